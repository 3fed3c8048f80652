/// @file config_manager.cpp
/// @brief YAML parsing and dotted-key collection for ConfigManager.

#include "tadv/foundation/config_manager.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace tadv::foundation {

namespace {

void collectLeaves(const YAML::Node& node, const std::string& path,
                   std::unordered_map<std::string, YAML::Node>& out) {
    if (!node.IsMap()) {
        if (!path.empty()) {
            out.emplace(path, YAML::Clone(node));
        }
        return;
    }
    for (const auto& child : node) {
        const auto name = child.first.as<std::string>();
        collectLeaves(child.second, path.empty() ? name : path + '.' + name, out);
    }
}

GameResult<void> loadFailed(std::string message) {
    return GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed, std::move(message)));
}

}  // namespace

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return loadFailed("config file not found: " + path.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return loadFailed(path.string() + ": " + e.what());
    }
    return adopt(root, path.string());
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml, std::string source) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return loadFailed(source + ": " + e.what());
    }
    return adopt(root, std::move(source));
}

GameResult<void> ConfigManager::adopt(const YAML::Node& root, std::string source) {
    // An empty document is a valid, empty configuration.
    if (!root.IsNull() && !root.IsMap()) {
        return loadFailed(source + ": top level must be a mapping");
    }

    LeafMap leaves;
    try {
        collectLeaves(root, "", leaves);
    } catch (const YAML::Exception& e) {
        return loadFailed(source + ": " + e.what());
    }

    leaves_ = std::move(leaves);
    source_ = std::move(source);
    return GameResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    return leaves_.find(std::string(key)) != leaves_.end();
}

GameError ConfigManager::missingKey(std::string_view key) const {
    return GameError(ErrorCode::ConfigKeyNotFound,
                     std::string(key) + " is not set in " +
                         (source_.empty() ? std::string("<empty>") : source_));
}

GameError ConfigManager::wrongType(std::string_view key, const YAML::Node& leaf) const {
    std::string shown = leaf.IsScalar() ? "'" + leaf.Scalar() + "'"
                        : leaf.IsSequence() ? std::string("a sequence")
                                            : std::string("null");
    return GameError(ErrorCode::ConfigTypeMismatch,
                     std::string(key) + " in " + source_ + " has the wrong type: " + shown);
}

}  // namespace tadv::foundation
