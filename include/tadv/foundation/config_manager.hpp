#pragma once

/// @file config_manager.hpp
/// @brief Read-only view over a YAML document, addressed by dotted paths.
///
/// Nested maps are collapsed into dotted keys ("arena.width"). Anything that
/// is not a map (scalar, sequence, null) is a leaf, so `demo.clicks` reads
/// back whole as `std::vector<std::vector<double>>`.

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "tadv/foundation/game_result.hpp"

namespace tadv::foundation {

class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse the file at @p path and replace the current contents.
    /// On failure the previous contents are kept.
    /// @return ConfigLoadFailed for a missing file, bad YAML, or a document
    ///         whose top level is not a mapping.
    GameResult<void> load(const std::filesystem::path& path);

    /// Same as load() for a document held in memory. @p source names the
    /// document in error messages.
    GameResult<void> loadFromString(std::string_view yaml, std::string source = "<memory>");

    /// @return ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is missing or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Overwrite @p target with the value at @p key if the key exists.
    /// A missing key leaves @p target untouched; a mistyped one is an error.
    template <typename T>
    GameResult<void> readInto(std::string_view key, T& target) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return leaves_.size(); }

    /// Path of the loaded file, or the name given to loadFromString().
    /// Empty until something was loaded.
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    using LeafMap = std::unordered_map<std::string, YAML::Node>;

    GameResult<void> adopt(const YAML::Node& root, std::string source);

    [[nodiscard]] GameError missingKey(std::string_view key) const;
    [[nodiscard]] GameError wrongType(std::string_view key, const YAML::Node& leaf) const;

    LeafMap leaves_;
    std::string source_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = leaves_.find(std::string(key));
    if (it == leaves_.end()) {
        return GameResult<T>::err(missingKey(key));
    }
    try {
        return GameResult<T>::ok(it->second.template as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(wrongType(key, it->second));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto value = get<T>(key);
    return value ? std::move(value).value() : std::move(fallback);
}

template <typename T>
GameResult<void> ConfigManager::readInto(std::string_view key, T& target) const {
    if (!hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = get<T>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    target = std::move(value).value();
    return GameResult<void>::ok();
}

} // namespace tadv::foundation
