/// @file host_config.cpp
/// @brief HostConfig validation and YAML mapping.

#include "tadv/service/host_config.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace tadv::service {

using tadv::foundation::ConfigManager;
using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameResult;

namespace {

GameResult<void> invalid(std::string message) {
    return GameResult<void>::err(GameError(ErrorCode::InvalidConfiguration, std::move(message)));
}

/// Read a millisecond count into @p target, leaving it alone when absent.
GameResult<void> readMillis(const ConfigManager& config, std::string_view key,
                            std::chrono::milliseconds& target) {
    int64_t ms = target.count();
    auto read = config.readInto(key, ms);
    if (read) {
        target = std::chrono::milliseconds(ms);
    }
    return read;
}

}  // namespace

GameResult<void> validateHostConfig(const HostConfig& config) {
    if (config.tickInterval.count() <= 0) {
        return invalid("tick interval must be positive, got " +
                       std::to_string(config.tickInterval.count()) + " ms");
    }
    if (config.spawnDelay.count() < 0) {
        return invalid("spawn delay must not be negative, got " +
                       std::to_string(config.spawnDelay.count()) + " ms");
    }
    if (!std::isfinite(config.enemySize) || config.enemySize <= 0.0) {
        return invalid("enemy size must be positive, got " + std::to_string(config.enemySize));
    }
    return GameResult<void>::ok();
}

GameResult<HostConfig> readHostConfig(const ConfigManager& config) {
    HostConfig cfg;
    auto& session = cfg.session;

    for (auto read : {config.readInto("arena.width", session.arena.width),
                      config.readInto("arena.height", session.arena.height),
                      config.readInto("level", session.level),
                      config.readInto("player.speed", session.playerSpeed),
                      config.readInto("home.size", session.homeSize),
                      readMillis(config, "host.tick_interval_ms", cfg.tickInterval),
                      readMillis(config, "enemies.spawn_delay_ms", cfg.spawnDelay),
                      config.readInto("enemies.size", cfg.enemySize)}) {
        if (!read) {
            return GameResult<HostConfig>::err(read.error());
        }
    }

    auto valid = validateHostConfig(cfg);
    if (!valid) {
        return GameResult<HostConfig>::err(valid.error());
    }
    return GameResult<HostConfig>::ok(std::move(cfg));
}

}  // namespace tadv::service
