#pragma once

/// @file host_config.hpp
/// @brief GameHost parameters and their YAML keys.
///
/// | Key                       | Field                   | Default |
/// |---------------------------|-------------------------|---------|
/// | `arena.width`             | session.arena.width     | 800     |
/// | `arena.height`            | session.arena.height    | 600     |
/// | `level`                   | session.level           | 1       |
/// | `player.speed`            | session.playerSpeed     | 5       |
/// | `home.size`               | session.homeSize        | 20      |
/// | `host.tick_interval_ms`   | tickInterval            | 30      |
/// | `enemies.spawn_delay_ms`  | spawnDelay              | 100     |
/// | `enemies.size`            | enemySize               | 20      |

#include <chrono>

#include "tadv/foundation/config_manager.hpp"
#include "tadv/foundation/game_result.hpp"
#include "tadv/game/game_session.hpp"
#include "tadv/game/game_types.hpp"

namespace tadv::service {

struct HostConfig {
    tadv::game::SessionConfig session;

    /// Delay between session ticks. Must be positive.
    std::chrono::milliseconds tickInterval{30};

    /// Delay between start() and the enemy spawn. Zero spawns on the first
    /// advance().
    std::chrono::milliseconds spawnDelay{100};

    double enemySize = tadv::game::kDefaultEnemySize;
};

/// Check the host-level timing and spawn parameters. Session parameters are
/// checked by GameSession::Create.
/// @return InvalidConfiguration naming the offending field.
[[nodiscard]] tadv::foundation::GameResult<void> validateHostConfig(const HostConfig& config);

/// Build a HostConfig from the keys above. Missing keys keep their default.
/// @return ConfigTypeMismatch for a mistyped key, or InvalidConfiguration
///         when the result fails validateHostConfig().
[[nodiscard]] tadv::foundation::GameResult<HostConfig>
readHostConfig(const tadv::foundation::ConfigManager& config);

}  // namespace tadv::service
