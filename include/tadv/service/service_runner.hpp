#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the headless runner.
///
/// Everything `turtle_adventure` needs before a GameHost exists: where the
/// YAML lives, what it says beyond the host parameters (frame rate and
/// scripted clicks), and a SIGINT/SIGTERM latch that stops the frame loop.

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "tadv/foundation/game_result.hpp"
#include "tadv/game/math_types.hpp"
#include "tadv/service/host_config.hpp"

namespace tadv::service {

/// Latches SIGINT and SIGTERM for the lifetime of the object.
///
/// The handlers only set a sig_atomic_t flag. The handlers that were
/// installed before construction are restored on destruction. Keep at most
/// one instance alive at a time.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    [[nodiscard]] bool raised() const noexcept;

private:
    static void onSignal(int signal);

    static volatile std::sig_atomic_t raised_;

    struct sigaction previousInt_ {};
    struct sigaction previousTerm_ {};
};

/// Pick the configuration file: `--config <path>` (or `--config=<path>`)
/// wins over the TADV_CONFIG_PATH environment variable, which wins over
/// @p fallback.
[[nodiscard]] std::filesystem::path
resolveConfigPath(int argc, char* argv[], const std::filesystem::path& fallback);

/// Runner settings read from the same YAML as the host.
struct RunnerConfig {
    HostConfig host;

    /// Frames per second of the pacing loop (`host.frame_rate`).
    uint32_t frameRate = 60;

    /// `demo.clicks`: replayed in order before the first tick.
    std::vector<tadv::game::Vector2> clicks;
};

/// Load @p path, apply its `logging` levels to GameLogger::instance(), and
/// build a RunnerConfig from it.
/// @return ConfigLoadFailed when the file cannot be read, LoggerLevelUnknown
///         for a bad `logging.<category>` value, or
///         InvalidConfiguration for a zero frame rate, a click that is not
///         an [x, y] pair, or host parameters rejected by readHostConfig().
[[nodiscard]] tadv::foundation::GameResult<RunnerConfig>
loadRunnerConfig(const std::filesystem::path& path);

}  // namespace tadv::service
