#pragma once

/// @file game_host.hpp
/// @brief GameHost: drives one GameSession from a single-threaded event queue.
///
/// The host owns the session, its EnemyGenerator and an EventQueue carrying
/// three event kinds: the periodic tick, the one-shot spawn trigger and
/// pointer clicks. start() announces the level and schedules the first tick
/// and the spawn trigger. Each tick advances the session once and schedules
/// the next one; when the session ends, every pending event is cancelled
/// and onGameOver fires exactly once.

#include <chrono>
#include <cstdint>
#include <memory>
#include <variant>

#include "tadv/foundation/game_result.hpp"
#include "tadv/foundation/signal.hpp"
#include "tadv/game/game_session.hpp"
#include "tadv/game/game_types.hpp"
#include "tadv/service/host_config.hpp"

namespace tadv::service {

// -- Events ------------------------------------------------------------------

struct TickEvent {};

struct SpawnEvent {};

struct ClickEvent {
    double x = 0.0;
    double y = 0.0;
};

using HostEvent = std::variant<TickEvent, SpawnEvent, ClickEvent>;

/// Runtime counters for the host.
struct GameHostStats {
    uint64_t ticksDispatched = 0;
    uint64_t clicksForwarded = 0;
    std::size_t enemiesSpawned = 0;
    std::size_t pendingEvents = 0;
};

// -- Game Host ---------------------------------------------------------------

/// Usage:
/// @code
///   GameHost host(config);
///   host.onGameOver().connect([](GameOutcome outcome, uint32_t level) {
///       showBanner(outcomeName(outcome), level);
///   });
///   host.start();
///   host.click(700.0, 300.0);
///   while (!host.isFinished()) {
///       host.advance(std::chrono::milliseconds(16));
///   }
/// @endcode
class GameHost {
public:
    using LevelStartedSignal = tadv::foundation::Signal<uint32_t>;
    using GameOverSignal = tadv::foundation::Signal<tadv::game::GameOutcome, uint32_t>;

    explicit GameHost(HostConfig config);
    ~GameHost();

    GameHost(const GameHost&) = delete;
    GameHost& operator=(const GameHost&) = delete;
    GameHost(GameHost&&) noexcept;
    GameHost& operator=(GameHost&&) noexcept;

    /// Create the session, emit onLevelStarted and schedule the first tick
    /// and the spawn trigger.
    /// @return InvalidConfiguration for bad host or session parameters, or
    ///         HostAlreadyStarted on a second call.
    [[nodiscard]] tadv::foundation::GameResult<void> start();

    /// Queue a click for delivery on the next advance().
    /// @return HostNotStarted before start(). Clicks after the game ended
    ///         are accepted and ignored.
    tadv::foundation::GameResult<void> click(double x, double y);

    /// Move host time forward and dispatch every event that became due.
    /// @return Number of events dispatched.
    std::size_t advance(std::chrono::microseconds elapsed);

    [[nodiscard]] bool isStarted() const noexcept;

    /// True once the session reached Won or Lost.
    [[nodiscard]] bool isFinished() const noexcept;

    /// The session, or nullptr before start().
    [[nodiscard]] const tadv::game::GameSession* session() const noexcept;

    [[nodiscard]] const HostConfig& config() const noexcept;

    [[nodiscard]] GameHostStats stats() const;

    /// Fired by start() with the level number.
    LevelStartedSignal& onLevelStarted() noexcept;

    /// Fired once when the session terminates.
    GameOverSignal& onGameOver() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tadv::service
