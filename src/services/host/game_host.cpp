/// @file game_host.cpp
/// @brief GameHost implementation.

#include "tadv/service/game_host.hpp"

#include <optional>
#include <string>
#include <utility>

#include "tadv/foundation/game_logger.hpp"
#include "tadv/game/enemy_generator.hpp"
#include "tadv/service/event_queue.hpp"

namespace tadv::service {

using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameLogger;
using tadv::foundation::GameResult;
using tadv::foundation::LogCategory;
using tadv::foundation::LogContext;
using tadv::foundation::LogLevel;
using tadv::game::EnemyGenerator;
using tadv::game::GameOutcome;
using tadv::game::GameSession;

// -- Impl --------------------------------------------------------------------

struct GameHost::Impl {
    HostConfig config;

    std::unique_ptr<GameSession> session;
    std::unique_ptr<EnemyGenerator> generator;
    EventQueue<HostEvent> queue;

    LevelStartedSignal levelStarted;
    GameOverSignal gameOver;

    GameHostStats stats;
    bool gameOverFired = false;

    explicit Impl(HostConfig cfg) : config(std::move(cfg)) {}

    void dispatch(const HostEvent& event) {
        std::visit([this](const auto& e) { handle(e); }, event);
    }

    void handle(const TickEvent&) {
        if (session->IsFinished()) {
            return;
        }
        ++stats.ticksDispatched;
        session->AdvanceTick();
        if (session->IsFinished()) {
            finish();
            return;
        }
        queue.scheduleAfter(config.tickInterval, TickEvent{});
    }

    void handle(const SpawnEvent&) {
        auto spawned = generator->CreateEnemy();
        if (!spawned) {
            LogContext ctx;
            ctx.tick = session->GetTickCount();
            ctx.level = session->GetLevel();
            ctx.extra["error"] = spawned.error().message();
            GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Host,
                                                  "spawn skipped", ctx);
            return;
        }
        stats.enemiesSpawned += spawned.value();
    }

    void handle(const ClickEvent& click) {
        ++stats.clicksForwarded;
        session->ActivateWaypoint(click.x, click.y);
    }

    void finish() {
        auto cancelled = queue.cancelAll();
        if (gameOverFired) {
            return;
        }
        gameOverFired = true;

        auto outcome = session->GetOutcome().value_or(GameOutcome::Lost);

        LogContext ctx;
        ctx.tick = session->GetTickCount();
        ctx.level = session->GetLevel();
        ctx.extra["outcome"] = std::string(tadv::game::outcomeName(outcome));
        ctx.extra["cancelled_events"] = std::to_string(cancelled);
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Host, "game over",
                                              ctx);

        gameOver.emit(outcome, session->GetLevel());
    }
};

// -- GameHost ----------------------------------------------------------------

GameHost::GameHost(HostConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {}

GameHost::~GameHost() = default;

GameHost::GameHost(GameHost&&) noexcept = default;

GameHost& GameHost::operator=(GameHost&&) noexcept = default;

GameResult<void> GameHost::start() {
    if (impl_->session) {
        return GameResult<void>::err(
            GameError(ErrorCode::HostAlreadyStarted, "game host is already started"));
    }

    auto valid = validateHostConfig(impl_->config);
    if (!valid) {
        return valid;
    }

    auto created = GameSession::Create(impl_->config.session);
    if (!created) {
        return GameResult<void>::err(created.error());
    }
    impl_->session = std::make_unique<GameSession>(std::move(created).value());
    impl_->generator = std::make_unique<EnemyGenerator>(
        *impl_->session, impl_->session->GetLevel(), impl_->session->GetArena(),
        impl_->config.enemySize);

    const auto level = impl_->session->GetLevel();
    LogContext ctx;
    ctx.level = level;
    ctx.extra["arena"] = std::to_string(impl_->config.session.arena.width) + "x" +
                         std::to_string(impl_->config.session.arena.height);
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Host, "level started",
                                          ctx);
    impl_->levelStarted.emit(level);

    impl_->queue.scheduleAfter(impl_->config.tickInterval, TickEvent{});
    impl_->queue.scheduleAfter(impl_->config.spawnDelay, SpawnEvent{});
    return GameResult<void>::ok();
}

GameResult<void> GameHost::click(double x, double y) {
    if (!impl_->session) {
        return GameResult<void>::err(
            GameError(ErrorCode::HostNotStarted, "click before game host start"));
    }
    impl_->queue.post(ClickEvent{x, y});
    return GameResult<void>::ok();
}

std::size_t GameHost::advance(std::chrono::microseconds elapsed) {
    if (!impl_->session) {
        return 0;
    }
    return impl_->queue.advance(elapsed,
                                [this](const HostEvent& event) { impl_->dispatch(event); });
}

bool GameHost::isStarted() const noexcept {
    return impl_->session != nullptr;
}

bool GameHost::isFinished() const noexcept {
    return impl_->session && impl_->session->IsFinished();
}

const GameSession* GameHost::session() const noexcept {
    return impl_->session.get();
}

const HostConfig& GameHost::config() const noexcept {
    return impl_->config;
}

GameHostStats GameHost::stats() const {
    auto stats = impl_->stats;
    stats.pendingEvents = impl_->queue.pending();
    return stats;
}

GameHost::LevelStartedSignal& GameHost::onLevelStarted() noexcept {
    return impl_->levelStarted;
}

GameHost::GameOverSignal& GameHost::onGameOver() noexcept {
    return impl_->gameOver;
}

}  // namespace tadv::service
