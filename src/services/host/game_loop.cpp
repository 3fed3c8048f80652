/// @file game_loop.cpp
/// @brief Frame pacing and overrun accounting.

#include "tadv/service/game_loop.hpp"

#include <string>
#include <thread>
#include <utility>

#include "tadv/foundation/game_logger.hpp"

namespace tadv::service {

using tadv::foundation::GameLogger;
using tadv::foundation::LogCategory;
using tadv::foundation::LogContext;
using tadv::foundation::LogLevel;

namespace {

constexpr uint32_t kDefaultFrameRate = 60;

using Clock = std::chrono::steady_clock;

std::chrono::microseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

}  // namespace

GameLoop::GameLoop(uint32_t frameRate)
    : frameRate_(frameRate == 0 ? kDefaultFrameRate : frameRate),
      frameTime_(std::chrono::microseconds(1'000'000 / frameRate_)) {}

void GameLoop::setFrameCallback(FrameCallback callback) {
    onFrame_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    onMetrics_ = std::move(callback);
}

uint64_t GameLoop::run(const StopPredicate& shouldStop) {
    if (running_.exchange(true)) {
        return 0;
    }
    stopRequested_ = false;

    uint64_t frames = 0;
    auto frameStart = Clock::now();
    auto deadline = frameStart;

    while (!stopRequested_ && !(shouldStop && shouldStop())) {
        deadline += frameTime_;
        auto metrics = runCallback();
        ++frames;

        if (Clock::now() < deadline) {
            std::this_thread::sleep_until(deadline);
        } else {
            deadline = Clock::now();
        }

        metrics.frameTime = since(frameStart);
        frameStart = Clock::now();
        last_ = metrics;
        if (onMetrics_) {
            onMetrics_(metrics);
        }
    }

    running_ = false;
    return frames;
}

void GameLoop::requestStop() noexcept {
    stopRequested_ = true;
}

FrameMetrics GameLoop::step() {
    last_ = runCallback();
    return last_;
}

FrameMetrics GameLoop::runCallback() {
    const auto start = Clock::now();
    if (onFrame_) {
        onFrame_(frameTime_);
    }

    FrameMetrics metrics;
    metrics.frameNumber = frameCount_++;
    metrics.updateTime = since(start);
    metrics.frameTime = metrics.updateTime;
    metrics.overrun = metrics.updateTime > frameTime_;

    if (metrics.overrun) {
        ++overruns_;
        LogContext ctx;
        ctx.extra["frame"] = std::to_string(metrics.frameNumber);
        ctx.extra["update_us"] = std::to_string(metrics.updateTime.count());
        ctx.extra["budget_us"] = std::to_string(frameTime_.count());
        GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Host,
                                              "frame overrun", ctx);
    }
    return metrics;
}

}  // namespace tadv::service
