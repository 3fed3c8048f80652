#pragma once

/// @file game_loop.hpp
/// @brief Wall-clock frame pacer for the headless runner.
///
/// The simulation itself never reads a clock: GameHost only moves when it is
/// handed a duration. GameLoop is what ties that duration to real time. Every
/// frame it calls the frame callback with the fixed frame time, then sleeps
/// out the rest of the frame. A frame whose callback took longer than the
/// frame time is an overrun; it is counted, logged on the Host category, and
/// the schedule restarts from "now" instead of trying to catch up.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace tadv::service {

struct FrameMetrics {
    uint64_t frameNumber = 0;

    /// Time spent inside the frame callback.
    std::chrono::microseconds updateTime{0};

    /// Callback plus sleep. Equal to updateTime for step().
    std::chrono::microseconds frameTime{0};

    bool overrun = false;
};

class GameLoop {
public:
    using FrameCallback = std::function<void(std::chrono::microseconds frameTime)>;
    using MetricsCallback = std::function<void(const FrameMetrics&)>;
    using StopPredicate = std::function<bool()>;

    /// @param frameRate Frames per second; 0 selects 60.
    explicit GameLoop(uint32_t frameRate = 60);

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    void setFrameCallback(FrameCallback callback);

    /// Called after every paced frame of run(), not after step().
    void setMetricsCallback(MetricsCallback callback);

    /// Pace frames on the calling thread until @p shouldStop returns true
    /// (checked before each frame) or requestStop() is called.
    /// @return Frames run by this call; 0 if the loop was already running.
    uint64_t run(const StopPredicate& shouldStop = {});

    /// Make run() return after the current frame. Callable from the frame
    /// callback or from another thread.
    void requestStop() noexcept;

    /// One unpaced frame.
    FrameMetrics step();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] uint32_t frameRate() const noexcept { return frameRate_; }
    [[nodiscard]] std::chrono::microseconds frameTime() const noexcept { return frameTime_; }
    [[nodiscard]] uint64_t frameCount() const noexcept { return frameCount_; }
    [[nodiscard]] uint64_t overrunCount() const noexcept { return overruns_; }
    [[nodiscard]] const FrameMetrics& lastMetrics() const noexcept { return last_; }

private:
    FrameMetrics runCallback();

    uint32_t frameRate_;
    std::chrono::microseconds frameTime_;

    FrameCallback onFrame_;
    MetricsCallback onMetrics_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    uint64_t frameCount_ = 0;
    uint64_t overruns_ = 0;
    FrameMetrics last_;
};

}  // namespace tadv::service
