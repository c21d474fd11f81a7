#pragma once

/// @file game_loop.hpp
/// @brief Fixed-rate frame driver with timing metrics.
///
/// GameLoop calls a frame callback at a configurable rate on the calling
/// thread. Each tick measures the real time elapsed since the previous
/// tick, hands it to the callback together with a millisecond clock, and
/// reports budget utilization and overruns.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace nexus::service {

/// Per-tick performance metrics.
struct TickMetrics {
    /// Time spent in the tick callback.
    std::chrono::microseconds updateTime{0};

    /// Real time since the previous tick (target frame time for the first).
    std::chrono::microseconds frameTime{0};

    /// Ratio of updateTime to target frame time (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Monotonically increasing tick counter (starts at 0).
    uint64_t tickNumber = 0;

    /// True when updateTime exceeded the target frame time.
    bool overrun = false;
};

/// Fixed-rate frame driver.
///
/// Usage:
/// @code
///   GameLoop loop(60);
///   loop.setTickCallback([&](float dt, int64_t nowMs) {
///       simulation.Step({dt, nowMs, input.Poll()});
///   });
///   loop.run(600);  // ten seconds, or until stop()
/// @endcode
class GameLoop {
public:
    using Clock = std::chrono::steady_clock;
    using TickCallback = std::function<void(float deltaTime, int64_t nowMs)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate  Ticks per second (0 falls back to 60).
    explicit GameLoop(uint32_t tickRate = 60);

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    void setTickCallback(TickCallback callback);
    void setMetricsCallback(MetricsCallback callback);

    /// Tick at the configured rate until stop() or @p maxTicks ticks
    /// (0 = unbounded). Returns the number of ticks executed.
    uint64_t run(uint64_t maxTicks = 0);

    /// Ask run() to return after the current tick. Safe from the callback
    /// or another thread.
    void stop() noexcept;

    /// Execute a single tick immediately, without pacing.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept { return tickRate_; }
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept {
        return targetFrameTime_;
    }
    [[nodiscard]] uint64_t tickCount() const noexcept { return tickCount_; }
    [[nodiscard]] const TickMetrics& lastMetrics() const noexcept { return lastMetrics_; }

    /// Milliseconds on the loop's monotonic clock.
    [[nodiscard]] static int64_t nowMs();

private:
    TickMetrics executeTick();

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    uint64_t tickCount_ = 0;
    bool hasTicked_ = false;
    Clock::time_point lastTick_;
    TickMetrics lastMetrics_;
};

}  // namespace nexus::service
