/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "nexus/service/game_loop.hpp"

#include <thread>

namespace nexus::service {

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : 60),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / (tickRate > 0 ? tickRate : 60))) {}

void GameLoop::setTickCallback(TickCallback callback) {
    tickCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    metricsCallback_ = std::move(callback);
}

uint64_t GameLoop::run(uint64_t maxTicks) {
    running_.store(true);
    auto nextTick = Clock::now();
    uint64_t executed = 0;

    while (running_.load() && (maxTicks == 0 || executed < maxTicks)) {
        nextTick += targetFrameTime_;

        executeTick();
        ++executed;

        // Sleep until the next tick; after an overrun restart the schedule
        // instead of catching up.
        auto now = Clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            nextTick = now;
        }
    }

    running_.store(false);
    return executed;
}

void GameLoop::stop() noexcept {
    running_.store(false);
}

TickMetrics GameLoop::tick() {
    return executeTick();
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

int64_t GameLoop::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               Clock::now().time_since_epoch())
        .count();
}

TickMetrics GameLoop::executeTick() {
    const auto frameStart = Clock::now();
    const auto elapsed = hasTicked_
        ? std::chrono::duration_cast<std::chrono::microseconds>(frameStart - lastTick_)
        : targetFrameTime_;
    lastTick_ = frameStart;
    hasTicked_ = true;

    if (tickCallback_) {
        const float dtSeconds = static_cast<float>(elapsed.count()) / 1'000'000.0f;
        tickCallback_(dtSeconds,
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          frameStart.time_since_epoch())
                          .count());
    }

    const auto updateDuration =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - frameStart);

    TickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.frameTime = elapsed;
    metrics.budgetUtilization = targetFrameTime_.count() > 0
        ? static_cast<float>(updateDuration.count()) /
              static_cast<float>(targetFrameTime_.count())
        : 0.0f;
    metrics.tickNumber = tickCount_++;
    metrics.overrun = updateDuration > targetFrameTime_;

    lastMetrics_ = metrics;
    if (metricsCallback_) {
        metricsCallback_(metrics);
    }
    return metrics;
}

}  // namespace nexus::service
