/// @file main.cpp
/// @brief Headless maze runner.
///
/// Runs the simulation without a renderer: an autopilot walks the A*
/// route to each goal while HUD snapshots are logged.
///
/// Usage: nexus_headless [--config <yaml>] [--seed <n>] [--ticks <n>] [--rate <hz>]

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "autopilot.hpp"
#include "console_logger.hpp"
#include "nexus/foundation/config_manager.hpp"
#include "nexus/foundation/game_logger.hpp"
#include "nexus/game/simulation.hpp"
#include "nexus/service/game_loop.hpp"
#include "nexus/service/service_runner.hpp"
#include "nexus/version.hpp"

namespace {

using nexus::foundation::LogCategory;
using nexus::foundation::LogContext;
using nexus::foundation::LogLevel;

constexpr uint64_t kHudInterval = 120;

template <typename T>
T parseNumber(int argc, char* argv[], std::string_view flag, T fallback) {
    auto text = nexus::service::findArg(argc, argv, flag);
    if (!text) {
        return fallback;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        std::cerr << "Ignoring malformed " << flag << " value: " << *text << "\n";
        return fallback;
    }
    return value;
}

void logHud(const nexus::game::HudSnapshot& hud) {
    LogContext ctx;
    ctx.level = hud.level;
    ctx.extra["score"] = std::to_string(hud.score);
    ctx.extra["health"] = std::to_string(hud.health);
    ctx.extra["energy"] = std::to_string(static_cast<int>(hud.energy));
    ctx.extra["cell"] = std::to_string(hud.playerCell.x) + "," + std::to_string(hud.playerCell.z);
    ctx.extra["visited"] = std::to_string(hud.visitedCells);
    ctx.extra["phase"] = std::string(nexus::game::gamePhaseName(hud.phase));
    nexus::foundation::GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Core,
                                                             "HUD", ctx);
}

} // namespace

int main(int argc, char* argv[]) {
    namespace kci = kcenon::common::interfaces;

    nexus::service::SignalHandler signals;
    kci::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<nexus::headless::ConsoleLogger>(kci::log_level::trace));

    auto& logger = nexus::foundation::GameLogger::instance();
    nexus::game::GameConfig config;

    auto configPath = nexus::service::parseConfigArg(argc, argv);
    if (!configPath.empty() || std::getenv("NEXUS_CONFIG_PATH") != nullptr) {
        nexus::foundation::ConfigManager source;
        auto loadResult = nexus::service::loadConfig(source, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
        auto gameConfig = nexus::game::LoadGameConfig(source);
        if (!gameConfig) {
            std::cerr << "Invalid config: " << gameConfig.error().message() << "\n";
            return EXIT_FAILURE;
        }
        config = gameConfig.value();

        if (auto levelName = source.get<std::string>("log.level")) {
            if (auto level = nexus::foundation::parseLogLevel(levelName.value())) {
                logger.setAllCategoryLevels(*level);
            }
        }
    }

    const auto seed = parseNumber<uint32_t>(argc, argv, "--seed", 1);
    const auto ticks = parseNumber<uint64_t>(argc, argv, "--ticks", 3600);
    const auto rate = parseNumber<uint32_t>(argc, argv, "--rate", 60);

    NEXUS_LOG_INFO(LogCategory::Core, nexus::Version::Banner("nexus_headless") +
                                          " seed=" + std::to_string(seed));

    nexus::game::Simulation simulation(config, seed);
    simulation.Events().connect([](const nexus::game::GameEvent& event) {
        NEXUS_LOG_DEBUG(LogCategory::Gameplay,
                        "Event " + std::string(nexus::game::gameEventName(event.type)));
    });

    nexus::service::GameLoop loop(rate);
    if (auto started = simulation.Start(nexus::service::GameLoop::nowMs()); !started) {
        std::cerr << "Failed to start simulation: " << started.error().message() << "\n";
        return EXIT_FAILURE;
    }

    nexus::headless::Autopilot autopilot(simulation);
    loop.setTickCallback([&](float deltaTime, int64_t nowMs) {
        const auto phase = simulation.Phase();
        if (signals.shutdownRequested() || phase == nexus::game::GamePhase::GameOver ||
            phase == nexus::game::GamePhase::GameWon) {
            loop.stop();
            return;
        }
        simulation.Step({deltaTime, nowMs, autopilot.NextActions(), std::nullopt});
        if (loop.tickCount() % kHudInterval == 0) {
            logHud(simulation.Hud());
        }
    });
    loop.setMetricsCallback([](const nexus::service::TickMetrics& metrics) {
        if (metrics.overrun) {
            NEXUS_LOG_WARN(LogCategory::Core,
                           "Tick " + std::to_string(metrics.tickNumber) + " overran its budget");
        }
    });

    const auto executed = loop.run(ticks);
    logHud(simulation.Hud());
    NEXUS_LOG_INFO(LogCategory::Core, "Stopped after " + std::to_string(executed) + " ticks");

    if (auto flushed = logger.flush(); !flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
