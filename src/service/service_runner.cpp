/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "nexus/service/service_runner.hpp"

#include <csignal>
#include <cstdlib>

namespace nexus::service {

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

nexus::foundation::GameResult<void>
loadConfig(nexus::foundation::ConfigManager& config, const std::filesystem::path& path) {
    std::filesystem::path configPath = path;
    if (const char* envPath = std::getenv("NEXUS_CONFIG_PATH"); envPath != nullptr) {
        configPath = envPath;
    }
    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::optional<std::string_view> findArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string_view(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    if (auto value = findArg(argc, argv, "--config")) {
        return std::filesystem::path(*value);
    }
    return {};
}

} // namespace nexus::service
