#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for executable entry points.
///
/// Signal handling, configuration loading and command-line parsing for
/// the nexus executables.

#include <atomic>
#include <filesystem>
#include <optional>
#include <string_view>

#include "nexus/foundation/config_manager.hpp"
#include "nexus/foundation/game_result.hpp"

namespace nexus::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. Default
/// handlers are restored on destruction.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file.
///
/// The NEXUS_CONFIG_PATH environment variable, when set, takes precedence
/// over @p path.
[[nodiscard]] nexus::foundation::GameResult<void>
loadConfig(nexus::foundation::ConfigManager& config, const std::filesystem::path& path);

/// Value following @p flag (e.g. "--config" "<path>"), if present.
[[nodiscard]] std::optional<std::string_view>
findArg(int argc, char* argv[], std::string_view flag);

/// Parse `--config <path>`; empty when absent.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace nexus::service
