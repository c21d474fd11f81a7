#pragma once

/// @file console_logger.hpp
/// @brief ILogger writing timestamped lines to stderr.

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace nexus::headless {

class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    explicit ConsoleLogger(kcenon::common::interfaces::log_level minLevel);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    std::atomic<kcenon::common::interfaces::log_level> minLevel_;
    std::mutex mutex_;
};

} // namespace nexus::headless
