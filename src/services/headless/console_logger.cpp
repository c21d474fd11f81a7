/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "console_logger.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>

namespace nexus::headless {

namespace kci = kcenon::common::interfaces;

namespace {

const char* levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO ";
        case kci::log_level::warning:  return "WARN ";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRIT ";
        default:                       return "     ";
    }
}

} // namespace

ConsoleLogger::ConsoleLogger(kci::log_level minLevel) : minLevel_(minLevel) {}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level, const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    std::lock_guard lock(mutex_);
    std::clog << std::setw(14) << now << ' ' << levelTag(level) << ' ' << message << '\n';
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level, std::string_view message,
                                              const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(kci::log_level level) const {
    return level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(kci::log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kci::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    std::clog.flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

} // namespace nexus::headless
