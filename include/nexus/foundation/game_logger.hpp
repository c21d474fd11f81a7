#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common logger interfaces for
///        category-filtered simulation logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "nexus/foundation/game_result.hpp"

namespace nexus::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Simulation log categories; each has its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Facade, frame driver, configuration
    ECS         = 1, ///< Entity/component store and scheduler
    Maze        = 2, ///< Maze generation
    Pathfinding = 3, ///< A* searches
    AI          = 4, ///< Enemy behavior transitions
    Physics     = 5, ///< Movement and wall contact
    Gameplay    = 6, ///< Pickups, damage, effects
    Level       = 7  ///< Level lifecycle and phase changes
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Maze", "Pathfinding", "AI", "Physics", "Gameplay", "Level"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context appended to a log line as `{key=value, ...}`.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = enemy.id();
///   ctx.extra["state"] = "Chase";
///   logger.logWithContext(LogLevel::Debug, LogCategory::AI,
///                         "Enemy state changed", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<uint32_t> level;
    std::unordered_map<std::string, std::string> extra;
};

/// Simulation logger wrapping kcenon's logger registry.
///
/// Each category resolves the named logger "nexus.<Category>" from the
/// GlobalLoggerRegistry and falls back to the registry's default logger.
/// Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | ECS         | Info          |
/// | Maze        | Info          |
/// | Pathfinding | Info          |
/// | AI          | Debug         |
/// | Physics     | Info          |
/// | Gameplay    | Debug         |
/// | Level       | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply the same minimum level to every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace", "debug", "info", "warning", "error", "critical" or "off"
/// (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace nexus::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name NEXUS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// NEXUS_MIN_LOG_LEVEL may be defined before including this header to
/// compile out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef NEXUS_MIN_LOG_LEVEL
    #define NEXUS_MIN_LOG_LEVEL 0
#endif

#define NEXUS_LOG(level, cat, msg)                                                  \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= NEXUS_MIN_LOG_LEVEL &&                       \
            ::nexus::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::nexus::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define NEXUS_LOG_TRACE(cat, msg) \
    NEXUS_LOG(::nexus::foundation::LogLevel::Trace, (cat), (msg))

#define NEXUS_LOG_DEBUG(cat, msg) \
    NEXUS_LOG(::nexus::foundation::LogLevel::Debug, (cat), (msg))

#define NEXUS_LOG_INFO(cat, msg) \
    NEXUS_LOG(::nexus::foundation::LogLevel::Info, (cat), (msg))

#define NEXUS_LOG_WARN(cat, msg) \
    NEXUS_LOG(::nexus::foundation::LogLevel::Warning, (cat), (msg))

#define NEXUS_LOG_ERROR(cat, msg) \
    NEXUS_LOG(::nexus::foundation::LogLevel::Error, (cat), (msg))

/// @}
