#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the maze simulation core.

#include <cstdint>
#include <string_view>

namespace nexus::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    ResourceExhausted = 0x0004,
    StaleReference = 0x0005,

    // ECS (0x0300 - 0x03FF)
    EntityNotFound = 0x0300,
    ComponentNotFound = 0x0301,
    SystemError = 0x0302,

    // Maze (0x0400 - 0x04FF)
    InvalidConfiguration = 0x0400,
    PathNotFound = 0x0401,

    // Level (0x0500 - 0x05FF)
    LevelCreationFailed = 0x0500,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0400: return "Maze";
        case 0x0500: return "Level";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for the codes that mean "the requested thing does not exist".
constexpr bool isNotFound(ErrorCode code) {
    return code == ErrorCode::NotFound || code == ErrorCode::EntityNotFound ||
           code == ErrorCode::ComponentNotFound || code == ErrorCode::PathNotFound;
}

} // namespace nexus::foundation
