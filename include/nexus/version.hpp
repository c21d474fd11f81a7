#pragma once

/// @file version.hpp
/// @brief nexus_maze release number, exposed to the preprocessor and to code.

#include <string>

#define NEXUS_VERSION_MAJOR 0
#define NEXUS_VERSION_MINOR 1
#define NEXUS_VERSION_PATCH 0
#define NEXUS_VERSION_STRING "0.1.0"

namespace nexus {

struct Version {
    static constexpr int major = NEXUS_VERSION_MAJOR;
    static constexpr int minor = NEXUS_VERSION_MINOR;
    static constexpr int patch = NEXUS_VERSION_PATCH;
    static constexpr const char* string = NEXUS_VERSION_STRING;

    /// "<program> <version>", printed by the runners at startup.
    [[nodiscard]] static std::string Banner(const char* program) {
        return std::string(program) + " " + string;
    }
};

} // namespace nexus
