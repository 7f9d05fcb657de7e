#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define EVOLVE_VERSION_MAJOR 0
#define EVOLVE_VERSION_MINOR 3
#define EVOLVE_VERSION_PATCH 0
#define EVOLVE_VERSION_STRING "0.3.0"

namespace evolve {

/// Project version information at compile time.
struct Version {
    static constexpr int major = EVOLVE_VERSION_MAJOR;
    static constexpr int minor = EVOLVE_VERSION_MINOR;
    static constexpr int patch = EVOLVE_VERSION_PATCH;
    static constexpr const char* string = EVOLVE_VERSION_STRING;
};

} // namespace evolve
