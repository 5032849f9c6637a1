#pragma once

/// @file version.hpp
/// @brief Addon version information and root namespace definition.

#define INTERACT_VERSION_MAJOR 1
#define INTERACT_VERSION_MINOR 2
#define INTERACT_VERSION_PATCH 0
#define INTERACT_VERSION_STRING "1.2.0"

namespace interact {

/// Addon version information at compile time.
struct Version {
    static constexpr int major = INTERACT_VERSION_MAJOR;
    static constexpr int minor = INTERACT_VERSION_MINOR;
    static constexpr int patch = INTERACT_VERSION_PATCH;
    static constexpr const char* string = INTERACT_VERSION_STRING;
};

} // namespace interact
