#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GK_VERSION_MAJOR 0
#define GK_VERSION_MINOR 3
#define GK_VERSION_PATCH 0
#define GK_VERSION_STRING "0.3.0"

namespace gk {

/// Gatekeeper version information at compile time.
struct Version {
    static constexpr int major = GK_VERSION_MAJOR;
    static constexpr int minor = GK_VERSION_MINOR;
    static constexpr int patch = GK_VERSION_PATCH;
    static constexpr const char* string = GK_VERSION_STRING;
};

} // namespace gk
