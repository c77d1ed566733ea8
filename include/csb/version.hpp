#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CSB_VERSION_MAJOR 0
#define CSB_VERSION_MINOR 3
#define CSB_VERSION_PATCH 0
#define CSB_VERSION_STRING "0.3.0"

namespace csb {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CSB_VERSION_MAJOR;
    static constexpr int minor = CSB_VERSION_MINOR;
    static constexpr int patch = CSB_VERSION_PATCH;
    static constexpr const char* string = CSB_VERSION_STRING;
};

} // namespace csb
