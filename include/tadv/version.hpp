#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TADV_VERSION_MAJOR 1
#define TADV_VERSION_MINOR 0
#define TADV_VERSION_PATCH 0
#define TADV_VERSION_STRING "1.0.0"

namespace tadv {

/// Project version information at compile time.
struct Version {
    static constexpr int major = TADV_VERSION_MAJOR;
    static constexpr int minor = TADV_VERSION_MINOR;
    static constexpr int patch = TADV_VERSION_PATCH;
    static constexpr const char* string = TADV_VERSION_STRING;
};

}  // namespace tadv
