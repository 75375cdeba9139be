#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define QE_VERSION_MAJOR 0
#define QE_VERSION_MINOR 1
#define QE_VERSION_PATCH 0
#define QE_VERSION_STRING "0.1.0"

namespace qe {

/// Project version information at compile time.
struct Version {
    static constexpr int major = QE_VERSION_MAJOR;
    static constexpr int minor = QE_VERSION_MINOR;
    static constexpr int patch = QE_VERSION_PATCH;
    static constexpr const char* string = QE_VERSION_STRING;
};

} // namespace qe
