#pragma once

/// @file version.hpp
/// @brief Library version information.

#define VELLUM_VERSION_MAJOR 0
#define VELLUM_VERSION_MINOR 1
#define VELLUM_VERSION_PATCH 0

namespace vellum {

/// @brief Return the library version string (e.g. "0.1.0").
inline const char* version() {
    return "0.1.0";
}

inline int versionMajor() { return VELLUM_VERSION_MAJOR; }
inline int versionMinor() { return VELLUM_VERSION_MINOR; }
inline int versionPatch() { return VELLUM_VERSION_PATCH; }

} // namespace vellum
