#pragma once

#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases and basic geometric/color types for the vellum library.
 */

namespace vellum {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u16 = uint16_t;  ///< Unsigned 16-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief A 2D point with double-precision coordinates.
struct Point {
    f64 x = 0;  ///< X coordinate.
    f64 y = 0;  ///< Y coordinate.
};

/// @brief A straight-alpha RGBA color with components in [0, 1].
struct Color {
    f32 r = 0;  ///< Red component.
    f32 g = 0;  ///< Green component.
    f32 b = 0;  ///< Blue component.
    f32 a = 1;  ///< Alpha component, default opaque.
};

inline bool operator==(Point a, Point b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Point a, Point b) { return !(a == b); }

inline bool operator==(Color a, Color b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}
inline bool operator!=(Color a, Color b) { return !(a == b); }

} // namespace vellum
