#pragma once

/**
 * @file brush.hpp
 * @brief Fill pattern descriptors: solid color, gradient, texture.
 */

#include "vellum/types.hpp"
#include "vellum/style.hpp"
#include <memory>
#include <vector>

namespace vellum {

class Image;

/// @brief Sampling policy outside a gradient's or image's defined range.
enum class Extend : u8 {
    Pad,      ///< Repeat the edge color.
    Repeat,   ///< Tile the pattern.
    Reflect   ///< Mirror the pattern on every tile.
};

/// @brief A gradient color stop.
struct ColorStop {
    f32 offset = 0;  ///< Normalized offset, expected in [0, 1].
    Color color;     ///< Color at the offset.
};

inline bool operator==(const ColorStop& a, const ColorStop& b) {
    return a.offset == b.offset && a.color == b.color;
}
inline bool operator!=(const ColorStop& a, const ColorStop& b) { return !(a == b); }

/// @brief Gradient geometry in brush space.
struct GradientKind {
    enum class Type : u8 {
        Linear,  ///< Along the line start -> end.
        Radial,  ///< Between two circles (two-point conical).
        Sweep    ///< Around a center, angles in radians from the +x axis.
    };

    Type type = Type::Linear;

    union Data {
        struct { Point start; Point end; } linear;
        struct { Point startCenter; f32 startRadius; Point endCenter; f32 endRadius; } radial;
        struct { Point center; f32 startAngle; f32 endAngle; } sweep;

        Data() : linear{{}, {}} {}
    } data;

    static GradientKind MakeLinear(Point start, Point end);
    static GradientKind MakeRadial(Point startCenter, f32 startRadius,
                                   Point endCenter, f32 endRadius);
    static GradientKind MakeSweep(Point center, f32 startAngle, f32 endAngle);
};

bool operator==(const GradientKind& a, const GradientKind& b);
inline bool operator!=(const GradientKind& a, const GradientKind& b) { return !(a == b); }

/// @brief A multi-stop gradient.
///
/// Stops are kept in caller order. Nothing is sorted or de-duplicated;
/// stopsAreMonotonic() reports whether offsets are non-decreasing.
struct Gradient {
    Extend extend = Extend::Pad;
    GradientKind kind;
    std::vector<ColorStop> stops;

    /// @brief N colors at offsets i / (N - 1).
    /// @throws std::invalid_argument if fewer than two colors are given.
    static Gradient MakeEquidistant(Extend extend, const GradientKind& kind,
                                    const std::vector<Color>& colors);

    bool stopsAreMonotonic() const;
};

bool operator==(const Gradient& a, const Gradient& b);
inline bool operator!=(const Gradient& a, const Gradient& b) { return !(a == b); }

/// @brief An image used as a fill pattern.
///
/// Placement of the image is carried by the geometry's brush transform; the
/// fit mode and offset are descriptive only.
struct TextureBrush {
    std::shared_ptr<const Image> image;
    ImageFit fit = ImageFit::Original();
    Extend edge = Extend::Pad;  ///< Sampling outside the image extent.
    Point offset;
};

/// @brief What fills a shape: a solid color, a gradient or a texture.
struct Brush {
    enum class Type : u8 {
        Solid,
        Gradient,
        Texture
    };

    Type type = Type::Solid;
    Color color;              ///< Type::Solid.
    vellum::Gradient gradient; ///< Type::Gradient.
    TextureBrush texture;     ///< Type::Texture.

    static Brush MakeSolid(Color c);
    static Brush MakeGradient(vellum::Gradient g);
    static Brush MakeTexture(std::shared_ptr<const Image> image,
                             ImageFit fit = ImageFit::Original(),
                             Extend edge = Extend::Pad,
                             Point offset = {});

    bool isSolid() const { return type == Type::Solid; }
    bool isGradient() const { return type == Type::Gradient; }
    bool isTexture() const { return type == Type::Texture; }
};

} // namespace vellum
