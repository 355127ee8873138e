#pragma once

/**
 * @file shapes.hpp
 * @brief Geometric value types. Shapes carry no transform.
 */

#include "vellum/types.hpp"

namespace vellum {

/// @brief A circle given by center and radius.
struct Circle {
    Point center;   ///< Center point.
    f64 radius = 0; ///< Radius.
};

/// @brief An axis-aligned rectangle given by two opposite corners.
struct Rectangle {
    Point a;  ///< First corner.
    Point b;  ///< Opposite corner.

    /// @brief Rectangle of the given size centered on (cx, cy).
    static Rectangle MakeCentered(f64 cx, f64 cy, f64 w, f64 h) {
        return {{cx - w / 2.0, cy - h / 2.0}, {cx + w / 2.0, cy + h / 2.0}};
    }

    f64 width() const { return b.x > a.x ? b.x - a.x : a.x - b.x; }
    f64 height() const { return b.y > a.y ? b.y - a.y : a.y - b.y; }
};

/// @brief A rectangle with uniformly rounded corners.
struct RoundedRectangle {
    Point a;        ///< First corner.
    Point b;        ///< Opposite corner.
    f64 radius = 0; ///< Corner radius.
};

/// @brief Closed set of shape variants, as stored in a recording.
///
/// Implicitly constructible from each concrete shape so that any of them can
/// be handed to Scene and Recorder APIs.
struct Shape {
    /// @brief Shape variant tag.
    enum class Kind : u8 {
        Circle,
        Rectangle,
        RoundedRectangle
    };

    Kind kind = Kind::Rectangle;

    /// @brief Per-variant payload.
    union Data {
        Circle circle;
        Rectangle rect;
        RoundedRectangle rounded;

        Data() : rect{} {}
    } data;

    Shape() = default;
    Shape(const Circle& c) : kind(Kind::Circle) { data.circle = c; }
    Shape(const Rectangle& r) : kind(Kind::Rectangle) { data.rect = r; }
    Shape(const RoundedRectangle& r) : kind(Kind::RoundedRectangle) { data.rounded = r; }

    /// @brief Axis-aligned bounds in shape-local space as (min, max).
    void bounds(Point& min, Point& max) const;
};

bool operator==(const Shape& a, const Shape& b);
inline bool operator!=(const Shape& a, const Shape& b) { return !(a == b); }

} // namespace vellum
