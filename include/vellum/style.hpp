#pragma once

/**
 * @file style.hpp
 * @brief Fill/stroke styles, layer blend modes and image fit policy.
 */

#include "vellum/types.hpp"
#include <array>
#include <vector>

namespace vellum {

/// @brief Winding rule for fills.
enum class FillRule : u8 {
    NonZero,
    EvenOdd
};

/// @brief Stroke join style.
enum class Join : u8 {
    Bevel,
    Miter,
    Round
};

/// @brief Stroke cap style.
enum class Cap : u8 {
    Butt,
    Square,
    Round
};

/// @brief One dash pattern entry.
using Dash = std::array<f64, 4>;

/// @brief Ordered dash pattern.
using Dashes = std::vector<Dash>;

/// @brief Stroke parameters.
struct StrokeStyle {
    f64 width = 1.0;          ///< Line width.
    Join join = Join::Round;  ///< Join style.
    f64 miterLimit = 4.0;     ///< Miter limit for Join::Miter.
    Cap startCap = Cap::Round;
    Cap endCap = Cap::Round;
    Dashes dashPattern;       ///< Empty means solid.
    f64 dashOffset = 0.0;
};

/// @brief Fill or stroke.
struct Style {
    enum class Type : u8 {
        Fill,
        Stroke
    };

    Type type = Type::Fill;
    FillRule fillRule = FillRule::NonZero;  ///< Used when type is Fill.
    StrokeStyle stroke;                     ///< Used when type is Stroke.

    static Style MakeFill(FillRule rule = FillRule::NonZero) {
        Style s;
        s.type = Type::Fill;
        s.fillRule = rule;
        return s;
    }

    static Style MakeStroke(const StrokeStyle& stroke) {
        Style s;
        s.type = Type::Stroke;
        s.stroke = stroke;
        return s;
    }

    bool isFill() const { return type == Type::Fill; }
    bool isStroke() const { return type == Type::Stroke; }
};

/// @brief Separable color mix applied when a layer is composited.
enum class MixMode : u8 {
    Normal,
    Clip,
    Multiply
};

/// @brief Porter-Duff composite operator applied when a layer is composited.
enum class CompositeMode : u8 {
    SourceOver,
    DestinationOver,
    SourceIn,
    DestinationIn,
    SourceOut,
    DestinationOut,
    SourceAtop,
    DestinationAtop,
    Lighter,
    Copy,
    Xor
};

/// @brief Mix + composite pair describing how a layer lands on its parent.
struct BlendMode {
    MixMode mix = MixMode::Normal;
    CompositeMode compose = CompositeMode::SourceOver;
};

inline bool operator==(BlendMode a, BlendMode b) {
    return a.mix == b.mix && a.compose == b.compose;
}
inline bool operator!=(BlendMode a, BlendMode b) { return !(a == b); }

/// @brief Policy for mapping an image's pixel extent onto a target rectangle.
struct ImageFit {
    enum class Mode : u8 {
        Original,  ///< Image pixels map 1:1 to shape units.
        Fill,      ///< Stretch the image to the target rectangle.
        Exact      ///< Scale the image to an explicit width/height.
    };

    Mode mode = Mode::Fill;
    f64 width = 0;   ///< Exact width (Mode::Exact only).
    f64 height = 0;  ///< Exact height (Mode::Exact only).

    static ImageFit Original() { return {Mode::Original, 0, 0}; }
    static ImageFit Fill() { return {Mode::Fill, 0, 0}; }
    static ImageFit Exact(f64 w, f64 h) { return {Mode::Exact, w, h}; }
};

} // namespace vellum
