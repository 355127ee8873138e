#pragma once

/**
 * @file draw_op_visitor.hpp
 * @brief Visitor interface for traversing recorded draw operations.
 *
 * This is the contract a rendering backend implements. Every callback
 * receives fully resolved data: transforms already include the scene's
 * global transform, arena offsets are turned into pointers, and images and
 * fonts into references that stay valid for the duration of the callback.
 */

#include "vellum/types.hpp"
#include "vellum/affine.hpp"
#include "vellum/shapes.hpp"
#include "vellum/style.hpp"
#include "vellum/brush.hpp"
#include "vellum/font.hpp"

namespace vellum {

class Image;

/// @brief Resolved paint view.
struct PaintRef {
    Brush::Type type = Brush::Type::Solid;
    Color color;                        ///< Solid color.
    Extend extend = Extend::Pad;        ///< Gradient extend or texture edge mode.
    const GradientKind* kind = nullptr; ///< Gradient geometry (Gradient only).
    const ColorStop* stops = nullptr;   ///< Gradient stops (Gradient only).
    u32 stopCount = 0;
    const Image* image = nullptr;       ///< Texture (Texture only).
};

/// @brief Resolved stroke parameter view.
struct StrokeRef {
    f64 width = 1;
    Join join = Join::Round;
    f64 miterLimit = 4;
    Cap startCap = Cap::Round;
    Cap endCap = Cap::Round;
    const Dash* dashes = nullptr;
    u32 dashCount = 0;
    f64 dashOffset = 0;
};

/// @brief Resolved glyph run view.
struct GlyphRunRef {
    const Font* font = nullptr;
    f32 size = 0;
    f32 weight = 0;
    FontStyle style = FontStyle::Normal;
    Color color;
    const PositionedGlyph* glyphs = nullptr;
    u32 count = 0;
};

/// @brief Visitor interface for traversing recorded draw operations.
///
/// Implement this interface to process drawing commands dispatched by
/// Recording::accept(). PushLayer/PopLayer calls are always balanced.
class DrawOpVisitor {
public:
    virtual ~DrawOpVisitor() = default;

    /// @brief Visit a fill.
    /// @param shape Geometry in shape-local space.
    /// @param rule Winding rule.
    /// @param paint What fills the shape.
    /// @param transform Shape-local to device transform.
    /// @param brushTransform Brush space to shape-local space, or null for identity.
    virtual void visitFill(const Shape& shape, FillRule rule, const PaintRef& paint,
                           const Affine& transform, const Affine* brushTransform) = 0;

    /// @brief Visit a stroke. Parameters as for visitFill().
    virtual void visitStroke(const Shape& shape, const StrokeRef& stroke, const PaintRef& paint,
                             const Affine& transform, const Affine* brushTransform) = 0;

    /// @brief Open a layer; content until the matching visitPopLayer() lands
    ///        on the parent with `blend`, clipped to `clip` and scaled by `alpha`.
    virtual void visitPushLayer(BlendMode blend, f32 alpha,
                                const Affine& clipTransform, const Shape& clip) = 0;

    /// @brief Close the innermost layer.
    virtual void visitPopLayer() = 0;

    /// @brief Visit a glyph run.
    /// @param run Font, size, color and positioned glyphs in text-local space.
    /// @param transform Text-local to device transform (alignment already applied).
    /// @param glyphTransform Per-glyph transform, or null.
    virtual void visitGlyphRun(const GlyphRunRef& run, const Affine& transform,
                               const Affine* glyphTransform) = 0;
};

} // namespace vellum
