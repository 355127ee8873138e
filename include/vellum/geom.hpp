#pragma once

/**
 * @file geom.hpp
 * @brief A shape bundled with its style, brush and transforms.
 */

#include "vellum/types.hpp"
#include "vellum/affine.hpp"
#include "vellum/shapes.hpp"
#include "vellum/style.hpp"
#include "vellum/brush.hpp"
#include "vellum/drawable.hpp"
#include <memory>
#include <optional>
#include <utility>

namespace vellum {

class Image;

/// @brief Lower one styled shape into a scene.
///
/// Emits a fill or stroke with transform `scene.globalTransform() * transform`.
/// @throws std::logic_error when stroking with a texture brush.
void drawGeom(Scene& scene, const Style& style, const Shape& shape, const Brush& brush,
              const Affine& transform, const std::optional<Affine>& brushTransform);

/// @brief A drawable shape.
///
/// `transform` places the shape; `brushTransform` maps brush space into the
/// shape's local space. The two are independent: the brush does not follow
/// `transform` unless the caller supplies the same mapping, which lets a
/// pattern stay put while the shape moves and vice versa. When
/// `brushTransform` is empty, gradients are evaluated in shape-local space
/// and textures in image pixel space.
template <typename S>
struct Geom : Drawable {
    Style style;
    S shape;
    Brush brush;
    Affine transform;
    std::optional<Affine> brushTransform;

    Geom() = default;

    Geom(Style style_, S shape_, Brush brush_, Affine transform_ = Affine(),
         std::optional<Affine> brushTransform_ = std::nullopt)
        : style(std::move(style_)),
          shape(shape_),
          brush(std::move(brush_)),
          transform(transform_),
          brushTransform(brushTransform_) {}

    void draw(Scene& scene) const override {
        drawGeom(scene, style, Shape(shape), brush, transform, brushTransform);
    }
};

/// @brief A filled rectangle showing an image.
///
/// The rectangle is centered on (x, y) with the given size. With
/// ImageFit::Fill the brush transform scales the image to the rectangle and
/// then moves its origin to the rectangle's top-left corner, so the image
/// corners coincide with the rectangle corners. ImageFit::Exact does the same
/// with an explicit image size. ImageFit::Original leaves the brush transform
/// empty (image pixels map 1:1 to shape units).
///
/// @throws std::invalid_argument if the image is null or invalid.
Geom<Rectangle> makeImageGeom(std::shared_ptr<const Image> image,
                              f64 x, f64 y, f64 width, f64 height,
                              const Affine& transform, ImageFit fit);

} // namespace vellum
