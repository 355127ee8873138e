#include "vellum/geom.hpp"
#include "vellum/image.hpp"
#include "vellum/scene.hpp"
#include <stdexcept>

namespace vellum {

void drawGeom(Scene& scene, const Style& style, const Shape& shape, const Brush& brush,
              const Affine& transform, const std::optional<Affine>& brushTransform) {
    Affine t = scene.globalTransform() * transform;

    if (style.isFill()) {
        scene.recorder().fill(shape, style.fillRule, brush, t, brushTransform);
        return;
    }

    if (brush.isTexture()) {
        throw std::logic_error("Geom: stroking a texture brush is not supported");
    }
    scene.recorder().stroke(shape, style.stroke, brush, t, brushTransform);
}

Geom<Rectangle> makeImageGeom(std::shared_ptr<const Image> image,
                              f64 x, f64 y, f64 width, f64 height,
                              const Affine& transform, ImageFit fit) {
    if (!image || !image->valid()) {
        throw std::invalid_argument("makeImageGeom: invalid image");
    }

    Rectangle rect = Rectangle::MakeCentered(x, y, width, height);
    const f64 imageW = f64(image->width());
    const f64 imageH = f64(image->height());

    // Brush space is anchored at the image's own (0, 0): scale first, then
    // move that origin onto the rectangle's top-left corner.
    std::optional<Affine> brushTransform;
    switch (fit.mode) {
        case ImageFit::Mode::Original:
            break;
        case ImageFit::Mode::Fill:
            brushTransform = Affine::Translate(rect.a) * Affine::Scale(width / imageW, height / imageH);
            break;
        case ImageFit::Mode::Exact:
            brushTransform = Affine::Translate(rect.a) *
                             Affine::Scale(fit.width / imageW, fit.height / imageH);
            break;
    }

    Brush brush = Brush::MakeTexture(std::move(image), fit);
    return Geom<Rectangle>(Style::MakeFill(FillRule::NonZero), rect, std::move(brush),
                           transform, brushTransform);
}

} // namespace vellum
