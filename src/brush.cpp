#include "vellum/brush.hpp"
#include "vellum/image.hpp"
#include <stdexcept>
#include <utility>

namespace vellum {

// --- GradientKind ---

GradientKind GradientKind::MakeLinear(Point start, Point end) {
    GradientKind k;
    k.type = Type::Linear;
    k.data.linear.start = start;
    k.data.linear.end = end;
    return k;
}

GradientKind GradientKind::MakeRadial(Point startCenter, f32 startRadius,
                                      Point endCenter, f32 endRadius) {
    GradientKind k;
    k.type = Type::Radial;
    k.data.radial.startCenter = startCenter;
    k.data.radial.startRadius = startRadius;
    k.data.radial.endCenter = endCenter;
    k.data.radial.endRadius = endRadius;
    return k;
}

GradientKind GradientKind::MakeSweep(Point center, f32 startAngle, f32 endAngle) {
    GradientKind k;
    k.type = Type::Sweep;
    k.data.sweep.center = center;
    k.data.sweep.startAngle = startAngle;
    k.data.sweep.endAngle = endAngle;
    return k;
}

bool operator==(const GradientKind& a, const GradientKind& b) {
    if (a.type != b.type) return false;
    switch (a.type) {
        case GradientKind::Type::Linear:
            return a.data.linear.start == b.data.linear.start &&
                   a.data.linear.end == b.data.linear.end;
        case GradientKind::Type::Radial:
            return a.data.radial.startCenter == b.data.radial.startCenter &&
                   a.data.radial.startRadius == b.data.radial.startRadius &&
                   a.data.radial.endCenter == b.data.radial.endCenter &&
                   a.data.radial.endRadius == b.data.radial.endRadius;
        case GradientKind::Type::Sweep:
            return a.data.sweep.center == b.data.sweep.center &&
                   a.data.sweep.startAngle == b.data.sweep.startAngle &&
                   a.data.sweep.endAngle == b.data.sweep.endAngle;
    }
    return false;
}

// --- Gradient ---

Gradient Gradient::MakeEquidistant(Extend extend, const GradientKind& kind,
                                   const std::vector<Color>& colors) {
    if (colors.size() < 2) {
        throw std::invalid_argument("Gradient::MakeEquidistant: at least two colors are required");
    }

    Gradient g;
    g.extend = extend;
    g.kind = kind;
    g.stops.reserve(colors.size());
    const f32 last = f32(colors.size() - 1);
    for (size_t i = 0; i < colors.size(); ++i) {
        g.stops.push_back({f32(i) / last, colors[i]});
    }
    return g;
}

bool Gradient::stopsAreMonotonic() const {
    for (size_t i = 1; i < stops.size(); ++i) {
        if (stops[i].offset < stops[i - 1].offset) return false;
    }
    return true;
}

bool operator==(const Gradient& a, const Gradient& b) {
    return a.extend == b.extend && a.kind == b.kind && a.stops == b.stops;
}

// --- Brush ---

Brush Brush::MakeSolid(Color c) {
    Brush b;
    b.type = Type::Solid;
    b.color = c;
    return b;
}

Brush Brush::MakeGradient(vellum::Gradient g) {
    Brush b;
    b.type = Type::Gradient;
    b.gradient = std::move(g);
    return b;
}

Brush Brush::MakeTexture(std::shared_ptr<const Image> image, ImageFit fit,
                         Extend edge, Point offset) {
    Brush b;
    b.type = Type::Texture;
    b.texture.image = std::move(image);
    b.texture.fit = fit;
    b.texture.edge = edge;
    b.texture.offset = offset;
    return b;
}

} // namespace vellum
