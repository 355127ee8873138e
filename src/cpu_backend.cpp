#include "vellum/cpu_backend.hpp"
#include "vellum/image.hpp"
#include "vellum/recording.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace vellum {

namespace {

constexpr f64 kPi = 3.14159265358979323846;

bool invertible(const Affine& t) {
    f64 det = t.determinant();
    return std::isfinite(det) && det != 0;
}

// --- Signed distance to shape outlines (negative inside) ---

f64 boxDistance(Point p, Point center, Point half, f64 radius, Join join) {
    f64 qx = std::abs(p.x - center.x) - half.x + radius;
    f64 qy = std::abs(p.y - center.y) - half.y + radius;
    f64 inside = std::min(std::max(qx, qy), 0.0);
    if (radius > 0 || join == Join::Round) {
        f64 ox = std::max(qx, 0.0);
        f64 oy = std::max(qy, 0.0);
        return std::sqrt(ox * ox + oy * oy) + inside - radius;
    }
    if (join == Join::Bevel && qx > 0 && qy > 0) {
        return qx + qy;
    }
    return std::max(qx, qy);
}

f64 signedDistance(const Shape& shape, Point p, Join join) {
    switch (shape.kind) {
        case Shape::Kind::Circle: {
            const Circle& c = shape.data.circle;
            return std::hypot(p.x - c.center.x, p.y - c.center.y) - c.radius;
        }
        case Shape::Kind::Rectangle: {
            const Rectangle& r = shape.data.rect;
            Point center{(r.a.x + r.b.x) / 2, (r.a.y + r.b.y) / 2};
            return boxDistance(p, center, {r.width() / 2, r.height() / 2}, 0, join);
        }
        case Shape::Kind::RoundedRectangle: {
            const RoundedRectangle& r = shape.data.rounded;
            Point center{(r.a.x + r.b.x) / 2, (r.a.y + r.b.y) / 2};
            Point half{std::abs(r.b.x - r.a.x) / 2, std::abs(r.b.y - r.a.y) / 2};
            f64 radius = std::clamp(r.radius, 0.0, std::min(half.x, half.y));
            return boxDistance(p, center, half, radius, join);
        }
    }
    return 1;
}

bool covers(const Shape& shape, const StrokeRef* stroke, Point local) {
    if (!stroke) {
        return signedDistance(shape, local, Join::Round) <= 0;
    }
    return std::abs(signedDistance(shape, local, stroke->join)) <= stroke->width / 2;
}

// Device-space pixel range touched by `shape` grown by `pad` local units.
bool deviceBounds(const Shape& shape, f64 pad, const Affine& t, i32 w, i32 h,
                  i32& x0, i32& y0, i32& x1, i32& y1) {
    Point lo, hi;
    shape.bounds(lo, hi);
    lo = {lo.x - pad, lo.y - pad};
    hi = {hi.x + pad, hi.y + pad};
    Point corners[4] = {t * lo, t * Point{hi.x, lo.y}, t * hi, t * Point{lo.x, hi.y}};
    f64 minX = corners[0].x, maxX = corners[0].x;
    f64 minY = corners[0].y, maxY = corners[0].y;
    for (const Point& c : corners) {
        minX = std::min(minX, c.x);
        maxX = std::max(maxX, c.x);
        minY = std::min(minY, c.y);
        maxY = std::max(maxY, c.y);
    }
    if (std::isnan(minX) || std::isnan(maxX) || std::isnan(minY) || std::isnan(maxY)) {
        return false;
    }
    // Clamp before narrowing; device bounds may lie far outside the i32 range.
    x0 = i32(std::clamp(std::floor(minX), 0.0, f64(w)));
    y0 = i32(std::clamp(std::floor(minY), 0.0, f64(h)));
    x1 = i32(std::clamp(std::ceil(maxX) + 1, 0.0, f64(w)));
    y1 = i32(std::clamp(std::ceil(maxY) + 1, 0.0, f64(h)));
    return x0 < x1 && y0 < y1;
}

// --- Paint evaluation ---

f64 applyExtend(f64 t, Extend extend) {
    switch (extend) {
        case Extend::Pad:
            return std::clamp(t, 0.0, 1.0);
        case Extend::Repeat:
            return t - std::floor(t);
        case Extend::Reflect: {
            f64 m = std::fmod(std::abs(t), 2.0);
            return m > 1 ? 2 - m : m;
        }
    }
    return t;
}

// Texel index for texture coordinate `c` on an axis of `n` texels. The
// wrap is done in f64 so coordinates beyond the i32 range stay defined.
i32 extendIndex(f64 c, i32 n, Extend extend) {
    f64 i = std::floor(c);
    f64 size = n;
    switch (extend) {
        case Extend::Pad:
            return i32(std::clamp(i, 0.0, size - 1));
        case Extend::Repeat:
            return i32(std::clamp(i - size * std::floor(i / size), 0.0, size - 1));
        case Extend::Reflect: {
            f64 period = 2 * size;
            f64 m = std::clamp(i - period * std::floor(i / period), 0.0, period - 1);
            return i32(m < size ? m : period - 1 - m);
        }
    }
    return 0;
}

std::array<f32, 4> premultiply(Color c) {
    return {c.r * c.a, c.g * c.a, c.b * c.a, c.a};
}

Color lerp(Color a, Color b, f32 t) {
    return {a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t,
            a.b + (b.b - a.b) * t, a.a + (b.a - a.a) * t};
}

Color sampleStops(const ColorStop* stops, u32 count, f64 t) {
    if (count == 0) return {0, 0, 0, 0};
    if (t <= stops[0].offset) return stops[0].color;
    for (u32 i = 1; i < count; ++i) {
        const ColorStop& prev = stops[i - 1];
        const ColorStop& next = stops[i];
        if (t <= next.offset) {
            f32 span = next.offset - prev.offset;
            if (span <= 0) return next.color;
            return lerp(prev.color, next.color, f32((t - prev.offset) / span));
        }
    }
    return stops[count - 1].color;
}

// Gradient parameter at p, or false where the gradient is undefined.
bool gradientParameter(const GradientKind& kind, Point p, f64& t) {
    switch (kind.type) {
        case GradientKind::Type::Linear: {
            const auto& g = kind.data.linear;
            f64 dx = g.end.x - g.start.x;
            f64 dy = g.end.y - g.start.y;
            f64 len2 = dx * dx + dy * dy;
            if (len2 == 0) return false;
            t = ((p.x - g.start.x) * dx + (p.y - g.start.y) * dy) / len2;
            return true;
        }
        case GradientKind::Type::Radial: {
            // Largest t with |p - c(t)| = r(t) and r(t) >= 0.
            const auto& g = kind.data.radial;
            f64 cdx = g.endCenter.x - g.startCenter.x;
            f64 cdy = g.endCenter.y - g.startCenter.y;
            f64 pdx = p.x - g.startCenter.x;
            f64 pdy = p.y - g.startCenter.y;
            f64 r0 = g.startRadius;
            f64 dr = f64(g.endRadius) - r0;
            f64 a = cdx * cdx + cdy * cdy - dr * dr;
            f64 b = pdx * cdx + pdy * cdy + r0 * dr;
            f64 c = pdx * pdx + pdy * pdy - r0 * r0;
            if (std::abs(a) < 1e-12) {
                if (b == 0) return false;
                t = c / (2 * b);
                return r0 + t * dr >= 0;
            }
            f64 disc = b * b - a * c;
            if (disc < 0) return false;
            f64 root = std::sqrt(disc);
            f64 t1 = (b + root) / a;
            f64 t2 = (b - root) / a;
            if (t1 < t2) std::swap(t1, t2);
            if (r0 + t1 * dr >= 0) { t = t1; return true; }
            if (r0 + t2 * dr >= 0) { t = t2; return true; }
            return false;
        }
        case GradientKind::Type::Sweep: {
            const auto& g = kind.data.sweep;
            f64 span = f64(g.endAngle) - g.startAngle;
            if (span == 0) return false;
            f64 angle = std::atan2(p.y - g.center.y, p.x - g.center.x);
            if (angle < 0) angle += 2 * kPi;
            t = (angle - g.startAngle) / span;
            return true;
        }
    }
    return false;
}

// Porter-Duff factors (Fa, Fb) for source alpha `as` and backdrop alpha `ab`.
void composeFactors(CompositeMode mode, f32 as, f32 ab, f32& fa, f32& fb) {
    switch (mode) {
        case CompositeMode::SourceOver:      fa = 1;      fb = 1 - as; break;
        case CompositeMode::DestinationOver: fa = 1 - ab; fb = 1;      break;
        case CompositeMode::SourceIn:        fa = ab;     fb = 0;      break;
        case CompositeMode::DestinationIn:   fa = 0;      fb = as;     break;
        case CompositeMode::SourceOut:       fa = 1 - ab; fb = 0;      break;
        case CompositeMode::DestinationOut:  fa = 0;      fb = 1 - as; break;
        case CompositeMode::SourceAtop:      fa = ab;     fb = 1 - as; break;
        case CompositeMode::DestinationAtop: fa = 1 - ab; fb = as;     break;
        case CompositeMode::Lighter:         fa = 1;      fb = 1;      break;
        case CompositeMode::Copy:            fa = 1;      fb = 0;      break;
        case CompositeMode::Xor:             fa = 1 - ab; fb = 1 - as; break;
    }
}

// Blend premultiplied `src` onto premultiplied `dst`.
std::array<f32, 4> blend(const std::array<f32, 4>& src, const std::array<f32, 4>& dst,
                         BlendMode mode) {
    f32 as = src[3];
    f32 ab = dst[3];
    f32 fa = 0, fb = 0;
    composeFactors(mode.compose, as, ab, fa, fb);

    std::array<f32, 4> out;
    for (int i = 0; i < 3; ++i) {
        // Source color after mixing with the backdrop, premultiplied by as.
        f32 mixed = src[i];
        if (mode.mix == MixMode::Multiply) {
            mixed = (1 - ab) * src[i] + src[i] * dst[i];
        }
        out[i] = fa * mixed + fb * dst[i];
    }
    out[3] = fa * as + fb * ab;
    if (mode.compose == CompositeMode::Lighter) {
        for (f32& v : out) v = std::min(v, 1.0f);
    }
    return out;
}

void sourceOver(std::array<f32, 4>& dst, const std::array<f32, 4>& src) {
    f32 inv = 1 - src[3];
    for (int i = 0; i < 4; ++i) dst[i] = src[i] + dst[i] * inv;
}

} // namespace

CpuBackend::CpuBackend(Pixmap* target)
    : target_(target) {
    if (target_) {
        width_ = target_->width();
        height_ = target_->height();
    }
}

void CpuBackend::allocateCanvas() {
    layers_.clear();
    layers_.emplace_back();
    layers_.back().pixels.assign(size_t(width_) * size_t(height_), Premul{0, 0, 0, 0});
}

void CpuBackend::beginFrame(Color background) {
    if (target_) {
        width_ = target_->width();
        height_ = target_->height();
    }
    allocateCanvas();
    std::fill(layers_[0].pixels.begin(), layers_[0].pixels.end(), premultiply(background));
    stats_ = {};
    frameImages_.clear();
}

void CpuBackend::execute(const Recording& recording) {
    if (layers_.empty()) allocateCanvas();
    for (const auto& image : recording.images()) {
        if (image) frameImages_.insert(image->uniqueId());
    }
    recording.accept(*this);
}

void CpuBackend::endFrame() {
    if (layers_.size() > 1) {
        std::fprintf(stderr, "vellum CpuBackend: %zu layer(s) still open at end of frame\n",
                     layers_.size() - 1);
        while (layers_.size() > 1) visitPopLayer();
    }
    textures_.retain(frameImages_);
    frameImages_.clear();
    if (!target_ || !target_->valid() || layers_.empty()) return;

    const auto& pixels = layers_[0].pixels;
    for (i32 y = 0; y < height_; ++y) {
        for (i32 x = 0; x < width_; ++x) {
            const Premul& p = pixels[size_t(y) * width_ + x];
            Color c{0, 0, 0, 0};
            if (p[3] > 0) {
                c = {p[0] / p[3], p[1] / p[3], p[2] / p[3], p[3]};
            }
            target_->setPixel(x, y, toPixel(c));
        }
    }
}

void CpuBackend::resize(i32 w, i32 h) {
    if (target_) {
        target_->reallocate(PixmapInfo::Make(w, h, target_->format()));
    }
    width_ = w;
    height_ = h;
    layers_.clear();
}

// --- Shapes ---

void CpuBackend::visitFill(const Shape& shape, FillRule, const PaintRef& paint,
                           const Affine& transform, const Affine* brushTransform) {
    // Circles and (rounded) rectangles are simple closed outlines, so both
    // winding rules cover the same pixels.
    ++stats_.fills;
    paintShape(shape, nullptr, paint, transform, brushTransform);
}

void CpuBackend::visitStroke(const Shape& shape, const StrokeRef& stroke, const PaintRef& paint,
                             const Affine& transform, const Affine* brushTransform) {
    ++stats_.strokes;
    if (stroke.dashCount > 0 && !warnedDashes_) {
        std::fprintf(stderr, "vellum CpuBackend: dash patterns are drawn as solid strokes\n");
        warnedDashes_ = true;
    }
    paintShape(shape, &stroke, paint, transform, brushTransform);
}

void CpuBackend::paintShape(const Shape& shape, const StrokeRef* stroke, const PaintRef& paint,
                            const Affine& transform, const Affine* brushTransform) {
    if (!invertible(transform) || (brushTransform && !invertible(*brushTransform))) {
        ++stats_.skipped;
        return;
    }
    if (layers_.empty()) allocateCanvas();

    f64 pad = stroke ? stroke->width / 2 : 0;
    i32 x0, y0, x1, y1;
    if (!deviceBounds(shape, pad, transform, width_, height_, x0, y0, x1, y1)) return;

    Affine inverse = transform.inverse();
    Affine brushInverse = brushTransform ? brushTransform->inverse() : Affine();
    const Texture* texture = nullptr;
    if (paint.type == Brush::Type::Texture && paint.image && paint.image->valid()) {
        texture = &textureFor(*paint.image);
    }
    auto& pixels = layers_.back().pixels;

    for (i32 y = y0; y < y1; ++y) {
        for (i32 x = x0; x < x1; ++x) {
            Point local = inverse * Point{x + 0.5, y + 0.5};
            if (!covers(shape, stroke, local)) continue;
            sourceOver(pixels[size_t(y) * width_ + x],
                       shade(paint, texture, local, brushInverse));
        }
    }
}

CpuBackend::Premul CpuBackend::shade(const PaintRef& paint, const Texture* texture,
                                     Point local, const Affine& brushInverse) {
    Point p = brushInverse * local;
    switch (paint.type) {
        case Brush::Type::Solid:
            return premultiply(paint.color);
        case Brush::Type::Gradient: {
            f64 t = 0;
            if (!paint.kind || !gradientParameter(*paint.kind, p, t)) return {0, 0, 0, 0};
            return premultiply(sampleStops(paint.stops, paint.stopCount,
                                           applyExtend(t, paint.extend)));
        }
        case Brush::Type::Texture: {
            if (!texture || !std::isfinite(p.x) || !std::isfinite(p.y)) return {0, 0, 0, 0};
            i32 tx = extendIndex(p.x, texture->width, paint.extend);
            i32 ty = extendIndex(p.y, texture->height, paint.extend);
            return texture->texels[size_t(ty) * texture->width + tx];
        }
    }
    return {0, 0, 0, 0};
}

const CpuBackend::Texture& CpuBackend::textureFor(const Image& image) {
    return textures_.getOrCreate(image, [](const Image& img) {
        Texture tex;
        tex.width = img.width();
        tex.height = img.height();
        tex.texels.reserve(size_t(tex.width) * size_t(tex.height));
        for (i32 y = 0; y < tex.height; ++y) {
            for (i32 x = 0; x < tex.width; ++x) {
                tex.texels.push_back(premultiply(toColor(img.pixel(x, y))));
            }
        }
        return tex;
    });
}

// --- Layers ---

void CpuBackend::visitPushLayer(BlendMode blendMode, f32 alpha,
                                const Affine& clipTransform, const Shape& clip) {
    ++stats_.layers;
    if (layers_.empty()) allocateCanvas();

    LayerBuffer layer;
    layer.blend = blendMode;
    layer.alpha = alpha;
    layer.pixels.assign(size_t(width_) * size_t(height_), Premul{0, 0, 0, 0});
    layer.clip.assign(size_t(width_) * size_t(height_), 0);

    i32 x0, y0, x1, y1;
    if (invertible(clipTransform) &&
        deviceBounds(clip, 0, clipTransform, width_, height_, x0, y0, x1, y1)) {
        Affine inverse = clipTransform.inverse();
        for (i32 y = y0; y < y1; ++y) {
            for (i32 x = x0; x < x1; ++x) {
                Point local = inverse * Point{x + 0.5, y + 0.5};
                if (covers(clip, nullptr, local)) layer.clip[size_t(y) * width_ + x] = 1;
            }
        }
    }
    layers_.push_back(std::move(layer));
}

void CpuBackend::visitPopLayer() {
    if (layers_.size() < 2) {
        std::fprintf(stderr, "vellum CpuBackend: pop without a matching push ignored\n");
        return;
    }
    LayerBuffer layer = std::move(layers_.back());
    layers_.pop_back();
    auto& parent = layers_.back().pixels;

    // Clip mixes like Normal; the clip itself is applied through coverage.
    for (size_t i = 0; i < parent.size(); ++i) {
        if (!layer.clip[i]) continue;
        Premul src = layer.pixels[i];
        for (f32& v : src) v *= layer.alpha;
        parent[i] = blend(src, parent[i], layer.blend);
    }
}

// --- Text ---

void CpuBackend::visitGlyphRun(const GlyphRunRef&, const Affine&, const Affine*) {
    ++stats_.glyphRuns;
    if (!warnedGlyphs_) {
        std::fprintf(stderr, "vellum CpuBackend: glyph runs are not rasterized\n");
        warnedGlyphs_ = true;
    }
}

} // namespace vellum
