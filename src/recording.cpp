#include "vellum/recording.hpp"
#include "vellum/draw_op_visitor.hpp"
#include "vellum/image.hpp"
#include <stdexcept>

namespace vellum {

// --- DrawOpArena ---

DrawOpArena::DrawOpArena(size_t initialCapacity) {
    data_.reserve(initialCapacity);
}

u32 DrawOpArena::allocate(size_t bytes, size_t align) {
    size_t offset = (data_.size() + align - 1) / align * align;
    data_.resize(offset + bytes);
    return static_cast<u32>(offset);
}

void DrawOpArena::reset() {
    data_.clear();
}

// --- Recording ---

Recording::Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena,
                     std::vector<std::shared_ptr<const Image>> images,
                     std::vector<std::shared_ptr<const Font>> fonts)
    : ops_(std::move(ops)), arena_(std::move(arena)),
      images_(std::move(images)), fonts_(std::move(fonts)) {
}

const Image* Recording::getImage(u32 index) const {
    if (index < images_.size()) {
        return images_[index].get();
    }
    return nullptr;
}

const Font* Recording::getFont(u32 index) const {
    if (index < fonts_.size()) {
        return fonts_[index].get();
    }
    return nullptr;
}

Gradient Recording::gradientOf(const CompactDrawOp& op) const {
    Gradient g;
    g.extend = op.paint.extend;
    g.kind = op.paint.kind;
    const ColorStop* stops = arena_.getArray<ColorStop>(op.paint.stopsOffset);
    g.stops.assign(stops, stops + op.paint.stopCount);
    return g;
}

static PaintRef makePaintRef(const PaintData& p, const DrawOpArena& arena, const Recording& rec) {
    PaintRef ref;
    ref.type = p.type;
    ref.color = p.color;
    ref.extend = p.extend;
    switch (p.type) {
        case Brush::Type::Solid:
            break;
        case Brush::Type::Gradient:
            ref.kind = &p.kind;
            ref.stops = arena.getArray<ColorStop>(p.stopsOffset);
            ref.stopCount = p.stopCount;
            break;
        case Brush::Type::Texture:
            ref.image = rec.getImage(p.imageIndex);
            break;
    }
    return ref;
}

void Recording::dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const {
    const Affine* aux = op.hasAuxTransform ? &op.auxTransform : nullptr;

    switch (op.type) {
        case DrawOp::Type::Fill:
            visitor.visitFill(op.shape, op.data.fill.rule,
                              makePaintRef(op.paint, arena_, *this), op.transform, aux);
            break;
        case DrawOp::Type::Stroke: {
            const StrokeData& s = op.data.stroke;
            StrokeRef stroke;
            stroke.width = s.width;
            stroke.join = s.join;
            stroke.miterLimit = s.miterLimit;
            stroke.startCap = s.startCap;
            stroke.endCap = s.endCap;
            stroke.dashes = arena_.getArray<Dash>(s.dashesOffset);
            stroke.dashCount = s.dashCount;
            stroke.dashOffset = s.dashOffset;
            visitor.visitStroke(op.shape, stroke,
                                makePaintRef(op.paint, arena_, *this), op.transform, aux);
            break;
        }
        case DrawOp::Type::PushLayer:
            visitor.visitPushLayer(op.data.layer.blend, op.data.layer.alpha,
                                   op.transform, op.shape);
            break;
        case DrawOp::Type::PopLayer:
            visitor.visitPopLayer();
            break;
        case DrawOp::Type::Glyphs: {
            GlyphRunRef run;
            run.font = getFont(op.data.glyphs.fontIndex);
            run.size = op.data.glyphs.size;
            run.weight = op.data.glyphs.weight;
            run.style = op.data.glyphs.style;
            run.color = op.paint.color;
            run.glyphs = arena_.getArray<PositionedGlyph>(op.data.glyphs.glyphsOffset);
            run.count = op.data.glyphs.glyphCount;
            visitor.visitGlyphRun(run, op.transform, aux);
            break;
        }
    }
}

void Recording::accept(DrawOpVisitor& visitor) const {
    for (const auto& op : ops_) {
        dispatchOp(op, visitor);
    }
}

// --- Recorder ---

void Recorder::reset() {
    ops_.clear();
    arena_.reset();
    images_.clear();
    fonts_.clear();
    imageSlots_.clear();
    fontSlots_.clear();
}

u32 Recorder::internImage(const std::shared_ptr<const Image>& image) {
    auto it = imageSlots_.find(image->uniqueId());
    if (it != imageSlots_.end()) return it->second;
    u32 index = static_cast<u32>(images_.size());
    images_.push_back(image);
    imageSlots_.emplace(image->uniqueId(), index);
    return index;
}

u32 Recorder::internFont(const std::shared_ptr<const Font>& font) {
    auto it = fontSlots_.find(font->uniqueId());
    if (it != fontSlots_.end()) return it->second;
    u32 index = static_cast<u32>(fonts_.size());
    fonts_.push_back(font);
    fontSlots_.emplace(font->uniqueId(), index);
    return index;
}

PaintData Recorder::resolvePaint(const Brush& brush) {
    PaintData paint;
    paint.type = brush.type;
    switch (brush.type) {
        case Brush::Type::Solid:
            paint.color = brush.color;
            break;
        case Brush::Type::Gradient: {
            const Gradient& g = brush.gradient;
            paint.extend = g.extend;
            paint.kind = g.kind;
            paint.stopCount = static_cast<u32>(g.stops.size());
            paint.stopsOffset = arena_.storeArray(g.stops.data(), paint.stopCount);
            break;
        }
        case Brush::Type::Texture:
            if (!brush.texture.image) {
                throw std::invalid_argument("Recorder: texture brush without an image");
            }
            paint.extend = brush.texture.edge;
            paint.imageIndex = internImage(brush.texture.image);
            break;
    }
    return paint;
}

void Recorder::fill(const Shape& shape, FillRule rule, const Brush& brush,
                    const Affine& transform, const std::optional<Affine>& brushTransform) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::Fill;
    op.transform = transform;
    op.hasAuxTransform = brushTransform.has_value();
    if (brushTransform) op.auxTransform = *brushTransform;
    op.shape = shape;
    op.paint = resolvePaint(brush);
    op.data.fill.rule = rule;
    ops_.push_back(op);
}

void Recorder::stroke(const Shape& shape, const StrokeStyle& style, const Brush& brush,
                      const Affine& transform, const std::optional<Affine>& brushTransform) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::Stroke;
    op.transform = transform;
    op.hasAuxTransform = brushTransform.has_value();
    if (brushTransform) op.auxTransform = *brushTransform;
    op.shape = shape;
    op.paint = resolvePaint(brush);

    StrokeData& s = op.data.stroke;
    s.width = style.width;
    s.miterLimit = style.miterLimit;
    s.dashOffset = style.dashOffset;
    s.dashCount = static_cast<u32>(style.dashPattern.size());
    s.dashesOffset = arena_.storeArray(style.dashPattern.data(), s.dashCount);
    s.join = style.join;
    s.startCap = style.startCap;
    s.endCap = style.endCap;
    ops_.push_back(op);
}

void Recorder::pushLayer(BlendMode blend, f32 alpha, const Affine& clipTransform, const Shape& clip) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::PushLayer;
    op.transform = clipTransform;
    op.shape = clip;
    op.data.layer.blend = blend;
    op.data.layer.alpha = alpha;
    ops_.push_back(op);
}

void Recorder::popLayer() {
    CompactDrawOp op{};
    op.type = DrawOp::Type::PopLayer;
    ops_.push_back(op);
}

void Recorder::drawGlyphs(std::shared_ptr<const Font> font, f32 size, f32 weight, FontStyle style,
                          Color color, const Affine& transform,
                          const std::optional<Affine>& glyphTransform,
                          const std::vector<PositionedGlyph>& glyphs) {
    if (!font) {
        throw std::invalid_argument("Recorder: glyph run without a font");
    }
    CompactDrawOp op{};
    op.type = DrawOp::Type::Glyphs;
    op.transform = transform;
    op.hasAuxTransform = glyphTransform.has_value();
    if (glyphTransform) op.auxTransform = *glyphTransform;
    op.paint.type = Brush::Type::Solid;
    op.paint.color = color;
    op.data.glyphs.fontIndex = internFont(font);
    op.data.glyphs.size = size;
    op.data.glyphs.weight = weight;
    op.data.glyphs.style = style;
    op.data.glyphs.glyphCount = static_cast<u32>(glyphs.size());
    op.data.glyphs.glyphsOffset = arena_.storeArray(glyphs.data(), op.data.glyphs.glyphCount);
    ops_.push_back(op);
}

void Recorder::append(const Recording& other, const Affine& transform) {
    const DrawOpArena& src = other.arena();

    for (const auto& srcOp : other.ops()) {
        CompactDrawOp op = srcOp;
        if (op.type != DrawOp::Type::PopLayer) {
            op.transform = transform * srcOp.transform;
        }

        switch (op.type) {
            case DrawOp::Type::Fill:
            case DrawOp::Type::Stroke:
                if (op.paint.type == Brush::Type::Gradient) {
                    op.paint.stopsOffset = arena_.storeArray(
                        src.getArray<ColorStop>(srcOp.paint.stopsOffset), op.paint.stopCount);
                } else if (op.paint.type == Brush::Type::Texture) {
                    op.paint.imageIndex = internImage(other.images()[srcOp.paint.imageIndex]);
                }
                if (op.type == DrawOp::Type::Stroke) {
                    op.data.stroke.dashesOffset = arena_.storeArray(
                        src.getArray<Dash>(srcOp.data.stroke.dashesOffset),
                        op.data.stroke.dashCount);
                }
                break;
            case DrawOp::Type::Glyphs:
                op.data.glyphs.fontIndex = internFont(other.fonts()[srcOp.data.glyphs.fontIndex]);
                op.data.glyphs.glyphsOffset = arena_.storeArray(
                    src.getArray<PositionedGlyph>(srcOp.data.glyphs.glyphsOffset),
                    op.data.glyphs.glyphCount);
                break;
            case DrawOp::Type::PushLayer:
            case DrawOp::Type::PopLayer:
                break;
        }
        ops_.push_back(op);
    }
}

std::unique_ptr<Recording> Recorder::finish() {
    auto recording = std::make_unique<Recording>(std::move(ops_), std::move(arena_),
                                                 std::move(images_), std::move(fonts_));
    reset();
    return recording;
}

} // namespace vellum
