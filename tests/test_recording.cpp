#include <gtest/gtest.h>
#include <vellum/recording.hpp>
#include <vellum/draw_op_visitor.hpp>
#include <vellum/image.hpp>
#include "fake_font.hpp"

#include <stdexcept>
#include <vector>

using namespace vellum;

// --- Mock visitor that records what each callback received ---

struct VisitorCall {
    enum class Kind { Fill, Stroke, PushLayer, PopLayer, GlyphRun };
    Kind kind;
    Affine transform;
    bool hasAux = false;
    Affine aux;
    Shape shape;
    Brush::Type paintType = Brush::Type::Solid;
    Color color;
    std::vector<ColorStop> stops;
    const Image* image = nullptr;
    std::vector<Dash> dashes;
    BlendMode blend;
    f32 alpha = 1;
    std::vector<PositionedGlyph> glyphs;
    const Font* font = nullptr;
};

class MockVisitor : public DrawOpVisitor {
public:
    std::vector<VisitorCall> calls;

    void visitFill(const Shape& shape, FillRule, const PaintRef& paint,
                   const Affine& transform, const Affine* brushTransform) override {
        calls.push_back(paintCall(VisitorCall::Kind::Fill, shape, paint, transform, brushTransform));
    }
    void visitStroke(const Shape& shape, const StrokeRef& stroke, const PaintRef& paint,
                     const Affine& transform, const Affine* brushTransform) override {
        auto call = paintCall(VisitorCall::Kind::Stroke, shape, paint, transform, brushTransform);
        call.dashes.assign(stroke.dashes, stroke.dashes + stroke.dashCount);
        calls.push_back(call);
    }
    void visitPushLayer(BlendMode blend, f32 alpha, const Affine& clipTransform,
                        const Shape& clip) override {
        VisitorCall call{VisitorCall::Kind::PushLayer};
        call.blend = blend;
        call.alpha = alpha;
        call.transform = clipTransform;
        call.shape = clip;
        calls.push_back(call);
    }
    void visitPopLayer() override {
        calls.push_back({VisitorCall::Kind::PopLayer});
    }
    void visitGlyphRun(const GlyphRunRef& run, const Affine& transform,
                       const Affine* glyphTransform) override {
        VisitorCall call{VisitorCall::Kind::GlyphRun};
        call.transform = transform;
        call.hasAux = glyphTransform != nullptr;
        if (glyphTransform) call.aux = *glyphTransform;
        call.color = run.color;
        call.font = run.font;
        call.glyphs.assign(run.glyphs, run.glyphs + run.count);
        calls.push_back(call);
    }

private:
    static VisitorCall paintCall(VisitorCall::Kind kind, const Shape& shape, const PaintRef& paint,
                                 const Affine& transform, const Affine* brushTransform) {
        VisitorCall call{kind};
        call.shape = shape;
        call.transform = transform;
        call.hasAux = brushTransform != nullptr;
        if (brushTransform) call.aux = *brushTransform;
        call.paintType = paint.type;
        call.color = paint.color;
        call.stops.assign(paint.stops, paint.stops + paint.stopCount);
        call.image = paint.image;
        return call;
    }
};

static std::shared_ptr<const Image> makeImage(i32 w, i32 h) {
    return Image::MakeFromBytes(std::vector<u8>(size_t(w) * size_t(h) * 4, 255), w, h);
}

// --- Recorder starts empty ---

TEST(Recording, RecorderStartsEmpty) {
    Recorder rec;
    auto recording = rec.finish();
    ASSERT_NE(recording, nullptr);
    EXPECT_EQ(recording->ops().size(), 0u);
}

// --- Fill ---

TEST(Recording, FillRecorded) {
    Recorder rec;
    rec.fill(Circle{{1, 2}, 3}, FillRule::EvenOdd, Brush::MakeSolid({1, 0, 0, 1}),
             Affine::Translate(5, 5), std::nullopt);

    auto recording = rec.finish();
    ASSERT_EQ(recording->ops().size(), 1u);
    const auto& op = recording->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::Fill);
    EXPECT_EQ(op.data.fill.rule, FillRule::EvenOdd);
    EXPECT_FALSE(op.hasAuxTransform);
    EXPECT_EQ(op.transform, Affine::Translate(5, 5));
    EXPECT_EQ(op.paint.color, (Color{1, 0, 0, 1}));
}

TEST(Recording, GradientStopsSurviveTheArena) {
    Gradient g = Gradient::MakeEquidistant(
        Extend::Repeat, GradientKind::MakeLinear({0, 0}, {10, 0}),
        {{1, 0, 0, 1}, {0, 1, 0, 1}, {0, 0, 1, 1}, {1, 1, 1, 0}});

    Recorder rec;
    rec.fill(Rectangle{{0, 0}, {10, 10}}, FillRule::NonZero, Brush::MakeGradient(g),
             Affine(), Affine::Scale(2));
    auto recording = rec.finish();

    EXPECT_EQ(recording->gradientOf(recording->ops()[0]), g);

    MockVisitor visitor;
    recording->accept(visitor);
    ASSERT_EQ(visitor.calls.size(), 1u);
    EXPECT_EQ(visitor.calls[0].paintType, Brush::Type::Gradient);
    EXPECT_EQ(visitor.calls[0].stops, g.stops);
    ASSERT_TRUE(visitor.calls[0].hasAux);
    EXPECT_EQ(visitor.calls[0].aux, Affine::Scale(2));
}

TEST(Recording, StrokeKeepsDashPattern) {
    StrokeStyle style;
    style.width = 4;
    style.dashPattern = {{4, 2, 1, 2}, {8, 8, 0, 0}};

    Recorder rec;
    rec.stroke(Rectangle{{0, 0}, {10, 10}}, style, Brush::MakeSolid({}), Affine(), std::nullopt);
    auto recording = rec.finish();

    const auto& op = recording->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::Stroke);
    EXPECT_DOUBLE_EQ(op.data.stroke.width, 4);

    MockVisitor visitor;
    recording->accept(visitor);
    ASSERT_EQ(visitor.calls.size(), 1u);
    EXPECT_EQ(visitor.calls[0].dashes, style.dashPattern);
}

// --- Images ---

TEST(Recording, ImagesAreDeduplicatedByIdentity) {
    auto a = makeImage(2, 2);
    auto b = makeImage(2, 2);

    Recorder rec;
    Shape rect = Rectangle{{0, 0}, {2, 2}};
    rec.fill(rect, FillRule::NonZero, Brush::MakeTexture(a), Affine(), std::nullopt);
    rec.fill(rect, FillRule::NonZero, Brush::MakeTexture(b), Affine(), std::nullopt);
    rec.fill(rect, FillRule::NonZero, Brush::MakeTexture(a), Affine(), std::nullopt);
    auto recording = rec.finish();

    ASSERT_EQ(recording->images().size(), 2u);
    EXPECT_EQ(recording->ops()[0].paint.imageIndex, recording->ops()[2].paint.imageIndex);

    MockVisitor visitor;
    recording->accept(visitor);
    EXPECT_EQ(visitor.calls[0].image, a.get());
    EXPECT_EQ(visitor.calls[1].image, b.get());
}

TEST(Recording, TextureWithoutImageThrows) {
    Recorder rec;
    Brush brush = Brush::MakeTexture(nullptr);
    EXPECT_THROW(rec.fill(Rectangle{}, FillRule::NonZero, brush, Affine(), std::nullopt),
                 std::invalid_argument);
    EXPECT_EQ(rec.opCount(), 0u);
}

TEST(Recording, GetImageOutOfRangeReturnsNull) {
    Recorder rec;
    auto recording = rec.finish();
    EXPECT_EQ(recording->getImage(0), nullptr);
    EXPECT_EQ(recording->getFont(3), nullptr);
}

// --- Layers and glyphs ---

TEST(Recording, LayersReplayInOrder) {
    Recorder rec;
    rec.pushLayer({MixMode::Multiply, CompositeMode::SourceIn}, 0.5f,
                  Affine::Translate(1, 1), Circle{{0, 0}, 4});
    rec.fill(Circle{{0, 0}, 1}, FillRule::NonZero, Brush::MakeSolid({}), Affine(), std::nullopt);
    rec.popLayer();
    auto recording = rec.finish();

    MockVisitor visitor;
    recording->accept(visitor);
    ASSERT_EQ(visitor.calls.size(), 3u);
    EXPECT_EQ(visitor.calls[0].kind, VisitorCall::Kind::PushLayer);
    EXPECT_EQ(visitor.calls[0].blend, (BlendMode{MixMode::Multiply, CompositeMode::SourceIn}));
    EXPECT_FLOAT_EQ(visitor.calls[0].alpha, 0.5f);
    EXPECT_EQ(visitor.calls[0].transform, Affine::Translate(1, 1));
    EXPECT_EQ(visitor.calls[0].shape, Shape(Circle{{0, 0}, 4}));
    EXPECT_EQ(visitor.calls[1].kind, VisitorCall::Kind::Fill);
    EXPECT_EQ(visitor.calls[2].kind, VisitorCall::Kind::PopLayer);
}

TEST(Recording, GlyphRunRecorded) {
    auto font = std::make_shared<FakeFont>();
    std::vector<PositionedGlyph> glyphs = {{1, 0, 0}, {2, 10, 0}};

    Recorder rec;
    rec.drawGlyphs(font, 16, 400, FontStyle::Italic, {0, 0, 1, 1}, Affine::Scale(2),
                   Affine::Rotate(0.1), glyphs);
    auto recording = rec.finish();
    ASSERT_EQ(recording->fonts().size(), 1u);

    MockVisitor visitor;
    recording->accept(visitor);
    ASSERT_EQ(visitor.calls.size(), 1u);
    const auto& call = visitor.calls[0];
    EXPECT_EQ(call.font, font.get());
    EXPECT_EQ(call.color, (Color{0, 0, 1, 1}));
    ASSERT_EQ(call.glyphs.size(), 2u);
    EXPECT_EQ(call.glyphs[1].id, 2u);
    EXPECT_FLOAT_EQ(call.glyphs[1].x, 10.0f);
    EXPECT_TRUE(call.hasAux);
}

TEST(Recording, GlyphRunWithoutFontThrows) {
    Recorder rec;
    EXPECT_THROW(rec.drawGlyphs(nullptr, 16, 400, FontStyle::Normal, {}, Affine(),
                                std::nullopt, {}),
                 std::invalid_argument);
}

// --- append ---

TEST(Recording, AppendComposesTransformsAndRehomesData) {
    auto img = makeImage(1, 1);
    Recorder inner;
    inner.pushLayer({}, 1, Affine::Translate(1, 0), Rectangle{{0, 0}, {4, 4}});
    inner.fill(Rectangle{{0, 0}, {1, 1}}, FillRule::NonZero, Brush::MakeTexture(img),
               Affine::Translate(2, 0), Affine::Scale(3));
    inner.popLayer();
    auto sub = inner.finish();

    Recorder outer;
    // Occupy arena and image slots so the appended data must move.
    outer.fill(Rectangle{}, FillRule::NonZero,
               Brush::MakeGradient(Gradient::MakeEquidistant(
                   Extend::Pad, GradientKind::MakeLinear({0, 0}, {1, 0}),
                   {{0, 0, 0, 1}, {1, 1, 1, 1}})),
               Affine(), std::nullopt);
    outer.fill(Rectangle{}, FillRule::NonZero, Brush::MakeTexture(makeImage(1, 1)),
               Affine(), std::nullopt);
    outer.append(*sub, Affine::Scale(2));
    auto recording = outer.finish();

    ASSERT_EQ(recording->ops().size(), 5u);
    EXPECT_EQ(recording->images().size(), 2u);

    MockVisitor visitor;
    recording->accept(visitor);
    ASSERT_EQ(visitor.calls.size(), 5u);
    EXPECT_EQ(visitor.calls[2].kind, VisitorCall::Kind::PushLayer);
    EXPECT_EQ(visitor.calls[2].transform, Affine::Scale(2) * Affine::Translate(1, 0));
    EXPECT_EQ(visitor.calls[3].transform, Affine::Scale(2) * Affine::Translate(2, 0));
    EXPECT_EQ(visitor.calls[3].aux, Affine::Scale(3));
    EXPECT_EQ(visitor.calls[3].image, img.get());
    EXPECT_EQ(visitor.calls[4].kind, VisitorCall::Kind::PopLayer);
}

// --- finish ---

TEST(Recording, FinishResetsRecorder) {
    Recorder rec;
    rec.popLayer();
    auto first = rec.finish();
    EXPECT_EQ(first->ops().size(), 1u);
    EXPECT_EQ(rec.opCount(), 0u);
    EXPECT_EQ(rec.finish()->ops().size(), 0u);
}

// --- Arena ---

TEST(DrawOpArena, StoreArrayAlignsItems) {
    DrawOpArena arena;
    u8 byte = 7;
    arena.storeArray(&byte, 1);
    f64 values[2] = {1.5, 2.5};
    u32 offset = arena.storeArray(values, 2);
    EXPECT_EQ(offset % alignof(f64), 0u);
    EXPECT_DOUBLE_EQ(arena.getArray<f64>(offset)[1], 2.5);
}
