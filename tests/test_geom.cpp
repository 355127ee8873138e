#include <gtest/gtest.h>
#include <vellum/geom.hpp>
#include <vellum/image.hpp>
#include <vellum/scene.hpp>
#include <stdexcept>

using namespace vellum;

static std::shared_ptr<const Image> makeImage(i32 w, i32 h) {
    return Image::MakeFromBytes(std::vector<u8>(size_t(w) * size_t(h) * 4, 200), w, h);
}

static void expectPoint(Point actual, Point expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-9);
    EXPECT_NEAR(actual.y, expected.y, 1e-9);
}

// --- Transforms ---

TEST(Geom, TransformIsGlobalTimesLocal) {
    Scene scene({}, 100, 100);
    Geom<Rectangle> g(Style::MakeFill(), Rectangle{{0, 0}, {1, 1}},
                      Brush::MakeSolid({0, 1, 0, 1}), Affine::Scale(3));
    scene.draw(g);
    auto recording = scene.finish();

    const auto& op = recording->ops()[0];
    EXPECT_EQ(op.transform, Affine::Translate(50, 50) * Affine::Scale(3));
    expectPoint(op.transform * Point{1, 1}, {53, 53});
    EXPECT_FALSE(op.hasAuxTransform);
}

TEST(Geom, BrushTransformPassedUntouched) {
    Scene scene({}, 100, 100);
    scene.draw(Geom<Circle>(Style::MakeFill(), Circle{{0, 0}, 5}, Brush::MakeSolid({}),
                            Affine::Translate(1, 1), Affine::Rotate(0.5)));
    auto recording = scene.finish();
    ASSERT_TRUE(recording->ops()[0].hasAuxTransform);
    EXPECT_EQ(recording->ops()[0].auxTransform, Affine::Rotate(0.5));
}

// --- Style ---

TEST(Geom, StrokeRecordsStrokeStyle) {
    StrokeStyle stroke;
    stroke.width = 2.5;
    stroke.join = Join::Miter;
    Scene scene({}, 10, 10);
    scene.draw(Geom<RoundedRectangle>(Style::MakeStroke(stroke),
                                      RoundedRectangle{{0, 0}, {4, 4}, 1},
                                      Brush::MakeSolid({})));
    auto recording = scene.finish();
    const auto& op = recording->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::Stroke);
    EXPECT_DOUBLE_EQ(op.data.stroke.width, 2.5);
    EXPECT_EQ(op.data.stroke.join, Join::Miter);
    EXPECT_EQ(op.shape.kind, Shape::Kind::RoundedRectangle);
}

TEST(Geom, StrokingTextureThrows) {
    Scene scene({}, 10, 10);
    Geom<Rectangle> g(Style::MakeStroke({}), Rectangle{{0, 0}, {4, 4}},
                      Brush::MakeTexture(makeImage(2, 2)));
    EXPECT_THROW(scene.draw(g), std::logic_error);
    EXPECT_EQ(scene.recorder().opCount(), 0u);
}

// --- Image geometry ---

TEST(Geom, ImageFillMapsCornersOntoRectangle) {
    auto img = makeImage(4, 2);
    auto g = makeImageGeom(img, 10, 20, 40, 10, Affine(), ImageFit::Fill());
    EXPECT_EQ(g.shape.a, (Point{-10, 15}));
    EXPECT_EQ(g.shape.b, (Point{30, 25}));
    ASSERT_TRUE(g.brushTransform.has_value());

    // Image corners land on rectangle corners.
    expectPoint(*g.brushTransform * Point{0, 0}, {-10, 15});
    expectPoint(*g.brushTransform * Point{4, 2}, {30, 25});
    EXPECT_TRUE(g.brush.isTexture());
    EXPECT_EQ(g.brush.texture.image, img);
}

TEST(Geom, ImageExactScalesToGivenSize) {
    auto g = makeImageGeom(makeImage(4, 4), 0, 0, 8, 8, Affine(), ImageFit::Exact(2, 6));
    ASSERT_TRUE(g.brushTransform.has_value());
    expectPoint(*g.brushTransform * Point{0, 0}, {-4, -4});
    expectPoint(*g.brushTransform * Point{4, 4}, {-2, 2});
}

TEST(Geom, ImageOriginalHasNoBrushTransform) {
    auto g = makeImageGeom(makeImage(4, 4), 0, 0, 8, 8, Affine::Scale(2), ImageFit::Original());
    EXPECT_FALSE(g.brushTransform.has_value());
    EXPECT_EQ(g.transform, Affine::Scale(2));
}

TEST(Geom, ImageGeomRejectsMissingImage) {
    EXPECT_THROW(makeImageGeom(nullptr, 0, 0, 1, 1, Affine(), ImageFit::Fill()),
                 std::invalid_argument);
}
