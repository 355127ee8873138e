#include <gtest/gtest.h>
#include <vellum/brush.hpp>
#include <vellum/image.hpp>
#include <stdexcept>

using namespace vellum;

// --- Gradient ---

TEST(Gradient, EquidistantStopsSpanUnitInterval) {
    auto kind = GradientKind::MakeLinear({0, 0}, {100, 0});
    Gradient g = Gradient::MakeEquidistant(Extend::Pad, kind,
                                           {{1, 0, 0, 1}, {0, 1, 0, 1}, {0, 0, 1, 1}});
    ASSERT_EQ(g.stops.size(), 3u);
    EXPECT_FLOAT_EQ(g.stops[0].offset, 0.0f);
    EXPECT_FLOAT_EQ(g.stops[1].offset, 0.5f);
    EXPECT_FLOAT_EQ(g.stops[2].offset, 1.0f);
    EXPECT_EQ(g.stops[1].color, (Color{0, 1, 0, 1}));
    EXPECT_EQ(g.kind, kind);
    EXPECT_TRUE(g.stopsAreMonotonic());
}

TEST(Gradient, EquidistantNeedsTwoColors) {
    auto kind = GradientKind::MakeSweep({0, 0}, 0, 1);
    EXPECT_THROW(Gradient::MakeEquidistant(Extend::Pad, kind, {{1, 1, 1, 1}}),
                 std::invalid_argument);
    EXPECT_THROW(Gradient::MakeEquidistant(Extend::Pad, kind, {}), std::invalid_argument);
}

TEST(Gradient, UnsortedStopsAreKept) {
    Gradient g;
    g.stops = {{0.8f, {1, 0, 0, 1}}, {0.2f, {0, 0, 1, 1}}};
    EXPECT_FALSE(g.stopsAreMonotonic());
    EXPECT_FLOAT_EQ(g.stops[0].offset, 0.8f);
}

TEST(GradientKind, EqualityComparesActiveVariant) {
    auto a = GradientKind::MakeRadial({0, 0}, 1, {1, 1}, 5);
    auto b = GradientKind::MakeRadial({0, 0}, 1, {1, 1}, 5);
    auto c = GradientKind::MakeRadial({0, 0}, 2, {1, 1}, 5);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, GradientKind::MakeLinear({0, 0}, {1, 1}));
}

// --- Brush ---

TEST(Brush, SolidFactory) {
    Brush b = Brush::MakeSolid({0.1f, 0.2f, 0.3f, 0.4f});
    EXPECT_TRUE(b.isSolid());
    EXPECT_EQ(b.color, (Color{0.1f, 0.2f, 0.3f, 0.4f}));
}

TEST(Brush, TextureFactoryKeepsImageAndEdge) {
    auto img = Image::MakeFromBytes(std::vector<u8>(4, 255), 1, 1);
    ASSERT_NE(img, nullptr);
    Brush b = Brush::MakeTexture(img, ImageFit::Fill(), Extend::Repeat, {2, 3});
    EXPECT_TRUE(b.isTexture());
    EXPECT_EQ(b.texture.image, img);
    EXPECT_EQ(b.texture.fit.mode, ImageFit::Mode::Fill);
    EXPECT_EQ(b.texture.edge, Extend::Repeat);
    EXPECT_EQ(b.texture.offset, (Point{2, 3}));
}

TEST(Brush, GradientFactory) {
    Gradient g = Gradient::MakeEquidistant(Extend::Reflect,
                                           GradientKind::MakeLinear({0, 0}, {1, 0}),
                                           {{0, 0, 0, 1}, {1, 1, 1, 1}});
    Brush b = Brush::MakeGradient(g);
    EXPECT_TRUE(b.isGradient());
    EXPECT_EQ(b.gradient, g);
}
