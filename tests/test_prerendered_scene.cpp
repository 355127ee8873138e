#include <gtest/gtest.h>
#include <vellum/prerendered_scene.hpp>
#include <vellum/geom.hpp>
#include <vellum/scene.hpp>
#include <stdexcept>

using namespace vellum;

static std::shared_ptr<const Recording> buildBadge() {
    Scene sub({}, 10, 10, Scene::Origin::TopLeft);
    sub.startLayer(MixMode::Normal, CompositeMode::SourceOver,
                   Rectangle{{0, 0}, {10, 10}}, Affine());
    sub.draw(Geom<Circle>(Style::MakeFill(), Circle{{5, 5}, 5},
                          Brush::MakeSolid({0, 0, 1, 1}), Affine::Translate(1, 0)));
    sub.endLayer();
    return sub.finish();
}

TEST(PrerenderedScene, AppendsUnderComposedTransform) {
    PrerenderedScene badge(buildBadge(), Affine::Scale(2));

    Scene scene({}, 100, 100);
    scene.draw(badge);
    scene.draw(badge);
    auto recording = scene.finish();

    ASSERT_EQ(recording->ops().size(), 6u);
    Affine placement = Affine::Translate(50, 50) * Affine::Scale(2);
    EXPECT_EQ(recording->ops()[0].transform, placement * Affine());
    EXPECT_EQ(recording->ops()[1].transform, placement * Affine::Translate(1, 0));
    EXPECT_EQ(recording->ops()[2].type, DrawOp::Type::PopLayer);
    EXPECT_EQ(recording->ops()[4].transform, placement * Affine::Translate(1, 0));
}

TEST(PrerenderedScene, FromSceneFinishesTheSubScene) {
    Scene sub({}, 10, 10, Scene::Origin::TopLeft);
    sub.draw(Geom<Circle>(Style::MakeFill(), Circle{{0, 0}, 1}, Brush::MakeSolid({})));
    PrerenderedScene pre = PrerenderedScene::FromScene(sub, Affine::Translate(3, 3));

    ASSERT_NE(pre.recording, nullptr);
    EXPECT_EQ(pre.recording->ops().size(), 1u);
    EXPECT_EQ(pre.transform, Affine::Translate(3, 3));
    EXPECT_EQ(sub.recorder().opCount(), 0u);
}

TEST(PrerenderedScene, FromSceneWithOpenLayerThrows) {
    Scene sub({}, 10, 10);
    sub.startLayer(MixMode::Normal, CompositeMode::SourceOver, Circle{{0, 0}, 1}, Affine());
    EXPECT_THROW(PrerenderedScene::FromScene(sub, Affine()), std::logic_error);
}

TEST(PrerenderedScene, MissingRecordingThrows) {
    Scene scene({}, 10, 10);
    EXPECT_THROW(scene.draw(PrerenderedScene()), std::invalid_argument);
}
