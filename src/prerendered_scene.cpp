#include "vellum/prerendered_scene.hpp"
#include "vellum/scene.hpp"
#include <stdexcept>

namespace vellum {

PrerenderedScene PrerenderedScene::FromScene(Scene& scene, const Affine& transform) {
    std::shared_ptr<const Recording> recording = scene.finish();
    return PrerenderedScene(std::move(recording), transform);
}

void PrerenderedScene::draw(Scene& scene) const {
    if (!recording) {
        throw std::invalid_argument("PrerenderedScene: no recording to append");
    }
    scene.recorder().append(*recording, scene.globalTransform() * transform);
}

} // namespace vellum
