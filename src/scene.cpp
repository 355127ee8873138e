#include "vellum/scene.hpp"
#include "vellum/drawable.hpp"
#include <stdexcept>
#include <string>

namespace vellum {

Scene::Scene(Color background, u32 width, u32 height, Origin origin)
    : background_(background),
      width_(width),
      height_(height) {
    if (origin == Origin::Center) {
        globalTransform_ = Affine::Translate(f64(width) / 2.0, f64(height) / 2.0);
    }
}

void Scene::draw(const Drawable& drawable) {
    drawable.draw(*this);
}

void Scene::startLayer(MixMode mix, CompositeMode composite, const Shape& clip,
                       const Affine& clipTransform,
                       const std::optional<Affine>& layerTransform,
                       f32 alpha) {
    if (layerTransform) {
        throw std::logic_error("Scene::startLayer: layer transforms are not supported");
    }
    recorder_.pushLayer({mix, composite}, alpha, globalTransform_ * clipTransform, clip);
    ++layerDepth_;
}

void Scene::startLayer(const Layer& layer) {
    startLayer(layer.mix, layer.composite, layer.clip, layer.clipTransform,
               std::nullopt, layer.alpha);
}

void Scene::endLayer() {
    if (layerDepth_ == 0) {
        throw std::logic_error("Scene::endLayer: no layer to pop");
    }
    recorder_.popLayer();
    --layerDepth_;
}

void Scene::drawAlphaMask(const std::function<void(Scene&)>& content,
                          const std::function<void(Scene&)>& mask,
                          const Shape& clip, const Affine& clipTransform) {
    const i32 depth = layerDepth_;
    try {
        startLayer(MixMode::Normal, CompositeMode::SourceOver, clip, clipTransform);
        content(*this);
        startLayer(MixMode::Multiply, CompositeMode::SourceIn, clip, clipTransform);
        mask(*this);
        endLayer();
        endLayer();
    } catch (...) {
        // Close whatever this call (and the callbacks) left open, then rethrow.
        while (layerDepth_ > depth) endLayer();
        throw;
    }
}

std::unique_ptr<Recording> Scene::finish() {
    if (layerDepth_ != 0) {
        throw std::logic_error("Scene::finish: " + std::to_string(layerDepth_) +
                               " layer(s) still open");
    }
    return recorder_.finish();
}

void Scene::reset() {
    recorder_.reset();
    layerDepth_ = 0;
}

} // namespace vellum
