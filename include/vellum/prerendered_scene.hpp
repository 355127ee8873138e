#pragma once

/**
 * @file prerendered_scene.hpp
 * @brief A finished recording embedded into another scene as one drawable.
 */

#include "vellum/affine.hpp"
#include "vellum/drawable.hpp"
#include "vellum/recording.hpp"
#include <memory>
#include <utility>

namespace vellum {

/// @brief A previously built scene, appended under a transform.
///
/// The recording's transforms already contain the global transform of the
/// scene it was built in; drawing appends every op under
/// `target.globalTransform() * transform`. Sub-scenes meant for embedding are
/// usually built with Scene::Origin::TopLeft.
struct PrerenderedScene : Drawable {
    std::shared_ptr<const Recording> recording;
    Affine transform;

    PrerenderedScene() = default;
    PrerenderedScene(std::shared_ptr<const Recording> recording_, const Affine& transform_)
        : recording(std::move(recording_)), transform(transform_) {}

    /// @brief Finish `scene` and wrap its recording.
    static PrerenderedScene FromScene(Scene& scene, const Affine& transform);

    /// @throws std::invalid_argument if no recording is set.
    void draw(Scene& scene) const override;
};

} // namespace vellum
