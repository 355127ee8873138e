#pragma once

/**
 * @file scene.hpp
 * @brief Immediate-mode scene builder with a push/pop layer stack.
 */

#include "vellum/types.hpp"
#include "vellum/affine.hpp"
#include "vellum/shapes.hpp"
#include "vellum/style.hpp"
#include "vellum/recording.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace vellum {

class Drawable;

/// @brief One entry of the layer stack.
struct Layer {
    MixMode mix = MixMode::Normal;
    CompositeMode composite = CompositeMode::SourceOver;
    Shape clip;            ///< Clip geometry in clip-local space.
    Affine clipTransform;  ///< Clip-local to scene space (global transform applied on push).
    f32 alpha = 1.0f;
};

/// @brief Frame under construction.
///
/// An application creates a Scene per frame, draws Drawables into it and
/// brackets compositing effects with startLayer()/endLayer(). Every draw is
/// lowered immediately using the current global transform; finish() hands
/// the accumulated command stream to a backend.
///
/// By default the global transform moves the origin to the canvas center, so
/// application coordinates are origin-centered. Pass Origin::TopLeft or call
/// setGlobalTransform() for other coordinate systems.
///
/// A Scene is owned and mutated by a single thread.
class Scene {
public:
    /// @brief Where scene coordinate (0, 0) lands on the canvas.
    enum class Origin : u8 {
        Center,
        TopLeft
    };

    Scene(Color background, u32 width, u32 height, Origin origin = Origin::Center);

    Color backgroundColor() const { return background_; }
    u32 width() const { return width_; }
    u32 height() const { return height_; }

    /// @brief Transform from scene space to canvas pixels.
    const Affine& globalTransform() const { return globalTransform_; }
    void setGlobalTransform(const Affine& t) { globalTransform_ = t; }

    /// @brief Draw a drawable using the current global transform.
    void draw(const Drawable& drawable);

    /// @brief Push a layer.
    /// @param mix Color mix used when the layer is composited.
    /// @param composite Porter-Duff operator used when the layer is composited.
    /// @param clip Clip geometry.
    /// @param clipTransform Clip-local to scene space; the global transform is applied after it.
    /// @param layerTransform Must be empty: per-layer transforms are not supported.
    /// @param alpha Layer opacity.
    /// @throws std::logic_error if layerTransform is set.
    void startLayer(MixMode mix, CompositeMode composite, const Shape& clip,
                    const Affine& clipTransform,
                    const std::optional<Affine>& layerTransform = std::nullopt,
                    f32 alpha = 1.0f);

    /// @brief Push a layer described by a Layer value.
    void startLayer(const Layer& layer);

    /// @brief Pop the most recently pushed layer.
    /// @throws std::logic_error if no layer is open.
    void endLayer();

    /// @brief Number of layers currently open.
    i32 layerDepth() const { return layerDepth_; }

    /// @brief Draw `content` masked by what `mask` draws.
    ///
    /// Opens a Normal/SourceOver layer for the content, then a nested
    /// Multiply/SourceIn layer for the mask, both clipped to `clip`. The mask
    /// only lands where the content already has coverage, and its alpha
    /// scales the content. If either callback throws, the layers opened here
    /// are closed before the exception propagates.
    void drawAlphaMask(const std::function<void(Scene&)>& content,
                       const std::function<void(Scene&)>& mask,
                       const Shape& clip, const Affine& clipTransform);

    /// @brief The command stream drawables lower themselves into.
    Recorder& recorder() { return recorder_; }

    /// @brief Finish the frame and reset the scene for reuse.
    /// @throws std::logic_error if layers are still open.
    std::unique_ptr<Recording> finish();

    /// @brief Discard everything recorded so far.
    void reset();

private:
    Color background_;
    u32 width_ = 0;
    u32 height_ = 0;
    Affine globalTransform_;
    Recorder recorder_;
    i32 layerDepth_ = 0;
};

} // namespace vellum
