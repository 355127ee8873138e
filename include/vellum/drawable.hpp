#pragma once

/**
 * @file drawable.hpp
 * @brief Capability implemented by everything that can be drawn into a Scene.
 */

namespace vellum {

class Scene;

/// @brief Something that lowers itself into a scene.
///
/// The drawable composes the scene's global transform with its own, resolves
/// its paint and emits its primitives through Scene::recorder(). New
/// primitive kinds are added by implementing this interface; Scene does not
/// need to know about them.
class Drawable {
public:
    virtual ~Drawable() = default;

    /// @brief Lower this object into the scene's command stream.
    virtual void draw(Scene& scene) const = 0;
};

} // namespace vellum
