#pragma once

/**
 * @file backend.hpp
 * @brief Abstract rendering backend interface.
 */

#include "vellum/types.hpp"

namespace vellum {

class Recording;

/**
 * Backend - Abstract base class for rendering backends.
 *
 * A Backend consumes finished Recordings in command order and produces
 * pixels. Different backends implement different rendering strategies:
 *
 *   - CpuBackend: reference software compositor writing to a Pixmap
 *   - GPU backends: live outside this library and implement the same
 *     contract through DrawOpVisitor
 *
 * The Backend does NOT own the target pixel buffer or GPU resources.
 */
class Backend {
public:
    virtual ~Backend() = default;

    /**
     * Called at the start of each frame to prepare the backend.
     * The target is cleared to `background`.
     */
    virtual void beginFrame(Color background) = 0;

    /**
     * Execute all draw operations from a recording, in order.
     * May be called several times within one frame.
     */
    virtual void execute(const Recording& recording) = 0;

    /**
     * Called at the end of each frame to finalize rendering.
     * CPU: resolves the working buffer into the target pixmap.
     */
    virtual void endFrame() = 0;

    /**
     * Resize the rendering target.
     */
    virtual void resize(i32 w, i32 h) = 0;
};

} // namespace vellum
