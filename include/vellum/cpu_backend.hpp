#pragma once

#include "vellum/backend.hpp"
#include "vellum/draw_op_visitor.hpp"
#include "vellum/pixmap.hpp"
#include "vellum/texture_cache.hpp"
#include <array>
#include <unordered_set>
#include <vector>

namespace vellum {

/**
 * CpuBackend - Reference software compositor.
 *
 * Executes recordings by sampling every shape at pixel centres in its local
 * space and compositing into premultiplied float buffers, one per open layer.
 * Layers are blended onto their parent when popped. endFrame() writes the
 * result into the target Pixmap.
 *
 * Images are converted to premultiplied textures on first use. endFrame()
 * drops the textures of images that no recording of the frame referenced.
 *
 * Rendering is aliased: a pixel is either covered or not. Glyph runs are
 * counted but not rasterized, and dashed strokes are drawn solid.
 */
class CpuBackend : public Backend, private DrawOpVisitor {
public:
    /// Per-frame counters.
    struct Stats {
        u32 fills = 0;
        u32 strokes = 0;
        u32 layers = 0;
        u32 glyphRuns = 0;
        u32 skipped = 0;    ///< Ops dropped for a singular transform.
    };

    explicit CpuBackend(Pixmap* target);

    void beginFrame(Color background) override;
    void execute(const Recording& recording) override;
    void endFrame() override;
    void resize(i32 w, i32 h) override;

    const Stats& stats() const { return stats_; }

    /// Number of textures currently held.
    size_t textureCount() const { return textures_.size(); }

private:
    using Premul = std::array<f32, 4>;

    struct Texture {
        i32 width = 0;
        i32 height = 0;
        std::vector<Premul> texels;
    };

    struct LayerBuffer {
        std::vector<Premul> pixels;
        std::vector<u8> clip;   ///< 1 where the layer may touch its parent.
        BlendMode blend;
        f32 alpha = 1;
    };

    void visitFill(const Shape& shape, FillRule rule, const PaintRef& paint,
                   const Affine& transform, const Affine* brushTransform) override;
    void visitStroke(const Shape& shape, const StrokeRef& stroke, const PaintRef& paint,
                     const Affine& transform, const Affine* brushTransform) override;
    void visitPushLayer(BlendMode blend, f32 alpha,
                        const Affine& clipTransform, const Shape& clip) override;
    void visitPopLayer() override;
    void visitGlyphRun(const GlyphRunRef& run, const Affine& transform,
                       const Affine* glyphTransform) override;

    // Paint every pixel whose centre lies within `halfWidth` of the shape
    // outline (stroke) or inside it (fill, when stroke is null).
    void paintShape(const Shape& shape, const StrokeRef* stroke, const PaintRef& paint,
                    const Affine& transform, const Affine* brushTransform);

    Premul shade(const PaintRef& paint, const Texture* texture, Point local,
                 const Affine& brushInverse);
    const Texture& textureFor(const Image& image);

    void allocateCanvas();

    Pixmap* target_ = nullptr;
    i32 width_ = 0;
    i32 height_ = 0;
    std::vector<LayerBuffer> layers_;
    TextureCache<Texture> textures_;
    std::unordered_set<u64> frameImages_;   ///< Image ids referenced this frame.
    Stats stats_;
    bool warnedGlyphs_ = false;
    bool warnedDashes_ = false;
};

} // namespace vellum
