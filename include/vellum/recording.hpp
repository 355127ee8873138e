#pragma once

/**
 * @file recording.hpp
 * @brief Draw operation types, arena allocator, recording, and recorder.
 */

#include "vellum/types.hpp"
#include "vellum/affine.hpp"
#include "vellum/shapes.hpp"
#include "vellum/style.hpp"
#include "vellum/brush.hpp"
#include "vellum/font.hpp"
#include <cstddef>
#include <cstring>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace vellum {

// Forward declarations
class DrawOpVisitor;
class Image;

/// @brief Draw operation type tag.
struct DrawOp {
    /// @brief Operation type enumeration.
    enum class Type : u8 {
        Fill,       ///< Fill a shape with a paint.
        Stroke,     ///< Stroke a shape outline with a paint.
        PushLayer,  ///< Open a blend/clip layer.
        PopLayer,   ///< Close the innermost layer.
        Glyphs      ///< Draw a positioned glyph run.
    };
};

/// @brief Arena allocator for variable-length DrawOp data (stops, dashes, glyphs).
class DrawOpArena {
public:
    /// @brief Construct an arena with the given initial capacity.
    /// @param initialCapacity Initial byte capacity (default 4096).
    explicit DrawOpArena(size_t initialCapacity = 4096);

    /// @brief Allocate raw storage aligned to `align`.
    /// @return Byte offset into the arena.
    u32 allocate(size_t bytes, size_t align = alignof(std::max_align_t));

    /// @brief Copy an array of trivially copyable items into the arena.
    /// @return Byte offset to the stored items.
    template <typename T>
    u32 storeArray(const T* items, u32 count) {
        static_assert(std::is_trivially_copyable<T>::value, "arena items must be trivially copyable");
        size_t bytes = size_t(count) * sizeof(T);
        u32 offset = allocate(bytes, alignof(T));
        if (bytes) std::memcpy(data_.data() + offset, items, bytes);
        return offset;
    }

    /// @brief Retrieve items stored by storeArray().
    template <typename T>
    const T* getArray(u32 offset) const {
        return reinterpret_cast<const T*>(data_.data() + offset);
    }

    /// @brief Bytes currently in use.
    size_t size() const { return data_.size(); }

    /// @brief Reset the arena, discarding all stored data.
    void reset();

private:
    std::vector<u8> data_;
};

/// @brief Resolved paint as stored in an op.
struct PaintData {
    Brush::Type type = Brush::Type::Solid;
    Extend extend = Extend::Pad;  ///< Gradient extend, or texture edge mode.
    Color color;                  ///< Solid color.
    GradientKind kind;            ///< Gradient geometry.
    u32 stopsOffset = 0;          ///< Arena offset of ColorStop[stopCount].
    u32 stopCount = 0;
    u32 imageIndex = 0;           ///< Index into Recording::images().
};

/// @brief Stroke parameters as stored in an op.
struct StrokeData {
    f64 width;
    f64 miterLimit;
    f64 dashOffset;
    u32 dashesOffset;  ///< Arena offset of Dash[dashCount].
    u32 dashCount;
    Join join;
    Cap startCap;
    Cap endCap;
};

/// @brief Compact draw operation structure.
struct CompactDrawOp {
    DrawOp::Type type;        ///< Operation type.
    bool hasAuxTransform;     ///< Whether auxTransform is meaningful.
    Affine transform;         ///< Object transform (Fill/Stroke/Glyphs) or clip transform (PushLayer).
    Affine auxTransform;      ///< Brush transform (Fill/Stroke) or glyph transform (Glyphs).
    Shape shape;              ///< Geometry (Fill/Stroke) or clip (PushLayer).
    PaintData paint;          ///< Paint (Fill/Stroke/Glyphs).

    /// @brief Union of per-operation data variants.
    union Data {
        struct { FillRule rule; } fill;                    ///< Fill data.
        StrokeData stroke;                                 ///< Stroke data.
        struct { BlendMode blend; f32 alpha; } layer;      ///< PushLayer data.
        struct {
            u32 fontIndex;
            f32 size;
            f32 weight;
            FontStyle style;
            u32 glyphsOffset;
            u32 glyphCount;
        } glyphs;                                          ///< Glyphs data.

        Data() : fill{FillRule::NonZero} {}
    } data;                                                ///< Per-operation payload.
};

/// @brief Immutable command buffer containing recorded draw operations.
///
/// Created by Recorder::finish(). Operations are traversed in recording
/// order via accept(); order is significant because of layers.
class Recording {
public:
    /// @brief Construct a Recording from operations, arena, images and fonts.
    Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena,
              std::vector<std::shared_ptr<const Image>> images,
              std::vector<std::shared_ptr<const Font>> fonts);

    /// @brief Get the list of recorded operations.
    const std::vector<CompactDrawOp>& ops() const { return ops_; }
    /// @brief Get the data arena.
    const DrawOpArena& arena() const { return arena_; }
    /// @brief Get the list of referenced images.
    const std::vector<std::shared_ptr<const Image>>& images() const { return images_; }
    /// @brief Get the list of referenced fonts.
    const std::vector<std::shared_ptr<const Font>>& fonts() const { return fonts_; }

    /// @brief Get an image by index, or nullptr if out of range.
    const Image* getImage(u32 index) const;

    /// @brief Get a font by index, or nullptr if out of range.
    const Font* getFont(u32 index) const;

    /// @brief Rebuild the gradient a Fill/Stroke op was recorded with.
    Gradient gradientOf(const CompactDrawOp& op) const;

    /// @brief Traverse operations in recording order.
    void accept(DrawOpVisitor& visitor) const;

private:
    void dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const;

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    std::vector<std::shared_ptr<const Image>> images_;
    std::vector<std::shared_ptr<const Font>> fonts_;
};

/// @brief Records draw operations into a compact command buffer.
///
/// This is the backend state of a Scene. Transforms passed in are final
/// (global transform already applied); the recorder does not track layers.
class Recorder {
public:
    /// @brief Reset the recorder, discarding all accumulated operations.
    void reset();

    /// @brief Record a fill.
    void fill(const Shape& shape, FillRule rule, const Brush& brush,
              const Affine& transform, const std::optional<Affine>& brushTransform);

    /// @brief Record a stroke.
    void stroke(const Shape& shape, const StrokeStyle& style, const Brush& brush,
                const Affine& transform, const std::optional<Affine>& brushTransform);

    /// @brief Record the opening of a layer.
    void pushLayer(BlendMode blend, f32 alpha, const Affine& clipTransform, const Shape& clip);

    /// @brief Record the closing of the innermost layer.
    void popLayer();

    /// @brief Record a glyph run painted with a solid color.
    void drawGlyphs(std::shared_ptr<const Font> font, f32 size, f32 weight, FontStyle style,
                    Color color, const Affine& transform,
                    const std::optional<Affine>& glyphTransform,
                    const std::vector<PositionedGlyph>& glyphs);

    /// @brief Re-emit every op of another recording under `transform`.
    void append(const Recording& other, const Affine& transform);

    /// @brief Number of ops recorded so far.
    size_t opCount() const { return ops_.size(); }

    /// @brief Finish recording and produce an immutable Recording.
    std::unique_ptr<Recording> finish();

private:
    PaintData resolvePaint(const Brush& brush);
    u32 internImage(const std::shared_ptr<const Image>& image);
    u32 internFont(const std::shared_ptr<const Font>& font);

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    std::vector<std::shared_ptr<const Image>> images_;
    std::vector<std::shared_ptr<const Font>> fonts_;
    std::unordered_map<u64, u32> imageSlots_;
    std::unordered_map<u64, u32> fontSlots_;
};

} // namespace vellum
