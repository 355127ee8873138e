#pragma once

/**
 * @file font.hpp
 * @brief Font collaborator interface used by text layout.
 */

#include "vellum/types.hpp"
#include <optional>

namespace vellum {

/// @brief Glyph index within a font.
using GlyphId = u32;

/// @brief The glyph substituted for unmapped characters.
constexpr GlyphId kNotdefGlyph = 0;

/// @brief Vertical font metrics at a given size.
///
/// descent follows the usual font convention and is negative below the
/// baseline.
struct FontMetrics {
    f32 ascent = 0;
    f32 descent = 0;
    f32 leading = 0;

    f32 lineHeight() const { return ascent - descent + leading; }
};

/// @brief Requested style; passed through to the backend untouched.
enum class FontStyle : u8 {
    Normal,
    Italic,
    Oblique
};

/// @brief A glyph positioned in text-local space.
struct PositionedGlyph {
    GlyphId id = 0;
    f32 x = 0;
    f32 y = 0;
};

/// @brief Font resource: character mapping and metrics.
///
/// Implementations are immutable after construction and may be shared across
/// threads. Glyph outlines are the backend's business; the core only needs
/// advances and vertical metrics.
class Font {
public:
    Font();
    virtual ~Font() = default;

    Font(const Font&) = delete;
    Font& operator=(const Font&) = delete;

    /// @brief Map a Unicode scalar to a glyph, or nullopt when the font has none.
    virtual std::optional<GlyphId> mapChar(char32_t ch) const = 0;

    /// @brief Horizontal advance of a glyph at the given size.
    virtual f32 advanceWidth(GlyphId glyph, f32 size) const = 0;

    /// @brief Vertical metrics at the given size.
    virtual FontMetrics metrics(f32 size) const = 0;

    /// @brief Stable identity used for backend caches.
    u64 uniqueId() const { return id_; }

private:
    u64 id_ = 0;
};

} // namespace vellum
