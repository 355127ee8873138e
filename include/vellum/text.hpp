#pragma once

/**
 * @file text.hpp
 * @brief Formatted text drawable and the pen-advance layout it uses.
 */

#include "vellum/types.hpp"
#include "vellum/affine.hpp"
#include "vellum/font.hpp"
#include "vellum/drawable.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vellum {

/// @brief Horizontal alignment relative to the text origin.
enum class Alignment : u8 {
    Left,
    Center,
    Right
};

/// @brief Vertical alignment relative to the text origin.
enum class VerticalAlignment : u8 {
    Top,
    Middle,
    Bottom
};

/// @brief Result of laying out a string.
struct TextLayout {
    std::vector<PositionedGlyph> glyphs;  ///< Glyph positions before alignment.
    f32 width = 0;       ///< Final horizontal pen position.
    f32 height = 0;      ///< Final vertical pen position plus one line height.
    f32 lineHeight = 0;  ///< ascent - descent + leading.
};

/// @brief Decode one UTF-8 scalar starting at `pos` and advance `pos`.
///
/// Malformed or truncated sequences consume one byte and yield U+FFFD.
char32_t decodeUtf8(std::string_view text, size_t& pos);

/// @brief Walk `text` left to right, assigning pen positions.
///
/// Starts at (penX, penY). A newline moves the pen to x = 0 on the next line
/// and emits no glyph. Characters the font cannot map use kNotdefGlyph.
TextLayout layoutText(const Font& font, f32 size, std::string_view text, f32 penX, f32 penY);

/// @brief Translation that aligns a laid out block of the given extent.
///
/// Left/Center/Right give 0, -width/2, -width; Top/Middle/Bottom give
/// 0, +height/2, +height.
Point alignmentOffset(f64 width, f64 height, Alignment alignment,
                      VerticalAlignment verticalAlignment);

/// @brief A drawable run of text.
struct FormattedText : Drawable {
    f64 x = 0;
    f64 y = 0;
    std::string text;
    f32 size = 16.0f;
    Color color;
    f32 weight = 400.0f;
    std::shared_ptr<const Font> font;
    FontStyle style = FontStyle::Normal;
    Alignment alignment = Alignment::Left;
    VerticalAlignment verticalAlignment = VerticalAlignment::Top;
    Affine transform;
    std::optional<Affine> glyphTransform;

    /// @brief Lay out the text and emit one glyph run.
    /// @throws std::runtime_error if no font is set.
    void draw(Scene& scene) const override;
};

} // namespace vellum
