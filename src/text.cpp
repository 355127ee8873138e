#include "vellum/text.hpp"
#include "vellum/scene.hpp"
#include <stdexcept>

namespace vellum {

namespace {
constexpr char32_t kReplacementChar = 0xFFFD;
}

char32_t decodeUtf8(std::string_view text, size_t& pos) {
    const u8 lead = static_cast<u8>(text[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    i32 extra;
    char32_t cp;
    char32_t min;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3; cp = lead & 0x07; min = 0x10000;
    } else {
        ++pos;
        return kReplacementChar;
    }

    if (pos + size_t(extra) >= text.size()) {
        ++pos;
        return kReplacementChar;
    }
    for (i32 i = 1; i <= extra; ++i) {
        const u8 c = static_cast<u8>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++pos;
        return kReplacementChar;
    }
    pos += size_t(extra) + 1;
    return cp;
}

TextLayout layoutText(const Font& font, f32 size, std::string_view text, f32 penX, f32 penY) {
    TextLayout layout;
    layout.lineHeight = font.metrics(size).lineHeight();
    layout.glyphs.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t ch = decodeUtf8(text, pos);
        if (ch == U'\n') {
            penY += layout.lineHeight;
            penX = 0;
            continue;
        }
        GlyphId gid = font.mapChar(ch).value_or(kNotdefGlyph);
        layout.glyphs.push_back({gid, penX, penY});
        penX += font.advanceWidth(gid, size);
    }

    layout.width = penX;
    layout.height = penY + layout.lineHeight;
    return layout;
}

Point alignmentOffset(f64 width, f64 height, Alignment alignment,
                      VerticalAlignment verticalAlignment) {
    Point offset;
    switch (alignment) {
        case Alignment::Left: offset.x = 0; break;
        case Alignment::Center: offset.x = -width / 2.0; break;
        case Alignment::Right: offset.x = -width; break;
    }
    switch (verticalAlignment) {
        case VerticalAlignment::Top: offset.y = 0; break;
        case VerticalAlignment::Middle: offset.y = height / 2.0; break;
        case VerticalAlignment::Bottom: offset.y = height; break;
    }
    return offset;
}

void FormattedText::draw(Scene& scene) const {
    if (!font) {
        throw std::runtime_error("FormattedText: no font to lay out text with");
    }

    TextLayout layout = layoutText(*font, size, text, f32(x), f32(y));
    Point offset = alignmentOffset(layout.width, layout.height, alignment, verticalAlignment);

    // Alignment depends on the full extent, so it is applied after layout as
    // a shift in text-local space.
    Affine t = (scene.globalTransform() * transform).preTranslate(offset.x, offset.y);

    scene.recorder().drawGlyphs(font, size, weight, style, color, t, glyphTransform, layout.glyphs);
}

} // namespace vellum
