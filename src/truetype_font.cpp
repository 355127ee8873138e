// TrueType font provider. Only compiled when VELLUM_HAS_TRUETYPE is defined (via CMake).

#include "vellum/truetype_font.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#include <cstdio>
#include <fstream>
#include <iterator>

namespace vellum {

namespace {

u32 readU32(const u8* p) {
    return (u32(p[0]) << 24) | (u32(p[1]) << 16) | (u32(p[2]) << 8) | u32(p[3]);
}

u16 readU16(const u8* p) {
    return u16((u16(p[0]) << 8) | u16(p[1]));
}

// stb_truetype trusts its input; make sure the table directory it walks is
// inside the buffer before handing the data over.
bool tableDirectoryFits(const std::vector<u8>& data, i32 offset) {
    if (offset < 0 || size_t(offset) + 12 > data.size()) return false;
    u16 numTables = readU16(data.data() + offset + 4);
    if (size_t(offset) + 12 + size_t(numTables) * 16 > data.size()) return false;
    for (u16 i = 0; i < numTables; ++i) {
        const u8* record = data.data() + offset + 12 + i * 16;
        u64 tableOffset = readU32(record + 8);
        u64 tableLength = readU32(record + 12);
        if (tableOffset + tableLength > data.size()) return false;
    }
    return true;
}

stbtt_fontinfo* info(void* p) { return static_cast<stbtt_fontinfo*>(p); }

} // namespace

std::shared_ptr<const TrueTypeFont> TrueTypeFont::MakeFromBytes(std::vector<u8> data, i32 index) {
    if (data.size() < 12) {
        std::fprintf(stderr, "vellum TrueTypeFont: font data too short (%zu bytes)\n", data.size());
        return nullptr;
    }

    i32 offset = stbtt_GetFontOffsetForIndex(data.data(), index);
    if (!tableDirectoryFits(data, offset)) {
        std::fprintf(stderr, "vellum TrueTypeFont: no usable face at index %d\n", index);
        return nullptr;
    }

    std::shared_ptr<TrueTypeFont> font(new TrueTypeFont());
    font->fontData_ = std::move(data);
    auto* fontInfo = new stbtt_fontinfo();
    font->fontInfo_ = fontInfo;
    if (!stbtt_InitFont(fontInfo, font->fontData_.data(), offset)) {
        std::fprintf(stderr, "vellum TrueTypeFont: malformed font tables\n");
        return nullptr;
    }
    return font;
}

std::shared_ptr<const TrueTypeFont> TrueTypeFont::MakeFromFile(const char* path, i32 index) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::fprintf(stderr, "vellum TrueTypeFont: cannot open %s\n", path);
        return nullptr;
    }
    std::vector<u8> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return MakeFromBytes(std::move(data), index);
}

TrueTypeFont::~TrueTypeFont() {
    delete info(fontInfo_);
}

std::optional<GlyphId> TrueTypeFont::mapChar(char32_t ch) const {
    i32 glyph = stbtt_FindGlyphIndex(info(fontInfo_), i32(ch));
    if (glyph == 0) return std::nullopt;
    return GlyphId(glyph);
}

f32 TrueTypeFont::advanceWidth(GlyphId glyph, f32 size) const {
    if (i32(glyph) >= glyphCount()) return 0;
    i32 advance = 0;
    i32 lsb = 0;
    stbtt_GetGlyphHMetrics(info(fontInfo_), i32(glyph), &advance, &lsb);
    return f32(advance) * stbtt_ScaleForMappingEmToPixels(info(fontInfo_), size);
}

FontMetrics TrueTypeFont::metrics(f32 size) const {
    i32 ascent = 0, descent = 0, lineGap = 0;
    stbtt_GetFontVMetrics(info(fontInfo_), &ascent, &descent, &lineGap);
    f32 scale = stbtt_ScaleForMappingEmToPixels(info(fontInfo_), size);
    return {f32(ascent) * scale, f32(descent) * scale, f32(lineGap) * scale};
}

i32 TrueTypeFont::glyphCount() const {
    return info(fontInfo_)->numGlyphs;
}

} // namespace vellum
