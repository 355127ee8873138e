#pragma once

// TrueType/OpenType font provider backed by stb_truetype.
// This header is only usable when VELLUM_HAS_TRUETYPE is defined.

#if !VELLUM_HAS_TRUETYPE
#error "TrueType fonts not available. Build with -DVELLUM_ENABLE_TRUETYPE=ON and stb_truetype installed"
#endif

#include "vellum/font.hpp"
#include <memory>
#include <vector>

namespace vellum {

/// @brief Font loaded from TrueType/OpenType data.
///
/// Sizes are in pixels per em. Only character mapping and metrics are used;
/// outlines stay in the font data for the backend to rasterize.
class TrueTypeFont : public Font {
public:
    /// @brief Load the face at `index` from font bytes (TTF, OTF or a collection).
    /// @return nullptr if the data is not a usable font.
    static std::shared_ptr<const TrueTypeFont> MakeFromBytes(std::vector<u8> data, i32 index = 0);

    /// @brief Read a font file and load the face at `index`.
    /// @return nullptr if the file cannot be read or is not a usable font.
    static std::shared_ptr<const TrueTypeFont> MakeFromFile(const char* path, i32 index = 0);

    ~TrueTypeFont() override;

    std::optional<GlyphId> mapChar(char32_t ch) const override;
    f32 advanceWidth(GlyphId glyph, f32 size) const override;
    FontMetrics metrics(f32 size) const override;

    /// @brief Number of glyphs in the face.
    i32 glyphCount() const;

    /// @brief The raw font bytes, for backends that rasterize outlines.
    const std::vector<u8>& data() const { return fontData_; }

private:
    TrueTypeFont() = default;

    std::vector<u8> fontData_;
    void* fontInfo_ = nullptr;
};

} // namespace vellum
