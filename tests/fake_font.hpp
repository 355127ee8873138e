#pragma once

#include <vellum/font.hpp>

// Deterministic font for layout tests.
// 'A' -> glyph 1 (advance 10), 'B' -> glyph 2 (advance 12), anything else
// is unmapped; .notdef advances 5. Advances are given at size 16 and scale
// linearly. Line height equals the size.
class FakeFont : public vellum::Font {
public:
    std::optional<vellum::GlyphId> mapChar(char32_t ch) const override {
        if (ch == U'A') return 1;
        if (ch == U'B') return 2;
        return std::nullopt;
    }

    vellum::f32 advanceWidth(vellum::GlyphId glyph, vellum::f32 size) const override {
        vellum::f32 scale = size / 16.0f;
        switch (glyph) {
            case 1: return 10.0f * scale;
            case 2: return 12.0f * scale;
            default: return 5.0f * scale;
        }
    }

    vellum::FontMetrics metrics(vellum::f32 size) const override {
        return {0.75f * size, -0.25f * size, 0.0f};
    }
};
