#include "vellum/pixmap.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace vellum {

Pixmap::Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels)
    : info_(info), pixels_(pixels), ownsPixels_(ownsPixels) {
}

Pixmap Pixmap::Alloc(const PixmapInfo& info) {
    if (info.width <= 0 || info.height <= 0 || info.stride < info.width * 4) {
        return Pixmap();
    }
    void* pixels = std::calloc(size_t(info.computeByteSize()), 1);
    if (!pixels) return Pixmap();
    return Pixmap(info, pixels, true);
}

Pixmap Pixmap::Wrap(const PixmapInfo& info, void* pixels) {
    return Pixmap(info, pixels, false);
}

Pixmap::~Pixmap() {
    reset();
}

Pixmap::Pixmap(Pixmap&& other) noexcept
    : info_(other.info_), pixels_(other.pixels_), ownsPixels_(other.ownsPixels_) {
    other.info_ = {};
    other.pixels_ = nullptr;
    other.ownsPixels_ = false;
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        reset();
        info_ = other.info_;
        pixels_ = other.pixels_;
        ownsPixels_ = other.ownsPixels_;
        other.info_ = {};
        other.pixels_ = nullptr;
        other.ownsPixels_ = false;
    }
    return *this;
}

Pixel Pixmap::pixel(i32 x, i32 y) const {
    const u8* p = static_cast<const u8*>(rowAddr(y)) + x * 4;
    if (info_.format == PixelFormat::BGRA8888) {
        return {p[2], p[1], p[0], p[3]};
    }
    return {p[0], p[1], p[2], p[3]};
}

void Pixmap::setPixel(i32 x, i32 y, Pixel px) {
    u8* p = static_cast<u8*>(rowAddr(y)) + x * 4;
    if (info_.format == PixelFormat::BGRA8888) {
        p[0] = px.b; p[1] = px.g; p[2] = px.r; p[3] = px.a;
    } else {
        p[0] = px.r; p[1] = px.g; p[2] = px.b; p[3] = px.a;
    }
}

void Pixmap::clear(Color c) {
    if (!valid()) return;
    Pixel px = toPixel(c);
    for (i32 y = 0; y < info_.height; ++y) {
        for (i32 x = 0; x < info_.width; ++x) {
            setPixel(x, y, px);
        }
    }
}

void Pixmap::reset() {
    if (ownsPixels_ && pixels_) {
        std::free(pixels_);
    }
    pixels_ = nullptr;
    ownsPixels_ = false;
    info_ = {};
}

void Pixmap::reallocate(const PixmapInfo& info) {
    Pixmap fresh = Alloc(info);
    *this = std::move(fresh);
}

static u8 quantize(f32 v) {
    v = std::min(std::max(v, 0.0f), 1.0f);
    return u8(std::lround(v * 255.0f));
}

Pixel toPixel(Color c) {
    return {quantize(c.r), quantize(c.g), quantize(c.b), quantize(c.a)};
}

Color toColor(Pixel p) {
    return {p.r / 255.0f, p.g / 255.0f, p.b / 255.0f, p.a / 255.0f};
}

} // namespace vellum
