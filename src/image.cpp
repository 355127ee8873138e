#include "vellum/image.hpp"
#include <cstring>
#include <atomic>

namespace vellum {

namespace {
std::atomic<u64> gNextImageId{1};
}

u64 Image::nextImageId() {
    return gNextImageId.fetch_add(1, std::memory_order_relaxed);
}

Image::Image(const PixmapInfo& info, std::shared_ptr<const std::vector<u8>> data)
    : id_(nextImageId()),
      info_(info),
      data_(std::move(data)) {
}

std::shared_ptr<const Image> Image::MakeFromPixmap(const Pixmap& src) {
    if (!src.valid()) return nullptr;

    // Repack rows tightly so the payload has no stride padding
    PixmapInfo info = PixmapInfo::Make(src.width(), src.height(), src.format());
    auto bytes = std::make_shared<std::vector<u8>>(size_t(info.computeByteSize()));
    for (i32 y = 0; y < info.height; ++y) {
        std::memcpy(bytes->data() + size_t(y) * size_t(info.stride),
                    src.rowAddr(y), size_t(info.stride));
    }
    return std::shared_ptr<const Image>(new Image(info, std::move(bytes)));
}

std::shared_ptr<const Image> Image::MakeFromBytes(std::vector<u8> bytes,
                                                  i32 width,
                                                  i32 height,
                                                  PixelFormat fmt) {
    if (width <= 0 || height <= 0) return nullptr;
    PixmapInfo info = PixmapInfo::Make(width, height, fmt);
    if (bytes.size() != size_t(info.computeByteSize())) return nullptr;

    auto data = std::make_shared<const std::vector<u8>>(std::move(bytes));
    return std::shared_ptr<const Image>(new Image(info, std::move(data)));
}

Pixel Image::pixel(i32 x, i32 y) const {
    const u8* p = pixels() + size_t(y) * size_t(info_.stride) + size_t(x) * 4;
    if (info_.format == PixelFormat::BGRA8888) {
        return {p[2], p[1], p[0], p[3]};
    }
    return {p[0], p[1], p[2], p[3]};
}

} // namespace vellum
