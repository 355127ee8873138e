#pragma once

#include "vellum/types.hpp"
#include "vellum/pixmap.hpp"
#include <memory>
#include <vector>

namespace vellum {

/**
 * Image - An immutable, decoded raster used as a texture brush.
 *
 * The pixel payload is owned and shared by reference count, so every
 * holder of the shared_ptr reads the same bytes. Decoding is not part of this library; callers hand over raw
 * 8-bit straight-alpha pixels.
 *
 * uniqueId() is stable for the lifetime of the image and is the key that
 * backends use to cache uploaded textures (see TextureCache).
 */
class Image {
public:
    // Create an image by copying pixel data from a Pixmap
    static std::shared_ptr<const Image> MakeFromPixmap(const Pixmap& src);

    // Create an image taking ownership of tightly packed pixel bytes
    // (width * height * 4 bytes). Returns nullptr on a size mismatch.
    static std::shared_ptr<const Image> MakeFromBytes(std::vector<u8> bytes,
                                                      i32 width,
                                                      i32 height,
                                                      PixelFormat fmt = PixelFormat::RGBA8888);

    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    PixelFormat format() const { return info_.format; }
    const PixmapInfo& info() const { return info_; }
    i32 stride() const { return info_.stride; }

    const u8* pixels() const { return data_ ? data_->data() : nullptr; }

    // The shared pixel payload.
    const std::shared_ptr<const std::vector<u8>>& data() const { return data_; }

    // Decode one pixel; coordinates must be in range.
    Pixel pixel(i32 x, i32 y) const;

    // Stable identity used for backend caches.
    u64 uniqueId() const { return id_; }

    bool valid() const {
        return info_.width > 0 && info_.height > 0 && data_ &&
               data_->size() >= size_t(info_.computeByteSize());
    }

private:
    static u64 nextImageId();

    Image(const PixmapInfo& info, std::shared_ptr<const std::vector<u8>> data);

    u64 id_ = 0;
    PixmapInfo info_;
    std::shared_ptr<const std::vector<u8>> data_;
};

} // namespace vellum
