#pragma once

/**
 * @file texture_cache.hpp
 * @brief Backend-side cache of uploaded images, keyed by image identity.
 */

#include "vellum/types.hpp"
#include "vellum/image.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace vellum {

/**
 * TextureCache - side table from Image::uniqueId() to a backend entry.
 *
 * Images stay immutable; whatever a backend derives from one (a GPU texture,
 * a converted pixel buffer) lives here instead. getOrCreate() runs the
 * factory at most once per image identity, even when called from several
 * threads; concurrent callers for the same image wait for the first upload.
 *
 * Entries are never invalidated implicitly. Call evict() when an image is
 * retired, retain() to keep only the images still in use, or clear() between
 * sessions; none of them may race with getOrCreate().
 */
template <typename Entry>
class TextureCache {
public:
    /// @brief Return the entry for `image`, creating it with `factory(image)` on first use.
    template <typename Factory>
    const Entry& getOrCreate(const Image& image, Factory&& factory) {
        Slot* slot = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& owned = slots_[image.uniqueId()];
            if (!owned) owned = std::make_unique<Slot>();
            slot = owned.get();
        }
        std::call_once(slot->once, [&] {
            slot->entry = std::make_unique<Entry>(factory(image));
            slot->ready.store(true, std::memory_order_release);
        });
        return *slot->entry;
    }

    /// @brief Whether an entry exists for the image identity.
    bool contains(u64 imageId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(imageId);
        return it != slots_.end() && it->second->ready.load(std::memory_order_acquire);
    }

    /// @brief Number of slots.
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    void evict(u64 imageId) {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.erase(imageId);
    }

    /// @brief Drop every entry whose image identity is not in `live`.
    void retain(const std::unordered_set<u64>& live) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = slots_.begin(); it != slots_.end();) {
            if (live.count(it->first)) {
                ++it;
            } else {
                it = slots_.erase(it);
            }
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        std::once_flag once;
        std::atomic<bool> ready{false};
        std::unique_ptr<Entry> entry;
    };

    mutable std::mutex mutex_;
    std::unordered_map<u64, std::unique_ptr<Slot>> slots_;
};

} // namespace vellum
