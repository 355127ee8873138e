#include <gtest/gtest.h>
#include <vellum/texture_cache.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace vellum;

static std::shared_ptr<const Image> makeImage() {
    return Image::MakeFromBytes(std::vector<u8>(4, 0), 1, 1);
}

struct UploadedTexture {
    u64 sourceId = 0;
    int handle = 0;
};

TEST(TextureCache, CreatesOncePerImage) {
    TextureCache<UploadedTexture> cache;
    auto img = makeImage();
    int uploads = 0;
    auto upload = [&](const Image& image) {
        ++uploads;
        return UploadedTexture{image.uniqueId(), 42};
    };

    const auto& first = cache.getOrCreate(*img, upload);
    const auto& second = cache.getOrCreate(*img, upload);
    EXPECT_EQ(uploads, 1);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.sourceId, img->uniqueId());
    EXPECT_TRUE(cache.contains(img->uniqueId()));
}

TEST(TextureCache, SharedImageCopiesHitSameEntry) {
    TextureCache<UploadedTexture> cache;
    auto img = makeImage();
    std::shared_ptr<const Image> copy = img;
    int uploads = 0;
    auto upload = [&](const Image&) { return UploadedTexture{0, ++uploads}; };

    cache.getOrCreate(*img, upload);
    cache.getOrCreate(*copy, upload);
    cache.getOrCreate(*makeImage(), upload);
    EXPECT_EQ(uploads, 2);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(TextureCache, EvictAndClear) {
    TextureCache<UploadedTexture> cache;
    auto a = makeImage();
    auto b = makeImage();
    auto upload = [](const Image& image) { return UploadedTexture{image.uniqueId(), 1}; };
    cache.getOrCreate(*a, upload);
    cache.getOrCreate(*b, upload);

    cache.evict(a->uniqueId());
    EXPECT_FALSE(cache.contains(a->uniqueId()));
    EXPECT_TRUE(cache.contains(b->uniqueId()));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TextureCache, RetainKeepsOnlyLiveImages) {
    TextureCache<UploadedTexture> cache;
    auto a = makeImage();
    auto b = makeImage();
    auto c = makeImage();
    auto upload = [](const Image& image) { return UploadedTexture{image.uniqueId(), 1}; };
    cache.getOrCreate(*a, upload);
    cache.getOrCreate(*b, upload);
    cache.getOrCreate(*c, upload);

    cache.retain({b->uniqueId()});
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.contains(a->uniqueId()));
    EXPECT_TRUE(cache.contains(b->uniqueId()));
    EXPECT_FALSE(cache.contains(c->uniqueId()));

    cache.retain({});
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TextureCache, ConcurrentCallersShareOneUpload) {
    TextureCache<UploadedTexture> cache;
    auto img = makeImage();
    std::atomic<int> uploads{0};
    std::vector<const UploadedTexture*> seen(8, nullptr);

    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] {
            seen[i] = &cache.getOrCreate(*img, [&](const Image& image) {
                uploads.fetch_add(1);
                return UploadedTexture{image.uniqueId(), 1};
            });
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(uploads.load(), 1);
    for (const auto* entry : seen) {
        EXPECT_EQ(entry, seen[0]);
    }
}
