#include "vellum/font.hpp"
#include <atomic>

namespace vellum {

namespace {
std::atomic<u64> gNextFontId{1};
}

Font::Font() : id_(gNextFontId.fetch_add(1, std::memory_order_relaxed)) {
}

} // namespace vellum
