#include "parq/core/text.hpp"

#include <cstring>

namespace parq::core {

bool text_copy(char* dst, std::size_t cap, const char* src) noexcept {
    if (dst == nullptr || cap == 0) {
        return false;
    }
    if (src == nullptr) {
        dst[0] = '\0';
        return true;
    }
    const std::size_t len = std::strlen(src);
    if (len < cap) {
        std::memcpy(dst, src, len + 1);
        return true;
    }
    std::memcpy(dst, src, cap - 1);
    dst[cap - 1] = '\0';
    return false;
}

bool text_fits(const char* src, std::size_t cap) noexcept {
    if (src == nullptr) {
        return cap > 0;
    }
    return std::strlen(src) < cap;
}

} // namespace parq::core
