#pragma once

#include <cstddef>

namespace parq::core {

    [[nodiscard]] constexpr bool text_empty(const char* s) noexcept {
        return s == nullptr || s[0] == '\0';
    }

    // Copies src (nullptr treated as "") into dst, always NUL-terminating.
    // Returns false if src did not fit; dst then holds the truncated prefix.
    bool text_copy(char* dst, std::size_t cap, const char* src) noexcept;

    template <std::size_t N>
    bool text_copy(char (&dst)[N], const char* src) noexcept {
        return text_copy(dst, N, src);
    }

    [[nodiscard]] bool text_fits(const char* src, std::size_t cap) noexcept;

} // namespace parq::core
