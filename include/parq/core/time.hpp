#pragma once

#include <cstddef>

#include "parq/core/types.hpp"

namespace parq::core {

    // Wall clock source. A null `now` means the system clock.
    struct Clock {
        Timestamp (*now)(void* ctx) noexcept {nullptr};
        void* ctx{nullptr};
    };

    [[nodiscard]] Timestamp system_now() noexcept;
    [[nodiscard]] Timestamp clock_now(const Clock& clock) noexcept;

    // 00:00:00 UTC of the day containing t.
    [[nodiscard]] constexpr Timestamp day_start(Timestamp t) noexcept {
        const Timestamp r = t % kSecondsPerDay;
        return r < 0 ? t - r - kSecondsPerDay : t - r;
    }

    // 2024-05-01T10:00:00Z
    bool time_format_iso(Timestamp t, char* out, std::size_t out_size) noexcept;
    // 20240501100000 (used in references)
    bool time_format_compact(Timestamp t, char* out, std::size_t out_size) noexcept;

    // Accepts "YYYY-mm-ddTHH:MM", "YYYY-mm-ddTHH:MM:SS", an optional trailing
    // 'Z', a space instead of 'T', or a plain integer of Unix seconds.
    [[nodiscard]] bool time_parse(const char* s, Timestamp* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Clock>);

} // namespace parq::core
