#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace parq::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Unix seconds, UTC.
    using Timestamp = i64;

    // Fixed-point currency amount in micro-units (1.00 == 1'000'000).
    using Money = i64;

    inline constexpr Money kMoneyScale = 1'000'000;
    inline constexpr i64 kSecondsPerHour = 3600;
    inline constexpr i64 kSecondsPerDay = 86400;

    [[nodiscard]] constexpr Money money_from_units(i64 whole, i64 cents = 0) noexcept {
        return whole * kMoneyScale + cents * (kMoneyScale / 100);
    }

    // Half-open [start, end).
    struct Interval {
        Timestamp start{0};
        Timestamp end{0};
    };

    // Overflow-checked i64 arithmetic; false (and *out untouched) on overflow.
    [[nodiscard]] constexpr bool checked_add(i64 a, i64 b, i64* out) noexcept {
        i64 r = 0;
        if (__builtin_add_overflow(a, b, &r)) {
            return false;
        }
        *out = r;
        return true;
    }

    [[nodiscard]] constexpr bool checked_sub(i64 a, i64 b, i64* out) noexcept {
        i64 r = 0;
        if (__builtin_sub_overflow(a, b, &r)) {
            return false;
        }
        *out = r;
        return true;
    }

    [[nodiscard]] constexpr bool checked_mul(i64 a, i64 b, i64* out) noexcept {
        i64 r = 0;
        if (__builtin_mul_overflow(a, b, &r)) {
            return false;
        }
        *out = r;
        return true;
    }

    // start < end, and the length fits in an i64.
    [[nodiscard]] constexpr bool interval_valid(Interval iv) noexcept {
        i64 len = 0;
        return iv.start < iv.end && checked_sub(iv.end, iv.start, &len);
    }

    // Only meaningful for a valid interval.
    [[nodiscard]] constexpr i64 interval_seconds(Interval iv) noexcept {
        return iv.end - iv.start;
    }

    // Strict inequalities: intervals that only touch at a boundary do not overlap.
    [[nodiscard]] constexpr bool intervals_overlap(Interval a, Interval b) noexcept {
        return a.start < b.end && b.start < a.end;
    }

    [[nodiscard]] constexpr bool interval_contains(Interval iv, Timestamp t) noexcept {
        return iv.start <= t && t < iv.end;
    }

    enum class BookingStatus : u8 {
        Pending = 0,
        Confirmed = 1,
        Active = 2,
        Completed = 3,
        Cancelled = 4,
    };

    // A booking's view of its settlement.
    enum class PaymentStatus : u8 {
        Pending = 0,
        Paid = 1,
        Refunded = 2,
    };

    // State of a single payment attempt.
    enum class PaymentState : u8 {
        Pending = 0,
        Processing = 1,
        Completed = 2,
        Failed = 3,
        Refunded = 4,
    };

    enum class OccupancyEventType : u8 {
        Entry = 0,
        Exit = 1,
    };

    [[nodiscard]] constexpr const char* booking_status_name(BookingStatus s) noexcept {
        switch (s) {
            case BookingStatus::Pending: return "pending";
            case BookingStatus::Confirmed: return "confirmed";
            case BookingStatus::Active: return "active";
            case BookingStatus::Completed: return "completed";
            case BookingStatus::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* payment_status_name(PaymentStatus s) noexcept {
        switch (s) {
            case PaymentStatus::Pending: return "pending";
            case PaymentStatus::Paid: return "paid";
            case PaymentStatus::Refunded: return "refunded";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* payment_state_name(PaymentState s) noexcept {
        switch (s) {
            case PaymentState::Pending: return "pending";
            case PaymentState::Processing: return "processing";
            case PaymentState::Completed: return "completed";
            case PaymentState::Failed: return "failed";
            case PaymentState::Refunded: return "refunded";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* occupancy_event_name(OccupancyEventType t) noexcept {
        return t == OccupancyEventType::Entry ? "entry" : "exit";
    }

    [[nodiscard]] bool parse_booking_status(const char* s, BookingStatus* out) noexcept;
    [[nodiscard]] bool parse_payment_state(const char* s, PaymentState* out) noexcept;

    // "15.00" style rendering, rounded half-up to cents.
    bool money_format(Money m, char* out, std::size_t out_size) noexcept;
    // Accepts "5", "5.5", "5.25", "0.000001"; at most 6 fractional digits.
    [[nodiscard]] bool money_parse(const char* s, Money* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Interval>);
    static_assert(std::is_standard_layout_v<Interval>);

} // namespace parq::core
