#include "parq/core/types.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>

namespace parq::core {
    namespace {
        constexpr BookingStatus kBookingStatuses[] = {
            BookingStatus::Pending,
            BookingStatus::Confirmed,
            BookingStatus::Active,
            BookingStatus::Completed,
            BookingStatus::Cancelled,
        };

        constexpr PaymentState kPaymentStates[] = {
            PaymentState::Pending,
            PaymentState::Processing,
            PaymentState::Completed,
            PaymentState::Failed,
            PaymentState::Refunded,
        };
    } // namespace

    bool parse_booking_status(const char* s, BookingStatus* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        for (BookingStatus st : kBookingStatuses) {
            if (std::strcmp(s, booking_status_name(st)) == 0) {
                *out = st;
                return true;
            }
        }
        return false;
    }

    bool parse_payment_state(const char* s, PaymentState* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        for (PaymentState st : kPaymentStates) {
            if (std::strcmp(s, payment_state_name(st)) == 0) {
                *out = st;
                return true;
            }
        }
        return false;
    }

    bool money_format(Money m, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        const bool negative = m < 0;
        // Magnitude as unsigned so INT64_MIN does not overflow.
        const u64 mag = negative ? static_cast<u64>(-(m + 1)) + 1u : static_cast<u64>(m);
        constexpr u64 kMicrosPerCent = static_cast<u64>(kMoneyScale / 100);
        const u64 cents = (mag + kMicrosPerCent / 2) / kMicrosPerCent;
        const int n = std::snprintf(out, out_size, "%s%llu.%02llu",
                                    negative && cents != 0 ? "-" : "",
                                    static_cast<unsigned long long>(cents / 100u),
                                    static_cast<unsigned long long>(cents % 100u));
        return n > 0 && static_cast<std::size_t>(n) < out_size;
    }

    bool money_parse(const char* s, Money* out) noexcept {
        if (s == nullptr || out == nullptr || *s == '\0') {
            return false;
        }
        const char* p = s;
        bool negative = false;
        if (*p == '-') {
            negative = true;
            ++p;
        }
        if (*p < '0' || *p > '9') {
            return false;
        }

        i64 whole = 0;
        for (; *p >= '0' && *p <= '9'; ++p) {
            if (whole > (INT64_MAX / kMoneyScale) / 10) {
                return false;
            }
            whole = whole * 10 + (*p - '0');
        }
        if (whole >= INT64_MAX / kMoneyScale) {
            return false;
        }

        i64 frac = 0;
        i64 scale = kMoneyScale;
        if (*p == '.') {
            ++p;
            if (*p < '0' || *p > '9') {
                return false;
            }
            for (; *p >= '0' && *p <= '9'; ++p) {
                if (scale == 1) {
                    return false;
                }
                scale /= 10;
                frac += (*p - '0') * scale;
            }
        }
        if (*p != '\0') {
            return false;
        }

        const Money v = whole * kMoneyScale + frac;
        *out = negative ? -v : v;
        return true;
    }
} // namespace parq::core
