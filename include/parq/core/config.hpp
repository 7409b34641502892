#pragma once

#include <type_traits>

#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/core/time.hpp"
#include "parq/core/types.hpp"

namespace parq::core {

    // Lot geometry used by lot initialization: rows x columns spaces named
    // P001, P002, ... in row-major order.
    struct LotLayout {
        u32 rows{5};
        u32 columns{10};
        Money hourly_rate{money_from_units(5)};
    };

    struct BookingPolicy {
        i64 cancellation_lead_seconds{2 * kSecondsPerHour};
        // Pending bookings younger than this block the space; 0 = pending
        // bookings never block.
        i64 pending_hold_seconds{15 * 60};
        bool enforce_limits{false};
        i64 min_duration_seconds{kSecondsPerHour};
        i64 max_duration_seconds{24 * kSecondsPerHour};
        i64 max_advance_seconds{7 * kSecondsPerDay};
        u32 max_page{100};
    };

    struct PaymentConfig {
        char currency[kCurrencyLen]{"USD"};
        char default_method[kMethodLen]{"card"};
        // Demo settlement completes payments synchronously; otherwise they
        // stay processing until the gateway reports back.
        bool demo_mode{true};
    };

    struct EngineConfig {
        const char* db_path{nullptr};   // nullptr = in-memory store
        u32 busy_timeout_ms{5000};
        LotLayout lot{};
        BookingPolicy booking{};
        PaymentConfig payment{};
        Clock clock{};
    };

    // Overlays PARQ_* environment variables onto cfg. Unset variables leave
    // fields untouched; malformed values fail with Invalid (aux = index of the
    // offending variable in the documented list).
    [[nodiscard]] Status config_from_env(EngineConfig* cfg) noexcept;

    static_assert(std::is_trivially_copyable_v<LotLayout>);
    static_assert(std::is_trivially_copyable_v<BookingPolicy>);
    static_assert(std::is_trivially_copyable_v<PaymentConfig>);
    static_assert(std::is_trivially_copyable_v<EngineConfig>);

} // namespace parq::core
