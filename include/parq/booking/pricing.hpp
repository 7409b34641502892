#pragma once

#include <type_traits>

#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/engine/engine.hpp"

namespace parq::booking {

    struct Quote {
        char space_number[parq::core::kSpaceNumberLen]{};
        parq::core::Interval interval{};
        parq::core::i64 duration_seconds{0};
        parq::core::Money hourly_rate{0};
        parq::core::Money amount{0};
        char currency[parq::core::kCurrencyLen]{};
    };

    // amount = seconds * rate / 3600, fractional hours included, rounded
    // half-up to the micro-unit. InvalidInterval unless iv.start < iv.end.
    [[nodiscard]] parq::core::Status quote_amount(parq::core::Interval iv,
        parq::core::Money hourly_rate,
        parq::core::Money* out) noexcept;

    // Looks the space up for its rate. ResourceNotFound is NotFound in
    // StatusDomain::Catalog.
    [[nodiscard]] parq::core::Status quote(const parq::engine::Engine& engine,
        const char* space_number,
        parq::core::Interval iv,
        Quote* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Quote>);
    static_assert(std::is_standard_layout_v<Quote>);

} // namespace parq::booking
