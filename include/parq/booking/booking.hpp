#pragma once

#include <type_traits>
#include <vector>

#include "parq/core/config.hpp"
#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/db/db.hpp"
#include "parq/engine/engine.hpp"

namespace parq::booking {
    using u32 = parq::core::u32;

    inline constexpr const char* kDefaultVehicleType = "car";
    // Fresh references tried before a unique-constraint collision is reported.
    inline constexpr u32 kReferenceAttempts = 4;

    struct BookingRequest {
        const char* space_number{nullptr};
        parq::core::Interval interval{};
        const char* customer_name{nullptr};    // required
        const char* customer_email{nullptr};   // required
        const char* customer_phone{nullptr};
        const char* vehicle_number{nullptr};   // required
        const char* vehicle_type{nullptr};     // nullptr = "car"
        const char* notes{nullptr};
    };

    struct BookingFilter {
        bool has_status{false};
        parq::core::BookingStatus status{parq::core::BookingStatus::Pending};
        bool has_from{false};
        parq::core::Timestamp from_start{0};
        const char* space_number{nullptr};
        u32 limit{0};    // 0 or above the policy cap = the cap
        u32 offset{0};
    };

    [[nodiscard]] constexpr bool booking_transition_allowed(parq::core::BookingStatus from,
        parq::core::BookingStatus to) noexcept {
        using parq::core::BookingStatus;
        switch (from) {
            case BookingStatus::Pending:
                return to == BookingStatus::Confirmed || to == BookingStatus::Cancelled;
            case BookingStatus::Confirmed:
                return to == BookingStatus::Active || to == BookingStatus::Cancelled;
            case BookingStatus::Active:
                return to == BookingStatus::Completed;
            case BookingStatus::Completed:
            case BookingStatus::Cancelled:
                return false;
        }
        return false;
    }

    // Confirmed bookings read as active once now reaches start and as
    // completed once now reaches end. Other states are returned as stored.
    [[nodiscard]] parq::core::BookingStatus booking_effective_status(const parq::core::Booking& b,
        parq::core::Timestamp now) noexcept;

    // Checks done before touching the store: required fields and widths
    // (MissingField, aux = FieldId), the interval (InvalidInterval) and, when
    // policy.enforce_limits is set, duration and advance limits (PolicyViolation).
    [[nodiscard]] parq::core::Status booking_validate_request(const BookingRequest& req,
        const parq::core::BookingPolicy& policy,
        parq::core::Timestamp now) noexcept;

    // Creates a pending booking. The space lookup, overlap check and insert
    // run in one write transaction, so of two overlapping concurrent creates
    // only one can succeed.
    [[nodiscard]] parq::core::Status booking_create(const parq::engine::Engine& engine,
        const BookingRequest& req,
        parq::core::Booking* out) noexcept;

    // status in the result is the effective status.
    [[nodiscard]] parq::core::Status booking_get(const parq::engine::Engine& engine,
        const char* reference,
        parq::core::Booking* out) noexcept;

    // Most recent first, at most policy.max_page rows. Status filters match
    // the effective status.
    [[nodiscard]] parq::core::Status booking_list(const parq::engine::Engine& engine,
        const BookingFilter& filter,
        std::vector<parq::core::Booking>* out) noexcept;

    // Does not refund; callers refund through the payment lifecycle.
    [[nodiscard]] parq::core::Status booking_cancel(const parq::engine::Engine& engine,
        const char* reference,
        parq::core::Timestamp now,
        parq::core::Booking* out) noexcept;

    // pending -> confirmed, payment_status = paid, inside the caller's write
    // transaction. InvalidState unless pending; Unavailable if a confirmed or
    // active booking on the same space now overlaps it.
    [[nodiscard]] parq::core::Status booking_confirm(parq::db::DbTxn txn,
        const char* reference,
        const char* payment_reference,
        parq::core::Timestamp now,
        parq::core::Booking* out) noexcept;

    static_assert(std::is_trivially_copyable_v<BookingRequest>);
    static_assert(std::is_trivially_copyable_v<BookingFilter>);
    static_assert(std::is_standard_layout_v<BookingRequest>);
    static_assert(std::is_standard_layout_v<BookingFilter>);

} // namespace parq::booking
