#pragma once

#include <type_traits>
#include <vector>

#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/db/db.hpp"
#include "parq/db/schema.hpp"

// Record access. Every call runs inside a transaction from db_txn_begin and
// reports failures in StatusDomain::Db; callers translate NotFound into their
// own domain.
namespace parq::db {
    using u32 = parq::core::u32;
    using u64 = parq::core::u64;

    // Pending bookings created strictly after this instant block the space.
    inline constexpr parq::core::Timestamp kNoPendingHold = INT64_MAX;

    struct OverlapQuery {
        const char* space_number{nullptr};
        parq::core::Interval interval{};
        parq::core::Timestamp pending_created_after{kNoPendingHold};
        const char* exclude_reference{nullptr};   // skip this booking (confirm re-check)
    };

    struct BookingListFilter {
        bool has_status{false};
        parq::core::BookingStatus status{parq::core::BookingStatus::Pending};   // effective status
        parq::core::Timestamp now{0};
        bool has_from{false};
        parq::core::Timestamp from_start{0};   // start_time >= from_start
        const char* space_number{nullptr};
        u32 offset{0};
    };

    [[nodiscard]] parq::core::Status db_table_count(DbTxn txn, TableId table, u64* out) noexcept;

    // ========================================================================
    // Spaces
    // ========================================================================

    [[nodiscard]] parq::core::Status db_space_insert(DbTxn txn, const parq::core::Space& space) noexcept;
    [[nodiscard]] parq::core::Status db_space_get(DbTxn txn, const char* space_number,
        parq::core::Space* out) noexcept;
    // Ordered by space_number.
    [[nodiscard]] parq::core::Status db_space_list(DbTxn txn, std::vector<parq::core::Space>* out) noexcept;
    [[nodiscard]] parq::core::Status db_space_set_occupancy(DbTxn txn,
        const char* space_number,
        bool occupied,
        const char* vehicle_type,
        parq::core::Timestamp at) noexcept;
    [[nodiscard]] parq::core::Status db_space_counts(DbTxn txn, u32* total, u32* occupied) noexcept;

    [[nodiscard]] parq::core::Status db_occupancy_event_insert(DbTxn txn,
        const parq::core::OccupancyEvent& ev) noexcept;
    // Most recent first; space_number may be nullptr for all spaces.
    // *count: in = capacity of out, out = rows written.
    [[nodiscard]] parq::core::Status db_occupancy_event_list(DbTxn txn,
        const char* space_number,
        parq::core::OccupancyEvent* out,
        u32* count) noexcept;
    // Entry and exit events with timestamp >= since, across the lot.
    [[nodiscard]] parq::core::Status db_occupancy_event_counts(DbTxn txn,
        parq::core::Timestamp since,
        u32* entries,
        u32* exits) noexcept;

    // ========================================================================
    // Bookings
    // ========================================================================

    // Conflict when booking_reference is already taken.
    [[nodiscard]] parq::core::Status db_booking_insert(DbTxn txn, const parq::core::Booking& b) noexcept;
    [[nodiscard]] parq::core::Status db_booking_get(DbTxn txn, const char* reference,
        parq::core::Booking* out) noexcept;
    // Writes status, payment_status, payment_id, notes and updated_at.
    [[nodiscard]] parq::core::Status db_booking_update(DbTxn txn, const parq::core::Booking& b) noexcept;

    // True when a confirmed/active booking (or a pending one inside its hold)
    // on the same space overlaps q.interval.
    [[nodiscard]] parq::core::Status db_booking_find_overlap(DbTxn txn, const OverlapQuery& q, bool* found) noexcept;

    // All non-cancelled bookings overlapping iv, any space.
    [[nodiscard]] parq::core::Status db_booking_slots_overlapping(DbTxn txn,
        parq::core::Interval iv,
        std::vector<parq::core::BookingSlot>* out) noexcept;

    // Ordered by created_at DESC. *count: in = page size, out = rows written.
    [[nodiscard]] parq::core::Status db_booking_list(DbTxn txn,
        const BookingListFilter& filter,
        parq::core::Booking* out,
        u32* count) noexcept;

    // ========================================================================
    // Payments
    // ========================================================================

    [[nodiscard]] parq::core::Status db_payment_insert(DbTxn txn, const parq::core::Payment& p) noexcept;
    [[nodiscard]] parq::core::Status db_payment_get(DbTxn txn, const char* reference,
        parq::core::Payment* out) noexcept;
    // Writes status, gateway_transaction_id and completed_at.
    [[nodiscard]] parq::core::Status db_payment_update(DbTxn txn, const parq::core::Payment& p) noexcept;
    [[nodiscard]] parq::core::Status db_payment_count_for_booking(DbTxn txn,
        const char* booking_reference,
        parq::core::PaymentState state,
        u32* out) noexcept;
    // Oldest first. *count: in = capacity, out = rows written.
    [[nodiscard]] parq::core::Status db_payment_list_for_booking(DbTxn txn,
        const char* booking_reference,
        parq::core::Payment* out,
        u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<OverlapQuery>);
    static_assert(std::is_trivially_copyable_v<BookingListFilter>);
    static_assert(std::is_standard_layout_v<OverlapQuery>);
    static_assert(std::is_standard_layout_v<BookingListFilter>);

} // namespace parq::db
