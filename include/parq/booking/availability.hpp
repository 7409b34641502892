#pragma once

#include <type_traits>
#include <vector>

#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/engine/engine.hpp"

namespace parq::booking {

    // Which existing bookings keep a space from being booked again.
    struct BlockingRule {
        parq::core::Timestamp now{0};
        parq::core::i64 pending_hold_seconds{0};   // 0 = pending bookings never block
    };

    // Pending bookings created strictly after the returned instant block.
    [[nodiscard]] parq::core::Timestamp pending_cutoff(BlockingRule rule) noexcept;

    // Confirmed and active bookings always block; pending ones only inside
    // their hold window; completed and cancelled never do.
    [[nodiscard]] bool slot_blocks(const parq::core::BookingSlot& slot, BlockingRule rule) noexcept;

    [[nodiscard]] BlockingRule blocking_rule(const parq::engine::Engine& engine,
        parq::core::Timestamp now) noexcept;

    // Spaces from catalog that are not physically occupied and have no
    // blocking booking overlapping iv. Output is ordered by space_number.
    // Fails with InvalidInterval unless iv.start < iv.end.
    [[nodiscard]] parq::core::Status available_spaces(parq::core::Interval iv,
        const std::vector<parq::core::Space>& catalog,
        const std::vector<parq::core::BookingSlot>& bookings,
        BlockingRule rule,
        std::vector<parq::core::Space>* out) noexcept;

    // Reads the catalog and the overlapping bookings in one read transaction
    // and applies available_spaces.
    [[nodiscard]] parq::core::Status list_available(const parq::engine::Engine& engine,
        parq::core::Interval iv,
        std::vector<parq::core::Space>* out) noexcept;

    static_assert(std::is_trivially_copyable_v<BlockingRule>);

} // namespace parq::booking
