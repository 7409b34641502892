#include "parq/booking/availability.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string_view>
#include <unordered_set>

#include "parq/db/queries.hpp"

namespace parq::booking {
    using namespace parq::core;

    Timestamp pending_cutoff(BlockingRule rule) noexcept {
        if (rule.pending_hold_seconds <= 0) {
            return db::kNoPendingHold;
        }
        Timestamp cutoff = 0;
        if (!checked_sub(rule.now, rule.pending_hold_seconds, &cutoff)) {
            return std::numeric_limits<Timestamp>::min();
        }
        return cutoff;
    }

    bool slot_blocks(const BookingSlot& slot, BlockingRule rule) noexcept {
        switch (slot.status) {
            case BookingStatus::Confirmed:
            case BookingStatus::Active:
                return true;
            case BookingStatus::Pending:
                return slot.created_at > pending_cutoff(rule);
            case BookingStatus::Completed:
            case BookingStatus::Cancelled:
                return false;
        }
        return false;
    }

    BlockingRule blocking_rule(const engine::Engine& engine, Timestamp now) noexcept {
        return BlockingRule{now, engine.config.booking.pending_hold_seconds};
    }

    Status available_spaces(Interval iv,
        const std::vector<Space>& catalog,
        const std::vector<BookingSlot>& bookings,
        BlockingRule rule,
        std::vector<Space>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (!interval_valid(iv)) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidInterval);
        }

        std::unordered_set<std::string_view> blocked;
        for (const BookingSlot& slot : bookings) {
            if (intervals_overlap(slot.interval, iv) && slot_blocks(slot, rule)) {
                blocked.insert(std::string_view(slot.space_number));
            }
        }

        out->clear();
        for (const Space& space : catalog) {
            if (space.is_occupied) {
                continue;
            }
            if (blocked.count(std::string_view(space.space_number)) != 0) {
                continue;
            }
            out->push_back(space);
        }

        std::sort(out->begin(), out->end(), [](const Space& a, const Space& b) {
            return std::strcmp(a.space_number, b.space_number) < 0;
        });
        return ok_status();
    }

    Status list_available(const engine::Engine& engine, Interval iv, std::vector<Space>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (!interval_valid(iv)) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidInterval);
        }

        const Timestamp now = engine::engine_now(engine);

        std::vector<Space> catalog;
        std::vector<BookingSlot> slots;

        // One transaction so the occupancy flags are a single snapshot.
        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }
        s = db::db_space_list(txn.txn(), &catalog);
        if (!is_ok(s)) {
            return s;
        }
        s = db::db_booking_slots_overlapping(txn.txn(), iv, &slots);
        if (!is_ok(s)) {
            return s;
        }
        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        return available_spaces(iv, catalog, slots, blocking_rule(engine, now), out);
    }

} // namespace parq::booking
