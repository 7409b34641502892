#include "parq/booking/booking.hpp"

#include <limits>

#include "parq/booking/availability.hpp"
#include "parq/booking/pricing.hpp"
#include "parq/booking/reference.hpp"
#include "parq/core/log.hpp"
#include "parq/core/text.hpp"
#include "parq/db/queries.hpp"

namespace parq::booking {
    using namespace parq::core;

    namespace {
        [[nodiscard]] Status missing(FieldId field) noexcept {
            return make_status(StatusDomain::Booking, StatusCode::MissingField, static_cast<u32>(field));
        }

        [[nodiscard]] Status to_booking(Status s) noexcept {
            if (s.code == StatusCode::NotFound && s.domain == StatusDomain::Db) {
                return make_status(StatusDomain::Booking, StatusCode::NotFound, static_cast<u32>(FieldId::BookingReference));
            }
            return s;
        }

        // t - now, saturated at the i64 limits.
        [[nodiscard]] i64 seconds_until(Timestamp t, Timestamp now) noexcept {
            i64 d = 0;
            if (!checked_sub(t, now, &d)) {
                return t > now ? std::numeric_limits<i64>::max() : std::numeric_limits<i64>::min();
            }
            return d;
        }

        void apply_effective_status(Booking* b, Timestamp now) noexcept {
            b->status = booking_effective_status(*b, now);
        }
    } // namespace

    BookingStatus booking_effective_status(const Booking& b, Timestamp now) noexcept {
        if (b.status != BookingStatus::Confirmed && b.status != BookingStatus::Active) {
            return b.status;
        }
        if (now >= b.interval.end) {
            return BookingStatus::Completed;
        }
        if (now >= b.interval.start) {
            return BookingStatus::Active;
        }
        return BookingStatus::Confirmed;
    }

    Status booking_validate_request(const BookingRequest& req, const BookingPolicy& policy, Timestamp now) noexcept {
        if (text_empty(req.space_number) || !text_fits(req.space_number, kSpaceNumberLen)) {
            return missing(FieldId::SpaceNumber);
        }
        if (text_empty(req.customer_name) || !text_fits(req.customer_name, kNameLen)) {
            return missing(FieldId::CustomerName);
        }
        if (text_empty(req.customer_email) || !text_fits(req.customer_email, kEmailLen)) {
            return missing(FieldId::CustomerEmail);
        }
        if (text_empty(req.vehicle_number) || !text_fits(req.vehicle_number, kVehicleNumberLen)) {
            return missing(FieldId::VehicleNumber);
        }
        if (!text_fits(req.customer_phone, kPhoneLen)) {
            return missing(FieldId::CustomerPhone);
        }
        if (!text_fits(req.vehicle_type, kVehicleTypeLen)) {
            return missing(FieldId::VehicleType);
        }
        if (!text_fits(req.notes, kNotesLen)) {
            return missing(FieldId::Notes);
        }

        if (!interval_valid(req.interval)) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidInterval);
        }

        if (policy.enforce_limits) {
            const i64 duration = interval_seconds(req.interval);
            if (duration < policy.min_duration_seconds || duration > policy.max_duration_seconds) {
                return make_status(StatusDomain::Booking, StatusCode::PolicyViolation);
            }
            const i64 lead = seconds_until(req.interval.start, now);
            if (lead < 0 || lead > policy.max_advance_seconds) {
                return make_status(StatusDomain::Booking, StatusCode::PolicyViolation);
            }
        }
        return ok_status();
    }

    Status booking_create(const engine::Engine& engine, const BookingRequest& req, Booking* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }

        const Timestamp now = engine::engine_now(engine);
        Status s = booking_validate_request(req, engine.config.booking, now);
        if (!is_ok(s)) {
            return s;
        }

        db::TxnGuard txn;
        s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Space space{};
        s = db::db_space_get(txn.txn(), req.space_number, &space);
        if (s.code == StatusCode::NotFound) {
            return make_status(StatusDomain::Catalog, StatusCode::NotFound, static_cast<u32>(FieldId::SpaceNumber));
        }
        if (!is_ok(s)) {
            return s;
        }

        // A vehicle parked right now only matters for a booking that covers now.
        if (space.is_occupied && interval_contains(req.interval, now)) {
            return make_status(StatusDomain::Booking, StatusCode::Unavailable);
        }

        db::OverlapQuery overlap{};
        overlap.space_number = space.space_number;
        overlap.interval = req.interval;
        overlap.pending_created_after = pending_cutoff(blocking_rule(engine, now));
        bool found = false;
        s = db::db_booking_find_overlap(txn.txn(), overlap, &found);
        if (!is_ok(s)) {
            return s;
        }
        if (found) {
            return make_status(StatusDomain::Booking, StatusCode::Unavailable);
        }

        Booking b{};
        s = quote_amount(req.interval, space.hourly_rate, &b.total_amount);
        if (!is_ok(s)) {
            return s;
        }
        text_copy(b.space_number, space.space_number);
        text_copy(b.customer.name, req.customer_name);
        text_copy(b.customer.email, req.customer_email);
        text_copy(b.customer.phone, req.customer_phone);
        text_copy(b.customer.vehicle_number, req.vehicle_number);
        text_copy(b.customer.vehicle_type, text_empty(req.vehicle_type) ? kDefaultVehicleType : req.vehicle_type);
        text_copy(b.notes, req.notes);
        b.interval = req.interval;
        b.status = BookingStatus::Pending;
        b.payment_status = PaymentStatus::Pending;
        b.created_at = now;
        b.updated_at = now;

        for (u32 attempt = 0; attempt < kReferenceAttempts; ++attempt) {
            s = reference_generate(kBookingPrefix, now, b.booking_reference, sizeof(b.booking_reference));
            if (!is_ok(s)) {
                return s;
            }
            s = db::db_booking_insert(txn.txn(), b);
            if (s.code != StatusCode::Conflict) {
                break;
            }
            log_debug("booking: reference %s taken, retrying", b.booking_reference);
        }
        if (!is_ok(s)) {
            return s;
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        log_info("booking: created %s for %s", b.booking_reference, b.space_number);
        *out = b;
        return ok_status();
    }

    Status booking_get(const engine::Engine& engine, const char* reference, Booking* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (text_empty(reference)) {
            return missing(FieldId::BookingReference);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }
        s = db::db_booking_get(txn.txn(), reference, out);
        if (!is_ok(s)) {
            return to_booking(s);
        }
        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        apply_effective_status(out, engine::engine_now(engine));
        return ok_status();
    }

    Status booking_list(const engine::Engine& engine, const BookingFilter& filter, std::vector<Booking>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }

        const u32 cap = engine.config.booking.max_page;
        u32 count = (filter.limit == 0 || filter.limit > cap) ? cap : filter.limit;
        const Timestamp now = engine::engine_now(engine);

        db::BookingListFilter q{};
        q.has_status = filter.has_status;
        q.status = filter.status;
        q.now = now;
        q.has_from = filter.has_from;
        q.from_start = filter.from_start;
        q.space_number = text_empty(filter.space_number) ? nullptr : filter.space_number;
        q.offset = filter.offset;

        out->assign(count, Booking{});

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            out->clear();
            return s;
        }
        s = db::db_booking_list(txn.txn(), q, out->data(), &count);
        if (!is_ok(s)) {
            out->clear();
            return s;
        }
        s = txn.commit();
        if (!is_ok(s)) {
            out->clear();
            return s;
        }

        out->resize(count);
        for (Booking& b : *out) {
            apply_effective_status(&b, now);
        }
        return ok_status();
    }

    Status booking_cancel(const engine::Engine& engine, const char* reference, Timestamp now, Booking* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (text_empty(reference)) {
            return missing(FieldId::BookingReference);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Booking b{};
        s = db::db_booking_get(txn.txn(), reference, &b);
        if (!is_ok(s)) {
            return to_booking(s);
        }

        if (!booking_transition_allowed(booking_effective_status(b, now), BookingStatus::Cancelled)) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidState);
        }

        u32 in_flight = 0;
        s = db::db_payment_count_for_booking(txn.txn(), reference, PaymentState::Processing, &in_flight);
        if (!is_ok(s)) {
            return s;
        }
        if (in_flight > 0) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidState);
        }

        // Exactly the lead time is still allowed.
        if (seconds_until(b.interval.start, now) < engine.config.booking.cancellation_lead_seconds) {
            return make_status(StatusDomain::Booking, StatusCode::PolicyViolation);
        }

        b.status = BookingStatus::Cancelled;
        b.updated_at = now;
        s = db::db_booking_update(txn.txn(), b);
        if (!is_ok(s)) {
            return to_booking(s);
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        log_info("booking: cancelled %s", b.booking_reference);
        *out = b;
        return ok_status();
    }

    Status booking_confirm(db::DbTxn txn,
        const char* reference,
        const char* payment_reference,
        Timestamp now,
        Booking* out) noexcept {
        if (out == nullptr || !db::db_txn_valid(txn)) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (text_empty(reference)) {
            return missing(FieldId::BookingReference);
        }

        Booking b{};
        Status s = db::db_booking_get(txn, reference, &b);
        if (!is_ok(s)) {
            return to_booking(s);
        }
        if (b.status != BookingStatus::Pending) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidState);
        }

        // Re-validate against bookings that were confirmed since this one was created.
        db::OverlapQuery overlap{};
        overlap.space_number = b.space_number;
        overlap.interval = b.interval;
        overlap.pending_created_after = db::kNoPendingHold;
        overlap.exclude_reference = b.booking_reference;
        bool found = false;
        s = db::db_booking_find_overlap(txn, overlap, &found);
        if (!is_ok(s)) {
            return s;
        }
        if (found) {
            return make_status(StatusDomain::Booking, StatusCode::Unavailable);
        }

        b.status = BookingStatus::Confirmed;
        b.payment_status = PaymentStatus::Paid;
        text_copy(b.payment_id, payment_reference);
        b.updated_at = now;
        s = db::db_booking_update(txn, b);
        if (!is_ok(s)) {
            return to_booking(s);
        }

        *out = b;
        return ok_status();
    }

} // namespace parq::booking
