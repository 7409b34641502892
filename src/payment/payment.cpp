#include "parq/payment/payment.hpp"

#include <cstdio>

#include "parq/booking/booking.hpp"
#include "parq/booking/reference.hpp"
#include "parq/core/log.hpp"
#include "parq/core/text.hpp"
#include "parq/db/queries.hpp"

namespace parq::payment {
    using namespace parq::core;

    namespace {
        constexpr u32 kMaxAttemptsListed = 64;

        [[nodiscard]] Status payment_error(StatusCode code, FieldId field = FieldId::None) noexcept {
            return make_status(StatusDomain::Payment, code, static_cast<u32>(field));
        }

        [[nodiscard]] Status to_payment(Status s) noexcept {
            if (s.code == StatusCode::NotFound && s.domain == StatusDomain::Db) {
                return payment_error(StatusCode::NotFound);
            }
            return s;
        }

        // demo_txn_NNNNNN with NNNNNN in [100000, 999999].
        [[nodiscard]] Status demo_transaction_id(char* out, std::size_t out_size) noexcept {
            u32 n = 0;
            const Status s = booking::random_uniform(900000, &n);
            if (!is_ok(s)) {
                return s;
            }
            const int w = std::snprintf(out, out_size, "demo_txn_%06u", 100000u + n);
            if (w < 0 || static_cast<std::size_t>(w) >= out_size) {
                return make_status(StatusDomain::Payment, StatusCode::Invalid);
            }
            return ok_status();
        }

        // Loads the payment and checks it may move to `to`.
        [[nodiscard]] Status load_for_transition(db::DbTxn txn,
            const char* reference,
            PaymentState to,
            Payment* out) noexcept {
            if (text_empty(reference)) {
                return payment_error(StatusCode::MissingField, FieldId::PaymentReference);
            }
            Status s = db::db_payment_get(txn, reference, out);
            if (!is_ok(s)) {
                return to_payment(s);
            }
            if (!payment_transition_allowed(out->status, to)) {
                return payment_error(StatusCode::InvalidState);
            }
            return ok_status();
        }

        // Marks p completed and confirms its booking, all inside txn.
        [[nodiscard]] Status settle(db::DbTxn txn, Payment* p, Timestamp now) noexcept {
            p->status = PaymentState::Completed;
            p->completed_at = now;
            Status s = db::db_payment_update(txn, *p);
            if (!is_ok(s)) {
                return to_payment(s);
            }
            if (text_empty(p->booking_reference)) {
                return ok_status();
            }
            Booking confirmed{};
            return booking::booking_confirm(txn, p->booking_reference, p->payment_reference, now, &confirmed);
        }
    } // namespace

    Status payment_process(const engine::Engine& engine, const PaymentRequest& req, Payment* out) noexcept {
        if (out == nullptr) {
            return payment_error(StatusCode::Invalid);
        }
        if (text_empty(req.booking_reference)) {
            return payment_error(StatusCode::MissingField, FieldId::BookingReference);
        }
        const char* method = text_empty(req.payment_method) ? engine.config.payment.default_method : req.payment_method;
        if (!text_fits(method, kMethodLen)) {
            return payment_error(StatusCode::MissingField, FieldId::PaymentMethod);
        }

        const Timestamp now = engine::engine_now(engine);

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Booking b{};
        s = db::db_booking_get(txn.txn(), req.booking_reference, &b);
        if (s.code == StatusCode::NotFound) {
            return make_status(StatusDomain::Booking, StatusCode::NotFound, static_cast<u32>(FieldId::BookingReference));
        }
        if (!is_ok(s)) {
            return s;
        }
        if (b.payment_status == PaymentStatus::Paid) {
            return payment_error(StatusCode::AlreadyPaid);
        }
        if (b.status != BookingStatus::Pending) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidState);
        }

        u32 in_flight = 0;
        s = db::db_payment_count_for_booking(txn.txn(), b.booking_reference, PaymentState::Processing, &in_flight);
        if (!is_ok(s)) {
            return s;
        }
        if (in_flight > 0) {
            return payment_error(StatusCode::InvalidState);
        }

        const PaymentConfig& cfg = engine.config.payment;
        Payment p{};
        text_copy(p.booking_reference, b.booking_reference);
        p.amount = b.total_amount;
        text_copy(p.currency, cfg.currency);
        text_copy(p.payment_method, method);
        text_copy(p.payment_gateway, cfg.demo_mode ? kDemoGateway : kLiveGateway);
        p.status = PaymentState::Processing;
        text_copy(p.customer_email, b.customer.email);
        p.payment_time = now;

        for (u32 attempt = 0; attempt < booking::kReferenceAttempts; ++attempt) {
            s = booking::reference_generate(booking::kPaymentPrefix, now, p.payment_reference, sizeof(p.payment_reference));
            if (!is_ok(s)) {
                return s;
            }
            s = db::db_payment_insert(txn.txn(), p);
            if (s.code != StatusCode::Conflict) {
                break;
            }
            log_debug("payment: reference %s taken, retrying", p.payment_reference);
        }
        if (!is_ok(s)) {
            return s;
        }

        if (cfg.demo_mode) {
            s = demo_transaction_id(p.gateway_transaction_id, sizeof(p.gateway_transaction_id));
            if (!is_ok(s)) {
                return s;
            }
            s = settle(txn.txn(), &p, now);
            if (!is_ok(s)) {
                return s;
            }
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        log_info("payment: %s for %s is %s", p.payment_reference, p.booking_reference, payment_state_name(p.status));
        *out = p;
        return ok_status();
    }

    Status payment_get(const engine::Engine& engine, const char* reference, Payment* out) noexcept {
        if (out == nullptr) {
            return payment_error(StatusCode::Invalid);
        }
        if (text_empty(reference)) {
            return payment_error(StatusCode::MissingField, FieldId::PaymentReference);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }
        s = db::db_payment_get(txn.txn(), reference, out);
        if (!is_ok(s)) {
            return to_payment(s);
        }
        return txn.commit();
    }

    Status payment_list_for_booking(const engine::Engine& engine,
        const char* booking_reference,
        std::vector<Payment>* out) noexcept {
        if (out == nullptr) {
            return payment_error(StatusCode::Invalid);
        }
        out->clear();
        if (text_empty(booking_reference)) {
            return payment_error(StatusCode::MissingField, FieldId::BookingReference);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }
        u32 count = kMaxAttemptsListed;
        out->resize(count);
        s = db::db_payment_list_for_booking(txn.txn(), booking_reference, out->data(), &count);
        if (!is_ok(s)) {
            out->clear();
            return s;
        }
        out->resize(count);
        return txn.commit();
    }

    Status payment_complete(const engine::Engine& engine,
        const char* reference,
        const char* gateway_transaction_id,
        Payment* out) noexcept {
        if (out == nullptr) {
            return payment_error(StatusCode::Invalid);
        }
        if (!text_fits(gateway_transaction_id, kGatewayTxnLen)) {
            return payment_error(StatusCode::Invalid);
        }

        const Timestamp now = engine::engine_now(engine);

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Payment p{};
        s = load_for_transition(txn.txn(), reference, PaymentState::Completed, &p);
        if (!is_ok(s)) {
            return s;
        }
        if (!text_empty(gateway_transaction_id)) {
            text_copy(p.gateway_transaction_id, gateway_transaction_id);
        }

        s = settle(txn.txn(), &p, now);
        if (!is_ok(s)) {
            log_status("payment complete", s);
            return s;
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        log_info("payment: %s completed", p.payment_reference);
        *out = p;
        return ok_status();
    }

    Status payment_fail(const engine::Engine& engine, const char* reference, Payment* out) noexcept {
        if (out == nullptr) {
            return payment_error(StatusCode::Invalid);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Payment p{};
        s = load_for_transition(txn.txn(), reference, PaymentState::Failed, &p);
        if (!is_ok(s)) {
            return s;
        }

        p.status = PaymentState::Failed;
        s = db::db_payment_update(txn.txn(), p);
        if (!is_ok(s)) {
            return to_payment(s);
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        log_info("payment: %s failed", p.payment_reference);
        *out = p;
        return ok_status();
    }

    Status payment_refund(const engine::Engine& engine, const char* reference, Payment* out) noexcept {
        if (out == nullptr) {
            return payment_error(StatusCode::Invalid);
        }

        const Timestamp now = engine::engine_now(engine);

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Payment p{};
        s = load_for_transition(txn.txn(), reference, PaymentState::Refunded, &p);
        if (!is_ok(s)) {
            return s;
        }

        p.status = PaymentState::Refunded;
        s = db::db_payment_update(txn.txn(), p);
        if (!is_ok(s)) {
            return to_payment(s);
        }

        if (!text_empty(p.booking_reference)) {
            Booking b{};
            s = db::db_booking_get(txn.txn(), p.booking_reference, &b);
            if (!is_ok(s)) {
                return s;
            }
            b.payment_status = PaymentStatus::Refunded;
            b.updated_at = now;
            s = db::db_booking_update(txn.txn(), b);
            if (!is_ok(s)) {
                return s;
            }
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        log_info("payment: %s refunded", p.payment_reference);
        *out = p;
        return ok_status();
    }

} // namespace parq::payment
