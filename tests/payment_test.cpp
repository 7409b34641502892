#include <cstring>
#include <vector>

#include <gtest/gtest.h>

#include "engine_fixture.hpp"
#include "parq/booking/booking.hpp"
#include "parq/payment/payment.hpp"

using namespace parq::core;
using namespace parq::payment;
using parq::booking::BookingRequest;
using parq::testing::at_hour;

namespace {

class PaymentTest : public parq::testing::EngineTest {
protected:
    Booking Book(const char* space = "P001", Interval iv = Interval{at_hour(10), at_hour(13)}) {
        BookingRequest req{};
        req.space_number = space;
        req.interval = iv;
        req.customer_name = "Jane Doe";
        req.customer_email = "jane@example.com";
        req.customer_phone = "+1-555-0100";
        req.vehicle_number = "ABC-123";
        Booking b{};
        const Status s = parq::booking::booking_create(engine_, req, &b);
        EXPECT_TRUE(is_ok(s)) << status_reason(s);
        return b;
    }

    Status Pay(const Booking& b, Payment* out, const char* method = nullptr) {
        PaymentRequest req{};
        req.booking_reference = b.booking_reference;
        req.payment_method = method;
        return payment_process(engine_, req, out);
    }

    Booking Reload(const Booking& b) {
        Booking out{};
        EXPECT_TRUE(is_ok(parq::booking::booking_get(engine_, b.booking_reference, &out)));
        return out;
    }
};

class LivePaymentTest : public PaymentTest {
protected:
    void Configure(EngineConfig* cfg) override { cfg->payment.demo_mode = false; }
};

} // namespace

TEST(PaymentTransitions, Allowed) {
    EXPECT_TRUE(payment_transition_allowed(PaymentState::Pending, PaymentState::Processing));
    EXPECT_TRUE(payment_transition_allowed(PaymentState::Processing, PaymentState::Completed));
    EXPECT_TRUE(payment_transition_allowed(PaymentState::Processing, PaymentState::Failed));
    EXPECT_TRUE(payment_transition_allowed(PaymentState::Completed, PaymentState::Refunded));

    EXPECT_FALSE(payment_transition_allowed(PaymentState::Pending, PaymentState::Completed));
    EXPECT_FALSE(payment_transition_allowed(PaymentState::Failed, PaymentState::Processing));
    EXPECT_FALSE(payment_transition_allowed(PaymentState::Refunded, PaymentState::Completed));
    EXPECT_FALSE(payment_transition_allowed(PaymentState::Processing, PaymentState::Refunded));
}

//=============================================================================
// Demo settlement
//=============================================================================

TEST_F(PaymentTest, DemoPaymentCompletesAndConfirms) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p)));

    EXPECT_EQ(p.status, PaymentState::Completed);
    EXPECT_STREQ(p.payment_gateway, kDemoGateway);
    EXPECT_EQ(std::strncmp(p.gateway_transaction_id, "demo_txn_", 9), 0);
    EXPECT_EQ(std::strlen(p.gateway_transaction_id), 15u);
    EXPECT_EQ(std::strncmp(p.payment_reference, "PAY", 3), 0);
    EXPECT_STREQ(p.booking_reference, b.booking_reference);
    EXPECT_EQ(p.amount, money_from_units(15));
    EXPECT_STREQ(p.currency, "USD");
    EXPECT_STREQ(p.payment_method, "card");
    EXPECT_STREQ(p.customer_email, "jane@example.com");
    EXPECT_EQ(p.payment_time, Now());
    EXPECT_EQ(p.completed_at, Now());

    const Booking after = Reload(b);
    EXPECT_EQ(after.status, BookingStatus::Confirmed);
    EXPECT_EQ(after.payment_status, PaymentStatus::Paid);
    EXPECT_STREQ(after.payment_id, p.payment_reference);

    Payment stored{};
    ASSERT_TRUE(is_ok(payment_get(engine_, p.payment_reference, &stored)));
    EXPECT_EQ(stored.status, PaymentState::Completed);
    EXPECT_STREQ(stored.gateway_transaction_id, p.gateway_transaction_id);
}

TEST_F(PaymentTest, ExplicitMethodIsRecorded) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p, "wallet")));
    EXPECT_STREQ(p.payment_method, "wallet");
}

TEST_F(PaymentTest, PayingTwiceIsAlreadyPaid) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p)));

    Payment again{};
    const Status s = Pay(b, &again);
    EXPECT_EQ(s.domain, StatusDomain::Payment);
    EXPECT_EQ(s.code, StatusCode::AlreadyPaid);

    std::vector<Payment> attempts;
    ASSERT_TRUE(is_ok(payment_list_for_booking(engine_, b.booking_reference, &attempts)));
    EXPECT_EQ(attempts.size(), 1u);
}

TEST_F(PaymentTest, RefundMarksBookingRefunded) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p)));

    Payment refunded{};
    ASSERT_TRUE(is_ok(payment_refund(engine_, p.payment_reference, &refunded)));
    EXPECT_EQ(refunded.status, PaymentState::Refunded);

    const Booking after = Reload(b);
    EXPECT_EQ(after.payment_status, PaymentStatus::Refunded);
    EXPECT_EQ(after.status, BookingStatus::Confirmed);

    const Status again = payment_refund(engine_, p.payment_reference, &refunded);
    EXPECT_EQ(again.domain, StatusDomain::Payment);
    EXPECT_EQ(again.code, StatusCode::InvalidState);
}

TEST_F(PaymentTest, LosingPaymentLeavesNoTrace) {
    const Booking first = Book();
    Advance(cfg_.booking.pending_hold_seconds);
    const Booking second = Book("P001", Interval{at_hour(12), at_hour(14)});

    Payment p{};
    ASSERT_TRUE(is_ok(Pay(second, &p)));

    const Status s = Pay(first, &p);
    EXPECT_EQ(s.code, StatusCode::Unavailable);

    std::vector<Payment> attempts;
    ASSERT_TRUE(is_ok(payment_list_for_booking(engine_, first.booking_reference, &attempts)));
    EXPECT_TRUE(attempts.empty());
    EXPECT_EQ(Reload(first).status, BookingStatus::Pending);
}

//=============================================================================
// Errors
//=============================================================================

TEST_F(PaymentTest, UnknownReferences) {
    Payment p{};
    Booking ghost{};
    std::strcpy(ghost.booking_reference, "BK20240501000000ZZZZZZ");

    Status s = Pay(ghost, &p);
    EXPECT_EQ(s.domain, StatusDomain::Booking);
    EXPECT_EQ(s.code, StatusCode::NotFound);

    s = payment_get(engine_, "PAY20240501000000ZZZZZZ", &p);
    EXPECT_EQ(s.domain, StatusDomain::Payment);
    EXPECT_EQ(s.code, StatusCode::NotFound);

    s = payment_refund(engine_, "PAY20240501000000ZZZZZZ", &p);
    EXPECT_EQ(s.domain, StatusDomain::Payment);
    EXPECT_EQ(s.code, StatusCode::NotFound);

    std::vector<Payment> attempts;
    ASSERT_TRUE(is_ok(payment_list_for_booking(engine_, ghost.booking_reference, &attempts)));
    EXPECT_TRUE(attempts.empty());
}

TEST_F(PaymentTest, MissingReferences) {
    Payment p{};
    Status s = payment_get(engine_, "", &p);
    EXPECT_EQ(s.code, StatusCode::MissingField);
    EXPECT_EQ(s.aux, static_cast<u32>(FieldId::PaymentReference));

    s = payment_complete(engine_, nullptr, nullptr, &p);
    EXPECT_EQ(s.code, StatusCode::MissingField);
    EXPECT_EQ(s.aux, static_cast<u32>(FieldId::PaymentReference));

    PaymentRequest req{};
    s = payment_process(engine_, req, &p);
    EXPECT_EQ(s.code, StatusCode::MissingField);
    EXPECT_EQ(s.aux, static_cast<u32>(FieldId::BookingReference));

    std::vector<Payment> attempts;
    s = payment_list_for_booking(engine_, nullptr, &attempts);
    EXPECT_EQ(s.code, StatusCode::MissingField);
    EXPECT_EQ(s.aux, static_cast<u32>(FieldId::BookingReference));
}

TEST_F(PaymentTest, CancelledBookingCannotBePaid) {
    const Booking b = Book();
    Booking cancelled{};
    ASSERT_TRUE(is_ok(parq::booking::booking_cancel(engine_, b.booking_reference, Now(), &cancelled)));

    Payment p{};
    const Status s = Pay(b, &p);
    EXPECT_EQ(s.domain, StatusDomain::Booking);
    EXPECT_EQ(s.code, StatusCode::InvalidState);
}

//=============================================================================
// Gateway-driven settlement
//=============================================================================

TEST_F(LivePaymentTest, PaymentStaysProcessing) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p)));

    EXPECT_EQ(p.status, PaymentState::Processing);
    EXPECT_STREQ(p.payment_gateway, kLiveGateway);
    EXPECT_STREQ(p.gateway_transaction_id, "");
    EXPECT_EQ(p.completed_at, 0);

    const Booking after = Reload(b);
    EXPECT_EQ(after.status, BookingStatus::Pending);
    EXPECT_EQ(after.payment_status, PaymentStatus::Pending);
    EXPECT_STREQ(after.payment_id, "");
}

TEST_F(LivePaymentTest, InFlightPaymentBlocksCancelAndRetry) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p)));

    Booking cancelled{};
    Status s = parq::booking::booking_cancel(engine_, b.booking_reference, Now(), &cancelled);
    EXPECT_EQ(s.domain, StatusDomain::Booking);
    EXPECT_EQ(s.code, StatusCode::InvalidState);

    Payment again{};
    s = Pay(b, &again);
    EXPECT_EQ(s.domain, StatusDomain::Payment);
    EXPECT_EQ(s.code, StatusCode::InvalidState);
}

TEST_F(LivePaymentTest, CompleteConfirmsBooking) {
    const Booking b = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(b, &p)));

    Advance(30);
    Payment done{};
    ASSERT_TRUE(is_ok(payment_complete(engine_, p.payment_reference, "gw-778899", &done)));
    EXPECT_EQ(done.status, PaymentState::Completed);
    EXPECT_STREQ(done.gateway_transaction_id, "gw-778899");
    EXPECT_EQ(done.completed_at, Now());

    const Booking after = Reload(b);
    EXPECT_EQ(after.status, BookingStatus::Confirmed);
    EXPECT_EQ(after.payment_status, PaymentStatus::Paid);
    EXPECT_STREQ(after.payment_id, p.payment_reference);

    const Status s = payment_complete(engine_, p.payment_reference, nullptr, &done);
    EXPECT_EQ(s.code, StatusCode::InvalidState);
}

TEST_F(LivePaymentTest, FailureAllowsAnotherAttempt) {
    const Booking b = Book();
    Payment first{};
    ASSERT_TRUE(is_ok(Pay(b, &first)));

    Payment failed{};
    ASSERT_TRUE(is_ok(payment_fail(engine_, first.payment_reference, &failed)));
    EXPECT_EQ(failed.status, PaymentState::Failed);
    EXPECT_EQ(Reload(b).status, BookingStatus::Pending);

    const Status s = payment_refund(engine_, first.payment_reference, &failed);
    EXPECT_EQ(s.code, StatusCode::InvalidState);

    Advance(1);
    Payment second{};
    ASSERT_TRUE(is_ok(Pay(b, &second)));
    EXPECT_STRNE(second.payment_reference, first.payment_reference);

    std::vector<Payment> attempts;
    ASSERT_TRUE(is_ok(payment_list_for_booking(engine_, b.booking_reference, &attempts)));
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_STREQ(attempts[0].payment_reference, first.payment_reference);
    EXPECT_EQ(attempts[0].status, PaymentState::Failed);
    EXPECT_STREQ(attempts[1].payment_reference, second.payment_reference);
    EXPECT_EQ(attempts[1].status, PaymentState::Processing);
}

TEST_F(LivePaymentTest, CompleteThatWouldOverlapChangesNothing) {
    const Booking first = Book();
    Payment p{};
    ASSERT_TRUE(is_ok(Pay(first, &p)));

    Advance(cfg_.booking.pending_hold_seconds);
    const Booking second = Book("P001", Interval{at_hour(12), at_hour(14)});
    Payment q{};
    ASSERT_TRUE(is_ok(Pay(second, &q)));
    Payment done{};
    ASSERT_TRUE(is_ok(payment_complete(engine_, q.payment_reference, nullptr, &done)));

    const Status s = payment_complete(engine_, p.payment_reference, nullptr, &done);
    EXPECT_EQ(s.code, StatusCode::Unavailable);

    Payment stored{};
    ASSERT_TRUE(is_ok(payment_get(engine_, p.payment_reference, &stored)));
    EXPECT_EQ(stored.status, PaymentState::Processing);
    EXPECT_EQ(Reload(first).status, BookingStatus::Pending);
}
