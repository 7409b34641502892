#include <cstdint>

#include <gtest/gtest.h>

#include "engine_fixture.hpp"
#include "parq/booking/pricing.hpp"

using namespace parq::core;
using namespace parq::booking;
using parq::testing::at_hour;

TEST(QuoteAmount, WholeAndFractionalHours) {
    Money m = 0;
    ASSERT_TRUE(is_ok(quote_amount(Interval{0, 3 * 3600}, money_from_units(5), &m)));
    EXPECT_EQ(m, money_from_units(15));

    ASSERT_TRUE(is_ok(quote_amount(Interval{0, 90 * 60}, money_from_units(5), &m)));
    EXPECT_EQ(m, money_from_units(7, 50));

    // 1 s at 5.00/h = 1388.88.. micro-units, rounded half-up.
    ASSERT_TRUE(is_ok(quote_amount(Interval{0, 1}, money_from_units(5), &m)));
    EXPECT_EQ(m, 1389);
}

TEST(QuoteAmount, IsDeterministic) {
    Money a = 0;
    Money b = 0;
    const Interval iv{1000, 1000 + 7 * 3600 + 17};
    ASSERT_TRUE(is_ok(quote_amount(iv, money_from_units(3, 33), &a)));
    ASSERT_TRUE(is_ok(quote_amount(iv, money_from_units(3, 33), &b)));
    EXPECT_EQ(a, b);
}

TEST(QuoteAmount, RejectsBadInput) {
    Money m = 0;
    const Status bad_iv = quote_amount(Interval{10, 10}, money_from_units(5), &m);
    EXPECT_EQ(bad_iv.code, StatusCode::InvalidInterval);
    EXPECT_EQ(bad_iv.domain, StatusDomain::Booking);

    EXPECT_EQ(quote_amount(Interval{0, 10}, 0, &m).code, StatusCode::Invalid);
    EXPECT_EQ(quote_amount(Interval{0, INT64_MAX}, money_from_units(5), &m).code, StatusCode::Invalid);
}

TEST(QuoteAmount, RejectsIntervalWhoseLengthOverflows) {
    Money m = 7;
    const Status s = quote_amount(Interval{INT64_MIN + 10, INT64_MAX - 10}, money_from_units(5), &m);
    EXPECT_EQ(s.code, StatusCode::InvalidInterval);
    EXPECT_EQ(m, 7);

    EXPECT_FALSE(interval_valid(Interval{-1, INT64_MAX}));
    EXPECT_TRUE(interval_valid(Interval{0, INT64_MAX}));
}

TEST(CheckedArithmetic, ReportsOverflow) {
    i64 r = 0;
    EXPECT_TRUE(checked_mul(3600, money_from_units(5), &r));
    EXPECT_EQ(r, 3600 * money_from_units(5));
    EXPECT_FALSE(checked_mul(INT64_MAX / 2, 3, &r));
    EXPECT_FALSE(checked_add(INT64_MAX, 1, &r));
    EXPECT_FALSE(checked_sub(INT64_MIN, 1, &r));
    EXPECT_TRUE(checked_sub(10, 25, &r));
    EXPECT_EQ(r, -15);

    static_assert(interval_valid(Interval{1, 2}));
    static_assert(!interval_valid(Interval{INT64_MIN, 0}));
}

using QuoteTest = parq::testing::EngineTest;

TEST_F(QuoteTest, UsesSpaceRateAndCurrency) {
    Quote q{};
    ASSERT_TRUE(is_ok(quote(engine_, "P001", Interval{at_hour(10), at_hour(13)}, &q)));
    EXPECT_STREQ(q.space_number, "P001");
    EXPECT_EQ(q.duration_seconds, 3 * 3600);
    EXPECT_EQ(q.hourly_rate, money_from_units(5));
    EXPECT_EQ(q.amount, money_from_units(15));
    EXPECT_STREQ(q.currency, "USD");
}

TEST_F(QuoteTest, ReportsUnknownSpaceAndBadInterval) {
    Quote q{};
    const Status missing = quote(engine_, "P404", Interval{at_hour(10), at_hour(11)}, &q);
    EXPECT_EQ(missing.code, StatusCode::NotFound);
    EXPECT_EQ(missing.domain, StatusDomain::Catalog);

    EXPECT_EQ(quote(engine_, "P001", Interval{at_hour(11), at_hour(10)}, &q).code, StatusCode::InvalidInterval);
}

TEST_F(QuoteTest, EmptySpaceNumberIsMissingFieldLikeCreate) {
    Quote q{};
    for (const char* number : {static_cast<const char*>(nullptr), ""}) {
        const Status s = quote(engine_, number, Interval{at_hour(10), at_hour(11)}, &q);
        EXPECT_EQ(s.code, StatusCode::MissingField);
        EXPECT_EQ(s.domain, StatusDomain::Booking);
        EXPECT_EQ(s.aux, static_cast<u32>(FieldId::SpaceNumber));
    }
}
