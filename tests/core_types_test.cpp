#include <cstring>

#include <gtest/gtest.h>

#include "parq/core/errors.hpp"
#include "parq/core/text.hpp"
#include "parq/core/time.hpp"
#include "parq/core/types.hpp"

using namespace parq::core;

//=============================================================================
// Intervals
//=============================================================================

TEST(Interval, OverlapIsStrict) {
    const Interval a{100, 200};
    EXPECT_TRUE(intervals_overlap(a, Interval{150, 250}));
    EXPECT_TRUE(intervals_overlap(a, Interval{50, 150}));
    EXPECT_TRUE(intervals_overlap(a, Interval{120, 130}));
    EXPECT_TRUE(intervals_overlap(a, Interval{0, 1000}));

    // Touching at a boundary is not an overlap.
    EXPECT_FALSE(intervals_overlap(a, Interval{200, 300}));
    EXPECT_FALSE(intervals_overlap(a, Interval{0, 100}));
}

TEST(Interval, ValidityAndContains) {
    EXPECT_TRUE(interval_valid(Interval{1, 2}));
    EXPECT_FALSE(interval_valid(Interval{2, 2}));
    EXPECT_FALSE(interval_valid(Interval{3, 2}));

    const Interval iv{10, 20};
    EXPECT_EQ(interval_seconds(iv), 10);
    EXPECT_TRUE(interval_contains(iv, 10));
    EXPECT_TRUE(interval_contains(iv, 19));
    EXPECT_FALSE(interval_contains(iv, 20));
    EXPECT_FALSE(interval_contains(iv, 9));
}

//=============================================================================
// Money
//=============================================================================

TEST(Money, ParseAcceptsUpToSixDecimals) {
    Money m = 0;
    ASSERT_TRUE(money_parse("5", &m));
    EXPECT_EQ(m, money_from_units(5));
    ASSERT_TRUE(money_parse("5.5", &m));
    EXPECT_EQ(m, 5'500'000);
    ASSERT_TRUE(money_parse("15.25", &m));
    EXPECT_EQ(m, money_from_units(15, 25));
    ASSERT_TRUE(money_parse("0.000001", &m));
    EXPECT_EQ(m, 1);
    ASSERT_TRUE(money_parse("-2.50", &m));
    EXPECT_EQ(m, -2'500'000);
}

TEST(Money, ParseRejectsMalformed) {
    Money m = 0;
    EXPECT_FALSE(money_parse("", &m));
    EXPECT_FALSE(money_parse("abc", &m));
    EXPECT_FALSE(money_parse("1.", &m));
    EXPECT_FALSE(money_parse(".5", &m));
    EXPECT_FALSE(money_parse("1.0000001", &m));
    EXPECT_FALSE(money_parse("1.2x", &m));
    EXPECT_FALSE(money_parse("99999999999999999999", &m));
    EXPECT_FALSE(money_parse(nullptr, &m));
}

TEST(Money, FormatRoundsToCents) {
    char buf[32];
    ASSERT_TRUE(money_format(money_from_units(15), buf, sizeof(buf)));
    EXPECT_STREQ(buf, "15.00");
    ASSERT_TRUE(money_format(1'234'567, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "1.23");
    ASSERT_TRUE(money_format(1'235'000, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "1.24");
    ASSERT_TRUE(money_format(-2'500'000, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "-2.50");
    ASSERT_TRUE(money_format(0, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "0.00");

    char tiny[3];
    EXPECT_FALSE(money_format(money_from_units(100), tiny, sizeof(tiny)));
}

//=============================================================================
// Time
//=============================================================================

TEST(Time, ParseIsoAndUnix) {
    Timestamp t = 0;
    ASSERT_TRUE(time_parse("2024-05-01T10:00", &t));
    EXPECT_EQ(t, 1714557600);
    ASSERT_TRUE(time_parse("2024-05-01T10:00:30Z", &t));
    EXPECT_EQ(t, 1714557630);
    ASSERT_TRUE(time_parse("2024-05-01 10:00:00", &t));
    EXPECT_EQ(t, 1714557600);
    ASSERT_TRUE(time_parse("1714557600", &t));
    EXPECT_EQ(t, 1714557600);
}

TEST(Time, ParseRejectsMalformed) {
    Timestamp t = 0;
    EXPECT_FALSE(time_parse("", &t));
    EXPECT_FALSE(time_parse("2024-05-01", &t));
    EXPECT_FALSE(time_parse("2024-13-01T10:00", &t));
    EXPECT_FALSE(time_parse("2024-02-30T10:00", &t));
    EXPECT_FALSE(time_parse("2024-05-01T25:00", &t));
    EXPECT_FALSE(time_parse("2024-05-01T10:00+02", &t));
    EXPECT_FALSE(time_parse("tomorrow", &t));
}

TEST(Time, FormatIsoAndCompact) {
    char buf[32];
    ASSERT_TRUE(time_format_iso(1714557600, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "2024-05-01T10:00:00Z");
    ASSERT_TRUE(time_format_compact(1714557600, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "20240501100000");
}

TEST(Time, DayStartIsUtcMidnight) {
    // 2024-05-01T00:00:00Z
    constexpr Timestamp midnight = 1714521600;
    static_assert(day_start(midnight) == midnight);
    EXPECT_EQ(day_start(midnight + 10 * kSecondsPerHour), midnight);
    EXPECT_EQ(day_start(midnight + kSecondsPerDay - 1), midnight);
    EXPECT_EQ(day_start(midnight - 1), midnight - kSecondsPerDay);
    EXPECT_EQ(day_start(-1), -kSecondsPerDay);
    EXPECT_EQ(day_start(0), 0);
}

TEST(Time, ClockUsesInjectedSource) {
    struct Ctx {
        Timestamp t;
    } ctx{42};
    Clock c{};
    c.now = [](void* p) noexcept -> Timestamp { return static_cast<Ctx*>(p)->t; };
    c.ctx = &ctx;
    EXPECT_EQ(clock_now(c), 42);

    const Clock system{};
    EXPECT_GT(clock_now(system), 1700000000);
}

//=============================================================================
// Status
//=============================================================================

TEST(Status, DefaultIsOk) {
    const Status s{};
    EXPECT_TRUE(is_ok(s));
    EXPECT_EQ(s.domain, StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_STREQ(status_reason(s), "ok");
}

TEST(Status, NamesAndReasons) {
    EXPECT_STREQ(status_code_name(StatusCode::AlreadyPaid), "AlreadyPaid");
    EXPECT_STREQ(status_domain_name(StatusDomain::Catalog), "Catalog");
    EXPECT_STREQ(field_name(FieldId::CustomerEmail), "customer_email");

    EXPECT_STREQ(status_reason(make_status(StatusDomain::Catalog, StatusCode::NotFound)),
                 "parking space not found");
    EXPECT_STREQ(status_reason(make_status(StatusDomain::Booking, StatusCode::NotFound)),
                 "booking not found");
    EXPECT_STREQ(status_reason(make_status(StatusDomain::Booking, StatusCode::Unavailable)),
                 "space not available for selected time");
    EXPECT_STREQ(status_reason(make_status(StatusDomain::Booking, StatusCode::MissingField,
                                           static_cast<u32>(FieldId::VehicleNumber))),
                 "vehicle_number is required");
    EXPECT_STREQ(status_reason(make_status(StatusDomain::Booking, StatusCode::InvalidInterval)),
                 "start time must be before end time");
}

TEST(Status, OnlyStoreContentionIsRetryable) {
    EXPECT_TRUE(status_retryable(make_status(StatusDomain::Db, StatusCode::Busy)));
    EXPECT_TRUE(status_retryable(make_status(StatusDomain::Db, StatusCode::Conflict)));
    EXPECT_FALSE(status_retryable(make_status(StatusDomain::Catalog, StatusCode::Conflict)));
    EXPECT_FALSE(status_retryable(make_status(StatusDomain::Booking, StatusCode::Unavailable)));
    EXPECT_FALSE(status_retryable(ok_status()));
}

//=============================================================================
// Names and text
//=============================================================================

TEST(Names, StatusRoundTripsThroughParser) {
    BookingStatus b{};
    ASSERT_TRUE(parse_booking_status("cancelled", &b));
    EXPECT_EQ(b, BookingStatus::Cancelled);
    EXPECT_FALSE(parse_booking_status("Cancelled", &b));

    PaymentState p{};
    ASSERT_TRUE(parse_payment_state("processing", &p));
    EXPECT_EQ(p, PaymentState::Processing);
    EXPECT_FALSE(parse_payment_state("paid", &p));
}

TEST(Text, CopyTruncatesAndReports) {
    char buf[4];
    EXPECT_TRUE(text_copy(buf, "abc"));
    EXPECT_STREQ(buf, "abc");
    EXPECT_FALSE(text_copy(buf, "abcd"));
    EXPECT_STREQ(buf, "abc");
    EXPECT_TRUE(text_copy(buf, nullptr));
    EXPECT_STREQ(buf, "");

    EXPECT_TRUE(text_fits("abc", 4));
    EXPECT_FALSE(text_fits("abcd", 4));
    EXPECT_TRUE(text_fits(nullptr, 1));
    EXPECT_TRUE(text_empty(nullptr));
    EXPECT_TRUE(text_empty(""));
    EXPECT_FALSE(text_empty("x"));
}
