#include <gtest/gtest.h>

#include "engine_fixture.hpp"
#include "parq/engine/engine.hpp"

using namespace parq::core;
using parq::engine::Engine;

namespace {

void expect_rejected(const EngineConfig& cfg) {
    Engine e{};
    const Status s = parq::engine::engine_open(cfg, &e);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Core);
    EXPECT_FALSE(parq::engine::engine_valid(e));
}

} // namespace

TEST(EngineOpen, DefaultConfigOpensInMemoryStore) {
    Engine e{};
    ASSERT_TRUE(is_ok(parq::engine::engine_open(EngineConfig{}, &e)));
    EXPECT_TRUE(parq::engine::engine_valid(e));
    EXPECT_TRUE(is_ok(parq::engine::engine_close(&e)));
    EXPECT_FALSE(parq::engine::engine_valid(e));
    EXPECT_EQ(parq::engine::engine_close(&e).code, StatusCode::Invalid);
}

TEST(EngineOpen, RejectsInvalidPolicy) {
    EngineConfig cfg{};
    cfg.lot.hourly_rate = 0;
    expect_rejected(cfg);

    cfg = EngineConfig{};
    cfg.booking.cancellation_lead_seconds = -1;
    expect_rejected(cfg);

    cfg = EngineConfig{};
    cfg.booking.pending_hold_seconds = -1;
    expect_rejected(cfg);

    cfg = EngineConfig{};
    cfg.booking.max_page = 0;
    expect_rejected(cfg);

    cfg = EngineConfig{};
    cfg.payment.currency[0] = '\0';
    expect_rejected(cfg);

    cfg = EngineConfig{};
    cfg.payment.default_method[0] = '\0';
    expect_rejected(cfg);

    EXPECT_EQ(parq::engine::engine_open(EngineConfig{}, nullptr).code, StatusCode::Invalid);
}

TEST(EngineOpen, NowFollowsInjectedClock) {
    parq::testing::ManualClock clock{};
    EngineConfig cfg{};
    cfg.clock.now = &parq::testing::manual_clock_now;
    cfg.clock.ctx = &clock;

    Engine e{};
    ASSERT_TRUE(is_ok(parq::engine::engine_open(cfg, &e)));
    EXPECT_EQ(parq::engine::engine_now(e), parq::testing::at_hour(8));
    clock.now += 90;
    EXPECT_EQ(parq::engine::engine_now(e), parq::testing::at_hour(8, 1) + 30);
    EXPECT_TRUE(is_ok(parq::engine::engine_close(&e)));
}
