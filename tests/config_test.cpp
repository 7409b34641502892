#include <cstdlib>

#include <gtest/gtest.h>

#include "parq/core/config.hpp"
#include "parq/core/log.hpp"

using namespace parq::core;

namespace {

const char* const kVars[] = {
    "PARQ_DB_PATH", "PARQ_BUSY_TIMEOUT_MS", "PARQ_CURRENCY", "PARQ_DEMO_MODE",
    "PARQ_CANCEL_LEAD_SECONDS", "PARQ_PENDING_HOLD_SECONDS", "PARQ_HOURLY_RATE",
    "PARQ_ENFORCE_LIMITS", "PARQ_LOT_ROWS", "PARQ_LOT_COLUMNS", "PARQ_LOG_LEVEL",
};

class ConfigEnv : public ::testing::Test {
protected:
    void SetUp() override { Clear(); }
    void TearDown() override {
        Clear();
        log_set_level(LogLevel::Warn);
    }

    static void Clear() {
        for (const char* v : kVars) {
            unsetenv(v);
        }
    }
};

} // namespace

TEST_F(ConfigEnv, DefaultsWhenUnset) {
    EngineConfig cfg{};
    ASSERT_TRUE(is_ok(config_from_env(&cfg)));

    EXPECT_EQ(cfg.db_path, nullptr);
    EXPECT_EQ(cfg.busy_timeout_ms, 5000u);
    EXPECT_EQ(cfg.lot.rows, 5u);
    EXPECT_EQ(cfg.lot.columns, 10u);
    EXPECT_EQ(cfg.lot.hourly_rate, money_from_units(5));
    EXPECT_STREQ(cfg.payment.currency, "USD");
    EXPECT_STREQ(cfg.payment.default_method, "card");
    EXPECT_TRUE(cfg.payment.demo_mode);
    EXPECT_EQ(cfg.booking.cancellation_lead_seconds, 7200);
    EXPECT_EQ(cfg.booking.pending_hold_seconds, 900);
    EXPECT_FALSE(cfg.booking.enforce_limits);
}

TEST_F(ConfigEnv, OverlaysVariables) {
    setenv("PARQ_DB_PATH", "/tmp/parq-test.db", 1);
    setenv("PARQ_BUSY_TIMEOUT_MS", "250", 1);
    setenv("PARQ_CURRENCY", "EUR", 1);
    setenv("PARQ_DEMO_MODE", "no", 1);
    setenv("PARQ_CANCEL_LEAD_SECONDS", "3600", 1);
    setenv("PARQ_PENDING_HOLD_SECONDS", "0", 1);
    setenv("PARQ_HOURLY_RATE", "7.25", 1);
    setenv("PARQ_ENFORCE_LIMITS", "1", 1);
    setenv("PARQ_LOT_ROWS", "2", 1);
    setenv("PARQ_LOT_COLUMNS", "4", 1);
    setenv("PARQ_LOG_LEVEL", "debug", 1);

    EngineConfig cfg{};
    ASSERT_TRUE(is_ok(config_from_env(&cfg)));
    EXPECT_STREQ(cfg.db_path, "/tmp/parq-test.db");
    EXPECT_EQ(cfg.busy_timeout_ms, 250u);
    EXPECT_STREQ(cfg.payment.currency, "EUR");
    EXPECT_FALSE(cfg.payment.demo_mode);
    EXPECT_EQ(cfg.booking.cancellation_lead_seconds, 3600);
    EXPECT_EQ(cfg.booking.pending_hold_seconds, 0);
    EXPECT_EQ(cfg.lot.hourly_rate, money_from_units(7, 25));
    EXPECT_TRUE(cfg.booking.enforce_limits);
    EXPECT_EQ(cfg.lot.rows, 2u);
    EXPECT_EQ(cfg.lot.columns, 4u);
    EXPECT_EQ(log_level(), LogLevel::Debug);
}

TEST_F(ConfigEnv, EmptyValueIsIgnored) {
    setenv("PARQ_CURRENCY", "", 1);
    EngineConfig cfg{};
    ASSERT_TRUE(is_ok(config_from_env(&cfg)));
    EXPECT_STREQ(cfg.payment.currency, "USD");
}

TEST_F(ConfigEnv, MalformedValueNamesTheVariable) {
    struct Case {
        const char* name;
        const char* value;
        u32 aux;
    };
    const Case cases[] = {
        {"PARQ_BUSY_TIMEOUT_MS", "soon", 2},
        {"PARQ_BUSY_TIMEOUT_MS", "0", 2},
        {"PARQ_CURRENCY", "EURO", 3},
        {"PARQ_DEMO_MODE", "maybe", 4},
        {"PARQ_CANCEL_LEAD_SECONDS", "-1", 5},
        {"PARQ_PENDING_HOLD_SECONDS", "x", 6},
        {"PARQ_HOURLY_RATE", "0", 7},
        {"PARQ_ENFORCE_LIMITS", "2", 8},
        {"PARQ_LOT_ROWS", "101", 9},
        {"PARQ_LOT_COLUMNS", "0", 10},
        {"PARQ_LOG_LEVEL", "chatty", 11},
    };
    for (const Case& c : cases) {
        Clear();
        setenv(c.name, c.value, 1);
        EngineConfig cfg{};
        const Status s = config_from_env(&cfg);
        EXPECT_EQ(s.code, StatusCode::Invalid) << c.name << "=" << c.value;
        EXPECT_EQ(s.aux, c.aux) << c.name;
    }
}

TEST(Config, NullIsInvalid) {
    EXPECT_EQ(config_from_env(nullptr).code, StatusCode::Invalid);
}
