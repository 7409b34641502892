#pragma once

#include <gtest/gtest.h>

#include "parq/catalog/catalog.hpp"
#include "parq/core/config.hpp"
#include "parq/core/errors.hpp"
#include "parq/core/time.hpp"
#include "parq/engine/engine.hpp"

namespace parq::testing {

    // 2024-05-01T00:00:00Z
    inline constexpr parq::core::Timestamp kDay0 = 1714521600;

    [[nodiscard]] constexpr parq::core::Timestamp at_hour(parq::core::i64 hour,
        parq::core::i64 minute = 0) noexcept {
        return kDay0 + hour * parq::core::kSecondsPerHour + minute * 60;
    }

    struct ManualClock {
        parq::core::Timestamp now{at_hour(8)};
    };

    inline parq::core::Timestamp manual_clock_now(void* ctx) noexcept {
        return static_cast<ManualClock*>(ctx)->now;
    }

    // In-memory engine with a hand-driven clock and a 1 x 3 lot at 5.00/h.
    class EngineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            cfg_.clock.now = &manual_clock_now;
            cfg_.clock.ctx = &clock_;
            cfg_.lot.rows = 1;
            cfg_.lot.columns = 3;
            Configure(&cfg_);
            ASSERT_TRUE(parq::core::is_ok(parq::engine::engine_open(cfg_, &engine_)));
            if (InitLot()) {
                parq::core::u32 created = 0;
                ASSERT_TRUE(parq::core::is_ok(parq::catalog::lot_initialize(engine_, cfg_.lot, &created)));
                ASSERT_EQ(created, cfg_.lot.rows * cfg_.lot.columns);
            }
        }

        void TearDown() override {
            if (parq::engine::engine_valid(engine_)) {
                EXPECT_TRUE(parq::core::is_ok(parq::engine::engine_close(&engine_)));
            }
        }

        // Hooks for derived fixtures.
        virtual void Configure(parq::core::EngineConfig* cfg) { (void)cfg; }
        virtual bool InitLot() const { return true; }

        void SetNow(parq::core::Timestamp t) { clock_.now = t; }
        void Advance(parq::core::i64 seconds) { clock_.now += seconds; }
        [[nodiscard]] parq::core::Timestamp Now() const { return clock_.now; }

        ManualClock clock_{};
        parq::core::EngineConfig cfg_{};
        parq::engine::Engine engine_{};
    };

} // namespace parq::testing
