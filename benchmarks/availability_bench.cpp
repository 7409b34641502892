#include <cstdio>
#include <vector>

#include <benchmark/benchmark.h>

#include "parq/booking/availability.hpp"
#include "parq/booking/booking.hpp"
#include "parq/catalog/catalog.hpp"
#include "parq/engine/engine.hpp"

using namespace parq::core;

namespace {

constexpr Timestamp kBase = 1714521600;

Timestamp fixed_now(void*) noexcept {
    return kBase;
}

std::vector<Space> make_catalog(u32 n) {
    std::vector<Space> spaces(n);
    for (u32 i = 0; i < n; ++i) {
        parq::catalog::format_space_number(i + 1, spaces[i].space_number, sizeof(spaces[i].space_number));
        spaces[i].hourly_rate = money_from_units(5);
        spaces[i].is_occupied = (i % 7) == 0;
    }
    return spaces;
}

// One booking per space, every third one confirmed, the rest pending at
// various ages.
std::vector<BookingSlot> make_slots(const std::vector<Space>& spaces) {
    std::vector<BookingSlot> slots(spaces.size());
    for (std::size_t i = 0; i < spaces.size(); ++i) {
        std::snprintf(slots[i].space_number, sizeof(slots[i].space_number), "%s", spaces[i].space_number);
        slots[i].interval = Interval{kBase + 3600, kBase + 7200};
        slots[i].status = (i % 3) == 0 ? BookingStatus::Confirmed : BookingStatus::Pending;
        slots[i].created_at = kBase - static_cast<i64>(i) * 60;
    }
    return slots;
}

} // namespace

//=============================================================================
// Pure filter
//=============================================================================

static void BM_AvailableSpaces(benchmark::State& state) {
    const auto spaces = make_catalog(static_cast<u32>(state.range(0)));
    const auto slots = make_slots(spaces);
    const parq::booking::BlockingRule rule{kBase, 15 * 60};
    const Interval iv{kBase + 1800, kBase + 5400};

    std::vector<Space> out;
    for (auto _ : state) {
        const Status s = parq::booking::available_spaces(iv, spaces, slots, rule, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AvailableSpaces)->Arg(50)->Arg(500)->Arg(5000);

//=============================================================================
// Through the store
//=============================================================================

static void BM_ListAvailable(benchmark::State& state) {
    EngineConfig cfg{};
    cfg.clock.now = &fixed_now;
    cfg.lot.rows = static_cast<u32>(state.range(0));
    cfg.lot.columns = 10;

    parq::engine::Engine engine{};
    if (!is_ok(parq::engine::engine_open(cfg, &engine))) {
        state.SkipWithError("engine_open failed");
        return;
    }
    u32 created = 0;
    (void)parq::catalog::lot_initialize(engine, cfg.lot, &created);

    // Book every other space for the window being queried.
    std::vector<Space> spaces;
    (void)parq::catalog::space_list(engine, &spaces);
    for (std::size_t i = 0; i < spaces.size(); i += 2) {
        parq::booking::BookingRequest req{};
        req.space_number = spaces[i].space_number;
        req.interval = Interval{kBase + 3600, kBase + 7200};
        req.customer_name = "Bench";
        req.customer_email = "bench@example.com";
        req.customer_phone = "555-0000";
        req.vehicle_number = "BENCH-1";
        Booking b{};
        (void)parq::booking::booking_create(engine, req, &b);
    }

    const Interval iv{kBase + 1800, kBase + 5400};
    std::vector<Space> out;
    for (auto _ : state) {
        const Status s = parq::booking::list_available(engine, iv, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.data());
    }

    parq::engine::engine_close(&engine);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ListAvailable)->Arg(5)->Arg(50);
