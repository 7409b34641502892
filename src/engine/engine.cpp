#include "parq/engine/engine.hpp"

#include "parq/core/log.hpp"
#include "parq/core/text.hpp"
#include "parq/core/time.hpp"

namespace parq::engine {

using namespace parq::core;

Status engine_open(const EngineConfig& cfg, Engine* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    if (cfg.lot.hourly_rate <= 0 || cfg.booking.cancellation_lead_seconds < 0 ||
        cfg.booking.pending_hold_seconds < 0 || cfg.booking.max_page == 0 ||
        text_empty(cfg.payment.currency) || text_empty(cfg.payment.default_method)) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    db::DbConfig db_cfg{};
    db_cfg.path = cfg.db_path;
    db_cfg.busy_timeout_ms = cfg.busy_timeout_ms;

    Engine e{};
    const Status s = db::db_open(db_cfg, &e.db);
    if (!is_ok(s)) {
        log_status("engine open", s);
        return s;
    }

    e.config = cfg;
    *out = e;

    log_info("engine: store %s, demo payments %s, cancellation lead %llds",
             cfg.db_path ? cfg.db_path : ":memory:",
             cfg.payment.demo_mode ? "on" : "off",
             static_cast<long long>(cfg.booking.cancellation_lead_seconds));
    return ok_status();
}

Status engine_close(Engine* engine) noexcept {
    if (!engine || !engine_valid(*engine)) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    const Status s = db::db_close(engine->db);
    if (is_ok(s)) {
        engine->db = db::DbHandle{};
    }
    return s;
}

Timestamp engine_now(const Engine& engine) noexcept {
    return clock_now(engine.config.clock);
}

} // namespace parq::engine
