#include "parq/catalog/catalog.hpp"

#include <cstdio>

#include "parq/core/log.hpp"
#include "parq/core/text.hpp"
#include "parq/db/queries.hpp"

namespace parq::catalog {
    using namespace parq::core;

    namespace {
        constexpr u32 kMaxLotDimension = 100;

        // Db NotFound becomes "parking space not found".
        [[nodiscard]] Status to_catalog(Status s) noexcept {
            if (s.code == StatusCode::NotFound && s.domain == StatusDomain::Db) {
                return make_status(StatusDomain::Catalog, StatusCode::NotFound, static_cast<u32>(FieldId::SpaceNumber));
            }
            return s;
        }

        void fill_lot_status(u32 total, u32 occupied, LotStatus* out) noexcept {
            out->total = total;
            out->occupied = occupied;
            out->available = total - occupied;
            out->occupancy_rate = total > 0 ? static_cast<double>(occupied) * 100.0 / static_cast<double>(total) : 0.0;
        }
    } // namespace

    bool format_space_number(u32 index, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        const int n = std::snprintf(out, out_size, "P%03u", index);
        return n > 0 && static_cast<std::size_t>(n) < out_size;
    }

    Status lot_initialize(const engine::Engine& engine, const LotLayout& layout, u32* created) noexcept {
        if (created == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }
        *created = 0;
        if (layout.rows == 0 || layout.columns == 0 ||
            layout.rows > kMaxLotDimension || layout.columns > kMaxLotDimension ||
            layout.hourly_rate <= 0) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        u32 total = 0;
        u32 occupied = 0;
        s = db::db_space_counts(txn.txn(), &total, &occupied);
        if (!is_ok(s)) {
            return s;
        }
        if (total > 0) {
            return make_status(StatusDomain::Catalog, StatusCode::Conflict);
        }

        const Timestamp now = engine::engine_now(engine);
        u32 index = 1;
        for (u32 row = 0; row < layout.rows; ++row) {
            for (u32 col = 0; col < layout.columns; ++col) {
                Space space{};
                if (!format_space_number(index, space.space_number, sizeof(space.space_number))) {
                    return make_status(StatusDomain::Catalog, StatusCode::Invalid);
                }
                space.row = static_cast<i32>(row);
                space.column = static_cast<i32>(col);
                space.hourly_rate = layout.hourly_rate;
                space.last_updated = now;

                s = db::db_space_insert(txn.txn(), space);
                if (!is_ok(s)) {
                    return s;
                }
                ++index;
            }
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        *created = layout.rows * layout.columns;
        log_info("catalog: initialized %u parking spaces", *created);
        return ok_status();
    }

    Status space_get(const engine::Engine& engine, const char* space_number, Space* out) noexcept {
        if (text_empty(space_number) || out == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid, static_cast<u32>(FieldId::SpaceNumber));
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }

        s = db::db_space_get(txn.txn(), space_number, out);
        if (!is_ok(s)) {
            return to_catalog(s);
        }
        return txn.commit();
    }

    Status space_list(const engine::Engine& engine, std::vector<Space>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }

        s = db::db_space_list(txn.txn(), out);
        if (!is_ok(s)) {
            return s;
        }
        return txn.commit();
    }

    Status set_occupancy(const engine::Engine& engine, const OccupancyUpdate& update, bool* changed) noexcept {
        if (text_empty(update.space_number) || changed == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid, static_cast<u32>(FieldId::SpaceNumber));
        }
        if (update.confidence < 0.0f || update.confidence > 1.0f) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }
        if (!text_fits(update.vehicle_type, kVehicleTypeLen)) {
            return make_status(StatusDomain::Catalog, StatusCode::MissingField, static_cast<u32>(FieldId::VehicleType));
        }
        *changed = false;

        const Timestamp at = update.at != 0 ? update.at : engine::engine_now(engine);

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Write);
        if (!is_ok(s)) {
            return s;
        }

        Space space{};
        s = db::db_space_get(txn.txn(), update.space_number, &space);
        if (!is_ok(s)) {
            return to_catalog(s);
        }

        // An exit clears the vehicle type; an unchanged flag keeps the old one
        // unless the feed reports a new type.
        const char* vehicle_type = space.vehicle_type;
        if (!update.occupied) {
            vehicle_type = "";
        } else if (!text_empty(update.vehicle_type)) {
            vehicle_type = update.vehicle_type;
        }

        s = db::db_space_set_occupancy(txn.txn(), update.space_number, update.occupied, vehicle_type, at);
        if (!is_ok(s)) {
            return to_catalog(s);
        }

        const bool flipped = space.is_occupied != update.occupied;
        if (flipped) {
            OccupancyEvent ev{};
            text_copy(ev.space_number, update.space_number);
            ev.type = update.occupied ? OccupancyEventType::Entry : OccupancyEventType::Exit;
            text_copy(ev.vehicle_type, update.vehicle_type);
            ev.confidence = update.confidence;
            ev.timestamp = at;
            s = db::db_occupancy_event_insert(txn.txn(), ev);
            if (!is_ok(s)) {
                return s;
            }
        }

        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        *changed = flipped;
        if (flipped) {
            log_debug("catalog: %s %s", update.space_number, update.occupied ? "entry" : "exit");
        }
        return ok_status();
    }

    Status lot_status(const engine::Engine& engine, LotStatus* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }

        u32 total = 0;
        u32 occupied = 0;
        s = db::db_space_counts(txn.txn(), &total, &occupied);
        if (!is_ok(s)) {
            return s;
        }
        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        fill_lot_status(total, occupied, out);
        return ok_status();
    }

    Status lot_summary(const engine::Engine& engine, Timestamp since, LotSummary* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }

        u32 total = 0;
        u32 occupied = 0;
        s = db::db_space_counts(txn.txn(), &total, &occupied);
        if (!is_ok(s)) {
            return s;
        }
        LotSummary summary{};
        s = db::db_occupancy_event_counts(txn.txn(), since, &summary.entries, &summary.exits);
        if (!is_ok(s)) {
            return s;
        }
        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }

        fill_lot_status(total, occupied, &summary.status);
        summary.since = since;
        *out = summary;
        return ok_status();
    }

    Status occupancy_events(const engine::Engine& engine,
        const char* space_number,
        OccupancyEvent* out,
        u32* count) noexcept {
        if (out == nullptr || count == nullptr) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }

        db::TxnGuard txn;
        Status s = txn.begin(engine.db, db::TxnMode::Read);
        if (!is_ok(s)) {
            return s;
        }

        s = db::db_occupancy_event_list(txn.txn(), space_number, out, count);
        if (!is_ok(s)) {
            return s;
        }
        return txn.commit();
    }

} // namespace parq::catalog
