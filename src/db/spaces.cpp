#include "parq/db/queries.hpp"
#include "db_internal.hpp"

#include <sqlite3.h>
#include <string>

namespace parq::db {

using namespace parq::core;
using detail::copy_column_text;
using detail::map_sqlite_error;
using detail::txn_conn;

namespace {
    constexpr const char* kSpaceColumns =
        "space_number, row_index, column_index, hourly_rate, is_occupied, vehicle_type, last_updated";

    void read_space(sqlite3_stmt* stmt, Space* out) noexcept {
        copy_column_text(stmt, 0, out->space_number);
        out->row = sqlite3_column_int(stmt, 1);
        out->column = sqlite3_column_int(stmt, 2);
        out->hourly_rate = sqlite3_column_int64(stmt, 3);
        out->is_occupied = sqlite3_column_int(stmt, 4) != 0;
        copy_column_text(stmt, 5, out->vehicle_type);
        out->last_updated = sqlite3_column_int64(stmt, 6);
    }
}

// ============================================================================
// Space Operations
// ============================================================================

Status db_space_insert(DbTxn txn, const Space& space) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "INSERT INTO spaces (";
    sql += kSpaceColumns;
    sql += ") VALUES (?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, space.space_number, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, space.row);
    sqlite3_bind_int(stmt, 3, space.column);
    sqlite3_bind_int64(stmt, 4, space.hourly_rate);
    sqlite3_bind_int(stmt, 5, space.is_occupied ? 1 : 0);
    sqlite3_bind_text(stmt, 6, space.vehicle_type, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, space.last_updated);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }

    return ok_status();
}

Status db_space_get(DbTxn txn, const char* space_number, Space* out) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !space_number || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += kSpaceColumns;
    sql += " FROM spaces WHERE space_number = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, space_number, -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_space(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_space_list(DbTxn txn, std::vector<Space>* out) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += kSpaceColumns;
    sql += " FROM spaces ORDER BY space_number";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    out->clear();
    for (;;) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            Space s{};
            read_space(stmt, &s);
            out->push_back(s);
            continue;
        }
        if (rc == SQLITE_DONE) {
            break;
        }
        sqlite3_finalize(stmt);
        return map_sqlite_error(rc);
    }

    sqlite3_finalize(stmt);
    return ok_status();
}

Status db_space_set_occupancy(DbTxn txn,
                              const char* space_number,
                              bool occupied,
                              const char* vehicle_type,
                              Timestamp at) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !space_number) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "UPDATE spaces SET is_occupied = ?, vehicle_type = ?, last_updated = ? "
                      "WHERE space_number = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_int(stmt, 1, occupied ? 1 : 0);
    sqlite3_bind_text(stmt, 2, vehicle_type ? vehicle_type : "", -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, at);
    sqlite3_bind_text(stmt, 4, space_number, -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }

    if (sqlite3_changes(conn) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    return ok_status();
}

Status db_space_counts(DbTxn txn, u32* total, u32* occupied) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !total || !occupied) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT COUNT(*), COALESCE(SUM(is_occupied), 0) FROM spaces";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *total = static_cast<u32>(sqlite3_column_int64(stmt, 0));
        *occupied = static_cast<u32>(sqlite3_column_int64(stmt, 1));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    return map_sqlite_error(rc);
}

// ============================================================================
// Occupancy Events
// ============================================================================

Status db_occupancy_event_insert(DbTxn txn, const OccupancyEvent& ev) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO occupancy_events (space_number, event_type, vehicle_type, confidence, timestamp) "
                      "VALUES (?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, ev.space_number, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(ev.type));
    sqlite3_bind_text(stmt, 3, ev.vehicle_type, -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, static_cast<double>(ev.confidence));
    sqlite3_bind_int64(stmt, 5, ev.timestamp);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }

    return ok_status();
}

Status db_occupancy_event_list(DbTxn txn,
                               const char* space_number,
                               OccupancyEvent* out,
                               u32* count) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !out || !count) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (*count == 0) {
        return ok_status();
    }

    std::string sql = "SELECT space_number, event_type, vehicle_type, confidence, timestamp "
                      "FROM occupancy_events";
    if (space_number) {
        sql += " WHERE space_number = ?";
    }
    sql += " ORDER BY timestamp DESC, id DESC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    int param_idx = 1;
    if (space_number) {
        sqlite3_bind_text(stmt, param_idx++, space_number, -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, param_idx++, static_cast<sqlite3_int64>(*count));

    u32 found = 0;
    while (found < *count) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            OccupancyEvent& ev = out[found];
            copy_column_text(stmt, 0, ev.space_number);
            ev.type = static_cast<OccupancyEventType>(sqlite3_column_int(stmt, 1));
            copy_column_text(stmt, 2, ev.vehicle_type);
            ev.confidence = static_cast<float>(sqlite3_column_double(stmt, 3));
            ev.timestamp = sqlite3_column_int64(stmt, 4);
            ++found;
            continue;
        }
        if (rc == SQLITE_DONE) {
            break;
        }
        sqlite3_finalize(stmt);
        return map_sqlite_error(rc);
    }

    sqlite3_finalize(stmt);
    *count = found;
    return ok_status();
}

Status db_occupancy_event_counts(DbTxn txn, Timestamp since, u32* entries, u32* exits) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !entries || !exits) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT "
                      "COALESCE(SUM(CASE WHEN event_type = ? THEN 1 ELSE 0 END), 0), "
                      "COALESCE(SUM(CASE WHEN event_type = ? THEN 1 ELSE 0 END), 0) "
                      "FROM occupancy_events WHERE timestamp >= ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(OccupancyEventType::Entry));
    sqlite3_bind_int(stmt, 2, static_cast<int>(OccupancyEventType::Exit));
    sqlite3_bind_int64(stmt, 3, since);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *entries = static_cast<u32>(sqlite3_column_int64(stmt, 0));
        *exits = static_cast<u32>(sqlite3_column_int64(stmt, 1));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    return map_sqlite_error(rc);
}

} // namespace parq::db
