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
    constexpr const char* kBookingColumns =
        "booking_reference, space_number, customer_name, customer_email, customer_phone, "
        "vehicle_number, vehicle_type, start_time, end_time, total_amount, status, "
        "payment_status, payment_id, notes, created_at, updated_at";

    // Confirmed/active always block; pending only while created after the bound parameter.
    constexpr const char* kBlockingClause =
        "(status IN (1, 2) OR (status = 0 AND created_at > ?))";

    void read_booking(sqlite3_stmt* stmt, Booking* out) noexcept {
        copy_column_text(stmt, 0, out->booking_reference);
        copy_column_text(stmt, 1, out->space_number);
        copy_column_text(stmt, 2, out->customer.name);
        copy_column_text(stmt, 3, out->customer.email);
        copy_column_text(stmt, 4, out->customer.phone);
        copy_column_text(stmt, 5, out->customer.vehicle_number);
        copy_column_text(stmt, 6, out->customer.vehicle_type);
        out->interval.start = sqlite3_column_int64(stmt, 7);
        out->interval.end = sqlite3_column_int64(stmt, 8);
        out->total_amount = sqlite3_column_int64(stmt, 9);
        out->status = static_cast<BookingStatus>(sqlite3_column_int(stmt, 10));
        out->payment_status = static_cast<PaymentStatus>(sqlite3_column_int(stmt, 11));
        copy_column_text(stmt, 12, out->payment_id);
        copy_column_text(stmt, 13, out->notes);
        out->created_at = sqlite3_column_int64(stmt, 14);
        out->updated_at = sqlite3_column_int64(stmt, 15);
    }

    // Appends the SQL condition selecting rows whose effective status is s.
    // Returns how many `now` parameters the condition binds.
    int append_effective_status(std::string& sql, BookingStatus s) noexcept {
        switch (s) {
            case BookingStatus::Pending:
                sql += " AND status = 0";
                return 0;
            case BookingStatus::Cancelled:
                sql += " AND status = 4";
                return 0;
            case BookingStatus::Confirmed:
                sql += " AND status = 1 AND start_time > ?";
                return 1;
            case BookingStatus::Active:
                sql += " AND status IN (1, 2) AND start_time <= ? AND end_time > ?";
                return 2;
            case BookingStatus::Completed:
                sql += " AND (status = 3 OR (status IN (1, 2) AND end_time <= ?))";
                return 1;
        }
        return 0;
    }
}

// ============================================================================
// Booking Operations
// ============================================================================

Status db_booking_insert(DbTxn txn, const Booking& b) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "INSERT INTO bookings (";
    sql += kBookingColumns;
    sql += ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, b.booking_reference, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, b.space_number, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, b.customer.name, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, b.customer.email, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, b.customer.phone, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, b.customer.vehicle_number, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, b.customer.vehicle_type, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 8, b.interval.start);
    sqlite3_bind_int64(stmt, 9, b.interval.end);
    sqlite3_bind_int64(stmt, 10, b.total_amount);
    sqlite3_bind_int(stmt, 11, static_cast<int>(b.status));
    sqlite3_bind_int(stmt, 12, static_cast<int>(b.payment_status));
    sqlite3_bind_text(stmt, 13, b.payment_id, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 14, b.notes, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 15, b.created_at);
    sqlite3_bind_int64(stmt, 16, b.updated_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }

    return ok_status();
}

Status db_booking_get(DbTxn txn, const char* reference, Booking* out) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !reference || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += kBookingColumns;
    sql += " FROM bookings WHERE booking_reference = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, reference, -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_booking(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_booking_update(DbTxn txn, const Booking& b) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "UPDATE bookings SET status = ?, payment_status = ?, payment_id = ?, "
                      "notes = ?, updated_at = ? WHERE booking_reference = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(b.status));
    sqlite3_bind_int(stmt, 2, static_cast<int>(b.payment_status));
    sqlite3_bind_text(stmt, 3, b.payment_id, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, b.notes, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, b.updated_at);
    sqlite3_bind_text(stmt, 6, b.booking_reference, -1, SQLITE_TRANSIENT);

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

Status db_booking_find_overlap(DbTxn txn, const OverlapQuery& q, bool* found) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !q.space_number || !found) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT 1 FROM bookings WHERE space_number = ? AND start_time < ? AND end_time > ? AND ";
    sql += kBlockingClause;
    if (q.exclude_reference) {
        sql += " AND booking_reference <> ?";
    }
    sql += " LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    int param_idx = 1;
    sqlite3_bind_text(stmt, param_idx++, q.space_number, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, param_idx++, q.interval.end);
    sqlite3_bind_int64(stmt, param_idx++, q.interval.start);
    sqlite3_bind_int64(stmt, param_idx++, q.pending_created_after);
    if (q.exclude_reference) {
        sqlite3_bind_text(stmt, param_idx++, q.exclude_reference, -1, SQLITE_TRANSIENT);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW) {
        *found = true;
        return ok_status();
    }
    if (rc == SQLITE_DONE) {
        *found = false;
        return ok_status();
    }
    return map_sqlite_error(rc);
}

Status db_booking_slots_overlapping(DbTxn txn, Interval iv, std::vector<BookingSlot>* out) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT space_number, start_time, end_time, status, created_at FROM bookings "
                      "WHERE start_time < ? AND end_time > ? AND status <> 4 "
                      "ORDER BY space_number, start_time";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_int64(stmt, 1, iv.end);
    sqlite3_bind_int64(stmt, 2, iv.start);

    out->clear();
    for (;;) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            BookingSlot slot{};
            copy_column_text(stmt, 0, slot.space_number);
            slot.interval.start = sqlite3_column_int64(stmt, 1);
            slot.interval.end = sqlite3_column_int64(stmt, 2);
            slot.status = static_cast<BookingStatus>(sqlite3_column_int(stmt, 3));
            slot.created_at = sqlite3_column_int64(stmt, 4);
            out->push_back(slot);
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

Status db_booking_list(DbTxn txn, const BookingListFilter& filter, Booking* out, u32* count) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !out || !count) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (*count == 0) {
        return ok_status();
    }

    std::string sql = "SELECT ";
    sql += kBookingColumns;
    sql += " FROM bookings WHERE 1 = 1";

    int now_params = 0;
    if (filter.has_status) {
        now_params = append_effective_status(sql, filter.status);
    }
    if (filter.has_from) {
        sql += " AND start_time >= ?";
    }
    if (filter.space_number) {
        sql += " AND space_number = ?";
    }
    sql += " ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    int param_idx = 1;
    for (int i = 0; i < now_params; ++i) {
        sqlite3_bind_int64(stmt, param_idx++, filter.now);
    }
    if (filter.has_from) {
        sqlite3_bind_int64(stmt, param_idx++, filter.from_start);
    }
    if (filter.space_number) {
        sqlite3_bind_text(stmt, param_idx++, filter.space_number, -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, param_idx++, static_cast<sqlite3_int64>(*count));
    sqlite3_bind_int64(stmt, param_idx++, static_cast<sqlite3_int64>(filter.offset));

    u32 found = 0;
    while (found < *count) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            read_booking(stmt, &out[found]);
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

} // namespace parq::db
