#include "parq/db/queries.hpp"
#include "db_internal.hpp"

#include <sqlite3.h>
#include <string>

namespace parq::db {

using namespace parq::core;
using detail::bind_text_or_null;
using detail::copy_column_text;
using detail::map_sqlite_error;
using detail::txn_conn;

namespace {
    constexpr const char* kPaymentColumns =
        "payment_reference, booking_reference, amount, currency, payment_method, payment_gateway, "
        "gateway_transaction_id, status, customer_email, payment_time, completed_at";

    void read_payment(sqlite3_stmt* stmt, Payment* out) noexcept {
        copy_column_text(stmt, 0, out->payment_reference);
        copy_column_text(stmt, 1, out->booking_reference);
        out->amount = sqlite3_column_int64(stmt, 2);
        copy_column_text(stmt, 3, out->currency);
        copy_column_text(stmt, 4, out->payment_method);
        copy_column_text(stmt, 5, out->payment_gateway);
        copy_column_text(stmt, 6, out->gateway_transaction_id);
        out->status = static_cast<PaymentState>(sqlite3_column_int(stmt, 7));
        copy_column_text(stmt, 8, out->customer_email);
        out->payment_time = sqlite3_column_int64(stmt, 9);
        out->completed_at = sqlite3_column_int64(stmt, 10);
    }
}

// ============================================================================
// Payment Operations
// ============================================================================

Status db_payment_insert(DbTxn txn, const Payment& p) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "INSERT INTO payments (";
    sql += kPaymentColumns;
    sql += ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, p.payment_reference, -1, SQLITE_TRANSIENT);
    bind_text_or_null(stmt, 2, p.booking_reference);
    sqlite3_bind_int64(stmt, 3, p.amount);
    sqlite3_bind_text(stmt, 4, p.currency, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, p.payment_method, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, p.payment_gateway, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, p.gateway_transaction_id, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 8, static_cast<int>(p.status));
    sqlite3_bind_text(stmt, 9, p.customer_email, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 10, p.payment_time);
    sqlite3_bind_int64(stmt, 11, p.completed_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }

    return ok_status();
}

Status db_payment_get(DbTxn txn, const char* reference, Payment* out) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !reference || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += kPaymentColumns;
    sql += " FROM payments WHERE payment_reference = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, reference, -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_payment(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return map_sqlite_error(rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_payment_update(DbTxn txn, const Payment& p) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "UPDATE payments SET status = ?, gateway_transaction_id = ?, completed_at = ? "
                      "WHERE payment_reference = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(p.status));
    sqlite3_bind_text(stmt, 2, p.gateway_transaction_id, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, p.completed_at);
    sqlite3_bind_text(stmt, 4, p.payment_reference, -1, SQLITE_TRANSIENT);

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

Status db_payment_count_for_booking(DbTxn txn,
                                    const char* booking_reference,
                                    PaymentState state,
                                    u32* out) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !booking_reference || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT COUNT(*) FROM payments WHERE booking_reference = ? AND status = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, booking_reference, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(state));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u32>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    return map_sqlite_error(rc);
}

Status db_payment_list_for_booking(DbTxn txn,
                                   const char* booking_reference,
                                   Payment* out,
                                   u32* count) noexcept {
    sqlite3* conn = txn_conn(txn);
    if (!conn || !booking_reference || !out || !count) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (*count == 0) {
        return ok_status();
    }

    std::string sql = "SELECT ";
    sql += kPaymentColumns;
    sql += " FROM payments WHERE booking_reference = ? ORDER BY id LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return map_sqlite_error(rc);
    }

    sqlite3_bind_text(stmt, 1, booking_reference, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(*count));

    u32 found = 0;
    while (found < *count) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            read_payment(stmt, &out[found]);
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
