#include "parq/db/db.hpp"
#include "parq/db/queries.hpp"
#include "parq/core/log.hpp"
#include "db_internal.hpp"

#include <sqlite3.h>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <strings.h>

namespace parq::db {

using namespace parq::core;

namespace {
    struct DbSlot {
        bool used = false;
        sqlite3* conn = nullptr;
        std::timed_mutex txn_mutex;
        bool in_txn = false;
        u32 txn_seq = 0;
        std::atomic<u32> busy_timeout_ms{0};
    };

    std::mutex g_registry_mutex;
    std::array<DbSlot, kMaxDbHandles> g_slots;

    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS spaces (
            space_number TEXT PRIMARY KEY,
            row_index INTEGER NOT NULL,
            column_index INTEGER NOT NULL,
            hourly_rate INTEGER NOT NULL CHECK (hourly_rate > 0),
            is_occupied INTEGER NOT NULL DEFAULT 0,
            vehicle_type TEXT NOT NULL DEFAULT '',
            last_updated INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS bookings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            booking_reference TEXT NOT NULL UNIQUE,
            space_number TEXT NOT NULL REFERENCES spaces(space_number),
            customer_name TEXT NOT NULL,
            customer_email TEXT NOT NULL,
            customer_phone TEXT NOT NULL DEFAULT '',
            vehicle_number TEXT NOT NULL,
            vehicle_type TEXT NOT NULL DEFAULT 'car',
            start_time INTEGER NOT NULL,
            end_time INTEGER NOT NULL,
            total_amount INTEGER NOT NULL,
            status INTEGER NOT NULL DEFAULT 0,
            payment_status INTEGER NOT NULL DEFAULT 0,
            payment_id TEXT NOT NULL DEFAULT '',
            notes TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            CHECK (start_time < end_time)
        );
        CREATE INDEX IF NOT EXISTS idx_bookings_space_time ON bookings(space_number, start_time, end_time);
        CREATE INDEX IF NOT EXISTS idx_bookings_created ON bookings(created_at);

        CREATE TABLE IF NOT EXISTS payments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            payment_reference TEXT NOT NULL UNIQUE,
            booking_reference TEXT REFERENCES bookings(booking_reference),
            amount INTEGER NOT NULL,
            currency TEXT NOT NULL,
            payment_method TEXT NOT NULL,
            payment_gateway TEXT NOT NULL DEFAULT '',
            gateway_transaction_id TEXT NOT NULL DEFAULT '',
            status INTEGER NOT NULL,
            customer_email TEXT NOT NULL DEFAULT '',
            payment_time INTEGER NOT NULL,
            completed_at INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_payments_booking ON payments(booking_reference);

        CREATE TABLE IF NOT EXISTS occupancy_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            space_number TEXT NOT NULL REFERENCES spaces(space_number),
            event_type INTEGER NOT NULL,
            vehicle_type TEXT NOT NULL DEFAULT '',
            confidence REAL NOT NULL DEFAULT 1.0,
            timestamp INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_occupancy_space ON occupancy_events(space_number, timestamp);
    )SQL";

    [[nodiscard]] bool journal_mode_allowed(const char* mode) noexcept {
        static constexpr const char* kModes[] = {"WAL", "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "OFF"};
        for (const char* m : kModes) {
            if (strcasecmp(m, mode) == 0) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] DbSlot* slot_for(u32 id) noexcept {
        if (id == 0 || id > kMaxDbHandles) {
            return nullptr;
        }
        return &g_slots[id - 1];
    }

    [[nodiscard]] DbSlot* slot_for_txn(DbTxn txn) noexcept {
        if (!db_txn_valid(txn)) {
            return nullptr;
        }
        DbSlot* slot = slot_for(txn.id);
        // Only the owning thread reads these while the transaction is open.
        if (slot == nullptr || !slot->in_txn || slot->txn_seq != txn.seq || slot->conn == nullptr) {
            return nullptr;
        }
        return slot;
    }

    void end_txn(DbSlot* slot) noexcept {
        slot->in_txn = false;
        slot->txn_mutex.unlock();
    }
}

namespace detail {
    sqlite3* txn_conn(DbTxn txn) noexcept {
        DbSlot* slot = slot_for_txn(txn);
        return slot != nullptr ? slot->conn : nullptr;
    }
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);

    DbSlot* slot = nullptr;
    u32 id = 0;
    for (u32 i = 0; i < kMaxDbHandles; ++i) {
        if (!g_slots[i].used) {
            slot = &g_slots[i];
            id = i + 1;
            break;
        }
    }
    if (!slot) {
        log_error("db: all %u connection slots in use", kMaxDbHandles);
        return make_status(StatusDomain::Db, StatusCode::Busy);
    }

    std::lock_guard<std::timed_mutex> slot_lock(slot->txn_mutex);

    const char* path = (cfg.path && cfg.path[0] != '\0') ? cfg.path : ":memory:";
    sqlite3* conn = nullptr;
    int rc = sqlite3_open_v2(path, &conn,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        log_error("db: cannot open %s: %s", path, conn ? sqlite3_errmsg(conn) : sqlite3_errstr(rc));
        sqlite3_close(conn);
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }

    const u32 timeout = cfg.busy_timeout_ms > 0 ? cfg.busy_timeout_ms : 1;
    sqlite3_busy_timeout(conn, static_cast<int>(timeout));

    // WAL lets readers proceed while one writer holds the lock (configurable).
    char* err_msg = nullptr;
    const char* journal_mode = std::getenv("PARQ_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    } else if (!journal_mode_allowed(journal_mode)) {
        log_warn("db: ignoring PARQ_DB_JOURNAL_MODE=%s", journal_mode);
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    rc = sqlite3_exec(conn, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        // In-memory databases refuse WAL; keep going.
        log_debug("db: journal_mode=%s not applied: %s", journal_mode, err_msg ? err_msg : "");
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }

    sqlite3_exec(conn, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec(conn, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);

    rc = sqlite3_exec(conn, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_error("db: schema setup failed: %s", err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        sqlite3_close(conn);
        return detail::map_sqlite_error(rc);
    }

    std::string version_sql = "PRAGMA user_version=" + std::to_string(kSchemaVersion);
    sqlite3_exec(conn, version_sql.c_str(), nullptr, nullptr, nullptr);

    slot->conn = conn;
    slot->used = true;
    slot->in_txn = false;
    slot->busy_timeout_ms.store(timeout, std::memory_order_relaxed);

    log_debug("db: opened %s as handle %u", path, id);
    out->id = id;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);

    DbSlot* slot = slot_for(db.id);
    const auto wait = std::chrono::milliseconds(slot->busy_timeout_ms.load(std::memory_order_relaxed));
    if (!slot->txn_mutex.try_lock_for(wait)) {
        return make_status(StatusDomain::Db, StatusCode::Busy);
    }
    std::lock_guard<std::timed_mutex> slot_lock(slot->txn_mutex, std::adopt_lock);

    if (!slot->used) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_close(slot->conn);
    slot->conn = nullptr;
    slot->used = false;
    slot->in_txn = false;
    return ok_status();
}

Status db_filename(DbHandle db, const char** out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    DbSlot* slot = slot_for(db.id);
    std::lock_guard<std::timed_mutex> slot_lock(slot->txn_mutex);
    if (!slot->used || !slot->conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // Empty for in-memory databases.
    const char* path = sqlite3_db_filename(slot->conn, "main");
    *out = path ? path : "";
    return ok_status();
}

// ============================================================================
// Transaction Management
// ============================================================================

Status db_txn_begin(DbHandle db, TxnMode mode, DbTxn* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    DbSlot* slot = slot_for(db.id);
    const auto wait = std::chrono::milliseconds(slot->busy_timeout_ms.load(std::memory_order_relaxed));
    if (!slot->txn_mutex.try_lock_for(wait)) {
        log_debug("db: handle %u busy for %lld ms", db.id, static_cast<long long>(wait.count()));
        return make_status(StatusDomain::Db, StatusCode::Busy);
    }

    if (!slot->used || !slot->conn) {
        slot->txn_mutex.unlock();
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = mode == TxnMode::Write ? "BEGIN IMMEDIATE" : "BEGIN";
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(slot->conn, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_debug("db: %s failed: %s", sql, err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        slot->txn_mutex.unlock();
        return detail::map_sqlite_error(rc);
    }

    slot->in_txn = true;
    if (++slot->txn_seq == 0) {
        slot->txn_seq = 1;
    }

    out->id = db.id;
    out->seq = slot->txn_seq;
    out->mode = mode;
    return ok_status();
}

Status db_txn_commit(DbTxn txn) noexcept {
    DbSlot* slot = slot_for_txn(txn);
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    char* err_msg = nullptr;
    const int rc = sqlite3_exec(slot->conn, "COMMIT", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_warn("db: commit failed: %s", err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        if (!sqlite3_get_autocommit(slot->conn)) {
            sqlite3_exec(slot->conn, "ROLLBACK", nullptr, nullptr, nullptr);
        }
        end_txn(slot);
        return detail::map_sqlite_error(rc);
    }

    end_txn(slot);
    return ok_status();
}

Status db_txn_rollback(DbTxn txn) noexcept {
    DbSlot* slot = slot_for_txn(txn);
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    Status result = ok_status();
    // A failed statement may already have ended the transaction.
    if (!sqlite3_get_autocommit(slot->conn)) {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(slot->conn, "ROLLBACK", nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            log_error("db: rollback failed: %s", err_msg ? err_msg : sqlite3_errstr(rc));
            sqlite3_free(err_msg);
            result = detail::map_sqlite_error(rc);
        }
    }

    end_txn(slot);
    return result;
}

TxnGuard::~TxnGuard() {
    rollback();
}

Status TxnGuard::begin(DbHandle db, TxnMode mode) noexcept {
    if (db_txn_valid(txn_)) {
        return make_status(StatusDomain::Db, StatusCode::InvalidState);
    }
    DbTxn txn{};
    const Status s = db_txn_begin(db, mode, &txn);
    if (is_ok(s)) {
        txn_ = txn;
    }
    return s;
}

Status TxnGuard::commit() noexcept {
    const DbTxn txn = txn_;
    txn_ = DbTxn{};
    return db_txn_commit(txn);
}

void TxnGuard::rollback() noexcept {
    if (!db_txn_valid(txn_)) {
        return;
    }
    const DbTxn txn = txn_;
    txn_ = DbTxn{};
    const Status s = db_txn_rollback(txn);
    if (!is_ok(s)) {
        log_status("db rollback", s);
    }
}

// ============================================================================
// Introspection
// ============================================================================

Status db_table_count(DbTxn txn, TableId table, u64* out) noexcept {
    sqlite3* conn = detail::txn_conn(txn);
    const char* name = table_name(table);
    if (!conn || !out || !name) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT COUNT(*) FROM ";
    sql += name;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::map_sqlite_error(rc);
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    return detail::map_sqlite_error(rc);
}

} // namespace parq::db
