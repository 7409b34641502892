#pragma once

#include <sqlite3.h>

#include <cstddef>

#include "parq/core/errors.hpp"
#include "parq/db/db.hpp"

namespace parq::db::detail {

    // Connection owned by txn, or nullptr if txn is stale or not open.
    [[nodiscard]] sqlite3* txn_conn(DbTxn txn) noexcept;

    [[nodiscard]] inline parq::core::Status map_sqlite_error(int rc) noexcept {
        using parq::core::StatusCode;
        using parq::core::StatusDomain;
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return parq::core::make_status(StatusDomain::Db, StatusCode::Busy, static_cast<parq::core::u32>(rc));
            case SQLITE_CONSTRAINT:
                return parq::core::make_status(StatusDomain::Db, StatusCode::Conflict, static_cast<parq::core::u32>(rc));
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_CANTOPEN:
                return parq::core::make_status(StatusDomain::Db, StatusCode::Io, static_cast<parq::core::u32>(rc));
            default:
                return parq::core::make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<parq::core::u32>(rc));
        }
    }

    inline void copy_column_text(sqlite3_stmt* stmt, int col, char* dst, std::size_t dst_size) noexcept {
        if (dst == nullptr || dst_size == 0) {
            return;
        }
        const unsigned char* txt = sqlite3_column_text(stmt, col);
        if (txt == nullptr) {
            dst[0] = '\0';
            return;
        }
        std::size_t i = 0;
        for (; i + 1 < dst_size && txt[i] != '\0'; ++i) {
            dst[i] = static_cast<char>(txt[i]);
        }
        dst[i] = '\0';
    }

    template <std::size_t N>
    void copy_column_text(sqlite3_stmt* stmt, int col, char (&dst)[N]) noexcept {
        copy_column_text(stmt, col, dst, N);
    }

    // Binds NULL for an empty string.
    inline int bind_text_or_null(sqlite3_stmt* stmt, int idx, const char* s) noexcept {
        if (s == nullptr || s[0] == '\0') {
            return sqlite3_bind_null(stmt, idx);
        }
        return sqlite3_bind_text(stmt, idx, s, -1, SQLITE_TRANSIENT);
    }

} // namespace parq::db::detail
