#pragma once

#include <type_traits>

#include "parq/core/errors.hpp"
#include "parq/core/types.hpp"
#include "parq/db/schema.hpp"

namespace parq::db {
    using u32 = parq::core::u32;

    struct DbConfig {
        const char* path{nullptr};   // nullptr or ":memory:" = private in-memory database
        u32 busy_timeout_ms{5000};
    };

    // Index into the process-wide connection table; 0 is never valid.
    struct DbHandle {
        u32 id{0};
    };

    enum class TxnMode : u32 {
        Read = 0,
        Write = 1,   // BEGIN IMMEDIATE: takes the write lock up front
    };

    struct DbTxn {
        u32 id{0};
        u32 seq{0};
        TxnMode mode{TxnMode::Read};
    };

    inline constexpr u32 kMaxDbHandles = 16;

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle db) noexcept {
        return db.id != 0 && db.id <= kMaxDbHandles;
    }

    [[nodiscard]] constexpr bool db_txn_valid(DbTxn txn) noexcept {
        return txn.id != 0 && txn.id <= kMaxDbHandles && txn.seq != 0;
    }

    [[nodiscard]] parq::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    parq::core::Status db_close(DbHandle db) noexcept;

    // One transaction per handle at a time. A second begin on the same handle
    // waits up to busy_timeout_ms and then fails with Busy. Commit, rollback
    // and the statements in between must run on the thread that began it.
    [[nodiscard]] parq::core::Status db_txn_begin(DbHandle db, TxnMode mode, DbTxn* out) noexcept;
    // On failure the transaction is rolled back and released.
    [[nodiscard]] parq::core::Status db_txn_commit(DbTxn txn) noexcept;
    parq::core::Status db_txn_rollback(DbTxn txn) noexcept;

    [[nodiscard]] parq::core::Status db_filename(DbHandle db, const char** out) noexcept;

    // Rolls back on scope exit unless commit() succeeded.
    class TxnGuard {
    public:
        TxnGuard() = default;
        ~TxnGuard();

        TxnGuard(const TxnGuard&) = delete;
        TxnGuard& operator=(const TxnGuard&) = delete;

        [[nodiscard]] parq::core::Status begin(DbHandle db, TxnMode mode) noexcept;
        [[nodiscard]] parq::core::Status commit() noexcept;
        void rollback() noexcept;

        [[nodiscard]] DbTxn txn() const noexcept { return txn_; }
        [[nodiscard]] bool active() const noexcept { return db_txn_valid(txn_); }

    private:
        DbTxn txn_{};
    };

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_trivially_copyable_v<DbTxn>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbTxn>);

} // namespace parq::db
