#pragma once

#include <type_traits>

#include "parq/core/config.hpp"
#include "parq/core/errors.hpp"
#include "parq/core/types.hpp"
#include "parq/db/db.hpp"

namespace parq::engine {

    // Explicitly scoped reservation engine: one store connection plus the
    // policy it runs under. Cheap to copy; copies share the connection and
    // are safe to use from several threads.
    struct Engine {
        parq::db::DbHandle db{};
        parq::core::EngineConfig config{};
    };

    // ========================================================================
    // Engine Lifecycle
    // ========================================================================

    // Opens (and creates, if needed) the store named by cfg.db_path.
    [[nodiscard]] parq::core::Status engine_open(const parq::core::EngineConfig& cfg, Engine* out) noexcept;

    // Closes the store connection. Fails with Busy if a transaction is still open.
    parq::core::Status engine_close(Engine* engine) noexcept;

    [[nodiscard]] parq::core::Timestamp engine_now(const Engine& engine) noexcept;

    [[nodiscard]] constexpr bool engine_valid(const Engine& engine) noexcept {
        return parq::db::db_handle_valid(engine.db);
    }

    static_assert(std::is_trivially_copyable_v<Engine>);

} // namespace parq::engine
