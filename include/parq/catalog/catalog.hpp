#pragma once

#include <cstddef>
#include <type_traits>
#include <vector>

#include "parq/core/config.hpp"
#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/engine/engine.hpp"

// Resource registry: the fixed set of parking spaces and their physical
// occupancy flags. Failures for unknown spaces are NotFound in
// StatusDomain::Catalog.
namespace parq::catalog {
    using u32 = parq::core::u32;

    // Reading from the detection feed.
    struct OccupancyUpdate {
        const char* space_number{nullptr};
        bool occupied{false};
        parq::core::Timestamp at{0};       // 0 = engine clock
        const char* vehicle_type{nullptr}; // optional
        float confidence{1.0f};
    };

    // "P001" for index 1. Returns false if out is too small.
    bool format_space_number(u32 index, char* out, std::size_t out_size) noexcept;

    // Creates rows x columns spaces named P001.. in row-major order (row and
    // column are 0-based). Fails with Conflict if the lot already has spaces.
    [[nodiscard]] parq::core::Status lot_initialize(const parq::engine::Engine& engine,
        const parq::core::LotLayout& layout,
        u32* created) noexcept;

    [[nodiscard]] parq::core::Status space_get(const parq::engine::Engine& engine,
        const char* space_number,
        parq::core::Space* out) noexcept;

    // Ordered by space_number.
    [[nodiscard]] parq::core::Status space_list(const parq::engine::Engine& engine,
        std::vector<parq::core::Space>* out) noexcept;

    // Updates the flag and last_updated. An entry/exit event is recorded only
    // when the flag actually flips; *changed reports whether it did.
    [[nodiscard]] parq::core::Status set_occupancy(const parq::engine::Engine& engine,
        const OccupancyUpdate& update,
        bool* changed) noexcept;

    [[nodiscard]] parq::core::Status lot_status(const parq::engine::Engine& engine,
        parq::core::LotStatus* out) noexcept;

    // lot_status plus the entry and exit events recorded at or after since,
    // read in one transaction.
    [[nodiscard]] parq::core::Status lot_summary(const parq::engine::Engine& engine,
        parq::core::Timestamp since,
        parq::core::LotSummary* out) noexcept;

    // Most recent first. space_number may be nullptr for the whole lot.
    // *count: in = capacity of out, out = events written.
    [[nodiscard]] parq::core::Status occupancy_events(const parq::engine::Engine& engine,
        const char* space_number,
        parq::core::OccupancyEvent* out,
        u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<OccupancyUpdate>);

} // namespace parq::catalog
