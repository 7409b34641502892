#pragma once

#include <type_traits>

#include "parq/core/types.hpp"

namespace parq::db {
    using u32 = parq::core::u32;

    inline constexpr u32 kSchemaVersion = 1;

    enum class TableId : u32 {
        Spaces = 1,
        Bookings = 2,
        Payments = 3,
        OccupancyEvents = 4,
    };

    [[nodiscard]] constexpr const char* table_name(TableId t) noexcept {
        switch (t) {
            case TableId::Spaces: return "spaces";
            case TableId::Bookings: return "bookings";
            case TableId::Payments: return "payments";
            case TableId::OccupancyEvents: return "occupancy_events";
        }
        return nullptr;
    }

    static_assert(std::is_trivially_copyable_v<TableId>);

} // namespace parq::db
