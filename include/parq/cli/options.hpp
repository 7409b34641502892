#pragma once

#include <type_traits>

#include "parq/core/errors.hpp"
#include "parq/core/types.hpp"

namespace parq::cli {
    using u8 = parq::core::u8;
    using u32 = parq::core::u32;
    using i64 = parq::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
        F64 = 3,
        Time = 4,    // ISO-8601 or Unix seconds, see core::time_parse
        Money = 5,   // "5.25", see core::money_parse
    };

    enum class OptionId : u32 {
        None = 0,
        Space = 1,
        Start = 2,
        End = 3,
        Name = 4,
        Email = 5,
        Phone = 6,
        Vehicle = 7,
        VehicleType = 8,
        Notes = 9,
        Method = 10,
        Status = 11,
        From = 12,
        Limit = 13,
        Offset = 14,
        Db = 15,
        Occupied = 16,
        Free = 17,
        Confidence = 18,
        Rows = 19,
        Columns = 20,
        Rate = 21,
        GatewayTxn = 22,
        Help = 23,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;   // I64, Time and Money
        double f64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options ("--name value", "--name=value", "-n value",
    // "-nvalue", "--" ends them). Stops at the first positional argument;
    // *consumed is the number of argv entries used. Unknown options, missing
    // or malformed values and a full `out` fail with Invalid (Cli domain).
    [[nodiscard]] parq::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins, so a repeated option overrides an earlier one.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace parq::cli
