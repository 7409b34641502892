#pragma once

#include <type_traits>

#include "parq/cli/options.hpp"
#include "parq/core/errors.hpp"

namespace parq::cli {
    using u32 = parq::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Init = 2,
        Status = 3,
        Space = 4,
        Spaces = 5,
        Available = 6,
        Quote = 7,
        Book = 8,
        Get = 9,
        List = 10,
        Cancel = 11,
        Pay = 12,
        Payment = 13,
        Complete = 14,
        Fail = 15,
        Refund = 16,
        Occupy = 17,
        Events = 18,
        Exit = 19,
        Payments = 20,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs by exact name; the invocation's args are
    // the remaining tokens.
    [[nodiscard]] parq::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace parq::cli
