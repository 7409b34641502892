#include "parq/cli/commands.hpp"

#include <cstring>

namespace parq::cli {
    using namespace parq::core;

    namespace {
        [[nodiscard]] Status cli_invalid() noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
    } // namespace

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        const char* name = args.argv[0];
        if (name[0] == '-') {
            return cli_invalid();
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                out->id = specs[i].id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return ok_status();
            }
        }
        return make_status(StatusDomain::Cli, StatusCode::NotFound);
    }
} // namespace parq::cli
