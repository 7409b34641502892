#include "parq/cli/options.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>

#include "parq/core/time.hpp"

namespace parq::cli {
    using namespace parq::core;

    namespace {
        [[nodiscard]] Status cli_invalid() noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs,
            u32 spec_count,
            const char* name,
            std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const char* ln = specs[i].long_name;
                if (ln != nullptr && std::strlen(ln) == name_len && std::strncmp(ln, name, name_len) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool parse_f64(const char* s, double* out) noexcept {
            errno = 0;
            char* end = nullptr;
            const double v = std::strtod(s, &end);
            if (end == s || end == nullptr || *end != '\0' || errno != 0) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool convert_value(OptionType type, const char* value, OptionValue* out) noexcept {
            if (value == nullptr) {
                return false;
            }
            switch (type) {
                case OptionType::String:
                    out->str = value;
                    return true;
                case OptionType::I64:
                    return parse_i64(value, &out->i64v);
                case OptionType::F64:
                    return parse_f64(value, &out->f64v);
                case OptionType::Time:
                    return time_parse(value, &out->i64v);
                case OptionType::Money:
                    return money_parse(value, &out->i64v);
                case OptionType::Flag:
                    return false;
            }
            return false;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;   // inline value, if any
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return cli_invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return cli_invalid();
            }
            ++i;

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            if (spec->type == OptionType::Flag) {
                if (value != nullptr) {
                    return cli_invalid();
                }
                opt.value.boolv = 1;
            } else {
                if (value == nullptr) {
                    if (i >= args.argc || args.argv[i] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[i++];
                }
                if (!convert_value(spec->type, value, &opt.value)) {
                    return cli_invalid();
                }
            }

            const Status s = push_option(out, opt);
            if (!is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace parq::cli
