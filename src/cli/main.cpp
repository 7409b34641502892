#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "parq/booking/availability.hpp"
#include "parq/booking/booking.hpp"
#include "parq/booking/pricing.hpp"
#include "parq/catalog/catalog.hpp"
#include "parq/cli/commands.hpp"
#include "parq/cli/options.hpp"
#include "parq/core/config.hpp"
#include "parq/core/errors.hpp"
#include "parq/core/log.hpp"
#include "parq/core/time.hpp"
#include "parq/engine/engine.hpp"
#include "parq/payment/payment.hpp"

using parq::core::i64;
using parq::core::Status;
using parq::core::u32;
using parq::engine::Engine;

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Option Table
// ========================================================================

const parq::cli::OptionSpec g_options[] = {
    {parq::cli::OptionId::Space, parq::cli::OptionType::String, "space", 's'},
    {parq::cli::OptionId::Start, parq::cli::OptionType::Time, "start", 'b'},
    {parq::cli::OptionId::End, parq::cli::OptionType::Time, "end", 'e'},
    {parq::cli::OptionId::Name, parq::cli::OptionType::String, "name", 'n'},
    {parq::cli::OptionId::Email, parq::cli::OptionType::String, "email", 'm'},
    {parq::cli::OptionId::Phone, parq::cli::OptionType::String, "phone", 'p'},
    {parq::cli::OptionId::Vehicle, parq::cli::OptionType::String, "vehicle", 'v'},
    {parq::cli::OptionId::VehicleType, parq::cli::OptionType::String, "type", 't'},
    {parq::cli::OptionId::Notes, parq::cli::OptionType::String, "notes", '\0'},
    {parq::cli::OptionId::Method, parq::cli::OptionType::String, "method", '\0'},
    {parq::cli::OptionId::Status, parq::cli::OptionType::String, "status", '\0'},
    {parq::cli::OptionId::From, parq::cli::OptionType::Time, "from", 'f'},
    {parq::cli::OptionId::Limit, parq::cli::OptionType::I64, "limit", 'l'},
    {parq::cli::OptionId::Offset, parq::cli::OptionType::I64, "offset", '\0'},
    {parq::cli::OptionId::Db, parq::cli::OptionType::String, "db", '\0'},
    {parq::cli::OptionId::Occupied, parq::cli::OptionType::Flag, "occupied", '\0'},
    {parq::cli::OptionId::Free, parq::cli::OptionType::Flag, "free", '\0'},
    {parq::cli::OptionId::Confidence, parq::cli::OptionType::F64, "confidence", '\0'},
    {parq::cli::OptionId::Rows, parq::cli::OptionType::I64, "rows", '\0'},
    {parq::cli::OptionId::Columns, parq::cli::OptionType::I64, "columns", '\0'},
    {parq::cli::OptionId::Rate, parq::cli::OptionType::Money, "rate", '\0'},
    {parq::cli::OptionId::GatewayTxn, parq::cli::OptionType::String, "gateway-txn", '\0'},
    {parq::cli::OptionId::Help, parq::cli::OptionType::Flag, "help", 'h'},
};
const u32 g_option_count = sizeof(g_options) / sizeof(g_options[0]);

const parq::cli::CommandSpec g_commands[] = {
    {parq::cli::CommandId::Help, "help"},
    {parq::cli::CommandId::Init, "init"},
    {parq::cli::CommandId::Status, "status"},
    {parq::cli::CommandId::Space, "space"},
    {parq::cli::CommandId::Spaces, "spaces"},
    {parq::cli::CommandId::Available, "available"},
    {parq::cli::CommandId::Quote, "quote"},
    {parq::cli::CommandId::Book, "book"},
    {parq::cli::CommandId::Get, "get"},
    {parq::cli::CommandId::List, "list"},
    {parq::cli::CommandId::Cancel, "cancel"},
    {parq::cli::CommandId::Pay, "pay"},
    {parq::cli::CommandId::Payment, "payment"},
    {parq::cli::CommandId::Payments, "payments"},
    {parq::cli::CommandId::Complete, "complete"},
    {parq::cli::CommandId::Fail, "fail"},
    {parq::cli::CommandId::Refund, "refund"},
    {parq::cli::CommandId::Occupy, "occupy"},
    {parq::cli::CommandId::Events, "events"},
    {parq::cli::CommandId::Exit, "q"},
    {parq::cli::CommandId::Exit, "quit"},
    {parq::cli::CommandId::Exit, "exit"},
};
const u32 g_command_count = sizeof(g_commands) / sizeof(g_commands[0]);

// ========================================================================
// Invocation Parsing
// ========================================================================

constexpr u32 kMaxOptions = 32;
constexpr u32 kMaxPositional = 4;

// Options and positional arguments of one command, in any order.
struct Invocation {
    parq::cli::ParsedOption storage[kMaxOptions]{};
    parq::cli::ParsedOptions opts{};
    const char* positional[kMaxPositional]{};
    u32 positional_count{0};
};

Status usage_error() {
    return parq::core::make_status(parq::core::StatusDomain::Cli, parq::core::StatusCode::Invalid);
}

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

Status parse_invocation(parq::cli::CliArgs args, Invocation* out) {
    out->opts = parq::cli::ParsedOptions{out->storage, 0, kMaxOptions};
    out->positional_count = 0;

    u32 i = 0;
    bool options_done = false;
    while (i < args.argc) {
        if (!options_done) {
            parq::cli::ParsedOptions chunk{out->storage + out->opts.len, 0, kMaxOptions - out->opts.len};
            u32 consumed = 0;
            const parq::cli::CliArgs rest{args.argv + i, args.argc - i};
            const Status s = parq::cli::parse_options(rest, g_options, g_option_count, &chunk, &consumed);
            if (!parq::core::is_ok(s)) {
                return s;
            }
            out->opts.len += chunk.len;
            i += consumed;
            if (consumed > 0 && std::strcmp(args.argv[i - 1], "--") == 0) {
                options_done = true;
            }
            if (i >= args.argc) {
                break;
            }
        }
        if (out->positional_count >= kMaxPositional) {
            return usage_error();
        }
        out->positional[out->positional_count++] = args.argv[i++];
    }
    return parq::core::ok_status();
}

const char* opt_str(const Invocation& inv, parq::cli::OptionId id) {
    const parq::cli::ParsedOption* o = parq::cli::find_option(inv.opts, id);
    return o != nullptr ? o->value.str : nullptr;
}

bool opt_i64(const Invocation& inv, parq::cli::OptionId id, i64* out) {
    const parq::cli::ParsedOption* o = parq::cli::find_option(inv.opts, id);
    if (o == nullptr) {
        return false;
    }
    *out = o->value.i64v;
    return true;
}

bool opt_flag(const Invocation& inv, parq::cli::OptionId id) {
    return parq::cli::find_option(inv.opts, id) != nullptr;
}

// The one positional argument a command takes, or --space for space ids.
const char* subject(const Invocation& inv, parq::cli::OptionId fallback) {
    if (inv.positional_count > 0) {
        return inv.positional[0];
    }
    return fallback == parq::cli::OptionId::None ? nullptr : opt_str(inv, fallback);
}

Status require_interval(const Invocation& inv, const char* cmd, parq::core::Interval* out) {
    if (!opt_i64(inv, parq::cli::OptionId::Start, &out->start) ||
        !opt_i64(inv, parq::cli::OptionId::End, &out->end)) {
        fprintf(stderr, "error: %s: --start and --end are required\n", cmd);
        return usage_error();
    }
    return parq::core::ok_status();
}

// ========================================================================
// Output
// ========================================================================

void format_money(parq::core::Money m, char* out, size_t out_size) {
    if (!parq::core::money_format(m, out, out_size)) {
        snprintf(out, out_size, "?");
    }
}

void format_time(parq::core::Timestamp t, char* out, size_t out_size) {
    if (t == 0) {
        snprintf(out, out_size, "-");
    } else if (!parq::core::time_format_iso(t, out, out_size)) {
        snprintf(out, out_size, "%lld", static_cast<long long>(t));
    }
}

void print_space(const parq::core::Space& sp, const char* currency) {
    char rate[32];
    format_money(sp.hourly_rate, rate, sizeof(rate));
    printf("%-6s row=%d col=%d rate=%s %s/h %s",
           sp.space_number, sp.row, sp.column, rate, currency,
           sp.is_occupied ? "occupied" : "free");
    if (sp.is_occupied && sp.vehicle_type[0] != '\0') {
        printf(" (%s)", sp.vehicle_type);
    }
    printf("\n");
}

void print_booking(const parq::core::Booking& b, const char* currency) {
    char amount[32];
    char start[32];
    char end[32];
    char created[32];
    format_money(b.total_amount, amount, sizeof(amount));
    format_time(b.interval.start, start, sizeof(start));
    format_time(b.interval.end, end, sizeof(end));
    format_time(b.created_at, created, sizeof(created));

    printf("booking   %s\n", b.booking_reference);
    printf("  space     %s\n", b.space_number);
    printf("  period    %s .. %s\n", start, end);
    printf("  customer  %s <%s>", b.customer.name, b.customer.email);
    if (b.customer.phone[0] != '\0') {
        printf(" %s", b.customer.phone);
    }
    printf("\n");
    printf("  vehicle   %s (%s)\n", b.customer.vehicle_number, b.customer.vehicle_type);
    printf("  amount    %s %s\n", amount, currency);
    printf("  status    %s, payment %s\n",
           parq::core::booking_status_name(b.status),
           parq::core::payment_status_name(b.payment_status));
    if (b.payment_id[0] != '\0') {
        printf("  payment   %s\n", b.payment_id);
    }
    if (b.notes[0] != '\0') {
        printf("  notes     %s\n", b.notes);
    }
    printf("  created   %s\n", created);
}

void print_booking_row(const parq::core::Booking& b) {
    char start[32];
    char end[32];
    char amount[32];
    format_time(b.interval.start, start, sizeof(start));
    format_time(b.interval.end, end, sizeof(end));
    format_money(b.total_amount, amount, sizeof(amount));
    printf("%s  %-6s %s .. %s  %10s  %-9s %s\n",
           b.booking_reference, b.space_number, start, end, amount,
           parq::core::booking_status_name(b.status),
           parq::core::payment_status_name(b.payment_status));
}

void print_payment(const parq::core::Payment& p) {
    char amount[32];
    char paid_at[32];
    char completed[32];
    format_money(p.amount, amount, sizeof(amount));
    format_time(p.payment_time, paid_at, sizeof(paid_at));
    format_time(p.completed_at, completed, sizeof(completed));

    printf("payment   %s\n", p.payment_reference);
    printf("  booking   %s\n", p.booking_reference[0] != '\0' ? p.booking_reference : "-");
    printf("  amount    %s %s\n", amount, p.currency);
    printf("  method    %s via %s\n", p.payment_method, p.payment_gateway);
    printf("  status    %s\n", parq::core::payment_state_name(p.status));
    if (p.gateway_transaction_id[0] != '\0') {
        printf("  gateway   %s\n", p.gateway_transaction_id);
    }
    printf("  started   %s\n", paid_at);
    printf("  completed %s\n", completed);
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Commands:\n");
    printf("  init [--rows N] [--columns N] [--rate 5.00]   Create the lot's spaces\n");
    printf("  status [--from T]                           Occupancy, entries/exits since T (default today)\n");
    printf("  space <P001>                                Show one space\n");
    printf("  spaces                                      List all spaces\n");
    printf("  available --start T --end T                 Spaces free for a period\n");
    printf("  quote <P001> --start T --end T              Price a period\n");
    printf("  book <P001> --start T --end T --name N --email E --vehicle V\n");
    printf("              [--phone P] [--type car] [--notes ...]\n");
    printf("  get <BK...>                                 Show a booking\n");
    printf("  list [--status S] [--from T] [--space P] [--limit N] [--offset N]\n");
    printf("  cancel <BK...>                              Cancel a booking\n");
    printf("  pay <BK...> [--method card]                 Pay for a booking\n");
    printf("  payment <PAY...>                            Show a payment\n");
    printf("  payments <BK...>                            Payment attempts for a booking\n");
    printf("  complete <PAY...> [--gateway-txn ID]        Gateway reported success\n");
    printf("  fail <PAY...>                               Gateway reported failure\n");
    printf("  refund <PAY...>                             Refund a completed payment\n");
    printf("  occupy <P001> --occupied|--free [--type car] [--confidence 0.9]\n");
    printf("  events [--space P] [--limit N]              Occupancy history\n");
    printf("  help                                        Show this help\n");
    printf("  q, quit, exit                               Exit REPL\n");
    printf("\n");
    printf("Times: YYYY-mm-ddTHH:MM[:SS] (UTC) or Unix seconds.\n");
}

Status handle_init(const Engine& engine, const Invocation& inv) {
    parq::core::LotLayout layout = engine.config.lot;
    i64 v = 0;
    if (opt_i64(inv, parq::cli::OptionId::Rows, &v)) {
        layout.rows = (v > 0 && v <= 1000) ? static_cast<u32>(v) : 0;
    }
    if (opt_i64(inv, parq::cli::OptionId::Columns, &v)) {
        layout.columns = (v > 0 && v <= 1000) ? static_cast<u32>(v) : 0;
    }
    opt_i64(inv, parq::cli::OptionId::Rate, &layout.hourly_rate);

    u32 created = 0;
    const Status s = parq::catalog::lot_initialize(engine, layout, &created);
    if (parq::core::is_ok(s)) {
        printf("created %u spaces (%u x %u)\n", created, layout.rows, layout.columns);
    }
    return s;
}

Status handle_status(const Engine& engine, const Invocation& inv) {
    parq::core::Timestamp since = 0;
    if (!opt_i64(inv, parq::cli::OptionId::From, &since)) {
        since = parq::core::day_start(parq::core::clock_now(engine.config.clock));
    }

    parq::core::LotSummary sum{};
    const Status s = parq::catalog::lot_summary(engine, since, &sum);
    if (parq::core::is_ok(s)) {
        char from[32];
        format_time(sum.since, from, sizeof(from));
        printf("total=%u occupied=%u available=%u occupancy=%.1f%%\n",
               sum.status.total, sum.status.occupied, sum.status.available, sum.status.occupancy_rate);
        printf("since %s: entries=%u exits=%u\n", from, sum.entries, sum.exits);
    }
    return s;
}

Status handle_space(const Engine& engine, const Invocation& inv) {
    const char* number = subject(inv, parq::cli::OptionId::Space);
    if (number == nullptr) {
        print_error("space: missing space number");
        return usage_error();
    }
    parq::core::Space sp{};
    const Status s = parq::catalog::space_get(engine, number, &sp);
    if (parq::core::is_ok(s)) {
        print_space(sp, engine.config.payment.currency);
    }
    return s;
}

Status handle_spaces(const Engine& engine) {
    std::vector<parq::core::Space> spaces;
    const Status s = parq::catalog::space_list(engine, &spaces);
    if (parq::core::is_ok(s)) {
        for (const parq::core::Space& sp : spaces) {
            print_space(sp, engine.config.payment.currency);
        }
    }
    return s;
}

Status handle_available(const Engine& engine, const Invocation& inv) {
    parq::core::Interval iv{};
    Status s = require_interval(inv, "available", &iv);
    if (!parq::core::is_ok(s)) {
        return s;
    }
    std::vector<parq::core::Space> spaces;
    s = parq::booking::list_available(engine, iv, &spaces);
    if (parq::core::is_ok(s)) {
        for (const parq::core::Space& sp : spaces) {
            print_space(sp, engine.config.payment.currency);
        }
        printf("%zu available\n", spaces.size());
    }
    return s;
}

Status handle_quote(const Engine& engine, const Invocation& inv) {
    const char* number = subject(inv, parq::cli::OptionId::Space);
    if (number == nullptr) {
        print_error("quote: missing space number");
        return usage_error();
    }
    parq::core::Interval iv{};
    Status s = require_interval(inv, "quote", &iv);
    if (!parq::core::is_ok(s)) {
        return s;
    }
    parq::booking::Quote q{};
    s = parq::booking::quote(engine, number, iv, &q);
    if (parq::core::is_ok(s)) {
        char rate[32];
        char amount[32];
        format_money(q.hourly_rate, rate, sizeof(rate));
        format_money(q.amount, amount, sizeof(amount));
        printf("%s for %.2f h at %s/h = %s %s\n",
               q.space_number, static_cast<double>(q.duration_seconds) / 3600.0, rate, amount, q.currency);
    }
    return s;
}

Status handle_book(const Engine& engine, const Invocation& inv) {
    parq::booking::BookingRequest req{};
    req.space_number = subject(inv, parq::cli::OptionId::Space);
    Status s = require_interval(inv, "book", &req.interval);
    if (!parq::core::is_ok(s)) {
        return s;
    }
    req.customer_name = opt_str(inv, parq::cli::OptionId::Name);
    req.customer_email = opt_str(inv, parq::cli::OptionId::Email);
    req.customer_phone = opt_str(inv, parq::cli::OptionId::Phone);
    req.vehicle_number = opt_str(inv, parq::cli::OptionId::Vehicle);
    req.vehicle_type = opt_str(inv, parq::cli::OptionId::VehicleType);
    req.notes = opt_str(inv, parq::cli::OptionId::Notes);

    parq::core::Booking b{};
    s = parq::booking::booking_create(engine, req, &b);
    if (parq::core::is_ok(s)) {
        print_booking(b, engine.config.payment.currency);
    }
    return s;
}

Status handle_get(const Engine& engine, const Invocation& inv) {
    parq::core::Booking b{};
    const Status s = parq::booking::booking_get(engine, subject(inv, parq::cli::OptionId::None), &b);
    if (parq::core::is_ok(s)) {
        print_booking(b, engine.config.payment.currency);
    }
    return s;
}

Status handle_list(const Engine& engine, const Invocation& inv) {
    parq::booking::BookingFilter filter{};
    const char* status = opt_str(inv, parq::cli::OptionId::Status);
    if (status != nullptr) {
        if (!parq::core::parse_booking_status(status, &filter.status)) {
            fprintf(stderr, "error: list: unknown status '%s'\n", status);
            return usage_error();
        }
        filter.has_status = true;
    }
    filter.has_from = opt_i64(inv, parq::cli::OptionId::From, &filter.from_start);
    filter.space_number = opt_str(inv, parq::cli::OptionId::Space);
    i64 v = 0;
    if (opt_i64(inv, parq::cli::OptionId::Limit, &v)) {
        if (v <= 0) {
            print_error("list: --limit must be positive");
            return usage_error();
        }
        filter.limit = v > 100000 ? 100000u : static_cast<u32>(v);
    }
    if (opt_i64(inv, parq::cli::OptionId::Offset, &v)) {
        if (v < 0 || v > 100000000) {
            print_error("list: --offset out of range");
            return usage_error();
        }
        filter.offset = static_cast<u32>(v);
    }

    std::vector<parq::core::Booking> bookings;
    const Status s = parq::booking::booking_list(engine, filter, &bookings);
    if (parq::core::is_ok(s)) {
        for (const parq::core::Booking& b : bookings) {
            print_booking_row(b);
        }
        printf("%zu bookings\n", bookings.size());
    }
    return s;
}

Status handle_cancel(const Engine& engine, const Invocation& inv) {
    parq::core::Booking b{};
    const Status s = parq::booking::booking_cancel(engine,
        subject(inv, parq::cli::OptionId::None),
        parq::engine::engine_now(engine),
        &b);
    if (parq::core::is_ok(s)) {
        print_booking(b, engine.config.payment.currency);
    }
    return s;
}

Status handle_pay(const Engine& engine, const Invocation& inv) {
    parq::payment::PaymentRequest req{};
    req.booking_reference = subject(inv, parq::cli::OptionId::None);
    req.payment_method = opt_str(inv, parq::cli::OptionId::Method);
    parq::core::Payment p{};
    const Status s = parq::payment::payment_process(engine, req, &p);
    if (parq::core::is_ok(s)) {
        print_payment(p);
    }
    return s;
}

Status handle_payment(const Engine& engine, const Invocation& inv, parq::cli::CommandId id) {
    const char* ref = subject(inv, parq::cli::OptionId::None);
    parq::core::Payment p{};
    Status s = parq::core::ok_status();
    switch (id) {
        case parq::cli::CommandId::Payment:
            s = parq::payment::payment_get(engine, ref, &p);
            break;
        case parq::cli::CommandId::Complete:
            s = parq::payment::payment_complete(engine, ref, opt_str(inv, parq::cli::OptionId::GatewayTxn), &p);
            break;
        case parq::cli::CommandId::Fail:
            s = parq::payment::payment_fail(engine, ref, &p);
            break;
        case parq::cli::CommandId::Refund:
            s = parq::payment::payment_refund(engine, ref, &p);
            break;
        default:
            return usage_error();
    }
    if (parq::core::is_ok(s)) {
        print_payment(p);
    }
    return s;
}

Status handle_payments(const Engine& engine, const Invocation& inv) {
    std::vector<parq::core::Payment> payments;
    const Status s = parq::payment::payment_list_for_booking(engine, subject(inv, parq::cli::OptionId::None), &payments);
    if (parq::core::is_ok(s)) {
        for (const parq::core::Payment& p : payments) {
            print_payment(p);
        }
        printf("%zu payments\n", payments.size());
    }
    return s;
}

Status handle_occupy(const Engine& engine, const Invocation& inv) {
    const bool occupied = opt_flag(inv, parq::cli::OptionId::Occupied);
    const bool vacant = opt_flag(inv, parq::cli::OptionId::Free);
    if (occupied == vacant) {
        print_error("occupy: exactly one of --occupied or --free is required");
        return usage_error();
    }

    parq::catalog::OccupancyUpdate update{};
    update.space_number = subject(inv, parq::cli::OptionId::Space);
    update.occupied = occupied;
    update.vehicle_type = opt_str(inv, parq::cli::OptionId::VehicleType);
    const parq::cli::ParsedOption* conf = parq::cli::find_option(inv.opts, parq::cli::OptionId::Confidence);
    if (conf != nullptr) {
        update.confidence = static_cast<float>(conf->value.f64v);
    }

    bool changed = false;
    const Status s = parq::catalog::set_occupancy(engine, update, &changed);
    if (parq::core::is_ok(s)) {
        printf("%s %s%s\n", update.space_number, occupied ? "occupied" : "free", changed ? "" : " (unchanged)");
    }
    return s;
}

Status handle_events(const Engine& engine, const Invocation& inv) {
    i64 limit = 20;
    if (opt_i64(inv, parq::cli::OptionId::Limit, &limit) && (limit <= 0 || limit > 1000)) {
        print_error("events: --limit must be in 1..1000");
        return usage_error();
    }
    std::vector<parq::core::OccupancyEvent> events(static_cast<size_t>(limit));
    u32 count = static_cast<u32>(limit);
    const Status s = parq::catalog::occupancy_events(engine,
        subject(inv, parq::cli::OptionId::Space),
        events.data(),
        &count);
    if (parq::core::is_ok(s)) {
        for (u32 i = 0; i < count; ++i) {
            const parq::core::OccupancyEvent& ev = events[i];
            char at[32];
            format_time(ev.timestamp, at, sizeof(at));
            printf("%s  %-6s %-5s %s conf=%.2f\n",
                   at, ev.space_number, parq::core::occupancy_event_name(ev.type),
                   ev.vehicle_type[0] != '\0' ? ev.vehicle_type : "-", static_cast<double>(ev.confidence));
        }
    }
    return s;
}

// Runs one tokenized command line. Usage errors are printed by the handlers;
// everything else is reported here.
Status dispatch(const Engine& engine, parq::cli::CliArgs args) {
    parq::cli::CommandInvocation cmd{};
    u32 consumed = 0;
    Status s = parq::cli::parse_command(args, g_commands, g_command_count, &cmd, &consumed);
    if (!parq::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try 'help')\n", args.argv[0]);
        return s;
    }

    Invocation inv{};
    s = parse_invocation(cmd.args, &inv);
    if (!parq::core::is_ok(s)) {
        fprintf(stderr, "error: %s: bad or unknown option (try 'help')\n", args.argv[0]);
        return s;
    }
    if (opt_flag(inv, parq::cli::OptionId::Help)) {
        handle_help();
        return parq::core::ok_status();
    }

    switch (cmd.id) {
        case parq::cli::CommandId::Help: handle_help(); break;
        case parq::cli::CommandId::Init: s = handle_init(engine, inv); break;
        case parq::cli::CommandId::Status: s = handle_status(engine, inv); break;
        case parq::cli::CommandId::Space: s = handle_space(engine, inv); break;
        case parq::cli::CommandId::Spaces: s = handle_spaces(engine); break;
        case parq::cli::CommandId::Available: s = handle_available(engine, inv); break;
        case parq::cli::CommandId::Quote: s = handle_quote(engine, inv); break;
        case parq::cli::CommandId::Book: s = handle_book(engine, inv); break;
        case parq::cli::CommandId::Get: s = handle_get(engine, inv); break;
        case parq::cli::CommandId::List: s = handle_list(engine, inv); break;
        case parq::cli::CommandId::Cancel: s = handle_cancel(engine, inv); break;
        case parq::cli::CommandId::Pay: s = handle_pay(engine, inv); break;
        case parq::cli::CommandId::Payment:
        case parq::cli::CommandId::Complete:
        case parq::cli::CommandId::Fail:
        case parq::cli::CommandId::Refund:
            s = handle_payment(engine, inv, cmd.id);
            break;
        case parq::cli::CommandId::Payments: s = handle_payments(engine, inv); break;
        case parq::cli::CommandId::Occupy: s = handle_occupy(engine, inv); break;
        case parq::cli::CommandId::Events: s = handle_events(engine, inv); break;
        case parq::cli::CommandId::Exit: g_running = 0; break;
        case parq::cli::CommandId::None: return usage_error();
    }

    if (!parq::core::is_ok(s) && s.domain != parq::core::StatusDomain::Cli) {
        parq::core::log_status(args.argv[0], s);
        if (parq::core::status_retryable(s)) {
            fprintf(stderr, "hint: the store was busy; retrying may succeed\n");
        }
    }
    return s;
}

// ========================================================================
// Line Parsing
// ========================================================================

// Whitespace-separated tokens; double quotes group words ("Jane Doe").
void parse_line(const char* line, std::vector<std::string>* out) {
    out->clear();
    const char* p = line;
    while (*p != '\0') {
        while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r') {
            ++p;
        }
        if (*p == '\0') {
            break;
        }
        std::string tok;
        bool quoted = false;
        while (*p != '\0' && (quoted || (*p != ' ' && *p != '\t' && *p != '\n' && *p != '\r'))) {
            if (*p == '"') {
                quoted = !quoted;
            } else {
                tok.push_back(*p);
            }
            ++p;
        }
        out->push_back(std::move(tok));
    }
}

// ========================================================================
// Main
// ========================================================================

std::string default_db_path() {
    const char* home = std::getenv("HOME");
    const std::filesystem::path root = (home != nullptr && *home != '\0')
        ? std::filesystem::path(home) / ".parq"
        : std::filesystem::path("/tmp/parq");
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        parq::core::log_warn("cannot create %s: %s", root.c_str(), ec.message().c_str());
    }
    return (root / "parq.db").string();
}

int run_repl(const Engine& engine) {
    printf("parq reservation engine - interactive mode\n");
    printf("db_path=%s\n", engine.config.db_path);
    printf("Type 'help' for commands, 'q' to quit\n\n");

    std::vector<std::string> tokens;
    std::vector<const char*> argv;
    while (g_running) {
        printf("parq> ");
        fflush(stdout);

        char line[1024];
        if (!fgets(line, sizeof(line), stdin)) {
            break;  // EOF (Ctrl-D)
        }
        parse_line(line, &tokens);
        if (tokens.empty()) {
            continue;
        }

        argv.clear();
        for (const std::string& t : tokens) {
            argv.push_back(t.c_str());
        }
        (void)dispatch(engine, parq::cli::CliArgs{argv.data(), static_cast<u32>(argv.size())});
    }
    printf("Goodbye!\n");
    return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    parq::core::EngineConfig cfg{};
    Status s = parq::core::config_from_env(&cfg);
    if (!parq::core::is_ok(s)) {
        parq::core::log_status("configuration", s);
        return EXIT_FAILURE;
    }

    // Leading global options: parqctl [--db PATH] [command ...]
    parq::cli::ParsedOption global_storage[4]{};
    parq::cli::ParsedOptions global{global_storage, 0, 4};
    const parq::cli::OptionSpec global_specs[] = {
        {parq::cli::OptionId::Db, parq::cli::OptionType::String, "db", 'd'},
        {parq::cli::OptionId::Help, parq::cli::OptionType::Flag, "help", 'h'},
    };
    u32 consumed = 0;
    const parq::cli::CliArgs all{argv + 1, static_cast<u32>(argc > 0 ? argc - 1 : 0)};
    s = parq::cli::parse_options(all, global_specs, 2, &global, &consumed);
    if (!parq::core::is_ok(s)) {
        print_error("usage: parqctl [--db PATH] [command [args...]]");
        return EXIT_FAILURE;
    }
    if (parq::cli::find_option(global, parq::cli::OptionId::Help) != nullptr) {
        printf("usage: parqctl [--db PATH] [command [args...]]\n\n");
        handle_help();
        return EXIT_SUCCESS;
    }

    std::string db_path;
    const parq::cli::ParsedOption* db_opt = parq::cli::find_option(global, parq::cli::OptionId::Db);
    if (db_opt != nullptr) {
        db_path = db_opt->value.str;
    } else if (cfg.db_path != nullptr) {
        db_path = cfg.db_path;
    } else {
        db_path = default_db_path();
    }
    cfg.db_path = db_path.c_str();

    Engine engine{};
    s = parq::engine::engine_open(cfg, &engine);
    if (!parq::core::is_ok(s)) {
        parq::core::log_status("engine open", s);
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    const parq::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (rest.argc == 0) {
        rc = run_repl(engine);
    } else {
        s = dispatch(engine, rest);
        rc = parq::core::is_ok(s) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    s = parq::engine::engine_close(&engine);
    if (!parq::core::is_ok(s)) {
        parq::core::log_status("engine close", s);
        rc = EXIT_FAILURE;
    }
    return rc;
}
