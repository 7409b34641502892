#include "parq/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

#include "parq/core/log.hpp"
#include "parq/core/text.hpp"

namespace parq::core {
    namespace {
        // aux values reported for malformed variables.
        enum class EnvVar : u32 {
            DbPath = 1,
            BusyTimeoutMs,
            Currency,
            DemoMode,
            CancelLeadSeconds,
            PendingHoldSeconds,
            HourlyRate,
            EnforceLimits,
            LotRows,
            LotColumns,
            LogLevel,
        };

        [[nodiscard]] Status env_invalid(EnvVar v) noexcept {
            return make_status(StatusDomain::Core, StatusCode::Invalid, static_cast<u32>(v));
        }

        [[nodiscard]] const char* env(const char* name) noexcept {
            const char* v = std::getenv(name);
            if (v == nullptr || v[0] == '\0') {
                return nullptr;
            }
            return v;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool parse_bool(const char* s, bool* out) noexcept {
            if (std::strcmp(s, "1") == 0 || std::strcmp(s, "true") == 0 || std::strcmp(s, "yes") == 0) {
                *out = true;
                return true;
            }
            if (std::strcmp(s, "0") == 0 || std::strcmp(s, "false") == 0 || std::strcmp(s, "no") == 0) {
                *out = false;
                return true;
            }
            return false;
        }

        [[nodiscard]] bool parse_u32(const char* s, u32 lo, u32 hi, u32* out) noexcept {
            i64 v{};
            if (!parse_i64(s, &v) || v < static_cast<i64>(lo) || v > static_cast<i64>(hi)) {
                return false;
            }
            *out = static_cast<u32>(v);
            return true;
        }
    } // namespace

    Status config_from_env(EngineConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        if (const char* v = env("PARQ_DB_PATH")) {
            cfg->db_path = v;
        }

        if (const char* v = env("PARQ_BUSY_TIMEOUT_MS")) {
            if (!parse_u32(v, 1, 600000, &cfg->busy_timeout_ms)) {
                return env_invalid(EnvVar::BusyTimeoutMs);
            }
        }

        if (const char* v = env("PARQ_CURRENCY")) {
            if (std::strlen(v) != 3 || !text_copy(cfg->payment.currency, v)) {
                return env_invalid(EnvVar::Currency);
            }
        }

        if (const char* v = env("PARQ_DEMO_MODE")) {
            if (!parse_bool(v, &cfg->payment.demo_mode)) {
                return env_invalid(EnvVar::DemoMode);
            }
        }

        if (const char* v = env("PARQ_CANCEL_LEAD_SECONDS")) {
            i64 secs{};
            if (!parse_i64(v, &secs) || secs < 0) {
                return env_invalid(EnvVar::CancelLeadSeconds);
            }
            cfg->booking.cancellation_lead_seconds = secs;
        }

        if (const char* v = env("PARQ_PENDING_HOLD_SECONDS")) {
            i64 secs{};
            if (!parse_i64(v, &secs) || secs < 0) {
                return env_invalid(EnvVar::PendingHoldSeconds);
            }
            cfg->booking.pending_hold_seconds = secs;
        }

        if (const char* v = env("PARQ_HOURLY_RATE")) {
            Money rate{};
            if (!money_parse(v, &rate) || rate <= 0) {
                return env_invalid(EnvVar::HourlyRate);
            }
            cfg->lot.hourly_rate = rate;
        }

        if (const char* v = env("PARQ_ENFORCE_LIMITS")) {
            if (!parse_bool(v, &cfg->booking.enforce_limits)) {
                return env_invalid(EnvVar::EnforceLimits);
            }
        }

        if (const char* v = env("PARQ_LOT_ROWS")) {
            if (!parse_u32(v, 1, 100, &cfg->lot.rows)) {
                return env_invalid(EnvVar::LotRows);
            }
        }

        if (const char* v = env("PARQ_LOT_COLUMNS")) {
            if (!parse_u32(v, 1, 100, &cfg->lot.columns)) {
                return env_invalid(EnvVar::LotColumns);
            }
        }

        if (const char* v = env("PARQ_LOG_LEVEL")) {
            LogLevel level{};
            if (!log_level_parse(v, &level)) {
                return env_invalid(EnvVar::LogLevel);
            }
            log_set_level(level);
        }

        return ok_status();
    }

} // namespace parq::core
