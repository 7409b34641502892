#include "parq/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace parq::core {
    namespace {
        std::atomic<u8> g_level{static_cast<u8>(LogLevel::Warn)};

        const char* level_prefix(LogLevel level) noexcept {
            switch (level) {
                case LogLevel::Error: return "error";
                case LogLevel::Warn: return "warn";
                case LogLevel::Info: return "info";
                case LogLevel::Debug: return "debug";
            }
            return "log";
        }

        // Formats the whole line first so concurrent writers never interleave.
        void vlog(LogLevel level, const char* fmt, va_list ap) noexcept {
            if (static_cast<u8>(level) > g_level.load(std::memory_order_relaxed)) {
                return;
            }
            char line[1024];
            int n = std::snprintf(line, sizeof(line), "%s: ", level_prefix(level));
            if (n < 0) {
                return;
            }
            const int m = std::vsnprintf(line + n, sizeof(line) - static_cast<size_t>(n), fmt, ap);
            if (m < 0) {
                return;
            }
            std::fprintf(stderr, "%s\n", line);
        }
    } // namespace

    void log_set_level(LogLevel level) noexcept {
        g_level.store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
    }

    bool log_level_parse(const char* s, LogLevel* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        if (std::strcmp(s, "error") == 0) {
            *out = LogLevel::Error;
        } else if (std::strcmp(s, "warn") == 0) {
            *out = LogLevel::Warn;
        } else if (std::strcmp(s, "info") == 0) {
            *out = LogLevel::Info;
        } else if (std::strcmp(s, "debug") == 0) {
            *out = LogLevel::Debug;
        } else {
            return false;
        }
        return true;
    }

    void log_error(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog(LogLevel::Error, fmt, ap);
        va_end(ap);
    }

    void log_warn(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog(LogLevel::Warn, fmt, ap);
        va_end(ap);
    }

    void log_info(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog(LogLevel::Info, fmt, ap);
        va_end(ap);
    }

    void log_debug(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog(LogLevel::Debug, fmt, ap);
        va_end(ap);
    }

    void log_status(const char* context, Status s) noexcept {
        log_error("%s failed (code=%s/%u, domain=%s/%u, aux=%u): %s",
                  context != nullptr ? context : "operation",
                  status_code_name(s.code),
                  static_cast<unsigned>(s.code),
                  status_domain_name(s.domain),
                  static_cast<unsigned>(s.domain),
                  s.aux,
                  status_reason(s));
    }

} // namespace parq::core
