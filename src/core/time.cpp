#include "parq/core/time.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace parq::core {
    namespace {
        [[nodiscard]] bool to_tm(Timestamp t, std::tm* out) noexcept {
            const std::time_t tt = static_cast<std::time_t>(t);
            return gmtime_r(&tt, out) != nullptr;
        }

        // Reads exactly `digits` decimal digits.
        [[nodiscard]] bool read_fixed(const char*& p, int digits, int* out) noexcept {
            int v = 0;
            for (int i = 0; i < digits; ++i) {
                if (p[i] < '0' || p[i] > '9') {
                    return false;
                }
                v = v * 10 + (p[i] - '0');
            }
            p += digits;
            *out = v;
            return true;
        }

        [[nodiscard]] bool expect(const char*& p, char c) noexcept {
            if (*p != c) {
                return false;
            }
            ++p;
            return true;
        }

        [[nodiscard]] bool parse_unix_seconds(const char* s, Timestamp* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }
    } // namespace

    Timestamp system_now() noexcept {
        using namespace std::chrono;
        return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    }

    Timestamp clock_now(const Clock& clock) noexcept {
        if (clock.now == nullptr) {
            return system_now();
        }
        return clock.now(clock.ctx);
    }

    bool time_format_iso(Timestamp t, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        std::tm tm{};
        if (!to_tm(t, &tm)) {
            out[0] = '\0';
            return false;
        }
        return std::strftime(out, out_size, "%Y-%m-%dT%H:%M:%SZ", &tm) != 0;
    }

    bool time_format_compact(Timestamp t, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        std::tm tm{};
        if (!to_tm(t, &tm)) {
            out[0] = '\0';
            return false;
        }
        return std::strftime(out, out_size, "%Y%m%d%H%M%S", &tm) != 0;
    }

    bool time_parse(const char* s, Timestamp* out) noexcept {
        if (s == nullptr || out == nullptr || *s == '\0') {
            return false;
        }
        if (std::strchr(s, '-') == nullptr || s[0] == '-') {
            return parse_unix_seconds(s, out);
        }

        const char* p = s;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_fixed(p, 4, &year) || !expect(p, '-') ||
            !read_fixed(p, 2, &month) || !expect(p, '-') ||
            !read_fixed(p, 2, &day)) {
            return false;
        }
        if (*p != 'T' && *p != ' ') {
            return false;
        }
        ++p;
        if (!read_fixed(p, 2, &hour) || !expect(p, ':') || !read_fixed(p, 2, &minute)) {
            return false;
        }
        if (*p == ':') {
            ++p;
            if (!read_fixed(p, 2, &second)) {
                return false;
            }
        }
        if (*p == 'Z') {
            ++p;
        }
        if (*p != '\0') {
            return false;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 ||
            hour > 23 || minute > 59 || second > 59) {
            return false;
        }

        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        const std::time_t t = timegm(&tm);
        // timegm normalizes out-of-range days (Feb 30 -> Mar 2); reject those.
        if (tm.tm_mday != day || tm.tm_mon != month - 1) {
            return false;
        }
        *out = static_cast<Timestamp>(t);
        return true;
    }

} // namespace parq::core
