#pragma once

#include "parq/core/errors.hpp"
#include "parq/core/types.hpp"

namespace parq::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] bool log_level_parse(const char* s, LogLevel* out) noexcept;

    // One line to stderr, prefixed "error: ", "warn: ", "info: " or "debug: ".
    void log_error(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_warn(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_info(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_debug(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));

    // error: <context> failed (code=InvalidState/10, domain=Booking/3, aux=0): <reason>
    void log_status(const char* context, Status s) noexcept;

} // namespace parq::core
