#pragma once
#include <cstdint>
#include <type_traits>

namespace parq::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Busy,
        Io,
        Unsupported,
        Unavailable,
        InvalidInterval,
        InvalidState,
        AlreadyPaid,
        PolicyViolation,
        MissingField,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Db,
        Catalog,
        Booking,
        Payment,
        Cli,
        External,
    };

    // Which customer field a MissingField status refers to (carried in aux).
    enum class FieldId : u32 {
        None = 0,
        SpaceNumber,
        CustomerName,
        CustomerEmail,
        CustomerPhone,
        VehicleNumber,
        VehicleType,
        Notes,
        BookingReference,
        PaymentMethod,
        PaymentReference,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Store conflicts and lock timeouts are the only failures where a bare
    // retry of the identical request is expected to help.
    [[nodiscard]] constexpr bool status_retryable(Status s) noexcept {
        return s.code == StatusCode::Busy ||
               (s.code == StatusCode::Conflict && s.domain == StatusDomain::Db);
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;
    [[nodiscard]] const char* field_name(FieldId field) noexcept;

    // Human-readable reason for a failure, e.g. "parking space not found".
    [[nodiscard]] const char* status_reason(Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace parq::core
