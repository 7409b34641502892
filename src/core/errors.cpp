#include "parq/core/errors.hpp"

namespace parq::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
        case StatusCode::InvalidInterval: return "InvalidInterval";
        case StatusCode::InvalidState: return "InvalidState";
        case StatusCode::AlreadyPaid: return "AlreadyPaid";
        case StatusCode::PolicyViolation: return "PolicyViolation";
        case StatusCode::MissingField: return "MissingField";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Catalog: return "Catalog";
        case StatusDomain::Booking: return "Booking";
        case StatusDomain::Payment: return "Payment";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

const char* field_name(FieldId field) noexcept {
    switch (field) {
        case FieldId::None: return "none";
        case FieldId::SpaceNumber: return "space_number";
        case FieldId::CustomerName: return "customer_name";
        case FieldId::CustomerEmail: return "customer_email";
        case FieldId::CustomerPhone: return "customer_phone";
        case FieldId::VehicleNumber: return "vehicle_number";
        case FieldId::VehicleType: return "vehicle_type";
        case FieldId::Notes: return "notes";
        case FieldId::BookingReference: return "booking_reference";
        case FieldId::PaymentMethod: return "payment_method";
        case FieldId::PaymentReference: return "payment_reference";
    }
    return "unknown";
}

const char* status_reason(Status s) noexcept {
    switch (s.code) {
        case StatusCode::Ok:
            return "ok";
        case StatusCode::InvalidInterval:
            return "start time must be before end time";
        case StatusCode::NotFound:
            switch (s.domain) {
                case StatusDomain::Catalog: return "parking space not found";
                case StatusDomain::Booking: return "booking not found";
                case StatusDomain::Payment: return "payment not found";
                default: return "record not found";
            }
        case StatusCode::Unavailable:
            if (s.domain == StatusDomain::Booking) {
                return "space not available for selected time";
            }
            return "service unavailable";
        case StatusCode::AlreadyPaid:
            return "booking already paid";
        case StatusCode::InvalidState:
            if (s.domain == StatusDomain::Payment) {
                return "operation not allowed in the payment's current state";
            }
            return "operation not allowed in the booking's current state";
        case StatusCode::PolicyViolation:
            return "rejected by booking policy";
        case StatusCode::MissingField:
            switch (static_cast<FieldId>(s.aux)) {
                case FieldId::SpaceNumber: return "space_number is required";
                case FieldId::CustomerName: return "customer_name is required";
                case FieldId::CustomerEmail: return "customer_email is required";
                case FieldId::CustomerPhone: return "customer_phone is too long";
                case FieldId::VehicleNumber: return "vehicle_number is required";
                case FieldId::VehicleType: return "vehicle_type is too long";
                case FieldId::Notes: return "notes are too long";
                case FieldId::BookingReference: return "booking_reference is required";
                case FieldId::PaymentMethod: return "payment_method is too long";
                case FieldId::PaymentReference: return "payment_reference is required";
                case FieldId::None: break;
            }
            return "missing required fields";
        case StatusCode::Conflict:
            if (s.domain == StatusDomain::Catalog) {
                return "parking lot already initialized";
            }
            return "store rejected a conflicting write; retry the operation";
        case StatusCode::Busy:
            return "store busy or transaction timed out; retry the operation";
        case StatusCode::Invalid:
            return "invalid argument";
        case StatusCode::Io:
            return "i/o error";
        case StatusCode::Unsupported:
            return "unsupported operation";
        case StatusCode::Unknown:
            break;
    }
    return "unknown error";
}

} // namespace parq::core
