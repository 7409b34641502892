#pragma once
#include <type_traits>
#include "parq/core/types.hpp"

namespace parq::core {
    inline constexpr std::size_t kSpaceNumberLen = 16;
    inline constexpr std::size_t kReferenceLen = 32;
    inline constexpr std::size_t kNameLen = 128;
    inline constexpr std::size_t kEmailLen = 128;
    inline constexpr std::size_t kPhoneLen = 32;
    inline constexpr std::size_t kVehicleNumberLen = 32;
    inline constexpr std::size_t kVehicleTypeLen = 64;
    inline constexpr std::size_t kNotesLen = 256;
    inline constexpr std::size_t kCurrencyLen = 8;
    inline constexpr std::size_t kMethodLen = 32;
    inline constexpr std::size_t kGatewayLen = 32;
    inline constexpr std::size_t kGatewayTxnLen = 64;

    struct Space {
        char space_number[kSpaceNumberLen]{};
        i32 row{0};
        i32 column{0};
        Money hourly_rate{0};
        bool is_occupied{false};
        char vehicle_type[kVehicleTypeLen]{};
        Timestamp last_updated{0};
    };

    struct CustomerInfo {
        char name[kNameLen]{};
        char email[kEmailLen]{};
        char phone[kPhoneLen]{};
        char vehicle_number[kVehicleNumberLen]{};
        char vehicle_type[kVehicleTypeLen]{};
    };

    struct Booking {
        char booking_reference[kReferenceLen]{};
        char space_number[kSpaceNumberLen]{};
        CustomerInfo customer{};
        Interval interval{};
        Money total_amount{0};
        BookingStatus status{BookingStatus::Pending};
        PaymentStatus payment_status{PaymentStatus::Pending};
        char payment_id[kReferenceLen]{};   // empty until a payment completes
        char notes[kNotesLen]{};
        Timestamp created_at{0};
        Timestamp updated_at{0};
    };

    // The part of a booking the availability check looks at.
    struct BookingSlot {
        char space_number[kSpaceNumberLen]{};
        Interval interval{};
        BookingStatus status{BookingStatus::Pending};
        Timestamp created_at{0};
    };

    struct Payment {
        char payment_reference[kReferenceLen]{};
        char booking_reference[kReferenceLen]{};   // empty when unattached
        Money amount{0};
        char currency[kCurrencyLen]{};
        char payment_method[kMethodLen]{};
        char payment_gateway[kGatewayLen]{};
        char gateway_transaction_id[kGatewayTxnLen]{};
        PaymentState status{PaymentState::Pending};
        char customer_email[kEmailLen]{};
        Timestamp payment_time{0};
        Timestamp completed_at{0};   // 0 = not completed
    };

    struct OccupancyEvent {
        char space_number[kSpaceNumberLen]{};
        OccupancyEventType type{OccupancyEventType::Entry};
        char vehicle_type[kVehicleTypeLen]{};
        float confidence{1.0f};
        Timestamp timestamp{0};
    };

    struct LotStatus {
        u32 total{0};
        u32 occupied{0};
        u32 available{0};
        double occupancy_rate{0.0};   // percent, 0..100
    };

    // Current occupancy plus detector traffic since a point in time.
    struct LotSummary {
        LotStatus status{};
        Timestamp since{0};
        u32 entries{0};
        u32 exits{0};
    };

    static_assert(std::is_trivially_copyable_v<Space>);
    static_assert(std::is_trivially_copyable_v<CustomerInfo>);
    static_assert(std::is_trivially_copyable_v<Booking>);
    static_assert(std::is_trivially_copyable_v<BookingSlot>);
    static_assert(std::is_trivially_copyable_v<Payment>);
    static_assert(std::is_trivially_copyable_v<OccupancyEvent>);
    static_assert(std::is_trivially_copyable_v<LotStatus>);
    static_assert(std::is_trivially_copyable_v<LotSummary>);
    static_assert(std::is_standard_layout_v<Space>);
    static_assert(std::is_standard_layout_v<Booking>);
    static_assert(std::is_standard_layout_v<Payment>);
    static_assert(std::is_standard_layout_v<OccupancyEvent>);
} // namespace parq::core
