#pragma once

#include <type_traits>
#include <vector>

#include "parq/core/errors.hpp"
#include "parq/core/models.hpp"
#include "parq/engine/engine.hpp"

namespace parq::payment {
    using u32 = parq::core::u32;

    inline constexpr const char* kDemoGateway = "demo";
    inline constexpr const char* kLiveGateway = "external";

    struct PaymentRequest {
        const char* booking_reference{nullptr};
        const char* payment_method{nullptr};   // nullptr = configured default ("card")
    };

    [[nodiscard]] constexpr bool payment_transition_allowed(parq::core::PaymentState from,
        parq::core::PaymentState to) noexcept {
        using parq::core::PaymentState;
        switch (from) {
            case PaymentState::Pending:
                return to == PaymentState::Processing;
            case PaymentState::Processing:
                return to == PaymentState::Completed || to == PaymentState::Failed;
            case PaymentState::Completed:
                return to == PaymentState::Refunded;
            case PaymentState::Failed:
            case PaymentState::Refunded:
                return false;
        }
        return false;
    }

    // Starts a payment attempt for a pending booking. With demo settlement the
    // attempt completes and confirms the booking in the same transaction;
    // otherwise it is left processing for payment_complete / payment_fail.
    //
    // NotFound (Booking) for an unknown booking, AlreadyPaid, InvalidState if
    // the booking is not pending or an attempt is already processing, and
    // Unavailable if confirming would overlap a confirmed booking (nothing is
    // written in that case).
    [[nodiscard]] parq::core::Status payment_process(const parq::engine::Engine& engine,
        const PaymentRequest& req,
        parq::core::Payment* out) noexcept;

    [[nodiscard]] parq::core::Status payment_get(const parq::engine::Engine& engine,
        const char* reference,
        parq::core::Payment* out) noexcept;

    // Every attempt made against a booking, oldest first. An unknown booking
    // yields an empty list.
    [[nodiscard]] parq::core::Status payment_list_for_booking(const parq::engine::Engine& engine,
        const char* booking_reference,
        std::vector<parq::core::Payment>* out) noexcept;

    // Gateway reported success: processing -> completed, then confirms the
    // booking. If the booking cannot be confirmed nothing changes and the
    // payment stays processing.
    [[nodiscard]] parq::core::Status payment_complete(const parq::engine::Engine& engine,
        const char* reference,
        const char* gateway_transaction_id,
        parq::core::Payment* out) noexcept;

    // Gateway reported failure: processing -> failed. The booking stays pending.
    [[nodiscard]] parq::core::Status payment_fail(const parq::engine::Engine& engine,
        const char* reference,
        parq::core::Payment* out) noexcept;

    // completed -> refunded; the booking's payment_status becomes refunded.
    [[nodiscard]] parq::core::Status payment_refund(const parq::engine::Engine& engine,
        const char* reference,
        parq::core::Payment* out) noexcept;

    static_assert(std::is_trivially_copyable_v<PaymentRequest>);
    static_assert(std::is_standard_layout_v<PaymentRequest>);

} // namespace parq::payment
