#include "parq/booking/pricing.hpp"

#include "parq/catalog/catalog.hpp"
#include "parq/core/text.hpp"

namespace parq::booking {
    using namespace parq::core;

    Status quote_amount(Interval iv, Money hourly_rate, Money* out) noexcept {
        if (out == nullptr || hourly_rate <= 0) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (!interval_valid(iv)) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidInterval);
        }

        i64 product = 0;
        if (!checked_mul(interval_seconds(iv), hourly_rate, &product) ||
            !checked_add(product, kSecondsPerHour / 2, &product)) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        *out = product / kSecondsPerHour;
        return ok_status();
    }

    Status quote(const engine::Engine& engine, const char* space_number, Interval iv, Quote* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Booking, StatusCode::Invalid);
        }
        if (text_empty(space_number)) {
            return make_status(StatusDomain::Booking, StatusCode::MissingField, static_cast<u32>(FieldId::SpaceNumber));
        }
        if (!interval_valid(iv)) {
            return make_status(StatusDomain::Booking, StatusCode::InvalidInterval);
        }

        Space space{};
        Status s = catalog::space_get(engine, space_number, &space);
        if (!is_ok(s)) {
            return s;
        }

        Quote q{};
        s = quote_amount(iv, space.hourly_rate, &q.amount);
        if (!is_ok(s)) {
            return s;
        }
        text_copy(q.space_number, space.space_number);
        q.interval = iv;
        q.duration_seconds = interval_seconds(iv);
        q.hourly_rate = space.hourly_rate;
        text_copy(q.currency, engine.config.payment.currency);

        *out = q;
        return ok_status();
    }

} // namespace parq::booking
