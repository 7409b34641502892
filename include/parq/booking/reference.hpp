#pragma once

#include <cstddef>

#include "parq/core/errors.hpp"
#include "parq/core/types.hpp"

namespace parq::booking {

    inline constexpr const char* kBookingPrefix = "BK";
    inline constexpr const char* kPaymentPrefix = "PAY";
    inline constexpr std::size_t kReferenceSuffixLen = 6;
    inline constexpr const char kReferenceAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

    // Uniform value in [0, upper) from libsodium's CSPRNG.
    [[nodiscard]] parq::core::Status random_uniform(parq::core::u32 upper, parq::core::u32* out) noexcept;

    // <prefix><YYYYmmddHHMMSS><6 x [A-Z0-9]>, e.g. BK20240501100000Q7K2ZD.
    // Not unique by itself: the store's unique constraint catches collisions
    // and callers retry with a fresh reference.
    [[nodiscard]] parq::core::Status reference_generate(const char* prefix,
        parq::core::Timestamp now,
        char* out,
        std::size_t out_size) noexcept;

} // namespace parq::booking
