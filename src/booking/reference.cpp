#include "parq/booking/reference.hpp"

#include <sodium.h>

#include <cstring>

#include "parq/core/time.hpp"

namespace parq::booking {
    using namespace parq::core;

    namespace {
        // Thread-safe; sodium_init returns 1 when already initialized.
        Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }

        constexpr std::size_t kTimestampLen = 14;
    } // namespace

    Status random_uniform(u32 upper, u32* out) noexcept {
        if (out == nullptr || upper == 0) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const Status init = ensure_sodium();
        if (!is_ok(init)) {
            return init;
        }
        *out = static_cast<u32>(randombytes_uniform(upper));
        return ok_status();
    }

    Status reference_generate(const char* prefix, Timestamp now, char* out, std::size_t out_size) noexcept {
        if (prefix == nullptr || out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const std::size_t prefix_len = std::strlen(prefix);
        if (prefix_len + kTimestampLen + kReferenceSuffixLen + 1 > out_size) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        const Status init = ensure_sodium();
        if (!is_ok(init)) {
            return init;
        }

        std::memcpy(out, prefix, prefix_len);
        char* p = out + prefix_len;
        if (!time_format_compact(now, p, kTimestampLen + 1) || std::strlen(p) != kTimestampLen) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        p += kTimestampLen;

        constexpr u32 alphabet_len = sizeof(kReferenceAlphabet) - 1;
        for (std::size_t i = 0; i < kReferenceSuffixLen; ++i) {
            p[i] = kReferenceAlphabet[randombytes_uniform(alphabet_len)];
        }
        p[kReferenceSuffixLen] = '\0';
        return ok_status();
    }

} // namespace parq::booking
