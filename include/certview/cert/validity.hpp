#pragma once

#include <chrono>
#include <optional>

#include <certview/cert/asn1_utils.hpp>

namespace certview::cert {

    // Half-open validity interval: valid at t iff not_before <= t < not_after.
    struct Validity {
        TimePoint not_before{};
        TimePoint not_after{};

        [[nodiscard]] bool is_valid_at(TimePoint t) const noexcept { return not_before <= t && t < not_after; }

        [[nodiscard]] static TimePoint now() {
            return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        }

        [[nodiscard]] bool is_valid_now() const { return is_valid_at(now()); }

        // Time left before expiry; empty unless the interval holds right now.
        [[nodiscard]] std::optional<std::chrono::seconds> time_to_expiration() const {
            const auto now = Validity::now();
            if (!is_valid_at(now)) {
                return std::nullopt;
            }
            return not_after - now;
        }
    };

} // namespace certview::cert
