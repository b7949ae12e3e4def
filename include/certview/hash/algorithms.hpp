#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace certview::hash {

    enum class Algorithm { SHA256, SHA512, BLAKE2b };

    struct Result {
        bool success;
        std::vector<uint8_t> data;
        std::string error_message;
    };

    [[nodiscard]] std::string_view algorithm_name(Algorithm algo) noexcept;

    // One-shot digest of `data`. BLAKE2b uses the libsodium default output size (32 bytes).
    Result digest(Algorithm algo, std::span<const uint8_t> data);

} // namespace certview::hash
