#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace certview::utils {

    // Hex encoding helpers used for serials, fingerprints and name rendering.
    std::string to_hex(std::span<const uint8_t> data, bool uppercase = false);

    // "aa:bb:cc" form, lower-case.
    std::string to_colon_hex(std::span<const uint8_t> data);

    // Returns an empty vector on odd length or non-hex characters.
    std::vector<uint8_t> from_hex(std::string_view hex);

} // namespace certview::utils
