#include "certview/utils/common.hpp"

#include <optional>
#include <string_view>

namespace certview::utils {

    namespace {

        char nibble_to_hex(uint8_t b, bool uppercase) {
            if (b < 10) {
                return static_cast<char>('0' + b);
            }
            return static_cast<char>((uppercase ? 'A' : 'a') + b - 10);
        }

        std::optional<uint8_t> hex_to_nibble(char c) {
            if (c >= '0' && c <= '9')
                return static_cast<uint8_t>(c - '0');
            if (c >= 'A' && c <= 'F')
                return static_cast<uint8_t>(c - 'A' + 10);
            if (c >= 'a' && c <= 'f')
                return static_cast<uint8_t>(c - 'a' + 10);
            return std::nullopt;
        }

    } // namespace

    std::string to_hex(std::span<const uint8_t> data, bool uppercase) {
        std::string hex;
        hex.reserve(data.size() * 2);
        for (uint8_t byte : data) {
            hex.push_back(nibble_to_hex((byte >> 4) & 0x0F, uppercase));
            hex.push_back(nibble_to_hex(byte & 0x0F, uppercase));
        }
        return hex;
    }

    std::string to_colon_hex(std::span<const uint8_t> data) {
        std::string hex;
        hex.reserve(data.size() * 3);
        for (size_t i = 0; i < data.size(); ++i) {
            if (i != 0) {
                hex.push_back(':');
            }
            hex.push_back(nibble_to_hex((data[i] >> 4) & 0x0F, false));
            hex.push_back(nibble_to_hex(data[i] & 0x0F, false));
        }
        return hex;
    }

    std::vector<uint8_t> from_hex(std::string_view hex) {
        if (hex.size() % 2 != 0) {
            return {};
        }
        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            const auto hi = hex_to_nibble(hex[i]);
            const auto lo = hex_to_nibble(hex[i + 1]);
            if (!hi || !lo) {
                return {};
            }
            bytes.push_back(static_cast<uint8_t>((*hi << 4) | *lo));
        }
        return bytes;
    }

} // namespace certview::utils
