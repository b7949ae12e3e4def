#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace certview::cert {

    /**
     * One decoded PEM block. Decoders return views into `data`, so the block has to
     * stay alive for as long as the decoded object is used.
     */
    struct PemBlock {
        std::string label;
        std::vector<uint8_t> data;
    };

    struct PemResult {
        bool success{};
        PemBlock block{};
        std::string error{};
    };

    struct PemBlocksResult {
        bool success{};
        std::vector<PemBlock> blocks;
        std::string error{};
    };

    // First block in `text`; with `expected_label` set, the first block carrying that label.
    PemResult pem_decode(std::string_view text, std::optional<std::string_view> expected_label = std::nullopt);

    // Every block in `text`, optionally restricted to one label. A malformed block fails the whole call.
    PemBlocksResult pem_decode_all(std::string_view text, std::optional<std::string_view> label = std::nullopt);

    inline PemResult pem_decode_certificate(std::string_view text) { return pem_decode(text, "CERTIFICATE"); }
    inline PemResult pem_decode_crl(std::string_view text) { return pem_decode(text, "X509 CRL"); }
    inline PemResult pem_decode_csr(std::string_view text) { return pem_decode(text, "CERTIFICATE REQUEST"); }

    // Cheap check for "-----BEGIN " anywhere in the input.
    [[nodiscard]] bool looks_like_pem(std::string_view text) noexcept;

} // namespace certview::cert
