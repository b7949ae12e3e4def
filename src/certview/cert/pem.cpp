#include <certview/cert/pem.hpp>

#include <sodium.h>

#include <certview/utils/sodium_utils.hpp>

namespace certview::cert {

    namespace {

        constexpr std::string_view kBeginMarker = "-----BEGIN ";
        constexpr std::string_view kEndMarker = "-----END ";
        constexpr std::string_view kTrailer = "-----";

        struct BlockScan {
            PemResult result;
            // Offset just past the END line, or npos when no block was found.
            size_t next{std::string_view::npos};
        };

        PemResult error_result(std::string message) { return PemResult{false, {}, std::move(message)}; }

        bool decode_base64(std::string_view body, std::vector<uint8_t> &output) {
            utils::ensure_sodium_init();
            output.resize(body.size() / 4U * 3U + 3U);
            size_t decoded_len = 0;
            const char *end = nullptr;
            if (sodium_base642bin(output.data(), output.size(), body.data(), body.size(), " \t\r\n", &decoded_len,
                                  &end, sodium_base64_VARIANT_ORIGINAL) != 0) {
                return false;
            }
            if (end != body.data() + body.size()) {
                return false;
            }
            output.resize(decoded_len);
            return true;
        }

        BlockScan scan_block(std::string_view text, size_t from) {
            BlockScan scan{};
            const auto begin_pos = text.find(kBeginMarker, from);
            if (begin_pos == std::string_view::npos) {
                scan.result = error_result("missing PEM BEGIN marker");
                return scan;
            }

            const size_t label_start = begin_pos + kBeginMarker.size();
            const auto label_end = text.find(kTrailer, label_start);
            if (label_end == std::string_view::npos) {
                scan.result = error_result("unterminated PEM header");
                scan.next = text.size();
                return scan;
            }
            std::string label(text.substr(label_start, label_end - label_start));

            const size_t content_start = label_end + kTrailer.size();
            const std::string footer = std::string(kEndMarker) + label + std::string(kTrailer);
            const auto footer_pos = text.find(footer, content_start);
            if (footer_pos == std::string_view::npos) {
                scan.result = error_result("missing PEM END marker for " + label);
                scan.next = text.size();
                return scan;
            }
            scan.next = footer_pos + footer.size();

            const auto body = text.substr(content_start, footer_pos - content_start);
            std::vector<uint8_t> decoded;
            if (!decode_base64(body, decoded)) {
                scan.result = error_result("invalid base64 content in " + label);
                return scan;
            }
            if (decoded.empty()) {
                scan.result = error_result("empty PEM body in " + label);
                return scan;
            }
            scan.result = PemResult{true, PemBlock{std::move(label), std::move(decoded)}, {}};
            return scan;
        }

    } // namespace

    PemResult pem_decode(std::string_view text, std::optional<std::string_view> expected_label) {
        size_t offset = 0;
        while (offset < text.size()) {
            auto scan = scan_block(text, offset);
            if (scan.next == std::string_view::npos) {
                break;
            }
            if (!scan.result.success) {
                return scan.result;
            }
            if (!expected_label || scan.result.block.label == *expected_label) {
                return scan.result;
            }
            offset = scan.next;
        }
        if (expected_label) {
            return error_result("no PEM block labelled " + std::string(*expected_label));
        }
        return error_result("missing PEM BEGIN marker");
    }

    PemBlocksResult pem_decode_all(std::string_view text, std::optional<std::string_view> label) {
        PemBlocksResult result{};
        size_t offset = 0;
        while (offset < text.size()) {
            auto scan = scan_block(text, offset);
            if (scan.next == std::string_view::npos) {
                break;
            }
            if (!scan.result.success) {
                return PemBlocksResult{false, {}, std::move(scan.result.error)};
            }
            if (!label || scan.result.block.label == *label) {
                result.blocks.push_back(std::move(scan.result.block));
            }
            offset = scan.next;
        }
        if (result.blocks.empty()) {
            return PemBlocksResult{false, {}, "no PEM blocks found"};
        }
        result.success = true;
        return result;
    }

    bool looks_like_pem(std::string_view text) noexcept { return text.find(kBeginMarker) != std::string_view::npos; }

} // namespace certview::cert
