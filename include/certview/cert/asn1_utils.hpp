#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <certview/cert/asn1_common.hpp>
#include <certview/cert/error.hpp>

namespace certview::cert {

    // Second resolution keeps years 0000 through 9999 in range.
    using TimePoint = std::chrono::sys_seconds;

    template <typename T> struct ASN1Result {
        bool success{};
        T value{};
        size_t bytes_consumed{};
        std::string error{};
        ErrorKind kind{ErrorKind::None};

        static ASN1Result<T> failure(std::string message, ErrorKind kind = ErrorKind::InvalidValue) {
            return ASN1Result<T>{false, {}, 0, std::move(message), kind};
        }

        template <typename U> static ASN1Result<T> failure(const ASN1Result<U> &other) {
            return ASN1Result<T>{false, {}, 0, other.error, other.kind};
        }

        static ASN1Result<T> ok(T value, size_t consumed) {
            return ASN1Result<T>{true, std::move(value), consumed, {}, ErrorKind::None};
        }
    };

    struct ParseOptions {
        // Reject RFC 5280 violations that lenient decoding tolerates.
        bool strict{false};
        // Deepest nesting accepted inside generic (ANY) values.
        size_t max_depth{ASN1_DEFAULT_MAX_DEPTH};
    };

    struct ParsedHeader {
        ASN1Identifier identifier{};
        size_t length{};
        size_t header_bytes{};
    };

    ASN1Result<ParsedHeader> parse_id_len(ByteSpan input);
    ASN1Result<size_t> get_length(ByteSpan input);
    std::optional<ASN1Identifier> peek_identifier(ByteSpan input);

    ASN1Result<ByteSpan> parse_integer(ByteSpan input);
    ASN1Result<uint32_t> parse_u32(ByteSpan input);
    ASN1Result<uint32_t> decode_u32(ByteSpan content);
    ASN1Result<ByteSpan> parse_enumerated(ByteSpan input);
    ASN1Result<BitStringView> parse_bit_string(ByteSpan input);
    ASN1Result<BitStringView> decode_bit_string(ByteSpan content);
    ASN1Result<ByteSpan> parse_octet_string(ByteSpan input);
    ASN1Result<Oid> parse_oid(ByteSpan input);
    ASN1Result<Oid> decode_oid(ByteSpan content);
    ASN1Result<ByteSpan> parse_sequence(ByteSpan input);
    ASN1Result<ByteSpan> parse_set(ByteSpan input);
    ASN1Result<ByteSpan> parse_explicit(ByteSpan input, uint32_t tag_number);
    ASN1Result<bool> parse_boolean(ByteSpan input);
    ASN1Result<TimePoint> parse_utc_time(ByteSpan input);
    ASN1Result<TimePoint> parse_generalized_time(ByteSpan input);
    ASN1Result<TimePoint> parse_time(ByteSpan input);
    ASN1Result<std::string> parse_directory_string(ByteSpan input);
    ASN1Result<Any> parse_any(ByteSpan input, size_t max_depth);

    namespace detail {

        template <typename T, typename U>
        ASN1Result<T> forward_error(const ASN1Result<U> &inner, ErrorKind field_kind, std::string_view field) {
            const ErrorKind kind = is_codec_error(inner.kind) ? field_kind : inner.kind;
            return ASN1Result<T>::failure(std::string(field) + ": " + inner.error, kind);
        }

    } // namespace detail

} // namespace certview::cert
