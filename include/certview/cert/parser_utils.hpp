#pragma once

#include <optional>

#include <gmpxx.h>

#include <certview/cert/asn1_utils.hpp>
#include <certview/cert/distinguished_name.hpp>
#include <certview/cert/validity.hpp>

namespace certview::cert {

    struct SerialNumber {
        mpz_class value{};
        // INTEGER content octets exactly as encoded.
        ByteSpan raw{};
        bool negative{false};
    };

} // namespace certview::cert

namespace certview::cert::detail {

    class DerCursor {
      public:
        explicit DerCursor(ByteSpan span) : data_(span) {}
        ByteSpan remaining() const { return data_.subspan(offset_); }
        bool empty() const { return offset_ >= data_.size(); }
        size_t offset() const { return offset_; }
        bool advance(size_t count) {
            if (offset_ + count > data_.size()) {
                return false;
            }
            offset_ += count;
            return true;
        }

        // True when the next element carries context tag [number].
        bool at_context(uint32_t number) const {
            auto identifier = peek_identifier(remaining());
            return identifier && identifier->is_context(number);
        }

      private:
        ByteSpan data_;
        size_t offset_{0};
    };

    ASN1Result<DistinguishedName> parse_name(ByteSpan input, size_t max_depth);
    // Content of one RDN SET: one or more AttributeTypeAndValue.
    ASN1Result<RelativeDistinguishedName> parse_rdn_content(ByteSpan content, size_t max_depth);
    ASN1Result<AlgorithmIdentifier> parse_algorithm_identifier(ByteSpan input, size_t max_depth);
    ASN1Result<SubjectPublicKeyInfo> parse_subject_public_key_info(ByteSpan input, size_t max_depth);
    ASN1Result<Validity> parse_validity(ByteSpan input);
    ASN1Result<SerialNumber> parse_serial(ByteSpan input);
    // [tag] IMPLICIT BIT STRING
    ASN1Result<BitStringView> parse_unique_identifier(ByteSpan input, uint32_t tag);
    // [0] EXPLICIT INTEGER; an absent tag yields nullopt and consumes nothing.
    ASN1Result<std::optional<uint32_t>> parse_optional_version(ByteSpan input);
    // Envelope signatureValue. Strict mode refuses unused bits.
    ASN1Result<BitStringView> parse_signature_value(ByteSpan input, bool strict);

    mpz_class integer_from_bytes(ByteSpan bytes);

} // namespace certview::cert::detail
