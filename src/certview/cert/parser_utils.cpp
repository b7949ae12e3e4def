#include <certview/cert/parser_utils.hpp>

#include <certview/cert/oid_registry.hpp>

namespace certview::cert {

    SignatureAlgorithmId AlgorithmIdentifier::signature_id() const { return find_sig_alg_by_oid(algorithm); }

    PublicKeyAlgorithmId AlgorithmIdentifier::public_key_id() const { return find_public_key_alg_by_oid(algorithm); }

    CurveId SubjectPublicKeyInfo::curve() const {
        if (algorithm.public_key_id() != PublicKeyAlgorithmId::Ec || !algorithm.parameters) {
            return CurveId::Unknown;
        }
        const auto &params = *algorithm.parameters;
        if (!params.identifier.is_universal(ASN1Tag::ObjectIdentifier) || params.identifier.constructed) {
            return CurveId::Unknown;
        }
        auto oid = decode_oid(params.content);
        if (!oid.success) {
            return CurveId::Unknown;
        }
        return find_curve_by_oid(oid.value);
    }

} // namespace certview::cert

namespace certview::cert::detail {

    mpz_class integer_from_bytes(ByteSpan bytes) {
        mpz_class out;
        if (!bytes.empty()) {
            mpz_import(out.get_mpz_t(), bytes.size(), 1, 1, 1, 0, bytes.data());
        }
        return out;
    }

    ASN1Result<RelativeDistinguishedName> parse_rdn_content(ByteSpan content, size_t max_depth) {
        RelativeDistinguishedName rdn;
        DerCursor cursor(content);
        while (!cursor.empty()) {
            auto atv_seq = parse_sequence(cursor.remaining());
            if (!atv_seq.success) {
                return ASN1Result<RelativeDistinguishedName>::failure(atv_seq);
            }
            DerCursor atv_cursor(atv_seq.value);

            auto oid = parse_oid(atv_cursor.remaining());
            if (!oid.success) {
                return ASN1Result<RelativeDistinguishedName>::failure(oid);
            }
            atv_cursor.advance(oid.bytes_consumed);

            auto value = parse_any(atv_cursor.remaining(), max_depth);
            if (!value.success) {
                return ASN1Result<RelativeDistinguishedName>::failure(value);
            }
            atv_cursor.advance(value.bytes_consumed);

            if (!atv_cursor.empty()) {
                return ASN1Result<RelativeDistinguishedName>::failure("trailing data in AttributeTypeAndValue");
            }

            rdn.set.push_back(AttributeTypeAndValue{std::move(oid.value), value.value});
            cursor.advance(atv_seq.bytes_consumed);
        }

        if (rdn.set.empty()) {
            return ASN1Result<RelativeDistinguishedName>::failure("empty RelativeDistinguishedName");
        }
        return ASN1Result<RelativeDistinguishedName>::ok(std::move(rdn), content.size());
    }

    ASN1Result<DistinguishedName> parse_name(ByteSpan input, size_t max_depth) {
        auto seq = parse_sequence(input);
        if (!seq.success) {
            return ASN1Result<DistinguishedName>::failure(seq);
        }

        std::vector<RelativeDistinguishedName> rdns;
        DerCursor cursor(seq.value);
        while (!cursor.empty()) {
            auto set = parse_set(cursor.remaining());
            if (!set.success) {
                return ASN1Result<DistinguishedName>::failure(set);
            }

            auto rdn = parse_rdn_content(set.value, max_depth);
            if (!rdn.success) {
                return ASN1Result<DistinguishedName>::failure(rdn);
            }
            rdns.push_back(std::move(rdn.value));
            cursor.advance(set.bytes_consumed);
        }

        DistinguishedName name(std::move(rdns), input.first(seq.bytes_consumed));
        return ASN1Result<DistinguishedName>::ok(std::move(name), seq.bytes_consumed);
    }

    ASN1Result<AlgorithmIdentifier> parse_algorithm_identifier(ByteSpan input, size_t max_depth) {
        auto seq = parse_sequence(input);
        if (!seq.success) {
            return ASN1Result<AlgorithmIdentifier>::failure(seq);
        }
        DerCursor cursor(seq.value);
        auto oid = parse_oid(cursor.remaining());
        if (!oid.success) {
            return ASN1Result<AlgorithmIdentifier>::failure(oid);
        }
        cursor.advance(oid.bytes_consumed);

        AlgorithmIdentifier identifier{};
        identifier.algorithm = std::move(oid.value);

        if (!cursor.empty()) {
            auto params = parse_any(cursor.remaining(), max_depth);
            if (!params.success) {
                return ASN1Result<AlgorithmIdentifier>::failure(params);
            }
            identifier.parameters = params.value;
            cursor.advance(params.bytes_consumed);
        }
        if (!cursor.empty()) {
            return ASN1Result<AlgorithmIdentifier>::failure("trailing data in AlgorithmIdentifier");
        }

        return ASN1Result<AlgorithmIdentifier>::ok(std::move(identifier), seq.bytes_consumed);
    }

    ASN1Result<SubjectPublicKeyInfo> parse_subject_public_key_info(ByteSpan input, size_t max_depth) {
        auto seq = parse_sequence(input);
        if (!seq.success) {
            return ASN1Result<SubjectPublicKeyInfo>::failure(seq);
        }
        DerCursor cursor(seq.value);
        auto alg = parse_algorithm_identifier(cursor.remaining(), max_depth);
        if (!alg.success) {
            return ASN1Result<SubjectPublicKeyInfo>::failure(alg);
        }
        cursor.advance(alg.bytes_consumed);

        auto bit_string = parse_bit_string(cursor.remaining());
        if (!bit_string.success) {
            return ASN1Result<SubjectPublicKeyInfo>::failure(bit_string);
        }
        cursor.advance(bit_string.bytes_consumed);
        if (!cursor.empty()) {
            return ASN1Result<SubjectPublicKeyInfo>::failure("trailing data in SubjectPublicKeyInfo");
        }

        SubjectPublicKeyInfo spki{};
        spki.algorithm = std::move(alg.value);
        spki.subject_public_key = bit_string.value;
        return ASN1Result<SubjectPublicKeyInfo>::ok(std::move(spki), seq.bytes_consumed);
    }

    ASN1Result<Validity> parse_validity(ByteSpan input) {
        auto seq = parse_sequence(input);
        if (!seq.success) {
            return ASN1Result<Validity>::failure(seq);
        }
        DerCursor cursor(seq.value);

        auto not_before = parse_time(cursor.remaining());
        if (!not_before.success) {
            return forward_error<Validity>(not_before, ErrorKind::InvalidDate, "notBefore");
        }
        cursor.advance(not_before.bytes_consumed);

        auto not_after = parse_time(cursor.remaining());
        if (!not_after.success) {
            return forward_error<Validity>(not_after, ErrorKind::InvalidDate, "notAfter");
        }
        cursor.advance(not_after.bytes_consumed);

        if (!cursor.empty()) {
            return ASN1Result<Validity>::failure("trailing data in Validity");
        }
        return ASN1Result<Validity>::ok(Validity{not_before.value, not_after.value}, seq.bytes_consumed);
    }

    ASN1Result<SerialNumber> parse_serial(ByteSpan input) {
        auto integer = parse_integer(input);
        if (!integer.success) {
            return ASN1Result<SerialNumber>::failure(integer);
        }
        SerialNumber serial{};
        serial.raw = integer.value;
        serial.negative = (integer.value[0] & 0x80U) != 0;
        serial.value = integer_from_bytes(integer.value);
        return ASN1Result<SerialNumber>::ok(std::move(serial), integer.bytes_consumed);
    }

    ASN1Result<BitStringView> parse_unique_identifier(ByteSpan input, uint32_t tag) {
        auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<BitStringView>::failure(header);
        }
        const auto &identifier = header.value.identifier;
        if (!identifier.is_context(tag)) {
            return ASN1Result<BitStringView>::failure("expected context tag [" + std::to_string(tag) + "]",
                                                      ErrorKind::UnexpectedType);
        }
        if (identifier.constructed) {
            return ASN1Result<BitStringView>::failure("unique identifier must be primitive", ErrorKind::InvalidTag);
        }
        auto bits = decode_bit_string(input.subspan(header.value.header_bytes, header.value.length));
        if (!bits.success) {
            return bits;
        }
        bits.bytes_consumed = header.bytes_consumed;
        return bits;
    }

    ASN1Result<std::optional<uint32_t>> parse_optional_version(ByteSpan input) {
        DerCursor probe(input);
        if (!probe.at_context(0)) {
            return ASN1Result<std::optional<uint32_t>>::ok(std::nullopt, 0);
        }
        auto wrapped = parse_explicit(input, 0);
        if (!wrapped.success) {
            return ASN1Result<std::optional<uint32_t>>::failure(wrapped);
        }
        auto version = parse_u32(wrapped.value);
        if (!version.success) {
            return ASN1Result<std::optional<uint32_t>>::failure(version);
        }
        if (version.bytes_consumed != wrapped.value.size()) {
            return ASN1Result<std::optional<uint32_t>>::failure("trailing data in version");
        }
        return ASN1Result<std::optional<uint32_t>>::ok(version.value, wrapped.bytes_consumed);
    }

    ASN1Result<BitStringView> parse_signature_value(ByteSpan input, bool strict) {
        auto bits = parse_bit_string(input);
        if (!bits.success) {
            return forward_error<BitStringView>(bits, ErrorKind::InvalidSignatureValue, "signatureValue");
        }
        if (strict && bits.value.unused_bits != 0) {
            return ASN1Result<BitStringView>::failure("signatureValue: BIT STRING has unused bits",
                                                      ErrorKind::InvalidSignatureValue);
        }
        return bits;
    }

} // namespace certview::cert::detail
