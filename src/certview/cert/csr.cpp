#include <certview/cert/csr.hpp>

#include <spdlog/spdlog.h>

namespace certview::cert {

    namespace {

        using detail::DerCursor;

        ASN1Result<ParsedCriAttribute> decode_extension_request(ByteSpan values, size_t max_depth) {
            auto extensions = detail::parse_extensions(values, max_depth);
            if (!extensions.success) {
                return ASN1Result<ParsedCriAttribute>::failure(extensions);
            }
            if (extensions.bytes_consumed != values.size()) {
                return ASN1Result<ParsedCriAttribute>::failure("extensionRequest must hold a single value");
            }
            return ASN1Result<ParsedCriAttribute>::ok(ExtensionRequestAttribute{std::move(extensions.value)},
                                                      values.size());
        }

        ASN1Result<ParsedCriAttribute> decode_challenge_password(ByteSpan values, size_t) {
            auto password = parse_directory_string(values);
            if (!password.success) {
                return ASN1Result<ParsedCriAttribute>::failure(password);
            }
            if (password.bytes_consumed != values.size()) {
                return ASN1Result<ParsedCriAttribute>::failure("challengePassword must hold a single value");
            }
            return ASN1Result<ParsedCriAttribute>::ok(ChallengePasswordAttribute{std::move(password.value)},
                                                      values.size());
        }

        ASN1Result<ParsedCriAttribute> dispatch_attribute(const Oid &oid, ByteSpan values, size_t max_depth) {
            switch (find_cri_attribute_by_oid(oid)) {
            case CriAttributeId::ExtensionRequest:
                return decode_extension_request(values, max_depth);
            case CriAttributeId::ChallengePassword:
                return decode_challenge_password(values, max_depth);
            case CriAttributeId::Unknown:
                break;
            }
            return ASN1Result<ParsedCriAttribute>::ok(UnsupportedAttribute{values}, values.size());
        }

        // Failures a requested extension must surface even when the attribute itself is optional.
        // Any other decode failure of a known attribute, codec errors included, keeps the attribute
        // as UnsupportedAttribute with its raw SET instead of failing the request.
        bool must_propagate(ErrorKind kind) {
            return kind == ErrorKind::UnsupportedCriticalExtension || kind == ErrorKind::DuplicateExtension;
        }

    } // namespace

    namespace detail {

        ASN1Result<CriAttribute> parse_cri_attribute(ByteSpan input, size_t max_depth) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<CriAttribute>::failure(seq);
            }
            DerCursor cursor(seq.value);

            auto oid = parse_oid(cursor.remaining());
            if (!oid.success) {
                return ASN1Result<CriAttribute>::failure(oid);
            }
            cursor.advance(oid.bytes_consumed);

            auto set = parse_set(cursor.remaining());
            if (!set.success) {
                return ASN1Result<CriAttribute>::failure(set);
            }
            CriAttribute attribute{};
            attribute.oid = std::move(oid.value);
            attribute.value = cursor.remaining().first(set.bytes_consumed);
            cursor.advance(set.bytes_consumed);

            if (!cursor.empty()) {
                return ASN1Result<CriAttribute>::failure("trailing data in Attribute");
            }

            DerCursor values(set.value);
            while (!values.empty()) {
                auto element = parse_any(values.remaining(), max_depth);
                if (!element.success) {
                    return ASN1Result<CriAttribute>::failure(element);
                }
                values.advance(element.bytes_consumed);
            }

            attribute.parsed = UnsupportedAttribute{attribute.value};
            auto decoded = dispatch_attribute(attribute.oid, set.value, max_depth);
            if (!decoded.success) {
                if (must_propagate(decoded.kind)) {
                    return ASN1Result<CriAttribute>::failure(decoded);
                }
                spdlog::debug("[Extensions] attribute {} kept as unsupported: {}", attribute.oid.to_string(),
                              decoded.error);
                return ASN1Result<CriAttribute>::ok(std::move(attribute), seq.bytes_consumed);
            }
            attribute.parsed = std::move(decoded.value);
            return ASN1Result<CriAttribute>::ok(std::move(attribute), seq.bytes_consumed);
        }

        ASN1Result<CertificationRequestInfo> parse_certification_request_info(ByteSpan input,
                                                                              const ParseOptions &options) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<CertificationRequestInfo>::failure(seq);
            }
            DerCursor cursor(seq.value);
            CertificationRequestInfo info{};
            info.raw = input.first(seq.bytes_consumed);

            auto version = parse_u32(cursor.remaining());
            if (!version.success) {
                return forward_error<CertificationRequestInfo>(version, ErrorKind::InvalidVersion, "version");
            }
            if (version.value != 0) {
                return ASN1Result<CertificationRequestInfo>::failure(
                    "version: unknown request version " + std::to_string(version.value), ErrorKind::InvalidVersion);
            }
            cursor.advance(version.bytes_consumed);

            auto subject = parse_name(cursor.remaining(), options.max_depth);
            if (!subject.success) {
                return forward_error<CertificationRequestInfo>(subject, ErrorKind::InvalidName, "subject");
            }
            info.subject = std::move(subject.value);
            cursor.advance(subject.bytes_consumed);

            auto spki = parse_subject_public_key_info(cursor.remaining(), options.max_depth);
            if (!spki.success) {
                return forward_error<CertificationRequestInfo>(spki, ErrorKind::InvalidSubjectPublicKeyInfo,
                                                               "subjectPKInfo");
            }
            info.subject_pki = std::move(spki.value);
            cursor.advance(spki.bytes_consumed);

            // attributes [0] IMPLICIT SET OF Attribute; the tag is mandatory but often dropped
            if (!cursor.empty() && cursor.at_context(0)) {
                auto wrapped = parse_explicit(cursor.remaining(), 0);
                if (!wrapped.success) {
                    return forward_error<CertificationRequestInfo>(wrapped, ErrorKind::InvalidAttributes,
                                                                   "attributes");
                }
                DerCursor attributes(wrapped.value);
                while (!attributes.empty()) {
                    auto attribute = parse_cri_attribute(attributes.remaining(), options.max_depth);
                    if (!attribute.success) {
                        return forward_error<CertificationRequestInfo>(attribute, ErrorKind::InvalidAttributes,
                                                                       "attributes");
                    }
                    if (info.find_attribute(attribute.value.oid) != nullptr) {
                        return ASN1Result<CertificationRequestInfo>::failure(
                            "attributes: duplicate attribute " + attribute.value.oid.to_string(),
                            ErrorKind::InvalidAttributes);
                    }
                    info.attributes.push_back(std::move(attribute.value));
                    attributes.advance(attribute.bytes_consumed);
                }
                cursor.advance(wrapped.bytes_consumed);
            } else if (options.strict) {
                return ASN1Result<CertificationRequestInfo>::failure("attributes: missing [0] attributes field",
                                                                     ErrorKind::InvalidAttributes);
            }

            if (!cursor.empty()) {
                return ASN1Result<CertificationRequestInfo>::failure(
                    "unexpected data after CertificationRequestInfo fields", ErrorKind::TrailingData);
            }
            return ASN1Result<CertificationRequestInfo>::ok(std::move(info), seq.bytes_consumed);
        }

    } // namespace detail

    namespace {

        CsrParseResult parse_csr(ByteSpan der, const ParseOptions &options) {
            auto outer = parse_sequence(der);
            if (!outer.success) {
                return CsrParseResult::failure(outer);
            }
            DerCursor cursor(outer.value);

            auto info = detail::parse_certification_request_info(cursor.remaining(), options);
            if (!info.success) {
                return CsrParseResult::failure(info);
            }
            cursor.advance(info.bytes_consumed);

            auto signature_algorithm = detail::parse_algorithm_identifier(cursor.remaining(), options.max_depth);
            if (!signature_algorithm.success) {
                return CsrParseResult::failure(detail::forward_error<AlgorithmIdentifier>(
                    signature_algorithm, ErrorKind::InvalidAlgorithmIdentifier, "signatureAlgorithm"));
            }
            cursor.advance(signature_algorithm.bytes_consumed);

            auto signature_value = detail::parse_signature_value(cursor.remaining(), options.strict);
            if (!signature_value.success) {
                return CsrParseResult::failure(signature_value);
            }
            cursor.advance(signature_value.bytes_consumed);

            if (!cursor.empty()) {
                return CsrParseResult::failure(ErrorKind::TrailingData, "unexpected data after signature");
            }

            const auto remaining = der.subspan(outer.bytes_consumed);
            if (options.strict && !remaining.empty()) {
                return CsrParseResult::failure(ErrorKind::TrailingData, "extra data after certification request");
            }

            CertificateRequest request(std::move(info.value), std::move(signature_algorithm.value),
                                       signature_value.value, der.first(outer.bytes_consumed));
            return CsrParseResult::ok(std::move(request), remaining);
        }

    } // namespace

    const CriAttribute *CertificationRequestInfo::find_attribute(const Oid &oid) const {
        for (const auto &attribute : attributes) {
            if (attribute.oid == oid) {
                return &attribute;
            }
        }
        return nullptr;
    }

    const CriAttribute *CertificationRequestInfo::find_attribute(CriAttributeId id) const {
        if (id == CriAttributeId::Unknown) {
            return nullptr;
        }
        for (const auto &attribute : attributes) {
            if (attribute.id() == id) {
                return &attribute;
            }
        }
        return nullptr;
    }

    CsrParseResult CertificateRequest::parse(ByteSpan der, const ParseOptions &options) {
        auto result = parse_csr(der, options);
        if (!result.success) {
            spdlog::debug("[Csr] parse failed ({}): {}", error_kind_name(result.kind), result.error);
        }
        return result;
    }

    const Extensions *CertificateRequest::requested_extensions() const {
        for (const auto &attribute : info_.attributes) {
            if (const auto *request = std::get_if<ExtensionRequestAttribute>(&attribute.parsed)) {
                return &request->extensions;
            }
        }
        return nullptr;
    }

    std::optional<std::string> CertificateRequest::challenge_password() const {
        for (const auto &attribute : info_.attributes) {
            if (const auto *challenge = std::get_if<ChallengePasswordAttribute>(&attribute.parsed)) {
                return challenge->password;
            }
        }
        return std::nullopt;
    }

    hash::Result CertificateRequest::fingerprint(hash::Algorithm algo) const { return hash::digest(algo, raw_); }

} // namespace certview::cert
