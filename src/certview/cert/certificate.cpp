#include <certview/cert/certificate.hpp>

#include <spdlog/spdlog.h>

#include <certview/utils/common.hpp>

namespace certview::cert {

    namespace detail {

        ASN1Result<TbsCertificate> parse_tbs_certificate(ByteSpan input, const ParseOptions &options) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<TbsCertificate>::failure(seq);
            }
            DerCursor cursor(seq.value);
            TbsCertificate tbs{};
            tbs.raw = input.first(seq.bytes_consumed);

            // Version: [0] EXPLICIT, DEFAULT v1
            auto version = parse_optional_version(cursor.remaining());
            if (!version.success) {
                return forward_error<TbsCertificate>(version, ErrorKind::InvalidVersion, "version");
            }
            if (version.value) {
                if (*version.value > static_cast<uint32_t>(X509Version::V3)) {
                    return ASN1Result<TbsCertificate>::failure("version: unknown value " +
                                                                   std::to_string(*version.value),
                                                               ErrorKind::InvalidVersion);
                }
                tbs.version = static_cast<X509Version>(*version.value);
            }
            cursor.advance(version.bytes_consumed);

            auto serial = parse_serial(cursor.remaining());
            if (!serial.success) {
                return forward_error<TbsCertificate>(serial, ErrorKind::InvalidSerialNumber, "serialNumber");
            }
            if (options.strict && serial.value.negative) {
                return ASN1Result<TbsCertificate>::failure("serialNumber: negative value",
                                                           ErrorKind::InvalidSerialNumber);
            }
            tbs.serial = std::move(serial.value);
            cursor.advance(serial.bytes_consumed);

            auto signature = parse_algorithm_identifier(cursor.remaining(), options.max_depth);
            if (!signature.success) {
                return forward_error<TbsCertificate>(signature, ErrorKind::InvalidAlgorithmIdentifier, "signature");
            }
            tbs.signature = std::move(signature.value);
            cursor.advance(signature.bytes_consumed);

            auto issuer = parse_name(cursor.remaining(), options.max_depth);
            if (!issuer.success) {
                return forward_error<TbsCertificate>(issuer, ErrorKind::InvalidName, "issuer");
            }
            tbs.issuer = std::move(issuer.value);
            cursor.advance(issuer.bytes_consumed);

            auto validity = parse_validity(cursor.remaining());
            if (!validity.success) {
                return forward_error<TbsCertificate>(validity, ErrorKind::InvalidValidity, "validity");
            }
            tbs.validity = validity.value;
            cursor.advance(validity.bytes_consumed);

            auto subject = parse_name(cursor.remaining(), options.max_depth);
            if (!subject.success) {
                return forward_error<TbsCertificate>(subject, ErrorKind::InvalidName, "subject");
            }
            tbs.subject = std::move(subject.value);
            cursor.advance(subject.bytes_consumed);

            auto spki = parse_subject_public_key_info(cursor.remaining(), options.max_depth);
            if (!spki.success) {
                return forward_error<TbsCertificate>(spki, ErrorKind::InvalidSubjectPublicKeyInfo,
                                                     "subjectPublicKeyInfo");
            }
            tbs.subject_pki = std::move(spki.value);
            cursor.advance(spki.bytes_consumed);

            // issuerUniqueID [1] and subjectUniqueID [2]: v2 and v3 only
            if (!cursor.empty() && cursor.at_context(1)) {
                if (options.strict && tbs.version == X509Version::V1) {
                    return ASN1Result<TbsCertificate>::failure("issuerUniqueID requires version 2 or 3",
                                                               ErrorKind::InvalidVersion);
                }
                auto uid = parse_unique_identifier(cursor.remaining(), 1);
                if (!uid.success) {
                    return forward_error<TbsCertificate>(uid, ErrorKind::InvalidUniqueIdentifier, "issuerUniqueID");
                }
                tbs.issuer_uid = uid.value;
                cursor.advance(uid.bytes_consumed);
            }
            if (!cursor.empty() && cursor.at_context(2)) {
                if (options.strict && tbs.version == X509Version::V1) {
                    return ASN1Result<TbsCertificate>::failure("subjectUniqueID requires version 2 or 3",
                                                               ErrorKind::InvalidVersion);
                }
                auto uid = parse_unique_identifier(cursor.remaining(), 2);
                if (!uid.success) {
                    return forward_error<TbsCertificate>(uid, ErrorKind::InvalidUniqueIdentifier,
                                                         "subjectUniqueID");
                }
                tbs.subject_uid = uid.value;
                cursor.advance(uid.bytes_consumed);
            }

            // extensions [3] EXPLICIT: v3 only
            if (!cursor.empty() && cursor.at_context(3)) {
                if (options.strict && tbs.version != X509Version::V3) {
                    return ASN1Result<TbsCertificate>::failure("extensions require version 3",
                                                               ErrorKind::InvalidVersion);
                }
                auto wrapped = parse_explicit(cursor.remaining(), 3);
                if (!wrapped.success) {
                    return forward_error<TbsCertificate>(wrapped, ErrorKind::InvalidExtensions, "extensions");
                }
                auto extensions = parse_extensions(wrapped.value, options.max_depth);
                if (!extensions.success) {
                    return forward_error<TbsCertificate>(extensions, ErrorKind::InvalidExtensions, "extensions");
                }
                if (extensions.bytes_consumed != wrapped.value.size()) {
                    return ASN1Result<TbsCertificate>::failure("extensions: trailing data",
                                                               ErrorKind::InvalidExtensions);
                }
                tbs.extensions = std::move(extensions.value);
                cursor.advance(wrapped.bytes_consumed);
            }

            if (!cursor.empty()) {
                return ASN1Result<TbsCertificate>::failure("unexpected data after TBSCertificate fields",
                                                           ErrorKind::TrailingData);
            }
            return ASN1Result<TbsCertificate>::ok(std::move(tbs), seq.bytes_consumed);
        }

    } // namespace detail

    namespace {

        CertificateParseResult parse_certificate(ByteSpan der, const ParseOptions &options) {
            auto outer = parse_sequence(der);
            if (!outer.success) {
                return CertificateParseResult::failure(outer);
            }
            detail::DerCursor cursor(outer.value);

            auto tbs = detail::parse_tbs_certificate(cursor.remaining(), options);
            if (!tbs.success) {
                return CertificateParseResult::failure(tbs);
            }
            cursor.advance(tbs.bytes_consumed);

            auto signature_algorithm = detail::parse_algorithm_identifier(cursor.remaining(), options.max_depth);
            if (!signature_algorithm.success) {
                return CertificateParseResult::failure(detail::forward_error<AlgorithmIdentifier>(
                    signature_algorithm, ErrorKind::InvalidAlgorithmIdentifier, "signatureAlgorithm"));
            }
            cursor.advance(signature_algorithm.bytes_consumed);

            auto signature_value = detail::parse_signature_value(cursor.remaining(), options.strict);
            if (!signature_value.success) {
                return CertificateParseResult::failure(signature_value);
            }
            cursor.advance(signature_value.bytes_consumed);

            if (!cursor.empty()) {
                return CertificateParseResult::failure(ErrorKind::TrailingData,
                                                       "unexpected data after signatureValue");
            }

            const auto remaining = der.subspan(outer.bytes_consumed);
            if (options.strict && !remaining.empty()) {
                return CertificateParseResult::failure(ErrorKind::TrailingData, "extra data after certificate");
            }

            Certificate certificate(std::move(tbs.value), std::move(signature_algorithm.value), signature_value.value,
                                    der.first(outer.bytes_consumed));
            return CertificateParseResult::ok(std::move(certificate), remaining);
        }

    } // namespace

    std::string TbsCertificate::raw_serial_as_string() const { return utils::to_colon_hex(serial.raw); }

    std::string TbsCertificate::serial_hex() const { return serial.value.get_str(16); }

    CertificateParseResult Certificate::parse(ByteSpan der, const ParseOptions &options) {
        auto result = parse_certificate(der, options);
        if (!result.success) {
            spdlog::debug("[Certificate] parse failed ({}): {}", error_kind_name(result.kind), result.error);
        }
        return result;
    }

    hash::Result Certificate::fingerprint(hash::Algorithm algo) const { return hash::digest(algo, raw_); }

} // namespace certview::cert
