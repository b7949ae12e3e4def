#include <certview/cert/crl.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

#include <certview/utils/common.hpp>

namespace certview::cert {

    namespace {

        bool next_is_time(const detail::DerCursor &cursor) {
            auto identifier = peek_identifier(cursor.remaining());
            return identifier &&
                   (identifier->is_universal(ASN1Tag::UTCTime) || identifier->is_universal(ASN1Tag::GeneralizedTime));
        }

    } // namespace

    namespace detail {

        ASN1Result<RevokedCertificate> parse_revoked_certificate(ByteSpan input, const ParseOptions &options) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return forward_error<RevokedCertificate>(seq, ErrorKind::InvalidRevokedCertificates,
                                                         "revokedCertificate");
            }
            DerCursor cursor(seq.value);
            RevokedCertificate entry{};

            auto serial = parse_serial(cursor.remaining());
            if (!serial.success) {
                return forward_error<RevokedCertificate>(serial, ErrorKind::InvalidSerialNumber, "userCertificate");
            }
            if (options.strict && serial.value.negative) {
                return ASN1Result<RevokedCertificate>::failure("userCertificate: negative serial number",
                                                               ErrorKind::InvalidSerialNumber);
            }
            entry.serial = std::move(serial.value);
            cursor.advance(serial.bytes_consumed);

            auto revocation_date = parse_time(cursor.remaining());
            if (!revocation_date.success) {
                return forward_error<RevokedCertificate>(revocation_date, ErrorKind::InvalidDate, "revocationDate");
            }
            entry.revocation_date = revocation_date.value;
            cursor.advance(revocation_date.bytes_consumed);

            // crlEntryExtensions: a plain SEQUENCE OF Extension, no context tag
            if (!cursor.empty()) {
                auto extensions = parse_extensions(cursor.remaining(), options.max_depth);
                if (!extensions.success) {
                    return forward_error<RevokedCertificate>(extensions, ErrorKind::InvalidExtensions,
                                                             "crlEntryExtensions");
                }
                entry.extensions = std::move(extensions.value);
                cursor.advance(extensions.bytes_consumed);
            }

            if (!cursor.empty()) {
                return ASN1Result<RevokedCertificate>::failure("trailing data in revokedCertificate",
                                                               ErrorKind::InvalidRevokedCertificates);
            }
            return ASN1Result<RevokedCertificate>::ok(std::move(entry), seq.bytes_consumed);
        }

        ASN1Result<TbsCertList> parse_tbs_cert_list(ByteSpan input, const ParseOptions &options) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<TbsCertList>::failure(seq);
            }
            DerCursor cursor(seq.value);
            TbsCertList tbs{};
            tbs.raw = input.first(seq.bytes_consumed);

            // Version: untagged INTEGER, present only for v2
            auto next = peek_identifier(cursor.remaining());
            if (next && next->is_universal(ASN1Tag::Integer)) {
                auto version = parse_u32(cursor.remaining());
                if (!version.success) {
                    return forward_error<TbsCertList>(version, ErrorKind::InvalidVersion, "version");
                }
                if (version.value > static_cast<uint32_t>(X509Version::V2)) {
                    return ASN1Result<TbsCertList>::failure("version: unknown CRL version " +
                                                                std::to_string(version.value),
                                                            ErrorKind::InvalidVersion);
                }
                tbs.version = static_cast<X509Version>(version.value);
                cursor.advance(version.bytes_consumed);
            }
            const bool is_v2 = tbs.version == X509Version::V2;

            auto signature = parse_algorithm_identifier(cursor.remaining(), options.max_depth);
            if (!signature.success) {
                return forward_error<TbsCertList>(signature, ErrorKind::InvalidAlgorithmIdentifier, "signature");
            }
            tbs.signature = std::move(signature.value);
            cursor.advance(signature.bytes_consumed);

            auto issuer = parse_name(cursor.remaining(), options.max_depth);
            if (!issuer.success) {
                return forward_error<TbsCertList>(issuer, ErrorKind::InvalidName, "issuer");
            }
            tbs.issuer = std::move(issuer.value);
            cursor.advance(issuer.bytes_consumed);

            auto this_update = parse_time(cursor.remaining());
            if (!this_update.success) {
                return forward_error<TbsCertList>(this_update, ErrorKind::InvalidDate, "thisUpdate");
            }
            tbs.this_update = this_update.value;
            cursor.advance(this_update.bytes_consumed);

            if (!cursor.empty() && next_is_time(cursor)) {
                auto next_update = parse_time(cursor.remaining());
                if (!next_update.success) {
                    return forward_error<TbsCertList>(next_update, ErrorKind::InvalidDate, "nextUpdate");
                }
                tbs.next_update = next_update.value;
                cursor.advance(next_update.bytes_consumed);
            }

            // revokedCertificates: omitted entirely when the list is empty
            next = peek_identifier(cursor.remaining());
            if (next && next->is_universal(ASN1Tag::Sequence)) {
                auto list = parse_sequence(cursor.remaining());
                if (!list.success) {
                    return forward_error<TbsCertList>(list, ErrorKind::InvalidRevokedCertificates,
                                                      "revokedCertificates");
                }
                DerCursor list_cursor(list.value);
                while (!list_cursor.empty()) {
                    auto entry = parse_revoked_certificate(list_cursor.remaining(), options);
                    if (!entry.success) {
                        return forward_error<TbsCertList>(entry, ErrorKind::InvalidRevokedCertificates,
                                                          "revokedCertificates");
                    }
                    if (options.strict && !is_v2 && !entry.value.extensions.empty()) {
                        return ASN1Result<TbsCertList>::failure("crlEntryExtensions require version 2",
                                                                ErrorKind::InvalidVersion);
                    }
                    tbs.revoked_certificates.push_back(std::move(entry.value));
                    list_cursor.advance(entry.bytes_consumed);
                }
                cursor.advance(list.bytes_consumed);
            }

            // crlExtensions [0] EXPLICIT
            if (!cursor.empty() && cursor.at_context(0)) {
                if (options.strict && !is_v2) {
                    return ASN1Result<TbsCertList>::failure("crlExtensions require version 2",
                                                            ErrorKind::InvalidVersion);
                }
                auto wrapped = parse_explicit(cursor.remaining(), 0);
                if (!wrapped.success) {
                    return forward_error<TbsCertList>(wrapped, ErrorKind::InvalidExtensions, "crlExtensions");
                }
                auto extensions = parse_extensions(wrapped.value, options.max_depth);
                if (!extensions.success) {
                    return forward_error<TbsCertList>(extensions, ErrorKind::InvalidExtensions, "crlExtensions");
                }
                if (extensions.bytes_consumed != wrapped.value.size()) {
                    return ASN1Result<TbsCertList>::failure("crlExtensions: trailing data",
                                                            ErrorKind::InvalidExtensions);
                }
                tbs.extensions = std::move(extensions.value);
                cursor.advance(wrapped.bytes_consumed);
            }

            if (!cursor.empty()) {
                return ASN1Result<TbsCertList>::failure("unexpected data after TBSCertList fields",
                                                        ErrorKind::TrailingData);
            }
            return ASN1Result<TbsCertList>::ok(std::move(tbs), seq.bytes_consumed);
        }

    } // namespace detail

    namespace {

        CrlParseResult parse_crl(ByteSpan der, const ParseOptions &options) {
            auto outer = parse_sequence(der);
            if (!outer.success) {
                return CrlParseResult::failure(outer);
            }
            detail::DerCursor cursor(outer.value);

            auto tbs = detail::parse_tbs_cert_list(cursor.remaining(), options);
            if (!tbs.success) {
                return CrlParseResult::failure(tbs);
            }
            cursor.advance(tbs.bytes_consumed);

            auto signature_algorithm = detail::parse_algorithm_identifier(cursor.remaining(), options.max_depth);
            if (!signature_algorithm.success) {
                return CrlParseResult::failure(detail::forward_error<AlgorithmIdentifier>(
                    signature_algorithm, ErrorKind::InvalidAlgorithmIdentifier, "signatureAlgorithm"));
            }
            cursor.advance(signature_algorithm.bytes_consumed);

            auto signature_value = detail::parse_signature_value(cursor.remaining(), options.strict);
            if (!signature_value.success) {
                return CrlParseResult::failure(signature_value);
            }
            cursor.advance(signature_value.bytes_consumed);

            if (!cursor.empty()) {
                return CrlParseResult::failure(ErrorKind::TrailingData, "unexpected data after signatureValue");
            }

            const auto remaining = der.subspan(outer.bytes_consumed);
            if (options.strict && !remaining.empty()) {
                return CrlParseResult::failure(ErrorKind::TrailingData, "extra data after CRL");
            }

            CertificateRevocationList crl(std::move(tbs.value), std::move(signature_algorithm.value),
                                          signature_value.value, der.first(outer.bytes_consumed));
            return CrlParseResult::ok(std::move(crl), remaining);
        }

    } // namespace

    std::string RevokedCertificate::raw_serial_as_string() const { return utils::to_colon_hex(serial.raw); }

    std::optional<CrlReason> RevokedCertificate::reason_code() const {
        if (const auto *reason = extensions.get<ReasonCodeExtension>()) {
            return reason->reason;
        }
        return std::nullopt;
    }

    std::optional<TimePoint> RevokedCertificate::invalidity_date() const {
        if (const auto *date = extensions.get<InvalidityDateExtension>()) {
            return date->date;
        }
        return std::nullopt;
    }

    CrlParseResult CertificateRevocationList::parse(ByteSpan der, const ParseOptions &options) {
        auto result = parse_crl(der, options);
        if (!result.success) {
            spdlog::debug("[Crl] parse failed ({}): {}", error_kind_name(result.kind), result.error);
        }
        return result;
    }

    std::optional<mpz_class> CertificateRevocationList::crl_number() const {
        if (const auto *number = tbs_.extensions.get<CrlNumberExtension>()) {
            return number->number;
        }
        return std::nullopt;
    }

    const RevokedCertificate *CertificateRevocationList::find_revoked(ByteSpan serial) const {
        for (const auto &entry : tbs_.revoked_certificates) {
            if (std::equal(entry.serial.raw.begin(), entry.serial.raw.end(), serial.begin(), serial.end())) {
                return &entry;
            }
        }
        return nullptr;
    }

    const RevokedCertificate *CertificateRevocationList::find_revoked(const mpz_class &serial) const {
        for (const auto &entry : tbs_.revoked_certificates) {
            if (entry.serial.value == serial) {
                return &entry;
            }
        }
        return nullptr;
    }

    hash::Result CertificateRevocationList::fingerprint(hash::Algorithm algo) const {
        return hash::digest(algo, raw_);
    }

} // namespace certview::cert
