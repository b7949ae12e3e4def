#pragma once

#include <optional>
#include <string>
#include <vector>

#include <gmpxx.h>

#include <certview/cert/certificate.hpp>

namespace certview::cert {

    // Revoked Certificate Entry
    struct RevokedCertificate {
        SerialNumber serial{};
        TimePoint revocation_date{};
        // crlEntryExtensions (v2 only)
        Extensions extensions{};

        [[nodiscard]] ByteSpan raw_serial() const noexcept { return serial.raw; }
        [[nodiscard]] std::string raw_serial_as_string() const;

        [[nodiscard]] std::optional<CrlReason> reason_code() const;
        [[nodiscard]] std::optional<TimePoint> invalidity_date() const;
        [[nodiscard]] const CertificateIssuerExtension *certificate_issuer() const {
            return extensions.get<CertificateIssuerExtension>();
        }
    };

    struct TbsCertList {
        // Absent in v1 lists.
        std::optional<X509Version> version{};
        AlgorithmIdentifier signature{};
        DistinguishedName issuer{};
        TimePoint this_update{};
        std::optional<TimePoint> next_update{};
        std::vector<RevokedCertificate> revoked_certificates;
        Extensions extensions{};
        ByteSpan raw{};
    };

    class CertificateRevocationList;
    using CrlParseResult = CertificateResult<CertificateRevocationList>;

    class CertificateRevocationList {
      public:
        CertificateRevocationList() = default;
        CertificateRevocationList(TbsCertList tbs, AlgorithmIdentifier signature_algorithm,
                                  BitStringView signature_value, ByteSpan raw)
            : tbs_(std::move(tbs)), signature_algorithm_(std::move(signature_algorithm)),
              signature_value_(signature_value), raw_(raw) {}

        static CrlParseResult parse(ByteSpan der, const ParseOptions &options = {});

        [[nodiscard]] const TbsCertList &tbs() const noexcept { return tbs_; }
        [[nodiscard]] const AlgorithmIdentifier &signature_algorithm() const noexcept { return signature_algorithm_; }
        [[nodiscard]] const BitStringView &signature_value() const noexcept { return signature_value_; }
        [[nodiscard]] ByteSpan raw() const noexcept { return raw_; }

        [[nodiscard]] X509Version version() const noexcept { return tbs_.version.value_or(X509Version::V1); }
        [[nodiscard]] const DistinguishedName &issuer() const noexcept { return tbs_.issuer; }
        [[nodiscard]] TimePoint last_update() const noexcept { return tbs_.this_update; }
        [[nodiscard]] std::optional<TimePoint> next_update() const noexcept { return tbs_.next_update; }
        [[nodiscard]] const std::vector<RevokedCertificate> &revoked() const noexcept {
            return tbs_.revoked_certificates;
        }
        [[nodiscard]] const Extensions &extensions() const noexcept { return tbs_.extensions; }

        [[nodiscard]] std::optional<mpz_class> crl_number() const;
        [[nodiscard]] const AuthorityKeyIdentifierExtension *authority_key_identifier() const {
            return tbs_.extensions.get<AuthorityKeyIdentifierExtension>();
        }

        // Lookup by the serial's INTEGER content octets, compared byte for byte.
        [[nodiscard]] const RevokedCertificate *find_revoked(ByteSpan serial) const;
        [[nodiscard]] const RevokedCertificate *find_revoked(const mpz_class &serial) const;

        [[nodiscard]] hash::Result fingerprint(hash::Algorithm algo = hash::Algorithm::SHA256) const;

      private:
        TbsCertList tbs_{};
        AlgorithmIdentifier signature_algorithm_{};
        BitStringView signature_value_{};
        ByteSpan raw_{};
    };

    namespace detail {

        ASN1Result<TbsCertList> parse_tbs_cert_list(ByteSpan input, const ParseOptions &options);
        ASN1Result<RevokedCertificate> parse_revoked_certificate(ByteSpan input, const ParseOptions &options);

    } // namespace detail

} // namespace certview::cert
