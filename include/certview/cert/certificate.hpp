#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <certview/cert/asn1_utils.hpp>
#include <certview/cert/distinguished_name.hpp>
#include <certview/cert/extensions.hpp>
#include <certview/cert/parser_utils.hpp>
#include <certview/cert/validity.hpp>
#include <certview/hash/algorithms.hpp>

namespace certview::cert {

    /**
     * Outcome of a top-level decode. `remaining` holds the bytes following the
     * decoded structure; it is always empty in strict mode.
     */
    template <typename T> struct CertificateResult {
        bool success{};
        T value{};
        ByteSpan remaining{};
        ErrorKind kind{ErrorKind::None};
        std::string error{};

        static CertificateResult<T> failure(ErrorKind kind, std::string message) {
            return CertificateResult<T>{false, {}, {}, kind, std::move(message)};
        }

        template <typename U> static CertificateResult<T> failure(const ASN1Result<U> &other) {
            return CertificateResult<T>{false, {}, {}, other.kind, other.error};
        }

        static CertificateResult<T> ok(T value, ByteSpan remaining) {
            return CertificateResult<T>{true, std::move(value), remaining, ErrorKind::None, {}};
        }
    };

    enum class X509Version : uint32_t { V1 = 0, V2 = 1, V3 = 2 };

    struct TbsCertificate {
        X509Version version{X509Version::V1};
        SerialNumber serial{};
        AlgorithmIdentifier signature{};
        DistinguishedName issuer{};
        Validity validity{};
        DistinguishedName subject{};
        SubjectPublicKeyInfo subject_pki{};
        std::optional<BitStringView> issuer_uid{};
        std::optional<BitStringView> subject_uid{};
        Extensions extensions{};
        // Exact DER of the TBSCertificate SEQUENCE, i.e. the signed bytes.
        ByteSpan raw{};

        [[nodiscard]] const BasicConstraintsExtension *basic_constraints() const {
            return extensions.get<BasicConstraintsExtension>();
        }
        [[nodiscard]] const KeyUsageExtension *key_usage() const { return extensions.get<KeyUsageExtension>(); }
        [[nodiscard]] const ExtendedKeyUsageExtension *extended_key_usage() const {
            return extensions.get<ExtendedKeyUsageExtension>();
        }
        [[nodiscard]] const SubjectAltNameExtension *subject_alternative_name() const {
            return extensions.get<SubjectAltNameExtension>();
        }
        [[nodiscard]] const NameConstraintsExtension *name_constraints() const {
            return extensions.get<NameConstraintsExtension>();
        }
        [[nodiscard]] const PolicyConstraintsExtension *policy_constraints() const {
            return extensions.get<PolicyConstraintsExtension>();
        }
        [[nodiscard]] const PolicyMappingsExtension *policy_mappings() const {
            return extensions.get<PolicyMappingsExtension>();
        }
        [[nodiscard]] const InhibitAnyPolicyExtension *inhibit_any_policy() const {
            return extensions.get<InhibitAnyPolicyExtension>();
        }

        [[nodiscard]] bool is_ca() const {
            const auto *bc = basic_constraints();
            return bc != nullptr && bc->ca;
        }

        [[nodiscard]] ByteSpan raw_serial() const noexcept { return serial.raw; }
        [[nodiscard]] std::string raw_serial_as_string() const;
        // Numeric value in lower-case hex, without leading zeros.
        [[nodiscard]] std::string serial_hex() const;
    };

    class Certificate;
    using CertificateParseResult = CertificateResult<Certificate>;

    /**
     * Decoded X.509 certificate. Every view points into the buffer handed to parse(),
     * which must outlive the Certificate.
     */
    class Certificate {
      public:
        Certificate() = default;
        Certificate(TbsCertificate tbs, AlgorithmIdentifier signature_algorithm, BitStringView signature_value,
                    ByteSpan raw)
            : tbs_(std::move(tbs)), signature_algorithm_(std::move(signature_algorithm)),
              signature_value_(signature_value), raw_(raw) {}

        static CertificateParseResult parse(ByteSpan der, const ParseOptions &options = {});

        [[nodiscard]] const TbsCertificate &tbs() const noexcept { return tbs_; }
        [[nodiscard]] const AlgorithmIdentifier &signature_algorithm() const noexcept { return signature_algorithm_; }
        [[nodiscard]] const BitStringView &signature_value() const noexcept { return signature_value_; }
        [[nodiscard]] ByteSpan raw() const noexcept { return raw_; }

        [[nodiscard]] X509Version version() const noexcept { return tbs_.version; }
        [[nodiscard]] const DistinguishedName &subject() const noexcept { return tbs_.subject; }
        [[nodiscard]] const DistinguishedName &issuer() const noexcept { return tbs_.issuer; }
        [[nodiscard]] const Validity &validity() const noexcept { return tbs_.validity; }
        [[nodiscard]] const SubjectPublicKeyInfo &public_key() const noexcept { return tbs_.subject_pki; }
        [[nodiscard]] const Extensions &extensions() const noexcept { return tbs_.extensions; }

        // Digest of the complete DER encoding.
        [[nodiscard]] hash::Result fingerprint(hash::Algorithm algo = hash::Algorithm::SHA256) const;

      private:
        TbsCertificate tbs_{};
        AlgorithmIdentifier signature_algorithm_{};
        BitStringView signature_value_{};
        ByteSpan raw_{};
    };

    namespace detail {

        ASN1Result<TbsCertificate> parse_tbs_certificate(ByteSpan input, const ParseOptions &options);

    } // namespace detail

} // namespace certview::cert
