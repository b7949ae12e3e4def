#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <certview/cert/certificate.hpp>

namespace certview::cert {

    // PKCS#9 extensionRequest
    struct ExtensionRequestAttribute {
        Extensions extensions{};
    };

    // PKCS#9 challengePassword
    struct ChallengePasswordAttribute {
        std::string password;
    };

    struct UnsupportedAttribute {
        ByteSpan value{};
    };

    using ParsedCriAttribute = std::variant<UnsupportedAttribute, ExtensionRequestAttribute, ChallengePasswordAttribute>;

    struct CriAttribute {
        Oid oid{};
        // The whole `values` SET, header included.
        ByteSpan value{};
        ParsedCriAttribute parsed{};

        [[nodiscard]] CriAttributeId id() const { return find_cri_attribute_by_oid(oid); }
        [[nodiscard]] bool is_unsupported() const noexcept {
            return std::holds_alternative<UnsupportedAttribute>(parsed);
        }
    };

    struct CertificationRequestInfo {
        X509Version version{X509Version::V1};
        DistinguishedName subject{};
        SubjectPublicKeyInfo subject_pki{};
        // Encounter order, unique OIDs.
        std::vector<CriAttribute> attributes;
        ByteSpan raw{};

        [[nodiscard]] const CriAttribute *find_attribute(const Oid &oid) const;
        [[nodiscard]] const CriAttribute *find_attribute(CriAttributeId id) const;
    };

    class CertificateRequest;
    using CsrParseResult = CertificateResult<CertificateRequest>;

    class CertificateRequest {
      public:
        CertificateRequest() = default;
        CertificateRequest(CertificationRequestInfo info, AlgorithmIdentifier signature_algorithm,
                           BitStringView signature_value, ByteSpan raw)
            : info_(std::move(info)), signature_algorithm_(std::move(signature_algorithm)),
              signature_value_(signature_value), raw_(raw) {}

        static CsrParseResult parse(ByteSpan der, const ParseOptions &options = {});

        [[nodiscard]] const CertificationRequestInfo &info() const noexcept { return info_; }
        [[nodiscard]] const AlgorithmIdentifier &signature_algorithm() const noexcept { return signature_algorithm_; }
        [[nodiscard]] const BitStringView &signature_value() const noexcept { return signature_value_; }
        [[nodiscard]] ByteSpan raw() const noexcept { return raw_; }

        [[nodiscard]] const DistinguishedName &subject() const noexcept { return info_.subject; }
        [[nodiscard]] const SubjectPublicKeyInfo &public_key() const noexcept { return info_.subject_pki; }
        [[nodiscard]] const std::vector<CriAttribute> &attributes() const noexcept { return info_.attributes; }

        // Extensions of the first decoded extensionRequest attribute, if any.
        [[nodiscard]] const Extensions *requested_extensions() const;
        [[nodiscard]] std::optional<std::string> challenge_password() const;

        [[nodiscard]] hash::Result fingerprint(hash::Algorithm algo = hash::Algorithm::SHA256) const;

      private:
        CertificationRequestInfo info_{};
        AlgorithmIdentifier signature_algorithm_{};
        BitStringView signature_value_{};
        ByteSpan raw_{};
    };

    namespace detail {

        ASN1Result<CriAttribute> parse_cri_attribute(ByteSpan input, size_t max_depth);
        ASN1Result<CertificationRequestInfo> parse_certification_request_info(ByteSpan input,
                                                                              const ParseOptions &options);

    } // namespace detail

} // namespace certview::cert
