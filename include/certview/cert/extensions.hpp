#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <gmpxx.h>

#include <certview/cert/asn1_utils.hpp>
#include <certview/cert/distinguished_name.hpp>
#include <certview/cert/oid_registry.hpp>

namespace certview::cert {

    // CRL Revocation Reasons (RFC 5280 Section 5.3.1)
    enum class CrlReason : uint8_t {
        Unspecified = 0,
        KeyCompromise = 1,
        CaCompromise = 2,
        AffiliationChanged = 3,
        Superseded = 4,
        CessationOfOperation = 5,
        CertificateHold = 6,
        // value 7 is not used
        RemoveFromCrl = 8,
        PrivilegeWithdrawn = 9,
        AaCompromise = 10
    };

    [[nodiscard]] std::string_view crl_reason_name(CrlReason reason) noexcept;

    // Tag numbers of the GeneralName CHOICE.
    enum class GeneralNameType : uint8_t {
        OtherName = 0,
        Email = 1,
        DNSName = 2,
        X400Address = 3,
        DirectoryName = 4,
        EdiPartyName = 5,
        URI = 6,
        IPAddress = 7,
        RegisteredID = 8
    };

    struct GeneralName {
        GeneralNameType type{GeneralNameType::OtherName};
        // Content octets of the tagged value. For directoryName this is the encoded Name.
        ByteSpan value{};
        std::optional<DistinguishedName> directory_name{};

        [[nodiscard]] std::string text() const;
    };

    struct BasicConstraintsExtension {
        bool ca{false};
        std::optional<uint32_t> path_len_constraint{};
    };

    struct KeyUsageExtension {
        enum : uint16_t {
            DigitalSignature = 0x8000,
            NonRepudiation = 0x4000,
            KeyEncipherment = 0x2000,
            DataEncipherment = 0x1000,
            KeyAgreement = 0x0800,
            KeyCertSign = 0x0400,
            CRLSign = 0x0200,
            EncipherOnly = 0x0100,
            DecipherOnly = 0x0080
        };

        uint16_t bits{0};

        [[nodiscard]] bool has(uint16_t flag) const noexcept { return (bits & flag) != 0; }
        [[nodiscard]] bool digital_signature() const noexcept { return has(DigitalSignature); }
        [[nodiscard]] bool key_cert_sign() const noexcept { return has(KeyCertSign); }
        [[nodiscard]] bool crl_sign() const noexcept { return has(CRLSign); }
    };

    struct ExtendedKeyUsageExtension {
        std::vector<Oid> purposes;

        [[nodiscard]] bool has_purpose(KeyPurposeId purpose) const;
        [[nodiscard]] bool allows_server_auth() const { return has_purpose(KeyPurposeId::ServerAuth); }
        [[nodiscard]] bool allows_client_auth() const { return has_purpose(KeyPurposeId::ClientAuth); }
        [[nodiscard]] bool allows_code_signing() const { return has_purpose(KeyPurposeId::CodeSigning); }
        [[nodiscard]] bool allows_any() const { return has_purpose(KeyPurposeId::AnyExtendedKeyUsage); }
    };

    struct SubjectKeyIdentifierExtension {
        ByteSpan key_identifier{};
    };

    struct AuthorityKeyIdentifierExtension {
        std::optional<ByteSpan> key_identifier{};
        std::optional<std::vector<GeneralName>> authority_cert_issuer{};
        std::optional<ByteSpan> authority_cert_serial{};
    };

    struct SubjectAltNameExtension {
        std::vector<GeneralName> general_names;
    };

    struct IssuerAltNameExtension {
        std::vector<GeneralName> general_names;
    };

    struct PolicyQualifierInfo {
        Oid policy_qualifier_id{};
        Any qualifier{};
    };

    struct PolicyInformation {
        Oid policy_id{};
        std::vector<PolicyQualifierInfo> qualifiers;

        [[nodiscard]] bool is_any_policy() const { return policy_id.to_string() == kAnyPolicyOid; }
    };

    struct CertificatePoliciesExtension {
        std::vector<PolicyInformation> policies;
    };

    struct PolicyMapping {
        Oid issuer_domain_policy{};
        Oid subject_domain_policy{};
    };

    struct PolicyMappingsExtension {
        std::vector<PolicyMapping> mappings;
    };

    struct PolicyConstraintsExtension {
        std::optional<uint32_t> require_explicit_policy{};
        std::optional<uint32_t> inhibit_policy_mapping{};
    };

    struct InhibitAnyPolicyExtension {
        uint32_t skip_certs{0};
    };

    struct GeneralSubtree {
        GeneralName base{};
        uint32_t minimum{0};
        std::optional<uint32_t> maximum{};
    };

    struct NameConstraintsExtension {
        std::optional<std::vector<GeneralSubtree>> permitted_subtrees{};
        std::optional<std::vector<GeneralSubtree>> excluded_subtrees{};
    };

    struct AccessDescription {
        Oid access_method{};
        GeneralName access_location{};

        [[nodiscard]] AccessMethodId method() const { return find_access_method_by_oid(access_method); }
    };

    struct AuthorityInfoAccessExtension {
        std::vector<AccessDescription> accessdescs;
    };

    struct DistributionPointName {
        enum class Kind { FullName, NameRelativeToCrlIssuer };

        Kind kind{Kind::FullName};
        std::vector<GeneralName> full_name;
        RelativeDistinguishedName relative_name{};
    };

    struct DistributionPoint {
        std::optional<DistributionPointName> distribution_point{};
        // ReasonFlags bits, first named bit in the most significant position.
        std::optional<uint16_t> reasons{};
        std::optional<std::vector<GeneralName>> crl_issuer{};
    };

    struct CrlDistributionPointsExtension {
        std::vector<DistributionPoint> points;
    };

    struct CrlNumberExtension {
        mpz_class number{};
        ByteSpan raw{};
    };

    struct DeltaCrlIndicatorExtension {
        mpz_class base_crl_number{};
        ByteSpan raw{};
    };

    struct ReasonCodeExtension {
        CrlReason reason{CrlReason::Unspecified};
    };

    struct InvalidityDateExtension {
        TimePoint date{};
    };

    struct CertificateIssuerExtension {
        std::vector<GeneralName> general_names;
    };

    // Unknown OID, or known OID whose body could not be decoded. The bytes stay available.
    struct UnsupportedExtension {
        ByteSpan value{};
    };

    using ParsedExtension =
        std::variant<UnsupportedExtension, BasicConstraintsExtension, KeyUsageExtension, ExtendedKeyUsageExtension,
                     SubjectKeyIdentifierExtension, AuthorityKeyIdentifierExtension, SubjectAltNameExtension,
                     IssuerAltNameExtension, CertificatePoliciesExtension, PolicyMappingsExtension,
                     PolicyConstraintsExtension, InhibitAnyPolicyExtension, NameConstraintsExtension,
                     AuthorityInfoAccessExtension, CrlDistributionPointsExtension, CrlNumberExtension,
                     DeltaCrlIndicatorExtension, ReasonCodeExtension, InvalidityDateExtension,
                     CertificateIssuerExtension>;

    struct X509Extension {
        Oid oid{};
        bool critical{false};
        // OCTET STRING content (extnValue).
        ByteSpan value{};
        ParsedExtension parsed{};

        [[nodiscard]] ExtensionId id() const { return find_extension_by_oid(oid); }
        [[nodiscard]] bool is_unsupported() const noexcept {
            return std::holds_alternative<UnsupportedExtension>(parsed);
        }
    };

    /**
     * Extensions in encounter order with unique OIDs.
     */
    class Extensions {
      public:
        using const_iterator = std::vector<X509Extension>::const_iterator;

        // Returns false, leaving the set unchanged, if the OID is already present.
        bool insert(X509Extension extension);

        [[nodiscard]] const X509Extension *find(const Oid &oid) const;
        [[nodiscard]] const X509Extension *find(ExtensionId id) const;

        template <typename T> [[nodiscard]] const T *get() const {
            for (const auto &ext : items_) {
                if (const auto *value = std::get_if<T>(&ext.parsed)) {
                    return value;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const std::vector<X509Extension> &all() const noexcept { return items_; }
        [[nodiscard]] size_t size() const noexcept { return items_.size(); }
        [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
        [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

      private:
        std::vector<X509Extension> items_;
    };

    // True when the OID has a dedicated decoder.
    [[nodiscard]] bool is_known_extension(const Oid &oid);

    // Runs the decoder registered for `oid` over the extnValue content. Unknown OIDs yield
    // UnsupportedExtension; a failing decoder yields its error.
    ASN1Result<ParsedExtension> dispatch_extension(const Oid &oid, ByteSpan value, size_t max_depth);

    namespace detail {

        ASN1Result<GeneralName> parse_general_name(ByteSpan input, size_t max_depth);
        // Content of a GeneralNames SEQUENCE (or of an IMPLICIT tag replacing it).
        ASN1Result<std::vector<GeneralName>> parse_general_names_content(ByteSpan content, size_t max_depth);

        // One Extension SEQUENCE, critical/unsupported policy applied.
        ASN1Result<X509Extension> parse_extension(ByteSpan input, size_t max_depth);
        // SEQUENCE OF Extension. Duplicate OIDs fail with DuplicateExtension.
        ASN1Result<Extensions> parse_extensions(ByteSpan input, size_t max_depth);

    } // namespace detail

} // namespace certview::cert
