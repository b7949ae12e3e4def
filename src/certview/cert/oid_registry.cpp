#include <certview/cert/oid_registry.hpp>

#include <array>
#include <span>
#include <utility>

namespace certview::cert {

    namespace {

        template <size_t N> using OidArray = std::array<uint32_t, N>;

        template <typename Enum, size_t N>
        Enum lookup_enum(const Oid &oid, const std::array<std::pair<Enum, std::span<const uint32_t>>, N> &table,
                         Enum unknown) {
            for (const auto &[value, pattern] : table) {
                if (oid.matches(pattern)) {
                    return value;
                }
            }
            return unknown;
        }

        template <typename Enum, size_t N>
        std::optional<Oid> lookup_oid(Enum id, const std::array<std::pair<Enum, std::span<const uint32_t>>, N> &table) {
            for (const auto &[value, pattern] : table) {
                if (value == id) {
                    return Oid{std::vector<uint32_t>(pattern.begin(), pattern.end())};
                }
            }
            return std::nullopt;
        }

        // Signature algorithms
        constexpr OidArray<7> kOidSha1WithRsa{1, 2, 840, 113549, 1, 1, 5};
        constexpr OidArray<7> kOidSha256WithRsa{1, 2, 840, 113549, 1, 1, 11};
        constexpr OidArray<7> kOidSha384WithRsa{1, 2, 840, 113549, 1, 1, 12};
        constexpr OidArray<7> kOidSha512WithRsa{1, 2, 840, 113549, 1, 1, 13};
        constexpr OidArray<7> kOidRsaPss{1, 2, 840, 113549, 1, 1, 10};
        constexpr OidArray<7> kOidEcdsaSha256{1, 2, 840, 10045, 4, 3, 2};
        constexpr OidArray<7> kOidEcdsaSha384{1, 2, 840, 10045, 4, 3, 3};
        constexpr OidArray<7> kOidEcdsaSha512{1, 2, 840, 10045, 4, 3, 4};
        constexpr OidArray<4> kOidEd25519{1, 3, 101, 112};
        constexpr OidArray<4> kOidEd448{1, 3, 101, 113};

        constexpr std::array<std::pair<SignatureAlgorithmId, std::span<const uint32_t>>, 10> kSignatureAlgorithms = {
            std::pair{SignatureAlgorithmId::RsaPkcs1Sha1, std::span<const uint32_t>(kOidSha1WithRsa)},
            std::pair{SignatureAlgorithmId::RsaPkcs1Sha256, std::span<const uint32_t>(kOidSha256WithRsa)},
            std::pair{SignatureAlgorithmId::RsaPkcs1Sha384, std::span<const uint32_t>(kOidSha384WithRsa)},
            std::pair{SignatureAlgorithmId::RsaPkcs1Sha512, std::span<const uint32_t>(kOidSha512WithRsa)},
            std::pair{SignatureAlgorithmId::RsaPss, std::span<const uint32_t>(kOidRsaPss)},
            std::pair{SignatureAlgorithmId::EcdsaSha256, std::span<const uint32_t>(kOidEcdsaSha256)},
            std::pair{SignatureAlgorithmId::EcdsaSha384, std::span<const uint32_t>(kOidEcdsaSha384)},
            std::pair{SignatureAlgorithmId::EcdsaSha512, std::span<const uint32_t>(kOidEcdsaSha512)},
            std::pair{SignatureAlgorithmId::Ed25519, std::span<const uint32_t>(kOidEd25519)},
            std::pair{SignatureAlgorithmId::Ed448, std::span<const uint32_t>(kOidEd448)},
        };

        // Public key algorithms
        constexpr OidArray<7> kOidRsaEncryption{1, 2, 840, 113549, 1, 1, 1};
        constexpr OidArray<6> kOidEcPublicKey{1, 2, 840, 10045, 2, 1};
        constexpr OidArray<4> kOidX25519{1, 3, 101, 110};
        constexpr OidArray<4> kOidX448{1, 3, 101, 111};

        constexpr std::array<std::pair<PublicKeyAlgorithmId, std::span<const uint32_t>>, 7> kPublicKeyAlgorithms = {
            std::pair{PublicKeyAlgorithmId::Rsa, std::span<const uint32_t>(kOidRsaEncryption)},
            std::pair{PublicKeyAlgorithmId::Rsa, std::span<const uint32_t>(kOidRsaPss)},
            std::pair{PublicKeyAlgorithmId::Ec, std::span<const uint32_t>(kOidEcPublicKey)},
            std::pair{PublicKeyAlgorithmId::Ed25519, std::span<const uint32_t>(kOidEd25519)},
            std::pair{PublicKeyAlgorithmId::Ed448, std::span<const uint32_t>(kOidEd448)},
            std::pair{PublicKeyAlgorithmId::X25519, std::span<const uint32_t>(kOidX25519)},
            std::pair{PublicKeyAlgorithmId::X448, std::span<const uint32_t>(kOidX448)},
        };

        // Named curves
        constexpr OidArray<7> kOidSecp256r1{1, 2, 840, 10045, 3, 1, 7};
        constexpr OidArray<5> kOidSecp384r1{1, 3, 132, 0, 34};
        constexpr OidArray<5> kOidSecp521r1{1, 3, 132, 0, 35};
        constexpr OidArray<5> kOidSecp256k1{1, 3, 132, 0, 10};

        constexpr std::array<std::pair<CurveId, std::span<const uint32_t>>, 4> kCurveOids = {
            std::pair{CurveId::Secp256r1, std::span<const uint32_t>(kOidSecp256r1)},
            std::pair{CurveId::Secp384r1, std::span<const uint32_t>(kOidSecp384r1)},
            std::pair{CurveId::Secp521r1, std::span<const uint32_t>(kOidSecp521r1)},
            std::pair{CurveId::Secp256k1, std::span<const uint32_t>(kOidSecp256k1)},
        };

        // Extensions
        constexpr OidArray<4> kOidBasicConstraints{2, 5, 29, 19};
        constexpr OidArray<4> kOidKeyUsage{2, 5, 29, 15};
        constexpr OidArray<4> kOidExtendedKeyUsage{2, 5, 29, 37};
        constexpr OidArray<4> kOidSubjectAltName{2, 5, 29, 17};
        constexpr OidArray<4> kOidAuthorityKeyId{2, 5, 29, 35};
        constexpr OidArray<4> kOidSubjectKeyId{2, 5, 29, 14};
        constexpr OidArray<4> kOidCertificatePolicies{2, 5, 29, 32};
        constexpr OidArray<4> kOidCrlDistributionPoints{2, 5, 29, 31};
        constexpr OidArray<9> kOidAuthorityInfoAccess{1, 3, 6, 1, 5, 5, 7, 1, 1};
        constexpr OidArray<4> kOidNameConstraints{2, 5, 29, 30};
        constexpr OidArray<4> kOidIssuerAltName{2, 5, 29, 18};
        constexpr OidArray<4> kOidPolicyMappings{2, 5, 29, 33};
        constexpr OidArray<4> kOidPolicyConstraints{2, 5, 29, 36};
        constexpr OidArray<4> kOidInhibitAnyPolicy{2, 5, 29, 54};
        constexpr OidArray<4> kOidCrlNumber{2, 5, 29, 20};
        constexpr OidArray<4> kOidDeltaCrlIndicator{2, 5, 29, 27};
        constexpr OidArray<4> kOidReasonCode{2, 5, 29, 21};
        constexpr OidArray<4> kOidInvalidityDate{2, 5, 29, 24};
        constexpr OidArray<4> kOidCertificateIssuer{2, 5, 29, 29};

        constexpr std::array<std::pair<ExtensionId, std::span<const uint32_t>>, 19> kExtensionOids = {
            std::pair{ExtensionId::BasicConstraints, std::span<const uint32_t>(kOidBasicConstraints)},
            std::pair{ExtensionId::KeyUsage, std::span<const uint32_t>(kOidKeyUsage)},
            std::pair{ExtensionId::ExtendedKeyUsage, std::span<const uint32_t>(kOidExtendedKeyUsage)},
            std::pair{ExtensionId::SubjectAltName, std::span<const uint32_t>(kOidSubjectAltName)},
            std::pair{ExtensionId::AuthorityKeyIdentifier, std::span<const uint32_t>(kOidAuthorityKeyId)},
            std::pair{ExtensionId::SubjectKeyIdentifier, std::span<const uint32_t>(kOidSubjectKeyId)},
            std::pair{ExtensionId::CertificatePolicies, std::span<const uint32_t>(kOidCertificatePolicies)},
            std::pair{ExtensionId::CRLDistributionPoints, std::span<const uint32_t>(kOidCrlDistributionPoints)},
            std::pair{ExtensionId::AuthorityInfoAccess, std::span<const uint32_t>(kOidAuthorityInfoAccess)},
            std::pair{ExtensionId::NameConstraints, std::span<const uint32_t>(kOidNameConstraints)},
            std::pair{ExtensionId::IssuerAltName, std::span<const uint32_t>(kOidIssuerAltName)},
            std::pair{ExtensionId::PolicyMappings, std::span<const uint32_t>(kOidPolicyMappings)},
            std::pair{ExtensionId::PolicyConstraints, std::span<const uint32_t>(kOidPolicyConstraints)},
            std::pair{ExtensionId::InhibitAnyPolicy, std::span<const uint32_t>(kOidInhibitAnyPolicy)},
            std::pair{ExtensionId::CRLNumber, std::span<const uint32_t>(kOidCrlNumber)},
            std::pair{ExtensionId::DeltaCRLIndicator, std::span<const uint32_t>(kOidDeltaCrlIndicator)},
            std::pair{ExtensionId::ReasonCode, std::span<const uint32_t>(kOidReasonCode)},
            std::pair{ExtensionId::InvalidityDate, std::span<const uint32_t>(kOidInvalidityDate)},
            std::pair{ExtensionId::CertificateIssuer, std::span<const uint32_t>(kOidCertificateIssuer)},
        };

        // PKCS#9 attributes carried in certification requests
        constexpr OidArray<7> kOidExtensionRequest{1, 2, 840, 113549, 1, 9, 14};
        constexpr OidArray<7> kOidChallengePassword{1, 2, 840, 113549, 1, 9, 7};

        constexpr std::array<std::pair<CriAttributeId, std::span<const uint32_t>>, 2> kCriAttributeOids = {
            std::pair{CriAttributeId::ExtensionRequest, std::span<const uint32_t>(kOidExtensionRequest)},
            std::pair{CriAttributeId::ChallengePassword, std::span<const uint32_t>(kOidChallengePassword)},
        };

        // Name attributes
        constexpr OidArray<4> kOidCommonName{2, 5, 4, 3};
        constexpr OidArray<4> kOidSurname{2, 5, 4, 4};
        constexpr OidArray<4> kOidSerialNumber{2, 5, 4, 5};
        constexpr OidArray<4> kOidCountryName{2, 5, 4, 6};
        constexpr OidArray<4> kOidLocalityName{2, 5, 4, 7};
        constexpr OidArray<4> kOidStateOrProvince{2, 5, 4, 8};
        constexpr OidArray<4> kOidStreetAddress{2, 5, 4, 9};
        constexpr OidArray<4> kOidOrganizationName{2, 5, 4, 10};
        constexpr OidArray<4> kOidOrganizationalUnit{2, 5, 4, 11};
        constexpr OidArray<4> kOidTitle{2, 5, 4, 12};
        constexpr OidArray<4> kOidGivenName{2, 5, 4, 42};
        constexpr OidArray<4> kOidInitials{2, 5, 4, 43};
        constexpr OidArray<4> kOidGenerationQualifier{2, 5, 4, 44};
        constexpr OidArray<4> kOidDnQualifier{2, 5, 4, 46};
        constexpr OidArray<4> kOidPseudonym{2, 5, 4, 65};
        constexpr OidArray<7> kOidEmailAddress{1, 2, 840, 113549, 1, 9, 1};
        constexpr OidArray<7> kOidDomainComponent{0, 9, 2342, 19200300, 100, 1, 25};
        constexpr OidArray<7> kOidUserId{0, 9, 2342, 19200300, 100, 1, 1};

        constexpr std::array<std::pair<DistinguishedNameAttribute, std::span<const uint32_t>>, 18> kDnAttributeOids = {
            std::pair{DistinguishedNameAttribute::CommonName, std::span<const uint32_t>(kOidCommonName)},
            std::pair{DistinguishedNameAttribute::Surname, std::span<const uint32_t>(kOidSurname)},
            std::pair{DistinguishedNameAttribute::SerialNumber, std::span<const uint32_t>(kOidSerialNumber)},
            std::pair{DistinguishedNameAttribute::CountryName, std::span<const uint32_t>(kOidCountryName)},
            std::pair{DistinguishedNameAttribute::LocalityName, std::span<const uint32_t>(kOidLocalityName)},
            std::pair{DistinguishedNameAttribute::StateOrProvinceName, std::span<const uint32_t>(kOidStateOrProvince)},
            std::pair{DistinguishedNameAttribute::StreetAddress, std::span<const uint32_t>(kOidStreetAddress)},
            std::pair{DistinguishedNameAttribute::OrganizationName, std::span<const uint32_t>(kOidOrganizationName)},
            std::pair{DistinguishedNameAttribute::OrganizationalUnitName,
                      std::span<const uint32_t>(kOidOrganizationalUnit)},
            std::pair{DistinguishedNameAttribute::Title, std::span<const uint32_t>(kOidTitle)},
            std::pair{DistinguishedNameAttribute::GivenName, std::span<const uint32_t>(kOidGivenName)},
            std::pair{DistinguishedNameAttribute::Initials, std::span<const uint32_t>(kOidInitials)},
            std::pair{DistinguishedNameAttribute::GenerationQualifier,
                      std::span<const uint32_t>(kOidGenerationQualifier)},
            std::pair{DistinguishedNameAttribute::DnQualifier, std::span<const uint32_t>(kOidDnQualifier)},
            std::pair{DistinguishedNameAttribute::Pseudonym, std::span<const uint32_t>(kOidPseudonym)},
            std::pair{DistinguishedNameAttribute::EmailAddress, std::span<const uint32_t>(kOidEmailAddress)},
            std::pair{DistinguishedNameAttribute::DomainComponent, std::span<const uint32_t>(kOidDomainComponent)},
            std::pair{DistinguishedNameAttribute::UserId, std::span<const uint32_t>(kOidUserId)},
        };

        constexpr std::array<std::pair<DistinguishedNameAttribute, std::string_view>, 18> kDnAbbreviations = {
            std::pair{DistinguishedNameAttribute::CommonName, std::string_view("CN")},
            std::pair{DistinguishedNameAttribute::Surname, std::string_view("SN")},
            std::pair{DistinguishedNameAttribute::SerialNumber, std::string_view("serialNumber")},
            std::pair{DistinguishedNameAttribute::CountryName, std::string_view("C")},
            std::pair{DistinguishedNameAttribute::LocalityName, std::string_view("L")},
            std::pair{DistinguishedNameAttribute::StateOrProvinceName, std::string_view("ST")},
            std::pair{DistinguishedNameAttribute::StreetAddress, std::string_view("street")},
            std::pair{DistinguishedNameAttribute::OrganizationName, std::string_view("O")},
            std::pair{DistinguishedNameAttribute::OrganizationalUnitName, std::string_view("OU")},
            std::pair{DistinguishedNameAttribute::Title, std::string_view("title")},
            std::pair{DistinguishedNameAttribute::GivenName, std::string_view("GN")},
            std::pair{DistinguishedNameAttribute::Initials, std::string_view("initials")},
            std::pair{DistinguishedNameAttribute::GenerationQualifier, std::string_view("generationQualifier")},
            std::pair{DistinguishedNameAttribute::DnQualifier, std::string_view("dnQualifier")},
            std::pair{DistinguishedNameAttribute::Pseudonym, std::string_view("pseudonym")},
            std::pair{DistinguishedNameAttribute::EmailAddress, std::string_view("emailAddress")},
            std::pair{DistinguishedNameAttribute::DomainComponent, std::string_view("DC")},
            std::pair{DistinguishedNameAttribute::UserId, std::string_view("UID")},
        };

        // Key purposes (RFC 5280 section 4.2.1.12)
        constexpr OidArray<5> kOidAnyExtendedKeyUsage{2, 5, 29, 37, 0};
        constexpr OidArray<9> kOidServerAuth{1, 3, 6, 1, 5, 5, 7, 3, 1};
        constexpr OidArray<9> kOidClientAuth{1, 3, 6, 1, 5, 5, 7, 3, 2};
        constexpr OidArray<9> kOidCodeSigning{1, 3, 6, 1, 5, 5, 7, 3, 3};
        constexpr OidArray<9> kOidEmailProtection{1, 3, 6, 1, 5, 5, 7, 3, 4};
        constexpr OidArray<9> kOidTimeStamping{1, 3, 6, 1, 5, 5, 7, 3, 8};
        constexpr OidArray<9> kOidOcspSigning{1, 3, 6, 1, 5, 5, 7, 3, 9};

        constexpr std::array<std::pair<KeyPurposeId, std::span<const uint32_t>>, 7> kKeyPurposeOids = {
            std::pair{KeyPurposeId::AnyExtendedKeyUsage, std::span<const uint32_t>(kOidAnyExtendedKeyUsage)},
            std::pair{KeyPurposeId::ServerAuth, std::span<const uint32_t>(kOidServerAuth)},
            std::pair{KeyPurposeId::ClientAuth, std::span<const uint32_t>(kOidClientAuth)},
            std::pair{KeyPurposeId::CodeSigning, std::span<const uint32_t>(kOidCodeSigning)},
            std::pair{KeyPurposeId::EmailProtection, std::span<const uint32_t>(kOidEmailProtection)},
            std::pair{KeyPurposeId::TimeStamping, std::span<const uint32_t>(kOidTimeStamping)},
            std::pair{KeyPurposeId::OcspSigning, std::span<const uint32_t>(kOidOcspSigning)},
        };

        constexpr OidArray<9> kOidAdOcsp{1, 3, 6, 1, 5, 5, 7, 48, 1};
        constexpr OidArray<9> kOidAdCaIssuers{1, 3, 6, 1, 5, 5, 7, 48, 2};

        constexpr std::array<std::pair<AccessMethodId, std::span<const uint32_t>>, 2> kAccessMethodOids = {
            std::pair{AccessMethodId::Ocsp, std::span<const uint32_t>(kOidAdOcsp)},
            std::pair{AccessMethodId::CaIssuers, std::span<const uint32_t>(kOidAdCaIssuers)},
        };

    } // namespace

    SignatureAlgorithmId find_sig_alg_by_oid(const Oid &oid) {
        return lookup_enum(oid, kSignatureAlgorithms, SignatureAlgorithmId::Unknown);
    }

    PublicKeyAlgorithmId find_public_key_alg_by_oid(const Oid &oid) {
        return lookup_enum(oid, kPublicKeyAlgorithms, PublicKeyAlgorithmId::Unknown);
    }

    CurveId find_curve_by_oid(const Oid &oid) { return lookup_enum(oid, kCurveOids, CurveId::Unknown); }

    ExtensionId find_extension_by_oid(const Oid &oid) {
        return lookup_enum(oid, kExtensionOids, ExtensionId::Unknown);
    }

    CriAttributeId find_cri_attribute_by_oid(const Oid &oid) {
        return lookup_enum(oid, kCriAttributeOids, CriAttributeId::Unknown);
    }

    DistinguishedNameAttribute find_dn_attribute_by_oid(const Oid &oid) {
        return lookup_enum(oid, kDnAttributeOids, DistinguishedNameAttribute::Unknown);
    }

    KeyPurposeId find_key_purpose_by_oid(const Oid &oid) {
        return lookup_enum(oid, kKeyPurposeOids, KeyPurposeId::Unknown);
    }

    AccessMethodId find_access_method_by_oid(const Oid &oid) {
        return lookup_enum(oid, kAccessMethodOids, AccessMethodId::Unknown);
    }

    std::optional<Oid> oid_for_extension(ExtensionId id) { return lookup_oid(id, kExtensionOids); }

    std::optional<Oid> oid_for_dn_attribute(DistinguishedNameAttribute attribute) {
        return lookup_oid(attribute, kDnAttributeOids);
    }

    std::optional<std::string_view> oid_abbreviation(const Oid &oid) {
        const auto attribute = find_dn_attribute_by_oid(oid);
        if (attribute == DistinguishedNameAttribute::Unknown) {
            return std::nullopt;
        }
        for (const auto &[value, label] : kDnAbbreviations) {
            if (value == attribute) {
                return label;
            }
        }
        return std::nullopt;
    }

} // namespace certview::cert
