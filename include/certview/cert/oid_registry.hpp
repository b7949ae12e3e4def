#pragma once

#include <optional>
#include <string_view>

#include <certview/cert/asn1_common.hpp>

namespace certview::cert {

    /**
     * Object identifiers recognised by the decoder and their strongly typed counterparts.
     * Unknown identifiers map to the `Unknown` member of each enum.
     */

    enum class DistinguishedNameAttribute {
        Unknown = 0,
        CommonName,
        Surname,
        SerialNumber,
        CountryName,
        LocalityName,
        StateOrProvinceName,
        StreetAddress,
        OrganizationName,
        OrganizationalUnitName,
        Title,
        GivenName,
        Initials,
        GenerationQualifier,
        DnQualifier,
        Pseudonym,
        EmailAddress,
        DomainComponent,
        UserId
    };

    enum class KeyPurposeId {
        Unknown = 0,
        AnyExtendedKeyUsage,
        ServerAuth,
        ClientAuth,
        CodeSigning,
        EmailProtection,
        TimeStamping,
        OcspSigning
    };

    enum class AccessMethodId { Unknown = 0, Ocsp, CaIssuers };

    SignatureAlgorithmId find_sig_alg_by_oid(const Oid &oid);
    PublicKeyAlgorithmId find_public_key_alg_by_oid(const Oid &oid);
    CurveId find_curve_by_oid(const Oid &oid);
    ExtensionId find_extension_by_oid(const Oid &oid);
    CriAttributeId find_cri_attribute_by_oid(const Oid &oid);
    DistinguishedNameAttribute find_dn_attribute_by_oid(const Oid &oid);
    KeyPurposeId find_key_purpose_by_oid(const Oid &oid);
    AccessMethodId find_access_method_by_oid(const Oid &oid);

    std::optional<Oid> oid_for_extension(ExtensionId id);
    std::optional<Oid> oid_for_dn_attribute(DistinguishedNameAttribute attribute);

    // Short label used when rendering names, e.g. "CN" or "emailAddress".
    std::optional<std::string_view> oid_abbreviation(const Oid &oid);

    // Dotted form of the anyPolicy identifier (2.5.29.32.0).
    inline constexpr std::string_view kAnyPolicyOid = "2.5.29.32.0";

} // namespace certview::cert
