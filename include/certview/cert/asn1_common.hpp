#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace certview::cert {

    using ByteSpan = std::span<const uint8_t>;

    constexpr inline size_t ASN1_MAX_TAG_NUMBER = (1U << 28); // Guardrail for corrupted tags
    constexpr inline size_t ASN1_DEFAULT_MAX_DEPTH = 50;

    enum class ASN1Class : uint8_t { Universal = 0x00, Application = 0x40, ContextSpecific = 0x80, Private = 0xC0 };

    enum class ASN1Tag : uint8_t {
        EndOfContent = 0x00,
        Boolean = 0x01,
        Integer = 0x02,
        BitString = 0x03,
        OctetString = 0x04,
        Null = 0x05,
        ObjectIdentifier = 0x06,
        ObjectDescriptor = 0x07,
        External = 0x08,
        Real = 0x09,
        Enumerated = 0x0A,
        EmbeddedPdv = 0x0B,
        UTF8String = 0x0C,
        RelativeOID = 0x0D,
        Sequence = 0x10,
        Set = 0x11,
        NumericString = 0x12,
        PrintableString = 0x13,
        T61String = 0x14,
        VideotexString = 0x15,
        IA5String = 0x16,
        UTCTime = 0x17,
        GeneralizedTime = 0x18,
        GraphicString = 0x19,
        VisibleString = 0x1A,
        GeneralString = 0x1B,
        UniversalString = 0x1C,
        CharacterString = 0x1D,
        BMPString = 0x1E
    };

    struct ASN1Identifier {
        ASN1Class tag_class{};
        bool constructed{};
        uint32_t tag_number{};

        [[nodiscard]] bool is(ASN1Class cls, uint32_t number) const noexcept {
            return tag_class == cls && tag_number == number;
        }

        [[nodiscard]] bool is_universal(ASN1Tag tag) const noexcept {
            return is(ASN1Class::Universal, static_cast<uint32_t>(tag));
        }

        [[nodiscard]] bool is_context(uint32_t number) const noexcept {
            return is(ASN1Class::ContextSpecific, number);
        }
    };

    enum class SignatureAlgorithmId {
        Unknown = 0,
        RsaPkcs1Sha1,
        RsaPkcs1Sha256,
        RsaPkcs1Sha384,
        RsaPkcs1Sha512,
        RsaPss,
        EcdsaSha256,
        EcdsaSha384,
        EcdsaSha512,
        Ed25519,
        Ed448
    };

    enum class PublicKeyAlgorithmId { Unknown = 0, Rsa, Ec, Ed25519, Ed448, X25519, X448 };

    enum class CurveId { Unknown = 0, Secp256r1, Secp384r1, Secp521r1, Secp256k1 };

    enum class ExtensionId {
        Unknown = 0,
        BasicConstraints,
        KeyUsage,
        ExtendedKeyUsage,
        SubjectAltName,
        AuthorityKeyIdentifier,
        SubjectKeyIdentifier,
        CertificatePolicies,
        CRLDistributionPoints,
        AuthorityInfoAccess,
        NameConstraints,
        IssuerAltName,
        PolicyMappings,
        PolicyConstraints,
        InhibitAnyPolicy,
        // CRL and CRL entry extensions
        CRLNumber,
        DeltaCRLIndicator,
        ReasonCode,
        InvalidityDate,
        CertificateIssuer
    };

    enum class CriAttributeId { Unknown = 0, ExtensionRequest, ChallengePassword };

    struct Oid {
        std::vector<uint32_t> nodes;

        [[nodiscard]] bool matches(std::span<const uint32_t> pattern) const noexcept {
            if (nodes.size() != pattern.size()) {
                return false;
            }
            for (size_t i = 0; i < pattern.size(); ++i) {
                if (nodes[i] != pattern[i]) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] std::string to_string() const {
            std::string out;
            for (size_t i = 0; i < nodes.size(); ++i) {
                if (i != 0) {
                    out.push_back('.');
                }
                out += std::to_string(nodes[i]);
            }
            return out;
        }

        bool operator==(const Oid &other) const noexcept { return nodes == other.nodes; }
    };

    struct BitStringView {
        uint8_t unused_bits{};
        ByteSpan bytes{};
    };

    // An element whose type is only known at run time. `raw` covers the whole TLV.
    struct Any {
        ASN1Identifier identifier{};
        ByteSpan content{};
        ByteSpan raw{};
    };

    struct AlgorithmIdentifier {
        Oid algorithm{};
        std::optional<Any> parameters{};

        [[nodiscard]] SignatureAlgorithmId signature_id() const;
        [[nodiscard]] PublicKeyAlgorithmId public_key_id() const;
    };

    struct SubjectPublicKeyInfo {
        AlgorithmIdentifier algorithm{};
        BitStringView subject_public_key{};

        // Named curve for EC keys, taken from the algorithm parameters.
        [[nodiscard]] CurveId curve() const;
    };

} // namespace certview::cert
