#pragma once

#include <cstdint>
#include <string_view>

namespace certview::cert {

    enum class ErrorKind : uint8_t {
        None = 0,
        // Codec level
        Truncated,
        InvalidTag,
        UnexpectedType,
        InvalidLength,
        InvalidValue,
        NestingTooDeep,
        // Field level
        InvalidVersion,
        InvalidSerialNumber,
        InvalidAlgorithmIdentifier,
        InvalidName,
        InvalidValidity,
        InvalidDate,
        InvalidSubjectPublicKeyInfo,
        InvalidUniqueIdentifier,
        InvalidExtensions,
        InvalidAttributes,
        DuplicateExtension,
        UnsupportedCriticalExtension,
        InvalidRevokedCertificates,
        InvalidSignatureValue,
        TrailingData
    };

    [[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) noexcept {
        switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::Truncated:
            return "Truncated";
        case ErrorKind::InvalidTag:
            return "InvalidTag";
        case ErrorKind::UnexpectedType:
            return "UnexpectedType";
        case ErrorKind::InvalidLength:
            return "InvalidLength";
        case ErrorKind::InvalidValue:
            return "InvalidValue";
        case ErrorKind::NestingTooDeep:
            return "NestingTooDeep";
        case ErrorKind::InvalidVersion:
            return "InvalidVersion";
        case ErrorKind::InvalidSerialNumber:
            return "InvalidSerialNumber";
        case ErrorKind::InvalidAlgorithmIdentifier:
            return "InvalidAlgorithmIdentifier";
        case ErrorKind::InvalidName:
            return "InvalidName";
        case ErrorKind::InvalidValidity:
            return "InvalidValidity";
        case ErrorKind::InvalidDate:
            return "InvalidDate";
        case ErrorKind::InvalidSubjectPublicKeyInfo:
            return "InvalidSubjectPublicKeyInfo";
        case ErrorKind::InvalidUniqueIdentifier:
            return "InvalidUniqueIdentifier";
        case ErrorKind::InvalidExtensions:
            return "InvalidExtensions";
        case ErrorKind::InvalidAttributes:
            return "InvalidAttributes";
        case ErrorKind::DuplicateExtension:
            return "DuplicateExtension";
        case ErrorKind::UnsupportedCriticalExtension:
            return "UnsupportedCriticalExtension";
        case ErrorKind::InvalidRevokedCertificates:
            return "InvalidRevokedCertificates";
        case ErrorKind::InvalidSignatureValue:
            return "InvalidSignatureValue";
        case ErrorKind::TrailingData:
            return "TrailingData";
        }
        return "Unknown";
    }

    // Kinds produced by the primitive readers. A structure decoding a named field replaces these
    // with the field's own kind; everything else travels upwards untouched.
    [[nodiscard]] constexpr bool is_codec_error(ErrorKind kind) noexcept {
        return kind == ErrorKind::InvalidTag || kind == ErrorKind::UnexpectedType || kind == ErrorKind::InvalidLength ||
               kind == ErrorKind::InvalidValue;
    }

} // namespace certview::cert
