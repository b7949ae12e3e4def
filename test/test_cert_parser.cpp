#include <doctest/doctest.h>

#include <certview/cert/certificate.hpp>
#include <certview/utils/common.hpp>

#include "cert_test_helpers.hpp"
#include "cert_test_vectors.hpp"

using namespace certview::cert;
using namespace cert_test;

namespace {

    ParseOptions strict_options() {
        ParseOptions options;
        options.strict = true;
        return options;
    }

} // namespace

TEST_SUITE("cert/parser") {
    TEST_CASE("CA certificate fields") {
        auto result = Certificate::parse(span(vectors::kCaCertificate));
        REQUIRE_MESSAGE(result.success, result.error);
        CHECK(result.remaining.empty());

        const auto &cert = result.value;
        CHECK(cert.version() == X509Version::V3);
        CHECK(cert.raw().size() == vectors::kCaCertificate.size());
        CHECK(cert.raw().data() == vectors::kCaCertificate.data());

        CHECK(cert.tbs().raw.data() == vectors::kCaCertificate.data() + 4);
        CHECK(cert.tbs().raw.size() == 536);

        CHECK(cert.tbs().raw_serial().size() == 20);
        CHECK(cert.tbs().raw_serial()[0] == 0x00);
        CHECK(cert.tbs().raw_serial()[1] == 0xC0);
        CHECK_FALSE(cert.tbs().serial.negative);
        CHECK(cert.tbs().raw_serial_as_string().rfind("00:c0:ff:ee:11:22", 0) == 0);
        CHECK(cert.tbs().serial_hex().rfind("c0ffee1122", 0) == 0);

        const std::string dn = "C=FR, ST=Some-State, O=Internet Widgits Pty Ltd, CN=Test1 + CN=Test2";
        CHECK(cert.issuer().to_string() == dn);
        CHECK(cert.subject().to_string() == dn);

        CHECK(cert.validity().not_before == utc(1792404547));
        CHECK(cert.validity().not_after == utc(2107764547));

        CHECK(find_sig_alg_by_oid(cert.signature_algorithm().algorithm) == SignatureAlgorithmId::EcdsaSha256);
        CHECK(cert.tbs().signature.algorithm == cert.signature_algorithm().algorithm);
        CHECK(find_public_key_alg_by_oid(cert.public_key().algorithm.algorithm) == PublicKeyAlgorithmId::Ec);
        CHECK(cert.public_key().curve() == CurveId::Secp256r1);
        CHECK(cert.public_key().subject_public_key.bytes.size() == 65);
        CHECK(cert.signature_value().unused_bits == 0);
    }

    TEST_CASE("CA certificate extensions") {
        auto result = Certificate::parse(span(vectors::kCaCertificate));
        REQUIRE(result.success);
        const auto &tbs = result.value.tbs();

        REQUIRE(tbs.extensions.size() == 6);
        CHECK(tbs.is_ca());
        REQUIRE(tbs.basic_constraints() != nullptr);
        CHECK(tbs.basic_constraints()->path_len_constraint == std::optional<uint32_t>(1));
        CHECK(tbs.extensions.find(ExtensionId::BasicConstraints)->critical);

        REQUIRE(tbs.key_usage() != nullptr);
        CHECK(tbs.key_usage()->bits == 0x8600);

        const auto *ski = tbs.extensions.get<SubjectKeyIdentifierExtension>();
        REQUIRE(ski != nullptr);
        CHECK(certview::utils::to_hex(ski->key_identifier, true) == "3D5216D407694CEFC9D510FA2BB819E9566C6268");

        REQUIRE(tbs.subject_alternative_name() != nullptr);
        const auto &names = tbs.subject_alternative_name()->general_names;
        REQUIRE(names.size() == 3);
        CHECK(names[0].text() == "test.example");
        CHECK(names[1].text() == "*.test.example");
        CHECK(names[2].type == GeneralNameType::IPAddress);
        CHECK(names[2].text() == "127.0.0.1");

        REQUIRE(tbs.extended_key_usage() != nullptr);
        CHECK(tbs.extended_key_usage()->allows_server_auth());
        CHECK(tbs.extended_key_usage()->allows_client_auth());

        const auto *custom = tbs.extensions.find(Oid{{1, 2, 3, 4, 5}});
        REQUIRE(custom != nullptr);
        CHECK_FALSE(custom->critical);
        CHECK(custom->is_unsupported());
        CHECK(certview::utils::to_hex(custom->value) == "0c0568656c6c6f");

        CHECK(tbs.name_constraints() == nullptr);
        CHECK(tbs.inhibit_any_policy() == nullptr);
    }

    TEST_CASE("fingerprint over the full encoding") {
        auto result = Certificate::parse(span(vectors::kCaCertificate));
        REQUIRE(result.success);
        auto fp = result.value.fingerprint();
        REQUIRE(fp.success);
        CHECK(certview::utils::to_hex(fp.data) == "05cc8682d2431e077a9e5eed0208f8f01281bbe6a9fdab955f23628f87431519");
        CHECK(result.value.fingerprint(certview::hash::Algorithm::SHA512).data.size() == 64);
    }

    TEST_CASE("strict mode accepts the CA certificate") {
        auto result = Certificate::parse(span(vectors::kCaCertificate), strict_options());
        CHECK_MESSAGE(result.success, result.error);
    }

    TEST_CASE("version defaults to v1") {
        fixtures::CertSpec spec;
        spec.version = std::nullopt;
        auto encoded = fixtures::certificate(spec);
        auto result = Certificate::parse(span(encoded));
        REQUIRE_MESSAGE(result.success, result.error);
        CHECK(result.value.version() == X509Version::V1);
        CHECK(result.value.extensions().empty());
        CHECK(result.value.tbs().serial.value == 0x1234);

        auto version = detail::parse_optional_version(span(der::integer(1)));
        REQUIRE(version.success);
        CHECK_FALSE(version.value.has_value());
        CHECK(version.bytes_consumed == 0);
    }

    TEST_CASE("explicit versions") {
        fixtures::CertSpec spec;
        spec.version = 1;
        auto v2 = fixtures::certificate(spec);
        auto result = Certificate::parse(span(v2));
        REQUIRE(result.success);
        CHECK(result.value.version() == X509Version::V2);

        spec.version = 3;
        auto v4 = fixtures::certificate(spec);
        auto rejected = Certificate::parse(span(v4));
        CHECK_FALSE(rejected.success);
        CHECK(rejected.kind == ErrorKind::InvalidVersion);
    }

    TEST_CASE("truncated input") {
        Bytes encoded(vectors::kCaCertificate.begin(), vectors::kCaCertificate.end() - 1);
        auto result = Certificate::parse(span(encoded));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::Truncated);

        auto empty = Certificate::parse(ByteSpan{});
        CHECK_FALSE(empty.success);
        CHECK(empty.kind == ErrorKind::Truncated);
    }

    TEST_CASE("bytes after the certificate") {
        Bytes encoded(vectors::kCaCertificate.begin(), vectors::kCaCertificate.end());
        encoded.push_back(0xDE);
        encoded.push_back(0xAD);

        auto lenient = Certificate::parse(span(encoded));
        REQUIRE(lenient.success);
        REQUIRE(lenient.remaining.size() == 2);
        CHECK(lenient.remaining[0] == 0xDE);
        CHECK(lenient.value.raw().size() == vectors::kCaCertificate.size());

        auto strict = Certificate::parse(span(encoded), strict_options());
        CHECK_FALSE(strict.success);
        CHECK(strict.kind == ErrorKind::TrailingData);
    }

    TEST_CASE("signature value with unused bits") {
        fixtures::CertSpec spec;
        spec.signature_unused_bits = 3;
        auto encoded = fixtures::certificate(spec);
        CHECK(Certificate::parse(span(encoded)).success);

        auto strict = Certificate::parse(span(encoded), strict_options());
        CHECK_FALSE(strict.success);
        CHECK(strict.kind == ErrorKind::InvalidSignatureValue);
    }

    TEST_CASE("negative serial numbers") {
        fixtures::CertSpec spec;
        spec.serial = der::integer_raw({0xFF, 0x01});
        auto encoded = fixtures::certificate(spec);

        auto lenient = Certificate::parse(span(encoded));
        REQUIRE(lenient.success);
        CHECK(lenient.value.tbs().serial.negative);
        CHECK(lenient.value.tbs().serial.value == -255);

        auto strict = Certificate::parse(span(encoded), strict_options());
        CHECK_FALSE(strict.success);
        CHECK(strict.kind == ErrorKind::InvalidSerialNumber);
    }

    TEST_CASE("malformed serial number") {
        fixtures::CertSpec spec;
        spec.serial = der::null();
        auto result = Certificate::parse(span(fixtures::certificate(spec)));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::InvalidSerialNumber);
    }

    TEST_CASE("extensions on a v1 certificate") {
        fixtures::CertSpec spec;
        spec.version = std::nullopt;
        spec.extensions = std::vector<Bytes>{fixtures::basic_constraints(true)};
        auto encoded = fixtures::certificate(spec);

        auto lenient = Certificate::parse(span(encoded));
        REQUIRE(lenient.success);
        CHECK(lenient.value.version() == X509Version::V1);
        CHECK(lenient.value.tbs().is_ca());

        auto strict = Certificate::parse(span(encoded), strict_options());
        CHECK_FALSE(strict.success);
        CHECK(strict.kind == ErrorKind::InvalidVersion);
    }

    TEST_CASE("unique identifiers") {
        fixtures::CertSpec spec;
        spec.issuer_uid = Bytes{0x01, 0x02};
        spec.subject_uid = Bytes{0x03};
        auto encoded = fixtures::certificate(spec);
        auto result = Certificate::parse(span(encoded), strict_options());
        REQUIRE_MESSAGE(result.success, result.error);
        REQUIRE(result.value.tbs().issuer_uid.has_value());
        CHECK(result.value.tbs().issuer_uid->bytes.size() == 2);
        REQUIRE(result.value.tbs().subject_uid.has_value());
        CHECK(result.value.tbs().subject_uid->bytes[0] == 0x03);

        spec.version = std::nullopt;
        auto v1 = fixtures::certificate(spec);
        CHECK(Certificate::parse(span(v1)).success);
        CHECK(Certificate::parse(span(v1), strict_options()).kind == ErrorKind::InvalidVersion);
    }

    TEST_CASE("critical extension policy inside a certificate") {
        fixtures::CertSpec spec;
        spec.extensions = std::vector<Bytes>{fixtures::extension(der::oid({1, 2, 3, 4, 5}), der::null(), true)};
        auto critical = Certificate::parse(span(fixtures::certificate(spec)));
        CHECK_FALSE(critical.success);
        CHECK(critical.kind == ErrorKind::UnsupportedCriticalExtension);

        spec.extensions = std::vector<Bytes>{fixtures::extension(der::oid({1, 2, 3, 4, 5}), der::null())};
        auto encoded = fixtures::certificate(spec);
        auto kept = Certificate::parse(span(encoded));
        REQUIRE(kept.success);
        CHECK(kept.value.extensions().size() == 1);
    }

    TEST_CASE("duplicate extensions inside a certificate") {
        fixtures::CertSpec spec;
        spec.extensions = std::vector<Bytes>{fixtures::basic_constraints(true), fixtures::basic_constraints(true)};
        auto result = Certificate::parse(span(fixtures::certificate(spec)));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::DuplicateExtension);
    }

    TEST_CASE("malformed extension container") {
        fixtures::CertSpec spec;
        spec.extensions = std::vector<Bytes>{der::integer(1)};
        auto result = Certificate::parse(span(fixtures::certificate(spec)));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::InvalidExtensions);
    }

    TEST_CASE("data after the last TBS field") {
        fixtures::CertSpec spec;
        spec.tbs_suffix = der::null();
        auto result = Certificate::parse(span(fixtures::certificate(spec)));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::TrailingData);
    }

    TEST_CASE("nesting limit follows the options") {
        fixtures::CertSpec spec;
        spec.subject = der::sequence({der::set({der::sequence({der::oid({2, 5, 4, 3}), der::nested(8)})})});
        auto encoded = fixtures::certificate(spec);

        ParseOptions shallow;
        shallow.max_depth = 4;
        auto rejected = Certificate::parse(span(encoded), shallow);
        CHECK_FALSE(rejected.success);
        CHECK(rejected.kind == ErrorKind::NestingTooDeep);

        auto accepted = Certificate::parse(span(encoded));
        REQUIRE(accepted.success);
        CHECK(accepted.value.subject().to_string() == std::string(DistinguishedName::kRenderFailure));
    }

    TEST_CASE("wrong outer type") {
        auto result = Certificate::parse(span(der::set({der::null()})));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::UnexpectedType);
    }
}
