#include <doctest/doctest.h>

#include <certview/cert/csr.hpp>
#include <certview/utils/common.hpp>

#include "cert_test_helpers.hpp"
#include "cert_test_vectors.hpp"

using namespace certview::cert;
using namespace cert_test;

namespace {

    Bytes attribute(std::initializer_list<uint32_t> oid, std::initializer_list<Bytes> values) {
        return der::sequence({der::oid(oid), der::set(values)});
    }

    Bytes extension_request(std::initializer_list<Bytes> extensions) {
        return attribute({1, 2, 840, 113549, 1, 9, 14}, {der::sequence(extensions)});
    }

    // nullopt leaves out the [0] attributes field.
    Bytes csr(std::optional<std::vector<Bytes>> attributes, uint64_t version = 0) {
        std::vector<Bytes> fields{der::integer(version), fixtures::name("requester"), fixtures::p256_spki()};
        if (attributes) {
            fields.push_back(der::context(0, der::concat(*attributes)));
        }
        return der::sequence({der::sequence_of(fields), fixtures::ecdsa_sha256(), der::bit_string(Bytes(8, 0xEF))});
    }

    ParseOptions strict_options() {
        ParseOptions options;
        options.strict = true;
        return options;
    }

} // namespace

TEST_SUITE("cert/csr") {
    TEST_CASE("CSR vector") {
        auto result = CertificateRequest::parse(span(vectors::kCsr), strict_options());
        REQUIRE_MESSAGE(result.success, result.error);
        const auto &request = result.value;

        CHECK(request.info().version == X509Version::V1);
        CHECK(request.info().raw.data() == vectors::kCsr.data() + 4);
        CHECK(request.info().raw.size() == 212);
        CHECK(request.subject().to_string() == "C=FR, O=Example Org, CN=csr.example");
        CHECK(request.public_key().curve() == CurveId::Secp256r1);
        CHECK(find_sig_alg_by_oid(request.signature_algorithm().algorithm) == SignatureAlgorithmId::EcdsaSha256);

        REQUIRE(request.attributes().size() == 1);
        CHECK(request.attributes()[0].id() == CriAttributeId::ExtensionRequest);
        CHECK(request.info().find_attribute(CriAttributeId::ExtensionRequest) != nullptr);
        CHECK_FALSE(request.challenge_password().has_value());
    }

    TEST_CASE("requested extensions") {
        auto result = CertificateRequest::parse(span(vectors::kCsr));
        REQUIRE(result.success);
        const auto *extensions = result.value.requested_extensions();
        REQUIRE(extensions != nullptr);
        CHECK(extensions->size() == 2);

        const auto *san = extensions->get<SubjectAltNameExtension>();
        REQUIRE(san != nullptr);
        REQUIRE(san->general_names.size() == 1);
        CHECK(san->general_names[0].text() == "csr.example");

        const auto *ku = extensions->get<KeyUsageExtension>();
        REQUIRE(ku != nullptr);
        CHECK(ku->bits == KeyUsageExtension::DigitalSignature);
    }

    TEST_CASE("CSR fingerprint") {
        auto result = CertificateRequest::parse(span(vectors::kCsr));
        REQUIRE(result.success);
        auto fp = result.value.fingerprint();
        REQUIRE(fp.success);
        CHECK(certview::utils::to_hex(fp.data) == "a715f3de90f0ee5cfade5bfbafb5159e836a877dd14e03a5ad178037fe465016");
    }

    TEST_CASE("missing attributes field") {
        auto encoded = csr(std::nullopt);
        auto lenient = CertificateRequest::parse(span(encoded));
        REQUIRE_MESSAGE(lenient.success, lenient.error);
        CHECK(lenient.value.attributes().empty());
        CHECK(lenient.value.requested_extensions() == nullptr);

        auto strict = CertificateRequest::parse(span(encoded), strict_options());
        CHECK_FALSE(strict.success);
        CHECK(strict.kind == ErrorKind::InvalidAttributes);
    }

    TEST_CASE("empty attributes field") {
        auto encoded = csr(std::vector<Bytes>{});
        auto result = CertificateRequest::parse(span(encoded), strict_options());
        REQUIRE_MESSAGE(result.success, result.error);
        CHECK(result.value.attributes().empty());
    }

    TEST_CASE("unknown request version") {
        auto result = CertificateRequest::parse(span(csr(std::vector<Bytes>{}, 1)));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::InvalidVersion);
    }

    TEST_CASE("challenge password and unknown attributes") {
        auto encoded = csr(std::vector<Bytes>{attribute({1, 2, 840, 113549, 1, 9, 7}, {der::printable("s3cret")}),
                                          attribute({1, 2, 3, 4}, {der::integer(1), der::null()})});
        auto result = CertificateRequest::parse(span(encoded));
        REQUIRE_MESSAGE(result.success, result.error);
        CHECK(result.value.challenge_password() == std::optional<std::string>("s3cret"));

        const auto *unknown = result.value.info().find_attribute(Oid{{1, 2, 3, 4}});
        REQUIRE(unknown != nullptr);
        CHECK(unknown->is_unsupported());
        CHECK(unknown->id() == CriAttributeId::Unknown);
        CHECK(unknown->value[0] == 0x31);
    }

    TEST_CASE("duplicate attributes") {
        auto encoded = csr(std::vector<Bytes>{attribute({1, 2, 840, 113549, 1, 9, 7}, {der::utf8("a")}),
                                          attribute({1, 2, 840, 113549, 1, 9, 7}, {der::utf8("b")})});
        auto result = CertificateRequest::parse(span(encoded));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::InvalidAttributes);
    }

    TEST_CASE("malformed known attribute degrades") {
        auto encoded = csr(std::vector<Bytes>{attribute({1, 2, 840, 113549, 1, 9, 7}, {der::integer(5)})});
        auto result = CertificateRequest::parse(span(encoded));
        REQUIRE_MESSAGE(result.success, result.error);
        REQUIRE(result.value.attributes().size() == 1);
        CHECK(result.value.attributes()[0].is_unsupported());
        CHECK_FALSE(result.value.challenge_password().has_value());
    }

    TEST_CASE("requested extension policy") {
        auto critical = csr(std::vector<Bytes>{
            extension_request({fixtures::extension(der::oid({1, 2, 3, 4, 5}), der::null(), true)})});
        auto rejected = CertificateRequest::parse(span(critical));
        CHECK_FALSE(rejected.success);
        CHECK(rejected.kind == ErrorKind::UnsupportedCriticalExtension);

        auto duplicate = csr(std::vector<Bytes>{
            extension_request({fixtures::basic_constraints(false), fixtures::basic_constraints(false)})});
        auto duplicated = CertificateRequest::parse(span(duplicate));
        CHECK_FALSE(duplicated.success);
        CHECK(duplicated.kind == ErrorKind::DuplicateExtension);

        auto basic = csr(std::vector<Bytes>{extension_request({fixtures::basic_constraints(true)})});
        auto accepted = CertificateRequest::parse(span(basic));
        REQUIRE(accepted.success);
        REQUIRE(accepted.value.requested_extensions() != nullptr);
        CHECK(accepted.value.requested_extensions()->get<BasicConstraintsExtension>()->ca);
    }

    TEST_CASE("trailing bytes after the request") {
        Bytes encoded(vectors::kCsr.begin(), vectors::kCsr.end());
        encoded.push_back(0x05);
        encoded.push_back(0x00);
        auto lenient = CertificateRequest::parse(span(encoded));
        REQUIRE(lenient.success);
        CHECK(lenient.remaining.size() == 2);
        CHECK(CertificateRequest::parse(span(encoded), strict_options()).kind == ErrorKind::TrailingData);
    }

    TEST_CASE("truncated request") {
        Bytes encoded(vectors::kCsr.begin(), vectors::kCsr.end() - 1);
        auto result = CertificateRequest::parse(span(encoded));
        CHECK_FALSE(result.success);
        CHECK(result.kind == ErrorKind::Truncated);

        auto empty = CertificateRequest::parse(ByteSpan{});
        CHECK_FALSE(empty.success);
        CHECK(empty.kind == ErrorKind::Truncated);
    }
}
