#include <variant>

#include <doctest/doctest.h>

#include <certview/cert/extensions.hpp>

#include "cert_test_helpers.hpp"

using namespace certview::cert;
using namespace cert_test;

namespace {

    template <typename T> T decode_as(std::initializer_list<uint32_t> oid, const Bytes &value) {
        auto result = dispatch_extension(Oid{std::vector<uint32_t>(oid)}, span(value), ASN1_DEFAULT_MAX_DEPTH);
        REQUIRE_MESSAGE(result.success, result.error);
        REQUIRE(std::holds_alternative<T>(result.value));
        return std::get<T>(result.value);
    }

    bool decodes(std::initializer_list<uint32_t> oid, const Bytes &value) {
        return dispatch_extension(Oid{std::vector<uint32_t>(oid)}, span(value), ASN1_DEFAULT_MAX_DEPTH).success;
    }

    Bytes dns(std::string_view name) { return der::context(2, Bytes(name.begin(), name.end()), false); }
    Bytes uri(std::string_view name) { return der::context(6, Bytes(name.begin(), name.end()), false); }

} // namespace

TEST_SUITE("cert/extensions") {
    TEST_CASE("basic constraints") {
        auto ca = decode_as<BasicConstraintsExtension>({2, 5, 29, 19}, der::sequence({der::boolean(true), der::integer(3)}));
        CHECK(ca.ca);
        CHECK(ca.path_len_constraint == std::optional<uint32_t>(3));

        auto leaf = decode_as<BasicConstraintsExtension>({2, 5, 29, 19}, der::sequence({}));
        CHECK_FALSE(leaf.ca);
        CHECK_FALSE(leaf.path_len_constraint.has_value());

        CHECK_FALSE(decodes({2, 5, 29, 19}, der::sequence({der::boolean(true), der::integer(1), der::null()})));
    }

    TEST_CASE("key usage bits") {
        auto ku = decode_as<KeyUsageExtension>({2, 5, 29, 15}, der::bit_string({0x86}, 1));
        CHECK(ku.bits == 0x8600);
        CHECK(ku.digital_signature());
        CHECK(ku.key_cert_sign());
        CHECK(ku.crl_sign());
        CHECK_FALSE(ku.has(KeyUsageExtension::KeyEncipherment));

        auto decipher = decode_as<KeyUsageExtension>({2, 5, 29, 15}, der::bit_string({0x00, 0x80}, 7));
        CHECK(decipher.has(KeyUsageExtension::DecipherOnly));

        CHECK_FALSE(decodes({2, 5, 29, 15}, der::bit_string({0x80, 0x00, 0x00}, 0)));
    }

    TEST_CASE("extended key usage") {
        auto eku = decode_as<ExtendedKeyUsageExtension>(
            {2, 5, 29, 37}, der::sequence({der::oid({1, 3, 6, 1, 5, 5, 7, 3, 1}), der::oid({1, 3, 6, 1, 5, 5, 7, 3, 3})}));
        CHECK(eku.purposes.size() == 2);
        CHECK(eku.allows_server_auth());
        CHECK(eku.allows_code_signing());
        CHECK_FALSE(eku.allows_client_auth());
        CHECK_FALSE(eku.allows_any());
    }

    TEST_CASE("key identifiers") {
        auto ski = decode_as<SubjectKeyIdentifierExtension>({2, 5, 29, 14}, der::octet_string({1, 2, 3, 4}));
        CHECK(ski.key_identifier.size() == 4);

        auto aki = decode_as<AuthorityKeyIdentifierExtension>(
            {2, 5, 29, 35},
            der::sequence({der::context(0, {9, 8, 7}, false),
                           der::context(1, der::context(4, fixtures::name("Root"))),
                           der::context(2, {0x01, 0x02}, false)}));
        REQUIRE(aki.key_identifier.has_value());
        CHECK(aki.key_identifier->size() == 3);
        REQUIRE(aki.authority_cert_issuer.has_value());
        REQUIRE(aki.authority_cert_issuer->size() == 1);
        CHECK((*aki.authority_cert_issuer)[0].text() == "CN=Root");
        REQUIRE(aki.authority_cert_serial.has_value());
        CHECK(aki.authority_cert_serial->size() == 2);

        auto key_only = decode_as<AuthorityKeyIdentifierExtension>({2, 5, 29, 35},
                                                                   der::sequence({der::context(0, {1}, false)}));
        CHECK_FALSE(key_only.authority_cert_issuer.has_value());
    }

    TEST_CASE("subject alternative names") {
        auto san = decode_as<SubjectAltNameExtension>(
            {2, 5, 29, 17},
            der::sequence({dns("example.com"), der::context(1, {'a', '@', 'b'}, false),
                           der::context(7, {127, 0, 0, 1}, false),
                           der::context(7, {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}, false),
                           uri("https://example.com/"), der::context(8, {0x2a, 0x03}, false),
                           der::context(4, fixtures::name("Dir"))}));
        REQUIRE(san.general_names.size() == 7);
        CHECK(san.general_names[0].type == GeneralNameType::DNSName);
        CHECK(san.general_names[0].text() == "example.com");
        CHECK(san.general_names[1].text() == "a@b");
        CHECK(san.general_names[2].text() == "127.0.0.1");
        CHECK(san.general_names[3].text() == "2001:0db8:0000:0000:0000:0000:0000:0001");
        CHECK(san.general_names[4].text() == "https://example.com/");
        CHECK(san.general_names[5].text() == "1.2.3");
        CHECK(san.general_names[6].type == GeneralNameType::DirectoryName);
        CHECK(san.general_names[6].text() == "CN=Dir");
    }

    TEST_CASE("general name form checks") {
        CHECK_FALSE(decodes({2, 5, 29, 17}, der::sequence({der::context(2, dns("x"))})));
        CHECK_FALSE(decodes({2, 5, 29, 17}, der::sequence({der::context(4, fixtures::name("x"), false)})));
        CHECK_FALSE(decodes({2, 5, 29, 17}, der::sequence({der::context(0, {0x01}, false)})));
        CHECK_FALSE(decodes({2, 5, 29, 17}, der::sequence({der::context(9, {0x01}, false)})));

        auto other = decode_as<SubjectAltNameExtension>(
            {2, 5, 29, 17},
            der::sequence({der::context(0, der::concat({der::oid({1, 2, 3}), der::context(0, der::utf8("v"))}))}));
        CHECK(other.general_names[0].type == GeneralNameType::OtherName);
    }

    TEST_CASE("issuer alternative name and certificate issuer") {
        auto ian = decode_as<IssuerAltNameExtension>({2, 5, 29, 18}, der::sequence({dns("ca.example")}));
        CHECK(ian.general_names[0].text() == "ca.example");
        auto issuer = decode_as<CertificateIssuerExtension>({2, 5, 29, 29}, der::sequence({dns("other.example")}));
        CHECK(issuer.general_names[0].text() == "other.example");
    }

    TEST_CASE("certificate policies") {
        auto policies = decode_as<CertificatePoliciesExtension>(
            {2, 5, 29, 32},
            der::sequence({der::sequence({der::oid({2, 23, 140, 1, 2, 1})}),
                           der::sequence({der::oid({1, 2, 3, 4}),
                                          der::sequence({der::sequence({der::oid({1, 3, 6, 1, 5, 5, 7, 2, 1}),
                                                                        der::ia5("https://cps.example")})})})}));
        REQUIRE(policies.policies.size() == 2);
        CHECK(policies.policies[0].policy_id.to_string() == "2.23.140.1.2.1");
        CHECK(policies.policies[0].qualifiers.empty());
        CHECK_FALSE(policies.policies[0].is_any_policy());
        REQUIRE(policies.policies[1].qualifiers.size() == 1);
        CHECK(policies.policies[1].qualifiers[0].qualifier.identifier.is_universal(ASN1Tag::IA5String));

        auto any = decode_as<CertificatePoliciesExtension>({2, 5, 29, 32},
                                                           der::sequence({der::sequence({der::oid({2, 5, 29, 32, 0})})}));
        REQUIRE(any.policies.size() == 1);
        CHECK(any.policies[0].is_any_policy());
    }

    TEST_CASE("policy mappings, constraints and inhibit any policy") {
        auto mappings = decode_as<PolicyMappingsExtension>(
            {2, 5, 29, 33}, der::sequence({der::sequence({der::oid({1, 2, 3}), der::oid({1, 2, 4})})}));
        REQUIRE(mappings.mappings.size() == 1);
        CHECK(mappings.mappings[0].subject_domain_policy.to_string() == "1.2.4");

        auto constraints = decode_as<PolicyConstraintsExtension>(
            {2, 5, 29, 36}, der::sequence({der::context(0, {0x02}, false), der::context(1, {0x00}, false)}));
        CHECK(constraints.require_explicit_policy == std::optional<uint32_t>(2));
        CHECK(constraints.inhibit_policy_mapping == std::optional<uint32_t>(0));

        auto only_inhibit =
            decode_as<PolicyConstraintsExtension>({2, 5, 29, 36}, der::sequence({der::context(1, {0x05}, false)}));
        CHECK_FALSE(only_inhibit.require_explicit_policy.has_value());

        CHECK_FALSE(decodes({2, 5, 29, 36}, der::sequence({})));

        auto inhibit = decode_as<InhibitAnyPolicyExtension>({2, 5, 29, 54}, der::integer(4));
        CHECK(inhibit.skip_certs == 4);
    }

    TEST_CASE("name constraints") {
        auto constraints = decode_as<NameConstraintsExtension>(
            {2, 5, 29, 30},
            der::sequence({der::context(0, der::sequence({dns(".example.com")})),
                           der::context(1, der::sequence({der::context(7, {10, 0, 0, 0, 255, 0, 0, 0}, false),
                                                          der::context(0, {0x01}, false),
                                                          der::context(1, {0x04}, false)}))}));
        REQUIRE(constraints.permitted_subtrees.has_value());
        REQUIRE(constraints.permitted_subtrees->size() == 1);
        CHECK((*constraints.permitted_subtrees)[0].base.text() == ".example.com");
        CHECK((*constraints.permitted_subtrees)[0].minimum == 0);
        REQUIRE(constraints.excluded_subtrees.has_value());
        const auto &excluded = (*constraints.excluded_subtrees)[0];
        CHECK(excluded.base.text() == "0a000000ff000000");
        CHECK(excluded.minimum == 1);
        CHECK(excluded.maximum == std::optional<uint32_t>(4));
    }

    TEST_CASE("authority information access") {
        auto aia = decode_as<AuthorityInfoAccessExtension>(
            {1, 3, 6, 1, 5, 5, 7, 1, 1},
            der::sequence({der::sequence({der::oid({1, 3, 6, 1, 5, 5, 7, 48, 1}), uri("http://ocsp.example")}),
                           der::sequence({der::oid({1, 3, 6, 1, 5, 5, 7, 48, 2}), uri("http://ca.example/ca.crt")})}));
        REQUIRE(aia.accessdescs.size() == 2);
        CHECK(aia.accessdescs[0].method() == AccessMethodId::Ocsp);
        CHECK(aia.accessdescs[0].access_location.text() == "http://ocsp.example");
        CHECK(aia.accessdescs[1].method() == AccessMethodId::CaIssuers);
    }

    TEST_CASE("CRL distribution points") {
        auto crldp = decode_as<CrlDistributionPointsExtension>(
            {2, 5, 29, 31},
            der::sequence({
                der::sequence({der::context(0, der::context(0, uri("http://crl.example/ca.crl")))}),
                der::sequence({der::context(0, der::context(1, der::sequence({der::oid({2, 5, 4, 3}), der::utf8("part")}))),
                               der::context(1, {0x06, 0x40}, false),
                               der::context(2, dns("issuer.example"))}),
            }));
        REQUIRE(crldp.points.size() == 2);
        const auto &first = crldp.points[0];
        REQUIRE(first.distribution_point.has_value());
        CHECK(first.distribution_point->kind == DistributionPointName::Kind::FullName);
        CHECK(first.distribution_point->full_name[0].text() == "http://crl.example/ca.crl");
        CHECK_FALSE(first.reasons.has_value());

        const auto &second = crldp.points[1];
        REQUIRE(second.distribution_point.has_value());
        CHECK(second.distribution_point->kind == DistributionPointName::Kind::NameRelativeToCrlIssuer);
        CHECK(second.distribution_point->relative_name.set.size() == 1);
        CHECK(second.reasons == std::optional<uint16_t>(0x4000));
        REQUIRE(second.crl_issuer.has_value());
        CHECK((*second.crl_issuer)[0].text() == "issuer.example");
    }

    TEST_CASE("CRL number and delta indicator keep big values") {
        Bytes big{0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        auto number = decode_as<CrlNumberExtension>({2, 5, 29, 20}, der::integer_raw(big));
        CHECK(number.number == mpz_class("18446744073709551616"));
        CHECK(number.raw.size() == big.size());

        auto delta = decode_as<DeltaCrlIndicatorExtension>({2, 5, 29, 27}, der::integer(41));
        CHECK(delta.base_crl_number == 41);
    }

    TEST_CASE("reason codes") {
        auto reason =
            decode_as<ReasonCodeExtension>({2, 5, 29, 21}, der::universal(ASN1Tag::Enumerated, Bytes{0x01}));
        CHECK(reason.reason == CrlReason::KeyCompromise);
        CHECK(crl_reason_name(reason.reason) == "keyCompromise");
        CHECK(crl_reason_name(CrlReason::RemoveFromCrl) == "removeFromCRL");

        CHECK_FALSE(decodes({2, 5, 29, 21}, der::universal(ASN1Tag::Enumerated, Bytes{0x07})));
        CHECK_FALSE(decodes({2, 5, 29, 21}, der::universal(ASN1Tag::Enumerated, Bytes{0x0B})));
        CHECK_FALSE(decodes({2, 5, 29, 21}, der::integer(1)));
    }

    TEST_CASE("invalidity date") {
        auto date = decode_as<InvalidityDateExtension>({2, 5, 29, 24}, der::generalized_time("20240101000000Z"));
        CHECK(date.date == utc(1704067200));
        CHECK_FALSE(decodes({2, 5, 29, 24}, der::utc_time("240101000000Z")));
    }

    TEST_CASE("unknown OIDs keep their bytes") {
        auto value = der::utf8("hello");
        auto result = dispatch_extension(Oid{{1, 2, 3, 4, 5}}, span(value), ASN1_DEFAULT_MAX_DEPTH);
        REQUIRE(result.success);
        REQUIRE(std::holds_alternative<UnsupportedExtension>(result.value));
        CHECK(std::get<UnsupportedExtension>(result.value).value.data() == value.data());
        CHECK_FALSE(is_known_extension(Oid{{1, 2, 3, 4, 5}}));
        CHECK(is_known_extension(Oid{{2, 5, 29, 19}}));
    }

    TEST_CASE("trailing bytes inside an extension value") {
        CHECK_FALSE(decodes({2, 5, 29, 54}, der::concat({der::integer(1), der::null()})));
    }
}

TEST_SUITE("cert/extensions/policy") {
    TEST_CASE("non-critical unknown extension is kept") {
        auto encoded = fixtures::extension(der::oid({1, 2, 3, 4, 5}), der::utf8("hello"));
        auto ext = detail::parse_extension(span(encoded), ASN1_DEFAULT_MAX_DEPTH);
        REQUIRE(ext.success);
        CHECK_FALSE(ext.value.critical);
        CHECK(ext.value.is_unsupported());
        CHECK(ext.value.id() == ExtensionId::Unknown);
        CHECK(ext.value.value.size() == 7);
    }

    TEST_CASE("critical unknown extension is rejected") {
        auto encoded = fixtures::extension(der::oid({1, 2, 3, 4, 5}), der::utf8("hello"), true);
        auto ext = detail::parse_extension(span(encoded), ASN1_DEFAULT_MAX_DEPTH);
        CHECK_FALSE(ext.success);
        CHECK(ext.kind == ErrorKind::UnsupportedCriticalExtension);
    }

    TEST_CASE("malformed known extension") {
        auto broken = der::sequence({der::integer(5)});
        auto lenient = fixtures::extension(der::oid({2, 5, 29, 15}), broken);
        auto ext = detail::parse_extension(span(lenient), ASN1_DEFAULT_MAX_DEPTH);
        REQUIRE(ext.success);
        CHECK(ext.value.is_unsupported());
        CHECK(ext.value.id() == ExtensionId::KeyUsage);

        auto critical = fixtures::extension(der::oid({2, 5, 29, 15}), broken, true);
        auto rejected = detail::parse_extension(span(critical), ASN1_DEFAULT_MAX_DEPTH);
        CHECK_FALSE(rejected.success);
        CHECK(rejected.kind == ErrorKind::UnsupportedCriticalExtension);
    }

    TEST_CASE("explicit FALSE critical flag") {
        auto encoded = der::sequence({der::oid({2, 5, 29, 19}), der::boolean(false), der::octet_string(der::sequence({}))});
        auto ext = detail::parse_extension(span(encoded), ASN1_DEFAULT_MAX_DEPTH);
        REQUIRE(ext.success);
        CHECK_FALSE(ext.value.critical);
        CHECK(std::holds_alternative<BasicConstraintsExtension>(ext.value.parsed));
    }

    TEST_CASE("extension list lookups") {
        auto encoded = der::sequence({fixtures::basic_constraints(true),
                                      fixtures::extension(der::oid({2, 5, 29, 15}), der::bit_string({0x06}, 1), true),
                                      fixtures::extension(der::oid({1, 2, 3}), der::null())});
        auto list = detail::parse_extensions(span(encoded), ASN1_DEFAULT_MAX_DEPTH);
        REQUIRE(list.success);
        CHECK(list.value.size() == 3);
        CHECK(list.value.all()[0].id() == ExtensionId::BasicConstraints);
        REQUIRE(list.value.get<BasicConstraintsExtension>() != nullptr);
        CHECK(list.value.get<BasicConstraintsExtension>()->ca);
        REQUIRE(list.value.find(ExtensionId::KeyUsage) != nullptr);
        CHECK(list.value.find(ExtensionId::KeyUsage)->critical);
        CHECK(list.value.find(Oid{{1, 2, 3}}) != nullptr);
        CHECK(list.value.find(ExtensionId::SubjectAltName) == nullptr);
        CHECK(list.value.get<SubjectAltNameExtension>() == nullptr);
    }

    TEST_CASE("duplicate extensions are rejected") {
        auto encoded = der::sequence({fixtures::basic_constraints(true), fixtures::basic_constraints(false, false)});
        auto list = detail::parse_extensions(span(encoded), ASN1_DEFAULT_MAX_DEPTH);
        CHECK_FALSE(list.success);
        CHECK(list.kind == ErrorKind::DuplicateExtension);
        CHECK(list.error.find("2.5.29.19") != std::string::npos);
    }

    TEST_CASE("insert keeps the first occurrence") {
        Extensions extensions;
        X509Extension first{};
        first.oid = Oid{{1, 2, 3}};
        first.critical = true;
        X509Extension second{};
        second.oid = Oid{{1, 2, 3}};
        CHECK(extensions.insert(first));
        CHECK_FALSE(extensions.insert(second));
        CHECK(extensions.size() == 1);
        CHECK(extensions.find(Oid{{1, 2, 3}})->critical);
    }
}
