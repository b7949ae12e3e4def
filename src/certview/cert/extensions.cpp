#include <certview/cert/extensions.hpp>

#include <array>

#include <spdlog/spdlog.h>

#include <certview/cert/parser_utils.hpp>
#include <certview/utils/common.hpp>

namespace certview::cert {

    namespace {

        using detail::DerCursor;

        using DecodeFn = ASN1Result<ParsedExtension> (*)(ByteSpan, size_t);

        struct ExtensionDecoder {
            ExtensionId id;
            DecodeFn decode;
        };

        ASN1Result<ParsedExtension> finish(ParsedExtension parsed, size_t consumed, ByteSpan value) {
            if (consumed != value.size()) {
                return ASN1Result<ParsedExtension>::failure("trailing data after extension value");
            }
            return ASN1Result<ParsedExtension>::ok(std::move(parsed), consumed);
        }

        // Header of an IMPLICIT or EXPLICIT context-tagged element.
        ASN1Result<ParsedHeader> expect_context(ByteSpan input, uint32_t tag, bool constructed) {
            auto header = parse_id_len(input);
            if (!header.success) {
                return header;
            }
            const auto &identifier = header.value.identifier;
            if (!identifier.is_context(tag)) {
                return ASN1Result<ParsedHeader>::failure("expected context tag [" + std::to_string(tag) + "]",
                                                         ErrorKind::UnexpectedType);
            }
            if (identifier.constructed != constructed) {
                return ASN1Result<ParsedHeader>::failure("context tag [" + std::to_string(tag) + "] has wrong form",
                                                         ErrorKind::InvalidTag);
            }
            return header;
        }

        ByteSpan content_of(ByteSpan input, const ParsedHeader &header) {
            return input.subspan(header.header_bytes, header.length);
        }

        // Two-byte view of a named-bit BIT STRING, first bit in the most significant position.
        ASN1Result<uint16_t> named_bits(const BitStringView &bits) {
            if (bits.bytes.size() > 2) {
                return ASN1Result<uint16_t>::failure("named bit list too long");
            }
            uint16_t value = 0;
            if (!bits.bytes.empty()) {
                value = static_cast<uint16_t>(bits.bytes[0] << 8U);
            }
            if (bits.bytes.size() == 2) {
                value = static_cast<uint16_t>(value | bits.bytes[1]);
            }
            return ASN1Result<uint16_t>::ok(value, 0);
        }

        // Optional [tag] IMPLICIT INTEGER with a 32-bit range.
        ASN1Result<std::optional<uint32_t>> parse_tagged_u32(DerCursor &cursor, uint32_t tag) {
            if (cursor.empty() || !cursor.at_context(tag)) {
                return ASN1Result<std::optional<uint32_t>>::ok(std::nullopt, 0);
            }
            auto header = expect_context(cursor.remaining(), tag, false);
            if (!header.success) {
                return ASN1Result<std::optional<uint32_t>>::failure(header);
            }
            auto value = decode_u32(content_of(cursor.remaining(), header.value));
            if (!value.success) {
                return ASN1Result<std::optional<uint32_t>>::failure(value);
            }
            cursor.advance(header.bytes_consumed);
            return ASN1Result<std::optional<uint32_t>>::ok(value.value, header.bytes_consumed);
        }

        ASN1Result<std::vector<GeneralName>> parse_general_names(ByteSpan input, size_t max_depth) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<std::vector<GeneralName>>::failure(seq);
            }
            auto names = detail::parse_general_names_content(seq.value, max_depth);
            if (names.success) {
                names.bytes_consumed = seq.bytes_consumed;
            }
            return names;
        }

        ASN1Result<ParsedExtension> decode_basic_constraints(ByteSpan value, size_t) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            DerCursor cursor(seq.value);
            BasicConstraintsExtension bc{};

            auto next = peek_identifier(cursor.remaining());
            if (next && next->is_universal(ASN1Tag::Boolean)) {
                auto ca = parse_boolean(cursor.remaining());
                if (!ca.success) {
                    return ASN1Result<ParsedExtension>::failure(ca);
                }
                bc.ca = ca.value;
                cursor.advance(ca.bytes_consumed);
            }
            if (!cursor.empty()) {
                auto path_len = parse_u32(cursor.remaining());
                if (!path_len.success) {
                    return ASN1Result<ParsedExtension>::failure(path_len);
                }
                bc.path_len_constraint = path_len.value;
                cursor.advance(path_len.bytes_consumed);
            }
            if (!cursor.empty()) {
                return ASN1Result<ParsedExtension>::failure("trailing data in BasicConstraints");
            }
            return finish(bc, seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_key_usage(ByteSpan value, size_t) {
            auto bit = parse_bit_string(value);
            if (!bit.success) {
                return ASN1Result<ParsedExtension>::failure(bit);
            }
            auto bits = named_bits(bit.value);
            if (!bits.success) {
                return ASN1Result<ParsedExtension>::failure(bits);
            }
            return finish(KeyUsageExtension{bits.value}, bit.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_extended_key_usage(ByteSpan value, size_t) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            ExtendedKeyUsageExtension eku{};
            DerCursor cursor(seq.value);
            while (!cursor.empty()) {
                auto oid = parse_oid(cursor.remaining());
                if (!oid.success) {
                    return ASN1Result<ParsedExtension>::failure(oid);
                }
                eku.purposes.push_back(std::move(oid.value));
                cursor.advance(oid.bytes_consumed);
            }
            return finish(std::move(eku), seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_subject_key_identifier(ByteSpan value, size_t) {
            auto octets = parse_octet_string(value);
            if (!octets.success) {
                return ASN1Result<ParsedExtension>::failure(octets);
            }
            return finish(SubjectKeyIdentifierExtension{octets.value}, octets.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_authority_key_identifier(ByteSpan value, size_t max_depth) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            DerCursor cursor(seq.value);
            AuthorityKeyIdentifierExtension aki{};

            if (!cursor.empty() && cursor.at_context(0)) {
                auto header = expect_context(cursor.remaining(), 0, false);
                if (!header.success) {
                    return ASN1Result<ParsedExtension>::failure(header);
                }
                aki.key_identifier = content_of(cursor.remaining(), header.value);
                cursor.advance(header.bytes_consumed);
            }
            if (!cursor.empty() && cursor.at_context(1)) {
                auto header = expect_context(cursor.remaining(), 1, true);
                if (!header.success) {
                    return ASN1Result<ParsedExtension>::failure(header);
                }
                auto names = detail::parse_general_names_content(content_of(cursor.remaining(), header.value), max_depth);
                if (!names.success) {
                    return ASN1Result<ParsedExtension>::failure(names);
                }
                aki.authority_cert_issuer = std::move(names.value);
                cursor.advance(header.bytes_consumed);
            }
            if (!cursor.empty() && cursor.at_context(2)) {
                auto header = expect_context(cursor.remaining(), 2, false);
                if (!header.success) {
                    return ASN1Result<ParsedExtension>::failure(header);
                }
                aki.authority_cert_serial = content_of(cursor.remaining(), header.value);
                cursor.advance(header.bytes_consumed);
            }
            if (!cursor.empty()) {
                return ASN1Result<ParsedExtension>::failure("trailing data in AuthorityKeyIdentifier");
            }
            return finish(std::move(aki), seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_subject_alt_name(ByteSpan value, size_t max_depth) {
            auto names = parse_general_names(value, max_depth);
            if (!names.success) {
                return ASN1Result<ParsedExtension>::failure(names);
            }
            return finish(SubjectAltNameExtension{std::move(names.value)}, names.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_issuer_alt_name(ByteSpan value, size_t max_depth) {
            auto names = parse_general_names(value, max_depth);
            if (!names.success) {
                return ASN1Result<ParsedExtension>::failure(names);
            }
            return finish(IssuerAltNameExtension{std::move(names.value)}, names.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_certificate_issuer(ByteSpan value, size_t max_depth) {
            auto names = parse_general_names(value, max_depth);
            if (!names.success) {
                return ASN1Result<ParsedExtension>::failure(names);
            }
            return finish(CertificateIssuerExtension{std::move(names.value)}, names.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_certificate_policies(ByteSpan value, size_t max_depth) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            CertificatePoliciesExtension policies{};
            DerCursor cursor(seq.value);
            while (!cursor.empty()) {
                auto info_seq = parse_sequence(cursor.remaining());
                if (!info_seq.success) {
                    return ASN1Result<ParsedExtension>::failure(info_seq);
                }
                DerCursor info_cursor(info_seq.value);

                PolicyInformation info{};
                auto policy_id = parse_oid(info_cursor.remaining());
                if (!policy_id.success) {
                    return ASN1Result<ParsedExtension>::failure(policy_id);
                }
                info.policy_id = std::move(policy_id.value);
                info_cursor.advance(policy_id.bytes_consumed);

                if (!info_cursor.empty()) {
                    auto qualifiers = parse_sequence(info_cursor.remaining());
                    if (!qualifiers.success) {
                        return ASN1Result<ParsedExtension>::failure(qualifiers);
                    }
                    DerCursor qualifier_cursor(qualifiers.value);
                    while (!qualifier_cursor.empty()) {
                        auto qualifier_seq = parse_sequence(qualifier_cursor.remaining());
                        if (!qualifier_seq.success) {
                            return ASN1Result<ParsedExtension>::failure(qualifier_seq);
                        }
                        DerCursor pq_cursor(qualifier_seq.value);
                        auto qualifier_id = parse_oid(pq_cursor.remaining());
                        if (!qualifier_id.success) {
                            return ASN1Result<ParsedExtension>::failure(qualifier_id);
                        }
                        pq_cursor.advance(qualifier_id.bytes_consumed);
                        auto qualifier = parse_any(pq_cursor.remaining(), max_depth);
                        if (!qualifier.success) {
                            return ASN1Result<ParsedExtension>::failure(qualifier);
                        }
                        pq_cursor.advance(qualifier.bytes_consumed);
                        if (!pq_cursor.empty()) {
                            return ASN1Result<ParsedExtension>::failure("trailing data in PolicyQualifierInfo");
                        }
                        info.qualifiers.push_back(PolicyQualifierInfo{std::move(qualifier_id.value), qualifier.value});
                        qualifier_cursor.advance(qualifier_seq.bytes_consumed);
                    }
                    info_cursor.advance(qualifiers.bytes_consumed);
                }
                if (!info_cursor.empty()) {
                    return ASN1Result<ParsedExtension>::failure("trailing data in PolicyInformation");
                }
                policies.policies.push_back(std::move(info));
                cursor.advance(info_seq.bytes_consumed);
            }
            return finish(std::move(policies), seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_policy_mappings(ByteSpan value, size_t) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            PolicyMappingsExtension mappings{};
            DerCursor cursor(seq.value);
            while (!cursor.empty()) {
                // Each mapping is a SEQUENCE { issuerDomainPolicy, subjectDomainPolicy }
                auto mapping_seq = parse_sequence(cursor.remaining());
                if (!mapping_seq.success) {
                    return ASN1Result<ParsedExtension>::failure(mapping_seq);
                }
                DerCursor mapping_cursor(mapping_seq.value);

                auto issuer_oid = parse_oid(mapping_cursor.remaining());
                if (!issuer_oid.success) {
                    return ASN1Result<ParsedExtension>::failure(issuer_oid);
                }
                mapping_cursor.advance(issuer_oid.bytes_consumed);

                auto subject_oid = parse_oid(mapping_cursor.remaining());
                if (!subject_oid.success) {
                    return ASN1Result<ParsedExtension>::failure(subject_oid);
                }
                mapping_cursor.advance(subject_oid.bytes_consumed);

                if (!mapping_cursor.empty()) {
                    return ASN1Result<ParsedExtension>::failure("trailing data in PolicyMapping");
                }
                mappings.mappings.push_back(PolicyMapping{std::move(issuer_oid.value), std::move(subject_oid.value)});
                cursor.advance(mapping_seq.bytes_consumed);
            }
            return finish(std::move(mappings), seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_policy_constraints(ByteSpan value, size_t) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            DerCursor cursor(seq.value);
            PolicyConstraintsExtension constraints{};

            auto require_explicit = parse_tagged_u32(cursor, 0);
            if (!require_explicit.success) {
                return ASN1Result<ParsedExtension>::failure(require_explicit);
            }
            constraints.require_explicit_policy = require_explicit.value;

            auto inhibit_mapping = parse_tagged_u32(cursor, 1);
            if (!inhibit_mapping.success) {
                return ASN1Result<ParsedExtension>::failure(inhibit_mapping);
            }
            constraints.inhibit_policy_mapping = inhibit_mapping.value;

            if (!cursor.empty()) {
                return ASN1Result<ParsedExtension>::failure("trailing data in PolicyConstraints");
            }
            // RFC 5280: MUST NOT issue certificates where policyConstraints is an empty sequence
            if (!constraints.require_explicit_policy && !constraints.inhibit_policy_mapping) {
                return ASN1Result<ParsedExtension>::failure("empty PolicyConstraints");
            }
            return finish(constraints, seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_inhibit_any_policy(ByteSpan value, size_t) {
            auto skip_certs = parse_u32(value);
            if (!skip_certs.success) {
                return ASN1Result<ParsedExtension>::failure(skip_certs);
            }
            return finish(InhibitAnyPolicyExtension{skip_certs.value}, skip_certs.bytes_consumed, value);
        }

        ASN1Result<std::vector<GeneralSubtree>> parse_general_subtrees(ByteSpan content, size_t max_depth) {
            std::vector<GeneralSubtree> subtrees;
            DerCursor cursor(content);
            while (!cursor.empty()) {
                auto subtree_seq = parse_sequence(cursor.remaining());
                if (!subtree_seq.success) {
                    return ASN1Result<std::vector<GeneralSubtree>>::failure(subtree_seq);
                }
                DerCursor subtree_cursor(subtree_seq.value);

                GeneralSubtree subtree{};
                auto base = detail::parse_general_name(subtree_cursor.remaining(), max_depth);
                if (!base.success) {
                    return ASN1Result<std::vector<GeneralSubtree>>::failure(base);
                }
                subtree.base = std::move(base.value);
                subtree_cursor.advance(base.bytes_consumed);

                auto minimum = parse_tagged_u32(subtree_cursor, 0);
                if (!minimum.success) {
                    return ASN1Result<std::vector<GeneralSubtree>>::failure(minimum);
                }
                subtree.minimum = minimum.value.value_or(0);

                auto maximum = parse_tagged_u32(subtree_cursor, 1);
                if (!maximum.success) {
                    return ASN1Result<std::vector<GeneralSubtree>>::failure(maximum);
                }
                subtree.maximum = maximum.value;

                if (!subtree_cursor.empty()) {
                    return ASN1Result<std::vector<GeneralSubtree>>::failure("trailing data in GeneralSubtree");
                }
                subtrees.push_back(std::move(subtree));
                cursor.advance(subtree_seq.bytes_consumed);
            }
            return ASN1Result<std::vector<GeneralSubtree>>::ok(std::move(subtrees), content.size());
        }

        ASN1Result<ParsedExtension> decode_name_constraints(ByteSpan value, size_t max_depth) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            DerCursor cursor(seq.value);
            NameConstraintsExtension constraints{};

            for (uint32_t tag : {0U, 1U}) {
                if (cursor.empty() || !cursor.at_context(tag)) {
                    continue;
                }
                auto header = expect_context(cursor.remaining(), tag, true);
                if (!header.success) {
                    return ASN1Result<ParsedExtension>::failure(header);
                }
                auto subtrees = parse_general_subtrees(content_of(cursor.remaining(), header.value), max_depth);
                if (!subtrees.success) {
                    return ASN1Result<ParsedExtension>::failure(subtrees);
                }
                if (tag == 0) {
                    constraints.permitted_subtrees = std::move(subtrees.value);
                } else {
                    constraints.excluded_subtrees = std::move(subtrees.value);
                }
                cursor.advance(header.bytes_consumed);
            }
            if (!cursor.empty()) {
                return ASN1Result<ParsedExtension>::failure("trailing data in NameConstraints");
            }
            return finish(std::move(constraints), seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_authority_info_access(ByteSpan value, size_t max_depth) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            AuthorityInfoAccessExtension aia{};
            DerCursor cursor(seq.value);
            while (!cursor.empty()) {
                auto desc_seq = parse_sequence(cursor.remaining());
                if (!desc_seq.success) {
                    return ASN1Result<ParsedExtension>::failure(desc_seq);
                }
                DerCursor desc_cursor(desc_seq.value);

                auto method = parse_oid(desc_cursor.remaining());
                if (!method.success) {
                    return ASN1Result<ParsedExtension>::failure(method);
                }
                desc_cursor.advance(method.bytes_consumed);

                auto location = detail::parse_general_name(desc_cursor.remaining(), max_depth);
                if (!location.success) {
                    return ASN1Result<ParsedExtension>::failure(location);
                }
                desc_cursor.advance(location.bytes_consumed);

                if (!desc_cursor.empty()) {
                    return ASN1Result<ParsedExtension>::failure("trailing data in AccessDescription");
                }
                aia.accessdescs.push_back(AccessDescription{std::move(method.value), std::move(location.value)});
                cursor.advance(desc_seq.bytes_consumed);
            }
            return finish(std::move(aia), seq.bytes_consumed, value);
        }

        ASN1Result<DistributionPointName> parse_distribution_point_name(ByteSpan input, size_t max_depth) {
            auto header = parse_id_len(input);
            if (!header.success) {
                return ASN1Result<DistributionPointName>::failure(header);
            }
            const auto &identifier = header.value.identifier;
            const auto content = content_of(input, header.value);
            if (identifier.tag_class != ASN1Class::ContextSpecific || !identifier.constructed ||
                identifier.tag_number > 1) {
                return ASN1Result<DistributionPointName>::failure("invalid DistributionPointName",
                                                                  ErrorKind::UnexpectedType);
            }

            DistributionPointName name{};
            if (identifier.tag_number == 0) {
                auto names = detail::parse_general_names_content(content, max_depth);
                if (!names.success) {
                    return ASN1Result<DistributionPointName>::failure(names);
                }
                name.kind = DistributionPointName::Kind::FullName;
                name.full_name = std::move(names.value);
            } else {
                auto rdn = detail::parse_rdn_content(content, max_depth);
                if (!rdn.success) {
                    return ASN1Result<DistributionPointName>::failure(rdn);
                }
                name.kind = DistributionPointName::Kind::NameRelativeToCrlIssuer;
                name.relative_name = std::move(rdn.value);
            }
            return ASN1Result<DistributionPointName>::ok(std::move(name), header.bytes_consumed);
        }

        ASN1Result<ParsedExtension> decode_crl_distribution_points(ByteSpan value, size_t max_depth) {
            auto seq = parse_sequence(value);
            if (!seq.success) {
                return ASN1Result<ParsedExtension>::failure(seq);
            }
            CrlDistributionPointsExtension crldp{};
            DerCursor cursor(seq.value);
            while (!cursor.empty()) {
                auto point_seq = parse_sequence(cursor.remaining());
                if (!point_seq.success) {
                    return ASN1Result<ParsedExtension>::failure(point_seq);
                }
                DerCursor point_cursor(point_seq.value);
                DistributionPoint point{};

                if (!point_cursor.empty() && point_cursor.at_context(0)) {
                    auto wrapped = parse_explicit(point_cursor.remaining(), 0);
                    if (!wrapped.success) {
                        return ASN1Result<ParsedExtension>::failure(wrapped);
                    }
                    auto name = parse_distribution_point_name(wrapped.value, max_depth);
                    if (!name.success) {
                        return ASN1Result<ParsedExtension>::failure(name);
                    }
                    if (name.bytes_consumed != wrapped.value.size()) {
                        return ASN1Result<ParsedExtension>::failure("trailing data in distributionPoint");
                    }
                    point.distribution_point = std::move(name.value);
                    point_cursor.advance(wrapped.bytes_consumed);
                }
                if (!point_cursor.empty() && point_cursor.at_context(1)) {
                    auto header = expect_context(point_cursor.remaining(), 1, false);
                    if (!header.success) {
                        return ASN1Result<ParsedExtension>::failure(header);
                    }
                    auto bits = decode_bit_string(content_of(point_cursor.remaining(), header.value));
                    if (!bits.success) {
                        return ASN1Result<ParsedExtension>::failure(bits);
                    }
                    auto reasons = named_bits(bits.value);
                    if (!reasons.success) {
                        return ASN1Result<ParsedExtension>::failure(reasons);
                    }
                    point.reasons = reasons.value;
                    point_cursor.advance(header.bytes_consumed);
                }
                if (!point_cursor.empty() && point_cursor.at_context(2)) {
                    auto header = expect_context(point_cursor.remaining(), 2, true);
                    if (!header.success) {
                        return ASN1Result<ParsedExtension>::failure(header);
                    }
                    auto issuer =
                        detail::parse_general_names_content(content_of(point_cursor.remaining(), header.value), max_depth);
                    if (!issuer.success) {
                        return ASN1Result<ParsedExtension>::failure(issuer);
                    }
                    point.crl_issuer = std::move(issuer.value);
                    point_cursor.advance(header.bytes_consumed);
                }
                if (!point_cursor.empty()) {
                    return ASN1Result<ParsedExtension>::failure("trailing data in DistributionPoint");
                }
                crldp.points.push_back(std::move(point));
                cursor.advance(point_seq.bytes_consumed);
            }
            return finish(std::move(crldp), seq.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_crl_number(ByteSpan value, size_t) {
            auto integer = parse_integer(value);
            if (!integer.success) {
                return ASN1Result<ParsedExtension>::failure(integer);
            }
            return finish(CrlNumberExtension{detail::integer_from_bytes(integer.value), integer.value},
                          integer.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_delta_crl_indicator(ByteSpan value, size_t) {
            auto integer = parse_integer(value);
            if (!integer.success) {
                return ASN1Result<ParsedExtension>::failure(integer);
            }
            return finish(DeltaCrlIndicatorExtension{detail::integer_from_bytes(integer.value), integer.value},
                          integer.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_reason_code(ByteSpan value, size_t) {
            auto enumerated = parse_enumerated(value);
            if (!enumerated.success) {
                return ASN1Result<ParsedExtension>::failure(enumerated);
            }
            auto code = decode_u32(enumerated.value);
            if (!code.success) {
                return ASN1Result<ParsedExtension>::failure(code);
            }
            if (code.value == 7 || code.value > 10) {
                return ASN1Result<ParsedExtension>::failure("invalid CRL reason code " + std::to_string(code.value));
            }
            return finish(ReasonCodeExtension{static_cast<CrlReason>(code.value)}, enumerated.bytes_consumed, value);
        }

        ASN1Result<ParsedExtension> decode_invalidity_date(ByteSpan value, size_t) {
            auto date = parse_generalized_time(value);
            if (!date.success) {
                return ASN1Result<ParsedExtension>::failure(date);
            }
            return finish(InvalidityDateExtension{date.value}, date.bytes_consumed, value);
        }

        constexpr std::array<ExtensionDecoder, 19> kExtensionDecoders = {{
            {ExtensionId::BasicConstraints, &decode_basic_constraints},
            {ExtensionId::KeyUsage, &decode_key_usage},
            {ExtensionId::ExtendedKeyUsage, &decode_extended_key_usage},
            {ExtensionId::SubjectAltName, &decode_subject_alt_name},
            {ExtensionId::AuthorityKeyIdentifier, &decode_authority_key_identifier},
            {ExtensionId::SubjectKeyIdentifier, &decode_subject_key_identifier},
            {ExtensionId::CertificatePolicies, &decode_certificate_policies},
            {ExtensionId::CRLDistributionPoints, &decode_crl_distribution_points},
            {ExtensionId::AuthorityInfoAccess, &decode_authority_info_access},
            {ExtensionId::NameConstraints, &decode_name_constraints},
            {ExtensionId::IssuerAltName, &decode_issuer_alt_name},
            {ExtensionId::PolicyMappings, &decode_policy_mappings},
            {ExtensionId::PolicyConstraints, &decode_policy_constraints},
            {ExtensionId::InhibitAnyPolicy, &decode_inhibit_any_policy},
            {ExtensionId::CRLNumber, &decode_crl_number},
            {ExtensionId::DeltaCRLIndicator, &decode_delta_crl_indicator},
            {ExtensionId::ReasonCode, &decode_reason_code},
            {ExtensionId::InvalidityDate, &decode_invalidity_date},
            {ExtensionId::CertificateIssuer, &decode_certificate_issuer},
        }};

        const ExtensionDecoder *find_decoder(const Oid &oid) {
            const auto id = find_extension_by_oid(oid);
            if (id == ExtensionId::Unknown) {
                return nullptr;
            }
            for (const auto &decoder : kExtensionDecoders) {
                if (decoder.id == id) {
                    return &decoder;
                }
            }
            return nullptr;
        }

        std::string format_ip(ByteSpan bytes) {
            if (bytes.size() == 4) {
                return std::to_string(bytes[0]) + "." + std::to_string(bytes[1]) + "." + std::to_string(bytes[2]) +
                       "." + std::to_string(bytes[3]);
            }
            if (bytes.size() == 16) {
                std::string out;
                for (size_t i = 0; i < bytes.size(); i += 2) {
                    if (i != 0) {
                        out.push_back(':');
                    }
                    out += utils::to_hex(bytes.subspan(i, 2));
                }
                return out;
            }
            // Address plus mask, as carried by name constraints
            return utils::to_hex(bytes);
        }

    } // namespace

    std::string_view crl_reason_name(CrlReason reason) noexcept {
        switch (reason) {
        case CrlReason::Unspecified:
            return "unspecified";
        case CrlReason::KeyCompromise:
            return "keyCompromise";
        case CrlReason::CaCompromise:
            return "cACompromise";
        case CrlReason::AffiliationChanged:
            return "affiliationChanged";
        case CrlReason::Superseded:
            return "superseded";
        case CrlReason::CessationOfOperation:
            return "cessationOfOperation";
        case CrlReason::CertificateHold:
            return "certificateHold";
        case CrlReason::RemoveFromCrl:
            return "removeFromCRL";
        case CrlReason::PrivilegeWithdrawn:
            return "privilegeWithdrawn";
        case CrlReason::AaCompromise:
            return "aACompromise";
        }
        return "unknown";
    }

    std::string GeneralName::text() const {
        switch (type) {
        case GeneralNameType::Email:
        case GeneralNameType::DNSName:
        case GeneralNameType::URI:
            return std::string(reinterpret_cast<const char *>(value.data()), value.size());
        case GeneralNameType::IPAddress:
            return format_ip(value);
        case GeneralNameType::DirectoryName:
            return directory_name ? directory_name->to_string() : std::string(DistinguishedName::kRenderFailure);
        case GeneralNameType::RegisteredID: {
            auto oid = decode_oid(value);
            return oid.success ? oid.value.to_string() : utils::to_hex(value);
        }
        default:
            return utils::to_hex(value);
        }
    }

    bool ExtendedKeyUsageExtension::has_purpose(KeyPurposeId purpose) const {
        for (const auto &oid : purposes) {
            if (find_key_purpose_by_oid(oid) == purpose) {
                return true;
            }
        }
        return false;
    }

    bool Extensions::insert(X509Extension extension) {
        if (find(extension.oid) != nullptr) {
            return false;
        }
        items_.push_back(std::move(extension));
        return true;
    }

    const X509Extension *Extensions::find(const Oid &oid) const {
        for (const auto &ext : items_) {
            if (ext.oid == oid) {
                return &ext;
            }
        }
        return nullptr;
    }

    const X509Extension *Extensions::find(ExtensionId id) const {
        if (id == ExtensionId::Unknown) {
            return nullptr;
        }
        for (const auto &ext : items_) {
            if (ext.id() == id) {
                return &ext;
            }
        }
        return nullptr;
    }

    bool is_known_extension(const Oid &oid) { return find_decoder(oid) != nullptr; }

    ASN1Result<ParsedExtension> dispatch_extension(const Oid &oid, ByteSpan value, size_t max_depth) {
        const auto *decoder = find_decoder(oid);
        if (decoder == nullptr) {
            return ASN1Result<ParsedExtension>::ok(UnsupportedExtension{value}, value.size());
        }
        return decoder->decode(value, max_depth);
    }

    namespace detail {

        ASN1Result<GeneralName> parse_general_name(ByteSpan input, size_t max_depth) {
            auto header = parse_id_len(input);
            if (!header.success) {
                return ASN1Result<GeneralName>::failure(header);
            }
            const auto &identifier = header.value.identifier;
            if (identifier.tag_class != ASN1Class::ContextSpecific || identifier.tag_number > 8) {
                return ASN1Result<GeneralName>::failure("invalid GeneralName tag", ErrorKind::UnexpectedType);
            }

            GeneralName name{};
            name.type = static_cast<GeneralNameType>(identifier.tag_number);
            name.value = input.subspan(header.value.header_bytes, header.value.length);

            switch (name.type) {
            case GeneralNameType::OtherName:
            case GeneralNameType::X400Address:
            case GeneralNameType::EdiPartyName: {
                if (!identifier.constructed) {
                    return ASN1Result<GeneralName>::failure("GeneralName must be constructed", ErrorKind::InvalidTag);
                }
                auto checked = parse_any(input, max_depth);
                if (!checked.success) {
                    return ASN1Result<GeneralName>::failure(checked);
                }
                break;
            }
            case GeneralNameType::DirectoryName: {
                // [4] EXPLICIT Name
                if (!identifier.constructed) {
                    return ASN1Result<GeneralName>::failure("directoryName must be constructed",
                                                            ErrorKind::InvalidTag);
                }
                auto dn = parse_name(name.value, max_depth);
                if (!dn.success) {
                    return ASN1Result<GeneralName>::failure(dn);
                }
                if (dn.bytes_consumed != name.value.size()) {
                    return ASN1Result<GeneralName>::failure("trailing data in directoryName");
                }
                name.directory_name = std::move(dn.value);
                break;
            }
            case GeneralNameType::RegisteredID: {
                if (identifier.constructed) {
                    return ASN1Result<GeneralName>::failure("registeredID must be primitive", ErrorKind::InvalidTag);
                }
                auto oid = decode_oid(name.value);
                if (!oid.success) {
                    return ASN1Result<GeneralName>::failure(oid);
                }
                break;
            }
            default:
                if (identifier.constructed) {
                    return ASN1Result<GeneralName>::failure("GeneralName must be primitive", ErrorKind::InvalidTag);
                }
                break;
            }
            return ASN1Result<GeneralName>::ok(std::move(name), header.bytes_consumed);
        }

        ASN1Result<std::vector<GeneralName>> parse_general_names_content(ByteSpan content, size_t max_depth) {
            std::vector<GeneralName> names;
            DerCursor cursor(content);
            while (!cursor.empty()) {
                auto name = parse_general_name(cursor.remaining(), max_depth);
                if (!name.success) {
                    return ASN1Result<std::vector<GeneralName>>::failure(name);
                }
                names.push_back(std::move(name.value));
                cursor.advance(name.bytes_consumed);
            }
            return ASN1Result<std::vector<GeneralName>>::ok(std::move(names), content.size());
        }

        ASN1Result<X509Extension> parse_extension(ByteSpan input, size_t max_depth) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<X509Extension>::failure(seq);
            }
            DerCursor cursor(seq.value);

            auto oid = parse_oid(cursor.remaining());
            if (!oid.success) {
                return ASN1Result<X509Extension>::failure(oid);
            }
            cursor.advance(oid.bytes_consumed);

            bool critical = false;
            auto next = peek_identifier(cursor.remaining());
            if (next && next->is_universal(ASN1Tag::Boolean)) {
                auto flag = parse_boolean(cursor.remaining());
                if (!flag.success) {
                    return ASN1Result<X509Extension>::failure(flag);
                }
                critical = flag.value;
                cursor.advance(flag.bytes_consumed);
            }

            auto octets = parse_octet_string(cursor.remaining());
            if (!octets.success) {
                return ASN1Result<X509Extension>::failure(octets);
            }
            cursor.advance(octets.bytes_consumed);
            if (!cursor.empty()) {
                return ASN1Result<X509Extension>::failure("trailing data in Extension");
            }

            X509Extension ext{};
            ext.oid = std::move(oid.value);
            ext.critical = critical;
            ext.value = octets.value;
            ext.parsed = UnsupportedExtension{octets.value};

            if (!is_known_extension(ext.oid)) {
                if (critical) {
                    return ASN1Result<X509Extension>::failure("unsupported critical extension " + ext.oid.to_string(),
                                                              ErrorKind::UnsupportedCriticalExtension);
                }
                return ASN1Result<X509Extension>::ok(std::move(ext), seq.bytes_consumed);
            }

            auto decoded = dispatch_extension(ext.oid, ext.value, max_depth);
            if (!decoded.success) {
                if (critical) {
                    return ASN1Result<X509Extension>::failure("critical extension " + ext.oid.to_string() +
                                                                  " could not be decoded: " + decoded.error,
                                                              ErrorKind::UnsupportedCriticalExtension);
                }
                spdlog::debug("[Extensions] extension {} kept as unsupported: {}", ext.oid.to_string(),
                              decoded.error);
                return ASN1Result<X509Extension>::ok(std::move(ext), seq.bytes_consumed);
            }
            ext.parsed = std::move(decoded.value);
            return ASN1Result<X509Extension>::ok(std::move(ext), seq.bytes_consumed);
        }

        ASN1Result<Extensions> parse_extensions(ByteSpan input, size_t max_depth) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<Extensions>::failure(seq);
            }
            Extensions extensions;
            DerCursor cursor(seq.value);
            while (!cursor.empty()) {
                auto ext = parse_extension(cursor.remaining(), max_depth);
                if (!ext.success) {
                    return ASN1Result<Extensions>::failure(ext);
                }
                cursor.advance(ext.bytes_consumed);
                const auto oid_text = ext.value.oid.to_string();
                if (!extensions.insert(std::move(ext.value))) {
                    return ASN1Result<Extensions>::failure("duplicate extension " + oid_text,
                                                           ErrorKind::DuplicateExtension);
                }
            }
            return ASN1Result<Extensions>::ok(std::move(extensions), seq.bytes_consumed);
        }

    } // namespace detail

} // namespace certview::cert
