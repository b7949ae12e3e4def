#include <certview/cert/distinguished_name.hpp>

#include <certview/utils/common.hpp>

namespace certview::cert {

    namespace {

        bool is_text_tag(const ASN1Identifier &identifier) {
            if (identifier.tag_class != ASN1Class::Universal || identifier.constructed) {
                return false;
            }
            switch (static_cast<ASN1Tag>(identifier.tag_number)) {
            case ASN1Tag::NumericString:
            case ASN1Tag::PrintableString:
            case ASN1Tag::UTF8String:
            case ASN1Tag::IA5String:
                return true;
            default:
                return false;
            }
        }

        std::optional<std::string> render_value(const AttributeTypeAndValue &atv) {
            if (auto text = atv.as_str()) {
                return std::string(*text);
            }
            if (auto bytes = atv.as_slice()) {
                return utils::to_hex(*bytes, true);
            }
            return std::nullopt;
        }

    } // namespace

    std::optional<std::string_view> AttributeTypeAndValue::as_str() const noexcept {
        if (!is_text_tag(attr_value.identifier)) {
            return std::nullopt;
        }
        return std::string_view(reinterpret_cast<const char *>(attr_value.content.data()), attr_value.content.size());
    }

    std::optional<ByteSpan> AttributeTypeAndValue::as_slice() const noexcept {
        if (attr_value.identifier.constructed) {
            return std::nullopt;
        }
        return attr_value.content;
    }

    std::vector<const AttributeTypeAndValue *> DistinguishedName::find_all(const Oid &oid) const {
        std::vector<const AttributeTypeAndValue *> out;
        for (const auto &rdn : rdns_) {
            for (const auto &atv : rdn.set) {
                if (atv.attr_type == oid) {
                    out.push_back(&atv);
                }
            }
        }
        return out;
    }

    std::vector<const AttributeTypeAndValue *> DistinguishedName::find_all(DistinguishedNameAttribute attribute) const {
        std::vector<const AttributeTypeAndValue *> out;
        for (const auto &rdn : rdns_) {
            for (const auto &atv : rdn.set) {
                if (atv.attribute() == attribute) {
                    out.push_back(&atv);
                }
            }
        }
        return out;
    }

    std::optional<std::string> DistinguishedName::first(DistinguishedNameAttribute attribute) const {
        for (const auto &rdn : rdns_) {
            for (const auto &entry : rdn.set) {
                if (entry.attribute() == attribute) {
                    return render_value(entry);
                }
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> DistinguishedName::try_to_string() const {
        std::string out;
        bool first_rdn = true;
        for (const auto &rdn : rdns_) {
            if (!first_rdn) {
                out += ", ";
            }
            first_rdn = false;

            bool first_attr = true;
            for (const auto &entry : rdn.set) {
                auto value = render_value(entry);
                if (!value) {
                    return std::nullopt;
                }
                if (!first_attr) {
                    out += " + ";
                }
                first_attr = false;

                const auto abbrev = oid_abbreviation(entry.attr_type);
                out += abbrev ? std::string(*abbrev) : entry.attr_type.to_string();
                out.push_back('=');
                out += *value;
            }
        }
        return out;
    }

    std::string DistinguishedName::to_string() const {
        auto rendered = try_to_string();
        if (!rendered) {
            return std::string(kRenderFailure);
        }
        return std::move(*rendered);
    }

} // namespace certview::cert
