#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <certview/cert/asn1_common.hpp>
#include <certview/cert/oid_registry.hpp>

namespace certview::cert {

    struct AttributeTypeAndValue {
        Oid attr_type{};
        Any attr_value{};

        [[nodiscard]] DistinguishedNameAttribute attribute() const { return find_dn_attribute_by_oid(attr_type); }

        // Text of NumericString, PrintableString, UTF8String and IA5String values.
        [[nodiscard]] std::optional<std::string_view> as_str() const noexcept;
        // Content bytes of any primitive value.
        [[nodiscard]] std::optional<ByteSpan> as_slice() const noexcept;
    };

    struct RelativeDistinguishedName {
        std::vector<AttributeTypeAndValue> set;
    };

    /**
     * X.501 Name as an ordered sequence of RDNs. `raw()` covers the exact encoded Name,
     * including its SEQUENCE header, inside the buffer it was decoded from.
     */
    class DistinguishedName {
      public:
        static constexpr std::string_view kRenderFailure = "<X509Error: Invalid X.509 name>";

        DistinguishedName() = default;
        DistinguishedName(std::vector<RelativeDistinguishedName> rdns, ByteSpan raw)
            : rdns_(std::move(rdns)), raw_(raw) {}

        [[nodiscard]] const std::vector<RelativeDistinguishedName> &rdns() const noexcept { return rdns_; }
        [[nodiscard]] ByteSpan raw() const noexcept { return raw_; }
        [[nodiscard]] bool empty() const noexcept { return rdns_.empty(); }

        [[nodiscard]] std::vector<const AttributeTypeAndValue *> find_all(const Oid &oid) const;
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> find_all(DistinguishedNameAttribute attribute) const;
        [[nodiscard]] std::optional<std::string> first(DistinguishedNameAttribute attribute) const;

        [[nodiscard]] std::vector<const AttributeTypeAndValue *> common_names() const {
            return find_all(DistinguishedNameAttribute::CommonName);
        }
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> countries() const {
            return find_all(DistinguishedNameAttribute::CountryName);
        }
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> organizations() const {
            return find_all(DistinguishedNameAttribute::OrganizationName);
        }
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> organizational_units() const {
            return find_all(DistinguishedNameAttribute::OrganizationalUnitName);
        }
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> states() const {
            return find_all(DistinguishedNameAttribute::StateOrProvinceName);
        }
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> localities() const {
            return find_all(DistinguishedNameAttribute::LocalityName);
        }
        [[nodiscard]] std::vector<const AttributeTypeAndValue *> email_addresses() const {
            return find_all(DistinguishedNameAttribute::EmailAddress);
        }

        // Fails when an attribute value can be rendered neither as text nor as hex.
        [[nodiscard]] std::optional<std::string> try_to_string() const;
        // Never fails; falls back to kRenderFailure.
        [[nodiscard]] std::string to_string() const;

      private:
        std::vector<RelativeDistinguishedName> rdns_;
        ByteSpan raw_{};
    };

} // namespace certview::cert
