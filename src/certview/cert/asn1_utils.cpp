#include <certview/cert/asn1_utils.hpp>

#include <array>
#include <chrono>
#include <limits>

namespace certview::cert {

    namespace {

        constexpr size_t kMaxLengthOctets = sizeof(size_t);

        bool is_digit(char c) { return c >= '0' && c <= '9'; }

        bool parse_decimal(std::string_view view, int &value) {
            value = 0;
            if (view.empty()) {
                return false;
            }
            for (char c : view) {
                if (!is_digit(c)) {
                    return false;
                }
                value = (value * 10) + (c - '0');
            }
            return true;
        }

        ASN1Result<TimePoint> make_time_point(int year, int month, int day, int hour, int minute, int second) {
            using namespace std::chrono;
            if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 || minute > 59 ||
                second < 0 || second > 60) {
                return ASN1Result<TimePoint>::failure("invalid time component");
            }

            const auto y = std::chrono::year{year};
            const auto m = std::chrono::month{static_cast<unsigned>(month)};
            const auto d = std::chrono::day{static_cast<unsigned>(day)};
            const std::chrono::year_month_day ymd{y / m / d};
            if (!ymd.ok()) {
                return ASN1Result<TimePoint>::failure("invalid calendar date");
            }

            const sys_days days{ymd};
            const TimePoint tp = days + hours{hour} + minutes{minute} + seconds{second};
            return ASN1Result<TimePoint>::ok(tp, 0);
        }

        // Reads a header and checks it carries the expected universal tag and form.
        ASN1Result<ParsedHeader> expect_universal(ByteSpan input, ASN1Tag tag, bool constructed, const char *name) {
            auto header = parse_id_len(input);
            if (!header.success) {
                return header;
            }
            const auto &identifier = header.value.identifier;
            if (!identifier.is_universal(tag)) {
                return ASN1Result<ParsedHeader>::failure(std::string("expected ") + name, ErrorKind::UnexpectedType);
            }
            if (identifier.constructed != constructed) {
                return ASN1Result<ParsedHeader>::failure(
                    std::string(name) + (constructed ? " must be constructed" : " must be primitive"),
                    ErrorKind::InvalidTag);
            }
            return header;
        }

        ByteSpan content_of(ByteSpan input, const ParsedHeader &header) {
            return input.subspan(header.header_bytes, header.length);
        }

    } // namespace

    ASN1Result<size_t> get_length(ByteSpan input) {
        if (input.empty()) {
            return ASN1Result<size_t>::failure("missing length field", ErrorKind::Truncated);
        }

        const uint8_t first = input[0];
        if ((first & 0x80U) == 0) {
            return ASN1Result<size_t>::ok(first, 1);
        }

        const size_t octet_count = first & 0x7FU;
        if (octet_count == 0) {
            return ASN1Result<size_t>::failure("indefinite lengths are not supported in DER", ErrorKind::InvalidLength);
        }
        if (octet_count > kMaxLengthOctets) {
            return ASN1Result<size_t>::failure("length uses more bytes than supported", ErrorKind::InvalidLength);
        }
        if (input.size() < 1 + octet_count) {
            return ASN1Result<size_t>::failure("insufficient data for long-form length", ErrorKind::Truncated);
        }

        if (input[1] == 0x00) {
            return ASN1Result<size_t>::failure("long-form length has leading zero octet", ErrorKind::InvalidLength);
        }

        size_t length = 0;
        for (size_t i = 0; i < octet_count; ++i) {
            length = (length << 8) | input[1 + i];
        }
        if (length < 0x80U) {
            return ASN1Result<size_t>::failure("long-form length where short form fits", ErrorKind::InvalidLength);
        }
        return ASN1Result<size_t>::ok(length, 1 + octet_count);
    }

    ASN1Result<ParsedHeader> parse_id_len(ByteSpan input) {
        if (input.empty()) {
            return ASN1Result<ParsedHeader>::failure("input too small for ASN.1 header", ErrorKind::Truncated);
        }

        size_t offset = 0;
        const uint8_t first_octet = input[offset++];

        ASN1Identifier identifier{};
        identifier.tag_class = static_cast<ASN1Class>(first_octet & 0xC0U);
        identifier.constructed = (first_octet & 0x20U) != 0;

        uint32_t tag_number = first_octet & 0x1FU;
        if (tag_number == 0x1FU) {
            tag_number = 0;
            bool more = true;
            size_t iterations = 0;
            while (more) {
                if (offset >= input.size()) {
                    return ASN1Result<ParsedHeader>::failure("unterminated long-form tag number",
                                                             ErrorKind::Truncated);
                }
                const uint8_t byte = input[offset++];
                if (iterations == 0 && byte == 0x80U) {
                    return ASN1Result<ParsedHeader>::failure("long-form tag number has leading zero bits",
                                                             ErrorKind::InvalidTag);
                }
                more = (byte & 0x80U) != 0;
                tag_number = (tag_number << 7U) | (byte & 0x7FU);
                ++iterations;
                if (iterations > 4 || tag_number > ASN1_MAX_TAG_NUMBER) {
                    return ASN1Result<ParsedHeader>::failure("tag number exceeds supported range",
                                                             ErrorKind::InvalidTag);
                }
            }
            if (tag_number < 0x1FU) {
                return ASN1Result<ParsedHeader>::failure("long-form tag number where low form fits",
                                                         ErrorKind::InvalidTag);
            }
        }
        identifier.tag_number = tag_number;

        const auto length_res = get_length(input.subspan(offset));
        if (!length_res.success) {
            return ASN1Result<ParsedHeader>::failure(length_res);
        }

        const size_t header_bytes = offset + length_res.bytes_consumed;
        if (length_res.value > input.size() - header_bytes) {
            return ASN1Result<ParsedHeader>::failure("value length exceeds buffer", ErrorKind::Truncated);
        }

        ParsedHeader header{identifier, length_res.value, header_bytes};
        return ASN1Result<ParsedHeader>::ok(header, header_bytes + length_res.value);
    }

    std::optional<ASN1Identifier> peek_identifier(ByteSpan input) {
        auto header = parse_id_len(input);
        if (!header.success) {
            return std::nullopt;
        }
        return header.value.identifier;
    }

    ASN1Result<ByteSpan> parse_integer(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::Integer, false, "INTEGER");
        if (!header.success) {
            return ASN1Result<ByteSpan>::failure(header);
        }
        const auto content = content_of(input, header.value);
        if (content.empty()) {
            return ASN1Result<ByteSpan>::failure("INTEGER has empty body");
        }
        return ASN1Result<ByteSpan>::ok(content, header.bytes_consumed);
    }

    ASN1Result<uint32_t> decode_u32(ByteSpan content) {
        if (content.empty()) {
            return ASN1Result<uint32_t>::failure("INTEGER has empty body");
        }
        if ((content[0] & 0x80U) != 0) {
            return ASN1Result<uint32_t>::failure("negative INTEGER where unsigned expected");
        }
        size_t start = 0;
        while (start + 1 < content.size() && content[start] == 0x00) {
            ++start;
        }
        if (content.size() - start > sizeof(uint32_t)) {
            return ASN1Result<uint32_t>::failure("INTEGER does not fit in 32 bits");
        }
        uint32_t value = 0;
        for (size_t i = start; i < content.size(); ++i) {
            value = (value << 8U) | content[i];
        }
        return ASN1Result<uint32_t>::ok(value, 0);
    }

    ASN1Result<uint32_t> parse_u32(ByteSpan input) {
        const auto integer = parse_integer(input);
        if (!integer.success) {
            return ASN1Result<uint32_t>::failure(integer);
        }
        auto value = decode_u32(integer.value);
        if (value.success) {
            value.bytes_consumed = integer.bytes_consumed;
        }
        return value;
    }

    ASN1Result<ByteSpan> parse_enumerated(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::Enumerated, false, "ENUMERATED");
        if (!header.success) {
            return ASN1Result<ByteSpan>::failure(header);
        }
        const auto content = content_of(input, header.value);
        if (content.empty()) {
            return ASN1Result<ByteSpan>::failure("ENUMERATED has empty body");
        }
        return ASN1Result<ByteSpan>::ok(content, header.bytes_consumed);
    }

    ASN1Result<BitStringView> decode_bit_string(ByteSpan content) {
        if (content.empty()) {
            return ASN1Result<BitStringView>::failure("BIT STRING missing unused-bits byte");
        }
        const uint8_t unused_bits = content[0];
        if (unused_bits > 7) {
            return ASN1Result<BitStringView>::failure("invalid unused bits");
        }
        if (unused_bits != 0 && content.size() == 1) {
            return ASN1Result<BitStringView>::failure("unused bits declared on empty BIT STRING");
        }
        return ASN1Result<BitStringView>::ok(BitStringView{unused_bits, content.subspan(1)}, content.size());
    }

    ASN1Result<BitStringView> parse_bit_string(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::BitString, false, "BIT STRING");
        if (!header.success) {
            return ASN1Result<BitStringView>::failure(header);
        }
        auto view = decode_bit_string(content_of(input, header.value));
        if (view.success) {
            view.bytes_consumed = header.bytes_consumed;
        }
        return view;
    }

    ASN1Result<ByteSpan> parse_octet_string(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::OctetString, false, "OCTET STRING");
        if (!header.success) {
            return ASN1Result<ByteSpan>::failure(header);
        }
        return ASN1Result<ByteSpan>::ok(content_of(input, header.value), header.bytes_consumed);
    }

    ASN1Result<Oid> decode_oid(ByteSpan content) {
        if (content.empty()) {
            return ASN1Result<Oid>::failure("OBJECT IDENTIFIER has empty body");
        }

        Oid oid{};
        oid.nodes.reserve(content.size() + 1);

        size_t offset = 0;
        bool first_subidentifier = true;
        while (offset < content.size()) {
            uint32_t value = 0;
            if (content[offset] == 0x80U) {
                return ASN1Result<Oid>::failure("OBJECT IDENTIFIER arc has leading padding");
            }
            do {
                const uint8_t byte = content[offset++];
                if (value > (std::numeric_limits<uint32_t>::max() >> 7U)) {
                    return ASN1Result<Oid>::failure("OBJECT IDENTIFIER arc overflow");
                }
                value = (value << 7U) | (byte & 0x7FU);
                if ((byte & 0x80U) == 0) {
                    break;
                }
                if (offset >= content.size()) {
                    return ASN1Result<Oid>::failure("truncated OBJECT IDENTIFIER arc");
                }
            } while (true);

            if (first_subidentifier) {
                const uint32_t first_arc = value < 80U ? value / 40U : 2U;
                oid.nodes.push_back(first_arc);
                oid.nodes.push_back(value - (first_arc * 40U));
                first_subidentifier = false;
            } else {
                oid.nodes.push_back(value);
            }
        }

        return ASN1Result<Oid>::ok(std::move(oid), content.size());
    }

    ASN1Result<Oid> parse_oid(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::ObjectIdentifier, false, "OBJECT IDENTIFIER");
        if (!header.success) {
            return ASN1Result<Oid>::failure(header);
        }
        auto oid = decode_oid(content_of(input, header.value));
        if (oid.success) {
            oid.bytes_consumed = header.bytes_consumed;
        }
        return oid;
    }

    ASN1Result<ByteSpan> parse_sequence(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::Sequence, true, "SEQUENCE");
        if (!header.success) {
            return ASN1Result<ByteSpan>::failure(header);
        }
        return ASN1Result<ByteSpan>::ok(content_of(input, header.value), header.bytes_consumed);
    }

    ASN1Result<ByteSpan> parse_set(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::Set, true, "SET");
        if (!header.success) {
            return ASN1Result<ByteSpan>::failure(header);
        }
        return ASN1Result<ByteSpan>::ok(content_of(input, header.value), header.bytes_consumed);
    }

    ASN1Result<ByteSpan> parse_explicit(ByteSpan input, uint32_t tag_number) {
        const auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<ByteSpan>::failure(header);
        }
        const auto &identifier = header.value.identifier;
        if (!identifier.is_context(tag_number)) {
            return ASN1Result<ByteSpan>::failure("expected context tag [" + std::to_string(tag_number) + "]",
                                                 ErrorKind::UnexpectedType);
        }
        if (!identifier.constructed) {
            return ASN1Result<ByteSpan>::failure("explicit tag must be constructed", ErrorKind::InvalidTag);
        }
        return ASN1Result<ByteSpan>::ok(content_of(input, header.value), header.bytes_consumed);
    }

    ASN1Result<bool> parse_boolean(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::Boolean, false, "BOOLEAN");
        if (!header.success) {
            return ASN1Result<bool>::failure(header);
        }
        if (header.value.length != 1) {
            return ASN1Result<bool>::failure("BOOLEAN length must be 1", ErrorKind::InvalidLength);
        }
        const auto content = content_of(input, header.value);
        return ASN1Result<bool>::ok(content[0] != 0, header.bytes_consumed);
    }

    ASN1Result<TimePoint> parse_utc_time(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::UTCTime, false, "UTCTime");
        if (!header.success) {
            return ASN1Result<TimePoint>::failure(header);
        }
        const auto content = content_of(input, header.value);
        if (content.size() < 11) {
            return ASN1Result<TimePoint>::failure("UTCTime too short");
        }
        const auto str = std::string_view(reinterpret_cast<const char *>(content.data()), content.size());
        if (str.back() != 'Z') {
            return ASN1Result<TimePoint>::failure("UTCTime must end with Z");
        }
        const size_t digits = str.size() - 1;
        if (digits != 10 && digits != 12) {
            return ASN1Result<TimePoint>::failure("UTCTime must have 10 or 12 digits");
        }

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!parse_decimal(str.substr(0, 2), year) || !parse_decimal(str.substr(2, 2), month) ||
            !parse_decimal(str.substr(4, 2), day) || !parse_decimal(str.substr(6, 2), hour) ||
            !parse_decimal(str.substr(8, 2), minute)) {
            return ASN1Result<TimePoint>::failure("invalid UTCTime digits");
        }
        if (digits == 12 && !parse_decimal(str.substr(10, 2), second)) {
            return ASN1Result<TimePoint>::failure("invalid UTCTime seconds");
        }

        const int full_year = (year >= 50) ? (1900 + year) : (2000 + year);
        auto tp_result = make_time_point(full_year, month, day, hour, minute, second);
        if (tp_result.success) {
            tp_result.bytes_consumed = header.bytes_consumed;
        }
        return tp_result;
    }

    ASN1Result<TimePoint> parse_generalized_time(ByteSpan input) {
        const auto header = expect_universal(input, ASN1Tag::GeneralizedTime, false, "GeneralizedTime");
        if (!header.success) {
            return ASN1Result<TimePoint>::failure(header);
        }
        const auto content = content_of(input, header.value);
        if (content.size() < 13) {
            return ASN1Result<TimePoint>::failure("GeneralizedTime too short");
        }
        const auto str = std::string_view(reinterpret_cast<const char *>(content.data()), content.size());
        if (str.back() != 'Z') {
            return ASN1Result<TimePoint>::failure("GeneralizedTime must end with Z");
        }
        const size_t digits = str.size() - 1;
        if (digits != 12 && digits != 14) { // allow optional seconds
            return ASN1Result<TimePoint>::failure("GeneralizedTime must have 12 or 14 digits");
        }

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!parse_decimal(str.substr(0, 4), year) || !parse_decimal(str.substr(4, 2), month) ||
            !parse_decimal(str.substr(6, 2), day) || !parse_decimal(str.substr(8, 2), hour) ||
            !parse_decimal(str.substr(10, 2), minute)) {
            return ASN1Result<TimePoint>::failure("invalid GeneralizedTime digits");
        }
        if (digits == 14 && !parse_decimal(str.substr(12, 2), second)) {
            return ASN1Result<TimePoint>::failure("invalid GeneralizedTime seconds");
        }

        auto tp_result = make_time_point(year, month, day, hour, minute, second);
        if (tp_result.success) {
            tp_result.bytes_consumed = header.bytes_consumed;
        }
        return tp_result;
    }

    ASN1Result<TimePoint> parse_time(ByteSpan input) {
        const auto identifier = peek_identifier(input);
        if (!identifier) {
            // Let the header reader report why.
            return ASN1Result<TimePoint>::failure(parse_id_len(input));
        }
        if (identifier->is_universal(ASN1Tag::UTCTime)) {
            return parse_utc_time(input);
        }
        if (identifier->is_universal(ASN1Tag::GeneralizedTime)) {
            return parse_generalized_time(input);
        }
        return ASN1Result<TimePoint>::failure("expected UTCTime or GeneralizedTime", ErrorKind::UnexpectedType);
    }

    ASN1Result<std::string> parse_directory_string(ByteSpan input) {
        const auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<std::string>::failure(header);
        }
        const auto &identifier = header.value.identifier;
        if (identifier.tag_class != ASN1Class::Universal || identifier.constructed) {
            return ASN1Result<std::string>::failure("directory string invalid tag", ErrorKind::UnexpectedType);
        }
        const auto tag = static_cast<ASN1Tag>(identifier.tag_number);
        const auto content = content_of(input, header.value);

        auto make_ascii = [&]() -> std::string {
            return std::string(reinterpret_cast<const char *>(content.data()), content.size());
        };

        switch (tag) {
        case ASN1Tag::PrintableString:
        case ASN1Tag::IA5String:
        case ASN1Tag::UTF8String:
        case ASN1Tag::T61String:
            return ASN1Result<std::string>::ok(make_ascii(), header.bytes_consumed);
        case ASN1Tag::BMPString: {
            if (content.size() % 2 != 0) {
                return ASN1Result<std::string>::failure("BMPString must have even length");
            }
            std::string utf8;
            utf8.reserve(content.size());
            for (size_t i = 0; i < content.size(); i += 2) {
                const uint16_t codepoint =
                    (static_cast<uint16_t>(content[i]) << 8U) | static_cast<uint16_t>(content[i + 1]);
                if (codepoint <= 0x7F) {
                    utf8.push_back(static_cast<char>(codepoint));
                } else if (codepoint <= 0x7FF) {
                    utf8.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
                    utf8.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                } else {
                    utf8.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
                    utf8.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                    utf8.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                }
            }
            return ASN1Result<std::string>::ok(utf8, header.bytes_consumed);
        }
        default:
            return ASN1Result<std::string>::failure("unsupported directory string tag", ErrorKind::UnexpectedType);
        }
    }

    ASN1Result<Any> parse_any(ByteSpan input, size_t max_depth) {
        const auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<Any>::failure(header);
        }
        Any any{};
        any.identifier = header.value.identifier;
        any.content = content_of(input, header.value);
        any.raw = input.first(header.bytes_consumed);

        if (any.identifier.constructed) {
            if (max_depth == 0) {
                return ASN1Result<Any>::failure("maximum nesting depth exceeded", ErrorKind::NestingTooDeep);
            }
            size_t offset = 0;
            while (offset < any.content.size()) {
                auto child = parse_any(any.content.subspan(offset), max_depth - 1);
                if (!child.success) {
                    return child;
                }
                offset += child.bytes_consumed;
            }
        }
        return ASN1Result<Any>::ok(any, header.bytes_consumed);
    }

} // namespace certview::cert
