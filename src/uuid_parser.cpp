// -----------------------------------------------------------------------------
// @file uuid_parser.cpp
// @brief Normalization and strict structural decoding of identifier text.
// -----------------------------------------------------------------------------
#include "genid/uuid_parser.hpp"

namespace genid {

namespace {

bool starts_with(const std::string& s, size_t from, const char* token, size_t token_len) {
    return s.size() - from >= token_len && s.compare(from, token_len, token) == 0;
}

// Hyphen positions of the 8-4-4-4-12 form
bool is_hyphen_slot(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

const char* parse_error_str(ParseError err) {
    switch (err) {
        case ParseError::None:             return "ok";
        case ParseError::InvalidLength:    return "invalid length: expected 32 or 36 characters";
        case ParseError::InvalidCharacter: return "invalid character: expected hex digit";
        case ParseError::InvalidGroup:     return "invalid group: hyphens must be at 8, 13, 18, 23";
    }
    return "unknown parse error";
}

std::string clean_uuid_input(const std::string& input) {
    static const char URN[]    = "urn:uuid:";
    static const char SCHEME[] = "uuid:";
    const size_t urn_len    = sizeof(URN) - 1;
    const size_t scheme_len = sizeof(SCHEME) - 1;

    size_t begin = 0;
    size_t end = input.size();

    while (starts_with(input, begin, URN, urn_len)) begin += urn_len;
    while (starts_with(input, begin, SCHEME, scheme_len)) begin += scheme_len;
    while (begin < end && input[begin] == '{') ++begin;
    while (end > begin && input[end - 1] == '}') --end;

    return input.substr(begin, end - begin);
}

ParseError parse_uuid(const std::string& input, Uuid& out) {
    const std::string text = clean_uuid_input(input);

    bool hyphenated;
    if (text.size() == Uuid::HEX_LEN_HYPHENATED) {
        hyphenated = true;
    } else if (text.size() == Uuid::HEX_LEN_SIMPLE) {
        hyphenated = false;
    } else {
        return ParseError::InvalidLength;
    }

    uint8_t bytes[Uuid::SIZE] = {0};
    size_t nibble = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (hyphenated && is_hyphen_slot(i)) {
            if (c != '-') return ParseError::InvalidGroup;
            continue;
        }
        if (c == '-') return ParseError::InvalidGroup;

        uint8_t v = 0;
        if (!Uuid::hex_char_to_val(c, v)) return ParseError::InvalidCharacter;

        // Even nibble is the high half of the byte
        if (nibble % 2 == 0) bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
        else                 bytes[nibble / 2] |= v;
        ++nibble;
    }

    out.unpack(bytes, Uuid::SIZE);
    return ParseError::None;
}

std::optional<Uuid> parse_uuid(const std::string& input) {
    Uuid id;
    if (parse_uuid(input, id) != ParseError::None) return std::nullopt;
    return id;
}

ParseError parse_uuid_with_metadata(const std::string& input, Uuid& out,
                                    std::optional<ExtractedMetadata>& meta) {
    Uuid id;
    ParseError err = parse_uuid(input, id);
    if (err != ParseError::None) return err;

    out = id;
    meta = extract_metadata(id);
    return ParseError::None;
}

} // namespace genid
