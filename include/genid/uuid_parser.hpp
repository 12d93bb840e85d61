/**
 * @file uuid_parser.hpp
 * @brief Text → Uuid, with optional recovery of embedded client metadata.
 *
 * Accepted input, case-insensitive:
 *  - `550e8400-e29b-41d4-a716-446655440000`  (hyphenated, 36 chars)
 *  - `550e8400e29b41d4a716446655440000`      (simple, 32 chars)
 *
 * either of which may be decorated with a `urn:uuid:` or `uuid:` scheme and/or
 * wrapped in braces. Decorations are removed by clean_uuid_input() before the
 * structural check. A generator prefix (e.g. `order_`) is NOT recognised and
 * must be stripped by the caller.
 *
 * Failures are reported as a ParseError code. Nothing here throws.
 */
#ifndef GENID_UUID_PARSER_HPP
#define GENID_UUID_PARSER_HPP

#include "genid/os_metadata.hpp"
#include "genid/uuid.hpp"
#include <optional>
#include <string>

namespace genid {

enum class ParseError {
    None = 0,          ///< Success
    InvalidLength,     ///< Normalized text is neither 32 nor 36 characters
    InvalidCharacter,  ///< A digit position holds something other than 0-9a-fA-F
    InvalidGroup,      ///< Hyphens missing or not at positions 8, 13, 18, 23
};

/// @brief Short human-readable description of @p err.
const char* parse_error_str(ParseError err);

/**
 * @brief Strip caller decorations: leading `urn:uuid:`, then leading `uuid:`,
 *        then leading `{` and trailing `}`.
 *
 * Each strip is applied as often as it matches, so `{{x}}` becomes `x`.
 */
std::string clean_uuid_input(const std::string& input);

/**
 * @brief Parse identifier text.
 * @param input Text, optionally decorated (see clean_uuid_input()).
 * @param out   Receives the value on success; untouched on failure.
 * @return ParseError::None on success.
 */
ParseError parse_uuid(const std::string& input, Uuid& out);

/// @brief Convenience overload: the value, or std::nullopt on any parse error.
std::optional<Uuid> parse_uuid(const std::string& input);

/**
 * @brief Parse and, for version-7 values, extract the metadata payload.
 * @param input Identifier text.
 * @param out   Receives the value on success.
 * @param meta  Receives the extracted record for v7 values, std::nullopt otherwise.
 * @return ParseError::None on success.
 *
 * A non-v7 identifier is a successful parse with no metadata. Every v7
 * identifier yields a record, including ones minted without metadata; their
 * record is simply meaningless.
 */
ParseError parse_uuid_with_metadata(const std::string& input, Uuid& out,
                                    std::optional<ExtractedMetadata>& meta);

} // namespace genid

#endif // GENID_UUID_PARSER_HPP
