#pragma once

#include <optional>
#include <string>
#include "genid/os_metadata.hpp"
#include "genid/uuid.hpp"
#include "genid/uuid_parser.hpp"

namespace genid {
namespace json_io {

/**
 * @brief Load a ClientMetadata from a JSON config document.
 * @param json_str Document such as
 *        `{"os":"linux","os_version":[5,15],"hostname":"h","user_agent":"ua"}`.
 * @param base     Record supplying every key the document leaves out.
 * @return The merged record, or std::nullopt if the text is not a JSON object,
 *         a key has the wrong type, or "os" names no known family.
 */
std::optional<ClientMetadata> client_metadata_from_json(const std::string& json_str,
                                                        const ClientMetadata& base);

/**
 * @brief Read a config file and hand it to client_metadata_from_json().
 * @return std::nullopt if the file cannot be opened or does not load.
 */
std::optional<ClientMetadata> load_client_metadata(const std::string& path,
                                                   const ClientMetadata& base);

/**
 * @brief Serialize a ClientMetadata. "user_agent" is omitted when unset.
 */
std::string to_json(const ClientMetadata& meta);

/**
 * @brief Serialize an ExtractedMetadata.
 * @return `{"timestamp_ms":..,"os":"..","os_version":[maj,min],"hostname_hash":..,"extended_hash":..}`
 */
std::string to_json(const ExtractedMetadata& meta);

/**
 * @brief One-line report for a parse attempt, as printed by `genid parse --output json`.
 * @param input Text as given by the user.
 * @param err   Result of the parse.
 * @param id    Parsed value (ignored unless err is ParseError::None).
 * @param meta  Extracted record, if any; omitted from the report when empty.
 */
std::string parse_report_json(const std::string& input, ParseError err, const Uuid& id,
                              const std::optional<ExtractedMetadata>& meta);

} // namespace json_io
} // namespace genid
