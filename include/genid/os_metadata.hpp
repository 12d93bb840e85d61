/**
 * @file os_metadata.hpp
 * @brief genid metadata codec: pack client OS/host facts into a version-7 Uuid.
 *
 * A metadata-bearing identifier is an ordinary version-7 Uuid whose spare
 * random bytes are overwritten with a deterministic payload. The timestamp,
 * the version nibble and the variant byte are never touched, so the value
 * still validates as v7 and still sorts by creation time.
 *
 * @section genid_meta_layout Byte layout (16 bytes, big endian)
 *
 * | Byte  | Contents                                               |
 * |-------|--------------------------------------------------------|
 * | 0–5   | Timestamp, ms since epoch (untouched)                  |
 * | 6     | `0x7` version nibble + OS field bits 11..8             |
 * | 7     | OS field bits 7..0                                     |
 * | 8     | Variant (untouched)                                    |
 * | 9     | Low byte of hash_to_u16(hostname)                      |
 * | 10–13 | hash_to_u32(hostname + user_agent), big endian         |
 * | 14–15 | Random (untouched, collision margin)                   |
 *
 * @section genid_meta_osfield OS field (12 bits, wire contract)
 *
 * | Bits   | Width | Field                          |
 * |--------|-------|--------------------------------|
 * | 11..9  | 3     | OS family code (1–5)           |
 * | 8..4   | 5     | Major version (0–31)           |
 * | 3..0   | 4     | Minor version (0–15)           |
 *
 * Components wider than their field are masked, not rejected: major 32
 * encodes as 0, minor 16 encodes as 0. An unknown family code (0, 6, 7)
 * decodes as Linux.
 *
 * @note extract_metadata() cannot tell a metadata-bearing identifier from a
 *       plain v7 one; any v7 value yields a record. There is no marker bit in
 *       the format to distinguish them.
 */
#ifndef GENID_OS_METADATA_HPP
#define GENID_OS_METADATA_HPP

#include "genid/uuid.hpp"
#include <stdint.h>
#include <optional>
#include <string>

namespace genid {

/// Operating system family, as stored in the top 3 bits of the OS field.
enum class OsType : uint8_t {
    Linux   = 1,
    Windows = 2,
    MacOS   = 3,
    Android = 4,
    IOS     = 5,
};

// OS field split. Changing any of these changes the wire format.
static constexpr unsigned OS_FAMILY_BITS = 3;
static constexpr unsigned OS_MAJOR_BITS  = 5;
static constexpr unsigned OS_MINOR_BITS  = 4;

static constexpr uint8_t  OS_FAMILY_MASK = (1u << OS_FAMILY_BITS) - 1;  ///< 0x07
static constexpr uint8_t  OS_MAJOR_MASK  = (1u << OS_MAJOR_BITS) - 1;   ///< 0x1F
static constexpr uint8_t  OS_MINOR_MASK  = (1u << OS_MINOR_BITS) - 1;   ///< 0x0F
static constexpr uint16_t OS_FIELD_MASK  = 0x0FFF;

/// @brief Family of the platform this library was compiled for.
OsType current_os_type();

/// @brief Numeric code written into the OS field.
uint8_t os_type_code(OsType os);

/**
 * @brief Decode a family code. Only the low 3 bits are looked at; anything
 *        outside 1–5 becomes OsType::Linux.
 */
OsType os_type_from_code(uint8_t code);

/// @brief Lowercase name: "linux", "windows", "macos", "android", "ios".
const char* os_type_name(OsType os);

/**
 * @brief Look up a family by name (case-insensitive).
 * @param name Name as produced by os_type_name().
 * @param out  Receives the family on success.
 * @return false if the name is not one of the five families.
 */
bool os_type_from_name(const std::string& name, OsType& out);

/// OS version as a (major, minor) pair.
struct OsVersion {
    uint8_t major_version;
    uint8_t minor_version;
};

bool operator==(const OsVersion& lhs, const OsVersion& rhs);
bool operator!=(const OsVersion& lhs, const OsVersion& rhs);

/// @brief Apply the same truncation encode_os_field() applies (major & 0x1F, minor & 0x0F).
OsVersion mask_os_version(OsVersion version);

/// Decoded content of the 12-bit OS field.
struct OsField {
    OsType    os_type;
    OsVersion version;
};

/**
 * @brief Pack family and version into the 12-bit OS field.
 * @return Value in 0x000–0xFFF.
 */
uint16_t encode_os_field(OsType os, OsVersion version);

/**
 * @brief Unpack a 12-bit OS field. Bits above 11 are ignored.
 *
 * `decode_os_field(encode_os_field(os, v))` yields `{os, mask_os_version(v)}`.
 */
OsField decode_os_field(uint16_t encoded);

/**
 * @brief Parse a dotted version string ("5.15.0-91-generic", "10.0.22631", "17").
 * @param version_str Text to parse; leading digits of the first two components count.
 * @param fallback    Returned when no leading number is found at all.
 * @return (major, minor) clamped to (31, 15).
 */
OsVersion parse_os_version(const std::string& version_str, OsVersion fallback);

/**
 * @struct ClientMetadata
 * @brief The facts a caller wants embedded in generated identifiers.
 *
 * Treat as an immutable value: build once per process or per request and
 * pass by const reference. with_user_agent() returns a modified copy.
 */
struct ClientMetadata {
    OsType os_type;
    OsVersion os_version;
    std::string hostname;                   ///< Hostname or other machine identifier
    std::optional<std::string> user_agent;  ///< Mixed into the extended hash when present

    ClientMetadata(OsType os, OsVersion version, std::string host);

    /// @brief Copy of this record with @p ua as user agent.
    ClientMetadata with_user_agent(std::string ua) const;

    /// @brief Copy of this record without a user agent.
    ClientMetadata without_user_agent() const;
};

bool operator==(const ClientMetadata& lhs, const ClientMetadata& rhs);
bool operator!=(const ClientMetadata& lhs, const ClientMetadata& rhs);

/**
 * @struct ExtractedMetadata
 * @brief What extract_metadata() recovers from a version-7 Uuid.
 */
struct ExtractedMetadata {
    uint64_t  timestamp_ms;
    OsType    os_type;
    OsVersion os_version;
    uint8_t   hostname_hash;   ///< Byte 9: low byte of hash_to_u16(hostname)
    uint32_t  extended_hash;   ///< Bytes 10–13: hash_to_u32(hostname + user_agent)
};

bool operator==(const ExtractedMetadata& lhs, const ExtractedMetadata& rhs);
bool operator!=(const ExtractedMetadata& lhs, const ExtractedMetadata& rhs);

/**
 * @brief Overwrite the payload bytes of a version-7 @p id with @p meta.
 *
 * Writes bytes 6 (low nibble), 7, 9 and 10–13. The version nibble is forced
 * to 7; bytes 0–5, 8, 14 and 15 are left exactly as they were.
 */
void embed_metadata(Uuid& id, const ClientMetadata& meta);

/**
 * @brief Recover the embedded payload.
 * @return std::nullopt when @p id is not version 7; a record otherwise.
 */
std::optional<ExtractedMetadata> extract_metadata(const Uuid& id);

} // namespace genid

#endif // GENID_OS_METADATA_HPP
