// -----------------------------------------------------------------------------
// @file os_metadata.cpp
// @brief OS field codec and the byte-level inject/extract of client metadata.
//
// encode_os_field() and decode_os_field() must stay in lock-step with the
// layout table in os_metadata.hpp. The split is 3 / 5 / 4 bits.
// -----------------------------------------------------------------------------
#include "genid/os_metadata.hpp"
#include "genid/hash.hpp"

#include <cctype>
#include <utility>

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace genid {

// =============================================================================
// OsType
// =============================================================================

OsType current_os_type() {
#if defined(__ANDROID__)
    return OsType::Android;
#elif defined(__linux__)
    return OsType::Linux;
#elif defined(_WIN32)
    return OsType::Windows;
#elif defined(__APPLE__)
  #if TARGET_OS_IPHONE
    return OsType::IOS;
  #else
    return OsType::MacOS;
  #endif
#else
    // Other Unix-likes are reported as Linux
    return OsType::Linux;
#endif
}

uint8_t os_type_code(OsType os) {
    return static_cast<uint8_t>(os);
}

OsType os_type_from_code(uint8_t code) {
    switch (code & OS_FAMILY_MASK) {
        case 1: return OsType::Linux;
        case 2: return OsType::Windows;
        case 3: return OsType::MacOS;
        case 4: return OsType::Android;
        case 5: return OsType::IOS;
        default: return OsType::Linux;
    }
}

const char* os_type_name(OsType os) {
    switch (os) {
        case OsType::Linux:   return "linux";
        case OsType::Windows: return "windows";
        case OsType::MacOS:   return "macos";
        case OsType::Android: return "android";
        case OsType::IOS:     return "ios";
    }
    return "linux";
}

bool os_type_from_name(const std::string& name, OsType& out) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    static const OsType all[] = {
        OsType::Linux, OsType::Windows, OsType::MacOS, OsType::Android, OsType::IOS
    };
    for (OsType os : all) {
        if (lower == os_type_name(os)) { out = os; return true; }
    }
    return false;
}

// =============================================================================
// OS field codec
// =============================================================================

bool operator==(const OsVersion& lhs, const OsVersion& rhs) {
    return lhs.major_version == rhs.major_version && lhs.minor_version == rhs.minor_version;
}

bool operator!=(const OsVersion& lhs, const OsVersion& rhs) { return !(lhs == rhs); }

OsVersion mask_os_version(OsVersion version) {
    return OsVersion{static_cast<uint8_t>(version.major_version & OS_MAJOR_MASK),
                     static_cast<uint8_t>(version.minor_version & OS_MINOR_MASK)};
}

uint16_t encode_os_field(OsType os, OsVersion version) {
    // Family code -> bits 11..9
    uint16_t family_bits = static_cast<uint16_t>((os_type_code(os) & OS_FAMILY_MASK)
                                                 << (OS_MAJOR_BITS + OS_MINOR_BITS));
    // Major, truncated to 5 bits -> bits 8..4
    uint16_t major_bits  = static_cast<uint16_t>((version.major_version & OS_MAJOR_MASK) << OS_MINOR_BITS);
    // Minor, truncated to 4 bits -> bits 3..0
    uint16_t minor_bits  = static_cast<uint16_t>(version.minor_version & OS_MINOR_MASK);
    return family_bits | major_bits | minor_bits;
}

OsField decode_os_field(uint16_t encoded) {
    encoded &= OS_FIELD_MASK;
    OsField f;
    f.os_type       = os_type_from_code(static_cast<uint8_t>(encoded >> (OS_MAJOR_BITS + OS_MINOR_BITS)));
    f.version.major_version = static_cast<uint8_t>((encoded >> OS_MINOR_BITS) & OS_MAJOR_MASK);
    f.version.minor_version = static_cast<uint8_t>(encoded & OS_MINOR_MASK);
    return f;
}

OsVersion parse_os_version(const std::string& version_str, OsVersion fallback) {
    // Read up to two dot-separated leading numbers; stop at the first non-digit
    unsigned parts[2] = {0, 0};
    size_t found = 0;
    size_t pos = 0;

    while (found < 2 && pos < version_str.size()) {
        if (!std::isdigit(static_cast<unsigned char>(version_str[pos]))) break;

        unsigned value = 0;
        while (pos < version_str.size() && std::isdigit(static_cast<unsigned char>(version_str[pos]))) {
            if (value < 1000) value = value * 10 + static_cast<unsigned>(version_str[pos] - '0');
            ++pos;
        }
        parts[found++] = value;

        if (pos < version_str.size() && version_str[pos] == '.') ++pos;
        else break;
    }

    if (found == 0) return fallback;

    OsVersion v;
    v.major_version = static_cast<uint8_t>(parts[0] > OS_MAJOR_MASK ? OS_MAJOR_MASK : parts[0]);
    v.minor_version = static_cast<uint8_t>(parts[1] > OS_MINOR_MASK ? OS_MINOR_MASK : parts[1]);
    return v;
}

// =============================================================================
// Records
// =============================================================================

ClientMetadata::ClientMetadata(OsType os, OsVersion version, std::string host)
    : os_type(os), os_version(version), hostname(std::move(host)), user_agent() {}

ClientMetadata ClientMetadata::with_user_agent(std::string ua) const {
    ClientMetadata copy = *this;
    copy.user_agent = std::move(ua);
    return copy;
}

ClientMetadata ClientMetadata::without_user_agent() const {
    ClientMetadata copy = *this;
    copy.user_agent.reset();
    return copy;
}

bool operator==(const ClientMetadata& lhs, const ClientMetadata& rhs) {
    return lhs.os_type == rhs.os_type && lhs.os_version == rhs.os_version &&
           lhs.hostname == rhs.hostname && lhs.user_agent == rhs.user_agent;
}

bool operator!=(const ClientMetadata& lhs, const ClientMetadata& rhs) { return !(lhs == rhs); }

bool operator==(const ExtractedMetadata& lhs, const ExtractedMetadata& rhs) {
    return lhs.timestamp_ms == rhs.timestamp_ms && lhs.os_type == rhs.os_type &&
           lhs.os_version == rhs.os_version && lhs.hostname_hash == rhs.hostname_hash &&
           lhs.extended_hash == rhs.extended_hash;
}

bool operator!=(const ExtractedMetadata& lhs, const ExtractedMetadata& rhs) { return !(lhs == rhs); }

// =============================================================================
// Inject & Extract
// =============================================================================

void embed_metadata(Uuid& id, const ClientMetadata& meta) {
    // Bytes 0-5 (timestamp) are never written here
    uint16_t os_field = encode_os_field(meta.os_type, meta.os_version);

    // Byte 6: keep the v7 nibble, low nibble takes OS field bits 11..8
    id.bytes[6] = static_cast<uint8_t>(0x70 | ((os_field >> 8) & 0x0F));
    // Byte 7: OS field bits 7..0
    id.bytes[7] = static_cast<uint8_t>(os_field & 0xFF);

    // Byte 8 carries the variant and stays as generated

    // Byte 9: low byte of the 16-bit hostname hash
    id.bytes[9] = static_cast<uint8_t>(hash_to_u16(meta.hostname) & 0xFF);

    // Bytes 10-13: 32-bit hash of hostname + user agent, big-endian
    uint32_t extended = meta.user_agent ? hash_to_u32(meta.hostname + *meta.user_agent)
                                        : hash_to_u32(meta.hostname);
    id.bytes[10] = (extended >> 24) & 0xFF;
    id.bytes[11] = (extended >> 16) & 0xFF;
    id.bytes[12] = (extended >> 8)  & 0xFF;
    id.bytes[13] =  extended        & 0xFF;

    // Bytes 14-15 stay random
}

std::optional<ExtractedMetadata> extract_metadata(const Uuid& id) {
    // Only version 7 carries a payload
    if (id.version() != 7) return std::nullopt;

    // Reassemble the 12-bit field: low nibble of byte 6, then byte 7
    uint16_t os_field = static_cast<uint16_t>(((id.bytes[6] & 0x0F) << 8) | id.bytes[7]);
    OsField f = decode_os_field(os_field);

    ExtractedMetadata out;
    out.timestamp_ms  = id.timestamp_ms();
    out.os_type       = f.os_type;
    out.os_version    = f.version;
    out.hostname_hash = id.bytes[9];
    // Bytes 10-13, big-endian
    out.extended_hash = (static_cast<uint32_t>(id.bytes[10]) << 24) |
                        (static_cast<uint32_t>(id.bytes[11]) << 16) |
                        (static_cast<uint32_t>(id.bytes[12]) << 8)  |
                         static_cast<uint32_t>(id.bytes[13]);
    return out;
}

} // namespace genid
