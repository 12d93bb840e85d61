// -----------------------------------------------------------------------------
// @file uuid.cpp
// @brief Implementation of genid::Uuid: construction, field access, hex output.
//
// Implemented here:
// - Constructors (nil, from buffer)
// - Version 4 and version 7 factories
// - Packing and unpacking to/from raw byte arrays
// - Hex rendering (hyphenated / simple, lower / upper case)
// - The getrandom(2) wrapper shared by every factory
// -----------------------------------------------------------------------------
#include "genid/uuid.hpp"

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sys/random.h>

namespace genid {

namespace {

constexpr uint8_t VERSION_4 = 0x40;
constexpr uint8_t VERSION_7 = 0x70;

// Force version nibble (byte 6) and RFC variant bits (byte 8).
void stamp_version_and_variant(uint8_t* bytes, uint8_t version_bits) {
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | version_bits);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
}

} // namespace

// =============================================================================
// Ambient sources
// =============================================================================

void fill_random(uint8_t* out, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        ssize_t n = ::getrandom(out + filled, len - filled, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "fatal: getrandom failed: " << std::strerror(errno) << "\n";
            std::abort();
        }
        filled += static_cast<size_t>(n);
    }
}

uint64_t now_unix_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// =============================================================================
// Constructors
// =============================================================================

Uuid::Uuid() : bytes{} {}

Uuid::Uuid(const uint8_t* data, size_t len) : bytes{} {
    unpack(data, len);
}

Uuid Uuid::new_v4() {
    Uuid id;
    fill_random(id.bytes, SIZE);
    stamp_version_and_variant(id.bytes, VERSION_4);
    return id;
}

Uuid Uuid::now_v7() {
    return v7_at(now_unix_ms());
}

Uuid Uuid::v7_at(uint64_t unix_ms) {
    Uuid id;
    // Random tail first, then the timestamp over bytes 0-5
    fill_random(id.bytes, SIZE);

    // 48-bit millisecond timestamp, most significant byte first, so byte
    // order matches time order
    id.bytes[0] = (unix_ms >> 40) & 0xFF;
    id.bytes[1] = (unix_ms >> 32) & 0xFF;
    id.bytes[2] = (unix_ms >> 24) & 0xFF;
    id.bytes[3] = (unix_ms >> 16) & 0xFF;
    id.bytes[4] = (unix_ms >> 8)  & 0xFF;
    id.bytes[5] =  unix_ms        & 0xFF;

    // Byte 6 high nibble = 7, byte 8 top bits = 10
    stamp_version_and_variant(id.bytes, VERSION_7);
    return id;
}

// =============================================================================
// Field access
// =============================================================================

uint8_t Uuid::version() const { return (bytes[6] >> 4) & 0x0F; }

bool Uuid::is_rfc_variant() const { return (bytes[8] & 0xC0) == 0x80; }

uint64_t Uuid::timestamp_ms() const {
    uint64_t ms = 0;
    for (size_t i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes[i];
    }
    return ms;
}

bool Uuid::is_nil() const {
    for (size_t i = 0; i < SIZE; ++i) {
        if (bytes[i] != 0) return false;
    }
    return true;
}

// =============================================================================
// Packing & Unpacking
// =============================================================================

void Uuid::pack(uint8_t* out_buf) const {
    std::memcpy(out_buf, bytes, SIZE);
}

void Uuid::unpack(const uint8_t* in_buf, size_t len) {
    // Too short (or null): fall back to nil rather than reading past the end
    if (in_buf == nullptr || len < SIZE) {
        std::memset(bytes, 0, SIZE);
        return;
    }
    std::memcpy(bytes, in_buf, SIZE);
}

// =============================================================================
// Conversion
// =============================================================================

Uuid::HexStr Uuid::to_hex_string(bool hyphenated, bool uppercase) const {
    const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";
    HexStr hex;

    for (size_t i = 0; i < SIZE; ++i) {
        // Group boundaries of the 8-4-4-4-12 form fall before bytes 4, 6, 8, 10
        if (hyphenated && (i == 4 || i == 6 || i == 8 || i == 10)) {
            hex += '-';
        }
        hex += digits[bytes[i] >> 4];
        hex += digits[bytes[i] & 0x0F];
    }

    return hex;
}

bool Uuid::hex_char_to_val(char c, uint8_t& out) {
    if ('0' <= c && c <= '9') {
        out = static_cast<uint8_t>(c - '0');
        return true;
    }
    if ('A' <= c && c <= 'F') {
        out = static_cast<uint8_t>(c - 'A' + 10);
        return true;
    }
    if ('a' <= c && c <= 'f') {
        out = static_cast<uint8_t>(c - 'a' + 10);
        return true;
    }
    return false;
}

bool operator==(const Uuid& lhs, const Uuid& rhs) {
    return std::memcmp(lhs.bytes, rhs.bytes, Uuid::SIZE) == 0;
}

bool operator!=(const Uuid& lhs, const Uuid& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Uuid& lhs, const Uuid& rhs) {
    return std::memcmp(lhs.bytes, rhs.bytes, Uuid::SIZE) < 0;
}

} // namespace genid
