/**
 * @file uuid.hpp
 * @brief genid Uuid: 16-byte identifier value with version-4 / version-7 construction.
 *
 * This header defines `genid::Uuid`, the raw 128-bit value every other genid
 * module works on. It is a plain byte array with big-endian semantics plus a
 * handful of accessors for the fields RFC 9562 fixes.
 *
 * @section genid_uuid_layout Field layout
 *
 * | Bytes | v4 content             | v7 content                                |
 * |-------|------------------------|-------------------------------------------|
 * | 0–5   | random                 | Unix time in ms, 48 bits, big endian      |
 * | 6     | `0x4` + 4 random bits  | `0x7` + 4 random bits                     |
 * | 7     | random                 | random                                    |
 * | 8     | `10` + 6 random bits   | `10` + 6 random bits (RFC variant)        |
 * | 9–15  | random                 | random                                    |
 *
 * Because the v7 timestamp sits in the most significant bytes, comparing two
 * v7 values byte by byte (or comparing their lowercase hex text) orders them by
 * creation millisecond.
 *
 * @note Randomness comes from getrandom(2). A kernel that cannot deliver random
 *       bytes is treated as fatal for the process; construction never returns
 *       an error.
 */
#ifndef GENID_UUID_HPP
#define GENID_UUID_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace genid {

/**
 * @struct Uuid
 * @brief A 128-bit identifier stored as 16 bytes in network (big-endian) order.
 *
 * A default-constructed Uuid is the nil value (all zeros). Values are
 * trivially copyable and compare byte-wise.
 */
struct Uuid {
    static constexpr size_t SIZE = 16;

    /// Hyphenated text is the longest rendering (8-4-4-4-12 = 36 characters).
    static constexpr size_t HEX_LEN_HYPHENATED = 36;
    static constexpr size_t HEX_LEN_SIMPLE     = 32;

    using HexStr = etl::string<HEX_LEN_HYPHENATED>;

    uint8_t bytes[SIZE];

    /// @brief Nil value, all 16 bytes zero.
    Uuid();

    /**
     * @brief Copy the first 16 bytes of @p data.
     * @param data Source buffer.
     * @param len  Buffer length; anything shorter than 16 leaves the nil value.
     */
    Uuid(const uint8_t* data, size_t len);

    /// @brief Fresh version-4 value: 122 random bits, version and variant fixed.
    static Uuid new_v4();

    /// @brief Fresh version-7 value stamped with the current wall-clock millisecond.
    static Uuid now_v7();

    /**
     * @brief Version-7 value for an explicit timestamp.
     * @param unix_ms Milliseconds since the Unix epoch; only the low 48 bits are kept.
     */
    static Uuid v7_at(uint64_t unix_ms);

    /// @brief Version tag, the high nibble of byte 6.
    uint8_t version() const;

    /// @brief true when byte 8 carries the RFC variant (`10xx xxxx`).
    bool is_rfc_variant() const;

    /// @brief Bytes 0–5 as a big-endian 48-bit number (meaningful for v7).
    uint64_t timestamp_ms() const;

    /// @brief true when all 16 bytes are zero.
    bool is_nil() const;

    /// @brief Copy the 16 bytes into @p out_buf (at least 16 bytes).
    void pack(uint8_t* out_buf) const;

    /**
     * @brief Load 16 bytes from @p in_buf.
     * @param in_buf Source buffer.
     * @param len    Length of the source; shorter than 16 resets to nil.
     */
    void unpack(const uint8_t* in_buf, size_t len);

    /**
     * @brief Render as hex text.
     * @param hyphenated true for 8-4-4-4-12 groups (36 chars), false for 32 bare digits.
     * @param uppercase  true for A–F, false for a–f.
     */
    HexStr to_hex_string(bool hyphenated = true, bool uppercase = false) const;

    /**
     * @brief Converts a single hex character to its numeric value (0–15).
     * @param c   Character to convert ('0'–'9', 'a'–'f', 'A'–'F').
     * @param out Receives the value on success; untouched otherwise.
     * @return true if @p c is a hex digit.
     */
    static bool hex_char_to_val(char c, uint8_t& out);
};

bool operator==(const Uuid& lhs, const Uuid& rhs);
bool operator!=(const Uuid& lhs, const Uuid& rhs);

/// Byte-wise ordering; for v7 values this is creation order at millisecond resolution.
bool operator<(const Uuid& lhs, const Uuid& rhs);

/**
 * @brief Fill @p out with @p len bytes from the kernel CSPRNG.
 *
 * Retries on EINTR and short reads. Any other failure writes a diagnostic to
 * stderr and aborts: the process cannot mint identifiers without entropy.
 */
void fill_random(uint8_t* out, size_t len);

/// @brief Current wall-clock time in milliseconds since the Unix epoch.
uint64_t now_unix_ms();

} // namespace genid

#endif // GENID_UUID_HPP
