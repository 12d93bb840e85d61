/**
 * @file hash.hpp
 * @brief genid string hashes: fold variable-length text into fixed-width fields.
 *
 * Both functions run the classic "times 33" accumulator:
 *
 * @code
 *   hash = 5381
 *   for each byte b:  hash = (hash << 5) + hash + b    // mod 2^32
 * @endcode
 *
 * The 16-bit variant XORs the high half onto the low half before truncating.
 *
 * These are NOT security primitives. Collisions are expected; the fields they
 * fill exist so identifiers minted on the same host cluster together.
 */
#ifndef GENID_HASH_HPP
#define GENID_HASH_HPP

#include <stdint.h>
#include <string>

namespace genid {

/**
 * @brief 32-bit hash of every byte in @p input.
 * @param input Any byte string (hostname, hostname+user-agent, ...).
 * @return Wrapping 32-bit accumulator value.
 */
uint32_t hash_to_u32(const std::string& input);

/**
 * @brief 16-bit hash: hash_to_u32() folded as `(h ^ (h >> 16)) & 0xFFFF`.
 */
uint16_t hash_to_u16(const std::string& input);

} // namespace genid

#endif // GENID_HASH_HPP
