// -----------------------------------------------------------------------------
// @file hash.cpp
// @brief Times-33 string hashes used to compress hostname / user-agent text.
// -----------------------------------------------------------------------------
#include "genid/hash.hpp"

namespace genid {

uint32_t hash_to_u32(const std::string& input) {
    uint32_t hash = 5381;
    for (unsigned char byte : input) {
        // Unsigned arithmetic wraps mod 2^32
        hash = (hash << 5) + hash + byte;
    }
    return hash;
}

uint16_t hash_to_u16(const std::string& input) {
    uint32_t hash = hash_to_u32(input);
    return static_cast<uint16_t>(hash ^ (hash >> 16));
}

} // namespace genid
