/**
 * @file ContentHasher.cpp
 * @brief BLAKE3 hashing implementation.
 */

#include "infrastructure/ContentHasher.hpp"

extern "C" {
#include <blake3.h>
}

namespace adaharvest::infrastructure {

ContentHasher::Hash ContentHasher::Hash256(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HashSize);

    return result;
}

std::string ContentHasher::HexDigest(const std::string& bytes) {
    return ToHex(Hash256(bytes.data(), bytes.size()));
}

std::string ContentHasher::ToHex(const Hash& hash) {
    static const char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(HashSize * 2);
    for (std::uint8_t b : hash) {
        hex.push_back(kDigits[b >> 4]);
        hex.push_back(kDigits[b & 0x0F]);
    }
    return hex;
}

bool ContentHasher::IsHexDigest(const std::string& value) {
    if (value.size() != HashSize * 2) return false;
    for (char c : value) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

} // namespace adaharvest::infrastructure
