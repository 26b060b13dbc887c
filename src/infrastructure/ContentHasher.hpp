/**
 * @file ContentHasher.hpp
 * @brief BLAKE3 digests used as content addresses.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace adaharvest::infrastructure {

/**
 * @class ContentHasher
 * @brief Same content, same hash, stored once.
 */
class ContentHasher {
public:
    static constexpr size_t HashSize = 32; // 256 bits
    using Hash = std::array<std::uint8_t, HashSize>;

    static Hash Hash256(const void* data, size_t len);

    /** @brief Lower-case hex digest of @p bytes (64 characters). */
    static std::string HexDigest(const std::string& bytes);

    static std::string ToHex(const Hash& hash);

    /** @brief Checks the shape of a stored hex digest. */
    static bool IsHexDigest(const std::string& value);
};

} // namespace adaharvest::infrastructure
