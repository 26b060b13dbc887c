/**
 * @file RawDocument.hpp
 * @brief Domain entities for downloaded document bytes, before and after persistence.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace adaharvest::domain {

/**
 * @struct DownloadedDocument
 * @brief Bytes exactly as returned by the remote source, not yet persisted.
 */
struct DownloadedDocument {
    std::string bytes;
    std::string sourceUrl;
    std::string contentType;
    std::chrono::system_clock::time_point retrievedAt;
};

/**
 * @class RawDocument
 * @brief One persisted version of a decision's document. Write-once.
 */
class RawDocument {
public:
    std::string ada;               ///< Owning decision identifier.
    std::string hash;              ///< Hex BLAKE3 digest of the bytes.
    int version = 0;               ///< 1-based position in the identifier's version chain.
    std::string sourceUrl;         ///< Where the bytes were downloaded from.
    std::string contentType;       ///< As reported by the server, may be empty.
    std::chrono::system_clock::time_point retrievedAt;
    std::uint64_t sizeBytes = 0;
    std::string storagePath;       ///< Absolute path of the verbatim bytes.

    RawDocument() = default;
};

} // namespace adaharvest::domain
