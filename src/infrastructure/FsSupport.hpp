/**
 * @file FsSupport.hpp
 * @brief Small helpers shared by the file-system stores.
 */

#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace adaharvest::infrastructure {

/**
 * @class StripedMutex
 * @brief Fixed pool of mutexes selected by key hash. Two keys may share a stripe,
 *        one key always maps to the same stripe.
 */
class StripedMutex {
public:
    std::mutex& forKey(const std::string& key) {
        return m_stripes[std::hash<std::string>()(key) % m_stripes.size()];
    }

private:
    std::array<std::mutex, 64> m_stripes;
};

class FsSupport {
public:
    /** @brief UTC timestamp as YYYY-MM-DDTHH:MM:SSZ. */
    static std::string ToIsoTimestamp(const std::chrono::system_clock::time_point& tp);

    /** @brief Inverse of ToIsoTimestamp; epoch on malformed input. */
    static std::chrono::system_clock::time_point FromIsoTimestamp(const std::string& value);

    /** @brief Whole file, or std::nullopt when it does not exist. Throws StorageError when unreadable. */
    static std::optional<std::string> ReadFile(const std::string& path);

    /** @brief Parsed JSON file, or std::nullopt when absent. Throws StorageError when unreadable or corrupt. */
    static std::optional<nlohmann::json> ReadJsonFile(const std::string& path);
};

} // namespace adaharvest::infrastructure
