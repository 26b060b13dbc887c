/**
 * @file FsSupport.cpp
 * @brief Implementation of FsSupport.
 */

#include "infrastructure/FsSupport.hpp"
#include "domain/PipelineErrors.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

std::string FsSupport::ToIsoTimestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::chrono::system_clock::time_point FsSupport::FromIsoTimestamp(const std::string& value) {
    std::tm tm = {};
    std::istringstream iss(value);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (iss.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::optional<std::string> FsSupport::ReadFile(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw domain::StorageError("cannot stat " + path + ": " + ec.message());
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw domain::StorageError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::StorageError("read failed for " + path);
    }
    return buffer.str();
}

std::optional<nlohmann::json> FsSupport::ReadJsonFile(const std::string& path) {
    auto content = ReadFile(path);
    if (!content) return std::nullopt;
    try {
        return nlohmann::json::parse(*content);
    } catch (const nlohmann::json::exception& e) {
        throw domain::StorageError("corrupt JSON in " + path + ": " + e.what());
    }
}

} // namespace adaharvest::infrastructure
