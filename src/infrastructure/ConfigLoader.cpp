/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FsSupport.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace adaharvest::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void Read(const json& section, const char* key, T& target) {
    if (!section.contains(key) || section[key].is_null()) return;
    try {
        target = section[key].get<T>();
    } catch (const json::exception&) {
        throw ConfigError(std::string("settings key '") + key + "' has the wrong type");
    }
}

const json& Section(const json& root, const char* key) {
    static const json kEmpty = json::object();
    if (!root.contains(key)) return kEmpty;
    if (!root[key].is_object()) {
        throw ConfigError(std::string("settings section '") + key + "' must be an object");
    }
    return root[key];
}

void RequirePositive(int value, const char* key) {
    if (value <= 0) throw ConfigError(std::string(key) + " must be positive");
}

} // namespace

void ConfigLoader::Apply(const std::string& jsonText, HarvestConfig& config) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("settings.json is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("settings.json must contain a JSON object");
    }

    Read(j, "apiBaseUrl", config.apiBaseUrl);
    Read(j, "outputRoot", config.outputRoot);
    Read(j, "workers", config.workers);
    Read(j, "userAgent", config.userAgent);

    const json& fetch = Section(j, "fetch");
    Read(fetch, "maxAttempts", config.fetch.maxAttempts);
    Read(fetch, "baseDelayMs", config.fetch.baseDelayMs);
    Read(fetch, "maxDelayMs", config.fetch.maxDelayMs);
    Read(fetch, "jitter", config.fetch.jitter);
    Read(fetch, "timeoutSeconds", config.fetch.timeoutSeconds);

    const json& rate = Section(j, "rateLimit");
    Read(rate, "requestsPerSecond", config.rateLimit.requestsPerSecond);
    Read(rate, "burst", config.rateLimit.burst);

    Read(Section(j, "storage"), "maxAttempts", config.storage.maxAttempts);

    const json& extraction = Section(j, "extraction");
    Read(extraction, "ocrLanguages", config.extraction.ocrLanguages);
    Read(extraction, "minNativeChars", config.extraction.minNativeChars);
    Read(extraction, "timeoutSeconds", config.extraction.timeoutSeconds);
    Read(extraction, "expectedCharsPerPage", config.extraction.expectedCharsPerPage);

    Read(Section(j, "normalization"), "defaultCurrency", config.normalization.defaultCurrency);

    RequirePositive(config.workers, "workers");
    RequirePositive(config.fetch.maxAttempts, "fetch.maxAttempts");
    RequirePositive(config.fetch.timeoutSeconds, "fetch.timeoutSeconds");
    RequirePositive(config.rateLimit.burst, "rateLimit.burst");
    RequirePositive(config.storage.maxAttempts, "storage.maxAttempts");
    RequirePositive(config.extraction.timeoutSeconds, "extraction.timeoutSeconds");
    if (config.fetch.jitter < 0.0 || config.fetch.jitter > 1.0) {
        throw ConfigError("fetch.jitter must be between 0 and 1");
    }
    if (config.normalization.defaultCurrency.size() != 3) {
        throw ConfigError("normalization.defaultCurrency must be an ISO 4217 code");
    }
}

HarvestConfig ConfigLoader::Load(const std::optional<std::string>& explicitPath) {
    HarvestConfig config;
    std::filesystem::path configPath = explicitPath ? std::filesystem::path(*explicitPath)
                                                    : PathUtils::GetDefaultConfigPath();

    std::optional<std::string> text;
    try {
        text = FsSupport::ReadFile(configPath.string());
    } catch (const std::exception& e) {
        throw ConfigError("cannot read " + configPath.string() + ": " + e.what());
    }

    if (!text) {
        if (explicitPath) {
            throw ConfigError("settings file not found: " + configPath.string());
        }
    } else {
        Apply(*text, config);
        Log::Info("ConfigLoader", "loaded " + configPath.string());
    }

    if (config.outputRoot.empty()) {
        config.outputRoot = PathUtils::GetDefaultOutputRoot().string();
    }
    return config;
}

} // namespace adaharvest::infrastructure
