/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the harvester configuration (settings.json).
 *
 * Provides a unified way to access settings without scattering JSON parsing
 * logic throughout the codebase. Every key is optional; defaults live here.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <optional>

namespace adaharvest::infrastructure {

/**
 * @class ConfigError
 * @brief Unreadable or malformed configuration. The CLI maps it to exit code 2.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct HarvestConfig
 * @brief Resolved settings for one run.
 */
struct HarvestConfig {
    std::string apiBaseUrl = "https://diavgeia.gov.gr";
    std::string outputRoot;                 ///< Empty until resolved; see ConfigLoader::Load.
    int workers = 4;
    std::string userAgent = "AdaHarvest/1.0 (+https://diavgeia.gov.gr/opendata)";

    struct Fetch {
        int maxAttempts = 5;
        int baseDelayMs = 500;
        int maxDelayMs = 30000;
        double jitter = 0.3;
        int timeoutSeconds = 60;
    } fetch;

    struct RateLimit {
        double requestsPerSecond = 2.0;
        int burst = 4;
    } rateLimit;

    struct Storage {
        int maxAttempts = 3;
    } storage;

    struct Extraction {
        std::string ocrLanguages = "ell+eng";
        int minNativeChars = 32;
        int timeoutSeconds = 900;
        double expectedCharsPerPage = 1200.0;
    } extraction;

    struct Normalization {
        std::string defaultCurrency = "EUR";
    } normalization;
};

class ConfigLoader {
public:
    /**
     * @brief Loads settings from @p explicitPath, or from the default location when empty.
     *
     * A missing default file yields defaults; a missing explicit file, unparsable JSON
     * or a value of the wrong type or range throws ConfigError. outputRoot falls back
     * to PathUtils::GetDefaultOutputRoot().
     */
    static HarvestConfig Load(const std::optional<std::string>& explicitPath);

    /** @brief Applies a parsed settings document over @p config. Throws ConfigError. */
    static void Apply(const std::string& jsonText, HarvestConfig& config);
};

} // namespace adaharvest::infrastructure
