#include <cassert>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "test/TestFakes.hpp"

using namespace adaharvest;
using infrastructure::ConfigError;
using infrastructure::ConfigLoader;
using infrastructure::HarvestConfig;

namespace {

bool Rejects(const std::string& text) {
    HarvestConfig config;
    try {
        ConfigLoader::Apply(text, config);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    {
        HarvestConfig config;
        ConfigLoader::Apply(R"({
            "apiBaseUrl": "http://localhost:8080",
            "workers": 8,
            "fetch": {"maxAttempts": 2, "jitter": 0.1},
            "rateLimit": {"requestsPerSecond": 0.5},
            "extraction": {"ocrLanguages": "ell", "minNativeChars": 10},
            "normalization": {"defaultCurrency": "USD"}
        })", config);
        assert(config.apiBaseUrl == "http://localhost:8080");
        assert(config.workers == 8);
        assert(config.fetch.maxAttempts == 2);
        assert(config.fetch.jitter == 0.1);
        assert(config.fetch.baseDelayMs == 500);
        assert(config.rateLimit.requestsPerSecond == 0.5);
        assert(config.rateLimit.burst == 4);
        assert(config.storage.maxAttempts == 3);
        assert(config.extraction.ocrLanguages == "ell");
        assert(config.extraction.minNativeChars == 10);
        assert(config.extraction.timeoutSeconds == 900);
        assert(config.normalization.defaultCurrency == "USD");
    }
    std::cout << "[PASS] Keys override defaults, absent keys keep them." << std::endl;

    assert(Rejects("{ not json"));
    assert(Rejects("[1, 2]"));
    assert(Rejects(R"({"workers": "four"})"));
    assert(Rejects(R"({"workers": 0})"));
    assert(Rejects(R"({"fetch": 5})"));
    assert(Rejects(R"({"fetch": {"jitter": 2.0}})"));
    assert(Rejects(R"({"normalization": {"defaultCurrency": "euro"}})"));
    std::cout << "[PASS] Malformed settings rejected." << std::endl;

    {
        test::ScratchDir dir("adaharvest_config");
        const std::string path = (dir.path() / "settings.json").string();
        {
            std::ofstream out(path);
            out << R"({"outputRoot": "/srv/diavgeia", "storage": {"maxAttempts": 6}})";
        }
        HarvestConfig config = ConfigLoader::Load(path);
        assert(config.outputRoot == "/srv/diavgeia");
        assert(config.storage.maxAttempts == 6);

        bool missing = false;
        try {
            ConfigLoader::Load((dir.path() / "absent.json").string());
        } catch (const ConfigError&) {
            missing = true;
        }
        assert(missing);
    }
    std::cout << "[PASS] Explicit settings file loaded; missing explicit file rejected." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
