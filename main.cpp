/**
 * @file main.cpp
 * @brief Command-line entry point: wires the stores, stages and runner for one harvest run.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

#include "application/ExtractionStage.hpp"
#include "application/FetchStage.hpp"
#include "application/HarvestRunner.hpp"
#include "application/IdentifierSources.hpp"
#include "application/NormalizationStage.hpp"
#include "application/PipelineCoordinator.hpp"
#include "application/RateLimiter.hpp"
#include "application/RetryPolicy.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/ContentStoreFs.hpp"
#include "infrastructure/DiavgeiaClient.hpp"
#include "infrastructure/EnvelopeStoreFs.hpp"
#include "infrastructure/ExtractedTextStoreFs.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/PipelineStateStoreFs.hpp"
#include "infrastructure/RecordStoreFs.hpp"
#include "infrastructure/RunLock.hpp"

namespace fs = std::filesystem;
using namespace adaharvest;

namespace {

volatile std::sig_atomic_t g_signal = 0;

extern "C" void OnSignal(int sig) {
    g_signal = sig;
}

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CliOptions {
    std::vector<std::string> adas;
    std::optional<std::string> manifest;
    domain::ListingQuery listing;
    bool listingMode = false;

    std::optional<std::string> configPath;
    std::optional<std::string> outputRoot;
    std::optional<int> workers;
    std::optional<int> maxAttempts;
    bool resume = false;
    bool retryFailed = false;
    bool quiet = false;
    bool help = false;
};

void PrintUsage(const char* argv0) {
    std::cout << "Usage:\n"
              << "  " << argv0 << " [options] <ADA>...             process the listed identifiers\n"
              << "  " << argv0 << " [options] --manifest <file>     one identifier per line, '#' comments\n"
              << "  " << argv0 << " [options] --org <id> --from <YYYY-MM-DD> --to <YYYY-MM-DD>\n"
              << "                                           page through the portal's search listing\n"
              << "Options:\n"
              << "  --config <file>       settings file (default $XDG_CONFIG_HOME/AdaHarvest/settings.json)\n"
              << "  --output <dir>        dataset root (default $XDG_DATA_HOME/AdaHarvest/dataset)\n"
              << "  --workers <n>         identifiers processed concurrently\n"
              << "  --max-attempts <n>    fetch attempts per request\n"
              << "  --resume              continue from the previous run's checkpoint\n"
              << "  --retry-failed        retry identifiers that failed permanently before\n"
              << "  --quiet               only print warnings and the final summary\n"
              << "  --help                show this message\n"
              << "Exit codes: 0 ok, 1 some identifiers failed, 2 usage or configuration error,\n"
              << "            3 storage failure, 130 cancelled\n";
}

int ParsePositive(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used == value.size() && n > 0) return n;
    } catch (const std::logic_error&) {
        // Reported below.
    }
    throw UsageError(flag + " expects a positive integer, got '" + value + "'");
}

bool IsIsoDate(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') return false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (value[i] < '0' || value[i] > '9') return false;
    }
    return true;
}

CliOptions ParseArgs(int argc, char** argv) {
    CliOptions cli;
    auto valueOf = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw UsageError(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--manifest") {
            cli.manifest = valueOf(i, arg);
        } else if (arg == "--org") {
            cli.listing.organizationId = valueOf(i, arg);
            cli.listingMode = true;
        } else if (arg == "--from") {
            cli.listing.fromIssueDate = valueOf(i, arg);
            cli.listingMode = true;
        } else if (arg == "--to") {
            cli.listing.toIssueDate = valueOf(i, arg);
            cli.listingMode = true;
        } else if (arg == "--config") {
            cli.configPath = valueOf(i, arg);
        } else if (arg == "--output") {
            cli.outputRoot = valueOf(i, arg);
        } else if (arg == "--workers") {
            cli.workers = ParsePositive(arg, valueOf(i, arg));
        } else if (arg == "--max-attempts") {
            cli.maxAttempts = ParsePositive(arg, valueOf(i, arg));
        } else if (arg == "--resume") {
            cli.resume = true;
        } else if (arg == "--retry-failed") {
            cli.retryFailed = true;
        } else if (arg == "--quiet" || arg == "-q") {
            cli.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            throw UsageError("unknown option " + arg);
        } else {
            cli.adas.push_back(arg);
        }
    }
    if (cli.help) return cli;

    const int modes = (cli.adas.empty() ? 0 : 1) + (cli.manifest ? 1 : 0) + (cli.listingMode ? 1 : 0);
    if (modes == 0) throw UsageError("nothing to do: give identifiers, --manifest or a listing range");
    if (modes > 1) throw UsageError("identifiers, --manifest and --org/--from/--to are mutually exclusive");

    if (cli.listingMode) {
        if (!IsIsoDate(cli.listing.fromIssueDate) || !IsIsoDate(cli.listing.toIssueDate)) {
            throw UsageError("--from and --to must both be given as YYYY-MM-DD");
        }
        if (cli.listing.fromIssueDate > cli.listing.toIssueDate) {
            throw UsageError("--from is after --to");
        }
    }
    return cli;
}

/**
 * @brief Forwards SIGINT/SIGTERM to the run's cancellation token from a regular thread.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(domain::CancellationToken& token) {
        struct sigaction action {};
        action.sa_handler = OnSignal;
        sigemptyset(&action.sa_mask);
        ::sigaction(SIGINT, &action, nullptr);
        ::sigaction(SIGTERM, &action, nullptr);

        m_thread = std::thread([this, &token] {
            while (!m_stop.load()) {
                if (g_signal != 0 && !token.isCancelled()) {
                    infrastructure::Log::Warn("main", "signal " + std::to_string(g_signal) +
                                              " received, finishing in-flight work");
                    token.cancel();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~SignalWatcher() {
        m_stop = true;
        m_thread.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    std::atomic<bool> m_stop{false};
    std::thread m_thread;
};

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    std::vector<domain::DecisionIdentifier> ids;
    try {
        cli = ParseArgs(argc, argv);
        for (const auto& raw : cli.adas) {
            ids.emplace_back(raw);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        PrintUsage(argv[0]);
        return 2;
    }
    if (cli.help) {
        PrintUsage(argv[0]);
        return 0;
    }
    infrastructure::Log::SetQuiet(cli.quiet);

    infrastructure::HarvestConfig config;
    try {
        config = infrastructure::ConfigLoader::Load(cli.configPath);
    } catch (const infrastructure::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    if (cli.outputRoot) config.outputRoot = *cli.outputRoot;
    if (cli.workers) config.workers = *cli.workers;
    if (cli.maxAttempts) config.fetch.maxAttempts = *cli.maxAttempts;

    std::error_code ec;
    const std::string root = fs::absolute(config.outputRoot, ec).lexically_normal().string();

    domain::CancellationToken token;
    SignalWatcher signals(token);

    try {
        fs::create_directories(fs::path(root) / "run", ec);
        if (ec) {
            throw domain::StorageError("cannot create output root " + root + ": " + ec.message());
        }
        infrastructure::RunLock lock(root);

        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        auto content = std::make_shared<infrastructure::ContentStoreFs>(root, persistence);
        content->probe();

        infrastructure::DiavgeiaClient::Options clientOptions;
        clientOptions.baseUrl = config.apiBaseUrl;
        clientOptions.userAgent = config.userAgent;
        clientOptions.timeoutSeconds = config.fetch.timeoutSeconds;

        application::RetryPolicy::Options fetchRetry;
        fetchRetry.maxAttempts = config.fetch.maxAttempts;
        fetchRetry.baseDelay = std::chrono::milliseconds(config.fetch.baseDelayMs);
        fetchRetry.maxDelay = std::chrono::milliseconds(config.fetch.maxDelayMs);
        fetchRetry.jitter = config.fetch.jitter;

        application::RetryPolicy::Options storageRetry = fetchRetry;
        storageRetry.maxAttempts = config.storage.maxAttempts;

        auto fetch = std::make_shared<application::FetchStage>(
            std::make_shared<infrastructure::DiavgeiaClient>(clientOptions),
            std::make_shared<application::RateLimiter>(config.rateLimit.requestsPerSecond, config.rateLimit.burst),
            std::make_shared<application::RetryPolicy>(fetchRetry));

        infrastructure::ContentExtractor::Options engineOptions;
        engineOptions.ocrLanguages = config.extraction.ocrLanguages;
        engineOptions.timeout = std::chrono::seconds(config.extraction.timeoutSeconds);

        application::ExtractionStage::Options extractionOptions;
        extractionOptions.minNativeChars = static_cast<std::size_t>(std::max(0, config.extraction.minNativeChars));
        extractionOptions.expectedCharsPerPage = config.extraction.expectedCharsPerPage;

        application::NormalizationStage::Options normalizationOptions;
        normalizationOptions.defaultCurrency = config.normalization.defaultCurrency;
        normalizationOptions.datasetRoot = root;

        application::PipelineCoordinator::Dependencies deps;
        deps.states = std::make_shared<infrastructure::PipelineStateStoreFs>(root, persistence);
        deps.content = content;
        deps.envelopes = std::make_shared<infrastructure::EnvelopeStoreFs>(root, persistence);
        deps.records = std::make_shared<infrastructure::RecordStoreFs>(root, persistence);
        deps.fetch = fetch;
        deps.extraction = std::make_shared<application::ExtractionStage>(
            std::make_shared<infrastructure::ContentExtractor>(engineOptions),
            std::make_shared<infrastructure::ExtractedTextStoreFs>(root, persistence),
            extractionOptions);
        deps.normalization = std::make_shared<application::NormalizationStage>(normalizationOptions);
        deps.storageRetry = std::make_shared<application::RetryPolicy>(
            storageRetry, application::RetryPolicy::IsStorage);

        std::unique_ptr<domain::IdentifierSource> source;
        if (cli.manifest) {
            try {
                source = std::make_unique<application::ManifestIdentifierSource>(*cli.manifest);
            } catch (const std::runtime_error& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 2;
            }
        } else if (cli.listingMode) {
            source = std::make_unique<application::ApiListingIdentifierSource>(fetch, cli.listing, token);
        } else {
            source = std::make_unique<application::ListIdentifierSource>(ids);
        }

        const std::string runId = application::HarvestRunner::NewRunId();
        auto coordinator = std::make_shared<application::PipelineCoordinator>(deps, runId);

        application::HarvestRunner::Options runnerOptions;
        runnerOptions.outputRoot = root;
        runnerOptions.workers = config.workers;
        runnerOptions.resume = cli.resume;
        runnerOptions.retryFailed = cli.retryFailed;

        application::HarvestRunner runner(coordinator, persistence, runnerOptions, token);
        application::RunSummary summary = runner.run(*source);

        std::cout << summary.report() << std::flush;
        return summary.exitCode();
    } catch (const domain::StorageError& e) {
        std::cerr << "Storage failure: " << e.what() << "\n";
        return 3;
    }
}
