/**
 * @file HarvestRunner.hpp
 * @brief Bounded worker pool that drains an IdentifierSource through the coordinator.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/PipelineCoordinator.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/IdentifierSource.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace adaharvest::application {

/**
 * @struct FailureEntry
 * @brief One line of the failure report.
 */
struct FailureEntry {
    std::string ada;
    domain::ErrorKind kind = domain::ErrorKind::None;
    std::string message;
};

/**
 * @struct RunSummary
 * @brief Counters and failures of one run.
 */
struct RunSummary {
    std::string runId;
    std::string source;
    std::string cursor;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;

    int ok = 0;
    int degraded = 0;
    int skipped = 0;
    int failed = 0;
    int inFlight = 0;

    bool cancelled = false;      ///< Stopped by the run-level signal.
    bool listingFailed = false;  ///< The source itself could not be drained.
    bool aborted = false;        ///< Fatal storage failure.
    std::string abortReason;

    std::vector<FailureEntry> failures;

    /** @brief 0 ok, 1 failures, 3 storage abort, 130 cancelled. */
    int exitCode() const;

    nlohmann::json toJson() const;

    /** @brief "Done. OK: n, Degraded: d, Skipped: s, Failed: f" plus one line per failure. */
    std::string report() const;
};

/**
 * @class HarvestRunner
 * @brief Pulls identifiers from a source and hands each to a free worker.
 *
 * At most @c workers identifiers are processed at once. After every finished
 * identifier the cursor of the longest fully-finished prefix of the sequence is
 * checkpointed to <outputRoot>/run/checkpoint.json, so resuming never skips an
 * identifier that was still in progress. Cancellation stops dispensing and lets
 * in-flight identifiers roll back; a StorageError cancels the whole run.
 */
class HarvestRunner {
public:
    struct Options {
        std::string outputRoot;
        int workers = 4;
        bool resume = false;        ///< Start the source from the saved checkpoint.
        bool retryFailed = false;   ///< Reset Failed identifiers before processing.
    };

    HarvestRunner(std::shared_ptr<PipelineCoordinator> coordinator,
                  std::shared_ptr<infrastructure::PersistenceService> persistence,
                  Options options,
                  domain::CancellationToken& token);

    RunSummary run(domain::IdentifierSource& source);

    /** @brief Time-ordered unique run id, e.g. "20260114T093012Z-4f2a9c". */
    static std::string NewRunId();

    std::string checkpointPath() const;
    std::string summaryPath() const;

private:
    struct Dispensed {
        domain::DecisionIdentifier id;
        size_t sequence;
    };

    std::optional<Dispensed> dispense(domain::IdentifierSource& source, RunSummary& summary);
    void workerLoop(int worker, domain::IdentifierSource& source, RunSummary& summary);
    void record(const Dispensed& item, const ProcessOutcome& outcome, RunSummary& summary);
    void finish(size_t sequence, RunSummary& summary);
    void abort(const std::string& reason, RunSummary& summary);
    void restoreCheckpoint(domain::IdentifierSource& source);
    void saveCheckpoint(const std::string& source, const std::string& cursor);

    std::shared_ptr<PipelineCoordinator> m_coordinator;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    Options m_options;
    domain::CancellationToken& m_token;

    std::mutex m_sourceMutex;
    bool m_sourceDone = false;
    size_t m_nextSequence = 0;

    std::mutex m_progressMutex;
    std::map<size_t, std::string> m_cursorAfter;   ///< Cursor right after each dispensed item.
    std::set<size_t> m_finished;
    size_t m_watermark = 0;                        ///< Every sequence below is finished.
};

} // namespace adaharvest::application
