/**
 * @file PipelineCoordinator.hpp
 * @brief Drives one identifier through fetch, store, extract and normalize.
 */

#pragma once

#include <memory>
#include <string>
#include "application/ExtractionStage.hpp"
#include "application/FetchStage.hpp"
#include "application/NormalizationStage.hpp"
#include "application/PipelineLedger.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/repositories/IContentStore.hpp"
#include "infrastructure/EnvelopeStoreFs.hpp"
#include "infrastructure/RecordStoreFs.hpp"

namespace adaharvest::application {

/**
 * @enum ProcessStatus
 * @brief What process() did for an identifier.
 */
enum class ProcessStatus {
    Completed,   ///< Record published with completeness "complete".
    Degraded,    ///< Record published but partial/minimal or without text.
    Skipped,     ///< Already complete, nothing done.
    InFlight,    ///< Another worker holds the identifier; rejected without side effects.
    Failed,      ///< Terminal or retry-exhausted failure, recorded in PipelineState.
    Cancelled    ///< Stopped by the run-level signal; state rolled back to the last completed stage.
};

inline std::string ProcessStatusToString(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Completed: return "completed";
        case ProcessStatus::Degraded: return "degraded";
        case ProcessStatus::Skipped: return "skipped";
        case ProcessStatus::InFlight: return "in-flight";
        case ProcessStatus::Failed: return "failed";
        case ProcessStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

struct ProcessOutcome {
    ProcessStatus status = ProcessStatus::Failed;
    domain::ErrorKind errorKind = domain::ErrorKind::None;
    std::string message;
};

/**
 * @class PipelineCoordinator
 * @brief Owns the per-identifier state machine.
 *
 * Pending -> Fetching -> Fetched -> Extracting -> Extracted -> Normalizing -> Complete.
 * Each transition is persisted before and after its stage runs, so an interrupted
 * identifier resumes at the last completed stage. A transient fetch failure that
 * outlives the retry policy leaves the identifier Pending with the error recorded;
 * a permanent one moves it to Failed. StorageError propagates: it is run-fatal.
 */
class PipelineCoordinator {
public:
    struct Dependencies {
        std::shared_ptr<domain::IPipelineStateStore> states;
        std::shared_ptr<domain::IContentStore> content;
        std::shared_ptr<infrastructure::EnvelopeStoreFs> envelopes;
        std::shared_ptr<infrastructure::RecordStoreFs> records;
        std::shared_ptr<FetchStage> fetch;
        std::shared_ptr<ExtractionStage> extraction;
        std::shared_ptr<NormalizationStage> normalization;
        std::shared_ptr<RetryPolicy> storageRetry;   ///< Retries StorageError before it turns fatal.
    };

    PipelineCoordinator(Dependencies deps, std::string runId);

    ProcessOutcome process(const domain::DecisionIdentifier& id,
                           const domain::CancellationToken& token,
                           const std::string& worker = "main");

    PipelineLedger& ledger() { return m_ledger; }

private:
    template <typename Fn>
    auto durable(const domain::DecisionIdentifier& id, Fn&& fn, const domain::CancellationToken& token)
        -> decltype(fn());

    ProcessOutcome run(const domain::DecisionIdentifier& id, domain::PipelineState state,
                       const std::string& owner, const domain::CancellationToken& token);

    domain::RawDocument rawFor(const domain::DecisionIdentifier& id, const domain::PipelineState& state,
                               const domain::CancellationToken& token);

    Dependencies m_deps;
    PipelineLedger m_ledger;
};

} // namespace adaharvest::application
