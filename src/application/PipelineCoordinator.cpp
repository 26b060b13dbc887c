/**
 * @file PipelineCoordinator.cpp
 * @brief Implementation of PipelineCoordinator.
 */

#include "application/PipelineCoordinator.hpp"
#include "infrastructure/Log.hpp"

#include <sstream>

namespace adaharvest::application {

using domain::ErrorKind;
using domain::PipelineState;
using domain::Stage;
using infrastructure::Log;

PipelineCoordinator::PipelineCoordinator(Dependencies deps, std::string runId)
    : m_deps(std::move(deps)), m_ledger(m_deps.states, std::move(runId)) {}

template <typename Fn>
auto PipelineCoordinator::durable(const domain::DecisionIdentifier& id, Fn&& fn,
                                  const domain::CancellationToken& token) -> decltype(fn()) {
    return m_deps.storageRetry->execute(fn, token,
        [&id](int failed, int maxAttempts, std::chrono::milliseconds delay, const std::exception& error) {
            std::ostringstream line;
            line << id.value() << ": storage error (" << error.what() << "), retry "
                 << (failed + 1) << "/" << maxAttempts << " in " << delay.count() << " ms";
            Log::Warn("PipelineCoordinator", line.str());
        });
}

ProcessOutcome PipelineCoordinator::process(const domain::DecisionIdentifier& id,
                                            const domain::CancellationToken& token,
                                            const std::string& worker) {
    const std::string owner = m_ledger.ownerFor(worker);
    auto begin = durable(id, [&] { return m_ledger.tryBegin(id, owner); }, token);

    switch (begin.status) {
        case BeginStatus::AlreadyComplete:
            return {ProcessStatus::Skipped, ErrorKind::None, "already complete"};
        case BeginStatus::InFlight:
            Log::Info("PipelineCoordinator", id.value() + ": in flight on " + begin.state.leaseOwner + ", rejected");
            return {ProcessStatus::InFlight, ErrorKind::None, "in flight on " + begin.state.leaseOwner};
        case BeginStatus::Failed:
            return {ProcessStatus::Failed, begin.state.lastErrorKind, begin.state.lastError};
        case BeginStatus::Acquired:
            break;
    }

    try {
        return run(id, begin.state, owner, token);
    } catch (const domain::CancelledError&) {
        m_ledger.release(id, owner);
        return {ProcessStatus::Cancelled, ErrorKind::Cancelled, "cancelled"};
    } catch (const domain::TransientFetchError& e) {
        m_ledger.release(id, owner, ErrorKind::TransientFetch, e.what());
        Log::Warn("PipelineCoordinator", id.value() + ": giving up after retries: " + e.what());
        return {ProcessStatus::Failed, ErrorKind::TransientFetch, e.what()};
    } catch (const domain::PipelineError& e) {
        if (e.kind() == ErrorKind::Storage) {
            m_ledger.release(id, owner, ErrorKind::Storage, e.what());
            throw;
        }
        // Permanent fetch and validation errors are terminal for the identifier.
        m_ledger.transition(id, owner, [&e](PipelineState& s) {
            s.stage = Stage::Failed;
            s.lastErrorKind = e.kind();
            s.lastError = e.what();
            s.leaseOwner.clear();
        });
        Log::Warn("PipelineCoordinator", id.value() + ": failed (" + domain::ErrorKindToString(e.kind()) +
                  "): " + e.what());
        return {ProcessStatus::Failed, e.kind(), e.what()};
    } catch (const std::exception&) {
        m_ledger.release(id, owner);
        throw;
    }
}

domain::RawDocument PipelineCoordinator::rawFor(const domain::DecisionIdentifier& id,
                                                const PipelineState& state,
                                                const domain::CancellationToken& token) {
    auto raw = durable(id, [&] { return m_deps.content->getByHash(id, state.rawHash); }, token);
    if (!raw) {
        throw domain::StorageError("raw document " + state.rawHash + " of " + id.value() + " is missing from the store");
    }
    return *raw;
}

ProcessOutcome PipelineCoordinator::run(const domain::DecisionIdentifier& id, PipelineState state,
                                        const std::string& owner, const domain::CancellationToken& token) {
    std::optional<domain::MetadataEnvelope> envelope;
    std::optional<domain::RawDocument> raw;
    std::optional<domain::ExtractedText> text;

    auto enter = [&](Stage stage, const char* counter) {
        state = durable(id, [&] {
            return m_ledger.transition(id, owner, [&](PipelineState& s) {
                s.stage = stage;
                s.attempts[counter] += 1;
            });
        }, token);
    };

    if (state.stage == Stage::Pending) {
        enter(Stage::Fetching, "fetch");
        FetchResult fetched = m_deps.fetch->fetch(id, token);

        raw = durable(id, [&] { return m_deps.content->put(id, fetched.document); }, token);
        const std::string envelopeHash = durable(id, [&] { return m_deps.envelopes->put(id, fetched.envelope); }, token);
        envelope = std::move(fetched.envelope);

        state = durable(id, [&] {
            return m_ledger.transition(id, owner, [&](PipelineState& s) {
                s.stage = Stage::Fetched;
                s.rawHash = raw->hash;
                s.rawVersion = raw->version;
                s.envelopeHash = envelopeHash;
                s.textMethod.clear();
                s.extractionFailed = false;
                s.lastErrorKind = ErrorKind::None;
                s.lastError.clear();
            });
        }, token);
        Log::Info("PipelineCoordinator", id.value() + ": fetched version " + std::to_string(raw->version) +
                  " (" + raw->hash.substr(0, 12) + ")");
    }

    if (state.stage == Stage::Fetched) {
        enter(Stage::Extracting, "extract");
        if (!raw) raw = rawFor(id, state, token);

        std::string method;
        std::string failure;
        try {
            text = m_deps.extraction->extract(*raw, token);
            method = domain::ExtractionMethodToString(text->method);
        } catch (const domain::ExtractionError& e) {
            failure = e.what();
            Log::Warn("PipelineCoordinator", id.value() + ": extraction failed, continuing without text: " + failure);
        }

        state = durable(id, [&] {
            return m_ledger.transition(id, owner, [&](PipelineState& s) {
                s.stage = Stage::Extracted;
                s.textMethod = method;
                s.extractionFailed = !failure.empty();
                if (!failure.empty()) {
                    s.lastErrorKind = ErrorKind::Extraction;
                    s.lastError = failure;
                }
            });
        }, token);
        if (text) {
            Log::Info("PipelineCoordinator", id.value() + ": extracted " + method + " text, quality " +
                      domain::TextQualityToString(text->quality));
        }
    }

    if (state.stage == Stage::Extracted) {
        enter(Stage::Normalizing, "normalize");
        if (!raw) raw = rawFor(id, state, token);
        if (!envelope) {
            envelope = durable(id, [&] { return m_deps.envelopes->get(id, state.envelopeHash); }, token);
            if (!envelope) {
                throw domain::StorageError("metadata snapshot " + state.envelopeHash + " of " + id.value() +
                                           " is missing from the store");
            }
        }
        if (!text && !state.extractionFailed) {
            text = durable(id, [&] { return m_deps.extraction->lookup(*raw); }, token);
            if (!text) {
                // Text is regenerable from the stored raw bytes.
                try {
                    text = m_deps.extraction->extract(*raw, token);
                } catch (const domain::ExtractionError& e) {
                    Log::Warn("PipelineCoordinator", id.value() + ": re-extraction failed: " + e.what());
                }
            }
        }

        domain::StructuredRecord record = m_deps.normalization->normalize(*envelope, text, raw);
        durable(id, [&] { m_deps.records->put(record); }, token);

        const bool extractionFailed = !text;
        state = durable(id, [&] {
            return m_ledger.transition(id, owner, [&](PipelineState& s) {
                s.stage = Stage::Complete;
                s.extractionFailed = extractionFailed;
                s.leaseOwner.clear();
            });
        }, token);

        const bool degraded = record.completeness != domain::Completeness::Complete || extractionFailed;
        Log::Info("PipelineCoordinator", id.value() + ": complete (" +
                  domain::CompletenessToString(record.completeness) + ")");
        return {degraded ? ProcessStatus::Degraded : ProcessStatus::Completed,
                extractionFailed ? ErrorKind::Extraction : ErrorKind::None,
                domain::CompletenessToString(record.completeness)};
    }

    // The lease was granted on a state this machine cannot advance.
    throw domain::StorageError("pipeline state of " + id.value() + " is stuck in " + domain::StageToString(state.stage));
}

} // namespace adaharvest::application
