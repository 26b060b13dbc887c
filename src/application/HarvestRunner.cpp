/**
 * @file HarvestRunner.cpp
 * @brief Implementation of HarvestRunner.
 */

#include "application/HarvestRunner.hpp"
#include "infrastructure/FsSupport.hpp"
#include "infrastructure/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace adaharvest::application {

using infrastructure::FsSupport;
using infrastructure::Log;

// --- RunSummary ---

int RunSummary::exitCode() const {
    if (aborted) return 3;
    if (cancelled) return 130;
    if (failed > 0 || listingFailed) return 1;
    return 0;
}

nlohmann::json RunSummary::toJson() const {
    nlohmann::json j;
    j["runId"] = runId;
    j["source"] = source;
    j["cursor"] = cursor;
    j["startedAt"] = FsSupport::ToIsoTimestamp(startedAt);
    j["finishedAt"] = FsSupport::ToIsoTimestamp(finishedAt);
    j["counts"] = {
        {"ok", ok}, {"degraded", degraded}, {"skipped", skipped},
        {"failed", failed}, {"inFlight", inFlight}
    };
    j["cancelled"] = cancelled;
    j["listingFailed"] = listingFailed;
    j["aborted"] = aborted;
    if (aborted) j["abortReason"] = abortReason;
    j["exitCode"] = exitCode();

    nlohmann::json list = nlohmann::json::array();
    for (const auto& f : failures) {
        list.push_back({{"ada", f.ada}, {"kind", domain::ErrorKindToString(f.kind)}, {"message", f.message}});
    }
    j["failures"] = list;
    return j;
}

std::string RunSummary::report() const {
    std::ostringstream out;
    out << "Done. OK: " << ok << ", Degraded: " << degraded
        << ", Skipped: " << skipped << ", Failed: " << failed;
    if (inFlight > 0) out << ", In flight elsewhere: " << inFlight;
    out << "\n";
    for (const auto& f : failures) {
        out << "  FAILED " << f.ada << " [" << domain::ErrorKindToString(f.kind) << "] " << f.message << "\n";
    }
    if (aborted) {
        out << "Run aborted: " << abortReason << "\n";
    } else if (cancelled) {
        out << "Cancelled at " << cursor << "; rerun with --resume to continue.\n";
    }
    return out.str();
}

// --- HarvestRunner ---

HarvestRunner::HarvestRunner(std::shared_ptr<PipelineCoordinator> coordinator,
                             std::shared_ptr<infrastructure::PersistenceService> persistence,
                             Options options,
                             domain::CancellationToken& token)
    : m_coordinator(std::move(coordinator)),
      m_persistence(std::move(persistence)),
      m_options(std::move(options)),
      m_token(token) {}

std::string HarvestRunner::checkpointPath() const {
    return (std::filesystem::path(m_options.outputRoot) / "run" / "checkpoint.json").string();
}

std::string HarvestRunner::summaryPath() const {
    return (std::filesystem::path(m_options.outputRoot) / "run" / "summary.json").string();
}

std::string HarvestRunner::NewRunId() {
    std::string stamp = FsSupport::ToIsoTimestamp(std::chrono::system_clock::now());
    stamp.erase(std::remove_if(stamp.begin(), stamp.end(), [](char c) { return c == '-' || c == ':'; }),
                stamp.end());

    std::random_device rd;
    std::ostringstream suffix;
    suffix << std::hex << std::setw(6) << std::setfill('0') << (rd() & 0xFFFFFFu);
    return stamp + "-" + suffix.str();
}

RunSummary HarvestRunner::run(domain::IdentifierSource& source) {
    RunSummary summary;
    summary.runId = m_coordinator->ledger().runId();
    summary.source = source.describe();
    summary.startedAt = std::chrono::system_clock::now();

    if (m_options.resume) {
        restoreCheckpoint(source);
    }

    m_sourceDone = false;
    m_nextSequence = 0;
    m_cursorAfter.clear();
    m_finished.clear();
    m_watermark = 0;
    summary.cursor = source.cursor();

    const int workers = std::max(1, m_options.workers);
    Log::Info("HarvestRunner", "run " + summary.runId + " over " + summary.source + " with " +
              std::to_string(workers) + " workers");

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        pool.emplace_back(&HarvestRunner::workerLoop, this, i, std::ref(source), std::ref(summary));
    }
    for (auto& t : pool) {
        t.join();
    }

    summary.finishedAt = std::chrono::system_clock::now();
    m_persistence->flush();
    try {
        m_persistence->writeAtomic(summaryPath(), summary.toJson().dump(2));
    } catch (const domain::StorageError& e) {
        Log::Warn("HarvestRunner", std::string("cannot write run summary: ") + e.what());
        if (!summary.aborted) {
            summary.aborted = true;
            summary.abortReason = e.what();
        }
    }
    return summary;
}

void HarvestRunner::restoreCheckpoint(domain::IdentifierSource& source) {
    std::optional<nlohmann::json> saved;
    try {
        saved = FsSupport::ReadJsonFile(checkpointPath());
    } catch (const domain::StorageError& e) {
        Log::Warn("HarvestRunner", std::string("ignoring unreadable checkpoint: ") + e.what());
        return;
    }
    if (!saved) {
        Log::Info("HarvestRunner", "no checkpoint, starting from the beginning");
        return;
    }

    const std::string savedSource = saved->value("source", "");
    const std::string cursor = saved->value("cursor", "");
    if (savedSource != source.describe()) {
        Log::Warn("HarvestRunner", "checkpoint belongs to " + savedSource + ", starting from the beginning");
        return;
    }
    try {
        source.resumeFrom(cursor);
        Log::Info("HarvestRunner", "resuming at " + cursor);
    } catch (const std::invalid_argument& e) {
        Log::Warn("HarvestRunner", std::string("ignoring checkpoint: ") + e.what());
    }
}

void HarvestRunner::saveCheckpoint(const std::string& source, const std::string& cursor) {
    nlohmann::json j;
    j["source"] = source;
    j["cursor"] = cursor;
    j["runId"] = m_coordinator->ledger().runId();
    j["updatedAt"] = FsSupport::ToIsoTimestamp(std::chrono::system_clock::now());
    m_persistence->saveTextAsync(checkpointPath(), j.dump(2));
}

std::optional<HarvestRunner::Dispensed> HarvestRunner::dispense(domain::IdentifierSource& source,
                                                                RunSummary& summary) {
    std::lock_guard<std::mutex> lock(m_sourceMutex);
    if (m_sourceDone) return std::nullopt;
    if (m_token.isCancelled()) {
        std::lock_guard<std::mutex> progress(m_progressMutex);
        if (!summary.aborted) summary.cancelled = true;
        return std::nullopt;
    }

    std::optional<domain::DecisionIdentifier> id;
    try {
        id = source.next();
    } catch (const domain::CancelledError&) {
        std::lock_guard<std::mutex> progress(m_progressMutex);
        if (!summary.aborted) summary.cancelled = true;
        return std::nullopt;
    } catch (const domain::PipelineError& e) {
        if (e.kind() == domain::ErrorKind::Storage) {
            abort(e.what(), summary);
            return std::nullopt;
        }
        m_sourceDone = true;
        std::lock_guard<std::mutex> progress(m_progressMutex);
        summary.listingFailed = true;
        summary.failures.push_back({"(listing)", e.kind(), e.what()});
        Log::Warn("HarvestRunner", std::string("listing stopped: ") + e.what());
        return std::nullopt;
    }

    if (!id) {
        m_sourceDone = true;
        return std::nullopt;
    }

    std::lock_guard<std::mutex> progress(m_progressMutex);
    size_t sequence = m_nextSequence++;
    m_cursorAfter[sequence] = source.cursor();
    return Dispensed{*id, sequence};
}

void HarvestRunner::workerLoop(int worker, domain::IdentifierSource& source, RunSummary& summary) {
    const std::string name = "w" + std::to_string(worker);
    while (auto item = dispense(source, summary)) {
        try {
            if (m_options.retryFailed && m_coordinator->ledger().resetFailed(item->id)) {
                Log::Info("HarvestRunner", item->id.value() + ": failed earlier, retrying");
            }
            ProcessOutcome outcome = m_coordinator->process(item->id, m_token, name);
            record(*item, outcome, summary);
        } catch (const domain::CancelledError&) {
            record(*item, {ProcessStatus::Cancelled, domain::ErrorKind::Cancelled, "cancelled"}, summary);
        } catch (const domain::PipelineError& e) {
            if (e.kind() == domain::ErrorKind::Storage) {
                abort(item->id.value() + ": " + e.what(), summary);
                return;
            }
            record(*item, {ProcessStatus::Failed, e.kind(), e.what()}, summary);
        } catch (const std::exception& e) {
            // Unexpected, but confined to this identifier.
            record(*item, {ProcessStatus::Failed, domain::ErrorKind::None, e.what()}, summary);
        }
    }
}

void HarvestRunner::record(const Dispensed& item, const ProcessOutcome& outcome, RunSummary& summary) {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    switch (outcome.status) {
        case ProcessStatus::Completed: ++summary.ok; break;
        case ProcessStatus::Degraded: ++summary.degraded; break;
        case ProcessStatus::Skipped: ++summary.skipped; break;
        case ProcessStatus::InFlight: ++summary.inFlight; break;
        case ProcessStatus::Failed:
            ++summary.failed;
            summary.failures.push_back({item.id.value(), outcome.errorKind, outcome.message});
            break;
        case ProcessStatus::Cancelled:
            // Not finished: the watermark must stay below it.
            if (!summary.aborted) summary.cancelled = true;
            return;
    }
    Log::Info("HarvestRunner", item.id.value() + ": " + ProcessStatusToString(outcome.status));
    finish(item.sequence, summary);
}

void HarvestRunner::finish(size_t sequence, RunSummary& summary) {
    m_finished.insert(sequence);
    const size_t before = m_watermark;
    while (!m_finished.empty() && *m_finished.begin() == m_watermark) {
        m_finished.erase(m_finished.begin());
        ++m_watermark;
    }
    if (m_watermark == before) return;

    auto it = m_cursorAfter.find(m_watermark - 1);
    if (it == m_cursorAfter.end()) return;
    summary.cursor = it->second;
    m_cursorAfter.erase(m_cursorAfter.begin(), std::next(it));
    saveCheckpoint(summary.source, summary.cursor);
}

void HarvestRunner::abort(const std::string& reason, RunSummary& summary) {
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        if (summary.aborted) return;
        summary.aborted = true;
        summary.cancelled = false;
        summary.abortReason = reason;
    }
    Log::Warn("HarvestRunner", "storage failure, aborting run: " + reason);
    m_token.cancel();
}

} // namespace adaharvest::application
