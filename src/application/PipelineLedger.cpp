/**
 * @file PipelineLedger.cpp
 * @brief Implementation of PipelineLedger.
 */

#include "application/PipelineLedger.hpp"
#include "infrastructure/Log.hpp"

namespace adaharvest::application {

using domain::PipelineState;
using domain::Stage;
using Clock = std::chrono::system_clock;

PipelineLedger::PipelineLedger(std::shared_ptr<domain::IPipelineStateStore> store, std::string runId)
    : m_store(std::move(store)), m_runId(std::move(runId)) {}

std::string PipelineLedger::RunOf(const std::string& owner) {
    auto slash = owner.find('/');
    return slash == std::string::npos ? owner : owner.substr(0, slash);
}

Stage PipelineLedger::ResumeStageOf(const PipelineState& state) {
    if (state.rawHash.empty() || state.envelopeHash.empty()) return Stage::Pending;
    if (!state.textMethod.empty() || state.extractionFailed) return Stage::Extracted;
    return Stage::Fetched;
}

std::optional<PipelineState> PipelineLedger::recover(const domain::DecisionIdentifier& id) {
    for (;;) {
        auto current = m_store->load(id);
        if (!current) return std::nullopt;
        if (!current->isLeased() || RunOf(current->leaseOwner) == m_runId) return current;

        PipelineState next = *current;
        next.stage = domain::LastCompletedBefore(next.stage);
        next.leaseOwner.clear();
        next.updatedAt = Clock::now();
        if (m_store->compareAndSet(id, current->revision, next)) {
            infrastructure::Log::Info("PipelineLedger", id.value() + ": reclaimed lease of " + current->leaseOwner +
                                      ", resuming from " + domain::StageToString(next.stage));
            next.revision = current->revision + 1;
            return next;
        }
    }
}

BeginResult PipelineLedger::tryBegin(const domain::DecisionIdentifier& id, const std::string& owner) {
    for (;;) {
        auto current = recover(id);
        if (current && current->isLeased()) {
            return {BeginStatus::InFlight, *current};
        }
        if (current && current->stage == Stage::Complete) {
            return {BeginStatus::AlreadyComplete, *current};
        }
        if (current && current->stage == Stage::Failed) {
            return {BeginStatus::Failed, *current};
        }

        const auto now = Clock::now();
        PipelineState next;
        if (current) {
            next = *current;
        } else {
            next.ada = id.value();
            next.stage = Stage::Pending;
            next.createdAt = now;
        }
        next.leaseOwner = owner;
        next.leaseAcquiredAt = now;
        next.updatedAt = now;

        const std::uint64_t expected = current ? current->revision : 0;
        if (m_store->compareAndSet(id, expected, next)) {
            next.revision = expected + 1;
            return {BeginStatus::Acquired, next};
        }
    }
}

PipelineState PipelineLedger::transition(const domain::DecisionIdentifier& id,
                                         const std::string& owner,
                                         const std::function<void(PipelineState&)>& update) {
    for (;;) {
        auto current = m_store->load(id);
        if (!current || current->leaseOwner != owner) {
            throw domain::StorageError("lease on " + id.value() + " is no longer held by " + owner);
        }

        PipelineState next = *current;
        update(next);
        next.updatedAt = Clock::now();
        if (m_store->compareAndSet(id, current->revision, next)) {
            next.revision = current->revision + 1;
            return next;
        }
    }
}

void PipelineLedger::release(const domain::DecisionIdentifier& id,
                             const std::string& owner,
                             domain::ErrorKind kind,
                             const std::string& error) {
    for (;;) {
        auto current = m_store->load(id);
        if (!current || current->leaseOwner != owner) return;

        PipelineState next = *current;
        next.stage = domain::LastCompletedBefore(next.stage);
        next.leaseOwner.clear();
        if (kind != domain::ErrorKind::None) {
            next.lastErrorKind = kind;
            next.lastError = error;
        }
        next.updatedAt = Clock::now();
        if (m_store->compareAndSet(id, current->revision, next)) return;
    }
}

bool PipelineLedger::resetFailed(const domain::DecisionIdentifier& id) {
    for (;;) {
        auto current = recover(id);
        if (!current || current->stage != Stage::Failed || current->isLeased()) return false;

        PipelineState next = *current;
        next.stage = ResumeStageOf(next);
        next.updatedAt = Clock::now();
        if (m_store->compareAndSet(id, current->revision, next)) {
            infrastructure::Log::Info("PipelineLedger", id.value() + ": failed state reset to " +
                                      domain::StageToString(next.stage));
            return true;
        }
    }
}

} // namespace adaharvest::application
