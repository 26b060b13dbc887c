/**
 * @file PipelineLedger.hpp
 * @brief Lease-based, compare-and-set access to per-identifier pipeline state.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "domain/DecisionIdentifier.hpp"
#include "domain/PipelineState.hpp"
#include "domain/repositories/IPipelineStateStore.hpp"

namespace adaharvest::application {

/**
 * @enum BeginStatus
 * @brief Result of trying to take the lease on an identifier.
 */
enum class BeginStatus {
    Acquired,         ///< Caller owns the identifier until release() or a terminal transition.
    AlreadyComplete,  ///< Nothing to do.
    InFlight,         ///< Another worker of this run holds the lease.
    Failed            ///< Terminal failure from an earlier attempt; see resetFailed().
};

struct BeginResult {
    BeginStatus status;
    domain::PipelineState state;
};

/**
 * @class PipelineLedger
 * @brief Every state change is a read-modify-write retried on revision conflicts.
 *
 * Lease owners are "<runId>/<worker>". Only one run can use an output root at a
 * time (RunLock), so a lease carrying another run id belongs to a run that died:
 * it is reclaimed and its in-progress stage resolves to the last completed stage.
 */
class PipelineLedger {
public:
    PipelineLedger(std::shared_ptr<domain::IPipelineStateStore> store, std::string runId);

    const std::string& runId() const { return m_runId; }
    std::string ownerFor(const std::string& worker) const { return m_runId + "/" + worker; }

    BeginResult tryBegin(const domain::DecisionIdentifier& id, const std::string& owner);

    /**
     * @brief Applies @p update to the state leased by @p owner and persists it.
     * @throws domain::StorageError when @p owner no longer holds the lease.
     */
    domain::PipelineState transition(const domain::DecisionIdentifier& id,
                                     const std::string& owner,
                                     const std::function<void(domain::PipelineState&)>& update);

    /**
     * @brief Drops the lease. An in-progress stage reverts to the last completed one,
     *        optionally recording why.
     */
    void release(const domain::DecisionIdentifier& id,
                 const std::string& owner,
                 domain::ErrorKind kind = domain::ErrorKind::None,
                 const std::string& error = {});

    /** @brief Failed -> the last stage whose outputs are recorded. @return true when reset. */
    bool resetFailed(const domain::DecisionIdentifier& id);

    /** @brief Reclaims a lease left behind by a dead run. @return the repaired state, if any. */
    std::optional<domain::PipelineState> recover(const domain::DecisionIdentifier& id);

    std::optional<domain::PipelineState> load(const domain::DecisionIdentifier& id) { return m_store->load(id); }

    /** @brief Run id part of a lease owner. */
    static std::string RunOf(const std::string& owner);

    /** @brief Last completed stage implied by the outputs a state records. */
    static domain::Stage ResumeStageOf(const domain::PipelineState& state);

private:
    std::shared_ptr<domain::IPipelineStateStore> m_store;
    std::string m_runId;
};

} // namespace adaharvest::application
