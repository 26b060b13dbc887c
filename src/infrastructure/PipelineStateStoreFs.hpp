/**
 * @file PipelineStateStoreFs.hpp
 * @brief File-system PipelineState store with per-identifier compare-and-set.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/repositories/IPipelineStateStore.hpp"
#include "infrastructure/FsSupport.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace adaharvest::infrastructure {

/**
 * @class PipelineStateStoreFs
 * @brief <root>/state/<storageKey>.json, one file per identifier.
 *
 * The read-compare-write of compareAndSet runs under the identifier's stripe
 * lock; identifiers on different stripes never wait for each other. Cross-process
 * exclusion is the caller's job (see RunLock).
 */
class PipelineStateStoreFs : public domain::IPipelineStateStore {
public:
    PipelineStateStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence);

    std::optional<domain::PipelineState> load(const domain::DecisionIdentifier& id) override;
    bool compareAndSet(const domain::DecisionIdentifier& id,
                       std::uint64_t expectedRevision,
                       const domain::PipelineState& next) override;

private:
    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;
    StripedMutex m_locks;

    std::string pathFor(const domain::DecisionIdentifier& id) const;
    std::optional<domain::PipelineState> read(const domain::DecisionIdentifier& id) const;
};

} // namespace adaharvest::infrastructure
