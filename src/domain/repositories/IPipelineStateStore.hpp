/**
 * @file IPipelineStateStore.hpp
 * @brief Interface for persisting PipelineState with compare-and-set semantics.
 */

#pragma once

#include <cstdint>
#include <optional>
#include "../DecisionIdentifier.hpp"
#include "../PipelineState.hpp"

namespace adaharvest::domain {

class IPipelineStateStore {
public:
    virtual ~IPipelineStateStore() = default;

    virtual std::optional<PipelineState> load(const DecisionIdentifier& id) = 0;

    /**
     * Atomically replaces the stored state when its revision equals @p expectedRevision
     * (0 means "no state stored yet"). The persisted state gets revision expectedRevision + 1.
     * @return false when another writer got there first; nothing is written then.
     * Throws StorageError on I/O failure.
     */
    virtual bool compareAndSet(const DecisionIdentifier& id,
                               std::uint64_t expectedRevision,
                               const PipelineState& next) = 0;
};

} // namespace adaharvest::domain
