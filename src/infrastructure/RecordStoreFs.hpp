/**
 * @file RecordStoreFs.hpp
 * @brief File-system store for published structured records.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/DecisionIdentifier.hpp"
#include "domain/StructuredRecord.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace adaharvest::infrastructure {

/**
 * @class RecordStoreFs
 * @brief <root>/records/<storageKey>.json, always replaced as a whole.
 */
class RecordStoreFs {
public:
    RecordStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence);

    /** @brief Writes the record. Skips the write when the stored record is identical. */
    void put(const domain::StructuredRecord& record);

    std::optional<domain::StructuredRecord> get(const domain::DecisionIdentifier& id) const;

    std::string pathFor(const domain::DecisionIdentifier& id) const;

private:
    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace adaharvest::infrastructure
