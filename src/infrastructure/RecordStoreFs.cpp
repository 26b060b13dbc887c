/**
 * @file RecordStoreFs.cpp
 * @brief Implementation of RecordStoreFs.
 */

#include "infrastructure/RecordStoreFs.hpp"
#include "infrastructure/FsSupport.hpp"
#include "infrastructure/RecordSerializer.hpp"
#include "domain/PipelineErrors.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

RecordStoreFs::RecordStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string RecordStoreFs::pathFor(const domain::DecisionIdentifier& id) const {
    return (fs::path(m_root) / "records" / (id.storageKey() + ".json")).string();
}

void RecordStoreFs::put(const domain::StructuredRecord& record) {
    domain::DecisionIdentifier id(record.ada);
    const std::string serialized = RecordSerializer::ToJson(record).dump(2);

    auto existing = FsSupport::ReadFile(pathFor(id));
    if (existing && *existing == serialized) {
        return;
    }
    m_persistence->writeAtomic(pathFor(id), serialized);
}

std::optional<domain::StructuredRecord> RecordStoreFs::get(const domain::DecisionIdentifier& id) const {
    auto j = FsSupport::ReadJsonFile(pathFor(id));
    if (!j) return std::nullopt;
    try {
        return RecordSerializer::FromJson(*j);
    } catch (const std::exception& e) {
        throw domain::StorageError("unreadable record " + pathFor(id) + ": " + e.what());
    }
}

} // namespace adaharvest::infrastructure
