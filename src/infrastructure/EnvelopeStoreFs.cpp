/**
 * @file EnvelopeStoreFs.cpp
 * @brief Implementation of EnvelopeStoreFs.
 */

#include "infrastructure/EnvelopeStoreFs.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/FsSupport.hpp"
#include "domain/PipelineErrors.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

using json = nlohmann::json;

EnvelopeStoreFs::EnvelopeStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string EnvelopeStoreFs::pathFor(const domain::DecisionIdentifier& id, const std::string& hash) const {
    return (fs::path(m_root) / "metadata" / id.storageKey() / (hash + ".json")).string();
}

std::string EnvelopeStoreFs::put(const domain::DecisionIdentifier& id, const domain::MetadataEnvelope& envelope) {
    const std::string hash = ContentHasher::HexDigest(envelope.fields.dump());
    const std::string path = pathFor(id, hash);

    std::error_code ec;
    if (fs::exists(path, ec)) {
        return hash;
    }

    json snapshot = {
        {"ada", id.value()},
        {"retrievedAt", FsSupport::ToIsoTimestamp(envelope.retrievedAt)},
        {"fields", envelope.fields}
    };
    m_persistence->writeAtomic(path, snapshot.dump(2));
    return hash;
}

std::optional<domain::MetadataEnvelope> EnvelopeStoreFs::get(const domain::DecisionIdentifier& id, const std::string& hash) const {
    auto snapshot = FsSupport::ReadJsonFile(pathFor(id, hash));
    if (!snapshot) return std::nullopt;

    if (!snapshot->contains("fields")) {
        throw domain::StorageError("envelope snapshot without fields: " + pathFor(id, hash));
    }
    domain::MetadataEnvelope envelope;
    envelope.ada = id.value();
    envelope.fields = (*snapshot)["fields"];
    envelope.retrievedAt = FsSupport::FromIsoTimestamp(snapshot->value("retrievedAt", ""));
    return envelope;
}

} // namespace adaharvest::infrastructure
