/**
 * @file ContentStoreFs.hpp
 * @brief File-system content-addressed store for raw documents.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/repositories/IContentStore.hpp"
#include "infrastructure/FsSupport.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace adaharvest::infrastructure {

/**
 * @class ContentStoreFs
 * @brief Keeps every version of every decision's document, verbatim.
 *
 * Layout: <root>/raw/<storageKey>/<hash><ext> for the bytes and
 * <root>/raw/<storageKey>/versions.json for the version chain.
 * Blobs are written before the index, so a crash can orphan a blob but never
 * index a missing one.
 */
class ContentStoreFs : public domain::IContentStore {
public:
    ContentStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence);

    domain::RawDocument put(const domain::DecisionIdentifier& id, const domain::DownloadedDocument& document) override;
    std::optional<domain::RawDocument> get(const domain::DecisionIdentifier& id) override;
    std::optional<domain::RawDocument> getByHash(const domain::DecisionIdentifier& id, const std::string& hash) override;
    std::vector<domain::RawDocument> versions(const domain::DecisionIdentifier& id) override;
    std::string readBytes(const domain::RawDocument& document) override;
    void probe() override;

private:
    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;
    StripedMutex m_locks;

    std::string directoryFor(const domain::DecisionIdentifier& id) const;
    std::vector<domain::RawDocument> loadIndex(const domain::DecisionIdentifier& id) const;
    void saveIndex(const domain::DecisionIdentifier& id, const std::vector<domain::RawDocument>& chain);

    static std::string ExtensionFor(const domain::DownloadedDocument& document);
};

} // namespace adaharvest::infrastructure
