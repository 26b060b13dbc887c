/**
 * @file ExtractedTextStoreFs.hpp
 * @brief File-system store for extracted text artifacts.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/DecisionIdentifier.hpp"
#include "domain/ExtractedText.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace adaharvest::infrastructure {

/**
 * @class ExtractedTextStoreFs
 * @brief One UTF-8 text file per (identifier, raw version, method) plus a JSON sidecar with provenance.
 *
 * Layout: <root>/text/<storageKey>/<rawHash>.<method>.txt and .json. Text from an
 * older raw version is never overwritten, so a record's reference stays valid.
 * The sidecar is written last and is what makes an artifact visible to find().
 */
class ExtractedTextStoreFs {
public:
    ExtractedTextStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence);

    /** @brief Persists @p text and returns it with storagePath set. */
    domain::ExtractedText put(const domain::DecisionIdentifier& id, domain::ExtractedText text);

    /** @brief Text previously extracted from the raw version @p rawHash, any method. */
    std::optional<domain::ExtractedText> find(const domain::DecisionIdentifier& id, const std::string& rawHash) const;

private:
    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;

    std::string basePath(const domain::DecisionIdentifier& id, const std::string& rawHash,
                         domain::ExtractionMethod method) const;
};

} // namespace adaharvest::infrastructure
