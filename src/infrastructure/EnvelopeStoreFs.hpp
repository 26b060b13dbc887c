/**
 * @file EnvelopeStoreFs.hpp
 * @brief Content-addressed snapshots of metadata envelopes.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/DecisionIdentifier.hpp"
#include "domain/MetadataEnvelope.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace adaharvest::infrastructure {

/**
 * @class EnvelopeStoreFs
 * @brief Keeps the envelope a record was normalized from, so a resumed identifier
 *        never has to go back to the network.
 *
 * Layout: <root>/metadata/<storageKey>/<hash>.json, hash taken over the compact
 * JSON dump of the envelope fields.
 */
class EnvelopeStoreFs {
public:
    EnvelopeStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence);

    /** @brief Stores the snapshot (no-op when already present) and returns its hash. */
    std::string put(const domain::DecisionIdentifier& id, const domain::MetadataEnvelope& envelope);

    std::optional<domain::MetadataEnvelope> get(const domain::DecisionIdentifier& id, const std::string& hash) const;

private:
    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;

    std::string pathFor(const domain::DecisionIdentifier& id, const std::string& hash) const;
};

} // namespace adaharvest::infrastructure
