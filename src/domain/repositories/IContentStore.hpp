/**
 * @file IContentStore.hpp
 * @brief Interface for the content-addressed raw document store.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../DecisionIdentifier.hpp"
#include "../RawDocument.hpp"

namespace adaharvest::domain {

class IContentStore {
public:
    virtual ~IContentStore() = default;

    /**
     * Persists @p document as the newest version for @p id.
     * If its hash equals the newest stored version the call is a no-op returning that version;
     * otherwise a new version is appended and earlier ones are kept.
     * Throws StorageError on I/O failure. Once put returns, the bytes are durable.
     */
    virtual RawDocument put(const DecisionIdentifier& id, const DownloadedDocument& document) = 0;

    // Newest version, if any.
    virtual std::optional<RawDocument> get(const DecisionIdentifier& id) = 0;

    virtual std::optional<RawDocument> getByHash(const DecisionIdentifier& id, const std::string& hash) = 0;

    // Whole version chain, oldest first.
    virtual std::vector<RawDocument> versions(const DecisionIdentifier& id) = 0;

    virtual std::string readBytes(const RawDocument& document) = 0;

    // Throws StorageError when the store root cannot be written.
    virtual void probe() = 0;
};

} // namespace adaharvest::domain
