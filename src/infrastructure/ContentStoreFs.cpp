/**
 * @file ContentStoreFs.cpp
 * @brief Implementation of ContentStoreFs.
 */

#include "infrastructure/ContentStoreFs.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/Log.hpp"
#include "domain/PipelineErrors.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

using json = nlohmann::json;

namespace {

json ToJson(const domain::RawDocument& doc) {
    return {
        {"version", doc.version},
        {"hash", doc.hash},
        {"file", fs::path(doc.storagePath).filename().string()},
        {"sourceUrl", doc.sourceUrl},
        {"contentType", doc.contentType},
        {"retrievedAt", FsSupport::ToIsoTimestamp(doc.retrievedAt)},
        {"sizeBytes", doc.sizeBytes}
    };
}

domain::RawDocument FromJson(const json& j, const std::string& ada, const fs::path& dir) {
    domain::RawDocument doc;
    doc.ada = ada;
    doc.version = j.at("version").get<int>();
    doc.hash = j.at("hash").get<std::string>();
    doc.storagePath = (dir / j.at("file").get<std::string>()).string();
    doc.sourceUrl = j.value("sourceUrl", "");
    doc.contentType = j.value("contentType", "");
    doc.retrievedAt = FsSupport::FromIsoTimestamp(j.value("retrievedAt", ""));
    doc.sizeBytes = j.value("sizeBytes", 0ULL);
    return doc;
}

} // namespace

ContentStoreFs::ContentStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string ContentStoreFs::directoryFor(const domain::DecisionIdentifier& id) const {
    return (fs::path(m_root) / "raw" / id.storageKey()).string();
}

std::string ContentStoreFs::ExtensionFor(const domain::DownloadedDocument& document) {
    const std::string& b = document.bytes;
    if (b.compare(0, 5, "%PDF-") == 0) return ".pdf";
    if (b.size() >= 8 && b.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0) return ".png";
    if (b.size() >= 3 && b.compare(0, 3, "\xFF\xD8\xFF") == 0) return ".jpg";
    if (b.compare(0, 4, "II*\0", 4) == 0 || b.compare(0, 4, "MM\0*", 4) == 0) return ".tif";
    return ".bin";
}

std::vector<domain::RawDocument> ContentStoreFs::loadIndex(const domain::DecisionIdentifier& id) const {
    fs::path dir = directoryFor(id);
    auto index = FsSupport::ReadJsonFile((dir / "versions.json").string());
    std::vector<domain::RawDocument> chain;
    if (!index) return chain;

    try {
        for (const auto& entry : index->at("versions")) {
            chain.push_back(FromJson(entry, id.value(), dir));
        }
    } catch (const json::exception& e) {
        throw domain::StorageError("corrupt version index for " + id.value() + ": " + e.what());
    }
    return chain;
}

void ContentStoreFs::saveIndex(const domain::DecisionIdentifier& id, const std::vector<domain::RawDocument>& chain) {
    json j;
    j["ada"] = id.value();
    j["versions"] = json::array();
    for (const auto& doc : chain) {
        j["versions"].push_back(ToJson(doc));
    }
    m_persistence->writeAtomic((fs::path(directoryFor(id)) / "versions.json").string(), j.dump(2));
}

domain::RawDocument ContentStoreFs::put(const domain::DecisionIdentifier& id, const domain::DownloadedDocument& document) {
    std::lock_guard<std::mutex> lock(m_locks.forKey(id.value()));

    const std::string hash = ContentHasher::HexDigest(document.bytes);
    auto chain = loadIndex(id);

    if (!chain.empty() && chain.back().hash == hash) {
        return chain.back();
    }

    fs::path blobPath = fs::path(directoryFor(id)) / (hash + ExtensionFor(document));
    std::error_code ec;
    if (!fs::exists(blobPath, ec)) {
        m_persistence->writeAtomic(blobPath.string(), document.bytes);
    }

    domain::RawDocument doc;
    doc.ada = id.value();
    doc.hash = hash;
    doc.version = chain.empty() ? 1 : chain.back().version + 1;
    doc.sourceUrl = document.sourceUrl;
    doc.contentType = document.contentType;
    doc.retrievedAt = document.retrievedAt;
    doc.sizeBytes = document.bytes.size();
    doc.storagePath = blobPath.string();

    chain.push_back(doc);
    saveIndex(id, chain);

    if (doc.version > 1) {
        Log::Info("ContentStore", id.value() + ": document changed upstream, stored version " +
                  std::to_string(doc.version));
    }
    return doc;
}

std::optional<domain::RawDocument> ContentStoreFs::get(const domain::DecisionIdentifier& id) {
    std::lock_guard<std::mutex> lock(m_locks.forKey(id.value()));
    auto chain = loadIndex(id);
    if (chain.empty()) return std::nullopt;
    return chain.back();
}

std::optional<domain::RawDocument> ContentStoreFs::getByHash(const domain::DecisionIdentifier& id, const std::string& hash) {
    std::lock_guard<std::mutex> lock(m_locks.forKey(id.value()));
    for (const auto& doc : loadIndex(id)) {
        if (doc.hash == hash) return doc;
    }
    return std::nullopt;
}

std::vector<domain::RawDocument> ContentStoreFs::versions(const domain::DecisionIdentifier& id) {
    std::lock_guard<std::mutex> lock(m_locks.forKey(id.value()));
    return loadIndex(id);
}

std::string ContentStoreFs::readBytes(const domain::RawDocument& document) {
    auto bytes = FsSupport::ReadFile(document.storagePath);
    if (!bytes) {
        throw domain::StorageError("raw document missing: " + document.storagePath);
    }
    return *bytes;
}

void ContentStoreFs::probe() {
    fs::path probePath = fs::path(m_root) / "raw" / ".probe";
    m_persistence->writeAtomic(probePath.string(), "probe");
    std::error_code ec;
    fs::remove(probePath, ec);
    if (ec) {
        throw domain::StorageError("cannot remove probe file " + probePath.string() + ": " + ec.message());
    }
}

} // namespace adaharvest::infrastructure
