/**
 * @file ExtractedTextStoreFs.cpp
 * @brief Implementation of ExtractedTextStoreFs.
 */

#include "infrastructure/ExtractedTextStoreFs.hpp"
#include "infrastructure/FsSupport.hpp"
#include "domain/PipelineErrors.hpp"

#include <cctype>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

using json = nlohmann::json;

namespace {

// Raw hashes become part of a file name.
bool IsHexDigest(const std::string& hash) {
    if (hash.empty() || hash.size() > 128) return false;
    for (char c : hash) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

ExtractedTextStoreFs::ExtractedTextStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string ExtractedTextStoreFs::basePath(const domain::DecisionIdentifier& id, const std::string& rawHash,
                                           domain::ExtractionMethod method) const {
    return (fs::path(m_root) / "text" / id.storageKey() /
            (rawHash + "." + domain::ExtractionMethodToString(method))).string();
}

domain::ExtractedText ExtractedTextStoreFs::put(const domain::DecisionIdentifier& id, domain::ExtractedText text) {
    if (!IsHexDigest(text.rawHash)) {
        throw domain::StorageError("extracted text for " + id.value() + " names no raw document hash");
    }
    const std::string base = basePath(id, text.rawHash, text.method);
    text.storagePath = base + ".txt";

    m_persistence->writeAtomic(text.storagePath, text.text);

    json sidecar = {
        {"ada", id.value()},
        {"rawHash", text.rawHash},
        {"method", domain::ExtractionMethodToString(text.method)},
        {"qualityScore", text.qualityScore},
        {"quality", domain::TextQualityToString(text.quality)},
        {"pageCount", text.pageCount},
        {"characterCount", text.characterCount}
    };
    m_persistence->writeAtomic(base + ".json", sidecar.dump(2));
    return text;
}

std::optional<domain::ExtractedText> ExtractedTextStoreFs::find(const domain::DecisionIdentifier& id, const std::string& rawHash) const {
    if (!IsHexDigest(rawHash)) return std::nullopt;
    for (auto method : {domain::ExtractionMethod::NativeText, domain::ExtractionMethod::Ocr}) {
        const std::string base = basePath(id, rawHash, method);
        auto sidecar = FsSupport::ReadJsonFile(base + ".json");
        if (!sidecar || sidecar->value("rawHash", "") != rawHash) continue;

        auto content = FsSupport::ReadFile(base + ".txt");
        if (!content) {
            throw domain::StorageError("text artifact missing next to its sidecar: " + base + ".txt");
        }

        domain::ExtractedText text;
        text.ada = id.value();
        text.rawHash = rawHash;
        text.method = method;
        text.text = *content;
        text.qualityScore = sidecar->value("qualityScore", 0.0);
        text.pageCount = sidecar->value("pageCount", 0);
        text.characterCount = sidecar->value("characterCount", static_cast<std::size_t>(0));
        text.quality = domain::TextQualityFromScore(text.qualityScore, sidecar->value("quality", "") == "empty");
        text.storagePath = base + ".txt";
        return text;
    }
    return std::nullopt;
}

} // namespace adaharvest::infrastructure
