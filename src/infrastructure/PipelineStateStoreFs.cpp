/**
 * @file PipelineStateStoreFs.cpp
 * @brief Implementation of PipelineStateStoreFs.
 */

#include "infrastructure/PipelineStateStoreFs.hpp"
#include "domain/PipelineErrors.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

using json = nlohmann::json;
using domain::PipelineState;

namespace {

json ToJson(const PipelineState& state) {
    return {
        {"ada", state.ada},
        {"stage", domain::StageToString(state.stage)},
        {"revision", state.revision},
        {"rawHash", state.rawHash},
        {"rawVersion", state.rawVersion},
        {"envelopeHash", state.envelopeHash},
        {"textMethod", state.textMethod},
        {"extractionFailed", state.extractionFailed},
        {"lastErrorKind", domain::ErrorKindToString(state.lastErrorKind)},
        {"lastError", state.lastError},
        {"attempts", state.attempts},
        {"leaseOwner", state.leaseOwner},
        {"leaseAcquiredAt", FsSupport::ToIsoTimestamp(state.leaseAcquiredAt)},
        {"createdAt", FsSupport::ToIsoTimestamp(state.createdAt)},
        {"updatedAt", FsSupport::ToIsoTimestamp(state.updatedAt)}
    };
}

PipelineState FromJson(const json& j) {
    PipelineState state;
    state.ada = j.at("ada").get<std::string>();
    if (!domain::StageFromString(j.at("stage").get<std::string>(), state.stage)) {
        throw domain::StorageError("unknown stage in state of " + state.ada);
    }
    state.revision = j.at("revision").get<std::uint64_t>();
    state.rawHash = j.value("rawHash", "");
    state.rawVersion = j.value("rawVersion", 0);
    state.envelopeHash = j.value("envelopeHash", "");
    state.textMethod = j.value("textMethod", "");
    state.extractionFailed = j.value("extractionFailed", false);
    state.lastErrorKind = domain::ErrorKindFromString(j.value("lastErrorKind", "none"));
    state.lastError = j.value("lastError", "");
    state.attempts = j.value("attempts", std::map<std::string, int>{});
    state.leaseOwner = j.value("leaseOwner", "");
    state.leaseAcquiredAt = FsSupport::FromIsoTimestamp(j.value("leaseAcquiredAt", ""));
    state.createdAt = FsSupport::FromIsoTimestamp(j.value("createdAt", ""));
    state.updatedAt = FsSupport::FromIsoTimestamp(j.value("updatedAt", ""));
    return state;
}

} // namespace

PipelineStateStoreFs::PipelineStateStoreFs(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string PipelineStateStoreFs::pathFor(const domain::DecisionIdentifier& id) const {
    return (fs::path(m_root) / "state" / (id.storageKey() + ".json")).string();
}

std::optional<PipelineState> PipelineStateStoreFs::read(const domain::DecisionIdentifier& id) const {
    auto j = FsSupport::ReadJsonFile(pathFor(id));
    if (!j) return std::nullopt;
    try {
        return FromJson(*j);
    } catch (const json::exception& e) {
        throw domain::StorageError("corrupt pipeline state for " + id.value() + ": " + e.what());
    }
}

std::optional<PipelineState> PipelineStateStoreFs::load(const domain::DecisionIdentifier& id) {
    std::lock_guard<std::mutex> lock(m_locks.forKey(id.value()));
    return read(id);
}

bool PipelineStateStoreFs::compareAndSet(const domain::DecisionIdentifier& id,
                                         std::uint64_t expectedRevision,
                                         const PipelineState& next) {
    std::lock_guard<std::mutex> lock(m_locks.forKey(id.value()));

    auto current = read(id);
    std::uint64_t currentRevision = current ? current->revision : 0;
    if (currentRevision != expectedRevision) {
        return false;
    }

    PipelineState stored = next;
    stored.ada = id.value();
    stored.revision = expectedRevision + 1;
    m_persistence->writeAtomic(pathFor(id), ToJson(stored).dump(2));
    return true;
}

} // namespace adaharvest::infrastructure
