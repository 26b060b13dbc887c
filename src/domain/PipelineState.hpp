/**
 * @file PipelineState.hpp
 * @brief Per-identifier state machine record owned by the coordinator.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include "domain/PipelineErrors.hpp"

namespace adaharvest::domain {

/**
 * @enum Stage
 * @brief Lifecycle of one identifier through the pipeline.
 *
 * Pending -> Fetching -> Fetched -> Extracting -> Extracted -> Normalizing -> Complete,
 * with Failed reachable from any in-progress stage. Complete and Failed are terminal.
 */
enum class Stage {
    Pending,
    Fetching,
    Fetched,
    Extracting,
    Extracted,
    Normalizing,
    Complete,
    Failed
};

inline std::string StageToString(Stage stage) {
    switch (stage) {
        case Stage::Pending: return "Pending";
        case Stage::Fetching: return "Fetching";
        case Stage::Fetched: return "Fetched";
        case Stage::Extracting: return "Extracting";
        case Stage::Extracted: return "Extracted";
        case Stage::Normalizing: return "Normalizing";
        case Stage::Complete: return "Complete";
        case Stage::Failed: return "Failed";
        default: return "Unknown";
    }
}

inline bool StageFromString(const std::string& value, Stage& out) {
    static const std::map<std::string, Stage> kStages = {
        {"Pending", Stage::Pending}, {"Fetching", Stage::Fetching}, {"Fetched", Stage::Fetched},
        {"Extracting", Stage::Extracting}, {"Extracted", Stage::Extracted},
        {"Normalizing", Stage::Normalizing}, {"Complete", Stage::Complete}, {"Failed", Stage::Failed}
    };
    auto it = kStages.find(value);
    if (it == kStages.end()) return false;
    out = it->second;
    return true;
}

/** @brief True for the "-ing" stages that are only valid while a lease is held. */
inline bool IsInProgress(Stage stage) {
    return stage == Stage::Fetching || stage == Stage::Extracting || stage == Stage::Normalizing;
}

inline bool IsTerminal(Stage stage) {
    return stage == Stage::Complete || stage == Stage::Failed;
}

/**
 * @brief The completed stage an in-progress stage started from.
 */
inline Stage LastCompletedBefore(Stage stage) {
    switch (stage) {
        case Stage::Fetching: return Stage::Pending;
        case Stage::Extracting: return Stage::Fetched;
        case Stage::Normalizing: return Stage::Extracted;
        default: return stage;
    }
}

/**
 * @brief The in-progress stage that follows a completed one.
 */
inline Stage NextInProgress(Stage stage) {
    switch (stage) {
        case Stage::Pending: return Stage::Fetching;
        case Stage::Fetched: return Stage::Extracting;
        case Stage::Extracted: return Stage::Normalizing;
        default: return stage;
    }
}

/**
 * @class PipelineState
 * @brief Stage flags, provenance pointers, last error and lease of one identifier.
 */
class PipelineState {
public:
    std::string ada;
    Stage stage = Stage::Pending;
    std::uint64_t revision = 0;            ///< Bumped on every persisted transition (compare-and-set token).

    // Stage outputs, filled as stages complete.
    std::string rawHash;
    int rawVersion = 0;
    std::string envelopeHash;
    std::string textMethod;                ///< Empty when no text artifact exists.
    bool extractionFailed = false;

    // Failure bookkeeping.
    ErrorKind lastErrorKind = ErrorKind::None;
    std::string lastError;
    std::map<std::string, int> attempts;   ///< Stage name -> attempts made across runs.

    // Lease. Empty owner means nobody is processing the identifier.
    std::string leaseOwner;
    std::chrono::system_clock::time_point leaseAcquiredAt;

    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;

    bool isLeased() const { return !leaseOwner.empty(); }
};

} // namespace adaharvest::domain
