#pragma once

#include "cloudmove/core/clock.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace cloudmove::migrate {

/**
 * @brief One file's trip through copy -> confirm -> delete
 *
 * Lives from the moment the orchestrator picks the file until the file
 * reaches a terminal FileOutcome.
 */
struct TransferTask {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    SteadyTime started_at{};
};

/**
 * @brief Classified destination sync state, recomputed on every poll
 */
enum class SyncStatus {
    Blank,       ///< Empty/whitespace status, or the probe failed
    InProgress,  ///< Pending, syncing, uploading, downloading
    Done,        ///< Fully available on this device
    Other        ///< Anything else the oracle reports (error strings etc.)
};

inline const char* to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Blank: return "Blank";
        case SyncStatus::InProgress: return "InProgress";
        case SyncStatus::Done: return "Done";
        case SyncStatus::Other: return "Other";
    }
    return "Unknown";
}

/**
 * @brief Per-task stability counter
 *
 * consecutive_done resets to 0 on any poll that is not Done and grows by
 * one on each consecutive Done poll.
 */
struct StabilityState {
    std::size_t consecutive_done = 0;
    std::size_t polls = 0;
    SteadyTime poll_started_at{};
};

enum class StabilityVerdict {
    Success,
    TimedOut
};

struct StabilityResult {
    StabilityVerdict verdict = StabilityVerdict::TimedOut;
    std::size_t polls = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Scope of one pruning pass
 *
 * Nothing at or above root_boundary is ever removed.
 */
struct PruneRequest {
    std::filesystem::path root_boundary;
    std::filesystem::path scope_directory;
};

struct PruneReport {
    std::size_t removed = 0;
    std::size_t failures = 0;
};

enum class FileOutcome {
    Deleted,    ///< Sync confirmed, source removed
    Preserved,  ///< Confirmation timed out, source kept
    Failed      ///< Copy or source deletion failed
};

inline const char* to_string(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Deleted: return "Deleted";
        case FileOutcome::Preserved: return "Preserved";
        case FileOutcome::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Upper bound on files processed in one run; nullopt means "all"
 */
using MaxFiles = std::optional<std::size_t>;

struct RunSummary {
    std::size_t planned = 0;
    std::size_t attempted = 0;
    std::size_t deleted = 0;
    std::size_t preserved = 0;
    std::size_t failed = 0;
    bool cancelled = false;
};

} // namespace cloudmove::migrate
