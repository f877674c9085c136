/**
 * @file events.hpp
 * @brief Event types emitted by the migration pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense (FileCopiedEvent, SourceDeletedEvent) and carry
 * everything a subscriber needs, so no subscriber has to call back into
 * the pipeline.
 */

#pragma once

#include "cloudmove/core/result.hpp"
#include "cloudmove/migrate/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cloudmove::events {

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

struct RunStartedEvent {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::size_t files_planned = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RunCompletedEvent {
    migrate::RunSummary summary;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted by the interrupt listener when a stop is first requested
 *
 * WHO EMITS: InterruptListener (signal thread)
 * WHO SUBSCRIBES: LoggerComponent
 */
struct CancellationRequestedEvent {
    int signal_number = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted by the orchestrator when it honours a stop request
 */
struct CancellationObservedEvent {
    std::size_t files_remaining = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-file Events
// ════════════════════════════════════════════════════════

struct TransferStartedEvent {
    migrate::TransferTask task;
    std::size_t index = 0;  ///< 1-based position in this run
    std::size_t total = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileCopiedEvent {
    migrate::TransferTask task;
    std::uintmax_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct CopyFailedEvent {
    migrate::TransferTask task;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief One stability monitor tick
 *
 * WHO EMITS: StabilityMonitor, once per probe
 * WHO SUBSCRIBES:
 * - LoggerComponent (POLL record)
 * - MetricsComponent (poll counter)
 * - any progress display
 */
struct PollObservedEvent {
    std::filesystem::path destination_path;
    std::string raw_status;
    migrate::SyncStatus status = migrate::SyncStatus::Blank;
    bool probe_failed = false;
    std::string probe_error;
    std::size_t stable_count = 0;
    std::size_t stable_required = 0;
    std::size_t poll_number = 0;
    std::chrono::milliseconds file_elapsed{0};
    std::chrono::milliseconds run_elapsed{0};  ///< Total process run time
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncConfirmedEvent {
    migrate::TransferTask task;
    std::size_t polls = 0;
    std::chrono::milliseconds elapsed{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncTimedOutEvent {
    migrate::TransferTask task;
    std::size_t polls = 0;
    std::chrono::milliseconds elapsed{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SourceDeletedEvent {
    migrate::TransferTask task;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SourceDeleteFailedEvent {
    migrate::TransferTask task;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A file's pipeline threw; the run continues with the next file
 */
struct TransferAbortedEvent {
    std::filesystem::path source_path;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Pruning Events
// ════════════════════════════════════════════════════════

struct DirectoryPrunedEvent {
    std::filesystem::path path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PruneFailedEvent {
    std::filesystem::path path;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace cloudmove::events
