/**
 * @file components.hpp
 * @brief Subscribers that turn pipeline events into log records and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus, migration_logger);
 * MetricsComponent metrics(bus);
 * orchestrator.run(...);
 * metrics.print_stats(*migration_logger);
 */

#pragma once

#include "cloudmove/events/event_bus.hpp"
#include "cloudmove/events/events.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cloudmove::events {

/// HH:MM:SS, hours not wrapped at 24
std::string format_run_time(std::chrono::milliseconds elapsed);

/// Body of a POLL record (without the [timestamp][POLL] prefix)
std::string format_poll_record(const PollObservedEvent& e);

/**
 * @brief Writes one log record per pipeline event
 *
 * Levels follow the failure table: copy and delete failures are ERROR,
 * timeouts, prune failures and stop requests are WARN, poll ticks are
 * POLL (spdlog debug), everything else INFO.
 */
class LoggerComponent {
public:
    LoggerComponent(EventBus& bus, std::shared_ptr<spdlog::logger> logger);
    ~LoggerComponent();

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType, typename Handler>
    void listen(Handler handler);

    void on_run_started(const RunStartedEvent& e);
    void on_run_completed(const RunCompletedEvent& e);
    void on_transfer_started(const TransferStartedEvent& e);
    void on_file_copied(const FileCopiedEvent& e);
    void on_copy_failed(const CopyFailedEvent& e);
    void on_poll(const PollObservedEvent& e);
    void on_sync_confirmed(const SyncConfirmedEvent& e);
    void on_sync_timed_out(const SyncTimedOutEvent& e);
    void on_source_deleted(const SourceDeletedEvent& e);
    void on_source_delete_failed(const SourceDeleteFailedEvent& e);
    void on_transfer_aborted(const TransferAbortedEvent& e);
    void on_directory_pruned(const DirectoryPrunedEvent& e);
    void on_prune_failed(const PruneFailedEvent& e);
    void on_cancellation_requested(const CancellationRequestedEvent& e);
    void on_cancellation_observed(const CancellationObservedEvent& e);

    EventBus& bus_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts what happened during a run
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_copied{0};
        std::atomic<uint64_t> bytes_copied{0};
        std::atomic<uint64_t> sources_deleted{0};
        std::atomic<uint64_t> sources_preserved{0};
        std::atomic<uint64_t> copy_failures{0};
        std::atomic<uint64_t> delete_failures{0};
        std::atomic<uint64_t> transfers_aborted{0};
        std::atomic<uint64_t> polls_observed{0};
        std::atomic<uint64_t> directories_pruned{0};
        std::atomic<uint64_t> prune_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<FileCopiedEvent>([this](const FileCopiedEvent& e) {
            stats_.files_copied++;
            stats_.bytes_copied += e.bytes;
        });
        bus.subscribe<SourceDeletedEvent>([this](const SourceDeletedEvent&) { stats_.sources_deleted++; });
        bus.subscribe<SyncTimedOutEvent>([this](const SyncTimedOutEvent&) { stats_.sources_preserved++; });
        bus.subscribe<CopyFailedEvent>([this](const CopyFailedEvent&) { stats_.copy_failures++; });
        bus.subscribe<SourceDeleteFailedEvent>([this](const SourceDeleteFailedEvent&) { stats_.delete_failures++; });
        bus.subscribe<TransferAbortedEvent>([this](const TransferAbortedEvent&) { stats_.transfers_aborted++; });
        bus.subscribe<PollObservedEvent>([this](const PollObservedEvent&) { stats_.polls_observed++; });
        bus.subscribe<DirectoryPrunedEvent>([this](const DirectoryPrunedEvent&) { stats_.directories_pruned++; });
        bus.subscribe<PruneFailedEvent>([this](const PruneFailedEvent&) { stats_.prune_failures++; });
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats(spdlog::logger& logger) const;

private:
    Stats stats_;
};

} // namespace cloudmove::events
