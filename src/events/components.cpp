#include "cloudmove/events/components.hpp"

#include <fmt/format.h>

#include <utility>

namespace cloudmove::events {
namespace {

double seconds(std::chrono::milliseconds elapsed) {
    return static_cast<double>(elapsed.count()) / 1000.0;
}

} // namespace

std::string format_run_time(std::chrono::milliseconds elapsed) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    const long long value = total < 0 ? 0 : static_cast<long long>(total);
    return fmt::format("{:02}:{:02}:{:02}", value / 3600, (value / 60) % 60, value % 60);
}

std::string format_poll_record(const PollObservedEvent& e) {
    using migrate::SyncStatus;
    std::string record = fmt::format(
        "status='{}' blank={} in_progress={} done={} stable={}/{} poll={} elapsed={:.1f}s run={} path={}",
        e.raw_status,
        e.status == SyncStatus::Blank,
        e.status == SyncStatus::InProgress,
        e.status == SyncStatus::Done,
        e.stable_count,
        e.stable_required,
        e.poll_number,
        seconds(e.file_elapsed),
        format_run_time(e.run_elapsed),
        e.destination_path.string());
    if (e.probe_failed) {
        record += fmt::format(" probe_error='{}'", e.probe_error);
    }
    return record;
}

template<typename EventType, typename Handler>
void LoggerComponent::listen(Handler handler) {
    const SubscriptionId id = bus_.subscribe<EventType>(
        [this, handler](const EventType& e) { (this->*handler)(e); });
    unsubscribers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
}

LoggerComponent::LoggerComponent(EventBus& bus, std::shared_ptr<spdlog::logger> logger)
    : bus_(bus), logger_(std::move(logger)) {
    listen<RunStartedEvent>(&LoggerComponent::on_run_started);
    listen<RunCompletedEvent>(&LoggerComponent::on_run_completed);
    listen<TransferStartedEvent>(&LoggerComponent::on_transfer_started);
    listen<FileCopiedEvent>(&LoggerComponent::on_file_copied);
    listen<CopyFailedEvent>(&LoggerComponent::on_copy_failed);
    listen<PollObservedEvent>(&LoggerComponent::on_poll);
    listen<SyncConfirmedEvent>(&LoggerComponent::on_sync_confirmed);
    listen<SyncTimedOutEvent>(&LoggerComponent::on_sync_timed_out);
    listen<SourceDeletedEvent>(&LoggerComponent::on_source_deleted);
    listen<SourceDeleteFailedEvent>(&LoggerComponent::on_source_delete_failed);
    listen<TransferAbortedEvent>(&LoggerComponent::on_transfer_aborted);
    listen<DirectoryPrunedEvent>(&LoggerComponent::on_directory_pruned);
    listen<PruneFailedEvent>(&LoggerComponent::on_prune_failed);
    listen<CancellationRequestedEvent>(&LoggerComponent::on_cancellation_requested);
    listen<CancellationObservedEvent>(&LoggerComponent::on_cancellation_observed);
}

LoggerComponent::~LoggerComponent() {
    for (const auto& unsubscribe : unsubscribers_) {
        unsubscribe();
    }
}

void LoggerComponent::on_run_started(const RunStartedEvent& e) {
    logger_->info("════════════════════════════════════════════");
    logger_->info("Migration started: {} -> {}", e.source_root.string(), e.destination_root.string());
    logger_->info("{} file(s) planned for this run", e.files_planned);
    logger_->info("════════════════════════════════════════════");
}

void LoggerComponent::on_run_completed(const RunCompletedEvent& e) {
    const auto& s = e.summary;
    logger_->info("════════════════════════════════════════════");
    logger_->info("Migration {} after {}: {} moved, {} preserved, {} failed ({}/{} attempted)",
                  s.cancelled ? "stopped" : "finished",
                  format_run_time(e.duration),
                  s.deleted, s.preserved, s.failed, s.attempted, s.planned);
    logger_->info("════════════════════════════════════════════");
}

void LoggerComponent::on_transfer_started(const TransferStartedEvent& e) {
    logger_->info("[{}/{}] Copying {} -> {}", e.index, e.total,
                  e.task.source_path.string(), e.task.destination_path.string());
}

void LoggerComponent::on_file_copied(const FileCopiedEvent& e) {
    logger_->info("Copied {} bytes to {}; waiting for sync confirmation",
                  e.bytes, e.task.destination_path.string());
}

void LoggerComponent::on_copy_failed(const CopyFailedEvent& e) {
    logger_->error("Copy failed for {}: {}; source kept, moving on",
                   e.task.source_path.string(), e.error.message);
}

void LoggerComponent::on_poll(const PollObservedEvent& e) {
    logger_->debug("{}", format_poll_record(e));
}

void LoggerComponent::on_sync_confirmed(const SyncConfirmedEvent& e) {
    logger_->info("Sync confirmed for {} after {} poll(s) ({:.1f}s)",
                  e.task.destination_path.string(), e.polls, seconds(e.elapsed));
}

void LoggerComponent::on_sync_timed_out(const SyncTimedOutEvent& e) {
    logger_->warn("Timed out after {:.1f}s ({} poll(s)) waiting for {}; source preserved at {}",
                  seconds(e.elapsed), e.polls,
                  e.task.destination_path.string(), e.task.source_path.string());
}

void LoggerComponent::on_source_deleted(const SourceDeletedEvent& e) {
    logger_->info("Deleted source {}", e.task.source_path.string());
}

void LoggerComponent::on_source_delete_failed(const SourceDeleteFailedEvent& e) {
    logger_->error("Could not delete source {}: {}; file now exists at both locations",
                   e.task.source_path.string(), e.error.message);
}

void LoggerComponent::on_transfer_aborted(const TransferAbortedEvent& e) {
    logger_->error("Transfer of {} aborted: {}", e.source_path.string(), e.reason);
}

void LoggerComponent::on_directory_pruned(const DirectoryPrunedEvent& e) {
    logger_->info("Removed empty directory {}", e.path.string());
}

void LoggerComponent::on_prune_failed(const PruneFailedEvent& e) {
    logger_->warn("Could not prune {}: {}", e.path.string(), e.error.message);
}

void LoggerComponent::on_cancellation_requested(const CancellationRequestedEvent& e) {
    logger_->warn("Stop requested (signal {}); the current file will finish first", e.signal_number);
}

void LoggerComponent::on_cancellation_observed(const CancellationObservedEvent& e) {
    logger_->warn("Stopping; {} file(s) not started", e.files_remaining);
}

void MetricsComponent::print_stats(spdlog::logger& logger) const {
    logger.info("Files copied:        {}", stats_.files_copied.load());
    logger.info("Bytes copied:        {}", stats_.bytes_copied.load());
    logger.info("Sources deleted:     {}", stats_.sources_deleted.load());
    logger.info("Sources preserved:   {}", stats_.sources_preserved.load());
    logger.info("Copy failures:       {}", stats_.copy_failures.load());
    logger.info("Delete failures:     {}", stats_.delete_failures.load());
    logger.info("Transfers aborted:   {}", stats_.transfers_aborted.load());
    logger.info("Status polls:        {}", stats_.polls_observed.load());
    logger.info("Directories pruned:  {}", stats_.directories_pruned.load());
    logger.info("Prune failures:      {}", stats_.prune_failures.load());
}

} // namespace cloudmove::events
