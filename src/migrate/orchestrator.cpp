#include "cloudmove/migrate/orchestrator.hpp"

#include "cloudmove/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace cloudmove::migrate {
namespace fs = std::filesystem;

std::vector<fs::path> collect_source_files(const fs::path& root) {
    std::vector<fs::path> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot enumerate {}: {}", root.string(), ec.message());
        return files;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code entry_ec;
        const bool regular = it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec);
        if (entry_ec) {
            spdlog::warn("Skipping {}: {}", it->path().string(), entry_ec.message());
        } else if (regular) {
            files.push_back(it->path());
        }

        it.increment(entry_ec);
        if (entry_ec) {
            spdlog::warn("Enumeration of {} stopped early: {}", root.string(), entry_ec.message());
            break;
        }
    }

    std::sort(files.begin(), files.end(), [](const fs::path& lhs, const fs::path& rhs) {
        return lhs.generic_string() < rhs.generic_string();
    });
    return files;
}

std::vector<fs::path> apply_cap(std::vector<fs::path> files, MaxFiles cap) {
    if (cap && files.size() > *cap) {
        files.resize(*cap);
    }
    return files;
}

TransferOrchestrator::TransferOrchestrator(OrchestratorSettings settings,
                                           StabilityMonitor& monitor,
                                           const DirectoryPruner& pruner,
                                           const CancellationToken& cancellation,
                                           events::EventBus& bus,
                                           Clock clock)
    : settings_(std::move(settings)),
      monitor_(monitor),
      pruner_(pruner),
      cancellation_(cancellation),
      bus_(bus),
      clock_(std::move(clock)) {}

RunSummary TransferOrchestrator::run(const std::vector<fs::path>& files, MaxFiles cap) {
    return run(files, cap, clock_.now());
}

RunSummary TransferOrchestrator::run(const std::vector<fs::path>& files,
                                     MaxFiles cap,
                                     SteadyTime run_started_at) {
    RunSummary summary;
    summary.planned = cap ? std::min(*cap, files.size()) : files.size();

    bus_.emit(events::RunStartedEvent{settings_.source_root, settings_.destination_root, summary.planned});

    for (std::size_t i = 0; i < summary.planned; ++i) {
        if (cancellation_.is_requested()) {
            summary.cancelled = true;
            bus_.emit(events::CancellationObservedEvent{summary.planned - i});
            break;
        }

        ++summary.attempted;
        FileOutcome outcome = FileOutcome::Failed;
        try {
            outcome = process_file(files[i], i + 1, summary.planned, run_started_at);
        } catch (const std::exception& e) {
            bus_.emit(events::TransferAbortedEvent{files[i], e.what()});
        }

        switch (outcome) {
            case FileOutcome::Deleted: ++summary.deleted; break;
            case FileOutcome::Preserved: ++summary.preserved; break;
            case FileOutcome::Failed: ++summary.failed; break;
        }
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - run_started_at);
    bus_.emit(events::RunCompletedEvent{summary, duration});
    return summary;
}

Result<fs::path> TransferOrchestrator::destination_for(const fs::path& source) const {
    const fs::path relative = source.lexically_normal().lexically_relative(settings_.source_root.lexically_normal());
    if (relative.empty() || relative.begin()->string() == "..") {
        return Err<fs::path>(ErrorCode::InvalidArgument,
                             source.string() + " is not inside " + settings_.source_root.string());
    }
    return Ok(settings_.destination_root / relative);
}

FileOutcome TransferOrchestrator::process_file(const fs::path& source,
                                               std::size_t index,
                                               std::size_t total,
                                               SteadyTime run_started_at) {
    TransferTask task;
    task.source_path = source;
    task.started_at = clock_.now();

    auto destination = destination_for(source);
    if (destination.is_error()) {
        bus_.emit(events::CopyFailedEvent{task, destination.error()});
        return FileOutcome::Failed;
    }
    task.destination_path = destination.value();

    bus_.emit(events::TransferStartedEvent{task, index, total});

    auto copied = copy_to_destination(task);
    if (copied.is_error()) {
        bus_.emit(events::CopyFailedEvent{task, copied.error()});
        return FileOutcome::Failed;
    }
    bus_.emit(events::FileCopiedEvent{task, copied.value()});

    const StabilityResult stability = monitor_.wait_for_sync(task, run_started_at);
    if (stability.verdict == StabilityVerdict::TimedOut) {
        bus_.emit(events::SyncTimedOutEvent{task, stability.polls, stability.elapsed});
        return FileOutcome::Preserved;
    }
    bus_.emit(events::SyncConfirmedEvent{task, stability.polls, stability.elapsed});

    std::error_code ec;
    const bool removed = fs::remove(task.source_path, ec);
    if (ec || !removed) {
        const std::string reason = ec ? ec.message() : std::string("source no longer exists");
        bus_.emit(events::SourceDeleteFailedEvent{task, Error{ErrorCode::DeleteFailed, reason}});
        return FileOutcome::Failed;
    }
    bus_.emit(events::SourceDeletedEvent{task});

    if (settings_.prune_empty_directories) {
        prune_after_delete(task);
    }
    return FileOutcome::Deleted;
}

Result<std::uintmax_t> TransferOrchestrator::copy_to_destination(const TransferTask& task) const {
    std::error_code ec;
    fs::create_directories(task.destination_path.parent_path(), ec);
    if (ec) {
        return Err<std::uintmax_t>(ErrorCode::CopyFailed,
            "cannot create " + task.destination_path.parent_path().string() + ": " + ec.message());
    }

    fs::copy_file(task.source_path, task.destination_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<std::uintmax_t>(ErrorCode::CopyFailed, ec.message());
    }

    const auto bytes = fs::file_size(task.destination_path, ec);
    return Ok(ec ? std::uintmax_t{0} : bytes);
}

void TransferOrchestrator::prune_after_delete(const TransferTask& task) const {
    const fs::path scope = settings_.prune_whole_tree ? settings_.source_root
                                                      : task.source_path.parent_path();
    pruner_.prune(settings_.source_root, scope);
}

} // namespace cloudmove::migrate
