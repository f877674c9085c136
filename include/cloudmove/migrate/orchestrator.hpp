#pragma once

#include "cloudmove/core/cancellation.hpp"
#include "cloudmove/core/clock.hpp"
#include "cloudmove/core/result.hpp"
#include "cloudmove/events/event_bus.hpp"
#include "cloudmove/migrate/directory_pruner.hpp"
#include "cloudmove/migrate/stability_monitor.hpp"
#include "cloudmove/migrate/types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace cloudmove::migrate {

struct OrchestratorSettings {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    bool prune_empty_directories = true;
    bool prune_whole_tree = false;  ///< false: prune only the file's parent directory
};

/**
 * @brief Regular files below root, sorted by ordinal generic path string
 *
 * Symlinks are not followed. Unreadable entries are skipped with a warning.
 */
std::vector<std::filesystem::path> collect_source_files(const std::filesystem::path& root);

/// First cap entries of files (all of them when cap is nullopt)
std::vector<std::filesystem::path> apply_cap(std::vector<std::filesystem::path> files, MaxFiles cap);

/**
 * @brief Moves files one at a time: copy, confirm sync, delete, prune
 *
 * Exactly one file is in flight at any time. The cancellation token is
 * read only before a file is started; a started file always reaches one
 * of its terminal outcomes. No per-file failure stops the run.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(OrchestratorSettings settings,
                         StabilityMonitor& monitor,
                         const DirectoryPruner& pruner,
                         const CancellationToken& cancellation,
                         events::EventBus& bus,
                         Clock clock = Clock::system());

    /**
     * @brief Process up to cap files of an already sorted list
     *
     * @param run_started_at Process start, used for the run time shown in
     *                       poll records
     */
    RunSummary run(const std::vector<std::filesystem::path>& files, MaxFiles cap, SteadyTime run_started_at);

    RunSummary run(const std::vector<std::filesystem::path>& files, MaxFiles cap);

    /// source re-rooted under the destination root
    Result<std::filesystem::path> destination_for(const std::filesystem::path& source) const;

    [[nodiscard]] const OrchestratorSettings& settings() const noexcept { return settings_; }

private:
    FileOutcome process_file(const std::filesystem::path& source,
                             std::size_t index,
                             std::size_t total,
                             SteadyTime run_started_at);

    Result<std::uintmax_t> copy_to_destination(const TransferTask& task) const;

    void prune_after_delete(const TransferTask& task) const;

    OrchestratorSettings settings_;
    StabilityMonitor& monitor_;
    const DirectoryPruner& pruner_;
    const CancellationToken& cancellation_;
    events::EventBus& bus_;
    Clock clock_;
};

} // namespace cloudmove::migrate
