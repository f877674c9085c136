/**
 * @file main.cpp
 * @brief cloudmove: move files into a cloud-synced folder one at a time
 *
 * Each source file is copied under the destination root, the sync
 * client's status is polled until the copy is confirmed, and only then
 * is the source deleted.
 *
 * USAGE:
 *   cloudmove --source ~/Archive --dest ~/Cloud/Archive --max-files 50
 *   cloudmove --config cloudmove.json --timeout-seconds 600
 *
 * Ctrl+C (or SIGTERM) stops after the file in flight has finished.
 */

#include "cloudmove/config/migration_config.hpp"
#include "cloudmove/core/cancellation.hpp"
#include "cloudmove/core/clock.hpp"
#include "cloudmove/core/logging.hpp"
#include "cloudmove/events/components.hpp"
#include "cloudmove/events/event_bus.hpp"
#include "cloudmove/migrate/directory_pruner.hpp"
#include "cloudmove/migrate/orchestrator.hpp"
#include "cloudmove/migrate/stability_monitor.hpp"
#include "cloudmove/migrate/status_classifier.hpp"
#include "cloudmove/migrate/status_probe.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;
using namespace cloudmove;

namespace {

struct ResolvedRoots {
    fs::path source;
    fs::path destination;
};

/**
 * Canonical absolute roots. The destination is created if missing.
 * Refuses identical or nested roots: pruning and enumeration would
 * otherwise walk into the destination.
 */
Result<ResolvedRoots> resolve_roots(const config::MigrationConfig& config) {
    std::error_code ec;
    if (!fs::is_directory(config.source_root, ec)) {
        return Err<ResolvedRoots>(ErrorCode::RootUnavailable,
            "source root is not a directory: " + config.source_root.string());
    }
    const fs::path source = fs::canonical(config.source_root, ec);
    if (ec) {
        return Err<ResolvedRoots>(ErrorCode::RootUnavailable,
            "cannot resolve source root " + config.source_root.string() + ": " + ec.message());
    }

    fs::create_directories(config.destination_root, ec);
    if (ec) {
        return Err<ResolvedRoots>(ErrorCode::RootUnavailable,
            "cannot create destination root " + config.destination_root.string() + ": " + ec.message());
    }
    const fs::path destination = fs::canonical(config.destination_root, ec);
    if (ec) {
        return Err<ResolvedRoots>(ErrorCode::RootUnavailable,
            "cannot resolve destination root " + config.destination_root.string() + ": " + ec.message());
    }

    if (source == destination ||
        migrate::is_strictly_within(destination, source) ||
        migrate::is_strictly_within(source, destination)) {
        return Err<ResolvedRoots>(ErrorCode::InvalidArgument,
            "source and destination roots must not contain each other: " +
            source.string() + ", " + destination.string());
    }
    return Ok(ResolvedRoots{source, destination});
}

} // namespace

int main(int argc, char* argv[]) {
    const SteadyTime run_started_at = std::chrono::steady_clock::now();

    auto loaded = config::load_configuration(argc, argv);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().message);
        std::cerr << config::usage_text(argv[0]);
        return 1;
    }
    const config::MigrationConfig& cfg = loaded.value();
    if (cfg.action == config::CommandLineAction::ShowHelp) {
        std::cout << config::usage_text(argv[0]);
        return 0;
    }

    auto roots = resolve_roots(cfg);
    if (roots.is_error()) {
        spdlog::error("{}", roots.error().message);
        return 1;
    }

    const fs::path log_file = cfg.log_file.empty() ? logging::default_log_file_name() : cfg.log_file;
    auto logger = logging::make_migration_logger(log_file);
    if (logger.is_error()) {
        spdlog::error("{}", logger.error().message);
        return 1;
    }
    spdlog::set_default_logger(logger.value());

    events::EventBus bus;
    events::LoggerComponent log_component(bus, logger.value());
    events::MetricsComponent metrics(bus);

    CancellationToken cancellation;
    InterruptListener interrupts(cancellation, bus);

    auto done = migrate::StatusMatcher::compile(cfg.done_pattern);
    auto in_progress = migrate::StatusMatcher::compile(cfg.in_progress_pattern);
    if (done.is_error() || in_progress.is_error()) {
        spdlog::error("{}", done.is_error() ? done.error().message : in_progress.error().message);
        return 1;
    }
    const migrate::StatusClassifier classifier(done.value(), in_progress.value());

    migrate::ShellStatusProbe probe(cfg.probe);

    migrate::StabilitySettings stability;
    stability.poll_interval = cfg.poll_interval;
    stability.timeout = cfg.timeout;
    stability.stable_polls_required = cfg.stable_polls;
    migrate::StabilityMonitor monitor(probe, classifier, stability, bus);

    const migrate::DirectoryPruner pruner(bus);

    migrate::OrchestratorSettings settings;
    settings.source_root = roots.value().source;
    settings.destination_root = roots.value().destination;
    settings.prune_empty_directories = cfg.prune_empty_dirs;
    settings.prune_whole_tree = cfg.prune_whole_tree;
    migrate::TransferOrchestrator orchestrator(settings, monitor, pruner, cancellation, bus);

    spdlog::info("Log file: {}", log_file.string());
    spdlog::info("Polling every {}s, timeout {}s, {} stable poll(s) required",
                 cfg.poll_interval.count(), cfg.timeout.count(), cfg.stable_polls);

    const auto files = migrate::collect_source_files(settings.source_root);
    orchestrator.run(files, cfg.max_files, run_started_at);

    interrupts.stop();
    metrics.print_stats(*logger.value());
    logger.value()->flush();
    return 0;
}
