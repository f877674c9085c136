/**
 * @file migration_config.hpp
 * @brief Run configuration: defaults, JSON config file, command line
 *
 * Later layers override earlier ones:
 *   built-in defaults -> --config JSON file -> command-line flags
 *
 * EXAMPLE:
 * auto config = load_configuration(argc, argv);
 * if (config.is_error()) { ... }
 * if (config.value().action == CommandLineAction::ShowHelp) { ... }
 */

#pragma once

#include "cloudmove/core/result.hpp"
#include "cloudmove/migrate/status_classifier.hpp"
#include "cloudmove/migrate/status_probe.hpp"
#include "cloudmove/migrate/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cloudmove::config {

enum class CommandLineAction {
    Run,
    ShowHelp
};

struct MigrationConfig {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    migrate::MaxFiles max_files;  ///< nullopt = all

    std::chrono::seconds poll_interval{5};
    std::chrono::seconds timeout{1800};
    std::size_t stable_polls = 2;

    std::string done_pattern = migrate::kDefaultDonePattern;
    std::string in_progress_pattern = migrate::kDefaultInProgressPattern;

    std::filesystem::path log_file;  ///< empty = timestamped name in the working directory

    bool prune_empty_dirs = true;
    bool prune_whole_tree = false;

    migrate::ShellProbeSettings probe;

    std::optional<std::filesystem::path> config_file;
    CommandLineAction action = CommandLineAction::Run;
};

// Accepted ranges, inclusive
inline constexpr long long kMinPollSeconds = 1;
inline constexpr long long kMaxPollSeconds = 300;
inline constexpr long long kMinTimeoutSeconds = 10;
inline constexpr long long kMaxTimeoutSeconds = 86400;
inline constexpr long long kMinStablePolls = 1;
inline constexpr long long kMaxStablePolls = 20;
inline constexpr long long kMaxColumnScanLimit = 1024;

/**
 * @brief "all" (any case) or a positive integer
 */
Result<migrate::MaxFiles> parse_max_files(std::string_view text);

/**
 * @brief Apply a JSON document on top of config
 *
 * Unknown keys are ignored. A key with the wrong JSON type is an
 * InvalidConfig error naming the key.
 */
Result<void> apply_config_text(const std::string& json_text, MigrationConfig& config);

/// Read a JSON config file and apply it
Result<void> load_config_file(const std::filesystem::path& path, MigrationConfig& config);

/**
 * @brief Apply command-line flags on top of config
 *
 * --config/-c is recorded but not loaded here; load_configuration()
 * handles the ordering.
 */
Result<void> parse_command_line(int argc, const char* const argv[], MigrationConfig& config);

/**
 * @brief Check ranges, required roots and pattern syntax
 *
 * Does not touch the filesystem.
 */
Result<void> validate(const MigrationConfig& config);

/**
 * @brief Defaults, then --config file if given, then flags, then validate
 *
 * Validation is skipped when --help was requested.
 */
Result<MigrationConfig> load_configuration(int argc, const char* const argv[]);

std::string usage_text(std::string_view program_name);

} // namespace cloudmove::config
