#pragma once

#include "cloudmove/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudmove::migrate {

/**
 * @brief Source of the raw sync-state string for a destination path
 *
 * Implementations return ProbeFailed when the containing folder or the
 * item cannot be resolved. Callers treat a failure the same as a blank
 * status.
 */
class SyncStatusProbe {
public:
    virtual ~SyncStatusProbe() = default;

    virtual Result<std::string> probe(const std::filesystem::path& path) = 0;
};

/**
 * @brief Header row plus one row per item, as printed by the status command
 */
struct StatusTable {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    /// Row whose first field equals item_name, if any
    [[nodiscard]] const std::vector<std::string>* find_row(const std::string& item_name) const;
};

/**
 * @brief Parse tab-separated status command output
 *
 * Line 1 is the header row. Blank lines are skipped and a trailing CR is
 * dropped from every line.
 */
Result<StatusTable> parse_status_table(const std::string& output);

/**
 * @brief Index of the status attribute among the first max_scan headers
 *
 * Header comparison is trimmed and case-insensitive.
 */
std::optional<std::size_t> find_status_column(const std::vector<std::string>& headers,
                                              const std::string& attribute_name,
                                              std::size_t max_scan);

struct ShellProbeSettings {
    std::string command = "cloudmove-status";
    std::string status_attribute = "Availability status";
    std::size_t max_column_scan = 64;
    std::size_t default_column = 1;
};

/**
 * @brief Queries an out-of-process status command through the shell
 *
 * Runs `<command> '<directory>'` and reads the item's field from the
 * returned table. The column holding the status attribute is discovered
 * once per directory and kept for the lifetime of the probe.
 */
class ShellStatusProbe : public SyncStatusProbe {
public:
    explicit ShellStatusProbe(ShellProbeSettings settings);

    Result<std::string> probe(const std::filesystem::path& path) override;

    /// Cached column for a directory, if that directory has been probed
    [[nodiscard]] std::optional<std::size_t> cached_column(const std::filesystem::path& directory) const;

    [[nodiscard]] std::size_t cached_directory_count() const noexcept { return column_cache_.size(); }

private:
    Result<std::string> run_command(const std::filesystem::path& directory) const;

    std::size_t resolve_column(const std::filesystem::path& directory, const StatusTable& table);

    ShellProbeSettings settings_;
    std::unordered_map<std::string, std::size_t> column_cache_;
};

/// Single-quote a string for /bin/sh
std::string shell_quote(const std::string& value);

} // namespace cloudmove::migrate
