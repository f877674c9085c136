#include "cloudmove/config/migration_config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace cloudmove::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> invalid(const std::string& message) {
    return Err<void>(ErrorCode::InvalidConfig, message);
}

Result<long long> parse_integer(std::string_view text, const std::string& name) {
    const std::string value(text);
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return Err<long long>(ErrorCode::InvalidConfig, name + ": not an integer: '" + value + "'");
        }
        return Ok(parsed);
    } catch (const std::invalid_argument&) {
        return Err<long long>(ErrorCode::InvalidConfig, name + ": not an integer: '" + value + "'");
    } catch (const std::out_of_range&) {
        return Err<long long>(ErrorCode::InvalidConfig, name + ": out of range: '" + value + "'");
    }
}

Result<std::size_t> to_count(long long value, const std::string& name) {
    if (value < 0) {
        return Err<std::size_t>(ErrorCode::InvalidConfig,
            name + " must not be negative, got " + std::to_string(value));
    }
    return Ok(static_cast<std::size_t>(value));
}

template<typename T, typename Apply>
Result<void> read_key(const json& object, const char* key, Apply apply) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    // nlohmann truncates 2.9 to 2 when asked for an integer
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_integer()) {
            return invalid(std::string("config key '") + key + "' must be an integer");
        }
    }
    try {
        apply(it->template get<T>());
    } catch (const json::exception& e) {
        return invalid(std::string("config key '") + key + "': " + e.what());
    }
    return Ok();
}

template<typename Apply>
Result<void> read_count(const json& object, const char* key, Apply apply) {
    std::optional<long long> raw;
    auto read = read_key<long long>(object, key, [&](long long v) { raw = v; });
    if (read.is_error() || !raw) {
        return read;
    }
    auto count = to_count(*raw, std::string("config key '") + key + "'");
    if (count.is_error()) {
        return Err<void>(count.error());
    }
    apply(count.value());
    return Ok();
}

Result<migrate::MaxFiles> max_files_from_json(const json& value) {
    if (value.is_string()) {
        return parse_max_files(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        const auto count = value.get<long long>();
        if (count <= 0) {
            return Err<migrate::MaxFiles>(ErrorCode::InvalidConfig,
                "max_files must be a positive integer or \"all\"");
        }
        return Ok(migrate::MaxFiles{static_cast<std::size_t>(count)});
    }
    return Err<migrate::MaxFiles>(ErrorCode::InvalidConfig, "max_files must be a positive integer or \"all\"");
}

Result<void> check_range(const char* name, long long value, long long low, long long high) {
    if (value < low || value > high) {
        return invalid(std::string(name) + " must be between " + std::to_string(low) + " and " +
                       std::to_string(high) + ", got " + std::to_string(value));
    }
    return Ok();
}

} // namespace

Result<migrate::MaxFiles> parse_max_files(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "all") {
        return Ok(migrate::MaxFiles{});
    }

    auto count = parse_integer(text, "max files");
    if (count.is_error()) {
        return Err<migrate::MaxFiles>(count.error());
    }
    if (count.value() <= 0) {
        return Err<migrate::MaxFiles>(ErrorCode::InvalidConfig,
            "max files must be a positive integer or \"all\", got '" + std::string(text) + "'");
    }
    return Ok(migrate::MaxFiles{static_cast<std::size_t>(count.value())});
}

Result<void> apply_config_text(const std::string& json_text, MigrationConfig& config) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return invalid(std::string("config file is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        return invalid("config file must contain a JSON object");
    }

    std::vector<Result<void>> steps;
    steps.push_back(read_key<std::string>(root, "source", [&](std::string v) { config.source_root = v; }));
    steps.push_back(read_key<std::string>(root, "destination", [&](std::string v) { config.destination_root = v; }));
    steps.push_back(read_key<long long>(root, "poll_seconds",
                                        [&](long long v) { config.poll_interval = std::chrono::seconds(v); }));
    steps.push_back(read_key<long long>(root, "timeout_seconds",
                                        [&](long long v) { config.timeout = std::chrono::seconds(v); }));
    steps.push_back(read_count(root, "stable_polls", [&](std::size_t v) { config.stable_polls = v; }));
    steps.push_back(read_key<std::string>(root, "done_pattern", [&](std::string v) { config.done_pattern = v; }));
    steps.push_back(read_key<std::string>(root, "in_progress_pattern",
                                          [&](std::string v) { config.in_progress_pattern = v; }));
    steps.push_back(read_key<std::string>(root, "log_file", [&](std::string v) { config.log_file = v; }));
    steps.push_back(read_key<bool>(root, "prune_empty_dirs", [&](bool v) { config.prune_empty_dirs = v; }));
    steps.push_back(read_key<bool>(root, "prune_whole_tree", [&](bool v) { config.prune_whole_tree = v; }));

    for (const auto& step : steps) {
        if (step.is_error()) {
            return step;
        }
    }

    if (auto it = root.find("max_files"); it != root.end()) {
        auto cap = max_files_from_json(*it);
        if (cap.is_error()) {
            return Err<void>(cap.error());
        }
        config.max_files = cap.value();
    }

    if (auto it = root.find("probe"); it != root.end()) {
        if (!it->is_object()) {
            return invalid("config key 'probe' must be an object");
        }
        const json& probe = *it;
        std::vector<Result<void>> probe_steps;
        probe_steps.push_back(read_key<std::string>(probe, "command",
                                                    [&](std::string v) { config.probe.command = v; }));
        probe_steps.push_back(read_key<std::string>(probe, "status_attribute",
                                                    [&](std::string v) { config.probe.status_attribute = v; }));
        probe_steps.push_back(read_count(probe, "max_column_scan",
                                         [&](std::size_t v) { config.probe.max_column_scan = v; }));
        probe_steps.push_back(read_count(probe, "default_column",
                                         [&](std::size_t v) { config.probe.default_column = v; }));
        for (const auto& step : probe_steps) {
            if (step.is_error()) {
                return step;
            }
        }
    }

    return Ok();
}

Result<void> load_config_file(const fs::path& path, MigrationConfig& config) {
    std::ifstream file(path);
    if (!file) {
        return invalid("cannot open config file " + path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto applied = apply_config_text(contents.str(), config);
    if (applied.is_error()) {
        return invalid(path.string() + ": " + applied.error().message);
    }
    return Ok();
}

Result<void> parse_command_line(int argc, const char* const argv[], MigrationConfig& config) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // Flags below this point take a value
        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            return std::nullopt;
        };

        if (arg == "--help" || arg == "-h") {
            config.action = CommandLineAction::ShowHelp;
            continue;
        }
        if (arg == "--prune-empty-dirs") {
            config.prune_empty_dirs = true;
            continue;
        }
        if (arg == "--no-prune-empty-dirs") {
            config.prune_empty_dirs = false;
            continue;
        }
        if (arg == "--prune-whole-tree") {
            config.prune_whole_tree = true;
            continue;
        }

        const bool takes_value =
            arg == "--source" || arg == "-s" || arg == "--dest" || arg == "-d" ||
            arg == "--max-files" || arg == "--poll-seconds" || arg == "--timeout-seconds" ||
            arg == "--stable-polls" || arg == "--done-pattern" || arg == "--in-progress-pattern" ||
            arg == "--log-file" || arg == "--probe-command" || arg == "--status-attribute" ||
            arg == "--config" || arg == "-c";
        if (!takes_value) {
            return invalid("unknown option: " + arg);
        }

        const auto value = next_value();
        if (!value) {
            return invalid(arg + " requires a value");
        }

        if (arg == "--source" || arg == "-s") {
            config.source_root = *value;
        } else if (arg == "--dest" || arg == "-d") {
            config.destination_root = *value;
        } else if (arg == "--max-files") {
            auto cap = parse_max_files(*value);
            if (cap.is_error()) {
                return Err<void>(cap.error());
            }
            config.max_files = cap.value();
        } else if (arg == "--poll-seconds") {
            auto seconds = parse_integer(*value, arg);
            if (seconds.is_error()) {
                return Err<void>(seconds.error());
            }
            config.poll_interval = std::chrono::seconds(seconds.value());
        } else if (arg == "--timeout-seconds") {
            auto seconds = parse_integer(*value, arg);
            if (seconds.is_error()) {
                return Err<void>(seconds.error());
            }
            config.timeout = std::chrono::seconds(seconds.value());
        } else if (arg == "--stable-polls") {
            auto polls = parse_integer(*value, arg);
            if (polls.is_error()) {
                return Err<void>(polls.error());
            }
            auto count = to_count(polls.value(), arg);
            if (count.is_error()) {
                return Err<void>(count.error());
            }
            config.stable_polls = count.value();
        } else if (arg == "--done-pattern") {
            config.done_pattern = *value;
        } else if (arg == "--in-progress-pattern") {
            config.in_progress_pattern = *value;
        } else if (arg == "--log-file") {
            config.log_file = *value;
        } else if (arg == "--probe-command") {
            config.probe.command = *value;
        } else if (arg == "--status-attribute") {
            config.probe.status_attribute = *value;
        } else {
            config.config_file = fs::path(*value);
        }
    }
    return Ok();
}

Result<void> validate(const MigrationConfig& config) {
    if (config.source_root.empty()) {
        return invalid("source root is required (--source)");
    }
    if (config.destination_root.empty()) {
        return invalid("destination root is required (--dest)");
    }

    const Result<void> ranges[] = {
        check_range("poll_seconds", config.poll_interval.count(), kMinPollSeconds, kMaxPollSeconds),
        check_range("timeout_seconds", config.timeout.count(), kMinTimeoutSeconds, kMaxTimeoutSeconds),
        check_range("stable_polls", static_cast<long long>(config.stable_polls), kMinStablePolls, kMaxStablePolls),
        check_range("probe.max_column_scan", static_cast<long long>(config.probe.max_column_scan),
                    1, kMaxColumnScanLimit),
    };
    for (const auto& range : ranges) {
        if (range.is_error()) {
            return range;
        }
    }

    if (config.max_files && *config.max_files == 0) {
        return invalid("max_files must be a positive integer or \"all\"");
    }
    // Column 0 holds the item name, never a status
    if (config.probe.default_column == 0 || config.probe.default_column >= config.probe.max_column_scan) {
        return invalid("probe.default_column must be between 1 and probe.max_column_scan - 1");
    }
    if (config.probe.command.empty()) {
        return invalid("probe.command must not be empty");
    }
    if (config.probe.status_attribute.empty()) {
        return invalid("probe.status_attribute must not be empty");
    }

    auto done = migrate::StatusMatcher::compile(config.done_pattern);
    if (done.is_error()) {
        return invalid("done_pattern: " + done.error().message);
    }
    auto in_progress = migrate::StatusMatcher::compile(config.in_progress_pattern);
    if (in_progress.is_error()) {
        return invalid("in_progress_pattern: " + in_progress.error().message);
    }
    return Ok();
}

Result<MigrationConfig> load_configuration(int argc, const char* const argv[]) {
    MigrationConfig config;

    // First pass only to find --config, so flags still win over the file
    MigrationConfig probe_pass;
    auto scanned = parse_command_line(argc, argv, probe_pass);
    if (scanned.is_error()) {
        return Err<MigrationConfig>(scanned.error());
    }
    if (probe_pass.action == CommandLineAction::ShowHelp) {
        config.action = CommandLineAction::ShowHelp;
        return Ok(std::move(config));
    }

    if (probe_pass.config_file) {
        auto loaded = load_config_file(*probe_pass.config_file, config);
        if (loaded.is_error()) {
            return Err<MigrationConfig>(loaded.error());
        }
    }

    auto parsed = parse_command_line(argc, argv, config);
    if (parsed.is_error()) {
        return Err<MigrationConfig>(parsed.error());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<MigrationConfig>(valid.error());
    }
    return Ok(std::move(config));
}

std::string usage_text(std::string_view program_name) {
    std::ostringstream out;
    out << "Usage: " << program_name << " --source <dir> --dest <dir> [options]\n"
        << "\n"
        << "Copies each file under the source root to the same relative path under the\n"
        << "destination root, waits until the sync client reports the copy as available,\n"
        << "then deletes the source file.\n"
        << "\n"
        << "Options:\n"
        << "  -s, --source <dir>             Source root (required)\n"
        << "  -d, --dest <dir>               Destination root inside the synced folder (required)\n"
        << "      --max-files <n|all>        Files to process this run (default: all)\n"
        << "      --poll-seconds <n>         Seconds between status polls, 1-300 (default: 5)\n"
        << "      --timeout-seconds <n>      Per-file confirmation timeout, 10-86400 (default: 1800)\n"
        << "      --stable-polls <n>         Consecutive Done polls required, 1-20 (default: 2)\n"
        << "      --done-pattern <regex>     Status text meaning fully synced\n"
        << "      --in-progress-pattern <re> Status text meaning sync in progress\n"
        << "      --log-file <path>          Log file (default: cloudmove_<timestamp>.log)\n"
        << "      --prune-empty-dirs         Remove source directories left empty (default)\n"
        << "      --no-prune-empty-dirs      Keep empty source directories\n"
        << "      --prune-whole-tree         Prune the whole source tree after each delete\n"
        << "      --probe-command <cmd>      Status command (default: cloudmove-status)\n"
        << "      --status-attribute <name>  Status column header (default: Availability status)\n"
        << "  -c, --config <file>            JSON config file; flags override its values\n"
        << "  -h, --help                     Show this help\n"
        << "\n"
        << "SIGINT or SIGTERM stops the run after the file in flight completes.\n";
    return out.str();
}

} // namespace cloudmove::config
