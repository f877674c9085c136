#include "cloudmove/migrate/status_probe.hpp"

#include "cloudmove/migrate/status_classifier.hpp"

#include <spdlog/spdlog.h>

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace cloudmove::migrate {
namespace fs = std::filesystem;
namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const auto tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string directory_key(const fs::path& directory) {
    return directory.lexically_normal().generic_string();
}

// Closes the pipe exactly once and keeps the child's wait status
class Pipe {
public:
    explicit Pipe(const std::string& command) : handle_(::popen(command.c_str(), "r")) {}

    ~Pipe() {
        if (handle_ != nullptr) {
            ::pclose(handle_);
        }
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    FILE* get() const noexcept { return handle_; }

    int close() {
        const int status = ::pclose(handle_);
        handle_ = nullptr;
        return status;
    }

private:
    FILE* handle_;
};

} // namespace

const std::vector<std::string>* StatusTable::find_row(const std::string& item_name) const {
    for (const auto& row : rows) {
        if (!row.empty() && row.front() == item_name) {
            return &row;
        }
    }
    return nullptr;
}

Result<StatusTable> parse_status_table(const std::string& output) {
    StatusTable table;
    std::istringstream input(output);
    std::string line;
    bool have_header = false;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (!have_header) {
            table.headers = split_tabs(line);
            have_header = true;
        } else {
            table.rows.push_back(split_tabs(line));
        }
    }

    if (!have_header) {
        return Err<StatusTable>(ErrorCode::ProbeFailed, "status command printed no header row");
    }
    return Ok(std::move(table));
}

std::optional<std::size_t> find_status_column(const std::vector<std::string>& headers,
                                              const std::string& attribute_name,
                                              std::size_t max_scan) {
    const std::string wanted = to_lower_ascii(trim_status(attribute_name));
    const std::size_t limit = std::min(headers.size(), max_scan);
    for (std::size_t i = 0; i < limit; ++i) {
        if (to_lower_ascii(trim_status(headers[i])) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}

ShellStatusProbe::ShellStatusProbe(ShellProbeSettings settings)
    : settings_(std::move(settings)) {}

Result<std::string> ShellStatusProbe::probe(const fs::path& path) {
    const fs::path directory = path.parent_path();
    const std::string item = path.filename().string();
    if (directory.empty() || item.empty()) {
        return Err<std::string>(ErrorCode::ProbeFailed, "cannot resolve containing folder of " + path.string());
    }

    auto output = run_command(directory);
    if (output.is_error()) {
        return Err<std::string>(output.error());
    }

    auto table = parse_status_table(output.value());
    if (table.is_error()) {
        return Err<std::string>(table.error());
    }

    const std::size_t column = resolve_column(directory, table.value());
    const auto* row = table.value().find_row(item);
    if (row == nullptr) {
        return Err<std::string>(ErrorCode::ProbeFailed, "item not listed by status command: " + path.string());
    }
    if (column >= row->size()) {
        return Ok(std::string{});
    }
    return Ok((*row)[column]);
}

std::optional<std::size_t> ShellStatusProbe::cached_column(const fs::path& directory) const {
    auto it = column_cache_.find(directory_key(directory));
    if (it == column_cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::string> ShellStatusProbe::run_command(const fs::path& directory) const {
    const std::string command = settings_.command + " " + shell_quote(directory.string()) + " 2>/dev/null";

    Pipe pipe(command);
    if (pipe.get() == nullptr) {
        return Err<std::string>(ErrorCode::ProbeFailed, "cannot start status command: " + settings_.command);
    }

    std::string output;
    std::array<char, 4096> buffer{};
    std::size_t count = 0;
    while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        output.append(buffer.data(), count);
    }

    const int status = pipe.close();
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Err<std::string>(ErrorCode::ProbeFailed,
            "status command failed for " + directory.string() + " (wait status " + std::to_string(status) + ")");
    }
    return Ok(std::move(output));
}

std::size_t ShellStatusProbe::resolve_column(const fs::path& directory, const StatusTable& table) {
    const std::string key = directory_key(directory);
    if (auto it = column_cache_.find(key); it != column_cache_.end()) {
        return it->second;
    }

    std::size_t column = settings_.default_column;
    if (auto found = find_status_column(table.headers, settings_.status_attribute, settings_.max_column_scan)) {
        column = *found;
    } else {
        spdlog::debug("'{}' not among the first {} columns for {}, using column {}",
                      settings_.status_attribute, settings_.max_column_scan, key, column);
    }
    column_cache_.emplace(key, column);
    return column;
}

} // namespace cloudmove::migrate
