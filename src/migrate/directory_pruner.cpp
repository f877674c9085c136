#include "cloudmove/migrate/directory_pruner.hpp"

#include "cloudmove/events/events.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace cloudmove::migrate {
namespace fs = std::filesystem;
namespace {

fs::path normalized(const fs::path& path) {
    fs::path result = path.lexically_normal();
    // "a/b/" normalises to "a/b/" with an empty filename; drop it so
    // depth and prefix comparisons see the same elements as "a/b"
    if (!result.empty() && result.filename().empty() && result != result.root_path()) {
        result = result.parent_path();
    }
    return result;
}

// True when any element from below the root down to the scope is a
// symlink, which would lead removals outside the root
bool passes_through_symlink(const fs::path& root, const fs::path& scope) {
    fs::path current = root;
    auto scope_it = scope.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it) {
        ++scope_it;
    }
    for (; scope_it != scope.end(); ++scope_it) {
        current /= *scope_it;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(current, ec))) {
            return true;
        }
    }
    return false;
}

} // namespace

std::size_t path_depth(const fs::path& path) {
    const fs::path norm = normalized(path);
    return static_cast<std::size_t>(std::distance(norm.begin(), norm.end()));
}

bool is_strictly_within(const fs::path& candidate, const fs::path& boundary) {
    const fs::path child = normalized(candidate);
    const fs::path root = normalized(boundary);

    auto child_it = child.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++child_it) {
        if (child_it == child.end() || *child_it != *root_it) {
            return false;
        }
    }
    return child_it != child.end();
}

DirectoryPruner::DirectoryPruner(events::EventBus& bus) : bus_(bus) {}

PruneReport DirectoryPruner::prune(const PruneRequest& request) const {
    PruneReport report;
    const fs::path root = normalized(request.root_boundary);
    const fs::path scope = normalized(request.scope_directory);

    if (scope != root && !is_strictly_within(scope, root)) {
        ++report.failures;
        bus_.emit(events::PruneFailedEvent{scope, Error{ErrorCode::PruneFailed,
            "scope is outside the root boundary " + root.string()}});
        return report;
    }

    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(scope, ec)) || passes_through_symlink(root, scope)) {
        return report;
    }

    // Step 1: descendants, deepest first
    std::vector<std::pair<std::size_t, fs::path>> candidates;
    fs::recursive_directory_iterator it(scope, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        ++report.failures;
        bus_.emit(events::PruneFailedEvent{scope, Error{ErrorCode::PruneFailed,
            "cannot enumerate: " + ec.message()}});
    } else {
        const fs::recursive_directory_iterator end;
        while (it != end) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
                candidates.emplace_back(path_depth(it->path()), it->path());
            }
            it.increment(entry_ec);
            if (entry_ec) {
                ++report.failures;
                bus_.emit(events::PruneFailedEvent{scope, Error{ErrorCode::PruneFailed,
                    "enumeration stopped early: " + entry_ec.message()}});
                break;
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });

    for (const auto& [depth, directory] : candidates) {
        remove_if_empty(directory, report);
    }

    // Step 2: the scope itself
    if (scope != root) {
        remove_if_empty(scope, report);
    }

    // Step 3: ancestors, never reaching the root boundary
    fs::path current = scope.parent_path();
    while (is_strictly_within(current, root)) {
        std::error_code exists_ec;
        if (!fs::exists(current, exists_ec)) {
            break;
        }
        if (!remove_if_empty(current, report)) {
            break;
        }
        current = current.parent_path();
    }

    return report;
}

bool DirectoryPruner::remove_if_empty(const fs::path& directory, PruneReport& report) const {
    std::error_code ec;
    // Only real directories; a link swapped in since enumeration is left alone
    if (!fs::is_directory(fs::symlink_status(directory, ec))) {
        return false;
    }
    const bool empty = fs::is_empty(directory, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return false;
        }
        ++report.failures;
        bus_.emit(events::PruneFailedEvent{directory, Error{ErrorCode::PruneFailed, ec.message()}});
        return false;
    }
    if (!empty) {
        return false;
    }

    // remove() refuses a directory that gained an entry after the check
    if (!fs::remove(directory, ec) || ec) {
        if (ec) {
            ++report.failures;
            bus_.emit(events::PruneFailedEvent{directory, Error{ErrorCode::PruneFailed, ec.message()}});
        }
        return false;
    }

    ++report.removed;
    bus_.emit(events::DirectoryPrunedEvent{directory});
    return true;
}

} // namespace cloudmove::migrate
