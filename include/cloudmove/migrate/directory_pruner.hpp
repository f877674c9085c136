#pragma once

#include "cloudmove/events/event_bus.hpp"
#include "cloudmove/migrate/types.hpp"

#include <cstddef>
#include <filesystem>

namespace cloudmove::migrate {

/**
 * @brief Removes directories left empty after a source file is deleted
 *
 * prune(request) runs three best-effort steps:
 *   1. every directory below the scope, deepest first by path depth,
 *      removed if empty at the moment of removal
 *   2. the scope itself, if now empty
 *   3. ancestors of the scope, walking up until one is missing or
 *      non-empty, stopping before the root boundary
 *
 * The root boundary and anything outside it are never removed. Each
 * failure emits PruneFailedEvent and pruning carries on with the next
 * candidate. The pruner holds no state between calls.
 */
class DirectoryPruner {
public:
    explicit DirectoryPruner(events::EventBus& bus);

    PruneReport prune(const PruneRequest& request) const;

    PruneReport prune(const std::filesystem::path& root_boundary,
                      const std::filesystem::path& scope) const {
        return prune(PruneRequest{root_boundary, scope});
    }

private:
    bool remove_if_empty(const std::filesystem::path& directory, PruneReport& report) const;

    events::EventBus& bus_;
};

/// Number of path elements in a lexically normalised path
std::size_t path_depth(const std::filesystem::path& path);

/// True when candidate lies below boundary (not equal to it)
bool is_strictly_within(const std::filesystem::path& candidate, const std::filesystem::path& boundary);

} // namespace cloudmove::migrate
