#pragma once

#include "cloudmove/core/result.hpp"
#include "cloudmove/migrate/types.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace cloudmove::migrate {

inline constexpr const char* kDefaultDonePattern = "(always )?available on this device";
inline constexpr const char* kDefaultInProgressPattern = "(sync )?(pending|syncing|uploading|downloading)( .*)?";

/**
 * @brief Case-insensitive whole-string pattern over a trimmed status
 */
class StatusMatcher {
public:
    /// @return InvalidConfig error when pattern is not a valid regular expression
    static Result<StatusMatcher> compile(const std::string& pattern);

    [[nodiscard]] bool matches(std::string_view trimmed_status) const;

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    StatusMatcher(std::string pattern, std::regex expression);

    std::string pattern_;
    std::regex expression_;
};

/// Strips leading/trailing ASCII whitespace and non-breaking spaces
std::string trim_status(std::string_view raw);

/**
 * @brief Maps a raw oracle string to Blank / InProgress / Done / Other
 *
 * Blank wins over everything; Done is tested before InProgress.
 */
SyncStatus classify(std::string_view raw_status,
                    const StatusMatcher& done,
                    const StatusMatcher& in_progress);

class StatusClassifier {
public:
    StatusClassifier(StatusMatcher done, StatusMatcher in_progress);

    /// Classifier built from kDefaultDonePattern / kDefaultInProgressPattern
    static StatusClassifier with_defaults();

    [[nodiscard]] SyncStatus classify(std::string_view raw_status) const;

    [[nodiscard]] const StatusMatcher& done_matcher() const noexcept { return done_; }
    [[nodiscard]] const StatusMatcher& in_progress_matcher() const noexcept { return in_progress_; }

private:
    StatusMatcher done_;
    StatusMatcher in_progress_;
};

} // namespace cloudmove::migrate
