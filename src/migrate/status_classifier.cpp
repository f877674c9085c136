#include "cloudmove/migrate/status_classifier.hpp"

#include <stdexcept>
#include <utility>

namespace cloudmove::migrate {
namespace {

bool is_ascii_space(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// U+00A0 in UTF-8
constexpr std::string_view kNbsp = "\xC2\xA0";

} // namespace

std::string trim_status(std::string_view raw) {
    bool changed = true;
    while (changed && !raw.empty()) {
        changed = false;
        if (is_ascii_space(raw.front())) {
            raw.remove_prefix(1);
            changed = true;
        } else if (raw.substr(0, kNbsp.size()) == kNbsp) {
            raw.remove_prefix(kNbsp.size());
            changed = true;
        }
        if (raw.empty()) {
            break;
        }
        if (is_ascii_space(raw.back())) {
            raw.remove_suffix(1);
            changed = true;
        } else if (raw.size() >= kNbsp.size() && raw.substr(raw.size() - kNbsp.size()) == kNbsp) {
            raw.remove_suffix(kNbsp.size());
            changed = true;
        }
    }
    return std::string(raw);
}

StatusMatcher::StatusMatcher(std::string pattern, std::regex expression)
    : pattern_(std::move(pattern)), expression_(std::move(expression)) {}

Result<StatusMatcher> StatusMatcher::compile(const std::string& pattern) {
    if (pattern.empty()) {
        return Err<StatusMatcher>(ErrorCode::InvalidConfig, "status pattern must not be empty");
    }
    try {
        std::regex expression(pattern, std::regex::ECMAScript | std::regex::icase);
        return Ok(StatusMatcher(pattern, std::move(expression)));
    } catch (const std::regex_error& e) {
        return Err<StatusMatcher>(ErrorCode::InvalidConfig,
                                  "invalid status pattern '" + pattern + "': " + e.what());
    }
}

bool StatusMatcher::matches(std::string_view trimmed_status) const {
    return std::regex_match(trimmed_status.begin(), trimmed_status.end(), expression_);
}

SyncStatus classify(std::string_view raw_status,
                    const StatusMatcher& done,
                    const StatusMatcher& in_progress) {
    const std::string status = trim_status(raw_status);
    if (status.empty()) {
        return SyncStatus::Blank;
    }
    if (done.matches(status)) {
        return SyncStatus::Done;
    }
    if (in_progress.matches(status)) {
        return SyncStatus::InProgress;
    }
    return SyncStatus::Other;
}

StatusClassifier::StatusClassifier(StatusMatcher done, StatusMatcher in_progress)
    : done_(std::move(done)), in_progress_(std::move(in_progress)) {}

StatusClassifier StatusClassifier::with_defaults() {
    auto done = StatusMatcher::compile(kDefaultDonePattern);
    auto in_progress = StatusMatcher::compile(kDefaultInProgressPattern);
    if (done.is_error() || in_progress.is_error()) {
        throw std::logic_error("built-in status patterns failed to compile");
    }
    return StatusClassifier(std::move(done.value()), std::move(in_progress.value()));
}

SyncStatus StatusClassifier::classify(std::string_view raw_status) const {
    return migrate::classify(raw_status, done_, in_progress_);
}

} // namespace cloudmove::migrate
