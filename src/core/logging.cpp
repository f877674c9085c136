#include "cloudmove/core/logging.hpp"

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace cloudmove::logging {
namespace {

class LevelTagFormatter final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const char* tag = level_tag(msg.level);
        dest.append(tag, tag + std::strlen(tag));
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return spdlog::details::make_unique<LevelTagFormatter>();
    }
};

std::unique_ptr<spdlog::formatter> make_record_formatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelTagFormatter>('*').set_pattern(kRecordPattern);
    return formatter;
}

} // namespace

const char* level_tag(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace: return "TRACE";
        case spdlog::level::debug: return "POLL";
        case spdlog::level::info: return "INFO";
        case spdlog::level::warn: return "WARN";
        case spdlog::level::err:
        case spdlog::level::critical: return "ERROR";
        default: return "INFO";
    }
}

void apply_record_format(spdlog::logger& logger) {
    logger.set_formatter(make_record_formatter());
}

Result<std::shared_ptr<spdlog::logger>> make_migration_logger(const std::filesystem::path& log_file,
                                                               bool console) {
    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (log_file.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(log_file.parent_path(), ec);
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(std::move(file_sink));
    } catch (const spdlog::spdlog_ex& e) {
        return Err<std::shared_ptr<spdlog::logger>>(ErrorCode::Io,
            "Cannot open log file " + log_file.string() + ": " + e.what());
    }

    if (console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        sinks.push_back(std::move(console_sink));
    }

    auto logger = std::make_shared<spdlog::logger>("cloudmove", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::warn);
    apply_record_format(*logger);
    return Ok(std::move(logger));
}

std::filesystem::path default_log_file_name() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream name;
    name << "cloudmove_" << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";
    return std::filesystem::current_path() / name.str();
}

} // namespace cloudmove::logging
