#include "cloudmove/core/logging.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cloudmove::logging::level_tag;
using cloudmove::logging::make_migration_logger;
using cloudmove::test_support::create_temp_dir;
using cloudmove::test_support::read_file;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST(LoggingTest, LevelTags) {
    EXPECT_STREQ(level_tag(spdlog::level::info), "INFO");
    EXPECT_STREQ(level_tag(spdlog::level::warn), "WARN");
    EXPECT_STREQ(level_tag(spdlog::level::err), "ERROR");
    EXPECT_STREQ(level_tag(spdlog::level::critical), "ERROR");
    EXPECT_STREQ(level_tag(spdlog::level::debug), "POLL");
}

TEST(LoggingTest, FileRecordsUseBracketedTimestampAndLevel) {
    const auto dir = create_temp_dir("cloudmove_logging_test");
    const fs::path log_file = dir / "run.log";

    auto logger = make_migration_logger(log_file, false);
    ASSERT_TRUE(logger.is_ok()) << logger.error().message;

    logger.value()->info("Copied {} bytes", 12);
    logger.value()->warn("Timed out");
    logger.value()->error("Copy failed");
    logger.value()->debug("status='Syncing' stable=0/2");
    logger.value()->flush();

    const auto lines = lines_of(read_file(log_file));
    ASSERT_EQ(lines.size(), 4u);

    const std::regex record(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\]\[(INFO|WARN|ERROR|POLL)\] .+$)");
    for (const auto& line : lines) {
        EXPECT_TRUE(std::regex_match(line, record)) << line;
    }
    EXPECT_NE(lines[0].find("][INFO] Copied 12 bytes"), std::string::npos);
    EXPECT_NE(lines[1].find("][WARN] Timed out"), std::string::npos);
    EXPECT_NE(lines[2].find("][ERROR] Copy failed"), std::string::npos);
    EXPECT_NE(lines[3].find("][POLL] status='Syncing'"), std::string::npos);

    fs::remove_all(dir);
}

TEST(LoggingTest, UnwritableLogFileIsReported) {
    const auto dir = create_temp_dir("cloudmove_logging_test");
    // A directory where the log file should be
    const fs::path log_file = dir / "taken";
    fs::create_directories(log_file);

    auto logger = make_migration_logger(log_file, false);
    ASSERT_TRUE(logger.is_error());
    EXPECT_EQ(logger.error().code, cloudmove::ErrorCode::Io);

    fs::remove_all(dir);
}

TEST(LoggingTest, DefaultLogFileNameIsTimestamped) {
    const auto name = cloudmove::logging::default_log_file_name().filename().string();
    EXPECT_TRUE(std::regex_match(name, std::regex(R"(cloudmove_\d{8}_\d{6}\.log)"))) << name;
}
