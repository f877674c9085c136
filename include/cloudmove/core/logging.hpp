#pragma once

#include "cloudmove/core/result.hpp"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>

namespace cloudmove::logging {

/// Record layout shared by every sink: [<timestamp>][<LEVEL>] <message>
inline constexpr const char* kRecordPattern = "[%Y-%m-%d %H:%M:%S][%*] %v";

/**
 * @brief Level tag written into each record
 *
 * debug is the POLL level; err and critical both render as ERROR.
 */
const char* level_tag(spdlog::level::level_enum level) noexcept;

/**
 * @brief Apply the migration record pattern to a logger
 */
void apply_record_format(spdlog::logger& logger);

/**
 * @brief Build the migration logger
 *
 * The file sink receives every record including POLL lines; the console
 * sink (when enabled) starts at INFO.
 */
Result<std::shared_ptr<spdlog::logger>> make_migration_logger(const std::filesystem::path& log_file,
                                                               bool console = true);

/// cloudmove_<YYYYMMDD_HHMMSS>.log in the current directory
std::filesystem::path default_log_file_name();

} // namespace cloudmove::logging
