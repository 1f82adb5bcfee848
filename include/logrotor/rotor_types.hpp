/**
 * @file rotor_types.hpp
 * @brief Core type definitions and constants for the rotation engine
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace logrotor
{

// Rotated file naming
inline constexpr size_t TIMESTAMP_DIGITS         = 17;    // YYYYMMDDhhmmssmmm
inline constexpr size_t MAX_ROLLOVER_SUFFIX      = 17;    // svc.log.1 .. svc.log.20060102150405000
inline constexpr const char *BACKUP_EXTENSION    = "zip"; // svc.log.20060102150405000.zip
inline constexpr const char *LOG_FILE_PATTERN    = R"(^.+\.(log|trace|out)$)";

// File modes
inline constexpr unsigned ROLLOVER_FILE_MODE = 0640; // raw copies and the truncated active file
inline constexpr unsigned BACKUP_FILE_MODE   = 0600; // compressed archives are owner-only

// Configuration defaults
inline constexpr int DEFAULT_ROTATE_SIZE_MB   = 10;
inline constexpr int DEFAULT_BACKUP_COUNT     = 50;
inline constexpr int DEFAULT_ROTATE_DATE_DAYS = 1;
inline constexpr auto SIZE_CHECK_CYCLE        = std::chrono::seconds(30);
inline constexpr auto DATE_CHECK_CYCLE        = std::chrono::seconds(std::chrono::hours(24));

// I/O
inline constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
inline constexpr int64_t BYTES_PER_MB    = 1024 * 1024;

/**
 * @brief Severity of messages sent to an error_reporter
 */
enum class log_level : int8_t
{
    nolog = -1, ///< No logging
    info  = 0,  ///< General information
    error = 1,  ///< Error messages
};

// Log level names for formatting
inline const char *log_level_names[] = {"INFO ", "ERROR"};

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or log_level::nolog if invalid
 *
 * Recognized values: "info", "error", "nolog", "off", "none"
 */
inline log_level log_level_from_string(const char *str)
{
    if (!str) return log_level::nolog;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "info") return log_level::info;
    if (lower == "error") return log_level::error;

    return log_level::nolog;
}

/**
 * @brief Which family of rotated files a retention pass works on
 */
enum class rotate_stage
{
    none,     ///< Unknown stage, retention is a no-op
    rollover, ///< Raw copies: base.N .. base.YYYYMMDDhhmmssmmm
    backup    ///< Archives: base.YYYYMMDDhhmmssmmm.zip
};

inline rotate_stage rotate_stage_from_string(const std::string &str)
{
    if (str == "rollover") return rotate_stage::rollover;
    if (str == "backup") return rotate_stage::backup;
    return rotate_stage::none;
}

/**
 * @brief Directory walk depth for file listings
 *
 * Sibling listings (backup, retention) are always flat. Only the directory
 * sweep of the scheduler can be switched to recursive.
 */
enum class list_mode
{
    flat,     ///< Only entries directly inside the directory
    recursive ///< Descend into subdirectories
};

/**
 * @brief Rollover trigger mode
 */
enum class rolling_policy
{
    size, ///< Roll over when the file exceeds a size threshold
    daily ///< Roll over every check cycle (multiple of 24h)
};

/**
 * @brief Outcome of a single rollover attempt
 */
enum class rollover_result
{
    disabled,   ///< Negative size threshold
    not_needed, ///< Below threshold or file could not be inspected
    rotated,    ///< Copied aside and truncated
    failed      ///< Copy or truncate failed (reported)
};

/**
 * @brief Outcome of a backup (compression) pass
 */
struct backup_result
{
    size_t compressed = 0; ///< Archives written and sources removed
    size_t failed     = 0; ///< Siblings left uncompressed
};

/**
 * @brief Outcome of a retention pass
 */
struct prune_result
{
    size_t removed = 0;   ///< Files deleted in this pass
    bool aborted   = false; ///< A deletion failed and the pass stopped early
};

} // namespace logrotor
