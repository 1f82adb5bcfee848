/**
 * @file rotor_timestamp.hpp
 * @brief Canonical timestamp used in rotated file names
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The timestamp is YYYY.MM.DD.hh.mm.ss.mmm in local time with the dots removed,
 * i.e. always 17 decimal digits. Fixed width makes lexicographic order of rotated
 * file names equal to chronological order. Two rotations inside the same
 * millisecond produce the same timestamp; this is not corrected.
 */
#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "rotor_types.hpp"

namespace logrotor
{

/**
 * @brief Format a point in time as a 17-digit rotation timestamp
 * @param tp Point in time, rendered in the local time zone
 * @return e.g. "20060102150405000"
 */
inline std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_local;
    localtime_r(&time_t, &tm_local);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    return fmt::format("{:04}{:02}{:02}{:02}{:02}{:02}{:03}",
                       tm_local.tm_year + 1900,
                       tm_local.tm_mon + 1,
                       tm_local.tm_mday,
                       tm_local.tm_hour,
                       tm_local.tm_min,
                       tm_local.tm_sec,
                       ms);
}

inline std::string current_timestamp() { return format_timestamp(std::chrono::system_clock::now()); }

/**
 * @brief Check whether @p suffix is a canonical rotation timestamp
 */
inline bool is_canonical_timestamp(std::string_view suffix)
{
    if (suffix.size() != TIMESTAMP_DIGITS) return false;
    for (char c : suffix)
    {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace logrotor
