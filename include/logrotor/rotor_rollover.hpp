/**
 * @file rotor_rollover.hpp
 * @brief Copy-then-truncate rollover of a single active log file
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The active file is never renamed. Its content is copied to
 * "<path>.<timestamp>" and the file is truncated in place so a writer holding
 * it open with O_APPEND keeps going into the now empty file. Anything written
 * between the copy and the truncate is lost.
 */
#pragma once

#include <cstdint>
#include <string>
#include <sys/stat.h>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "rotor_file_ops.hpp"
#include "rotor_reporter.hpp"
#include "rotor_retention.hpp"
#include "rotor_timestamp.hpp"
#include "rotor_types.hpp"
#include "rotor_utils.hpp"

namespace logrotor
{

/**
 * @brief Check whether @p path is larger than @p max_size_mb megabytes
 *
 * A negative threshold disables rollover. A threshold of 0 rolls any non-empty
 * file, which is how date based policies roll once per check cycle.
 * A file that cannot be stat'ed is reported and never rolled.
 */
inline bool should_rollover(const std::string &path, int max_size_mb, error_reporter &reporter)
{
    if (max_size_mb < 0) return false;

    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
    {
        reporter.error(fmt::format("stat path: {} failed: {}", path, get_error_string(errno)));
        return false;
    }

    return static_cast<int64_t>(st.st_size) > static_cast<int64_t>(max_size_mb) * BYTES_PER_MB;
}

/**
 * @brief Roll @p path over if it exceeds its size threshold
 *
 * On success the raw copies of this file are pruned down to @p max_backup_count.
 *
 * @param path Active log file
 * @param max_size_mb Size threshold in megabytes (negative disables)
 * @param max_backup_count Raw copies to keep (negative keeps all)
 * @param reporter Receives I/O failures; nothing is thrown
 */
inline rollover_result do_rollover(const std::string &path, int max_size_mb, int max_backup_count, error_reporter &reporter)
{
    if (max_size_mb < 0) return rollover_result::disabled;
    if (!should_rollover(path, max_size_mb, reporter)) return rollover_result::not_needed;

    std::string rotate_file = path + "." + current_timestamp();

    std::string error;
    if (!copy_file(path, rotate_file, error))
    {
        reporter.error(fmt::format("copy path: {} failed: {}", path, error));
        return rollover_result::failed;
    }

    if (!truncate_file(path, error))
    {
        reporter.error(fmt::format("truncate path: {} failed: {}", path, error));
        return rollover_result::failed;
    }

    remove_exceeded_files(parent_directory(path), base_file_name(path), max_backup_count, rotate_stage::rollover, reporter);
    return rollover_result::rotated;
}

} // namespace logrotor
