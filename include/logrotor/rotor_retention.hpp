/**
 * @file rotor_retention.hpp
 * @brief Count-based retention of rotated and compressed files
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "rotor_file_matcher.hpp"
#include "rotor_file_ops.hpp"
#include "rotor_reporter.hpp"
#include "rotor_types.hpp"

namespace logrotor
{

/**
 * @brief Delete the oldest rotated files of @p base_name until at most @p max_kept_count remain
 *
 * Files are ordered by name. With the fixed-width timestamp suffix this is
 * chronological order; short numeric suffixes only order correctly within the
 * same digit count ("svc.log.10" sorts before "svc.log.9").
 *
 * The listing is taken fresh on every call. A failed deletion aborts the pass:
 * it usually means a persistent problem such as missing permissions.
 *
 * @param directory Directory holding the rotated files
 * @param base_name Active log file name without directory, e.g. "svc.log"
 * @param max_kept_count Files to keep; negative keeps everything
 * @param stage rotate_stage::rollover or rotate_stage::backup; none is a no-op
 * @param reporter Receives listing and deletion failures
 */
inline prune_result remove_exceeded_files(const std::string &directory,
                                          const std::string &base_name,
                                          int max_kept_count,
                                          rotate_stage stage,
                                          error_reporter &reporter)
{
    prune_result result;
    if (max_kept_count < 0) return result;

    std::string pattern = rotated_file_pattern(base_name, stage);
    if (pattern.empty()) return result;

    std::error_code ec;
    auto file_list = filter_file_list(directory, pattern, list_mode::flat, ec);
    if (ec)
    {
        reporter.error(fmt::format("list path: {} failed: {}", directory, ec.message()));
        return result;
    }

    std::sort(file_list.begin(), file_list.end());

    auto remaining = file_list.size();
    auto limit     = static_cast<size_t>(max_kept_count);
    for (auto it = file_list.begin(); it != file_list.end() && remaining > limit; ++it, --remaining)
    {
        bool removed = remove_file(*it, ec);
        if (ec)
        {
            reporter.error(fmt::format("remove file path: {} failed: {}", *it, ec.message()));
            result.aborted = true;
            break;
        }
        if (removed) { ++result.removed; }
    }

    return result;
}

inline prune_result remove_exceeded_files(const std::string &directory,
                                          const std::string &base_name,
                                          int max_kept_count,
                                          const std::string &stage,
                                          error_reporter &reporter)
{
    return remove_exceeded_files(directory, base_name, max_kept_count, rotate_stage_from_string(stage), reporter);
}

} // namespace logrotor
