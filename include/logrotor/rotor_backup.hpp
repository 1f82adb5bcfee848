/**
 * @file rotor_backup.hpp
 * @brief Compression of rolled-over copies into timestamped zip archives
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string>
#include <system_error>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "rotor_file_matcher.hpp"
#include "rotor_file_ops.hpp"
#include "rotor_reporter.hpp"
#include "rotor_retention.hpp"
#include "rotor_timestamp.hpp"
#include "rotor_types.hpp"
#include "rotor_zip.hpp"

namespace logrotor
{

/**
 * @brief Compress one rolled-over copy into a single-entry archive
 *
 * With @p replace_timestamp the numeric suffix is swapped for a fresh
 * timestamp ("svc.log.1" -> "svc.log.20060102150405000.zip"); otherwise ".zip"
 * is appended to the existing name. The archive entry is named after
 * @p file_path's base name. The source file is not removed.
 *
 * @param file_path Rolled-over copy, e.g. "/var/log/app/svc.log.1"
 * @param base_name Active file's base name, e.g. "svc.log"
 * @param replace_timestamp Whether to generate a new timestamp for the archive name
 * @param error Receives a description of the failure
 * @return Path of the written archive, or an empty string on failure
 */
inline std::string compress_file(const std::string &file_path,
                                 const std::string &base_name,
                                 bool replace_timestamp,
                                 std::string &error)
{
    std::string zip_file_path;
    if (replace_timestamp)
    {
        zip_file_path = fmt::format("{}/{}.{}.{}", parent_directory(file_path), base_name, current_timestamp(), BACKUP_EXTENSION);
    }
    else { zip_file_path = fmt::format("{}.{}", file_path, BACKUP_EXTENSION); }

    if (!zip::file_to_zip(file_path, zip_file_path, base_file_name(file_path), error)) return {};
    return zip_file_path;
}

/**
 * @brief Compress every rolled-over copy of @p path and prune old archives
 *
 * Siblings whose suffix already is a 17-digit timestamp keep it; short numeric
 * suffixes (from other rotation tools) get a fresh one. A sibling is deleted
 * only after its archive was written completely. Finally the archives of this
 * file are pruned down to @p max_backup_count.
 *
 * @param path Active log file
 * @param max_backup_count Archives to keep; zero or negative disables backup entirely
 * @param reporter Receives I/O failures; nothing is thrown
 */
inline backup_result do_backup(const std::string &path, int max_backup_count, error_reporter &reporter)
{
    backup_result result;
    if (max_backup_count <= 0) return result;

    std::string directory = parent_directory(path);
    std::string base_name = base_file_name(path);

    std::error_code ec;
    auto rotate_file_list = filter_file_list(directory, rotated_file_pattern(base_name, rotate_stage::rollover), list_mode::flat, ec);
    if (ec)
    {
        reporter.error(fmt::format("list path: {} failed: {}", directory, ec.message()));
        return result;
    }

    for (const auto &file : rotate_file_list)
    {
        // Matched "^base\.[0-9]{1,17}$", so everything past "base." is the numeric suffix
        std::string suffix = base_file_name(file).substr(base_name.size() + 1);

        std::string error;
        std::string archive = compress_file(file, base_name, !is_canonical_timestamp(suffix), error);
        if (archive.empty())
        {
            reporter.error(fmt::format("compress path: {} failed: {}", file, error));
            ++result.failed;
            continue;
        }

        if (!remove_file(file, ec) && ec)
        {
            reporter.error(fmt::format("remove path: {} failed: {}", file, ec.message()));
        }
        ++result.compressed;
    }

    remove_exceeded_files(directory, base_name, max_backup_count, rotate_stage::backup, reporter);
    return result;
}

} // namespace logrotor
