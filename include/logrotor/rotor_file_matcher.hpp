/**
 * @file rotor_file_matcher.hpp
 * @brief Directory listing filtered by a regular expression on the base name
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

#include "rotor_types.hpp"
#include "rotor_utils.hpp"

namespace logrotor
{

namespace detail
{

// Returns false and sets ec when the entry could not be inspected for a reason
// other than having disappeared. Symlinks are not followed, so a dangling or
// looping link is just a non-directory entry filtered by name.
inline bool match_entry(const std::filesystem::directory_entry &entry,
                        const std::regex *re,
                        std::vector<std::string> &file_list,
                        std::error_code &ec)
{
    namespace fs = std::filesystem;

    std::error_code st_ec;
    auto status = entry.symlink_status(st_ec);
    if (st_ec)
    {
        // Removed between readdir and lstat (e.g. pruned by a concurrent pass)
        if (st_ec == std::errc::no_such_file_or_directory) return true;
        ec = st_ec;
        return false;
    }

    if (!fs::is_regular_file(status) && !fs::is_symlink(status)) return true;

    if (re)
    {
        std::string name = entry.path().filename().string();
        if (!std::regex_search(name, *re)) return true;
    }

    file_list.push_back(entry.path().string());
    return true;
}

template <typename Iterator>
inline void walk(Iterator it, const std::regex *re, std::vector<std::string> &file_list, std::error_code &ec)
{
    for (; !ec && it != Iterator(); it.increment(ec))
    {
        if (!match_entry(*it, re, file_list, ec)) return;
    }
}

} // namespace detail

/**
 * @brief List regular files and symlinks under @p directory whose base name matches @p pattern
 *
 * The pattern is applied with std::regex_search against the file name only, so
 * callers anchor it themselves ("^svc\.log\.[0-9]{1,17}$"). An empty pattern
 * matches every entry. Directories are never returned and symlinks are not
 * resolved, so a broken link cannot fail the listing. A recursive walk does not
 * descend into linked directories and skips subdirectories it cannot read.
 *
 * @param directory Directory to walk
 * @param pattern ECMAScript regular expression
 * @param mode flat (default) or recursive walk
 * @param ec Set when the directory cannot be walked or the pattern is invalid
 * @return Matching paths in directory order; empty on error or when nothing matches
 */
inline std::vector<std::string> filter_file_list(const std::string &directory,
                                                 const std::string &pattern,
                                                 list_mode mode,
                                                 std::error_code &ec)
{
    namespace fs = std::filesystem;
    ec.clear();

    std::regex re;
    if (!pattern.empty())
    {
        try
        {
            re = std::regex(pattern, std::regex::ECMAScript);
        }
        catch (const std::regex_error &)
        {
            ec = std::make_error_code(std::errc::invalid_argument);
            return {};
        }
    }
    const std::regex *re_ptr = pattern.empty() ? nullptr : &re;

    std::vector<std::string> file_list;
    file_list.reserve(10);

    if (mode == list_mode::recursive)
    {
        // Unreadable subdirectories are skipped instead of ending the walk
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (!ec) { detail::walk(std::move(it), re_ptr, file_list, ec); }
    }
    else
    {
        fs::directory_iterator it(directory, fs::directory_options::none, ec);
        if (!ec) { detail::walk(std::move(it), re_ptr, file_list, ec); }
    }

    if (ec) return {};
    return file_list;
}

inline std::vector<std::string> filter_file_list(const std::string &directory, const std::string &pattern, std::error_code &ec)
{
    return filter_file_list(directory, pattern, list_mode::flat, ec);
}

/**
 * @brief Pattern matching the rotated siblings of @p base_name for a retention stage
 * @return Anchored pattern, or an empty string for rotate_stage::none
 */
inline std::string rotated_file_pattern(const std::string &base_name, rotate_stage stage)
{
    switch (stage)
    {
    case rotate_stage::rollover:
        // svc.log.1 .. svc.log.20060102150405000
        return fmt::format(R"(^{}\.[0-9]{{1,{}}}$)", detail::regex_escape(base_name), MAX_ROLLOVER_SUFFIX);
    case rotate_stage::backup:
        // svc.log.20060102150405000.zip
        return fmt::format(R"(^{}\.[0-9]{{{}}}\.{}$)", detail::regex_escape(base_name), TIMESTAMP_DIGITS, BACKUP_EXTENSION);
    default: return {};
    }
}

} // namespace logrotor
