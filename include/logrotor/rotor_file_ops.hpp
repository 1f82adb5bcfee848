/**
 * @file rotor_file_ops.hpp
 * @brief Copy, truncate and remove primitives with OS error reporting
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "rotor_types.hpp"
#include "rotor_utils.hpp"

namespace logrotor
{

/**
 * @brief Directory containing @p path ("." for a bare file name)
 */
inline std::string parent_directory(const std::string &path)
{
    auto dir = std::filesystem::path(path).parent_path();
    return dir.empty() ? std::string(".") : dir.string();
}

/**
 * @brief File name of @p path without its directory
 */
inline std::string base_file_name(const std::string &path) { return std::filesystem::path(path).filename().string(); }

/**
 * @brief Copy @p src to @p dst byte for byte
 *
 * The source is only read, never renamed, so a process holding it open keeps
 * writing to the same inode. @p dst is created (or truncated) with mode 0640 and
 * removed again if the copy does not complete.
 *
 * @param error Receives a description of the failure
 * @return true on success
 */
inline bool copy_file(const std::string &src, const std::string &dst, std::string &error)
{
    detail::file_descriptor in_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in_fd)
    {
        error = "open " + src + ": " + get_error_string(errno);
        return false;
    }

    detail::temp_file guard(dst);
    detail::file_descriptor out_fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, ROLLOVER_FILE_MODE));
    if (!out_fd)
    {
        error = "open " + dst + ": " + get_error_string(errno);
        return false;
    }

    std::vector<unsigned char> buf(COPY_BUFFER_SIZE);
    for (;;)
    {
        ssize_t r = ::read(in_fd.get(), buf.data(), buf.size());
        if (r < 0)
        {
            if (errno == EINTR) continue;
            error = "read " + src + ": " + get_error_string(errno);
            return false;
        }
        if (r == 0) break;

        if (!detail::write_all(out_fd.get(), buf.data(), static_cast<size_t>(r)))
        {
            error = "write " + dst + ": " + get_error_string(errno);
            return false;
        }
    }

    if (out_fd.close() != 0)
    {
        error = "close " + dst + ": " + get_error_string(errno);
        return false;
    }

    guard.commit();
    return true;
}

/**
 * @brief Truncate @p path to zero length in place (creating it if missing)
 *
 * Opening with O_TRUNC keeps the inode, so writers appending through an
 * O_APPEND descriptor continue at offset 0.
 */
inline bool truncate_file(const std::string &path, std::string &error)
{
    detail::file_descriptor fd(::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, ROLLOVER_FILE_MODE));
    if (!fd)
    {
        error = "truncate " + path + ": " + get_error_string(errno);
        return false;
    }
    if (fd.close() != 0)
    {
        error = "close " + path + ": " + get_error_string(errno);
        return false;
    }
    return true;
}

/**
 * @brief Remove a regular file; directories are left alone
 * @param ec Set when the path cannot be inspected or removed
 * @return true if a file was removed
 */
inline bool remove_file(const std::string &path, std::error_code &ec)
{
    namespace fs = std::filesystem;
    ec.clear();

    auto status = fs::symlink_status(path, ec);
    if (status.type() == fs::file_type::not_found)
    {
        // Already gone, e.g. pruned by a concurrent pass
        ec.clear();
        return false;
    }
    if (ec) return false;
    if (fs::is_directory(status)) return false;

    return fs::remove(path, ec);
}

} // namespace logrotor
