/**
 * @file rotor_zip.hpp
 * @brief Single-entry zip archive writer using the miniz library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <miniz.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "rotor_types.hpp"
#include "rotor_utils.hpp"

namespace logrotor
{
namespace zip
{

/**
 * @brief RAII wrapper for a stdio stream handed to miniz
 */
class cfile
{
  public:
    cfile() = default;
    explicit cfile(FILE *fp) noexcept : fp_(fp) {}

    ~cfile() { close(); }

    cfile(const cfile &)            = delete;
    cfile &operator=(const cfile &) = delete;

    FILE *get() const noexcept { return fp_; }
    explicit operator bool() const noexcept { return fp_ != nullptr; }

    int close() noexcept
    {
        if (!fp_) return 0;
        int ret = std::fclose(fp_);
        fp_     = nullptr;
        return ret;
    }

  private:
    FILE *fp_ = nullptr;
};

/**
 * @brief RAII wrapper for a miniz zip writer
 */
class archive_writer
{
  public:
    archive_writer() { std::memset(&zip_, 0, sizeof(zip_)); }

    ~archive_writer()
    {
        if (initialized_) { mz_zip_writer_end(&zip_); }
    }

    // Disable copy and move for simplicity
    archive_writer(const archive_writer &)            = delete;
    archive_writer &operator=(const archive_writer &) = delete;
    archive_writer(archive_writer &&)                 = delete;
    archive_writer &operator=(archive_writer &&)      = delete;

    bool init(FILE *fp)
    {
        initialized_ = mz_zip_writer_init_cfile(&zip_, fp, 0);
        return initialized_;
    }

    bool add_file(const std::string &entry_name, const std::string &src, int level)
    {
        return mz_zip_writer_add_file(&zip_, entry_name.c_str(), src.c_str(), nullptr, 0, static_cast<mz_uint>(level));
    }

    bool finalize() { return mz_zip_writer_finalize_archive(&zip_); }

    bool end()
    {
        if (!initialized_) return true;
        initialized_ = false;
        return mz_zip_writer_end(&zip_);
    }

    std::string last_error() { return mz_zip_get_error_string(mz_zip_get_last_error(&zip_)); }

  private:
    mz_zip_archive zip_;
    bool initialized_ = false;
};

/**
 * @brief Compress @p src into a new zip archive holding exactly one entry
 *
 * The archive is created with mode 0600 (an existing file at @p dst is
 * overwritten and its mode reset). On failure the partial archive is removed
 * and @p src is left untouched.
 *
 * @param src Path to the file to compress
 * @param dst Path of the archive to write
 * @param entry_name Name of the single entry inside the archive
 * @param level Compression level (0-10, MZ_DEFAULT_LEVEL)
 * @param error Receives a description of the failure
 * @return true if the archive was fully written
 */
inline bool file_to_zip(const std::string &src,
                        const std::string &dst,
                        const std::string &entry_name,
                        int level,
                        std::string &error)
{
    struct stat st;
    if (::stat(src.c_str(), &st) != 0)
    {
        error = "stat " + src + ": " + get_error_string(errno);
        return false;
    }

    detail::temp_file guard(dst);

    detail::file_descriptor out_fd(::open(dst.c_str(),
                                          O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC
#ifdef O_NOFOLLOW
                                              | O_NOFOLLOW
#endif
                                          ,
                                          BACKUP_FILE_MODE));
    if (!out_fd)
    {
        error = "open " + dst + ": " + get_error_string(errno);
        return false;
    }
    if (::fchmod(out_fd.get(), BACKUP_FILE_MODE) != 0)
    {
        error = "chmod " + dst + ": " + get_error_string(errno);
        return false;
    }

    cfile out(::fdopen(out_fd.get(), "wb"));
    if (!out)
    {
        error = "fdopen " + dst + ": " + get_error_string(errno);
        return false;
    }
    out_fd.release(); // now owned by the stdio stream

    archive_writer writer;
    if (!writer.init(out.get()))
    {
        error = "zip init " + dst + ": " + writer.last_error();
        return false;
    }
    if (!writer.add_file(entry_name, src, level))
    {
        error = "zip add " + src + ": " + writer.last_error();
        return false;
    }
    if (!writer.finalize())
    {
        error = "zip finalize " + dst + ": " + writer.last_error();
        return false;
    }
    if (!writer.end())
    {
        error = "zip end " + dst + ": " + writer.last_error();
        return false;
    }
    if (out.close() != 0)
    {
        error = "close " + dst + ": " + get_error_string(errno);
        return false;
    }

    guard.commit();
    return true;
}

inline bool file_to_zip(const std::string &src, const std::string &dst, const std::string &entry_name, std::string &error)
{
    return file_to_zip(src, dst, entry_name, MZ_DEFAULT_LEVEL, error);
}

} // namespace zip
} // namespace logrotor
