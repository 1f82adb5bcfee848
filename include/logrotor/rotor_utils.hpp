/**
 * @file rotor_utils.hpp
 * @brief Common POSIX helpers shared by the rotation engine
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <errno.h>
#include <unistd.h>

namespace logrotor
{

// Thread-safe error string helper
inline std::string get_error_string(int err)
{
    char errbuf[256];

#ifdef _GNU_SOURCE
    // GNU version returns char* which may or may not use the buffer
    const char *msg = strerror_r(err, errbuf, sizeof(errbuf));
    return std::string(msg);
#else
    // POSIX version returns int and always uses the buffer
    int ret = strerror_r(err, errbuf, sizeof(errbuf));
    if (ret != 0) { return "Unknown error " + std::to_string(err); }
    return std::string(errbuf);
#endif
}

namespace detail
{

/**
 * @brief RAII wrapper for file descriptors
 */
class file_descriptor
{
  public:
    explicit file_descriptor(int fd = -1) noexcept : fd_(fd) {}

    ~file_descriptor() { close(); }

    // Disable copy and move
    file_descriptor(const file_descriptor &)            = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept
    {
        int old = fd_;
        fd_     = -1;
        return old;
    }

    /**
     * @brief Close the descriptor, reporting the close() result
     * @return 0 on success (or if nothing was open), -1 with errno set otherwise
     */
    int close() noexcept
    {
        if (fd_ < 0) return 0;
        int ret = ::close(fd_);
        fd_     = -1;
        return ret;
    }

  private:
    int fd_;
};

/**
 * @brief Path that gets unlinked on scope exit unless committed
 *
 * Guards partially written copies and archives.
 */
class temp_file
{
  public:
    explicit temp_file(std::string path) : path_(std::move(path)) {}

    ~temp_file()
    {
        if (!committed_ && !path_.empty()) { ::unlink(path_.c_str()); }
    }

    temp_file(const temp_file &)            = delete;
    temp_file &operator=(const temp_file &) = delete;

    void commit() noexcept { committed_ = true; }

  private:
    std::string path_;
    bool committed_ = false;
};

/**
 * @brief Write all data to file descriptor, handling partial writes and EINTR
 */
inline bool write_all(int fd, const void *buf, size_t len)
{
    const auto *p = static_cast<const unsigned char *>(buf);
    while (len > 0)
    {
        ssize_t w = ::write(fd, p, len);
        if (w < 0)
        {
            if (errno == EINTR) continue;
            return false;
        }
        p += static_cast<size_t>(w);
        len -= static_cast<size_t>(w);
    }
    return true;
}

/**
 * @brief Escape regular expression metacharacters so @p text matches literally
 *
 * Used to embed a log file's base name (e.g. "svc.log") in the sibling patterns.
 */
inline std::string regex_escape(std::string_view text)
{
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";

    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text)
    {
        if (special.find(c) != std::string_view::npos) { out.push_back('\\'); }
        out.push_back(c);
    }
    return out;
}

} // namespace detail

} // namespace logrotor
