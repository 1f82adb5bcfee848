/**
 * @file rotor_reporter.hpp
 * @brief Error reporter capability used by the rotation engine
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Every failure inside the engine ends up here as a human-readable string.
 * Nothing structured crosses this boundary.
 */
#pragma once

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "rotor_types.hpp"
#include "rotor_utils.hpp"

namespace logrotor
{

/**
 * @brief Sink for informational and error messages produced while rotating
 *
 * Implementations must be safe to call from several scheduler threads.
 */
class error_reporter
{
  public:
    virtual ~error_reporter() = default;

    virtual void info(std::string_view msg)  = 0;
    virtual void error(std::string_view msg) = 0;
};

/**
 * @brief Reporter that drops everything
 */
class discard_reporter final : public error_reporter
{
  public:
    void info(std::string_view) override {}
    void error(std::string_view) override {}
};

/**
 * @brief Reporter writing one header-prefixed line per message to a file descriptor
 *
 * Line format: "TTTTTTTT.mmm [LEVEL] [thread] module     message"
 * where TTTTTTTT.mmm is milliseconds (with microseconds) since the reporter was created.
 */
class fd_reporter final : public error_reporter
{
  public:
    explicit fd_reporter(int fd = STDERR_FILENO, log_level min_level = log_level::info, std::string module = "logrotor")
        : fd_(fd), close_fd_(false), min_level_(min_level), module_(std::move(module)),
          start_time_(std::chrono::steady_clock::now())
    {
    }

    /**
     * @brief Append reports to a file
     * @throws std::runtime_error if the file cannot be opened
     */
    fd_reporter(const std::string &filename, log_level min_level, std::string module = "logrotor")
        : fd_(-1), close_fd_(true), min_level_(min_level), module_(std::move(module)),
          start_time_(std::chrono::steady_clock::now())
    {
        fd_ = ::open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0)
        {
            throw std::runtime_error("Failed to open report file: " + filename + " - " + get_error_string(errno));
        }
    }

    ~fd_reporter() override
    {
        if (close_fd_ && fd_ >= 0) { ::close(fd_); }
    }

    fd_reporter(const fd_reporter &)            = delete;
    fd_reporter &operator=(const fd_reporter &) = delete;

    void info(std::string_view msg) override { write_line(log_level::info, msg); }
    void error(std::string_view msg) override { write_line(log_level::error, msg); }

    log_level min_level() const noexcept { return min_level_; }

  private:
    void write_line(log_level level, std::string_view msg)
    {
        if (min_level_ == log_level::nolog || level < min_level_) return;

        int64_t diff_us =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_time_).count();
        int64_t ms = diff_us / 1000;
        int64_t us = std::abs(diff_us % 1000);

        size_t thread_hash = std::hash<std::thread::id>{}(std::this_thread::get_id());

        std::string line = fmt::format("{:08}.{:03} [{:<5}] [{:08x}] {:<10} {}\n",
                                       ms,
                                       us,
                                       log_level_names[static_cast<int>(level)],
                                       static_cast<uint32_t>(thread_hash & 0xFFFFFFFF),
                                       module_,
                                       msg);

        // One write per line keeps lines from different scheduler threads whole
        std::lock_guard<std::mutex> lock(mutex_);
        if (!detail::write_all(fd_, line.data(), line.size())) { perror("Failed to write rotation report"); }
    }

    int fd_;
    bool close_fd_;
    log_level min_level_;
    std::string module_;
    std::chrono::steady_clock::time_point start_time_;
    std::mutex mutex_;
};

} // namespace logrotor
