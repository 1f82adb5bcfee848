/**
 * @file rotor_scheduler.hpp
 * @brief Periodic per-directory rotation tasks and their registry
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A rotation pass sweeps one directory for active log files
 * (*.log, *.trace, *.out) and runs rollover followed by backup on each.
 * A rotation_task repeats the pass on its own thread every check cycle;
 * scheduler_registry guarantees at most one task per directory.
 *
 * Every failure is reported through the injected error_reporter and contained
 * at the per-file or per-pass level. Nothing propagates to the caller.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <moodycamel/blockingconcurrentqueue.h>

#include "rotor_config.hpp"
#include "rotor_reporter.hpp"
#include "rotor_types.hpp"

namespace logrotor
{

/**
 * @brief Rollover then backup a single active log file, containing any exception
 */
inline void log_rotate_file(const std::string &file, int max_size_mb, int max_backup_count, error_reporter &reporter);

/**
 * @brief Run one synchronous rotation pass over all log files in @p directory
 *
 * Usable for manual or administrative invocation without a scheduler.
 *
 * @param directory Directory to sweep
 * @param max_size_mb Rollover threshold in MB (negative disables rollover)
 * @param max_backup_count Copies / archives to keep (negative keeps all, <= 0 disables backup)
 * @param reporter Receives every failure
 * @param mode Whether to descend into subdirectories
 */
inline void log_rotate(const std::string &directory,
                       int max_size_mb,
                       int max_backup_count,
                       error_reporter &reporter,
                       list_mode mode = list_mode::flat);

/**
 * @brief Registry key for a directory: lexically normalized, no trailing separator
 */
inline std::string directory_key(const std::string &directory);

/**
 * @brief Background task repeating the rotation pass for one directory
 *
 * The task waits on a command queue with the check cycle as timeout, so it can
 * be ticked (run a pass now) or stopped without waiting for the cycle to elapse.
 */
class rotation_task
{
  public:
    rotation_task(rotate_config config, error_reporter &reporter);
    ~rotation_task();

    rotation_task(const rotation_task &)            = delete;
    rotation_task &operator=(const rotation_task &) = delete;

    /**
     * @brief Start the background thread; the first pass runs immediately
     */
    void start();

    /**
     * @brief Run the next pass now instead of at the end of the current cycle
     */
    void tick();

    /**
     * @brief Stop the loop and join the thread; a pass in progress runs to completion
     */
    void stop();

    bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Number of completed passes
    uint64_t passes() const noexcept { return passes_.load(std::memory_order_acquire); }

    const rotate_config &config() const noexcept { return config_; }

  private:
    enum class command
    {
        tick,
        stop
    };

    void run();
    void run_pass() noexcept;
    void report_failure(const char *what) noexcept;

    rotate_config config_;
    error_reporter &reporter_;
    moodycamel::BlockingConcurrentQueue<command> queue_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> passes_{0};
};

/**
 * @brief Process-wide set of rotation tasks, at most one per directory
 *
 * Construct once at process start and pass by reference to whoever registers
 * rotation. Entries are never removed; tasks run until stop_all() or
 * destruction of the registry.
 */
class scheduler_registry
{
  public:
    explicit scheduler_registry(error_reporter &reporter) : reporter_(reporter) {}
    ~scheduler_registry();

    scheduler_registry(const scheduler_registry &)            = delete;
    scheduler_registry &operator=(const scheduler_registry &) = delete;

    /**
     * @brief Register and start a rotation task for config.log_file_dir
     *
     * A second call for a directory that already has a task is a silent no-op.
     */
    void rotate(const rotate_config &config);

    bool contains(const std::string &directory) const;
    size_t size() const;

    /**
     * @brief Ask the task for @p directory to run a pass now
     * @return false if no task is registered for the directory
     */
    bool tick(const std::string &directory);

    /**
     * @brief Task registered for @p directory, or nullptr
     */
    const rotation_task *find(const std::string &directory) const;

    /**
     * @brief Stop and join every task
     */
    void stop_all();

  private:
    error_reporter &reporter_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<rotation_task>> tasks_;
};

} // namespace logrotor
