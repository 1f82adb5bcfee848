#pragma once
/**
 * @file rotor_scheduler_impl.hpp
 * @brief Implementation of the rotation pass, rotation tasks and the scheduler registry
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <cstdio>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "rotor_backup.hpp"
#include "rotor_file_matcher.hpp"
#include "rotor_rollover.hpp"
#include "rotor_scheduler.hpp"

namespace logrotor
{

inline void log_rotate_file(const std::string &file, int max_size_mb, int max_backup_count, error_reporter &reporter)
{
    try
    {
        do_rollover(file, max_size_mb, max_backup_count, reporter);
        do_backup(file, max_backup_count, reporter);
    }
    catch (const std::exception &e)
    {
        reporter.error(fmt::format("LogRotate file path: {} catch an exception: {}", file, e.what()));
    }
    catch (...)
    {
        reporter.error(fmt::format("LogRotate file path: {} catch an unknown exception", file));
    }
}

inline void log_rotate(const std::string &directory,
                       int max_size_mb,
                       int max_backup_count,
                       error_reporter &reporter,
                       list_mode mode)
{
    try
    {
        std::error_code ec;
        auto file_list = filter_file_list(directory, LOG_FILE_PATTERN, mode, ec);
        if (ec)
        {
            reporter.error(fmt::format("list path: {} failed: {}", directory, ec.message()));
            return;
        }

        for (const auto &file : file_list) { log_rotate_file(file, max_size_mb, max_backup_count, reporter); }
    }
    catch (const std::exception &e)
    {
        reporter.error(fmt::format("LogRotate catch an exception, {}", e.what()));
    }
    catch (...)
    {
        reporter.error("LogRotate catch an unknown exception");
    }
}

inline std::string directory_key(const std::string &directory)
{
    std::string key = std::filesystem::path(directory).lexically_normal().string();
    while (key.size() > 1 && key.back() == '/') { key.pop_back(); }
    return key.empty() ? std::string(".") : key;
}

// rotation_task implementation
inline rotation_task::rotation_task(rotate_config config, error_reporter &reporter)
    : config_(std::move(config)), reporter_(reporter)
{
}

inline rotation_task::~rotation_task() { stop(); }

inline void rotation_task::start()
{
    bool expected = false;
    if (running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        thread_ = std::thread(&rotation_task::run, this);
    }
}

inline void rotation_task::tick()
{
    if (running()) { queue_.enqueue(command::tick); }
}

inline void rotation_task::stop()
{
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) { queue_.enqueue(command::stop); }

    if (thread_.joinable()) { thread_.join(); }
}

inline void rotation_task::run_pass() noexcept
{
    try
    {
        log_rotate(config_.log_file_dir, config_.rollover_threshold_mb(), config_.backup_count, reporter_, config_.sweep_mode);
    }
    catch (const std::exception &e)
    {
        // Only reachable when the reporter itself throws
        report_failure(e.what());
    }
    catch (...)
    {
        report_failure("unknown exception");
    }
    passes_.fetch_add(1, std::memory_order_acq_rel);
}

inline void rotation_task::report_failure(const char *what) noexcept
{
    try
    {
        reporter_.error(fmt::format("LogRotate task {} catch an exception: {}", config_.log_file_dir, what));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "logrotor: reporter failed (%s) while reporting: %s\n", e.what(), what);
    }
    catch (...)
    {
        std::fprintf(stderr, "logrotor: reporter failed while reporting: %s\n", what);
    }
}

inline void rotation_task::run()
{
    try
    {
        reporter_.info("start log rotate task");
    }
    catch (const std::exception &e)
    {
        report_failure(e.what());
    }
    catch (...)
    {
        report_failure("unknown exception");
    }

    for (;;)
    {
        run_pass();

        // Timeout means the check cycle elapsed; a tick just shortens it
        command cmd;
        if (queue_.wait_dequeue_timed(cmd, config_.check_cycle) && cmd == command::stop) { break; }
    }
}

// scheduler_registry implementation
inline scheduler_registry::~scheduler_registry() { stop_all(); }

inline void scheduler_registry::rotate(const rotate_config &config)
{
    std::string key = directory_key(config.log_file_dir);

    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.find(key) != tasks_.end()) { return; }

    auto task = std::make_unique<rotation_task>(config, reporter_);
    task->start();
    tasks_.emplace(std::move(key), std::move(task));
}

inline bool scheduler_registry::contains(const std::string &directory) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.find(directory_key(directory)) != tasks_.end();
}

inline size_t scheduler_registry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

inline bool scheduler_registry::tick(const std::string &directory)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(directory_key(directory));
    if (it == tasks_.end()) { return false; }
    it->second->tick();
    return true;
}

inline const rotation_task *scheduler_registry::find(const std::string &directory) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(directory_key(directory));
    return it == tasks_.end() ? nullptr : it->second.get();
}

inline void scheduler_registry::stop_all()
{
    // Entries are never erased, so the pointers stay valid after unlocking.
    // Joining happens without the lock so registration is not blocked by a running pass.
    std::vector<rotation_task *> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.reserve(tasks_.size());
        for (auto &entry : tasks_) { tasks.push_back(entry.second.get()); }
    }

    for (auto *task : tasks) { task->stop(); }
}

} // namespace logrotor
