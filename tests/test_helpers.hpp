/**
 * @file test_helpers.hpp
 * @brief Shared fixture and helpers for the rotation test suites
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <miniz.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <regex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

#include "logrotor/logrotor.hpp"

namespace fs = std::filesystem;

// Reporter that records every message for inspection
class capture_reporter final : public logrotor::error_reporter
{
  public:
    void info(std::string_view msg) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        infos_.emplace_back(msg);
    }

    void error(std::string_view msg) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.emplace_back(msg);
    }

    std::vector<std::string> infos() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return infos_;
    }

    std::vector<std::string> errors() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    bool has_error_containing(const std::string &needle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(errors_.begin(), errors_.end(),
                           [&needle](const std::string &e) { return e.find(needle) != std::string::npos; });
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> infos_;
    std::vector<std::string> errors_;
};

class rotation_test_fixture
{
  protected:
    std::string test_dir;
    std::string log_file;
    capture_reporter reporter;

    rotation_test_fixture()
    {
        static std::atomic<int> counter{0};
        auto pid = getpid();
        test_dir = "/tmp/test_logrotor_" + std::to_string(pid) + "_" + std::to_string(counter.fetch_add(1));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        log_file = test_dir + "/svc.log";
    }

    ~rotation_test_fixture()
    {
        std::error_code ec;
        fs::permissions(test_dir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(test_dir, ec);
    }

    static void write_file(const std::string &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    static void append_file(const std::string &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << content;
    }

    static std::string read_file(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static std::string make_content(size_t bytes, char seed = 'a')
    {
        std::string data;
        data.reserve(bytes);
        for (size_t i = 0; i < bytes; ++i) { data.push_back(static_cast<char>(seed + (i % 26))); }
        return data;
    }

    // Base names of all entries directly in the test directory matching @p pattern, sorted
    std::vector<std::string> list_names(const std::string &pattern) const
    {
        std::regex re(pattern);
        std::vector<std::string> names;
        for (const auto &entry : fs::directory_iterator(test_dir))
        {
            std::string name = entry.path().filename().string();
            if (std::regex_match(name, re)) { names.push_back(name); }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    std::vector<std::string> rollover_copies() const { return list_names(R"(svc\.log\.[0-9]{1,17})"); }
    std::vector<std::string> backups() const { return list_names(R"(svc\.log\.[0-9]{17}\.zip)"); }

    /**
     * @brief Run @p fn while the test directory refuses writes from the caller
     *
     * Root ignores directory permissions, so as root @p fn runs in a forked
     * child that switched to nobody and its result comes back as the exit
     * status. @p fn must report failed expectations through its return value.
     *
     * @return @p fn's result (0 when all its expectations held), -1 if the
     *         unprivileged child could not be run
     */
    int run_without_write_access(const std::function<int()> &fn)
    {
        if (::geteuid() != 0)
        {
            fs::permissions(test_dir, fs::perms::owner_write, fs::perm_options::remove);
            int rc = fn();
            fs::permissions(test_dir, fs::perms::owner_write, fs::perm_options::add);
            return rc;
        }

        // Owned by root, rwxr-xr-x: nobody can list and read but not create or unlink
        fs::permissions(test_dir,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
                            fs::perms::others_exec,
                        fs::perm_options::replace);

        constexpr uid_t nobody    = 65534;
        constexpr int drop_failed = 126;
        constexpr int threw       = 125;
        pid_t pid                 = ::fork();
        if (pid < 0) return -1;
        if (pid == 0)
        {
            // The child must never return into the test runner
            if (::setgid(nobody) != 0 || ::setuid(nobody) != 0) { ::_exit(drop_failed); }
            int rc = threw;
            try
            {
                rc = fn() & 0x7f;
            }
            catch (...)
            {
                rc = threw;
            }
            ::_exit(rc);
        }

        int status = 0;
        if (::waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) return -1;
        return WEXITSTATUS(status) == drop_failed ? -1 : WEXITSTATUS(status);
    }

    // Keep successive rotations out of the same millisecond
    static void next_millisecond() { std::this_thread::sleep_for(std::chrono::milliseconds(3)); }
};

struct zip_entry
{
    std::string name;
    std::string content;
};

// Read every entry of a zip archive
inline bool read_zip(const std::string &path, std::vector<zip_entry> &entries)
{
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    if (!mz_zip_reader_init_file(&zip, path.c_str(), 0)) return false;

    bool ok        = true;
    mz_uint count  = mz_zip_reader_get_num_files(&zip);
    for (mz_uint i = 0; i < count && ok; ++i)
    {
        mz_zip_archive_file_stat st;
        if (!mz_zip_reader_file_stat(&zip, i, &st))
        {
            ok = false;
            break;
        }

        size_t size = 0;
        void *data  = mz_zip_reader_extract_to_heap(&zip, i, &size, 0);
        if (!data)
        {
            ok = false;
            break;
        }
        entries.push_back({st.m_filename, std::string(static_cast<const char *>(data), size)});
        mz_free(data);
    }

    mz_zip_reader_end(&zip);
    return ok;
}
