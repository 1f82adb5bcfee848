/**
 * @file logrotor.cpp
 * @brief Command line front end: one-shot rotation of a directory or a background scheduler
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <pthread.h>

#include "logrotor/logrotor.hpp"

using namespace logrotor;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " -d <dir> [options]    rotate a directory once\n"
              << "       " << prog_name << " -f <file> [options]   rotate the file's directory until SIGINT/SIGTERM\n"
              << "Options:\n"
              << "  -d <dir>          Directory to rotate once\n"
              << "  -f <file>         Log file whose directory is rotated in the background\n"
              << "  -p <policy>       Rolling policy: size or daily (default: size)\n"
              << "  -s <mb>           Rollover size in MB (default: " << DEFAULT_ROTATE_SIZE_MB << ", -1 disables)\n"
              << "  -b <count>        Backups to keep (default: " << DEFAULT_BACKUP_COUNT << ", -1 keeps all)\n"
              << "  -r <days>         Days between rollovers for the daily policy (default: 1)\n"
              << "  -R                Descend into subdirectories\n"
              << "  -l <level>        Report level: info, error, off (default: info)\n"
              << "  -v                Print version\n"
              << "  -h                Show this help\n";
}

static bool parse_int(const char *text, int &value)
{
    char *end = nullptr;
    errno     = 0;
    long v    = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    value = static_cast<int>(v);
    return true;
}

// Block until SIGINT or SIGTERM; must be called with both signals blocked in all threads
static int wait_for_termination(const sigset_t &signals)
{
    int sig = 0;
    if (sigwait(&signals, &sig) != 0) return -1;
    return sig;
}

int main(int argc, char *argv[])
{
    std::string directory;
    rotate_options options;
    int size_mb      = DEFAULT_ROTATE_SIZE_MB;
    int backup_count = DEFAULT_BACKUP_COUNT;
    log_level level  = log_level::info;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) { directory = argv[++i]; }
        else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { options.logger_file = argv[++i]; }
        else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) { options.rolling_policy = argv[++i]; }
        else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc)
        {
            if (!parse_int(argv[++i], size_mb))
            {
                std::cerr << "Error: invalid size: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (strcmp(argv[i], "-b") == 0 && i + 1 < argc)
        {
            if (!parse_int(argv[++i], backup_count))
            {
                std::cerr << "Error: invalid backup count: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (strcmp(argv[i], "-r") == 0 && i + 1 < argc)
        {
            if (!parse_int(argv[++i], options.log_rotate_date))
            {
                std::cerr << "Error: invalid day count: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (strcmp(argv[i], "-R") == 0) { options.sweep_mode = list_mode::recursive; }
        else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) { level = log_level_from_string(argv[++i]); }
        else if (strcmp(argv[i], "-v") == 0)
        {
            std::cout << "logrotor " << VERSION << "\n";
            return 0;
        }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (directory.empty() == options.logger_file.empty())
    {
        std::cerr << "Error: exactly one of -d or -f is required\n";
        print_usage(argv[0]);
        return 1;
    }

    fd_reporter reporter(STDERR_FILENO, level);

    if (!directory.empty())
    {
        log_rotate(directory, size_mb, backup_count, reporter, options.sweep_mode);
        return 0;
    }

    // new_rotate_config() treats non-positive values as "use the default";
    // -1 on the command line must still disable rollover / pruning.
    options.log_rotate_size  = size_mb;
    options.log_backup_count = backup_count;
    rotate_config config     = new_rotate_config(options);
    if (size_mb < 0) { config.size = size_mb; }
    if (backup_count < 0) { config.backup_count = backup_count; }

    // Scheduler threads inherit the mask, so only sigwait() below sees these signals
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0)
    {
        std::cerr << "Error: failed to block termination signals\n";
        return 1;
    }

    scheduler_registry registry(reporter);
    registry.rotate(config);
    reporter.info(fmt::format("rotating {} every {}s, policy {}",
                              config.log_file_dir,
                              config.check_cycle.count(),
                              config.policy == rolling_policy::size ? "size" : "daily"));

    int sig = wait_for_termination(signals);
    reporter.info(fmt::format("received signal {}, stopping", sig));
    registry.stop_all();
    return 0;
}
