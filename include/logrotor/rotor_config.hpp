/**
 * @file rotor_config.hpp
 * @brief Rotation configuration and its construction from user options
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <string>

#include "rotor_file_ops.hpp"
#include "rotor_types.hpp"

namespace logrotor
{

/**
 * @brief User-facing rotation options
 *
 * Non-positive numeric values select the defaults from rotor_types.hpp.
 */
struct rotate_options
{
    std::string logger_file;                ///< Active log file, e.g. "/var/log/app/svc.log"
    std::string rolling_policy = "size";    ///< "size", anything else selects date based rotation
    int log_rotate_date        = 0;         ///< Days between date based rollovers
    int log_rotate_size        = 0;         ///< Size threshold in MB
    int log_backup_count       = 0;         ///< Rotated copies / archives to keep
    list_mode sweep_mode       = list_mode::flat; ///< Walk depth of the directory sweep
};

/**
 * @brief Immutable per-directory rotation policy
 *
 * Fixed for the lifetime of the scheduler task it was registered with.
 */
struct rotate_config
{
    std::string log_file_path;                 ///< Active log file
    std::string log_file_dir;                  ///< Directory swept by the scheduler (registry key)
    rolling_policy policy = rolling_policy::size;
    int size              = DEFAULT_ROTATE_SIZE_MB; ///< MB threshold (size policy)
    int backup_count      = DEFAULT_BACKUP_COUNT;   ///< Negative keeps everything
    std::chrono::seconds check_cycle{SIZE_CHECK_CYCLE};
    int rotate_date      = DEFAULT_ROTATE_DATE_DAYS;
    list_mode sweep_mode = list_mode::flat;

    /**
     * @brief Size threshold handed to the rollover check
     *
     * Date based policies roll any non-empty file once per check cycle.
     */
    int rollover_threshold_mb() const noexcept { return policy == rolling_policy::size ? size : 0; }
};

/**
 * @brief Build a rotate_config from user options, applying defaults
 *
 * - size policy: threshold log_rotate_size (default 10 MB), checked every 30s
 * - date policy: checked every 24h * log_rotate_date (when > 1)
 */
inline rotate_config new_rotate_config(const rotate_options &option)
{
    rotate_config rc;
    rc.backup_count = DEFAULT_BACKUP_COUNT;
    if (option.log_backup_count > 0) { rc.backup_count = option.log_backup_count; }

    rc.log_file_path = option.logger_file;
    rc.log_file_dir  = parent_directory(option.logger_file);
    rc.sweep_mode    = option.sweep_mode;

    if (option.rolling_policy == "size")
    {
        rc.policy = rolling_policy::size;
        rc.size   = DEFAULT_ROTATE_SIZE_MB;
        if (option.log_rotate_size > 0) { rc.size = option.log_rotate_size; }
        rc.check_cycle = SIZE_CHECK_CYCLE;
    }
    else
    {
        rc.policy      = rolling_policy::daily;
        rc.rotate_date = DEFAULT_ROTATE_DATE_DAYS;
        rc.check_cycle = DATE_CHECK_CYCLE;
        if (option.log_rotate_date > 1)
        {
            rc.rotate_date = option.log_rotate_date;
            rc.check_cycle = DATE_CHECK_CYCLE * option.log_rotate_date;
        }
    }

    return rc;
}

} // namespace logrotor
