/**
 * @file logrotor.hpp
 * @brief Background log file rotation engine
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * logrotor keeps the disk usage of a directory of growing log files bounded
 * without pausing the processes writing them.
 *
 * Rotated file layout for an active file "svc.log":
 *
 *   svc.log                          active file, truncated in place on rollover
 *   svc.log.20060102150405000        raw copy made by a rollover
 *   svc.log.20060102150405000.zip    compressed backup, one entry "svc.log.20060102150405000"
 *
 * The 17-digit suffix is the local time as YYYYMMDDhhmmssmmm, so sorting names
 * sorts copies oldest first. Raw copies with a short numeric suffix ("svc.log.1",
 * as left by other rotation tools) are picked up by the backup pass and archived
 * under a fresh timestamp.
 *
 * One rotation pass over a directory:
 *  1. list *.log, *.trace and *.out files
 *  2. for each file larger than the threshold: copy to "<file>.<timestamp>",
 *     truncate, prune raw copies beyond the backup count
 *  3. for each file: zip every raw copy, delete it, prune archives beyond the
 *     backup count
 *
 * @code
 * logrotor::fd_reporter reporter;                    // reports to stderr
 * logrotor::scheduler_registry registry(reporter);  // one per process
 *
 * logrotor::rotate_options options;
 * options.logger_file      = "/var/log/app/svc.log";
 * options.log_rotate_size  = 20;  // MB
 * options.log_backup_count = 10;
 * registry.rotate(logrotor::new_rotate_config(options)); // checks every 30s
 *
 * // Or a single synchronous pass, e.g. from an admin command
 * logrotor::log_rotate("/var/log/app", 20, 10, reporter);
 * @endcode
 */
#pragma once

#include "fmt_config.hpp"         // IWYU pragma: keep
#include "rotor_version.hpp"      // IWYU pragma: keep
#include "rotor_types.hpp"        // IWYU pragma: keep
#include "rotor_utils.hpp"        // IWYU pragma: keep
#include "rotor_reporter.hpp"     // IWYU pragma: keep
#include "rotor_timestamp.hpp"    // IWYU pragma: keep
#include "rotor_file_matcher.hpp" // IWYU pragma: keep
#include "rotor_file_ops.hpp"     // IWYU pragma: keep
#include "rotor_zip.hpp"          // IWYU pragma: keep
#include "rotor_retention.hpp"    // IWYU pragma: keep
#include "rotor_rollover.hpp"     // IWYU pragma: keep
#include "rotor_backup.hpp"       // IWYU pragma: keep
#include "rotor_config.hpp"       // IWYU pragma: keep
#include "rotor_scheduler.hpp"    // IWYU pragma: keep

#include "rotor_scheduler_impl.hpp" // IWYU pragma: keep
