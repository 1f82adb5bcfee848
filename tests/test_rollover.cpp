/**
 * @file test_rollover.cpp
 * @brief Tests for copy-and-truncate rollover
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <sys/stat.h>

#include "test_helpers.hpp"

using namespace logrotor;

TEST_CASE_METHOD(rotation_test_fixture, "should_rollover threshold", "[rollover]")
{
    SECTION("Negative threshold disables rollover")
    {
        write_file(log_file, make_content(100));
        REQUIRE_FALSE(should_rollover(log_file, -1, reporter));
        REQUIRE(do_rollover(log_file, -1, 5, reporter) == rollover_result::disabled);
        REQUIRE(rollover_copies().empty());
    }

    SECTION("Zero threshold rolls any non-empty file")
    {
        write_file(log_file, "x");
        REQUIRE(should_rollover(log_file, 0, reporter));
    }

    SECTION("Empty file never rolls")
    {
        write_file(log_file, "");
        REQUIRE_FALSE(should_rollover(log_file, 0, reporter));
    }

    SECTION("Exactly at the threshold does not roll")
    {
        write_file(log_file, make_content(static_cast<size_t>(BYTES_PER_MB)));
        REQUIRE_FALSE(should_rollover(log_file, 1, reporter));
        append_file(log_file, "x");
        REQUIRE(should_rollover(log_file, 1, reporter));
    }

    REQUIRE(reporter.errors().empty());
}

TEST_CASE_METHOD(rotation_test_fixture, "Rollover copies aside and truncates in place", "[rollover]")
{
    std::string content = make_content(4096);
    write_file(log_file, content);

    struct stat before;
    REQUIRE(::stat(log_file.c_str(), &before) == 0);

    REQUIRE(do_rollover(log_file, 0, 5, reporter) == rollover_result::rotated);

    auto copies = rollover_copies();
    REQUIRE(copies.size() == 1);
    REQUIRE(is_canonical_timestamp(copies[0].substr(std::string("svc.log.").size())));
    REQUIRE(read_file(test_dir + "/" + copies[0]) == content);

    struct stat after;
    REQUIRE(::stat(log_file.c_str(), &after) == 0);
    REQUIRE(after.st_size == 0);
    REQUIRE(after.st_ino == before.st_ino);

    struct stat copy_st;
    REQUIRE(::stat((test_dir + "/" + copies[0]).c_str(), &copy_st) == 0);
    REQUIRE((copy_st.st_mode & 0777 & ~ROLLOVER_FILE_MODE) == 0);

    SECTION("A second pass on the empty file does nothing")
    {
        REQUIRE(do_rollover(log_file, 0, 5, reporter) == rollover_result::not_needed);
        REQUIRE(rollover_copies().size() == 1);
    }

    REQUIRE(reporter.errors().empty());
}

TEST_CASE_METHOD(rotation_test_fixture, "Below threshold leaves the file untouched", "[rollover]")
{
    write_file(log_file, make_content(1024));

    REQUIRE(do_rollover(log_file, 1, 5, reporter) == rollover_result::not_needed);
    REQUIRE(fs::file_size(log_file) == 1024);
    REQUIRE(rollover_copies().empty());
    REQUIRE(reporter.errors().empty());
}

TEST_CASE_METHOD(rotation_test_fixture, "Rollover prunes old raw copies", "[rollover][retention]")
{
    write_file(log_file + ".20200101000000001", "old1");
    write_file(log_file + ".20200101000000002", "old2");
    write_file(log_file + ".20200101000000003", "old3");
    write_file(log_file, "fresh");

    REQUIRE(do_rollover(log_file, 0, 2, reporter) == rollover_result::rotated);

    auto copies = rollover_copies();
    REQUIRE(copies.size() == 2);
    REQUIRE(copies[0] == "svc.log.20200101000000003");
    REQUIRE(read_file(test_dir + "/" + copies[1]) == "fresh");
    REQUIRE(reporter.errors().empty());
}

TEST_CASE_METHOD(rotation_test_fixture, "Rollover failures are reported", "[rollover][errors]")
{
    SECTION("Missing file")
    {
        REQUIRE(do_rollover(log_file, 0, 5, reporter) == rollover_result::not_needed);
        REQUIRE(reporter.has_error_containing("stat path: " + log_file));
    }

    SECTION("Copy failure leaves the active file intact")
    {
        write_file(log_file, "keep me");

        int rc = run_without_write_access([this] {
            if (do_rollover(log_file, 0, 5, reporter) != rollover_result::failed) return 1;
            if (!reporter.has_error_containing("copy path: " + log_file)) return 2;
            if (reporter.has_error_containing("truncate path")) return 3;
            return 0;
        });

        REQUIRE(rc == 0);
        REQUIRE(read_file(log_file) == "keep me");
        REQUIRE(rollover_copies().empty());
    }
}

TEST_CASE_METHOD(rotation_test_fixture, "copy_file and truncate_file", "[rollover][file_ops]")
{
    std::string error;

    SECTION("copy_file reproduces content and overwrites the target")
    {
        write_file(test_dir + "/src", make_content(200000));
        write_file(test_dir + "/dst", "stale content that is longer than nothing");
        REQUIRE(copy_file(test_dir + "/src", test_dir + "/dst", error));
        REQUIRE(read_file(test_dir + "/dst") == read_file(test_dir + "/src"));
    }

    SECTION("copy_file from a missing source creates nothing")
    {
        REQUIRE_FALSE(copy_file(test_dir + "/missing", test_dir + "/dst", error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(fs::exists(test_dir + "/dst"));
    }

    SECTION("truncate_file empties the file")
    {
        write_file(log_file, "data");
        REQUIRE(truncate_file(log_file, error));
        REQUIRE(fs::file_size(log_file) == 0);
    }

    SECTION("Path helpers")
    {
        REQUIRE(parent_directory("svc.log") == ".");
        REQUIRE(parent_directory("/var/log/svc.log") == "/var/log");
        REQUIRE(base_file_name("/var/log/svc.log") == "svc.log");
    }
}
