/**
 * @file test_reporter.cpp
 * @brief Tests for the file descriptor error reporter
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace logrotor;

static std::vector<std::string> read_lines(const std::string &path)
{
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) { lines.push_back(line); }
    return lines;
}

TEST_CASE_METHOD(rotation_test_fixture, "fd_reporter line format", "[reporter]")
{
    std::string report_file = test_dir + "/report.txt";

    {
        fd_reporter file_reporter(report_file, log_level::info, "rotor");
        file_reporter.info("start log rotate task");
        file_reporter.error("copy path: /x failed: denied");
    }

    auto lines = read_lines(report_file);
    REQUIRE(lines.size() == 2);

    std::regex header(R"(^\d{8}\.\d{3} \[(INFO |ERROR)\] \[[0-9a-f]{8}\] rotor      (.*)$)");
    std::smatch m;

    REQUIRE(std::regex_match(lines[0], m, header));
    REQUIRE(m[1] == "INFO ");
    REQUIRE(m[2] == "start log rotate task");

    REQUIRE(std::regex_match(lines[1], m, header));
    REQUIRE(m[1] == "ERROR");
    REQUIRE(m[2] == "copy path: /x failed: denied");
}

TEST_CASE_METHOD(rotation_test_fixture, "fd_reporter level filtering", "[reporter]")
{
    std::string report_file = test_dir + "/report.txt";

    SECTION("Error level drops info")
    {
        {
            fd_reporter file_reporter(report_file, log_level::error);
            file_reporter.info("dropped");
            file_reporter.error("kept");
        }
        auto lines = read_lines(report_file);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("kept") != std::string::npos);
    }

    SECTION("nolog drops everything")
    {
        {
            fd_reporter file_reporter(report_file, log_level::nolog);
            file_reporter.info("dropped");
            file_reporter.error("dropped");
        }
        REQUIRE(read_lines(report_file).empty());
    }

    SECTION("Reports are appended")
    {
        {
            fd_reporter file_reporter(report_file, log_level::info);
            file_reporter.info("one");
        }
        {
            fd_reporter file_reporter(report_file, log_level::info);
            file_reporter.info("two");
        }
        REQUIRE(read_lines(report_file).size() == 2);
    }
}

TEST_CASE_METHOD(rotation_test_fixture, "fd_reporter on a borrowed descriptor", "[reporter]")
{
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    {
        fd_reporter pipe_reporter(fds[1], log_level::info);
        pipe_reporter.error("through the pipe");
        REQUIRE(pipe_reporter.min_level() == log_level::info);
    }

    // The reporter does not own the descriptor
    REQUIRE(::close(fds[1]) == 0);

    std::string data;
    char buf[256];
    ssize_t n;
    while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) { data.append(buf, static_cast<size_t>(n)); }
    ::close(fds[0]);

    REQUIRE(data.find("[ERROR]") != std::string::npos);
    REQUIRE(data.find("logrotor") != std::string::npos);
    REQUIRE(data.find("through the pipe\n") != std::string::npos);
}

TEST_CASE_METHOD(rotation_test_fixture, "fd_reporter fails on an unopenable file", "[reporter][errors]")
{
    REQUIRE_THROWS_AS(fd_reporter(test_dir + "/missing/report.txt", log_level::info), std::runtime_error);
}

TEST_CASE("fd_reporter keeps lines whole across threads", "[reporter][threads]")
{
    std::string report_file = "/tmp/test_logrotor_report_" + std::to_string(getpid()) + ".txt";
    fs::remove(report_file);

    {
        fd_reporter file_reporter(report_file, log_level::info);
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
        {
            threads.emplace_back([&file_reporter, t] {
                for (int i = 0; i < 100; ++i) { file_reporter.error(fmt::format("thread {} message {}", t, i)); }
            });
        }
        for (auto &th : threads) { th.join(); }
    }

    auto lines = read_lines(report_file);
    fs::remove(report_file);

    REQUIRE(lines.size() == 400);
    std::regex line_re(R"(^\d{8}\.\d{3} \[ERROR\] \[[0-9a-f]{8}\] logrotor   thread \d message \d+$)");
    for (const auto &line : lines) { REQUIRE(std::regex_match(line, line_re)); }
}

TEST_CASE("discard_reporter accepts everything", "[reporter]")
{
    discard_reporter quiet;
    error_reporter &reporter = quiet;
    reporter.info("ignored");
    reporter.error("ignored");
    SUCCEED();
}
