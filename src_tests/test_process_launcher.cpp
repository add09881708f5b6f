/**
 * @file test_process_launcher.cpp
 * @brief Tests for the fork/exec/wait wrapper and its tagged outcomes
 */

#include <catch2/catch_test_macros.hpp>

#include "simharness/process_launcher.hpp"
#include "support/temp_workspace.hpp"

#include <csignal>
#include <filesystem>
#include <string>

using simharness::LaunchOutcome;
using simharness::LaunchRequest;
using simharness::launch_process;
using simharness::test::TempWorkspace;
using simharness::test::read_text;

TEST_CASE("Child exiting 0 is a success", "[launcher]") {
    const auto outcome = launch_process(LaunchRequest{"/bin/sh", {"-c", "exit 0"}});
    REQUIRE(outcome.kind == LaunchOutcome::Kind::Success);
    REQUIRE(outcome.succeeded());
    REQUIRE(outcome.status_code() == 0);
}

TEST_CASE("Child exit status is carried verbatim", "[launcher]") {
    const auto outcome = launch_process(LaunchRequest{"/bin/sh", {"-c", "exit 42"}});
    REQUIRE(outcome.kind == LaunchOutcome::Kind::NonZeroExit);
    REQUIRE(outcome.exit_code == 42);
    REQUIRE(outcome.status_code() == 42);
}

TEST_CASE("Positional arguments arrive in order", "[launcher]") {
    TempWorkspace ws;
    const auto out = ws.path() / "args.txt";
    const auto outcome = launch_process(LaunchRequest{
        "/bin/sh", {"-c", "printf '%s|%s' \"$1\" \"$2\" > \"$3\"", "sh", "first", "second", out.string()}});
    REQUIRE(outcome.succeeded());
    REQUIRE(read_text(out) == "first|second");
}

TEST_CASE("Working directory applies to the child only", "[launcher]") {
    TempWorkspace ws;
    const auto before = std::filesystem::current_path();

    LaunchRequest request{"/bin/sh", {"-c", "pwd -P > where.txt"}, ws.path()};
    REQUIRE(launch_process(request).succeeded());

    REQUIRE(std::filesystem::current_path() == before);
    const auto where = read_text(ws.path() / "where.txt");
    REQUIRE(where.find(std::filesystem::canonical(ws.path()).string()) == 0);
}

TEST_CASE("Missing executable is a launch error, not an exit code", "[launcher]") {
    const auto outcome = launch_process(LaunchRequest{"/nonexistent/simharness-simulator", {}});
    REQUIRE(outcome.kind == LaunchOutcome::Kind::LaunchError);
    REQUIRE(outcome.error.find("cannot execute") != std::string::npos);
    REQUIRE(outcome.status_code() == simharness::kLaunchErrorStatus);
}

TEST_CASE("Missing working directory is a launch error", "[launcher]") {
    TempWorkspace ws;
    const auto outcome =
        launch_process(LaunchRequest{"/bin/sh", {"-c", "exit 0"}, ws.path() / "no-such-dir"});
    REQUIRE(outcome.kind == LaunchOutcome::Kind::LaunchError);
    REQUIRE(outcome.error.find("cannot change directory") != std::string::npos);
}

TEST_CASE("Empty program is rejected without forking", "[launcher]") {
    const auto outcome = launch_process(LaunchRequest{});
    REQUIRE(outcome.kind == LaunchOutcome::Kind::LaunchError);
}

TEST_CASE("Child killed by a signal reports 128+N", "[launcher]") {
    const auto outcome = launch_process(LaunchRequest{"/bin/sh", {"-c", "kill -TERM $$"}});
    REQUIRE(outcome.kind == LaunchOutcome::Kind::Signaled);
    REQUIRE(outcome.signal == SIGTERM);
    REQUIRE(outcome.status_code() == simharness::kSignalStatusBase + SIGTERM);
}
