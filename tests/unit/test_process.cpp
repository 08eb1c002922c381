/*
 * HwmonFanControl — process runner tests
 * (c) 2026 HwmonFanControl contributors
 */

#include <catch2/catch.hpp>

#include "include/Process.hpp"

#include <atomic>
#include <chrono>

using hfc::runCommand;

TEST_CASE("runCommand: captures stdout and exit status", "[process]") {
    auto r = runCommand({"/bin/sh", "-c", "echo 42; exit 3"}, 2000);
    REQUIRE(r.started);
    REQUIRE_FALSE(r.timedOut);
    REQUIRE(r.exitCode == 3);
    REQUIRE(r.output == "42\n");
}

TEST_CASE("runCommand: stderr is not mixed into the output", "[process]") {
    auto r = runCommand({"/bin/sh", "-c", "echo noise >&2; echo data"}, 2000);
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.output == "data\n");
}

TEST_CASE("runCommand: a hung command is killed at the timeout", "[process]") {
    const auto t0 = std::chrono::steady_clock::now();
    auto r = runCommand({"/bin/sh", "-c", "sleep 10"}, 200);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    REQUIRE(r.timedOut);
    REQUIRE_FALSE(r.error.empty());
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("runCommand: the cancel flag aborts a running command", "[process]") {
    std::atomic<bool> cancel{true};
    auto r = runCommand({"/bin/sh", "-c", "sleep 10"}, 10000, &cancel);
    REQUIRE(r.cancelled);
    REQUIRE(r.error == "cancelled");
}

TEST_CASE("runCommand: missing executable", "[process]") {
    auto r = runCommand({"hfc-no-such-tool-for-tests"}, 2000);
    REQUIRE(r.exitCode == 127);
    REQUIRE(r.error.find("command not found") != std::string::npos);
}

TEST_CASE("runCommand: empty argv is rejected", "[process]") {
    auto r = runCommand({}, 1000);
    REQUIRE_FALSE(r.started);
    REQUIRE_FALSE(r.error.empty());
}
