#include <catch2/catch_test_macros.hpp>

#include <svn_bridge/svn/process_runner.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace svn_bridge;

namespace {

Result<std::string, Error> RunShell(ProcessRunner& runner, const std::string& script,
                                    const std::optional<std::string>& cwd = std::nullopt) {
    return runner.Run({"-c", script}, cwd);
}

} // anonymous namespace

// ===========================================================================
// Spawning
// ===========================================================================

TEST_CASE("ProcessRunner: captures stdout on success", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner, "printf '<status/>'; echo ignored >&2");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "<status/>");
}

TEST_CASE("ProcessRunner: large output does not dead-lock", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner,
                      "i=0; while [ $i -lt 5000 ]; do "
                      "echo 'line of output that is long enough to fill pipes'; "
                      "echo err >&2; i=$((i+1)); done");
    REQUIRE(r.IsOk());
    CHECK(r.Value().size() > 65536);
}

TEST_CASE("ProcessRunner: non-zero exit returns CommandExecution with stderr", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner, "echo 'svn: E155007: not a working copy' >&2; exit 1");
    REQUIRE(r.IsErr());
    const auto& e = r.Error();
    CHECK(e.category == ErrorCategory::CommandExecution);
    REQUIRE(e.exit_code.has_value());
    CHECK(*e.exit_code == 1);
    CHECK(e.stderr_text == "svn: E155007: not a working copy\n");
    CHECK(e.message == "svn: E155007: not a working copy");
    CHECK(e.failure == FailureKind::WorkingCopy);
}

TEST_CASE("ProcessRunner: non-zero exit with empty stderr", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner, "exit 3");
    REQUIRE(r.IsErr());
    CHECK(*r.Error().exit_code == 3);
    CHECK(r.Error().message == "exit code 3");
}

TEST_CASE("ProcessRunner: missing executable exits 127", "[svn][runner]") {
    ProcessRunner runner("/nonexistent/svn-bridge-no-such-binary");
    auto r = runner.Run({"status"}, std::nullopt);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::CommandExecution);
    CHECK(*r.Error().exit_code == 127);
    CHECK(r.Error().stderr_text.find("cannot execute") != std::string::npos);
}

TEST_CASE("ProcessRunner: forces UTF-8 locale in the child", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner, "printf '%s|%s' \"$LANG\" \"$LC_ALL\"");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "en_US.UTF-8|en_US.UTF-8");
}

TEST_CASE("ProcessRunner: extra environment reaches the child", "[svn][runner]") {
    ProcessRunnerOptions options;
    options.environment["SVN_BRIDGE_TEST_VAR"] = "hello";
    ProcessRunner runner("/bin/sh", options);
    auto r = RunShell(runner, "printf '%s' \"$SVN_BRIDGE_TEST_VAR\"");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "hello");
}

TEST_CASE("ProcessRunner: runs in the working directory", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner, "pwd", std::string("/"));
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "/\n");
}

TEST_CASE("ProcessRunner: invalid working directory fails the child", "[svn][runner]") {
    ProcessRunner runner("/bin/sh");
    auto r = RunShell(runner, "pwd", std::string("/nonexistent-svn-bridge-dir"));
    REQUIRE(r.IsErr());
    CHECK(*r.Error().exit_code == 127);
    CHECK(r.Error().stderr_text.find("cannot change directory") != std::string::npos);
}

// ===========================================================================
// Timeout / cancellation
// ===========================================================================

TEST_CASE("ProcessRunner: timeout kills the child", "[svn][runner]") {
    ProcessRunnerOptions options;
    options.timeout = std::chrono::milliseconds(200);
    ProcessRunner runner("/bin/sh", options);

    const auto start = std::chrono::steady_clock::now();
    auto r = RunShell(runner, "exec sleep 10");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(r.Error().message.find("Timed out after 200 ms") != std::string::npos);
    CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("ProcessRunner: pre-cancelled token stops immediately", "[svn][runner]") {
    CancellationToken token;
    token.Cancel();
    ProcessRunnerOptions options;
    options.cancellation = token;
    ProcessRunner runner("/bin/sh", options);

    auto r = RunShell(runner, "exec sleep 10");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Cancelled);
}

TEST_CASE("ProcessRunner: cancel from another thread", "[svn][runner]") {
    CancellationToken token;
    ProcessRunnerOptions options;
    options.cancellation = token;
    ProcessRunner runner("/bin/sh", options);

    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.Cancel();
    });
    auto r = RunShell(runner, "exec sleep 10");
    canceller.join();

    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Cancelled);
    CHECK(r.Error().ExitCode() == 5);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("ProcessRunner: slow run on another thread does not delay a quick run", "[svn][runner]") {
    std::atomic<bool> slow_done{false};
    std::atomic<int> slow_ok{0};
    std::thread slow([&slow_done, &slow_ok]() {
        ProcessRunner runner("/bin/sh");
        for (int i = 0; i < 3; ++i) {
            if (runner.Run({"-c", "exec sleep 1"}, std::nullopt).IsOk()) ++slow_ok;
        }
        slow_done = true;
    });

    ProcessRunner runner("/bin/sh");
    int quick_runs = 0;
    int failures = 0;
    auto worst = std::chrono::steady_clock::duration::zero();
    while (!slow_done) {
        const auto start = std::chrono::steady_clock::now();
        auto r = RunShell(runner, "echo hi");
        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed > worst) worst = elapsed;
        if (r.IsErr() || r.Value() != "hi\n") ++failures;
        ++quick_runs;
    }
    slow.join();

    CHECK(slow_ok == 3);
    CHECK(quick_runs > 0);
    CHECK(failures == 0);
    CHECK(worst < std::chrono::milliseconds(500));
}

// ===========================================================================
// Helpers
// ===========================================================================

TEST_CASE("BuildChildEnvironment: locale override and replacement order", "[svn][runner]") {
    auto env = BuildChildEnvironment({"PATH=/usr/bin", "LANG=C", "HOME=/root"},
                                     {{"HOME", "/tmp"}});
    REQUIRE(env.size() == 4);
    CHECK(env[0] == "PATH=/usr/bin");
    CHECK(env[1] == "LANG=en_US.UTF-8");
    CHECK(env[2] == "HOME=/tmp");
    CHECK(env[3] == "LC_ALL=en_US.UTF-8");
}

TEST_CASE("BuildChildEnvironment: malformed base entries are skipped", "[svn][runner]") {
    auto env = BuildChildEnvironment({"NOEQUALS", "=value"}, {});
    REQUIRE(env.size() == 2);
    CHECK(env[0] == "LANG=en_US.UTF-8");
}

TEST_CASE("DescribeCommand: masks password and quotes spaces", "[svn][runner]") {
    auto text = DescribeCommand("svn", {"commit", "-m", "fix bug", "--password", "s3cret",
                                        "--username", "alice"});
    CHECK(text == "svn commit -m \"fix bug\" --password **** --username alice");
    CHECK(text.find("s3cret") == std::string::npos);
}
