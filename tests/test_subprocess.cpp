#include "catch2_custom.hpp"

#include <batchgrader/subprocess/run_result.hpp>
#include <batchgrader/subprocess/subprocess.hpp>

#include "scratch_dir.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/types.h>

using batchgrader::RunResult;
using batchgrader::Subprocess;
using namespace std::chrono_literals;

namespace {

Subprocess make_shell(const std::string& command, const std::filesystem::path& cwd = "/",
                      Subprocess::StderrMode mode = Subprocess::StderrMode::Separate) {
    return Subprocess{"/bin/sh", {"-c", command}, cwd, mode};
}

/// Whether `pid` no longer refers to a running process. A zombie awaiting its reaper counts as gone
bool process_gone(pid_t pid) {
    for (int i = 0; i < 100; ++i) {
        if (::kill(pid, 0) == -1 && errno == ESRCH) {
            return true;
        }

        std::ifstream stat{fmt::format("/proc/{}/stat", pid)};
        std::string ignored;
        char state = '?';
        // pid (comm) state ...; comm of sleep has no spaces
        if (stat >> ignored >> ignored >> state && state == 'Z') {
            return true;
        }

        std::this_thread::sleep_for(10ms);
    }

    return false;
}

} // namespace

TEST_CASE("Read stdout of a shell command") {
    auto proc = make_shell("printf 'Hello world!'");
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(res->succeeded());
    REQUIRE(proc.get_stdout() == "Hello world!");
    REQUIRE(proc.get_stderr().empty());
}

TEST_CASE("Exit status is reported") {
    auto proc = make_shell("exit 42");
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(*res == RunResult::make_exited(42));
    REQUIRE_FALSE(res->succeeded());
    REQUIRE(fmt::format("{}", *res) == "exit status 42");
}

TEST_CASE("Death by signal is reported") {
    auto proc = make_shell("kill -TERM $$");
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::Killed);
    REQUIRE(res->get_code() == SIGTERM);
}

TEST_CASE("stderr is captured separately or merged") {
    SECTION("Separate") {
        auto proc = make_shell("echo out; echo err >&2");
        REQUIRE(proc.start());
        REQUIRE(proc.wait_for_exit());

        REQUIRE(proc.get_stdout() == "out\n");
        REQUIRE(proc.get_stderr() == "err\n");
    }

    SECTION("Merged") {
        auto proc = make_shell("echo out; echo err >&2", "/", Subprocess::StderrMode::Merge);
        REQUIRE(proc.start());
        REQUIRE(proc.wait_for_exit());

        REQUIRE(proc.get_stdout() == "out\nerr\n");
        REQUIRE(proc.get_stderr().empty());
    }
}

TEST_CASE("Runs in the given working directory with /dev/null as stdin") {
    ScratchDir dir;
    dir.write_file("marker.txt", "here");

    auto proc = make_shell("cat marker.txt; cat", dir.path());
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res);
    REQUIRE(res->succeeded());
    REQUIRE(proc.get_stdout() == "here");
}

TEST_CASE("Large output is collected completely") {
    // Several times the capacity of a pipe
    auto proc = make_shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done");
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(30s);

    REQUIRE(res);
    REQUIRE(res->succeeded());
    REQUIRE(proc.get_stdout().size() == 20000 * 11);
}

TEST_CASE("Timeout kills the whole process group") {
    ScratchDir dir;

    // The background sleep is a grandchild; it reports its pid before the shell blocks
    auto proc = make_shell("sleep 30 & echo $! > bg.pid; printf partial; wait", dir.path());
    REQUIRE(proc.start());

    const auto start = std::chrono::steady_clock::now();
    auto res = proc.wait_for_exit(500ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::TimedOut);
    REQUIRE(fmt::format("{}", *res) == "timed out");
    REQUIRE(elapsed < 5s);
    REQUIRE(proc.get_stdout() == "partial");

    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(process_gone(proc.get_pid()));

    const pid_t bg_pid = std::stoi(read_file(dir / "bg.pid"));
    REQUIRE(process_gone(bg_pid));
}

TEST_CASE("Leftover background jobs are killed once the command exits") {
    ScratchDir dir;

    auto proc = make_shell("sleep 30 & echo $! > bg.pid; echo done", dir.path());
    REQUIRE(proc.start());

    const auto start = std::chrono::steady_clock::now();
    auto res = proc.wait_for_exit(10s);

    REQUIRE(res);
    REQUIRE(res->succeeded());
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE(proc.get_stdout() == "done\n");

    const pid_t bg_pid = std::stoi(read_file(dir / "bg.pid"));
    REQUIRE(process_gone(bg_pid));
}

TEST_CASE("Destroying a running subprocess kills it") {
    pid_t pid = 0;

    {
        auto proc = make_shell("sleep 30");
        REQUIRE(proc.start());
        pid = proc.get_pid();
        REQUIRE(proc.is_alive());
    }

    REQUIRE(process_gone(pid));
}

TEST_CASE("Missing executable exits with 127") {
    Subprocess proc{"/nonexistent/program", {}, "/"};
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res);
    REQUIRE(*res == RunResult::make_exited(127));
    REQUIRE_THAT(proc.get_stderr(), Catch::Matchers::ContainsSubstring("/nonexistent/program"));
}
