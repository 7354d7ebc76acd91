#include <batchgrader/subprocess/subprocess.hpp>

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/expected.hpp>
#include <batchgrader/common/linux.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <fmt/ranges.h>
#include <fmt/std.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace batchgrader {

namespace {

/// Writes a message to fd 2 and exits; for use in the child between fork and exec only
[[noreturn]] void child_fail(const char* what, int exit_code) noexcept {
    constexpr std::string_view PREFIX = "batchgrader: failed to start command: ";

    std::ignore = ::write(STDERR_FILENO, PREFIX.data(), PREFIX.size());
    std::ignore = ::write(STDERR_FILENO, what, std::strlen(what));
    std::ignore = ::write(STDERR_FILENO, "\n", 1);

    ::_exit(exit_code);
}

/// Exit status used by the shell when a command cannot be executed. See sh(1p)
constexpr int EXIT_CANNOT_EXECUTE = 126;
constexpr int EXIT_NOT_FOUND = 127;

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path working_dir,
                       StderrMode stderr_mode)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , working_dir_{std::move(working_dir)}
    , stderr_mode_{stderr_mode} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started, or the object was moved from
    if (child_pid_ != 0 && !reaped_) {
        LOG_DEBUG("Subprocess {} still running on destruction; killing it", child_pid_);

        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill subprocess {}: {}", child_pid_, res.error());
        }
    }

    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : child_pid_{std::exchange(other.child_pid_, 0)}
    , reaped_{std::exchange(other.reaped_, false)}
    , stdout_fd_{std::exchange(other.stdout_fd_, -1)}
    , stderr_fd_{std::exchange(other.stderr_fd_, -1)}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stderr_buffer_{std::exchange(other.stderr_buffer_, {})}
    , exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , working_dir_{std::move(other.working_dir_)}
    , stderr_mode_{other.stderr_mode_} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (child_pid_ != 0 && !reaped_) {
        std::ignore = kill();
    }
    close_pipes();

    child_pid_ = std::exchange(rhs.child_pid_, 0);
    reaped_ = std::exchange(rhs.reaped_, false);
    stdout_fd_ = std::exchange(rhs.stdout_fd_, -1);
    stderr_fd_ = std::exchange(rhs.stderr_fd_, -1);
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stderr_buffer_ = std::exchange(rhs.stderr_buffer_, {});
    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    working_dir_ = std::move(rhs.working_dir_);
    stderr_mode_ = rhs.stderr_mode_;

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess started twice", exec_);

    LOG_DEBUG("Starting '{}' {} in {}", exec_, args_, working_dir_);

    // O_CLOEXEC so that children forked concurrently by other threads don't inherit these pipes,
    // which would keep them open (and our reads from hitting EOF) for as long as those children live
    linux::Pipe stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    std::optional<linux::Pipe> stderr_pipe;

    auto close_child_ends = gsl::finally([&] {
        std::ignore = linux::close(stdout_pipe.write_fd);
        if (stderr_pipe) {
            std::ignore = linux::close(stderr_pipe->write_fd);
        }
    });

    if (stderr_mode_ == StderrMode::Separate) {
        auto pipe_res = linux::pipe2(O_CLOEXEC);

        if (!pipe_res) {
            std::ignore = linux::close(stdout_pipe.read_fd);
            return ErrorKind::SyscallFailure;
        }

        stderr_pipe = *pipe_res;
    }

    stdout_fd_ = stdout_pipe.read_fd;
    stderr_fd_ = stderr_pipe ? stderr_pipe->read_fd : -1;

    // Everything the child needs is prepared before forking.
    // No logging or allocation past the fork in the child; other threads may hold the logger's or allocator's locks
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> argv(args_.size() + 2, nullptr);
    argv.front() = const_cast<char*>(exec_.c_str());
    ranges::transform(args_, argv.begin() + 1, [](const std::string& str) { return const_cast<char*>(str.c_str()); });
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    const std::string working_dir = working_dir_.string();
    const int stdout_write_fd = stdout_pipe.write_fd;
    const int stderr_write_fd = stderr_pipe ? stderr_pipe->write_fd : stdout_pipe.write_fd;

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        // New session => new process group with pgid == pid, so the whole tree can be killed at once
        if (::setsid() == -1) {
            child_fail("setsid", EXIT_CANNOT_EXECUTE);
        }

        if (::dup2(stdout_write_fd, STDOUT_FILENO) == -1 || ::dup2(stderr_write_fd, STDERR_FILENO) == -1) {
            child_fail("dup2", EXIT_CANNOT_EXECUTE);
        }

        // NOLINTNEXTLINE(*vararg)
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1) {
            child_fail("/dev/null", EXIT_CANNOT_EXECUTE);
        }
        if (devnull != STDIN_FILENO) {
            ::close(devnull);
        }

        if (::chdir(working_dir.c_str()) == -1) {
            child_fail(working_dir.c_str(), EXIT_CANNOT_EXECUTE);
        }

        ::execv(exec_.c_str(), argv.data());

        child_fail(exec_.c_str(), EXIT_NOT_FOUND);
    }

    // Parent process
    child_pid_ = fork_res.pid;
    reaped_ = false;

    LOG_DEBUG("Started subprocess {}", child_pid_);

    return {};
}

Result<std::optional<RunResult>> Subprocess::peek_exit() const {
    // WNOWAIT leaves the child as a zombie, which keeps its pid (and so its process group id)
    // from being reused before we are done signalling the group
    siginfo_t info = TRYE(linux::waitid(P_PID, static_cast<id_t>(child_pid_), WEXITED | WNOHANG | WNOWAIT),
                          SyscallFailure);

    // si_pid will only be 0 if waitid returned early from WNOHANG
    // see waitid(2)
    if (info.si_pid == 0) {
        return std::nullopt;
    }

    switch (info.si_code) {
    case CLD_EXITED:
        return RunResult::make_exited(info.si_status);
    case CLD_KILLED:
    case CLD_DUMPED:
        return RunResult::make_killed(info.si_status);
    default:
        // Stopped / continued children haven't exited
        return std::nullopt;
    }
}

Result<void> Subprocess::reap() {
    TRYE(linux::waitid(P_PID, static_cast<id_t>(child_pid_), WEXITED), SyscallFailure);
    reaped_ = true;

    return {};
}

Result<RunResult> Subprocess::wait_for_exit(std::optional<std::chrono::microseconds> timeout) {
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0, "Subprocess was never started", exec_);
    ASSERT(!reaped_, "Subprocess was already waited for", exec_);

    const auto start_time = steady_clock::now();
    std::optional<RunResult> result;

    while (true) {
        result = TRY(peek_exit());

        if (result) {
            break;
        }

        auto wait_period = POLL_PERIOD;

        if (timeout) {
            const auto elapsed = steady_clock::now() - start_time;

            if (elapsed >= *timeout) {
                LOG_DEBUG("Subprocess {} timed out after {}", child_pid_,
                          std::chrono::duration_cast<std::chrono::milliseconds>(elapsed));

                TRY(kill());
                drain();

                return RunResult::make_timed_out(SIGKILL);
            }

            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*timeout - elapsed);
            wait_period = std::min(wait_period, remaining);
        }

        TRY(read_available(wait_period));
    }

    // The shell has exited. Anything left in its process group (background jobs, orphaned
    // helpers) goes with it, so that nothing outlives the command.
    // ESRCH just means that the group is already empty
    if (auto kill_res = linux::kill(-child_pid_, SIGKILL);
        !kill_res && kill_res.error() != std::make_error_code(std::errc::no_such_process)) {
        LOG_WARN("Failed to kill process group {}: {}", child_pid_, kill_res.error().message());
    }

    TRY(reap());
    drain();

    LOG_DEBUG("Subprocess {} finished: {}", child_pid_, *result);

    return *result;
}

bool Subprocess::is_alive() const {
    if (child_pid_ == 0 || reaped_) {
        return false;
    }

    auto res = peek_exit();

    return res && !res->has_value();
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0 || reaped_) {
        return {};
    }

    // The child may not have called setsid yet, in which case its group doesn't exist
    if (auto group_res = linux::kill(-child_pid_, SIGKILL); !group_res) {
        TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);
    }

    TRY(reap());

    return {};
}

Result<void> Subprocess::read_available(std::chrono::milliseconds timeout) {
    std::array<pollfd, 2> poll_fds{};
    std::size_t num_fds = 0;

    for (int fd : {stdout_fd_, stderr_fd_}) {
        if (fd != -1) {
            poll_fds.at(num_fds++) = pollfd{.fd = fd, .events = POLLIN, .revents = 0};
        }
    }

    // Nothing left to read; just wait out the period so the caller doesn't spin
    if (num_fds == 0) {
        std::this_thread::sleep_for(timeout);
        return {};
    }

    const std::span<pollfd> active_fds(poll_fds.data(), num_fds);

    int num_ready = TRYE(linux::poll(active_fds, gsl::narrow_cast<int>(timeout.count())), SyscallFailure);

    if (num_ready == 0) {
        return {};
    }

    for (const pollfd& pfd : active_fds) {
        if (pfd.revents == 0) {
            continue;
        }

        const bool is_stdout = pfd.fd == stdout_fd_;
        int& fd = is_stdout ? stdout_fd_ : stderr_fd_;
        std::string& buffer = is_stdout ? stdout_buffer_ : stderr_buffer_;

        std::string chunk = TRYE(linux::read(fd, READ_CHUNK_SIZE), SyscallFailure);

        // EOF; every writer has closed its end
        if (chunk.empty()) {
            std::ignore = linux::close(fd);
            fd = -1;
            continue;
        }

        buffer += chunk;
    }

    return {};
}

void Subprocess::drain() {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();

    while ((stdout_fd_ != -1 || stderr_fd_ != -1) && steady_clock::now() - start_time < DRAIN_TIMEOUT) {
        if (auto res = read_available(POLL_PERIOD); !res) {
            LOG_WARN("Error reading output of subprocess {}: {}", child_pid_, res.error());
            break;
        }
    }

    if (stdout_fd_ != -1 || stderr_fd_ != -1) {
        LOG_DEBUG("Output pipes of subprocess {} still open after {}; closing them", child_pid_, DRAIN_TIMEOUT);
    }

    close_pipes();
}

void Subprocess::close_pipes() {
    for (int* fd : {&stdout_fd_, &stderr_fd_}) {
        if (*fd != -1) {
            std::ignore = linux::close(*fd);
            *fd = -1;
        }
    }
}

} // namespace batchgrader
