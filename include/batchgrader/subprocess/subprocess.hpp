#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/linux.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace batchgrader {

/// A child process running in its own session (and therefore its own process group), with its
/// output captured through pipes. stdin is connected to /dev/null.
///
/// Killing a Subprocess kills its whole process group, so helpers spawned by the command
/// (e.g. the program started by `sh -c`) are terminated along with it.
class Subprocess : NonCopyable
{
public:
    enum class StderrMode {
        Merge,   ///< stderr is written into the same buffer as stdout
        Separate ///< stderr is captured on its own
    };

    /// Creates a sub (child) process by running ``exec`` with ``args`` in ``working_dir``
    /// ENV variables are inherited from the grader.
    Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path working_dir,
               StderrMode stderr_mode = StderrMode::Separate);
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    // Forks the current process to start a new subprocess as specified
    Result<void> start();

    /// Blocks until the process exits, collecting its output as it goes.
    /// If ``timeout`` is given and elapses first, the process group is killed and reaped, and the
    /// result kind is ``RunResult::Kind::TimedOut``.
    Result<RunResult> wait_for_exit(std::optional<std::chrono::microseconds> timeout = std::nullopt);

    /// Whether child process is alive (a zombie that has not been reaped counts as alive)
    bool is_alive() const;

    /// Manually kill the whole process group with SIGKILL, and reap the child
    Result<void> kill();

    pid_t get_pid() const { return child_pid_; }

    /// All stdout (and stderr, if merged) produced so far
    const std::string& get_stdout() const { return stdout_buffer_; }

    /// All stderr produced so far; always empty if stderr is merged
    const std::string& get_stderr() const { return stderr_buffer_; }

    /// How long to wait for output between checks on the child's state
    static constexpr std::chrono::milliseconds POLL_PERIOD{10};

    /// How long to keep reading output after the child has exited and its group was killed
    static constexpr std::chrono::milliseconds DRAIN_TIMEOUT{200};

    static constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

private:
    /// Checks, without blocking or reaping, whether the child has exited
    Result<std::optional<RunResult>> peek_exit() const;

    /// Reaps the (already exited) child and releases its pid
    Result<void> reap();

    /// Waits up to `timeout` for output and appends whatever is available to the buffers
    Result<void> read_available(std::chrono::milliseconds timeout);

    /// Reads remaining output until EOF on every pipe or ``DRAIN_TIMEOUT``
    void drain();

    void close_pipes();

    pid_t child_pid_{};
    bool reaped_ = false;

    /// Read ends of the pipes connected to the child's stdout and stderr; -1 once closed
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::string exec_;
    std::vector<std::string> args_;
    std::filesystem::path working_dir_;
    StderrMode stderr_mode_;
};

} // namespace batchgrader
