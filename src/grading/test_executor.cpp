#include <batchgrader/grading/test_executor.hpp>

#include <batchgrader/command_template.hpp>
#include <batchgrader/common/error_types.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>

namespace batchgrader {

TestExecutor::TestExecutor(CommandTemplate test_command, std::chrono::microseconds timeout)
    : test_command_{std::move(test_command)}
    , timeout_{timeout} {
    ASSERT(test_command_.policy() == CommandTemplate::SlotPolicy::Required);
}

Result<TestExecution> TestExecutor::run(const std::filesystem::path& sandbox_dir, const TestCase& test) const {
    LOG_TRACE("Running {} in {}", test_command_.describe(test.path), sandbox_dir);

    Subprocess proc{std::string{CommandTemplate::SHELL}, test_command_.to_shell_args(test.path), sandbox_dir,
                    Subprocess::StderrMode::Separate};

    TRY(proc.start());

    auto exit_res = proc.wait_for_exit(timeout_);

    if (!exit_res) {
        // Make sure nothing is left running; the Subprocess destructor would do the same
        if (auto kill_res = proc.kill(); !kill_res) {
            LOG_WARN("Failed to kill test process for {}: {}", test.name, kill_res.error());
        }

        return exit_res.error();
    }

    LOG_DEBUG("Test {} in {}: {}", test.name, sandbox_dir, *exit_res);

    return TestExecution{
        .run_result = *exit_res, .stdout_output = proc.get_stdout(), .stderr_output = proc.get_stderr()};
}

} // namespace batchgrader
