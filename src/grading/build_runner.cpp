#include <batchgrader/grading/build_runner.hpp>

#include <batchgrader/command_template.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace batchgrader {

BuildRunner::BuildRunner(CommandTemplate build_command)
    : build_command_{std::move(build_command)} {}

BuildRecord BuildRunner::run(const std::filesystem::path& sandbox_dir) const {
    if (build_command_.empty()) {
        LOG_DEBUG("No build command; skipping build in {}", sandbox_dir);
        return {.succeeded = true, .output = "", .run_result = std::nullopt};
    }

    Subprocess proc{std::string{CommandTemplate::SHELL}, build_command_.to_shell_args(std::nullopt), sandbox_dir,
                    Subprocess::StderrMode::Merge};

    if (auto start_res = proc.start(); !start_res) {
        LOG_ERROR("Could not start build command '{}': {}", build_command_.text(), start_res.error());
        return {.succeeded = false,
                .output = fmt::format("could not start build command: {}", start_res.error()),
                .run_result = std::nullopt};
    }

    auto exit_res = proc.wait_for_exit();

    if (!exit_res) {
        LOG_ERROR("Lost track of build command '{}': {}", build_command_.text(), exit_res.error());

        if (auto kill_res = proc.kill(); !kill_res) {
            LOG_WARN("Failed to kill build command: {}", kill_res.error());
        }

        return {.succeeded = false,
                .output = fmt::format("{}\nbuild command failed: {}", proc.get_stdout(), exit_res.error()),
                .run_result = std::nullopt};
    }

    LOG_DEBUG("Build in {} finished with {}", sandbox_dir, *exit_res);

    return {.succeeded = exit_res->succeeded(), .output = proc.get_stdout(), .run_result = *exit_res};
}

} // namespace batchgrader
