#pragma once

#include <batchgrader/command_template.hpp>
#include <batchgrader/grading_session.hpp>

#include <filesystem>

namespace batchgrader {

/// Runs the configured build command inside a sandbox
class BuildRunner
{
public:
    explicit BuildRunner(CommandTemplate build_command);

    /// Runs the build with `sandbox_dir` as its working directory, capturing combined stdout and stderr.
    /// A failing build is reported in the returned record, never thrown. No timeout is applied.
    ///
    /// An empty build command is an immediate success with no output.
    BuildRecord run(const std::filesystem::path& sandbox_dir) const;

private:
    CommandTemplate build_command_;
};

} // namespace batchgrader
