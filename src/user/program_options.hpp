#pragma once

#include <batchgrader/common/expected.hpp>
#include <batchgrader/config.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// Raw values of the command line, before validation
struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for console progress output
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Submission files to collect; empty means everything
    std::vector<std::string> file_names;

    std::filesystem::path context_dir;
    std::string build_command = std::string{GradingConfig::DEFAULT_BUILD_COMMAND};
    std::filesystem::path tests_dir;
    std::string test_command;
    std::filesystem::path solution_dir;

    std::optional<std::filesystem::path> logs_dir;
    std::optional<std::filesystem::path> summary_path;

    double timeout_seconds = GradingConfig::DEFAULT_TIMEOUT_SECONDS;

    /// `submissions_path` is a single submission rather than a directory of them
    bool single = false;

    int jobs = 1;
    bool keep_sandboxes = false;

    std::filesystem::path submissions_path;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    /// Verify that all fields are valid and consistent with each other
    Expected<void, std::string> validate();

    /// Builds the immutable configuration of a run. Throws `ConfigError` if `validate()` fails.
    GradingConfig to_config() const;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path, std::string_view what);

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path, std::string_view what);
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::ProgramOptions> : formatter<std::string>
{
    auto format(const ::batchgrader::ProgramOptions& from, format_context& ctx) const {
        std::string str =
            fmt::format("{{verbosity={}, color_opt={}, files=[{}], context={}, build='{}', tests={}, test='{}', "
                        "solution={}, logs={}, summary={}, timeout={}s, single={}, jobs={}, keep_sandboxes={}, "
                        "submissions={}}}",
                        fmt::underlying(from.verbosity), fmt::underlying(from.colorize_option),
                        fmt::join(from.file_names, ", "), from.context_dir, from.build_command, from.tests_dir,
                        from.test_command, from.solution_dir, from.logs_dir.value_or("<none>"),
                        from.summary_path.value_or("<none>"), from.timeout_seconds, from.single, from.jobs,
                        from.keep_sandboxes, from.submissions_path);

        return formatter<std::string>::format(str, ctx);
    }
};
