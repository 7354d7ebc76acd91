#include "user/program_options.hpp"

#include <batchgrader/command_template.hpp>
#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/expected.hpp>
#include <batchgrader/config.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace batchgrader {

namespace fs = std::filesystem;

Expected<void, std::string> ProgramOptions::ensure_file_exists(const fs::path& path, std::string_view what) {
    if (!fs::exists(path)) {
        return fmt::format("{} '{}' does not exist", what, path.string());
    }

    return {};
}

Expected<void, std::string> ProgramOptions::ensure_is_directory(const fs::path& path, std::string_view what) {
    TRY(ensure_file_exists(path, what));

    if (!fs::is_directory(path)) {
        return fmt::format("{} '{}' is not a directory", what, path.string());
    }

    return {};
}

Expected<void, std::string> ProgramOptions::validate() {
    // Verbosity is just clamped to [MIN, MAX]
    constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
    constexpr auto MIN_VERBOSITY = VerbosityLevel{};

    verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

    TRY(ensure_is_directory(context_dir, "Context directory"));
    TRY(ensure_is_directory(tests_dir, "Tests directory"));
    TRY(ensure_is_directory(solution_dir, "Solution directory"));
    TRY(ensure_is_directory(submissions_path, single ? "Submission directory" : "Submissions directory"));

    TRY(CommandTemplate::parse(test_command, CommandTemplate::SlotPolicy::Required));
    TRY(CommandTemplate::parse(build_command, CommandTemplate::SlotPolicy::None));

    if (!std::isfinite(timeout_seconds) || timeout_seconds <= 0) {
        return fmt::format("Timeout must be a positive number of seconds (got {})", timeout_seconds);
    }

    // Must fit into the microsecond duration the subprocess deadline is kept in
    constexpr double MAX_TIMEOUT_SECONDS = std::chrono::duration<double>{std::chrono::microseconds::max()}.count();

    if (timeout_seconds >= MAX_TIMEOUT_SECONDS) {
        return fmt::format("Timeout of {} seconds is too large", timeout_seconds);
    }

    if (jobs < 1) {
        return fmt::format("Number of jobs must be at least 1 (got {})", jobs);
    }

    for (const std::string& name : file_names) {
        const fs::path file_path{name};

        if (name.empty() || file_path.is_absolute()) {
            return fmt::format("Submission file name '{}' must be a non-empty relative path", name);
        }

        for (const fs::path& part : file_path) {
            if (part == "..") {
                return fmt::format("Submission file name '{}' must not refer to a parent directory", name);
            }
        }
    }

    if (logs_dir && fs::exists(*logs_dir) && !fs::is_directory(*logs_dir)) {
        return fmt::format("Logs directory '{}' is not a directory", logs_dir->string());
    }

    if (summary_path && fs::is_directory(*summary_path)) {
        return fmt::format("Summary file '{}' is a directory", summary_path->string());
    }

    return {};
}

GradingConfig ProgramOptions::to_config() const {
    ProgramOptions opts = *this;

    if (auto res = opts.validate(); !res) {
        throw ConfigError{res.error()};
    }

    // Both were just validated
    auto test_cmd = CommandTemplate::parse(opts.test_command, CommandTemplate::SlotPolicy::Required);
    auto build_cmd = CommandTemplate::parse(opts.build_command, CommandTemplate::SlotPolicy::None);

    if (!test_cmd || !build_cmd) {
        throw ConfigError{test_cmd ? build_cmd.error() : test_cmd.error()};
    }

    const auto timeout =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::duration<double>{opts.timeout_seconds});

    GradingConfig config{
        .context_dir = fs::absolute(opts.context_dir),
        .file_selection = make_file_selection(std::set<std::string>{opts.file_names.begin(), opts.file_names.end()}),
        .tests_dir = fs::absolute(opts.tests_dir),
        .test_command = *test_cmd,
        .build_command = *build_cmd,
        .solution_dir = fs::absolute(opts.solution_dir),
        .logs_dir = opts.logs_dir,
        .summary_path = opts.summary_path,
        .timeout = timeout,
        .jobs = static_cast<std::size_t>(opts.jobs),
        .keep_sandboxes = opts.keep_sandboxes,
    };

    LOG_DEBUG("Configuration: context={}, tests={}, solution={}, timeout={}, jobs={}", config.context_dir,
              config.tests_dir, config.solution_dir, config.timeout, config.jobs);

    return config;
}

} // namespace batchgrader
