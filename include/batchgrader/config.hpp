#pragma once

#include <batchgrader/command_template.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>

namespace batchgrader {

/// Copy every entry of the source directory into the sandbox
struct CollectAll
{
    bool operator==(const CollectAll&) const = default;
};

/// Copy exactly the named files of the source directory; each one must exist
struct CollectNamed
{
    std::set<std::string> names;

    bool operator==(const CollectNamed&) const = default;
};

using FileSelection = std::variant<CollectAll, CollectNamed>;

/// `CollectAll` for an empty set of names, otherwise `CollectNamed`
FileSelection make_file_selection(std::set<std::string> names);

/// Immutable settings for one grading run
struct GradingConfig
{
    std::filesystem::path context_dir;
    FileSelection file_selection;
    std::filesystem::path tests_dir;
    CommandTemplate test_command;
    CommandTemplate build_command;
    std::filesystem::path solution_dir;

    std::optional<std::filesystem::path> logs_dir;
    std::optional<std::filesystem::path> summary_path;

    /// Wall-clock limit for every test execution (not builds)
    std::chrono::microseconds timeout;

    /// Number of submissions graded concurrently
    std::size_t jobs = 1;

    /// Leave sandbox directories on disk after grading, for inspection
    bool keep_sandboxes = false;

    /// Directory that sandboxes are created in
    std::filesystem::path sandbox_root = std::filesystem::temp_directory_path();

    static constexpr std::string_view DEFAULT_BUILD_COMMAND = "make";
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 5.0;
};

} // namespace batchgrader
