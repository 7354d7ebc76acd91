#include "user/submission_discovery.hpp"

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/functional/comparisons.hpp>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace batchgrader {

namespace fs = std::filesystem;

namespace {

bool is_hidden(const fs::path& path) {
    return path.filename().string().starts_with('.');
}

/// Entries of `dir` satisfying `pred`, excluding hidden ones, sorted by file name
template <typename Pred>
std::vector<fs::path> list_entries(const fs::path& dir, Pred pred) {
    std::vector<fs::path> entries;

    std::error_code err;
    fs::directory_iterator iter{dir, err};

    if (err) {
        throw ConfigError{fmt::format("Could not read directory {}: {}", dir, err.message())};
    }

    for (const fs::directory_entry& entry : iter) {
        if (is_hidden(entry.path()) || !pred(entry)) {
            continue;
        }

        entries.push_back(entry.path());
    }

    ranges::sort(entries, ranges::less{}, [](const fs::path& path) { return path.filename().string(); });

    return entries;
}

} // namespace

std::vector<TestCase> discover_tests(const fs::path& tests_dir) {
    std::vector<TestCase> tests;

    // is_regular_file follows symlinks, so linked inputs count as tests too
    for (const fs::path& path : list_entries(tests_dir, [](const fs::directory_entry& entry) {
             std::error_code err;
             return entry.is_regular_file(err);
         })) {
        tests.push_back(TestCase{.name = path.filename().string(), .path = fs::absolute(path)});
    }

    LOG_DEBUG("Discovered {} tests in {}", tests.size(), tests_dir);

    return tests;
}

std::vector<Submission> discover_submissions(const fs::path& path, bool single) {
    if (single) {
        // "subs/stu1/" should still be identified as "stu1"
        fs::path normalized = fs::absolute(path).lexically_normal();
        if (!normalized.has_filename()) {
            normalized = normalized.parent_path();
        }

        return {Submission{.id = normalized.filename().string(), .dir = normalized}};
    }

    std::vector<Submission> submissions;

    for (const fs::path& dir : list_entries(path, [](const fs::directory_entry& entry) {
             std::error_code err;
             return entry.is_directory(err);
         })) {
        submissions.push_back(Submission{.id = dir.filename().string(), .dir = fs::absolute(dir)});
    }

    LOG_DEBUG("Discovered {} submissions in {}", submissions.size(), path);

    return submissions;
}

} // namespace batchgrader
