#pragma once

#include <batchgrader/grading_session.hpp>

#include <filesystem>
#include <vector>

namespace batchgrader {

/// The test cases of `tests_dir`: every non-hidden regular file, sorted by name, with absolute paths
std::vector<TestCase> discover_tests(const std::filesystem::path& tests_dir);

/// In multiple mode, every non-hidden subdirectory of `path` (sorted by name) is a submission.
/// In single mode, `path` itself is the only submission, identified by its basename.
std::vector<Submission> discover_submissions(const std::filesystem::path& path, bool single);

} // namespace batchgrader
