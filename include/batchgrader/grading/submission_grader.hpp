#pragma once

#include <batchgrader/config.hpp>
#include <batchgrader/grading/build_runner.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/test_executor.hpp>
#include <batchgrader/grading_session.hpp>

#include <filesystem>

namespace batchgrader {

/// Takes a single submission through the whole pipeline: sandbox assembly, build, and every test
///
/// Safe to use from several threads at once; every call owns its own sandbox.
class SubmissionGrader
{
public:
    SubmissionGrader(const GradingConfig& config, const ReferenceOutputs& reference);

    /// Failures of the submission itself (missing files, failed build, failing tests) are recorded
    /// in the result and never thrown
    SubmissionResult grade(const Submission& submission) const;

private:
    TestRecord run_test(const std::filesystem::path& sandbox_dir, const TestCase& test) const;

    /// Records every test as `Error` without running it
    void fail_all_tests(SubmissionResult& result) const;

    const GradingConfig* config_;
    const ReferenceOutputs* reference_;

    BuildRunner build_runner_;
    TestExecutor test_executor_;
};

} // namespace batchgrader
