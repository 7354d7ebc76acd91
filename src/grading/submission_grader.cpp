#include <batchgrader/grading/submission_grader.hpp>

#include <batchgrader/config.hpp>
#include <batchgrader/grading/build_runner.hpp>
#include <batchgrader/grading/comparator.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/test_executor.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/sandbox/sandbox.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <string>
#include <utility>

namespace batchgrader {

SubmissionGrader::SubmissionGrader(const GradingConfig& config, const ReferenceOutputs& reference)
    : config_{&config}
    , reference_{&reference}
    , build_runner_{config.build_command}
    , test_executor_{config.test_command, config.timeout} {}

SubmissionResult SubmissionGrader::grade(const Submission& submission) const {
    SubmissionResult result{.id = submission.id};

    LOG_INFO("Grading {} ({})", submission.id, submission.dir);

    auto sandbox = Sandbox::create(config_->sandbox_root, submission.id, config_->keep_sandboxes);

    if (!sandbox) {
        LOG_ERROR("{}: {}", submission.id, sandbox.error());
        result.assembly_error = AssemblyError{.kind = AssemblyError::Kind::CopyFailure, .detail = sandbox.error()};
        result.state = SubmissionState::BuildFailed;
        fail_all_tests(result);
        return result;
    }

    if (auto res = sandbox->assemble(config_->context_dir, submission.dir, config_->file_selection); !res) {
        LOG_INFO("{}: {}", submission.id, res.error());
        result.assembly_error = res.error();
        result.state = SubmissionState::BuildFailed;
        fail_all_tests(result);
        return result;
    }

    result.state = SubmissionState::SandboxBuilt;

    result.build = build_runner_.run(sandbox->path());

    if (!result.build->succeeded) {
        LOG_INFO("{}: build failed", submission.id);
        result.state = SubmissionState::BuildFailed;
        fail_all_tests(result);
        return result;
    }

    result.state = SubmissionState::BuildSucceeded;

    for (const TestCase& test : reference_->get_tests()) {
        result.tests.push_back(run_test(sandbox->path(), test));
        result.state = SubmissionState::PerTestExecuted;
    }

    result.state = SubmissionState::Recorded;

    LOG_INFO("{}: passed {}/{}", submission.id, result.num_passed(), result.num_total());

    return result;
}

TestRecord SubmissionGrader::run_test(const std::filesystem::path& sandbox_dir, const TestCase& test) const {
    TestRecord record{.name = test.name};

    auto execution = test_executor_.run(sandbox_dir, test);

    if (!execution) {
        LOG_ERROR("Could not run test {} in {}: {}", test.name, sandbox_dir, execution.error());
        record.outcome = Outcome::Error;
        record.error_output = fmt::format("could not run test command: {}", execution.error());
        return record;
    }

    record.outcome = classify(*execution, reference_->output_for(test.name));
    record.run_result = execution->run_result;
    record.actual_output = std::move(execution->stdout_output);
    record.error_output = std::move(execution->stderr_output);

    return record;
}

void SubmissionGrader::fail_all_tests(SubmissionResult& result) const {
    result.tests.clear();

    for (const TestCase& test : reference_->get_tests()) {
        result.tests.push_back(TestRecord{.name = test.name, .outcome = Outcome::Error});
    }
}

} // namespace batchgrader
