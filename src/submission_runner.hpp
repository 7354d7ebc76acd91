#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/config.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading/submission_grader.hpp>
#include <batchgrader/grading_session.hpp>

#include "output/serializer.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace batchgrader {

/// Grades every submission against the reference solution, on up to `GradingConfig::jobs` threads
class SubmissionRunner : NonCopyable
{
public:
    SubmissionRunner(const GradingConfig& config, std::vector<TestCase> tests,
                     const std::shared_ptr<Serializer>& serializer);

    /// Runs the reference solution, then every submission. Rows of the returned (finalized) matrix
    /// are in the order of `submissions`, regardless of the order in which grading finished.
    ///
    /// Throws `OracleError` before any submission is graded if the reference solution fails
    ResultMatrix run_all(const std::vector<Submission>& submissions);

    /// The reference outputs computed by `run_all`
    const ReferenceOutputs& get_reference();

private:
    std::vector<SubmissionResult> grade_all(const SubmissionGrader& grader, const std::vector<Submission>& submissions);

    /// Calls `func` with the serializer, holding the serializer's lock
    template <typename Func>
    void with_serializer(Func&& func);

    const GradingConfig* config_;
    std::vector<TestCase> tests_;
    std::shared_ptr<Serializer> serializer_;
    ReferenceOracle oracle_;

    std::mutex serializer_mutex_;
};

template <typename Func>
void SubmissionRunner::with_serializer(Func&& func) {
    std::scoped_lock lock{serializer_mutex_};
    std::forward<Func>(func)(*serializer_);
}

} // namespace batchgrader
