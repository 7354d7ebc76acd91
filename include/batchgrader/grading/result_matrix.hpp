#pragma once

#include <batchgrader/grading_session.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// Outcomes of every (submission, test) pair of a run.
/// Rows (submissions) and columns (tests) keep the order they were added in.
class ResultMatrix
{
public:
    explicit ResultMatrix(std::vector<std::string> test_names);

    /// Appends a row. Submission ids must be unique, and the matrix must not be finalized yet
    void add(SubmissionResult result);

    /// Makes the matrix read-only
    void finalize() { finalized_ = true; }

    bool is_finalized() const { return finalized_; }

    const std::vector<std::string>& get_test_names() const { return test_names_; }

    const std::vector<SubmissionResult>& get_results() const { return results_; }

    /// Empty if either the submission or the test is unknown
    std::optional<Outcome> outcome(std::string_view submission_id, std::string_view test_name) const;

    const SubmissionResult* find(std::string_view submission_id) const;

    std::size_t size() const { return results_.size(); }

    bool empty() const { return results_.empty(); }

    /// Number of submissions that passed every test
    std::size_t num_all_passed() const;

private:
    std::vector<std::string> test_names_;
    std::vector<SubmissionResult> results_;
    bool finalized_ = false;
};

} // namespace batchgrader
