#include <batchgrader/grading/result_matrix.hpp>

#include <batchgrader/grading_session.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

ResultMatrix::ResultMatrix(std::vector<std::string> test_names)
    : test_names_{std::move(test_names)} {}

void ResultMatrix::add(SubmissionResult result) {
    ASSERT(!finalized_, "Attempted to add to a finalized result matrix", result.id);
    ASSERT(find(result.id) == nullptr, "Duplicate submission id", result.id);

    results_.push_back(std::move(result));
}

std::optional<Outcome> ResultMatrix::outcome(std::string_view submission_id, std::string_view test_name) const {
    const SubmissionResult* result = find(submission_id);

    if (result == nullptr) {
        return std::nullopt;
    }

    return result->outcome_of(test_name);
}

const SubmissionResult* ResultMatrix::find(std::string_view submission_id) const {
    auto iter = ranges::find(results_, submission_id, &SubmissionResult::id);

    if (iter == results_.end()) {
        return nullptr;
    }

    return &*iter;
}

std::size_t ResultMatrix::num_all_passed() const {
    return static_cast<std::size_t>(ranges::count_if(results_, &SubmissionResult::all_passed));
}

} // namespace batchgrader
