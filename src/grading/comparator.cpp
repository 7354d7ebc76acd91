#include <batchgrader/grading/comparator.hpp>

#include <batchgrader/grading/test_executor.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <libassert/assert.hpp>

#include <string_view>

namespace batchgrader {

Outcome compare_outputs(std::string_view actual, std::string_view expected) {
    return actual == expected ? Outcome::Pass : Outcome::Fail;
}

Outcome classify(const TestExecution& execution, std::string_view reference_output) {
    switch (execution.run_result.get_kind()) {
    case RunResult::Kind::TimedOut:
        return Outcome::Timeout;
    case RunResult::Kind::Killed:
        return Outcome::Error;
    case RunResult::Kind::Exited:
        if (execution.run_result.get_code() != 0) {
            return Outcome::Error;
        }
        return compare_outputs(execution.stdout_output, reference_output);
    }

    UNREACHABLE("Invalid RunResult kind");
}

} // namespace batchgrader
