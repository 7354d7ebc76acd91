#pragma once

#include <batchgrader/grading/test_executor.hpp>
#include <batchgrader/grading_session.hpp>

#include <string_view>

namespace batchgrader {

/// `Pass` iff `actual` and `expected` are byte-for-byte equal, otherwise `Fail`
Outcome compare_outputs(std::string_view actual, std::string_view expected);

/// Outcome of a test run against the reference output for the same test.
/// Timeouts and abnormal exits are classified without looking at the output.
Outcome classify(const TestExecution& execution, std::string_view reference_output);

} // namespace batchgrader
