#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/config.hpp>
#include <batchgrader/grading_session.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace batchgrader {

/// The canonical output of the reference solution for every test.
/// Read-only once computed; shared by every submission's comparisons.
class ReferenceOutputs
{
public:
    ReferenceOutputs(std::vector<TestCase> tests, std::unordered_map<std::string, std::string> outputs);

    /// In run order
    const std::vector<TestCase>& get_tests() const { return tests_; }

    /// The reference stdout of the named test, which must be one of `get_tests()`
    const std::string& output_for(const std::string& test_name) const;

private:
    std::vector<TestCase> tests_;
    std::unordered_map<std::string, std::string> outputs_;
};

/// Assembles, builds, and runs every test against the solution directory, exactly once.
class ReferenceOracle : NonCopyable
{
public:
    ReferenceOracle(const GradingConfig& config, std::vector<TestCase> tests);

    /// Computes the reference outputs on the first call; later calls return the same object
    ///
    /// Throws `OracleError` if the solution's sandbox cannot be assembled, its build fails, or
    /// any of its tests does not exit successfully (including timeouts)
    const ReferenceOutputs& get_outputs();

private:
    ReferenceOutputs compute() const;

    const GradingConfig* config_;
    std::vector<TestCase> tests_;
    std::optional<ReferenceOutputs> outputs_;
};

} // namespace batchgrader
