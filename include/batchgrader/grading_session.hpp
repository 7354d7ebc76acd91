/// \file
/// Defines data classes to store result data for the current grading run
#pragma once

#include <batchgrader/sandbox/sandbox.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count.hpp>
#include <range/v3/algorithm/find.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// One test-input file; identified by its file name
struct TestCase
{
    std::string name;

    /// Absolute path of the input file, bound to the test command's slot
    std::filesystem::path path;

    bool operator==(const TestCase&) const = default;
};

/// One entity to be graded; identified by its directory name
struct Submission
{
    std::string id;
    std::filesystem::path dir;

    bool operator==(const Submission&) const = default;
};

enum class Outcome {
    Pass,   ///< Output exactly equals the reference output
    Fail,   ///< Completed normally, but the output differs
    Error,  ///< Nonzero exit, killed by a signal, or never executed (build failure)
    Timeout ///< Exceeded the configured wall-clock limit
};

/// Single letter used in the summary table
constexpr char outcome_code(Outcome outcome) {
    switch (outcome) {
    case Outcome::Pass:
        return 'P';
    case Outcome::Fail:
        return 'F';
    case Outcome::Error:
        return 'E';
    case Outcome::Timeout:
        return 'T';
    }

    return '?';
}

constexpr std::string_view to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Pass:
        return "Pass";
    case Outcome::Fail:
        return "Fail";
    case Outcome::Error:
        return "Error";
    case Outcome::Timeout:
        return "Timeout";
    }

    return "<invalid Outcome>";
}

/// How far a single submission got through the grading pipeline
///
///   NotStarted -> SandboxBuilt -> BuildFailed (terminal)
///                              -> BuildSucceeded -> PerTestExecuted* -> Recorded (terminal)
///
/// A sandbox that could not be assembled also ends in BuildFailed.
enum class SubmissionState { NotStarted, SandboxBuilt, BuildFailed, BuildSucceeded, PerTestExecuted, Recorded };

constexpr std::string_view to_string(SubmissionState state) {
    switch (state) {
    case SubmissionState::NotStarted:
        return "NotStarted";
    case SubmissionState::SandboxBuilt:
        return "SandboxBuilt";
    case SubmissionState::BuildFailed:
        return "BuildFailed";
    case SubmissionState::BuildSucceeded:
        return "BuildSucceeded";
    case SubmissionState::PerTestExecuted:
        return "PerTestExecuted";
    case SubmissionState::Recorded:
        return "Recorded";
    }

    return "<invalid SubmissionState>";
}

struct BuildRecord
{
    bool succeeded{};

    /// Combined stdout and stderr of the build command
    std::string output;

    /// Empty if there was no build step, or the command could not be started
    std::optional<RunResult> run_result;
};

struct TestRecord
{
    std::string name;
    Outcome outcome{};

    /// Captured stdout; partial (and never compared) for a timeout
    std::string actual_output;

    /// Captured stderr; only rendered in logs
    std::string error_output;

    /// Empty if the test was never executed
    std::optional<RunResult> run_result;

    constexpr bool passed() const noexcept { return outcome == Outcome::Pass; }
};

struct SubmissionResult
{
    std::string id;
    SubmissionState state = SubmissionState::NotStarted;

    /// Set if the sandbox could not be assembled; no build was attempted in that case
    std::optional<AssemblyError> assembly_error;

    /// Empty if the sandbox could not be assembled
    std::optional<BuildRecord> build;

    /// In test order
    std::vector<TestRecord> tests;

    bool build_failed() const noexcept { return state == SubmissionState::BuildFailed; }

    bool all_passed() const noexcept { return ranges::all_of(tests, &TestRecord::passed); }

    int num_passed() const noexcept {
        return gsl::narrow_cast<int>(ranges::count(tests, Outcome::Pass, &TestRecord::outcome));
    }

    int num_total() const noexcept { return gsl::narrow_cast<int>(tests.size()); }

    std::optional<Outcome> outcome_of(std::string_view test_name) const {
        auto iter = ranges::find(tests, test_name, &TestRecord::name);

        if (iter == tests.end()) {
            return std::nullopt;
        }

        return iter->outcome;
    }
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::Outcome> : formatter<std::string_view>
{
    auto format(::batchgrader::Outcome from, format_context& ctx) const {
        return formatter<std::string_view>::format(::batchgrader::to_string(from), ctx);
    }
};

template <>
struct fmt::formatter<::batchgrader::SubmissionState> : formatter<std::string_view>
{
    auto format(::batchgrader::SubmissionState from, format_context& ctx) const {
        return formatter<std::string_view>::format(::batchgrader::to_string(from), ctx);
    }
};
