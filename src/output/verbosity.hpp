#pragma once

namespace batchgrader {

/// How much progress output is written while grading.
/// `Max` is just used as a sentinal
enum class VerbosityLevel {
    Silent,  ///< Nothing; only the exit code and the written artifacts
    Quiet,   ///< One line per submission, plus the final tally
    Summary, ///< Non-passing tests of every submission
    All,     ///< Every test of every submission
    Max
};

/// See \ref VerbosityLevel
constexpr bool should_output_test(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !passed));
}

/// See \ref VerbosityLevel
constexpr bool should_output_submission_details(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Summary);
}

/// See \ref VerbosityLevel
constexpr bool should_output_submission_line(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level == Quiet);
}

/// See \ref VerbosityLevel
constexpr bool should_output_progress(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= All);
}

/// See \ref VerbosityLevel
constexpr bool should_output_run_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level > Silent);
}

} // namespace batchgrader
