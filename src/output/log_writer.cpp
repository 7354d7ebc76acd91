#include "output/log_writer.hpp"

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>

#include "output/file_sink.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <libassert/assert.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace batchgrader {

namespace {

constexpr std::string_view NO_NEWLINE_MARKER = "\\ no newline at end of output\n";

/// Appends `text` verbatim, terminating it with a newline marker if it lacks one
void append_block(std::string& out, std::string_view text) {
    if (text.empty()) {
        return;
    }

    out += text;

    if (!text.ends_with('\n')) {
        out += '\n';
        out += NO_NEWLINE_MARKER;
    }
}

std::string describe_outcome(const TestRecord& record) {
    switch (record.outcome) {
    case Outcome::Pass:
        return "passed";
    case Outcome::Fail:
        return "failed";
    case Outcome::Timeout:
        return "timed out";
    case Outcome::Error:
        if (record.run_result) {
            return fmt::format("test execution failed ({})", *record.run_result);
        }
        return "test execution failed";
    }

    UNREACHABLE("Invalid Outcome");
}

void append_test_section(std::string& out, const TestRecord& record, const ReferenceOutputs& reference) {
    out += fmt::format("\n=== {} ===\n", record.name);
    out += fmt::format("{}: {}\n", record.name, describe_outcome(record));

    // A timed out test's output is partial; only the marker is kept
    if (record.outcome != Outcome::Timeout) {
        out += "-- actual output --\n";
        append_block(out, record.actual_output);
    }

    out += "-- expected output --\n";
    append_block(out, reference.output_for(record.name));

    if (!record.error_output.empty()) {
        out += "-- stderr --\n";
        append_block(out, record.error_output);
    }
}

} // namespace

std::string log_file_name(std::string_view submission_id) {
    return fmt::format("{}.txt", submission_id);
}

std::string render_log(const SubmissionResult& result, const ReferenceOutputs& reference) {
    std::string out;

    if (result.assembly_error) {
        // Nothing was built; the reason replaces the build log
        out += fmt::format("{}\n", *result.assembly_error);
    } else {
        out += "== build log ==\n";

        if (result.build) {
            append_block(out, result.build->output);
        }

        if (result.build_failed()) {
            if (result.build && result.build->run_result) {
                out += fmt::format("build failed ({})\n", *result.build->run_result);
            } else {
                out += "build failed\n";
            }
        }
    }

    // A build failure is recorded once, not once per test
    if (!result.build_failed()) {
        for (const TestRecord& record : result.tests) {
            if (!record.passed()) {
                append_test_section(out, record, reference);
            }
        }
    }

    out += fmt::format("\npassed {}/{}\n", result.num_passed(), result.num_total());

    return out;
}

void write_logs(const ResultMatrix& matrix, const ReferenceOutputs& reference, const std::filesystem::path& logs_dir) {
    std::error_code err;
    std::filesystem::create_directories(logs_dir, err);

    if (err) {
        throw IoError{fmt::format("Could not create logs directory {}: {}", logs_dir, err.message())};
    }

    for (const SubmissionResult& result : matrix.get_results()) {
        FileSink sink{logs_dir / log_file_name(result.id)};

        sink.write(render_log(result, reference));
        sink.close();

        LOG_DEBUG("Wrote log {}", sink.get_path());
    }
}

} // namespace batchgrader
