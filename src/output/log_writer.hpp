#pragma once

#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace batchgrader {

/// Renders the human-readable log of one submission: its build output, a section for every test that
/// did not pass (with the reference output next to the actual one), and a final `passed N/M` line.
std::string render_log(const SubmissionResult& result, const ReferenceOutputs& reference);

/// Writes `<id>.txt` for every submission of `matrix` into `logs_dir`, creating the directory if needed.
/// Throws `IoError` on failure.
void write_logs(const ResultMatrix& matrix, const ReferenceOutputs& reference, const std::filesystem::path& logs_dir);

/// Name of the log file of the given submission
std::string log_file_name(std::string_view submission_id);

} // namespace batchgrader
