#pragma once

#include <batchgrader/grading/result_matrix.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace batchgrader {

/// Renders the outcome matrix as CSV: a header row `id,<test 1>,<test 2>,...` followed by one
/// row of outcome codes (P/F/E/T) per submission, in the order the matrix holds them
std::string render_summary(const ResultMatrix& matrix);

/// Writes `render_summary(matrix)` to `path`. Throws `IoError` on failure.
void write_summary(const ResultMatrix& matrix, const std::filesystem::path& path);

/// Quotes a CSV field if it contains a comma, a double quote, or a line break. See RFC 4180
std::string csv_escape(std::string_view field);

} // namespace batchgrader
