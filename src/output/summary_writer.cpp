#include "output/summary_writer.hpp"

#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>

#include "output/file_sink.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace batchgrader {

namespace {

constexpr std::string_view CRLF = "\r\n";

} // namespace

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }

    std::string escaped = "\"";

    for (char chr : field) {
        if (chr == '"') {
            escaped += '"';
        }
        escaped += chr;
    }

    escaped += '"';

    return escaped;
}

std::string render_summary(const ResultMatrix& matrix) {
    std::string out = "id";

    for (const std::string& test_name : matrix.get_test_names()) {
        out += ',';
        out += csv_escape(test_name);
    }
    out += CRLF;

    for (const SubmissionResult& result : matrix.get_results()) {
        out += csv_escape(result.id);

        for (const std::string& test_name : matrix.get_test_names()) {
            out += ',';

            // A missing cell can only come from a result built outside the grader; leave it empty
            if (auto outcome = result.outcome_of(test_name)) {
                out += outcome_code(*outcome);
            }
        }
        out += CRLF;
    }

    return out;
}

void write_summary(const ResultMatrix& matrix, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code err;
        std::filesystem::create_directories(path.parent_path(), err);

        if (err) {
            LOG_WARN("Could not create directory for summary {}: {}", path, err.message());
        }
    }

    FileSink sink{path};

    sink.write(render_summary(matrix));
    sink.close();

    LOG_DEBUG("Wrote summary of {} submissions to {}", matrix.size(), path);
}

} // namespace batchgrader
