#include "app/grader_app.hpp"

#include <batchgrader/config.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/log_writer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "output/summary_writer.hpp"
#include "submission_runner.hpp"
#include "user/program_options.hpp"
#include "user/submission_discovery.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <gsl/util>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

int GraderApp::run_impl() {
    StdoutSink output_sink;
    std::shared_ptr output_serializer =
        std::make_shared<PlainTextSerializer>(output_sink, OPTS.colorize_option, OPTS.verbosity);

    // Whatever was written so far still reaches stdout, even when the run is aborted
    auto flush_output = gsl::finally([&output_serializer] { output_serializer->finalize(); });

    try {
        return grade(output_serializer);
    } catch (const ConfigError& err) {
        report_fatal("configuration error", err.what());
    } catch (const OracleError& err) {
        report_fatal("reference solution failed", fmt::to_string(err), err.get_details());
    } catch (const IoError& err) {
        report_fatal("could not write results", err.what());
    }

    return EXIT_FAILURE;
}

int GraderApp::grade(const std::shared_ptr<Serializer>& serializer) const {
    const GradingConfig config = OPTS.to_config();

    std::vector<TestCase> tests = discover_tests(config.tests_dir);
    std::vector<Submission> submissions = discover_submissions(OPTS.submissions_path, OPTS.single);

    if (tests.empty()) {
        serializer->on_warning(fmt::format("No tests found in {}", config.tests_dir.string()));
    }
    if (submissions.empty()) {
        serializer->on_warning(fmt::format("No submissions found in {}", OPTS.submissions_path.string()));
    }

    SubmissionRunner runner{config, std::move(tests), serializer};

    const ResultMatrix matrix = runner.run_all(submissions);

    write_artifacts(config, matrix, runner.get_reference(), *serializer);

    return EXIT_SUCCESS;
}

void GraderApp::write_artifacts(const GradingConfig& config, const ResultMatrix& matrix,
                                const ReferenceOutputs& reference, Serializer& serializer) {
    if (config.logs_dir) {
        write_logs(matrix, reference, *config.logs_dir);
        serializer.on_artifact_written("logs", *config.logs_dir);
    }

    if (config.summary_path) {
        write_summary(matrix, *config.summary_path);
        serializer.on_artifact_written("summary", *config.summary_path);
    }
}

void GraderApp::report_fatal(std::string_view kind, std::string_view msg, std::string_view details) const {
    using enum ProgramOptions::ColorizeOpt;

    const bool colorize = OPTS.colorize_option == Always ||
                          (OPTS.colorize_option == Auto && in_terminal(stderr) && is_color_terminal());

    std::string line = fmt::format("error: {}: {}", kind, msg);

    LOG_DEBUG("Aborting run: {}", line);

    if (colorize) {
        fmt::print(stderr, "{}\n", fmt::styled(line, fmt::fg(fmt::color::red) | fmt::emphasis::bold));
    } else {
        fmt::print(stderr, "{}\n", line);
    }

    if (!details.empty()) {
        fmt::print(stderr, "{}{}", details, details.ends_with('\n') ? "" : "\n");
    }
}

} // namespace batchgrader
