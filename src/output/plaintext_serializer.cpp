#include "output/plaintext_serializer.hpp"

#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace batchgrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_begin(std::size_t num_submissions, std::size_t num_tests) {
    if (!should_output_submission_details(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("Grading {} {} against {} {}\n", num_submissions, pluralize("submission", num_submissions),
                            num_tests, pluralize("test", num_tests)));
}

void PlainTextSerializer::on_reference_begin(const std::filesystem::path& solution_dir) {
    if (!should_output_submission_details(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("{} ({})\n", style_str("solution", POP_OUT_STYLE), solution_dir.string()));
}

void PlainTextSerializer::on_reference_end(const ReferenceOutputs& outputs) {
    if (!should_output_progress(verbosity_)) {
        return;
    }

    const std::size_t num_tests = outputs.get_tests().size();

    sink_.write(fmt::format("  reference output of {} {} recorded\n", num_tests, pluralize("test", num_tests)));
}

void PlainTextSerializer::on_submission_begin(const Submission& submission) {
    if (!should_output_progress(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("grading {}...\n", style_str(submission.id, VALUE_STYLE)));
}

void PlainTextSerializer::on_submission_result(const SubmissionResult& result) {
    const auto num_passed = static_cast<std::size_t>(result.num_passed());
    const auto num_total = static_cast<std::size_t>(result.num_total());

    std::string problem;

    if (result.assembly_error) {
        problem = fmt::format("{}", *result.assembly_error);
    } else if (result.build_failed()) {
        problem = "build failed";

        if (result.build && result.build->run_result) {
            problem += fmt::format(" ({})", *result.build->run_result);
        }
    }

    // Short form; a single line of the form:
    // NAME: 3/4 passed
    if (should_output_submission_line(verbosity_)) {
        std::string out = fmt::format("{}: {}/{} passed", style_str(result.id, POP_OUT_STYLE), num_passed, num_total);

        if (!problem.empty()) {
            out += fmt::format(" ({})", style_str(problem, ERROR_STYLE));
        }

        sink_.write(out + "\n");
        return;
    }

    if (!should_output_submission_details(verbosity_)) {
        return;
    }

    std::string out = style_str(result.id, POP_OUT_STYLE) + "\n";

    if (!problem.empty()) {
        out += fmt::format("  {}\n", style_str(problem, ERROR_STYLE));
    } else {
        for (const TestRecord& record : result.tests) {
            if (should_output_test(verbosity_, record.passed())) {
                out += test_line(record);
            }
        }
    }

    const auto passed_style = (num_passed == num_total) ? SUCCESS_STYLE : ERROR_STYLE;
    out += fmt::format("  passed {}\n", style_str(fmt::format("{}/{}", num_passed, num_total), passed_style));

    sink_.write(out);
}

void PlainTextSerializer::on_run_result(const ResultMatrix& matrix) {
    if (!should_output_run_summary(verbosity_)) {
        return;
    }

    const std::size_t num_graded = matrix.size();
    const std::size_t num_all_passed = matrix.num_all_passed();

    std::string passed_msg = fmt::format("{} passed every test", num_all_passed);

    std::string out = line_divider_em(terminal_width_) + "\n";
    out += fmt::format("Graded {} {}: {}\n", num_graded, pluralize("submission", num_graded),
                       style_str(passed_msg, num_all_passed == num_graded ? SUCCESS_STYLE : WARNING_STYLE));

    sink_.write(out);
}

void PlainTextSerializer::on_artifact_written(std::string_view what, const std::filesystem::path& path) {
    if (!should_output_submission_details(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("Wrote {} to {}\n", what, style_str(path.string(), VALUE_STYLE)));
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_.write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::test_line(const TestRecord& record) const {
    switch (record.outcome) {
    case Outcome::Pass:
        return fmt::format("  test {} {}\n", record.name, style_str("passed", SUCCESS_STYLE));
    case Outcome::Fail:
        return fmt::format("  test {} {}\n", record.name, style_str("failed", ERROR_STYLE));
    case Outcome::Timeout:
        return fmt::format("  test {} {}\n", record.name, style_str("timed out", ERROR_STYLE));
    case Outcome::Error:
        if (record.run_result) {
            return fmt::format("  test {} {} ({})\n", record.name, style_str("errored", ERROR_STYLE),
                               *record.run_result);
        }
        return fmt::format("  test {} {}\n", record.name, style_str("errored", ERROR_STYLE));
    }

    return fmt::format("  test {}\n", record.name);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    std::size_t result = width.value_or(DEFAULT_WIDTH);

    // Not a terminal, or a terminal that doesn't report its size
    return result == 0 ? DEFAULT_WIDTH : result;
}

} // namespace batchgrader
