#pragma once

#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace batchgrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_run_begin(std::size_t num_submissions, std::size_t num_tests) override;

    void on_reference_begin(const std::filesystem::path& solution_dir) override;
    void on_reference_end(const ReferenceOutputs& outputs) override;

    void on_submission_begin(const Submission& submission) override;
    void on_submission_result(const SubmissionResult& result) override;

    void on_run_result(const ResultMatrix& matrix) override;

    void on_artifact_written(std::string_view what, const std::filesystem::path& path) override;

    void on_warning(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// One line describing a single test's outcome, e.g. "  test 03.in timed out"
    std::string test_line(const TestRecord& record) const;

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("submission", 1) => "submission"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - failed builds and tests, fatal errors, etc.
    //   success  - passed tests
    //   pop out  - submission names
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE = fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static std::string line_divider(std::size_t len) { return std::string(len, '-'); }
    static std::string line_divider_em(std::size_t len) { return std::string(len, '='); }

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace batchgrader
