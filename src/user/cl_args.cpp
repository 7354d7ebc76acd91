#include "user/cl_args.hpp"

#include <batchgrader/common/expected.hpp>
#include <batchgrader/config.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/version.hpp>

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace batchgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ BATCHGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

double parse_seconds(const std::string& opt) {
    std::size_t num_parsed = 0;
    double value = std::stod(opt, &num_parsed);

    if (num_parsed != opt.size()) {
        throw std::invalid_argument(fmt::format("Invalid number of seconds '{}'", opt));
    }

    return value;
}

int parse_count(const std::string& opt) {
    std::size_t num_parsed = 0;
    int value = std::stoi(opt, &num_parsed);

    if (num_parsed != opt.size()) {
        throw std::invalid_argument(fmt::format("Invalid count '{}'", opt));
    }

    return value;
}

} // namespace

void CommandLineArgs::adjust_verbosity(int delta) {
    constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(VerbosityLevel::Max);
    constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(VerbosityLevel::Silent);

    const auto new_value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + delta;

    if (new_value > MAX_VERBOSITY_VALUE) {
        throw std::invalid_argument("Verbosity specification exceeds maximum level");
    }
    if (new_value < MIN_VERBOSITY_VALUE) {
        throw std::invalid_argument("Verbosity specification is lower than minimum level");
    }

    opts_buffer_.verbosity = static_cast<VerbosityLevel>(new_value);
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout); term_sz && term_sz->ws_col > 0) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("BatchGrader v{}\nRuns every test input against a reference solution "
                                            "and each submission, and compares their outputs.",
                                            BATCHGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("submissions")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.submissions_path = opt; })
        .help("Directory with one subdirectory per submission (or a single submission, with --single)");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", BATCHGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("--file")
        .metavar("NAME")
        .append()
        .action([this] (const std::string& opt) { opts_buffer_.file_names.push_back(opt); })
        .help("Student submission file name. May be repeated. If never given, every file is collected.");

    arg_parser_.add_argument("--context")
        .metavar("DIR")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.context_dir = opt; })
        .help("Directory with scaffolding files, copied into every sandbox");

    arg_parser_.add_argument("--build")
        .metavar("CMD")
        .default_value(std::string{GradingConfig::DEFAULT_BUILD_COMMAND})
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.build_command = opt; })
        .help("Shell command to build submissions. An empty command skips the build step.");

    arg_parser_.add_argument("--tests")
        .metavar("DIR")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.tests_dir = opt; })
        .help("Directory of test input files to run");

    arg_parser_.add_argument("--test")
        .metavar("CMD")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.test_command = opt; })
        .help("Shell command to run each test; \"$0\" is the path of the test input file");

    arg_parser_.add_argument("--solution")
        .metavar("DIR")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.solution_dir = opt; })
        .help("Pseudo-submission with the correct solution");

    arg_parser_.add_argument("--logs")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.logs_dir = opt; })
        .help("Directory to write one log file per submission to");

    arg_parser_.add_argument("--summary")
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.summary_path = opt; })
        .help("CSV file to write summary data to");

    arg_parser_.add_argument("--timeout")
        .metavar("SECONDS")
        .default_value(GradingConfig::DEFAULT_TIMEOUT_SECONDS)
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.timeout_seconds = parse_seconds(opt); })
        .help("Seconds to wait for each test");

    arg_parser_.add_argument("--single")
        .flag()
        .store_into(opts_buffer_.single)
        .help("Grade one submission, not a parent directory of them");

    arg_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .default_value(1)
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.jobs = parse_count(opt); })
        .help("Number of submissions graded concurrently");

    arg_parser_.add_argument("--keep-sandboxes")
        .flag()
        .store_into(opts_buffer_.keep_sandboxes)
        .help("Leave sandbox directories on disk for inspection");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) { adjust_verbosity(+1); })
        .append()
        .help("Increase verbosity level (list every test)");

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) { adjust_verbosity(-1); })
        .append()
        .help("Decrease verbosity level (up to 2x)");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on

    opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace batchgrader
