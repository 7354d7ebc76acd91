#include "catch2_custom.hpp"

#include <batchgrader/config.hpp>
#include <batchgrader/exceptions.hpp>

#include "scratch_dir.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <chrono>
#include <filesystem>
#include <limits>
#include <span>
#include <string>
#include <variant>
#include <vector>

using namespace batchgrader;
using namespace std::chrono_literals;

namespace {

/// Options naming existing directories under `dir`
ProgramOptions make_valid_options(const ScratchDir& dir) {
    ProgramOptions opts;

    opts.context_dir = dir.make_dir("context");
    opts.tests_dir = dir.make_dir("tests");
    opts.solution_dir = dir.make_dir("solution");
    opts.submissions_path = dir.make_dir("subs");
    opts.test_command = "./prog < $0";

    return opts;
}

Expected<ProgramOptions, std::string> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "batchgrader");
    CommandLineArgs cl_args{std::span{args}};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Valid options produce a configuration") {
    ScratchDir dir;
    ProgramOptions opts = make_valid_options(dir);
    opts.file_names = {"main.ml", "util.ml", "main.ml"};
    opts.timeout_seconds = 1.5;
    opts.jobs = 4;

    REQUIRE(opts.validate());

    const GradingConfig config = opts.to_config();

    REQUIRE(config.context_dir == dir / "context");
    REQUIRE(config.test_command.text() == "./prog < $0");
    REQUIRE(config.build_command.text() == "make");
    REQUIRE(config.timeout == 1500ms);
    REQUIRE(config.jobs == 4);
    REQUIRE(config.file_selection == FileSelection{CollectNamed{{"main.ml", "util.ml"}}});
}

TEST_CASE("No file names means collect everything") {
    ScratchDir dir;
    const GradingConfig config = make_valid_options(dir).to_config();

    REQUIRE(std::holds_alternative<CollectAll>(config.file_selection));
}

TEST_CASE("Invalid options are rejected") {
    ScratchDir dir;
    ProgramOptions opts = make_valid_options(dir);

    SECTION("Missing directory") {
        opts.tests_dir = dir / "nope";
        REQUIRE_THAT(opts.validate().error(), Catch::Matchers::ContainsSubstring("does not exist"));
    }

    SECTION("File instead of directory") {
        opts.solution_dir = dir.write_file("file", "");
        REQUIRE_THAT(opts.validate().error(), Catch::Matchers::ContainsSubstring("not a directory"));
    }

    SECTION("Test command without the slot") {
        opts.test_command = "./prog";
        REQUIRE_FALSE(opts.validate());
    }

    SECTION("Build command with the slot") {
        opts.build_command = "make $0";
        REQUIRE_FALSE(opts.validate());
    }

    SECTION("Non-positive or non-finite timeout") {
        for (double timeout : {0.0, -1.0, std::numeric_limits<double>::infinity(),
                               std::numeric_limits<double>::quiet_NaN(), 1e13, 1e300,
                               std::numeric_limits<double>::max()}) {
            opts.timeout_seconds = timeout;
            REQUIRE_FALSE(opts.validate());
        }
    }

    SECTION("Large but representable timeout") {
        opts.timeout_seconds = 1e12;
        REQUIRE(opts.validate());
        REQUIRE(opts.to_config().timeout > std::chrono::microseconds::zero());
    }

    SECTION("No jobs") {
        opts.jobs = 0;
        REQUIRE_FALSE(opts.validate());
    }

    SECTION("File names escaping the submission") {
        for (const char* name : {"", "/etc/passwd", "../other/main.ml", "a/../../b"}) {
            opts.file_names = {name};
            REQUIRE_FALSE(opts.validate());
        }
    }

    SECTION("Summary path is a directory") {
        opts.summary_path = dir.path();
        REQUIRE_FALSE(opts.validate());
    }

    REQUIRE_THROWS_AS(opts.to_config(), ConfigError);
}

TEST_CASE("Command line parsing") {
    auto res = parse({"--context", "ctx", "--tests", "tests", "--test", "./prog $0", "--solution", "sol", "--file",
                      "a.ml", "--file", "b.ml", "--build", "", "--timeout", "2.5", "-j", "3", "--logs", "logs",
                      "--summary", "out.csv", "--single", "--keep-sandboxes", "-q", "-c", "never", "subs/stu1"});

    REQUIRE(res);

    const ProgramOptions& opts = *res;

    REQUIRE(opts.context_dir == "ctx");
    REQUIRE(opts.tests_dir == "tests");
    REQUIRE(opts.test_command == "./prog $0");
    REQUIRE(opts.solution_dir == "sol");
    REQUIRE(opts.file_names == std::vector<std::string>{"a.ml", "b.ml"});
    REQUIRE(opts.build_command.empty());
    REQUIRE(opts.timeout_seconds == 2.5);
    REQUIRE(opts.jobs == 3);
    REQUIRE(opts.logs_dir == std::filesystem::path{"logs"});
    REQUIRE(opts.summary_path == std::filesystem::path{"out.csv"});
    REQUIRE(opts.single);
    REQUIRE(opts.keep_sandboxes);
    REQUIRE(opts.verbosity == VerbosityLevel::Quiet);
    REQUIRE(opts.colorize_option == ProgramOptions::ColorizeOpt::Never);
    REQUIRE(opts.submissions_path == "subs/stu1");
}

TEST_CASE("Command line defaults") {
    auto res = parse({"--context", "ctx", "--tests", "tests", "--test", "cat $0", "--solution", "sol", "subs"});

    REQUIRE(res);
    REQUIRE(res->build_command == "make");
    REQUIRE(res->timeout_seconds == GradingConfig::DEFAULT_TIMEOUT_SECONDS);
    REQUIRE(res->jobs == 1);
    REQUIRE(res->file_names.empty());
    REQUIRE_FALSE(res->logs_dir.has_value());
    REQUIRE_FALSE(res->single);
    REQUIRE(res->verbosity == ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
}

TEST_CASE("Command line errors") {
    // Missing required --test
    REQUIRE_FALSE(parse({"--context", "ctx", "--tests", "tests", "--solution", "sol", "subs"}));

    // Not a number
    REQUIRE_FALSE(
        parse({"--context", "c", "--tests", "t", "--test", "x $0", "--solution", "s", "--timeout", "soon", "subs"}));

    // Bad color choice
    REQUIRE_FALSE(parse({"--context", "c", "--tests", "t", "--test", "x $0", "--solution", "s", "-c", "sometimes",
                         "subs"}));
}
