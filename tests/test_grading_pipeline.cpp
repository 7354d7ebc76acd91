#include "catch2_custom.hpp"

#include <batchgrader/config.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>

#include "app/grader_app.hpp"
#include "output/log_writer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/sink.hpp"
#include "output/summary_writer.hpp"
#include "scratch_dir.hpp"
#include "submission_runner.hpp"
#include "user/program_options.hpp"
#include "user/submission_discovery.hpp"

#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace batchgrader;

namespace fs = std::filesystem;

namespace {

const fs::path GRADING_DIR = fs::path{RESOURCES_DIR} / "grading";

class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }

    void flush() override {}

    const std::string& get_buffer() const { return buffer_; }

private:
    std::string buffer_;
};

ProgramOptions make_options(const fs::path& grading_dir) {
    ProgramOptions opts;

    opts.context_dir = grading_dir / "context";
    opts.tests_dir = grading_dir / "tests";
    opts.solution_dir = grading_dir / "solution";
    opts.submissions_path = grading_dir / "subs";
    opts.build_command = "sh build.sh";
    opts.test_command = "./prog \"$0\"";
    opts.file_names = {"main.sh"};
    opts.timeout_seconds = 0.5;
    opts.colorize_option = ProgramOptions::ColorizeOpt::Never;

    return opts;
}

struct RunOutput
{
    ResultMatrix matrix;
    std::string summary;
    std::string console;
};

/// Grades every submission of `opts` the way the application does, minus writing artifacts
RunOutput grade(const ProgramOptions& opts, const fs::path& sandbox_root) {
    GradingConfig config = opts.to_config();
    config.sandbox_root = sandbox_root;

    StringSink sink;
    auto serializer = std::make_shared<PlainTextSerializer>(sink, opts.colorize_option, VerbosityLevel::All);

    SubmissionRunner runner{config, discover_tests(config.tests_dir), serializer};
    ResultMatrix matrix = runner.run_all(discover_submissions(opts.submissions_path, opts.single));

    std::string summary = render_summary(matrix);

    return {.matrix = std::move(matrix), .summary = std::move(summary), .console = sink.get_buffer()};
}

const std::string EXPECTED_SUMMARY = "id,a.txt,b.txt\r\n"
                                     "stu1,P,F\r\n"
                                     "stu2,E,E\r\n"
                                     "stu3,E,E\r\n"
                                     "stu4,T,T\r\n"
                                     "stu5,E,E\r\n";

} // namespace

TEST_CASE("Grading a batch of submissions") {
    ScratchDir sandbox_root;
    const RunOutput run = grade(make_options(GRADING_DIR), sandbox_root.path());

    REQUIRE(run.summary == EXPECTED_SUMMARY);

    const SubmissionResult& stu1 = *run.matrix.find("stu1");
    REQUIRE(stu1.state == SubmissionState::Recorded);
    REQUIRE(stu1.build->output == "linking prog\n");
    REQUIRE(stu1.tests.at(0).actual_output == "3\n");
    REQUIRE(stu1.tests.at(1).actual_output == "no idea\n");

    // Missing file: rejected before any build
    const SubmissionResult& stu2 = *run.matrix.find("stu2");
    REQUIRE(stu2.build_failed());
    REQUIRE_FALSE(stu2.build.has_value());
    REQUIRE(stu2.assembly_error->detail == "main.sh");

    // Syntax error: the build fails
    const SubmissionResult& stu3 = *run.matrix.find("stu3");
    REQUIRE(stu3.build_failed());
    REQUIRE(stu3.build.has_value());
    REQUIRE_FALSE(stu3.build->succeeded);
    for (const TestRecord& test : stu3.tests) {
        // Never executed
        REQUIRE_FALSE(test.run_result.has_value());
        REQUIRE(test.outcome == Outcome::Error);
    }

    const SubmissionResult& stu5 = *run.matrix.find("stu5");
    REQUIRE(stu5.tests.at(0).error_output == "segmentation fault, probably\n");

    // Every sandbox is removed once its submission has been graded
    REQUIRE(fs::is_empty(sandbox_root.path()));

    REQUIRE_THAT(run.console, Catch::Matchers::ContainsSubstring("missing: main.sh"));
    REQUIRE_THAT(run.console, Catch::Matchers::ContainsSubstring("build failed (exit status"));
    REQUIRE_THAT(run.console, Catch::Matchers::ContainsSubstring("test b.txt failed"));
    REQUIRE_THAT(run.console, Catch::Matchers::ContainsSubstring("test a.txt timed out"));
    REQUIRE_THAT(run.console, Catch::Matchers::ContainsSubstring("Graded 5 submissions: 0 passed every test"));
}

TEST_CASE("Logs of a graded batch") {
    ScratchDir dir;
    const ProgramOptions opts = make_options(GRADING_DIR);
    GradingConfig config = opts.to_config();
    config.sandbox_root = dir.make_dir("sandboxes");

    StringSink sink;
    auto serializer = std::make_shared<PlainTextSerializer>(sink, opts.colorize_option, VerbosityLevel::Silent);
    SubmissionRunner runner{config, discover_tests(config.tests_dir), serializer};

    const ResultMatrix matrix = runner.run_all(discover_submissions(opts.submissions_path, false));
    write_logs(matrix, runner.get_reference(), dir / "logs");

    const std::string stu1_log = read_file(dir / "logs/stu1.txt");
    REQUIRE_THAT(stu1_log, Catch::Matchers::ContainsSubstring("=== b.txt ===\n"
                                                              "b.txt: failed\n"
                                                              "-- actual output --\n"
                                                              "no idea\n"
                                                              "-- expected output --\n"
                                                              "7\n"));
    REQUIRE_THAT(stu1_log, !Catch::Matchers::ContainsSubstring("=== a.txt ==="));
    REQUIRE_THAT(stu1_log, Catch::Matchers::EndsWith("passed 1/2\n"));

    REQUIRE_THAT(read_file(dir / "logs/stu2.txt"), Catch::Matchers::StartsWith("missing: main.sh\n"));
    REQUIRE_THAT(read_file(dir / "logs/stu3.txt"), Catch::Matchers::ContainsSubstring("build failed"));
    REQUIRE_THAT(read_file(dir / "logs/stu4.txt"), Catch::Matchers::ContainsSubstring("a.txt: timed out"));
    REQUIRE_THAT(read_file(dir / "logs/stu5.txt"),
                 Catch::Matchers::ContainsSubstring("b.txt: test execution failed (exit status 3)"));

    // Nothing but the log files
    REQUIRE(std::distance(fs::directory_iterator{dir / "logs"}, fs::directory_iterator{}) == 5);
}

TEST_CASE("Results do not depend on the number of jobs") {
    ScratchDir sandbox_root;
    ProgramOptions opts = make_options(GRADING_DIR);

    opts.jobs = 1;
    const RunOutput serial = grade(opts, sandbox_root.path());

    opts.jobs = 4;
    const RunOutput parallel = grade(opts, sandbox_root.path());

    REQUIRE(serial.summary == EXPECTED_SUMMARY);
    REQUIRE(parallel.summary == serial.summary);
    REQUIRE(fs::is_empty(sandbox_root.path()));
}

TEST_CASE("Without file names every submission file is collected") {
    ScratchDir sandbox_root;
    ProgramOptions opts = make_options(GRADING_DIR);
    opts.file_names.clear();

    const RunOutput run = grade(opts, sandbox_root.path());

    // stu2 has no main.sh to link, so its build fails instead
    const SubmissionResult& stu2 = *run.matrix.find("stu2");
    REQUIRE_FALSE(stu2.assembly_error.has_value());
    REQUIRE(stu2.build_failed());
    REQUIRE(run.matrix.outcome("stu1", "a.txt") == Outcome::Pass);
}

TEST_CASE("Single submission mode") {
    ScratchDir sandbox_root;
    ProgramOptions opts = make_options(GRADING_DIR);
    opts.submissions_path = GRADING_DIR / "subs/stu1";
    opts.single = true;

    const RunOutput run = grade(opts, sandbox_root.path());

    REQUIRE(run.summary == "id,a.txt,b.txt\r\nstu1,P,F\r\n");
}

TEST_CASE("Failing reference solution aborts the run") {
    ScratchDir dir;
    fs::copy(GRADING_DIR, dir / "grading", fs::copy_options::recursive);
    dir.write_file("grading/solution/main.sh", "exit 1\n");

    ProgramOptions opts = make_options(dir / "grading");

    SECTION("Nothing is graded") {
        GradingConfig config = opts.to_config();
        config.sandbox_root = dir.make_dir("sandboxes");

        StringSink sink;
        auto serializer = std::make_shared<PlainTextSerializer>(sink, opts.colorize_option, VerbosityLevel::All);
        SubmissionRunner runner{config, discover_tests(config.tests_dir), serializer};

        try {
            runner.run_all(discover_submissions(opts.submissions_path, false));
            FAIL("Expected an OracleError");
        } catch (const OracleError& err) {
            REQUIRE(err.get_test_name() == "a.txt");
        }

        REQUIRE_THAT(sink.get_buffer(), !Catch::Matchers::ContainsSubstring("stu1"));
        REQUIRE(fs::is_empty(dir / "sandboxes"));
    }

    SECTION("No artifacts are written") {
        opts.logs_dir = dir / "logs";
        opts.summary_path = dir / "summary.csv";
        opts.verbosity = VerbosityLevel::Silent;

        REQUIRE(GraderApp{opts}.run() == 1);

        REQUIRE_FALSE(fs::exists(dir / "logs"));
        REQUIRE_FALSE(fs::exists(dir / "summary.csv"));
    }
}

TEST_CASE("Reference build failures and timeouts are fatal") {
    ScratchDir dir;
    fs::copy(GRADING_DIR, dir / "grading", fs::copy_options::recursive);

    const ProgramOptions opts = make_options(dir / "grading");
    GradingConfig config = opts.to_config();
    config.sandbox_root = dir.make_dir("sandboxes");

    StringSink sink;
    auto serializer = std::make_shared<PlainTextSerializer>(sink, opts.colorize_option, VerbosityLevel::All);

    SECTION("Build fails") {
        dir.write_file("grading/solution/main.sh", "if then fi (\n");

        SubmissionRunner runner{config, discover_tests(config.tests_dir), serializer};

        try {
            runner.run_all(discover_submissions(opts.submissions_path, false));
            FAIL("Expected an OracleError");
        } catch (const OracleError& err) {
            REQUIRE(err.get_test_name().empty());
            REQUIRE_THAT(err.what(), Catch::Matchers::ContainsSubstring("solution build failed"));
            REQUIRE_THAT(err.get_details(), Catch::Matchers::StartsWith("linking prog\n"));
        }
    }

    SECTION("A test times out") {
        dir.write_file("grading/solution/main.sh", "sleep 30\n");

        SubmissionRunner runner{config, discover_tests(config.tests_dir), serializer};

        try {
            runner.run_all(discover_submissions(opts.submissions_path, false));
            FAIL("Expected an OracleError");
        } catch (const OracleError& err) {
            REQUIRE(err.get_test_name() == "a.txt");
            REQUIRE_THAT(err.what(), Catch::Matchers::ContainsSubstring("timed out"));
        }
    }

    REQUIRE_THAT(sink.get_buffer(), !Catch::Matchers::ContainsSubstring("stu1"));
    REQUIRE(fs::is_empty(dir / "sandboxes"));
}

TEST_CASE("The application writes every artifact that was asked for") {
    ScratchDir dir;
    ProgramOptions opts = make_options(GRADING_DIR);
    opts.logs_dir = dir / "logs";
    opts.summary_path = dir / "out/summary.csv";
    opts.verbosity = VerbosityLevel::Silent;
    opts.jobs = 2;

    REQUIRE(GraderApp{opts}.run() == 0);

    REQUIRE(read_file(dir / "out/summary.csv") == EXPECTED_SUMMARY);
    REQUIRE(fs::is_regular_file(dir / "logs/stu1.txt"));
    REQUIRE(fs::is_regular_file(dir / "logs/stu5.txt"));
}

TEST_CASE("Invalid configuration fails before any grading") {
    ScratchDir dir;
    ProgramOptions opts = make_options(GRADING_DIR);
    opts.tests_dir = dir / "missing";
    opts.summary_path = dir / "summary.csv";
    opts.verbosity = VerbosityLevel::Silent;

    REQUIRE(GraderApp{opts}.run() == 1);
    REQUIRE_FALSE(fs::exists(dir / "summary.csv"));
}
