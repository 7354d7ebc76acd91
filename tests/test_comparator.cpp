#include "catch2_custom.hpp"

#include <batchgrader/grading/comparator.hpp>
#include <batchgrader/grading/test_executor.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <csignal>
#include <string>

using namespace std::literals;
using batchgrader::classify;
using batchgrader::compare_outputs;
using batchgrader::Outcome;
using batchgrader::RunResult;
using batchgrader::TestExecution;

TEST_CASE("Outputs are compared byte for byte") {
    REQUIRE(compare_outputs("3\n", "3\n") == Outcome::Pass);
    REQUIRE(compare_outputs("", "") == Outcome::Pass);

    // No normalization of whitespace or line endings
    REQUIRE(compare_outputs("3", "3\n") == Outcome::Fail);
    REQUIRE(compare_outputs("3 \n", "3\n") == Outcome::Fail);
    REQUIRE(compare_outputs("3\r\n", "3\n") == Outcome::Fail);
    REQUIRE(compare_outputs("A\n", "a\n") == Outcome::Fail);

    // Embedded NULs are significant
    REQUIRE(compare_outputs("a\0b"sv, "a\0b"sv) == Outcome::Pass);
    REQUIRE(compare_outputs("a\0b"sv, "a\0c"sv) == Outcome::Fail);
}

TEST_CASE("Classification of test executions") {
    const std::string reference = "42\n";

    SECTION("Successful run with matching output") {
        TestExecution exec{.run_result = RunResult::make_exited(0), .stdout_output = "42\n", .stderr_output = "noise"};
        REQUIRE(classify(exec, reference) == Outcome::Pass);
    }

    SECTION("Successful run with different output") {
        TestExecution exec{.run_result = RunResult::make_exited(0), .stdout_output = "41\n", .stderr_output = ""};
        REQUIRE(classify(exec, reference) == Outcome::Fail);
    }

    SECTION("Nonzero exit is an error even when the output matches") {
        TestExecution exec{.run_result = RunResult::make_exited(1), .stdout_output = "42\n", .stderr_output = ""};
        REQUIRE(classify(exec, reference) == Outcome::Error);
    }

    SECTION("Killed by a signal") {
        TestExecution exec{.run_result = RunResult::make_killed(SIGSEGV), .stdout_output = "", .stderr_output = ""};
        REQUIRE(classify(exec, reference) == Outcome::Error);
    }

    SECTION("Timeouts are never compared") {
        TestExecution exec{
            .run_result = RunResult::make_timed_out(SIGKILL), .stdout_output = "42\n", .stderr_output = ""};
        REQUIRE(classify(exec, reference) == Outcome::Timeout);
    }
}

TEST_CASE("Outcome codes") {
    REQUIRE(batchgrader::outcome_code(Outcome::Pass) == 'P');
    REQUIRE(batchgrader::outcome_code(Outcome::Fail) == 'F');
    REQUIRE(batchgrader::outcome_code(Outcome::Error) == 'E');
    REQUIRE(batchgrader::outcome_code(Outcome::Timeout) == 'T');
}
