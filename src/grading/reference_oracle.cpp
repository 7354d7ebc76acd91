#include <batchgrader/grading/reference_oracle.hpp>

#include <batchgrader/config.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/build_runner.hpp>
#include <batchgrader/grading/test_executor.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/sandbox/sandbox.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <libassert/assert.hpp>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace batchgrader {

ReferenceOutputs::ReferenceOutputs(std::vector<TestCase> tests, std::unordered_map<std::string, std::string> outputs)
    : tests_{std::move(tests)}
    , outputs_{std::move(outputs)} {}

const std::string& ReferenceOutputs::output_for(const std::string& test_name) const {
    auto iter = outputs_.find(test_name);

    ASSERT(iter != outputs_.end(), "No reference output for test", test_name);

    return iter->second;
}

ReferenceOracle::ReferenceOracle(const GradingConfig& config, std::vector<TestCase> tests)
    : config_{&config}
    , tests_{std::move(tests)} {}

const ReferenceOutputs& ReferenceOracle::get_outputs() {
    if (!outputs_) {
        outputs_.emplace(DEBUG_TIME(compute()));
    }

    return *outputs_;
}

ReferenceOutputs ReferenceOracle::compute() const {
    LOG_INFO("Running reference solution {}", config_->solution_dir);

    auto sandbox = Sandbox::create(config_->sandbox_root, "solution", config_->keep_sandboxes);

    if (!sandbox) {
        throw OracleError{"could not create a sandbox for the solution", "", sandbox.error()};
    }

    // The solution is always collected whole; file names only restrict what is taken from submissions
    if (auto res = sandbox->assemble(config_->context_dir, config_->solution_dir, CollectAll{}); !res) {
        throw OracleError{fmt::format("could not assemble the solution ({})", res.error()), "", res.error().detail};
    }

    BuildRecord build = BuildRunner{config_->build_command}.run(sandbox->path());

    if (!build.succeeded) {
        std::string reason = build.run_result ? fmt::format("{}", *build.run_result) : "could not run build command";
        throw OracleError{fmt::format("solution build failed ({})", reason), "", build.output};
    }

    const TestExecutor executor{config_->test_command, config_->timeout};
    std::unordered_map<std::string, std::string> outputs;

    for (const TestCase& test : tests_) {
        auto execution = executor.run(sandbox->path(), test);

        if (!execution) {
            throw OracleError{fmt::format("solution test could not be run ({})", execution.error()), test.name, ""};
        }

        if (!execution->run_result.succeeded()) {
            throw OracleError{fmt::format("solution test failed ({})", execution->run_result), test.name,
                              execution->stdout_output + execution->stderr_output};
        }

        LOG_DEBUG("Reference output of {}: {} bytes", test.name, execution->stdout_output.size());

        outputs.emplace(test.name, std::move(execution->stdout_output));
    }

    return ReferenceOutputs{tests_, std::move(outputs)};
}

} // namespace batchgrader
