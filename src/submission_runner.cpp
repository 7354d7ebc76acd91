#include "submission_runner.hpp"

#include <batchgrader/config.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading/submission_grader.hpp>
#include <batchgrader/grading_session.hpp>
#include <batchgrader/logging.hpp>

#include "output/serializer.hpp"

#include <libassert/assert.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace batchgrader {

SubmissionRunner::SubmissionRunner(const GradingConfig& config, std::vector<TestCase> tests,
                                   const std::shared_ptr<Serializer>& serializer)
    : config_{&config}
    , tests_{tests}
    , serializer_{serializer}
    , oracle_{config, std::move(tests)} {}

ResultMatrix SubmissionRunner::run_all(const std::vector<Submission>& submissions) {
    with_serializer([&](Serializer& ser) { ser.on_run_begin(submissions.size(), tests_.size()); });
    with_serializer([&](Serializer& ser) { ser.on_reference_begin(config_->solution_dir); });

    // Throws on failure; nothing has been graded at this point
    const ReferenceOutputs& reference = oracle_.get_outputs();

    with_serializer([&](Serializer& ser) { ser.on_reference_end(reference); });

    const SubmissionGrader grader{*config_, reference};

    std::vector<SubmissionResult> results = grade_all(grader, submissions);

    auto test_names = tests_ | ranges::views::transform(&TestCase::name) | ranges::to<std::vector<std::string>>();
    ResultMatrix matrix{std::move(test_names)};

    for (SubmissionResult& result : results) {
        matrix.add(std::move(result));
    }

    matrix.finalize();

    with_serializer([&](Serializer& ser) { ser.on_run_result(matrix); });

    return matrix;
}

const ReferenceOutputs& SubmissionRunner::get_reference() {
    return oracle_.get_outputs();
}

std::vector<SubmissionResult> SubmissionRunner::grade_all(const SubmissionGrader& grader,
                                                          const std::vector<Submission>& submissions) {
    // One slot per submission, so that results are ordered by submission rather than by completion
    std::vector<std::optional<SubmissionResult>> slots(submissions.size());
    std::mutex slots_mutex;

    std::atomic<std::size_t> next_idx{0};
    std::atomic<bool> stop{false};
    std::exception_ptr first_exception;

    auto worker = [&]() {
        while (!stop) {
            const std::size_t idx = next_idx.fetch_add(1);

            if (idx >= submissions.size()) {
                return;
            }

            const Submission& submission = submissions[idx];

            try {
                with_serializer([&](Serializer& ser) { ser.on_submission_begin(submission); });

                SubmissionResult result = grader.grade(submission);

                with_serializer([&](Serializer& ser) { ser.on_submission_result(result); });

                std::scoped_lock lock{slots_mutex};
                slots[idx] = std::move(result);
            } catch (...) {
                // Grading failures are recorded in the result; anything thrown is an internal error,
                // which is rethrown on the calling thread once every worker has stopped
                std::scoped_lock lock{slots_mutex};
                if (!first_exception) {
                    first_exception = std::current_exception();
                }
                stop = true;
            }
        }
    };

    const std::size_t max_workers = std::max<std::size_t>(submissions.size(), 1);
    const std::size_t num_workers = std::clamp<std::size_t>(config_->jobs, 1, max_workers);

    LOG_DEBUG("Grading {} submissions on {} threads", submissions.size(), num_workers);

    if (num_workers == 1) {
        worker();
    } else {
        std::vector<std::jthread> threads;
        threads.reserve(num_workers);

        for (std::size_t i = 0; i < num_workers; ++i) {
            threads.emplace_back(worker);
        }

        // jthreads join on destruction
    }

    if (first_exception) {
        std::rethrow_exception(first_exception);
    }

    std::vector<SubmissionResult> results;
    results.reserve(slots.size());

    for (std::optional<SubmissionResult>& slot : slots) {
        ASSERT(slot.has_value(), "Submission was never graded");
        results.push_back(std::move(*slot));
    }

    return results;
}

} // namespace batchgrader
