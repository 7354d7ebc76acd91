#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>
#include <batchgrader/grading_session.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace batchgrader {

/// Receives progress events of a grading run and renders them to a sink.
/// Implementations are not required to be thread-safe; callers serialize access.
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_begin(std::size_t num_submissions, std::size_t num_tests) = 0;

    virtual void on_reference_begin(const std::filesystem::path& solution_dir) = 0;
    virtual void on_reference_end(const ReferenceOutputs& outputs) = 0;

    virtual void on_submission_begin(const Submission& submission) = 0;
    virtual void on_submission_result(const SubmissionResult& result) = 0;

    virtual void on_run_result(const ResultMatrix& matrix) = 0;

    /// An artifact of the run (`what` is e.g. "logs" or "summary") was written to `path`
    virtual void on_artifact_written(std::string_view what, const std::filesystem::path& path) = 0;

    virtual void on_warning(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace batchgrader
