#pragma once

#include <batchgrader/config.hpp>
#include <batchgrader/grading/reference_oracle.hpp>
#include <batchgrader/grading/result_matrix.hpp>

#include "app/app.hpp" // IWYU pragma: export
#include "output/serializer.hpp"

#include <memory>
#include <string_view>

namespace batchgrader {

/// Grades a batch of submissions as described by the command line
class GraderApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;

    /// The actual run; fatal conditions propagate as exceptions
    int grade(const std::shared_ptr<Serializer>& serializer) const;

    /// Fatal diagnostics go to stderr, in red unless colors are turned off
    void report_fatal(std::string_view kind, std::string_view msg, std::string_view details = {}) const;

    /// Writes the log files and the CSV summary that were asked for
    static void write_artifacts(const GradingConfig& config, const ResultMatrix& matrix,
                                const ReferenceOutputs& reference, Serializer& serializer);
};

} // namespace batchgrader
