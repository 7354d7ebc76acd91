#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace batchgrader {

/// Invalid or contradictory configuration. Fatal; raised before any grading work starts.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// The reference solution failed to assemble, build, or pass one of its own tests.
/// Fatal; every comparison would be meaningless without the reference outputs.
class OracleError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

    /// `test_name` is empty when the failure happened before any test ran (sandbox or build)
    OracleError(const std::string& msg, std::string test_name, std::string details)
        : std::runtime_error{msg}
        , test_name_{std::move(test_name)}
        , details_{std::move(details)} {}

    const std::string& get_test_name() const { return test_name_; }

    /// Captured output of the failed step, if any
    const std::string& get_details() const { return details_; }

private:
    std::string test_name_;
    std::string details_;
};

/// Failure to write one of the run's artifacts (log files, summary)
class IoError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::OracleError> : fmt::formatter<std::string>
{
    auto format(const ::batchgrader::OracleError& from, format_context& ctx) const {
        if (from.get_test_name().empty()) {
            return fmt::format_to(ctx.out(), "{}", from.what());
        }

        return fmt::format_to(ctx.out(), "{} (test '{}')", from.what(), from.get_test_name());
    }
};
