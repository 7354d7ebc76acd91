#pragma once

#include <fmt/format.h>

#include <string>

namespace batchgrader {

/// How a subprocess ended
class RunResult
{
public:
    enum class Kind {
        Exited,  ///< Exited normally; code is the exit status
        Killed,  ///< Terminated by a signal it did not handle; code is the signal number
        TimedOut ///< Still running at the deadline and killed by us; code is the signal used
    };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal_num);
    static RunResult make_timed_out(int signal_num);

    Kind get_kind() const;
    int get_code() const;

    /// Exited normally with status 0
    bool succeeded() const;

    bool operator==(const RunResult& rhs) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

/// "exit status N", "killed by signal N (description)", or "timed out"
std::string to_string(const RunResult& from);

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::RunResult> : formatter<std::string>
{
    auto format(const ::batchgrader::RunResult& from, format_context& ctx) const {
        return formatter<std::string>::format(::batchgrader::to_string(from), ctx);
    }
};
