#include <batchgrader/subprocess/run_result.hpp>

#include <batchgrader/common/linux.hpp>

#include <fmt/format.h>

#include <string>

namespace batchgrader {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal_num) {
    return {Kind::Killed, signal_num};
}

RunResult RunResult::make_timed_out(int signal_num) {
    return {Kind::TimedOut, signal_num};
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

bool RunResult::succeeded() const {
    return kind_ == Kind::Exited && code_ == 0;
}

std::string to_string(const RunResult& from) {
    switch (from.get_kind()) {
    case RunResult::Kind::Exited:
        return fmt::format("exit status {}", from.get_code());
    case RunResult::Kind::Killed:
        return fmt::format("killed by signal {} ({})", from.get_code(), linux::Signal{from.get_code()});
    case RunResult::Kind::TimedOut:
        return "timed out";
    }

    return "<unknown>";
}

} // namespace batchgrader
