#pragma once

#include <batchgrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace batchgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Process / operation surpassed its deadline
    SyscallFailure, ///< A Linux syscall failed
    MissingFile,    ///< A required submission file does not exist
    CopyFailure,    ///< Copying files into a sandbox failed
    UnknownError,   ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::MissingFile:
        return "MissingFile";
    case ErrorKind::CopyFailure:
        return "CopyFailure";
    case ErrorKind::UnknownError:
        return "UnknownError";
    case ErrorKind::MaxErrorNum:
        break;
    }

    return "<invalid ErrorKind>";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::ErrorKind> : formatter<std::string_view>
{
    auto format(::batchgrader::ErrorKind from, format_context& ctx) const {
        return formatter<std::string_view>::format(::batchgrader::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::batchgrader::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
