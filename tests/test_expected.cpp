#include "catch2_custom.hpp"

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/expected.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>

using namespace std::literals;
using batchgrader::ErrorKind;
using batchgrader::Expected;
using batchgrader::Result;

// Simple types
using Et = Expected<int, std::string>;

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234");

    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != "Exp!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(456) == 456);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square) == "no");
}

TEST_CASE("Accessing the wrong alternative is an assertion failure") {
    REQUIRE_THROWS(Et{"err"}.value());
    REQUIRE_THROWS(Et{5}.error());
}

namespace {

Result<int> half_of_even(int n) {
    if (n % 2 != 0) {
        return ErrorKind::UnknownError;
    }
    return n / 2;
}

Result<int> quarter_of(int n) {
    int half = TRY(half_of_even(n));
    return TRY(half_of_even(half));
}

Result<int> quarter_or_timeout(int n) {
    int half = TRYE(half_of_even(n), TimedOut);
    return TRYE(half_of_even(half), TimedOut);
}

} // namespace

TEST_CASE("TRY and TRYE propagate errors") {
    REQUIRE(quarter_of(8) == 2);
    REQUIRE(quarter_of(6) == ErrorKind::UnknownError);
    REQUIRE(quarter_of(3) == ErrorKind::UnknownError);

    REQUIRE(quarter_or_timeout(12) == 3);
    REQUIRE(quarter_or_timeout(10) == ErrorKind::TimedOut);
}

TEST_CASE("Formatting") {
    REQUIRE(fmt::format("{}", Et{3}) == "Expected(3)");
    REQUIRE(fmt::format("{}", Et{"bad"}) == "Error(bad)");
    REQUIRE(fmt::format("{}", Expected{}) == "Expected(void)");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::SyscallFailure}) == "Error(SyscallFailure)");
}
