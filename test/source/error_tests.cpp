#include <string>
#include <string_view>
#include <vector>

#include <error/error.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

namespace
{
struct error_test
{
    std::string_view input;
    std::string expected_message;
};
}  // namespace

TEST(errors, testEvaluationErrors)
{
    const std::vector<error_test> tests {
        {"(add x 5)", "undefined variable: x"},
        {"(foo 1 2)", "unknown operator or keyword: foo"},
        {"(let x 10 y)", "undefined variable: y"},
        {"(let x 1 (let y 2 z))", "undefined variable: z"},
        {"(add (let x 1 x) x)", "undefined variable: x"},
        {"(add x $)", "undefined variable: x"},
        {"x1(", "undefined variable: x1"},
    };
    for (const auto& test : tests) {
        assert_error(test.input, error_kind::evaluation, test.expected_message);
    }
}

TEST(errors, testArityErrors)
{
    const std::vector<error_test> tests {
        {"(mult 1 2 3)", "mult takes exactly two operands: expected ), got integer `3` at position 10"},
        {"(add 1 2 3 4)", "add takes exactly two operands: expected ), got integer `3` at position 9"},
        {"(add 1 2 x)", "add takes exactly two operands: expected ), got identifier `x` at position 9"},
        {"(add 1 2 )", "expected ), got space at position 8"},
        {"(add 1)", "expected space, got `)` at position 6"},
    };
    for (const auto& test : tests) {
        assert_error(test.input, error_kind::syntax, test.expected_message);
    }
}

TEST(errors, testSyntaxErrors)
{
    const std::vector<error_test> tests {
        {"", "unexpected end of input"},
        {"()", "expected an operator or keyword after ( at position 0, got `)` instead"},
        {"(1 2)", "expected an operator or keyword after ( at position 0, got integer `1` instead"},
        {"(+ 1 2)", "unexpected character '+' at position 1"},
        {"(add 1 $)", "unexpected character '$' at position 7"},
        {")", "unexpected token `)` at position 0"},
        {"  1", "unexpected token space at position 1"},
        {"(add  1 2)", "unexpected token space at position 5"},
        {"(add 1(add 2 3))", "expected space, got `(` at position 6"},
        {"(add 1", "expected space, got end of input at position 6"},
        {"(add 1 2", "expected ), got end of input at position 8"},
        {"(add 99999999999999999999 1)", "could not parse 99999999999999999999 as integer"},
    };
    for (const auto& test : tests) {
        assert_error(test.input, error_kind::syntax, test.expected_message);
    }
}

TEST(errors, testTrailingInput)
{
    const std::vector<error_test> tests {
        {"42 ", "extra characters at end of input: space at position 2"},
        {"1 2", "extra characters at end of input: space at position 1"},
        {"(add 1 2) 3", "extra characters at end of input: space at position 9"},
        {"(add 1 2))", "extra characters at end of input: `)` at position 9"},
    };
    for (const auto& test : tests) {
        assert_error(test.input, error_kind::syntax, test.expected_message);
    }
}

TEST(errors, testMalformedLet)
{
    const std::vector<error_test> tests {
        {"(let)", "expected space, got `)` at position 4"},
        {"(let x 2)", "let without body expression at position 8"},
        {"(let 1 2)", "expected ), got space at position 6"},
        {"(let x 10 y", "malformed let binding list: `y` at position 10 is not followed by a value, got end of input"},
        {"(let x(add 1 2) x)", "malformed let binding list: `x` at position 5 is not followed by a value, got `(`"},
        {"(let x 1 y 2", "expected space, got end of input at position 12"},
    };
    for (const auto& test : tests) {
        assert_error(test.input, error_kind::syntax, test.expected_message);
    }
}
