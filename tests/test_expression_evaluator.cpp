/**
 * @file test_expression_evaluator.cpp
 * @brief Unit tests for the sandboxed arithmetic evaluator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/safety/expression_evaluator.hpp"

using namespace deepdive::safety;
using Catch::Matchers::WithinAbs;

namespace {

double value_of(const std::string& expression) {
    ExpressionEvaluator evaluator;
    EvalResult result = evaluator.evaluate(expression);
    REQUIRE(result.success);
    return result.value;
}

EvalErrorKind error_of(const std::string& expression) {
    ExpressionEvaluator evaluator;
    EvalResult result = evaluator.evaluate(expression);
    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(result.message.empty());
    return result.error;
}

} // namespace

TEST_CASE("ExpressionEvaluator: arithmetic", "[safety][calculator]") {
    SECTION("precedence and grouping") {
        REQUIRE(value_of("2 + 3 * 4") == 14.0);
        REQUIRE(value_of("(2 + 3) * 4") == 20.0);
        REQUIRE(value_of("10 - 4 - 3") == 3.0);
        REQUIRE(value_of("100 / 10 / 5") == 2.0);
    }

    SECTION("power is right associative and binds tighter than unary minus") {
        REQUIRE(value_of("2 ^ 3 ^ 2") == 512.0);
        REQUIRE(value_of("2 ** 10") == 1024.0);
        REQUIRE(value_of("-2 ^ 2") == -4.0);
        REQUIRE(value_of("2 ^ -1") == 0.5);
    }

    SECTION("floored modulo") {
        REQUIRE(value_of("7 % 3") == 1.0);
        REQUIRE(value_of("-7 % 3") == 2.0);
        REQUIRE(value_of("7 % -3") == -2.0);
    }

    SECTION("numbers") {
        REQUIRE(value_of(".5 + 1.25") == 1.75);
        REQUIRE_THAT(value_of("1e3 + 2E-1"), WithinAbs(1000.2, 1e-9));
        REQUIRE(value_of("--3") == 3.0);
    }

    SECTION("functions and constants") {
        REQUIRE(value_of("sqrt(16)") == 4.0);
        REQUIRE(value_of("abs(-3) + floor(2.7) + ceil(0.2)") == 6.0);
        REQUIRE_THAT(value_of("sin(pi / 2)"), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(value_of("ln(e)"), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(value_of("tau / 2"), WithinAbs(3.14159265358979, 1e-12));
        REQUIRE_THAT(value_of("log10(1000)"), WithinAbs(3.0, 1e-12));
    }
}

TEST_CASE("ExpressionEvaluator: math errors", "[safety][calculator]") {
    REQUIRE(error_of("1 / 0") == EvalErrorKind::DIVISION_BY_ZERO);
    REQUIRE(error_of("5 % 0") == EvalErrorKind::DIVISION_BY_ZERO);
    REQUIRE(error_of("0 ^ -1") == EvalErrorKind::DIVISION_BY_ZERO);
    REQUIRE(error_of("sqrt(-1)") == EvalErrorKind::DOMAIN_ERROR);
    REQUIRE(error_of("log(0)") == EvalErrorKind::DOMAIN_ERROR);
    REQUIRE(error_of("acos(2)") == EvalErrorKind::DOMAIN_ERROR);
    REQUIRE(error_of("(-8) ^ 0.5") == EvalErrorKind::DOMAIN_ERROR);
    REQUIRE(error_of("10 ^ 400") == EvalErrorKind::OVERFLOW);
    REQUIRE(error_of("exp(1000)") == EvalErrorKind::OVERFLOW);
}

TEST_CASE("ExpressionEvaluator: syntax errors", "[safety][calculator]") {
    REQUIRE(error_of("") == EvalErrorKind::SYNTAX_ERROR);
    REQUIRE(error_of("   ") == EvalErrorKind::SYNTAX_ERROR);
    REQUIRE(error_of("2 +") == EvalErrorKind::SYNTAX_ERROR);
    REQUIRE(error_of("(2 + 3") == EvalErrorKind::SYNTAX_ERROR);
    REQUIRE(error_of("2 3") == EvalErrorKind::SYNTAX_ERROR);
    REQUIRE(error_of("sqrt 4") == EvalErrorKind::SYNTAX_ERROR);
    REQUIRE(error_of(")") == EvalErrorKind::SYNTAX_ERROR);

    ExpressionEvaluator evaluator;
    REQUIRE(evaluator.evaluate("").message == "empty expression");
}

TEST_CASE("ExpressionEvaluator: anything beyond arithmetic is rejected", "[safety][calculator]") {
    REQUIRE(error_of("__import__('os')") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("os.system(\"ls\")") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("x = 3") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("1 == 1") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("'a' * 3") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("pi.real") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("open(1)") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("2 & 3") == EvalErrorKind::REJECTED);
    REQUIRE(error_of("[1, 2]") == EvalErrorKind::REJECTED);

    SECTION("length limit") {
        std::string long_sum = "1";
        for (int i = 0; i < 200; ++i) long_sum += "+1";
        REQUIRE(error_of(long_sum) == EvalErrorKind::REJECTED);
    }

    SECTION("nesting limit") {
        std::string nested = std::string(100, '(') + "1" + std::string(100, ')');
        REQUIRE(error_of(nested) == EvalErrorKind::REJECTED);
    }

    SECTION("configured limits") {
        EvaluatorLimits limits;
        limits.max_length = 5;
        limits.max_magnitude = 1000.0;
        ExpressionEvaluator strict(limits);
        REQUIRE(strict.evaluate("1+2+3+4").error == EvalErrorKind::REJECTED);
        REQUIRE(strict.evaluate("99*99").error == EvalErrorKind::OVERFLOW);
        REQUIRE(strict.evaluate("9*9").success);
    }
}

TEST_CASE("ExpressionEvaluator: arithmetic query detection", "[safety][calculator]") {
    REQUIRE(ExpressionEvaluator::is_arithmetic_query("2 + 3 * 4"));
    REQUIRE(ExpressionEvaluator::is_arithmetic_query("(1.5 - 0.5) / 2"));
    REQUIRE(ExpressionEvaluator::is_arithmetic_query("2^8"));

    REQUIRE_FALSE(ExpressionEvaluator::is_arithmetic_query("42"));
    REQUIRE_FALSE(ExpressionEvaluator::is_arithmetic_query("+"));
    REQUIRE_FALSE(ExpressionEvaluator::is_arithmetic_query("sqrt(16)"));
    REQUIRE_FALSE(ExpressionEvaluator::is_arithmetic_query("history of the printing press"));
    REQUIRE_FALSE(ExpressionEvaluator::is_arithmetic_query("what is 2 + 2"));
}

TEST_CASE("ExpressionEvaluator: value formatting", "[safety][calculator]") {
    REQUIRE(ExpressionEvaluator::format_value(14.0) == "14");
    REQUIRE(ExpressionEvaluator::format_value(-3.0) == "-3");
    REQUIRE(ExpressionEvaluator::format_value(0.5) == "0.5");
    REQUIRE(ExpressionEvaluator::format_value(1.0 / 3.0) == "0.333333333333");
    REQUIRE(ExpressionEvaluator::format_value(1e20) == "1e+20");
}
