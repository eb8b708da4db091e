/**
 * @file expression_evaluator.hpp
 * @brief Sandboxed arithmetic evaluation
 *
 * Expressions are parsed by a recursive-descent parser into an explicit tree
 * and only then evaluated. Anything outside the arithmetic grammar (unknown
 * identifiers, assignment, attribute access, string literals) is rejected
 * while parsing, before any evaluation happens.
 *
 * Grammar:
 *   expr    := term (('+' | '-') term)*
 *   term    := unary (('*' | '/' | '%') unary)*
 *   unary   := ('+' | '-') unary | power
 *   power   := primary (('^' | '**') unary)?
 *   primary := NUMBER | CONSTANT | FUNCTION '(' expr ')' | '(' expr ')'
 */

#ifndef DEEPDIVE_SAFETY_EXPRESSION_EVALUATOR_HPP
#define DEEPDIVE_SAFETY_EXPRESSION_EVALUATOR_HPP

#include <cstddef>
#include <string>

namespace deepdive {
namespace safety {

enum class EvalErrorKind {
    NONE,
    SYNTAX_ERROR,
    REJECTED,
    DIVISION_BY_ZERO,
    DOMAIN_ERROR,
    OVERFLOW
};

inline std::string eval_error_to_string(EvalErrorKind kind) {
    switch (kind) {
        case EvalErrorKind::NONE: return "NONE";
        case EvalErrorKind::SYNTAX_ERROR: return "SYNTAX_ERROR";
        case EvalErrorKind::REJECTED: return "REJECTED";
        case EvalErrorKind::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case EvalErrorKind::DOMAIN_ERROR: return "DOMAIN_ERROR";
        case EvalErrorKind::OVERFLOW: return "OVERFLOW";
        default: return "UNKNOWN";
    }
}

struct EvalResult {
    bool success;
    double value;
    EvalErrorKind error;
    std::string message;

    EvalResult() : success(false), value(0.0), error(EvalErrorKind::NONE) {}

    static EvalResult ok(double value);
    static EvalResult failure(EvalErrorKind kind, const std::string& message);
};

struct EvaluatorLimits {
    size_t max_length;       ///< Longer input is REJECTED
    size_t max_depth;        ///< Deeper nesting is REJECTED
    double max_magnitude;    ///< Larger intermediate results are OVERFLOW

    EvaluatorLimits() : max_length(256), max_depth(64), max_magnitude(1e300) {}
};

class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(const EvaluatorLimits& limits = EvaluatorLimits());

    EvalResult evaluate(const std::string& expression) const;

    /**
     * @brief True when text contains nothing but digits, arithmetic operators,
     *        parentheses and whitespace, with at least one digit
     *
     * Used to route a user query straight to the evaluator.
     */
    static bool is_arithmetic_query(const std::string& text);

    /**
     * @brief Render a result the way the CLI prints it (integers without decimals)
     */
    static std::string format_value(double value);

private:
    EvaluatorLimits limits_;
};

} // namespace safety
} // namespace deepdive

#endif // DEEPDIVE_SAFETY_EXPRESSION_EVALUATOR_HPP
