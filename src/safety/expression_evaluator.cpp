#include "safety/expression_evaluator.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace deepdive {
namespace safety {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double E = 2.71828182845904523536;

const char* const FUNCTIONS[] = {
    "sqrt", "cbrt", "abs", "sin", "cos", "tan", "asin", "acos", "atan",
    "sinh", "cosh", "tanh", "exp", "log", "ln", "log10", "log2",
    "floor", "ceil", "round"
};

bool is_function(const std::string& name) {
    for (const char* fn : FUNCTIONS) {
        if (name == fn) return true;
    }
    return false;
}

bool is_constant(const std::string& name) {
    return name == "pi" || name == "e" || name == "tau";
}

class EvalFailure : public std::runtime_error {
public:
    EvalFailure(EvalErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    EvalErrorKind kind() const { return kind_; }

private:
    EvalErrorKind kind_;
};

enum class TokenType {
    NUMBER, IDENTIFIER, PLUS, MINUS, STAR, SLASH, PERCENT, POWER, LPAREN, RPAREN, END
};

struct Token {
    TokenType type;
    std::string text;
    double number;
    size_t position;

    Token(TokenType type_, const std::string& text_, size_t position_, double number_ = 0.0)
        : type(type_), text(text_), number(number_), position(position_) {}
};

std::vector<Token> tokenize(const std::string& input) {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < input.size()) {
        char c = input[i];
        unsigned char uc = static_cast<unsigned char>(c);

        if (std::isspace(uc)) {
            ++i;
            continue;
        }

        bool starts_number = std::isdigit(uc) ||
            (c == '.' && i + 1 < input.size() && std::isdigit(static_cast<unsigned char>(input[i + 1])));
        if (starts_number) {
            size_t start = i;
            while (i < input.size() && std::isdigit(static_cast<unsigned char>(input[i]))) ++i;
            if (i < input.size() && input[i] == '.') {
                ++i;
                while (i < input.size() && std::isdigit(static_cast<unsigned char>(input[i]))) ++i;
            }
            if (i < input.size() && (input[i] == 'e' || input[i] == 'E')) {
                size_t exp = i + 1;
                if (exp < input.size() && (input[exp] == '+' || input[exp] == '-')) ++exp;
                if (exp < input.size() && std::isdigit(static_cast<unsigned char>(input[exp]))) {
                    i = exp;
                    while (i < input.size() && std::isdigit(static_cast<unsigned char>(input[i]))) ++i;
                }
            }
            std::string text = input.substr(start, i - start);
            tokens.emplace_back(TokenType::NUMBER, text, start, std::strtod(text.c_str(), nullptr));
            continue;
        }

        if (std::isalpha(uc) || c == '_') {
            size_t start = i;
            while (i < input.size() &&
                   (std::isalnum(static_cast<unsigned char>(input[i])) || input[i] == '_')) {
                ++i;
            }
            std::string name = input.substr(start, i - start);
            if (!is_function(name) && !is_constant(name)) {
                throw EvalFailure(EvalErrorKind::REJECTED, "unknown identifier '" + name + "'");
            }
            size_t next = i;
            while (next < input.size() && std::isspace(static_cast<unsigned char>(input[next]))) ++next;
            if (next < input.size() && input[next] == '.') {
                throw EvalFailure(EvalErrorKind::REJECTED, "attribute access is not permitted");
            }
            tokens.emplace_back(TokenType::IDENTIFIER, name, start);
            continue;
        }

        switch (c) {
            case '+': tokens.emplace_back(TokenType::PLUS, "+", i); break;
            case '-': tokens.emplace_back(TokenType::MINUS, "-", i); break;
            case '/': tokens.emplace_back(TokenType::SLASH, "/", i); break;
            case '%': tokens.emplace_back(TokenType::PERCENT, "%", i); break;
            case '^': tokens.emplace_back(TokenType::POWER, "^", i); break;
            case '(': tokens.emplace_back(TokenType::LPAREN, "(", i); break;
            case ')': tokens.emplace_back(TokenType::RPAREN, ")", i); break;
            case '*':
                if (i + 1 < input.size() && input[i + 1] == '*') {
                    tokens.emplace_back(TokenType::POWER, "**", i);
                    ++i;
                } else {
                    tokens.emplace_back(TokenType::STAR, "*", i);
                }
                break;
            case '=':
                throw EvalFailure(EvalErrorKind::REJECTED, "assignment is not permitted");
            case '\'':
            case '"':
                throw EvalFailure(EvalErrorKind::REJECTED, "string literals are not permitted");
            case '.':
                throw EvalFailure(EvalErrorKind::REJECTED, "attribute access is not permitted");
            default:
                throw EvalFailure(EvalErrorKind::REJECTED,
                                  std::string("character '") + c + "' is not permitted");
        }
        ++i;
    }

    tokens.emplace_back(TokenType::END, "", input.size());
    return tokens;
}

double checked(double value, const EvaluatorLimits& limits) {
    if (std::isnan(value)) {
        throw EvalFailure(EvalErrorKind::DOMAIN_ERROR, "result is undefined");
    }
    if (std::isinf(value) || std::fabs(value) > limits.max_magnitude) {
        throw EvalFailure(EvalErrorKind::OVERFLOW, "result is too large");
    }
    return value;
}

struct Node {
    virtual ~Node() = default;
    virtual double evaluate(const EvaluatorLimits& limits) const = 0;
};

struct NumberNode : Node {
    double value;

    explicit NumberNode(double value_) : value(value_) {}

    double evaluate(const EvaluatorLimits& limits) const override {
        return checked(value, limits);
    }
};

struct NegateNode : Node {
    std::unique_ptr<Node> operand;

    explicit NegateNode(std::unique_ptr<Node> operand_) : operand(std::move(operand_)) {}

    double evaluate(const EvaluatorLimits& limits) const override {
        return -operand->evaluate(limits);
    }
};

struct BinaryNode : Node {
    TokenType op;
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;

    BinaryNode(TokenType op_, std::unique_ptr<Node> left_, std::unique_ptr<Node> right_)
        : op(op_), left(std::move(left_)), right(std::move(right_)) {}

    double evaluate(const EvaluatorLimits& limits) const override {
        double l = left->evaluate(limits);
        double r = right->evaluate(limits);

        switch (op) {
            case TokenType::PLUS:
                return checked(l + r, limits);
            case TokenType::MINUS:
                return checked(l - r, limits);
            case TokenType::STAR:
                return checked(l * r, limits);
            case TokenType::SLASH:
                if (r == 0.0) {
                    throw EvalFailure(EvalErrorKind::DIVISION_BY_ZERO, "division by zero");
                }
                return checked(l / r, limits);
            case TokenType::PERCENT:
                if (r == 0.0) {
                    throw EvalFailure(EvalErrorKind::DIVISION_BY_ZERO, "modulo by zero");
                }
                // Floored modulo: the result takes the sign of the divisor
                return checked(l - r * std::floor(l / r), limits);
            case TokenType::POWER:
                if (l == 0.0 && r < 0.0) {
                    throw EvalFailure(EvalErrorKind::DIVISION_BY_ZERO, "zero raised to a negative power");
                }
                if (l < 0.0 && std::floor(r) != r) {
                    throw EvalFailure(EvalErrorKind::DOMAIN_ERROR,
                                      "fractional power of a negative number");
                }
                return checked(std::pow(l, r), limits);
            default:
                throw EvalFailure(EvalErrorKind::SYNTAX_ERROR, "unknown operator");
        }
    }
};

struct CallNode : Node {
    std::string name;
    std::unique_ptr<Node> argument;

    CallNode(const std::string& name_, std::unique_ptr<Node> argument_)
        : name(name_), argument(std::move(argument_)) {}

    double evaluate(const EvaluatorLimits& limits) const override {
        double x = argument->evaluate(limits);

        auto domain = [this](const char* what) {
            throw EvalFailure(EvalErrorKind::DOMAIN_ERROR, name + ": " + what);
        };

        double result = 0.0;
        if (name == "sqrt") {
            if (x < 0.0) domain("argument must not be negative");
            result = std::sqrt(x);
        } else if (name == "cbrt") {
            result = std::cbrt(x);
        } else if (name == "abs") {
            result = std::fabs(x);
        } else if (name == "sin") {
            result = std::sin(x);
        } else if (name == "cos") {
            result = std::cos(x);
        } else if (name == "tan") {
            result = std::tan(x);
        } else if (name == "asin") {
            if (x < -1.0 || x > 1.0) domain("argument must be within [-1, 1]");
            result = std::asin(x);
        } else if (name == "acos") {
            if (x < -1.0 || x > 1.0) domain("argument must be within [-1, 1]");
            result = std::acos(x);
        } else if (name == "atan") {
            result = std::atan(x);
        } else if (name == "sinh") {
            result = std::sinh(x);
        } else if (name == "cosh") {
            result = std::cosh(x);
        } else if (name == "tanh") {
            result = std::tanh(x);
        } else if (name == "exp") {
            result = std::exp(x);
        } else if (name == "log" || name == "ln") {
            if (x <= 0.0) domain("argument must be positive");
            result = std::log(x);
        } else if (name == "log10") {
            if (x <= 0.0) domain("argument must be positive");
            result = std::log10(x);
        } else if (name == "log2") {
            if (x <= 0.0) domain("argument must be positive");
            result = std::log2(x);
        } else if (name == "floor") {
            result = std::floor(x);
        } else if (name == "ceil") {
            result = std::ceil(x);
        } else if (name == "round") {
            result = std::round(x);
        } else {
            throw EvalFailure(EvalErrorKind::REJECTED, "unknown function '" + name + "'");
        }

        return checked(result, limits);
    }
};

class Parser {
public:
    Parser(const std::vector<Token>& tokens, const EvaluatorLimits& limits)
        : tokens_(tokens), limits_(limits), pos_(0), depth_(0) {}

    std::unique_ptr<Node> parse() {
        auto root = parse_expression();
        if (peek().type != TokenType::END) {
            throw EvalFailure(EvalErrorKind::SYNTAX_ERROR,
                              "unexpected '" + peek().text + "' at position " +
                              std::to_string(peek().position));
        }
        return root;
    }

private:
    struct DepthGuard {
        size_t& depth;

        DepthGuard(size_t& depth_, size_t max_depth) : depth(depth_) {
            if (++depth > max_depth) {
                --depth;
                throw EvalFailure(EvalErrorKind::REJECTED, "expression is nested too deeply");
            }
        }
        ~DepthGuard() { --depth; }
    };

    const std::vector<Token>& tokens_;
    const EvaluatorLimits& limits_;
    size_t pos_;
    size_t depth_;

    const Token& peek() const { return tokens_[pos_]; }

    const Token& advance() { return tokens_[pos_++]; }

    void expect(TokenType type, const std::string& what) {
        if (peek().type != type) {
            std::string found = peek().type == TokenType::END ? "end of input" : "'" + peek().text + "'";
            throw EvalFailure(EvalErrorKind::SYNTAX_ERROR, "expected " + what + " but found " + found);
        }
        advance();
    }

    std::unique_ptr<Node> parse_expression() {
        DepthGuard guard(depth_, limits_.max_depth);
        auto left = parse_term();
        while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
            TokenType op = advance().type;
            auto right = parse_term();
            left = std::make_unique<BinaryNode>(op, std::move(left), std::move(right));
        }
        return left;
    }

    std::unique_ptr<Node> parse_term() {
        auto left = parse_unary();
        while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH ||
               peek().type == TokenType::PERCENT) {
            TokenType op = advance().type;
            auto right = parse_unary();
            left = std::make_unique<BinaryNode>(op, std::move(left), std::move(right));
        }
        return left;
    }

    std::unique_ptr<Node> parse_unary() {
        DepthGuard guard(depth_, limits_.max_depth);
        if (peek().type == TokenType::MINUS) {
            advance();
            return std::make_unique<NegateNode>(parse_unary());
        }
        if (peek().type == TokenType::PLUS) {
            advance();
            return parse_unary();
        }
        return parse_power();
    }

    std::unique_ptr<Node> parse_power() {
        auto base = parse_primary();
        if (peek().type == TokenType::POWER) {
            advance();
            auto exponent = parse_unary();
            return std::make_unique<BinaryNode>(TokenType::POWER, std::move(base), std::move(exponent));
        }
        return base;
    }

    std::unique_ptr<Node> parse_primary() {
        const Token& token = peek();

        if (token.type == TokenType::NUMBER) {
            advance();
            return std::make_unique<NumberNode>(token.number);
        }

        if (token.type == TokenType::IDENTIFIER) {
            advance();
            if (token.text == "pi") return std::make_unique<NumberNode>(PI);
            if (token.text == "e") return std::make_unique<NumberNode>(E);
            if (token.text == "tau") return std::make_unique<NumberNode>(2.0 * PI);

            expect(TokenType::LPAREN, "'(' after " + token.text);
            auto argument = parse_expression();
            expect(TokenType::RPAREN, "')'");
            return std::make_unique<CallNode>(token.text, std::move(argument));
        }

        if (token.type == TokenType::LPAREN) {
            advance();
            auto inner = parse_expression();
            expect(TokenType::RPAREN, "')'");
            return inner;
        }

        if (token.type == TokenType::END) {
            throw EvalFailure(EvalErrorKind::SYNTAX_ERROR, "unexpected end of input");
        }
        throw EvalFailure(EvalErrorKind::SYNTAX_ERROR,
                          "unexpected '" + token.text + "' at position " + std::to_string(token.position));
    }
};

} // namespace

EvalResult EvalResult::ok(double value) {
    EvalResult result;
    result.success = true;
    result.value = value;
    return result;
}

EvalResult EvalResult::failure(EvalErrorKind kind, const std::string& message) {
    EvalResult result;
    result.success = false;
    result.error = kind;
    result.message = message;
    return result;
}

ExpressionEvaluator::ExpressionEvaluator(const EvaluatorLimits& limits) : limits_(limits) {}

EvalResult ExpressionEvaluator::evaluate(const std::string& expression) const {
    if (expression.size() > limits_.max_length) {
        return EvalResult::failure(EvalErrorKind::REJECTED,
                                   "expression exceeds " + std::to_string(limits_.max_length) + " characters");
    }

    try {
        std::vector<Token> tokens = tokenize(expression);
        if (tokens.size() == 1) {
            return EvalResult::failure(EvalErrorKind::SYNTAX_ERROR, "empty expression");
        }

        Parser parser(tokens, limits_);
        std::unique_ptr<Node> tree = parser.parse();

        double value = tree->evaluate(limits_);
        // -0 prints badly and carries no information here
        if (value == 0.0) {
            value = 0.0;
        }
        return EvalResult::ok(value);

    } catch (const EvalFailure& e) {
        return EvalResult::failure(e.kind(), e.what());
    }
}

bool ExpressionEvaluator::is_arithmetic_query(const std::string& text) {
    bool has_digit = false;
    bool has_operator = false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isdigit(uc)) {
            has_digit = true;
        } else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '%' || c == '^') {
            has_operator = true;
        } else if (c != '(' && c != ')' && c != '.' && !std::isspace(uc)) {
            return false;
        }
    }
    return has_digit && has_operator;
}

std::string ExpressionEvaluator::format_value(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

} // namespace safety
} // namespace deepdive
