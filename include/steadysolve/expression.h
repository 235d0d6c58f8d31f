#pragma once

#include "ast.h"
#include "autodiff.h"
#include <cmath>
#include <complex>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace steadysolve {

// ============================================================================
// Expression evaluation
// ============================================================================
// One evaluator serves three scalar types:
//   double               residuals
//   std::complex<double> closed-form steady states (sqrt of a negative number
//                        yields an imaginary part instead of NaN)
//   ADValue              residuals with Jacobian rows

template<typename Scalar>
using SymbolResolver = std::function<Scalar(const Variable&)>;

namespace detail {

template<typename Scalar>
double realPart(const Scalar& x) {
    if constexpr (std::is_same_v<Scalar, std::complex<double>>) {
        return x.real();
    } else if constexpr (std::is_same_v<Scalar, ADValue>) {
        return x.value;
    } else {
        return x;
    }
}

// Real arguments stay on the real axis: (-2)^2 is exactly 4 in complex mode
template<typename Scalar>
Scalar power(const Scalar& base, const Scalar& exponent) {
    using std::pow;
    if constexpr (std::is_same_v<Scalar, std::complex<double>>) {
        if (base.imag() == 0.0 && exponent.imag() == 0.0 &&
            (base.real() >= 0.0 || exponent.real() == std::round(exponent.real()))) {
            return Scalar(std::pow(base.real(), exponent.real()));
        }
    }
    return pow(base, exponent);
}

template<typename Scalar>
Scalar callBuiltin(const std::string& name, const std::vector<Scalar>& args, int line) {
    using std::exp; using std::log; using std::log10; using std::sqrt;
    using std::sin; using std::cos; using std::tan; using std::asin; using std::acos;
    using std::atan; using std::sinh; using std::cosh; using std::tanh;

    auto arity = [&](size_t n) {
        if (args.size() != n) {
            throw std::runtime_error("Function '" + name + "' expects " + std::to_string(n) +
                                     " argument(s), got " + std::to_string(args.size()) +
                                     " (line " + std::to_string(line) + ")");
        }
    };

    if (name == "min" || name == "max") {
        arity(2);
        // Complex arguments are ordered by their real part; ties keep the first
        const bool takeSecond = name == "min" ? realPart(args[1]) < realPart(args[0])
                                              : realPart(args[1]) > realPart(args[0]);
        return takeSecond ? args[1] : args[0];
    }
    if (name == "pow") {
        arity(2);
        return power(args[0], args[1]);
    }

    arity(1);
    const Scalar& x = args[0];
    if (name == "exp") return exp(x);
    if (name == "log" || name == "ln") return log(x);
    if (name == "log10") return log10(x);
    if (name == "sqrt") return sqrt(x);
    if (name == "abs") {
        if constexpr (std::is_same_v<Scalar, ADValue>) {
            return steadysolve::abs(x);
        } else {
            return Scalar(std::abs(x));
        }
    }
    if (name == "sin") return sin(x);
    if (name == "cos") return cos(x);
    if (name == "tan") return tan(x);
    if (name == "asin") return asin(x);
    if (name == "acos") return acos(x);
    if (name == "atan") return atan(x);
    if (name == "sinh") return sinh(x);
    if (name == "cosh") return cosh(x);
    if (name == "tanh") return tanh(x);

    throw std::runtime_error("Unknown function '" + name + "' (line " + std::to_string(line) + ")");
}

}  // namespace detail

/**
 * @brief Evaluate an expression tree.
 *
 * Symbols are looked up through `resolve`; literals become constants of the
 * scalar type. Unknown functions and wrong arities throw std::runtime_error.
 */
template<typename Scalar>
Scalar evaluateExpression(const ExprPtr& expr, const SymbolResolver<Scalar>& resolve) {
    if (!expr) {
        throw std::runtime_error("Null expression");
    }

    return std::visit([&](const auto& node) -> Scalar {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, NumberLiteral>) {
            return Scalar(node.value);
        } else if constexpr (std::is_same_v<T, Variable>) {
            return resolve(node);
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            Scalar operand = evaluateExpression<Scalar>(node.operand, resolve);
            return node.op == "-" ? Scalar(-operand) : operand;
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            Scalar left = evaluateExpression<Scalar>(node.left, resolve);
            Scalar right = evaluateExpression<Scalar>(node.right, resolve);
            switch (node.op[0]) {
                case '+': return left + right;
                case '-': return left - right;
                case '*': return left * right;
                case '/': return left / right;
                case '^': return detail::power(left, right);
                default:
                    throw std::runtime_error("Unknown operator '" + node.op + "'");
            }
        } else {
            std::vector<Scalar> args;
            args.reserve(node.args.size());
            for (const auto& arg : node.args) {
                args.push_back(evaluateExpression<Scalar>(arg, resolve));
            }
            return detail::callBuiltin<Scalar>(node.name, args, expr->sourceLineNumber);
        }
    }, expr->node);
}

// Rewrites an expression, replacing every symbol reference through `substitute`.
// Subtrees without symbols are shared with the input.
ExprPtr substituteVariables(const ExprPtr& expr,
                            const std::function<ExprPtr(const Variable&, int line)>& substitute);

// Copy of `expr` with every lead and lag removed
ExprPtr staticForm(const ExprPtr& expr);

}  // namespace steadysolve
