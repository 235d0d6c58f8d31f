#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace steadysolve {

struct Expression;

using ExprPtr = std::shared_ptr<Expression>;

// ============================================================================
// Expression Types
// ============================================================================

struct NumberLiteral {
    double value;
};

enum class SymbolKind {
    Unresolved,
    Endogenous,
    Exogenous,   // exogenous and deterministic exogenous share one vector
    Parameter
};

/**
 * @brief Reference to a declared symbol, possibly shifted in time.
 *
 * `shift` is the lead (> 0) or lag (< 0) of the reference: `k(-1)` has
 * shift -1, `c(+1)` has shift +1. Parameters always have shift 0.
 * `kind` and `index` are filled in by the ModelBuilder.
 */
struct Variable {
    std::string name;
    int shift = 0;
    SymbolKind kind = SymbolKind::Unresolved;
    int index = -1;
};

struct UnaryOp {
    std::string op;  // "-", "+"
    ExprPtr operand;
};

struct BinaryOp {
    std::string op;  // "+", "-", "*", "/", "^"
    ExprPtr left;
    ExprPtr right;
};

struct FunctionCall {
    std::string name;
    std::vector<ExprPtr> args;
};

struct Expression {
    std::variant<
        NumberLiteral,
        Variable,
        UnaryOp,
        BinaryOp,
        FunctionCall
    > node;

    int sourceLineNumber = 0;  // For error reporting

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }
};

// ============================================================================
// Statements of a model file
// ============================================================================

/**
 * @brief One equation of the `model` block.
 *
 * An equation written without `=` is stored with a zero right-hand side.
 * Tags are the bracketed annotations preceding the equation
 * (`[static]`, `[dynamic]`, `[multiplier]`, `[name='...']`).
 */
struct ModelEquation {
    ExprPtr lhs;
    ExprPtr rhs;
    std::vector<std::string> tags;
    std::string name;
    int sourceLine = 0;

    bool hasTag(const std::string& tag) const;
};

struct Assignment {
    std::string target;
    ExprPtr value;
    int sourceLine = 0;
};

// ============================================================================
// Top-level model file
// ============================================================================

struct ModFile {
    std::string sourceFilename;

    // Declarations, in declaration order
    std::vector<std::string> endogenous;
    std::vector<std::string> multipliers;   // subset of endogenous declared with var(multiplier)
    std::vector<std::string> exogenous;
    std::vector<std::string> exogenousDet;
    std::vector<std::string> parameters;

    std::vector<Assignment> parameterAssignments;
    std::vector<ModelEquation> equations;
    bool linearModel = false;

    std::vector<Assignment> initval;
    std::vector<Assignment> steadyStateModel;
    bool hasSteadyStateModel = false;

    bool ramseyPolicy = false;
    std::vector<std::string> instruments;

    // Flags from options(...) statements: block, bytecode, debug, linear
    std::vector<std::string> solveFlags;
};

// ============================================================================
// Helper functions for AST construction
// ============================================================================

inline ExprPtr makeNumber(double value, int line = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = NumberLiteral{value};
    expr->sourceLineNumber = line;
    return expr;
}

inline ExprPtr makeVariable(const std::string& name, int shift = 0, int line = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = Variable{name, shift, SymbolKind::Unresolved, -1};
    expr->sourceLineNumber = line;
    return expr;
}

inline ExprPtr makeResolvedVariable(const std::string& name, SymbolKind kind, int index,
                                    int shift = 0, int line = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = Variable{name, shift, kind, index};
    expr->sourceLineNumber = line;
    return expr;
}

inline ExprPtr makeUnaryOp(const std::string& op, ExprPtr operand, int line = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = UnaryOp{op, std::move(operand)};
    expr->sourceLineNumber = line;
    return expr;
}

inline ExprPtr makeBinaryOp(const std::string& op, ExprPtr left, ExprPtr right, int line = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = BinaryOp{op, std::move(left), std::move(right)};
    expr->sourceLineNumber = line;
    return expr;
}

inline ExprPtr makeFunctionCall(const std::string& name, std::vector<ExprPtr> args, int line = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = FunctionCall{name, std::move(args)};
    expr->sourceLineNumber = line;
    return expr;
}

}  // namespace steadysolve
