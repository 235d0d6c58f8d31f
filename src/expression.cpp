#include "steadysolve/expression.h"

namespace steadysolve {

ExprPtr substituteVariables(const ExprPtr& expr,
                            const std::function<ExprPtr(const Variable&, int line)>& substitute) {
    if (!expr) return expr;
    const int line = expr->sourceLineNumber;

    return std::visit([&](const auto& node) -> ExprPtr {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, NumberLiteral>) {
            return expr;
        } else if constexpr (std::is_same_v<T, Variable>) {
            return substitute(node, line);
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            ExprPtr operand = substituteVariables(node.operand, substitute);
            if (operand == node.operand) return expr;
            return makeUnaryOp(node.op, operand, line);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            ExprPtr left = substituteVariables(node.left, substitute);
            ExprPtr right = substituteVariables(node.right, substitute);
            if (left == node.left && right == node.right) return expr;
            return makeBinaryOp(node.op, left, right, line);
        } else {
            std::vector<ExprPtr> args;
            bool changed = false;
            for (const auto& arg : node.args) {
                args.push_back(substituteVariables(arg, substitute));
                changed = changed || args.back() != arg;
            }
            if (!changed) return expr;
            return makeFunctionCall(node.name, std::move(args), line);
        }
    }, expr->node);
}

ExprPtr staticForm(const ExprPtr& expr) {
    return substituteVariables(expr, [](const Variable& var, int line) {
        return makeResolvedVariable(var.name, var.kind, var.index, 0, line);
    });
}

}  // namespace steadysolve
