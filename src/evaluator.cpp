#include "steadysolve/evaluator.h"
#include "steadysolve/expression.h"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace steadysolve {

ModelEvaluator::ModelEvaluator(const BuiltModel& model) : model_(model) {}

void ModelEvaluator::checkSizes(const Eigen::VectorXd& y, const Eigen::VectorXd& exo,
                                const Eigen::VectorXd& params) const {
    const ModelDescriptor& d = model_.descriptor;
    if (y.size() != d.endoNbr) {
        throw std::invalid_argument("Expected " + std::to_string(d.endoNbr) + " endogenous values, got " +
                                    std::to_string(y.size()));
    }
    if (exo.size() != d.exoNbr + d.exoDetNbr) {
        throw std::invalid_argument("Expected " + std::to_string(d.exoNbr + d.exoDetNbr) +
                                    " exogenous values, got " + std::to_string(exo.size()));
    }
    if (params.size() != d.paramNbr) {
        throw std::invalid_argument("Expected " + std::to_string(d.paramNbr) + " parameters, got " +
                                    std::to_string(params.size()));
    }
}

Eigen::VectorXd ModelEvaluator::staticResidual(const Eigen::VectorXd& y,
                                               const Eigen::VectorXd& exo,
                                               const Eigen::VectorXd& params) const {
    checkSizes(y, exo, params);

    SymbolResolver<double> resolve = [&](const Variable& var) -> double {
        switch (var.kind) {
            case SymbolKind::Endogenous: return y(var.index);
            case SymbolKind::Exogenous: return exo(var.index);
            case SymbolKind::Parameter: return params(var.index);
            default: throw std::runtime_error("Unresolved symbol '" + var.name + "'");
        }
    };

    const auto& residuals = model_.staticResiduals;
    Eigen::VectorXd r(static_cast<Eigen::Index>(residuals.size()));
    for (size_t i = 0; i < residuals.size(); ++i) {
        r(static_cast<Eigen::Index>(i)) = evaluateExpression<double>(residuals[i], resolve);
    }
    return r;
}

void ModelEvaluator::staticResidualAndJacobian(const Eigen::VectorXd& y,
                                               const Eigen::VectorXd& exo,
                                               const Eigen::VectorXd& params,
                                               Eigen::VectorXd& residual,
                                               Eigen::MatrixXd& jacobian) const {
    checkSizes(y, exo, params);
    const Eigen::Index n = y.size();

    // Seed each endogenous variable once; parameters and exogenous values
    // stay constants
    std::vector<ADValue> seeds;
    seeds.reserve(static_cast<size_t>(n));
    for (Eigen::Index j = 0; j < n; ++j) {
        seeds.push_back(ADValue::independent(y(j), j, n));
    }

    SymbolResolver<ADValue> resolve = [&](const Variable& var) -> ADValue {
        switch (var.kind) {
            case SymbolKind::Endogenous: return seeds[static_cast<size_t>(var.index)];
            case SymbolKind::Exogenous: return ADValue(exo(var.index));
            case SymbolKind::Parameter: return ADValue(params(var.index));
            default: throw std::runtime_error("Unresolved symbol '" + var.name + "'");
        }
    };

    const auto& residuals = model_.staticResiduals;
    const Eigen::Index m = static_cast<Eigen::Index>(residuals.size());
    residual.resize(m);
    jacobian = Eigen::MatrixXd::Zero(m, n);
    for (Eigen::Index i = 0; i < m; ++i) {
        ADValue value = evaluateExpression<ADValue>(residuals[static_cast<size_t>(i)], resolve);
        residual(i) = value.value;
        if (!value.isConstant()) {
            jacobian.row(i) = value.gradient.transpose();
        }
    }
}

Eigen::VectorXd ModelEvaluator::dynamicResidual(const Eigen::VectorXd& y,
                                                const Eigen::MatrixXd& exo,
                                                const Eigen::VectorXd& params,
                                                const Eigen::VectorXd& /*steadyState*/,
                                                int it) const {
    const ModelDescriptor& d = model_.descriptor;
    if (y.size() != d.dynamicVariableCount()) {
        throw std::invalid_argument("Expected " + std::to_string(d.dynamicVariableCount()) +
                                    " dynamic endogenous values, got " + std::to_string(y.size()));
    }

    SymbolResolver<double> resolve = [&](const Variable& var) -> double {
        switch (var.kind) {
            case SymbolKind::Endogenous: {
                const int row = d.maximumLag + var.shift;
                const int position = d.leadLagIncidence(row, var.index);
                if (position == 0) {
                    throw std::runtime_error("'" + var.name + "' does not appear at shift " +
                                             std::to_string(var.shift) + " in the lead/lag incidence");
                }
                return y(position - 1);
            }
            case SymbolKind::Exogenous: return exo(it + var.shift, var.index);
            case SymbolKind::Parameter: return params(var.index);
            default: throw std::runtime_error("Unresolved symbol '" + var.name + "'");
        }
    };

    const auto& residuals = model_.dynamicResiduals;
    Eigen::VectorXd r(static_cast<Eigen::Index>(residuals.size()));
    for (size_t i = 0; i < residuals.size(); ++i) {
        r(static_cast<Eigen::Index>(i)) = evaluateExpression<double>(residuals[i], resolve);
    }
    return r;
}

Eigen::VectorXd ModelEvaluator::setAuxiliaryVariables(const Eigen::VectorXd& y,
                                                      const Eigen::VectorXd& exo,
                                                      const Eigen::VectorXd& params) const {
    checkSizes(y, exo, params);
    const ModelDescriptor& d = model_.descriptor;

    // Static definitions only reference original variables, so the order of
    // evaluation does not matter
    SymbolResolver<double> resolve = [&](const Variable& var) -> double {
        switch (var.kind) {
            case SymbolKind::Endogenous: return y(var.index);
            case SymbolKind::Exogenous: return exo(var.index);
            case SymbolKind::Parameter: return params(var.index);
            default: throw std::runtime_error("Unresolved symbol '" + var.name + "'");
        }
    };

    Eigen::VectorXd result = y;
    for (int k = 0; k < d.auxVarCount(); ++k) {
        result(d.auxVars[k].endoIndex) = evaluateExpression<double>(model_.auxDefinitions[k], resolve);
    }
    return result;
}

Eigen::VectorXd ModelEvaluator::defaultExogenous() const {
    Eigen::VectorXd exo(model_.exoSteadyState.size() + model_.exoDetSteadyState.size());
    exo << model_.exoSteadyState, model_.exoDetSteadyState;
    return exo;
}

// ============================================================================
// Utility Functions
// ============================================================================

Eigen::VectorXd closeAuxiliaryBlock(const ResidualEvaluator& evaluator,
                                    const ModelDescriptor& model,
                                    const Eigen::VectorXd& y,
                                    const Eigen::VectorXd& exo,
                                    const Eigen::VectorXd& params) {
    const int auxNbr = model.auxVarCount();
    if (auxNbr == 0) return y;

    Eigen::VectorXd z = y;
    z.tail(auxNbr).setZero();
    const Eigen::VectorXd residual = evaluator.staticResidual(z, exo, params);
    z.tail(auxNbr) = -residual.tail(auxNbr);
    return z;
}

double compareJacobianWithFiniteDifferences(const ResidualEvaluator& evaluator,
                                            const Eigen::VectorXd& y,
                                            const Eigen::VectorXd& exo,
                                            const Eigen::VectorXd& params,
                                            double epsilon,
                                            bool verbose) {
    Eigen::VectorXd residual;
    Eigen::MatrixXd adJacobian;
    evaluator.staticResidualAndJacobian(y, exo, params, residual, adJacobian);

    const Eigen::Index n = y.size();
    Eigen::MatrixXd numJacobian(residual.size(), n);
    for (Eigen::Index j = 0; j < n; ++j) {
        const double h = epsilon * std::max(1.0, std::abs(y(j)));
        Eigen::VectorXd yPlus = y;
        Eigen::VectorXd yMinus = y;
        yPlus(j) += h;
        yMinus(j) -= h;
        numJacobian.col(j) = (evaluator.staticResidual(yPlus, exo, params) -
                              evaluator.staticResidual(yMinus, exo, params)) / (2.0 * h);
    }

    const double maxDiff = n == 0 ? 0.0 : (adJacobian - numJacobian).cwiseAbs().maxCoeff();

    if (verbose) {
        Eigen::IOFormat fmt(6, 0, "  ", "\n", "    ", "");
        std::cout << "\n=== Jacobian Comparison ===\n";
        std::cout << "Residuals F(y) = [" << residual.transpose() << "]\n\n";
        std::cout << "Jacobian (AD):\n" << adJacobian.format(fmt) << "\n\n";
        std::cout << "Jacobian (finite differences, eps=" << epsilon << "):\n"
                  << numJacobian.format(fmt) << "\n\n";
        std::cout << "Max |AD - FD| = " << std::scientific << std::setprecision(3) << maxDiff
                  << std::defaultfloat << "\n";
    }
    return maxDiff;
}

}  // namespace steadysolve
