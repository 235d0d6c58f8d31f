#include "steadysolve/ramsey.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace steadysolve {

NewtonRamseySolver::NewtonRamseySolver(const ResidualEvaluator& evaluator,
                                       SteadyStateFunction* steadyStateFunction)
    : evaluator_(evaluator), steadyStateFunction_(steadyStateFunction) {}

RamseyResult NewtonRamseySolver::solve(const Eigen::VectorXd& guess,
                                       const ModelDescriptor& model,
                                       const Eigen::VectorXd& params,
                                       const SteadyStateOptions& options,
                                       const OutputState& outputs) {
    const Eigen::VectorXd exo = exogenousVector(outputs);
    if (steadyStateFunction_ && options.steadystateFlag) {
        return solveWithFunction(guess, model, params, exo, options);
    }
    return solveJointly(guess, model, params, exo, options);
}

RamseyResult NewtonRamseySolver::solveJointly(const Eigen::VectorXd& guess, const ModelDescriptor& model,
                                              const Eigen::VectorXd& params, const Eigen::VectorXd& exo,
                                              const SteadyStateOptions& options) {
    const int n = model.origEndoNbr;
    std::vector<int> indices(static_cast<size_t>(n));
    std::iota(indices.begin(), indices.end(), 0);

    NonLinearSolver::Problem problem = makeSubsystemProblem(evaluator_, guess, exo, params, indices, indices);
    Eigen::VectorXd x = guess.head(n);
    auto solver = makeSolver(options.solver.algorithm);
    std::string error;
    const SolverStatus status = solver->solve(problem, x, options.solver, nullptr, &error);

    RamseyResult result;
    result.params = params;
    result.ys = guess;
    result.ys.head(n) = x;
    if (status != SolverStatus::Success) {
        const Eigen::VectorXd residual = evaluator_.staticResidual(result.ys, exo, params).head(n);
        result.status = StatusCode{SteadyStateCode::NonConvergence, residual.squaredNorm()};
        result.errorMessage = "Joint Ramsey solve: " + statusToString(status) + (error.empty() ? "" : " (" + error + ")");
        return result;
    }
    result.ys = closeAuxiliaryBlock(evaluator_, model, result.ys, exo, params);
    return result;
}

bool NewtonRamseySolver::fitMultipliers(Eigen::VectorXd& y, const ModelDescriptor& model,
                                        const Eigen::VectorXd& exo, const Eigen::VectorXd& params) const {
    const auto& multipliers = model.multiplierIndices;
    if (multipliers.empty()) return true;

    for (int m : multipliers) y(m) = 0.0;
    y = closeAuxiliaryBlock(evaluator_, model, y, exo, params);

    Eigen::VectorXd residual;
    Eigen::MatrixXd jacobian;
    evaluator_.staticResidualAndJacobian(y, exo, params, residual, jacobian);

    const Eigen::Index rows = model.ramseyEqNbr;
    Eigen::MatrixXd A(rows, static_cast<Eigen::Index>(multipliers.size()));
    for (size_t k = 0; k < multipliers.size(); ++k) {
        A.col(static_cast<Eigen::Index>(k)) = jacobian.col(multipliers[k]).head(rows);
    }
    const Eigen::VectorXd mu = A.colPivHouseholderQr().solve(-residual.head(rows));
    if (!mu.allFinite()) return false;

    for (size_t k = 0; k < multipliers.size(); ++k) {
        y(multipliers[k]) = mu(static_cast<Eigen::Index>(k));
    }
    y = closeAuxiliaryBlock(evaluator_, model, y, exo, params);
    return true;
}

RamseyResult NewtonRamseySolver::solveWithFunction(const Eigen::VectorXd& guess, const ModelDescriptor& model,
                                                   const Eigen::VectorXd& params, const Eigen::VectorXd& exo,
                                                   const SteadyStateOptions& options) {
    RamseyResult result;
    result.ys = guess;
    result.params = params;

    std::vector<int> instruments;
    for (const auto& name : options.instruments) {
        auto index = model.endoIndex(name);
        if (!index) {
            result.status = StatusCode{SteadyStateCode::NonConvergence, std::nullopt};
            result.errorMessage = "Instrument '" + name + "' is not an endogenous variable";
            return result;
        }
        instruments.push_back(*index);
    }

    // Steady state given the instrument values, multipliers left to the caller
    auto conditional = [&](const Eigen::VectorXd& instrumentValues, Eigen::VectorXd& y, Eigen::VectorXd& p) {
        Eigen::VectorXd g = guess;
        for (size_t k = 0; k < instruments.size(); ++k) {
            g(instruments[k]) = instrumentValues(static_cast<Eigen::Index>(k));
        }
        SteadyStateFileResult file = steadyStateFunction_->evaluate(g, exo, params, options);
        if (file.ys.cols() != 1 || file.ys.rows() != model.endoNbr || file.params.size() != params.size()) {
            throw std::runtime_error("The steady-state function returned a result of the wrong shape");
        }
        y = file.ys.col(0).real();
        p = file.params;
    };

    Eigen::VectorXd instrumentValues(static_cast<Eigen::Index>(instruments.size()));
    for (size_t k = 0; k < instruments.size(); ++k) {
        instrumentValues(static_cast<Eigen::Index>(k)) = guess(instruments[k]);
    }

    try {
        conditional(instrumentValues, result.ys, result.params);
    } catch (const std::exception& e) {
        result.status = StatusCode{SteadyStateCode::NonConvergence, std::nullopt};
        result.errorMessage = e.what();
        return result;
    }
    if (!fitMultipliers(result.ys, model, exo, result.params)) {
        result.status = StatusCode{SteadyStateCode::NonConvergence, std::nullopt};
        result.errorMessage = "The multipliers could not be computed from the first-order conditions";
        return result;
    }
    if (instruments.empty()) return result;

    const auto& multipliers = model.multiplierIndices;
    const Eigen::Index k = static_cast<Eigen::Index>(instruments.size());
    const Eigen::Index m = static_cast<Eigen::Index>(multipliers.size());
    if (k + m != model.ramseyEqNbr) {
        result.status = StatusCode{SteadyStateCode::NonConvergence, std::nullopt};
        result.errorMessage = "There are " + std::to_string(model.ramseyEqNbr) + " first-order conditions for " +
                              std::to_string(k) + " instrument(s) and " + std::to_string(m) + " multiplier(s)";
        return result;
    }

    // Unknowns: instruments, then multipliers
    auto pointAt = [&](const Eigen::VectorXd& x, Eigen::VectorXd& y, Eigen::VectorXd& p) {
        conditional(x.head(k), y, p);
        for (Eigen::Index j = 0; j < m; ++j) {
            y(multipliers[static_cast<size_t>(j)]) = x(k + j);
        }
        y = closeAuxiliaryBlock(evaluator_, model, y, exo, p);
    };
    auto conditions = [&](const Eigen::VectorXd& x) -> Eigen::VectorXd {
        Eigen::VectorXd y;
        Eigen::VectorXd p;
        pointAt(x, y, p);
        return evaluator_.staticResidual(y, exo, p).head(model.ramseyEqNbr);
    };

    NonLinearSolver::Problem problem;
    problem.size = static_cast<int>(k + m);
    problem.evaluate = [&](const Eigen::VectorXd& x, Eigen::VectorXd& F, Eigen::MatrixXd& J, bool computeJacobian) {
        F = conditions(x);
        if (!computeJacobian) return;
        J.resize(F.size(), x.size());
        for (Eigen::Index j = 0; j < x.size(); ++j) {
            const double h = 1e-7 * std::max(1.0, std::abs(x(j)));
            Eigen::VectorXd shifted = x;
            shifted(j) += h;
            J.col(j) = (conditions(shifted) - F) / h;
        }
    };

    Eigen::VectorXd x(k + m);
    x.head(k) = instrumentValues;
    for (Eigen::Index j = 0; j < m; ++j) {
        x(k + j) = result.ys(multipliers[static_cast<size_t>(j)]);
    }

    auto solver = makeSolver(options.solver.algorithm);
    std::string error;
    const SolverStatus status = solver->solve(problem, x, options.solver, nullptr, &error);
    if (options.solver.verbose) {
        std::cout << "Ramsey instruments solve: " << statusToString(status) << std::endl;
    }

    try {
        pointAt(x, result.ys, result.params);
    } catch (const std::exception& e) {
        result.status = StatusCode{SteadyStateCode::NonConvergence, std::nullopt};
        result.errorMessage = e.what();
        return result;
    }
    if (status != SolverStatus::Success) {
        const Eigen::VectorXd residual = evaluator_.staticResidual(result.ys, exo, result.params);
        result.status = StatusCode{SteadyStateCode::NonConvergence, residual.squaredNorm()};
        result.errorMessage = "Ramsey instruments solve: " + statusToString(status) +
                              (error.empty() ? "" : " (" + error + ")");
    }
    return result;
}

}  // namespace steadysolve
