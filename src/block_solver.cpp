#include "steadysolve/block_solver.h"
#include <iostream>
#include <limits>

namespace steadysolve {

NonLinearSolver::Problem makeSubsystemProblem(const ResidualEvaluator& evaluator,
                                              const Eigen::VectorXd& base,
                                              const Eigen::VectorXd& exo,
                                              const Eigen::VectorXd& params,
                                              const std::vector<int>& equationIds,
                                              const std::vector<int>& variables) {
    NonLinearSolver::Problem problem;
    problem.size = static_cast<int>(variables.size());
    problem.evaluate = [&evaluator, base, exo, params, equationIds, variables](
                           const Eigen::VectorXd& x, Eigen::VectorXd& F, Eigen::MatrixXd& J,
                           bool computeJacobian) {
        Eigen::VectorXd y = base;
        for (size_t k = 0; k < variables.size(); ++k) {
            y(variables[k]) = x(static_cast<Eigen::Index>(k));
        }

        Eigen::VectorXd residual;
        Eigen::MatrixXd jacobian;
        if (computeJacobian) {
            evaluator.staticResidualAndJacobian(y, exo, params, residual, jacobian);
        } else {
            residual = evaluator.staticResidual(y, exo, params);
        }

        const Eigen::Index m = static_cast<Eigen::Index>(equationIds.size());
        F.resize(m);
        for (Eigen::Index i = 0; i < m; ++i) {
            F(i) = residual(equationIds[static_cast<size_t>(i)]);
        }
        if (computeJacobian) {
            J.resize(m, x.size());
            for (Eigen::Index i = 0; i < m; ++i) {
                for (Eigen::Index j = 0; j < x.size(); ++j) {
                    J(i, j) = jacobian(equationIds[static_cast<size_t>(i)], variables[static_cast<size_t>(j)]);
                }
            }
        }
    };
    return problem;
}

// ============================================================================
// DecompositionBlockSolver
// ============================================================================

DecompositionBlockSolver::DecompositionBlockSolver(const ResidualEvaluator& evaluator)
    : evaluator_(evaluator) {}

BlockSolveResult DecompositionBlockSolver::solve(const Eigen::VectorXd& guess,
                                                 const Eigen::VectorXd& exo,
                                                 const Eigen::VectorXd& params,
                                                 const ModelDescriptor& model,
                                                 const SolverOptions& options) {
    BlockSolveResult result;
    result.y = guess;

    // Original equations only involve original variables; the auxiliary
    // block is solved separately at the end
    std::vector<std::vector<int>> incidence(model.staticIncidence.begin(),
                                            model.staticIncidence.begin() + model.origEqNbr);
    result.analysis = StructuralAnalyzer::analyze(incidence, model.origEndoNbr);
    if (!result.analysis.success) {
        result.errorMessage = result.analysis.errorMessage;
        return result;
    }

    if (options.verbose) {
        std::cout << "Block decomposition: " << result.analysis.blocks.size() << " blocks, largest "
                  << result.analysis.largestBlockSize << std::endl;
    }

    auto solver = makeSolver(options.algorithm);
    for (const auto& block : result.analysis.blocks) {
        NonLinearSolver::Problem problem = makeSubsystemProblem(evaluator_, result.y, exo, params,
                                                                block.equationIds, block.variables);
        Eigen::VectorXd x(static_cast<Eigen::Index>(block.variables.size()));
        for (size_t k = 0; k < block.variables.size(); ++k) {
            x(static_cast<Eigen::Index>(k)) = result.y(block.variables[k]);
        }

        SolverTrace trace;
        std::string error;
        const SolverStatus status = solver->solve(problem, x, options, &trace, &error);

        for (size_t k = 0; k < block.variables.size(); ++k) {
            result.y(block.variables[k]) = x(static_cast<Eigen::Index>(k));
        }

        BlockSolveResult::BlockResult blockResult;
        blockResult.id = block.id;
        blockResult.size = static_cast<int>(block.size());
        blockResult.status = status;
        blockResult.iterations = trace.iterations.empty() ? 0 : static_cast<int>(trace.iterations.size()) - 1;
        blockResult.maxResidual = trace.iterations.empty() ? std::numeric_limits<double>::quiet_NaN()
                                                           : trace.iterations.back().residualNorm;
        blockResult.errorMessage = error;
        result.blockResults.push_back(blockResult);

        if (options.verbose) {
            std::cout << "Block " << block.id << " (size " << block.size() << "): "
                      << statusToString(status) << " after " << blockResult.iterations
                      << " iterations" << std::endl;
        }

        if (status != SolverStatus::Success) {
            result.errorMessage = "Block " + std::to_string(block.id) + " failed: " +
                                  statusToString(status) + (error.empty() ? "" : " (" + error + ")");
            return result;
        }
    }

    result.y = closeAuxiliaryBlock(evaluator_, model, result.y, exo, params);
    result.success = true;
    return result;
}

}  // namespace steadysolve
