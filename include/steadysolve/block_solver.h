#pragma once

#include "evaluator.h"
#include "solver.h"
#include "structural_analysis.h"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace steadysolve {

// ============================================================================
// Block solve result
// ============================================================================

struct BlockSolveResult {
    bool success = false;
    Eigen::VectorXd y;              // Last iterate, auxiliaries included
    std::string errorMessage;

    struct BlockResult {
        int id = 0;
        int size = 0;
        SolverStatus status = SolverStatus::InvalidInput;
        int iterations = 0;
        double maxResidual = 0.0;
        std::string errorMessage;
    };
    std::vector<BlockResult> blockResults;

    StructuralAnalysisResult analysis;
};

/**
 * @brief Nonlinear problem in `variables` made of `equationIds` of the static
 * model, every other entry of `base` held fixed.
 */
NonLinearSolver::Problem makeSubsystemProblem(const ResidualEvaluator& evaluator,
                                              const Eigen::VectorXd& base,
                                              const Eigen::VectorXd& exo,
                                              const Eigen::VectorXd& params,
                                              const std::vector<int>& equationIds,
                                              const std::vector<int>& variables);

// ============================================================================
// Block solver interface
// ============================================================================

/**
 * @brief Solves the static model block by block (`block` / `bytecode` mode).
 */
class BlockSolver {
public:
    virtual ~BlockSolver() = default;

    virtual BlockSolveResult solve(const Eigen::VectorXd& guess,
                                   const Eigen::VectorXd& exo,
                                   const Eigen::VectorXd& params,
                                   const ModelDescriptor& model,
                                   const SolverOptions& options) = 0;
};

/**
 * @brief Block solver built on the structural decomposition of the original
 * equations.
 *
 * Blocks are solved in topological order with the nonlinear solver selected
 * by `options.algorithm`; each block works on its own variables with all
 * others held at their current values. The auxiliary block is closed last.
 */
class DecompositionBlockSolver : public BlockSolver {
public:
    explicit DecompositionBlockSolver(const ResidualEvaluator& evaluator);

    BlockSolveResult solve(const Eigen::VectorXd& guess,
                           const Eigen::VectorXd& exo,
                           const Eigen::VectorXd& params,
                           const ModelDescriptor& model,
                           const SolverOptions& options) override;

private:
    const ResidualEvaluator& evaluator_;
};

}  // namespace steadysolve
