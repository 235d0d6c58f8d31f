#pragma once

#include "evaluator.h"
#include "steady_state.h"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace steadysolve {

/**
 * @brief Ramsey static solver built on the nonlinear solvers.
 *
 * The leading `ramseyEqNbr` static equations are the first-order conditions
 * of the planner; they are linear in the Lagrange multipliers.
 *
 * Without a steady-state function the original system (multipliers
 * included) is solved jointly. With one, the function gives every
 * non-multiplier variable conditional on the instruments, the multipliers
 * come from a least-squares fit of the first-order conditions, and when
 * instruments are declared the first-order conditions are then solved for
 * the instruments and multipliers together (finite-difference Jacobian, the
 * steady-state function being a black box).
 */
class NewtonRamseySolver : public RamseyStaticSolver {
public:
    explicit NewtonRamseySolver(const ResidualEvaluator& evaluator,
                                SteadyStateFunction* steadyStateFunction = nullptr);

    RamseyResult solve(const Eigen::VectorXd& guess,
                       const ModelDescriptor& model,
                       const Eigen::VectorXd& params,
                       const SteadyStateOptions& options,
                       const OutputState& outputs) override;

private:
    const ResidualEvaluator& evaluator_;
    SteadyStateFunction* steadyStateFunction_;

    RamseyResult solveJointly(const Eigen::VectorXd& guess, const ModelDescriptor& model,
                              const Eigen::VectorXd& params, const Eigen::VectorXd& exo,
                              const SteadyStateOptions& options);

    RamseyResult solveWithFunction(const Eigen::VectorXd& guess, const ModelDescriptor& model,
                                   const Eigen::VectorXd& params, const Eigen::VectorXd& exo,
                                   const SteadyStateOptions& options);

    // Sets the multipliers of `y` to the least-squares solution of the
    // first-order conditions; false if they come out non-finite
    bool fitMultipliers(Eigen::VectorXd& y, const ModelDescriptor& model,
                        const Eigen::VectorXd& exo, const Eigen::VectorXd& params) const;
};

}  // namespace steadysolve
