#pragma once

#include "model.h"
#include "steady_state.h"
#include <Eigen/Dense>

namespace steadysolve {

/**
 * @brief Steady state given in closed form by a `steady_state_model` block.
 *
 * Assignments run in order in complex arithmetic, so a square root of a
 * negative number shows up as an imaginary part of the result rather than as
 * NaN. Assigned parameters are returned (real part); endogenous variables the
 * block does not assign keep their guess value; auxiliary variables are
 * computed from their definitions once the block has run.
 */
class SteadyStateModelFunction : public SteadyStateFunction {
public:
    explicit SteadyStateModelFunction(const BuiltModel& model);

    SteadyStateFileResult evaluate(const Eigen::VectorXd& guess,
                                   const Eigen::VectorXd& exo,
                                   const Eigen::VectorXd& params,
                                   const SteadyStateOptions& options) override;

    // Number of calls to evaluate()
    int callCount() const { return calls_; }

private:
    const BuiltModel& model_;
    int calls_ = 0;
};

}  // namespace steadysolve
