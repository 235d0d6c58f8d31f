#pragma once

#include "model.h"
#include <Eigen/Dense>

namespace steadysolve {

// ============================================================================
// Evaluator interfaces
// ============================================================================

/**
 * @brief Residuals of the static and dynamic forms of a model.
 *
 * The exogenous vector is the concatenation of the exogenous and
 * deterministic exogenous steady states.
 */
class ResidualEvaluator {
public:
    virtual ~ResidualEvaluator() = default;

    /**
     * @brief Residuals of the static model, one per equation.
     * @param y Endogenous values, auxiliaries included
     * @param exo Exogenous values
     * @param params Parameter values
     */
    virtual Eigen::VectorXd staticResidual(const Eigen::VectorXd& y,
                                           const Eigen::VectorXd& exo,
                                           const Eigen::VectorXd& params) const = 0;

    /**
     * @brief Residuals and Jacobian (equations x endogenous variables) of the
     * static model.
     */
    virtual void staticResidualAndJacobian(const Eigen::VectorXd& y,
                                           const Eigen::VectorXd& exo,
                                           const Eigen::VectorXd& params,
                                           Eigen::VectorXd& residual,
                                           Eigen::MatrixXd& jacobian) const = 0;

    /**
     * @brief Residuals of the dynamic model at period `it`.
     * @param y Stacked endogenous values, ordered by the lead/lag incidence
     * @param exo Exogenous values, one row per period
     * @param params Parameter values
     * @param steadyState Steady state around which the model is written
     * @param it Row of `exo` holding the current period (0-based, equals maximumLag)
     */
    virtual Eigen::VectorXd dynamicResidual(const Eigen::VectorXd& y,
                                            const Eigen::MatrixXd& exo,
                                            const Eigen::VectorXd& params,
                                            const Eigen::VectorXd& steadyState,
                                            int it) const = 0;
};

// Fills the auxiliary block of a guess from the original variables
class AuxiliaryVariableSetter {
public:
    virtual ~AuxiliaryVariableSetter() = default;

    virtual Eigen::VectorXd setAuxiliaryVariables(const Eigen::VectorXd& y,
                                                  const Eigen::VectorXd& exo,
                                                  const Eigen::VectorXd& params) const = 0;
};

// ============================================================================
// Model evaluator
// ============================================================================

/**
 * @brief Evaluates a built model's residual expressions.
 *
 * Jacobians come from forward-mode automatic differentiation (ADValue) with
 * one independent variable per endogenous variable. The evaluator keeps a
 * reference to the model, which must outlive it.
 */
class ModelEvaluator : public ResidualEvaluator, public AuxiliaryVariableSetter {
public:
    explicit ModelEvaluator(const BuiltModel& model);

    Eigen::VectorXd staticResidual(const Eigen::VectorXd& y,
                                   const Eigen::VectorXd& exo,
                                   const Eigen::VectorXd& params) const override;

    void staticResidualAndJacobian(const Eigen::VectorXd& y,
                                   const Eigen::VectorXd& exo,
                                   const Eigen::VectorXd& params,
                                   Eigen::VectorXd& residual,
                                   Eigen::MatrixXd& jacobian) const override;

    Eigen::VectorXd dynamicResidual(const Eigen::VectorXd& y,
                                    const Eigen::MatrixXd& exo,
                                    const Eigen::VectorXd& params,
                                    const Eigen::VectorXd& steadyState,
                                    int it) const override;

    Eigen::VectorXd setAuxiliaryVariables(const Eigen::VectorXd& y,
                                          const Eigen::VectorXd& exo,
                                          const Eigen::VectorXd& params) const override;

    // Exogenous vector [exo; exo_det] from the model's initval values
    Eigen::VectorXd defaultExogenous() const;

    const BuiltModel& model() const { return model_; }

private:
    const BuiltModel& model_;

    void checkSizes(const Eigen::VectorXd& y, const Eigen::VectorXd& exo,
                    const Eigen::VectorXd& params) const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Solve the auxiliary equations for the auxiliary variables, the
 * original variables held fixed.
 *
 * Each auxiliary equation reads `aux - definition(original variables)`, so
 * its Jacobian block is the identity and one Newton step from zero is exact.
 * Returns `y` with the auxiliary block replaced.
 */
Eigen::VectorXd closeAuxiliaryBlock(const ResidualEvaluator& evaluator,
                                    const ModelDescriptor& model,
                                    const Eigen::VectorXd& y,
                                    const Eigen::VectorXd& exo,
                                    const Eigen::VectorXd& params);

/**
 * @brief Compare the static Jacobian of an evaluator with central finite
 * differences.
 *
 * @param epsilon Relative finite difference step
 * @param verbose If true, prints both Jacobians to stdout for comparison
 * @return Maximum absolute difference between the two Jacobians
 */
double compareJacobianWithFiniteDifferences(const ResidualEvaluator& evaluator,
                                            const Eigen::VectorXd& y,
                                            const Eigen::VectorXd& exo,
                                            const Eigen::VectorXd& params,
                                            double epsilon = 1e-7,
                                            bool verbose = false);

}  // namespace steadysolve
