#pragma once

#include <Eigen/Dense>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace steadysolve {

// ============================================================================
// Solver Status & Options
// ============================================================================

/**
 * @brief Outcome of a nonlinear solve.
 */
enum class SolverStatus {
    Success,           // ||F||_inf below tolerance
    MaxIterations,     // Iteration budget exhausted
    LineSearchFailed,  // No acceptable step along the Newton direction
    Stalled,           // Steps (or the trust region) shrank below stepTolerance
    SingularJacobian,  // Step could not be computed from the Jacobian
    InvalidInput,      // Inconsistent problem size or guess
    EvaluationError    // Residual evaluation threw or returned non-finite values
};

std::string statusToString(SolverStatus status);

/**
 * @brief Nonlinear solver selection (`solve_algo`).
 */
enum class SolverAlgorithm {
    Newton,       // Damped Newton with Armijo line search
    TrustRegion   // Powell dogleg trust region
};

std::string algorithmToString(SolverAlgorithm algorithm);

// Accepts "newton" and "trust_region" (also "trust-region", "trustregion",
// "dogleg"), case-insensitive. Returns false for anything else.
bool parseAlgorithm(const std::string& text, SolverAlgorithm& algorithm);

struct SolverOptions {
    SolverAlgorithm algorithm = SolverAlgorithm::Newton;
    int maxIterations = 100;          // Maximum Newton/trust-region iterations
    double tolerance = 1e-9;          // Convergence tolerance on ||F||_inf
    double stepTolerance = 1e-12;     // Scaled step (or radius) below which the solve stalls
    bool verbose = false;             // Print iteration info

    // Line search options (Newton)
    double lsAlpha = 1e-4;            // Armijo condition parameter
    double lsRho = 0.5;               // Step reduction factor when a trial point cannot be evaluated
    int lsMaxIterations = 20;         // Max line search iterations
    double lsMinStep = 1e-10;         // Minimum step size in line search

    // Trust region options
    double trInitialRadius = 1.0;     // Initial radius, relative to max(1, ||x||)

    bool enableScaling = true;        // Scale variables by their order of magnitude
};

// ============================================================================
// Solver Trace (Debug Information)
// ============================================================================

struct SolverTrace {
    struct Iteration {
        int iter = 0;
        double residualNorm = 0.0;
        double stepNorm = 0.0;
        double lambda = 1.0;   // Line search step or trust-region radius
        Eigen::VectorXd x;
        Eigen::VectorXd residuals;
    };

    std::vector<Iteration> iterations;
    SolverStatus finalStatus = SolverStatus::InvalidInput;
    std::chrono::duration<double> totalTime{0};

    std::string toString() const;
};

// ============================================================================
// Non-Linear Solver Interface (Strategy Pattern)
// ============================================================================

/**
 * @brief Solves F(x) = 0 for F: R^n -> R^n.
 */
class NonLinearSolver {
public:
    /**
     * @brief Problem definition for the solver.
     */
    struct Problem {
        /**
         * @brief Evaluate F(x) and, when `computeJacobian` is set, J(x).
         *
         * May throw; solvers report exceptions as EvaluationError or treat
         * the point as unacceptable during a line search.
         */
        std::function<void(const Eigen::VectorXd& x,
                           Eigen::VectorXd& F,
                           Eigen::MatrixXd& J,
                           bool computeJacobian)> evaluate;
        int size = 0;  // Number of equations/variables
    };

    virtual ~NonLinearSolver() = default;

    /**
     * @brief Solve the system starting from `x`.
     *
     * @param problem Problem definition
     * @param x Initial guess, overwritten with the last iterate
     * @param options Solver options
     * @param trace Optional trace for debugging (nullptr to disable)
     * @param detailedError Optional human-readable failure description
     */
    virtual SolverStatus solve(Problem& problem,
                               Eigen::VectorXd& x,
                               const SolverOptions& options = SolverOptions(),
                               SolverTrace* trace = nullptr,
                               std::string* detailedError = nullptr) = 0;
};

// ============================================================================
// Newton Solver (Damped Newton-Raphson with Line Search)
// ============================================================================

/**
 * @brief Damped Newton-Raphson solver with backtracking line search.
 *
 * 1. Evaluate F(x), J(x); stop when ||F||_inf < tolerance
 * 2. Solve (J D) dy = -F with column-pivoting QR, dx = D dy (D = scaling)
 * 3. Backtrack on phi = ||F||^2 / 2 until the Armijo condition holds,
 *    interpolating the step quadratically
 * 4. x <- x + lambda dx
 */
class NewtonSolver : public NonLinearSolver {
public:
    SolverStatus solve(Problem& problem,
                       Eigen::VectorXd& x,
                       const SolverOptions& options = SolverOptions(),
                       SolverTrace* trace = nullptr,
                       std::string* detailedError = nullptr) override;

private:
    double lineSearch(Problem& problem,
                      const Eigen::VectorXd& x,
                      const Eigen::VectorXd& dx,
                      const Eigen::VectorXd& F,
                      const SolverOptions& options) const;
};

// ============================================================================
// Trust-Region Solver (Powell dogleg)
// ============================================================================

/**
 * @brief Dogleg trust-region solver on ||F||^2.
 *
 * The step combines the Gauss-Newton and steepest-descent (Cauchy) steps
 * inside a radius that grows after good predictions of the residual decrease
 * and shrinks after poor ones. Copes with singular Jacobians, where Newton
 * gives up.
 */
class TrustRegionSolver : public NonLinearSolver {
public:
    SolverStatus solve(Problem& problem,
                       Eigen::VectorXd& x,
                       const SolverOptions& options = SolverOptions(),
                       SolverTrace* trace = nullptr,
                       std::string* detailedError = nullptr) override;
};

std::unique_ptr<NonLinearSolver> makeSolver(SolverAlgorithm algorithm);

// Orders of magnitude of |x| (1 for |x| < 1), clamped to [1, 1e6]
Eigen::VectorXd computeScalingFactors(const Eigen::VectorXd& x);

}  // namespace steadysolve
