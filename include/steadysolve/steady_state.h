#pragma once

#include "block_solver.h"
#include "evaluator.h"
#include "model.h"
#include "solver.h"
#include <Eigen/Dense>
#include <complex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace steadysolve {

// ============================================================================
// Status codes
// ============================================================================

/**
 * @brief Outcome of a steady-state computation.
 *
 * The numeric values are the ones reported to users and in JSON reports.
 */
enum class SteadyStateCode {
    Success = 0,
    NonConvergence = 20,          // Strategy reported an unsolved system
    ComplexSteadyState = 21,      // Nonzero imaginary part, real part returned
    NaNSteadyState = 22,          // NaN in the steady state or its residuals
    StaticDynamicMismatch = 25,   // Dynamic residuals above solve_tolf at the static steady state
    RamseyNotSolving = 81,        // Joint Ramsey steady state above dynatol_f
    RamseyNaN = 82,               // NaN in the original equations after the Ramsey solve
    RamseyAuxNaN = 83,            // NaN in the multiplier equations after the Ramsey solve
    RamseyFileNaN = 84,           // Steady-state function produced NaN residuals
    RamseyFileNotSolving = 85,    // Steady-state function leaves residuals above dynatol_f
    RamseyInternalError = 86      // Ramsey static solver reported a failure
};

std::string codeToString(SteadyStateCode code);

struct StatusCode {
    SteadyStateCode code = SteadyStateCode::Success;
    std::optional<double> magnitude;   // Residual sum of squares or similar, when meaningful

    bool ok() const { return code == SteadyStateCode::Success; }
    int value() const { return static_cast<int>(code); }
};

// ============================================================================
// Options and caller-owned outputs
// ============================================================================

struct SteadyStateOptions {
    bool steadystateFlag = false;     // A steady-state function supplies the steady state
    bool ramseyPolicy = false;
    bool linear = false;
    bool bytecode = false;
    bool block = false;
    bool debug = false;
    bool steadystateCheckFlag = true; // Check a steady-state function result against the static model

    double dynatolF = 1e-5;           // Residual acceptance tolerance
    double solveTolf = 1e-7;          // Static/dynamic consistency tolerance

    std::vector<std::string> instruments;   // Ramsey policy instruments (diagnostics)

    SolverOptions solver;
};

/**
 * @brief Point at which the dynamic model was checked in block/bytecode mode.
 */
struct DecisionRule {
    bool evaluated = false;
    Eigen::VectorXd steadyState;
    Eigen::MatrixXd exogenous;        // One row per period
    Eigen::VectorXd residuals;
};

struct OutputState {
    Eigen::VectorXd exoSteadyState;
    Eigen::VectorXd exoDetSteadyState;
    DecisionRule decisionRule;
};

// [exo_steady_state; exo_det_steady_state]
Eigen::VectorXd exogenousVector(const OutputState& outputs);

// ============================================================================
// Collaborators
// ============================================================================

/**
 * @brief Thrown when a steady-state function returns something other than a
 * column vector with one entry per endogenous variable.
 */
class SteadyStateFileShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SteadyStateFileResult {
    Eigen::MatrixXcd ys;        // Must be a single column of endoNbr entries
    Eigen::VectorXd params;
    StatusCode status;
};

/**
 * @brief User-supplied (closed-form) steady state.
 *
 * Returned vectors already contain the auxiliary variables.
 */
class SteadyStateFunction {
public:
    virtual ~SteadyStateFunction() = default;

    virtual SteadyStateFileResult evaluate(const Eigen::VectorXd& guess,
                                           const Eigen::VectorXd& exo,
                                           const Eigen::VectorXd& params,
                                           const SteadyStateOptions& options) = 0;
};

struct RamseyResult {
    Eigen::VectorXd ys;
    Eigen::VectorXd params;
    StatusCode status;
    std::string errorMessage;
};

/**
 * @brief Steady state of a Ramsey problem, jointly with its Lagrange
 * multipliers.
 */
class RamseyStaticSolver {
public:
    virtual ~RamseyStaticSolver() = default;

    virtual RamseyResult solve(const Eigen::VectorXd& guess,
                               const ModelDescriptor& model,
                               const Eigen::VectorXd& params,
                               const SteadyStateOptions& options,
                               const OutputState& outputs) = 0;
};

/**
 * @brief Collaborators of a SteadyStateComputer. Non-owning; each must
 * outlive the computer.
 *
 * Only the evaluator is always required. The others are needed when the
 * model or the options call for them: the auxiliary setter when the model
 * has auxiliary variables, the steady-state function with `steadystateFlag`,
 * the Ramsey solver with `ramseyPolicy`, the block solver with `block` or
 * `bytecode`. Without a nonlinear solver, one is made from
 * `options.solver.algorithm`.
 */
struct SteadyStateCollaborators {
    const ResidualEvaluator* evaluator = nullptr;
    const AuxiliaryVariableSetter* auxSetter = nullptr;
    SteadyStateFunction* steadyStateFunction = nullptr;
    RamseyStaticSolver* ramseySolver = nullptr;
    BlockSolver* blockSolver = nullptr;
    NonLinearSolver* nonlinearSolver = nullptr;
};

// ============================================================================
// Strategy selection
// ============================================================================

struct RamseyWithFile {};
struct RamseyNoFile {};
struct ExplicitFile {};
struct LinearDirect {};
struct NonlinearGeneric {};
struct BlockStructured {};

using SolveStrategy = std::variant<RamseyWithFile, RamseyNoFile, ExplicitFile,
                                   LinearDirect, NonlinearGeneric, BlockStructured>;

/**
 * @brief Strategy implied by the option flags.
 *
 * Precedence: ramseyPolicy (with or without a steady-state function), then
 * steadystateFlag, then linear/nonlinear when neither block nor bytecode is
 * set, then the block solver.
 */
SolveStrategy selectStrategy(const SteadyStateOptions& options);

std::string strategyName(const SolveStrategy& strategy);

// ============================================================================
// Steady-state computer
// ============================================================================

struct SteadyStateResult {
    Eigen::VectorXd steadyState;
    Eigen::VectorXd params;
    StatusCode status;
    std::string diagnostics;    // Human-readable messages, empty when there is nothing to report
    std::string strategy;
};

// Residuals below this at the initial guess of a linear model skip the solve
constexpr double kLinearAlreadySolvedTolerance = 1e-12;
// Residual accepted after the Newton step of a linear model
constexpr double kLinearStepTolerance = 1e-6;

/**
 * @brief Computes the steady state of a model.
 *
 * Runs exactly one strategy, then validates its output: non-convergence,
 * static/dynamic consistency, complex values and NaN, in that order. Failures
 * are reported through StatusCode; the only exception thrown for a
 * well-formed call is SteadyStateFileShapeError. A collaborator the call
 * needs but that was not supplied is a std::invalid_argument.
 */
class SteadyStateComputer {
public:
    explicit SteadyStateComputer(const SteadyStateCollaborators& collaborators);

    /**
     * @brief Compute the steady state starting from `initialGuess`.
     *
     * @param initialGuess One entry per endogenous variable; auxiliaries may be NaN
     * @param model Model descriptor
     * @param params Parameters, updated in place when a steady-state function sets them
     * @param options Mode flags and tolerances
     * @param outputs Exogenous steady state; `decisionRule` is written in block/bytecode mode
     */
    SteadyStateResult compute(const Eigen::VectorXd& initialGuess,
                              const ModelDescriptor& model,
                              Eigen::VectorXd& params,
                              const SteadyStateOptions& options,
                              OutputState& outputs);

private:
    SteadyStateCollaborators collaborators_;

    // What a strategy hands back to the validation steps
    struct Candidate {
        Eigen::VectorXcd ys;
        bool solved = true;
        std::optional<StatusCode> terminal;   // Set when the strategy decided the outcome
    };

    struct Context {
        const ModelDescriptor& model;
        Eigen::VectorXd& params;
        const SteadyStateOptions& options;
        OutputState& outputs;
        Eigen::VectorXd exo;
        Eigen::VectorXd guess;
        std::ostringstream& diag;
    };

    Candidate solveRamsey(Context& ctx, bool withFile);
    Candidate solveExplicitFile(Context& ctx);
    Candidate solveLinear(Context& ctx);
    Candidate solveNonlinear(Context& ctx);
    Candidate solveBlock(Context& ctx);

    bool checkStaticDynamicConsistency(Context& ctx, const Eigen::VectorXd& ys);

    void printInstrumentValues(Context& ctx, const Eigen::VectorXd& values) const;

    const ResidualEvaluator& evaluator() const;
};

}  // namespace steadysolve
