#include "steadysolve/steady_state.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>
#include <type_traits>

namespace steadysolve {

std::string codeToString(SteadyStateCode code) {
    switch (code) {
        case SteadyStateCode::Success: return "Success";
        case SteadyStateCode::NonConvergence: return "NonConvergence";
        case SteadyStateCode::ComplexSteadyState: return "ComplexSteadyState";
        case SteadyStateCode::NaNSteadyState: return "NaNSteadyState";
        case SteadyStateCode::StaticDynamicMismatch: return "StaticDynamicMismatch";
        case SteadyStateCode::RamseyNotSolving: return "RamseyNotSolving";
        case SteadyStateCode::RamseyNaN: return "RamseyNaN";
        case SteadyStateCode::RamseyAuxNaN: return "RamseyAuxNaN";
        case SteadyStateCode::RamseyFileNaN: return "RamseyFileNaN";
        case SteadyStateCode::RamseyFileNotSolving: return "RamseyFileNotSolving";
        case SteadyStateCode::RamseyInternalError: return "RamseyInternalError";
    }
    return "Unknown";
}

Eigen::VectorXd exogenousVector(const OutputState& outputs) {
    Eigen::VectorXd exo(outputs.exoSteadyState.size() + outputs.exoDetSteadyState.size());
    exo << outputs.exoSteadyState, outputs.exoDetSteadyState;
    return exo;
}

SolveStrategy selectStrategy(const SteadyStateOptions& options) {
    if (options.ramseyPolicy) {
        if (options.steadystateFlag) return RamseyWithFile{};
        return RamseyNoFile{};
    }
    if (options.steadystateFlag) return ExplicitFile{};
    if (!options.block && !options.bytecode) {
        if (options.linear) return LinearDirect{};
        return NonlinearGeneric{};
    }
    return BlockStructured{};
}

std::string strategyName(const SolveStrategy& strategy) {
    return std::visit([](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RamseyWithFile>) return "ramsey_with_file";
        else if constexpr (std::is_same_v<T, RamseyNoFile>) return "ramsey";
        else if constexpr (std::is_same_v<T, ExplicitFile>) return "steady_state_file";
        else if constexpr (std::is_same_v<T, LinearDirect>) return "linear";
        else if constexpr (std::is_same_v<T, NonlinearGeneric>) return "nonlinear";
        else return "block";
    }, strategy);
}

namespace {

// Largest absolute entry; NaN as soon as one entry is NaN
double maxAbs(const Eigen::VectorXd& v) {
    double worst = 0.0;
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (std::isnan(v(i))) return std::numeric_limits<double>::quiet_NaN();
        worst = std::max(worst, std::abs(v(i)));
    }
    return worst;
}

std::vector<int> nanRows(const Eigen::VectorXd& v) {
    std::vector<int> rows;
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (std::isnan(v(i))) rows.push_back(static_cast<int>(i));
    }
    return rows;
}

// 1-based, comma separated
void printRows(std::ostream& os, const std::vector<int>& rows) {
    for (size_t i = 0; i < rows.size(); ++i) {
        os << (i > 0 ? ", " : "") << rows[i] + 1;
    }
    os << "\n";
}

bool hasImaginaryPart(const Eigen::VectorXcd& ys) {
    for (Eigen::Index i = 0; i < ys.size(); ++i) {
        if (ys(i).imag() != 0.0) return true;
    }
    return false;
}

Eigen::VectorXcd toComplex(const Eigen::VectorXd& v) {
    return v.cast<std::complex<double>>();
}

Eigen::VectorXcd checkedColumn(const Eigen::MatrixXcd& ys, const ModelDescriptor& model) {
    if (ys.cols() > ys.rows()) {
        throw SteadyStateFileShapeError("The steady-state function must return a column vector, not a " +
                                        std::to_string(ys.rows()) + "x" + std::to_string(ys.cols()) +
                                        " row vector");
    }
    if (ys.cols() != 1 || ys.rows() != model.endoNbr) {
        throw SteadyStateFileShapeError("The steady-state function returned a " + std::to_string(ys.rows()) +
                                        "x" + std::to_string(ys.cols()) + " result, expected " +
                                        std::to_string(model.endoNbr) + "x1");
    }
    return ys.col(0);
}

void checkParameterCount(const Eigen::VectorXd& returned, const Eigen::VectorXd& params) {
    if (returned.size() != params.size()) {
        throw SteadyStateFileShapeError("The steady-state function returned " + std::to_string(returned.size()) +
                                        " parameters, expected " + std::to_string(params.size()));
    }
}

}  // namespace

// ============================================================================
// SteadyStateComputer
// ============================================================================

SteadyStateComputer::SteadyStateComputer(const SteadyStateCollaborators& collaborators)
    : collaborators_(collaborators) {
    if (!collaborators_.evaluator) {
        throw std::invalid_argument("SteadyStateComputer requires a residual evaluator");
    }
}

const ResidualEvaluator& SteadyStateComputer::evaluator() const {
    return *collaborators_.evaluator;
}

SteadyStateResult SteadyStateComputer::compute(const Eigen::VectorXd& initialGuess,
                                               const ModelDescriptor& model,
                                               Eigen::VectorXd& params,
                                               const SteadyStateOptions& options,
                                               OutputState& outputs) {
    std::ostringstream diag;
    const SolveStrategy strategy = selectStrategy(options);
    Context ctx{model, params, options, outputs, exogenousVector(outputs), initialGuess, diag};

    // A steady-state function returns vectors with the auxiliaries already set
    if (model.auxVarCount() > 0 && !options.steadystateFlag) {
        if (!collaborators_.auxSetter) {
            throw std::invalid_argument("The model has auxiliary variables but no auxiliary variable setter was supplied");
        }
        ctx.guess = collaborators_.auxSetter->setAuxiliaryVariables(ctx.guess, ctx.exo, params);
    }

    const Candidate candidate = std::visit([&](const auto& s) -> Candidate {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RamseyWithFile>) {
            return solveRamsey(ctx, true);
        } else if constexpr (std::is_same_v<T, RamseyNoFile>) {
            return solveRamsey(ctx, false);
        } else if constexpr (std::is_same_v<T, ExplicitFile>) {
            return solveExplicitFile(ctx);
        } else if constexpr (std::is_same_v<T, LinearDirect>) {
            return solveLinear(ctx);
        } else if constexpr (std::is_same_v<T, NonlinearGeneric>) {
            return solveNonlinear(ctx);
        } else {
            static_assert(std::is_same_v<T, BlockStructured>, "unhandled solve strategy");
            return solveBlock(ctx);
        }
    }, strategy);

    SteadyStateResult result;
    result.strategy = strategyName(strategy);
    auto finish = [&](const StatusCode& status, const Eigen::VectorXd& ys) {
        result.steadyState = ys;
        result.params = params;
        result.status = status;
        result.diagnostics = diag.str();
        return result;
    };

    const Eigen::VectorXd realPart = candidate.ys.real();

    if (candidate.terminal) {
        return finish(*candidate.terminal, realPart);
    }

    if (!candidate.solved) {
        const Eigen::VectorXd resid = evaluator().staticResidual(realPart, ctx.exo, params);
        StatusCode status{SteadyStateCode::NonConvergence, resid.squaredNorm()};
        if (std::isnan(*status.magnitude)) {
            status.code = SteadyStateCode::NaNSteadyState;
        }
        return finish(status, realPart);
    }

    const bool complex = hasImaginaryPart(candidate.ys);

    // Complex candidates are checked through their real part
    if (model.staticAndDynamicDiffer) {
        if (!checkStaticDynamicConsistency(ctx, realPart)) {
            return finish(StatusCode{SteadyStateCode::StaticDynamicMismatch, std::nullopt}, realPart);
        }
    }

    if (complex) {
        const double imagSquares = candidate.ys.imag().squaredNorm();
        diag << "The steady state is complex valued (sum of squared imaginary parts " << imagSquares
             << "); returning its real part.\n";
        return finish(StatusCode{SteadyStateCode::ComplexSteadyState, imagSquares}, realPart);
    }

    if (realPart.hasNaN()) {
        diag << "The steady state contains NaN for:";
        for (Eigen::Index i = 0; i < realPart.size(); ++i) {
            if (std::isnan(realPart(i))) diag << " " << model.endoNames[static_cast<size_t>(i)];
        }
        diag << "\n";
        return finish(StatusCode{SteadyStateCode::NaNSteadyState, std::numeric_limits<double>::quiet_NaN()},
                      realPart);
    }

    return finish(StatusCode{}, realPart);
}

// ----------------------------------------------------------------------------
// Ramsey policy
// ----------------------------------------------------------------------------

void SteadyStateComputer::printInstrumentValues(Context& ctx, const Eigen::VectorXd& values) const {
    for (const auto& name : ctx.options.instruments) {
        auto index = ctx.model.endoIndex(name);
        ctx.diag << "    " << name << " = ";
        if (index && *index < values.size()) {
            ctx.diag << values(*index) << "\n";
        } else {
            ctx.diag << "(not an endogenous variable)\n";
        }
    }
}

SteadyStateComputer::Candidate SteadyStateComputer::solveRamsey(Context& ctx, bool withFile) {
    const ModelDescriptor& model = ctx.model;
    const SteadyStateOptions& options = ctx.options;
    const Eigen::Index nMultipliers = model.ramseyEqNbr;
    Candidate candidate;

    if (withFile) {
        if (!collaborators_.steadyStateFunction) {
            throw std::invalid_argument("steadystateFlag is set but no steady-state function was supplied");
        }
        SteadyStateFileResult file =
            collaborators_.steadyStateFunction->evaluate(ctx.guess, ctx.exo, ctx.params, options);
        const Eigen::VectorXcd ys = checkedColumn(file.ys, model);
        checkParameterCount(file.params, ctx.params);
        ctx.params = file.params;
        candidate.ys = ys;

        // The function solves everything but the multipliers, given the
        // instruments
        const Eigen::VectorXd resids = evaluator().staticResidual(ys.real(), ctx.exo, ctx.params);
        const Eigen::VectorXd constraints = resids.tail(resids.size() - nMultipliers);

        const std::vector<int> nans = nanRows(constraints);
        if (!nans.empty()) {
            ctx.diag << "The steady-state function for the Ramsey problem resulted in NaN residuals.\n"
                     << "It was evaluated conditional on the following initial instrument values:\n";
            printInstrumentValues(ctx, ctx.guess);
            ctx.diag << "NaN in equation(s): ";
            printRows(ctx.diag, nans);
            ctx.diag << "If these initial values are not admissible, change them in the initval block.\n";
            candidate.terminal = StatusCode{SteadyStateCode::RamseyFileNaN, resids.squaredNorm()};
            return candidate;
        }

        if (maxAbs(constraints) > options.dynatolF) {
            ctx.diag << "The steady-state function does not solve the steady state of the Ramsey problem\n"
                     << "conditional on the following instrument values:\n";
            printInstrumentValues(ctx, ctx.guess);
            ctx.diag << "Equations with nonzero residuals:\n";
            for (Eigen::Index i = 0; i < constraints.size(); ++i) {
                if (std::abs(constraints(i)) > options.dynatolF / 100) {
                    ctx.diag << "    Equation number " << i + 1 << ": " << constraints(i) << "\n";
                }
            }
            candidate.terminal = StatusCode{SteadyStateCode::RamseyFileNotSolving, resids.squaredNorm()};
            return candidate;
        }
    }

    if (options.debug) {
        std::vector<std::string> infNames;
        std::vector<std::string> nanNames;
        for (Eigen::Index i = 0; i < ctx.guess.size(); ++i) {
            if (std::isinf(ctx.guess(i))) infNames.push_back(model.endoNames[static_cast<size_t>(i)]);
            if (std::isnan(ctx.guess(i))) nanNames.push_back(model.endoNames[static_cast<size_t>(i)]);
        }
        if (!infNames.empty()) {
            ctx.diag << "The initial values of the following variables are Inf:\n";
            for (const auto& name : infNames) ctx.diag << "    " << name << "\n";
        }
        if (!nanNames.empty()) {
            ctx.diag << "The initial values of the following variables are NaN:\n";
            for (const auto& name : nanNames) ctx.diag << "    " << name << "\n";
        }
    }

    if (!collaborators_.ramseySolver) {
        throw std::invalid_argument("ramseyPolicy is set but no Ramsey static solver was supplied");
    }
    RamseyResult ramsey = collaborators_.ramseySolver->solve(ctx.guess, model, ctx.params, options, ctx.outputs);
    if (!ramsey.status.ok()) {
        ctx.diag << "The Ramsey static solver failed with status " << ramsey.status.value() << " ("
                 << codeToString(ramsey.status.code) << ").\n";
        if (!ramsey.errorMessage.empty()) ctx.diag << ramsey.errorMessage << "\n";
        candidate.ys = toComplex(ramsey.ys.size() == model.endoNbr ? ramsey.ys : ctx.guess);
        candidate.terminal = StatusCode{SteadyStateCode::RamseyInternalError, ramsey.status.magnitude};
        return candidate;
    }
    if (ramsey.params.size() == ctx.params.size()) {
        ctx.params = ramsey.params;
    }
    candidate.ys = toComplex(ramsey.ys);

    const Eigen::VectorXd resids = evaluator().staticResidual(ramsey.ys, ctx.exo, ctx.params);
    const Eigen::VectorXd multiplierBlock = resids.head(nMultipliers);
    const Eigen::VectorXd constraints = resids.tail(resids.size() - nMultipliers);

    const std::vector<int> nans = nanRows(constraints);
    if (!nans.empty()) {
        ctx.diag << "The steady state of the Ramsey problem resulted in NaN residuals.\n"
                 << "Instrument values at the steady state:\n";
        printInstrumentValues(ctx, ramsey.ys);
        ctx.diag << "NaN in equation(s): ";
        printRows(ctx.diag, nans);
        candidate.terminal = StatusCode{SteadyStateCode::RamseyNaN, std::nullopt};
        return candidate;
    }

    const std::vector<int> multiplierNans = nanRows(multiplierBlock);
    if (!multiplierNans.empty()) {
        ctx.diag << "The steady state of the Ramsey problem resulted in NaN residuals in the multiplier equations.\n"
                 << "Instrument values at the steady state:\n";
        printInstrumentValues(ctx, ramsey.ys);
        ctx.diag << "NaN in auxiliary equation(s): ";
        printRows(ctx.diag, multiplierNans);
        candidate.terminal = StatusCode{SteadyStateCode::RamseyAuxNaN, std::nullopt};
        return candidate;
    }

    if (maxAbs(resids) > options.dynatolF) {
        ctx.diag << "The steady state of the Ramsey problem could not be computed.\n"
                 << "The computation stopped with the following instrument values:\n";
        printInstrumentValues(ctx, ramsey.ys);
        ctx.diag << "Equations with nonzero residuals:\n";
        for (Eigen::Index i = 0; i < resids.size(); ++i) {
            if (std::abs(resids(i)) <= options.dynatolF / 100) continue;
            if (i < nMultipliers) {
                ctx.diag << "    Auxiliary Ramsey equation number " << i + 1 << ": " << resids(i) << "\n";
            } else {
                ctx.diag << "    Equation number " << i - nMultipliers + 1 << ": " << resids(i) << "\n";
            }
        }
        candidate.terminal = StatusCode{SteadyStateCode::RamseyNotSolving, resids.squaredNorm()};
        return candidate;
    }

    return candidate;
}

// ----------------------------------------------------------------------------
// Explicit steady-state function
// ----------------------------------------------------------------------------

SteadyStateComputer::Candidate SteadyStateComputer::solveExplicitFile(Context& ctx) {
    if (!collaborators_.steadyStateFunction) {
        throw std::invalid_argument("steadystateFlag is set but no steady-state function was supplied");
    }
    SteadyStateFileResult file =
        collaborators_.steadyStateFunction->evaluate(ctx.guess, ctx.exo, ctx.params, ctx.options);

    Candidate candidate;
    candidate.ys = checkedColumn(file.ys, ctx.model);
    checkParameterCount(file.params, ctx.params);
    ctx.params = file.params;

    if (!file.status.ok()) {
        ctx.diag << "The steady-state function reported status " << file.status.value() << " ("
                 << codeToString(file.status.code) << ").\n";
        candidate.terminal = file.status;
        return candidate;
    }

    // Complex or NaN results are left to the final sanity checks
    if (ctx.options.steadystateCheckFlag && !hasImaginaryPart(candidate.ys) && candidate.ys.real().allFinite()) {
        const Eigen::VectorXd resids = evaluator().staticResidual(candidate.ys.real(), ctx.exo, ctx.params);
        if (!(maxAbs(resids) <= ctx.options.dynatolF)) {
            candidate.solved = false;
            ctx.diag << "The steady-state function does not solve the static model.\n"
                     << "Equations with nonzero residuals:\n";
            for (Eigen::Index i = 0; i < resids.size(); ++i) {
                if (!(std::abs(resids(i)) <= ctx.options.dynatolF / 100)) {
                    ctx.diag << "    Equation number " << i + 1 << ": " << resids(i) << "\n";
                }
            }
        }
    }
    return candidate;
}

// ----------------------------------------------------------------------------
// Linear model
// ----------------------------------------------------------------------------

SteadyStateComputer::Candidate SteadyStateComputer::solveLinear(Context& ctx) {
    const ModelDescriptor& model = ctx.model;
    Candidate candidate;

    Eigen::VectorXd fvec;
    Eigen::MatrixXd jacobian;
    evaluator().staticResidualAndJacobian(ctx.guess, ctx.exo, ctx.params, fvec, jacobian);

    std::vector<int> nonFinite;
    for (Eigen::Index i = 0; i < fvec.size(); ++i) {
        if (!std::isfinite(fvec(i))) nonFinite.push_back(static_cast<int>(i));
    }

    if (!nonFinite.empty()) {
        candidate.ys = toComplex(ctx.guess);
        candidate.solved = false;
        ctx.diag << "Initial values or parameters are incompatible with equation(s): ";
        printRows(ctx.diag, nonFinite);
        ctx.diag << "Check whether the model is truly linear; print the residuals at the initial values "
                    "(--resid) to see the problematic equations.\n";
    } else if (maxAbs(fvec) > kLinearAlreadySolvedTolerance) {
        const Eigen::VectorXd ys = ctx.guess - jacobian.colPivHouseholderQr().solve(fvec);
        const Eigen::VectorXd resid = evaluator().staticResidual(ys, ctx.exo, ctx.params);
        candidate.ys = toComplex(ys);
        if (!(maxAbs(resid) <= kLinearStepTolerance)) {
            candidate.solved = false;
            ctx.diag << "No steady state could be found for the linear model.\n"
                     << "Check whether the model is truly linear; print the residuals at the initial values "
                        "(--resid) to see the problematic equations.\n";
        }
    } else {
        candidate.ys = toComplex(ctx.guess);
    }

    if (ctx.options.debug && !jacobian.allFinite()) {
        ctx.diag << "The Jacobian contains Inf or NaN. The problem arises from:\n";
        for (Eigen::Index j = 0; j < jacobian.cols(); ++j) {
            for (Eigen::Index i = 0; i < jacobian.rows(); ++i) {
                if (std::isfinite(jacobian(i, j))) continue;
                // Auxiliary columns are reported through their original variable
                const std::string name = model.reportedName(static_cast<int>(j));
                ctx.diag << "    Derivative of equation " << i + 1 << " with respect to variable " << name
                         << " (initial value of " << name << ": " << ctx.guess(j) << ")\n";
            }
        }
        ctx.diag << "Check whether the model is truly linear.\n";
    }
    return candidate;
}

// ----------------------------------------------------------------------------
// Nonlinear and block-structured models
// ----------------------------------------------------------------------------

SteadyStateComputer::Candidate SteadyStateComputer::solveNonlinear(Context& ctx) {
    const ModelDescriptor& model = ctx.model;
    const int n = model.origEndoNbr;

    std::unique_ptr<NonLinearSolver> ownedSolver;
    NonLinearSolver* solver = collaborators_.nonlinearSolver;
    if (!solver) {
        ownedSolver = makeSolver(ctx.options.solver.algorithm);
        solver = ownedSolver.get();
    }

    // Original equations over original variables; auxiliaries stay at their
    // expanded values until the block is closed
    std::vector<int> indices(static_cast<size_t>(n));
    std::iota(indices.begin(), indices.end(), 0);
    NonLinearSolver::Problem problem =
        makeSubsystemProblem(evaluator(), ctx.guess, ctx.exo, ctx.params, indices, indices);

    Eigen::VectorXd x = ctx.guess.head(n);
    std::string error;
    const SolverStatus status = solver->solve(problem, x, ctx.options.solver, nullptr, &error);

    Eigen::VectorXd ys = ctx.guess;
    ys.head(n) = x;

    Candidate candidate;
    if (status == SolverStatus::Success) {
        ys = closeAuxiliaryBlock(evaluator(), model, ys, ctx.exo, ctx.params);
    } else {
        candidate.solved = false;
        ctx.diag << "The " << algorithmToString(ctx.options.solver.algorithm) << " solver failed: "
                 << statusToString(status) << "\n";
        if (!error.empty()) ctx.diag << error << "\n";
    }
    candidate.ys = toComplex(ys);
    return candidate;
}

SteadyStateComputer::Candidate SteadyStateComputer::solveBlock(Context& ctx) {
    if (!collaborators_.blockSolver) {
        throw std::invalid_argument("block or bytecode is set but no block solver was supplied");
    }
    BlockSolveResult blockResult =
        collaborators_.blockSolver->solve(ctx.guess, ctx.exo, ctx.params, ctx.model, ctx.options.solver);

    Candidate candidate;
    candidate.ys = toComplex(blockResult.y.size() == ctx.guess.size() ? blockResult.y : ctx.guess);
    candidate.solved = blockResult.success;
    if (!blockResult.success) {
        ctx.diag << "The block solver failed: " << blockResult.errorMessage << "\n";
    }
    return candidate;
}

// ----------------------------------------------------------------------------
// Static/dynamic consistency
// ----------------------------------------------------------------------------

bool SteadyStateComputer::checkStaticDynamicConsistency(Context& ctx, const Eigen::VectorXd& ys) {
    const ModelDescriptor& model = ctx.model;
    const int periods = model.periods();

    // Steady state replicated over every period, keeping the entries the
    // lead/lag incidence selects
    Eigen::VectorXd z(model.dynamicVariableCount());
    for (int p = 0; p < periods; ++p) {
        for (int j = 0; j < model.endoNbr; ++j) {
            const int position = model.leadLagIncidence(p, j);
            if (position > 0) z(position - 1) = ys(j);
        }
    }
    const Eigen::MatrixXd zx = ctx.exo.transpose().replicate(periods, 1);

    const Eigen::VectorXd r = evaluator().dynamicResidual(z, zx, ctx.params, ys, model.maximumLag);

    if (ctx.options.block || ctx.options.bytecode) {
        DecisionRule& dr = ctx.outputs.decisionRule;
        dr.evaluated = true;
        dr.steadyState = ys;
        dr.exogenous = zx;
        dr.residuals = r;
    }

    const double worst = maxAbs(r);
    if (worst <= ctx.options.solveTolf) return true;

    ctx.diag << "The dynamic model does not hold at the static steady state (max |residual| = " << worst
             << ", solve_tolf = " << ctx.options.solveTolf << ").\n";
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        if (!(std::abs(r(i)) <= ctx.options.solveTolf)) {
            ctx.diag << "    Dynamic equation number " << i + 1 << ": " << r(i) << "\n";
        }
    }
    return false;
}

}  // namespace steadysolve
