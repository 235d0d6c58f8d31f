#include "steadysolve/solver.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace steadysolve {

// ============================================================================
// Utility Functions
// ============================================================================

std::string statusToString(SolverStatus status) {
    switch (status) {
        case SolverStatus::Success: return "Success";
        case SolverStatus::MaxIterations: return "MaxIterations";
        case SolverStatus::LineSearchFailed: return "LineSearchFailed";
        case SolverStatus::Stalled: return "Stalled";
        case SolverStatus::SingularJacobian: return "SingularJacobian";
        case SolverStatus::InvalidInput: return "InvalidInput";
        case SolverStatus::EvaluationError: return "EvaluationError";
        default: return "Unknown";
    }
}

std::string algorithmToString(SolverAlgorithm algorithm) {
    switch (algorithm) {
        case SolverAlgorithm::Newton: return "newton";
        case SolverAlgorithm::TrustRegion: return "trust_region";
        default: return "unknown";
    }
}

bool parseAlgorithm(const std::string& text, SolverAlgorithm& algorithm) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "newton") {
        algorithm = SolverAlgorithm::Newton;
        return true;
    }
    if (s == "trust_region" || s == "trust-region" || s == "trustregion" || s == "dogleg") {
        algorithm = SolverAlgorithm::TrustRegion;
        return true;
    }
    return false;
}

std::string SolverTrace::toString() const {
    std::ostringstream ss;
    ss << std::scientific << std::setprecision(6);
    ss << "Solver Trace (" << iterations.size() << " iterations, "
       << statusToString(finalStatus) << ")\n";
    ss << "Total time: " << totalTime.count() << " s\n";
    ss << std::setw(6) << "Iter"
       << std::setw(15) << "||F||"
       << std::setw(15) << "||dx||"
       << std::setw(15) << "lambda" << "\n";
    ss << std::string(51, '-') << "\n";

    for (const auto& it : iterations) {
        ss << std::setw(6) << it.iter
           << std::setw(15) << it.residualNorm
           << std::setw(15) << it.stepNorm
           << std::setw(15) << it.lambda << "\n";
    }
    return ss.str();
}

Eigen::VectorXd computeScalingFactors(const Eigen::VectorXd& x) {
    Eigen::VectorXd scale = Eigen::VectorXd::Ones(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        const double xi = std::abs(x(i));
        if (std::isfinite(xi) && xi >= 1.0) {
            scale(i) = std::min(std::pow(10.0, std::floor(std::log10(xi))), 1e6);
        }
    }
    return scale;
}

std::unique_ptr<NonLinearSolver> makeSolver(SolverAlgorithm algorithm) {
    switch (algorithm) {
        case SolverAlgorithm::TrustRegion: return std::make_unique<TrustRegionSolver>();
        case SolverAlgorithm::Newton:
        default: return std::make_unique<NewtonSolver>();
    }
}

namespace {

// Evaluates the problem, turning exceptions into a false return
bool tryEvaluate(NonLinearSolver::Problem& problem, const Eigen::VectorXd& x,
                 Eigen::VectorXd& F, Eigen::MatrixXd& J, bool computeJacobian,
                 std::string* error = nullptr) {
    try {
        problem.evaluate(x, F, J, computeJacobian);
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
    return true;
}

class TraceRecorder {
public:
    TraceRecorder(SolverTrace* trace, std::string* detailedError)
        : trace_(trace), detailedError_(detailedError), start_(std::chrono::steady_clock::now()) {}

    void record(int iter, double residualNorm, const Eigen::VectorXd& x, const Eigen::VectorXd& F) {
        if (!trace_) return;
        SolverTrace::Iteration it;
        it.iter = iter;
        it.residualNorm = residualNorm;
        it.x = x;
        it.residuals = F;
        trace_->iterations.push_back(it);
    }

    void step(double stepNorm, double lambda) {
        if (!trace_ || trace_->iterations.empty()) return;
        trace_->iterations.back().stepNorm = stepNorm;
        trace_->iterations.back().lambda = lambda;
    }

    SolverStatus finish(SolverStatus status, const std::string& message = std::string()) {
        if (trace_) {
            trace_->finalStatus = status;
            trace_->totalTime = std::chrono::steady_clock::now() - start_;
        }
        if (detailedError_ && !message.empty()) *detailedError_ = message;
        return status;
    }

private:
    SolverTrace* trace_;
    std::string* detailedError_;
    std::chrono::steady_clock::time_point start_;
};

std::string describeFailure(const std::string& what, int iter, double residualNorm) {
    std::ostringstream ss;
    ss << what << " at iteration " << iter << " (||F||_inf = " << std::scientific
       << std::setprecision(3) << residualNorm << ")";
    return ss.str();
}

}  // namespace

// ============================================================================
// Newton Solver Implementation
// ============================================================================

double NewtonSolver::lineSearch(Problem& problem,
                                const Eigen::VectorXd& x,
                                const Eigen::VectorXd& dx,
                                const Eigen::VectorXd& F,
                                const SolverOptions& options) const {
    // phi(lambda) = ||F(x + lambda dx)||^2 / 2, with phi'(0) = -||F||^2 along
    // the Newton direction
    const double phi0 = 0.5 * F.squaredNorm();
    const double slope = -2.0 * phi0;

    Eigen::VectorXd trialF(F.size());
    Eigen::MatrixXd unusedJ;
    double lambda = 1.0;

    for (int lsIter = 0; lsIter < options.lsMaxIterations && lambda >= options.lsMinStep; ++lsIter) {
        if (!tryEvaluate(problem, x + lambda * dx, trialF, unusedJ, false) || !trialF.allFinite()) {
            lambda *= options.lsRho;
            continue;
        }

        const double phi = 0.5 * trialF.squaredNorm();
        if (phi <= phi0 + options.lsAlpha * lambda * slope) {
            return lambda;
        }

        // Minimizer of the quadratic through phi(0), phi'(0) and phi(lambda),
        // kept within [0.1, 0.5] lambda
        const double denom = 2.0 * (phi - phi0 - slope * lambda);
        const double candidate = denom > 0.0 ? -slope * lambda * lambda / denom : options.lsRho * lambda;
        lambda = std::clamp(candidate, 0.1 * lambda, 0.5 * lambda);
    }
    return 0.0;
}

SolverStatus NewtonSolver::solve(Problem& problem,
                                 Eigen::VectorXd& x,
                                 const SolverOptions& options,
                                 SolverTrace* trace,
                                 std::string* detailedError) {
    TraceRecorder recorder(trace, detailedError);

    const int n = problem.size;
    if (n <= 0 || x.size() != n || !problem.evaluate) {
        return recorder.finish(SolverStatus::InvalidInput,
                               "Problem of size " + std::to_string(n) + " with a guess of size " +
                               std::to_string(x.size()));
    }

    const Eigen::VectorXd scale = options.enableScaling ? computeScalingFactors(x)
                                                        : Eigen::VectorXd::Ones(n);
    if (options.verbose && options.enableScaling) {
        std::cout << "Newton: scaling factors min=" << scale.minCoeff()
                  << ", max=" << scale.maxCoeff() << std::endl;
    }

    Eigen::VectorXd F(n);
    Eigen::MatrixXd J(n, n);
    double residualNorm = std::numeric_limits<double>::infinity();

    for (int iter = 0; iter <= options.maxIterations; ++iter) {
        std::string error;
        if (!tryEvaluate(problem, x, F, J, true, &error)) {
            if (options.verbose) {
                std::cerr << "Newton: evaluation failed at iter " << iter << ": " << error << std::endl;
            }
            return recorder.finish(SolverStatus::EvaluationError,
                                   "Evaluation failed at iteration " + std::to_string(iter) + ": " + error);
        }
        if (!F.allFinite()) {
            return recorder.finish(SolverStatus::EvaluationError,
                                   "Residuals are not finite at iteration " + std::to_string(iter));
        }

        residualNorm = F.lpNorm<Eigen::Infinity>();
        if (options.verbose) {
            std::cout << "Newton iter " << iter << ": ||F||_inf = " << residualNorm << std::endl;
        }
        recorder.record(iter, residualNorm, x, F);

        if (residualNorm < options.tolerance) {
            return recorder.finish(SolverStatus::Success);
        }
        if (iter == options.maxIterations) break;

        // Newton step in scaled coordinates: (J D) dy = -F, dx = D dy
        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(J * scale.asDiagonal());
        if (qr.rank() < n && options.verbose) {
            std::cerr << "Newton: Jacobian is rank-deficient (rank=" << qr.rank()
                      << ", n=" << n << ")" << std::endl;
        }
        const Eigen::VectorXd dx = scale.cwiseProduct(qr.solve(-F));
        if (!dx.allFinite()) {
            return recorder.finish(SolverStatus::SingularJacobian,
                                   describeFailure("Newton step is not finite", iter, residualNorm));
        }

        const double lambda = lineSearch(problem, x, dx, F, options);
        if (lambda == 0.0) {
            if (options.verbose) {
                std::cerr << "Newton: line search failed at iter " << iter << std::endl;
            }
            return recorder.finish(SolverStatus::LineSearchFailed,
                                   describeFailure("Line search failed", iter, residualNorm));
        }

        const Eigen::VectorXd step = lambda * dx;
        x += step;
        const double stepNorm = step.cwiseQuotient(scale).lpNorm<Eigen::Infinity>();
        recorder.step(stepNorm, lambda);

        if (stepNorm < options.stepTolerance) {
            if (tryEvaluate(problem, x, F, J, false) && F.allFinite() &&
                F.lpNorm<Eigen::Infinity>() < options.tolerance) {
                return recorder.finish(SolverStatus::Success);
            }
            return recorder.finish(SolverStatus::Stalled,
                                   describeFailure("Newton steps stalled", iter, residualNorm));
        }
    }

    return recorder.finish(SolverStatus::MaxIterations,
                           "Max iterations (" + std::to_string(options.maxIterations) +
                           ") reached without convergence. Last residual norm ||F|| = " +
                           std::to_string(residualNorm));
}

// ============================================================================
// Trust-Region Solver Implementation
// ============================================================================

SolverStatus TrustRegionSolver::solve(Problem& problem,
                                      Eigen::VectorXd& x,
                                      const SolverOptions& options,
                                      SolverTrace* trace,
                                      std::string* detailedError) {
    TraceRecorder recorder(trace, detailedError);

    const int n = problem.size;
    if (n <= 0 || x.size() != n || !problem.evaluate) {
        return recorder.finish(SolverStatus::InvalidInput,
                               "Problem of size " + std::to_string(n) + " with a guess of size " +
                               std::to_string(x.size()));
    }

    Eigen::VectorXd F(n);
    Eigen::MatrixXd J(n, n);
    std::string error;
    if (!tryEvaluate(problem, x, F, J, true, &error) || !F.allFinite()) {
        return recorder.finish(SolverStatus::EvaluationError,
                               error.empty() ? "Residuals are not finite at the initial guess"
                                             : "Evaluation failed at the initial guess: " + error);
    }

    double radius = options.trInitialRadius * std::max(1.0, x.norm());
    Eigen::VectorXd trialF(n);
    Eigen::MatrixXd unusedJ;

    for (int iter = 0; iter <= options.maxIterations; ++iter) {
        const double residualNorm = F.lpNorm<Eigen::Infinity>();
        if (options.verbose) {
            std::cout << "TrustRegion iter " << iter << ": ||F||_inf = " << residualNorm
                      << ", radius = " << radius << std::endl;
        }
        recorder.record(iter, residualNorm, x, F);

        if (residualNorm < options.tolerance) {
            return recorder.finish(SolverStatus::Success);
        }
        if (iter == options.maxIterations) break;

        // Steepest descent direction of ||F||^2 / 2 and the Cauchy point
        const Eigen::VectorXd g = J.transpose() * F;
        const double gNorm = g.norm();
        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(J);
        const Eigen::VectorXd newtonStep = qr.solve(-F);
        const bool newtonValid = qr.rank() == n && newtonStep.allFinite();

        if (gNorm == 0.0 && !newtonValid) {
            return recorder.finish(SolverStatus::Stalled,
                                   describeFailure("Gradient of ||F||^2 vanished", iter, residualNorm));
        }

        Eigen::VectorXd step;
        const Eigen::VectorXd cauchy = gNorm > 0.0
            ? Eigen::VectorXd(-(g.squaredNorm() / (J * g).squaredNorm()) * g)
            : Eigen::VectorXd::Zero(n);

        if (newtonValid && newtonStep.norm() <= radius) {
            step = newtonStep;
        } else if (cauchy.norm() >= radius) {
            step = (radius / cauchy.norm()) * cauchy;
        } else if (!newtonValid) {
            step = cauchy;
        } else {
            // Point where the dogleg path leaves the trust region
            const Eigen::VectorXd d = newtonStep - cauchy;
            const double a = d.squaredNorm();
            const double b = 2.0 * cauchy.dot(d);
            const double c = cauchy.squaredNorm() - radius * radius;
            const double tau = (-b + std::sqrt(b * b - 4.0 * a * c)) / (2.0 * a);
            step = cauchy + tau * d;
        }

        const double stepNorm = step.norm();
        const double predicted = F.squaredNorm() - (F + J * step).squaredNorm();
        double ratio = -1.0;
        if (tryEvaluate(problem, x + step, trialF, unusedJ, false) && trialF.allFinite() && predicted > 0.0) {
            ratio = (F.squaredNorm() - trialF.squaredNorm()) / predicted;
        }

        if (ratio < 0.25) {
            radius = 0.25 * stepNorm;
        } else if (ratio > 0.75 && stepNorm >= 0.99 * radius) {
            radius = 2.0 * stepNorm;
        }

        if (ratio > 1e-4) {
            x += step;
            if (!tryEvaluate(problem, x, F, J, true, &error) || !F.allFinite()) {
                return recorder.finish(SolverStatus::EvaluationError,
                                       "Evaluation failed at iteration " + std::to_string(iter) + ": " + error);
            }
        }
        recorder.step(stepNorm, radius);

        if (radius < options.stepTolerance * std::max(1.0, x.norm())) {
            return recorder.finish(SolverStatus::Stalled,
                                   describeFailure("Trust region collapsed", iter, residualNorm));
        }
    }

    return recorder.finish(SolverStatus::MaxIterations,
                           "Max iterations (" + std::to_string(options.maxIterations) +
                           ") reached without convergence. Last residual norm ||F|| = " +
                           std::to_string(F.lpNorm<Eigen::Infinity>()));
}

}  // namespace steadysolve
