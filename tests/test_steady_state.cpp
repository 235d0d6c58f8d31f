#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "steadysolve/steady_state.h"
#include <algorithm>
#include <cmath>
#include <complex>
#include <functional>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>

using namespace steadysolve;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Instrumented collaborators
// ============================================================================

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

using ResidualFn = std::function<Eigen::VectorXd(const Eigen::VectorXd& y)>;
using JacobianFn = std::function<Eigen::MatrixXd(const Eigen::VectorXd& y)>;

/**
 * Residual evaluator over plain functions of y. The Jacobian falls back to
 * forward differences; the dynamic model defaults to the static one at the
 * steady state.
 */
class FunctionEvaluator : public ResidualEvaluator {
public:
    explicit FunctionEvaluator(ResidualFn residual, JacobianFn jacobian = nullptr)
        : residual_(std::move(residual)), jacobian_(std::move(jacobian)) {}

    ResidualFn dynamic;

    mutable int staticCalls = 0;
    mutable int jacobianCalls = 0;
    mutable int dynamicCalls = 0;

    Eigen::VectorXd staticResidual(const Eigen::VectorXd& y, const Eigen::VectorXd&,
                                   const Eigen::VectorXd&) const override {
        ++staticCalls;
        return residual_(y);
    }

    void staticResidualAndJacobian(const Eigen::VectorXd& y, const Eigen::VectorXd&, const Eigen::VectorXd&,
                                   Eigen::VectorXd& residual, Eigen::MatrixXd& jacobian) const override {
        ++jacobianCalls;
        residual = residual_(y);
        if (jacobian_) {
            jacobian = jacobian_(y);
            return;
        }
        jacobian.resize(residual.size(), y.size());
        for (Eigen::Index j = 0; j < y.size(); ++j) {
            Eigen::VectorXd yh = y;
            const double h = 1e-7 * std::max(1.0, std::abs(y(j)));
            yh(j) += h;
            jacobian.col(j) = (residual_(yh) - residual) / h;
        }
    }

    Eigen::VectorXd dynamicResidual(const Eigen::VectorXd&, const Eigen::MatrixXd&, const Eigen::VectorXd&,
                                    const Eigen::VectorXd& steadyState, int) const override {
        ++dynamicCalls;
        return dynamic ? dynamic(steadyState) : residual_(steadyState);
    }

private:
    ResidualFn residual_;
    JacobianFn jacobian_;
};

// Sets every auxiliary variable to the original variable it lags
class CountingAuxSetter : public AuxiliaryVariableSetter {
public:
    explicit CountingAuxSetter(const ModelDescriptor& model) : model_(model) {}

    mutable int calls = 0;

    Eigen::VectorXd setAuxiliaryVariables(const Eigen::VectorXd& y, const Eigen::VectorXd&,
                                          const Eigen::VectorXd&) const override {
        ++calls;
        Eigen::VectorXd out = y;
        for (const auto& aux : model_.auxVars) out(aux.endoIndex) = y(aux.origIndex);
        return out;
    }

private:
    const ModelDescriptor& model_;
};

class MockSteadyStateFunction : public SteadyStateFunction {
public:
    SteadyStateFileResult result;
    int calls = 0;

    SteadyStateFileResult evaluate(const Eigen::VectorXd&, const Eigen::VectorXd&, const Eigen::VectorXd&,
                                   const SteadyStateOptions&) override {
        ++calls;
        return result;
    }
};

class MockRamseySolver : public RamseyStaticSolver {
public:
    RamseyResult result;
    int calls = 0;
    Eigen::VectorXd lastParams;

    RamseyResult solve(const Eigen::VectorXd&, const ModelDescriptor&, const Eigen::VectorXd& params,
                       const SteadyStateOptions&, const OutputState&) override {
        ++calls;
        lastParams = params;
        return result;
    }
};

class MockBlockSolver : public BlockSolver {
public:
    BlockSolveResult result;
    int calls = 0;

    BlockSolveResult solve(const Eigen::VectorXd&, const Eigen::VectorXd&, const Eigen::VectorXd&,
                           const ModelDescriptor&, const SolverOptions&) override {
        ++calls;
        return result;
    }
};

// Moves x to a fixed point and reports a fixed status
class MockNonlinearSolver : public NonLinearSolver {
public:
    Eigen::VectorXd answer;
    SolverStatus status = SolverStatus::Success;
    int calls = 0;
    int problemSize = -1;

    SolverStatus solve(Problem& problem, Eigen::VectorXd& x, const SolverOptions&, SolverTrace*,
                       std::string* detailedError) override {
        ++calls;
        problemSize = problem.size;
        x = answer;
        if (status != SolverStatus::Success && detailedError) *detailedError = "mock failure";
        return status;
    }
};

// Static model with `n` variables (the last `nAux` auxiliary lags of the
// first ones) and one exogenous variable, no leads or lags
ModelDescriptor makeDescriptor(int n, int nAux = 0) {
    ModelDescriptor d;
    d.name = "toy";
    d.endoNbr = n;
    d.origEndoNbr = n - nAux;
    d.origEqNbr = n - nAux;
    d.exoNbr = 1;
    d.exoNames = {"e"};
    d.paramNbr = 1;
    d.paramNames = {"a"};

    for (int i = 0; i < n; ++i) {
        d.endoNames.push_back(i < d.origEndoNbr ? "y" + std::to_string(i + 1)
                                                : "AUX_ENDO_LAG_y" + std::to_string(i - d.origEndoNbr + 1) + "_1");
    }
    for (int k = 0; k < nAux; ++k) {
        AuxVarSpec aux;
        aux.type = AuxVarType::EndoLag;
        aux.endoIndex = d.origEndoNbr + k;
        aux.origIndex = k;
        aux.origLeadLag = -1;
        d.auxVars.push_back(aux);
    }

    d.leadLagIncidence.resize(1, n);
    std::vector<int> all;
    for (int j = 0; j < n; ++j) {
        d.leadLagIncidence(0, j) = j + 1;
        all.push_back(j);
    }
    for (int i = 0; i < n; ++i) {
        d.staticIncidence.push_back(all);
        EquationInfo eq;
        eq.id = i;
        eq.auxiliary = i >= d.origEqNbr;
        d.equations.push_back(eq);
    }
    return d;
}

OutputState makeOutputs() {
    OutputState outputs;
    outputs.exoSteadyState = Eigen::VectorXd::Zero(1);
    outputs.exoDetSteadyState = Eigen::VectorXd(0);
    return outputs;
}

Eigen::VectorXd vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double value : values) v(i++) = value;
    return v;
}

Eigen::MatrixXcd column(const Eigen::VectorXcd& v) {
    return v;
}

// 2x + y = 4, x + 3y = 7, solution (1, 2)
Eigen::VectorXd linearResidual(const Eigen::VectorXd& y) {
    return vec({2.0 * y(0) + y(1) - 4.0, y(0) + 3.0 * y(1) - 7.0});
}

Eigen::MatrixXd linearJacobian(const Eigen::VectorXd&) {
    Eigen::MatrixXd J(2, 2);
    J << 2.0, 1.0,
         1.0, 3.0;
    return J;
}

}  // namespace

// ============================================================================
// Strategy selection
// ============================================================================

TEST_CASE("Strategy selection follows option precedence", "[steady_state][strategy]") {
    SteadyStateOptions options;
    CHECK(strategyName(selectStrategy(options)) == "nonlinear");

    options.linear = true;
    CHECK(std::holds_alternative<LinearDirect>(selectStrategy(options)));

    options.block = true;
    CHECK(std::holds_alternative<BlockStructured>(selectStrategy(options)));
    options.block = false;
    options.bytecode = true;
    CHECK(strategyName(selectStrategy(options)) == "block");

    // A steady-state function wins over the model type
    options.steadystateFlag = true;
    CHECK(std::holds_alternative<ExplicitFile>(selectStrategy(options)));

    // Ramsey policy wins over everything
    options.ramseyPolicy = true;
    CHECK(std::holds_alternative<RamseyWithFile>(selectStrategy(options)));
    CHECK(strategyName(selectStrategy(options)) == "ramsey_with_file");
    options.steadystateFlag = false;
    CHECK(std::holds_alternative<RamseyNoFile>(selectStrategy(options)));
    CHECK(strategyName(selectStrategy(options)) == "ramsey");
}

TEST_CASE("Status codes", "[steady_state][status]") {
    StatusCode status;
    CHECK(status.ok());
    CHECK(status.value() == 0);
    CHECK_FALSE(status.magnitude.has_value());

    status.code = SteadyStateCode::RamseyFileNotSolving;
    CHECK_FALSE(status.ok());
    CHECK(status.value() == 85);
    CHECK(codeToString(SteadyStateCode::StaticDynamicMismatch) == "StaticDynamicMismatch");
    CHECK(static_cast<int>(SteadyStateCode::RamseyInternalError) == 86);
}

// ============================================================================
// Linear models
// ============================================================================

TEST_CASE("Linear model already solved keeps the guess", "[steady_state][linear]") {
    ModelDescriptor model = makeDescriptor(2);
    FunctionEvaluator evaluator(linearResidual, linearJacobian);
    SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

    SteadyStateOptions options;
    options.linear = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});
    const Eigen::VectorXd guess = vec({1.0, 2.0});

    SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

    CHECK(result.status.ok());
    CHECK(result.strategy == "linear");
    CHECK(result.steadyState == guess);
    CHECK(evaluator.jacobianCalls == 1);
    CHECK(evaluator.staticCalls == 0);
}

TEST_CASE("Linear model solved by one Newton step", "[steady_state][linear]") {
    SteadyStateOptions options;
    options.linear = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("Truly linear") {
        ModelDescriptor model = makeDescriptor(2);
        FunctionEvaluator evaluator(linearResidual, linearJacobian);
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        REQUIRE(result.status.ok());
        CHECK_THAT(result.steadyState(0), WithinAbs(1.0, 1e-12));
        CHECK_THAT(result.steadyState(1), WithinAbs(2.0, 1e-12));
        CHECK(evaluator.jacobianCalls == 1);
        CHECK(result.diagnostics.empty());

        // Residuals at the returned point are within dynatol_f
        Eigen::VectorXd r = evaluator.staticResidual(result.steadyState, exogenousVector(outputs), params);
        CHECK(r.cwiseAbs().maxCoeff() <= options.dynatolF);
    }

    SECTION("Residual between the two thresholds still takes the step") {
        // y - 1 = 0 from 1 + 1e-9
        ModelDescriptor model = makeDescriptor(1);
        FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({y(0) - 1.0}); },
                                    [](const Eigen::VectorXd&) -> Eigen::MatrixXd { return Eigen::MatrixXd::Identity(1, 1); });
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        SteadyStateResult result = computer.compute(vec({1.0 + 1e-9}), model, params, options, outputs);

        REQUIRE(result.status.ok());
        CHECK(evaluator.jacobianCalls == 1);
        CHECK(evaluator.staticCalls == 1);
        CHECK_THAT(result.steadyState(0), WithinAbs(1.0, 1e-15));
    }

    SECTION("Residual below 1e-12 keeps the guess") {
        ModelDescriptor model = makeDescriptor(1);
        FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({y(0) - 1.0}); },
                                    [](const Eigen::VectorXd&) -> Eigen::MatrixXd { return Eigen::MatrixXd::Identity(1, 1); });
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        SteadyStateResult result = computer.compute(vec({1.0 + 1e-13}), model, params, options, outputs);

        REQUIRE(result.status.ok());
        CHECK(evaluator.staticCalls == 0);
        CHECK(result.steadyState(0) == 1.0 + 1e-13);
    }

    SECTION("Post-step residual below 1e-6 is accepted") {
        // The reported Jacobian is off by 1e-8, so one step leaves a residual of about 1e-8
        ModelDescriptor model = makeDescriptor(1);
        FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({y(0) - 1.0}); },
                                    [](const Eigen::VectorXd&) -> Eigen::MatrixXd {
                                        return Eigen::MatrixXd::Constant(1, 1, 1.0 / (1.0 + 1e-8));
                                    });
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        SteadyStateResult result = computer.compute(vec({0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 0);
        CHECK(evaluator.staticCalls == 1);
        const double residual = result.steadyState(0) - 1.0;
        CHECK(residual > 1e-12);
        CHECK(residual <= 1e-6);
        CHECK_THAT(residual, WithinAbs(1e-8, 1e-12));
    }

    SECTION("Declared linear but is not") {
        // y^2 = 4 from y = 1: one step lands on 2.5
        ModelDescriptor model = makeDescriptor(1);
        FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({y(0) * y(0) - 4.0}); },
                                    [](const Eigen::VectorXd& y) -> Eigen::MatrixXd { return Eigen::MatrixXd::Constant(1, 1, 2.0 * y(0)); });
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        SteadyStateResult result = computer.compute(vec({1.0}), model, params, options, outputs);

        CHECK(result.status.value() == 20);
        CHECK_THAT(result.steadyState(0), WithinAbs(2.5, 1e-14));
        REQUIRE(result.status.magnitude.has_value());
        CHECK_THAT(*result.status.magnitude, WithinRel(2.25 * 2.25, 1e-12));
        CHECK(result.diagnostics.find("No steady state could be found for the linear model") != std::string::npos);
    }
}

TEST_CASE("Linear model with non-finite residuals at the guess", "[steady_state][linear]") {
    SteadyStateOptions options;
    options.linear = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});
    ModelDescriptor model = makeDescriptor(2);

    SECTION("NaN residual escalates to code 22") {
        FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({std::log(y(0)), y(1) - 1.0}); },
                                    [](const Eigen::VectorXd& y) {
                                        Eigen::MatrixXd J = Eigen::MatrixXd::Identity(2, 2);
                                        J(0, 0) = 1.0 / y(0);
                                        return J;
                                    });
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        const Eigen::VectorXd guess = vec({-1.0, 0.0});
        SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

        CHECK(result.status.value() == 22);
        REQUIRE(result.status.magnitude.has_value());
        CHECK(std::isnan(*result.status.magnitude));
        CHECK(result.steadyState == guess);
        CHECK(result.diagnostics.find("incompatible with equation(s): 1") != std::string::npos);
    }

    SECTION("Infinite residual is non-convergence") {
        FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({1.0 / y(0), y(1) - 1.0}); },
                                    [](const Eigen::VectorXd& y) {
                                        Eigen::MatrixXd J = Eigen::MatrixXd::Identity(2, 2);
                                        J(0, 0) = -1.0 / (y(0) * y(0));
                                        return J;
                                    });
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});
        options.debug = true;

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 20);
        REQUIRE(result.status.magnitude.has_value());
        CHECK(std::isinf(*result.status.magnitude));
        // Debug mode names the non-finite derivative
        CHECK(result.diagnostics.find("Derivative of equation 1 with respect to variable y1") != std::string::npos);
    }
}

TEST_CASE("Non-finite Jacobian entries are reported through the original variable", "[steady_state][linear][aux]") {
    // y2 is an auxiliary lag of y1
    ModelDescriptor model = makeDescriptor(2, 1);
    FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({y(0) - 1.0, y(1) - y(0)}); },
                                [](const Eigen::VectorXd&) {
                                    Eigen::MatrixXd J(2, 2);
                                    J << 1.0, std::numeric_limits<double>::infinity(),
                                         -1.0, 1.0;
                                    return J;
                                });
    CountingAuxSetter setter(model);
    SteadyStateComputer computer(SteadyStateCollaborators{&evaluator, &setter});

    SteadyStateOptions options;
    options.linear = true;
    options.debug = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SteadyStateResult result = computer.compute(vec({1.0, NaN}), model, params, options, outputs);

    CHECK(setter.calls == 1);
    CHECK(result.status.ok());
    CHECK(result.diagnostics.find("Derivative of equation 1 with respect to variable y1 (initial value of y1: 1)") !=
          std::string::npos);
}

// ============================================================================
// Auxiliary variables
// ============================================================================

TEST_CASE("Auxiliary expansion", "[steady_state][aux]") {
    SteadyStateOptions options;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    auto quadratic = [](const Eigen::VectorXd& y) {
        Eigen::VectorXd r(y.size());
        r(0) = y(0) * y(0) - 4.0;
        for (Eigen::Index i = 1; i < y.size(); ++i) r(i) = y(i) - y(0);
        return r;
    };
    auto quadraticJacobian = [](const Eigen::VectorXd& y) {
        Eigen::MatrixXd J = Eigen::MatrixXd::Identity(y.size(), y.size());
        J(0, 0) = 2.0 * y(0);
        for (Eigen::Index i = 1; i < y.size(); ++i) J(i, 0) = -1.0;
        return J;
    };

    SECTION("Never invoked without auxiliary variables") {
        ModelDescriptor model = makeDescriptor(1);
        FunctionEvaluator evaluator(quadratic, quadraticJacobian);
        CountingAuxSetter setter(model);
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator, &setter});

        SteadyStateResult result = computer.compute(vec({1.0}), model, params, options, outputs);

        REQUIRE(result.status.ok());
        CHECK_THAT(result.steadyState(0), WithinRel(2.0, 1e-8));
        CHECK(setter.calls == 0);
    }

    SECTION("Invoked once, then the auxiliary block is closed") {
        ModelDescriptor model = makeDescriptor(2, 1);
        FunctionEvaluator evaluator(quadratic, quadraticJacobian);
        CountingAuxSetter setter(model);
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator, &setter});

        SteadyStateResult result = computer.compute(vec({1.0, NaN}), model, params, options, outputs);

        REQUIRE(result.status.ok());
        CHECK(setter.calls == 1);
        CHECK_THAT(result.steadyState(0), WithinRel(2.0, 1e-8));
        CHECK_THAT(result.steadyState(1), WithinRel(2.0, 1e-8));
    }

    SECTION("Skipped when a steady-state function is supplied") {
        ModelDescriptor model = makeDescriptor(2, 1);
        FunctionEvaluator evaluator(quadratic, quadraticJacobian);
        CountingAuxSetter setter(model);
        MockSteadyStateFunction file;
        file.result.ys = column(vec({2.0, 2.0}).cast<std::complex<double>>());
        file.result.params = params;
        SteadyStateCollaborators collaborators{&evaluator, &setter};
        collaborators.steadyStateFunction = &file;
        SteadyStateComputer computer(collaborators);

        options.steadystateFlag = true;
        SteadyStateResult result = computer.compute(vec({1.0, NaN}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(setter.calls == 0);
        CHECK(file.calls == 1);
    }

    SECTION("Missing setter") {
        ModelDescriptor model = makeDescriptor(2, 1);
        FunctionEvaluator evaluator(quadratic, quadraticJacobian);
        SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

        CHECK_THROWS_AS(computer.compute(vec({1.0, NaN}), model, params, options, outputs), std::invalid_argument);
    }
}

// ============================================================================
// Explicit steady-state function
// ============================================================================

TEST_CASE("Steady-state function results", "[steady_state][file]") {
    ModelDescriptor model = makeDescriptor(2);
    FunctionEvaluator evaluator(linearResidual, linearJacobian);
    MockSteadyStateFunction file;
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.steadyStateFunction = &file;
    SteadyStateComputer computer(collaborators);

    SteadyStateOptions options;
    options.steadystateFlag = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("Row vector is a contract violation raised before any residual evaluation") {
        Eigen::MatrixXcd row(1, 2);
        row << 1.0, 2.0;
        file.result.ys = row;
        file.result.params = params;

        CHECK_THROWS_AS(computer.compute(vec({0.0, 0.0}), model, params, options, outputs),
                        SteadyStateFileShapeError);
        CHECK(file.calls == 1);
        CHECK(evaluator.staticCalls == 0);
        CHECK(evaluator.jacobianCalls == 0);
        CHECK(evaluator.dynamicCalls == 0);
    }

    SECTION("Wrong length") {
        file.result.ys = column(vec({1.0, 2.0, 3.0}).cast<std::complex<double>>());
        file.result.params = params;
        CHECK_THROWS_AS(computer.compute(vec({0.0, 0.0}), model, params, options, outputs),
                        SteadyStateFileShapeError);
    }

    SECTION("Wrong number of parameters") {
        file.result.ys = column(vec({1.0, 2.0}).cast<std::complex<double>>());
        file.result.params = vec({1.0, 2.0});
        CHECK_THROWS_AS(computer.compute(vec({0.0, 0.0}), model, params, options, outputs),
                        SteadyStateFileShapeError);
    }

    SECTION("Parameters set by the function are written back") {
        file.result.ys = column(vec({1.0, 2.0}).cast<std::complex<double>>());
        file.result.params = vec({0.5});

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        REQUIRE(result.status.ok());
        CHECK(result.strategy == "steady_state_file");
        CHECK(params(0) == 0.5);
        CHECK(result.params(0) == 0.5);
        CHECK(result.steadyState == vec({1.0, 2.0}));

        Eigen::VectorXd r = evaluator.staticResidual(result.steadyState, exogenousVector(outputs), params);
        CHECK(r.cwiseAbs().maxCoeff() <= options.dynatolF);
    }

    SECTION("Failure status is propagated unchanged") {
        file.result.ys = column(vec({1.0, 2.0}).cast<std::complex<double>>());
        file.result.params = params;
        file.result.status = StatusCode{SteadyStateCode::NonConvergence, 3.0};

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 20);
        REQUIRE(result.status.magnitude.has_value());
        CHECK(*result.status.magnitude == 3.0);
        CHECK(evaluator.staticCalls == 0);
    }

    SECTION("Result that does not solve the static model is non-convergence") {
        // Residuals (1, 3) at (1, 3)
        file.result.ys = column(vec({1.0, 3.0}).cast<std::complex<double>>());
        file.result.params = params;

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 20);
        REQUIRE(result.status.magnitude.has_value());
        CHECK_THAT(*result.status.magnitude, WithinRel(10.0, 1e-14));
        CHECK(result.steadyState == vec({1.0, 3.0}));
        CHECK(result.diagnostics.find("does not solve the static model") != std::string::npos);
        CHECK(result.diagnostics.find("Equation number 2: 3") != std::string::npos);
    }

    SECTION("Result within dynatol_f is accepted") {
        file.result.ys = column(vec({1.0, 2.0 + 1e-7}).cast<std::complex<double>>());
        file.result.params = params;

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(evaluator.staticCalls == 1);
    }

    SECTION("Check against the static model can be turned off") {
        file.result.ys = column(vec({1.0, 3.0}).cast<std::complex<double>>());
        file.result.params = params;
        options.steadystateCheckFlag = false;

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(evaluator.staticCalls == 0);
    }

    SECTION("Missing function") {
        SteadyStateComputer bare(SteadyStateCollaborators{&evaluator});
        CHECK_THROWS_AS(bare.compute(vec({0.0, 0.0}), model, params, options, outputs), std::invalid_argument);
    }
}

// ============================================================================
// Final sanity checks
// ============================================================================

TEST_CASE("Complex steady state returns its real part", "[steady_state][complex]") {
    // y1^2 = -4 has no real root; the closed form sqrt(-4) is 2i
    ModelDescriptor model = makeDescriptor(2);
    FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({y(0) * y(0) + 4.0, y(1) - 1.0}); });
    MockSteadyStateFunction file;
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.steadyStateFunction = &file;
    SteadyStateComputer computer(collaborators);

    Eigen::VectorXcd ys(2);
    ys << std::sqrt(std::complex<double>(-4.0, 0.0)), std::complex<double>(1.0, 0.5);
    file.result.ys = column(ys);
    file.result.params = vec({1.0});

    SteadyStateOptions options;
    options.steadystateFlag = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("Sum of squared imaginary parts") {
        SteadyStateResult result = computer.compute(vec({1.0, 1.0}), model, params, options, outputs);

        CHECK(result.status.value() == 21);
        REQUIRE(result.status.magnitude.has_value());
        CHECK_THAT(*result.status.magnitude, WithinRel(ys.imag().squaredNorm(), 1e-14));
        CHECK_THAT(*result.status.magnitude, WithinRel(4.25, 1e-12));
        CHECK(result.steadyState == Eigen::VectorXd(ys.real()));
        CHECK(result.diagnostics.find("complex") != std::string::npos);
    }

    SECTION("Consistent dynamic form at the real part") {
        model.staticAndDynamicDiffer = true;
        evaluator.dynamic = [](const Eigen::VectorXd& y) -> Eigen::VectorXd { return Eigen::VectorXd::Zero(y.size()); };

        SteadyStateResult result = computer.compute(vec({1.0, 1.0}), model, params, options, outputs);

        CHECK(result.status.value() == 21);
        CHECK(evaluator.dynamicCalls == 1);
    }

    SECTION("Dynamic mismatch is reported before the complex check") {
        model.staticAndDynamicDiffer = true;
        evaluator.dynamic = [](const Eigen::VectorXd& y) -> Eigen::VectorXd {
            return y + Eigen::VectorXd::Constant(y.size(), 100.0);
        };

        SteadyStateResult result = computer.compute(vec({1.0, 1.0}), model, params, options, outputs);

        CHECK(result.status.value() == 25);
        CHECK_FALSE(result.status.magnitude.has_value());
        CHECK(evaluator.dynamicCalls == 1);
        CHECK(result.steadyState == Eigen::VectorXd(ys.real()));
    }
}

TEST_CASE("NaN in the steady state", "[steady_state][nan]") {
    ModelDescriptor model = makeDescriptor(2);
    FunctionEvaluator evaluator(linearResidual, linearJacobian);
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("From a steady-state function") {
        MockSteadyStateFunction file;
        file.result.ys = column(vec({1.0, NaN}).cast<std::complex<double>>());
        file.result.params = params;
        SteadyStateCollaborators collaborators{&evaluator};
        collaborators.steadyStateFunction = &file;
        SteadyStateComputer computer(collaborators);

        SteadyStateOptions options;
        options.steadystateFlag = true;
        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 22);
        REQUIRE(result.status.magnitude.has_value());
        CHECK(std::isnan(*result.status.magnitude));
        CHECK(result.diagnostics.find("NaN for: y2") != std::string::npos);
    }

    SECTION("From a block solver that claims success") {
        MockBlockSolver block;
        block.result.success = true;
        block.result.y = vec({NaN, 2.0});
        SteadyStateCollaborators collaborators{&evaluator};
        collaborators.blockSolver = &block;
        SteadyStateComputer computer(collaborators);

        SteadyStateOptions options;
        options.block = true;
        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(block.calls == 1);
        CHECK(result.status.value() == 22);
    }
}

// ============================================================================
// Nonlinear and block-structured models
// ============================================================================

TEST_CASE("Nonlinear model with an injected solver", "[steady_state][nonlinear]") {
    ModelDescriptor model = makeDescriptor(2);
    FunctionEvaluator evaluator(linearResidual, linearJacobian);
    MockNonlinearSolver solver;
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.nonlinearSolver = &solver;
    SteadyStateComputer computer(collaborators);

    SteadyStateOptions options;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("Success") {
        solver.answer = vec({1.0, 2.0});
        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(result.strategy == "nonlinear");
        CHECK(solver.calls == 1);
        CHECK(solver.problemSize == 2);
        CHECK(result.steadyState == vec({1.0, 2.0}));
    }

    SECTION("Failure is non-convergence with the residual sum of squares") {
        solver.answer = vec({1.0, 1.0});
        solver.status = SolverStatus::MaxIterations;
        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        // Residuals at (1, 1) are (-1, -3)
        CHECK(result.status.value() == 20);
        REQUIRE(result.status.magnitude.has_value());
        CHECK_THAT(*result.status.magnitude, WithinRel(10.0, 1e-14));
        CHECK(result.steadyState == vec({1.0, 1.0}));
        CHECK(result.diagnostics.find("mock failure") != std::string::npos);
    }
}

TEST_CASE("Nonlinear model with the default solver", "[steady_state][nonlinear]") {
    // Solow steady state: s*k^0.5 = delta*k with s = 0.2, delta = 0.1, so k = 4
    ModelDescriptor model = makeDescriptor(1);
    FunctionEvaluator evaluator([](const Eigen::VectorXd& y) { return vec({0.2 * std::sqrt(y(0)) - 0.1 * y(0)}); });
    SteadyStateComputer computer(SteadyStateCollaborators{&evaluator});

    SteadyStateOptions options;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    for (auto algorithm : {SolverAlgorithm::Newton, SolverAlgorithm::TrustRegion}) {
        options.solver.algorithm = algorithm;
        SteadyStateResult result = computer.compute(vec({3.0}), model, params, options, outputs);
        INFO("Algorithm: " << algorithmToString(algorithm));
        REQUIRE(result.status.ok());
        CHECK_THAT(result.steadyState(0), WithinRel(4.0, 1e-6));
    }
}

TEST_CASE("Block-structured model", "[steady_state][block]") {
    ModelDescriptor model = makeDescriptor(2);
    FunctionEvaluator evaluator(linearResidual, linearJacobian);
    MockBlockSolver block;
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.blockSolver = &block;
    SteadyStateComputer computer(collaborators);

    SteadyStateOptions options;
    options.bytecode = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("Failure") {
        block.result.success = false;
        block.result.y = vec({0.0, 0.0});
        block.result.errorMessage = "block 1 did not converge";

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 20);
        REQUIRE(result.status.magnitude.has_value());
        CHECK_THAT(*result.status.magnitude, WithinRel(65.0, 1e-14));
        CHECK(result.diagnostics.find("block 1 did not converge") != std::string::npos);
    }

    SECTION("Missing block solver") {
        SteadyStateComputer bare(SteadyStateCollaborators{&evaluator});
        CHECK_THROWS_AS(bare.compute(vec({0.0, 0.0}), model, params, options, outputs), std::invalid_argument);
    }
}

TEST_CASE("Computer requires an evaluator", "[steady_state][errors]") {
    CHECK_THROWS_AS(SteadyStateComputer(SteadyStateCollaborators{}), std::invalid_argument);
}

// ============================================================================
// Static/dynamic consistency
// ============================================================================

TEST_CASE("Static and dynamic forms are checked at the steady state", "[steady_state][dynamic]") {
    ModelDescriptor model = makeDescriptor(2);
    model.staticAndDynamicDiffer = true;
    FunctionEvaluator evaluator(linearResidual, linearJacobian);
    MockBlockSolver block;
    block.result.success = true;
    block.result.y = vec({1.0, 2.0});
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.blockSolver = &block;
    SteadyStateComputer computer(collaborators);

    SteadyStateOptions options;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});

    SECTION("Consistent forms pass and record the decision-rule point") {
        options.block = true;
        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(evaluator.dynamicCalls == 1);
        CHECK(outputs.decisionRule.evaluated);
        CHECK(outputs.decisionRule.steadyState == vec({1.0, 2.0}));
        CHECK(outputs.decisionRule.exogenous.rows() == model.periods());
        CHECK(outputs.decisionRule.residuals.cwiseAbs().maxCoeff() == 0.0);
    }

    SECTION("Dynamic residual above solve_tolf") {
        options.block = true;
        evaluator.dynamic = [](const Eigen::VectorXd& y) -> Eigen::VectorXd { return linearResidual(y) + vec({0.0, 0.1}); };

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.value() == 25);
        CHECK_FALSE(result.status.magnitude.has_value());
        CHECK(result.steadyState == vec({1.0, 2.0}));
        CHECK(result.diagnostics.find("Dynamic equation number 2") != std::string::npos);
        CHECK(outputs.decisionRule.evaluated);
    }

    SECTION("NaN dynamic residual is a mismatch") {
        options.block = true;
        evaluator.dynamic = [](const Eigen::VectorXd& y) -> Eigen::VectorXd { return linearResidual(y) + vec({NaN, 0.0}); };

        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);
        CHECK(result.status.value() == 25);
    }

    SECTION("Decision rule untouched outside block/bytecode mode") {
        MockSteadyStateFunction file;
        file.result.ys = column(vec({1.0, 2.0}).cast<std::complex<double>>());
        file.result.params = params;
        SteadyStateCollaborators withFile{&evaluator};
        withFile.steadyStateFunction = &file;
        SteadyStateComputer fileComputer(withFile);

        options.steadystateFlag = true;
        SteadyStateResult result = fileComputer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(evaluator.dynamicCalls == 1);
        CHECK_FALSE(outputs.decisionRule.evaluated);
    }

    SECTION("Skipped when the forms do not differ") {
        model.staticAndDynamicDiffer = false;
        options.block = true;
        SteadyStateResult result = computer.compute(vec({0.0, 0.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(evaluator.dynamicCalls == 0);
    }
}

// ============================================================================
// Ramsey policy
// ============================================================================

namespace {

// Variables (x, mu); the leading equation is the first-order condition
// log(mu) = 0, the other one the constraint log(x) = log(2)
ModelDescriptor makeRamseyDescriptor() {
    ModelDescriptor model = makeDescriptor(2);
    model.endoNames = {"x", "mu"};
    model.ramseyEqNbr = 1;
    model.multiplierIndices = {1};
    model.equations[0].multiplier = true;
    return model;
}

Eigen::VectorXd ramseyResidual(const Eigen::VectorXd& y) {
    return vec({std::log(y(1)), std::log(y(0)) - std::log(2.0)});
}

}  // namespace

TEST_CASE("Ramsey policy with a steady-state function", "[steady_state][ramsey]") {
    ModelDescriptor model = makeRamseyDescriptor();
    FunctionEvaluator evaluator(ramseyResidual);
    MockSteadyStateFunction file;
    MockRamseySolver ramsey;
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.steadyStateFunction = &file;
    collaborators.ramseySolver = &ramsey;
    SteadyStateComputer computer(collaborators);

    SteadyStateOptions options;
    options.ramseyPolicy = true;
    options.steadystateFlag = true;
    options.instruments = {"x"};
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});
    file.result.params = vec({1.5});

    SECTION("NaN in the constraints stops before the Ramsey solver") {
        file.result.ys = column(vec({-1.0, 1.0}).cast<std::complex<double>>());

        SteadyStateResult result = computer.compute(vec({-1.0, 1.0}), model, params, options, outputs);

        CHECK(result.status.value() == 84);
        CHECK(result.strategy == "ramsey_with_file");
        CHECK(ramsey.calls == 0);
        REQUIRE(result.status.magnitude.has_value());
        CHECK(std::isnan(*result.status.magnitude));
        CHECK(result.diagnostics.find("x = -1") != std::string::npos);
    }

    SECTION("Constraints not solved") {
        file.result.ys = column(vec({3.0, 1.0}).cast<std::complex<double>>());

        SteadyStateResult result = computer.compute(vec({3.0, 1.0}), model, params, options, outputs);

        CHECK(result.status.value() == 85);
        CHECK(ramsey.calls == 0);
        REQUIRE(result.status.magnitude.has_value());
        const double r = std::log(3.0) - std::log(2.0);
        CHECK_THAT(*result.status.magnitude, WithinRel(r * r, 1e-12));
        CHECK(result.diagnostics.find("Equation number 1") != std::string::npos);
    }

    SECTION("Multiplier block is left to the Ramsey solver") {
        // mu = 5 leaves the first-order condition unsolved; only the
        // constraints are checked against the function's output
        file.result.ys = column(vec({2.0, 5.0}).cast<std::complex<double>>());
        ramsey.result.ys = vec({2.0, 1.0});
        ramsey.result.params = vec({1.5});

        SteadyStateResult result = computer.compute(vec({2.0, 5.0}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(ramsey.calls == 1);
        // The solver sees the parameters set by the function
        CHECK(ramsey.lastParams(0) == 1.5);
        CHECK(params(0) == 1.5);
        CHECK(result.steadyState == vec({2.0, 1.0}));
    }

    SECTION("Row-shaped function result") {
        Eigen::MatrixXcd row(1, 2);
        row << 2.0, 1.0;
        file.result.ys = row;

        CHECK_THROWS_AS(computer.compute(vec({2.0, 1.0}), model, params, options, outputs),
                        SteadyStateFileShapeError);
        CHECK(evaluator.staticCalls == 0);
        CHECK(ramsey.calls == 0);
    }
}

TEST_CASE("Ramsey policy validation of the joint steady state", "[steady_state][ramsey]") {
    ModelDescriptor model = makeRamseyDescriptor();
    FunctionEvaluator evaluator(ramseyResidual);
    MockRamseySolver ramsey;
    SteadyStateCollaborators collaborators{&evaluator};
    collaborators.ramseySolver = &ramsey;
    SteadyStateComputer computer(collaborators);

    SteadyStateOptions options;
    options.ramseyPolicy = true;
    OutputState outputs = makeOutputs();
    Eigen::VectorXd params = vec({1.0});
    ramsey.result.params = params;
    const Eigen::VectorXd guess = vec({1.0, 1.0});

    SECTION("Success") {
        ramsey.result.ys = vec({2.0, 1.0});
        SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(result.strategy == "ramsey");
        CHECK(ramsey.calls == 1);
        Eigen::VectorXd r = evaluator.staticResidual(result.steadyState, exogenousVector(outputs), params);
        CHECK(r.cwiseAbs().maxCoeff() <= options.dynatolF);
    }

    SECTION("Solver failure is an internal error") {
        ramsey.result.ys = vec({2.0, 1.0});
        ramsey.result.status = StatusCode{SteadyStateCode::NonConvergence, 7.0};
        ramsey.result.errorMessage = "singular first-order conditions";

        SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

        CHECK(result.status.value() == 86);
        REQUIRE(result.status.magnitude.has_value());
        CHECK(*result.status.magnitude == 7.0);
        CHECK(result.diagnostics.find("singular first-order conditions") != std::string::npos);
    }

    SECTION("NaN in the original equations") {
        ramsey.result.ys = vec({-2.0, 1.0});
        SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

        CHECK(result.status.value() == 82);
        CHECK_FALSE(result.status.magnitude.has_value());
    }

    SECTION("NaN in the multiplier equations") {
        ramsey.result.ys = vec({2.0, -1.0});
        SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

        CHECK(result.status.value() == 83);
        CHECK_FALSE(result.status.magnitude.has_value());
        CHECK(result.diagnostics.find("NaN in auxiliary equation(s): 1") != std::string::npos);
    }

    SECTION("Residuals above dynatol_f") {
        ramsey.result.ys = vec({2.0, 1.5});
        SteadyStateResult result = computer.compute(guess, model, params, options, outputs);

        CHECK(result.status.value() == 81);
        REQUIRE(result.status.magnitude.has_value());
        CHECK_THAT(*result.status.magnitude, WithinRel(std::log(1.5) * std::log(1.5), 1e-12));
        CHECK(result.diagnostics.find("Auxiliary Ramsey equation number 1") != std::string::npos);
    }

    SECTION("Debug mode lists non-finite initial values") {
        ramsey.result.ys = vec({2.0, 1.0});
        options.debug = true;
        SteadyStateResult result =
            computer.compute(vec({std::numeric_limits<double>::infinity(), NaN}), model, params, options, outputs);

        CHECK(result.status.ok());
        CHECK(result.diagnostics.find("are Inf:\n    x") != std::string::npos);
        CHECK(result.diagnostics.find("are NaN:\n    mu") != std::string::npos);
    }

    SECTION("Missing Ramsey solver") {
        SteadyStateComputer bare(SteadyStateCollaborators{&evaluator});
        CHECK_THROWS_AS(bare.compute(guess, model, params, options, outputs), std::invalid_argument);
    }
}
