#include "steadysolve/runner.h"
#include "steadysolve/ramsey.h"
#include "steadysolve/steady_state_file.h"
#include <chrono>
#include <cmath>
#include <iostream>

namespace steadysolve {

SteadyStateOptions mergeModelOptions(const BuiltModel& model, const SteadyStateOptions& options) {
    SteadyStateOptions merged = options;
    merged.steadystateFlag = options.steadystateFlag || model.hasSteadyStateModel;
    merged.ramseyPolicy = options.ramseyPolicy || model.ramseyPolicy;
    merged.linear = options.linear || model.descriptor.linear;
    merged.block = options.block || model.block;
    merged.bytecode = options.bytecode || model.bytecode;
    merged.debug = options.debug || model.debug;
    if (merged.instruments.empty()) {
        merged.instruments = model.instruments;
    }
    return merged;
}

SteadySolveRunner::SteadySolveRunner(const std::string& inputFile)
    : inputFile_(inputFile) {}

SteadySolveRunner::~SteadySolveRunner() = default;

bool SteadySolveRunner::run(const SteadyStateOptions& options) {
    auto pipeline_start = std::chrono::high_resolution_clock::now();

    // 1. Parse
    auto t1 = std::chrono::high_resolution_clock::now();
    ModParser parser;
    parseResult_ = parser.parseFile(inputFile_);
    auto t2 = std::chrono::high_resolution_clock::now();
    timing_.parse_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    if (!parseResult_.success) {
        errorMessage_ = parseResult_.errors.empty() ? "Parse failed" : parseResult_.errors.front().message;
        return false;
    }

    // 2. Build the model
    try {
        t1 = std::chrono::high_resolution_clock::now();
        model_ = std::make_unique<BuiltModel>(ModelBuilder::build(parseResult_.model));
        t2 = std::chrono::high_resolution_clock::now();
        timing_.build_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
    } catch (const std::exception& e) {
        errorMessage_ = e.what();
        return false;
    }

    const ModelDescriptor& d = model_->descriptor;
    options_ = mergeModelOptions(*model_, options);
    evaluator_ = std::make_unique<ModelEvaluator>(*model_);

    for (Eigen::Index i = 0; i < model_->params.size(); ++i) {
        if (std::isnan(model_->params(i)) && options_.solver.verbose) {
            std::cerr << "Warning: parameter '" << d.paramNames[static_cast<size_t>(i)]
                      << "' has no value" << std::endl;
        }
    }

    // 3. Block structure of the original equations (reports)
    t1 = std::chrono::high_resolution_clock::now();
    std::vector<std::vector<int>> incidence(d.staticIncidence.begin(), d.staticIncidence.begin() + d.origEqNbr);
    analysisResult_ = StructuralAnalyzer::analyze(incidence, d.origEndoNbr);
    t2 = std::chrono::high_resolution_clock::now();
    timing_.analysis_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    // 4. Steady state
    try {
        SteadyStateModelFunction steadyStateFunction(*model_);
        NewtonRamseySolver ramseySolver(*evaluator_, model_->hasSteadyStateModel ? &steadyStateFunction : nullptr);
        DecompositionBlockSolver blockSolver(*evaluator_);

        SteadyStateCollaborators collaborators;
        collaborators.evaluator = evaluator_.get();
        collaborators.auxSetter = evaluator_.get();
        collaborators.steadyStateFunction = model_->hasSteadyStateModel ? &steadyStateFunction : nullptr;
        collaborators.ramseySolver = &ramseySolver;
        collaborators.blockSolver = &blockSolver;

        outputs_ = OutputState();
        outputs_.exoSteadyState = model_->exoSteadyState;
        outputs_.exoDetSteadyState = model_->exoDetSteadyState;
        Eigen::VectorXd params = model_->params;

        t1 = std::chrono::high_resolution_clock::now();
        SteadyStateComputer computer(collaborators);
        result_ = computer.compute(model_->initialGuess, d, params, options_, outputs_);
        t2 = std::chrono::high_resolution_clock::now();
        timing_.solve_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
        solved_ = true;
    } catch (const std::exception& e) {
        errorMessage_ = e.what();
        return false;
    }

    auto pipeline_end = std::chrono::high_resolution_clock::now();
    timing_.total_time_ms = std::chrono::duration<double, std::milli>(pipeline_end - pipeline_start).count();

    return result_.status.ok();
}

Eigen::VectorXd SteadySolveRunner::initialResiduals() const {
    Eigen::VectorXd exo = evaluator_->defaultExogenous();
    Eigen::VectorXd y = model_->initialGuess;
    if (model_->descriptor.auxVarCount() > 0) {
        y = evaluator_->setAuxiliaryVariables(y, exo, model_->params);
    }
    return evaluator_->staticResidual(y, exo, model_->params);
}

}  // namespace steadysolve
