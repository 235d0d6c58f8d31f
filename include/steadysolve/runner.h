#pragma once

#include "block_solver.h"
#include "evaluator.h"
#include "model.h"
#include "parser.h"
#include "steady_state.h"
#include "structural_analysis.h"
#include <memory>
#include <string>

namespace steadysolve {

/**
 * @brief Parse -> build -> compute pipeline for one model file.
 */
class SteadySolveRunner {
public:
    SteadySolveRunner(const std::string& inputFile);
    ~SteadySolveRunner();

    /**
     * @brief Run the full pipeline.
     *
     * Flags set by the model file (options(...), model(linear),
     * steady_state_model, ramsey_policy) are added to `options`.
     * @return true when the steady state was found (status code 0)
     */
    bool run(const SteadyStateOptions& options = SteadyStateOptions());

    // Static residuals at the initial values, auxiliaries expanded. Requires
    // a successful build.
    Eigen::VectorXd initialResiduals() const;

    struct PipelineTiming {
        double parse_time_ms = 0.0;
        double build_time_ms = 0.0;
        double analysis_time_ms = 0.0;
        double solve_time_ms = 0.0;
        double total_time_ms = 0.0;
    };

    // Accessors
    const ParseResult& getParseResult() const { return parseResult_; }
    const BuiltModel& getModel() const { return *model_; }
    const SteadyStateOptions& getOptions() const { return options_; }
    const SteadyStateResult& getResult() const { return result_; }
    const StructuralAnalysisResult& getAnalysisResult() const { return analysisResult_; }
    const OutputState& getOutputs() const { return outputs_; }
    const PipelineTiming& getTiming() const { return timing_; }
    const std::string& getErrorMessage() const { return errorMessage_; }

    bool isParseSuccess() const { return parseResult_.success; }
    bool isBuildSuccess() const { return model_ != nullptr; }
    bool isSolveSuccess() const { return solved_ && result_.status.ok(); }

private:
    std::string inputFile_;
    ParseResult parseResult_;
    std::unique_ptr<BuiltModel> model_;
    std::unique_ptr<ModelEvaluator> evaluator_;
    SteadyStateOptions options_;
    StructuralAnalysisResult analysisResult_;
    SteadyStateResult result_;
    OutputState outputs_;
    PipelineTiming timing_;
    std::string errorMessage_;
    bool solved_ = false;
};

// Options implied by a built model, merged into `options`
SteadyStateOptions mergeModelOptions(const BuiltModel& model, const SteadyStateOptions& options);

}  // namespace steadysolve
