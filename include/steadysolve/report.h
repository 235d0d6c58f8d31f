#pragma once

#include "model.h"
#include "steady_state.h"
#include "structural_analysis.h"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace steadysolve {

// ============================================================================
// Reports
// ============================================================================
// `variables` selects the endogenous variables to list (see
// stationaryVariableList); every report lists all parameters.

/**
 * @brief JSON report of a steady-state computation.
 *
 * Keys: model, strategy, status {code, name, magnitude}, steadyState
 * [{name, value}], params {name: value}, diagnostics and, when `analysis` is
 * given, the block structure of the original equations.
 */
std::string generateJSONReport(const BuiltModel& model,
                               const SteadyStateResult& result,
                               const std::vector<int>& variables,
                               const StructuralAnalysisResult* analysis = nullptr);

// Plain-text report in the layout of the `steady` command
std::string generateTextReport(const BuiltModel& model,
                               const SteadyStateResult& result,
                               const std::vector<int>& variables);

// Static residuals, one line per equation, with the equation text
std::string generateResidualsReport(const BuiltModel& model, const Eigen::VectorXd& residuals);

}  // namespace steadysolve
