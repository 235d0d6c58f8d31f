#pragma once

#include "steady_state.h"
#include <string>

namespace steadysolve {

/**
 * @brief Load options from a `key = value` configuration file
 * (steadysolve.conf).
 *
 * Lines starting with `#` and text after a `#` are comments. Recognized keys:
 * the SolverOptions fields (`maxIterations`, `tolerance`, `stepTolerance`,
 * `verbose`, `lsAlpha`, `lsRho`, `lsMaxIterations`, `lsMinStep`,
 * `trInitialRadius`, `enableScaling`), `solveAlgo`, and the steady-state
 * settings `dynatolF`, `solveTolf`, `debug`, `linear`, `block`, `bytecode`.
 * Unknown keys and malformed values are reported on stderr and skipped.
 *
 * @return false if the file cannot be opened; `options` is then unchanged
 */
bool loadSteadyStateOptionsFromFile(const std::string& path, SteadyStateOptions& options);

}  // namespace steadysolve
