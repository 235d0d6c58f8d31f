#pragma once

#include "ast.h"
#include <Eigen/Dense>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace steadysolve {

// ============================================================================
// Model errors
// ============================================================================

/**
 * @brief Semantic error in a model file (unknown symbol, duplicate
 * declaration, non-square system, ...). Carries the source line when known.
 */
class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& message, int line = 0);
    int line() const { return line_; }

private:
    int line_;
};

// ============================================================================
// Auxiliary variables
// ============================================================================

enum class AuxVarType {
    EndoLead,   // stands for x(+k), k >= 1, so that leads are at most one period
    EndoLag,    // stands for x(-k), k >= 1, so that lags are at most one period
    ExoLag      // stands for e(-k), k >= 0, so that exogenous variables appear only at t
};

std::string auxVarTypeToString(AuxVarType type);

struct AuxVarSpec {
    AuxVarType type = AuxVarType::EndoLag;
    int endoIndex = -1;    // Position in the endogenous vector
    int origIndex = -1;    // Original endogenous (or exogenous for ExoLag) variable
    int origLeadLag = 0;   // The auxiliary variable equals orig(origLeadLag) at steady state
};

// ============================================================================
// Model descriptor
// ============================================================================

struct EquationInfo {
    int id = 0;                 // 0-based position in the equation list
    std::string name;           // From [name='...'], may be empty
    std::string text;           // Printable form of the static equation
    int sourceLine = 0;
    bool auxiliary = false;     // Defining equation of an auxiliary variable
    bool multiplier = false;    // Part of the leading Lagrange-multiplier block
};

/**
 * @brief Static structural description of a model.
 *
 * Endogenous variables are ordered originals first, then auxiliaries. The
 * equation list is ordered multiplier equations, other original equations,
 * auxiliary equations.
 *
 * `leadLagIncidence(p, j)` is the 1-based position of variable j at period
 * p - maximumLag in the stacked dynamic vector, 0 when the variable does not
 * appear at that period. Positions run period by period.
 */
struct ModelDescriptor {
    std::string name;

    std::vector<std::string> endoNames;
    std::vector<std::string> exoNames;
    std::vector<std::string> exoDetNames;
    std::vector<std::string> paramNames;

    int origEndoNbr = 0;
    int endoNbr = 0;
    int exoNbr = 0;
    int exoDetNbr = 0;
    int paramNbr = 0;

    int origEqNbr = 0;          // Equations before auxiliary definitions
    int ramseyEqNbr = 0;        // Size of the leading multiplier block
    std::vector<int> multiplierIndices;

    std::vector<AuxVarSpec> auxVars;

    int maximumLag = 0;
    int maximumLead = 0;
    Eigen::MatrixXi leadLagIncidence;

    // staticIncidence[eq] = endogenous indices appearing in the static equation
    std::vector<std::vector<int>> staticIncidence;

    std::vector<EquationInfo> equations;

    bool linear = false;
    bool staticAndDynamicDiffer = false;

    int auxVarCount() const { return static_cast<int>(auxVars.size()); }
    int equationCount() const { return static_cast<int>(equations.size()); }
    int periods() const { return maximumLag + maximumLead + 1; }

    // Number of entries of the stacked dynamic endogenous vector
    int dynamicVariableCount() const;

    std::optional<int> endoIndex(const std::string& name) const;
    std::optional<int> paramIndex(const std::string& name) const;

    // Auxiliary variable stored at endogenous position `endoIndex`, or nullptr
    const AuxVarSpec* auxVarAt(int endoIndex) const;

    // Name of the variable to report for endogenous column `endoIndex`:
    // auxiliaries report their original variable
    std::string reportedName(int endoIndex) const;
};

// ============================================================================
// Built model
// ============================================================================

/**
 * @brief Everything the model file determines: structure, residual
 * expressions (symbols resolved) and the numeric starting point.
 */
struct BuiltModel {
    ModelDescriptor descriptor;

    // Residual expressions (lhs - rhs), one per equation, symbols resolved
    std::vector<ExprPtr> staticResiduals;
    std::vector<ExprPtr> dynamicResiduals;

    // Static definition of each auxiliary variable, indexed like auxVars
    std::vector<ExprPtr> auxDefinitions;

    Eigen::VectorXd initialGuess;       // NaN for auxiliaries until expanded
    Eigen::VectorXd params;             // NaN for parameters never assigned
    Eigen::VectorXd exoSteadyState;
    Eigen::VectorXd exoDetSteadyState;

    // steady_state_model block, targets checked and expressions resolved
    std::vector<Assignment> steadyStateProgram;
    bool hasSteadyStateModel = false;

    bool ramseyPolicy = false;
    std::vector<std::string> instruments;

    bool block = false;
    bool bytecode = false;
    bool debug = false;
};

class ModelBuilder {
public:
    // Throws ModelError on semantic errors
    static BuiltModel build(const ModFile& mod);
};

/**
 * @brief Indices of the endogenous variables in `varlist` that are not listed
 * as unit-root variables. An empty varlist selects every original endogenous
 * variable. Unknown names throw ModelError.
 */
std::vector<int> stationaryVariableList(const ModelDescriptor& model,
                                        const std::vector<std::string>& varlist,
                                        const std::vector<std::string>& unitRootVars);

}  // namespace steadysolve
