#include "steadysolve/steady_state_file.h"
#include "steadysolve/expression.h"
#include <complex>
#include <iostream>
#include <stdexcept>

namespace steadysolve {

using Complex = std::complex<double>;

SteadyStateModelFunction::SteadyStateModelFunction(const BuiltModel& model) : model_(model) {}

SteadyStateFileResult SteadyStateModelFunction::evaluate(const Eigen::VectorXd& guess,
                                                         const Eigen::VectorXd& exo,
                                                         const Eigen::VectorXd& params,
                                                         const SteadyStateOptions& options) {
    ++calls_;
    const ModelDescriptor& d = model_.descriptor;
    if (guess.size() != d.endoNbr || params.size() != d.paramNbr) {
        throw std::invalid_argument("Steady-state function called with " + std::to_string(guess.size()) +
                                    " endogenous values and " + std::to_string(params.size()) +
                                    " parameters");
    }

    Eigen::VectorXcd ys = guess.cast<Complex>();
    Eigen::VectorXcd p = params.cast<Complex>();

    SymbolResolver<Complex> resolve = [&](const Variable& var) -> Complex {
        switch (var.kind) {
            case SymbolKind::Endogenous: return ys(var.index);
            case SymbolKind::Exogenous: return Complex(exo(var.index));
            case SymbolKind::Parameter: return p(var.index);
            default: throw std::runtime_error("Unresolved symbol '" + var.name + "'");
        }
    };

    for (const auto& assignment : model_.steadyStateProgram) {
        const Complex value = evaluateExpression<Complex>(assignment.value, resolve);
        const auto endo = d.endoIndex(assignment.target);
        const auto param = d.paramIndex(assignment.target);
        if (endo) {
            ys(*endo) = value;
        } else if (param) {
            p(*param) = value;
        } else {
            throw std::runtime_error("steady_state_model assigns unknown symbol '" + assignment.target + "'");
        }
        if (options.solver.verbose) {
            std::cout << "  " << assignment.target << " = " << value << std::endl;
        }
    }

    // Definitions reference original variables only
    for (int k = 0; k < d.auxVarCount(); ++k) {
        ys(d.auxVars[k].endoIndex) = evaluateExpression<Complex>(model_.auxDefinitions[k], resolve);
    }

    SteadyStateFileResult result;
    result.ys = ys;
    result.params = p.real();
    return result;
}

}  // namespace steadysolve
