#include "steadysolve/model.h"
#include "steadysolve/expression.h"
#include "steadysolve/parser.h"
#include <algorithm>
#include <deque>
#include <limits>
#include <set>
#include <tuple>

namespace steadysolve {

ModelError::ModelError(const std::string& message, int line)
    : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + message : message),
      line_(line) {}

std::string auxVarTypeToString(AuxVarType type) {
    switch (type) {
        case AuxVarType::EndoLead: return "endo_lead";
        case AuxVarType::EndoLag: return "endo_lag";
        case AuxVarType::ExoLag: return "exo_lag";
    }
    return "unknown";
}

// ============================================================================
// ModelDescriptor
// ============================================================================

int ModelDescriptor::dynamicVariableCount() const {
    if (leadLagIncidence.size() == 0) return 0;
    return static_cast<int>((leadLagIncidence.array() > 0).count());
}

std::optional<int> ModelDescriptor::endoIndex(const std::string& name) const {
    auto it = std::find(endoNames.begin(), endoNames.end(), name);
    if (it == endoNames.end()) return std::nullopt;
    return static_cast<int>(it - endoNames.begin());
}

std::optional<int> ModelDescriptor::paramIndex(const std::string& name) const {
    auto it = std::find(paramNames.begin(), paramNames.end(), name);
    if (it == paramNames.end()) return std::nullopt;
    return static_cast<int>(it - paramNames.begin());
}

const AuxVarSpec* ModelDescriptor::auxVarAt(int index) const {
    const int k = index - origEndoNbr;
    if (k < 0 || k >= auxVarCount()) return nullptr;
    return &auxVars[k];
}

std::string ModelDescriptor::reportedName(int index) const {
    const AuxVarSpec* aux = auxVarAt(index);
    if (!aux) return endoNames.at(index);
    if (aux->type == AuxVarType::ExoLag) {
        return aux->origIndex < exoNbr ? exoNames.at(aux->origIndex)
                                       : exoDetNames.at(aux->origIndex - exoNbr);
    }
    return endoNames.at(aux->origIndex);
}

// ============================================================================
// ModelBuilder
// ============================================================================

namespace {

const double kUnset = std::numeric_limits<double>::quiet_NaN();

struct Symbol {
    SymbolKind kind;
    int index;
};

// A static equation paired with its dynamic counterpart. Untagged equations
// pair with themselves.
struct EquationPair {
    const ModelEquation* staticEq;
    const ModelEquation* dynamicEq;

    bool isMultiplier() const {
        return staticEq->hasTag("multiplier") || dynamicEq->hasTag("multiplier");
    }
};

ExprPtr residualOf(const ModelEquation& eq) {
    if (eq.rhs->is<NumberLiteral>() && eq.rhs->as<NumberLiteral>().value == 0.0) {
        return eq.lhs;
    }
    return makeBinaryOp("-", eq.lhs, eq.rhs, eq.sourceLine);
}

void checkFunctions(const ExprPtr& expr) {
    std::visit([](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, UnaryOp>) {
            checkFunctions(node.operand);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            checkFunctions(node.left);
            checkFunctions(node.right);
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            if (!isBuiltinFunction(node.name)) {
                throw ModelError("Unknown function '" + node.name + "'");
            }
            const size_t expected = (node.name == "min" || node.name == "max" || node.name == "pow") ? 2 : 1;
            if (node.args.size() != expected) {
                throw ModelError("Function '" + node.name + "' expects " + std::to_string(expected) +
                                 " argument(s)");
            }
            for (const auto& arg : node.args) checkFunctions(arg);
        }
    }, expr->node);
}

class BuildContext {
public:
    explicit BuildContext(const ModFile& mod) : mod_(mod) {}

    BuiltModel run() {
        desc().name = mod_.sourceFilename;
        declareSymbols();
        assignParameters();
        buildEquations();
        computeIncidence();
        applyInitval();
        resolveSteadyStateProgram();
        applyFlags();
        return std::move(built_);
    }

private:
    const ModFile& mod_;
    BuiltModel built_;
    std::map<std::string, Symbol> symbols_;
    std::map<std::tuple<AuxVarType, int, int>, int> auxCache_;
    std::vector<ExprPtr> auxDynamicResiduals_;

    ModelDescriptor& desc() { return built_.descriptor; }

    // ------------------------------------------------------------------------
    // Symbols
    // ------------------------------------------------------------------------

    void declare(const std::string& name, SymbolKind kind, int index) {
        if (!symbols_.emplace(name, Symbol{kind, index}).second) {
            throw ModelError("Symbol '" + name + "' is declared more than once");
        }
        if (isBuiltinFunction(name)) {
            throw ModelError("Symbol '" + name + "' clashes with a built-in function");
        }
    }

    void declareSymbols() {
        ModelDescriptor& d = desc();
        for (const auto& name : mod_.endogenous) {
            declare(name, SymbolKind::Endogenous, d.origEndoNbr++);
            d.endoNames.push_back(name);
        }
        for (const auto& name : mod_.exogenous) {
            declare(name, SymbolKind::Exogenous, d.exoNbr++);
            d.exoNames.push_back(name);
        }
        for (const auto& name : mod_.exogenousDet) {
            declare(name, SymbolKind::Exogenous, d.exoNbr + d.exoDetNbr++);
            d.exoDetNames.push_back(name);
        }
        for (const auto& name : mod_.parameters) {
            declare(name, SymbolKind::Parameter, d.paramNbr++);
            d.paramNames.push_back(name);
        }
        for (const auto& name : mod_.multipliers) {
            d.multiplierIndices.push_back(symbols_.at(name).index);
        }
        d.endoNbr = d.origEndoNbr;
    }

    std::string exogenousName(int index) const {
        const ModelDescriptor& d = built_.descriptor;
        return index < d.exoNbr ? d.exoNames[index] : d.exoDetNames[index - d.exoNbr];
    }

    ExprPtr resolve(const ExprPtr& expr, bool allowShifts, const std::string& context, int line) {
        try {
            checkFunctions(expr);
        } catch (const ModelError& e) {
            throw ModelError(std::string(e.what()) + " in " + context, line);
        }
        return substituteVariables(expr, [&](const Variable& var, int varLine) {
            auto it = symbols_.find(var.name);
            if (it == symbols_.end()) {
                throw ModelError("Unknown symbol '" + var.name + "' in " + context, varLine ? varLine : line);
            }
            if (var.shift != 0 && (!allowShifts || it->second.kind == SymbolKind::Parameter)) {
                throw ModelError("'" + var.name + "' cannot have a lead or lag in " + context,
                                 varLine ? varLine : line);
            }
            return makeResolvedVariable(var.name, it->second.kind, it->second.index, var.shift, varLine);
        });
    }

    double evaluate(const ExprPtr& resolved, bool allowModelSymbols, const std::string& context, int line) {
        return evaluateExpression<double>(resolved, [&](const Variable& var) -> double {
            if (var.kind == SymbolKind::Parameter) {
                return built_.params(var.index);
            }
            if (!allowModelSymbols) {
                throw ModelError("'" + var.name + "' is not a parameter and cannot appear in " + context, line);
            }
            if (var.kind == SymbolKind::Endogenous) {
                return built_.initialGuess(var.index);
            }
            const int exoNbr = built_.descriptor.exoNbr;
            return var.index < exoNbr ? built_.exoSteadyState(var.index)
                                      : built_.exoDetSteadyState(var.index - exoNbr);
        });
    }

    void assignParameters() {
        built_.params = Eigen::VectorXd::Constant(desc().paramNbr, kUnset);
        for (const auto& assignment : mod_.parameterAssignments) {
            auto it = symbols_.find(assignment.target);
            if (it == symbols_.end() || it->second.kind != SymbolKind::Parameter) {
                throw ModelError("'" + assignment.target + "' is not a declared parameter", assignment.sourceLine);
            }
            ExprPtr value = resolve(assignment.value, false, "parameter assignment", assignment.sourceLine);
            built_.params(it->second.index) = evaluate(value, false, "a parameter assignment", assignment.sourceLine);
        }
    }

    // ------------------------------------------------------------------------
    // Equations and auxiliary variables
    // ------------------------------------------------------------------------

    std::vector<EquationPair> pairEquations() {
        std::vector<EquationPair> pairs;
        std::deque<const ModelEquation*> pendingStatic;
        std::deque<const ModelEquation*> pendingDynamic;

        for (const auto& eq : mod_.equations) {
            const bool isStatic = eq.hasTag("static");
            const bool isDynamic = eq.hasTag("dynamic");
            if (isStatic && isDynamic) {
                throw ModelError("An equation cannot be tagged both [static] and [dynamic]", eq.sourceLine);
            }
            if (isStatic) {
                if (!pendingDynamic.empty()) {
                    pairs.push_back({&eq, pendingDynamic.front()});
                    pendingDynamic.pop_front();
                } else {
                    pendingStatic.push_back(&eq);
                }
            } else if (isDynamic) {
                if (!pendingStatic.empty()) {
                    pairs.push_back({pendingStatic.front(), &eq});
                    pendingStatic.pop_front();
                } else {
                    pendingDynamic.push_back(&eq);
                }
            } else {
                pairs.push_back({&eq, &eq});
            }
        }
        if (!pendingStatic.empty()) {
            throw ModelError("[static] equation has no matching [dynamic] equation",
                             pendingStatic.front()->sourceLine);
        }
        if (!pendingDynamic.empty()) {
            throw ModelError("[dynamic] equation has no matching [static] equation",
                             pendingDynamic.front()->sourceLine);
        }

        std::stable_partition(pairs.begin(), pairs.end(),
                              [](const EquationPair& p) { return p.isMultiplier(); });
        return pairs;
    }

    void buildEquations() {
        ModelDescriptor& d = desc();
        std::vector<EquationPair> pairs = pairEquations();

        for (const auto& pair : pairs) {
            const ModelEquation& s = *pair.staticEq;
            const ModelEquation& dyn = *pair.dynamicEq;
            const std::string where = "equation at line " + std::to_string(s.sourceLine);

            built_.staticResiduals.push_back(staticForm(resolve(residualOf(s), true, where, s.sourceLine)));
            ExprPtr dynamic = resolve(residualOf(dyn), true, "equation at line " + std::to_string(dyn.sourceLine),
                                      dyn.sourceLine);
            built_.dynamicResiduals.push_back(toDynamicForm(dynamic));

            EquationInfo info;
            info.id = static_cast<int>(d.equations.size());
            info.name = s.name.empty() ? dyn.name : s.name;
            info.text = astToString(s);
            info.sourceLine = s.sourceLine;
            info.multiplier = pair.isMultiplier();
            d.equations.push_back(info);
            if (pair.staticEq != pair.dynamicEq) d.staticAndDynamicDiffer = true;
            if (info.multiplier) ++d.ramseyEqNbr;
        }
        d.origEqNbr = static_cast<int>(pairs.size());

        for (int k = 0; k < d.auxVarCount(); ++k) {
            const AuxVarSpec& aux = d.auxVars[k];
            ExprPtr auxVar = makeResolvedVariable(d.endoNames[aux.endoIndex], SymbolKind::Endogenous, aux.endoIndex);
            built_.staticResiduals.push_back(makeBinaryOp("-", auxVar, built_.auxDefinitions[k]));
            built_.dynamicResiduals.push_back(auxDynamicResiduals_[k]);

            EquationInfo info;
            info.id = static_cast<int>(d.equations.size());
            info.text = d.endoNames[aux.endoIndex] + " = " + astToString(built_.auxDefinitions[k]);
            info.auxiliary = true;
            d.equations.push_back(info);
        }

        if (d.endoNbr != d.equationCount()) {
            throw ModelError("The model has " + std::to_string(d.equationCount()) + " equations for " +
                             std::to_string(d.endoNbr) + " endogenous variables");
        }
    }

    ExprPtr toDynamicForm(const ExprPtr& resolved) {
        return substituteVariables(resolved, [&](const Variable& var, int line) -> ExprPtr {
            if (var.kind == SymbolKind::Endogenous && var.shift > 1) {
                int aux = endoLeadAux(var.index, var.shift - 1);
                return makeResolvedVariable(desc().endoNames[aux], SymbolKind::Endogenous, aux, 1, line);
            }
            if (var.kind == SymbolKind::Endogenous && var.shift < -1) {
                int aux = endoLagAux(var.index, -var.shift - 1);
                return makeResolvedVariable(desc().endoNames[aux], SymbolKind::Endogenous, aux, -1, line);
            }
            if (var.kind == SymbolKind::Exogenous && var.shift > 0) {
                throw ModelError("Leads of exogenous variable '" + var.name + "' are not supported", line);
            }
            if (var.kind == SymbolKind::Exogenous && var.shift < 0) {
                int aux = exoLagAux(var.index, -var.shift);
                return makeResolvedVariable(desc().endoNames[aux], SymbolKind::Endogenous, aux, -1, line);
            }
            return makeResolvedVariable(var.name, var.kind, var.index, var.shift, line);
        });
    }

    ExprPtr endoRef(int index, int shift) {
        return makeResolvedVariable(desc().endoNames[index], SymbolKind::Endogenous, index, shift);
    }

    // AUX_ENDO_LEAD_x_k equals x(+k); its dynamic definition is prev(+1)
    int endoLeadAux(int orig, int k) {
        auto key = std::make_tuple(AuxVarType::EndoLead, orig, k);
        if (auto it = auxCache_.find(key); it != auxCache_.end()) return it->second;
        const int prev = k == 1 ? orig : endoLeadAux(orig, k - 1);
        return addAux(key, "AUX_ENDO_LEAD_" + desc().endoNames[orig] + "_" + std::to_string(k),
                      endoRef(prev, 1), endoRef(orig, 0), k);
    }

    // AUX_ENDO_LAG_x_k equals x(-k); its dynamic definition is prev(-1)
    int endoLagAux(int orig, int k) {
        auto key = std::make_tuple(AuxVarType::EndoLag, orig, k);
        if (auto it = auxCache_.find(key); it != auxCache_.end()) return it->second;
        const int prev = k == 1 ? orig : endoLagAux(orig, k - 1);
        return addAux(key, "AUX_ENDO_LAG_" + desc().endoNames[orig] + "_" + std::to_string(k),
                      endoRef(prev, -1), endoRef(orig, 0), -k);
    }

    // AUX_EXO_LAG_e_k equals e(-(k-1)), so that e(-k) becomes AUX_EXO_LAG_e_k(-1)
    int exoLagAux(int exo, int k) {
        auto key = std::make_tuple(AuxVarType::ExoLag, exo, k);
        if (auto it = auxCache_.find(key); it != auxCache_.end()) return it->second;
        const std::string exoName = exogenousName(exo);
        ExprPtr exoRef = makeResolvedVariable(exoName, SymbolKind::Exogenous, exo);
        ExprPtr definition = k == 1 ? exoRef : endoRef(exoLagAux(exo, k - 1), -1);
        return addAux(key, "AUX_EXO_LAG_" + exoName + "_" + std::to_string(k), definition, exoRef, -(k - 1));
    }

    int addAux(const std::tuple<AuxVarType, int, int>& key, const std::string& name,
               ExprPtr dynamicDefinition, ExprPtr staticDefinition, int origLeadLag) {
        if (symbols_.count(name)) {
            throw ModelError("Auxiliary variable name '" + name + "' clashes with a declared symbol");
        }
        ModelDescriptor& d = desc();
        AuxVarSpec aux;
        aux.type = std::get<0>(key);
        aux.endoIndex = d.endoNbr++;
        aux.origIndex = std::get<1>(key);
        aux.origLeadLag = origLeadLag;
        d.auxVars.push_back(aux);
        d.endoNames.push_back(name);

        ExprPtr self = endoRef(aux.endoIndex, 0);
        built_.auxDefinitions.push_back(std::move(staticDefinition));
        auxDynamicResiduals_.push_back(makeBinaryOp("-", self, std::move(dynamicDefinition)));
        auxCache_[key] = aux.endoIndex;
        return aux.endoIndex;
    }

    // ------------------------------------------------------------------------
    // Incidence
    // ------------------------------------------------------------------------

    void computeIncidence() {
        ModelDescriptor& d = desc();

        std::set<std::pair<int, int>> present;  // (shift, endogenous index)
        for (int j = 0; j < d.endoNbr; ++j) {
            present.insert({0, j});
        }
        for (const auto& residual : built_.dynamicResiduals) {
            std::vector<Variable> vars;
            collectVariables(residual, vars);
            for (const auto& var : vars) {
                if (var.kind != SymbolKind::Endogenous) continue;
                present.insert({var.shift, var.index});
                d.maximumLag = std::max(d.maximumLag, -var.shift);
                d.maximumLead = std::max(d.maximumLead, var.shift);
            }
        }

        d.leadLagIncidence = Eigen::MatrixXi::Zero(d.periods(), d.endoNbr);
        int position = 0;
        for (int p = 0; p < d.periods(); ++p) {
            for (int j = 0; j < d.endoNbr; ++j) {
                if (present.count({p - d.maximumLag, j})) {
                    d.leadLagIncidence(p, j) = ++position;
                }
            }
        }

        d.staticIncidence.clear();
        for (const auto& residual : built_.staticResiduals) {
            std::vector<Variable> vars;
            collectVariables(residual, vars);
            std::set<int> endo;
            for (const auto& var : vars) {
                if (var.kind == SymbolKind::Endogenous) endo.insert(var.index);
            }
            d.staticIncidence.emplace_back(endo.begin(), endo.end());
        }
    }

    // ------------------------------------------------------------------------
    // Initial values, steady-state program, options
    // ------------------------------------------------------------------------

    void applyInitval() {
        const ModelDescriptor& d = built_.descriptor;
        built_.initialGuess = Eigen::VectorXd::Constant(d.endoNbr, kUnset);
        built_.initialGuess.head(d.origEndoNbr).setZero();
        built_.exoSteadyState = Eigen::VectorXd::Zero(d.exoNbr);
        built_.exoDetSteadyState = Eigen::VectorXd::Zero(d.exoDetNbr);

        for (const auto& assignment : mod_.initval) {
            auto it = symbols_.find(assignment.target);
            if (it == symbols_.end() || it->second.kind == SymbolKind::Parameter) {
                throw ModelError("initval can only set endogenous or exogenous variables, not '" +
                                 assignment.target + "'", assignment.sourceLine);
            }
            ExprPtr value = resolve(assignment.value, false, "initval", assignment.sourceLine);
            const double v = evaluate(value, true, "initval", assignment.sourceLine);
            const int index = it->second.index;
            if (it->second.kind == SymbolKind::Endogenous) {
                built_.initialGuess(index) = v;
            } else if (index < d.exoNbr) {
                built_.exoSteadyState(index) = v;
            } else {
                built_.exoDetSteadyState(index - d.exoNbr) = v;
            }
        }
    }

    void resolveSteadyStateProgram() {
        built_.hasSteadyStateModel = mod_.hasSteadyStateModel;
        for (const auto& assignment : mod_.steadyStateModel) {
            auto it = symbols_.find(assignment.target);
            if (it == symbols_.end() || it->second.kind == SymbolKind::Exogenous) {
                throw ModelError("steady_state_model can only assign endogenous variables or parameters, not '" +
                                 assignment.target + "'", assignment.sourceLine);
            }
            Assignment resolved = assignment;
            resolved.value = resolve(assignment.value, false, "steady_state_model", assignment.sourceLine);
            built_.steadyStateProgram.push_back(resolved);
        }
    }

    void applyFlags() {
        desc().linear = mod_.linearModel;
        for (const auto& flag : mod_.solveFlags) {
            if (flag == "linear") {
                desc().linear = true;
            } else if (flag == "block") {
                built_.block = true;
            } else if (flag == "bytecode") {
                built_.bytecode = true;
            } else if (flag == "debug") {
                built_.debug = true;
            } else {
                throw ModelError("Unknown option '" + flag + "'");
            }
        }

        built_.ramseyPolicy = mod_.ramseyPolicy;
        for (const auto& instrument : mod_.instruments) {
            auto it = symbols_.find(instrument);
            if (it == symbols_.end() || it->second.kind != SymbolKind::Endogenous) {
                throw ModelError("Instrument '" + instrument + "' is not an endogenous variable");
            }
            built_.instruments.push_back(instrument);
        }
    }
};

}  // namespace

BuiltModel ModelBuilder::build(const ModFile& mod) {
    return BuildContext(mod).run();
}

// ============================================================================
// Variable selection
// ============================================================================

std::vector<int> stationaryVariableList(const ModelDescriptor& model,
                                        const std::vector<std::string>& varlist,
                                        const std::vector<std::string>& unitRootVars) {
    std::vector<std::string> names = varlist;
    if (names.empty()) {
        names.assign(model.endoNames.begin(), model.endoNames.begin() + model.origEndoNbr);
    }

    std::vector<int> indices;
    for (const auto& name : names) {
        if (std::find(unitRootVars.begin(), unitRootVars.end(), name) != unitRootVars.end()) {
            continue;
        }
        auto index = model.endoIndex(name);
        if (!index) {
            throw ModelError("Unknown variable '" + name + "' in variable list");
        }
        indices.push_back(*index);
    }
    return indices;
}

}  // namespace steadysolve
