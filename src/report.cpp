#include "steadysolve/report.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace steadysolve {

std::string generateJSONReport(const BuiltModel& model,
                               const SteadyStateResult& result,
                               const std::vector<int>& variables,
                               const StructuralAnalysisResult* analysis) {
    const ModelDescriptor& d = model.descriptor;
    nlohmann::json j;

    j["model"] = d.name;
    j["strategy"] = result.strategy;

    j["status"]["code"] = result.status.value();
    j["status"]["name"] = codeToString(result.status.code);
    if (result.status.magnitude) {
        j["status"]["magnitude"] = *result.status.magnitude;
    } else {
        j["status"]["magnitude"] = nullptr;
    }

    nlohmann::json steadyState = nlohmann::json::array();
    for (int index : variables) {
        nlohmann::json entry;
        entry["name"] = d.endoNames[static_cast<size_t>(index)];
        entry["value"] = index < result.steadyState.size() ? result.steadyState(index) : 0.0;
        steadyState.push_back(entry);
    }
    j["steadyState"] = steadyState;

    nlohmann::json params = nlohmann::json::object();
    for (Eigen::Index i = 0; i < result.params.size() && i < static_cast<Eigen::Index>(d.paramNames.size()); ++i) {
        params[d.paramNames[static_cast<size_t>(i)]] = result.params(i);
    }
    j["params"] = params;

    if (!result.diagnostics.empty()) {
        j["diagnostics"] = result.diagnostics;
    }

    if (analysis) {
        j["stats"]["totalEquations"] = analysis->totalEquations;
        j["stats"]["totalVariables"] = analysis->totalVariables;
        j["stats"]["totalBlocks"] = analysis->blocks.size();
        j["stats"]["largestBlockSize"] = analysis->largestBlockSize;
        j["stats"]["scalarBlockCount"] = analysis->scalarBlockCount;
        j["stats"]["auxiliaryVariables"] = d.auxVarCount();
        if (!analysis->errorMessage.empty()) {
            j["stats"]["error"] = analysis->errorMessage;
        }

        nlohmann::json blocks = nlohmann::json::array();
        for (const auto& block : analysis->blocks) {
            nlohmann::json blockJson;
            blockJson["id"] = block.id;
            blockJson["size"] = block.size();
            blockJson["equationIds"] = block.equationIds;
            std::vector<std::string> names;
            for (int var : block.variables) names.push_back(d.endoNames[static_cast<size_t>(var)]);
            blockJson["variables"] = names;
            blocks.push_back(blockJson);
        }
        j["blocks"] = blocks;
    }

    return j.dump(2);
}

std::string generateTextReport(const BuiltModel& model,
                               const SteadyStateResult& result,
                               const std::vector<int>& variables) {
    const ModelDescriptor& d = model.descriptor;
    std::ostringstream out;

    if (result.status.ok()) {
        out << "STEADY-STATE RESULTS:\n\n";
    } else {
        out << "Steady state not found (" << result.status.value() << ", "
            << codeToString(result.status.code);
        if (result.status.magnitude) out << ", " << *result.status.magnitude;
        out << "). Last values:\n\n";
    }

    size_t width = 0;
    for (int index : variables) width = std::max(width, d.endoNames[static_cast<size_t>(index)].size());

    for (int index : variables) {
        out << std::left << std::setw(static_cast<int>(width) + 2) << d.endoNames[static_cast<size_t>(index)]
            << std::right << std::setw(14) << std::setprecision(6) << result.steadyState(index) << "\n";
    }

    if (!d.paramNames.empty() && result.params.size() > 0) {
        out << "\nPARAMETERS:\n\n";
        for (size_t i = 0; i < d.paramNames.size() && static_cast<Eigen::Index>(i) < result.params.size(); ++i) {
            out << "  " << d.paramNames[i] << " = " << result.params(static_cast<Eigen::Index>(i)) << "\n";
        }
    }
    return out.str();
}

std::string generateResidualsReport(const BuiltModel& model, const Eigen::VectorXd& residuals) {
    const ModelDescriptor& d = model.descriptor;
    std::ostringstream out;
    out << "Residuals of the static equations:\n\n";
    out << std::scientific << std::setprecision(6);
    for (Eigen::Index i = 0; i < residuals.size(); ++i) {
        const EquationInfo& eq = d.equations[static_cast<size_t>(i)];
        out << "  Equation " << std::setw(3) << i + 1 << ": " << std::setw(14) << residuals(i);
        if (!eq.name.empty()) out << "  [" << eq.name << "]";
        if (eq.auxiliary) out << "  (auxiliary)";
        out << "  " << eq.text << "\n";
    }
    return out.str();
}

}  // namespace steadysolve
