#include "steadysolve/structural_analysis.h"
#include <algorithm>
#include <functional>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace steadysolve {

// ============================================================================
// Hopcroft-Karp Maximum Bipartite Matching
// ============================================================================

std::vector<int> StructuralAnalyzer::maximumMatching(const std::vector<std::vector<int>>& incidence,
                                                     int numVariables) {
    const int numEquations = static_cast<int>(incidence.size());
    std::vector<int> eqToVar(numEquations, -1);
    std::vector<int> varToEq(numVariables, -1);
    std::vector<int> layer(numEquations, -1);

    // Layers of equations reachable from the free equations by alternating
    // paths; true when some path ends at a free variable
    auto buildLayers = [&]() {
        std::queue<int> pending;
        for (int eq = 0; eq < numEquations; ++eq) {
            layer[eq] = eqToVar[eq] == -1 ? 0 : -1;
            if (layer[eq] == 0) pending.push(eq);
        }
        bool reachesFreeVariable = false;
        while (!pending.empty()) {
            const int eq = pending.front();
            pending.pop();
            for (int var : incidence[eq]) {
                const int owner = varToEq[var];
                if (owner == -1) {
                    reachesFreeVariable = true;
                } else if (layer[owner] == -1) {
                    layer[owner] = layer[eq] + 1;
                    pending.push(owner);
                }
            }
        }
        return reachesFreeVariable;
    };

    std::function<bool(int)> augment = [&](int eq) {
        for (int var : incidence[eq]) {
            const int owner = varToEq[var];
            if (owner == -1 || (layer[owner] == layer[eq] + 1 && augment(owner))) {
                eqToVar[eq] = var;
                varToEq[var] = eq;
                return true;
            }
        }
        layer[eq] = -1;  // Dead end for this phase
        return false;
    };

    while (buildLayers()) {
        bool augmented = false;
        for (int eq = 0; eq < numEquations; ++eq) {
            if (eqToVar[eq] == -1 && augment(eq)) augmented = true;
        }
        if (!augmented) break;
    }
    return eqToVar;
}

// ============================================================================
// Tarjan's Strongly Connected Components
// ============================================================================

std::vector<std::vector<int>> StructuralAnalyzer::stronglyConnectedComponents(
    const std::vector<std::vector<int>>& dependsOn) {
    const int n = static_cast<int>(dependsOn.size());
    std::vector<int> index(n, -1);
    std::vector<int> lowlink(n, 0);
    std::vector<bool> onStack(n, false);
    std::vector<int> stack;
    std::vector<std::vector<int>> components;
    int counter = 0;

    // Explicit call stack of (node, next edge to visit)
    std::vector<std::pair<int, size_t>> calls;

    auto visit = [&](int v) {
        index[v] = lowlink[v] = counter++;
        stack.push_back(v);
        onStack[v] = true;
        calls.emplace_back(v, 0);
    };

    for (int root = 0; root < n; ++root) {
        if (index[root] != -1) continue;
        visit(root);

        while (!calls.empty()) {
            const int v = calls.back().first;
            size_t& next = calls.back().second;

            if (next < dependsOn[v].size()) {
                const int w = dependsOn[v][next++];
                if (index[w] == -1) {
                    visit(w);
                } else if (onStack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            if (lowlink[v] == index[v]) {
                std::vector<int> component;
                int w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    onStack[w] = false;
                    component.push_back(w);
                } while (w != v);
                std::sort(component.begin(), component.end());
                components.push_back(std::move(component));
            }

            calls.pop_back();
            if (!calls.empty()) {
                const int parent = calls.back().first;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }

    // Edges point from an equation to the equations it depends on, so
    // components are emitted dependencies first
    return components;
}

// ============================================================================
// Main Analysis Function
// ============================================================================

StructuralAnalysisResult StructuralAnalyzer::analyze(const std::vector<std::vector<int>>& incidence,
                                                     int numVariables) {
    StructuralAnalysisResult result;
    const int numEquations = static_cast<int>(incidence.size());
    result.totalEquations = numEquations;
    result.totalVariables = numVariables;

    if (numEquations != numVariables) {
        result.errorMessage = "There are " + std::to_string(numEquations) + " equations and " +
                              std::to_string(numVariables) + " unknowns. The system is not square";
        return result;
    }
    for (int eq = 0; eq < numEquations; ++eq) {
        for (int var : incidence[eq]) {
            if (var < 0 || var >= numVariables) {
                throw std::out_of_range("Equation " + std::to_string(eq) + " references variable " +
                                        std::to_string(var) + " outside [0, " +
                                        std::to_string(numVariables) + ")");
            }
        }
    }

    result.matching = maximumMatching(incidence, numVariables);

    std::vector<int> unmatched;
    for (int eq = 0; eq < numEquations; ++eq) {
        if (result.matching[eq] == -1) unmatched.push_back(eq);
    }
    if (!unmatched.empty()) {
        std::ostringstream msg;
        msg << "Structural singularity: " << unmatched.size()
            << " equation(s) cannot be matched to a variable:";
        for (int eq : unmatched) msg << " " << (eq + 1);
        result.errorMessage = msg.str();
        return result;
    }

    std::vector<int> varToEq(numVariables, -1);
    for (int eq = 0; eq < numEquations; ++eq) {
        varToEq[result.matching[eq]] = eq;
    }

    std::vector<std::vector<int>> dependsOn(numEquations);
    for (int eq = 0; eq < numEquations; ++eq) {
        for (int var : incidence[eq]) {
            if (varToEq[var] != eq) dependsOn[eq].push_back(varToEq[var]);
        }
    }

    for (auto& component : stronglyConnectedComponents(dependsOn)) {
        Block block;
        block.id = static_cast<int>(result.blocks.size());
        block.equationIds = std::move(component);
        for (int eq : block.equationIds) {
            block.variables.push_back(result.matching[eq]);
        }
        result.largestBlockSize = std::max(result.largestBlockSize, static_cast<int>(block.size()));
        if (block.isScalar()) ++result.scalarBlockCount;
        result.blocks.push_back(std::move(block));
    }

    result.success = true;
    return result;
}

}  // namespace steadysolve
