#pragma once

#include <string>
#include <vector>

namespace steadysolve {

// ============================================================================
// Block Information (Strongly Connected Component)
// ============================================================================

struct Block {
    int id = 0;                        // Block number (0-based), in solve order
    std::vector<int> equationIds;      // Equations in this block
    std::vector<int> variables;        // Variables determined by this block

    // A single equation in a single unknown
    bool isScalar() const { return equationIds.size() == 1; }

    size_t size() const { return equationIds.size(); }
};

// ============================================================================
// Structural Analysis Result
// ============================================================================

struct StructuralAnalysisResult {
    bool success = false;
    std::string errorMessage;

    // matching[eq] = variable determined by equation eq, -1 if unmatched
    std::vector<int> matching;

    // Blocks in topological order (solve Block 0 first, then Block 1, etc.)
    std::vector<Block> blocks;

    // Statistics
    int totalEquations = 0;
    int totalVariables = 0;
    int largestBlockSize = 0;
    int scalarBlockCount = 0;
};

// ============================================================================
// Structural Analyzer
// ============================================================================

/**
 * @brief Block decomposition of a square system from its incidence.
 *
 * Equations are matched to variables (Hopcroft-Karp); the equation graph
 * induced by the matching is split into strongly connected components
 * (Tarjan), which come out with dependencies first.
 */
class StructuralAnalyzer {
public:
    /**
     * @param incidence incidence[eq] = variables appearing in equation eq
     * @param numVariables Number of variables
     */
    static StructuralAnalysisResult analyze(const std::vector<std::vector<int>>& incidence,
                                            int numVariables);

private:
    static std::vector<int> maximumMatching(const std::vector<std::vector<int>>& incidence,
                                            int numVariables);

    static std::vector<std::vector<int>> stronglyConnectedComponents(
        const std::vector<std::vector<int>>& dependsOn);
};

}  // namespace steadysolve
