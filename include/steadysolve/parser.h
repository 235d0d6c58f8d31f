#pragma once

#include "ast.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace steadysolve {

// ============================================================================
// Parser Error
// ============================================================================

struct ParseError {
    int line;
    int column;
    std::string message;
    std::string context;  // The source line where error occurred
};

// ============================================================================
// Parser Result
// ============================================================================

struct ParseResult {
    bool success = false;
    ModFile model;
    std::vector<ParseError> errors;

    // Statistics
    int totalLines = 0;
    int equationCount = 0;
};

// ============================================================================
// Model file parser
// ============================================================================

/**
 * @brief Parser for the `.mod` model language.
 *
 * The grammar is a PEG run by cpp-peglib in AST mode; the resulting
 * syntax tree is lowered into a ModFile.
 */
class ModParser {
public:
    ModParser();
    ~ModParser();

    // Parse model source code string
    ParseResult parse(const std::string& source, const std::string& filename = "<input>");

    // Parse from file
    ParseResult parseFile(const std::string& filepath);

    // Parse a single expression (used by tests and the --resid helper)
    ExprPtr parseExpression(const std::string& source);

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// ============================================================================
// Utility functions
// ============================================================================

std::optional<std::string> readFile(const std::string& filepath);

// Returns true for the names of the built-in math functions
bool isBuiltinFunction(const std::string& name);

// Collect all symbol references (name, shift) from an expression
void collectVariables(const ExprPtr& expr, std::vector<Variable>& vars);

std::string astToString(const ExprPtr& expr);
std::string astToString(const ModelEquation& equation);

}  // namespace steadysolve
