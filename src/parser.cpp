#include "steadysolve/parser.h"
#include <peglib.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace steadysolve {

// ============================================================================
// Built-in functions
// ============================================================================
// A built-in applied to an integer literal, e.g. `exp(1)`, is syntactically a
// lead/lag reference. This list is used to tell the two apart.

static const std::set<std::string> BUILTIN_FUNCTIONS = {
    "exp", "log", "ln", "log10", "sqrt", "abs",
    "sin", "cos", "tan", "asin", "acos", "atan",
    "sinh", "cosh", "tanh", "min", "max", "pow"
};

bool isBuiltinFunction(const std::string& name) {
    return BUILTIN_FUNCTIONS.find(name) != BUILTIN_FUNCTIONS.end();
}

bool ModelEquation::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

// ============================================================================
// Grammar (PEG format)
// ============================================================================

static const char* MODEL_RULES = R"(
    ModFile          <- Statement* EndOfFile
    Statement        <- VarDecl / VarexoDetDecl / VarexoDecl / ParamDecl / ModelBlock
                      / InitvalBlock / SteadyStateBlock / RamseyPolicy / SolveOptions
                      / Command / Assignment

    # Declarations
    VarDecl          <- 'var' VarQualifier? SymbolList ';'
    VarQualifier     <- '(' Identifier ')'
    VarexoDecl       <- 'varexo' SymbolList ';'
    VarexoDetDecl    <- 'varexo_det' SymbolList ';'
    ParamDecl        <- 'parameters' SymbolList ';'
    SymbolList       <- Identifier (','? Identifier)*

    # model; ... end;
    ModelBlock       <- 'model' ModelQualifier? ';' ModelEquation* 'end' ';'
    ModelQualifier   <- '(' Identifier ')'
    ModelEquation    <- !('end' ';') Tags? Expression EquationRhs? ';'
    EquationRhs      <- '=' Expression
    Tags             <- '[' Tag (',' Tag)* ']'
    Tag              <- Identifier TagValue?
    TagValue         <- '=' "'" < (!"'" .)* > "'"

    # Value blocks
    InitvalBlock     <- 'initval' ';' Assignment* 'end' ';'
    SteadyStateBlock <- 'steady_state_model' ';' Assignment* 'end' ';'
    Assignment       <- Identifier '=' Expression ';'

    # Solve settings
    RamseyPolicy     <- 'ramsey_policy' RamseyOptions? ';'
    RamseyOptions    <- '(' 'instruments' '=' '(' SymbolList ')' ')'
    SolveOptions     <- 'options' '(' SymbolList ')' ';'
    Command          <- CommandName ('(' (!')' .)* ')')? ';'
    CommandName      <- < 'steady' / 'resid' / 'check' >
)";

static const char* EXPRESSION_RULES = R"(
    # Expressions with operator precedence; '^' is right associative and
    # binds tighter than unary minus
    Expression       <- Term (AddOp Term)*
    Term             <- Factor (MulOp Factor)*
    Factor           <- UnaryOp* PowerExpr
    PowerExpr        <- Primary ('^' Factor)?
    AddOp            <- < [-+] >
    MulOp            <- < [*/] >
    UnaryOp          <- < [-+] >

    Primary          <- LeadLag / Call / Number / Symbol / '(' Expression ')'
    LeadLag          <- Identifier '(' Shift ')'
    Shift            <- < [-+]? [0-9]+ >
    Call             <- Identifier '(' Expression (',' Expression)* ')'
    Symbol           <- Identifier

    Number           <- < ([0-9]+ ('.' [0-9]*)? / '.' [0-9]+) ([eE] [-+]? [0-9]+)? >
    Identifier       <- < [a-zA-Z_] [a-zA-Z0-9_]* >
    EndOfFile        <- !.

    %whitespace      <- ([ \t\r\n] / '//' (![\r\n] .)* / '%' (![\r\n] .)* / '/*' (!'*/' .)* '*/')*
    %word            <- [a-zA-Z0-9_]+
)";

static const char* EXPRESSION_START = R"(
    Input            <- Expression EndOfFile
)";

using AstPtr = std::shared_ptr<peg::Ast>;

// ============================================================================
// Parser Implementation
// ============================================================================

class ModParser::Impl {
public:
    Impl() {
        grammarValid_ = load(modelParser_, std::string(MODEL_RULES) + EXPRESSION_RULES);
        grammarValid_ = load(exprParser_, std::string(EXPRESSION_START) + EXPRESSION_RULES) && grammarValid_;
    }

    ParseResult parse(const std::string& source, const std::string& filename) {
        ParseResult result;
        result.model.sourceFilename = filename;
        result.totalLines = static_cast<int>(std::count(source.begin(), source.end(), '\n')) +
                            (source.empty() || source.back() == '\n' ? 0 : 1);

        if (!grammarValid_) {
            result.errors.push_back({0, 0, "Grammar initialization failed: " + lastError_, ""});
            return result;
        }

        std::vector<ParseError> syntaxErrors;
        modelParser_.set_logger([&](size_t line, size_t col, const std::string& msg) {
            syntaxErrors.push_back({static_cast<int>(line), static_cast<int>(col), msg,
                                    sourceLine(source, line)});
        });

        AstPtr ast;
        if (!modelParser_.parse(source, ast, filename.c_str())) {
            result.errors = syntaxErrors;
            if (result.errors.empty()) {
                result.errors.push_back({0, 0, "Syntax error", ""});
            }
            lastError_ = result.errors.front().message;
            return result;
        }

        try {
            for (const auto& stmt : ast->nodes) {
                if (stmt->name != "Statement") continue;
                lowerStatement(stmt->nodes.front(), result);
            }
        } catch (const std::exception& e) {
            result.errors.push_back({0, 0, e.what(), ""});
        }

        result.equationCount = static_cast<int>(result.model.equations.size());
        result.success = result.errors.empty();
        return result;
    }

    ExprPtr parseExpression(const std::string& source) {
        if (!grammarValid_) {
            throw std::runtime_error("Grammar initialization failed: " + lastError_);
        }
        std::string error;
        exprParser_.set_logger([&](size_t line, size_t col, const std::string& msg) {
            error = std::to_string(line) + ":" + std::to_string(col) + ": " + msg;
        });
        AstPtr ast;
        if (!exprParser_.parse(source, ast)) {
            lastError_ = error;
            throw std::runtime_error("Could not parse expression '" + source + "': " + error);
        }
        return lowerExpression(ast->nodes.front());
    }

    std::string getLastError() const { return lastError_; }

private:
    peg::parser modelParser_;
    peg::parser exprParser_;
    bool grammarValid_ = false;
    std::string lastError_;

    bool load(peg::parser& parser, const std::string& grammar) {
        parser.set_logger([this](size_t line, size_t col, const std::string& msg) {
            lastError_ = std::to_string(line) + ":" + std::to_string(col) + ": " + msg;
        });
        if (!parser.load_grammar(grammar)) {
            return false;
        }
        parser.enable_ast();
        return true;
    }

    static std::string sourceLine(const std::string& source, size_t line) {
        std::istringstream stream(source);
        std::string text;
        for (size_t i = 0; i < line && std::getline(stream, text); ++i) {
        }
        return text;
    }

    static std::string tokenOf(const AstPtr& node) {
        return std::string(node->token);
    }

    static int lineOf(const AstPtr& node) {
        return static_cast<int>(node->line);
    }

    static const AstPtr* findChild(const AstPtr& node, const std::string& name) {
        for (const auto& child : node->nodes) {
            if (child->name == name) return &child;
        }
        return nullptr;
    }

    static std::vector<std::string> symbolList(const AstPtr& node) {
        std::vector<std::string> names;
        for (const auto& ident : node->nodes) {
            names.push_back(tokenOf(ident));
        }
        return names;
    }

    // ------------------------------------------------------------------------
    // Statements
    // ------------------------------------------------------------------------

    void lowerStatement(const AstPtr& node, ParseResult& result) {
        ModFile& mod = result.model;

        if (node->name == "VarDecl") {
            bool multiplier = false;
            if (const AstPtr* qualifier = findChild(node, "VarQualifier")) {
                std::string q = tokenOf((*qualifier)->nodes.front());
                if (q != "multiplier") {
                    result.errors.push_back({lineOf(node), static_cast<int>(node->column),
                                             "Unknown var qualifier '" + q + "'", ""});
                    return;
                }
                multiplier = true;
            }
            for (const auto& name : symbolList(*findChild(node, "SymbolList"))) {
                mod.endogenous.push_back(name);
                if (multiplier) mod.multipliers.push_back(name);
            }
        } else if (node->name == "VarexoDecl") {
            auto names = symbolList(node->nodes.front());
            mod.exogenous.insert(mod.exogenous.end(), names.begin(), names.end());
        } else if (node->name == "VarexoDetDecl") {
            auto names = symbolList(node->nodes.front());
            mod.exogenousDet.insert(mod.exogenousDet.end(), names.begin(), names.end());
        } else if (node->name == "ParamDecl") {
            auto names = symbolList(node->nodes.front());
            mod.parameters.insert(mod.parameters.end(), names.begin(), names.end());
        } else if (node->name == "ModelBlock") {
            for (const auto& child : node->nodes) {
                if (child->name == "ModelQualifier") {
                    std::string q = tokenOf(child->nodes.front());
                    if (q != "linear") {
                        result.errors.push_back({lineOf(child), static_cast<int>(child->column),
                                                 "Unknown model qualifier '" + q + "'", ""});
                        return;
                    }
                    mod.linearModel = true;
                } else if (child->name == "ModelEquation") {
                    mod.equations.push_back(lowerEquation(child));
                }
            }
        } else if (node->name == "InitvalBlock") {
            for (const auto& child : node->nodes) {
                mod.initval.push_back(lowerAssignment(child));
            }
        } else if (node->name == "SteadyStateBlock") {
            mod.hasSteadyStateModel = true;
            for (const auto& child : node->nodes) {
                mod.steadyStateModel.push_back(lowerAssignment(child));
            }
        } else if (node->name == "RamseyPolicy") {
            mod.ramseyPolicy = true;
            if (const AstPtr* options = findChild(node, "RamseyOptions")) {
                mod.instruments = symbolList((*options)->nodes.front());
            }
        } else if (node->name == "SolveOptions") {
            auto flags = symbolList(node->nodes.front());
            mod.solveFlags.insert(mod.solveFlags.end(), flags.begin(), flags.end());
        } else if (node->name == "Assignment") {
            mod.parameterAssignments.push_back(lowerAssignment(node));
        }
        // Command statements (steady; resid; check;) carry no model information
    }

    ModelEquation lowerEquation(const AstPtr& node) {
        ModelEquation eq;
        eq.sourceLine = lineOf(node);
        for (const auto& child : node->nodes) {
            if (child->name == "Tags") {
                for (const auto& tag : child->nodes) {
                    std::string tagName = tokenOf(tag->nodes.front());
                    if (tag->nodes.size() > 1 && tagName == "name") {
                        eq.name = tokenOf(tag->nodes[1]);
                    } else {
                        eq.tags.push_back(tagName);
                    }
                }
            } else if (child->name == "Expression") {
                eq.lhs = lowerExpression(child);
            } else if (child->name == "EquationRhs") {
                eq.rhs = lowerExpression(child->nodes.front());
            }
        }
        if (!eq.rhs) {
            eq.rhs = makeNumber(0.0, eq.sourceLine);
        }
        return eq;
    }

    Assignment lowerAssignment(const AstPtr& node) {
        Assignment a;
        a.target = tokenOf(node->nodes[0]);
        a.value = lowerExpression(node->nodes[1]);
        a.sourceLine = lineOf(node);
        return a;
    }

    // ------------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------------

    ExprPtr lowerExpression(const AstPtr& node) {
        const int line = lineOf(node);

        if (node->name == "Expression" || node->name == "Term") {
            // Left-associative chain: operand (op operand)*
            ExprPtr result = lowerExpression(node->nodes[0]);
            for (size_t i = 1; i + 1 < node->nodes.size(); i += 2) {
                std::string op = tokenOf(node->nodes[i]);
                result = makeBinaryOp(op, result, lowerExpression(node->nodes[i + 1]), line);
            }
            return result;
        }
        if (node->name == "Factor") {
            ExprPtr result = lowerExpression(node->nodes.back());
            for (size_t i = node->nodes.size() - 1; i-- > 0;) {
                std::string op = tokenOf(node->nodes[i]);
                if (op == "-") {
                    result = makeUnaryOp(op, result, line);
                }
            }
            return result;
        }
        if (node->name == "PowerExpr") {
            ExprPtr base = lowerExpression(node->nodes[0]);
            if (node->nodes.size() == 1) return base;
            return makeBinaryOp("^", base, lowerExpression(node->nodes[1]), line);
        }
        if (node->name == "Primary") {
            return lowerExpression(node->nodes.front());
        }
        if (node->name == "LeadLag") {
            std::string name = tokenOf(node->nodes[0]);
            int shift = std::stoi(tokenOf(node->nodes[1]));
            if (isBuiltinFunction(name)) {
                return makeFunctionCall(name, {makeNumber(static_cast<double>(shift), line)}, line);
            }
            return makeVariable(name, shift, line);
        }
        if (node->name == "Call") {
            std::string name = tokenOf(node->nodes[0]);
            std::vector<ExprPtr> args;
            for (size_t i = 1; i < node->nodes.size(); ++i) {
                args.push_back(lowerExpression(node->nodes[i]));
            }
            return makeFunctionCall(name, std::move(args), line);
        }
        if (node->name == "Number") {
            return makeNumber(std::stod(tokenOf(node)), line);
        }
        if (node->name == "Symbol") {
            return makeVariable(tokenOf(node->nodes.front()), 0, line);
        }

        throw std::runtime_error("Unexpected syntax node '" + node->name + "' at line " +
                                 std::to_string(line));
    }
};

// ============================================================================
// ModParser Public Interface
// ============================================================================

ModParser::ModParser() : pImpl(std::make_unique<Impl>()) {}
ModParser::~ModParser() = default;

ParseResult ModParser::parse(const std::string& source, const std::string& filename) {
    return pImpl->parse(source, filename);
}

ParseResult ModParser::parseFile(const std::string& filepath) {
    auto content = readFile(filepath);
    if (!content) {
        ParseResult result;
        result.errors.push_back({0, 0, "Could not open file: " + filepath, ""});
        return result;
    }
    return parse(*content, filepath);
}

ExprPtr ModParser::parseExpression(const std::string& source) {
    return pImpl->parseExpression(source);
}

std::string ModParser::getLastError() const {
    return pImpl->getLastError();
}

// ============================================================================
// Utility Functions
// ============================================================================

std::optional<std::string> readFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void collectVariables(const ExprPtr& expr, std::vector<Variable>& vars) {
    if (!expr) return;

    std::visit([&vars](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Variable>) {
            vars.push_back(node);
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            collectVariables(node.operand, vars);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            collectVariables(node.left, vars);
            collectVariables(node.right, vars);
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            for (const auto& arg : node.args) {
                collectVariables(arg, vars);
            }
        }
    }, expr->node);
}

std::string astToString(const ExprPtr& expr) {
    if (!expr) return "<null>";

    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, NumberLiteral>) {
            std::ostringstream ss;
            ss << node.value;
            return ss.str();
        } else if constexpr (std::is_same_v<T, Variable>) {
            if (node.shift == 0) return node.name;
            return node.name + "(" + (node.shift > 0 ? "+" : "") + std::to_string(node.shift) + ")";
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            return "(" + node.op + astToString(node.operand) + ")";
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            return "(" + astToString(node.left) + " " + node.op + " " + astToString(node.right) + ")";
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            std::string result = node.name + "(";
            for (size_t i = 0; i < node.args.size(); ++i) {
                if (i > 0) result += ", ";
                result += astToString(node.args[i]);
            }
            return result + ")";
        }
        return "<unknown>";
    }, expr->node);
}

std::string astToString(const ModelEquation& equation) {
    return astToString(equation.lhs) + " = " + astToString(equation.rhs);
}

}  // namespace steadysolve
