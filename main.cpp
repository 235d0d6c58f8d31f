#include "steadysolve/config.h"
#include "steadysolve/model.h"
#include "steadysolve/report.h"
#include "steadysolve/runner.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <model.mod>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config <file>     Options file (default: steadysolve.conf next to the model, if any)\n";
    std::cerr << "  -o, --output <file>     Output file (default: stdout)\n";
    std::cerr << "  -f, --format <format>   Output format: json, text (default: text)\n";
    std::cerr << "  --resid                 Print the static residuals at the initial values\n";
    std::cerr << "  --debug                 Report Inf/NaN initial values and Jacobian entries\n";
    std::cerr << "  --linear                Treat the model as linear\n";
    std::cerr << "  --block                 Solve block by block\n";
    std::cerr << "  --bytecode              Solve block by block (bytecode mode)\n";
    std::cerr << "  --solve-algo <name>     Nonlinear solver: newton, trust_region\n";
    std::cerr << "  --varlist <a,b,...>     Variables to report (default: all)\n";
    std::cerr << "  --unit-root <a,b,...>   Unit-root variables, left out of the report\n";
    std::cerr << "  -v, --verbose           Print solver iterations\n";
    std::cerr << "  -h, --help              Show this help message\n";
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

int main(int argc, char* argv[]) {
    std::string inputFile;
    std::string outputFile;
    std::string configFile;
    std::string format = "text";
    std::string solveAlgo;
    std::vector<std::string> varlist;
    std::vector<std::string> unitRootVars;
    bool printResiduals = false;
    bool debug = false;
    bool linear = false;
    bool block = false;
    bool bytecode = false;
    bool verbose = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto requireValue = [&](const std::string& flag) -> bool {
            if (i + 1 < argc) return true;
            std::cerr << "Error: " << flag << " requires an argument\n";
            return false;
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--resid") {
            printResiduals = true;
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--linear") {
            linear = true;
        } else if (arg == "--block") {
            block = true;
        } else if (arg == "--bytecode") {
            bytecode = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!requireValue(arg)) return 1;
            configFile = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!requireValue(arg)) return 1;
            outputFile = argv[++i];
        } else if (arg == "-f" || arg == "--format") {
            if (!requireValue(arg)) return 1;
            format = argv[++i];
        } else if (arg == "--solve-algo") {
            if (!requireValue(arg)) return 1;
            solveAlgo = argv[++i];
        } else if (arg == "--varlist") {
            if (!requireValue(arg)) return 1;
            varlist = splitList(argv[++i]);
        } else if (arg == "--unit-root") {
            if (!requireValue(arg)) return 1;
            unitRootVars = splitList(argv[++i]);
        } else if (arg[0] != '-') {
            inputFile = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (inputFile.empty()) {
        std::cerr << "Error: No input file specified\n";
        printUsage(argv[0]);
        return 1;
    }
    if (format != "json" && format != "text") {
        std::cerr << "Unknown format: " << format << "\n";
        return 1;
    }

    // Configuration file first, command-line flags override it
    steadysolve::SteadyStateOptions options;
    if (!configFile.empty()) {
        if (!steadysolve::loadSteadyStateOptionsFromFile(configFile, options)) {
            std::cerr << "Error: Could not read config file: " << configFile << "\n";
            return 1;
        }
    } else {
        fs::path defaultConfig = fs::path(inputFile).parent_path() / "steadysolve.conf";
        if (fs::exists(defaultConfig)) {
            steadysolve::loadSteadyStateOptionsFromFile(defaultConfig.string(), options);
        }
    }
    options.debug = options.debug || debug;
    options.linear = options.linear || linear;
    options.block = options.block || block;
    options.bytecode = options.bytecode || bytecode;
    options.solver.verbose = options.solver.verbose || verbose;
    if (!solveAlgo.empty() && !steadysolve::parseAlgorithm(solveAlgo, options.solver.algorithm)) {
        std::cerr << "Unknown solver algorithm: " << solveAlgo << "\n";
        return 1;
    }

    // Run the pipeline (Parse -> Build -> Steady state)
    steadysolve::SteadySolveRunner runner(inputFile);
    bool runSuccess = runner.run(options);

    if (!runner.isParseSuccess()) {
        std::cerr << "Parse failed:\n";
        for (const auto& err : runner.getParseResult().errors) {
            std::cerr << "  Line " << err.line << ", column " << err.column << ": " << err.message << "\n";
            if (!err.context.empty()) std::cerr << "    " << err.context << "\n";
        }
        return 1;
    }
    if (!runner.isBuildSuccess()) {
        std::cerr << "Model error: " << runner.getErrorMessage() << "\n";
        return 1;
    }

    const auto& model = runner.getModel();
    if (printResiduals) {
        try {
            std::cout << steadysolve::generateResidualsReport(model, runner.initialResiduals()) << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: Could not evaluate residuals: " << e.what() << "\n";
        }
    }

    if (!runner.getErrorMessage().empty()) {
        std::cerr << "Error: " << runner.getErrorMessage() << "\n";
        return 1;
    }

    const auto& result = runner.getResult();
    if (!result.diagnostics.empty()) {
        std::cerr << result.diagnostics;
    }

    std::vector<int> variables;
    try {
        variables = steadysolve::stationaryVariableList(model.descriptor, varlist, unitRootVars);
    } catch (const steadysolve::ModelError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::string output;
    if (format == "json") {
        output = steadysolve::generateJSONReport(model, result, variables, &runner.getAnalysisResult());
    } else {
        output = steadysolve::generateTextReport(model, result, variables);
    }

    if (!outputFile.empty()) {
        std::ofstream file(outputFile);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open output file: " << outputFile << "\n";
            return 1;
        }
        file << output;
    } else {
        std::cout << output;
    }

    if (options.solver.verbose) {
        const auto& timing = runner.getTiming();
        std::cerr << "Timing (ms): parse " << timing.parse_time_ms << ", build " << timing.build_time_ms
                  << ", analysis " << timing.analysis_time_ms << ", solve " << timing.solve_time_ms
                  << ", total " << timing.total_time_ms << "\n";
    }

    return runSuccess ? 0 : 1;
}
