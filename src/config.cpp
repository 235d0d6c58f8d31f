#include "steadysolve/config.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace steadysolve {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool parseBool(const std::string& value, bool& out) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseDouble(const std::string& value, double& out) {
    try {
        size_t used = 0;
        const double v = std::stod(value, &used);
        if (used != value.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& value, int& out) {
    try {
        size_t used = 0;
        const int v = std::stoi(value, &used);
        if (used != value.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

enum class OptionResult { Applied, InvalidValue, UnknownKey };

OptionResult result(bool parsed) {
    return parsed ? OptionResult::Applied : OptionResult::InvalidValue;
}

OptionResult applyOption(const std::string& key, const std::string& value, SteadyStateOptions& options) {
    SolverOptions& solver = options.solver;
    if (key == "maxIterations") return result(parseInt(value, solver.maxIterations));
    if (key == "tolerance") return result(parseDouble(value, solver.tolerance));
    if (key == "stepTolerance") return result(parseDouble(value, solver.stepTolerance));
    if (key == "verbose") return result(parseBool(value, solver.verbose));
    if (key == "lsAlpha") return result(parseDouble(value, solver.lsAlpha));
    if (key == "lsRho") return result(parseDouble(value, solver.lsRho));
    if (key == "lsMaxIterations") return result(parseInt(value, solver.lsMaxIterations));
    if (key == "lsMinStep") return result(parseDouble(value, solver.lsMinStep));
    if (key == "trInitialRadius") return result(parseDouble(value, solver.trInitialRadius));
    if (key == "enableScaling") return result(parseBool(value, solver.enableScaling));
    if (key == "solveAlgo") return result(parseAlgorithm(value, solver.algorithm));
    if (key == "dynatolF") return result(parseDouble(value, options.dynatolF));
    if (key == "solveTolf") return result(parseDouble(value, options.solveTolf));
    if (key == "debug") return result(parseBool(value, options.debug));
    if (key == "steadystateCheck") return result(parseBool(value, options.steadystateCheckFlag));
    if (key == "linear") return result(parseBool(value, options.linear));
    if (key == "block") return result(parseBool(value, options.block));
    if (key == "bytecode") return result(parseBool(value, options.bytecode));
    return OptionResult::UnknownKey;
}

}  // namespace

bool loadSteadyStateOptionsFromFile(const std::string& path, SteadyStateOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": expected 'key = value'" << std::endl;
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        switch (applyOption(key, value, options)) {
            case OptionResult::Applied:
                break;
            case OptionResult::InvalidValue:
                std::cerr << "Warning: " << path << ":" << lineNumber << ": invalid value '" << value
                          << "' for " << key << std::endl;
                break;
            case OptionResult::UnknownKey:
                std::cerr << "Warning: " << path << ":" << lineNumber << ": unknown option '" << key << "'"
                          << std::endl;
                break;
        }
    }
    return true;
}

}  // namespace steadysolve
