#include "lineq/LinEq.hpp"
#include "lineq/interfaces/ISolver.hpp"
#include "lineq/parser/LinearEquationParser.hpp"
#include "lineq/parser/Scanner.hpp"
#include "lineq/solver/LUSolver.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace LinEq {

// ============================================================================
// Parser Functions
// ============================================================================

int parseLine(LinEqContext& ctx, const std::string& line) {
    auto& io = *ctx.io;
    auto& session = *ctx.session;

    ++io.nLinesParsed;
    io.lSolved = false;

    int status = LinearEquationParser::parse(line, session, *ctx.system, io.nEquations);
    io.nVariables = ctx.system->numberOfVariables();

    if (ErrorCode::isSuccess(status)) {
        io.setError(status, 0, 0);
    } else {
        io.setError(status, io.nLinesParsed, session.iErrorPosition);
        if (io.lVerbose) {
            std::cerr << "[Parser] line " << io.nLinesParsed
                      << ", column " << session.iErrorPosition + 1
                      << ": " << ErrorCode::getMessage(status) << "\n";
        }
    }

    return status;
}

int parseDocument(LinEqContext& ctx, const std::vector<std::string>& lines) {
    ctx.resetDocument();
    auto& io = *ctx.io;

    for (const auto& line : lines) {
        int status = parseLine(ctx, line);
        if (!ErrorCode::isSuccess(status)) {
            return status;
        }
    }

    // The last equation must not be left waiting for a continuation
    if (ctx.session->isEquationPending()) {
        int status = ctx.session->equationStatus();
        if (ErrorCode::isSuccess(status)) {
            status = ErrorCode::kIllegalEquation;
        }
        int position = lines.empty() ? 0
                     : static_cast<int>(Scanner::trimRight(lines.back()).size());
        io.setError(status, io.nLinesParsed, position);
        if (io.lVerbose) {
            std::cerr << "[Parser] unterminated equation " << ctx.session->iEquation + 1
                      << ": " << ErrorCode::getMessage(status) << "\n";
        }
        return status;
    }

    io.setError(ErrorCode::kSuccess, 0, 0);
    return ErrorCode::kSuccess;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        // Strip Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

int loadDocument(const std::string& filename, std::vector<std::string>& lines) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return ErrorCode::kDocumentNotFound;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    lines = splitLines(contents.str());
    return ErrorCode::kSuccess;
}

// ============================================================================
// Solver Functions
// ============================================================================

int checkSystem(LinEqContext& ctx) {
    auto& io = *ctx.io;
    io.nVariables = ctx.system->numberOfVariables();

    int status = ErrorCode::kSuccess;
    if (io.nEquations == 0) {
        status = ErrorCode::kNoEquations;
    } else if (io.nEquations < io.nVariables) {
        status = ErrorCode::kTooFewEquations;
    } else if (io.nEquations > io.nVariables) {
        status = ErrorCode::kTooManyEquations;
    }

    io.setError(status, 0, 0);
    return status;
}

int solve(LinEqContext& ctx) {
    auto& io = *ctx.io;

    int status = checkSystem(ctx);
    if (status != ErrorCode::kSuccess) {
        return status;
    }

    if (!ctx.solver) {
        ctx.solver = std::make_unique<LUSolver>();
    }

    status = ctx.solver->solve(*ctx.system, io.nEquations, io);
    io.cVariableNameOut = ctx.system->variableNames();
    io.setError(status, 0, 0);

    if (io.lVerbose) {
        std::cerr << "[" << ctx.solver->getSolverName() << "] "
                  << io.nEquations << " equations: "
                  << ErrorCode::getMessage(status) << "\n";
    }

    return status;
}

int solveDocument(LinEqContext& ctx, const std::vector<std::string>& lines) {
    int status = parseDocument(ctx, lines);
    if (status != ErrorCode::kSuccess) {
        return status;
    }
    return solve(ctx);
}

// ============================================================================
// Configuration Functions
// ============================================================================

void setPrintResultsMode(LinEqContext& ctx, int mode) {
    ctx.io->iPrintResultsMode = mode;
}

void setOutputPrecision(LinEqContext& ctx, int precision) {
    if (precision > 0) {
        ctx.io->iOutputPrecision = precision;
    }
}

void setVerbose(LinEqContext& ctx, bool enable) {
    ctx.io->lVerbose = enable;
}

void setSingularThreshold(LinEqContext& ctx, double threshold) {
    ctx.io->dSingularThreshold = threshold;
}

void setIllConditionedThreshold(LinEqContext& ctx, double rcond) {
    ctx.io->dIllConditionedRCond = rcond;
}

// ============================================================================
// Output Functions
// ============================================================================

std::pair<double, int> getSolution(const LinEqContext& ctx, const std::string& variableName) {
    const auto& io = *ctx.io;
    if (!io.lSolved) {
        return {0.0, -1};
    }

    int index = ctx.system->findVariable(variableName);
    if (index < 0 || index >= io.dSolution.size()) {
        return {0.0, -1};
    }
    return {io.dSolution(index), 0};
}

std::string getErrorMessage(const LinEqContext& ctx) {
    const auto& io = *ctx.io;
    std::string message = ErrorCode::getMessage(io.INFOLinEq);

    if (io.INFOLinEq == ErrorCode::kTooFewEquations
        || io.INFOLinEq == ErrorCode::kTooManyEquations) {
        message += " (" + std::to_string(io.nEquations) + " equations, "
                 + std::to_string(io.nVariables) + " variables)";
    }
    return message;
}

std::string formatError(const LinEqContext& ctx) {
    const auto& io = *ctx.io;
    std::ostringstream oss;
    if (!io.cDocumentName.empty()) {
        oss << io.cDocumentName << ": ";
    }
    if (io.iErrorLine > 0) {
        oss << "line " << io.iErrorLine << ", column " << io.iErrorPosition + 1 << ": ";
    }
    oss << getErrorMessage(ctx);
    return oss.str();
}

} // namespace LinEq
