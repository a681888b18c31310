#include "lineq/LinEq.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace LinEq {

std::string formatSolution(const LinEqContext& ctx) {
    const auto& io = *ctx.io;
    std::ostringstream oss;
    if (!io.lSolved) {
        return oss.str();
    }

    oss << std::setprecision(io.iOutputPrecision);
    for (std::size_t i = 0; i < io.cVariableNameOut.size(); ++i) {
        oss << io.cVariableNameOut[i] << " = " << io.dSolution(static_cast<Eigen::Index>(i)) << "\n";
    }
    return oss.str();
}

namespace {

void printResultsDetailed(const LinEqContext& ctx) {
    const auto& io = *ctx.io;

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "        LINEAR SYSTEM RESULTS\n";
    std::cout << "========================================\n";

    if (!io.cDocumentName.empty()) {
        std::cout << "\nDocument:  " << io.cDocumentName << "\n";
    }
    std::cout << "\nEquations: " << io.nEquations << "\n";
    std::cout << "Variables: " << io.nVariables << "\n";
    std::cout << "Condition: " << std::scientific << std::setprecision(3)
              << io.dReciprocalCondition << " (reciprocal estimate)\n";
    std::cout << std::defaultfloat;

    std::cout << "\nSolution:\n";
    for (std::size_t i = 0; i < io.cVariableNameOut.size(); ++i) {
        std::cout << "  " << std::setw(20) << std::left << io.cVariableNameOut[i]
                  << " = " << std::setprecision(io.iOutputPrecision)
                  << io.dSolution(static_cast<Eigen::Index>(i)) << "\n";
    }

    std::cout << "\n========================================\n\n";
}

} // namespace

void printResults(const LinEqContext& ctx) {
    const auto& io = *ctx.io;
    if (io.iPrintResultsMode <= 0) {
        return;
    }

    if (!io.lSolved) {
        std::cerr << formatError(ctx) << "\n";
        return;
    }

    if (io.iPrintResultsMode >= 2) {
        printResultsDetailed(ctx);
    } else {
        std::cout << formatSolution(ctx);
    }
}

} // namespace LinEq
