/// @file lineq_solve.cpp
/// @brief Solve a system of linear equations read from a text file
/// @details One or more equations per document; an equation may continue
/// on the next line after an operator.
///
/// Usage: lineq_solve [--precision N] [--detailed] [--verbose] [--quiet] [file|-]

#include "lineq/LinEqClass.hpp"
#include "lineq/LinEq.hpp"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <iterator>
#include <string>

using namespace LinEq;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--precision N] [--detailed] [--verbose] [--quiet] [file|-]\n"
              << "Reads equations such as\n"
              << "    2x + 3y = 8\n"
              << "    x - y = -1\n"
              << "from the file (or standard input) and prints the solution.\n"
              << "--quiet suppresses the solution; errors are always printed.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string filename = "-";
    int precision = 0;
    int printMode = 1;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--precision" && i + 1 < argc) {
            precision = std::atoi(argv[++i]);
            if (precision <= 0) {
                std::cerr << "Invalid precision: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--detailed") {
            printMode = 2;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--quiet") {
            printMode = 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            filename = arg;
        }
    }

    try {
        LinEqClass lineq;
        lineq.setPrintResultsMode(printMode);
        lineq.setVerbose(verbose);
        if (precision > 0) {
            lineq.setOutputPrecision(precision);
        }

        int result = 0;
        if (filename == "-") {
            std::string text((std::istreambuf_iterator<char>(std::cin)),
                             std::istreambuf_iterator<char>());
            result = lineq.parseText(text);
        } else {
            result = lineq.loadDocument(filename);
        }

        if (result == ErrorCode::kSuccess) {
            result = lineq.solve();
        }

        // Errors are reported even in quiet mode
        if (result != ErrorCode::kSuccess) {
            std::cerr << formatError(lineq.getContext()) << "\n";
            return 1;
        }

        lineq.printResults();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
