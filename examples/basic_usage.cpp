/// Basic usage example for LinEq
/// Demonstrates the LinEqClass object-oriented API

#include <lineq/LinEqClass.hpp>
#include <iostream>

int main() {
    LinEq::LinEqClass lineq;

    // Equations may be split across lines after an operator
    const char* document[] = {
        "2x + 3y - z = 5",
        "x - y +",
        "   2z = 3.5",
        "",
        "-x + 4y = z + 1.25^1",
    };

    for (const char* line : document) {
        int result = lineq.parseLine(line);
        if (!lineq.isSuccess()) {
            std::cerr << "Parse error on line " << lineq.getErrorLine()
                      << ", column " << lineq.getErrorPosition() + 1
                      << " (code " << result << "): "
                      << lineq.getErrorMessage() << std::endl;
            return 1;
        }
    }

    std::cout << "Equations: " << lineq.getNumberOfEquations() << "\n";
    std::cout << "Variables: " << lineq.getNumberOfVariables() << "\n";

    int result = lineq.solve();
    if (result != 0) {
        std::cerr << "Solve failed (code " << result << "): "
                  << lineq.getErrorMessage() << std::endl;
        return 1;
    }

    std::cout << "\nSolution:\n" << lineq.formatSolution();

    auto [x, info] = lineq.getSolution("x");
    if (info == 0) {
        std::cout << "\nx alone: " << x << "\n";
    }

    return 0;
}
