/// @file LinEqClass.hpp
/// @brief Main LinEq class for object-oriented API
/// @details Class-based interface over the free-function API. Owns the
/// context for one document and the solver strategy.

#pragma once

#include "lineq/LinEqContext.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace LinEq {

class ISolver;

/// @brief Parser and solver for one document of linear equations
/// @details Example usage:
/// @code
/// LinEqClass lineq;
/// lineq.parseLine("x + y = 10");
/// lineq.parseLine("x - y = 2");
/// if (lineq.solve() == 0) {
///     auto [x, info] = lineq.getSolution("x");
/// }
/// @endcode
class LinEqClass {
public:
    /// @brief Constructor - uses LUSolver by default
    LinEqClass();

    /// @brief Destructor
    ~LinEqClass();

    /// @brief Move constructor
    LinEqClass(LinEqClass&&) noexcept;

    /// @brief Move assignment
    LinEqClass& operator=(LinEqClass&&) noexcept;

    // Delete copy operations (LinEqContext is not copyable)
    LinEqClass(const LinEqClass&) = delete;
    LinEqClass& operator=(const LinEqClass&) = delete;

    // =========================================================================
    // Input
    // =========================================================================

    /// @brief Parse one line, continuing the current document
    /// @return Error code (0 = success, 1 = blank line)
    int parseLine(const std::string& line);

    /// @brief Reset and parse a whole document
    /// @return Error code (0 = success)
    int parseDocument(const std::vector<std::string>& lines);

    /// @brief Reset and parse a document given as one string
    /// @return Error code (0 = success)
    int parseText(const std::string& text);

    /// @brief Reset and parse a document file
    /// @param filename Path to a plain text file
    /// @return Error code (0 = success)
    int loadDocument(const std::string& filename);

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Set custom solver strategy
    /// @param solver Solver implementation
    void setSolver(std::unique_ptr<ISolver> solver);

    /// @brief Set print results mode
    /// @param mode Print mode (0 = none, 1 = solution, 2 = detailed)
    void setPrintResultsMode(int mode);

    /// @brief Set number of significant digits in the solution output
    void setOutputPrecision(int precision);

    /// @brief Enable/disable diagnostics on stderr
    void setVerbose(bool enable);

    /// @brief Set singular matrix threshold
    void setSingularThreshold(double threshold);

    /// @brief Set ill-conditioning threshold (reciprocal condition number)
    void setIllConditionedThreshold(double rcond);

    // =========================================================================
    // Computation
    // =========================================================================

    /// @brief Check the system and solve it
    /// @return Error code (0 = success)
    int solve();

    // =========================================================================
    // Output Retrieval
    // =========================================================================

    /// @brief Get solved value of a variable
    /// @return Pair of (value, error code)
    std::pair<double, int> getSolution(const std::string& variableName) const;

    /// @brief Variable names in index order
    std::vector<std::string> getVariableNames() const;

    /// @brief Number of completed equations
    int getNumberOfEquations() const;

    /// @brief Number of distinct variables
    int getNumberOfVariables() const;

    /// @brief Reciprocal condition estimate of the last solve
    double getReciprocalCondition() const;

    /// @brief Solution as "name = value" lines
    std::string formatSolution() const;

    /// @brief Print results to stdout (errors to stderr)
    void printResults() const;

    // =========================================================================
    // Status
    // =========================================================================

    /// @brief Get error/info code
    int getInfoCode() const;

    /// @brief Check if the last operation succeeded
    bool isSuccess() const;

    /// @brief Get error message (with counts for equation/variable mismatches)
    std::string getErrorMessage() const;

    /// @brief 1-based line of the last error (0 = none)
    int getErrorLine() const;

    /// @brief 0-based column of the last error
    int getErrorPosition() const;

    // =========================================================================
    // Reset
    // =========================================================================

    /// @brief Clear equations and parser state (keeps settings and solver)
    void reset();

    /// @brief Reset everything including settings and solver
    void resetAll();

    /// @brief Access the underlying context
    LinEqContext& getContext() { return context_; }
    const LinEqContext& getContext() const { return context_; }

private:
    LinEqContext context_;
};

} // namespace LinEq
