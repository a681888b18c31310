#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <map>
#include <string>
#include <vector>

namespace LinEq {

/// Sparse system of linear equations A x = b built up by the parser
/// Rows are equation indices, columns are variable indices. Storage grows
/// on demand; entries are only ever added to, never removed.
struct EquationSystem {
    Eigen::SparseMatrix<double> dCoefficients;      ///< A [equations x variables]
    Eigen::SparseVector<double> dConstants;         ///< b [equations]
    std::map<std::string, int> iVariableIndex;      ///< Variable name -> column index

    EquationSystem() = default;

    /// Index of a variable, allocating the next free index for a new name
    int variableIndex(const std::string& name);

    /// Index of a known variable (-1 if not present)
    int findVariable(const std::string& name) const;

    /// Accumulate a coefficient at (equation, variable)
    void addCoefficient(int equationIndex, int variableIndex, double value);

    /// Accumulate a right-hand side value for an equation
    void addConstant(int equationIndex, double value);

    /// Coefficient at (equation, variable), 0 when absent
    double coefficient(int equationIndex, int variableIndex) const;

    /// Right-hand side of an equation, 0 when absent
    double constant(int equationIndex) const;

    int numberOfVariables() const { return static_cast<int>(iVariableIndex.size()); }

    /// Variable names ordered by index
    std::vector<std::string> variableNames() const;

    /// Dense copy of A with the given number of rows
    Eigen::MatrixXd denseCoefficients(int nEquations) const;

    /// Dense copy of b with the given number of rows
    Eigen::VectorXd denseConstants(int nEquations) const;

    /// True if both systems hold the same variables and values
    bool isEquivalent(const EquationSystem& other) const;

    /// Remove all equations and variables
    void clear();
};

} // namespace LinEq
