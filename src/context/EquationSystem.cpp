#include "lineq/context/EquationSystem.hpp"
#include <algorithm>

namespace LinEq {

int EquationSystem::variableIndex(const std::string& name) {
    auto it = iVariableIndex.find(name);
    if (it != iVariableIndex.end()) {
        return it->second;
    }

    // New variables take the next column
    int index = static_cast<int>(iVariableIndex.size());
    iVariableIndex.emplace(name, index);
    return index;
}

int EquationSystem::findVariable(const std::string& name) const {
    auto it = iVariableIndex.find(name);
    return (it != iVariableIndex.end()) ? it->second : -1;
}

void EquationSystem::addCoefficient(int equationIndex, int variableIndex, double value) {
    if (equationIndex >= dCoefficients.rows() || variableIndex >= dCoefficients.cols()) {
        Eigen::Index rows = std::max<Eigen::Index>(dCoefficients.rows(), equationIndex + 1);
        Eigen::Index cols = std::max<Eigen::Index>(dCoefficients.cols(), variableIndex + 1);
        dCoefficients.conservativeResize(rows, cols);
    }
    dCoefficients.coeffRef(equationIndex, variableIndex) += value;
}

void EquationSystem::addConstant(int equationIndex, double value) {
    if (equationIndex >= dConstants.size()) {
        dConstants.conservativeResize(equationIndex + 1);
    }
    dConstants.coeffRef(equationIndex) += value;
}

double EquationSystem::coefficient(int equationIndex, int variableIndex) const {
    if (equationIndex < 0 || variableIndex < 0
        || equationIndex >= dCoefficients.rows() || variableIndex >= dCoefficients.cols()) {
        return 0.0;
    }
    return dCoefficients.coeff(equationIndex, variableIndex);
}

double EquationSystem::constant(int equationIndex) const {
    if (equationIndex < 0 || equationIndex >= dConstants.size()) {
        return 0.0;
    }
    return dConstants.coeff(equationIndex);
}

std::vector<std::string> EquationSystem::variableNames() const {
    std::vector<std::string> names(iVariableIndex.size());
    for (const auto& [name, index] : iVariableIndex) {
        names[index] = name;
    }
    return names;
}

Eigen::MatrixXd EquationSystem::denseCoefficients(int nEquations) const {
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(nEquations, numberOfVariables());
    for (int k = 0; k < dCoefficients.outerSize(); ++k) {
        for (Eigen::SparseMatrix<double>::InnerIterator it(dCoefficients, k); it; ++it) {
            if (it.row() < nEquations && it.col() < A.cols()) {
                A(it.row(), it.col()) = it.value();
            }
        }
    }
    return A;
}

Eigen::VectorXd EquationSystem::denseConstants(int nEquations) const {
    Eigen::VectorXd b = Eigen::VectorXd::Zero(nEquations);
    for (Eigen::SparseVector<double>::InnerIterator it(dConstants); it; ++it) {
        if (it.index() < nEquations) {
            b(it.index()) = it.value();
        }
    }
    return b;
}

bool EquationSystem::isEquivalent(const EquationSystem& other) const {
    if (iVariableIndex != other.iVariableIndex) {
        return false;
    }

    int rows = static_cast<int>(std::max({dCoefficients.rows(), other.dCoefficients.rows(),
                                          dConstants.size(), other.dConstants.size()}));
    return denseCoefficients(rows) == other.denseCoefficients(rows)
        && denseConstants(rows) == other.denseConstants(rows);
}

void EquationSystem::clear() {
    dCoefficients = Eigen::SparseMatrix<double>();
    dConstants = Eigen::SparseVector<double>();
    iVariableIndex.clear();
}

} // namespace LinEq
