/// @file LUSolver.hpp
/// @brief Dense LU solver for square systems
/// @details Implements ISolver with Eigen's LU decompositions

#pragma once

#include "lineq/interfaces/ISolver.hpp"
#include <Eigen/Dense>

namespace LinEq {

/// @brief LU solver with singularity and conditioning checks
/// @details A full-pivot LU decides the rank (singular systems are rejected),
/// then a partial-pivot LU estimates the reciprocal condition number and
/// solves the system.
class LUSolver : public ISolver {
public:
    LUSolver() = default;

    /// @brief Solve A x = b
    /// @param system Parsed equations
    /// @param nEquations Number of equations (must equal the variable count)
    /// @param io Thresholds in, solution and condition estimate out
    /// @return Error code (0 = success)
    int solve(const EquationSystem& system,
              int nEquations,
              LinEqIO& io) override;

    /// @brief Get solver name
    /// @return "LUSolver"
    const char* getSolverName() const override {
        return "LUSolver";
    }

private:
    /// @brief Check the solution for NaN/Inf
    static bool isFinite(const Eigen::VectorXd& x);
};

} // namespace LinEq
