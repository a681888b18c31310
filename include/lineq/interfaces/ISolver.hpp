/// @file ISolver.hpp
/// @brief Interface for linear system solver strategies
/// @details Defines the contract between the parsed equation system and
/// the algorithm that solves it

#pragma once

namespace LinEq {

// Forward declarations
struct EquationSystem;
struct LinEqIO;

/// @brief Abstract interface for linear system solvers
/// @details Implementations solve A x = b for the first nEquations rows of
/// the system, using the variable indices assigned during parsing:
/// - LUSolver: dense LU decomposition with rank and condition checks
class ISolver {
public:
    virtual ~ISolver() = default;

    /// @brief Solve the system
    /// @param system Parsed equations (A, b, variable map)
    /// @param nEquations Number of completed equations (rows of A)
    /// @param io Settings (thresholds) and outputs (solution, condition)
    /// @return Error code (0 = success, kSingularMatrix, kIllConditioned)
    virtual int solve(const EquationSystem& system,
                      int nEquations,
                      LinEqIO& io) = 0;

    /// @brief Get solver name for logging
    /// @return Solver name string
    virtual const char* getSolverName() const = 0;
};

} // namespace LinEq
