/// @file LUSolver.cpp
/// @brief Implementation of the dense LU solver

#include "lineq/solver/LUSolver.hpp"
#include "lineq/context/EquationSystem.hpp"
#include "lineq/context/LinEqIO.hpp"
#include "lineq/util/ErrorCodes.hpp"
#include <Eigen/LU>
#include <cmath>
#include <iostream>

namespace LinEq {

int LUSolver::solve(const EquationSystem& system,
                    int nEquations,
                    LinEqIO& io) {
    io.lSolved = false;
    io.dReciprocalCondition = 0.0;

    int nVar = system.numberOfVariables();
    if (nEquations == 0) {
        return ErrorCode::kNoEquations;
    }
    if (nEquations != nVar) {
        return (nEquations < nVar) ? ErrorCode::kTooFewEquations
                                   : ErrorCode::kTooManyEquations;
    }

    Eigen::MatrixXd A = system.denseCoefficients(nEquations);
    Eigen::VectorXd b = system.denseConstants(nEquations);

    // Rank test with full pivoting
    Eigen::FullPivLU<Eigen::MatrixXd> fullLu(A);
    fullLu.setThreshold(io.dSingularThreshold);
    if (!fullLu.isInvertible()) {
        if (io.lVerbose) {
            std::cerr << "[LUSolver] rank " << fullLu.rank() << " of " << nVar << "\n";
        }
        return ErrorCode::kSingularMatrix;
    }

    // Solve using Eigen's PartialPivLU (equivalent to LAPACK DGESV)
    Eigen::PartialPivLU<Eigen::MatrixXd> lu(A);
    io.dReciprocalCondition = lu.rcond();

    if (io.lVerbose) {
        std::cerr << "[LUSolver] n=" << nVar
                  << " det=" << lu.determinant()
                  << " rcond=" << io.dReciprocalCondition << "\n";
    }

    if (io.dReciprocalCondition < io.dIllConditionedRCond) {
        return ErrorCode::kIllConditioned;
    }

    Eigen::VectorXd x = lu.solve(b);
    if (!isFinite(x)) {
        return ErrorCode::kSingularMatrix;
    }

    io.dSolution = x;
    io.lSolved = true;
    return ErrorCode::kSuccess;
}

bool LUSolver::isFinite(const Eigen::VectorXd& x) {
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        if (std::isnan(x(i)) || std::isinf(x(i))) {
            return false;
        }
    }
    return true;
}

} // namespace LinEq
