#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "../util/Constants.hpp"

namespace LinEq {

/// Input/Output state
/// Bridge between external callers and the parser/solver state
struct LinEqIO {
    // Input settings
    int iPrintResultsMode = 1;          ///< Print results mode (0=none, 1=solution, 2=detailed)
    int iOutputPrecision = Constants::kDefaultOutputPrecision;  ///< Significant digits
    double dSingularThreshold = Constants::kDefaultSingularThreshold;
    double dIllConditionedRCond = Constants::kDefaultIllConditionedRCond;
    bool lVerbose = false;              ///< Diagnostic output to stderr
    std::string cDocumentName;          ///< Document path (for messages only)

    // Output variables
    int INFOLinEq = 0;                  ///< Status/error code
    int iErrorLine = 0;                 ///< 1-based line of the error (0 = none)
    int iErrorPosition = 0;             ///< 0-based column of the error
    int nLinesParsed = 0;               ///< Lines fed to the parser
    int nEquations = 0;                 ///< Completed equations
    int nVariables = 0;                 ///< Distinct variables
    double dReciprocalCondition = 0.0;  ///< Condition estimate of the last solve
    bool lSolved = false;               ///< Solution vector is valid

    Eigen::VectorXd dSolution;                  ///< x, indexed like the variables
    std::vector<std::string> cVariableNameOut;  ///< Variable names by index

    LinEqIO() = default;

    /// Record a status together with its location
    void setError(int code, int line, int position);

    /// Clear outputs (keeps settings)
    void resetOutput();

    /// Restore default settings and clear outputs
    void reset();
};

} // namespace LinEq
