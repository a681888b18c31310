#pragma once

#include "../util/Constants.hpp"

namespace LinEq {

/// Parser state that survives between lines of one document
/// An equation may continue on the next line after an operator, so the
/// mode, the sign flags and the per-equation validity flags are kept here
/// rather than on the stack of a single parse call.
struct ParserSession {
    Constants::ParserMode mode = Constants::ParserMode::ExpectTerm;

    int iEquation = 0;                  ///< Index of the equation being assembled
    int iStartPosition = 0;             ///< First non-blank column of the current line
    int INFO = 0;                       ///< Status of the last parse call
    int iErrorPosition = 0;             ///< Column where INFO was determined

    bool lNegativeOperator = false;     ///< Last '+'/'-' operator was '-'
    bool lEqualSign = false;            ///< '=' seen in this equation
    bool lVariableInEquation = false;   ///< At least one variable term seen
    bool lTermBeforeEqualSign = false;  ///< Term seen on the left side
    bool lTermAfterEqualSign = false;   ///< Term seen on the right side

    ParserSession() = default;

    /// Reset to parse a new document
    void reset();

    /// Advance to the next equation and clear per-equation flags
    void resetForNewEquation();

    /// Record a status and the column it refers to
    void setStatus(int status, int position);

    /// Classify the equation currently being assembled
    /// @return ErrorCode value describing what the equation still lacks
    int equationStatus() const;

    /// True if an equation has been started but not completed
    bool isEquationPending() const;
};

} // namespace LinEq
