#pragma once

#include "../context/EquationSystem.hpp"
#include "../context/ParserSession.hpp"
#include <string>

namespace LinEq {

/// Incremental parser for systems of linear equations
/// Each call consumes one line. Terms are numbers, variables or a number
/// followed by a variable; operators are '+', '-' and '='. An equation may
/// continue on the next line after an operator, but a term cannot be split
/// between lines. Numbers have up to 20 digits, one decimal point and an
/// optional power-of-ten exponent after '^' (e.g. 1.5^-2).
class LinearEquationParser {
public:
    /// Parse one line of input
    /// @param line Input line
    /// @param session Parser state carried between lines (updated)
    /// @param system Equations under construction (updated)
    /// @param numberOfEquations Set to the count of completed equations
    ///        whenever this line completes one
    /// @return Error code (0 = success); session.iErrorPosition holds the column
    static int parse(const std::string& line,
                     ParserSession& session,
                     EquationSystem& system,
                     int& numberOfEquations);

    /// Parse one term and add it to the system
    /// @return true if a number and/or a variable was found
    static bool getTerm(const std::string& line, int& position,
                        ParserSession& session, EquationSystem& system);

    /// Parse an operator ('=', '+', '-', or '=' followed by a sign)
    /// @return true if an operator was found
    static bool getOperator(const std::string& line, int& position,
                            ParserSession& session);

private:
    /// Parse the digits after '^' and append them to the number text
    /// @return Error code (0 = success)
    static int getExponent(const std::string& line, int& position,
                           std::string& numberText);
};

} // namespace LinEq
