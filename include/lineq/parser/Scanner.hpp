#pragma once

#include <string>

namespace LinEq {
namespace Scanner {

/// Advance position past whitespace
void skipSpaces(const std::string& line, int& position);

/// Recognize an optional '+' or '-'
/// @param negative Set to true if and only if a '-' was read
/// @return true if a sign character was consumed
bool scanSign(const std::string& line, int& position, bool& negative);

/// Recognize a numeric literal made of digits and at most one decimal point
/// @param text Receives the literal text
/// @param haveNumber Set to true if at least one digit was read
/// @return Error code (0 = success, kTooManyDigits, kMultipleDecimalPoints);
///         on error position is the column of the error
int scanNumber(const std::string& line, int& position,
               std::string& text, bool& haveNumber);

/// Recognize a variable name made of ASCII letters and '_'
/// @return true if at least one character was read
bool scanVariableName(const std::string& line, int& position, std::string& name);

/// Copy of line without trailing whitespace
std::string trimRight(const std::string& line);

} // namespace Scanner
} // namespace LinEq
