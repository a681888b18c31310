#pragma once

#include "LinEqContext.hpp"
#include "util/Constants.hpp"
#include "util/ErrorCodes.hpp"

#include <string>
#include <vector>

namespace LinEq {

// ============================================================================
// Parser Functions
// ============================================================================

/// Parse one line of the document
/// Lines are counted, so the error line reported in io is 1-based
/// @return Error code (0 = success, 1 = blank line)
int parseLine(LinEqContext& ctx, const std::string& line);

/// Reset the context and parse a whole document
/// Stops at the first line that reports an error. An equation left open
/// by the last line is reported with ParserSession::equationStatus().
/// @return Error code (0 = success)
int parseDocument(LinEqContext& ctx, const std::vector<std::string>& lines);

/// Split text into lines (handles \n and \r\n)
std::vector<std::string> splitLines(const std::string& text);

/// Read a document file into lines
/// @return Error code (0 = success, kDocumentNotFound)
int loadDocument(const std::string& filename, std::vector<std::string>& lines);

// ============================================================================
// Solver Functions
// ============================================================================

/// Check that the parsed system is square
/// @return Error code (0 = success, kNoEquations, kTooFewEquations, kTooManyEquations)
int checkSystem(LinEqContext& ctx);

/// Run the configured solver on the parsed system
/// @return Error code (0 = success)
int solve(LinEqContext& ctx);

/// Parse, check and solve a document
/// @return Error code (0 = success)
int solveDocument(LinEqContext& ctx, const std::vector<std::string>& lines);

// ============================================================================
// Configuration Functions
// ============================================================================

/// Set print results mode (0=none, 1=solution, 2=detailed)
void setPrintResultsMode(LinEqContext& ctx, int mode);

/// Set number of significant digits in printed solutions
void setOutputPrecision(LinEqContext& ctx, int precision);

/// Enable/disable diagnostic output on stderr
void setVerbose(LinEqContext& ctx, bool enable);

/// Set the relative pivot threshold below which the system is singular
void setSingularThreshold(LinEqContext& ctx, double threshold);

/// Set the reciprocal condition number below which the system is ill-conditioned
void setIllConditionedThreshold(LinEqContext& ctx, double rcond);

// ============================================================================
// Output Functions
// ============================================================================

/// Get the solved value of a variable
/// @return Pair of (value, error code); code is nonzero if the variable
///         is unknown or the system has not been solved
std::pair<double, int> getSolution(const LinEqContext& ctx, const std::string& variableName);

/// Format the solution as "name = value" lines, in variable index order
std::string formatSolution(const LinEqContext& ctx);

/// Message for the current status; equation/variable counts are appended
/// for kTooFewEquations and kTooManyEquations
std::string getErrorMessage(const LinEqContext& ctx);

/// Format the current error as "line L, column C: message"
/// (1-based column; the location is omitted when no line is recorded)
std::string formatError(const LinEqContext& ctx);

/// Print the results according to the print mode
void printResults(const LinEqContext& ctx);

} // namespace LinEq
