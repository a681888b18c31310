#pragma once

namespace LinEq {
namespace Constants {

// Number grammar limits
constexpr int kMaximumNumberLength = 20;          // Digits (and characters) per literal
constexpr int kMaximumExponentLength = 2;         // Digits after '^'

// Solver defaults
constexpr double kDefaultSingularThreshold = 1.0e-12;     // Relative pivot threshold (FullPivLU)
constexpr double kDefaultIllConditionedRCond = 1.0e-14;   // Reciprocal condition number floor

// Output defaults
constexpr int kDefaultOutputPrecision = 10;

// Parser states
enum class ParserMode {
    ExpectTerm = 0,
    ExpectOperator
};

} // namespace Constants
} // namespace LinEq
