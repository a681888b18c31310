#pragma once

namespace LinEq {
namespace ErrorCode {

// Success
constexpr int kSuccess = 0;
constexpr int kSuccessNoEquation = 1;

// Equation structure errors (10-19)
constexpr int kIllegalEquation = 10;
constexpr int kNoEqualSign = 11;
constexpr int kMultipleEqualSigns = 12;
constexpr int kNoTermBeforeEqualSign = 13;
constexpr int kNoTermAfterEqualSign = 14;
constexpr int kNoTermEncountered = 15;
constexpr int kNoVariableInEquation = 16;

// Number format errors (20-29)
constexpr int kMultipleDecimalPoints = 20;
constexpr int kTooManyDigits = 21;
constexpr int kMissingExponent = 22;
constexpr int kIllegalExponent = 23;

// System check errors (30-39)
constexpr int kNoEquations = 30;
constexpr int kTooFewEquations = 31;
constexpr int kTooManyEquations = 32;

// Solver errors (40-49)
constexpr int kSingularMatrix = 40;
constexpr int kIllConditioned = 41;

// Document errors (50-59)
constexpr int kDocumentNotFound = 50;

/// True for both success codes (a blank line is not an error)
inline bool isSuccess(int code) {
    return code == kSuccess || code == kSuccessNoEquation;
}

// Get error message string
inline const char* getMessage(int code) {
    switch (code) {
        case kSuccess: return "Success";
        case kSuccessNoEquation: return "Success";
        case kIllegalEquation: return "Illegal equation";
        case kNoEqualSign: return "No equal sign in equation";
        case kMultipleEqualSigns: return "More than one equal sign in equation";
        case kNoTermBeforeEqualSign: return "No term before the equal sign";
        case kNoTermAfterEqualSign: return "No term after the equal sign";
        case kNoTermEncountered: return "Expected a number or a variable";
        case kNoVariableInEquation: return "No variable in equation";
        case kMultipleDecimalPoints: return "More than one decimal point in number";
        case kTooManyDigits: return "Too many digits in number";
        case kMissingExponent: return "Missing exponent after '^'";
        case kIllegalExponent: return "Illegal exponent";
        case kNoEquations: return "No equations to solve";
        case kTooFewEquations: return "Too few equations for the number of variables";
        case kTooManyEquations: return "Too many equations for the number of variables";
        case kSingularMatrix: return "The system of equations is singular";
        case kIllConditioned: return "The system of equations is ill-conditioned";
        case kDocumentNotFound: return "Document not found";
        default: return "Unknown error";
    }
}

} // namespace ErrorCode
} // namespace LinEq
