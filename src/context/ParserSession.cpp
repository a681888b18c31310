#include "lineq/context/ParserSession.hpp"
#include "lineq/util/ErrorCodes.hpp"

namespace LinEq {

void ParserSession::reset() {
    mode = Constants::ParserMode::ExpectTerm;
    iEquation = 0;
    iStartPosition = 0;
    INFO = ErrorCode::kSuccess;
    iErrorPosition = 0;

    lNegativeOperator = false;
    lEqualSign = false;
    lVariableInEquation = false;
    lTermBeforeEqualSign = false;
    lTermAfterEqualSign = false;
}

void ParserSession::resetForNewEquation() {
    mode = Constants::ParserMode::ExpectTerm;
    iStartPosition = 0;

    lNegativeOperator = false;
    lEqualSign = false;
    lVariableInEquation = false;
    lTermBeforeEqualSign = false;
    lTermAfterEqualSign = false;

    ++iEquation;
}

void ParserSession::setStatus(int status, int position) {
    INFO = status;
    iErrorPosition = position;
}

int ParserSession::equationStatus() const {
    if (!lEqualSign && !lTermBeforeEqualSign && !lTermAfterEqualSign && !lVariableInEquation) {
        return ErrorCode::kSuccessNoEquation;
    }
    if (!lEqualSign) {
        return ErrorCode::kNoEqualSign;
    }
    if (!lTermBeforeEqualSign) {
        return ErrorCode::kNoTermBeforeEqualSign;
    }
    if (!lTermAfterEqualSign) {
        return ErrorCode::kNoTermAfterEqualSign;
    }
    if (!lVariableInEquation) {
        return ErrorCode::kNoVariableInEquation;
    }
    return ErrorCode::kSuccess;
}

bool ParserSession::isEquationPending() const {
    return mode == Constants::ParserMode::ExpectOperator
        || lEqualSign || lTermBeforeEqualSign || lTermAfterEqualSign;
}

} // namespace LinEq
