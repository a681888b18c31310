#include "lineq/context/LinEqIO.hpp"
#include "lineq/util/ErrorCodes.hpp"

namespace LinEq {

void LinEqIO::setError(int code, int line, int position) {
    INFOLinEq = code;
    iErrorLine = line;
    iErrorPosition = position;
}

void LinEqIO::resetOutput() {
    INFOLinEq = ErrorCode::kSuccess;
    iErrorLine = 0;
    iErrorPosition = 0;
    nLinesParsed = 0;
    nEquations = 0;
    nVariables = 0;
    dReciprocalCondition = 0.0;
    lSolved = false;

    dSolution.resize(0);
    cVariableNameOut.clear();
}

void LinEqIO::reset() {
    iPrintResultsMode = 1;
    iOutputPrecision = Constants::kDefaultOutputPrecision;
    dSingularThreshold = Constants::kDefaultSingularThreshold;
    dIllConditionedRCond = Constants::kDefaultIllConditionedRCond;
    lVerbose = false;
    cDocumentName.clear();

    resetOutput();
}

} // namespace LinEq
