#include "lineq/parser/LinearEquationParser.hpp"
#include "lineq/parser/Scanner.hpp"
#include "lineq/util/Constants.hpp"
#include "lineq/util/ErrorCodes.hpp"
#include <cctype>
#include <locale>
#include <sstream>
#include <string>

namespace LinEq {

using Constants::ParserMode;

namespace {

/// Convert number text independently of the global C locale
double toDouble(const std::string& text) {
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    iss >> value;
    return value;
}

} // namespace

int LinearEquationParser::parse(const std::string& inputLine,
                                ParserSession& session,
                                EquationSystem& system,
                                int& numberOfEquations) {
    const std::string line = Scanner::trimRight(inputLine);
    const int length = static_cast<int>(line.size());

    int position = 0;
    session.setStatus(ErrorCode::kSuccess, position);

    // Blank line: nothing to add, an open equation stays open
    if (length == 0) {
        session.setStatus(ErrorCode::kSuccessNoEquation, position);
        return session.INFO;
    }

    Scanner::skipSpaces(line, position);

    // If the first token of the line is not accepted here, the previous
    // line most likely did not end the equation properly
    session.iStartPosition = position;

    // Term:
    //   <Space> <Sign> Number <Space>
    //   <Space> <Sign> Variable <Space>
    //   <Space> <Sign> Number Variable <Space>
    //
    // Operator:
    //   <Space> Plus <Space>
    //   <Space> Minus <Space>
    //   <Space> Equals <Space>
    //   <Space> Equals Plus|Minus <Space>
    bool operatorFoundLast = false;
    while (position < length) {
        if (session.mode == ParserMode::ExpectTerm) {
            Scanner::skipSpaces(line, position);
            if (position >= length) {
                break;
            }

            if (getTerm(line, position, session, system)) {
                session.mode = ParserMode::ExpectOperator;
                operatorFoundLast = false;
            } else {
                if (session.INFO == ErrorCode::kSuccess) {
                    session.setStatus(ErrorCode::kIllegalEquation, position);
                }
                break;
            }
        } else {
            Scanner::skipSpaces(line, position);
            if (position >= length) {
                break;
            }

            if (getOperator(line, position, session)) {
                session.mode = ParserMode::ExpectTerm;
                operatorFoundLast = true;
            } else {
                // A failed operator scan only reports an error of its own;
                // two adjacent terms leave the status untouched
                if (session.INFO != ErrorCode::kSuccess
                    && position == session.iStartPosition) {
                    session.setStatus(ErrorCode::kIllegalEquation, position);
                }
                break;
            }
        }
    }

    // The equation is complete when the line ends on a term. A line that
    // ends on an operator continues on the next line.
    if (position >= length && position > 0 && !operatorFoundLast
        && session.INFO == ErrorCode::kSuccess) {
        session.resetForNewEquation();
        numberOfEquations = session.iEquation;
    }

    return session.INFO;
}

bool LinearEquationParser::getTerm(const std::string& line, int& position,
                                   ParserSession& session, EquationSystem& system) {
    const int length = static_cast<int>(line.size());

    bool negativeTerm = false;
    Scanner::scanSign(line, position, negativeTerm);
    Scanner::skipSpaces(line, position);

    std::string numberText;
    bool haveNumber = false;
    int status = Scanner::scanNumber(line, position, numberText, haveNumber);
    if (status != ErrorCode::kSuccess) {
        session.setStatus(status, position);
        return false;
    }

    // Power of ten, e.g. 1.5^-2
    if (haveNumber && position < length && line[position] == '^') {
        ++position;
        status = getExponent(line, position, numberText);
        if (status != ErrorCode::kSuccess) {
            session.setStatus(status, position);
            return false;
        }
    }

    Scanner::skipSpaces(line, position);

    std::string variableName;
    bool haveVariable = Scanner::scanVariableName(line, position, variableName);

    // Terms after the equal sign move to the left side
    bool negative = session.lEqualSign ^ session.lNegativeOperator ^ negativeTerm;

    double value = haveNumber ? toDouble(numberText) : 1.0;
    if (negative) {
        value = -value;
    }

    if (haveVariable) {
        session.lVariableInEquation = true;
        int variableIndex = system.variableIndex(variableName);
        system.addCoefficient(session.iEquation, variableIndex, value);
    } else if (haveNumber) {
        // Constants move to the right side
        system.addConstant(session.iEquation, -value);
    } else {
        session.setStatus(ErrorCode::kNoTermEncountered, position);
        return false;
    }

    if (session.lEqualSign) {
        session.lTermAfterEqualSign = true;
    } else {
        session.lTermBeforeEqualSign = true;
    }

    Scanner::skipSpaces(line, position);
    return true;
}

bool LinearEquationParser::getOperator(const std::string& line, int& position,
                                       ParserSession& session) {
    Scanner::skipSpaces(line, position);

    session.lNegativeOperator = false;
    bool haveEqualSign = false;
    if (position < static_cast<int>(line.size()) && line[position] == '=') {
        if (session.lEqualSign) {
            session.setStatus(ErrorCode::kMultipleEqualSigns, position);
            return false;
        }
        session.lEqualSign = true;
        haveEqualSign = true;
        ++position;
    }

    bool haveSign = Scanner::scanSign(line, position, session.lNegativeOperator);
    return haveSign || haveEqualSign;
}

int LinearEquationParser::getExponent(const std::string& line, int& position,
                                      std::string& numberText) {
    bool negativeExponent = false;
    Scanner::scanSign(line, position, negativeExponent);

    std::string exponentText;
    bool haveExponent = false;
    // Too many digits or decimal points make the exponent illegal
    if (Scanner::scanNumber(line, position, exponentText, haveExponent) != ErrorCode::kSuccess) {
        return ErrorCode::kIllegalExponent;
    }
    if (!haveExponent) {
        return ErrorCode::kMissingExponent;
    }

    if (static_cast<int>(exponentText.size()) > Constants::kMaximumExponentLength) {
        return ErrorCode::kIllegalExponent;
    }
    for (char c : exponentText) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return ErrorCode::kIllegalExponent;
        }
    }

    numberText += 'E';
    if (negativeExponent) {
        numberText += '-';
    }
    numberText += exponentText;
    return ErrorCode::kSuccess;
}

} // namespace LinEq
