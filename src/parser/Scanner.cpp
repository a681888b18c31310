#include "lineq/parser/Scanner.hpp"
#include "lineq/util/Constants.hpp"
#include "lineq/util/ErrorCodes.hpp"
#include <cctype>

namespace LinEq {
namespace Scanner {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isVariableChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return (uc < 128 && std::isalpha(uc) != 0) || c == '_';
}

} // namespace

void skipSpaces(const std::string& line, int& position) {
    const int length = static_cast<int>(line.size());
    while (position < length && isSpace(line[position])) {
        ++position;
    }
}

bool scanSign(const std::string& line, int& position, bool& negative) {
    negative = false;
    if (position >= static_cast<int>(line.size())) {
        return false;
    }

    char c = line[position];
    if (c == '+') {
        ++position;
        return true;
    }
    if (c == '-') {
        negative = true;
        ++position;
        return true;
    }
    return false;
}

int scanNumber(const std::string& line, int& position,
               std::string& text, bool& haveNumber) {
    const int length = static_cast<int>(line.size());
    const int start = position;
    int digitCount = 0;
    int decimalPointCount = 0;
    haveNumber = false;

    while (position < length) {
        char c = line[position];
        if (isDigit(c)) {
            text += c;
            ++position;
            if (++digitCount > Constants::kMaximumNumberLength) {
                return ErrorCode::kTooManyDigits;
            }
            haveNumber = true;
        } else if (c == '.') {
            if (++decimalPointCount > 1) {
                return ErrorCode::kMultipleDecimalPoints;
            }
            text += c;
            ++position;
        } else {
            break;
        }
    }

    // Digits plus the decimal point must also fit
    if (position - start > Constants::kMaximumNumberLength) {
        return ErrorCode::kTooManyDigits;
    }

    return ErrorCode::kSuccess;
}

bool scanVariableName(const std::string& line, int& position, std::string& name) {
    const int length = static_cast<int>(line.size());
    bool haveName = false;
    while (position < length && isVariableChar(line[position])) {
        name += line[position];
        ++position;
        haveName = true;
    }
    return haveName;
}

std::string trimRight(const std::string& line) {
    auto end = line.find_last_not_of(" \t\n\r\f\v");
    if (end == std::string::npos) return "";
    return line.substr(0, end + 1);
}

} // namespace Scanner
} // namespace LinEq
