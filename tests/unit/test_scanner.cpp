#include <gtest/gtest.h>
#include <lineq/parser/Scanner.hpp>
#include <lineq/util/ErrorCodes.hpp>

using namespace LinEq;

TEST(ScannerTest, SkipSpaces) {
    int pos = 0;
    Scanner::skipSpaces("   x", pos);
    EXPECT_EQ(pos, 3);

    pos = 0;
    Scanner::skipSpaces("\t x", pos);
    EXPECT_EQ(pos, 2);

    pos = 0;
    Scanner::skipSpaces("", pos);
    EXPECT_EQ(pos, 0);

    // Stops at the end of an all-blank line
    pos = 1;
    Scanner::skipSpaces("x  ", pos);
    EXPECT_EQ(pos, 3);
}

TEST(ScannerTest, ScanSign) {
    bool negative = true;
    int pos = 0;
    EXPECT_TRUE(Scanner::scanSign("+5", pos, negative));
    EXPECT_FALSE(negative);
    EXPECT_EQ(pos, 1);

    pos = 0;
    EXPECT_TRUE(Scanner::scanSign("-x", pos, negative));
    EXPECT_TRUE(negative);
    EXPECT_EQ(pos, 1);

    pos = 0;
    EXPECT_FALSE(Scanner::scanSign("5", pos, negative));
    EXPECT_FALSE(negative);
    EXPECT_EQ(pos, 0);

    pos = 2;
    EXPECT_FALSE(Scanner::scanSign("x-", pos, negative));
    EXPECT_EQ(pos, 2);
}

TEST(ScannerTest, ScanNumber) {
    std::string text;
    bool haveNumber = false;
    int pos = 0;
    EXPECT_EQ(Scanner::scanNumber("12.5x", pos, text, haveNumber), ErrorCode::kSuccess);
    EXPECT_EQ(text, "12.5");
    EXPECT_TRUE(haveNumber);
    EXPECT_EQ(pos, 4);

    text.clear();
    pos = 0;
    EXPECT_EQ(Scanner::scanNumber(".5", pos, text, haveNumber), ErrorCode::kSuccess);
    EXPECT_EQ(text, ".5");
    EXPECT_TRUE(haveNumber);

    text.clear();
    pos = 0;
    EXPECT_EQ(Scanner::scanNumber("12.", pos, text, haveNumber), ErrorCode::kSuccess);
    EXPECT_EQ(text, "12.");
    EXPECT_TRUE(haveNumber);
    EXPECT_EQ(pos, 3);
}

TEST(ScannerTest, ScanNumberWithoutDigits) {
    std::string text;
    bool haveNumber = true;
    int pos = 0;
    EXPECT_EQ(Scanner::scanNumber("x", pos, text, haveNumber), ErrorCode::kSuccess);
    EXPECT_FALSE(haveNumber);
    EXPECT_TRUE(text.empty());
    EXPECT_EQ(pos, 0);

    // A lone decimal point is consumed but is not a number
    pos = 0;
    EXPECT_EQ(Scanner::scanNumber(".", pos, text, haveNumber), ErrorCode::kSuccess);
    EXPECT_FALSE(haveNumber);
    EXPECT_EQ(pos, 1);
}

TEST(ScannerTest, ScanNumberMultipleDecimalPoints) {
    std::string text;
    bool haveNumber = false;
    int pos = 0;
    EXPECT_EQ(Scanner::scanNumber("1.2.3", pos, text, haveNumber),
              ErrorCode::kMultipleDecimalPoints);
    EXPECT_EQ(pos, 3);
}

TEST(ScannerTest, ScanNumberLength) {
    std::string text;
    bool haveNumber = false;
    int pos = 0;

    // Twenty digits fit
    EXPECT_EQ(Scanner::scanNumber("12345678901234567890", pos, text, haveNumber),
              ErrorCode::kSuccess);
    EXPECT_EQ(pos, 20);

    // The 21st digit is rejected, position just past it
    text.clear();
    pos = 0;
    EXPECT_EQ(Scanner::scanNumber("123456789012345678901", pos, text, haveNumber),
              ErrorCode::kTooManyDigits);
    EXPECT_EQ(pos, 21);

    // The decimal point counts toward the literal length
    text.clear();
    pos = 0;
    EXPECT_EQ(Scanner::scanNumber("1234567890123456789.0", pos, text, haveNumber),
              ErrorCode::kTooManyDigits);
}

TEST(ScannerTest, ScanVariableName) {
    std::string name;
    int pos = 0;
    EXPECT_TRUE(Scanner::scanVariableName("x_1", pos, name));
    EXPECT_EQ(name, "x_");
    EXPECT_EQ(pos, 2);

    name.clear();
    pos = 0;
    EXPECT_TRUE(Scanner::scanVariableName("Abc def", pos, name));
    EXPECT_EQ(name, "Abc");
    EXPECT_EQ(pos, 3);

    name.clear();
    pos = 0;
    EXPECT_FALSE(Scanner::scanVariableName("9x", pos, name));
    EXPECT_TRUE(name.empty());
    EXPECT_EQ(pos, 0);

    // Only ASCII letters
    name.clear();
    pos = 0;
    EXPECT_TRUE(Scanner::scanVariableName("a\xC3\xA9", pos, name));
    EXPECT_EQ(name, "a");
}

TEST(ScannerTest, TrimRight) {
    EXPECT_EQ(Scanner::trimRight("x = 1  \t"), "x = 1");
    EXPECT_EQ(Scanner::trimRight("  x"), "  x");
    EXPECT_EQ(Scanner::trimRight("   "), "");
    EXPECT_EQ(Scanner::trimRight(""), "");
}
