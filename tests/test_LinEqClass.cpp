/// @file test_LinEqClass.cpp
/// @brief Tests for the class-based LinEqClass API
/// @details Verifies that LinEqClass matches the free-function API

#include <gtest/gtest.h>
#include "lineq/LinEqClass.hpp"
#include "lineq/LinEq.hpp"
#include "lineq/interfaces/ISolver.hpp"
#include "lineq/context/LinEqIO.hpp"
#include "lineq/util/ErrorCodes.hpp"
#include <cmath>

using namespace LinEq;

/// @brief Solver returning a fixed value for every variable
class FixedSolver : public ISolver {
public:
    explicit FixedSolver(double value) : value_(value) {}

    int solve(const EquationSystem&, int nEquations, LinEqIO& io) override {
        io.dSolution = Eigen::VectorXd::Constant(nEquations, value_);
        io.lSolved = true;
        return ErrorCode::kSuccess;
    }

    const char* getSolverName() const override { return "FixedSolver"; }

private:
    double value_;
};

/// @brief Test fixture for LinEqClass tests
class LinEqClassTest : public ::testing::Test {
protected:
    const std::string twoByTwo = "x + y = 10\nx - y = 2\n";

    /// @brief Compare two doubles with tolerance
    bool approxEqual(double a, double b, double tol = 1e-10) {
        return std::abs(a - b) < tol;
    }
};

/// @brief Test basic construction and destruction
TEST_F(LinEqClassTest, ConstructorDestructor) {
    LinEqClass lineq;
    EXPECT_EQ(lineq.getInfoCode(), 0);
    EXPECT_TRUE(lineq.isSuccess());
    EXPECT_EQ(lineq.getNumberOfEquations(), 0);
}

/// @brief Test move semantics
TEST_F(LinEqClassTest, MoveSemantics) {
    LinEqClass lineq1;
    lineq1.parseText(twoByTwo);

    LinEqClass lineq2(std::move(lineq1));
    EXPECT_EQ(lineq2.getNumberOfEquations(), 2);

    LinEqClass lineq3;
    lineq3 = std::move(lineq2);
    EXPECT_EQ(lineq3.solve(), ErrorCode::kSuccess);
    EXPECT_TRUE(approxEqual(lineq3.getSolution("x").first, 6.0));
}

/// @brief Parse and solve the two-variable system
TEST_F(LinEqClassTest, SolveTwoByTwo) {
    LinEqClass lineq;
    EXPECT_EQ(lineq.parseText(twoByTwo), ErrorCode::kSuccess);
    EXPECT_EQ(lineq.getNumberOfEquations(), 2);
    EXPECT_EQ(lineq.getNumberOfVariables(), 2);

    EXPECT_EQ(lineq.solve(), ErrorCode::kSuccess);

    auto [x, infoX] = lineq.getSolution("x");
    auto [y, infoY] = lineq.getSolution("y");
    EXPECT_EQ(infoX, 0);
    EXPECT_EQ(infoY, 0);
    EXPECT_TRUE(approxEqual(x, 6.0));
    EXPECT_TRUE(approxEqual(y, 4.0));
    EXPECT_GT(lineq.getReciprocalCondition(), 0.0);

    std::vector<std::string> expected = {"x", "y"};
    EXPECT_EQ(lineq.getVariableNames(), expected);
}

/// @brief Line-by-line parsing gives the same result as a whole document
TEST_F(LinEqClassTest, ParseLineMatchesDocument) {
    LinEqClass byLine;
    EXPECT_EQ(byLine.parseLine("x + y = 10"), ErrorCode::kSuccess);
    EXPECT_EQ(byLine.parseLine(""), ErrorCode::kSuccessNoEquation);
    EXPECT_EQ(byLine.parseLine("x - y = 2"), ErrorCode::kSuccess);

    LinEqClass byDocument;
    byDocument.parseDocument({"x + y = 10", "", "x - y = 2"});

    EXPECT_TRUE(byLine.getContext().system->isEquivalent(*byDocument.getContext().system));
}

TEST_F(LinEqClassTest, WindowsLineEndings) {
    LinEqClass lineq;
    EXPECT_EQ(lineq.parseText("x + y = 10\r\nx - y = 2\r\n"), ErrorCode::kSuccess);
    EXPECT_EQ(lineq.getNumberOfEquations(), 2);
}

/// @brief Unknown variables and unsolved systems report -1
TEST_F(LinEqClassTest, GetSolutionNotFound) {
    LinEqClass lineq;
    lineq.parseText(twoByTwo);
    EXPECT_EQ(lineq.getSolution("x").second, -1);

    lineq.solve();
    auto [value, info] = lineq.getSolution("z");
    EXPECT_EQ(info, -1);
    EXPECT_DOUBLE_EQ(value, 0.0);
}

TEST_F(LinEqClassTest, TooFewEquations) {
    LinEqClass lineq;
    lineq.parseText("x + y = 3");
    EXPECT_EQ(lineq.solve(), ErrorCode::kTooFewEquations);
    EXPECT_FALSE(lineq.isSuccess());
    EXPECT_EQ(lineq.getErrorMessage(),
              "Too few equations for the number of variables (1 equations, 2 variables)");
}

TEST_F(LinEqClassTest, NoEquations) {
    LinEqClass lineq;
    lineq.parseText("\n   \n");
    EXPECT_EQ(lineq.solve(), ErrorCode::kNoEquations);
}

TEST_F(LinEqClassTest, SingularSystem) {
    LinEqClass lineq;
    lineq.parseText("x + y = 1\n2x + 2y = 2\n");
    EXPECT_EQ(lineq.solve(), ErrorCode::kSingularMatrix);
    EXPECT_EQ(lineq.formatSolution(), "");
}

/// @brief A parse error is kept and solve() does not run
TEST_F(LinEqClassTest, ParseErrorStopsDocument) {
    LinEqClass lineq;
    EXPECT_EQ(lineq.parseText("x + y = 3\nx = = 1\nx - y = 1\n"),
              ErrorCode::kNoTermEncountered);
    EXPECT_EQ(lineq.getErrorLine(), 2);
    EXPECT_EQ(lineq.getErrorPosition(), 4);
    EXPECT_EQ(lineq.getContext().io->nLinesParsed, 2);

    EXPECT_EQ(lineq.solve(), ErrorCode::kNoTermEncountered);
}

/// @brief Document ends while an equation is still open
TEST_F(LinEqClassTest, UnterminatedEquation) {
    LinEqClass lineq;
    EXPECT_EQ(lineq.parseText("x + y = 2\nx - y +"), ErrorCode::kNoEqualSign);
    EXPECT_EQ(lineq.getErrorLine(), 2);
    EXPECT_EQ(lineq.getErrorPosition(), 7);

    EXPECT_EQ(lineq.parseText("x + y ="), ErrorCode::kNoTermAfterEqualSign);
    EXPECT_EQ(lineq.getErrorLine(), 1);

    EXPECT_EQ(lineq.parseText("x = y +"), ErrorCode::kIllegalEquation);
}

TEST_F(LinEqClassTest, FormatSolution) {
    LinEqClass lineq;
    lineq.parseText(twoByTwo);
    lineq.solve();
    EXPECT_EQ(lineq.formatSolution(), "x = 6\ny = 4\n");

    lineq.parseText("3x = 1");
    lineq.setOutputPrecision(3);
    lineq.solve();
    EXPECT_EQ(lineq.formatSolution(), "x = 0.333\n");
}

/// @brief A custom solver strategy replaces the LU solver
TEST_F(LinEqClassTest, CustomSolver) {
    LinEqClass lineq;
    lineq.setSolver(std::make_unique<FixedSolver>(42.0));
    EXPECT_STREQ(lineq.getContext().solver->getSolverName(), "FixedSolver");

    lineq.parseText(twoByTwo);
    EXPECT_EQ(lineq.solve(), ErrorCode::kSuccess);
    EXPECT_DOUBLE_EQ(lineq.getSolution("y").first, 42.0);

    // A null solver is ignored
    lineq.setSolver(nullptr);
    EXPECT_STREQ(lineq.getContext().solver->getSolverName(), "FixedSolver");

    // Survives a document reset, not a full reset
    lineq.reset();
    EXPECT_STREQ(lineq.getContext().solver->getSolverName(), "FixedSolver");
    lineq.resetAll();
    EXPECT_STREQ(lineq.getContext().solver->getSolverName(), "LUSolver");
}

TEST_F(LinEqClassTest, MissingDocument) {
    LinEqClass lineq;
    EXPECT_EQ(lineq.loadDocument("nonexistent/equations.txt"), ErrorCode::kDocumentNotFound);
    EXPECT_FALSE(lineq.isSuccess());
    EXPECT_EQ(lineq.solve(), ErrorCode::kDocumentNotFound);
    EXPECT_EQ(formatError(lineq.getContext()),
              "nonexistent/equations.txt: Document not found");
}

TEST_F(LinEqClassTest, ResetClearsDocument) {
    LinEqClass lineq;
    lineq.parseText(twoByTwo);
    lineq.solve();

    lineq.reset();
    EXPECT_EQ(lineq.getNumberOfEquations(), 0);
    EXPECT_EQ(lineq.getNumberOfVariables(), 0);
    EXPECT_EQ(lineq.getSolution("x").second, -1);
    EXPECT_TRUE(lineq.isSuccess());
}
