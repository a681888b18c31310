/// @file LinEqClass.cpp
/// @brief Implementation of the LinEq class

#include "lineq/LinEqClass.hpp"
#include "lineq/LinEq.hpp"
#include "lineq/interfaces/ISolver.hpp"

namespace LinEq {

LinEqClass::LinEqClass() = default;

LinEqClass::~LinEqClass() = default;

LinEqClass::LinEqClass(LinEqClass&&) noexcept = default;

LinEqClass& LinEqClass::operator=(LinEqClass&&) noexcept = default;

// =========================================================================
// Input
// =========================================================================

int LinEqClass::parseLine(const std::string& line) {
    return LinEq::parseLine(context_, line);
}

int LinEqClass::parseDocument(const std::vector<std::string>& lines) {
    return LinEq::parseDocument(context_, lines);
}

int LinEqClass::parseText(const std::string& text) {
    return LinEq::parseDocument(context_, splitLines(text));
}

int LinEqClass::loadDocument(const std::string& filename) {
    std::vector<std::string> lines;
    int result = LinEq::loadDocument(filename, lines);
    context_.io->cDocumentName = filename;
    if (result != ErrorCode::kSuccess) {
        context_.resetDocument();
        context_.setInfoLinEq(result);
        return result;
    }

    return LinEq::parseDocument(context_, lines);
}

// =========================================================================
// Configuration
// =========================================================================

void LinEqClass::setSolver(std::unique_ptr<ISolver> solver) {
    if (solver) {
        context_.solver = std::move(solver);
    }
}

void LinEqClass::setPrintResultsMode(int mode) {
    LinEq::setPrintResultsMode(context_, mode);
}

void LinEqClass::setOutputPrecision(int precision) {
    LinEq::setOutputPrecision(context_, precision);
}

void LinEqClass::setVerbose(bool enable) {
    LinEq::setVerbose(context_, enable);
}

void LinEqClass::setSingularThreshold(double threshold) {
    LinEq::setSingularThreshold(context_, threshold);
}

void LinEqClass::setIllConditionedThreshold(double rcond) {
    LinEq::setIllConditionedThreshold(context_, rcond);
}

// =========================================================================
// Computation
// =========================================================================

int LinEqClass::solve() {
    // Do not solve past a parse error
    if (!context_.isSuccess()) {
        return context_.infoLinEq();
    }
    return LinEq::solve(context_);
}

// =========================================================================
// Output Retrieval
// =========================================================================

std::pair<double, int> LinEqClass::getSolution(const std::string& variableName) const {
    return LinEq::getSolution(context_, variableName);
}

std::vector<std::string> LinEqClass::getVariableNames() const {
    return context_.system->variableNames();
}

int LinEqClass::getNumberOfEquations() const {
    return context_.io->nEquations;
}

int LinEqClass::getNumberOfVariables() const {
    return context_.system->numberOfVariables();
}

double LinEqClass::getReciprocalCondition() const {
    return context_.io->dReciprocalCondition;
}

std::string LinEqClass::formatSolution() const {
    return LinEq::formatSolution(context_);
}

void LinEqClass::printResults() const {
    LinEq::printResults(context_);
}

// =========================================================================
// Status
// =========================================================================

int LinEqClass::getInfoCode() const {
    return context_.infoLinEq();
}

bool LinEqClass::isSuccess() const {
    return context_.isSuccess();
}

std::string LinEqClass::getErrorMessage() const {
    return LinEq::getErrorMessage(context_);
}

int LinEqClass::getErrorLine() const {
    return context_.io->iErrorLine;
}

int LinEqClass::getErrorPosition() const {
    return context_.io->iErrorPosition;
}

// =========================================================================
// Reset
// =========================================================================

void LinEqClass::reset() {
    context_.resetDocument();
}

void LinEqClass::resetAll() {
    context_.resetAll();
}

} // namespace LinEq
