#include "lineq/LinEqContext.hpp"
#include "lineq/solver/LUSolver.hpp"
#include "lineq/util/ErrorCodes.hpp"

namespace LinEq {

LinEqContext::LinEqContext()
    : system(std::make_unique<EquationSystem>())
    , session(std::make_unique<ParserSession>())
    , io(std::make_unique<LinEqIO>())
    , solver(std::make_unique<LUSolver>())
{
}

LinEqContext::~LinEqContext() = default;

LinEqContext::LinEqContext(LinEqContext&&) noexcept = default;

LinEqContext& LinEqContext::operator=(LinEqContext&&) noexcept = default;

bool LinEqContext::isSuccess() const {
    return ErrorCode::isSuccess(io->INFOLinEq);
}

void LinEqContext::resetDocument() {
    // Keep settings and solver, drop everything parsed so far
    system->clear();
    session->reset();
    io->resetOutput();
}

void LinEqContext::resetAll() {
    system->clear();
    session->reset();
    io->reset();
    solver = std::make_unique<LUSolver>();
}

} // namespace LinEq
