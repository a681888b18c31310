#pragma once

#include <memory>
#include "context/EquationSystem.hpp"
#include "context/ParserSession.hpp"
#include "context/LinEqIO.hpp"

namespace LinEq {

class ISolver;

/// Main context object for one document
/// All parse and solve state is contained within this object.
/// Pass LinEqContext& to all functions; use one context per document.
class LinEqContext {
public:
    /// Equations parsed so far (A, b, variable map)
    std::unique_ptr<EquationSystem> system;

    /// Parser state carried between lines
    std::unique_ptr<ParserSession> session;

    /// Settings and outputs
    std::unique_ptr<LinEqIO> io;

    /// Solver strategy (LUSolver by default)
    std::unique_ptr<ISolver> solver;

    /// Constructor - initializes all state objects
    LinEqContext();

    /// Destructor
    ~LinEqContext();

    /// Move constructor
    LinEqContext(LinEqContext&&) noexcept;

    /// Move assignment
    LinEqContext& operator=(LinEqContext&&) noexcept;

    // Deleted copy operations (context is not copyable)
    LinEqContext(const LinEqContext&) = delete;
    LinEqContext& operator=(const LinEqContext&) = delete;

    /// Get the current error/info code
    int infoLinEq() const { return io->INFOLinEq; }

    /// Set the error/info code
    void setInfoLinEq(int code) { io->INFOLinEq = code; }

    /// Check if the last operation was successful
    bool isSuccess() const;

    /// Reset parse state and equations for a new document (keeps settings)
    void resetDocument();

    /// Full reset including settings
    void resetAll();
};

} // namespace LinEq
