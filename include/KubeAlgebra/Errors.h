#pragma once

#include <stdexcept>
#include <string>

namespace KubeAlgebra {

class KubeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Scramble contains a symbol outside the 12 quarter-turn alphabet
class InvalidTokenError : public KubeError {
public:
    explicit InvalidTokenError(const std::string& symbol)
        : KubeError("unknown move symbol '" + symbol + "'"), badSymbol(symbol) {}

    const std::string& symbol() const { return badSymbol; }

private:
    std::string badSymbol;
};

class InvalidArgumentError : public KubeError {
public:
    using KubeError::KubeError;
};

// Raised by the reduction pipeline. Never a user error for a reachable scramble.
class SolveFailedError : public KubeError {
public:
    SolveFailedError(const std::string& phase, const std::string& detail)
        : KubeError(phase + ": " + detail), phaseName(phase) {}

    const std::string& phase() const { return phaseName; }

private:
    std::string phaseName;
};

}  // namespace KubeAlgebra
