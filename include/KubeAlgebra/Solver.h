#pragma once

#include <string>
#include <vector>

#include "Configuration.h"
#include "ConnectorSearch.h"
#include "Move.h"

namespace KubeAlgebra {

struct SolverOptions {
    int cornerMaxMoves = ConnectorSearch::kDefaultCornerMaxMoves;
    int edgeMaxMoves = ConnectorSearch::kDefaultEdgeMaxMoves;
    bool verbose = false;  // phase summaries on std::cout
};

// Four-phase reduction: corner positions, corner twists, edge positions, edge flips.
// Each phase conjugates a switcher/flipper by a connecting move per defect.
class Solver {
public:
    explicit Solver(SolverOptions options = {});

    // Returns quarter turns that, replayed after the scramble, give the solved state.
    // Throws InvalidTokenError / SolveFailedError; never returns an unverified answer.
    TokenSequence solve(const TokenSequence& scramble);
    TokenSequence solve(const std::vector<std::string>& scrambleSymbols);

    // phase4 * phase3 * phase2 * phase1 for the given state.
    // Throws SolveFailedError("verification", ...) when the result leaves start unsolved,
    // which happens for configurations no scramble can produce.
    Move solveConfiguration(const Configuration& start);

    // Single phases. Each replaces state by (phase move) applied to it.
    Move placeCorners(Configuration& state);
    Move orientCorners(Configuration& state);
    Move placeEdges(Configuration& state);
    Move orientEdges(Configuration& state);

    const SolverOptions& getOptions() const { return options; }
    // Index into edgeSwitchers() for each step of the last placeEdges call
    const std::vector<int>& getEdgeSwitchersUsed() const { return edgeSwitchersUsed; }

private:
    SolverOptions options;
    ConnectorSearch search;
    std::vector<int> edgeSwitchersUsed;
};

// One-shot solve with default options
TokenSequence solve(const TokenSequence& scramble);

}  // namespace KubeAlgebra
