#include "KubeAlgebra/Solver.h"
#include "KubeAlgebra/Errors.h"
#include "KubeAlgebra/Switchers.h"

#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace KubeAlgebra {

namespace {
    constexpr const char* kCornerPositionPhase = "corner position";
    constexpr const char* kCornerOrientationPhase = "corner orientation";
    constexpr const char* kEdgePositionPhase = "edge position";
    constexpr const char* kEdgeOrientationPhase = "edge orientation";

    // Slot j > i currently holding label i
    template <size_t N>
    int findLabel(const std::array<uint8_t, N>& pos, int label, int from) {
        for (int k = from; k < static_cast<int>(N); ++k) {
            if (pos[k] == label) return k;
        }
        return -1;
    }

    Move require(std::optional<Move> connector, const char* phase, int slot) {
        if (!connector) {
            throw SolveFailedError(phase, "connector search exhausted for slot " + std::to_string(slot));
        }
        return std::move(*connector);
    }
}

Solver::Solver(SolverOptions opts) : options(opts) {
    search.setVerbose(options.verbose);
}

Move Solver::placeCorners(Configuration& state) {
    Move result;
    for (int i = 0; i < kCornerCount; ++i) {
        if (state.cornerPos[i] == i) continue;

        int j = findLabel(state.cornerPos, i, i + 1);
        if (j < 0) {
            throw SolveFailedError(kCornerPositionPhase, "corner " + std::to_string(i) + " not found");
        }
        Move g = require(search.connectCorners(1, 3, i, j, Placement::EitherOrder,
                                               options.cornerMaxMoves),
                         kCornerPositionPhase, i);
        Move next = conjugate(cornerSwitcher(), g);
        result = next * result;
        state = state.applied(next);
    }
    return result;
}

Move Solver::orientCorners(Configuration& state) {
    Move result;
    // Slot 0 is the reference corner
    for (int i = 1; i < kCornerCount; ++i) {
        int twist = state.cornerOri[i];
        if (twist == 0) continue;

        Move g = require(search.connectCorners(0, 2, 0, i, Placement::Exact, options.cornerMaxMoves),
                         kCornerOrientationPhase, i);
        Move next = conjugate(cornerFlipper(), g);
        if (twist == 1) {
            next = next.power(2);
        }
        result = next * result;
        state = state.applied(next);
    }
    return result;
}

Move Solver::placeEdges(Configuration& state) {
    Move result;
    edgeSwitchersUsed.clear();
    // The last two slots follow from parity
    for (int i = 0; i < kEdgeCount - 2; ++i) {
        if (state.edgePos[i] == i) continue;

        int j = findLabel(state.edgePos, i, i + 1);
        if (j < 0) {
            throw SolveFailedError(kEdgePositionPhase, "edge " + std::to_string(i) + " not found");
        }

        std::optional<Move> next;
        const auto& switchers = edgeSwitchers();
        for (size_t k = 0; k < switchers.size(); ++k) {
            auto g = search.connectEdgeZone(switchers[k].zone, i, j, options.edgeMaxMoves);
            if (g) {
                next = conjugate(switchers[k].move, *g);
                edgeSwitchersUsed.push_back(static_cast<int>(k));
                break;
            }
        }
        if (!next) {
            throw SolveFailedError(kEdgePositionPhase,
                                   "no edge switcher reaches slots " + std::to_string(i) + ", " +
                                   std::to_string(j));
        }
        result = *next * result;
        state = state.applied(*next);
    }
    return result;
}

Move Solver::orientEdges(Configuration& state) {
    Move result;
    for (int i = 1; i < kEdgeCount; ++i) {
        if (state.edgeOri[i] == 0) continue;

        Move g = require(search.connectEdges(0, 3, 0, i, options.edgeMaxMoves),
                         kEdgeOrientationPhase, i);
        Move next = conjugate(edgeFlipper(), g);
        result = next * result;
        state = state.applied(next);
    }
    return result;
}

Move Solver::solveConfiguration(const Configuration& start) {
    Configuration state = start;

    Move corners = placeCorners(state);
    Move twists = orientCorners(state);
    Move edges = placeEdges(state);
    Move flips = orientEdges(state);

    if (options.verbose) {
        std::cout << "[Solver] " << kCornerPositionPhase << ": " << corners.length() << " moves\n";
        std::cout << "[Solver] " << kCornerOrientationPhase << ": " << twists.length() << " moves\n";
        std::cout << "[Solver] " << kEdgePositionPhase << ": " << edges.length() << " moves\n";
        std::cout << "[Solver] " << kEdgeOrientationPhase << ": " << flips.length() << " moves\n";
    }
    Move result = flips * edges * twists * corners;
    if (!start.applied(result).isSolved()) {
        throw SolveFailedError("verification", "configuration is not reachable from the solved state");
    }
    return result;
}

TokenSequence Solver::solve(const TokenSequence& scramble) {
    Move solution = solveConfiguration(StateModel::apply(scramble));

    TokenSequence replay = scramble;
    replay.insert(replay.end(), solution.getTokens().begin(), solution.getTokens().end());
    if (!StateModel::apply(replay).isSolved()) {
        throw SolveFailedError("verification", "solution does not restore the solved state");
    }

    if (options.verbose) {
        std::cout << "[Solver] solved in " << solution.length() << " moves" << std::endl;
    }
    return solution.getTokens();
}

TokenSequence Solver::solve(const std::vector<std::string>& scrambleSymbols) {
    return solve(parseTokens(scrambleSymbols));
}

TokenSequence solve(const TokenSequence& scramble) {
    Solver solver;
    return solver.solve(scramble);
}

}  // namespace KubeAlgebra
