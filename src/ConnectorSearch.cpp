#include "KubeAlgebra/ConnectorSearch.h"
#include "KubeAlgebra/Errors.h"
#include "KubeAlgebra/Generators.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace KubeAlgebra {

namespace {
    void checkSlot(int value, int count, const char* what) {
        if (value < 0 || value >= count) {
            throw InvalidArgumentError(std::string("connector search: ") + what + " " +
                                       std::to_string(value) + " out of range");
        }
    }

    void checkPair(int cubieA, int cubieB, int slotA, int slotB, int count) {
        checkSlot(cubieA, count, "cubie");
        checkSlot(cubieB, count, "cubie");
        checkSlot(slotA, count, "slot");
        checkSlot(slotB, count, "slot");
        if (cubieA == cubieB || slotA == slotB) {
            throw InvalidArgumentError("connector search: cubies and slots must be distinct");
        }
    }
}

ConnectorSearch::ConnectorSearch() : ConnectorSearch(authorizedMoves()) {}

ConnectorSearch::ConnectorSearch(std::vector<Move> moves) : generators(std::move(moves)) {
    if (generators.empty() || generators.size() > std::numeric_limits<uint8_t>::max()) {
        throw InvalidArgumentError("connector search needs between 1 and 255 generators");
    }
    for (const auto& g : generators) {
        if (g.getTokens().empty()) {
            throw InvalidArgumentError("connector search generators need a token word");
        }
        cornerPerms.push_back(g.getCornerPerm());
        edgePerms.push_back(g.getEdgePerm());
        firstTokens.push_back(g.getTokens().front());
        lastTokens.push_back(g.getTokens().back());
    }
}

bool ConnectorSearch::pruned(size_t generator, size_t previous) const {
    const MoveToken& next = firstTokens[generator];
    const MoveToken& last = lastTokens[previous];
    return next.cancels(last) || next == last;
}

template <size_t N>
Move ConnectorSearch::rebuild(const std::vector<Level<N>>& levels, size_t depthIndex,
                              size_t index) const {
    std::vector<uint8_t> path(depthIndex + 1);
    for (size_t d = depthIndex + 1; d-- > 0;) {
        const Candidate<N>& c = levels[d][index];
        path[d] = c.generator;
        index = c.parent;
    }

    Move result;
    for (uint8_t g : path) {
        result = generators[g] * result;
    }
    return result;
}

template <size_t N, typename Matches>
std::optional<Move> ConnectorSearch::deepen(const std::vector<std::array<uint8_t, N>>& generatorPerms,
                                            std::vector<Level<N>>& levels,
                                            const Matches& matches, int maxMoves) {
    stats = SearchStats{};
    if (maxMoves > kMaxSearchMoves) {
        throw InvalidArgumentError("connector search depth " + std::to_string(maxMoves) +
                                   " exceeds " + std::to_string(kMaxSearchMoves));
    }
    if (maxMoves < 1) {
        return std::nullopt;
    }
    if (levels.size() < static_cast<size_t>(maxMoves)) {
        levels.resize(maxMoves);
    }
    for (auto& level : levels) {
        level.clear();
    }

    // Depth 1: the identity, then every generator on its own
    stats.depthReached = 1;
    std::array<uint8_t, N> identity;
    for (size_t i = 0; i < N; ++i) identity[i] = static_cast<uint8_t>(i);
    ++stats.candidatesExamined;
    if (matches(identity)) {
        return Move();
    }

    Level<N>& first = levels[0];
    for (size_t g = 0; g < generatorPerms.size(); ++g) {
        first.push_back(Candidate<N>{generatorPerms[g], 0, static_cast<uint8_t>(g)});
        ++stats.candidatesExamined;
        if (matches(first.back().perm)) {
            return rebuild(levels, 0, first.size() - 1);
        }
    }

    for (int depth = 2; depth <= maxMoves; ++depth) {
        stats.depthReached = depth;
        const Level<N>& prev = levels[depth - 2];
        Level<N>& cur = levels[depth - 1];

        for (size_t g = 0; g < generatorPerms.size(); ++g) {
            const auto& genPerm = generatorPerms[g];
            for (size_t p = 0; p < prev.size(); ++p) {
                const Candidate<N>& parent = prev[p];
                if (pruned(g, parent.generator)) continue;

                // generator applied after the parent word
                Candidate<N> next;
                for (size_t i = 0; i < N; ++i) {
                    next.perm[i] = parent.perm[genPerm[i]];
                }
                next.parent = static_cast<uint32_t>(p);
                next.generator = static_cast<uint8_t>(g);
                cur.push_back(next);

                ++stats.candidatesExamined;
                if (matches(next.perm)) {
                    return rebuild(levels, depth - 1, cur.size() - 1);
                }
            }
        }
    }

    if (verbose) {
        std::cout << "[ConnectorSearch] maximum of " << maxMoves << " moves reached, "
                  << stats.candidatesExamined << " candidates examined\n";
    }
    return std::nullopt;
}

std::optional<Move> ConnectorSearch::connectCorners(int cubieA, int cubieB, int slotA, int slotB,
                                                    Placement placement, int maxMoves) {
    checkPair(cubieA, cubieB, slotA, slotB, kCornerCount);
    const bool eitherOrder = placement == Placement::EitherOrder;
    auto matches = [=](const CornerArray& perm) {
        if (perm[slotA] == cubieA && perm[slotB] == cubieB) return true;
        return eitherOrder && perm[slotA] == cubieB && perm[slotB] == cubieA;
    };
    return deepen(cornerPerms, cornerLevels, matches, maxMoves);
}

std::optional<Move> ConnectorSearch::connectEdges(int cubieA, int cubieB, int slotA, int slotB,
                                                  int maxMoves) {
    checkPair(cubieA, cubieB, slotA, slotB, kEdgeCount);
    auto matches = [=](const EdgeArray& perm) {
        return perm[slotA] == cubieA && perm[slotB] == cubieB;
    };
    return deepen(edgePerms, edgeLevels, matches, maxMoves);
}

std::optional<Move> ConnectorSearch::connectEdgeZone(const std::array<int, 3>& zone, int slotA,
                                                     int slotB, int maxMoves) {
    checkPair(zone[0], zone[1], slotA, slotB, kEdgeCount);
    checkSlot(zone[2], kEdgeCount, "cubie");
    if (zone[2] == zone[0] || zone[2] == zone[1]) {
        throw InvalidArgumentError("connector search: zone cubies must be distinct");
    }
    auto matches = [=](const EdgeArray& perm) {
        if (perm[slotA] != zone[0] || perm[slotB] != zone[1]) return false;
        return std::find(perm.begin() + slotA + 1, perm.end(), zone[2]) != perm.end();
    };
    return deepen(edgePerms, edgeLevels, matches, maxMoves);
}

}  // namespace KubeAlgebra
