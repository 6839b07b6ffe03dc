#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "Move.h"

namespace KubeAlgebra {

enum class Placement {
    Exact,        // cubieA -> slotA and cubieB -> slotB
    EitherOrder   // the two cubies may land in either slot
};

struct SearchStats {
    int depthReached = 0;
    size_t candidatesExamined = 0;
};

// Iterative-deepening search for a short word over a generating set that
// brings given cubies into given slots. A move G places cubie c into slot s
// when G.perm[s] == c. No face is turned twice in a row.
//
// Candidate buffers are kept between queries, so one instance must not be
// shared between threads.
class ConnectorSearch {
public:
    static constexpr int kDefaultCornerMaxMoves = 5;
    static constexpr int kDefaultEdgeMaxMoves = 3;
    // Levels are kept in memory, roughly 18 * 15^(d-1) candidates at depth d
    static constexpr int kMaxSearchMoves = 6;

    // Quarter and half turns
    ConnectorSearch();
    // Every generator needs a non-empty token word
    explicit ConnectorSearch(std::vector<Move> generators);

    // Empty result when nothing within maxMoves qualifies.
    // maxMoves above kMaxSearchMoves throws InvalidArgumentError.
    std::optional<Move> connectCorners(int cubieA, int cubieB, int slotA, int slotB,
                                       Placement placement,
                                       int maxMoves = kDefaultCornerMaxMoves);
    std::optional<Move> connectEdges(int cubieA, int cubieB, int slotA, int slotB,
                                     int maxMoves = kDefaultEdgeMaxMoves);
    // zone[0] -> slotA, zone[1] -> slotB, zone[2] into any slot after slotA
    std::optional<Move> connectEdgeZone(const std::array<int, 3>& zone, int slotA, int slotB,
                                        int maxMoves = kDefaultEdgeMaxMoves);

    const SearchStats& lastStats() const { return stats; }
    // Report exhausted queries on std::cout
    void setVerbose(bool enabled) { verbose = enabled; }
    const std::vector<Move>& getGenerators() const { return generators; }

private:
    template <size_t N>
    struct Candidate {
        std::array<uint8_t, N> perm;
        uint32_t parent;
        uint8_t generator;
    };

    template <size_t N>
    using Level = std::vector<Candidate<N>>;

    template <size_t N, typename Matches>
    std::optional<Move> deepen(const std::vector<std::array<uint8_t, N>>& generatorPerms,
                               std::vector<Level<N>>& levels,
                               const Matches& matches, int maxMoves);

    template <size_t N>
    Move rebuild(const std::vector<Level<N>>& levels, size_t depthIndex, size_t index) const;

    bool pruned(size_t generator, size_t previous) const;

    std::vector<Move> generators;
    std::vector<CornerArray> cornerPerms;
    std::vector<EdgeArray> edgePerms;
    std::vector<MoveToken> firstTokens;
    std::vector<MoveToken> lastTokens;

    std::vector<Level<kCornerCount>> cornerLevels;
    std::vector<Level<kEdgeCount>> edgeLevels;
    SearchStats stats;
    bool verbose = false;
};

}  // namespace KubeAlgebra
