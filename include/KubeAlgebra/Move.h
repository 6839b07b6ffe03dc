#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "MoveToken.h"

namespace KubeAlgebra {

constexpr int kCornerCount = 8;
constexpr int kEdgeCount = 12;

using CornerArray = std::array<uint8_t, kCornerCount>;
using EdgeArray = std::array<uint8_t, kEdgeCount>;

// Element of the cube group, stored as a semidirect product:
//   perm[i]  = slot whose cubie lands in slot i
//   twist[i] = orientation delta (Z3 corners, Z2 edges) of the cubie landing in slot i
// tokens is a quarter-turn word whose replay reproduces the four arrays.
class Move {
public:
    Move();

    static Move identity() { return Move(); }

    // cycle = {a, b, c, d}: cubie in a moves to b, b to c, c to d, d to a.
    // twists[k] is the twist taken by the cubie arriving in cycle[k].
    static Move fromCycles(const std::array<int, 4>& cornerCycle,
                           const std::array<int, 4>& cornerTwists,
                           const std::array<int, 4>& edgeCycle,
                           const std::array<int, 4>& edgeFlips,
                           MoveToken token);

    // Throws InvalidArgumentError unless both perms are bijections and twists are in range.
    static Move fromTables(const CornerArray& cornerPerm, const CornerArray& cornerTwist,
                           const EdgeArray& edgePerm, const EdgeArray& edgeTwist,
                           TokenSequence tokens);

    const CornerArray& getCornerPerm() const { return cornerPerm; }
    const CornerArray& getCornerTwist() const { return cornerTwist; }
    const EdgeArray& getEdgePerm() const { return edgePerm; }
    const EdgeArray& getEdgeTwist() const { return edgeTwist; }
    const TokenSequence& getTokens() const { return tokens; }
    size_t length() const { return tokens.size(); }

    // Apply rhs, then *this
    Move operator*(const Move& rhs) const;
    Move inverse() const;
    // n >= -1. Throws InvalidArgumentError for n < -1.
    Move power(int n) const;

    bool isIdentity() const;
    // Algebraic equality; token words are not compared
    bool operator==(const Move& other) const;
    bool operator!=(const Move& other) const { return !(*this == other); }

    std::string toString() const;

private:
    CornerArray cornerPerm;
    CornerArray cornerTwist;
    EdgeArray edgePerm;
    EdgeArray edgeTwist;
    TokenSequence tokens;
};

Move compose(const Move& a, const Move& b);
Move inverse(const Move& a);
Move power(const Move& a, int n);
// g * a * g^-1: moves the effect of a onto the cubies g brings into a's support
Move conjugate(const Move& a, const Move& g);
// b^-1 * a^-1 * b * a
Move commutator(const Move& a, const Move& b);

std::ostream& operator<<(std::ostream& os, const Move& move);

}  // namespace KubeAlgebra
