#pragma once

#include <string>
#include <vector>

#include "Move.h"

namespace KubeAlgebra {

// Puzzle state: which cubie sits in each slot and how it is twisted there.
struct Configuration {
    CornerArray cornerPos;
    CornerArray cornerOri;  // Z3
    EdgeArray edgePos;
    EdgeArray edgeOri;      // Z2

    // Solved configuration
    Configuration();

    // Action of the move on the solved configuration
    static Configuration fromMove(const Move& move);

    // New state = move applied after this one
    Configuration applied(const Move& move) const;

    bool isSolved() const;
    bool operator==(const Configuration& other) const;
    bool operator!=(const Configuration& other) const { return !(*this == other); }

    std::string toString() const;
};

namespace StateModel {

// Folds the tokens onto the identity, each fundamental move composed on the left
Move accumulate(const TokenSequence& tokens);

Configuration apply(const TokenSequence& tokens);
// Throws InvalidTokenError for anything outside the 12-symbol alphabet
Configuration apply(const std::vector<std::string>& symbols);

}

}  // namespace KubeAlgebra
