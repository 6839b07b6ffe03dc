#pragma once

#include <array>
#include <vector>

#include "Move.h"

namespace KubeAlgebra {

// The 12 quarter turns, indexed by MoveToken::index(). Built once, read-only.
const std::array<Move, kTokenCount>& fundamentalMoves();
const Move& fundamentalMove(MoveToken token);

// Quarter and half turns: F F2 f R R2 r U U2 u B B2 b L L2 l D D2 d
const std::vector<Move>& authorizedMoves();

}  // namespace KubeAlgebra
