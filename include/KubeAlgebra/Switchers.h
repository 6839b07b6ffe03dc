#pragma once

#include <array>

#include "Move.h"

namespace KubeAlgebra {

// 3-cycle of edges confined to one zone of three slots
struct EdgeSwitcher {
    Move move;
    std::array<int, 3> zone;
};

// Swaps corner slots 1 and 3, touches no other corner
const Move& cornerSwitcher();
// Twists corners 0 and 2 in place, touches no other corner
const Move& cornerFlipper();
// Tried in this order by the edge-position phase
const std::array<EdgeSwitcher, 4>& edgeSwitchers();
// Flips edges 0 and 3, touches nothing else
const Move& edgeFlipper();

}  // namespace KubeAlgebra
