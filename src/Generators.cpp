#include "KubeAlgebra/Generators.h"

namespace KubeAlgebra {

namespace {
    struct FaceTable {
        Face face;
        std::array<int, 4> cornerCycle;
        std::array<int, 4> cornerTwists;
        std::array<int, 4> edgeCycle;
        std::array<int, 4> edgeFlips;
    };

    // Corner slot bits: 4 = right, 2 = up, 1 = back.
    // Edges: 0 LD, 1 FL, 2 LB, 3 LU, 4 FD, 5 BD, 6 FU, 7 UB, 8 RD, 9 FR, 10 RB, 11 RU.
    constexpr std::array<FaceTable, kFaceCount> kClockwiseTables = {{
        {Face::Front, {0, 2, 6, 4}, {1, 2, 1, 2}, {4, 1, 6, 9}, {1, 1, 1, 1}},
        {Face::Right, {4, 6, 7, 5}, {1, 2, 1, 2}, {8, 9, 11, 10}, {0, 0, 0, 0}},
        {Face::Up, {6, 2, 3, 7}, {0, 0, 0, 0}, {6, 3, 7, 11}, {0, 0, 0, 0}},
        {Face::Back, {1, 5, 7, 3}, {2, 1, 2, 1}, {7, 2, 5, 10}, {1, 1, 1, 1}},
        {Face::Left, {0, 1, 3, 2}, {2, 1, 2, 1}, {0, 2, 3, 1}, {0, 0, 0, 0}},
        {Face::Down, {0, 4, 5, 1}, {0, 0, 0, 0}, {0, 4, 8, 5}, {0, 0, 0, 0}},
    }};

    std::array<Move, kTokenCount> buildFundamentals() {
        std::array<Move, kTokenCount> moves;
        for (const auto& table : kClockwiseTables) {
            MoveToken cw{table.face, Direction::Clockwise};
            Move turn = Move::fromCycles(table.cornerCycle, table.cornerTwists,
                                         table.edgeCycle, table.edgeFlips, cw);
            moves[cw.index()] = turn;
            moves[cw.inverse().index()] = turn.inverse();
        }
        return moves;
    }

    std::vector<Move> buildAuthorized() {
        const auto& fundamentals = fundamentalMoves();
        std::vector<Move> moves;
        moves.reserve(kFaceCount * 3);
        for (const auto& table : kClockwiseTables) {
            const Move& cw = fundamentals[MoveToken{table.face, Direction::Clockwise}.index()];
            const Move& ccw = fundamentals[MoveToken{table.face, Direction::CounterClockwise}.index()];
            moves.push_back(cw);
            moves.push_back(cw.power(2));
            moves.push_back(ccw);
        }
        return moves;
    }
}

const std::array<Move, kTokenCount>& fundamentalMoves() {
    static const std::array<Move, kTokenCount> moves = buildFundamentals();
    return moves;
}

const Move& fundamentalMove(MoveToken token) {
    return fundamentalMoves()[token.index()];
}

const std::vector<Move>& authorizedMoves() {
    static const std::vector<Move> moves = buildAuthorized();
    return moves;
}

}  // namespace KubeAlgebra
