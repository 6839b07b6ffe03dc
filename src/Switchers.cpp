#include "KubeAlgebra/Switchers.h"
#include "KubeAlgebra/Generators.h"

namespace KubeAlgebra {

namespace {
    struct Turns {
        Move F, f, R, r, U, u, B, b, L, l, D, d;
    };

    const Turns& turns() {
        static const Turns t = [] {
            auto cw = [](Face face) { return fundamentalMove(MoveToken{face, Direction::Clockwise}); };
            auto ccw = [](Face face) { return fundamentalMove(MoveToken{face, Direction::CounterClockwise}); };
            return Turns{cw(Face::Front), ccw(Face::Front), cw(Face::Right), ccw(Face::Right),
                         cw(Face::Up), ccw(Face::Up), cw(Face::Back), ccw(Face::Back),
                         cw(Face::Left), ccw(Face::Left), cw(Face::Down), ccw(Face::Down)};
        }();
        return t;
    }
}

const Move& cornerSwitcher() {
    static const Move m = [] {
        const Turns& t = turns();
        return (t.F * commutator(t.U, t.L)).power(3);
    }();
    return m;
}

const Move& cornerFlipper() {
    static const Move m = [] {
        const Turns& t = turns();
        return (t.f * t.L).power(3) * (t.F * t.l).power(3);
    }();
    return m;
}

const std::array<EdgeSwitcher, 4>& edgeSwitchers() {
    static const std::array<EdgeSwitcher, 4> switchers = [] {
        const Turns& t = turns();
        return std::array<EdgeSwitcher, 4>{{
            {t.U.power(2) * t.F * t.b * t.L.power(2) * t.f * t.B, {0, 3, 11}},
            {t.B.power(2) * t.R * t.l * t.U.power(2) * t.r * t.L, {5, 6, 7}},
            {t.U.power(2) * t.R * t.l * t.F.power(2) * t.r * t.L, {4, 6, 7}},
            {t.B.power(2) * t.D * t.u * t.R.power(2) * t.d * t.U, {2, 9, 10}},
        }};
    }();
    return switchers;
}

const Move& edgeFlipper() {
    static const Move m = [] {
        const Turns& t = turns();
        return t.b * t.F * t.D * t.b * t.F * t.R * t.b * t.F * t.U * t.U *
               t.f * t.B * t.R * t.f * t.B * t.D * t.f * t.B * t.L * t.L;
    }();
    return m;
}

}  // namespace KubeAlgebra
