#include "KubeAlgebra/Move.h"
#include "KubeAlgebra/Errors.h"

#include <ostream>
#include <sstream>
#include <utility>

namespace KubeAlgebra {

namespace {
    constexpr int kCornerStates = 3;
    constexpr int kEdgeStates = 2;

    template <size_t N>
    void setIdentity(std::array<uint8_t, N>& perm, std::array<uint8_t, N>& twist) {
        for (size_t i = 0; i < N; ++i) {
            perm[i] = static_cast<uint8_t>(i);
            twist[i] = 0;
        }
    }

    // (a * b)(i) = b(a(i)); twists of b are carried along a's relocation
    template <size_t N>
    void composeParts(const std::array<uint8_t, N>& aPerm, const std::array<uint8_t, N>& aTwist,
                      const std::array<uint8_t, N>& bPerm, const std::array<uint8_t, N>& bTwist,
                      int modulus,
                      std::array<uint8_t, N>& outPerm, std::array<uint8_t, N>& outTwist) {
        for (size_t i = 0; i < N; ++i) {
            outPerm[i] = bPerm[aPerm[i]];
            outTwist[i] = static_cast<uint8_t>((bTwist[aPerm[i]] + aTwist[i]) % modulus);
        }
    }

    template <size_t N>
    void invertParts(const std::array<uint8_t, N>& perm, const std::array<uint8_t, N>& twist,
                     int modulus,
                     std::array<uint8_t, N>& outPerm, std::array<uint8_t, N>& outTwist) {
        for (size_t i = 0; i < N; ++i) {
            outPerm[perm[i]] = static_cast<uint8_t>(i);
        }
        for (size_t i = 0; i < N; ++i) {
            outTwist[i] = static_cast<uint8_t>((modulus - twist[outPerm[i]]) % modulus);
        }
    }

    template <size_t N>
    void checkTables(const std::array<uint8_t, N>& perm, const std::array<uint8_t, N>& twist,
                     int modulus, const char* what) {
        std::array<bool, N> seen{};
        for (size_t i = 0; i < N; ++i) {
            if (perm[i] >= N || seen[perm[i]]) {
                throw InvalidArgumentError(std::string(what) + " permutation is not a bijection");
            }
            seen[perm[i]] = true;
            if (twist[i] >= modulus) {
                throw InvalidArgumentError(std::string(what) + " twist out of range at slot " +
                                           std::to_string(i));
            }
        }
    }

    template <size_t N>
    void applyCycle(const std::array<int, 4>& cycle, const std::array<int, 4>& twists, int modulus,
                    std::array<uint8_t, N>& perm, std::array<uint8_t, N>& twist, const char* what) {
        for (int k = 0; k < 4; ++k) {
            if (cycle[k] < 0 || cycle[k] >= static_cast<int>(N)) {
                throw InvalidArgumentError(std::string(what) + " cycle slot out of range");
            }
        }
        for (int k = 0; k < 4; ++k) {
            perm[cycle[(k + 1) % 4]] = static_cast<uint8_t>(cycle[k]);
            int t = ((twists[k] % modulus) + modulus) % modulus;
            twist[cycle[k]] = static_cast<uint8_t>((modulus - t) % modulus);
        }
        checkTables(perm, twist, modulus, what);
    }

    template <size_t N>
    void printArray(std::ostream& os, const std::array<uint8_t, N>& values) {
        os << '[';
        for (size_t i = 0; i < N; ++i) {
            if (i > 0) os << ", ";
            os << static_cast<int>(values[i]);
        }
        os << ']';
    }
}

Move::Move() {
    setIdentity(cornerPerm, cornerTwist);
    setIdentity(edgePerm, edgeTwist);
}

Move Move::fromCycles(const std::array<int, 4>& cornerCycle,
                      const std::array<int, 4>& cornerTwists,
                      const std::array<int, 4>& edgeCycle,
                      const std::array<int, 4>& edgeFlips,
                      MoveToken token) {
    Move m;
    applyCycle(cornerCycle, cornerTwists, kCornerStates, m.cornerPerm, m.cornerTwist, "corner");
    applyCycle(edgeCycle, edgeFlips, kEdgeStates, m.edgePerm, m.edgeTwist, "edge");
    m.tokens.push_back(token);
    return m;
}

Move Move::fromTables(const CornerArray& cornerPerm, const CornerArray& cornerTwist,
                      const EdgeArray& edgePerm, const EdgeArray& edgeTwist,
                      TokenSequence tokens) {
    checkTables(cornerPerm, cornerTwist, kCornerStates, "corner");
    checkTables(edgePerm, edgeTwist, kEdgeStates, "edge");
    Move m;
    m.cornerPerm = cornerPerm;
    m.cornerTwist = cornerTwist;
    m.edgePerm = edgePerm;
    m.edgeTwist = edgeTwist;
    m.tokens = std::move(tokens);
    return m;
}

Move Move::operator*(const Move& rhs) const {
    Move out;
    composeParts(cornerPerm, cornerTwist, rhs.cornerPerm, rhs.cornerTwist, kCornerStates,
                 out.cornerPerm, out.cornerTwist);
    composeParts(edgePerm, edgeTwist, rhs.edgePerm, rhs.edgeTwist, kEdgeStates,
                 out.edgePerm, out.edgeTwist);
    out.tokens.reserve(rhs.tokens.size() + tokens.size());
    out.tokens.insert(out.tokens.end(), rhs.tokens.begin(), rhs.tokens.end());
    out.tokens.insert(out.tokens.end(), tokens.begin(), tokens.end());
    return out;
}

Move Move::inverse() const {
    Move out;
    invertParts(cornerPerm, cornerTwist, kCornerStates, out.cornerPerm, out.cornerTwist);
    invertParts(edgePerm, edgeTwist, kEdgeStates, out.edgePerm, out.edgeTwist);
    out.tokens = invertTokens(tokens);
    return out;
}

Move Move::power(int n) const {
    if (n < -1) {
        throw InvalidArgumentError("move power must be >= -1, got " + std::to_string(n));
    }
    if (n == 0) return Move();
    if (n == -1) return inverse();

    Move result = *this;
    for (int k = 1; k < n; ++k) {
        result = result * *this;
    }
    return result;
}

bool Move::isIdentity() const {
    return *this == Move();
}

bool Move::operator==(const Move& other) const {
    return cornerPerm == other.cornerPerm && cornerTwist == other.cornerTwist &&
           edgePerm == other.edgePerm && edgeTwist == other.edgeTwist;
}

std::string Move::toString() const {
    std::ostringstream os;
    printArray(os, cornerPerm);
    os << '\n';
    printArray(os, edgePerm);
    os << '\n';
    printArray(os, cornerTwist);
    os << '\n';
    printArray(os, edgeTwist);
    return os.str();
}

Move compose(const Move& a, const Move& b) {
    return a * b;
}

Move inverse(const Move& a) {
    return a.inverse();
}

Move power(const Move& a, int n) {
    return a.power(n);
}

Move conjugate(const Move& a, const Move& g) {
    return compose(compose(g, a), inverse(g));
}

Move commutator(const Move& a, const Move& b) {
    return compose(compose(inverse(b), inverse(a)), compose(b, a));
}

std::ostream& operator<<(std::ostream& os, const Move& move) {
    return os << move.toString();
}

}  // namespace KubeAlgebra
