#include "KubeAlgebra/Configuration.h"
#include "KubeAlgebra/Generators.h"

#include <sstream>

namespace KubeAlgebra {

namespace {
    template <size_t N>
    void relabel(const std::array<uint8_t, N>& pos, const std::array<uint8_t, N>& ori,
                 const std::array<uint8_t, N>& perm, const std::array<uint8_t, N>& twist,
                 int modulus,
                 std::array<uint8_t, N>& outPos, std::array<uint8_t, N>& outOri) {
        for (size_t i = 0; i < N; ++i) {
            outPos[i] = pos[perm[i]];
            outOri[i] = static_cast<uint8_t>((ori[perm[i]] + twist[i]) % modulus);
        }
    }

    template <size_t N>
    void printRow(std::ostringstream& os, const char* label, const std::array<uint8_t, N>& values) {
        os << "  " << label << ": ";
        for (auto v : values) os << static_cast<int>(v) << " ";
        os << "\n";
    }
}

Configuration::Configuration() {
    for (int i = 0; i < kCornerCount; ++i) {
        cornerPos[i] = static_cast<uint8_t>(i);
        cornerOri[i] = 0;
    }
    for (int i = 0; i < kEdgeCount; ++i) {
        edgePos[i] = static_cast<uint8_t>(i);
        edgeOri[i] = 0;
    }
}

Configuration Configuration::fromMove(const Move& move) {
    Configuration c;
    c.cornerPos = move.getCornerPerm();
    c.cornerOri = move.getCornerTwist();
    c.edgePos = move.getEdgePerm();
    c.edgeOri = move.getEdgeTwist();
    return c;
}

Configuration Configuration::applied(const Move& move) const {
    Configuration next;
    relabel(cornerPos, cornerOri, move.getCornerPerm(), move.getCornerTwist(), 3,
            next.cornerPos, next.cornerOri);
    relabel(edgePos, edgeOri, move.getEdgePerm(), move.getEdgeTwist(), 2,
            next.edgePos, next.edgeOri);
    return next;
}

bool Configuration::isSolved() const {
    return *this == Configuration();
}

bool Configuration::operator==(const Configuration& other) const {
    return cornerPos == other.cornerPos && cornerOri == other.cornerOri &&
           edgePos == other.edgePos && edgeOri == other.edgeOri;
}

std::string Configuration::toString() const {
    std::ostringstream os;
    printRow(os, "cPos", cornerPos);
    printRow(os, "cOri", cornerOri);
    printRow(os, "ePos", edgePos);
    printRow(os, "eOri", edgeOri);
    return os.str();
}

namespace StateModel {

Move accumulate(const TokenSequence& tokens) {
    Move m;
    for (const auto& token : tokens) {
        m = fundamentalMove(token) * m;
    }
    return m;
}

Configuration apply(const TokenSequence& tokens) {
    return Configuration::fromMove(accumulate(tokens));
}

Configuration apply(const std::vector<std::string>& symbols) {
    return apply(parseTokens(symbols));
}

}

}  // namespace KubeAlgebra
