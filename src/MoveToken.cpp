#include "KubeAlgebra/MoveToken.h"
#include "KubeAlgebra/Errors.h"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace KubeAlgebra {

namespace {
    constexpr char kFaceSymbols[kFaceCount] = {'F', 'R', 'U', 'B', 'L', 'D'};
    constexpr const char* kFaceNames[kFaceCount] = {"Front", "Right", "Up", "Back", "Left", "Down"};

    bool isSeparator(char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == ',';
    }
}

MoveToken MoveToken::inverse() const {
    Direction flipped = direction == Direction::Clockwise ? Direction::CounterClockwise
                                                          : Direction::Clockwise;
    return MoveToken{face, flipped};
}

bool MoveToken::cancels(const MoveToken& other) const {
    return face == other.face && direction != other.direction;
}

int MoveToken::index() const {
    return static_cast<int>(face) * 2 + static_cast<int>(direction);
}

char MoveToken::symbol() const {
    char upper = kFaceSymbols[static_cast<int>(face)];
    if (direction == Direction::Clockwise) return upper;
    return static_cast<char>(std::tolower(static_cast<unsigned char>(upper)));
}

MoveToken MoveToken::fromIndex(int index) {
    if (index < 0 || index >= kTokenCount) {
        throw InvalidArgumentError("move token index out of range: " + std::to_string(index));
    }
    return MoveToken{static_cast<Face>(index / 2), static_cast<Direction>(index % 2)};
}

std::optional<MoveToken> MoveToken::fromSymbol(char symbol) {
    for (int f = 0; f < kFaceCount; ++f) {
        if (symbol == kFaceSymbols[f]) {
            return MoveToken{static_cast<Face>(f), Direction::Clockwise};
        }
        if (symbol == std::tolower(static_cast<unsigned char>(kFaceSymbols[f]))) {
            return MoveToken{static_cast<Face>(f), Direction::CounterClockwise};
        }
    }
    return std::nullopt;
}

const char* faceName(Face face) {
    return kFaceNames[static_cast<int>(face)];
}

TokenSequence parseTokens(const std::string& text) {
    TokenSequence tokens;
    tokens.reserve(text.size());
    for (char c : text) {
        if (isSeparator(c)) continue;
        auto token = MoveToken::fromSymbol(c);
        if (!token) {
            throw InvalidTokenError(std::string(1, c));
        }
        tokens.push_back(*token);
    }
    return tokens;
}

TokenSequence parseTokens(const std::vector<std::string>& symbols) {
    TokenSequence tokens;
    tokens.reserve(symbols.size());
    for (const auto& s : symbols) {
        if (s.size() != 1) {
            throw InvalidTokenError(s);
        }
        auto token = MoveToken::fromSymbol(s[0]);
        if (!token) {
            throw InvalidTokenError(s);
        }
        tokens.push_back(*token);
    }
    return tokens;
}

std::string formatTokens(const TokenSequence& tokens, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += separator;
        out += tokens[i].symbol();
    }
    return out;
}

TokenSequence invertTokens(const TokenSequence& tokens) {
    TokenSequence out;
    out.reserve(tokens.size());
    std::transform(tokens.rbegin(), tokens.rend(), std::back_inserter(out),
                   [](const MoveToken& t) { return t.inverse(); });
    return out;
}

}  // namespace KubeAlgebra
