#pragma once

#include <optional>
#include <string>
#include <vector>

namespace KubeAlgebra {

// Face order matches the generator tables: Front, Right, Up, Back, Left, Down
enum class Face : int { Front, Right, Up, Back, Left, Down };

enum class Direction : int { Clockwise, CounterClockwise };

constexpr int kFaceCount = 6;
constexpr int kTokenCount = 12;

// One quarter turn. Symbols: uppercase = clockwise, lowercase = counter-clockwise.
struct MoveToken {
    Face face{Face::Front};
    Direction direction{Direction::Clockwise};

    MoveToken inverse() const;
    bool cancels(const MoveToken& other) const;
    bool sameFace(const MoveToken& other) const { return face == other.face; }

    // 0..11, clockwise/counter-clockwise pairs per face
    int index() const;
    char symbol() const;

    bool operator==(const MoveToken& other) const {
        return face == other.face && direction == other.direction;
    }
    bool operator!=(const MoveToken& other) const { return !(*this == other); }

    static MoveToken fromIndex(int index);
    static std::optional<MoveToken> fromSymbol(char symbol);
};

using TokenSequence = std::vector<MoveToken>;

const char* faceName(Face face);

// Whitespace and commas between symbols are ignored. Throws InvalidTokenError.
TokenSequence parseTokens(const std::string& text);
// One symbol per element. Throws InvalidTokenError.
TokenSequence parseTokens(const std::vector<std::string>& symbols);

std::string formatTokens(const TokenSequence& tokens, const std::string& separator = " ");
TokenSequence invertTokens(const TokenSequence& tokens);

}  // namespace KubeAlgebra
