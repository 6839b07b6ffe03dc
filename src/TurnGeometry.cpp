#include "KubeAlgebra/TurnGeometry.h"
#include "KubeAlgebra/Errors.h"
#include "KubeAlgebra/Move.h"

#include <cmath>
#include <string>

namespace KubeAlgebra {

const std::array<FacePivot, kFaceCount> kFacePivots = {
    FacePivot{{0, 0, +1}, {0, 0, 1}},   // Front
    FacePivot{{+1, 0, 0}, {1, 0, 0}},   // Right
    FacePivot{{0, +1, 0}, {0, 1, 0}},   // Up
    FacePivot{{0, 0, -1}, {0, 0, -1}},  // Back
    FacePivot{{-1, 0, 0}, {-1, 0, 0}},  // Left
    FacePivot{{0, -1, 0}, {0, -1, 0}},  // Down
};

namespace {
    constexpr float kQuarterTurn = 90.0f;

    const std::array<glm::vec3, kEdgeCount> kEdgeOffsets = {
        glm::vec3(-1, -1, 0),  // LD
        glm::vec3(-1, 0, 1),   // FL
        glm::vec3(-1, 0, -1),  // LB
        glm::vec3(-1, 1, 0),   // LU
        glm::vec3(0, -1, 1),   // FD
        glm::vec3(0, -1, -1),  // BD
        glm::vec3(0, 1, 1),    // FU
        glm::vec3(0, 1, -1),   // UB
        glm::vec3(1, -1, 0),   // RD
        glm::vec3(1, 0, 1),    // FR
        glm::vec3(1, 0, -1),   // RB
        glm::vec3(1, 1, 0),    // RU
    };

    void checkIndex(int slot, int count, const char* what) {
        if (slot < 0 || slot >= count) {
            throw InvalidArgumentError(std::string(what) + " slot out of range: " + std::to_string(slot));
        }
    }
}

glm::vec3 cornerSlotOffset(int slot) {
    checkIndex(slot, kCornerCount, "corner");
    return glm::vec3((slot & 4) ? 1.0f : -1.0f,
                     (slot & 2) ? 1.0f : -1.0f,
                     (slot & 1) ? -1.0f : 1.0f);
}

glm::vec3 edgeSlotOffset(int slot) {
    checkIndex(slot, kEdgeCount, "edge");
    return kEdgeOffsets[slot];
}

int cornerSlotAt(const glm::vec3& offset) {
    const float epsilon = 0.5f;
    for (int i = 0; i < kCornerCount; ++i) {
        if (glm::length(cornerSlotOffset(i) - offset) < epsilon) {
            return i;
        }
    }
    return -1;
}

int edgeSlotAt(const glm::vec3& offset) {
    const float epsilon = 0.5f;
    for (int i = 0; i < kEdgeCount; ++i) {
        if (glm::length(kEdgeOffsets[i] - offset) < epsilon) {
            return i;
        }
    }
    return -1;
}

bool slotOnFace(const glm::vec3& offset, Face face) {
    return glm::dot(offset, kFacePivots[static_cast<int>(face)].axis) > 0.5f;
}

TurnGeometry turnGeometry(MoveToken token) {
    TurnGeometry geometry;
    geometry.face = token.face;
    geometry.axis = kFacePivots[static_cast<int>(token.face)].axis;
    geometry.angleDegrees = token.direction == Direction::Clockwise ? -kQuarterTurn : kQuarterTurn;

    for (int i = 0; i < kCornerCount; ++i) {
        if (slotOnFace(cornerSlotOffset(i), token.face)) geometry.cornerSlots.push_back(i);
    }
    for (int i = 0; i < kEdgeCount; ++i) {
        if (slotOnFace(kEdgeOffsets[i], token.face)) geometry.edgeSlots.push_back(i);
    }
    return geometry;
}

std::optional<Face> directionToFace(const glm::vec3& dir) {
    float len = glm::length(dir);
    if (len <= 0.0f) return std::nullopt;

    glm::vec3 normalized = dir / len;
    float bestDot = -2.0f;
    int bestIdx = 0;
    for (int i = 0; i < kFaceCount; ++i) {
        float dot = glm::dot(normalized, kFacePivots[i].axis);
        if (dot > bestDot) {
            bestDot = dot;
            bestIdx = i;
        }
    }
    return static_cast<Face>(bestIdx);
}

std::optional<MoveToken> tokenForRotation(const glm::vec3& faceNormal, float angleDegrees) {
    int turns = static_cast<int>(std::round(std::fabs(angleDegrees) / kQuarterTurn)) % 4;
    if (turns == 0 || turns == 2) return std::nullopt;

    auto face = directionToFace(faceNormal);
    if (!face) return std::nullopt;

    // Three quarter turns one way are one the other way
    bool clockwise = (angleDegrees < 0.0f) == (turns == 1);
    return MoveToken{*face, clockwise ? Direction::Clockwise : Direction::CounterClockwise};
}

}  // namespace KubeAlgebra
