#pragma once

#include <array>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

#include "MoveToken.h"

namespace KubeAlgebra {

// Cube-space layout consumed by a renderer: unit offsets per slot, +x right, +y up, +z front.
struct FacePivot {
    glm::vec3 position;  // Center of the turning face
    glm::vec3 axis;      // Outward normal
};

// Indexed by Face
extern const std::array<FacePivot, kFaceCount> kFacePivots;

// What an animation needs to play one quarter turn
struct TurnGeometry {
    Face face;
    glm::vec3 axis;
    float angleDegrees;  // about axis; clockwise seen from outside is -90
    std::vector<int> cornerSlots;
    std::vector<int> edgeSlots;
};

glm::vec3 cornerSlotOffset(int slot);
glm::vec3 edgeSlotOffset(int slot);
// -1 when no slot sits at that offset
int cornerSlotAt(const glm::vec3& offset);
int edgeSlotAt(const glm::vec3& offset);
bool slotOnFace(const glm::vec3& offset, Face face);

TurnGeometry turnGeometry(MoveToken token);

// Snaps an arbitrary direction to the closest face normal; empty for a zero vector
std::optional<Face> directionToFace(const glm::vec3& dir);
// Quarter turn matching a rotation of the face whose normal is given.
// Empty for half or null turns and for a zero normal.
std::optional<MoveToken> tokenForRotation(const glm::vec3& faceNormal, float angleDegrees);

}  // namespace KubeAlgebra
