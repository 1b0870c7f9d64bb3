#pragma once

// Fixed icosahedron topology that every Goldberg sphere is subdivided from.
//
// Faces are laid out as four rings of five around the polar axis through
// vertex 0 (north) and vertex 3 (south):
//   top           0..5    (N,   P_k,   P_k+1)
//   upper middle  5..10   (L_k, P_k+1, P_k)
//   lower middle 10..15   (P_k+1, L_k, L_k+1)
//   bottom       15..20   (S,   L_k+1, L_k)
// where P is the upper and L the lower vertex ring, both counterclockwise seen
// from the north pole. All faces are wound counterclockwise seen from outside.
// The corner labels (u, v, w) of each face are what the face assembly tables in
// GoldbergPolyhedron are written against.

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace Goldberg {

class SeedIcosahedron {
public:
    static constexpr uint32_t VERTEX_COUNT = 12;
    static constexpr uint32_t EDGE_COUNT = 30;
    static constexpr uint32_t FACE_COUNT = 20;
    static constexpr uint32_t RING_SIZE = 5;

    // Face with explicit corners, one per ring
    struct BaseFace {
        uint32_t id;
        std::array<glm::dvec3, 3> corners;
    };

    // Face obtained by rotating a base face about the polar axis
    struct Symmetry {
        uint32_t id;
        uint32_t baseId;
        uint32_t steps;         // rotation angle in multiples of 72 degrees
        glm::dmat3 rotation;
    };

    SeedIcosahedron();

    const glm::dvec3& vertex(uint32_t i) const { return vertices_[i]; }
    const std::array<uint32_t, 3>& face(uint32_t f) const { return faces_[f]; }
    std::array<glm::dvec3, 3> corners(uint32_t f) const;

    // Axis through the north pole, shared by all five top faces
    const glm::dvec3& polarAxis() const { return vertices_[0]; }

    const std::vector<BaseFace>& baseFaces() const { return baseFaces_; }
    const std::vector<Symmetry>& symmetries() const { return symmetries_; }

    // Ring a face belongs to (0 top .. 3 bottom) and its base face id
    static uint32_t ring(uint32_t f) { return f / RING_SIZE; }
    static uint32_t baseFaceOf(uint32_t f) { return ring(f) * RING_SIZE; }

    // The 30 pairs of faces sharing an edge, (lower id, higher id)
    std::vector<std::pair<uint32_t, uint32_t>> faceAdjacency() const;

private:
    std::array<glm::dvec3, VERTEX_COUNT> vertices_;
    std::array<std::array<uint32_t, 3>, FACE_COUNT> faces_;
    std::vector<BaseFace> baseFaces_;
    std::vector<Symmetry> symmetries_;
};

}  // namespace Goldberg
