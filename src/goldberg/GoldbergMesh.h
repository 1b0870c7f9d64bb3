#pragma once

// Flat render buffers for a Goldberg polyhedron.
//
// Every face gets its own copy of its corner points so that normals can be
// flat per face. Buffers are laid out in face order, so the 12 pentagons
// occupy the first 60 vertices and every following face takes 6.

#include "GoldbergPolyhedron.h"
#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Goldberg {
namespace GoldbergMesh {

// Indices into the flat vertex buffer. Pentagons only use the first five.
struct MeshFace {
    FaceKind kind = FaceKind::Hexagon;
    std::array<uint32_t, 6> indices{};

    size_t size() const { return static_cast<size_t>(kind); }
    uint32_t operator[](size_t i) const { return indices[i]; }
};

constexpr size_t PENTAGON_VERTEX_COUNT = GoldbergPolyhedron::PENTAGON_COUNT * 5;

inline size_t meshVertexCount(uint32_t n) {
    return PENTAGON_VERTEX_COUNT + 6 * GoldbergPolyhedron::hexagonCount(n);
}

// Fan triangulation, 3 triangles per pentagon and 4 per hexagon
inline size_t meshTriangleCount(uint32_t n) {
    return 3 * GoldbergPolyhedron::PENTAGON_COUNT + 4 * GoldbergPolyhedron::hexagonCount(n);
}

std::vector<glm::vec3> meshVertices(const GoldbergPolyhedron& polyhedron,
                                    const ResolvedPositions& positions);

std::vector<MeshFace> meshFaces(const GoldbergPolyhedron& polyhedron);

// Three indices per triangle, counterclockwise seen from outside
std::vector<uint32_t> meshTriangles(const GoldbergPolyhedron& polyhedron);

// Newell normal of each face written to all of its vertices. Expects the
// layout produced by meshVertices.
std::vector<glm::vec3> meshNormals(const std::vector<glm::vec3>& vertices);

// Newell's method, robust for slightly non-planar polygons. Not normalized.
glm::vec3 newellNormal(const glm::vec3* points, size_t count);

}  // namespace GoldbergMesh
}  // namespace Goldberg
