#pragma once

// Goldberg polyhedron GP(N, 0) built as the dual of a subdivided icosahedron.
//
// Every Goldberg vertex is the centroid of one lattice triangle on one seed
// face, addressed by a PackedIndex. Faces are listed in a fixed order:
//   [0, 12)                      pentagons, one per icosahedron vertex
//   [12, 12 + 30 (N - 1))        hexagons along the 30 seed edges, N - 1 per edge
//   [12 + 30 (N - 1), count)     hexagons inside the 20 seed faces
// All faces are wound counterclockwise seen from outside the sphere.
//
// Usage:
//   auto poly = GoldbergPolyhedron::create(config);
//   if (!poly) return;
//   ResolvedPositions positions = poly->resolvePositions();
//   for (const PolyhedronFace& face : poly->faces()) { ... positions[face[i]] ... }

#include "GoldbergConfig.h"
#include "PackedIndex.h"
#include "SeedIcosahedron.h"
#include "SphericalAverage.h"
#include "SubdividedTriangle.h"
#include <glm/glm.hpp>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace Goldberg {

enum class FaceKind : uint8_t {
    Pentagon = 5,
    Hexagon = 6
};

// One polyhedron face. Pentagons only use the first five slots.
struct PolyhedronFace {
    FaceKind kind = FaceKind::Hexagon;
    std::array<PackedIndex, 6> vertices{};

    static PolyhedronFace pentagon(const std::array<PackedIndex, 5>& v) {
        return {FaceKind::Pentagon, {v[0], v[1], v[2], v[3], v[4], PackedIndex()}};
    }
    static PolyhedronFace hexagon(const std::array<PackedIndex, 6>& v) {
        return {FaceKind::Hexagon, v};
    }

    size_t size() const { return static_cast<size_t>(kind); }
    bool isPentagon() const { return kind == FaceKind::Pentagon; }

    const PackedIndex& operator[](size_t i) const { return vertices[i]; }
    const PackedIndex* begin() const { return vertices.data(); }
    const PackedIndex* end() const { return vertices.data() + size(); }
};

// Goldberg vertex positions, dense over PackedIndex values.
// Slots for face ids 20..31 exist but are never written.
class ResolvedPositions {
public:
    ResolvedPositions() = default;
    ResolvedPositions(size_t trianglesPerFace, float radius)
        : trianglesPerFace_(trianglesPerFace), radius_(radius),
          points_(trianglesPerFace * PackedIndex::MAX_FACES, glm::vec3(0.0f)) {}

    const glm::vec3& operator[](PackedIndex i) const {
        assert(contains(i));
        return points_[i.value];
    }
    glm::vec3& operator[](PackedIndex i) {
        assert(contains(i));
        return points_[i.value];
    }

    bool contains(PackedIndex i) const {
        return i.face() < SeedIcosahedron::FACE_COUNT && i.index() < trianglesPerFace_;
    }

    // Number of Goldberg vertices, 20 * N^2
    size_t size() const { return trianglesPerFace_ * SeedIcosahedron::FACE_COUNT; }
    size_t trianglesPerFace() const { return trianglesPerFace_; }
    float radius() const { return radius_; }

private:
    size_t trianglesPerFace_ = 0;
    float radius_ = 1.0f;
    std::vector<glm::vec3> points_;
};

class GoldbergPolyhedron {
public:
    static constexpr size_t PENTAGON_COUNT = 12;

    // Returns nullopt (and logs) when subdivisions == 0 or radius is not a
    // positive finite number
    static std::optional<GoldbergPolyhedron> create(const GoldbergConfig& config);
    static std::optional<GoldbergPolyhedron> create(uint32_t subdivisions);

    // Closed-form counts
    static size_t hexagonCount(uint32_t n) { return 10 * (static_cast<size_t>(n) * n - 1); }
    static size_t faceCount(uint32_t n) { return PENTAGON_COUNT + hexagonCount(n); }
    static size_t vertexCount(uint32_t n) { return SeedIcosahedron::FACE_COUNT * static_cast<size_t>(n) * n; }
    static size_t edgeCount(uint32_t n) { return 30 * static_cast<size_t>(n) * n; }
    static size_t facesPerEdge(uint32_t n) { return n - 1; }
    static size_t facesPerFace(uint32_t n) { return SubdividedTriangle::interiorVertexCount(n); }

    // Face assembly stages, in output order
    static std::vector<PolyhedronFace> vertexFaces(const SubdividedTriangle& lattice);
    static std::vector<PolyhedronFace> edgeFaces(const SubdividedTriangle& lattice);
    static std::vector<PolyhedronFace> faceFaces(const SubdividedTriangle& lattice);

    uint32_t subdivisions() const { return lattice_.subdivisions(); }
    const GoldbergConfig& config() const { return config_; }
    const SubdividedTriangle& lattice() const { return lattice_; }
    const SeedIcosahedron& seed() const { return seed_; }

    const std::vector<PolyhedronFace>& faces() const { return faces_; }
    const PolyhedronFace& face(size_t i) const { return faces_[i]; }
    size_t faceCount() const { return faces_.size(); }
    size_t pentagonCount() const { return PENTAGON_COUNT; }
    size_t hexagonCount() const { return faces_.size() - PENTAGON_COUNT; }

    // Polyhedron face owning the lattice vertex on the given seed face.
    // Lattice vertices on seed edges and corners are shared, so several
    // (seedFace, latticeVertex) pairs map to the same face.
    uint32_t faceIndexOf(uint32_t seedFace, uint32_t latticeVertex) const;

    // Pairs of faces sharing an edge, (lower, higher), each exactly once
    std::vector<std::pair<uint32_t, uint32_t>> adjacency() const;

    // Unit-sphere position of a single Goldberg vertex, computed directly
    // from its own seed face
    glm::dvec3 resolveVertex(PackedIndex index) const;

    // Positions of all Goldberg vertices on a sphere of the given radius.
    // Only the four base faces are averaged, the rest are rotated copies.
    ResolvedPositions resolvePositions() const { return resolvePositions(config_.radius); }
    ResolvedPositions resolvePositions(float radius) const;

    // Same points grouped per seed face: result[f][triangle]
    std::vector<std::vector<glm::vec3>> centroids(float radius) const;

private:
    GoldbergPolyhedron(const GoldbergConfig& config, SubdividedTriangle lattice);

    SphericalAverage::Settings averageSettings() const;

    GoldbergConfig config_;
    SubdividedTriangle lattice_;
    SeedIcosahedron seed_;
    std::vector<PolyhedronFace> faces_;
    std::vector<glm::dvec3> weights_;   // centroid weights per lattice triangle
};

}  // namespace Goldberg
