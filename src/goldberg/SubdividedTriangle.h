#pragma once

// Integer barycentric lattice of one seed triangle subdivided N times.
// Pure data, no GPU or seed geometry dependencies.

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace Goldberg {

// Barycentric lattice point. x + y + z == N for the owning lattice; the true
// barycentric weights are (x, y, z) / N.
struct LatticeVertex {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    bool operator==(const LatticeVertex& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    bool operator!=(const LatticeVertex& other) const {
        return !(*this == other);
    }
};

// Vertex indices of one lattice triangle, counterclockwise in the seed
// triangle's orientation.
struct LatticeTriangle {
    uint32_t u = 0;
    uint32_t v = 0;
    uint32_t w = 0;
};

class SubdividedTriangle {
public:
    // Returns nullopt (and logs) for n == 0
    static std::optional<SubdividedTriangle> create(uint32_t n);

    // Closed-form counts at subdivision level n
    static size_t vertexCount(uint32_t n) { return static_cast<size_t>(n + 1) * (n + 2) / 2; }
    static size_t triangleCount(uint32_t n) { return static_cast<size_t>(n) * n; }
    static size_t upwardTriangleCount(uint32_t n) { return static_cast<size_t>(n) * (n + 1) / 2; }
    static size_t downwardTriangleCount(uint32_t n) { return n == 0 ? 0 : static_cast<size_t>(n) * (n - 1) / 2; }
    static size_t edgeCount(uint32_t n) { return upwardTriangleCount(n) * 3; }
    static size_t interiorVertexCount(uint32_t n) { return n < 3 ? 0 : static_cast<size_t>(n - 1) * (n - 2) / 2; }

    // index(x, y) = x * (2(n + 1) + 1 - x) / 2 + y. z is implied by x + y + z == n.
    // No validation, callers must pass a triple on the lattice.
    static size_t computeVertexIndex(uint32_t n, int32_t x, int32_t y) {
        return static_cast<size_t>(x * (2 * (static_cast<int32_t>(n) + 1) + 1 - x) / 2 + y);
    }

    uint32_t subdivisions() const { return n_; }
    size_t vertexCount() const { return vertices_.size(); }
    size_t triangleCount() const { return triangles_.size(); }
    size_t upwardTriangleCount() const { return upwardTriangleCount(n_); }
    size_t downwardTriangleCount() const { return downwardTriangleCount(n_); }

    const LatticeVertex& vertex(size_t i) const { return vertices_[i]; }
    const LatticeTriangle& triangle(size_t i) const { return triangles_[i]; }
    const std::vector<LatticeVertex>& vertices() const { return vertices_; }
    const std::vector<LatticeTriangle>& triangles() const { return triangles_; }

    // Checked lookup, nullopt when v is not a point of this lattice
    std::optional<size_t> vertexIndex(const LatticeVertex& v) const;
    size_t vertexIndexUnchecked(const LatticeVertex& v) const {
        return computeVertexIndex(n_, v.x, v.y);
    }

    // Index of an interior vertex (x, y, z all > 0) among interior vertices only
    std::optional<size_t> interiorIndex(const LatticeVertex& v) const;
    size_t interiorIndexUnchecked(const LatticeVertex& v) const {
        return computeVertexIndex(n_ - 3, v.x - 1, v.y - 1);
    }

    // Barycentric weights of a triangle's centroid, summing to 1
    glm::dvec3 centroidWeights(size_t triangle) const;

    // Triangles having vertices with lattice x == i, sorted by ascending centroid y.
    // Upward and downward triangles alternate. Empty for i >= N.
    std::vector<uint32_t> row(size_t i) const;

    // Triangles touching each boundary edge of the seed triangle (2N - 1 each),
    // alternating corner-side and edge-side triangles.
    std::vector<uint32_t> uv() const;  // z == 0, descending centroid x
    std::vector<uint32_t> vw() const;  // x == 0, descending centroid y
    std::vector<uint32_t> wu() const;  // y == 0, descending centroid z

    // Corner triangles containing (N,0,0), (0,N,0) and (0,0,N)
    uint32_t u() const { return static_cast<uint32_t>(upwardTriangleCount() - 1); }
    uint32_t v() const { return n_ - 1; }
    uint32_t w() const { return 0; }

    // Undirected vertex edges, each unordered pair exactly once, (min, max)
    std::vector<std::pair<uint32_t, uint32_t>> vertexAdjacency() const;

private:
    explicit SubdividedTriangle(uint32_t n);

    std::vector<uint32_t> upwardRow(size_t i) const;
    std::vector<uint32_t> downwardRow(size_t i) const;

    uint32_t n_ = 0;
    std::vector<LatticeVertex> vertices_;
    std::vector<LatticeTriangle> triangles_;
};

}  // namespace Goldberg
