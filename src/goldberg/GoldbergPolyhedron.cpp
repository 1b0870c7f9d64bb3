#include "GoldbergPolyhedron.h"
#include "ParallelFor.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

namespace Goldberg {

namespace {

constexpr uint32_t RING_SIZE = SeedIcosahedron::RING_SIZE;

enum class BoundaryEdge : uint8_t { UV, VW, WU };

// One class of seed edges: face A = ringA * 5 + k meets
// face B = ringB * 5 + (k + shiftB) % 5 for k in [0, 5)
struct EdgeSeam {
    uint32_t ringA;
    BoundaryEdge edgeA;
    uint32_t ringB;
    uint32_t shiftB;
    BoundaryEdge edgeB;
};

// Emitted in this order, seam ordinal = seam * 5 + k
constexpr std::array<EdgeSeam, 6> EDGE_SEAMS = {{
    {0, BoundaryEdge::WU, 0, 1, BoundaryEdge::UV},   // top - top
    {0, BoundaryEdge::VW, 1, 0, BoundaryEdge::VW},   // top - upper middle
    {1, BoundaryEdge::UV, 2, 0, BoundaryEdge::UV},   // upper middle - lower middle
    {2, BoundaryEdge::WU, 1, 1, BoundaryEdge::WU},   // lower middle - upper middle
    {2, BoundaryEdge::VW, 3, 0, BoundaryEdge::VW},   // lower middle - bottom
    {3, BoundaryEdge::UV, 3, 1, BoundaryEdge::WU},   // bottom - bottom
}};

// Pentagon owning a seed corner: base + stride * ((k + shift) % 5)
struct CornerRule {
    uint32_t base;
    uint32_t shift;
    uint32_t stride;
};

// [ring][u, v, w]
constexpr CornerRule CORNER_RULES[4][3] = {
    {{0, 0, 0}, {2, 4, 1}, {2, 0, 1}},
    {{7, 0, 1}, {2, 0, 1}, {2, 4, 1}},
    {{2, 0, 1}, {7, 0, 1}, {7, 1, 1}},
    {{1, 0, 0}, {7, 1, 1}, {7, 0, 1}},
};

enum class Coordinate : uint8_t { X, Y, Z };

// Seam ordinal of a boundary edge, base + (k + shift) % 5, and the lattice
// coordinate that counts positions along it starting at 1
struct EdgeRule {
    uint32_t base;
    uint32_t shift;
    Coordinate position;
};

// [ring][uv, vw, wu]
constexpr EdgeRule EDGE_RULES[4][3] = {
    {{0, 4, Coordinate::X}, {5, 0, Coordinate::Z}, {0, 0, Coordinate::X}},
    {{10, 0, Coordinate::Y}, {5, 0, Coordinate::Y}, {15, 4, Coordinate::Z}},
    {{10, 0, Coordinate::X}, {20, 0, Coordinate::Z}, {15, 0, Coordinate::X}},
    {{25, 0, Coordinate::Y}, {20, 0, Coordinate::Y}, {25, 4, Coordinate::Z}},
};

std::vector<uint32_t> boundary(const SubdividedTriangle& lattice, BoundaryEdge edge) {
    switch (edge) {
        case BoundaryEdge::UV: return lattice.uv();
        case BoundaryEdge::VW: return lattice.vw();
        case BoundaryEdge::WU: return lattice.wu();
    }
    return {};
}

PackedIndex at(uint32_t face, uint32_t triangle) {
    return PackedIndex::pack(face, triangle);
}

int32_t coordinate(const LatticeVertex& v, Coordinate c) {
    switch (c) {
        case Coordinate::X: return v.x;
        case Coordinate::Y: return v.y;
        case Coordinate::Z: return v.z;
    }
    return 0;
}

}  // namespace

std::optional<GoldbergPolyhedron> GoldbergPolyhedron::create(const GoldbergConfig& config) {
    if (config.subdivisions == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "GoldbergPolyhedron: subdivision level must be at least 1");
        return std::nullopt;
    }
    if (!std::isfinite(config.radius) || config.radius <= 0.0f) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "GoldbergPolyhedron: radius must be positive and finite (got %f)",
                     static_cast<double>(config.radius));
        return std::nullopt;
    }

    auto lattice = SubdividedTriangle::create(config.subdivisions);
    if (!lattice) {
        return std::nullopt;
    }

    GoldbergPolyhedron polyhedron(config, std::move(*lattice));

    SDL_Log("GoldbergPolyhedron: N=%u, %zu faces (%zu pentagons, %zu hexagons), %zu vertices",
            config.subdivisions, polyhedron.faceCount(), polyhedron.pentagonCount(),
            polyhedron.hexagonCount(), vertexCount(config.subdivisions));

    return polyhedron;
}

std::optional<GoldbergPolyhedron> GoldbergPolyhedron::create(uint32_t subdivisions) {
    GoldbergConfig config;
    config.subdivisions = subdivisions;
    return create(config);
}

GoldbergPolyhedron::GoldbergPolyhedron(const GoldbergConfig& config, SubdividedTriangle lattice)
    : config_(config), lattice_(std::move(lattice)) {
    faces_.reserve(faceCount(lattice_.subdivisions()));

    for (auto* stage : {&vertexFaces, &edgeFaces, &faceFaces}) {
        std::vector<PolyhedronFace> stageFaces = stage(lattice_);
        faces_.insert(faces_.end(), stageFaces.begin(), stageFaces.end());
    }

    weights_.reserve(lattice_.triangleCount());
    for (size_t t = 0; t < lattice_.triangleCount(); ++t) {
        weights_.push_back(lattice_.centroidWeights(t));
    }
}

std::vector<PolyhedronFace> GoldbergPolyhedron::vertexFaces(const SubdividedTriangle& lattice) {
    const uint32_t u = lattice.u();
    const uint32_t v = lattice.v();
    const uint32_t w = lattice.w();

    std::vector<PolyhedronFace> result;
    result.reserve(PENTAGON_COUNT);

    // North pole: u corners of the top ring
    result.push_back(PolyhedronFace::pentagon({at(0, u), at(1, u), at(2, u), at(3, u), at(4, u)}));

    // South pole: u corners of the bottom ring
    result.push_back(PolyhedronFace::pentagon({at(19, u), at(18, u), at(17, u), at(16, u), at(15, u)}));

    // Upper ring vertices
    for (uint32_t k = 0; k < RING_SIZE; ++k) {
        const uint32_t f = 5 + k;
        const uint32_t next = (k + 1) % RING_SIZE;
        result.push_back(PolyhedronFace::pentagon({
            at(f, v), at(f + 5, u), at(5 + next, w), at(next, v), at(k, w)
        }));
    }

    // Lower ring vertices
    for (uint32_t k = 0; k < RING_SIZE; ++k) {
        const uint32_t f = 10 + k;
        const uint32_t prev = (k + RING_SIZE - 1) % RING_SIZE;
        result.push_back(PolyhedronFace::pentagon({
            at(f, v), at(5 + k, u), at(10 + prev, w), at(15 + prev, v), at(15 + k, w)
        }));
    }

    return result;
}

std::vector<PolyhedronFace> GoldbergPolyhedron::edgeFaces(const SubdividedTriangle& lattice) {
    std::vector<PolyhedronFace> result;
    result.reserve(SeedIcosahedron::EDGE_COUNT * facesPerEdge(lattice.subdivisions()));

    for (const EdgeSeam& seam : EDGE_SEAMS) {
        const std::vector<uint32_t> a = boundary(lattice, seam.edgeA);
        const std::vector<uint32_t> b = boundary(lattice, seam.edgeB);
        const size_t length = a.size();

        for (uint32_t k = 0; k < RING_SIZE; ++k) {
            const uint32_t fa = seam.ringA * RING_SIZE + k;
            const uint32_t fb = seam.ringB * RING_SIZE + (k + seam.shiftB) % RING_SIZE;

            // Walk A forwards and B backwards, three triangles at a time
            for (size_t i = 0; i + 2 < length; i += 2) {
                result.push_back(PolyhedronFace::hexagon({
                    at(fb, b[length - 1 - i]),
                    at(fb, b[length - 2 - i]),
                    at(fb, b[length - 3 - i]),
                    at(fa, a[i + 2]),
                    at(fa, a[i + 1]),
                    at(fa, a[i]),
                }));
            }
        }
    }

    return result;
}

std::vector<PolyhedronFace> GoldbergPolyhedron::faceFaces(const SubdividedTriangle& lattice) {
    const uint32_t n = lattice.subdivisions();

    // One hexagon per interior lattice vertex, the same triangles on every seed face
    std::vector<std::array<uint32_t, 6>> pattern;
    pattern.reserve(facesPerFace(n));

    std::vector<uint32_t> current = lattice.row(0);
    for (uint32_t i = 0; i + 1 < n; ++i) {
        std::vector<uint32_t> next = lattice.row(i + 1);

        // current without its first and last triangle lines up with next
        if (current.size() >= 2) {
            const size_t length = std::min(current.size() - 2, next.size());
            for (size_t j = 0; j + 2 < length; j += 2) {
                pattern.push_back({
                    next[j], next[j + 1], next[j + 2],
                    current[j + 3], current[j + 2], current[j + 1],
                });
            }
        }

        current = std::move(next);
    }

    std::vector<PolyhedronFace> result;
    result.reserve(SeedIcosahedron::FACE_COUNT * pattern.size());

    for (uint32_t f = 0; f < SeedIcosahedron::FACE_COUNT; ++f) {
        for (const std::array<uint32_t, 6>& p : pattern) {
            result.push_back(PolyhedronFace::hexagon({
                at(f, p[0]), at(f, p[1]), at(f, p[2]), at(f, p[3]), at(f, p[4]), at(f, p[5])
            }));
        }
    }

    return result;
}

uint32_t GoldbergPolyhedron::faceIndexOf(uint32_t seedFace, uint32_t latticeVertex) const {
    assert(seedFace < SeedIcosahedron::FACE_COUNT);

    const uint32_t n = lattice_.subdivisions();
    const LatticeVertex& v = lattice_.vertex(latticeVertex);
    const uint32_t ring = SeedIcosahedron::ring(seedFace);
    const uint32_t k = seedFace % RING_SIZE;

    // Corners: two coordinates are zero
    int corner = -1;
    if (v.y == 0 && v.z == 0) corner = 0;
    else if (v.x == 0 && v.z == 0) corner = 1;
    else if (v.x == 0 && v.y == 0) corner = 2;

    if (corner >= 0) {
        const CornerRule& rule = CORNER_RULES[ring][corner];
        return rule.base + rule.stride * ((k + rule.shift) % RING_SIZE);
    }

    // Edges: one coordinate is zero
    int edge = -1;
    if (v.z == 0) edge = 0;
    else if (v.x == 0) edge = 1;
    else if (v.y == 0) edge = 2;

    const uint32_t perEdge = static_cast<uint32_t>(facesPerEdge(n));
    const uint32_t edgeStart = static_cast<uint32_t>(PENTAGON_COUNT);

    if (edge >= 0) {
        const EdgeRule& rule = EDGE_RULES[ring][edge];
        const uint32_t ordinal = rule.base + (k + rule.shift) % RING_SIZE;
        const uint32_t position = static_cast<uint32_t>(coordinate(v, rule.position)) - 1;
        return edgeStart + ordinal * perEdge + position;
    }

    const uint32_t faceStart = edgeStart + SeedIcosahedron::EDGE_COUNT * perEdge;
    const uint32_t perFace = static_cast<uint32_t>(facesPerFace(n));
    return faceStart + seedFace * perFace + static_cast<uint32_t>(lattice_.interiorIndexUnchecked(v));
}

std::vector<std::pair<uint32_t, uint32_t>> GoldbergPolyhedron::adjacency() const {
    const std::vector<std::pair<uint32_t, uint32_t>> latticeEdges = lattice_.vertexAdjacency();

    std::vector<std::pair<uint32_t, uint32_t>> result;
    result.reserve(latticeEdges.size() * SeedIcosahedron::FACE_COUNT);

    for (const auto& [a, b] : latticeEdges) {
        for (uint32_t f = 0; f < SeedIcosahedron::FACE_COUNT; ++f) {
            const uint32_t fa = faceIndexOf(f, a);
            const uint32_t fb = faceIndexOf(f, b);
            result.emplace_back(std::min(fa, fb), std::max(fa, fb));
        }
    }

    // Seed edges and corners are visited once from every face touching them
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

SphericalAverage::Settings GoldbergPolyhedron::averageSettings() const {
    SphericalAverage::Settings settings;
    settings.tolerance = config_.convergenceTolerance;
    settings.maxIterations = config_.maxIterations;
    return settings;
}

glm::dvec3 GoldbergPolyhedron::resolveVertex(PackedIndex index) const {
    assert(index.face() < SeedIcosahedron::FACE_COUNT);
    assert(index.index() < lattice_.triangleCount());

    const std::array<glm::dvec3, 3> corners = seed_.corners(index.face());
    return SphericalAverage::weightedAverage3(weights_[index.index()],
                                              corners[0], corners[1], corners[2],
                                              averageSettings());
}

ResolvedPositions GoldbergPolyhedron::resolvePositions(float radius) const {
    const size_t triangles = lattice_.triangleCount();
    const SphericalAverage::Settings settings = averageSettings();
    const unsigned int threads = config_.parallelPlacement ? 0 : 1;
    const double scale = static_cast<double>(radius);

    ResolvedPositions positions(triangles, radius);

    const std::vector<SeedIcosahedron::BaseFace>& baseFaces = seed_.baseFaces();
    std::array<size_t, SeedIcosahedron::FACE_COUNT> baseSlot{};
    for (size_t b = 0; b < baseFaces.size(); ++b) {
        baseSlot[baseFaces[b].id] = b;
    }

    // Unit-sphere placement of every base face triangle
    std::vector<glm::dvec3> basePoints(baseFaces.size() * triangles);
    Parallel::parallel_for(0, basePoints.size(), [&](size_t item) {
        const SeedIcosahedron::BaseFace& face = baseFaces[item / triangles];
        const size_t t = item % triangles;
        const glm::dvec3 p = SphericalAverage::weightedAverage3(weights_[t],
                                                                face.corners[0],
                                                                face.corners[1],
                                                                face.corners[2],
                                                                settings);
        basePoints[item] = p;
        positions[at(face.id, static_cast<uint32_t>(t))] = glm::vec3(p * scale);
    }, threads);

    // Derived faces are rotated copies
    const std::vector<SeedIcosahedron::Symmetry>& symmetries = seed_.symmetries();
    Parallel::parallel_for(0, symmetries.size() * triangles, [&](size_t item) {
        const SeedIcosahedron::Symmetry& symmetry = symmetries[item / triangles];
        const size_t t = item % triangles;
        const glm::dvec3 p = symmetry.rotation * basePoints[baseSlot[symmetry.baseId] * triangles + t];
        positions[at(symmetry.id, static_cast<uint32_t>(t))] = glm::vec3(p * scale);
    }, threads);

    return positions;
}

std::vector<std::vector<glm::vec3>> GoldbergPolyhedron::centroids(float radius) const {
    const ResolvedPositions positions = resolvePositions(radius);
    const size_t triangles = lattice_.triangleCount();

    std::vector<std::vector<glm::vec3>> result(SeedIcosahedron::FACE_COUNT);
    for (uint32_t f = 0; f < SeedIcosahedron::FACE_COUNT; ++f) {
        result[f].reserve(triangles);
        for (size_t t = 0; t < triangles; ++t) {
            result[f].push_back(positions[at(f, static_cast<uint32_t>(t))]);
        }
    }
    return result;
}

}  // namespace Goldberg
