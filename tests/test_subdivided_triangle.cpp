// Tests for SubdividedTriangle - integer barycentric lattice of one seed face

#include <doctest/doctest.h>
#include "goldberg/SubdividedTriangle.h"
#include <algorithm>
#include <cstdlib>
#include <set>

using namespace Goldberg;

namespace {

SubdividedTriangle makeLattice(uint32_t n) {
    auto lattice = SubdividedTriangle::create(n);
    REQUIRE(lattice.has_value());
    return *lattice;
}

LatticeVertex centroidTimesThree(const SubdividedTriangle& lattice, uint32_t t) {
    const LatticeTriangle& tri = lattice.triangle(t);
    const LatticeVertex& a = lattice.vertex(tri.u);
    const LatticeVertex& b = lattice.vertex(tri.v);
    const LatticeVertex& c = lattice.vertex(tri.w);
    return {a.x + b.x + c.x, a.y + b.y + c.y, a.z + b.z + c.z};
}

bool touchesVertex(const SubdividedTriangle& lattice, uint32_t t, size_t vertex) {
    const LatticeTriangle& tri = lattice.triangle(t);
    return tri.u == vertex || tri.v == vertex || tri.w == vertex;
}

}  // namespace

// ============================================================================
// Construction and counts
// ============================================================================

TEST_SUITE("SubdividedTriangle") {
    TEST_CASE("level zero is rejected") {
        CHECK_FALSE(SubdividedTriangle::create(0).has_value());
    }

    TEST_CASE("level one is the seed triangle itself") {
        auto lattice = makeLattice(1);
        CHECK(lattice.vertexCount() == 3);
        CHECK(lattice.triangleCount() == 1);
        CHECK(lattice.upwardTriangleCount() == 1);
        CHECK(lattice.downwardTriangleCount() == 0);
        CHECK(lattice.u() == 0);
        CHECK(lattice.v() == 0);
        CHECK(lattice.w() == 0);
    }

    TEST_CASE("counts follow closed forms") {
        for (uint32_t n = 1; n <= 8; ++n) {
            auto lattice = makeLattice(n);
            CAPTURE(n);
            CHECK(lattice.vertexCount() == (n + 1) * (n + 2) / 2);
            CHECK(lattice.triangleCount() == n * n);
            CHECK(lattice.upwardTriangleCount() == n * (n + 1) / 2);
            CHECK(lattice.downwardTriangleCount() == n * (n - 1) / 2);
            CHECK(lattice.vertexAdjacency().size() == SubdividedTriangle::edgeCount(n));
        }
    }

    TEST_CASE("vertices sum to N and closed-form index matches position") {
        for (uint32_t n = 1; n <= 8; ++n) {
            auto lattice = makeLattice(n);
            for (size_t i = 0; i < lattice.vertexCount(); ++i) {
                const LatticeVertex& v = lattice.vertex(i);
                CHECK(v.x >= 0);
                CHECK(v.y >= 0);
                CHECK(v.z >= 0);
                CHECK(v.x + v.y + v.z == static_cast<int32_t>(n));
                CHECK(SubdividedTriangle::computeVertexIndex(n, v.x, v.y) == i);
                CHECK(lattice.vertexIndex(v) == i);
            }
        }
    }

    TEST_CASE("vertexIndex rejects points off the lattice") {
        auto lattice = makeLattice(4);
        CHECK_FALSE(lattice.vertexIndex({1, 1, 1}).has_value());
        CHECK_FALSE(lattice.vertexIndex({-1, 3, 2}).has_value());
        CHECK_FALSE(lattice.vertexIndex({5, 0, -1}).has_value());
    }

    TEST_CASE("upward triangles come before downward ones") {
        auto lattice = makeLattice(5);
        for (size_t t = 0; t < lattice.triangleCount(); ++t) {
            LatticeVertex c = centroidTimesThree(lattice, static_cast<uint32_t>(t));
            // Upward centroids have coordinates 3k + 1, downward 3k + 2 (times 3)
            bool upward = (c.x % 3) == 1;
            CHECK(upward == (t < lattice.upwardTriangleCount()));
        }
    }

    TEST_CASE("triangle corners are distinct neighbours") {
        auto lattice = makeLattice(4);
        for (const LatticeTriangle& t : lattice.triangles()) {
            const LatticeVertex& a = lattice.vertex(t.u);
            const LatticeVertex& b = lattice.vertex(t.v);
            const LatticeVertex& c = lattice.vertex(t.w);
            CHECK(std::abs(a.x - b.x) + std::abs(a.y - b.y) + std::abs(a.z - b.z) == 2);
            CHECK(std::abs(b.x - c.x) + std::abs(b.y - c.y) + std::abs(b.z - c.z) == 2);
            CHECK(std::abs(c.x - a.x) + std::abs(c.y - a.y) + std::abs(c.z - a.z) == 2);
        }
    }

    TEST_CASE("centroid weights sum to one") {
        auto lattice = makeLattice(6);
        for (size_t t = 0; t < lattice.triangleCount(); ++t) {
            glm::dvec3 w = lattice.centroidWeights(t);
            CHECK(w.x + w.y + w.z == doctest::Approx(1.0));
            CHECK(w.x > 0.0);
            CHECK(w.y > 0.0);
            CHECK(w.z > 0.0);
        }
    }
}

// ============================================================================
// Row and boundary queries
// ============================================================================

TEST_SUITE("SubdividedTriangle queries") {
    TEST_CASE("rows partition the triangles by x") {
        for (uint32_t n = 1; n <= 7; ++n) {
            auto lattice = makeLattice(n);
            std::set<uint32_t> seen;
            for (size_t i = 0; i < n; ++i) {
                std::vector<uint32_t> row = lattice.row(i);
                CHECK(row.size() == 2 * (n - i) - 1);

                int32_t previousY = -1;
                for (uint32_t t : row) {
                    LatticeVertex c = centroidTimesThree(lattice, t);
                    // Centroid x lies within (i, i + 1)
                    CHECK(c.x > static_cast<int32_t>(3 * i));
                    CHECK(c.x < static_cast<int32_t>(3 * (i + 1)));
                    CHECK(c.y > previousY);
                    previousY = c.y;
                    seen.insert(t);
                }
            }
            CHECK(seen.size() == lattice.triangleCount());
            CHECK(lattice.row(n).empty());
        }
    }

    TEST_CASE("boundary runs have 2N - 1 entries and touch their edge") {
        for (uint32_t n = 1; n <= 7; ++n) {
            auto lattice = makeLattice(n);
            std::vector<uint32_t> uv = lattice.uv();
            std::vector<uint32_t> vw = lattice.vw();
            std::vector<uint32_t> wu = lattice.wu();
            REQUIRE(uv.size() == 2 * n - 1);
            REQUIRE(vw.size() == 2 * n - 1);
            REQUIRE(wu.size() == 2 * n - 1);

            for (size_t i = 0; i < uv.size(); ++i) {
                LatticeVertex a = centroidTimesThree(lattice, uv[i]);
                LatticeVertex b = centroidTimesThree(lattice, vw[i]);
                LatticeVertex c = centroidTimesThree(lattice, wu[i]);
                // Corner-side triangles have a full edge on the boundary
                int32_t expected = (i % 2 == 0) ? 1 : 2;
                CHECK(a.z == expected);
                CHECK(b.x == expected);
                CHECK(c.y == expected);
                if (i > 0) {
                    CHECK(a.x < centroidTimesThree(lattice, uv[i - 1]).x);
                    CHECK(b.y < centroidTimesThree(lattice, vw[i - 1]).y);
                    CHECK(c.z < centroidTimesThree(lattice, wu[i - 1]).z);
                }
            }

            // Runs start at u, v and w respectively and end at the next corner
            CHECK(uv.front() == lattice.u());
            CHECK(uv.back() == lattice.v());
            CHECK(vw.front() == lattice.v());
            CHECK(vw.back() == lattice.w());
            CHECK(wu.front() == lattice.w());
            CHECK(wu.back() == lattice.u());
        }
    }

    TEST_CASE("corner triangles contain the corner vertices") {
        for (uint32_t n = 1; n <= 6; ++n) {
            auto lattice = makeLattice(n);
            const int32_t N = static_cast<int32_t>(n);
            CHECK(touchesVertex(lattice, lattice.u(), *lattice.vertexIndex({N, 0, 0})));
            CHECK(touchesVertex(lattice, lattice.v(), *lattice.vertexIndex({0, N, 0})));
            CHECK(touchesVertex(lattice, lattice.w(), *lattice.vertexIndex({0, 0, N})));
        }
    }

    TEST_CASE("interior index enumerates interior vertices densely") {
        for (uint32_t n = 3; n <= 8; ++n) {
            auto lattice = makeLattice(n);
            std::vector<size_t> indices;
            for (const LatticeVertex& v : lattice.vertices()) {
                auto index = lattice.interiorIndex(v);
                bool interior = v.x > 0 && v.y > 0 && v.z > 0;
                CHECK(index.has_value() == interior);
                if (index) {
                    indices.push_back(*index);
                }
            }
            std::sort(indices.begin(), indices.end());
            REQUIRE(indices.size() == SubdividedTriangle::interiorVertexCount(n));
            for (size_t i = 0; i < indices.size(); ++i) {
                CHECK(indices[i] == i);
            }
        }
    }

    TEST_CASE("vertex adjacency pairs are unique and ordered") {
        auto lattice = makeLattice(5);
        auto edges = lattice.vertexAdjacency();
        std::set<std::pair<uint32_t, uint32_t>> unique(edges.begin(), edges.end());
        CHECK(unique.size() == edges.size());
        for (const auto& [a, b] : edges) {
            CHECK(a < b);
        }
    }
}
