#include "SubdividedTriangle.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

namespace Goldberg {

std::optional<SubdividedTriangle> SubdividedTriangle::create(uint32_t n) {
    if (n == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "SubdividedTriangle: subdivision level must be at least 1");
        return std::nullopt;
    }
    return SubdividedTriangle(n);
}

SubdividedTriangle::SubdividedTriangle(uint32_t n) : n_(n) {
    const int32_t N = static_cast<int32_t>(n);

    // Lexicographic order on (x, y) so that position == computeVertexIndex
    vertices_.reserve(vertexCount(n));
    for (int32_t x = 0; x <= N; ++x) {
        for (int32_t y = 0; y <= N - x; ++y) {
            vertices_.push_back({x, y, N - x - y});
        }
    }

    auto index = [n](int32_t x, int32_t y) {
        return static_cast<uint32_t>(computeVertexIndex(n, x, y));
    };

    triangles_.reserve(triangleCount(n));

    // Upward: {v, v + (-1, 1, 0), v + (-1, 0, 1)}
    for (const LatticeVertex& v : vertices_) {
        if (v.x > 0) {
            triangles_.push_back({index(v.x, v.y), index(v.x - 1, v.y + 1), index(v.x - 1, v.y)});
        }
    }

    // Downward: {v, v - (-1, 1, 0), v - (-1, 0, 1)}
    for (const LatticeVertex& v : vertices_) {
        if (v.y > 0 && v.z > 0) {
            triangles_.push_back({index(v.x, v.y), index(v.x + 1, v.y - 1), index(v.x + 1, v.y)});
        }
    }
}

std::optional<size_t> SubdividedTriangle::vertexIndex(const LatticeVertex& v) const {
    if (v.x < 0 || v.y < 0 || v.z < 0 || v.x + v.y + v.z != static_cast<int32_t>(n_)) {
        return std::nullopt;
    }
    return vertexIndexUnchecked(v);
}

std::optional<size_t> SubdividedTriangle::interiorIndex(const LatticeVertex& v) const {
    if (v.x <= 0 || v.y <= 0 || v.z <= 0 || v.x + v.y + v.z != static_cast<int32_t>(n_)) {
        return std::nullopt;
    }
    return interiorIndexUnchecked(v);
}

glm::dvec3 SubdividedTriangle::centroidWeights(size_t triangle) const {
    const LatticeTriangle& t = triangles_[triangle];
    const LatticeVertex& a = vertices_[t.u];
    const LatticeVertex& b = vertices_[t.v];
    const LatticeVertex& c = vertices_[t.w];

    const double denominator = 3.0 * static_cast<double>(n_);
    return glm::dvec3(a.x + b.x + c.x, a.y + b.y + c.y, a.z + b.z + c.z) / denominator;
}

std::vector<uint32_t> SubdividedTriangle::upwardRow(size_t i) const {
    std::vector<uint32_t> result;
    if (i >= n_) {
        return result;
    }
    size_t k = n_ - i;
    size_t start = upwardTriangleCount() - k * (k + 1) / 2;
    result.reserve(k);
    for (size_t t = start; t < start + k; ++t) {
        result.push_back(static_cast<uint32_t>(t));
    }
    return result;
}

std::vector<uint32_t> SubdividedTriangle::downwardRow(size_t i) const {
    std::vector<uint32_t> result;
    if (i + 1 >= n_) {
        return result;
    }
    size_t k = n_ - 1 - i;
    size_t start = upwardTriangleCount() + downwardTriangleCount() - k * (k + 1) / 2;
    result.reserve(k);
    for (size_t t = start; t < start + k; ++t) {
        result.push_back(static_cast<uint32_t>(t));
    }
    return result;
}

std::vector<uint32_t> SubdividedTriangle::row(size_t i) const {
    std::vector<uint32_t> up = upwardRow(i);
    std::vector<uint32_t> down = downwardRow(i);

    std::vector<uint32_t> result;
    result.reserve(up.size() + down.size());
    for (size_t j = 0; j < std::max(up.size(), down.size()); ++j) {
        if (j < up.size()) result.push_back(up[j]);
        if (j < down.size()) result.push_back(down[j]);
    }
    return result;
}

std::vector<uint32_t> SubdividedTriangle::uv() const {
    const size_t N = n_;
    const size_t up = upwardTriangleCount();
    const size_t total = triangleCount();

    std::vector<uint32_t> edge(2 * N - 1, 0);
    for (size_t i = 0; i < N; ++i) {
        edge[2 * i] = static_cast<uint32_t>(up - i * (i + 1) / 2 - 1);
    }
    for (size_t i = 0; i + 1 < N; ++i) {
        edge[2 * i + 1] = static_cast<uint32_t>(total - i * (i + 1) / 2 - 1);
    }
    return edge;
}

std::vector<uint32_t> SubdividedTriangle::vw() const {
    const size_t N = n_;
    const size_t up = upwardTriangleCount();

    std::vector<uint32_t> edge(2 * N - 1, 0);
    for (size_t i = 0; i < N; ++i) {
        edge[2 * i] = static_cast<uint32_t>(N - 1 - i);
    }
    for (size_t i = 0; i + 1 < N; ++i) {
        edge[2 * i + 1] = static_cast<uint32_t>(up + N - 2 - i);
    }
    return edge;
}

std::vector<uint32_t> SubdividedTriangle::wu() const {
    const size_t N = n_;
    const size_t up = upwardTriangleCount();
    const size_t total = triangleCount();

    std::vector<uint32_t> edge(2 * N - 1, 0);
    for (size_t i = 0; i < N; ++i) {
        size_t k = N - 1 - i;
        edge[2 * i] = static_cast<uint32_t>(up - (k + 1) * (k + 2) / 2);
    }
    for (size_t i = 1; i < N; ++i) {
        size_t k = N - 1 - i;
        edge[2 * i - 1] = static_cast<uint32_t>(total - (k + 1) * (k + 2) / 2);
    }
    return edge;
}

std::vector<std::pair<uint32_t, uint32_t>> SubdividedTriangle::vertexAdjacency() const {
    std::vector<std::pair<uint32_t, uint32_t>> edges;
    edges.reserve(triangles_.size() * 3);

    auto addEdge = [&edges](uint32_t a, uint32_t b) {
        edges.emplace_back(std::min(a, b), std::max(a, b));
    };

    for (const LatticeTriangle& t : triangles_) {
        addEdge(t.u, t.v);
        addEdge(t.v, t.w);
        addEdge(t.w, t.u);
    }

    // Interior edges are shared by one upward and one downward triangle
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

}  // namespace Goldberg
