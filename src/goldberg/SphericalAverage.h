#pragma once

// Weighted averages of points on the unit sphere.
//
// Uses the locally linearly convergent fixed-point iteration of Buss & Fillmore,
// "Spherical Averages and Applications to Spherical Splines and Interpolation":
// map every point into the tangent plane at the current estimate, take the
// weighted Euclidean mean there and map it back onto the sphere, until the
// tangent step vanishes.
//
// Preconditions (checked with assert in debug builds only, undefined behaviour
// in release builds): all points are unit length, weights are >= 0 and sum to 1.

#include <glm/glm.hpp>
#include <array>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Goldberg {
namespace SphericalAverage {

struct Settings {
    double tolerance = 1.0e-6;     // stop once the tangent step is shorter than this
    uint32_t maxIterations = 64;   // hard cap, reaching it is logged
};

// Log map S^2 -> T_q(S^2): a tangent vector at q pointing towards p whose length
// is the angle between p and q. Zero when p == q.
glm::dvec3 sphereLn(const glm::dvec3& q, const glm::dvec3& p);

// Exponential map T_q(S^2) -> S^2: walks |u| radians from q along u. Returns q
// when u is zero.
glm::dvec3 sphereExp(const glm::dvec3& q, const glm::dvec3& u);

// Angle in radians between two unit vectors, stable near 0 and pi
double angleBetween(const glm::dvec3& a, const glm::dvec3& b);

namespace detail {
void reportNonConvergence(uint32_t iterations, double residual);
}

template<size_t K>
glm::dvec3 weightedAverage(const std::array<double, K>& weights,
                           const std::array<glm::dvec3, K>& points,
                           const Settings& settings = {}) {
#ifndef NDEBUG
    double totalWeight = 0.0;
    for (size_t i = 0; i < K; ++i) {
        assert(weights[i] >= 0.0 && "weights must be non-negative");
        assert(std::abs(glm::length(points[i]) - 1.0) <= 1.0e-6 && "points must be unit length");
        totalWeight += weights[i];
    }
    assert(std::abs(totalWeight - 1.0) <= 1.0e-9 && "weights must sum to 1");
#endif

    glm::dvec3 q(0.0);
    for (size_t i = 0; i < K; ++i) {
        q += weights[i] * points[i];
    }
    q = glm::normalize(q);

    double residual = 0.0;
    for (uint32_t iteration = 0; iteration < settings.maxIterations; ++iteration) {
        glm::dvec3 u(0.0);
        for (size_t i = 0; i < K; ++i) {
            u += weights[i] * sphereLn(q, points[i]);
        }

        q = sphereExp(q, u);

        residual = glm::length(u);
        if (residual < settings.tolerance) {
            return q;
        }
    }

    detail::reportNonConvergence(settings.maxIterations, residual);
    return q;
}

// Spherical centroid of three unit points with barycentric weights
inline glm::dvec3 weightedAverage3(const glm::dvec3& weights,
                                   const glm::dvec3& p1,
                                   const glm::dvec3& p2,
                                   const glm::dvec3& p3,
                                   const Settings& settings = {}) {
    return weightedAverage<3>({weights.x, weights.y, weights.z}, {p1, p2, p3}, settings);
}

}  // namespace SphericalAverage
}  // namespace Goldberg
