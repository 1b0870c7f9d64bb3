#include "SphericalAverage.h"
#include <SDL3/SDL_log.h>

namespace Goldberg {
namespace SphericalAverage {

double angleBetween(const glm::dvec3& a, const glm::dvec3& b) {
    return std::atan2(glm::length(glm::cross(a, b)), glm::dot(a, b));
}

glm::dvec3 sphereLn(const glm::dvec3& q, const glm::dvec3& p) {
    double theta = angleBetween(p, q);

    // theta / sin(theta) -> 1 as theta -> 0, and (p - q cos(theta)) -> 0
    double k = theta == 0.0 ? 1.0 : theta / std::sin(theta);

    return k * (p - q * std::cos(theta));
}

glm::dvec3 sphereExp(const glm::dvec3& q, const glm::dvec3& u) {
    double r = glm::length(u);

    double k = r == 0.0 ? 1.0 : std::sin(r) / r;

    return q * std::cos(r) + k * u;
}

namespace detail {

void reportNonConvergence(uint32_t iterations, double residual) {
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "SphericalAverage: no convergence after %u iterations (residual %g)",
                iterations, residual);
}

}  // namespace detail

}  // namespace SphericalAverage
}  // namespace Goldberg
