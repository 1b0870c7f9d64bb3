// Tests for SphericalAverage - log/exp maps and weighted spherical centroids

#include <doctest/doctest.h>
#include "goldberg/SphericalAverage.h"
#include <glm/gtc/constants.hpp>
#include <cmath>

using namespace Goldberg;
using namespace Goldberg::SphericalAverage;

static bool approxEqual(const glm::dvec3& a, const glm::dvec3& b, double eps = 1e-9) {
    return glm::length(a - b) <= eps;
}

TEST_SUITE("SphericalAverage maps") {
    TEST_CASE("ln of the base point is zero") {
        glm::dvec3 q = glm::normalize(glm::dvec3(1.0, 2.0, 3.0));
        CHECK(glm::length(sphereLn(q, q)) == doctest::Approx(0.0));
    }

    TEST_CASE("exp of zero is the base point") {
        glm::dvec3 q = glm::normalize(glm::dvec3(-1.0, 0.5, 2.0));
        CHECK(approxEqual(sphereExp(q, glm::dvec3(0.0)), q));
    }

    TEST_CASE("ln length is the angle and lies in the tangent plane") {
        glm::dvec3 q(0.0, 0.0, 1.0);
        glm::dvec3 p(1.0, 0.0, 0.0);
        glm::dvec3 u = sphereLn(q, p);
        CHECK(glm::length(u) == doctest::Approx(glm::half_pi<double>()));
        CHECK(glm::dot(u, q) == doctest::Approx(0.0));
    }

    TEST_CASE("exp undoes ln") {
        glm::dvec3 q = glm::normalize(glm::dvec3(0.3, -0.2, 0.9));
        const glm::dvec3 points[] = {
            glm::normalize(glm::dvec3(1.0, 0.0, 0.0)),
            glm::normalize(glm::dvec3(0.2, 0.9, 0.1)),
            glm::normalize(glm::dvec3(-0.5, -0.5, 0.7)),
        };
        for (const glm::dvec3& p : points) {
            CHECK(approxEqual(sphereExp(q, sphereLn(q, p)), p));
        }
    }

    TEST_CASE("angleBetween is stable for nearly parallel vectors") {
        glm::dvec3 a(1.0, 0.0, 0.0);
        glm::dvec3 b = glm::normalize(glm::dvec3(1.0, 1e-9, 0.0));
        CHECK(angleBetween(a, b) == doctest::Approx(1e-9).epsilon(1e-3).scale(0.0));
        CHECK(angleBetween(a, -a) == doctest::Approx(glm::pi<double>()));
    }
}

TEST_SUITE("SphericalAverage weightedAverage") {
    TEST_CASE("result is unit length") {
        glm::dvec3 p1 = glm::normalize(glm::dvec3(1.0, 0.1, 0.0));
        glm::dvec3 p2 = glm::normalize(glm::dvec3(0.0, 1.0, 0.2));
        glm::dvec3 p3 = glm::normalize(glm::dvec3(0.1, 0.0, 1.0));
        glm::dvec3 q = weightedAverage3(glm::dvec3(0.2, 0.5, 0.3), p1, p2, p3);
        CHECK(glm::length(q) == doctest::Approx(1.0));
    }

    TEST_CASE("full weight on one point returns that point") {
        glm::dvec3 p1(1.0, 0.0, 0.0);
        glm::dvec3 p2(0.0, 1.0, 0.0);
        glm::dvec3 p3(0.0, 0.0, 1.0);
        CHECK(approxEqual(weightedAverage3(glm::dvec3(1.0, 0.0, 0.0), p1, p2, p3), p1, 1e-6));
        CHECK(approxEqual(weightedAverage3(glm::dvec3(0.0, 0.0, 1.0), p1, p2, p3), p3, 1e-6));
    }

    TEST_CASE("symmetric inputs give the normalized mean") {
        glm::dvec3 p1(1.0, 0.0, 0.0);
        glm::dvec3 p2(0.0, 1.0, 0.0);
        glm::dvec3 p3(0.0, 0.0, 1.0);
        glm::dvec3 third(1.0 / 3.0);
        glm::dvec3 q = weightedAverage3(third, p1, p2, p3);
        CHECK(approxEqual(q, glm::normalize(glm::dvec3(1.0)), 1e-6));
    }

    TEST_CASE("two point midpoint lies on the great circle") {
        glm::dvec3 a(1.0, 0.0, 0.0);
        glm::dvec3 b(0.0, 1.0, 0.0);
        glm::dvec3 q = weightedAverage<2>({0.5, 0.5}, {a, b});
        CHECK(approxEqual(q, glm::normalize(glm::dvec3(1.0, 1.0, 0.0)), 1e-6));
    }

    TEST_CASE("uneven weights follow geodesic distance, not chord distance") {
        // Along a great circle the weighted average is the point at the
        // weighted angle, which differs from the normalized chord mix
        glm::dvec3 a(1.0, 0.0, 0.0);
        glm::dvec3 b(0.0, 1.0, 0.0);
        glm::dvec3 q = weightedAverage<2>({0.75, 0.25}, {a, b});
        double angle = 0.25 * glm::half_pi<double>();
        CHECK(approxEqual(q, glm::dvec3(std::cos(angle), std::sin(angle), 0.0), 1e-6));
    }

    TEST_CASE("rotation commutes with averaging") {
        glm::dvec3 p1 = glm::normalize(glm::dvec3(1.0, 0.2, 0.1));
        glm::dvec3 p2 = glm::normalize(glm::dvec3(0.1, 1.0, 0.3));
        glm::dvec3 p3 = glm::normalize(glm::dvec3(0.2, 0.1, 1.0));
        glm::dvec3 w(0.6, 0.3, 0.1);

        glm::dmat3 r(0.0, 1.0, 0.0,
                     -1.0, 0.0, 0.0,
                     0.0, 0.0, 1.0);  // 90 degrees about +z

        glm::dvec3 rotatedThenAveraged = weightedAverage3(w, r * p1, r * p2, r * p3);
        glm::dvec3 averagedThenRotated = r * weightedAverage3(w, p1, p2, p3);
        CHECK(approxEqual(rotatedThenAveraged, averagedThenRotated, 1e-9));
    }

    TEST_CASE("iteration cap stops the loop and returns an estimate") {
        glm::dvec3 p1(1.0, 0.0, 0.0);
        glm::dvec3 p2(0.0, 1.0, 0.0);
        glm::dvec3 p3(0.0, 0.0, 1.0);

        Settings settings;
        settings.tolerance = 0.0;     // unreachable
        settings.maxIterations = 3;
        glm::dvec3 q = weightedAverage3(glm::dvec3(0.5, 0.3, 0.2), p1, p2, p3, settings);
        CHECK(glm::length(q) == doctest::Approx(1.0));
    }
}
