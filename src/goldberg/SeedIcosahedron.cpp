#include "SeedIcosahedron.h"
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>

namespace Goldberg {

SeedIcosahedron::SeedIcosahedron() {
    const double t = (1.0 + std::sqrt(5.0)) / 2.0;

    vertices_ = {
        glm::normalize(glm::dvec3(-1,  t,  0)),   // 0: north pole
        glm::normalize(glm::dvec3( 1,  t,  0)),
        glm::normalize(glm::dvec3(-1, -t,  0)),
        glm::normalize(glm::dvec3( 1, -t,  0)),   // 3: south pole
        glm::normalize(glm::dvec3( 0, -1,  t)),
        glm::normalize(glm::dvec3( 0,  1,  t)),
        glm::normalize(glm::dvec3( 0, -1, -t)),
        glm::normalize(glm::dvec3( 0,  1, -t)),
        glm::normalize(glm::dvec3( t,  0, -1)),
        glm::normalize(glm::dvec3( t,  0,  1)),
        glm::normalize(glm::dvec3(-t,  0, -1)),
        glm::normalize(glm::dvec3(-t,  0,  1))
    };

    // Upper ring P = 11, 5, 1, 7, 10 and lower ring L = 4, 9, 8, 6, 2
    faces_ = {{
        // Top
        {0, 11, 5}, {0, 5, 1}, {0, 1, 7}, {0, 7, 10}, {0, 10, 11},
        // Upper middle
        {4, 5, 11}, {9, 1, 5}, {8, 7, 1}, {6, 10, 7}, {2, 11, 10},
        // Lower middle
        {5, 4, 9}, {1, 9, 8}, {7, 8, 6}, {10, 6, 2}, {11, 2, 4},
        // Bottom
        {3, 9, 4}, {3, 8, 9}, {3, 6, 8}, {3, 2, 6}, {3, 4, 2}
    }};

    // Rotating about the polar axis by 72 degrees maps face k of a ring onto
    // face k + 1 with corner labels preserved, so one face per ring is enough.
    const double step = glm::two_pi<double>() / RING_SIZE;
    for (uint32_t f = 0; f < FACE_COUNT; ++f) {
        uint32_t k = f % RING_SIZE;
        if (k == 0) {
            baseFaces_.push_back({f, corners(f)});
        } else {
            glm::dquat q = glm::angleAxis(step * k, polarAxis());
            symmetries_.push_back({f, baseFaceOf(f), k, glm::mat3_cast(q)});
        }
    }
}

std::array<glm::dvec3, 3> SeedIcosahedron::corners(uint32_t f) const {
    const std::array<uint32_t, 3>& face = faces_[f];
    return {vertices_[face[0]], vertices_[face[1]], vertices_[face[2]]};
}

std::vector<std::pair<uint32_t, uint32_t>> SeedIcosahedron::faceAdjacency() const {
    std::vector<std::pair<uint32_t, uint32_t>> result;
    result.reserve(EDGE_COUNT);

    for (uint32_t a = 0; a < FACE_COUNT; ++a) {
        for (uint32_t b = a + 1; b < FACE_COUNT; ++b) {
            int shared = 0;
            for (uint32_t i : faces_[a]) {
                shared += static_cast<int>(std::count(faces_[b].begin(), faces_[b].end(), i));
            }
            if (shared == 2) {
                result.emplace_back(a, b);
            }
        }
    }
    return result;
}

}  // namespace Goldberg
