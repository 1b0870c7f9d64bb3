#pragma once

#include <cstdint>

namespace Goldberg {

// Construction parameters for a Goldberg sphere
struct GoldbergConfig {
    uint32_t subdivisions = 1;          // N, each seed triangle edge is split into N segments
    float radius = 1.0f;                // radius used by resolvePositions() without an argument

    // Spherical placement
    double convergenceTolerance = 1.0e-6;
    uint32_t maxIterations = 64;
    bool parallelPlacement = false;     // spread base face placement across threads
};

}  // namespace Goldberg
