#include "goldberg/GoldbergMesh.h"
#include "goldberg/GoldbergPolyhedron.h"
#include <SDL3/SDL_log.h>
#include <chrono>
#include <string>

void printUsage(const char* programName) {
    SDL_Log("Goldberg Sphere Benchmark");
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --min <n>        Smallest subdivision level (default: 1)");
    SDL_Log("  --max <n>        Largest subdivision level (default: 32)");
    SDL_Log("  --radius <f>     Sphere radius (default: 1.0)");
    SDL_Log("  --parallel       Place base faces on multiple threads");
    SDL_Log("  --help           Show this help message");
}

struct BenchOptions {
    uint32_t minSubdivisions = 1;
    uint32_t maxSubdivisions = 32;
    float radius = 1.0f;
    bool parallel = false;
};

bool parseArguments(int argc, char* argv[], BenchOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--min" && i + 1 < argc) {
            opts.minSubdivisions = std::stoul(argv[++i]);
        }
        else if (arg == "--max" && i + 1 < argc) {
            opts.maxSubdivisions = std::stoul(argv[++i]);
        }
        else if (arg == "--radius" && i + 1 < argc) {
            opts.radius = std::stof(argv[++i]);
        }
        else if (arg == "--parallel") {
            opts.parallel = true;
        }
        else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown argument: %s", arg.c_str());
            return false;
        }
    }

    if (opts.minSubdivisions == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "--min must be at least 1");
        return false;
    }
    if (opts.maxSubdivisions < opts.minSubdivisions) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "--max must not be smaller than --min");
        return false;
    }

    return true;
}

namespace {

using Clock = std::chrono::steady_clock;

double millisecondsSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

}  // namespace

int main(int argc, char* argv[]) {
    BenchOptions opts;

    if (!parseArguments(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    SDL_Log("=== Goldberg Sphere Benchmark ===");
    SDL_Log("Subdivisions:   %u..%u", opts.minSubdivisions, opts.maxSubdivisions);
    SDL_Log("Radius:         %.3f", opts.radius);
    SDL_Log("Placement:      %s", opts.parallel ? "parallel" : "serial");
    SDL_Log("");

    for (uint32_t n = opts.minSubdivisions; n <= opts.maxSubdivisions; ++n) {
        Goldberg::GoldbergConfig config;
        config.subdivisions = n;
        config.radius = opts.radius;
        config.parallelPlacement = opts.parallel;

        auto start = Clock::now();
        auto polyhedron = Goldberg::GoldbergPolyhedron::create(config);
        if (!polyhedron) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to build polyhedron at N=%u", n);
            return 1;
        }
        double buildMs = millisecondsSince(start);

        start = Clock::now();
        Goldberg::ResolvedPositions positions = polyhedron->resolvePositions();
        double placeMs = millisecondsSince(start);

        start = Clock::now();
        std::vector<glm::vec3> vertices = Goldberg::GoldbergMesh::meshVertices(*polyhedron, positions);
        std::vector<glm::vec3> normals = Goldberg::GoldbergMesh::meshNormals(vertices);
        std::vector<uint32_t> indices = Goldberg::GoldbergMesh::meshTriangles(*polyhedron);
        double meshMs = millisecondsSince(start);

        start = Clock::now();
        auto adjacency = polyhedron->adjacency();
        double adjacencyMs = millisecondsSince(start);

        SDL_Log("N=%3u faces=%8zu vertices=%9zu triangles=%9zu edges=%9zu | "
                "build %8.2f ms, place %8.2f ms, mesh %8.2f ms, adjacency %8.2f ms",
                n, polyhedron->faceCount(), vertices.size(), indices.size() / 3, adjacency.size(),
                buildMs, placeMs, meshMs, adjacencyMs);

        if (normals.size() != vertices.size()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Normal count mismatch at N=%u", n);
            return 1;
        }
    }

    SDL_Log("");
    SDL_Log("=== Benchmark complete ===");
    return 0;
}
