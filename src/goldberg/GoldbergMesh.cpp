#include "GoldbergMesh.h"
#include <cassert>

namespace Goldberg {
namespace GoldbergMesh {

std::vector<glm::vec3> meshVertices(const GoldbergPolyhedron& polyhedron,
                                    const ResolvedPositions& positions) {
    std::vector<glm::vec3> vertices;
    vertices.reserve(meshVertexCount(polyhedron.subdivisions()));

    for (const PolyhedronFace& face : polyhedron.faces()) {
        for (PackedIndex index : face) {
            vertices.push_back(positions[index]);
        }
    }
    return vertices;
}

std::vector<MeshFace> meshFaces(const GoldbergPolyhedron& polyhedron) {
    std::vector<MeshFace> faces;
    faces.reserve(polyhedron.faceCount());

    uint32_t next = 0;
    for (const PolyhedronFace& face : polyhedron.faces()) {
        MeshFace meshFace;
        meshFace.kind = face.kind;
        for (size_t i = 0; i < face.size(); ++i) {
            meshFace.indices[i] = next++;
        }
        faces.push_back(meshFace);
    }
    return faces;
}

std::vector<uint32_t> meshTriangles(const GoldbergPolyhedron& polyhedron) {
    std::vector<uint32_t> indices;
    indices.reserve(meshTriangleCount(polyhedron.subdivisions()) * 3);

    for (const MeshFace& face : meshFaces(polyhedron)) {
        for (size_t i = 1; i + 1 < face.size(); ++i) {
            indices.push_back(face[0]);
            indices.push_back(face[i]);
            indices.push_back(face[i + 1]);
        }
    }
    return indices;
}

glm::vec3 newellNormal(const glm::vec3* points, size_t count) {
    glm::vec3 normal(0.0f);
    for (size_t i = 0; i < count; ++i) {
        const glm::vec3& current = points[i];
        const glm::vec3& next = points[(i + 1) % count];

        normal.x += (current.y - next.y) * (current.z + next.z);
        normal.y += (current.z - next.z) * (current.x + next.x);
        normal.z += (current.x - next.x) * (current.y + next.y);
    }
    return normal;
}

std::vector<glm::vec3> meshNormals(const std::vector<glm::vec3>& vertices) {
    assert(vertices.size() >= PENTAGON_VERTEX_COUNT);
    assert((vertices.size() - PENTAGON_VERTEX_COUNT) % 6 == 0);

    std::vector<glm::vec3> normals(vertices.size(), glm::vec3(0.0f));

    size_t offset = 0;
    while (offset < vertices.size()) {
        const size_t count = offset < PENTAGON_VERTEX_COUNT ? 5 : 6;

        glm::vec3 normal = newellNormal(vertices.data() + offset, count);
        float len = glm::length(normal);
        if (len > 0.0001f) {
            normal /= len;
        }

        for (size_t i = 0; i < count; ++i) {
            normals[offset + i] = normal;
        }
        offset += count;
    }
    return normals;
}

}  // namespace GoldbergMesh
}  // namespace Goldberg
