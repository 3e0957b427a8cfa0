#pragma once

#include <glm/glm.hpp>
#include <vector>
#include <limits>
#include <cstdint>

namespace corolla::geometry {

/// Vertex format for segment meshes
struct Vertex3D {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec2 uv;

    Vertex3D() : position(0), normal(0, 1, 0), uv(0) {}

    Vertex3D(glm::vec3 pos)
        : position(pos), normal(0, 1, 0), uv(0) {}

    Vertex3D(glm::vec3 pos, glm::vec3 norm)
        : position(pos), normal(norm), uv(0) {}

    Vertex3D(glm::vec3 pos, glm::vec3 norm, glm::vec2 texcoord)
        : position(pos), normal(norm), uv(texcoord) {}
};

/// Axis-aligned bounding box
struct Bounds3D {
    glm::vec3 min{std::numeric_limits<float>::max()};
    glm::vec3 max{std::numeric_limits<float>::lowest()};

    bool valid() const { return min.x <= max.x && min.y <= max.y && min.z <= max.z; }
    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 size() const { return max - min; }
    float radius() const { return glm::length(size()) * 0.5f; }

    void expand(const glm::vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }
};

/// Indexed triangle mesh kept on the CPU for hit testing
class Mesh {
public:
    std::vector<Vertex3D> vertices;
    std::vector<uint32_t> indices;

    /// Get index count
    uint32_t indexCount() const { return static_cast<uint32_t>(indices.size()); }

    /// Get vertex count
    uint32_t vertexCount() const { return static_cast<uint32_t>(vertices.size()); }

    /// Get triangle count (indices that don't complete a triangle are ignored)
    uint32_t triangleCount() const { return indexCount() / 3; }

    /// Check if the mesh has any triangles
    bool empty() const { return triangleCount() == 0; }

    /// Bounding box of the vertex positions in mesh space
    Bounds3D bounds() const;
};

} // namespace corolla::geometry
