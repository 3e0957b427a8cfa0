#pragma once

#include <corolla/geometry/mesh.h>
#include <glm/glm.hpp>
#include <vector>

namespace corolla::geometry {

/// Builder for constructing segment meshes procedurally
///
/// Faces are wound counter-clockwise when seen from the side their normal
/// points to, so up-facing primitives are front faces for a downward ray.
class MeshBuilder {
public:
    MeshBuilder() = default;

    // -------------------------------------------------------------------------
    /// @name Vertex Manipulation
    /// @{

    /// Add a vertex with just position
    MeshBuilder& addVertex(glm::vec3 pos);

    /// Add a vertex with position and normal
    MeshBuilder& addVertex(glm::vec3 pos, glm::vec3 normal);

    /// Add a vertex with position, normal, and UV
    MeshBuilder& addVertex(glm::vec3 pos, glm::vec3 normal, glm::vec2 uv);

    /// Add a complete Vertex3D
    MeshBuilder& addVertex(const Vertex3D& v);

    /// Number of vertices added so far
    uint32_t vertexCount() const { return static_cast<uint32_t>(m_vertices.size()); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Face Construction
    /// @{

    /// Add a triangle from vertex indices
    MeshBuilder& addTriangle(uint32_t a, uint32_t b, uint32_t c);

    /// Add a quad from vertex indices (splits into 2 triangles)
    MeshBuilder& addQuad(uint32_t a, uint32_t b, uint32_t c, uint32_t d);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Modifiers
    /// @{

    /// Compute smooth normals from face data
    MeshBuilder& computeNormals();

    /// Apply a transformation matrix
    MeshBuilder& transform(const glm::mat4& m);

    /// Translate all vertices
    MeshBuilder& translate(glm::vec3 offset);

    /// Rotate around an axis (angle in radians)
    MeshBuilder& rotate(float angle, glm::vec3 axis);

    /// Invert normals and winding order
    MeshBuilder& invert();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Build
    /// @{

    /// Copy the accumulated geometry into a Mesh
    Mesh build() const;

    /// Remove all vertices and faces
    void clear();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Primitive Generators
    /// @{

    /// Flat up-facing rectangle centered at the origin in the XZ plane
    static MeshBuilder plane(float width, float depth);

    /// Flat up-facing leaf blade in the XZ plane
    /// @param length Extent along +X, starting at the origin
    /// @param width Widest point across Z (reached at half length)
    /// @param segments Number of slices along the length (minimum 1)
    static MeshBuilder petal(float length, float width, int segments = 8);

    /// @}

private:
    std::vector<Vertex3D> m_vertices;
    std::vector<uint32_t> m_indices;
};

} // namespace corolla::geometry
