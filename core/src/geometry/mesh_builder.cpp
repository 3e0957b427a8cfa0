#include <corolla/geometry/mesh_builder.h>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace corolla::geometry {

// -----------------------------------------------------------------------------
// Vertex Manipulation
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::addVertex(glm::vec3 pos) {
    m_vertices.emplace_back(pos);
    return *this;
}

MeshBuilder& MeshBuilder::addVertex(glm::vec3 pos, glm::vec3 normal) {
    m_vertices.emplace_back(pos, normal);
    return *this;
}

MeshBuilder& MeshBuilder::addVertex(glm::vec3 pos, glm::vec3 normal, glm::vec2 uv) {
    m_vertices.emplace_back(pos, normal, uv);
    return *this;
}

MeshBuilder& MeshBuilder::addVertex(const Vertex3D& v) {
    m_vertices.push_back(v);
    return *this;
}

// -----------------------------------------------------------------------------
// Face Construction
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::addTriangle(uint32_t a, uint32_t b, uint32_t c) {
    m_indices.push_back(a);
    m_indices.push_back(b);
    m_indices.push_back(c);
    return *this;
}

MeshBuilder& MeshBuilder::addQuad(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    // Split quad into two triangles
    addTriangle(a, b, c);
    addTriangle(a, c, d);
    return *this;
}

// -----------------------------------------------------------------------------
// Modifiers
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::computeNormals() {
    // Simple smooth normals: average face normals at each vertex index
    for (auto& v : m_vertices) {
        v.normal = glm::vec3(0);
    }

    for (size_t i = 0; i + 2 < m_indices.size(); i += 3) {
        uint32_t i0 = m_indices[i];
        uint32_t i1 = m_indices[i + 1];
        uint32_t i2 = m_indices[i + 2];

        glm::vec3 v0 = m_vertices[i0].position;
        glm::vec3 v1 = m_vertices[i1].position;
        glm::vec3 v2 = m_vertices[i2].position;

        glm::vec3 normal = glm::cross(v1 - v0, v2 - v0);

        m_vertices[i0].normal += normal;
        m_vertices[i1].normal += normal;
        m_vertices[i2].normal += normal;
    }

    for (auto& v : m_vertices) {
        float len = glm::length(v.normal);
        if (len > 0.0001f) {
            v.normal /= len;
        }
    }

    return *this;
}

MeshBuilder& MeshBuilder::transform(const glm::mat4& m) {
    glm::mat3 normalMatrix = glm::transpose(glm::inverse(glm::mat3(m)));

    for (auto& v : m_vertices) {
        v.position = glm::vec3(m * glm::vec4(v.position, 1.0f));
        glm::vec3 n = normalMatrix * v.normal;
        float len = glm::length(n);
        if (len > 0.0001f) {
            v.normal = n / len;
        }
    }

    return *this;
}

MeshBuilder& MeshBuilder::translate(glm::vec3 offset) {
    for (auto& v : m_vertices) {
        v.position += offset;
    }
    return *this;
}

MeshBuilder& MeshBuilder::rotate(float angle, glm::vec3 axis) {
    glm::mat4 m = glm::rotate(glm::mat4(1.0f), angle, axis);
    return transform(m);
}

MeshBuilder& MeshBuilder::invert() {
    for (auto& v : m_vertices) {
        v.normal = -v.normal;
    }

    // Reverse winding order
    for (size_t i = 0; i + 2 < m_indices.size(); i += 3) {
        std::swap(m_indices[i + 1], m_indices[i + 2]);
    }

    return *this;
}

// -----------------------------------------------------------------------------
// Build
// -----------------------------------------------------------------------------

Mesh MeshBuilder::build() const {
    Mesh mesh;
    mesh.vertices = m_vertices;
    mesh.indices = m_indices;
    return mesh;
}

void MeshBuilder::clear() {
    m_vertices.clear();
    m_indices.clear();
}

// -----------------------------------------------------------------------------
// Primitive Generators
// -----------------------------------------------------------------------------

MeshBuilder MeshBuilder::plane(float width, float depth) {
    MeshBuilder builder;
    float hx = width * 0.5f;
    float hz = depth * 0.5f;
    glm::vec3 up(0, 1, 0);

    builder.addVertex({-hx, 0, -hz}, up, {0, 0});
    builder.addVertex({-hx, 0,  hz}, up, {0, 1});
    builder.addVertex({ hx, 0,  hz}, up, {1, 1});
    builder.addVertex({ hx, 0, -hz}, up, {1, 0});
    builder.addQuad(0, 1, 2, 3);

    return builder;
}

MeshBuilder MeshBuilder::petal(float length, float width, int segments) {
    MeshBuilder builder;
    segments = std::max(segments, 1);
    glm::vec3 up(0, 1, 0);

    // Two vertices per slice: right edge (-Z) then left edge (+Z).
    // Half-width follows sin(pi * t) so both ends taper to a point.
    for (int i = 0; i <= segments; ++i) {
        float t = static_cast<float>(i) / segments;
        float x = t * length;
        float half = 0.5f * width * std::sin(t * glm::pi<float>());
        builder.addVertex({x, 0, -half}, up, {t, 0});
        builder.addVertex({x, 0,  half}, up, {t, 1});
    }

    for (int i = 0; i < segments; ++i) {
        uint32_t right0 = static_cast<uint32_t>(i * 2);
        uint32_t left0 = right0 + 1;
        uint32_t right1 = right0 + 2;
        uint32_t left1 = right0 + 3;
        builder.addQuad(right0, left0, left1, right1);
    }

    return builder;
}

} // namespace corolla::geometry
