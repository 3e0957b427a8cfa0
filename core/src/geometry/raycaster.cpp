#include <corolla/geometry/raycaster.h>
#include <cmath>

namespace corolla::geometry {

namespace {

constexpr float kDetEpsilon = 1e-10f;
constexpr float kMinDistance = 1e-6f;

} // anonymous namespace

std::optional<float> intersectTriangle(const glm::vec3& origin, const glm::vec3& dir,
                                       const glm::vec3& v0, const glm::vec3& v1,
                                       const glm::vec3& v2, CullMode cull) {
    glm::vec3 e1 = v1 - v0;
    glm::vec3 e2 = v2 - v0;
    glm::vec3 p = glm::cross(dir, e2);
    float det = glm::dot(e1, p);

    // det > 0 when the counter-clockwise normal points against the ray
    switch (cull) {
        case CullMode::Front:
            if (det < kDetEpsilon) return std::nullopt;
            break;
        case CullMode::Back:
            if (det > -kDetEpsilon) return std::nullopt;
            break;
        case CullMode::None:
            if (std::abs(det) < kDetEpsilon) return std::nullopt;
            break;
    }

    float invDet = 1.0f / det;
    glm::vec3 s = origin - v0;
    float u = glm::dot(s, p) * invDet;
    if (u < 0.0f || u > 1.0f) return std::nullopt;

    glm::vec3 q = glm::cross(s, e1);
    float v = glm::dot(dir, q) * invDet;
    if (v < 0.0f || u + v > 1.0f) return std::nullopt;

    float t = glm::dot(e2, q) * invDet;
    if (t <= kMinDistance) return std::nullopt;

    return t;
}

void Raycaster::set(const glm::vec3& origin, const glm::vec3& direction) {
    m_ray.origin = origin;
    float len = glm::length(direction);
    m_ray.direction = len > 0.0f ? direction / len : glm::vec3(0, -1, 0);
}

std::optional<RayHit> Raycaster::intersect(const Mesh& mesh, const glm::mat4& worldTransform) const {
    if (mesh.empty()) {
        return std::nullopt;
    }

    float linearDet = glm::determinant(glm::mat3(worldTransform));
    if (std::abs(linearDet) < kDetEpsilon) {
        // Collapsed (zero-scale) geometry has no surface to hit
        return std::nullopt;
    }

    // Intersect in mesh space. The inverse is linear, so the ray parameter
    // stays in world units as long as the world direction is normalized.
    glm::mat4 inv = glm::inverse(worldTransform);
    glm::vec3 localOrigin = glm::vec3(inv * glm::vec4(m_ray.origin, 1.0f));
    glm::vec3 localDir = glm::mat3(inv) * m_ray.direction;

    // A mirroring transform flips winding
    CullMode cull = m_cull;
    if (linearDet < 0.0f) {
        if (cull == CullMode::Front) cull = CullMode::Back;
        else if (cull == CullMode::Back) cull = CullMode::Front;
    }

    std::optional<RayHit> best;
    const auto& verts = mesh.vertices;
    const auto& idx = mesh.indices;

    for (uint32_t tri = 0; tri < mesh.triangleCount(); ++tri) {
        uint32_t i0 = idx[tri * 3];
        uint32_t i1 = idx[tri * 3 + 1];
        uint32_t i2 = idx[tri * 3 + 2];
        if (i0 >= verts.size() || i1 >= verts.size() || i2 >= verts.size()) {
            continue;
        }

        auto t = intersectTriangle(localOrigin, localDir,
                                   verts[i0].position, verts[i1].position, verts[i2].position,
                                   cull);
        if (!t || *t > m_maxDistance) continue;

        if (!best || *t < best->distance) {
            RayHit hit;
            hit.distance = *t;
            hit.point = m_ray.at(*t);
            hit.triangle = tri;
            best = hit;
        }
    }

    return best;
}

} // namespace corolla::geometry
