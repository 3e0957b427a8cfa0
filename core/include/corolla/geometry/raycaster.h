#pragma once

/**
 * @file raycaster.h
 * @brief Ray/triangle intersection against segment meshes
 *
 * Used by OrbitDriver to find the segment directly below the probe.
 *
 * @par Example
 * @code
 * Raycaster caster(Ray{probePos, glm::vec3(0, -1, 0)});
 * if (auto hit = caster.intersect(mesh, segment.worldTransform())) {
 *     float distance = hit->distance;
 * }
 * @endcode
 */

#include <corolla/geometry/mesh.h>
#include <glm/glm.hpp>
#include <optional>
#include <limits>

namespace corolla::geometry {

/// Half-line with a normalized direction
struct Ray {
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, -1.0f, 0.0f};

    glm::vec3 at(float t) const { return origin + direction * t; }
};

/// Which triangle sides a ray can hit
enum class CullMode {
    Front,  ///< Hit only triangles facing the ray (normal opposes direction)
    Back,   ///< Hit only triangles facing away from the ray
    None    ///< Hit both sides
};

/// Nearest intersection of a ray with a mesh
struct RayHit {
    float distance = 0.0f;      ///< Distance along the ray, in world units
    glm::vec3 point{0.0f};      ///< World-space hit position
    uint32_t triangle = 0;      ///< Index of the hit triangle (first index / 3)
};

/**
 * @brief Möller-Trumbore ray/triangle test
 * @param origin Ray origin
 * @param dir Ray direction (need not be normalized; t is in units of dir)
 * @param cull Which sides count as hits
 * @return Parameter t of the hit, or std::nullopt
 *
 * Degenerate triangles and hits at or behind the origin are rejected.
 */
std::optional<float> intersectTriangle(const glm::vec3& origin, const glm::vec3& dir,
                                       const glm::vec3& v0, const glm::vec3& v1,
                                       const glm::vec3& v2, CullMode cull);

class Raycaster {
public:
    Raycaster() = default;
    explicit Raycaster(const Ray& ray) : m_ray(ray) {}

    /// Set the ray (direction is normalized here)
    void set(const glm::vec3& origin, const glm::vec3& direction);

    const Ray& ray() const { return m_ray; }

    /// Which sides of a triangle count as hits (default: Front)
    void cullMode(CullMode mode) { m_cull = mode; }
    CullMode cullMode() const { return m_cull; }

    /// Maximum hit distance (default: unbounded)
    void maxDistance(float distance) { m_maxDistance = distance; }
    float maxDistance() const { return m_maxDistance; }

    /**
     * @brief Intersect the ray with a transformed mesh
     * @param mesh Geometry in mesh space
     * @param worldTransform Mesh-to-world matrix (may include non-uniform scale)
     * @return Nearest hit within maxDistance(), or std::nullopt
     */
    std::optional<RayHit> intersect(const Mesh& mesh, const glm::mat4& worldTransform) const;

private:
    Ray m_ray;
    CullMode m_cull = CullMode::Front;
    float m_maxDistance = std::numeric_limits<float>::infinity();
};

} // namespace corolla::geometry
