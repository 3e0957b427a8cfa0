#pragma once

/**
 * @file segment_ring.h
 * @brief Ordered closed loop of petal segments
 *
 * A SegmentRing is built once from named meshes. Names look like
 * "leaf.007": only names starting with the prefix are kept, and they are
 * ordered by the integer after the last '.'. That order defines ring
 * distance and never changes afterwards. Index N-1 is adjacent to index 0.
 *
 * Each Segment is also the per-frame output sink: TrailField overwrites
 * color and scale every tick and the host renderer reads them back.
 *
 * @par Example
 * @code
 * Mesh petal = MeshBuilder::petal(0.9f, 0.28f).build();
 * SegmentRing ring = SegmentRing::fromMeshes(SegmentRing::layout(petal, 32, 1.2f));
 *
 * for (const Segment& s : ring) {
 *     draw(*s.mesh, s.worldTransform(), s.color);
 * }
 * @endcode
 */

#include <corolla/color.h>
#include <corolla/geometry/mesh.h>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace corolla {

/// A mesh handle with an identifier and a placement, as delivered by a scene
struct NamedMesh {
    std::string name;
    const geometry::Mesh* mesh = nullptr;
    glm::mat4 placement = glm::mat4(1.0f);
};

/// One petal of the ring
struct Segment {
    std::string name;
    const geometry::Mesh* mesh = nullptr;  ///< Hit-test geometry (not owned)
    glm::mat4 placement = glm::mat4(1.0f); ///< Node transform, fixed after construction

    Color color = Color::Ivory;  ///< Written every tick by TrailField
    float scale = 1.0f;          ///< Written every tick by TrailField

    /// Placement with the current uniform scale applied in mesh space
    glm::mat4 worldTransform() const;
};

class SegmentRing {
public:
    SegmentRing() = default;

    /**
     * @brief Build a ring from a scene's named meshes
     * @param meshes Candidate meshes in any order
     * @param prefix Only names starting with this are kept
     * @return Ring sorted ascending by numeric suffix (stable for equal suffixes)
     * @throw std::runtime_error if a kept name has no numeric suffix after its last '.'
     */
    static SegmentRing fromMeshes(const std::vector<NamedMesh>& meshes,
                                  const std::string& prefix = "leaf");

    /**
     * @brief Lay out copies of one petal mesh around the Y axis
     * @param petal Petal geometry, base at the origin pointing along +X
     * @param count Number of petals
     * @param innerRadius Distance from the center to each petal's base
     * @param prefix Name prefix; petals are named prefix.000, prefix.001, ...
     *
     * Petal i is rotated by 2*pi*i/count about +Y, so ring index grows in the
     * direction the probe travels.
     */
    static std::vector<NamedMesh> layout(const geometry::Mesh& petal, size_t count,
                                         float innerRadius, const std::string& prefix = "leaf");

    /**
     * @brief Parse the integer after the last '.' of a name
     * @return Suffix value, or std::nullopt if missing or not all digits
     */
    static std::optional<int> parseSuffix(const std::string& name);

    /**
     * @brief Shortest hop count between two indices on a ring of n
     * @param active Active index, or std::nullopt
     * @return min(|a-i|, n-|a-i|), or +infinity when there is no active index
     */
    static float ringDistance(std::optional<size_t> active, size_t i, size_t n);

    // -------------------------------------------------------------------------
    /// @name Access
    /// @{

    size_t size() const { return m_segments.size(); }
    bool empty() const { return m_segments.empty(); }

    Segment& operator[](size_t index) { return m_segments[index]; }
    const Segment& operator[](size_t index) const { return m_segments[index]; }

    std::vector<Segment>::iterator begin() { return m_segments.begin(); }
    std::vector<Segment>::iterator end() { return m_segments.end(); }
    std::vector<Segment>::const_iterator begin() const { return m_segments.begin(); }
    std::vector<Segment>::const_iterator end() const { return m_segments.end(); }

    /// Index of the segment with this name, if present
    std::optional<size_t> indexOf(const std::string& name) const;

    /// Ring distance between two member indices
    float distance(size_t a, size_t b) const { return ringDistance(a, b, m_segments.size()); }

    /// @}

private:
    std::vector<Segment> m_segments;
};

} // namespace corolla
