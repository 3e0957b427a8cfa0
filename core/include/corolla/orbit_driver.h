#pragma once

/**
 * @file orbit_driver.h
 * @brief Moves the probe around the ring and finds the segment beneath it
 *
 * Each tick the probe angle decreases by speed * dt (clockwise seen from
 * above). The probe sits at basePosition + radius * (cos, 0, sin) and a ray
 * cast straight down from it picks the active segment.
 *
 * @par Example
 * @code
 * OrbitDriver orbit(ring);
 * orbit.radius = 1.6f;
 * orbit.speed = 1.0f;
 *
 * OrbitSample s = orbit.advance(dt);
 * if (s.activeIndex) {
 *     // ring[*s.activeIndex] is under the probe
 * }
 * @endcode
 */

#include <corolla/operator.h>
#include <corolla/param.h>
#include <corolla/param_registry.h>
#include <corolla/geometry/raycaster.h>
#include <glm/glm.hpp>
#include <optional>

namespace corolla {

class SegmentRing;

/// The orbiting probe's own renderable state
struct Probe {
    float angle = 0.0f;            ///< Orbit angle in radians, unbounded
    glm::vec3 position{0.0f};      ///< World position
    float spin = 0.0f;             ///< Cosmetic self-rotation about +Y, in radians
    float size = 0.075f;           ///< Sphere radius for drawing
};

/// Result of one advance() call
struct OrbitSample {
    glm::vec3 position{0.0f};
    std::optional<size_t> activeIndex;
};

class OrbitDriver : public Operator, public ParamRegistry {
public:
    /// Spin added to the probe each tick, independent of orbit speed
    static constexpr float SPIN_PER_TICK = 0.01f;

    // -------------------------------------------------------------------------
    /// @name Parameters (re-read every tick, never clamped)
    /// @{

    Param<float> radius{"radius", 1.6f, 1.0f, 10.0f};   ///< Orbit radius
    Param<float> speed{"speed", 1.0f, 0.1f, 5.0f};      ///< Radians per second
    Vec3Param basePosition{"basePosition", 0.0f, 0.75f, 0.0f, -10.0f, 10.0f}; ///< Orbit center

    /// @}
    // -------------------------------------------------------------------------

    OrbitDriver();
    explicit OrbitDriver(SegmentRing& ring);

    /// Hit-test against this ring (not owned; may be empty)
    void attach(SegmentRing& ring) { m_ring = &ring; }
    SegmentRing* ring() const { return m_ring; }

    /// Which triangle sides the downward ray can hit (default: Front)
    void cullMode(geometry::CullMode mode) { m_raycaster.cullMode(mode); }

    /**
     * @brief Advance the probe by one tick
     * @param dt Seconds since the previous tick
     * @return Probe position and the segment under it, if any
     */
    OrbitSample advance(float dt);

    /**
     * @brief Cast a ray straight down from a point against the ring
     * @return Index of the nearest segment hit (lowest index on ties), or std::nullopt
     */
    std::optional<size_t> hitTest(const glm::vec3& origin);

    /// Put the probe back at angle 0 with no spin
    void reset();

    const Probe& probe() const { return m_probe; }
    std::optional<size_t> activeIndex() const { return m_active; }

    // -------------------------------------------------------------------------
    /// @name Operator Interface
    /// @{

    void init(Context& ctx) override;
    void process(Context& ctx) override;
    std::string name() const override { return "OrbitDriver"; }

    std::vector<ParamDecl> params() override { return registeredParams(); }
    bool getParam(const std::string& n, float out[4]) override { return getRegisteredParam(n, out); }
    bool setParam(const std::string& n, const float v[4]) override { return setRegisteredParam(n, v); }

    /// @}

private:
    SegmentRing* m_ring = nullptr;
    geometry::Raycaster m_raycaster;
    Probe m_probe;
    std::optional<size_t> m_active;
};

} // namespace corolla
