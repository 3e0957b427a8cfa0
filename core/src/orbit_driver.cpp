// Corolla - Orbit Driver

#include <corolla/orbit_driver.h>
#include <corolla/segment_ring.h>
#include <corolla/context.h>
#include <cmath>

namespace corolla {

OrbitDriver::OrbitDriver() {
    registerParam(radius);
    registerParam(speed);
    registerParam(basePosition);
}

OrbitDriver::OrbitDriver(SegmentRing& ring)
    : OrbitDriver() {
    m_ring = &ring;
}

void OrbitDriver::init(Context& ctx) {
    Operator::init(ctx);
    // Place the probe before the first tick so hosts can draw it immediately
    glm::vec3 base = basePosition.get();
    m_probe.position = base + glm::vec3(static_cast<float>(radius) * std::cos(m_probe.angle), 0.0f,
                                        static_cast<float>(radius) * std::sin(m_probe.angle));
}

OrbitSample OrbitDriver::advance(float dt) {
    // Parameters may be bound to live sources, so read them once per tick
    float r = radius;
    float s = speed;
    glm::vec3 base = basePosition.get();

    m_probe.angle -= s * dt;
    m_probe.position = glm::vec3(base.x + r * std::cos(m_probe.angle),
                                 base.y,
                                 base.z + r * std::sin(m_probe.angle));
    m_probe.spin += SPIN_PER_TICK;

    m_active = hitTest(m_probe.position);
    return {m_probe.position, m_active};
}

std::optional<size_t> OrbitDriver::hitTest(const glm::vec3& origin) {
    if (!m_ring || m_ring->empty()) {
        return std::nullopt;
    }

    m_raycaster.set(origin, glm::vec3(0.0f, -1.0f, 0.0f));

    std::optional<size_t> nearest;
    float nearestDistance = 0.0f;

    for (size_t i = 0; i < m_ring->size(); ++i) {
        const Segment& seg = (*m_ring)[i];
        if (!seg.mesh) continue;

        auto hit = m_raycaster.intersect(*seg.mesh, seg.worldTransform());
        // Strict comparison keeps the lowest index on ties
        if (hit && (!nearest || hit->distance < nearestDistance)) {
            nearest = i;
            nearestDistance = hit->distance;
        }
    }

    return nearest;
}

void OrbitDriver::reset() {
    m_probe.angle = 0.0f;
    m_probe.spin = 0.0f;
    m_active.reset();
}

void OrbitDriver::process(Context& ctx) {
    advance(static_cast<float>(ctx.dt()));
}

} // namespace corolla
