// Corolla - Trail Field

#include <corolla/trail_field.h>
#include <corolla/orbit_driver.h>
#include <corolla/segment_ring.h>
#include <corolla/context.h>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace corolla {

namespace {

inline float lerp(float from, float to, float t) {
    return (1.0f - t) * from + t * to;
}

} // anonymous namespace

float trailTarget(float distance, float trailLength) {
    if (!(distance < trailLength)) {
        return 0.0f;
    }
    return 1.0f - distance / trailLength;
}

float trailScaleTarget(float target, bool insideTrail, float amplitude) {
    if (!insideTrail) {
        return 1.0f;
    }
    return 1.0f + std::sin(target * glm::half_pi<float>()) * amplitude;
}

TrailFrame computeTrailFrame(std::optional<size_t> active,
                             const std::vector<float>& previousIntensity,
                             const std::vector<float>& previousScale,
                             const TrailSettings& settings) {
    const size_t n = previousIntensity.size();

    TrailFrame frame;
    frame.intensity.resize(n);
    frame.colors.resize(n);
    frame.scales.resize(n);

    for (size_t i = 0; i < n; ++i) {
        float distance = SegmentRing::ringDistance(active, i, n);
        bool insideTrail = distance < settings.trailLength;
        float target = trailTarget(distance, settings.trailLength);

        float intensity = lerp(previousIntensity[i], target, settings.intensitySmoothing);
        frame.intensity[i] = intensity;
        frame.colors[i] = settings.baseColor.lerp(settings.activeColor, intensity);

        // Scale follows the raw target, not the smoothed intensity
        float scaleTarget = trailScaleTarget(target, insideTrail, settings.amplitude);
        float prevScale = i < previousScale.size() ? previousScale[i] : 1.0f;
        frame.scales[i] = prevScale + (scaleTarget - prevScale) * settings.scaleSmoothing;
    }

    return frame;
}

TrailField::TrailField() {
    registerParam(trailLength);
    registerParam(intensitySmoothing);
    registerParam(scaleSmoothing);
    registerParam(amplitude);
    registerParam(baseColor);
    registerParam(activeColor);
}

TrailField::TrailField(SegmentRing& ring)
    : TrailField() {
    attach(ring);
}

void TrailField::attach(SegmentRing& ring) {
    m_ring = &ring;
    reset();
}

TrailField& TrailField::input(OrbitDriver* orbit) {
    m_orbit = orbit;
    setInput(0, orbit);
    return *this;
}

TrailSettings TrailField::settings() const {
    TrailSettings s;
    s.trailLength = trailLength;
    s.intensitySmoothing = intensitySmoothing;
    s.scaleSmoothing = scaleSmoothing;
    s.amplitude = amplitude;
    s.baseColor = baseColor.get();
    s.activeColor = activeColor.get();
    return s;
}

void TrailField::resizeState(size_t n) {
    m_intensity.resize(n, 0.0f);
    m_scale.resize(n, 1.0f);
}

void TrailField::reset() {
    m_intensity.assign(m_ring ? m_ring->size() : 0, 0.0f);
    m_scale.assign(m_intensity.size(), 1.0f);
}

void TrailField::update(std::optional<size_t> active) {
    size_t n = m_ring ? m_ring->size() : 0;
    if (m_intensity.size() != n) {
        resizeState(n);
    }
    if (active && *active >= n) {
        active.reset();
    }

    TrailFrame frame = computeTrailFrame(active, m_intensity, m_scale, settings());
    m_intensity = std::move(frame.intensity);
    m_scale = std::move(frame.scales);

    for (size_t i = 0; i < n; ++i) {
        Segment& seg = (*m_ring)[i];
        seg.color = frame.colors[i];
        seg.scale = m_scale[i];
    }
}

void TrailField::init(Context& ctx) {
    Operator::init(ctx);
    if (m_ring) {
        resizeState(m_ring->size());
    }
}

void TrailField::process(Context& ctx) {
    update(m_orbit ? m_orbit->activeIndex() : std::nullopt);
}

} // namespace corolla
