#pragma once

/**
 * @file trail_field.h
 * @brief Comet-trail intensity, color, and scale for every ring segment
 *
 * Every tick each segment gets a target intensity that ramps linearly from 1
 * at the active segment down to 0 at trailLength hops away (in either
 * direction around the ring). The stored intensity eases toward that target
 * and drives the color blend. Scale follows a separate, slower filter whose
 * target is a sine-eased bulge of the unsmoothed target, so the size pop and
 * the color fade settle at different rates.
 *
 * @par Example
 * @code
 * auto& orbit = chain.add<OrbitDriver>("orbit", ring);
 * auto& trail = chain.add<TrailField>("trail", ring);
 * trail.input(&orbit);
 * trail.activeColor = Color::fromHex("#6D00A3");
 * @endcode
 */

#include <corolla/operator.h>
#include <corolla/param.h>
#include <corolla/param_registry.h>
#include <corolla/color.h>
#include <optional>
#include <vector>

namespace corolla {

class SegmentRing;
class OrbitDriver;

/// Snapshot of the values TrailField reads each tick
struct TrailSettings {
    float trailLength = 5.0f;
    float intensitySmoothing = 0.1f;
    float scaleSmoothing = 0.075f;
    float amplitude = 0.065f;
    Color baseColor = Color::Ivory;
    Color activeColor = Color::DeepPurple;
};

/// Per-segment output of one tick
struct TrailFrame {
    std::vector<float> intensity;
    std::vector<Color> colors;
    std::vector<float> scales;
};

/// Target intensity for a segment at the given ring distance (0 outside the trail)
float trailTarget(float distance, float trailLength);

/// Scale the segment eases toward: 1 + sin(target * pi/2) * amplitude inside the trail, else 1
float trailScaleTarget(float target, bool insideTrail, float amplitude);

/**
 * @brief Compute one tick of the trail from the previous state
 * @param active Segment under the probe, or std::nullopt
 * @param previousIntensity Last tick's intensity (one entry per segment)
 * @param previousScale Last tick's scale (same length)
 * @return New intensity, color, and scale for every segment
 *
 * Pure function: the ring size is previousIntensity.size().
 */
TrailFrame computeTrailFrame(std::optional<size_t> active,
                             const std::vector<float>& previousIntensity,
                             const std::vector<float>& previousScale,
                             const TrailSettings& settings);

class TrailField : public Operator, public ParamRegistry {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters
    /// @{

    Param<float> trailLength{"trailLength", 5.0f, 1.0f, 32.0f};               ///< Hops until target reaches 0
    Param<float> intensitySmoothing{"intensitySmoothing", 0.1f, 0.0f, 1.0f};  ///< Per-tick lerp toward target
    Param<float> scaleSmoothing{"scaleSmoothing", 0.075f, 0.0f, 1.0f};        ///< Per-tick lerp toward scale target
    Param<float> amplitude{"amplitude", 0.065f, 0.0f, 0.5f};                  ///< Extra scale at full intensity
    ColorParam baseColor{"baseColor", Color::Ivory};                          ///< Color at intensity 0
    ColorParam activeColor{"activeColor", Color::DeepPurple};                 ///< Color at intensity 1

    /// @}
    // -------------------------------------------------------------------------

    TrailField();
    explicit TrailField(SegmentRing& ring);

    /// Write into this ring (not owned). Resets intensity to 0 and scale to 1.
    void attach(SegmentRing& ring);
    SegmentRing* ring() const { return m_ring; }

    /// Read the active index from this driver during process()
    TrailField& input(OrbitDriver* orbit);

    /**
     * @brief Advance the trail by one tick and write every segment's color and scale
     * @param active Segment under the probe, or std::nullopt
     */
    void update(std::optional<size_t> active);

    /// Current parameter values
    TrailSettings settings() const;

    /// Zero all intensities and return scales to 1
    void reset();

    const std::vector<float>& intensities() const { return m_intensity; }
    const std::vector<float>& scales() const { return m_scale; }

    // -------------------------------------------------------------------------
    /// @name Operator Interface
    /// @{

    void init(Context& ctx) override;
    void process(Context& ctx) override;
    std::string name() const override { return "TrailField"; }

    std::vector<ParamDecl> params() override { return registeredParams(); }
    bool getParam(const std::string& n, float out[4]) override { return getRegisteredParam(n, out); }
    bool setParam(const std::string& n, const float v[4]) override { return setRegisteredParam(n, v); }

    /// @}

private:
    void resizeState(size_t n);

    SegmentRing* m_ring = nullptr;
    OrbitDriver* m_orbit = nullptr;
    std::vector<float> m_intensity;
    std::vector<float> m_scale;
};

} // namespace corolla
