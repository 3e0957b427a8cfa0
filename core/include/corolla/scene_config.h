#pragma once

/**
 * @file scene_config.h
 * @brief JSON configuration for the ring, the orbit, and the trail
 *
 * All keys are optional; anything missing keeps its default.
 *
 * @code
 * {
 *   "ring":  { "prefix": "leaf", "count": 32, "innerRadius": 1.2,
 *              "petalLength": 0.9, "petalWidth": 0.28 },
 *   "orbit": { "radius": 1.6, "speed": 1.0, "basePosition": [0, 0.75, 0] },
 *   "trail": { "length": 5, "intensitySmoothing": 0.1, "scaleSmoothing": 0.075,
 *              "amplitude": 0.065, "baseColor": "#fdfcf7", "activeColor": "#6D00A3" }
 * }
 * @endcode
 */

#include <corolla/color.h>
#include <glm/glm.hpp>
#include <string>

namespace corolla {

class OrbitDriver;
class TrailField;

/// Procedural ring used when the host has no scene of its own
struct RingConfig {
    std::string prefix = "leaf";
    int count = 32;
    float innerRadius = 1.2f;
    float petalLength = 0.9f;
    float petalWidth = 0.28f;
};

struct OrbitConfig {
    float radius = 1.6f;
    float speed = 1.0f;
    glm::vec3 basePosition{0.0f, 0.75f, 0.0f};
};

struct TrailConfig {
    float length = 5.0f;
    float intensitySmoothing = 0.1f;
    float scaleSmoothing = 0.075f;
    float amplitude = 0.065f;
    Color baseColor = Color::Ivory;
    Color activeColor = Color::DeepPurple;
};

class SceneConfig {
public:
    RingConfig ring;
    OrbitConfig orbit;
    TrailConfig trail;

    /**
     * @brief Load from a JSON file
     * @return False on I/O, parse, or type errors (see error()); fields parsed
     *         before the failure keep their new values
     */
    bool load(const std::string& path);

    /// Load from a JSON string (same rules as load())
    bool loadFromString(const std::string& text);

    /// Serialize the current values
    std::string toJson(int indent = 2) const;

    /// Copy orbit values into a driver's params (clears bindings)
    void applyTo(OrbitDriver& orbit) const;

    /// Copy trail values into a trail field's params (clears bindings)
    void applyTo(TrailField& trail) const;

    const std::string& error() const { return m_error; }

private:
    std::string m_error;
};

} // namespace corolla
