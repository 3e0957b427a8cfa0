// Corolla Application
// Headless host: builds a procedural ring, runs the chain for N frames,
// and reports per-frame state

#pragma once

#include <corolla/scene_config.h>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace corolla {

// Configuration passed from command-line arguments
struct AppConfig {
    std::string configPath;       // Empty = built-in defaults
    int frames = 600;
    double dt = 1.0 / 60.0;
    bool json = false;            // One JSON object per frame on stdout
    bool quiet = false;

    // Overrides applied on top of the config file
    std::optional<int> segments;
    std::optional<float> radius;
    std::optional<float> speed;
};

// Main application class
// Owns the ring, its meshes, and the chain
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Initialize the application with given config
    // Returns 0 on success, non-zero on error
    int init(const AppConfig& config);

    // Run all frames, writing frame records / summary to out
    // Returns exit code (0 = success)
    int run(std::ostream& out);

    // Number of frames on which the probe was over a segment
    int framesWithHit() const { return m_framesWithHit; }

private:
    void writeFrame(std::ostream& out) const;
    void writeSummary(std::ostream& out) const;

    struct Impl;
    std::unique_ptr<Impl> m_impl;
    AppConfig m_config;
    SceneConfig m_scene;
    int m_framesWithHit = 0;
    bool m_initialized = false;
};

} // namespace corolla
