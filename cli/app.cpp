// Corolla Application

#include "app.h"
#include <corolla/corolla.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>

namespace corolla {

using json = nlohmann::json;

struct Application::Impl {
    geometry::Mesh petal;
    SegmentRing ring;
    Context ctx;
    Chain chain;
    OrbitDriver* orbit = nullptr;
    TrailField* trail = nullptr;
    std::map<size_t, int> hitsPerSegment;
};

Application::Application()
    : m_impl(std::make_unique<Impl>()) {}

Application::~Application() = default;

int Application::init(const AppConfig& config) {
    m_config = config;

    if (!config.configPath.empty()) {
        if (!m_scene.load(config.configPath)) {
            std::cerr << "Error: " << m_scene.error() << "\n";
            return 1;
        }
        // stdout carries frame records in JSON mode
        if (!config.quiet && !config.json) {
            std::cout << "[Application] Loaded config: " << config.configPath << std::endl;
        }
    }

    if (config.segments) m_scene.ring.count = *config.segments;
    if (config.radius) m_scene.orbit.radius = *config.radius;
    if (config.speed) m_scene.orbit.speed = *config.speed;

    if (m_scene.ring.count < 0) {
        std::cerr << "Error: segment count must not be negative\n";
        return 1;
    }

    const RingConfig& rc = m_scene.ring;
    m_impl->petal = geometry::MeshBuilder::petal(rc.petalLength, rc.petalWidth, 8).build();

    try {
        m_impl->ring = SegmentRing::fromMeshes(
            SegmentRing::layout(m_impl->petal, static_cast<size_t>(rc.count), rc.innerRadius, rc.prefix),
            rc.prefix);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Added in reverse order on purpose: the chain orders by inputs
    auto& trail = m_impl->chain.add<TrailField>("trail", m_impl->ring);
    auto& orbit = m_impl->chain.add<OrbitDriver>("orbit", m_impl->ring);
    trail.input(&orbit);

    m_scene.applyTo(orbit);
    m_scene.applyTo(trail);

    m_impl->orbit = &orbit;
    m_impl->trail = &trail;

    m_impl->chain.init(m_impl->ctx);
    if (m_impl->chain.hasError()) {
        std::cerr << "Error: " << m_impl->chain.error() << "\n";
        return 1;
    }

    if (!config.quiet && !config.json) {
        std::cout << "[Application] " << m_impl->ring.size() << " segments, radius "
                  << static_cast<float>(orbit.radius) << ", speed " << static_cast<float>(orbit.speed)
                  << ", " << config.frames << " frames at dt " << config.dt << std::endl;
    }

    m_initialized = true;
    return 0;
}

int Application::run(std::ostream& out) {
    if (!m_initialized) {
        return 1;
    }

    Impl& impl = *m_impl;
    for (int i = 0; i < m_config.frames; ++i) {
        impl.ctx.beginFrame(m_config.dt);
        impl.chain.process(impl.ctx);

        if (impl.ctx.hasError()) {
            std::cerr << "Error: " << impl.ctx.error() << "\n";
            return 1;
        }

        if (auto active = impl.orbit->activeIndex()) {
            ++m_framesWithHit;
            ++impl.hitsPerSegment[*active];
        }

        if (m_config.json) {
            writeFrame(out);
        }

        impl.ctx.endFrame();
    }

    if (!m_config.json && !m_config.quiet) {
        writeSummary(out);
    }

    return 0;
}

void Application::writeFrame(std::ostream& out) const {
    const Impl& impl = *m_impl;
    const Probe& probe = impl.orbit->probe();

    json frame;
    frame["frame"] = impl.ctx.frame();
    frame["time"] = impl.ctx.time();
    frame["probe"] = {
        {"position", {probe.position.x, probe.position.y, probe.position.z}},
        {"angle", probe.angle},
        {"spin", probe.spin}
    };

    auto active = impl.orbit->activeIndex();
    frame["active"] = active ? json(*active) : json(nullptr);

    json colors = json::array();
    for (const Segment& s : impl.ring) {
        colors.push_back(s.color.toHexString());
    }
    frame["intensity"] = impl.trail->intensities();
    frame["scale"] = impl.trail->scales();
    frame["color"] = colors;

    out << frame.dump() << "\n";
}

void Application::writeSummary(std::ostream& out) const {
    const Impl& impl = *m_impl;
    const Probe& probe = impl.orbit->probe();

    out << "Frames:        " << m_config.frames << "\n";
    out << "Elapsed:       " << impl.ctx.time() << " s\n";
    out << "Probe angle:   " << probe.angle << " rad\n";
    out << "Frames on hit: " << m_framesWithHit << "\n";
    out << "Segments hit:  " << impl.hitsPerSegment.size() << " of " << impl.ring.size() << "\n";

    auto active = impl.orbit->activeIndex();
    if (active) {
        out << "Active:        " << impl.ring[*active].name << "\n";
    } else {
        out << "Active:        (none)\n";
    }
}

} // namespace corolla
