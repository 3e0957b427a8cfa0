// Corolla - Scene Configuration

#include <corolla/scene_config.h>
#include <corolla/orbit_driver.h>
#include <corolla/trail_field.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace corolla {

using json = nlohmann::json;

namespace {

template<typename T>
void read(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end()) {
        out = it->get<T>();
    }
}

bool readColor(const json& obj, const char* key, Color& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;

    auto parsed = Color::parseHex(it->get<std::string>());
    if (!parsed) {
        error = std::string("Invalid color for '") + key + "': " + it->get<std::string>();
        return false;
    }
    out = *parsed;
    return true;
}

bool readVec3(const json& obj, const char* key, glm::vec3& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;

    if (!it->is_array() || it->size() != 3) {
        error = std::string("'") + key + "' must be an array of 3 numbers";
        return false;
    }
    out = glm::vec3((*it)[0].get<float>(), (*it)[1].get<float>(), (*it)[2].get<float>());
    return true;
}

// Section to read, or nullptr if absent, malformed, or an earlier error is pending
const json* section(const json& root, const char* key, std::string& error) {
    if (!error.empty() || !root.is_object()) return nullptr;

    auto it = root.find(key);
    if (it == root.end()) return nullptr;

    if (!it->is_object()) {
        error = std::string("'") + key + "' must be an object";
        return nullptr;
    }
    return &*it;
}

json colorJson(const Color& c) {
    return c.toHexString();
}

} // anonymous namespace

bool SceneConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_error = "Failed to open: " + path;
        std::cerr << "[SceneConfig] " << m_error << "\n";
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

bool SceneConfig::loadFromString(const std::string& text) {
    m_error.clear();

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            m_error = "Top-level JSON value must be an object";
        }

        if (const json* r = section(root, "ring", m_error)) {
            read(*r, "prefix", ring.prefix);
            read(*r, "count", ring.count);
            read(*r, "innerRadius", ring.innerRadius);
            read(*r, "petalLength", ring.petalLength);
            read(*r, "petalWidth", ring.petalWidth);
            if (ring.count < 0) {
                m_error = "ring.count must not be negative";
            }
        }

        if (const json* o = section(root, "orbit", m_error)) {
            read(*o, "radius", orbit.radius);
            read(*o, "speed", orbit.speed);
            readVec3(*o, "basePosition", orbit.basePosition, m_error);
        }

        if (const json* t = section(root, "trail", m_error)) {
            read(*t, "length", trail.length);
            read(*t, "intensitySmoothing", trail.intensitySmoothing);
            read(*t, "scaleSmoothing", trail.scaleSmoothing);
            read(*t, "amplitude", trail.amplitude);
            if (readColor(*t, "baseColor", trail.baseColor, m_error)) {
                readColor(*t, "activeColor", trail.activeColor, m_error);
            }
            if (m_error.empty() && trail.length <= 0.0f) {
                m_error = "trail.length must be positive";
            }
        }
    } catch (const json::parse_error& e) {
        m_error = std::string("Parse error: ") + e.what();
    } catch (const json::exception& e) {
        m_error = std::string("Invalid value: ") + e.what();
    }

    if (!m_error.empty()) {
        std::cerr << "[SceneConfig] " << m_error << "\n";
        return false;
    }
    return true;
}

std::string SceneConfig::toJson(int indent) const {
    json root;
    root["ring"] = {
        {"prefix", ring.prefix},
        {"count", ring.count},
        {"innerRadius", ring.innerRadius},
        {"petalLength", ring.petalLength},
        {"petalWidth", ring.petalWidth}
    };
    root["orbit"] = {
        {"radius", orbit.radius},
        {"speed", orbit.speed},
        {"basePosition", {orbit.basePosition.x, orbit.basePosition.y, orbit.basePosition.z}}
    };
    root["trail"] = {
        {"length", trail.length},
        {"intensitySmoothing", trail.intensitySmoothing},
        {"scaleSmoothing", trail.scaleSmoothing},
        {"amplitude", trail.amplitude},
        {"baseColor", colorJson(trail.baseColor)},
        {"activeColor", colorJson(trail.activeColor)}
    };
    return root.dump(indent);
}

void SceneConfig::applyTo(OrbitDriver& driver) const {
    driver.radius = orbit.radius;
    driver.speed = orbit.speed;
    driver.basePosition.set(orbit.basePosition);
}

void SceneConfig::applyTo(TrailField& field) const {
    field.trailLength = trail.length;
    field.intensitySmoothing = trail.intensitySmoothing;
    field.scaleSmoothing = trail.scaleSmoothing;
    field.amplitude = trail.amplitude;
    field.baseColor = trail.baseColor;
    field.activeColor = trail.activeColor;
}

} // namespace corolla
