// Corolla - Segment Ring

#include <corolla/segment_ring.h>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace corolla {

glm::mat4 Segment::worldTransform() const {
    return glm::scale(placement, glm::vec3(scale));
}

std::optional<int> SegmentRing::parseSuffix(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) {
        return std::nullopt;
    }

    std::string digits = name.substr(dot + 1);
    if (digits.size() > 9) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return std::stoi(digits);
}

float SegmentRing::ringDistance(std::optional<size_t> active, size_t i, size_t n) {
    if (!active || n == 0) {
        return std::numeric_limits<float>::infinity();
    }
    size_t a = *active;
    size_t diff = a > i ? a - i : i - a;
    return static_cast<float>(std::min(diff, n - diff));
}

SegmentRing SegmentRing::fromMeshes(const std::vector<NamedMesh>& meshes,
                                    const std::string& prefix) {
    struct Keyed {
        int suffix;
        const NamedMesh* source;
    };

    std::vector<Keyed> keyed;
    for (const auto& m : meshes) {
        if (m.name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        auto suffix = parseSuffix(m.name);
        if (!suffix) {
            throw std::runtime_error("Segment name has no numeric suffix: " + m.name);
        }
        keyed.push_back({*suffix, &m});
    }

    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const Keyed& a, const Keyed& b) { return a.suffix < b.suffix; });

    SegmentRing ring;
    ring.m_segments.reserve(keyed.size());
    for (const auto& k : keyed) {
        Segment s;
        s.name = k.source->name;
        s.mesh = k.source->mesh;
        s.placement = k.source->placement;
        ring.m_segments.push_back(std::move(s));
    }

    if (ring.empty()) {
        std::cerr << "[SegmentRing] No meshes matched prefix '" << prefix << "'" << std::endl;
    }

    return ring;
}

std::vector<NamedMesh> SegmentRing::layout(const geometry::Mesh& petal, size_t count,
                                           float innerRadius, const std::string& prefix) {
    std::vector<NamedMesh> out;
    out.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        float theta = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(count);
        glm::mat4 m = glm::rotate(glm::mat4(1.0f), theta, glm::vec3(0, 1, 0));
        m = glm::translate(m, glm::vec3(innerRadius, 0, 0));

        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), ".%03zu", i);

        out.push_back({prefix + suffix, &petal, m});
    }

    return out;
}

std::optional<size_t> SegmentRing::indexOf(const std::string& name) const {
    for (size_t i = 0; i < m_segments.size(); ++i) {
        if (m_segments[i].name == name) return i;
    }
    return std::nullopt;
}

} // namespace corolla
