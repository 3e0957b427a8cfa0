/**
 * @file test_orbit_driver.cpp
 * @brief Unit tests for probe motion and downward hit testing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <corolla/orbit_driver.h>
#include <corolla/segment_ring.h>
#include <corolla/context.h>
#include <corolla/geometry/mesh_builder.h>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>

using namespace corolla;
using namespace corolla::geometry;
using Catch::Matchers::WithinAbs;

namespace {

glm::mat4 at(float x, float y, float z) {
    return glm::translate(glm::mat4(1.0f), glm::vec3(x, y, z));
}

} // namespace

TEST_CASE("Probe travels clockwise around the base position", "[orbit][motion]") {
    OrbitDriver orbit;
    orbit.radius = 2.0f;
    orbit.speed = 1.0f;
    orbit.basePosition.set(0.0f, 1.0f, 0.0f);

    SECTION("half a turn lands on the far side") {
        OrbitSample s = orbit.advance(glm::pi<float>());

        REQUIRE_THAT(orbit.probe().angle, WithinAbs(-glm::pi<float>(), 1e-6));
        REQUIRE_THAT(s.position.x, WithinAbs(-2.0f, 1e-5));
        REQUIRE_THAT(s.position.y, WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(s.position.z, WithinAbs(0.0f, 1e-5));
    }

    SECTION("a quarter turn moves toward -Z") {
        OrbitSample s = orbit.advance(glm::half_pi<float>());
        REQUIRE_THAT(s.position.x, WithinAbs(0.0f, 1e-5));
        REQUIRE_THAT(s.position.z, WithinAbs(-2.0f, 1e-5));
    }

    SECTION("position stays on the circle") {
        for (int i = 0; i < 50; ++i) {
            OrbitSample s = orbit.advance(0.37f);
            glm::vec2 offset(s.position.x, s.position.z);
            REQUIRE_THAT(glm::length(offset), WithinAbs(2.0f, 1e-4));
        }
    }

    SECTION("zero dt keeps the angle") {
        orbit.advance(0.0f);
        REQUIRE(orbit.probe().angle == 0.0f);
        REQUIRE_THAT(orbit.probe().position.x, WithinAbs(2.0f, 1e-6));
    }
}

TEST_CASE("Probe spin is fixed per tick", "[orbit][motion]") {
    OrbitDriver orbit;
    orbit.advance(0.0f);
    orbit.advance(0.5f);
    orbit.advance(2.0f);
    REQUIRE_THAT(orbit.probe().spin, WithinAbs(3 * OrbitDriver::SPIN_PER_TICK, 1e-6));

    orbit.reset();
    REQUIRE(orbit.probe().spin == 0.0f);
    REQUIRE(orbit.probe().angle == 0.0f);
    REQUIRE_FALSE(orbit.activeIndex().has_value());
}

TEST_CASE("Parameters are read every tick and never clamped", "[orbit][params]") {
    OrbitDriver orbit;

    SECTION("out-of-range radius is used as given") {
        orbit.radius = 20.0f;
        OrbitSample s = orbit.advance(0.0f);
        REQUIRE_THAT(s.position.x, WithinAbs(20.0f, 1e-5));
    }

    SECTION("bound speed changes between ticks") {
        float speed = 1.0f;
        orbit.speed.bindDirect([&]() { return speed; });

        orbit.advance(1.0f);
        REQUIRE_THAT(orbit.probe().angle, WithinAbs(-1.0f, 1e-6));

        speed = 2.0f;
        orbit.advance(1.0f);
        REQUIRE_THAT(orbit.probe().angle, WithinAbs(-3.0f, 1e-6));
    }

    SECTION("bound base position moves the orbit plane") {
        float height = 0.5f;
        orbit.basePosition.bindDirect([&]() { return glm::vec3(1.0f, height, 0.0f); });

        OrbitSample s = orbit.advance(0.0f);
        REQUIRE_THAT(s.position.x, WithinAbs(2.6f, 1e-6));
        REQUIRE_THAT(s.position.y, WithinAbs(0.5f, 1e-6));

        height = 1.25f;
        s = orbit.advance(0.0f);
        REQUIRE_THAT(s.position.y, WithinAbs(1.25f, 1e-6));
    }

    SECTION("registered by name") {
        float out[4] = {0};
        REQUIRE(orbit.getParam("radius", out));
        REQUIRE_THAT(out[0], WithinAbs(1.6f, 1e-6));
        REQUIRE(orbit.getParam("speed", out));
        REQUIRE_THAT(out[0], WithinAbs(1.0f, 1e-6));
        REQUIRE(orbit.getParam("basePosition", out));
        REQUIRE_THAT(out[1], WithinAbs(0.75f, 1e-6));
        REQUIRE(orbit.params().size() == 3);
        REQUIRE(orbit.name() == "OrbitDriver");
    }
}

TEST_CASE("Probe over a laid-out ring hits the petal below it", "[orbit][hit]") {
    Mesh petal = MeshBuilder::petal(0.9f, 0.28f, 8).build();
    SegmentRing ring = SegmentRing::fromMeshes(SegmentRing::layout(petal, 8, 1.2f));
    OrbitDriver orbit(ring);

    SECTION("starting angle is over petal 0") {
        OrbitSample s = orbit.advance(0.0f);
        REQUIRE(s.activeIndex == std::optional<size_t>(0));
    }

    SECTION("index grows in the direction of travel") {
        OrbitSample s = orbit.advance(glm::two_pi<float>() * 2.0f / 8.0f);
        REQUIRE(s.activeIndex == std::optional<size_t>(2));
        REQUIRE(orbit.activeIndex() == s.activeIndex);
    }

    SECTION("the gap between petals has no active segment") {
        OrbitSample s = orbit.advance(glm::pi<float>() / 8.0f);
        REQUIRE_FALSE(s.activeIndex.has_value());
    }

    SECTION("a probe below the ring never hits") {
        orbit.basePosition.set(0.0f, -1.0f, 0.0f);
        OrbitSample s = orbit.advance(0.0f);
        REQUIRE_FALSE(s.activeIndex.has_value());
    }
}

TEST_CASE("Hit test picks the nearest segment", "[orbit][hit]") {
    Mesh plane = MeshBuilder::plane(1.0f, 1.0f).build();
    OrbitDriver orbit;
    glm::vec3 probe(1.6f, 0.75f, 0.0f);

    SECTION("higher segment wins") {
        SegmentRing ring = SegmentRing::fromMeshes({
            {"leaf.000", &plane, at(1.7f, 0.0f, 0.2f)},
            {"leaf.001", &plane, at(1.7f, 0.5f, 0.2f)},
        });
        orbit.attach(ring);
        REQUIRE(orbit.hitTest(probe) == std::optional<size_t>(1));
    }

    SECTION("ties go to the lower index") {
        SegmentRing ring = SegmentRing::fromMeshes({
            {"leaf.001", &plane, at(1.7f, 0.0f, 0.2f)},
            {"leaf.000", &plane, at(1.7f, 0.0f, 0.2f)},
        });
        orbit.attach(ring);
        REQUIRE(orbit.hitTest(probe) == std::optional<size_t>(0));
    }

    SECTION("current scale decides the footprint") {
        SegmentRing ring = SegmentRing::fromMeshes({
            {"leaf.000", &plane, at(2.2f, 0.0f, 0.1f)},
        });
        orbit.attach(ring);
        REQUIRE_FALSE(orbit.hitTest(probe).has_value());

        ring[0].scale = 2.0f;
        REQUIRE(orbit.hitTest(probe) == std::optional<size_t>(0));
    }

    SECTION("downward-facing segments are culled unless both sides count") {
        Mesh flipped = MeshBuilder::plane(1.0f, 1.0f).invert().build();
        SegmentRing ring = SegmentRing::fromMeshes({
            {"leaf.000", &flipped, at(1.7f, 0.0f, 0.2f)},
        });
        orbit.attach(ring);
        REQUIRE_FALSE(orbit.hitTest(probe).has_value());

        orbit.cullMode(CullMode::None);
        REQUIRE(orbit.hitTest(probe) == std::optional<size_t>(0));
    }

    SECTION("segments without geometry are skipped") {
        SegmentRing ring = SegmentRing::fromMeshes({
            {"leaf.000", nullptr, at(1.7f, 0.0f, 0.2f)},
            {"leaf.001", &plane, at(1.7f, 0.0f, 0.2f)},
        });
        orbit.attach(ring);
        REQUIRE(orbit.hitTest(probe) == std::optional<size_t>(1));
    }
}

TEST_CASE("Empty or missing ring never reports a hit", "[orbit][hit]") {
    SECTION("no ring attached") {
        OrbitDriver orbit;
        REQUIRE_FALSE(orbit.advance(0.1f).activeIndex.has_value());
    }

    SECTION("empty ring") {
        SegmentRing ring;
        OrbitDriver orbit(ring);
        OrbitSample s = orbit.advance(0.1f);
        REQUIRE_FALSE(s.activeIndex.has_value());
        REQUIRE(orbit.probe().spin > 0.0f);
    }
}

TEST_CASE("OrbitDriver as an operator", "[orbit][operator]") {
    OrbitDriver orbit;
    orbit.radius = 3.0f;
    Context ctx;

    orbit.init(ctx);
    REQUIRE(orbit.isInitialized());
    REQUIRE_THAT(orbit.probe().position.x, WithinAbs(3.0f, 1e-6));

    ctx.beginFrame(0.5);
    orbit.process(ctx);
    ctx.endFrame();
    REQUIRE_THAT(orbit.probe().angle, WithinAbs(-0.5f, 1e-6));
}
