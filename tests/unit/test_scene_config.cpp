/**
 * @file test_scene_config.cpp
 * @brief Unit tests for JSON scene configuration
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <corolla/scene_config.h>
#include <corolla/orbit_driver.h>
#include <corolla/trail_field.h>
#include <nlohmann/json.hpp>

using namespace corolla;
using Catch::Matchers::WithinAbs;

TEST_CASE("Scene config defaults", "[config][defaults]") {
    SceneConfig config;
    REQUIRE(config.ring.prefix == "leaf");
    REQUIRE(config.ring.count == 32);
    REQUIRE(config.orbit.radius == 1.6f);
    REQUIRE(config.orbit.basePosition == glm::vec3(0.0f, 0.75f, 0.0f));
    REQUIRE(config.trail.length == 5.0f);
    REQUIRE(config.trail.activeColor == Color::DeepPurple);

    SECTION("empty object keeps everything") {
        REQUIRE(config.loadFromString("{}"));
        REQUIRE(config.ring.count == 32);
        REQUIRE(config.error().empty());
    }
}

TEST_CASE("Scene config parsing", "[config][parse]") {
    SceneConfig config;

    SECTION("partial sections override only what they name") {
        REQUIRE(config.loadFromString(R"({
            "ring":  { "count": 12, "prefix": "petal" },
            "orbit": { "speed": 2.5, "basePosition": [1, 2, 3] },
            "trail": { "length": 3, "activeColor": "#ff0000" }
        })"));

        REQUIRE(config.ring.count == 12);
        REQUIRE(config.ring.prefix == "petal");
        REQUIRE(config.ring.innerRadius == 1.2f);
        REQUIRE(config.orbit.speed == 2.5f);
        REQUIRE(config.orbit.radius == 1.6f);
        REQUIRE(config.orbit.basePosition == glm::vec3(1.0f, 2.0f, 3.0f));
        REQUIRE(config.trail.length == 3.0f);
        REQUIRE(config.trail.activeColor == Color(1.0f, 0.0f, 0.0f));
        REQUIRE(config.trail.baseColor == Color::Ivory);
    }

    SECTION("malformed JSON") {
        REQUIRE_FALSE(config.loadFromString("{ \"ring\": "));
        REQUIRE_FALSE(config.error().empty());
    }

    SECTION("non-object root") {
        REQUIRE_FALSE(config.loadFromString("[1, 2]"));
    }

    SECTION("wrong value type") {
        REQUIRE_FALSE(config.loadFromString(R"({ "orbit": { "radius": "far" } })"));
    }

    SECTION("bad color") {
        REQUIRE_FALSE(config.loadFromString(R"({ "trail": { "baseColor": "#zzzzzz" } })"));
    }

    SECTION("base position must have three components") {
        REQUIRE_FALSE(config.loadFromString(R"({ "orbit": { "basePosition": [1, 2] } })"));
    }

    SECTION("negative count") {
        REQUIRE_FALSE(config.loadFromString(R"({ "ring": { "count": -1 } })"));
    }

    SECTION("non-positive trail length") {
        REQUIRE_FALSE(config.loadFromString(R"({ "trail": { "length": 0 } })"));
    }

    SECTION("ring section must be an object") {
        REQUIRE_FALSE(config.loadFromString(R"({ "ring": 5 })"));
        REQUIRE(config.error() == "'ring' must be an object");
    }

    SECTION("orbit section must be an object") {
        REQUIRE_FALSE(config.loadFromString(R"({ "orbit": [1.6, 1.0] })"));
        REQUIRE(config.error() == "'orbit' must be an object");
    }

    SECTION("trail section must be an object") {
        REQUIRE_FALSE(config.loadFromString(R"({ "trail": "x" })"));
        REQUIRE(config.error() == "'trail' must be an object");
    }

    SECTION("color must be a string") {
        REQUIRE_FALSE(config.loadFromString(R"({ "trail": { "activeColor": 7 } })"));
    }

    SECTION("missing file") {
        REQUIRE_FALSE(config.load("/nonexistent/corolla.json"));
        REQUIRE(config.error().find("Failed to open") != std::string::npos);
    }
}

TEST_CASE("Scene config serialization", "[config][json]") {
    SceneConfig config;
    config.orbit.speed = 0.5f;
    config.trail.activeColor = Color::fromHex(0x00FF00u);

    auto root = nlohmann::json::parse(config.toJson());
    REQUIRE(root["ring"]["count"].get<int>() == 32);
    REQUIRE_THAT(root["orbit"]["speed"].get<float>(), WithinAbs(0.5f, 1e-6));
    REQUIRE(root["trail"]["activeColor"].get<std::string>() == "#00ff00");

    SceneConfig reloaded;
    REQUIRE(reloaded.loadFromString(config.toJson()));
    REQUIRE(reloaded.orbit.speed == 0.5f);
    REQUIRE(reloaded.trail.activeColor == Color::fromHex(0x00FF00u));
}

TEST_CASE("Scene config applies to operators", "[config][apply]") {
    SceneConfig config;
    REQUIRE(config.loadFromString(R"({
        "orbit": { "radius": 2.0, "speed": 0.25 },
        "trail": { "length": 7, "amplitude": 0.1 }
    })"));

    OrbitDriver orbit;
    orbit.speed.bindDirect([]() { return 9.0f; });
    config.applyTo(orbit);
    REQUIRE(orbit.radius.get() == 2.0f);
    REQUIRE_FALSE(orbit.speed.isBound());
    REQUIRE(orbit.speed.get() == 0.25f);

    TrailField trail;
    config.applyTo(trail);
    REQUIRE(trail.trailLength.get() == 7.0f);
    REQUIRE(trail.amplitude.get() == 0.1f);
    REQUIRE(trail.settings().baseColor == Color::Ivory);
}
