/**
 * @file test_chain.cpp
 * @brief Integration tests for the orbit -> trail chain
 *
 * Runs the full per-frame pipeline on a procedural ring without any renderer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <corolla/corolla.h>
#include <set>
#include <stdexcept>

using namespace corolla;
using Catch::Matchers::WithinAbs;

TEST_CASE("Chain basic operations", "[integration][chain]") {
    Chain chain;

    SECTION("add operator returns reference") {
        OrbitDriver& orbit = chain.add<OrbitDriver>("orbit");
        REQUIRE(orbit.name() == "OrbitDriver");
        REQUIRE(chain.size() == 1);
    }

    SECTION("getByName finds operator") {
        chain.add<TrailField>("trail");
        Operator* op = chain.getByName("trail");
        REQUIRE(op != nullptr);
        REQUIRE(op->name() == "TrailField");
        REQUIRE(chain.getByName("nonexistent") == nullptr);
    }

    SECTION("get<T> checks name and type") {
        chain.add<OrbitDriver>("orbit");
        REQUIRE(chain.get<OrbitDriver>("orbit").name() == "OrbitDriver");
        REQUIRE_THROWS_AS(chain.get<TrailField>("orbit"), std::runtime_error);
        REQUIRE_THROWS_AS(chain.get<OrbitDriver>("missing"), std::runtime_error);
    }

    SECTION("getName returns the name an operator was added under") {
        OrbitDriver& orbit = chain.add<OrbitDriver>("probe");
        REQUIRE(chain.getName(&orbit) == "probe");
    }

    SECTION("adding under an existing name replaces the operator") {
        chain.add<OrbitDriver>("op");
        chain.add<TrailField>("op");
        REQUIRE(chain.size() == 1);
        REQUIRE(chain.getByName("op")->name() == "TrailField");
    }
}

TEST_CASE("Chain orders operators by their inputs", "[integration][chain]") {
    SegmentRing ring;
    Chain chain;
    Context ctx;

    auto& trail = chain.add<TrailField>("trail", ring);
    auto& orbit = chain.add<OrbitDriver>("orbit", ring);
    trail.input(&orbit);

    chain.init(ctx);
    REQUIRE_FALSE(chain.hasError());
    REQUIRE(chain.executionOrder().size() == 2);
    REQUIRE(chain.executionOrder()[0] == &orbit);
    REQUIRE(chain.executionOrder()[1] == &trail);
    REQUIRE(orbit.isInitialized());
    REQUIRE(trail.isInitialized());

    REQUIRE(chain.operatorNames()[0] == "trail");
}

TEST_CASE("Chain re-sorts when inputs change after the first frame", "[integration][chain]") {
    geometry::Mesh petal = geometry::MeshBuilder::petal(0.9f, 0.28f).build();
    SegmentRing ring = SegmentRing::fromMeshes(SegmentRing::layout(petal, 8, 1.2f));
    Chain chain;
    Context ctx;

    auto& trail = chain.add<TrailField>("trail", ring);
    auto& orbit = chain.add<OrbitDriver>("orbit", ring);

    ctx.beginFrame(1.0 / 60.0);
    chain.process(ctx);
    ctx.endFrame();
    REQUIRE(chain.executionOrder()[0] == &trail);
    REQUIRE(trail.intensities()[0] == 0.0f);

    trail.input(&orbit);

    ctx.beginFrame(1.0 / 60.0);
    chain.process(ctx);
    ctx.endFrame();
    REQUIRE_FALSE(chain.hasError());
    REQUIRE(chain.executionOrder()[0] == &orbit);
    REQUIRE(chain.executionOrder()[1] == &trail);
    REQUIRE(orbit.activeIndex() == std::optional<size_t>(0));
    REQUIRE_THAT(trail.intensities()[0], WithinAbs(0.1f, 1e-6));
}

TEST_CASE("Chain detects circular inputs", "[integration][chain]") {
    Chain chain;
    Context ctx;

    auto& a = chain.add<OrbitDriver>("a");
    auto& b = chain.add<OrbitDriver>("b");
    a.setInput(&b);
    b.setInput(&a);

    chain.init(ctx);
    REQUIRE(chain.hasError());
    REQUIRE(chain.error().find("Circular") != std::string::npos);
    REQUIRE(ctx.hasError());

    // Processing a broken chain reports instead of running
    ctx.clearError();
    chain.process(ctx);
    REQUIRE(ctx.hasError());
    REQUIRE(a.probe().spin == 0.0f);
}

TEST_CASE("Bypassed operators are skipped", "[integration][chain]") {
    Chain chain;
    Context ctx;
    auto& orbit = chain.add<OrbitDriver>("orbit");
    orbit.setBypassed(true);

    ctx.beginFrame(0.1);
    chain.process(ctx);
    ctx.endFrame();

    REQUIRE(orbit.probe().angle == 0.0f);
}

TEST_CASE("Full revolution lights every petal", "[integration][ring]") {
    SceneConfig config;
    geometry::Mesh petal = geometry::MeshBuilder::petal(
        config.ring.petalLength, config.ring.petalWidth, 8).build();
    SegmentRing ring = SegmentRing::fromMeshes(
        SegmentRing::layout(petal, static_cast<size_t>(config.ring.count), config.ring.innerRadius));
    REQUIRE(ring.size() == 32);

    Chain chain;
    Context ctx;
    auto& trail = chain.add<TrailField>("trail", ring);
    auto& orbit = chain.add<OrbitDriver>("orbit", ring);
    trail.input(&orbit);
    config.applyTo(orbit);
    config.applyTo(trail);
    chain.init(ctx);
    REQUIRE_FALSE(chain.hasError());

    std::set<size_t> visited;
    std::vector<size_t> order;
    const double dt = 1.0 / 60.0;

    // 400 frames at 1 rad/s is a little over one full turn
    for (int frame = 0; frame < 400; ++frame) {
        ctx.beginFrame(dt);
        chain.process(ctx);
        ctx.endFrame();

        REQUIRE_FALSE(ctx.hasError());

        for (size_t i = 0; i < ring.size(); ++i) {
            REQUIRE(trail.intensities()[i] >= 0.0f);
            REQUIRE(trail.intensities()[i] <= 1.0f + 1e-6f);
            REQUIRE(ring[i].scale >= 1.0f);
            REQUIRE(ring[i].scale <= 1.0f + 0.065f + 1e-6f);
        }

        if (auto active = orbit.activeIndex()) {
            if (order.empty() || order.back() != *active) {
                order.push_back(*active);
            }
            visited.insert(*active);

            size_t opposite = (*active + ring.size() / 2) % ring.size();
            REQUIRE(trail.intensities()[*active] > trail.intensities()[opposite]);
        }
    }

    REQUIRE(ctx.frame() == 400);
    REQUIRE_THAT(ctx.time(), WithinAbs(400.0 / 60.0, 1e-9));
    REQUIRE(visited.size() == ring.size());

    SECTION("petals light up in ascending ring order") {
        for (size_t k = 1; k < order.size(); ++k) {
            REQUIRE(order[k] == (order[k - 1] + 1) % ring.size());
        }
    }

    SECTION("probe spin counts ticks") {
        REQUIRE_THAT(orbit.probe().spin, WithinAbs(400 * OrbitDriver::SPIN_PER_TICK, 1e-3));
    }
}
