/**
 * @file test_renderer.cpp
 * @brief ShapeRenderer behavior that doesn't require GPU context
 */

#include <catch2/catch_test_macros.hpp>

#include <flatdraw/shape_renderer.h>

#include <vector>

using namespace flatdraw;

TEST_CASE("growCapacity", "[renderer]") {
    SECTION("empty storage still holds one record") {
        REQUIRE(growCapacity(0, 0) == 1);
    }

    SECTION("capacity is kept while the data fits") {
        REQUIRE(growCapacity(10, 10) == 10);
        REQUIRE(growCapacity(10, 3) == 10);
        REQUIRE(growCapacity(1, 0) == 1);
    }

    SECTION("growth adds a quarter headroom") {
        REQUIRE(growCapacity(0, 8) == 10);
        REQUIRE(growCapacity(10, 11) == 13);
        REQUIRE(growCapacity(1, 3) == 3);
    }
}

TEST_CASE("ShapeRenderer before init", "[renderer]") {
    ShapeRenderer renderer;

    REQUIRE_FALSE(renderer.isInitialized());
    REQUIRE(renderer.circleCount() == 0);
    REQUIRE(renderer.rectangleCount() == 0);

    SECTION("calls are ignored") {
        std::vector<CircleInstance> circles(3);
        renderer.prepare(CameraUniform(), circles, {});
        renderer.paint(nullptr);
        renderer.render(nullptr, glm::vec4(0.0f));
        REQUIRE(renderer.circleCount() == 0);
    }

    SECTION("cleanup is safe") {
        renderer.cleanup();
        renderer.cleanup();
        REQUIRE_FALSE(renderer.isInitialized());
    }
}
