/**
 * @file test_layout.cpp
 * @brief Byte layout of the host structs against the WGSL host-shareable rules
 */

#include <catch2/catch_test_macros.hpp>

#include <flatdraw/types.h>

#include <cstddef>
#include <cstring>
#include <vector>

using namespace flatdraw;

namespace {

float floatAt(const void* base, size_t byteOffset) {
    float value = 0.0f;
    std::memcpy(&value, static_cast<const unsigned char*>(base) + byteOffset, sizeof(float));
    return value;
}

} // namespace

TEST_CASE("CameraUniform layout", "[layout][camera]") {
    REQUIRE(sizeof(CameraUniform) == 16);

    CameraUniform camera({1.5f, -2.5f}, 1.25f, 0.75f);
    REQUIRE(floatAt(&camera, 0) == 1.5f);
    REQUIRE(floatAt(&camera, 4) == -2.5f);
    REQUIRE(floatAt(&camera, 8) == 1.25f);
    REQUIRE(floatAt(&camera, 12) == 0.75f);
}

TEST_CASE("RectangleInstance array layout", "[layout][rectangle]") {
    REQUIRE(sizeof(RectangleInstance) == 48);
    REQUIRE(offsetof(RectangleInstance, color) == 16);
    REQUIRE(offsetof(RectangleInstance, size) == 32);

    std::vector<RectangleInstance> rects = {
        RectangleInstance({1.0f, 2.0f}, {0.1f, 0.2f, 0.3f}, {4.0f, 5.0f}),
        RectangleInstance({6.0f, 7.0f}, {0.4f, 0.5f, 0.6f}, {8.0f, 9.0f}),
    };
    const void* bytes = rects.data();

    SECTION("second record starts at the stride") {
        REQUIRE(floatAt(bytes, 48 + 0) == 6.0f);
        REQUIRE(floatAt(bytes, 48 + 4) == 7.0f);
        REQUIRE(floatAt(bytes, 48 + 16) == 0.4f);
        REQUIRE(floatAt(bytes, 48 + 32) == 8.0f);
        REQUIRE(floatAt(bytes, 48 + 36) == 9.0f);
    }

    SECTION("padding is zeroed") {
        REQUIRE(floatAt(bytes, 8) == 0.0f);
        REQUIRE(floatAt(bytes, 12) == 0.0f);
        REQUIRE(floatAt(bytes, 28) == 0.0f);
        REQUIRE(floatAt(bytes, 40) == 0.0f);
        REQUIRE(floatAt(bytes, 44) == 0.0f);
    }
}

TEST_CASE("CircleInstance array layout", "[layout][circle]") {
    REQUIRE(sizeof(CircleInstance) == 32);
    REQUIRE(offsetof(CircleInstance, color) == 16);
    REQUIRE(offsetof(CircleInstance, radius) == 28);

    std::vector<CircleInstance> circles = {
        CircleInstance({1.0f, 2.0f}, {0.1f, 0.2f, 0.3f}, 4.0f),
        CircleInstance({5.0f, 6.0f}, {0.7f, 0.8f, 0.9f}, 10.0f),
    };
    const void* bytes = circles.data();

    // Radius sits right after the three color components
    REQUIRE(floatAt(bytes, 24) == 0.3f);
    REQUIRE(floatAt(bytes, 28) == 4.0f);
    REQUIRE(floatAt(bytes, 32 + 0) == 5.0f);
    REQUIRE(floatAt(bytes, 32 + 16) == 0.7f);
    REQUIRE(floatAt(bytes, 32 + 28) == 10.0f);
}
