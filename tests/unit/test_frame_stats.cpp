/**
 * @file test_frame_stats.cpp
 * @brief Unit tests for the viewer's frame counter and FPS report
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <flatdraw/frame_stats.h>

using namespace flatdraw;
using Catch::Matchers::WithinAbs;

TEST_CASE("FrameStats counts drawn frames", "[frame_stats]") {
    FrameStats stats;
    REQUIRE(stats.frames() == 0);

    REQUIRE_FALSE(stats.frame(10.0));
    REQUIRE_FALSE(stats.frame(10.1));
    REQUIRE(stats.frames() == 2);
    REQUIRE(stats.fps() == 0.0);
}

TEST_CASE("FrameStats reports once per interval", "[frame_stats]") {
    FrameStats stats;

    REQUIRE_FALSE(stats.frame(0.0));
    REQUIRE_FALSE(stats.frame(0.25));
    REQUIRE_FALSE(stats.frame(0.5));
    REQUIRE_FALSE(stats.frame(0.75));
    REQUIRE(stats.frame(1.0));

    REQUIRE_THAT(stats.fps(), WithinAbs(4.0, 1e-9));
    REQUIRE_THAT(stats.frameTimeMs(), WithinAbs(250.0, 1e-9));
    REQUIRE(stats.frames() == 5);

    SECTION("next report covers only the new interval") {
        REQUIRE_FALSE(stats.frame(1.5));
        REQUIRE(stats.frame(2.0));
        REQUIRE_THAT(stats.fps(), WithinAbs(2.0, 1e-9));
        REQUIRE_THAT(stats.frameTimeMs(), WithinAbs(500.0, 1e-9));
    }

    SECTION("a long stall between frames shows up as one slow frame") {
        REQUIRE(stats.frame(4.0));
        REQUIRE_THAT(stats.fps(), WithinAbs(1.0 / 3.0, 1e-9));
        REQUIRE_THAT(stats.frameTimeMs(), WithinAbs(3000.0, 1e-9));
    }
}
