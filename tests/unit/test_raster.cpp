/**
 * @file test_raster.cpp
 * @brief Unit tests for the software rasterizer
 *
 * Pixel coverage of both programs, discard, submission order and degenerate
 * quads. These tests don't require GPU context.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <flatdraw/raster.h>
#include <flatdraw/types.h>

#include <filesystem>
#include <vector>

using namespace flatdraw;
using Catch::Matchers::WithinAbs;

namespace {

const glm::vec4 BLACK(0.0f, 0.0f, 0.0f, 1.0f);
const glm::vec4 RED(1.0f, 0.0f, 0.0f, 1.0f);
const glm::vec4 BLUE(0.0f, 0.0f, 1.0f, 1.0f);

int countColor(const Framebuffer& fb, const glm::vec4& color) {
    int count = 0;
    for (const auto& p : fb.pixels) {
        if (p == color) ++count;
    }
    return count;
}

} // namespace

TEST_CASE("pixelCenterToClip", "[raster]") {
    glm::vec2 topLeft = pixelCenterToClip(0, 0, 4, 4);
    REQUIRE_THAT(topLeft.x, WithinAbs(-0.75, 1e-6));
    REQUIRE_THAT(topLeft.y, WithinAbs(0.75, 1e-6));

    glm::vec2 bottomRight = pixelCenterToClip(3, 3, 4, 4);
    REQUIRE_THAT(bottomRight.x, WithinAbs(0.75, 1e-6));
    REQUIRE_THAT(bottomRight.y, WithinAbs(-0.75, 1e-6));
}

TEST_CASE("Framebuffer", "[raster]") {
    Framebuffer fb(3, 2, RED);
    REQUIRE(fb.pixels.size() == 6);
    REQUIRE(fb.at(2, 1) == RED);

    fb.clear(BLUE);
    REQUIRE(countColor(fb, BLUE) == 6);
}

TEST_CASE("rasterize rectangles", "[raster][rectangle]") {
    Framebuffer fb(8, 8, BLACK);
    CameraUniform camera;

    SECTION("full screen rectangle covers every pixel") {
        std::vector<RectangleInstance> rects = {
            RectangleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {2.0f, 2.0f}),
        };
        rasterize(fb, camera, {}, rects);
        REQUIRE(countColor(fb, RED) == 64);
    }

    SECTION("half size rectangle covers the middle quarter") {
        std::vector<RectangleInstance> rects = {
            RectangleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f}),
        };
        rasterize(fb, camera, {}, rects);
        REQUIRE(countColor(fb, RED) == 16);
        REQUIRE(fb.at(2, 2) == RED);
        REQUIRE(fb.at(5, 5) == RED);
        REQUIRE(fb.at(1, 1) == BLACK);
        REQUIRE(fb.at(6, 6) == BLACK);
    }

    SECTION("positive Y is up") {
        std::vector<RectangleInstance> rects = {
            RectangleInstance({0.0f, 0.5f}, {1.0f, 0.0f, 0.0f}, {2.0f, 1.0f}),
        };
        rasterize(fb, camera, {}, rects);
        REQUIRE(fb.at(0, 0) == RED);
        REQUIRE(fb.at(0, 7) == BLACK);
    }

    SECTION("zero size draws nothing") {
        std::vector<RectangleInstance> rects = {
            RectangleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f}),
        };
        rasterize(fb, camera, {}, rects);
        REQUIRE(countColor(fb, BLACK) == 64);
    }

    SECTION("zero aspect draws nothing") {
        std::vector<RectangleInstance> rects = {
            RectangleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f}),
        };
        rasterize(fb, CameraUniform({0.0f, 0.0f}, 0.0f, 1.0f), {}, rects);
        REQUIRE(countColor(fb, BLACK) == 64);
    }
}

TEST_CASE("rasterize circles", "[raster][circle]") {
    Framebuffer fb(16, 16, BLACK);
    CameraUniform camera;

    std::vector<CircleInstance> circles = {
        CircleInstance({0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, 1.0f),
    };
    rasterize(fb, camera, circles, {});

    SECTION("center is filled") {
        REQUIRE(fb.at(7, 7) == BLUE);
        REQUIRE(fb.at(8, 8) == BLUE);
    }

    SECTION("corners are discarded and keep the clear color") {
        REQUIRE(fb.at(0, 0) == BLACK);
        REQUIRE(fb.at(15, 0) == BLACK);
        REQUIRE(fb.at(0, 15) == BLACK);
        REQUIRE(fb.at(15, 15) == BLACK);
    }

    SECTION("area is close to pi r^2") {
        // 256 pixels over a 2x2 clip square, disk area pi -> about 201 pixels
        int filled = countColor(fb, BLUE);
        REQUIRE(filled > 180);
        REQUIRE(filled < 220);
    }
}

TEST_CASE("rasterize draws circles before rectangles", "[raster]") {
    Framebuffer fb(4, 4, BLACK);
    CameraUniform camera;

    std::vector<CircleInstance> circles = {
        CircleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, 1.0f),
    };
    std::vector<RectangleInstance> rects = {
        RectangleInstance({0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {2.0f, 2.0f}),
    };

    rasterize(fb, camera, circles, rects);
    REQUIRE(countColor(fb, BLUE) == 16);
    REQUIRE(countColor(fb, RED) == 0);
}

TEST_CASE("later instances overwrite earlier ones", "[raster]") {
    Framebuffer fb(4, 4, BLACK);
    std::vector<RectangleInstance> rects = {
        RectangleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {2.0f, 2.0f}),
        RectangleInstance({0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {2.0f, 2.0f}),
    };

    rasterize(fb, CameraUniform(), {}, rects);
    REQUIRE(countColor(fb, BLUE) == 16);
}

TEST_CASE("renderSnapshot", "[raster][io]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "flatdraw_test_snapshot.png";
    std::vector<CircleInstance> circles = {
        CircleInstance({0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, 1.0f),
    };

    SECTION("small frame is written") {
        REQUIRE(renderSnapshot(path.string(), 16, 8, CameraUniform(), BLACK, circles, {}));
        REQUIRE(fs::exists(path));
        REQUIRE(fs::file_size(path) > 0);
    }

    SECTION("frame too large to allocate fails without throwing") {
        bool written = true;
        REQUIRE_NOTHROW(written = renderSnapshot(path.string(), 1 << 30, 1 << 30,
                                                 CameraUniform(), BLACK, circles, {}));
        REQUIRE_FALSE(written);
    }

    SECTION("empty size is rejected") {
        REQUIRE_FALSE(renderSnapshot(path.string(), 0, 8, CameraUniform(), BLACK, circles, {}));
    }

    std::error_code ec;
    fs::remove(path, ec);
}
