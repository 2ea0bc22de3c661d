/**
 * @file test_scene.cpp
 * @brief Unit tests for scene JSON parsing, serialization and the demo scene
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <flatdraw/scene.h>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace flatdraw;
using nlohmann::json;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

static constexpr double PI = 3.14159265358979323846;

TEST_CASE("sceneFromJson defaults", "[scene]") {
    Scene scene = sceneFromJson(json::object());

    REQUIRE(scene.camera.position == glm::vec2(0.0f));
    REQUIRE(scene.camera.zoom == ViewCamera::DEFAULT_ZOOM);
    REQUIRE(scene.clearColor == glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    REQUIRE(scene.circles.empty());
    REQUIRE(scene.rectangles.empty());
}

TEST_CASE("sceneFromJson reads every field", "[scene]") {
    json j = json::parse(R"({
        "camera": { "position": [1.5, -2], "zoom": 0.5 },
        "clearColor": [0.2, 0.3, 0.4],
        "circles": [ { "position": [3, 0], "color": [1, 0, 0], "radius": 2 } ],
        "rectangles": [
            { "position": [0, 7.5], "color": [0.1, 0.1, 0.1], "size": [30, 1] },
            { "size": [2, 3] }
        ]
    })");

    Scene scene = sceneFromJson(j);

    REQUIRE(scene.camera.position == glm::vec2(1.5f, -2.0f));
    REQUIRE(scene.camera.zoom == 0.5f);
    REQUIRE(scene.clearColor == glm::vec4(0.2f, 0.3f, 0.4f, 1.0f));

    REQUIRE(scene.circles.size() == 1);
    REQUIRE(scene.circles[0].position == glm::vec2(3.0f, 0.0f));
    REQUIRE(scene.circles[0].color == glm::vec3(1.0f, 0.0f, 0.0f));
    REQUIRE(scene.circles[0].radius == 2.0f);

    REQUIRE(scene.rectangles.size() == 2);
    REQUIRE(scene.rectangles[0].size == glm::vec2(30.0f, 1.0f));

    SECTION("missing record keys default to zero") {
        REQUIRE(scene.rectangles[1].position == glm::vec2(0.0f));
        REQUIRE(scene.rectangles[1].color == glm::vec3(0.0f));
        REQUIRE(scene.rectangles[1].size == glm::vec2(2.0f, 3.0f));
    }
}

TEST_CASE("sceneFromJson errors name the offending path", "[scene][errors]") {
    SECTION("wrong vector length") {
        json j = json::parse(R"({ "circles": [ {}, {}, { "position": [1, 2, 3] } ] })");
        REQUIRE_THROWS_WITH(sceneFromJson(j),
                            ContainsSubstring("scene.circles[2].position"));
    }

    SECTION("non-numeric component") {
        json j = json::parse(R"({ "rectangles": [ { "size": [1, "wide"] } ] })");
        REQUIRE_THROWS_WITH(sceneFromJson(j),
                            ContainsSubstring("scene.rectangles[0].size[1]"));
    }

    SECTION("shape list is not an array") {
        json j = json::parse(R"({ "circles": { "radius": 1 } })");
        REQUIRE_THROWS_AS(sceneFromJson(j), SceneError);
    }

    SECTION("root is not an object") {
        REQUIRE_THROWS_AS(sceneFromJson(json::array()), SceneError);
    }
}

TEST_CASE("sceneToJson round trip", "[scene]") {
    Scene scene = defaultScene();
    scene.camera.position = {1.0f, 2.0f};
    scene.clearColor = {0.5f, 0.25f, 0.0f, 1.0f};

    Scene back = sceneFromJson(sceneToJson(scene));

    REQUIRE(back.camera.position == scene.camera.position);
    REQUIRE(back.camera.zoom == scene.camera.zoom);
    REQUIRE(back.clearColor == scene.clearColor);
    REQUIRE(back.circles.size() == scene.circles.size());
    REQUIRE(back.rectangles.size() == scene.rectangles.size());
    REQUIRE(back.circles[0].radius == scene.circles[0].radius);
    REQUIRE(back.rectangles[2].size == scene.rectangles[2].size);
}

TEST_CASE("loadScene and saveScene", "[scene][io]") {
    fs::path path = fs::temp_directory_path() / "flatdraw_test_scene.json";

    SECTION("saved scene loads back") {
        REQUIRE(saveScene(defaultScene(), path.string()));
        Scene loaded = loadScene(path.string());
        REQUIRE(loaded.circles.size() == 3);
        REQUIRE(loaded.rectangles.size() == 4);
    }

    SECTION("malformed JSON") {
        std::ofstream(path) << "{ \"circles\": [ ";
        REQUIRE_THROWS_WITH(loadScene(path.string()), ContainsSubstring("Invalid JSON"));
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(loadScene((path.parent_path() / "flatdraw_missing.json").string()),
                          SceneError);
    }

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_CASE("defaultScene", "[scene]") {
    Scene scene = defaultScene();

    REQUIRE(scene.camera.zoom == ViewCamera::DEFAULT_ZOOM);

    SECTION("four walls enclose the particles") {
        REQUIRE(scene.rectangles.size() == 4);
        for (const auto& wall : scene.rectangles) {
            REQUIRE(wall.color == glm::vec3(0.1f));
        }
        REQUIRE(scene.rectangles[0].position == glm::vec2(-15.0f, 0.0f));
        REQUIRE(scene.rectangles[0].size == glm::vec2(1.0f, 16.0f));
        REQUIRE(scene.rectangles[2].size == glm::vec2(30.0f, 1.0f));
    }

    SECTION("particle radius follows mass") {
        REQUIRE(scene.circles.size() == 3);
        // Oxygen, mass 16
        REQUIRE(scene.circles[0].color == glm::vec3(1.0f, 0.0f, 0.0f));
        REQUIRE_THAT(scene.circles[0].radius, WithinAbs(std::sqrt(16.0 / PI), 1e-5));
        // Hydrogen, mass 1
        REQUIRE(scene.circles[1].color == glm::vec3(1.0f));
        REQUIRE_THAT(scene.circles[1].radius, WithinAbs(std::sqrt(1.0 / PI), 1e-5));
        REQUIRE(scene.circles[2].position == glm::vec2(-6.0f, 0.5f));
    }
}
