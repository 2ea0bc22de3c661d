#pragma once

/**
 * @file scene.h
 * @brief JSON scene files
 *
 * A scene is everything the viewer needs for a frame: the view camera, the
 * clear color and both instance arrays.
 *
 * @code
 * {
 *   "camera":     { "position": [0, 0], "zoom": 0.25 },
 *   "clearColor": [0, 0, 0, 1],
 *   "circles":    [ { "position": [3, 0], "color": [1, 0, 0], "radius": 2.26 } ],
 *   "rectangles": [ { "position": [0, 7.5], "color": [0.1, 0.1, 0.1], "size": [30, 1] } ]
 * }
 * @endcode
 *
 * Every key is optional.
 */

#include <flatdraw/types.h>
#include <flatdraw/view.h>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace flatdraw {

/// @brief Thrown for unreadable or malformed scene files
class SceneError : public std::runtime_error {
public:
    explicit SceneError(const std::string& message) : std::runtime_error(message) {}
};

struct Scene {
    ViewCamera camera;
    glm::vec4 clearColor{0.0f, 0.0f, 0.0f, 1.0f};
    std::vector<CircleInstance> circles;
    std::vector<RectangleInstance> rectangles;
};

/// @brief Parse a scene from JSON (throws SceneError)
Scene sceneFromJson(const nlohmann::json& j);

/// @brief Serialize a scene to JSON
nlohmann::json sceneToJson(const Scene& scene);

/// @brief Load a scene file (throws SceneError)
Scene loadScene(const std::string& path);

/// @brief Write a scene file, pretty printed
/// @return false if the file could not be written
bool saveScene(const Scene& scene, const std::string& path);

/**
 * @brief Built-in demo scene
 *
 * A box of four dark walls holding one oxygen (red) and two hydrogen (white)
 * particles; particle radius is sqrt(mass / pi).
 */
Scene defaultScene();

} // namespace flatdraw
