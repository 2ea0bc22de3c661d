// flatdraw - Scene Files Implementation

#include <flatdraw/scene.h>
#include <cmath>
#include <fstream>
#include <iostream>

namespace flatdraw {

using nlohmann::json;

namespace {

constexpr float PI = 3.14159265358979f;

float readFloat(const json& j, const std::string& path) {
    if (!j.is_number()) {
        throw SceneError(path + ": expected a number");
    }
    return j.get<float>();
}

template <int N>
glm::vec<N, float> readVec(const json& j, const std::string& path) {
    if (!j.is_array() || j.size() != static_cast<size_t>(N)) {
        throw SceneError(path + ": expected an array of " + std::to_string(N) + " numbers");
    }
    glm::vec<N, float> v(0.0f);
    for (int i = 0; i < N; ++i) {
        v[i] = readFloat(j[i], path + "[" + std::to_string(i) + "]");
    }
    return v;
}

const json* member(const json& j, const char* key, const std::string& path) {
    if (!j.is_object()) {
        throw SceneError(path + ": expected an object");
    }
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

const json& requireArray(const json& j, const std::string& path) {
    if (!j.is_array()) {
        throw SceneError(path + ": expected an array");
    }
    return j;
}

template <int N>
json vecToJson(const glm::vec<N, float>& v) {
    json out = json::array();
    for (int i = 0; i < N; ++i) {
        out.push_back(v[i]);
    }
    return out;
}

CircleInstance particle(glm::vec2 position, glm::vec3 color, float mass) {
    return CircleInstance(position, color, std::sqrt(mass / PI));
}

} // namespace

Scene sceneFromJson(const json& j) {
    Scene scene;
    const std::string root = "scene";

    if (const json* camera = member(j, "camera", root)) {
        const std::string path = root + ".camera";
        if (const json* p = member(*camera, "position", path)) {
            scene.camera.position = readVec<2>(*p, path + ".position");
        }
        if (const json* z = member(*camera, "zoom", path)) {
            scene.camera.zoom = readFloat(*z, path + ".zoom");
        }
        if (scene.camera.zoom <= 0.0f) {
            std::cerr << "[Scene] Warning: camera zoom " << scene.camera.zoom
                      << " is not positive, shapes will not render correctly\n";
        }
    }

    if (const json* clear = member(j, "clearColor", root)) {
        const std::string path = root + ".clearColor";
        if (clear->is_array() && clear->size() == 3) {
            scene.clearColor = glm::vec4(readVec<3>(*clear, path), 1.0f);
        } else {
            scene.clearColor = readVec<4>(*clear, path);
        }
    }

    if (const json* circles = member(j, "circles", root)) {
        const json& arr = requireArray(*circles, root + ".circles");
        for (size_t i = 0; i < arr.size(); ++i) {
            const std::string path = root + ".circles[" + std::to_string(i) + "]";
            CircleInstance circle;
            if (const json* p = member(arr[i], "position", path)) {
                circle.position = readVec<2>(*p, path + ".position");
            }
            if (const json* c = member(arr[i], "color", path)) {
                circle.color = readVec<3>(*c, path + ".color");
            }
            if (const json* r = member(arr[i], "radius", path)) {
                circle.radius = readFloat(*r, path + ".radius");
            }
            if (circle.radius < 0.0f) {
                std::cerr << "[Scene] Warning: " << path << " has negative radius\n";
            }
            scene.circles.push_back(circle);
        }
    }

    if (const json* rectangles = member(j, "rectangles", root)) {
        const json& arr = requireArray(*rectangles, root + ".rectangles");
        for (size_t i = 0; i < arr.size(); ++i) {
            const std::string path = root + ".rectangles[" + std::to_string(i) + "]";
            RectangleInstance rectangle;
            if (const json* p = member(arr[i], "position", path)) {
                rectangle.position = readVec<2>(*p, path + ".position");
            }
            if (const json* c = member(arr[i], "color", path)) {
                rectangle.color = readVec<3>(*c, path + ".color");
            }
            if (const json* s = member(arr[i], "size", path)) {
                rectangle.size = readVec<2>(*s, path + ".size");
            }
            if (rectangle.size.x < 0.0f || rectangle.size.y < 0.0f) {
                std::cerr << "[Scene] Warning: " << path << " has negative size\n";
            }
            scene.rectangles.push_back(rectangle);
        }
    }

    return scene;
}

json sceneToJson(const Scene& scene) {
    json j;
    j["camera"] = {
        {"position", vecToJson<2>(scene.camera.position)},
        {"zoom", scene.camera.zoom}
    };
    j["clearColor"] = vecToJson<4>(scene.clearColor);

    json circles = json::array();
    for (const auto& c : scene.circles) {
        circles.push_back({
            {"position", vecToJson<2>(c.position)},
            {"color", vecToJson<3>(c.color)},
            {"radius", c.radius}
        });
    }
    j["circles"] = circles;

    json rectangles = json::array();
    for (const auto& r : scene.rectangles) {
        rectangles.push_back({
            {"position", vecToJson<2>(r.position)},
            {"color", vecToJson<3>(r.color)},
            {"size", vecToJson<2>(r.size)}
        });
    }
    j["rectangles"] = rectangles;

    return j;
}

Scene loadScene(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw SceneError("Cannot open scene file '" + path + "'");
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw SceneError("Invalid JSON in '" + path + "': " + e.what());
    }

    Scene scene = sceneFromJson(j);
    std::cout << "[Scene] Loaded " << path << " (" << scene.circles.size() << " circles, "
              << scene.rectangles.size() << " rectangles)\n";
    return scene;
}

bool saveScene(const Scene& scene, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "[Scene] Cannot write " << path << "\n";
        return false;
    }
    file << sceneToJson(scene).dump(2) << "\n";
    return static_cast<bool>(file);
}

Scene defaultScene() {
    const glm::vec3 wall(0.1f, 0.1f, 0.1f);
    const glm::vec3 hydrogen(1.0f, 1.0f, 1.0f);
    const glm::vec3 oxygen(1.0f, 0.0f, 0.0f);

    Scene scene;
    scene.camera = ViewCamera(glm::vec2(0.0f), ViewCamera::DEFAULT_ZOOM);

    scene.circles = {
        particle({3.0f, 0.0f}, oxygen, 16.0f),
        particle({-3.0f, 0.0f}, hydrogen, 1.0f),
        particle({-6.0f, 0.5f}, hydrogen, 1.0f),
    };

    scene.rectangles = {
        RectangleInstance({-15.0f, 0.0f}, wall, {1.0f, 16.0f}),
        RectangleInstance({15.0f, 0.0f}, wall, {1.0f, 16.0f}),
        RectangleInstance({0.0f, 7.5f}, wall, {30.0f, 1.0f}),
        RectangleInstance({0.0f, -7.5f}, wall, {30.0f, 1.0f}),
    };

    return scene;
}

} // namespace flatdraw
