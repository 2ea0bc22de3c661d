// flatdraw - Host Shading Implementation
// Mirrors RECTANGLE_SHADER and CIRCLE_SHADER operation for operation

#include <flatdraw/shading.h>
#include <stdexcept>
#include <string>

namespace flatdraw::shading {

namespace {

template <typename T>
const T& instanceAt(const std::vector<T>& instances, uint32_t index, const char* kind) {
    if (index >= instances.size()) {
        throw std::out_of_range(std::string(kind) + " index " + std::to_string(index) +
                                " out of range (count " + std::to_string(instances.size()) + ")");
    }
    return instances[index];
}

} // namespace

glm::vec2 quadCorner(uint32_t vertexIndex) {
    glm::vec2 bits(static_cast<float>(vertexIndex & 1u),
                   static_cast<float>((vertexIndex >> 1u) & 1u));
    return bits * 2.0f - 1.0f;
}

glm::vec4 cameraTransform(const CameraUniform& camera, glm::vec2 world) {
    glm::vec2 clipXY = (world - camera.position) * camera.zoom / glm::vec2(camera.aspect, 1.0f);
    return glm::vec4(clipXY, 0.0f, 1.0f);
}

bool insideUnitDisk(glm::vec2 uv) {
    return glm::dot(uv, uv) <= 1.0f;
}

VertexOutput rectangleVertex(const CameraUniform& camera,
                             const std::vector<RectangleInstance>& rectangles,
                             uint32_t vertexIndex,
                             uint32_t instanceIndex) {
    const RectangleInstance& rectangle = instanceAt(rectangles, instanceIndex, "rectangle");

    VertexOutput out;
    out.uv = quadCorner(vertexIndex);

    glm::vec2 worldPosition = out.uv * rectangle.size * 0.5f + rectangle.position;
    out.position = cameraTransform(camera, worldPosition);
    out.instanceIndex = instanceIndex;
    return out;
}

glm::vec4 rectanglePixel(const std::vector<RectangleInstance>& rectangles,
                         const VertexOutput& in) {
    return glm::vec4(instanceAt(rectangles, in.instanceIndex, "rectangle").color, 1.0f);
}

VertexOutput circleVertex(const CameraUniform& camera,
                          const std::vector<CircleInstance>& circles,
                          uint32_t vertexIndex,
                          uint32_t instanceIndex) {
    const CircleInstance& circle = instanceAt(circles, instanceIndex, "circle");

    VertexOutput out;
    out.uv = quadCorner(vertexIndex);

    // Full radius, not radius * 0.5: uv already spans [-1, 1]
    glm::vec2 worldPosition = out.uv * circle.radius + circle.position;
    out.position = cameraTransform(camera, worldPosition);
    out.instanceIndex = instanceIndex;
    return out;
}

std::optional<glm::vec4> circlePixel(const std::vector<CircleInstance>& circles,
                                     const VertexOutput& in) {
    if (!insideUnitDisk(in.uv)) {
        return std::nullopt;
    }
    return glm::vec4(instanceAt(circles, in.instanceIndex, "circle").color, 1.0f);
}

} // namespace flatdraw::shading
