#pragma once

// flatdraw - GPU Types
// Host mirrors of the WGSL structs shared with the shape shaders

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>

namespace flatdraw {

// Camera uniform (@group(0) @binding(0))
// Total size: 16 bytes (one uniform block)
struct CameraUniform {
    glm::vec2 position{0.0f};  // World point at the center of the view
    float aspect = 1.0f;       // Viewport width / height
    float zoom = 1.0f;         // Uniform scale, larger = closer

    CameraUniform() = default;
    CameraUniform(glm::vec2 pos, float a, float z)
        : position(pos), aspect(a), zoom(z) {}
};

// Rectangle record in the read-only storage array (@group(1) @binding(0))
// vec3 color is 16-byte aligned in WGSL, so the stride rounds up to 48 bytes
struct RectangleInstance {
    glm::vec2 position{0.0f};
    float _pad0[2] = {0.0f, 0.0f};
    glm::vec3 color{0.0f};
    float _pad1 = 0.0f;
    glm::vec2 size{0.0f};
    float _pad2[2] = {0.0f, 0.0f};

    RectangleInstance() = default;
    RectangleInstance(glm::vec2 pos, glm::vec3 c, glm::vec2 s)
        : position(pos), color(c), size(s) {}
};

// Circle record in the read-only storage array (@group(1) @binding(0))
// radius packs into the tail of the vec3 color slot, stride 32 bytes
struct CircleInstance {
    glm::vec2 position{0.0f};
    float _pad0[2] = {0.0f, 0.0f};
    glm::vec3 color{0.0f};
    float radius = 0.0f;

    CircleInstance() = default;
    CircleInstance(glm::vec2 pos, glm::vec3 c, float r)
        : position(pos), color(c), radius(r) {}
};

static_assert(sizeof(CameraUniform) == 16, "CameraUniform must match WGSL Camera");
static_assert(offsetof(CameraUniform, aspect) == 8, "Camera.aspect offset");
static_assert(offsetof(CameraUniform, zoom) == 12, "Camera.zoom offset");

static_assert(sizeof(RectangleInstance) == 48, "RectangleInstance must match WGSL stride");
static_assert(offsetof(RectangleInstance, color) == 16, "Rectangle.color offset");
static_assert(offsetof(RectangleInstance, size) == 32, "Rectangle.size offset");

static_assert(sizeof(CircleInstance) == 32, "CircleInstance must match WGSL stride");
static_assert(offsetof(CircleInstance, color) == 16, "Circle.color offset");
static_assert(offsetof(CircleInstance, radius) == 28, "Circle.radius offset");

// Output of either vertex stage, consumed by the matching pixel stage
struct VertexOutput {
    glm::vec4 position{0.0f};    // Clip space, w = 1
    uint32_t instanceIndex = 0;  // Flat across the primitive
    glm::vec2 uv{0.0f};          // Interpolated, [-1, 1] at the corners
};

} // namespace flatdraw
