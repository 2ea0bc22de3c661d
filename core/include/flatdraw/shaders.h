#pragma once

/**
 * @file shaders.h
 * @brief WGSL programs for instanced rectangles and circles
 *
 * Both programs share the same binding contract:
 * - @group(0) @binding(0): Camera uniform (see CameraUniform)
 * - @group(1) @binding(0): read-only storage array of instances
 *
 * Each instance is drawn as a 4-vertex triangle strip. The vertex stage
 * decodes the quad corner from the low two bits of the vertex index and the
 * pixel stage reads the instance color through the flat instance index.
 */

namespace flatdraw::shaders {

/// Vertex stage entry point in both programs
inline constexpr const char* VERTEX_ENTRY = "vertex";

/// Fragment stage entry point in both programs
inline constexpr const char* FRAGMENT_ENTRY = "pixel";

/// Vertices submitted per instance
inline constexpr unsigned VERTICES_PER_INSTANCE = 4;

/**
 * @brief Solid rectangles spanning ±size/2 around their position
 */
inline constexpr const char* RECTANGLE_SHADER = R"(
struct Camera {
    position: vec2<f32>,
    aspect: f32,
    zoom: f32,
}

struct Rectangle {
    position: vec2<f32>,
    color: vec3<f32>,
    size: vec2<f32>,
}

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) @interpolate(flat) rectangle_index: u32,
    @location(1) uv: vec2<f32>,
}

@group(0) @binding(0) var<uniform> camera: Camera;
@group(1) @binding(0) var<storage, read> rectangles: array<Rectangle>;

@vertex
fn vertex(
    @builtin(vertex_index) vertex_index: u32,
    @builtin(instance_index) rectangle_index: u32,
) -> VertexOutput {
    let rectangle = rectangles[rectangle_index];

    var out: VertexOutput;
    out.uv = vec2<f32>(f32(vertex_index & 1u), f32((vertex_index >> 1u) & 1u)) * 2.0 - 1.0;

    let world_position = out.uv * rectangle.size * 0.5 + rectangle.position;
    let clip_xy = (world_position - camera.position) * camera.zoom / vec2<f32>(camera.aspect, 1.0);
    out.clip_position = vec4<f32>(clip_xy, 0.0, 1.0);
    out.rectangle_index = rectangle_index;
    return out;
}

@fragment
fn pixel(in: VertexOutput) -> @location(0) vec4<f32> {
    return vec4<f32>(rectangles[in.rectangle_index].color, 1.0);
}
)";

/**
 * @brief Filled circles, cut out of a 2*radius bounding square
 *
 * Unlike the rectangle program the corner UV is scaled by the full radius,
 * since the UV already spans [-1, 1]. Pixels outside the unit disk in UV
 * space are discarded, giving a hard edge.
 */
inline constexpr const char* CIRCLE_SHADER = R"(
struct Camera {
    position: vec2<f32>,
    aspect: f32,
    zoom: f32,
}

struct Circle {
    position: vec2<f32>,
    color: vec3<f32>,
    radius: f32,
}

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) @interpolate(flat) circle_index: u32,
    @location(1) uv: vec2<f32>,
}

@group(0) @binding(0) var<uniform> camera: Camera;
@group(1) @binding(0) var<storage, read> circles: array<Circle>;

@vertex
fn vertex(
    @builtin(vertex_index) vertex_index: u32,
    @builtin(instance_index) circle_index: u32,
) -> VertexOutput {
    let circle = circles[circle_index];

    var out: VertexOutput;
    out.uv = vec2<f32>(f32(vertex_index & 1u), f32((vertex_index >> 1u) & 1u)) * 2.0 - 1.0;

    let world_position = out.uv * circle.radius + circle.position;
    let clip_xy = (world_position - camera.position) * camera.zoom / vec2<f32>(camera.aspect, 1.0);
    out.clip_position = vec4<f32>(clip_xy, 0.0, 1.0);
    out.circle_index = circle_index;
    return out;
}

@fragment
fn pixel(in: VertexOutput) -> @location(0) vec4<f32> {
    if dot(in.uv, in.uv) > 1.0 {
        discard;
    }
    return vec4<f32>(circles[in.circle_index].color, 1.0);
}
)";

} // namespace flatdraw::shaders
