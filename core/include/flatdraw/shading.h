#pragma once

/**
 * @file shading.h
 * @brief Host evaluation of the rectangle and circle shader stages
 *
 * Every function here computes exactly what one shader invocation computes,
 * in the same float operations and the same order, so results can be compared
 * against GPU output and used by the software rasterizer. All functions are
 * pure: identical inputs give bit-identical outputs.
 *
 * Instance indices are range checked (std::out_of_range). On the GPU an
 * out-of-range index is undefined behavior instead.
 */

#include <flatdraw/types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace flatdraw::shading {

/**
 * @brief Decode a quad corner from a vertex index
 *
 * Bit 0 selects the X sign and bit 1 the Y sign:
 * 0 -> (-1,-1), 1 -> (1,-1), 2 -> (-1,1), 3 -> (1,1).
 * Higher bits are ignored.
 */
glm::vec2 quadCorner(uint32_t vertexIndex);

/**
 * @brief Map a world point to clip space
 *
 * clip.xy = (world - camera.position) * camera.zoom / (camera.aspect, 1).
 * Depth is 0 and w is 1. A zero aspect yields Inf/NaN, never an error.
 */
glm::vec4 cameraTransform(const CameraUniform& camera, glm::vec2 world);

/// @brief True when uv lies in the closed unit disk (dot(uv, uv) <= 1)
bool insideUnitDisk(glm::vec2 uv);

// -----------------------------------------------------------------------------
// Rectangle program
// -----------------------------------------------------------------------------

VertexOutput rectangleVertex(const CameraUniform& camera,
                             const std::vector<RectangleInstance>& rectangles,
                             uint32_t vertexIndex,
                             uint32_t instanceIndex);

/// @brief Always (color, 1)
glm::vec4 rectanglePixel(const std::vector<RectangleInstance>& rectangles,
                         const VertexOutput& in);

// -----------------------------------------------------------------------------
// Circle program
// -----------------------------------------------------------------------------

VertexOutput circleVertex(const CameraUniform& camera,
                          const std::vector<CircleInstance>& circles,
                          uint32_t vertexIndex,
                          uint32_t instanceIndex);

/// @brief (color, 1), or std::nullopt when the pixel is discarded
std::optional<glm::vec4> circlePixel(const std::vector<CircleInstance>& circles,
                                     const VertexOutput& in);

} // namespace flatdraw::shading
