#pragma once

// flatdraw - Software Rasterizer
// Headless rendering of both shape programs through the host shading functions

#include <flatdraw/types.h>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace flatdraw {

// RGBA float framebuffer, row 0 at the top like a WebGPU render target
struct Framebuffer {
    int width = 0;
    int height = 0;
    std::vector<glm::vec4> pixels;

    Framebuffer() = default;
    Framebuffer(int w, int h, const glm::vec4& clearColor = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));

    void clear(const glm::vec4& color);

    glm::vec4& at(int x, int y) { return pixels[static_cast<size_t>(y) * width + x]; }
    const glm::vec4& at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
};

/// @brief Clip-space coordinates of a pixel center (Y up, like WebGPU NDC)
glm::vec2 pixelCenterToClip(int x, int y, int width, int height);

/**
 * @brief Draw circles then rectangles into the framebuffer
 *
 * Same submission order as ShapeRenderer::paint(). Each quad's corners come
 * from the vertex stage; a pixel is covered when its center is inside the
 * quad (max edges exclusive), its UV is interpolated from the corners, and
 * the pixel stage decides its color. Discarded pixels keep their old value.
 */
void rasterize(Framebuffer& target,
               const CameraUniform& camera,
               const std::vector<CircleInstance>& circles,
               const std::vector<RectangleInstance>& rectangles);

/**
 * @brief Save as 8-bit RGBA PNG
 * @return false if the file could not be written
 */
bool writePng(const Framebuffer& framebuffer, const std::string& path);

/**
 * @brief Rasterize one width x height frame and save it as PNG
 * @return false (and logs) if the framebuffer cannot be allocated or written
 */
bool renderSnapshot(const std::string& path, int width, int height,
                    const CameraUniform& camera, const glm::vec4& clearColor,
                    const std::vector<CircleInstance>& circles,
                    const std::vector<RectangleInstance>& rectangles);

} // namespace flatdraw
