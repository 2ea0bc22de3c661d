// flatdraw - Software Rasterizer Implementation

#include <flatdraw/raster.h>
#include <flatdraw/shading.h>
#include <flatdraw/shaders.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace flatdraw {

Framebuffer::Framebuffer(int w, int h, const glm::vec4& clearColor)
    : width(w), height(h), pixels(static_cast<size_t>(w) * h, clearColor) {}

void Framebuffer::clear(const glm::vec4& color) {
    std::fill(pixels.begin(), pixels.end(), color);
}

glm::vec2 pixelCenterToClip(int x, int y, int width, int height) {
    return glm::vec2((static_cast<float>(x) + 0.5f) / width * 2.0f - 1.0f,
                     1.0f - (static_cast<float>(y) + 0.5f) / height * 2.0f);
}

namespace {

// Fill one instanced quad. VertexFn gives the corner for a vertex index,
// PixelFn returns the color or std::nullopt to discard.
template <typename VertexFn, typename PixelFn>
void drawQuad(Framebuffer& target, VertexFn&& vertexStage, PixelFn&& pixelStage) {
    std::array<VertexOutput, shaders::VERTICES_PER_INSTANCE> corners;
    for (uint32_t v = 0; v < shaders::VERTICES_PER_INSTANCE; ++v) {
        corners[v] = vertexStage(v);
    }

    // Corner 0 carries uv (-1,-1) and corner 3 carries uv (1,1); the quad is
    // axis aligned because the camera transform is a scale and a translation.
    glm::vec2 c0(corners[0].position);
    glm::vec2 c3(corners[3].position);
    glm::vec2 lo = glm::min(c0, c3);
    glm::vec2 hi = glm::max(c0, c3);

    if (!std::isfinite(lo.x) || !std::isfinite(lo.y) ||
        !std::isfinite(hi.x) || !std::isfinite(hi.y)) {
        return;
    }
    if (lo.x == hi.x || lo.y == hi.y) {
        return;
    }

    const float w = static_cast<float>(target.width);
    const float h = static_cast<float>(target.height);

    // Pixel window guaranteed to contain every covered center
    float fx0 = std::floor((lo.x + 1.0f) * 0.5f * w - 0.5f);
    float fx1 = std::ceil((hi.x + 1.0f) * 0.5f * w - 0.5f);
    float fy0 = std::floor((1.0f - hi.y) * 0.5f * h - 0.5f);
    float fy1 = std::ceil((1.0f - lo.y) * 0.5f * h - 0.5f);

    int x0 = static_cast<int>(std::clamp(fx0, 0.0f, w - 1.0f));
    int x1 = static_cast<int>(std::clamp(fx1, 0.0f, w - 1.0f));
    int y0 = static_cast<int>(std::clamp(fy0, 0.0f, h - 1.0f));
    int y1 = static_cast<int>(std::clamp(fy1, 0.0f, h - 1.0f));

    glm::vec2 extent = c3 - c0;
    const uint32_t instanceIndex = corners[0].instanceIndex;

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            glm::vec2 p = pixelCenterToClip(x, y, target.width, target.height);
            if (p.x < lo.x || p.x >= hi.x || p.y < lo.y || p.y >= hi.y) {
                continue;
            }

            VertexOutput in;
            in.position = glm::vec4(p, 0.0f, 1.0f);
            in.instanceIndex = instanceIndex;
            in.uv = (p - c0) / extent * 2.0f - 1.0f;

            std::optional<glm::vec4> color = pixelStage(in);
            if (color) {
                target.at(x, y) = *color;
            }
        }
    }
}

} // namespace

void rasterize(Framebuffer& target,
               const CameraUniform& camera,
               const std::vector<CircleInstance>& circles,
               const std::vector<RectangleInstance>& rectangles) {
    if (target.width <= 0 || target.height <= 0) return;

    for (uint32_t i = 0; i < circles.size(); ++i) {
        drawQuad(target,
                 [&](uint32_t v) { return shading::circleVertex(camera, circles, v, i); },
                 [&](const VertexOutput& in) { return shading::circlePixel(circles, in); });
    }

    for (uint32_t i = 0; i < rectangles.size(); ++i) {
        drawQuad(target,
                 [&](uint32_t v) { return shading::rectangleVertex(camera, rectangles, v, i); },
                 [&](const VertexOutput& in) {
                     return std::optional<glm::vec4>(shading::rectanglePixel(rectangles, in));
                 });
    }
}

bool writePng(const Framebuffer& framebuffer, const std::string& path) {
    if (framebuffer.width <= 0 || framebuffer.height <= 0) {
        std::cerr << "[Raster] Cannot write empty framebuffer to " << path << "\n";
        return false;
    }

    std::vector<uint8_t> bytes(framebuffer.pixels.size() * 4);
    for (size_t i = 0; i < framebuffer.pixels.size(); ++i) {
        glm::vec4 c = glm::clamp(framebuffer.pixels[i], 0.0f, 1.0f);
        bytes[i * 4 + 0] = static_cast<uint8_t>(std::lround(c.r * 255.0f));
        bytes[i * 4 + 1] = static_cast<uint8_t>(std::lround(c.g * 255.0f));
        bytes[i * 4 + 2] = static_cast<uint8_t>(std::lround(c.b * 255.0f));
        bytes[i * 4 + 3] = static_cast<uint8_t>(std::lround(c.a * 255.0f));
    }

    int result = stbi_write_png(path.c_str(), framebuffer.width, framebuffer.height, 4,
                                bytes.data(), framebuffer.width * 4);
    if (result == 0) {
        std::cerr << "[Raster] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

bool renderSnapshot(const std::string& path, int width, int height,
                    const CameraUniform& camera, const glm::vec4& clearColor,
                    const std::vector<CircleInstance>& circles,
                    const std::vector<RectangleInstance>& rectangles) {
    if (width <= 0 || height <= 0) {
        std::cerr << "[Raster] Invalid snapshot size " << width << "x" << height << "\n";
        return false;
    }

    try {
        Framebuffer framebuffer(width, height, clearColor);
        rasterize(framebuffer, camera, circles, rectangles);
        if (!writePng(framebuffer, path)) {
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Raster] Cannot render " << width << "x" << height
                  << " snapshot: " << e.what() << "\n";
        return false;
    }

    std::cout << "[Raster] Wrote " << width << "x" << height << " snapshot to " << path << "\n";
    return true;
}

} // namespace flatdraw
