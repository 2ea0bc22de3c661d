#pragma once

// flatdraw - 2D View Controller
// Pan/zoom camera state, screen <-> world mapping and shape picking

#include <flatdraw/types.h>
#include <glm/glm.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace flatdraw {

enum class ShapeKind {
    Circle,
    Rectangle
};

// Result of a pick: which array and which record in it
struct Selection {
    ShapeKind kind = ShapeKind::Circle;
    size_t index = 0;

    bool operator==(const Selection& other) const {
        return kind == other.kind && index == other.index;
    }
};

/**
 * @brief Interactive orthographic camera
 *
 * Viewport sizes and pixel positions are in window pixels with the origin at
 * the top-left corner and Y pointing down.
 */
class ViewCamera {
public:
    static constexpr float DEFAULT_ZOOM = 0.25f;
    static constexpr float SCROLL_ZOOM_FACTOR = 0.9f;

    glm::vec2 position{0.0f};
    float zoom = DEFAULT_ZOOM;

    ViewCamera() = default;
    ViewCamera(glm::vec2 pos, float z) : position(pos), zoom(z) {}

    /// @brief Uniform for a viewport of the given width / height ratio
    CameraUniform uniform(float aspect) const { return CameraUniform(position, aspect, zoom); }

    /// @brief Move the view so the world follows a mouse drag
    void pan(glm::vec2 dragDelta, glm::vec2 viewportSize);

    /// @brief Scroll down zooms out, scroll up zooms in, zero is ignored
    void scroll(float deltaY);

    /// @brief World point under a pixel of the viewport
    glm::vec2 screenToWorld(glm::vec2 pixel, glm::vec2 viewportSize) const;

    /// @brief Pixel of the viewport showing a world point
    glm::vec2 worldToScreen(glm::vec2 world, glm::vec2 viewportSize) const;
};

/// @brief width / height, or 1 for an empty viewport
float aspectRatio(glm::vec2 viewportSize);

/**
 * @brief Find the shape under a world point
 *
 * Circles are tested first, then rectangles, each in array order; the first
 * hit wins. Boundaries count as hits.
 */
std::optional<Selection> pick(glm::vec2 world,
                              const std::vector<CircleInstance>& circles,
                              const std::vector<RectangleInstance>& rectangles);

} // namespace flatdraw
