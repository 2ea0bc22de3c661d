// flatdraw - 2D View Controller Implementation

#include <flatdraw/view.h>
#include <cmath>

namespace flatdraw {

float aspectRatio(glm::vec2 viewportSize) {
    if (viewportSize.x <= 0.0f || viewportSize.y <= 0.0f) {
        return 1.0f;
    }
    return viewportSize.x / viewportSize.y;
}

void ViewCamera::pan(glm::vec2 dragDelta, glm::vec2 viewportSize) {
    if (viewportSize.x <= 0.0f || viewportSize.y <= 0.0f) return;

    float aspect = aspectRatio(viewportSize);
    position.x -= dragDelta.x / zoom / viewportSize.x * 2.0f * aspect;
    position.y += dragDelta.y / zoom / viewportSize.y * 2.0f;
}

void ViewCamera::scroll(float deltaY) {
    if (deltaY < 0.0f) {
        zoom *= SCROLL_ZOOM_FACTOR;
    } else if (deltaY > 0.0f) {
        zoom /= SCROLL_ZOOM_FACTOR;
    }
}

glm::vec2 ViewCamera::screenToWorld(glm::vec2 pixel, glm::vec2 viewportSize) const {
    float aspect = aspectRatio(viewportSize);
    glm::vec2 ndc = (pixel / viewportSize * 2.0f - glm::vec2(1.0f)) * glm::vec2(1.0f, -1.0f);
    return glm::vec2(ndc.x * aspect / zoom + position.x,
                     ndc.y / zoom + position.y);
}

glm::vec2 ViewCamera::worldToScreen(glm::vec2 world, glm::vec2 viewportSize) const {
    glm::vec2 ndc = (world - position) * zoom / glm::vec2(aspectRatio(viewportSize), 1.0f);
    return (ndc * glm::vec2(1.0f, -1.0f) + glm::vec2(1.0f)) * 0.5f * viewportSize;
}

std::optional<Selection> pick(glm::vec2 world,
                              const std::vector<CircleInstance>& circles,
                              const std::vector<RectangleInstance>& rectangles) {
    for (size_t i = 0; i < circles.size(); ++i) {
        glm::vec2 d = world - circles[i].position;
        if (glm::dot(d, d) <= circles[i].radius * circles[i].radius) {
            return Selection{ShapeKind::Circle, i};
        }
    }

    for (size_t i = 0; i < rectangles.size(); ++i) {
        glm::vec2 d = world - rectangles[i].position;
        if (std::abs(d.x) <= rectangles[i].size.x * 0.5f &&
            std::abs(d.y) <= rectangles[i].size.y * 0.5f) {
            return Selection{ShapeKind::Rectangle, i};
        }
    }

    return std::nullopt;
}

} // namespace flatdraw
