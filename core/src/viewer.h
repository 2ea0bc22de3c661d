#pragma once

// flatdraw Viewer - window, WebGPU device and the interactive frame loop

#include <flatdraw/frame_stats.h>
#include <flatdraw/scene.h>
#include <flatdraw/shape_renderer.h>
#include <flatdraw/view.h>
#include <webgpu/webgpu.h>
#include <glm/glm.hpp>
#include <string>

struct GLFWwindow;

namespace flatdraw {

class Viewer {
public:
    Viewer(Scene scene, int width, int height, const std::string& title);
    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // Run until the window closes, or for maxFrames frames when positive
    // Returns the process exit code
    int run(int maxFrames);

private:
    enum class FrameResult {
        Drawn,
        Skipped,  // Surface not ready, try again next frame
        Failed
    };

    bool initGpu();
    bool requestAdapter();
    bool requestDevice();
    void querySurfaceCapabilities();
    void configureSurface();
    FrameResult renderFrame();
    bool isMinimized() const { return m_framebufferWidth <= 0 || m_framebufferHeight <= 0; }
    void releaseGpu();

    // Input handling
    void onMouseButton(int button, int action);
    void onCursorPos(double x, double y);
    void onScroll(double yOffset);
    void onFramebufferResize(int width, int height);
    void selectAt(glm::vec2 pixel);
    glm::vec2 windowSize() const;

    static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void cursorPosCallback(GLFWwindow* window, double x, double y);
    static void scrollCallback(GLFWwindow* window, double xOffset, double yOffset);
    static void framebufferResizeCallback(GLFWwindow* window, int width, int height);

    Scene m_scene;
    GLFWwindow* m_window = nullptr;

    // WebGPU infrastructure
    WGPUInstance m_instance = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUPresentMode m_presentMode = WGPUPresentMode_Fifo;
    int m_framebufferWidth = 0;
    int m_framebufferHeight = 0;
    bool m_surfaceDirty = false;

    ShapeRenderer m_renderer;
    FrameStats m_stats;

    // Mouse state, in window pixels
    glm::vec2 m_cursor{0.0f};
    glm::vec2 m_pressPosition{0.0f};
    bool m_rightDragging = false;
};

} // namespace flatdraw
