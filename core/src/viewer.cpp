// flatdraw Viewer Implementation

#include "viewer.h"
#include <flatdraw/gpu_common.h>
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace flatdraw {

namespace {

const char* kindName(ShapeKind kind) {
    return kind == ShapeKind::Circle ? "circle" : "rectangle";
}

} // namespace

Viewer::Viewer(Scene scene, int width, int height, const std::string& title)
    : m_scene(std::move(scene)) {

    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    m_window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!m_window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(m_window, this);
    glfwSetMouseButtonCallback(m_window, mouseButtonCallback);
    glfwSetCursorPosCallback(m_window, cursorPosCallback);
    glfwSetScrollCallback(m_window, scrollCallback);
    glfwSetFramebufferSizeCallback(m_window, framebufferResizeCallback);

    std::cout << "[Viewer] Created " << width << "x" << height << " window\n";

    if (!initGpu()) {
        releaseGpu();
        glfwDestroyWindow(m_window);
        glfwTerminate();
        throw std::runtime_error("Failed to initialize WebGPU");
    }
}

Viewer::~Viewer() {
    releaseGpu();
    if (m_window) {
        glfwDestroyWindow(m_window);
    }
    glfwTerminate();
}

// -----------------------------------------------------------------------------
// WebGPU setup
// -----------------------------------------------------------------------------

bool Viewer::initGpu() {
    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        std::cerr << "[Viewer] Failed to create WebGPU instance\n";
        return false;
    }

    m_surface = glfwCreateWindowWGPUSurface(m_instance, m_window);
    if (!m_surface) {
        std::cerr << "[Viewer] Failed to create surface\n";
        return false;
    }

    if (!requestAdapter()) {
        std::cerr << "[Viewer] Failed to get adapter\n";
        return false;
    }

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    std::cout << "[Viewer] Adapter: " << gpu::toString(info.device) << "\n";
    wgpuAdapterInfoFreeMembers(info);

    if (!requestDevice()) {
        std::cerr << "[Viewer] Failed to get device\n";
        return false;
    }

    m_queue = wgpuDeviceGetQueue(m_device);
    querySurfaceCapabilities();

    glfwGetFramebufferSize(m_window, &m_framebufferWidth, &m_framebufferHeight);
    if (isMinimized()) {
        m_surfaceDirty = true;
    } else {
        configureSurface();
    }

    if (!m_renderer.init(m_device, m_queue, m_surfaceFormat)) {
        return false;
    }

    std::cout << "[Viewer] WebGPU initialized (" << m_framebufferWidth << "x"
              << m_framebufferHeight << ")\n";
    return true;
}

bool Viewer::requestAdapter() {
    WGPURequestAdapterOptions options = {};
    options.compatibleSurface = m_surface;
    options.powerPreference = WGPUPowerPreference_HighPerformance;

    struct AdapterUserData {
        WGPUAdapter adapter = nullptr;
        bool done = false;
    } userData;

    WGPURequestAdapterCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<AdapterUserData*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success) {
            data->adapter = adapter;
        } else {
            std::cerr << "[Viewer] Adapter request failed: " << gpu::toString(message) << "\n";
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;
    callbackInfo.userdata2 = nullptr;

    wgpuInstanceRequestAdapter(m_instance, &options, callbackInfo);

    // Process events until callback fires
    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    m_adapter = userData.adapter;
    return m_adapter != nullptr;
}

bool Viewer::requestDevice() {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = gpu::toStringView("flatdraw Device");

    deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    deviceDesc.deviceLostCallbackInfo.callback = [](WGPUDevice const* device, WGPUDeviceLostReason reason,
                                                    WGPUStringView message, void* userdata1, void* userdata2) {
        if (reason == WGPUDeviceLostReason_Destroyed) return;
        std::cerr << "[WebGPU] Device lost: " << gpu::toString(message) << "\n";
    };
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const* device, WGPUErrorType type,
                                                         WGPUStringView message, void* userdata1, void* userdata2) {
        std::cerr << "[WebGPU Error] " << gpu::toString(message) << "\n";
    };

    struct DeviceUserData {
        WGPUDevice device = nullptr;
        bool done = false;
    } userData;

    WGPURequestDeviceCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<DeviceUserData*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success) {
            data->device = device;
        } else {
            std::cerr << "[Viewer] Device request failed: " << gpu::toString(message) << "\n";
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;
    callbackInfo.userdata2 = nullptr;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, callbackInfo);

    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    m_device = userData.device;
    return m_device != nullptr;
}

void Viewer::querySurfaceCapabilities() {
    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);

    if (capabilities.formatCount > 0) {
        m_surfaceFormat = capabilities.formats[0];
    }

    // Uncapped frame rate when the surface allows it
    m_presentMode = WGPUPresentMode_Fifo;
    for (size_t i = 0; i < capabilities.presentModeCount; ++i) {
        if (capabilities.presentModes[i] == WGPUPresentMode_Immediate) {
            m_presentMode = WGPUPresentMode_Immediate;
            break;
        }
    }
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);
}

void Viewer::configureSurface() {
    WGPUSurfaceConfiguration config = {};
    config.device = m_device;
    config.format = m_surfaceFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.width = static_cast<uint32_t>(m_framebufferWidth);
    config.height = static_cast<uint32_t>(m_framebufferHeight);
    config.presentMode = m_presentMode;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    wgpuSurfaceConfigure(m_surface, &config);

    m_surfaceDirty = false;
}

void Viewer::releaseGpu() {
    m_renderer.cleanup();

    if (m_surface) {
        if (m_device) wgpuSurfaceUnconfigure(m_surface);
        wgpuSurfaceRelease(m_surface);
        m_surface = nullptr;
    }
    if (m_queue) { wgpuQueueRelease(m_queue); m_queue = nullptr; }
    if (m_device) { wgpuDeviceRelease(m_device); m_device = nullptr; }
    if (m_adapter) { wgpuAdapterRelease(m_adapter); m_adapter = nullptr; }
    if (m_instance) { wgpuInstanceRelease(m_instance); m_instance = nullptr; }
}

// -----------------------------------------------------------------------------
// Frame loop
// -----------------------------------------------------------------------------

int Viewer::run(int maxFrames) {
    while (!glfwWindowShouldClose(m_window)) {
        glfwPollEvents();

        // Nothing to draw into, sleep until the window comes back
        if (isMinimized()) {
            glfwWaitEvents();
            continue;
        }

        FrameResult result = renderFrame();
        if (result == FrameResult::Failed) {
            return 1;
        }
        if (result == FrameResult::Skipped) {
            continue;
        }

        if (m_stats.frame(glfwGetTime())) {
            std::cout << "[Viewer] FPS: " << std::fixed << std::setprecision(1) << m_stats.fps()
                      << " (" << std::setprecision(3) << m_stats.frameTimeMs() << " ms)"
                      << std::defaultfloat << "\n";
        }

        if (maxFrames > 0 && m_stats.frames() >= maxFrames) {
            std::cout << "[Viewer] Rendered " << m_stats.frames() << " frames, exiting\n";
            break;
        }
    }
    return 0;
}

Viewer::FrameResult Viewer::renderFrame() {
    if (m_surfaceDirty) {
        configureSurface();
    }

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);
    switch (surfaceTexture.status) {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
        case WGPUSurfaceGetCurrentTextureStatus_Outdated:
        case WGPUSurfaceGetCurrentTextureStatus_Lost:
            if (surfaceTexture.texture) wgpuTextureRelease(surfaceTexture.texture);
            m_surfaceDirty = true;
            return FrameResult::Skipped;
        default:
            std::cerr << "[Viewer] Cannot acquire surface texture (status "
                      << surfaceTexture.status << ")\n";
            return FrameResult::Failed;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

    float aspect = aspectRatio(glm::vec2(m_framebufferWidth, m_framebufferHeight));
    m_renderer.prepare(m_scene.camera.uniform(aspect), m_scene.circles, m_scene.rectangles);
    m_renderer.render(view, m_scene.clearColor);

    wgpuSurfacePresent(m_surface);
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfaceTexture.texture);
    return FrameResult::Drawn;
}

// -----------------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------------

glm::vec2 Viewer::windowSize() const {
    int width = 0;
    int height = 0;
    glfwGetWindowSize(m_window, &width, &height);
    return glm::vec2(width, height);
}

void Viewer::selectAt(glm::vec2 pixel) {
    glm::vec2 world = m_scene.camera.screenToWorld(pixel, windowSize());
    auto selection = pick(world, m_scene.circles, m_scene.rectangles);

    if (!selection) {
        std::cout << "[Viewer] Nothing at (" << world.x << ", " << world.y << ")\n";
        return;
    }

    std::cout << "[Viewer] Selected " << kindName(selection->kind) << " " << selection->index;
    if (selection->kind == ShapeKind::Circle) {
        const CircleInstance& c = m_scene.circles[selection->index];
        std::cout << ": position (" << c.position.x << ", " << c.position.y
                  << ") radius " << c.radius;
    } else {
        const RectangleInstance& r = m_scene.rectangles[selection->index];
        std::cout << ": position (" << r.position.x << ", " << r.position.y
                  << ") size " << r.size.x << "x" << r.size.y;
    }
    std::cout << "\n";
}

void Viewer::onMouseButton(int button, int action) {
    if (button == GLFW_MOUSE_BUTTON_RIGHT) {
        m_rightDragging = (action == GLFW_PRESS);
    } else if (button == GLFW_MOUSE_BUTTON_LEFT) {
        if (action == GLFW_PRESS) {
            m_pressPosition = m_cursor;
        } else if (action == GLFW_RELEASE) {
            // A click, not a drag
            glm::vec2 moved = m_cursor - m_pressPosition;
            if (glm::dot(moved, moved) <= 16.0f) {
                selectAt(m_cursor);
            }
        }
    }
}

void Viewer::onCursorPos(double x, double y) {
    glm::vec2 position(static_cast<float>(x), static_cast<float>(y));
    if (m_rightDragging) {
        m_scene.camera.pan(position - m_cursor, windowSize());
    }
    m_cursor = position;
}

void Viewer::onScroll(double yOffset) {
    m_scene.camera.scroll(static_cast<float>(yOffset));
}

void Viewer::onFramebufferResize(int width, int height) {
    m_framebufferWidth = width;
    m_framebufferHeight = height;
    m_surfaceDirty = true;
}

void Viewer::mouseButtonCallback(GLFWwindow* window, int button, int action, int mods) {
    if (auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(window))) {
        viewer->onMouseButton(button, action);
    }
}

void Viewer::cursorPosCallback(GLFWwindow* window, double x, double y) {
    if (auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(window))) {
        viewer->onCursorPos(x, y);
    }
}

void Viewer::scrollCallback(GLFWwindow* window, double xOffset, double yOffset) {
    if (auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(window))) {
        viewer->onScroll(yOffset);
    }
}

void Viewer::framebufferResizeCallback(GLFWwindow* window, int width, int height) {
    if (auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(window))) {
        viewer->onFramebufferResize(width, height);
    }
}

} // namespace flatdraw
