#pragma once

// flatdraw - Shape Renderer
// GPU-instanced rendering of rectangles and circles through the shape shaders

#include <flatdraw/types.h>
#include <webgpu/webgpu.h>
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace flatdraw {

/**
 * @brief Storage capacity (in records) after making room for `required`
 *
 * Unchanged while the data fits; otherwise required plus a quarter headroom.
 * Never less than one record, so the storage binding stays valid when empty.
 */
size_t growCapacity(size_t capacity, size_t required);

/**
 * @brief Owns the GPU state of both shape pipelines
 *
 * Per frame: prepare() uploads the camera and instance arrays, then either
 * paint() records the draws into a render pass owned by the caller, or
 * render() encodes and submits a pass of its own. Circles are drawn before
 * rectangles.
 *
 * prepare() writes buffers through the queue, so it must not be called while
 * a previously submitted frame that reads them could still observe the
 * change out of order; WebGPU queue ordering guarantees this when all work
 * goes through the same queue.
 */
class ShapeRenderer {
public:
    ShapeRenderer() = default;
    ~ShapeRenderer();

    ShapeRenderer(const ShapeRenderer&) = delete;
    ShapeRenderer& operator=(const ShapeRenderer&) = delete;

    // Create pipelines and buffers for the given color target format
    bool init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat targetFormat);

    // Upload the camera and both instance arrays
    void prepare(const CameraUniform& camera,
                 const std::vector<CircleInstance>& circles,
                 const std::vector<RectangleInstance>& rectangles);

    // Record draws into an open render pass
    void paint(WGPURenderPassEncoder pass);

    // Clear output, paint and submit
    void render(WGPUTextureView output, const glm::vec4& clearColor);

    // Release all GPU resources
    void cleanup();

    bool isInitialized() const { return m_initialized; }
    uint32_t circleCount() const { return m_circles.count; }
    uint32_t rectangleCount() const { return m_rectangles.count; }

private:
    // Storage array bound at @group(1) @binding(0)
    struct InstanceStorage {
        const char* label = "";
        size_t stride = 0;
        size_t capacity = 0;
        uint32_t count = 0;
        WGPUBuffer buffer = nullptr;
        WGPUBindGroupLayout layout = nullptr;
        WGPUBindGroup bindGroup = nullptr;
        WGPURenderPipeline pipeline = nullptr;
    };

    bool createCameraResources();
    bool createPipeline(InstanceStorage& storage, const char* shaderSource);
    void ensureCapacity(InstanceStorage& storage, size_t count);
    void upload(InstanceStorage& storage, const void* data, size_t count);
    void draw(WGPURenderPassEncoder pass, const InstanceStorage& storage);
    void release(InstanceStorage& storage);
    bool warnIfUninitialized(const char* operation);

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUTextureFormat m_targetFormat = WGPUTextureFormat_Undefined;
    bool m_initialized = false;
    bool m_warnedUninitialized = false;

    // Camera uniform, @group(0) @binding(0), shared by both pipelines
    WGPUBuffer m_cameraBuffer = nullptr;
    WGPUBindGroupLayout m_cameraBindGroupLayout = nullptr;
    WGPUBindGroup m_cameraBindGroup = nullptr;

    InstanceStorage m_circles;
    InstanceStorage m_rectangles;
};

} // namespace flatdraw
