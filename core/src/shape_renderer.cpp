// flatdraw - Shape Renderer Implementation
// One pipeline per shape program, instance data in read-only storage buffers

#include <flatdraw/shape_renderer.h>
#include <flatdraw/shaders.h>
#include <flatdraw/gpu_common.h>
#include <flatdraw/pipeline_builder.h>
#include <iostream>
#include <string>

namespace flatdraw {

size_t growCapacity(size_t capacity, size_t required) {
    if (required <= capacity && capacity > 0) {
        return capacity;
    }
    if (required == 0) {
        return 1;
    }
    // Allocate with some headroom
    return required + required / 4;
}

ShapeRenderer::~ShapeRenderer() {
    cleanup();
}

bool ShapeRenderer::init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat targetFormat) {
    if (m_initialized) return true;

    m_device = device;
    m_queue = queue;
    m_targetFormat = targetFormat;

    m_circles.label = "Circle";
    m_circles.stride = sizeof(CircleInstance);
    m_rectangles.label = "Rectangle";
    m_rectangles.stride = sizeof(RectangleInstance);

    if (!createCameraResources() ||
        !createPipeline(m_circles, shaders::CIRCLE_SHADER) ||
        !createPipeline(m_rectangles, shaders::RECTANGLE_SHADER)) {
        std::cerr << "[ShapeRenderer] Initialization failed\n";
        cleanup();
        return false;
    }

    m_initialized = true;
    m_warnedUninitialized = false;
    return true;
}

bool ShapeRenderer::createCameraResources() {
    m_cameraBuffer = gpu::createBuffer(m_device, sizeof(CameraUniform),
                                       WGPUBufferUsage_Uniform, "Camera Buffer");
    if (!m_cameraBuffer) {
        std::cerr << "[ShapeRenderer] Failed to create camera buffer\n";
        return false;
    }
    return true;
}

bool ShapeRenderer::createPipeline(InstanceStorage& storage, const char* shaderSource) {
    std::string label = std::string(storage.label) + " Render Pipeline";

    gpu::PipelineBuilder builder(m_device);
    builder.label(label.c_str())
           .shader(shaderSource)
           .vertexEntry(shaders::VERTEX_ENTRY)
           .fragmentEntry(shaders::FRAGMENT_ENTRY)
           .topology(WGPUPrimitiveTopology_TriangleStrip)
           .frontFace(WGPUFrontFace_CW)
           .colorTarget(m_targetFormat);

    // The first pipeline creates the camera layout, later ones share it
    if (m_cameraBindGroupLayout) {
        builder.sharedGroup(m_cameraBindGroupLayout);
    } else {
        builder.group().uniform(0, sizeof(CameraUniform), WGPUShaderStage_Vertex);
    }
    builder.group().storage(0, storage.stride, WGPUShaderStage_Vertex | WGPUShaderStage_Fragment);

    storage.pipeline = builder.build();
    if (!storage.pipeline) {
        return false;
    }
    storage.layout = builder.bindGroupLayout(1);

    if (!m_cameraBindGroupLayout) {
        m_cameraBindGroupLayout = builder.bindGroupLayout(0);
        m_cameraBindGroup = gpu::createBufferBindGroup(m_device, m_cameraBindGroupLayout,
                                                       m_cameraBuffer, sizeof(CameraUniform),
                                                       "Camera Bind Group");
        if (!m_cameraBindGroup) {
            std::cerr << "[ShapeRenderer] Failed to create camera bind group\n";
            return false;
        }
    }

    // Start with room for one record so the binding is valid before prepare()
    ensureCapacity(storage, 0);
    return storage.buffer != nullptr && storage.bindGroup != nullptr;
}

void ShapeRenderer::ensureCapacity(InstanceStorage& storage, size_t count) {
    size_t capacity = growCapacity(storage.capacity, count);
    if (capacity == storage.capacity && storage.buffer) return;

    gpu::release(storage.bindGroup);
    gpu::release(storage.buffer);

    storage.capacity = capacity;
    std::string bufferLabel = std::string(storage.label) + " Buffer";
    std::string groupLabel = std::string(storage.label) + " Bind Group";
    uint64_t size = static_cast<uint64_t>(storage.capacity) * storage.stride;

    storage.buffer = gpu::createBuffer(m_device, size, WGPUBufferUsage_Storage, bufferLabel.c_str());
    if (!storage.buffer) {
        std::cerr << "[ShapeRenderer] Failed to allocate " << size << " bytes for "
                  << storage.label << " instances\n";
        storage.capacity = 0;
        return;
    }
    storage.bindGroup = gpu::createBufferBindGroup(m_device, storage.layout, storage.buffer,
                                                   size, groupLabel.c_str());
}

void ShapeRenderer::upload(InstanceStorage& storage, const void* data, size_t count) {
    ensureCapacity(storage, count);
    if (!storage.buffer || !storage.bindGroup) {
        storage.count = 0;
        return;
    }

    if (count > 0) {
        wgpuQueueWriteBuffer(m_queue, storage.buffer, 0, data, count * storage.stride);
    }
    storage.count = static_cast<uint32_t>(count);
}

void ShapeRenderer::prepare(const CameraUniform& camera,
                            const std::vector<CircleInstance>& circles,
                            const std::vector<RectangleInstance>& rectangles) {
    if (warnIfUninitialized("prepare")) return;

    wgpuQueueWriteBuffer(m_queue, m_cameraBuffer, 0, &camera, sizeof(CameraUniform));

    // CircleInstance / RectangleInstance already carry the WGSL layout
    upload(m_circles, circles.data(), circles.size());
    upload(m_rectangles, rectangles.data(), rectangles.size());
}

void ShapeRenderer::draw(WGPURenderPassEncoder pass, const InstanceStorage& storage) {
    if (storage.count == 0) return;

    wgpuRenderPassEncoderSetPipeline(pass, storage.pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_cameraBindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetBindGroup(pass, 1, storage.bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, shaders::VERTICES_PER_INSTANCE, storage.count, 0, 0);
}

void ShapeRenderer::paint(WGPURenderPassEncoder pass) {
    if (warnIfUninitialized("paint")) return;

    draw(pass, m_circles);
    draw(pass, m_rectangles);
}

void ShapeRenderer::render(WGPUTextureView output, const glm::vec4& clearColor) {
    if (warnIfUninitialized("render")) return;
    if (!output) return;

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = gpu::toStringView("Shape Encoder");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = output;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {clearColor.r, clearColor.g, clearColor.b, clearColor.a};

    WGPURenderPassDescriptor renderPassDesc = {};
    renderPassDesc.colorAttachmentCount = 1;
    renderPassDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
    paint(pass);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);
}

bool ShapeRenderer::warnIfUninitialized(const char* operation) {
    if (m_initialized) return false;
    if (!m_warnedUninitialized) {
        std::cerr << "[ShapeRenderer] " << operation << "() called before init(), ignoring\n";
        m_warnedUninitialized = true;
    }
    return true;
}

void ShapeRenderer::release(InstanceStorage& storage) {
    gpu::release(storage.pipeline);
    gpu::release(storage.bindGroup);
    gpu::release(storage.buffer);
    gpu::release(storage.layout);
    storage.capacity = 0;
    storage.count = 0;
}

void ShapeRenderer::cleanup() {
    release(m_circles);
    release(m_rectangles);

    gpu::release(m_cameraBindGroup);
    gpu::release(m_cameraBindGroupLayout);
    gpu::release(m_cameraBuffer);

    m_initialized = false;
}

} // namespace flatdraw
