// flatdraw - Pipeline Builder Utility
// Fluent API for creating render pipelines with less boilerplate

#pragma once

#include <webgpu/webgpu.h>
#include <vector>
#include <string>

namespace flatdraw::gpu {

// Binding types for the builder
enum class BindingType {
    Uniform,
    ReadOnlyStorage
};

struct BindingEntry {
    uint32_t binding;
    BindingType type;
    uint64_t size;  // Minimum binding size
    WGPUShaderStage visibility;
};

// One @group of the pipeline layout. A group either lists its bindings
// (layout created by build()) or reuses a layout owned by the caller.
struct BindGroupSpec {
    std::vector<BindingEntry> bindings;
    WGPUBindGroupLayout shared = nullptr;
};

// Pipeline builder with fluent interface
//
// Usage:
// @code
// gpu::PipelineBuilder builder(device);
// builder.shader(shaders::CIRCLE_SHADER)
//        .vertexEntry("vertex").fragmentEntry("pixel")
//        .topology(WGPUPrimitiveTopology_TriangleStrip)
//        .colorTarget(format)
//        .group().uniform(0, sizeof(CameraUniform), WGPUShaderStage_Vertex)
//        .group().storage(0, sizeof(CircleInstance), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment);
// WGPURenderPipeline pipeline = builder.build();
// WGPUBindGroupLayout cameraLayout = builder.bindGroupLayout(0);  // caller releases
// @endcode
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    PipelineBuilder(const PipelineBuilder&) = delete;
    PipelineBuilder& operator=(const PipelineBuilder&) = delete;

    // Shader configuration
    PipelineBuilder& shader(const char* wgslSource);
    PipelineBuilder& vertexEntry(const char* entryPoint);
    PipelineBuilder& fragmentEntry(const char* entryPoint);
    PipelineBuilder& label(const char* name);

    // Output / primitive configuration
    PipelineBuilder& colorTarget(WGPUTextureFormat format);
    PipelineBuilder& topology(WGPUPrimitiveTopology topology);
    PipelineBuilder& frontFace(WGPUFrontFace face);

    // Bind groups, in @group order
    PipelineBuilder& group();
    PipelineBuilder& sharedGroup(WGPUBindGroupLayout layout);

    // Bindings of the most recent group()
    PipelineBuilder& uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility);
    PipelineBuilder& storage(uint32_t binding, uint64_t size, WGPUShaderStage visibility);

    // Build the pipeline (nullptr on failure)
    WGPURenderPipeline build();

    // Layout of a group after build(). Layouts created by the builder are
    // handed to the caller, who must release them.
    WGPUBindGroupLayout bindGroupLayout(size_t group) const;

private:
    bool createShaderModule();
    bool createBindGroupLayouts();
    bool createPipelineLayout();
    void releaseOwnedLayouts();

    WGPUDevice m_device;
    std::string m_label = "flatdraw pipeline";
    std::string m_shaderSource;
    std::string m_vertexEntry = "vertex";
    std::string m_fragmentEntry = "pixel";
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUPrimitiveTopology m_topology = WGPUPrimitiveTopology_TriangleList;
    WGPUFrontFace m_frontFace = WGPUFrontFace_CCW;

    std::vector<BindGroupSpec> m_groups;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    std::vector<WGPUBindGroupLayout> m_bindGroupLayouts;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
};

} // namespace flatdraw::gpu
