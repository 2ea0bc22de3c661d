// flatdraw - Pipeline Builder Implementation

#include <flatdraw/pipeline_builder.h>
#include <flatdraw/gpu_common.h>
#include <iostream>

namespace flatdraw::gpu {

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // Bind group layouts created here and m_pipeline are returned to the
    // caller, who is responsible for releasing them
    release(m_shaderModule);
    release(m_pipelineLayout);
}

PipelineBuilder& PipelineBuilder::shader(const char* wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexEntry(const char* entryPoint) {
    m_vertexEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentEntry(const char* entryPoint) {
    m_fragmentEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::label(const char* name) {
    m_label = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_colorFormat = format;
    return *this;
}

PipelineBuilder& PipelineBuilder::topology(WGPUPrimitiveTopology topology) {
    m_topology = topology;
    return *this;
}

PipelineBuilder& PipelineBuilder::frontFace(WGPUFrontFace face) {
    m_frontFace = face;
    return *this;
}

PipelineBuilder& PipelineBuilder::group() {
    m_groups.push_back({});
    return *this;
}

PipelineBuilder& PipelineBuilder::sharedGroup(WGPUBindGroupLayout layout) {
    BindGroupSpec group;
    group.shared = layout;
    m_groups.push_back(group);
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    if (m_groups.empty() || m_groups.back().shared) {
        group();
    }
    m_groups.back().bindings.push_back({binding, BindingType::Uniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::storage(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    if (m_groups.empty() || m_groups.back().shared) {
        group();
    }
    m_groups.back().bindings.push_back({binding, BindingType::ReadOnlyStorage, size, visibility});
    return *this;
}

bool PipelineBuilder::createShaderModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource.c_str());

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(m_label.c_str());
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);

    if (!m_shaderModule) {
        std::cerr << "[PipelineBuilder] Failed to create shader module for " << m_label << "\n";
        return false;
    }
    return true;
}

bool PipelineBuilder::createBindGroupLayouts() {
    m_bindGroupLayouts.clear();

    for (const auto& group : m_groups) {
        if (group.shared) {
            m_bindGroupLayouts.push_back(group.shared);
            continue;
        }

        std::vector<WGPUBindGroupLayoutEntry> entries(group.bindings.size());
        for (size_t i = 0; i < group.bindings.size(); ++i) {
            auto& entry = entries[i];
            const auto& binding = group.bindings[i];

            entry = {};
            entry.binding = binding.binding;
            entry.visibility = binding.visibility;
            entry.buffer.hasDynamicOffset = false;
            entry.buffer.minBindingSize = binding.size;

            switch (binding.type) {
                case BindingType::Uniform:
                    entry.buffer.type = WGPUBufferBindingType_Uniform;
                    break;
                case BindingType::ReadOnlyStorage:
                    entry.buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
                    break;
            }
        }

        WGPUBindGroupLayoutDescriptor layoutDesc = {};
        layoutDesc.entryCount = entries.size();
        layoutDesc.entries = entries.data();
        WGPUBindGroupLayout layout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
        if (!layout) {
            std::cerr << "[PipelineBuilder] Failed to create bind group layout "
                      << m_bindGroupLayouts.size() << " for " << m_label << "\n";
            return false;
        }
        m_bindGroupLayouts.push_back(layout);
    }
    return true;
}

bool PipelineBuilder::createPipelineLayout() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = m_bindGroupLayouts.size();
    pipelineLayoutDesc.bindGroupLayouts = m_bindGroupLayouts.data();
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
    return m_pipelineLayout != nullptr;
}

WGPURenderPipeline PipelineBuilder::build() {
    if (!createShaderModule() || !createBindGroupLayouts() || !createPipelineLayout()) {
        releaseOwnedLayouts();
        return nullptr;
    }

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.blend = nullptr;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = toStringView(m_fragmentEntry.c_str());
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label.c_str());
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView(m_vertexEntry.c_str());
    pipelineDesc.vertex.bufferCount = 0;
    pipelineDesc.vertex.buffers = nullptr;
    pipelineDesc.primitive.topology = m_topology;
    pipelineDesc.primitive.stripIndexFormat = WGPUIndexFormat_Undefined;
    pipelineDesc.primitive.frontFace = m_frontFace;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.depthStencil = nullptr;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    if (!m_pipeline) {
        std::cerr << "[PipelineBuilder] Failed to create render pipeline " << m_label << "\n";
        releaseOwnedLayouts();
    }
    return m_pipeline;
}

void PipelineBuilder::releaseOwnedLayouts() {
    // Nothing reaches the caller on failure
    for (size_t i = 0; i < m_bindGroupLayouts.size(); ++i) {
        if (!m_groups[i].shared) {
            release(m_bindGroupLayouts[i]);
        }
    }
    m_bindGroupLayouts.clear();
}

WGPUBindGroupLayout PipelineBuilder::bindGroupLayout(size_t group) const {
    return group < m_bindGroupLayouts.size() ? m_bindGroupLayouts[group] : nullptr;
}

} // namespace flatdraw::gpu
