#pragma once

/**
 * @file gpu_common.h
 * @brief Small WebGPU helpers shared by the renderer and the viewer
 */

#include <webgpu/webgpu.h>
#include <cstring>
#include <string>

namespace flatdraw::gpu {

// =============================================================================
// String Helpers
// =============================================================================

/**
 * @brief Convert C string to WebGPU string view
 */
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

/**
 * @brief Copy a WebGPU string view (explicit length or null-terminated)
 */
inline std::string toString(WGPUStringView view) {
    if (!view.data) return {};
    size_t length = view.length == WGPU_STRLEN ? std::strlen(view.data) : view.length;
    return std::string(view.data, length);
}

// =============================================================================
// Resource Cleanup Helpers
// =============================================================================

/**
 * @brief Safe release helpers that check for null, release, and set to nullptr
 *
 * Usage:
 * @code
 * void cleanup() {
 *     gpu::release(m_pipeline);
 *     gpu::release(m_bindGroupLayout);
 *     gpu::release(m_buffer);
 * }
 * @endcode
 */

inline void release(WGPURenderPipeline& p) {
    if (p) { wgpuRenderPipelineRelease(p); p = nullptr; }
}

inline void release(WGPUBindGroupLayout& l) {
    if (l) { wgpuBindGroupLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUBindGroup& g) {
    if (g) { wgpuBindGroupRelease(g); g = nullptr; }
}

inline void release(WGPUBuffer& b) {
    if (b) { wgpuBufferRelease(b); b = nullptr; }
}

inline void release(WGPUShaderModule& m) {
    if (m) { wgpuShaderModuleRelease(m); m = nullptr; }
}

inline void release(WGPUPipelineLayout& l) {
    if (l) { wgpuPipelineLayoutRelease(l); l = nullptr; }
}

// =============================================================================
// Buffers
// =============================================================================

/**
 * @brief Create a buffer of the given usage (CopyDst is always added)
 */
inline WGPUBuffer createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsage usage,
                               const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.size = size;
    desc.usage = usage | WGPUBufferUsage_CopyDst;
    desc.mappedAtCreation = false;
    return wgpuDeviceCreateBuffer(device, &desc);
}

/**
 * @brief Bind group holding one whole buffer at binding 0
 */
inline WGPUBindGroup createBufferBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                                           WGPUBuffer buffer, uint64_t size, const char* label) {
    WGPUBindGroupEntry entry = {};
    entry.binding = 0;
    entry.buffer = buffer;
    entry.offset = 0;
    entry.size = size;

    WGPUBindGroupDescriptor desc = {};
    desc.label = toStringView(label);
    desc.layout = layout;
    desc.entryCount = 1;
    desc.entries = &entry;
    return wgpuDeviceCreateBindGroup(device, &desc);
}

} // namespace flatdraw::gpu
