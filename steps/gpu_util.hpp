#pragma once

#include <cstddef>

#include <webgpu/webgpu_cpp.h>

namespace steps {

// WGSL source lives next to the code as raw string literals.
wgpu::ShaderModule CreateShaderModule(const wgpu::Device& device, const char* wgsl, const char* label);

// Mapped at creation and filled with `data` when it is non-null.
wgpu::Buffer CreateBuffer(const wgpu::Device& device, const void* data, std::size_t size,
                          wgpu::BufferUsage usage, const char* label = nullptr);

} // namespace steps
