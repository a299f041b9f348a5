#include "steps/gpu_util.hpp"

#include <cstring>

namespace steps {

wgpu::ShaderModule CreateShaderModule(const wgpu::Device& device, const char* wgsl, const char* label) {
    wgpu::ShaderSourceWGSL src{}; src.code = wgsl;
    wgpu::ShaderModuleDescriptor md{}; md.nextInChain = &src; md.label = label;
    return device.CreateShaderModule(&md);
}

wgpu::Buffer CreateBuffer(const wgpu::Device& device, const void* data, std::size_t size,
                          wgpu::BufferUsage usage, const char* label) {
    wgpu::BufferDescriptor bd{}; bd.size = size; bd.usage = usage; bd.mappedAtCreation = (data != nullptr);
    if (label) bd.label = label;
    auto buf = device.CreateBuffer(&bd);
    if (data) { std::memcpy(buf.GetMappedRange(), data, size); buf.Unmap(); }
    return buf;
}

} // namespace steps
