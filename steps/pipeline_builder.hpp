#pragma once

#include <optional>
#include <string>
#include <vector>

#include <webgpu/webgpu_cpp.h>

namespace steps {

struct GpuPipeline {
    wgpu::PipelineLayout layout;
    wgpu::RenderPipeline pipeline;
};

// Collects render pipeline state with chained setters and creates the pipeline
// layout plus the pipeline in Build(). Only the vertex stage is mandatory.
class GpuPipelineBuilder {
public:
    explicit GpuPipelineBuilder(wgpu::Device device);

    GpuPipelineBuilder& Label(std::string label);
    GpuPipelineBuilder& BindGroupLayout(wgpu::BindGroupLayout layout);
    GpuPipelineBuilder& VertexShader(wgpu::ShaderModule module, std::string entry);
    GpuPipelineBuilder& FragmentShader(wgpu::ShaderModule module, std::string entry);
    GpuPipelineBuilder& VertexBufferLayout(const wgpu::VertexBufferLayout& layout);
    GpuPipelineBuilder& ColorTarget(const wgpu::ColorTargetState& target);
    GpuPipelineBuilder& Primitive(const wgpu::PrimitiveState& primitive);
    GpuPipelineBuilder& DepthStencil(std::optional<wgpu::DepthStencilState> depthStencil);
    GpuPipelineBuilder& Multisample(const wgpu::MultisampleState& multisample);

    // ===== Defaults =====
    static wgpu::ColorTargetState DefaultColorTarget(wgpu::TextureFormat format);
    static wgpu::DepthStencilState DefaultDepthStencil();
    static wgpu::MultisampleState DefaultMultisample();
    static wgpu::PrimitiveState DefaultPrimitive();

    GpuPipeline Build() const;

private:
    struct ShaderStage {
        wgpu::ShaderModule module;
        std::string entry;
    };

    wgpu::Device device_;
    std::string label_;
    std::vector<wgpu::BindGroupLayout> bindGroupLayouts_;
    std::optional<ShaderStage> vertex_;
    std::optional<ShaderStage> fragment_;
    std::vector<wgpu::VertexBufferLayout> vertexBuffers_;
    std::vector<wgpu::ColorTargetState> colorTargets_;
    wgpu::PrimitiveState primitive_;
    std::optional<wgpu::DepthStencilState> depthStencil_;
    wgpu::MultisampleState multisample_;
};

} // namespace steps
