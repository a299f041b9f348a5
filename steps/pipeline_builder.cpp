#include "steps/pipeline_builder.hpp"

#include <stdexcept>
#include <utility>

namespace steps {

namespace {

// ColorTargetState only points at its blend state.
const wgpu::BlendState* ReplaceBlend() {
    static const wgpu::BlendState blend = [] {
        wgpu::BlendState b{};
        b.color.operation = wgpu::BlendOperation::Add; b.color.srcFactor = wgpu::BlendFactor::One; b.color.dstFactor = wgpu::BlendFactor::Zero;
        b.alpha.operation = wgpu::BlendOperation::Add; b.alpha.srcFactor = wgpu::BlendFactor::One; b.alpha.dstFactor = wgpu::BlendFactor::Zero;
        return b;
    }();
    return &blend;
}

} // namespace

GpuPipelineBuilder::GpuPipelineBuilder(wgpu::Device device)
    : device_(std::move(device)),
      primitive_(DefaultPrimitive()),
      multisample_(DefaultMultisample()) {}

GpuPipelineBuilder& GpuPipelineBuilder::Label(std::string label) {
    label_ = std::move(label);
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::BindGroupLayout(wgpu::BindGroupLayout layout) {
    bindGroupLayouts_.push_back(std::move(layout));
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::VertexShader(wgpu::ShaderModule module, std::string entry) {
    vertex_ = ShaderStage{ std::move(module), std::move(entry) };
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::FragmentShader(wgpu::ShaderModule module, std::string entry) {
    fragment_ = ShaderStage{ std::move(module), std::move(entry) };
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::VertexBufferLayout(const wgpu::VertexBufferLayout& layout) {
    vertexBuffers_.push_back(layout);
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::ColorTarget(const wgpu::ColorTargetState& target) {
    colorTargets_.push_back(target);
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::Primitive(const wgpu::PrimitiveState& primitive) {
    primitive_ = primitive;
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::DepthStencil(std::optional<wgpu::DepthStencilState> depthStencil) {
    depthStencil_ = std::move(depthStencil);
    return *this;
}

GpuPipelineBuilder& GpuPipelineBuilder::Multisample(const wgpu::MultisampleState& multisample) {
    multisample_ = multisample;
    return *this;
}

wgpu::ColorTargetState GpuPipelineBuilder::DefaultColorTarget(wgpu::TextureFormat format) {
    wgpu::ColorTargetState color{}; color.format = format; color.blend = ReplaceBlend(); color.writeMask = wgpu::ColorWriteMask::All;
    return color;
}

wgpu::DepthStencilState GpuPipelineBuilder::DefaultDepthStencil() {
    wgpu::DepthStencilState ds{}; ds.format = wgpu::TextureFormat::Depth32Float; ds.depthWriteEnabled = true; ds.depthCompare = wgpu::CompareFunction::Less;
    return ds;
}

wgpu::MultisampleState GpuPipelineBuilder::DefaultMultisample() {
    wgpu::MultisampleState ms{}; ms.count = 1; ms.mask = 0xFFFFFFFF; ms.alphaToCoverageEnabled = false;
    return ms;
}

wgpu::PrimitiveState GpuPipelineBuilder::DefaultPrimitive() {
    wgpu::PrimitiveState ps{};
    ps.topology = wgpu::PrimitiveTopology::TriangleList;
    ps.frontFace = wgpu::FrontFace::CCW;
    ps.cullMode = wgpu::CullMode::Back;
    return ps;
}

GpuPipeline GpuPipelineBuilder::Build() const {
    if (!vertex_) throw std::runtime_error("Vertex shader is required");

    GpuPipeline out;

    wgpu::PipelineLayoutDescriptor pld{};
    pld.label = label_.c_str();
    pld.bindGroupLayoutCount = bindGroupLayouts_.size();
    pld.bindGroupLayouts = bindGroupLayouts_.data();
    out.layout = device_.CreatePipelineLayout(&pld);

    wgpu::RenderPipelineDescriptor rpd{};
    rpd.label = label_.c_str(); rpd.layout = out.layout;
    rpd.vertex.module = vertex_->module; rpd.vertex.entryPoint = vertex_->entry.c_str();
    rpd.vertex.bufferCount = vertexBuffers_.size(); rpd.vertex.buffers = vertexBuffers_.data();

    wgpu::FragmentState fs{};
    if (fragment_) {
        fs.module = fragment_->module; fs.entryPoint = fragment_->entry.c_str();
        fs.targetCount = colorTargets_.size(); fs.targets = colorTargets_.data();
        rpd.fragment = &fs;
    }

    if (depthStencil_) rpd.depthStencil = &*depthStencil_;
    rpd.primitive = primitive_;
    rpd.multisample = multisample_;

    out.pipeline = device_.CreateRenderPipeline(&rpd);
    return out;
}

} // namespace steps
