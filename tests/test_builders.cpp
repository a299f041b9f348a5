#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <webgpu/webgpu_cpp.h>

#include "steps/pipeline_builder.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/shaders.hpp"

using steps::GpuPipelineBuilder;
using steps::RenderPassBuilder;

// Null device and encoder handles: Build() must reject incomplete state before
// it calls into either of them.

static std::string BuildError(const GpuPipelineBuilder& builder) {
    try {
        builder.Build();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

static std::string BuildError(RenderPassBuilder& builder) {
    try {
        builder.Build();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

// --- GpuPipelineBuilder ---

TEST(GpuPipelineBuilder, BuildWithoutVertexShaderThrows) {
    GpuPipelineBuilder builder{wgpu::Device{}};
    EXPECT_EQ(BuildError(builder), "Vertex shader is required");
}

TEST(GpuPipelineBuilder, FragmentStageAloneIsNotEnough) {
    GpuPipelineBuilder builder{wgpu::Device{}};
    builder.Label("Fragment Only")
        .FragmentShader(wgpu::ShaderModule{}, "fs_main")
        .ColorTarget(GpuPipelineBuilder::DefaultColorTarget(wgpu::TextureFormat::BGRA8Unorm))
        .DepthStencil(GpuPipelineBuilder::DefaultDepthStencil());
    EXPECT_EQ(BuildError(builder), "Vertex shader is required");
}

TEST(GpuPipelineBuilder, DefaultColorTargetReplaces) {
    const wgpu::ColorTargetState target = GpuPipelineBuilder::DefaultColorTarget(wgpu::TextureFormat::RGBA16Float);
    EXPECT_EQ(target.format, wgpu::TextureFormat::RGBA16Float);
    EXPECT_EQ(target.writeMask, wgpu::ColorWriteMask::All);
    ASSERT_NE(target.blend, nullptr);
    EXPECT_EQ(target.blend->color.srcFactor, wgpu::BlendFactor::One);
    EXPECT_EQ(target.blend->color.dstFactor, wgpu::BlendFactor::Zero);
    EXPECT_EQ(target.blend->alpha.srcFactor, wgpu::BlendFactor::One);
    EXPECT_EQ(target.blend->alpha.dstFactor, wgpu::BlendFactor::Zero);
}

TEST(GpuPipelineBuilder, DefaultDepthStencilIsLessOnDepth32) {
    const wgpu::DepthStencilState ds = GpuPipelineBuilder::DefaultDepthStencil();
    EXPECT_EQ(ds.format, wgpu::TextureFormat::Depth32Float);
    EXPECT_EQ(ds.depthCompare, wgpu::CompareFunction::Less);
}

TEST(GpuPipelineBuilder, DefaultPrimitiveCullsBackFaces) {
    const wgpu::PrimitiveState ps = GpuPipelineBuilder::DefaultPrimitive();
    EXPECT_EQ(ps.topology, wgpu::PrimitiveTopology::TriangleList);
    EXPECT_EQ(ps.frontFace, wgpu::FrontFace::CCW);
    EXPECT_EQ(ps.cullMode, wgpu::CullMode::Back);

    const wgpu::MultisampleState ms = GpuPipelineBuilder::DefaultMultisample();
    EXPECT_EQ(ms.count, 1u);
    EXPECT_EQ(ms.mask, 0xFFFFFFFFu);
}

// --- RenderPassBuilder ---

TEST(RenderPassBuilder, BuildWithoutColorViewThrows) {
    RenderPassBuilder builder{wgpu::CommandEncoder{}};
    EXPECT_EQ(BuildError(builder), "No color attachment provided");
}

TEST(RenderPassBuilder, DepthViewAloneIsNotEnough) {
    RenderPassBuilder builder{wgpu::CommandEncoder{}};
    builder.Label("Depth Only").ClearColor({0.1, 0.2, 0.3, 1.0}).DepthView(wgpu::TextureView{});
    EXPECT_EQ(BuildError(builder), "No color attachment provided");
}

// --- Shared shaders ---

TEST(DiffuseShader, ExposesBothEntryPointsAndGroupZeroBindings) {
    const std::string wgsl = steps::kDiffuseWGSL;
    EXPECT_NE(wgsl.find("fn vs_main("), std::string::npos);
    EXPECT_NE(wgsl.find("fn fs_main("), std::string::npos);
    EXPECT_NE(wgsl.find("@group(0) @binding(0) var diffuseTexture"), std::string::npos);
    EXPECT_NE(wgsl.find("@group(0) @binding(1) var diffuseSampler"), std::string::npos);
}
