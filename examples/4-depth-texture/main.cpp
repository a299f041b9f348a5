#include <exception>
#include <iostream>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/frame_time.hpp"
#include "steps/gpu_context.hpp"
#include "steps/gpu_util.hpp"
#include "steps/pipeline_builder.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/shaders.hpp"
#include "steps/texture.hpp"
#include "steps/vertex.hpp"
#include "steps/window.hpp"

namespace {

// The depth texture has the surface's size, so its dimensions double as the
// resolution here.
const char kDepthShader[] = R"(
@group(0) @binding(0) var depthTexture: texture_depth_2d;

@vertex
fn vs_main(@location(0) position: vec3f) -> @builtin(position) vec4f {
    return vec4f(position.xy * 0.5 + vec2f(0.5, 0.5), 0.0, 1.0);
}

@fragment
fn fs_main(@builtin(position) position: vec4f) -> @location(0) vec4f {
    let size = vec2i(textureDimensions(depthTexture));
    let halfRes = vec2f(size) * 0.5;
    let uv = vec2f((position.x - halfRes.x) / halfRes.x, position.y / halfRes.y);
    let texel = clamp(vec2i(uv * vec2f(size)), vec2i(0, 0), size - vec2i(1, 1));
    let depth = textureLoad(depthTexture, texel, 0);
    return vec4f(vec3f(1.0 - depth), 1.0);
}
)";

struct DepthScene {
    steps::Texture diffuse;
    wgpu::BindGroup diffuseBindGroup;
    steps::GpuPipeline diffusePipeline;

    steps::Texture depth;
    wgpu::BindGroupLayout depthLayout;
    wgpu::BindGroup depthBindGroup;
    steps::GpuPipeline depthPipeline;

    wgpu::Buffer triangle;
    wgpu::Buffer quad;
};

wgpu::BindGroup CreateDepthBindGroup(const steps::GpuContext& gpu, const DepthScene& scene) {
    wgpu::BindGroupEntry b0{}; b0.binding = 0; b0.textureView = scene.depth.view;
    wgpu::BindGroupDescriptor bgd{}; bgd.layout = scene.depthLayout; bgd.entryCount = 1; bgd.entries = &b0; bgd.label = "Depth Bind Group";
    return gpu.device.CreateBindGroup(&bgd);
}

DepthScene CreateScene(const steps::GpuContext& gpu, const steps::AppConfig& config) {
    DepthScene s;

    // ===== Diffuse =====
    s.diffuse = steps::Texture::FromImage(gpu.device, gpu.queue, steps::LoadDiffuseImage(config), "Diffuse Texture");

    wgpu::BindGroupLayoutEntry e0{}; e0.binding = 0; e0.visibility = wgpu::ShaderStage::Fragment; e0.texture.sampleType = wgpu::TextureSampleType::Float; e0.texture.viewDimension = wgpu::TextureViewDimension::e2D;
    wgpu::BindGroupLayoutEntry e1{}; e1.binding = 1; e1.visibility = wgpu::ShaderStage::Fragment; e1.sampler.type = wgpu::SamplerBindingType::Filtering;
    wgpu::BindGroupLayoutEntry entries[2] = { e0, e1 };
    wgpu::BindGroupLayoutDescriptor bgld{}; bgld.entryCount = 2; bgld.entries = entries; bgld.label = "Texture Bind Group Layout";
    wgpu::BindGroupLayout diffuseLayout = gpu.device.CreateBindGroupLayout(&bgld);

    wgpu::BindGroupEntry b0{}; b0.binding = 0; b0.textureView = s.diffuse.view;
    wgpu::BindGroupEntry b1{}; b1.binding = 1; b1.sampler = s.diffuse.sampler;
    wgpu::BindGroupEntry bgEntries[2] = { b0, b1 };
    wgpu::BindGroupDescriptor bgd{}; bgd.layout = diffuseLayout; bgd.entryCount = 2; bgd.entries = bgEntries; bgd.label = "Texture Bind Group";
    s.diffuseBindGroup = gpu.device.CreateBindGroup(&bgd);

    wgpu::ShaderModule shader = steps::CreateShaderModule(gpu.device, steps::kDiffuseWGSL, "Texture Shader");
    s.diffusePipeline = steps::GpuPipelineBuilder(gpu.device)
                            .Label("Render Pipeline")
                            .BindGroupLayout(diffuseLayout)
                            .VertexShader(shader, "vs_main")
                            .FragmentShader(shader, "fs_main")
                            .VertexBufferLayout(steps::Vertex::Layout())
                            .ColorTarget(steps::GpuPipelineBuilder::DefaultColorTarget(gpu.Format()))
                            .DepthStencil(steps::GpuPipelineBuilder::DefaultDepthStencil())
                            .Build();

    // ===== Depth visualization =====
    const steps::FramebufferSize size = gpu.Size();
    s.depth = steps::Texture::CreateDepth(gpu.device, size.width, size.height, "Depth Texture");

    wgpu::BindGroupLayoutEntry d0{}; d0.binding = 0; d0.visibility = wgpu::ShaderStage::Fragment; d0.texture.sampleType = wgpu::TextureSampleType::Depth; d0.texture.viewDimension = wgpu::TextureViewDimension::e2D;
    wgpu::BindGroupLayoutDescriptor dld{}; dld.entryCount = 1; dld.entries = &d0; dld.label = "Depth Bind Group Layout";
    s.depthLayout = gpu.device.CreateBindGroupLayout(&dld);
    s.depthBindGroup = CreateDepthBindGroup(gpu, s);

    wgpu::ShaderModule depthShader = steps::CreateShaderModule(gpu.device, kDepthShader, "Depth Shader");
    s.depthPipeline = steps::GpuPipelineBuilder(gpu.device)
                          .Label("Depth Pipeline")
                          .BindGroupLayout(s.depthLayout)
                          .VertexShader(depthShader, "vs_main")
                          .FragmentShader(depthShader, "fs_main")
                          .VertexBufferLayout(steps::DepthVertex::Layout())
                          .ColorTarget(steps::GpuPipelineBuilder::DefaultColorTarget(gpu.Format()))
                          .Build();

    // ===== Buffers =====
    s.triangle = steps::CreateBuffer(gpu.device, steps::kTriangle.data(), sizeof(steps::kTriangle),
                                     wgpu::BufferUsage::Vertex | wgpu::BufferUsage::CopyDst, "Vertex Buffer");
    s.quad = steps::CreateBuffer(gpu.device, steps::kFullscreenQuad.data(), sizeof(steps::kFullscreenQuad),
                                 wgpu::BufferUsage::Vertex, "Depth Quad Buffer");
    return s;
}

void OnResize(steps::GpuContext& gpu, DepthScene& scene, steps::FramebufferSize size) {
    if (size.IsEmpty()) return;
    gpu.Resize(size);
    scene.depth.Resize(gpu.device, size.width, size.height);
    scene.depthBindGroup = CreateDepthBindGroup(gpu, scene);
}

void Render(steps::GpuContext& gpu, const DepthScene& scene, float time) {
    auto frame = gpu.AcquireFrame();
    if (!frame) return;

    const auto verts = steps::RotatedVertices(time);
    gpu.queue.WriteBuffer(scene.triangle, 0, verts.data(), sizeof(verts));

    wgpu::CommandEncoder encoder = gpu.device.CreateCommandEncoder();
    {
        wgpu::RenderPassEncoder pass = steps::RenderPassBuilder(encoder)
                                           .Label("Render Pass")
                                           .ColorView(frame->view)
                                           .ClearColor({ 0.1, 0.2, 0.3, 1.0 })
                                           .DepthView(scene.depth.view)
                                           .Build();
        pass.SetPipeline(scene.diffusePipeline.pipeline);
        pass.SetBindGroup(0, scene.diffuseBindGroup);
        pass.SetVertexBuffer(0, scene.triangle);
        pass.Draw(static_cast<uint32_t>(verts.size()));
        pass.End();
    }
    {
        wgpu::RenderPassEncoder pass = steps::RenderPassBuilder(encoder)
                                           .Label("Depth Pass")
                                           .ColorView(frame->view)
                                           .LoadColor()
                                           .Build();
        pass.SetPipeline(scene.depthPipeline.pipeline);
        pass.SetBindGroup(0, scene.depthBindGroup);
        pass.SetVertexBuffer(0, scene.quad);
        pass.Draw(static_cast<uint32_t>(steps::kFullscreenQuad.size()));
        pass.End();
    }

    wgpu::CommandBuffer commands = encoder.Finish();
    gpu.queue.Submit(1, &commands);
    gpu.Present();
}

} // namespace

int main(int argc, char** argv) {
    try {
        steps::AppConfig defaults;
        defaults.title = "Depth Texture";
        const steps::AppConfig config = steps::LoadConfig(argc, argv, defaults);
        if (config.showHelp) {
            std::cout << steps::Usage(argv[0]);
            return 0;
        }

        steps::Window window(config);
        steps::GpuContext gpu(window, config);
        DepthScene scene = CreateScene(gpu, config);
        window.SetResizeHandler([&](steps::FramebufferSize size) { OnResize(gpu, scene, size); });

        steps::FrameClock clock;
        while (!window.ShouldClose()) {
            window.PollEvents();
            clock.Update();
            Render(gpu, scene, clock.total);
            gpu.ProcessEvents();
        }
    } catch (const std::exception& e) {
        std::cerr << "[fatal] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
