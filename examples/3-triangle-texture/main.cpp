#include <exception>
#include <iostream>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/gpu_context.hpp"
#include "steps/gpu_util.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/shaders.hpp"
#include "steps/texture.hpp"
#include "steps/vertex.hpp"
#include "steps/window.hpp"

namespace {

struct TexturedTriangle {
    steps::Texture diffuse;
    wgpu::BindGroupLayout bindGroupLayout;
    wgpu::BindGroup bindGroup;
    wgpu::RenderPipeline pipeline;
    wgpu::Buffer vertexBuffer;
};

TexturedTriangle CreateTexturedTriangle(const steps::GpuContext& gpu, const steps::AppConfig& config) {
    TexturedTriangle t;
    t.diffuse = steps::Texture::FromImage(gpu.device, gpu.queue, steps::LoadDiffuseImage(config), "Diffuse Texture");

    wgpu::BindGroupLayoutEntry e0{}; e0.binding = 0; e0.visibility = wgpu::ShaderStage::Fragment; e0.texture.sampleType = wgpu::TextureSampleType::Float; e0.texture.viewDimension = wgpu::TextureViewDimension::e2D;
    wgpu::BindGroupLayoutEntry e1{}; e1.binding = 1; e1.visibility = wgpu::ShaderStage::Fragment; e1.sampler.type = wgpu::SamplerBindingType::Filtering;
    wgpu::BindGroupLayoutEntry entries[2] = { e0, e1 };
    wgpu::BindGroupLayoutDescriptor bgld{}; bgld.entryCount = 2; bgld.entries = entries; bgld.label = "Texture Bind Group Layout";
    t.bindGroupLayout = gpu.device.CreateBindGroupLayout(&bgld);

    wgpu::BindGroupEntry b0{}; b0.binding = 0; b0.textureView = t.diffuse.view;
    wgpu::BindGroupEntry b1{}; b1.binding = 1; b1.sampler = t.diffuse.sampler;
    wgpu::BindGroupEntry bgEntries[2] = { b0, b1 };
    wgpu::BindGroupDescriptor bgd{}; bgd.layout = t.bindGroupLayout; bgd.entryCount = 2; bgd.entries = bgEntries; bgd.label = "Texture Bind Group";
    t.bindGroup = gpu.device.CreateBindGroup(&bgd);

    t.vertexBuffer = steps::CreateBuffer(gpu.device, steps::kTriangle.data(), sizeof(steps::kTriangle),
                                         wgpu::BufferUsage::Vertex, "Vertex Buffer");

    wgpu::ShaderModule shader = steps::CreateShaderModule(gpu.device, steps::kDiffuseWGSL, "Texture Shader");

    wgpu::PipelineLayoutDescriptor pld{}; wgpu::BindGroupLayout layouts[1] = { t.bindGroupLayout };
    pld.bindGroupLayoutCount = 1; pld.bindGroupLayouts = layouts; pld.label = "Render Pipeline Layout";
    wgpu::PipelineLayout layout = gpu.device.CreatePipelineLayout(&pld);

    wgpu::VertexBufferLayout vbl = steps::Vertex::Layout();

    wgpu::ColorTargetState color{}; color.format = gpu.Format(); color.writeMask = wgpu::ColorWriteMask::All;
    wgpu::FragmentState fs{}; fs.module = shader; fs.entryPoint = "fs_main"; fs.targetCount = 1; fs.targets = &color;

    wgpu::RenderPipelineDescriptor rpd{};
    rpd.label = "Render Pipeline"; rpd.layout = layout;
    rpd.vertex.module = shader; rpd.vertex.entryPoint = "vs_main";
    rpd.vertex.bufferCount = 1; rpd.vertex.buffers = &vbl;
    rpd.fragment = &fs;
    rpd.primitive.topology = wgpu::PrimitiveTopology::TriangleList;
    rpd.primitive.frontFace = wgpu::FrontFace::CCW;
    rpd.primitive.cullMode = wgpu::CullMode::Back;
    rpd.multisample.count = 1; rpd.multisample.mask = 0xFFFFFFFF; rpd.multisample.alphaToCoverageEnabled = false;
    t.pipeline = gpu.device.CreateRenderPipeline(&rpd);
    return t;
}

void Render(steps::GpuContext& gpu, const TexturedTriangle& triangle) {
    auto frame = gpu.AcquireFrame();
    if (!frame) return;

    wgpu::CommandEncoder encoder = gpu.device.CreateCommandEncoder();
    wgpu::RenderPassEncoder pass = steps::RenderPassBuilder(encoder)
                                       .Label("Render Pass")
                                       .ColorView(frame->view)
                                       .ClearColor({ 0.1, 0.2, 0.3, 1.0 })
                                       .Build();
    pass.SetPipeline(triangle.pipeline);
    pass.SetBindGroup(0, triangle.bindGroup);
    pass.SetVertexBuffer(0, triangle.vertexBuffer);
    pass.Draw(static_cast<uint32_t>(steps::kTriangle.size()));
    pass.End();

    wgpu::CommandBuffer commands = encoder.Finish();
    gpu.queue.Submit(1, &commands);
    gpu.Present();
}

} // namespace

int main(int argc, char** argv) {
    try {
        steps::AppConfig defaults;
        defaults.title = "Triangle Texture";
        const steps::AppConfig config = steps::LoadConfig(argc, argv, defaults);
        if (config.showHelp) {
            std::cout << steps::Usage(argv[0]);
            return 0;
        }

        steps::Window window(config);
        steps::GpuContext gpu(window, config);
        window.SetResizeHandler([&gpu](steps::FramebufferSize size) { gpu.Resize(size); });

        const TexturedTriangle triangle = CreateTexturedTriangle(gpu, config);

        while (!window.ShouldClose()) {
            window.PollEvents();
            Render(gpu, triangle);
            gpu.ProcessEvents();
        }
    } catch (const std::exception& e) {
        std::cerr << "[fatal] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
