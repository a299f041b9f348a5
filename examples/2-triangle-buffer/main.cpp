#include <exception>
#include <iostream>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/gpu_context.hpp"
#include "steps/gpu_util.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/vertex.hpp"
#include "steps/window.hpp"

namespace {

const char kShader[] = R"(
struct VertexInput {
    @location(0) position: vec3f,
    @location(1) color: vec3f,
};

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) color: vec3f,
};

@vertex
fn vs_main(in: VertexInput) -> VertexOutput {
    var out: VertexOutput;
    out.position = vec4f(in.position, 1.0);
    out.color = in.color;
    return out;
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    return vec4f(in.color, 1.0);
}
)";

struct Triangle {
    wgpu::RenderPipeline pipeline;
    wgpu::Buffer vertexBuffer;
};

Triangle CreateTriangle(const steps::GpuContext& gpu) {
    Triangle t;
    t.vertexBuffer = steps::CreateBuffer(gpu.device, steps::kColorTriangle.data(), sizeof(steps::kColorTriangle),
                                         wgpu::BufferUsage::Vertex, "Vertex Buffer");

    wgpu::ShaderModule shader = steps::CreateShaderModule(gpu.device, kShader, "Triangle Shader");

    wgpu::PipelineLayoutDescriptor pld{}; pld.label = "Render Pipeline Layout";
    wgpu::PipelineLayout layout = gpu.device.CreatePipelineLayout(&pld);

    wgpu::VertexBufferLayout vbl = steps::ColorVertex::Layout();

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

void Render(steps::GpuContext& gpu, const Triangle& triangle) {
    auto frame = gpu.AcquireFrame();
    if (!frame) return;

    wgpu::CommandEncoder encoder = gpu.device.CreateCommandEncoder();
    wgpu::RenderPassEncoder pass = steps::RenderPassBuilder(encoder)
                                       .Label("Render Pass")
                                       .ColorView(frame->view)
                                       .ClearColor({ 0.1, 0.2, 0.3, 1.0 })
                                       .Build();
    pass.SetPipeline(triangle.pipeline);
    pass.SetVertexBuffer(0, triangle.vertexBuffer);
    pass.Draw(static_cast<uint32_t>(steps::kColorTriangle.size()));
    pass.End();

    wgpu::CommandBuffer commands = encoder.Finish();
    gpu.queue.Submit(1, &commands);
    gpu.Present();
}

} // namespace

int main(int argc, char** argv) {
    try {
        steps::AppConfig defaults;
        defaults.title = "Triangle Buffer";
        const steps::AppConfig config = steps::LoadConfig(argc, argv, defaults);
        if (config.showHelp) {
            std::cout << steps::Usage(argv[0]);
            return 0;
        }

        steps::Window window(config);
        steps::GpuContext gpu(window, config);
        window.SetResizeHandler([&gpu](steps::FramebufferSize size) { gpu.Resize(size); });

        const Triangle triangle = CreateTriangle(gpu);

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
