#include "steps/scene.hpp"

#include <exception>
#include <optional>

#include "steps/gpu_util.hpp"
#include "steps/log.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/shaders.hpp"
#include "steps/vertex.hpp"

namespace steps {

namespace {

// ===================== Shaders =====================

const char kDepthWGSL[] = R"(
struct Uniforms {
    resolution: vec2f,
    srgbSurface: f32,
    padding: f32,
};

@group(0) @binding(0) var depthTexture: texture_depth_2d;
@group(0) @binding(1) var<uniform> uniforms: Uniforms;

struct VertexOutput {
    @builtin(position) position: vec4f,
};

// full-screen quad squeezed into the top-right quarter
@vertex
fn vs_main(@location(0) position: vec3f) -> VertexOutput {
    var out: VertexOutput;
    out.position = vec4f(position.xy * 0.5 + vec2f(0.5, 0.5), 0.0, 1.0);
    return out;
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    let halfRes = uniforms.resolution * 0.5;
    let uv = vec2f((in.position.x - halfRes.x) / halfRes.x, in.position.y / halfRes.y);
    let size = vec2i(textureDimensions(depthTexture));
    let texel = clamp(vec2i(uv * vec2f(size)), vec2i(0, 0), size - vec2i(1, 1));
    let depth = textureLoad(depthTexture, texel, 0);
    return vec4f(vec3f(1.0 - depth), 1.0);
}
)";

const char kPresentWGSL[] = R"(
struct Uniforms {
    resolution: vec2f,
    srgbSurface: f32,
    padding: f32,
};

@group(0) @binding(0) var frameTexture: texture_2d<f32>;
@group(0) @binding(1) var frameSampler: sampler;
@group(0) @binding(2) var<uniform> uniforms: Uniforms;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@vertex
fn vs_main(@location(0) position: vec3f) -> VertexOutput {
    var out: VertexOutput;
    out.position = vec4f(position.xy, 0.0, 1.0);
    out.uv = vec2f(position.x * 0.5 + 0.5, 0.5 - position.y * 0.5);
    return out;
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    let color = textureSample(frameTexture, frameSampler, in.uv);
    if (uniforms.srgbSurface > 0.5) {
        return color;
    }
    return vec4f(pow(max(color.rgb, vec3f(0.0)), vec3f(1.0 / 2.2)), color.a);
}
)";

wgpu::BindGroup CreateDepthBindGroup(const GpuContext& gpu, const DepthPass& pass, const Uniforms& uniforms) {
    wgpu::BindGroupEntry b0{}; b0.binding = 0; b0.textureView = pass.depth.view;
    wgpu::BindGroupEntry b1{}; b1.binding = 1; b1.buffer = uniforms.buffer; b1.offset = 0; b1.size = sizeof(UniformsData);
    wgpu::BindGroupEntry entries[2] = { b0, b1 };
    wgpu::BindGroupDescriptor bgd{}; bgd.layout = pass.layout; bgd.entryCount = 2; bgd.entries = entries; bgd.label = "Depth Bind Group";
    return gpu.device.CreateBindGroup(&bgd);
}

wgpu::BindGroup CreatePresentBindGroup(const GpuContext& gpu, const PresentPass& pass, const Texture& frameBuffer,
                                       const Uniforms& uniforms) {
    wgpu::BindGroupEntry b0{}; b0.binding = 0; b0.textureView = frameBuffer.view;
    wgpu::BindGroupEntry b1{}; b1.binding = 1; b1.sampler = frameBuffer.sampler;
    wgpu::BindGroupEntry b2{}; b2.binding = 2; b2.buffer = uniforms.buffer; b2.offset = 0; b2.size = sizeof(UniformsData);
    wgpu::BindGroupEntry entries[3] = { b0, b1, b2 };
    wgpu::BindGroupDescriptor bgd{}; bgd.layout = pass.layout; bgd.entryCount = 3; bgd.entries = entries; bgd.label = "Present Bind Group";
    return gpu.device.CreateBindGroup(&bgd);
}

} // namespace

// ===================== Setup =====================
Texture SetupFrameBuffer(const GpuContext& gpu) {
    FramebufferSize size = gpu.Size();
    return Texture::CreateFrameBuffer(gpu.device, size.width, size.height, "Frame Buffer");
}

DiffusePass SetupDiffusePass(const GpuContext& gpu, const DecodedImage& image) {
    DiffusePass pass;
    pass.texture = Texture::FromImage(gpu.device, gpu.queue, image, "Diffuse Texture");

    wgpu::BindGroupLayoutEntry e0{}; e0.binding = 0; e0.visibility = wgpu::ShaderStage::Fragment; e0.texture.sampleType = wgpu::TextureSampleType::Float; e0.texture.viewDimension = wgpu::TextureViewDimension::e2D;
    wgpu::BindGroupLayoutEntry e1{}; e1.binding = 1; e1.visibility = wgpu::ShaderStage::Fragment; e1.sampler.type = wgpu::SamplerBindingType::Filtering;
    wgpu::BindGroupLayoutEntry entries[2] = { e0, e1 };
    wgpu::BindGroupLayoutDescriptor bgld{}; bgld.entryCount = 2; bgld.entries = entries; bgld.label = "Diffuse Bind Group Layout";
    pass.layout = gpu.device.CreateBindGroupLayout(&bgld);

    wgpu::BindGroupEntry b0{}; b0.binding = 0; b0.textureView = pass.texture.view;
    wgpu::BindGroupEntry b1{}; b1.binding = 1; b1.sampler = pass.texture.sampler;
    wgpu::BindGroupEntry bgEntries[2] = { b0, b1 };
    wgpu::BindGroupDescriptor bgd{}; bgd.layout = pass.layout; bgd.entryCount = 2; bgd.entries = bgEntries; bgd.label = "Diffuse Bind Group";
    pass.bindGroup = gpu.device.CreateBindGroup(&bgd);

    wgpu::ShaderModule shader = CreateShaderModule(gpu.device, kDiffuseWGSL, "Diffuse Shader");
    pass.pipeline = GpuPipelineBuilder(gpu.device)
                        .Label("Diffuse Pipeline")
                        .BindGroupLayout(pass.layout)
                        .VertexShader(shader, "vs_main")
                        .FragmentShader(shader, "fs_main")
                        .VertexBufferLayout(Vertex::Layout())
                        .ColorTarget(GpuPipelineBuilder::DefaultColorTarget(Texture::kFrameBufferFormat))
                        .DepthStencil(GpuPipelineBuilder::DefaultDepthStencil())
                        .Build();
    return pass;
}

DepthPass SetupDepthPass(const GpuContext& gpu, const Uniforms& uniforms) {
    DepthPass pass;
    FramebufferSize size = gpu.Size();
    pass.depth = Texture::CreateDepth(gpu.device, size.width, size.height, "Depth Texture");

    wgpu::BindGroupLayoutEntry e0{}; e0.binding = 0; e0.visibility = wgpu::ShaderStage::Fragment; e0.texture.sampleType = wgpu::TextureSampleType::Depth; e0.texture.viewDimension = wgpu::TextureViewDimension::e2D;
    wgpu::BindGroupLayoutEntry e1{}; e1.binding = 1; e1.visibility = wgpu::ShaderStage::Vertex | wgpu::ShaderStage::Fragment; e1.buffer.type = wgpu::BufferBindingType::Uniform; e1.buffer.minBindingSize = sizeof(UniformsData);
    wgpu::BindGroupLayoutEntry entries[2] = { e0, e1 };
    wgpu::BindGroupLayoutDescriptor bgld{}; bgld.entryCount = 2; bgld.entries = entries; bgld.label = "Depth Bind Group Layout";
    pass.layout = gpu.device.CreateBindGroupLayout(&bgld);
    pass.bindGroup = CreateDepthBindGroup(gpu, pass, uniforms);

    wgpu::ShaderModule shader = CreateShaderModule(gpu.device, kDepthWGSL, "Depth Shader");
    pass.pipeline = GpuPipelineBuilder(gpu.device)
                        .Label("Depth Pipeline")
                        .BindGroupLayout(pass.layout)
                        .VertexShader(shader, "vs_main")
                        .FragmentShader(shader, "fs_main")
                        .VertexBufferLayout(DepthVertex::Layout())
                        .ColorTarget(GpuPipelineBuilder::DefaultColorTarget(Texture::kFrameBufferFormat))
                        .Build();
    return pass;
}

VertexBuffers SetupVertexBuffers(const GpuContext& gpu) {
    VertexBuffers buffers;
    buffers.triangle = CreateBuffer(gpu.device, kTriangle.data(), sizeof(kTriangle),
                                    wgpu::BufferUsage::Vertex | wgpu::BufferUsage::CopyDst, "Triangle Vertices");
    buffers.quad = CreateBuffer(gpu.device, kFullscreenQuad.data(), sizeof(kFullscreenQuad),
                                wgpu::BufferUsage::Vertex, "Quad Vertices");
    return buffers;
}

PresentPass SetupPresentPass(const GpuContext& gpu, const Texture& frameBuffer, const Uniforms& uniforms) {
    PresentPass pass;

    wgpu::BindGroupLayoutEntry e0{}; e0.binding = 0; e0.visibility = wgpu::ShaderStage::Fragment; e0.texture.sampleType = wgpu::TextureSampleType::Float; e0.texture.viewDimension = wgpu::TextureViewDimension::e2D;
    wgpu::BindGroupLayoutEntry e1{}; e1.binding = 1; e1.visibility = wgpu::ShaderStage::Fragment; e1.sampler.type = wgpu::SamplerBindingType::Filtering;
    wgpu::BindGroupLayoutEntry e2{}; e2.binding = 2; e2.visibility = wgpu::ShaderStage::Fragment; e2.buffer.type = wgpu::BufferBindingType::Uniform; e2.buffer.minBindingSize = sizeof(UniformsData);
    wgpu::BindGroupLayoutEntry entries[3] = { e0, e1, e2 };
    wgpu::BindGroupLayoutDescriptor bgld{}; bgld.entryCount = 3; bgld.entries = entries; bgld.label = "Present Bind Group Layout";
    pass.layout = gpu.device.CreateBindGroupLayout(&bgld);
    pass.bindGroup = CreatePresentBindGroup(gpu, pass, frameBuffer, uniforms);

    wgpu::ShaderModule shader = CreateShaderModule(gpu.device, kPresentWGSL, "Present Shader");
    pass.pipeline = GpuPipelineBuilder(gpu.device)
                        .Label("Present Pipeline")
                        .BindGroupLayout(pass.layout)
                        .VertexShader(shader, "vs_main")
                        .FragmentShader(shader, "fs_main")
                        .VertexBufferLayout(DepthVertex::Layout())
                        .ColorTarget(GpuPipelineBuilder::DefaultColorTarget(gpu.Format()))
                        .Build();
    return pass;
}

Scene::Scene(GpuContext& context, const DecodedImage& diffuseImage)
    : gpu(context),
      uniforms(context),
      frameBuffer(SetupFrameBuffer(context)),
      diffuse(SetupDiffusePass(context, diffuseImage)),
      depth(SetupDepthPass(context, uniforms)),
      vertices(SetupVertexBuffers(context)),
      present(SetupPresentPass(context, frameBuffer, uniforms)) {}

void Scene::OnResize(FramebufferSize size) {
    if (size.IsEmpty()) {
        log::Debug("resize") << "Ignoring resize to " << size << "\n";
        return;
    }
    log::Info("resize") << "Resizing to " << size << "\n";

    gpu.Resize(size);
    frameBuffer.Resize(gpu.device, size.width, size.height);
    depth.depth.Resize(gpu.device, size.width, size.height);
    uniforms.UpdateResolution(gpu, size);

    depth.bindGroup = CreateDepthBindGroup(gpu, depth, uniforms);
    present.bindGroup = CreatePresentBindGroup(gpu, present, frameBuffer, uniforms);
}

// ===================== Systems =====================
void TimeSystem(SceneTime& time, Window& window) {
    time.clock.Update();
    time.history.Push(time.clock.delta);
    window.SetTitle(FormatFrameTitle(time.history));
}

void ResizeSystem(Scene& scene, ResizeState& resize, const SceneTime& time) {
    resize.debouncer.Tick(time.clock.delta);
    if (auto size = resize.debouncer.Take()) scene.OnResize(*size);
}

bool RenderSystem(Scene& scene, const SceneTime& time, const OverlayFn& overlay) {
    GpuContext& gpu = scene.gpu;

    std::optional<SurfaceFrame> frame = gpu.AcquireFrame();
    if (!frame) return false;

    const auto verts = RotatedVertices(time.clock.total);
    gpu.queue.WriteBuffer(scene.vertices.triangle, 0, verts.data(), sizeof(verts));

    wgpu::CommandEncoderDescriptor ed{}; ed.label = "Frame Encoder";
    wgpu::CommandEncoder encoder = gpu.device.CreateCommandEncoder(&ed);

    {
        wgpu::RenderPassEncoder pass = RenderPassBuilder(encoder)
                                           .Label("Diffuse Pass")
                                           .ColorView(scene.frameBuffer.view)
                                           .ClearColor(scene.clearColor)
                                           .DepthView(scene.depth.depth.view, 1.0f)
                                           .Build();
        pass.SetPipeline(scene.diffuse.pipeline.pipeline);
        pass.SetBindGroup(0, scene.diffuse.bindGroup);
        pass.SetVertexBuffer(0, scene.vertices.triangle);
        pass.Draw(static_cast<uint32_t>(verts.size()));
        pass.End();
    }
    {
        wgpu::RenderPassEncoder pass = RenderPassBuilder(encoder)
                                           .Label("Depth Pass")
                                           .ColorView(scene.frameBuffer.view)
                                           .LoadColor()
                                           .Build();
        pass.SetPipeline(scene.depth.pipeline.pipeline);
        pass.SetBindGroup(0, scene.depth.bindGroup);
        pass.SetVertexBuffer(0, scene.vertices.quad);
        pass.Draw(static_cast<uint32_t>(kFullscreenQuad.size()));
        pass.End();
    }
    if (overlay) overlay(encoder, scene.frameBuffer.view);
    {
        wgpu::RenderPassEncoder pass = RenderPassBuilder(encoder)
                                           .Label("Present Pass")
                                           .ColorView(frame->view)
                                           .Build();
        pass.SetPipeline(scene.present.pipeline.pipeline);
        pass.SetBindGroup(0, scene.present.bindGroup);
        pass.SetVertexBuffer(0, scene.vertices.quad);
        pass.Draw(static_cast<uint32_t>(kFullscreenQuad.size()));
        pass.End();
    }

    wgpu::CommandBuffer commands = encoder.Finish();
    gpu.queue.Submit(1, &commands);
    return true;
}

bool RunFrame(Scene& scene, ResizeState& resize, SceneTime& time, Window& window, const OverlayFn& overlay) {
    TimeSystem(time, window);
    ResizeSystem(scene, resize, time);
    try {
        return RenderSystem(scene, time, overlay);
    } catch (const std::exception& e) {
        log::Error("render") << "Error during rendering: " << e.what() << "\n";
        return false;
    }
}

} // namespace steps
