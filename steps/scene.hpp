#pragma once

#include <chrono>
#include <functional>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/debouncer.hpp"
#include "steps/frame_time.hpp"
#include "steps/gpu_context.hpp"
#include "steps/image.hpp"
#include "steps/pipeline_builder.hpp"
#include "steps/size.hpp"
#include "steps/texture.hpp"
#include "steps/uniforms.hpp"
#include "steps/window.hpp"

namespace steps {

// ===================== Resources =====================
// Built once, in declaration order, then handed by reference to the per-frame
// systems below.

struct DiffusePass {
    Texture texture;
    wgpu::BindGroupLayout layout;
    wgpu::BindGroup bindGroup;
    GpuPipeline pipeline;
};

// Shows the depth buffer in the top-right quarter of the frame buffer.
struct DepthPass {
    Texture depth;
    wgpu::BindGroupLayout layout;
    wgpu::BindGroup bindGroup; // depth view + uniforms, rebuilt on resize
    GpuPipeline pipeline;
};

struct VertexBuffers {
    wgpu::Buffer triangle; // rewritten every frame
    wgpu::Buffer quad;
};

// Frame buffer -> surface, gamma-encoding for non-sRGB surfaces.
struct PresentPass {
    wgpu::BindGroupLayout layout;
    wgpu::BindGroup bindGroup; // frame buffer view + sampler + uniforms, rebuilt on resize
    GpuPipeline pipeline;
};

struct ResizeState {
    Debouncer<FramebufferSize> debouncer;

    explicit ResizeState(std::chrono::milliseconds delay) : debouncer(delay) {}
};

struct SceneTime {
    FrameClock clock;
    FrameTimeHistory history;
};

// ===================== Setup =====================
Texture SetupFrameBuffer(const GpuContext& gpu);
DiffusePass SetupDiffusePass(const GpuContext& gpu, const DecodedImage& image);
DepthPass SetupDepthPass(const GpuContext& gpu, const Uniforms& uniforms);
VertexBuffers SetupVertexBuffers(const GpuContext& gpu);
PresentPass SetupPresentPass(const GpuContext& gpu, const Texture& frameBuffer, const Uniforms& uniforms);

struct Scene {
    GpuContext& gpu;
    Uniforms uniforms;
    Texture frameBuffer;
    DiffusePass diffuse;
    DepthPass depth;
    VertexBuffers vertices;
    PresentPass present;
    wgpu::Color clearColor{ 0.1, 0.2, 0.3, 1.0 };

    Scene(GpuContext& gpu, const DecodedImage& diffuseImage);

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // Surface, frame buffer, depth texture, resolution uniform and the bind
    // groups that referenced the old textures. Zero-area sizes are ignored.
    void OnResize(FramebufferSize size);
};

// ===================== Systems =====================
// Records extra passes on top of the frame buffer (UI). Runs only for frames
// that actually have a surface texture.
using OverlayFn = std::function<void(const wgpu::CommandEncoder&, const wgpu::TextureView&)>;

void TimeSystem(SceneTime& time, Window& window);
void ResizeSystem(Scene& scene, ResizeState& resize, const SceneTime& time);
// False when there was nothing to present this frame.
bool RenderSystem(Scene& scene, const SceneTime& time, const OverlayFn& overlay = {});

// time -> resize -> render. Render errors are logged and the frame dropped.
bool RunFrame(Scene& scene, ResizeState& resize, SceneTime& time, Window& window,
              const OverlayFn& overlay = {});

} // namespace steps
