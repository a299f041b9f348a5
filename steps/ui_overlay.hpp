#pragma once

#include <webgpu/webgpu_cpp.h>

#include "steps/size.hpp"

namespace steps {

class Window;
struct GpuContext;

// Dear ImGui on the GLFW and WebGPU backends. One instance per process; the
// window and the context must outlive it.
class UiOverlay {
public:
    UiOverlay(Window& window, const GpuContext& gpu, wgpu::TextureFormat targetFormat);
    ~UiOverlay();

    UiOverlay(const UiOverlay&) = delete;
    UiOverlay& operator=(const UiOverlay&) = delete;

    // Starts a UI frame laid out for a render target of `targetSize` pixels;
    // ImGui:: calls are valid until Render().
    void NewFrame(FramebufferSize targetSize);

    // Draws the frame's UI on top of `target` (load, no depth).
    void Render(const wgpu::CommandEncoder& encoder, const wgpu::TextureView& target);
};

} // namespace steps
