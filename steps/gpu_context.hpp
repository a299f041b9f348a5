#pragma once

#include <optional>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/size.hpp"
#include "steps/window.hpp"

namespace steps {

// Current surface texture plus a view on it, valid for one frame.
struct SurfaceFrame {
    wgpu::Texture texture;
    wgpu::TextureView view;
};

// Instance, adapter, device and the configuration of the window's surface.
// The window must outlive the context.
struct GpuContext {
    Window& window;
    wgpu::Instance instance;
    wgpu::Adapter adapter;
    wgpu::Device device;
    wgpu::Queue queue;
    wgpu::SurfaceConfiguration config;
    float scale = 1.0f;

    GpuContext(Window& window, const AppConfig& appConfig);

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    const wgpu::Surface& Surface() const { return window.Surface(); }
    wgpu::TextureFormat Format() const { return config.format; }
    FramebufferSize Size() const { return {config.width, config.height}; }

    // Reconfigures the surface. Zero-area sizes (minimized) are ignored.
    void Resize(FramebufferSize size);

    // Empty when the frame should be skipped (timeout, outdated or lost surface).
    // The surface is left as configured; Resize() is the only reconfigure path.
    // Throws on a hard surface error.
    std::optional<SurfaceFrame> AcquireFrame();

    void Present();
    void ProcessEvents();

private:
    void ConfigureSurface(const AppConfig& appConfig);
};

} // namespace steps
