#pragma once

#include <functional>
#include <string>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/size.hpp"

struct GLFWwindow;

namespace steps {

// GLFW window without a client API. The window owns the WebGPU surface made for
// it and drops the surface before the native window goes away.
class Window {
public:
    using ResizeHandler = std::function<void(FramebufferSize)>;

    explicit Window(const AppConfig& config);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Creates (or replaces) the surface for this window on `instance`.
    const wgpu::Surface& CreateSurface(const wgpu::Instance& instance);
    const wgpu::Surface& Surface() const { return surface_; }

    bool ShouldClose() const;
    void PollEvents();

    FramebufferSize GetFramebufferSize() const;
    float ContentScale() const;
    void SetTitle(const std::string& title);

    void SetResizeHandler(ResizeHandler handler) { onResize_ = std::move(handler); }

    GLFWwindow* Handle() const { return window_; }

private:
    static void FramebufferSizeCallback(GLFWwindow* handle, int width, int height);

    GLFWwindow* window_ = nullptr;
    wgpu::Surface surface_;
    ResizeHandler onResize_;
};

} // namespace steps
