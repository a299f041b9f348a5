#include "steps/window.hpp"

#include <stdexcept>

#include <GLFW/glfw3.h>
#include <webgpu/webgpu_glfw.h>

#include "steps/log.hpp"

namespace steps {

Window::Window(const AppConfig& config) {
    glfwSetErrorCallback([](int code, const char* description) {
        log::Error("glfw") << "(" << code << ") " << description << "\n";
    });
    if (!glfwInit()) throw std::runtime_error("Failed to initialize GLFW");

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window_ = glfwCreateWindow(static_cast<int>(config.width), static_cast<int>(config.height),
                               config.title.c_str(), nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create window");
    }
    glfwSetWindowSizeLimits(window_, static_cast<int>(config.minWidth), static_cast<int>(config.minHeight),
                            GLFW_DONT_CARE, GLFW_DONT_CARE);

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, &Window::FramebufferSizeCallback);

    log::Info("glfw") << "Window created: " << GetFramebufferSize() << "\n";
}

Window::~Window() {
    // surface before window
    surface_ = nullptr;
    glfwDestroyWindow(window_);
    glfwTerminate();
}

const wgpu::Surface& Window::CreateSurface(const wgpu::Instance& instance) {
    surface_ = wgpu::glfw::CreateSurfaceForWindow(instance, window_);
    if (!surface_) throw std::runtime_error("Failed to create surface for window");
    return surface_;
}

bool Window::ShouldClose() const { return glfwWindowShouldClose(window_); }

void Window::PollEvents() { glfwPollEvents(); }

FramebufferSize Window::GetFramebufferSize() const {
    int w = 0, h = 0;
    glfwGetFramebufferSize(window_, &w, &h);
    return {static_cast<uint32_t>(w), static_cast<uint32_t>(h)};
}

float Window::ContentScale() const {
    float xs = 1.0f, ys = 1.0f;
    glfwGetWindowContentScale(window_, &xs, &ys);
    return xs;
}

void Window::SetTitle(const std::string& title) { glfwSetWindowTitle(window_, title.c_str()); }

void Window::FramebufferSizeCallback(GLFWwindow* handle, int width, int height) {
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(handle));
    if (!self || !self->onResize_) return;
    self->onResize_({static_cast<uint32_t>(width), static_cast<uint32_t>(height)});
}

} // namespace steps
