#pragma once

#include <optional>
#include <string>
#include <utility>

#include <webgpu/webgpu_cpp.h>

namespace steps {

// One color attachment, optional depth. Clears to black unless told otherwise.
class RenderPassBuilder {
public:
    explicit RenderPassBuilder(wgpu::CommandEncoder encoder) : encoder_(std::move(encoder)) {}

    RenderPassBuilder& Label(std::string label) { label_ = std::move(label); return *this; }
    RenderPassBuilder& ColorView(wgpu::TextureView view) { colorView_ = std::move(view); return *this; }
    RenderPassBuilder& ClearColor(const wgpu::Color& color) { clearColor_ = color; load_ = false; return *this; }
    // Keep what is already in the color target.
    RenderPassBuilder& LoadColor() { load_ = true; return *this; }
    RenderPassBuilder& DepthView(wgpu::TextureView view, float clearValue = 1.0f) {
        depthView_ = std::move(view);
        depthClear_ = clearValue;
        return *this;
    }

    wgpu::RenderPassEncoder Build();

private:
    wgpu::CommandEncoder encoder_;
    std::string label_;
    wgpu::TextureView colorView_;
    wgpu::Color clearColor_{ 0.0, 0.0, 0.0, 1.0 };
    bool load_ = false;
    std::optional<wgpu::TextureView> depthView_;
    float depthClear_ = 1.0f;
};

} // namespace steps
