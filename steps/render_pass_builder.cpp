#include "steps/render_pass_builder.hpp"

#include <stdexcept>

namespace steps {

wgpu::RenderPassEncoder RenderPassBuilder::Build() {
    if (!colorView_) throw std::runtime_error("No color attachment provided");

    wgpu::RenderPassColorAttachment ca{};
    ca.view = colorView_;
    ca.loadOp = load_ ? wgpu::LoadOp::Load : wgpu::LoadOp::Clear;
    ca.storeOp = wgpu::StoreOp::Store;
    ca.clearValue = clearColor_;

    wgpu::RenderPassDepthStencilAttachment da{};
    wgpu::RenderPassDescriptor rp{};
    if (!label_.empty()) rp.label = label_.c_str();
    rp.colorAttachmentCount = 1;
    rp.colorAttachments = &ca;
    if (depthView_) {
        da.view = *depthView_;
        da.depthLoadOp = wgpu::LoadOp::Clear;
        da.depthStoreOp = wgpu::StoreOp::Store;
        da.depthClearValue = depthClear_;
        rp.depthStencilAttachment = &da;
    }
    return encoder_.BeginRenderPass(&rp);
}

} // namespace steps
