#include "steps/ui_overlay.hpp"

#include <stdexcept>

#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_wgpu.h>

#include "steps/gpu_context.hpp"
#include "steps/log.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/window.hpp"

namespace steps {

UiOverlay::UiOverlay(Window& window, const GpuContext& gpu, wgpu::TextureFormat targetFormat) {
    log::Info("imgui") << "Initializing imgui...\n";

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    auto& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(gpu.scale);
    io.FontGlobalScale = gpu.scale;

    if (!ImGui_ImplGlfw_InitForOther(window.Handle(), true)) {
        ImGui::DestroyContext();
        throw std::runtime_error("Failed to initialize the imgui GLFW backend");
    }

    ImGui_ImplWGPU_InitInfo info;
    info.Device = gpu.device.Get();
    info.NumFramesInFlight = 3;
    info.RenderTargetFormat = static_cast<WGPUTextureFormat>(targetFormat);
    info.DepthStencilFormat = WGPUTextureFormat_Undefined;
    if (!ImGui_ImplWGPU_Init(&info)) {
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        throw std::runtime_error("Failed to initialize the imgui WebGPU backend");
    }
}

UiOverlay::~UiOverlay() {
    ImGui_ImplWGPU_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}

void UiOverlay::NewFrame(FramebufferSize targetSize) {
    ImGui_ImplWGPU_NewFrame();
    ImGui_ImplGlfw_NewFrame();

    // The GLFW backend sizes the UI from the live window, which runs ahead of
    // the frame buffer while a resize is debounced. Lay out for the target.
    auto& io = ImGui::GetIO();
    float scale = io.DisplayFramebufferScale.x;
    if (!(scale > 0.0f)) scale = 1.0f;
    const LogicalSize display = ToLogical(targetSize, scale);
    io.DisplaySize = ImVec2(display.width, display.height);
    io.DisplayFramebufferScale = ImVec2(scale, scale);

    ImGui::NewFrame();
}

void UiOverlay::Render(const wgpu::CommandEncoder& encoder, const wgpu::TextureView& target) {
    ImGui::Render();
    wgpu::RenderPassEncoder pass = RenderPassBuilder(encoder).Label("UI Pass").ColorView(target).LoadColor().Build();
    ImGui_ImplWGPU_RenderDrawData(ImGui::GetDrawData(), pass.Get());
    pass.End();
}

} // namespace steps
