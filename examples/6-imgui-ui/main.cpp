#include <exception>
#include <iostream>

#include <imgui.h>

#include "steps/config.hpp"
#include "steps/gpu_context.hpp"
#include "steps/scene.hpp"
#include "steps/texture.hpp"
#include "steps/ui_overlay.hpp"
#include "steps/window.hpp"

namespace {

void DrawStats(const steps::Scene& scene, const steps::SceneTime& time, const steps::ResizeState& resize) {
    ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
    ImGui::Begin("Stats");
    ImGui::Text("Frame time: %.2f ms", time.history.Average() * 1000.0f);
    ImGui::Text("95th: %.2f ms  99th: %.2f ms", time.history.Percentile(0.95f) * 1000.0f,
                time.history.Percentile(0.99f) * 1000.0f);
    const steps::FramebufferSize size = scene.gpu.Size();
    ImGui::Text("Surface: %ux%u", size.width, size.height);
    ImGui::Text("Resize pending: %s", resize.debouncer.HasPending() ? "yes" : "no");
    ImGui::End();
}

} // namespace

int main(int argc, char** argv) {
    try {
        const steps::AppConfig config = steps::LoadConfig(argc, argv);
        if (config.showHelp) {
            std::cout << steps::Usage(argv[0]);
            return 0;
        }

        steps::Window window(config);
        steps::GpuContext gpu(window, config);

        steps::Scene scene(gpu, steps::LoadDiffuseImage(config));
        steps::ResizeState resize(config.resizeDebounce);
        steps::SceneTime time;
        window.SetResizeHandler([&resize](steps::FramebufferSize size) { resize.debouncer.Push(size); });

        steps::UiOverlay ui(window, gpu, scene.frameBuffer.format);
        bool showDemo = true;

        auto overlay = [&](const wgpu::CommandEncoder& encoder, const wgpu::TextureView& target) {
            ui.NewFrame(scene.frameBuffer.Size());
            if (showDemo) ImGui::ShowDemoWindow(&showDemo);
            DrawStats(scene, time, resize);
            ui.Render(encoder, target);
        };

        while (!window.ShouldClose()) {
            window.PollEvents();
            if (steps::RunFrame(scene, resize, time, window, overlay)) gpu.Present();
            gpu.ProcessEvents();
        }
    } catch (const std::exception& e) {
        std::cerr << "[fatal] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
