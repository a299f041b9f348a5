#include <exception>
#include <iostream>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/gpu_context.hpp"
#include "steps/render_pass_builder.hpp"
#include "steps/window.hpp"

namespace {

void Render(steps::GpuContext& gpu) {
    auto frame = gpu.AcquireFrame();
    if (!frame) return;

    wgpu::CommandEncoder encoder = gpu.device.CreateCommandEncoder();
    wgpu::RenderPassEncoder pass = steps::RenderPassBuilder(encoder)
                                       .Label("Clear Pass")
                                       .ColorView(frame->view)
                                       .ClearColor({ 1.0, 0.2, 0.3, 1.0 })
                                       .Build();
    pass.End();
    wgpu::CommandBuffer commands = encoder.Finish();
    gpu.queue.Submit(1, &commands);
    gpu.Present();
}

} // namespace

int main(int argc, char** argv) {
    try {
        steps::AppConfig defaults;
        defaults.title = "Showing Window";
        const steps::AppConfig config = steps::LoadConfig(argc, argv, defaults);
        if (config.showHelp) {
            std::cout << steps::Usage(argv[0]);
            return 0;
        }

        steps::Window window(config);
        steps::GpuContext gpu(window, config);
        window.SetResizeHandler([&gpu](steps::FramebufferSize size) { gpu.Resize(size); });

        while (!window.ShouldClose()) {
            window.PollEvents();
            Render(gpu);
            gpu.ProcessEvents();
        }
    } catch (const std::exception& e) {
        std::cerr << "[fatal] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
