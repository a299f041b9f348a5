#include <exception>
#include <iostream>

#include "steps/config.hpp"
#include "steps/gpu_context.hpp"
#include "steps/scene.hpp"
#include "steps/texture.hpp"
#include "steps/window.hpp"

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

        while (!window.ShouldClose()) {
            window.PollEvents();
            if (steps::RunFrame(scene, resize, time, window)) gpu.Present();
            gpu.ProcessEvents();
        }
    } catch (const std::exception& e) {
        std::cerr << "[fatal] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
