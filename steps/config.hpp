#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <webgpu/webgpu_cpp.h>

#include "steps/log.hpp"

namespace steps {

struct AppConfig {
    std::string title = "WGPU Engine";
    uint32_t width = 800;
    uint32_t height = 600;
    uint32_t minWidth = 400;
    uint32_t minHeight = 300;
    std::chrono::milliseconds resizeDebounce{100};
    std::string texturePath;                      // empty: generated stone texture
    std::optional<wgpu::PresentMode> presentMode; // empty: scored choice
    log::Level logLevel = log::Level::Info;
    bool showHelp = false;
};

// Throws std::invalid_argument naming the offending flag.
AppConfig ParseArgs(int argc, const char* const* argv, AppConfig defaults = {});

// STEPS_LOG first, then the command line; applies the resulting log level.
AppConfig LoadConfig(int argc, const char* const* argv, AppConfig defaults = {});

std::string Usage(const char* program);

} // namespace steps
