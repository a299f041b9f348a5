#include "steps/surface_policy.hpp"

#include <algorithm>
#include <stdexcept>

#include <dawn/webgpu_cpp_print.h>

#include "steps/log.hpp"

namespace steps {

uint32_t FormatScore(wgpu::TextureFormat format) {
    switch (format) {
        case wgpu::TextureFormat::BGRA8UnormSrgb: return 10;
        case wgpu::TextureFormat::RGBA8UnormSrgb: return 9;
        case wgpu::TextureFormat::RGBA16Float: return 8;
        case wgpu::TextureFormat::RGBA32Float: return 7;
        default: return 0;
    }
}

uint32_t PresentModeScore(wgpu::PresentMode mode) {
    switch (mode) {
        case wgpu::PresentMode::Mailbox: return 10;
        case wgpu::PresentMode::Fifo: return 9;
        case wgpu::PresentMode::Immediate: return 8;
        case wgpu::PresentMode::FifoRelaxed: return 7;
        default: return 0;
    }
}

bool IsSrgb(wgpu::TextureFormat format) {
    switch (format) {
        case wgpu::TextureFormat::BGRA8UnormSrgb:
        case wgpu::TextureFormat::RGBA8UnormSrgb:
            return true;
        default:
            return false;
    }
}

bool SupportsHdr(const std::vector<wgpu::TextureFormat>& formats) {
    return std::any_of(formats.begin(), formats.end(), [](wgpu::TextureFormat f) {
        return f == wgpu::TextureFormat::BGRA8UnormSrgb ||
               f == wgpu::TextureFormat::RGBA16Float ||
               f == wgpu::TextureFormat::RGBA32Float;
    });
}

wgpu::TextureFormat ChooseSurfaceFormat(const std::vector<wgpu::TextureFormat>& formats) {
    if (formats.empty()) throw std::runtime_error("Surface reports no supported formats");

    wgpu::TextureFormat best = formats[0];
    for (wgpu::TextureFormat f : formats) {
        if (FormatScore(f) > FormatScore(best)) best = f;
    }
    return best;
}

wgpu::PresentMode ChoosePresentMode(const std::vector<wgpu::PresentMode>& modes,
                                    std::optional<wgpu::PresentMode> requested) {
    if (requested) {
        if (std::find(modes.begin(), modes.end(), *requested) != modes.end()) return *requested;
        log::Warn("wgpu") << "Requested present mode " << *requested
                          << " is not supported by the surface, picking one\n";
    }
    if (modes.empty()) return wgpu::PresentMode::Fifo;

    wgpu::PresentMode best = modes[0];
    for (wgpu::PresentMode m : modes) {
        if (PresentModeScore(m) > PresentModeScore(best)) best = m;
    }
    return best;
}

SurfaceTextureAction ClassifySurfaceTexture(wgpu::SurfaceGetCurrentTextureStatus status) {
    switch (status) {
        case wgpu::SurfaceGetCurrentTextureStatus::SuccessOptimal:
        case wgpu::SurfaceGetCurrentTextureStatus::SuccessSuboptimal:
            return SurfaceTextureAction::Render;
        case wgpu::SurfaceGetCurrentTextureStatus::Timeout:
        case wgpu::SurfaceGetCurrentTextureStatus::Outdated:
        case wgpu::SurfaceGetCurrentTextureStatus::Lost:
            return SurfaceTextureAction::Skip;
        default:
            return SurfaceTextureAction::Fail;
    }
}

} // namespace steps
