#pragma once

#include <webgpu/webgpu_cpp.h>

#include "steps/size.hpp"
#include "steps/surface_policy.hpp"

namespace steps {

// Matches `struct Uniforms` in the WGSL of the depth and present passes.
struct UniformsData {
    float resolution[2] = { 0.0f, 0.0f };
    float srgbSurface = 0.0f; // 1.0 when the surface format is sRGB
    float padding = 0.0f;
};
static_assert(sizeof(UniformsData) == 16, "UniformsData must stay 16 bytes");

inline UniformsData MakeUniformsData(FramebufferSize size, wgpu::TextureFormat surfaceFormat) {
    UniformsData d;
    d.resolution[0] = static_cast<float>(size.width);
    d.resolution[1] = static_cast<float>(size.height);
    d.srgbSurface = IsSrgb(surfaceFormat) ? 1.0f : 0.0f;
    return d;
}

struct GpuContext;

struct Uniforms {
    UniformsData data;
    wgpu::Buffer buffer;

    explicit Uniforms(const GpuContext& gpu);

    void UpdateResolution(const GpuContext& gpu, FramebufferSize size);
};

} // namespace steps
