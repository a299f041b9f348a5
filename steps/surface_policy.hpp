#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <webgpu/webgpu_cpp.h>

namespace steps {

// Higher is preferred; 0 for formats we have no opinion on.
uint32_t FormatScore(wgpu::TextureFormat format);
uint32_t PresentModeScore(wgpu::PresentMode mode);

bool IsSrgb(wgpu::TextureFormat format);
bool SupportsHdr(const std::vector<wgpu::TextureFormat>& formats);

// Highest score wins, ties keep the earliest entry. Throws on an empty list.
wgpu::TextureFormat ChooseSurfaceFormat(const std::vector<wgpu::TextureFormat>& formats);

// The requested mode if offered, otherwise the best scored one, otherwise Fifo.
wgpu::PresentMode ChoosePresentMode(const std::vector<wgpu::PresentMode>& modes,
                                    std::optional<wgpu::PresentMode> requested = std::nullopt);

// Outcome of Surface::GetCurrentTexture. Skip drops the frame and leaves the
// surface configuration to the resize path.
enum class SurfaceTextureAction { Render, Skip, Fail };

SurfaceTextureAction ClassifySurfaceTexture(wgpu::SurfaceGetCurrentTextureStatus status);

} // namespace steps
