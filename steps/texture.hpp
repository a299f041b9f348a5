#pragma once

#include <cstdint>
#include <string>

#include <webgpu/webgpu_cpp.h>

#include "steps/config.hpp"
#include "steps/image.hpp"
#include "steps/size.hpp"

namespace steps {

// Texture, its default view and a sampler. Resize() rebuilds the texture and
// view with the same format, usage and label; the sampler is kept.
struct Texture {
    static constexpr wgpu::TextureFormat kDepthFormat = wgpu::TextureFormat::Depth32Float;
    static constexpr wgpu::TextureFormat kFrameBufferFormat = wgpu::TextureFormat::RGBA16Float;

    wgpu::Texture texture;
    wgpu::TextureView view;
    wgpu::Sampler sampler;
    wgpu::TextureFormat format = wgpu::TextureFormat::Undefined;
    wgpu::TextureUsage usage = wgpu::TextureUsage::None;
    std::string label;

    // RGBA8UnormSrgb, uploaded through the queue, linear clamp sampler.
    static Texture FromImage(const wgpu::Device& device, const wgpu::Queue& queue,
                             const DecodedImage& image, const std::string& label);

    static Texture CreateDepth(const wgpu::Device& device, uint32_t width, uint32_t height,
                               const std::string& label);

    static Texture CreateFrameBuffer(const wgpu::Device& device, uint32_t width, uint32_t height,
                                     const std::string& label,
                                     wgpu::TextureFormat format = kFrameBufferFormat);

    void Resize(const wgpu::Device& device, uint32_t width, uint32_t height);

    FramebufferSize Size() const { return {texture.GetWidth(), texture.GetHeight()}; }
};

// The --texture PNG, or the generated stone texture when none was given.
DecodedImage LoadDiffuseImage(const AppConfig& config);

} // namespace steps
