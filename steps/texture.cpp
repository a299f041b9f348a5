#include "steps/texture.hpp"

#include <stdexcept>

#include "steps/log.hpp"

namespace steps {

namespace {

wgpu::Texture MakeTexture(const wgpu::Device& device, uint32_t width, uint32_t height,
                          wgpu::TextureFormat format, wgpu::TextureUsage usage, const std::string& label) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("Texture '" + label + "' needs a non-zero size");
    }
    wgpu::TextureDescriptor td{};
    td.label = label.c_str();
    td.size = { width, height, 1 };
    td.mipLevelCount = 1;
    td.sampleCount = 1;
    td.dimension = wgpu::TextureDimension::e2D;
    td.format = format;
    td.usage = usage;
    return device.CreateTexture(&td);
}

wgpu::Sampler MakeLinearSampler(const wgpu::Device& device) {
    wgpu::SamplerDescriptor sd{}; sd.minFilter = wgpu::FilterMode::Linear; sd.magFilter = wgpu::FilterMode::Linear; sd.mipmapFilter = wgpu::MipmapFilterMode::Nearest;
    sd.addressModeU = wgpu::AddressMode::ClampToEdge; sd.addressModeV = wgpu::AddressMode::ClampToEdge; sd.addressModeW = wgpu::AddressMode::ClampToEdge;
    return device.CreateSampler(&sd);
}

} // namespace

Texture Texture::FromImage(const wgpu::Device& device, const wgpu::Queue& queue,
                           const DecodedImage& image, const std::string& label) {
    Texture t;
    t.label = label;
    t.format = wgpu::TextureFormat::RGBA8UnormSrgb;
    t.usage = wgpu::TextureUsage::TextureBinding | wgpu::TextureUsage::CopyDst;
    t.texture = MakeTexture(device, image.width, image.height, t.format, t.usage, label);

    wgpu::TexelCopyTextureInfo dst{}; dst.texture = t.texture; dst.mipLevel = 0; dst.origin = { 0, 0, 0 }; dst.aspect = wgpu::TextureAspect::All;
    wgpu::TexelCopyBufferLayout layout{}; layout.bytesPerRow = image.width * 4; layout.rowsPerImage = image.height;
    wgpu::Extent3D size{ image.width, image.height, 1 };
    queue.WriteTexture(&dst, image.rgba.data(), image.rgba.size(), &layout, &size);

    t.view = t.texture.CreateView();
    t.sampler = MakeLinearSampler(device);
    return t;
}

Texture Texture::CreateDepth(const wgpu::Device& device, uint32_t width, uint32_t height,
                             const std::string& label) {
    Texture t;
    t.label = label;
    t.format = kDepthFormat;
    t.usage = wgpu::TextureUsage::RenderAttachment | wgpu::TextureUsage::TextureBinding;
    t.texture = MakeTexture(device, width, height, t.format, t.usage, label);
    t.view = t.texture.CreateView();
    // the depth pass reads with textureLoad and never binds this sampler
    t.sampler = MakeLinearSampler(device);
    return t;
}

Texture Texture::CreateFrameBuffer(const wgpu::Device& device, uint32_t width, uint32_t height,
                                   const std::string& label, wgpu::TextureFormat format) {
    Texture t;
    t.label = label;
    t.format = format;
    t.usage = wgpu::TextureUsage::RenderAttachment | wgpu::TextureUsage::TextureBinding;
    t.texture = MakeTexture(device, width, height, t.format, t.usage, label);
    t.view = t.texture.CreateView();
    t.sampler = MakeLinearSampler(device);
    return t;
}

DecodedImage LoadDiffuseImage(const AppConfig& config) {
    if (!config.texturePath.empty()) {
        log::Info("texture") << "Loading " << config.texturePath << "\n";
        return LoadImageFile(config.texturePath);
    }
    log::Debug("texture") << "No --texture given, using generated stone texture\n";
    return DecodeImage(MakeStonePng(256, 256));
}

void Texture::Resize(const wgpu::Device& device, uint32_t width, uint32_t height) {
    texture = MakeTexture(device, width, height, format, usage, label);
    view = texture.CreateView();
}

} // namespace steps
