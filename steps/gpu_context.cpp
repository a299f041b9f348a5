#include "steps/gpu_context.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <dawn/webgpu_cpp_print.h>

#include "steps/log.hpp"
#include "steps/surface_policy.hpp"

namespace steps {

namespace {

struct AdapterRequest {
    wgpu::Adapter adapter;
    std::string error;
};

struct DeviceRequest {
    wgpu::Device device;
    std::string error;
};

} // namespace

// ======================================================================================
// Initialization: instance, surface, adapter, device (WaitAny keeps it synchronous)
// ======================================================================================
GpuContext::GpuContext(Window& w, const AppConfig& appConfig) : window(w) {
    const auto kTimedWaitAny = wgpu::InstanceFeatureName::TimedWaitAny;
    wgpu::InstanceDescriptor instanceDesc{};
    instanceDesc.requiredFeatureCount = 1;
    instanceDesc.requiredFeatures = &kTimedWaitAny;
    instance = wgpu::CreateInstance(&instanceDesc);
    if (!instance) throw std::runtime_error("Failed to create WebGPU instance");

    window.CreateSurface(instance);

    wgpu::RequestAdapterOptions adapterOptions{};
    adapterOptions.compatibleSurface = window.Surface();

    AdapterRequest adapterRequest;
    wgpu::Future f1 = instance.RequestAdapter(
        &adapterOptions, wgpu::CallbackMode::WaitAnyOnly,
        [](wgpu::RequestAdapterStatus status, wgpu::Adapter a, wgpu::StringView message, AdapterRequest* out) {
            if (status != wgpu::RequestAdapterStatus::Success) {
                out->error = std::string(std::string_view(message));
                return;
            }
            out->adapter = std::move(a);
        },
        &adapterRequest);
    if (instance.WaitAny(f1, UINT64_MAX) != wgpu::WaitStatus::Success || !adapterRequest.adapter) {
        throw std::runtime_error("No adapter found: " + adapterRequest.error);
    }
    adapter = std::move(adapterRequest.adapter);

    wgpu::AdapterInfo info;
    adapter.GetInfo(&info);
    log::Info("wgpu") << "Adapter: " << std::string_view(info.device) << " (" << info.backendType << ")\n";

    wgpu::DeviceDescriptor deviceDesc{};
    deviceDesc.label = "steps device";
    deviceDesc.SetUncapturedErrorCallback([](const wgpu::Device&, wgpu::ErrorType errorType, wgpu::StringView message) {
        log::Error("wgpu") << "Device error (" << errorType << "): " << std::string_view(message) << "\n";
    });
    deviceDesc.SetDeviceLostCallback(
        wgpu::CallbackMode::AllowSpontaneous,
        [](const wgpu::Device&, wgpu::DeviceLostReason reason, wgpu::StringView message) {
            if (reason == wgpu::DeviceLostReason::Destroyed) return; // normal shutdown
            log::Error("wgpu") << "Device lost (" << reason << "): " << std::string_view(message) << "\n";
        });

    DeviceRequest deviceRequest;
    wgpu::Future f2 = adapter.RequestDevice(
        &deviceDesc, wgpu::CallbackMode::WaitAnyOnly,
        [](wgpu::RequestDeviceStatus status, wgpu::Device d, wgpu::StringView message, DeviceRequest* out) {
            if (status != wgpu::RequestDeviceStatus::Success) {
                out->error = std::string(std::string_view(message));
                return;
            }
            out->device = std::move(d);
        },
        &deviceRequest);
    if (instance.WaitAny(f2, UINT64_MAX) != wgpu::WaitStatus::Success || !deviceRequest.device) {
        throw std::runtime_error("RequestDevice failed: " + deviceRequest.error);
    }
    device = std::move(deviceRequest.device);
    queue = device.GetQueue();

    ConfigureSurface(appConfig);
    scale = window.ContentScale();
}

// ======================================================================================
// Surface config
// ======================================================================================
void GpuContext::ConfigureSurface(const AppConfig& appConfig) {
    wgpu::SurfaceCapabilities caps;
    if (Surface().GetCapabilities(adapter, &caps) != wgpu::Status::Success) {
        throw std::runtime_error("Failed to query surface capabilities");
    }

    std::vector<wgpu::TextureFormat> formats(caps.formats, caps.formats + caps.formatCount);
    std::vector<wgpu::PresentMode> presentModes(caps.presentModes, caps.presentModes + caps.presentModeCount);

    log::Info("wgpu") << "Surface supports HDR: " << (SupportsHdr(formats) ? "true" : "false") << "\n";
    if (log::Enabled(log::Level::Debug)) {
        auto& out = log::Debug("wgpu") << "Supported surface formats:";
        for (wgpu::TextureFormat f : formats) out << " " << f;
        out << "\n";
    }

    FramebufferSize fb = window.GetFramebufferSize();
    config.device = device;
    config.usage = wgpu::TextureUsage::RenderAttachment;
    config.format = ChooseSurfaceFormat(formats);
    config.width = fb.width;
    config.height = fb.height;
    config.presentMode = ChoosePresentMode(presentModes, appConfig.presentMode);
    config.alphaMode = caps.alphaModeCount > 0 ? caps.alphaModes[0] : wgpu::CompositeAlphaMode::Auto;

    log::Info("wgpu") << "Using surface format: " << config.format
                      << ", present mode: " << config.presentMode << "\n";
    Surface().Configure(&config);
}

void GpuContext::Resize(FramebufferSize size) {
    if (size.IsEmpty()) {
        log::Debug("wgpu") << "Ignoring resize to " << size << "\n";
        return;
    }
    config.width = size.width;
    config.height = size.height;
    Surface().Configure(&config);
}

// ======================================================================================
// Per-frame
// ======================================================================================
std::optional<SurfaceFrame> GpuContext::AcquireFrame() {
    wgpu::SurfaceTexture st;
    Surface().GetCurrentTexture(&st);

    switch (ClassifySurfaceTexture(st.status)) {
        case SurfaceTextureAction::Render:
            break;
        case SurfaceTextureAction::Skip:
            log::Warn("wgpu") << "Surface texture unavailable (" << st.status << "), skipping frame\n";
            return std::nullopt;
        case SurfaceTextureAction::Fail:
            throw std::runtime_error("Failed to acquire surface texture");
    }

    SurfaceFrame frame;
    frame.texture = st.texture;
    frame.view = st.texture.CreateView();
    return frame;
}

void GpuContext::Present() { Surface().Present(); }

void GpuContext::ProcessEvents() { instance.ProcessEvents(); }

} // namespace steps
