#include "steps/uniforms.hpp"

#include "steps/gpu_context.hpp"
#include "steps/gpu_util.hpp"

namespace steps {

Uniforms::Uniforms(const GpuContext& gpu) : data(MakeUniformsData(gpu.Size(), gpu.Format())) {
    buffer = CreateBuffer(gpu.device, &data, sizeof(UniformsData),
                          wgpu::BufferUsage::Uniform | wgpu::BufferUsage::CopyDst, "Uniforms");
}

void Uniforms::UpdateResolution(const GpuContext& gpu, FramebufferSize size) {
    data.resolution[0] = static_cast<float>(size.width);
    data.resolution[1] = static_cast<float>(size.height);
    gpu.queue.WriteBuffer(buffer, 0, &data, sizeof(UniformsData));
}

} // namespace steps
