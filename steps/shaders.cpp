#include "steps/shaders.hpp"

namespace steps {

const char kDiffuseWGSL[] = R"(
struct VertexInput {
    @location(0) position: vec3f,
    @location(1) color: vec3f,
    @location(2) uv: vec2f,
};

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) color: vec3f,
    @location(1) uv: vec2f,
};

@group(0) @binding(0) var diffuseTexture: texture_2d<f32>;
@group(0) @binding(1) var diffuseSampler: sampler;

@vertex
fn vs_main(in: VertexInput) -> VertexOutput {
    var out: VertexOutput;
    out.position = vec4f(in.position, 1.0);
    out.color = in.color;
    out.uv = in.uv;
    return out;
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    let texel = textureSample(diffuseTexture, diffuseSampler, in.uv);
    return vec4f(texel.rgb * in.color, 1.0);
}
)";

} // namespace steps
