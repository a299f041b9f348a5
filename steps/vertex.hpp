#pragma once

#include <array>

#include <webgpu/webgpu_cpp.h>

namespace steps {

// ===================== Vertex formats =====================
struct ColorVertex {
    float position[3];
    float color[3];

    static wgpu::VertexBufferLayout Layout();
};

struct Vertex {
    float position[3];
    float color[3];
    float texCoords[2];

    static wgpu::VertexBufferLayout Layout();
};

struct DepthVertex {
    float position[3];

    static wgpu::VertexBufferLayout Layout();
};

// ===================== Geometry =====================
extern const std::array<ColorVertex, 3> kColorTriangle;
extern const std::array<Vertex, 3> kTriangle;
extern const std::array<DepthVertex, 6> kFullscreenQuad;

// kTriangle spun around +Y by time*pi and pushed through an orthographic
// projection (depth 0..1). Colors and uvs are kept.
std::array<Vertex, 3> RotatedVertices(float time);

} // namespace steps
