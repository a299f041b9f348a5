#include "steps/vertex.hpp"

#include <cstddef>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/ext/matrix_clip_space.hpp>

namespace steps {

namespace {

wgpu::VertexAttribute Attribute(wgpu::VertexFormat format, uint64_t offset, uint32_t location) {
    wgpu::VertexAttribute a{};
    a.format = format;
    a.offset = offset;
    a.shaderLocation = location;
    return a;
}

template <typename V, std::size_t N>
wgpu::VertexBufferLayout MakeLayout(const wgpu::VertexAttribute (&attributes)[N]) {
    wgpu::VertexBufferLayout vbl{};
    vbl.arrayStride = sizeof(V);
    vbl.stepMode = wgpu::VertexStepMode::Vertex;
    vbl.attributeCount = N;
    vbl.attributes = attributes;
    return vbl;
}

} // namespace

wgpu::VertexBufferLayout ColorVertex::Layout() {
    static const wgpu::VertexAttribute attrs[2] = {
        Attribute(wgpu::VertexFormat::Float32x3, offsetof(ColorVertex, position), 0),
        Attribute(wgpu::VertexFormat::Float32x3, offsetof(ColorVertex, color), 1),
    };
    return MakeLayout<ColorVertex>(attrs);
}

wgpu::VertexBufferLayout Vertex::Layout() {
    static const wgpu::VertexAttribute attrs[3] = {
        Attribute(wgpu::VertexFormat::Float32x3, offsetof(Vertex, position), 0),
        Attribute(wgpu::VertexFormat::Float32x3, offsetof(Vertex, color), 1),
        Attribute(wgpu::VertexFormat::Float32x2, offsetof(Vertex, texCoords), 2),
    };
    return MakeLayout<Vertex>(attrs);
}

wgpu::VertexBufferLayout DepthVertex::Layout() {
    static const wgpu::VertexAttribute attrs[1] = {
        Attribute(wgpu::VertexFormat::Float32x3, offsetof(DepthVertex, position), 0),
    };
    return MakeLayout<DepthVertex>(attrs);
}

const std::array<ColorVertex, 3> kColorTriangle = {{
    //   x,     y,    z,      r,    g,    b
    {{ 0.0f,  0.5f, 0.0f}, {1.0f, 0.0f, 0.0f}},
    {{-0.5f, -0.5f, 0.0f}, {0.0f, 1.0f, 0.0f}},
    {{ 0.5f, -0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}},
}};

const std::array<Vertex, 3> kTriangle = {{
    {{ 0.0f,  0.5f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f}},
    {{-0.5f, -0.5f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 1.0f}},
    {{ 0.5f, -0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 1.0f}},
}};

// two triangles covering clip space
const std::array<DepthVertex, 6> kFullscreenQuad = {{
    {{-1.0f,  1.0f, 0.0f}},
    {{-1.0f, -1.0f, 0.0f}},
    {{ 1.0f, -1.0f, 0.0f}},
    {{ 1.0f, -1.0f, 0.0f}},
    {{ 1.0f,  1.0f, 0.0f}},
    {{-1.0f,  1.0f, 0.0f}},
}};

std::array<Vertex, 3> RotatedVertices(float time) {
    const glm::mat4 rotation = glm::rotate(glm::mat4(1.0f), time * glm::pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f));
    const glm::mat4 ortho = glm::orthoRH_ZO(-1.0f, 1.0f, -1.0f, 1.0f, -1.5f, 1.5f);
    const glm::mat4 mvp = ortho * rotation;

    std::array<Vertex, 3> out = kTriangle;
    for (Vertex& v : out) {
        glm::vec4 p = mvp * glm::vec4(v.position[0], v.position[1], v.position[2], 1.0f);
        p /= p.w;
        v.position[0] = p.x;
        v.position[1] = p.y;
        v.position[2] = p.z;
    }
    return out;
}

} // namespace steps
