#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>

#include "steps/uniforms.hpp"
#include "steps/vertex.hpp"

using steps::ColorVertex;
using steps::DepthVertex;
using steps::Vertex;

TEST(VertexLayout, ColorVertex) {
    const wgpu::VertexBufferLayout l = ColorVertex::Layout();
    EXPECT_EQ(l.arrayStride, sizeof(ColorVertex));
    EXPECT_EQ(l.stepMode, wgpu::VertexStepMode::Vertex);
    ASSERT_EQ(l.attributeCount, 2u);
    EXPECT_EQ(l.attributes[0].format, wgpu::VertexFormat::Float32x3);
    EXPECT_EQ(l.attributes[0].offset, 0u);
    EXPECT_EQ(l.attributes[1].shaderLocation, 1u);
    EXPECT_EQ(l.attributes[1].offset, 12u);
}

TEST(VertexLayout, TexturedVertex) {
    const wgpu::VertexBufferLayout l = Vertex::Layout();
    EXPECT_EQ(l.arrayStride, 32u);
    ASSERT_EQ(l.attributeCount, 3u);
    for (uint32_t i = 0; i < 3; ++i) EXPECT_EQ(l.attributes[i].shaderLocation, i);
    EXPECT_EQ(l.attributes[1].offset, offsetof(Vertex, color));
    EXPECT_EQ(l.attributes[2].offset, 24u);
    EXPECT_EQ(l.attributes[2].format, wgpu::VertexFormat::Float32x2);
}

TEST(VertexLayout, DepthVertex) {
    const wgpu::VertexBufferLayout l = DepthVertex::Layout();
    EXPECT_EQ(l.arrayStride, 12u);
    ASSERT_EQ(l.attributeCount, 1u);
    EXPECT_EQ(l.attributes[0].format, wgpu::VertexFormat::Float32x3);
}

TEST(VertexData, TexturedTriangle) {
    ASSERT_EQ(steps::kTriangle.size(), 3u);
    EXPECT_FLOAT_EQ(steps::kTriangle[0].position[1], 0.5f);
    EXPECT_FLOAT_EQ(steps::kTriangle[1].texCoords[1], 1.0f);
    EXPECT_FLOAT_EQ(steps::kTriangle[2].texCoords[0], 1.0f);
    EXPECT_FLOAT_EQ(steps::kTriangle[2].color[2], 1.0f);
}

TEST(VertexData, FullscreenQuadCoversClipSpace) {
    ASSERT_EQ(steps::kFullscreenQuad.size(), 6u);
    for (const DepthVertex& v : steps::kFullscreenQuad) {
        EXPECT_FLOAT_EQ(std::abs(v.position[0]), 1.0f);
        EXPECT_FLOAT_EQ(std::abs(v.position[1]), 1.0f);
    }
}

TEST(RotatedVertices, AtTimeZeroOnlyProjects) {
    const auto v = steps::RotatedVertices(0.0f);
    for (std::size_t i = 0; i < v.size(); ++i) {
        EXPECT_NEAR(v[i].position[0], steps::kTriangle[i].position[0], 1e-5f);
        EXPECT_NEAR(v[i].position[1], steps::kTriangle[i].position[1], 1e-5f);
        EXPECT_NEAR(v[i].position[2], 0.5f, 1e-5f); // z = 0 lands mid depth range
    }
}

TEST(RotatedVertices, HalfTurnMirrorsX) {
    const auto v = steps::RotatedVertices(1.0f);
    EXPECT_NEAR(v[1].position[0], 0.5f, 1e-5f);
    EXPECT_NEAR(v[1].position[1], -0.5f, 1e-5f);
    EXPECT_NEAR(v[2].position[0], -0.5f, 1e-5f);
    EXPECT_NEAR(v[1].position[2], 0.5f, 1e-5f);
}

TEST(RotatedVertices, KeepsColorsAndUvs) {
    const auto v = steps::RotatedVertices(0.37f);
    for (std::size_t i = 0; i < v.size(); ++i) {
        for (int c = 0; c < 3; ++c) EXPECT_EQ(v[i].color[c], steps::kTriangle[i].color[c]);
        EXPECT_EQ(v[i].texCoords[0], steps::kTriangle[i].texCoords[0]);
        EXPECT_EQ(v[i].texCoords[1], steps::kTriangle[i].texCoords[1]);
        EXPECT_GE(v[i].position[2], 0.0f);
        EXPECT_LE(v[i].position[2], 1.0f);
    }
}

TEST(Uniforms, LayoutMatchesShader) {
    EXPECT_EQ(sizeof(steps::UniformsData), 16u);
    EXPECT_EQ(offsetof(steps::UniformsData, srgbSurface), 8u);
}

TEST(Uniforms, FromSurface) {
    steps::UniformsData d = steps::MakeUniformsData({800, 600}, wgpu::TextureFormat::BGRA8UnormSrgb);
    EXPECT_FLOAT_EQ(d.resolution[0], 800.0f);
    EXPECT_FLOAT_EQ(d.resolution[1], 600.0f);
    EXPECT_FLOAT_EQ(d.srgbSurface, 1.0f);

    d = steps::MakeUniformsData({1, 2}, wgpu::TextureFormat::RGBA16Float);
    EXPECT_FLOAT_EQ(d.srgbSurface, 0.0f);
}
