#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "steps/surface_policy.hpp"

using wgpu::PresentMode;
using wgpu::TextureFormat;

TEST(SurfaceFormat, Scores) {
    EXPECT_EQ(steps::FormatScore(TextureFormat::BGRA8UnormSrgb), 10u);
    EXPECT_EQ(steps::FormatScore(TextureFormat::RGBA8UnormSrgb), 9u);
    EXPECT_EQ(steps::FormatScore(TextureFormat::RGBA16Float), 8u);
    EXPECT_EQ(steps::FormatScore(TextureFormat::RGBA32Float), 7u);
    EXPECT_EQ(steps::FormatScore(TextureFormat::BGRA8Unorm), 0u);
}

TEST(SurfaceFormat, PicksHighestScore) {
    std::vector<TextureFormat> formats = {TextureFormat::BGRA8Unorm, TextureFormat::RGBA16Float,
                                          TextureFormat::BGRA8UnormSrgb};
    EXPECT_EQ(steps::ChooseSurfaceFormat(formats), TextureFormat::BGRA8UnormSrgb);
}

TEST(SurfaceFormat, TiesKeepFirst) {
    std::vector<TextureFormat> formats = {TextureFormat::BGRA8Unorm, TextureFormat::RGBA8Unorm};
    EXPECT_EQ(steps::ChooseSurfaceFormat(formats), TextureFormat::BGRA8Unorm);
}

TEST(SurfaceFormat, EmptyListThrows) {
    EXPECT_THROW(steps::ChooseSurfaceFormat({}), std::runtime_error);
}

TEST(SurfaceFormat, SrgbAndHdr) {
    EXPECT_TRUE(steps::IsSrgb(TextureFormat::BGRA8UnormSrgb));
    EXPECT_TRUE(steps::IsSrgb(TextureFormat::RGBA8UnormSrgb));
    EXPECT_FALSE(steps::IsSrgb(TextureFormat::BGRA8Unorm));
    EXPECT_FALSE(steps::IsSrgb(TextureFormat::RGBA16Float));

    EXPECT_TRUE(steps::SupportsHdr({TextureFormat::BGRA8Unorm, TextureFormat::RGBA16Float}));
    EXPECT_FALSE(steps::SupportsHdr({TextureFormat::BGRA8Unorm, TextureFormat::RGBA8Unorm}));
    EXPECT_FALSE(steps::SupportsHdr({}));
}

TEST(PresentMode, Scores) {
    EXPECT_EQ(steps::PresentModeScore(PresentMode::Mailbox), 10u);
    EXPECT_EQ(steps::PresentModeScore(PresentMode::Fifo), 9u);
    EXPECT_EQ(steps::PresentModeScore(PresentMode::Immediate), 8u);
    EXPECT_EQ(steps::PresentModeScore(PresentMode::FifoRelaxed), 7u);
}

TEST(PresentMode, PicksHighestScore) {
    EXPECT_EQ(steps::ChoosePresentMode({PresentMode::Fifo, PresentMode::Immediate, PresentMode::Mailbox}),
              PresentMode::Mailbox);
    EXPECT_EQ(steps::ChoosePresentMode({PresentMode::FifoRelaxed, PresentMode::Fifo}), PresentMode::Fifo);
}

TEST(PresentMode, RequestedModeWinsWhenOffered) {
    EXPECT_EQ(steps::ChoosePresentMode({PresentMode::Fifo, PresentMode::Mailbox}, PresentMode::Fifo),
              PresentMode::Fifo);
}

TEST(PresentMode, UnsupportedRequestFallsBackToScore) {
    EXPECT_EQ(steps::ChoosePresentMode({PresentMode::Fifo, PresentMode::Immediate}, PresentMode::Mailbox),
              PresentMode::Fifo);
}

TEST(PresentMode, EmptyListFallsBackToFifo) {
    EXPECT_EQ(steps::ChoosePresentMode({}), PresentMode::Fifo);
    EXPECT_EQ(steps::ChoosePresentMode({}, PresentMode::Mailbox), PresentMode::Fifo);
}

// --- Surface texture status ---

using steps::SurfaceTextureAction;
using Status = wgpu::SurfaceGetCurrentTextureStatus;

TEST(SurfaceTexture, SuccessRenders) {
    EXPECT_EQ(steps::ClassifySurfaceTexture(Status::SuccessOptimal), SurfaceTextureAction::Render);
    EXPECT_EQ(steps::ClassifySurfaceTexture(Status::SuccessSuboptimal), SurfaceTextureAction::Render);
}

TEST(SurfaceTexture, TransientStatusesSkipTheFrame) {
    EXPECT_EQ(steps::ClassifySurfaceTexture(Status::Timeout), SurfaceTextureAction::Skip);
    EXPECT_EQ(steps::ClassifySurfaceTexture(Status::Outdated), SurfaceTextureAction::Skip);
    EXPECT_EQ(steps::ClassifySurfaceTexture(Status::Lost), SurfaceTextureAction::Skip);
}

TEST(SurfaceTexture, ErrorFails) {
    EXPECT_EQ(steps::ClassifySurfaceTexture(Status::Error), SurfaceTextureAction::Fail);
}
