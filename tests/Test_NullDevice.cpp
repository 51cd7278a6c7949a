#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

import Core;
import RHI;

// -----------------------------------------------------------------------------
// Compile-time contracts of the RHI helpers
// -----------------------------------------------------------------------------

static_assert((RHI::BufferUsage::Vertex | RHI::BufferUsage::CopyDst) != RHI::BufferUsage::None);
static_assert(RHI::HasFlag(RHI::BufferUsage::Vertex | RHI::BufferUsage::CopyDst, RHI::BufferUsage::CopyDst));
static_assert(!RHI::HasFlag(RHI::BufferUsage::Vertex, RHI::BufferUsage::Index));
static_assert(!RHI::HasFlag(RHI::BufferUsage::Vertex, RHI::BufferUsage::None));

static_assert(RHI::IndexFormatFromElementSize(2) == RHI::IndexFormat::Uint16);
static_assert(RHI::IndexFormatFromElementSize(4) == RHI::IndexFormat::Uint32);
static_assert(!RHI::IndexFormatFromElementSize(8).has_value());

static_assert(RHI::VertexFormatSize(RHI::VertexFormat::Float32x3) == 12);
static_assert(RHI::VertexFormatSize(RHI::VertexFormat::Unorm8x4) == 4);
static_assert(RHI::VertexFormatSize(RHI::VertexFormat::Float64x4) == 32);

static_assert(RHI::TexelSize(RHI::TextureFormat::RGBA32Float) == 16);
static_assert(RHI::TexelSize(RHI::TextureFormat::Undefined) == 0);
static_assert(RHI::IsDepthFormat(RHI::TextureFormat::Depth24PlusStencil8));
static_assert(!RHI::IsDepthFormat(RHI::TextureFormat::BGRA8UnormSrgb));
static_assert(RHI::IsStripTopology(RHI::PrimitiveTopology::TriangleStrip));
static_assert(!RHI::IsStripTopology(RHI::PrimitiveTopology::TriangleList));

static_assert(RHI::Extent3D{4, 3, 2}.TexelCount() == 24);
static_assert(RHI::SurfaceErrorToString(RHI::SurfaceError::Outdated) == "Outdated");

static_assert(!std::is_copy_constructible_v<RHI::NullDevice>);
static_assert(std::is_abstract_v<RHI::IDevice>);
static_assert(std::is_base_of_v<RHI::IDevice, RHI::NullDevice>);

// -----------------------------------------------------------------------------
// Runtime behaviour
// -----------------------------------------------------------------------------

TEST(NullDevice, DefaultSurface)
{
    RHI::NullDevice device;
    EXPECT_EQ(device.GetSurfaceExtent(), (RHI::Extent2D{1280, 720}));
    EXPECT_EQ(device.GetSurfaceFormat(), RHI::TextureFormat::BGRA8UnormSrgb);
    EXPECT_EQ(device.GetMapAlignment(), RHI::DefaultMapAlignment);
    EXPECT_NE(device.GetSurfaceViewId(), 0u);
    EXPECT_FALSE(device.IsFrameOpen());
}

TEST(NullDevice, BufferWriteAndReadBack)
{
    RHI::NullDevice device;
    auto buffer = device.CreateBuffer({.Size = 16, .Usage = RHI::BufferUsage::CopyDst, .Label = "scratch"});
    ASSERT_TRUE(buffer.has_value());
    EXPECT_EQ((*buffer)->GetSize(), 16u);

    const std::array<std::byte, 4> payload = {std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4}};
    ASSERT_TRUE(device.WriteBuffer(**buffer, 8, payload).has_value());

    std::vector<std::byte> out(16);
    ASSERT_TRUE(device.ReadBuffer(**buffer, 0, out).has_value());
    EXPECT_EQ(out[0], std::byte{0});
    EXPECT_EQ(out[8], std::byte{1});
    EXPECT_EQ(out[11], std::byte{4});
    EXPECT_EQ(device.GetStats().BufferWrites, 1u);
}

TEST(NullDevice, BufferBoundsChecked)
{
    RHI::NullDevice device;
    auto buffer = device.CreateBuffer({.Size = 8, .Usage = RHI::BufferUsage::CopyDst});
    ASSERT_TRUE(buffer.has_value());

    const std::array<std::byte, 4> payload{};
    auto written = device.WriteBuffer(**buffer, 6, payload);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), Core::ErrorCode::OutOfRange);

    std::vector<std::byte> out(9);
    auto read = device.ReadBuffer(**buffer, 0, out);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), Core::ErrorCode::OutOfRange);
}

TEST(NullDevice, RejectsEmptyResources)
{
    RHI::NullDevice device;

    auto buffer = device.CreateBuffer({.Size = 0, .Usage = RHI::BufferUsage::Vertex});
    ASSERT_FALSE(buffer.has_value());
    EXPECT_EQ(buffer.error(), Core::ErrorCode::InvalidArgument);

    auto texture = device.CreateTexture({.Size = {0, 4, 1}, .Format = RHI::TextureFormat::R8Unorm,
                                         .Usage = RHI::TextureUsage::Sampled});
    ASSERT_FALSE(texture.has_value());
    EXPECT_EQ(texture.error(), Core::ErrorCode::InvalidArgument);

    auto shader = device.CreateShaderModule({}, RHI::ShaderStage::Vertex, "empty");
    ASSERT_FALSE(shader.has_value());
    EXPECT_EQ(shader.error(), Core::ErrorCode::ShaderCompilationFailed);

    EXPECT_EQ(device.GetStats().BuffersCreated, 0u);
    EXPECT_EQ(device.GetStats().TexturesCreated, 0u);
}

TEST(NullDevice, TextureWriteNeedsExactSize)
{
    RHI::NullDevice device;
    auto texture = device.CreateTexture({.Size = {2, 2, 1}, .Format = RHI::TextureFormat::RGBA8Unorm,
                                         .Usage = RHI::TextureUsage::CopyDst});
    ASSERT_TRUE(texture.has_value());

    const std::vector<std::byte> exact(16, std::byte{0xff});
    EXPECT_TRUE(device.WriteTexture(**texture, exact).has_value());

    const std::vector<std::byte> shorter(12);
    auto written = device.WriteTexture(**texture, shorter);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), Core::ErrorCode::OutOfRange);
    EXPECT_EQ(device.GetStats().TextureWrites, 1u);
}

TEST(NullDevice, DeviceIdsAreUnique)
{
    RHI::NullDevice device;
    auto a = device.CreateBuffer({.Size = 4, .Usage = RHI::BufferUsage::CopyDst});
    auto b = device.CreateBuffer({.Size = 4, .Usage = RHI::BufferUsage::CopyDst});
    auto t = device.CreateTexture({.Size = {1, 1, 1}, .Format = RHI::TextureFormat::R8Unorm,
                                   .Usage = RHI::TextureUsage::Sampled});
    ASSERT_TRUE(a && b && t);

    EXPECT_NE((*a)->GetId(), (*b)->GetId());
    EXPECT_NE((*t)->GetId(), (*t)->GetView().GetId());
    EXPECT_NE((*t)->GetView().GetId(), device.GetSurfaceViewId());
}

TEST(NullDevice, FrameLifecycle)
{
    RHI::NullDevice device;

    auto target = device.AcquireSurfaceTarget();
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->View->GetId(), device.GetSurfaceViewId());
    EXPECT_TRUE(device.IsFrameOpen());

    RHI::ICommandRecorder& recorder = device.BeginCommands();
    recorder.BeginComputePass("empty");
    recorder.EndComputePass();
    ASSERT_TRUE(device.Submit(recorder).has_value());
    ASSERT_TRUE(device.Present(*target).has_value());

    EXPECT_FALSE(device.IsFrameOpen());
    EXPECT_EQ(device.GetLastSubmittedCommands().size(), 2u);
    EXPECT_EQ(device.GetStats().Acquires, 1u);
    EXPECT_EQ(device.GetStats().Submits, 1u);
    EXPECT_EQ(device.GetStats().Presents, 1u);
}

TEST(NullDevice, SecondAcquireWithoutPresentTimesOut)
{
    RHI::NullDevice device;
    ASSERT_TRUE(device.AcquireSurfaceTarget().has_value());

    auto second = device.AcquireSurfaceTarget();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), RHI::SurfaceError::Timeout);
}

TEST(NullDevice, SubmitRequiresOpenRecorder)
{
    RHI::NullDevice device;
    RHI::ICommandRecorder& recorder = device.BeginCommands();
    ASSERT_TRUE(device.Submit(recorder).has_value());

    auto again = device.Submit(recorder);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::InvalidState);
}

TEST(NullDevice, QueuedAcquireErrorFiresOnce)
{
    RHI::NullDevice device;
    device.QueueAcquireError(RHI::SurfaceError::Lost);

    auto failed = device.AcquireSurfaceTarget();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), RHI::SurfaceError::Lost);
    EXPECT_FALSE(device.IsFrameOpen());

    EXPECT_TRUE(device.AcquireSurfaceTarget().has_value());
}

TEST(NullDevice, QueuedAllocationFailureSkipsThenFiresOnce)
{
    RHI::NullDevice device;
    device.QueueAllocationFailure(1);

    EXPECT_TRUE(device.CreateBuffer({.Size = 16, .Usage = RHI::BufferUsage::Vertex}).has_value());

    auto failed = device.CreateBuffer({.Size = 16, .Usage = RHI::BufferUsage::Vertex});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::OutOfDeviceMemory);

    EXPECT_TRUE(device.CreateBuffer({.Size = 16, .Usage = RHI::BufferUsage::Vertex}).has_value());
    EXPECT_EQ(device.GetStats().BuffersCreated, 2u);
}

TEST(NullDevice, ConfigureSurfaceReplacesImages)
{
    RHI::NullDevice device;
    const uint64_t before = device.GetSurfaceViewId();

    ASSERT_TRUE(device.ConfigureSurface({640, 480}).has_value());
    EXPECT_EQ(device.GetSurfaceExtent(), (RHI::Extent2D{640, 480}));
    EXPECT_NE(device.GetSurfaceViewId(), before);
    EXPECT_EQ(device.GetStats().SurfaceConfigurations, 1u);

    auto empty = device.ConfigureSurface({0, 480});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(device.GetSurfaceExtent(), (RHI::Extent2D{640, 480}));
}

TEST(NullDevice, CustomSurfaceConfig)
{
    RHI::NullDevice device(RHI::NullDeviceConfig{.SurfaceExtent = {320, 200},
                                                 .SurfaceFormat = RHI::TextureFormat::RGBA8UnormSrgb});
    EXPECT_EQ(device.GetSurfaceExtent(), (RHI::Extent2D{320, 200}));
    EXPECT_EQ(device.GetSurfaceFormat(), RHI::TextureFormat::RGBA8UnormSrgb);
}
