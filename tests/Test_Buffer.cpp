#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

import Core;
import RHI;
import Cairn;

#include "CairnTestContext.h"

namespace
{
    struct ColoredVertex
    {
        glm::vec3 Position;
        Cairn::Normalized<glm::u8vec4> Color;
    };

    template<typename T>
    concept CanMarkIndex = requires(Cairn::BufferBuilder<T>& builder) { builder.Index(); };

    template<typename T>
    concept CanMarkVertex = requires(Cairn::BufferBuilder<T>& builder) { builder.Vertex(); };
}

template<>
struct Cairn::VertexLayout<ColoredVertex>
{
    static constexpr auto Attributes = Cairn::SequentialAttributes<glm::vec3, Cairn::Normalized<glm::u8vec4>>();
};

// -----------------------------------------------------------------------------
// Compile-time contracts
// -----------------------------------------------------------------------------

static_assert(Cairn::VertexFormatOf<glm::vec3> == RHI::VertexFormat::Float32x3);
static_assert(Cairn::VertexFormatOf<glm::uvec2> == RHI::VertexFormat::Uint32x2);
static_assert(Cairn::VertexFormatOf<Cairn::Normalized<glm::u8vec4>> == RHI::VertexFormat::Unorm8x4);
static_assert(!Cairn::VertexField<char>);
static_assert(!Cairn::VertexField<glm::u8vec3>);

static_assert(Cairn::VertexType<glm::vec2>);
static_assert(Cairn::VertexType<ColoredVertex>);
static_assert(Cairn::AttributeExtent<ColoredVertex>() == 16);
static_assert(!Cairn::VertexType<uint16_t>);

static_assert(CanMarkIndex<uint16_t>);
static_assert(CanMarkIndex<uint32_t>);
static_assert(!CanMarkIndex<uint8_t>, "only 2- and 4-byte elements can index");
static_assert(!CanMarkIndex<float>);
static_assert(CanMarkVertex<ColoredVertex>);
static_assert(!CanMarkVertex<uint16_t>);

// -----------------------------------------------------------------------------
// Building
// -----------------------------------------------------------------------------

using BufferTest = CairnTest;

TEST_F(BufferTest, BuildInitUploadsContents)
{
    const std::array<uint32_t, 4> data = {1, 2, 3, 4};
    auto buffer = Ctx().CreateBuffer<uint32_t>().CopySrc().Label("data").BuildInit(data);
    ASSERT_TRUE(buffer.has_value());

    const Cairn::Buffer& record = GetBuffer(*buffer);
    EXPECT_EQ(record.GetCapacity(), 16u);
    EXPECT_EQ(record.GetElementCount(), 4u);
    EXPECT_EQ(record.GetLabel(), "data");
    EXPECT_EQ(record.GetElementType(), Core::TypeTag::Of<uint32_t>());

    auto read = Ctx().ReadBuffer<uint32_t>(*buffer);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, (std::vector<uint32_t>{1, 2, 3, 4}));
}

TEST_F(BufferTest, BuildZeroFillsCount)
{
    auto buffer = Ctx().CreateBuffer<glm::vec4>().Uniform().Build(3);
    ASSERT_TRUE(buffer.has_value());
    EXPECT_EQ(GetBuffer(*buffer).GetCapacity(), 3u * sizeof(glm::vec4));

    auto read = Ctx().ReadBuffer<glm::vec4>(*buffer);
    ASSERT_TRUE(read.has_value());
    ASSERT_EQ(read->size(), 3u);
    EXPECT_EQ((*read)[2], glm::vec4(0.0f));
}

TEST_F(BufferTest, ZeroElementsIsRejected)
{
    auto empty = Ctx().CreateBuffer<float>().Build(0);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), Core::ErrorCode::InvalidArgument);

    auto emptyInit = Ctx().CreateBuffer<float>().BuildInit({});
    ASSERT_FALSE(emptyInit.has_value());
    EXPECT_EQ(emptyInit.error(), Core::ErrorCode::InvalidArgument);

    EXPECT_EQ(Store().GetBuffers().Size(), 0u);
    EXPECT_EQ(Device().GetStats().BuffersCreated, 0u);
}

TEST_F(BufferTest, UniformElementsMustRespectMapAlignment)
{
    auto misaligned = Ctx().CreateBuffer<float>().Uniform().Build(4);
    ASSERT_FALSE(misaligned.has_value());
    EXPECT_EQ(misaligned.error(), Core::ErrorCode::InvalidArgument);

    auto storage = Ctx().CreateBuffer<glm::vec3>().Storage().Build(1);
    ASSERT_FALSE(storage.has_value());
    EXPECT_EQ(storage.error(), Core::ErrorCode::InvalidArgument);

    // Plain vertex data has no alignment requirement.
    auto vertices = Ctx().CreateBuffer<glm::vec3>().Vertex().Build(1);
    EXPECT_TRUE(vertices.has_value());
}

TEST_F(BufferTest, VertexCapturesLayout)
{
    auto buffer = Ctx().CreateBuffer<ColoredVertex>().Vertex().Build(2);
    ASSERT_TRUE(buffer.has_value());

    const auto& layout = GetBuffer(*buffer).GetVertexLayout();
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout->Stride, sizeof(ColoredVertex));
    EXPECT_EQ(layout->StepMode, RHI::VertexStepMode::Vertex);
    ASSERT_EQ(layout->Attributes.size(), 2u);
    EXPECT_EQ(layout->Attributes[0], (RHI::VertexAttribute{RHI::VertexFormat::Float32x3, 0, 0}));
    EXPECT_EQ(layout->Attributes[1], (RHI::VertexAttribute{RHI::VertexFormat::Unorm8x4, 12, 1}));
    EXPECT_TRUE(RHI::HasFlag(GetBuffer(*buffer).GetUsage(), RHI::BufferUsage::Vertex));
}

TEST_F(BufferTest, InstanceCapturesInstanceStepMode)
{
    auto buffer = Ctx().CreateBuffer<glm::vec4>().Instance().Build(8);
    ASSERT_TRUE(buffer.has_value());
    ASSERT_TRUE(GetBuffer(*buffer).GetVertexLayout().has_value());
    EXPECT_EQ(GetBuffer(*buffer).GetVertexLayout()->StepMode, RHI::VertexStepMode::Instance);
}

TEST_F(BufferTest, IndexFormatFollowsElementWidth)
{
    auto narrow = Ctx().CreateBuffer<uint16_t>().Index().Build(6);
    auto wide = Ctx().CreateBuffer<uint32_t>().Index().Build(6);
    auto plain = Ctx().CreateBuffer<uint32_t>().CopyDst().Build(6);
    ASSERT_TRUE(narrow && wide && plain);

    EXPECT_EQ(GetBuffer(*narrow).GetIndexFormat(), RHI::IndexFormat::Uint16);
    EXPECT_EQ(GetBuffer(*wide).GetIndexFormat(), RHI::IndexFormat::Uint32);
    EXPECT_FALSE(GetBuffer(*plain).GetIndexFormat().has_value());

    EXPECT_FALSE(RHI::IndexFormatFromElementSize(1).has_value());
    EXPECT_FALSE(RHI::IndexFormatFromElementSize(8).has_value());
}

// -----------------------------------------------------------------------------
// Writes
// -----------------------------------------------------------------------------

TEST_F(BufferTest, WriteWithinCapacityKeepsAllocation)
{
    const std::array<float, 4> initial = {1.0f, 2.0f, 3.0f, 4.0f};
    auto buffer = Ctx().CreateBuffer<float>().CopyDst().Build(8);
    ASSERT_TRUE(buffer.has_value());
    ASSERT_TRUE(Ctx().WriteBuffer<float>(*buffer, initial).has_value());

    const uint64_t id = GetBuffer(*buffer).GetGpu().GetId();

    const std::array<float, 2> update = {9.0f, 8.0f};
    auto written = Ctx().WriteBuffer<float>(*buffer, update);
    ASSERT_TRUE(written.has_value());
    EXPECT_FALSE(*written);

    const Cairn::Buffer& record = GetBuffer(*buffer);
    EXPECT_EQ(record.GetGpu().GetId(), id);
    EXPECT_EQ(record.GetCapacity(), 8u * sizeof(float));
    EXPECT_EQ(record.GetReallocationCount(), 0u);

    auto read = Ctx().ReadBuffer<float>(*buffer);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ((*read)[0], 9.0f);
    EXPECT_EQ((*read)[1], 8.0f);
    EXPECT_EQ((*read)[2], 3.0f);
    EXPECT_EQ((*read)[3], 4.0f);
}

TEST_F(BufferTest, WriteBeyondCapacityReallocatesToExactSize)
{
    auto buffer = Ctx().CreateBuffer<uint32_t>().CopyDst().Build(1);
    ASSERT_TRUE(buffer.has_value());
    const uint64_t oldId = GetBuffer(*buffer).GetGpu().GetId();

    std::vector<uint32_t> ten(10);
    for (uint32_t i = 0; i < ten.size(); ++i) ten[i] = i * 3;

    auto written = Ctx().WriteBuffer<uint32_t>(*buffer, ten);
    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(*written);

    const Cairn::Buffer& record = GetBuffer(*buffer);
    EXPECT_EQ(record.GetCapacity(), 10u * sizeof(uint32_t));
    EXPECT_EQ(record.GetElementCount(), 10u);
    EXPECT_EQ(record.GetReallocationCount(), 1u);
    EXPECT_NE(record.GetGpu().GetId(), oldId);

    auto read = Ctx().ReadBuffer<uint32_t>(*buffer);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, ten);
}

TEST_F(BufferTest, GrowthKeepsUsageAndLayout)
{
    auto buffer = Ctx().CreateBuffer<glm::vec2>().Vertex().CopyDst().Build(3);
    ASSERT_TRUE(buffer.has_value());

    const std::vector<glm::vec2> more(5, glm::vec2(1.0f));
    ASSERT_TRUE(Ctx().WriteBuffer<glm::vec2>(*buffer, more).value_or(false));

    const Cairn::Buffer& record = GetBuffer(*buffer);
    EXPECT_EQ(record.GetGpu().GetUsage(), RHI::BufferUsage::Vertex | RHI::BufferUsage::CopyDst);
    ASSERT_TRUE(record.GetVertexLayout().has_value());
    EXPECT_EQ(record.GetVertexLayout()->Stride, sizeof(glm::vec2));
}

TEST_F(BufferTest, EmptyWriteIsNoOp)
{
    auto buffer = Ctx().CreateBuffer<float>().Build(2);
    ASSERT_TRUE(buffer.has_value());
    const uint32_t writes = Device().GetStats().BufferWrites;

    auto written = Ctx().WriteBuffer<float>(*buffer, {});
    ASSERT_TRUE(written.has_value());
    EXPECT_FALSE(*written);
    EXPECT_EQ(Device().GetStats().BufferWrites, writes);
}

TEST_F(BufferTest, ElementTypeMismatchIsRejected)
{
    auto buffer = Ctx().CreateBuffer<uint32_t>().CopyDst().Build(4);
    ASSERT_TRUE(buffer.has_value());

    const std::array<float, 1> wrong = {1.0f};
    auto written = Ctx().WriteBuffer<float>(*buffer, wrong);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), Core::ErrorCode::TypeMismatch);

    // Same size, different type: still a mismatch.
    auto read = Ctx().ReadBuffer<int32_t>(*buffer);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), Core::ErrorCode::TypeMismatch);
}

TEST_F(BufferTest, UnknownHandleIsResourceNotFound)
{
    const std::array<float, 1> data = {1.0f};
    auto written = Ctx().WriteBuffer<float>(Cairn::BufferHandle(99), data);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), Core::ErrorCode::ResourceNotFound);
}
