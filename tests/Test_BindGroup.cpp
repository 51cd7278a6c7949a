#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

import Core;
import RHI;
import Cairn;

#include "CairnTestContext.h"

namespace
{
    struct Camera
    {
        glm::mat4 ViewProjection;
        glm::vec4 Eye;
    };
}

class BindGroupTest : public CairnTest
{
protected:
    void SetUp() override
    {
        CairnTest::SetUp();

        auto uniform = Ctx().CreateBuffer<Camera>().Uniform().CopyDst().Label("camera").Build(1);
        auto storage = Ctx().CreateBuffer<glm::vec4>().Storage().Label("particles").Build(4);
        ASSERT_TRUE(uniform && storage);
        m_Uniform = *uniform;
        m_Storage = *storage;
    }

    Cairn::BufferHandle m_Uniform;
    Cairn::BufferHandle m_Storage;
};

TEST_F(BindGroupTest, BindsCurrentAllocations)
{
    auto group = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, m_Uniform)
        .BindStorageBuffer(1, RHI::ShaderVisibility::Compute, true, m_Storage)
        .Label("frame")
        .Build();
    ASSERT_TRUE(group.has_value());

    const auto bound = BoundResources(*group);
    ASSERT_EQ(bound.size(), 2u);
    EXPECT_EQ(bound[0], (RHI::NullBinding{0, GetBuffer(m_Uniform).GetGpu().GetId()}));
    EXPECT_EQ(bound[1], (RHI::NullBinding{1, GetBuffer(m_Storage).GetGpu().GetId()}));

    const Cairn::BindGroup& record = GetBindGroup(*group);
    EXPECT_EQ(record.GetRebuildCount(), 0u);
    EXPECT_EQ(record.GetLabel(), "frame");
    EXPECT_TRUE(record.DependsOn(m_Uniform));
    EXPECT_FALSE(record.DependsOn(Cairn::BufferHandle(42)));
}

TEST_F(BindGroupTest, LayoutCarriesUniformSizeAndStorageAccess)
{
    auto group = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex | RHI::ShaderVisibility::Fragment, m_Uniform)
        .BindStorageBuffer(3, RHI::ShaderVisibility::Compute, false, m_Storage)
        .Build();
    ASSERT_TRUE(group.has_value());

    const auto entries = GetBindGroup(*group).GetLayout().GetEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].Kind, RHI::BindingKind::UniformBuffer);
    EXPECT_EQ(entries[0].MinBindingSize, sizeof(Camera));
    EXPECT_EQ(entries[0].Visibility, RHI::ShaderVisibility::Vertex | RHI::ShaderVisibility::Fragment);
    EXPECT_EQ(entries[1].Binding, 3u);
    EXPECT_EQ(entries[1].Kind, RHI::BindingKind::StorageBuffer);
    EXPECT_FALSE(entries[1].ReadOnly);
}

TEST_F(BindGroupTest, BufferGrowthRebuildsDependentGroup)
{
    auto group = Ctx().CreateBindGroup()
        .BindStorageBuffer(0, RHI::ShaderVisibility::Compute, false, m_Storage)
        .Build();
    ASSERT_TRUE(group.has_value());
    const uint64_t oldInstance = GetBindGroup(*group).GetInstance()->GetId();

    const std::vector<glm::vec4> grown(16, glm::vec4(1.0f));
    auto written = Ctx().WriteBuffer<glm::vec4>(m_Storage, grown);
    ASSERT_TRUE(written.has_value());
    ASSERT_TRUE(*written);

    const Cairn::BindGroup& record = GetBindGroup(*group);
    EXPECT_EQ(record.GetRebuildCount(), 1u);
    EXPECT_NE(record.GetInstance()->GetId(), oldInstance);

    const auto bound = BoundResources(*group);
    ASSERT_EQ(bound.size(), 1u);
    EXPECT_EQ(bound[0].ResourceId, GetBuffer(m_Storage).GetGpu().GetId());
}

TEST_F(BindGroupTest, InPlaceWriteDoesNotRebuild)
{
    auto group = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, m_Uniform)
        .Build();
    ASSERT_TRUE(group.has_value());

    const std::vector<Camera> camera(1, Camera{glm::mat4(1.0f), glm::vec4(0.0f, 0.0f, 5.0f, 1.0f)});
    auto written = Ctx().WriteBuffer<Camera>(m_Uniform, camera);
    ASSERT_TRUE(written.has_value());
    EXPECT_FALSE(*written);
    EXPECT_EQ(GetBindGroup(*group).GetRebuildCount(), 0u);
}

TEST_F(BindGroupTest, UnrelatedGrowthLeavesGroupAlone)
{
    auto group = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, m_Uniform)
        .Build();
    ASSERT_TRUE(group.has_value());

    const std::vector<glm::vec4> grown(32, glm::vec4(0.0f));
    ASSERT_TRUE(Ctx().WriteBuffer<glm::vec4>(m_Storage, grown).value_or(false));
    EXPECT_EQ(GetBindGroup(*group).GetRebuildCount(), 0u);
}

TEST_F(BindGroupTest, RecreateIsIdempotent)
{
    auto group = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, m_Uniform)
        .Build();
    ASSERT_TRUE(group.has_value());
    const auto before = BoundResources(*group);

    ASSERT_TRUE(Ctx().RecreateBindGroup(*group).has_value());
    ASSERT_TRUE(Ctx().RecreateBindGroup(*group).has_value());

    EXPECT_EQ(GetBindGroup(*group).GetRebuildCount(), 2u);
    EXPECT_EQ(BoundResources(*group), before);
}

TEST_F(BindGroupTest, TexturesAndSamplers)
{
    auto texture = Ctx().CreateTexture<glm::vec4>().Size2D(16, 16).Sampled().Build();
    auto image = Ctx().CreateTexture<float>().Size2D(16, 16).Storage().Build();
    auto sampler = Ctx().CreateSampler().Build();
    ASSERT_TRUE(texture && image && sampler);

    auto group = Ctx().CreateBindGroup()
        .BindTexture(0, RHI::ShaderVisibility::Fragment, RHI::TextureSampleType::Float,
                     RHI::TextureViewDimension::D2, false, *texture)
        .BindStorageTexture(1, RHI::ShaderVisibility::Compute, RHI::StorageTextureAccess::WriteOnly,
                            RHI::TextureViewDimension::D2, *image)
        .BindSampler(2, RHI::ShaderVisibility::Fragment, RHI::SamplerBindingType::Filtering, *sampler)
        .Build();
    ASSERT_TRUE(group.has_value());

    const auto entries = GetBindGroup(*group).GetLayout().GetEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].Format, RHI::TextureFormat::R32Float);

    const auto bound = BoundResources(*group);
    ASSERT_EQ(bound.size(), 3u);
    EXPECT_EQ(bound[0].ResourceId, GetTexture(*texture).GetGpu().GetId());
    EXPECT_EQ(bound[2].ResourceId, Store().GetSamplers().Get(*sampler).value()->GetGpu().GetId());

    EXPECT_TRUE(GetBindGroup(*group).DependsOn(*texture));
    EXPECT_TRUE(GetBindGroup(*group).DependsOn(*sampler));
}

TEST_F(BindGroupTest, TextureResizeRebuildsDependentGroup)
{
    auto texture = Ctx().CreateTexture<glm::vec4>().Size2D(16, 16).Sampled().Build();
    ASSERT_TRUE(texture.has_value());

    auto group = Ctx().CreateBindGroup()
        .BindTexture(0, RHI::ShaderVisibility::Fragment, RHI::TextureSampleType::Float,
                     RHI::TextureViewDimension::D2, false, *texture)
        .Build();
    ASSERT_TRUE(group.has_value());

    ASSERT_TRUE(Ctx().ResizeTexture(*texture, {32, 32, 1}).has_value());

    EXPECT_EQ(GetBindGroup(*group).GetRebuildCount(), 1u);
    EXPECT_EQ(BoundResources(*group)[0].ResourceId, GetTexture(*texture).GetGpu().GetId());
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------

TEST_F(BindGroupTest, DuplicateBindingIsRejected)
{
    auto group = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, m_Uniform)
        .BindStorageBuffer(0, RHI::ShaderVisibility::Compute, true, m_Storage)
        .Build();
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(Store().GetBindGroups().Size(), 0u);
    EXPECT_EQ(Device().GetStats().BindGroupLayoutsCreated, 0u);
}

TEST_F(BindGroupTest, MissingUsageIsRejected)
{
    auto asUniform = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, m_Storage)
        .Build();
    ASSERT_FALSE(asUniform.has_value());
    EXPECT_EQ(asUniform.error(), Core::ErrorCode::InvalidArgument);

    auto unsampled = Ctx().CreateTexture<float>().Size2D(4, 4).CopyDst().Build();
    ASSERT_TRUE(unsampled.has_value());

    auto asTexture = Ctx().CreateBindGroup()
        .BindTexture(0, RHI::ShaderVisibility::Fragment, RHI::TextureSampleType::UnfilterableFloat,
                     RHI::TextureViewDimension::D2, false, *unsampled)
        .Build();
    ASSERT_FALSE(asTexture.has_value());
    EXPECT_EQ(asTexture.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(BindGroupTest, SurfaceTextureCannotBeBound)
{
    auto group = Ctx().CreateBindGroup()
        .BindTexture(0, RHI::ShaderVisibility::Fragment, RHI::TextureSampleType::Float,
                     RHI::TextureViewDimension::D2, false, Cairn::SurfaceTexture)
        .Build();
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(BindGroupTest, UnknownHandlesAreResourceNotFound)
{
    auto buffer = Ctx().CreateBindGroup()
        .BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, Cairn::BufferHandle(77))
        .Build();
    ASSERT_FALSE(buffer.has_value());
    EXPECT_EQ(buffer.error(), Core::ErrorCode::ResourceNotFound);

    auto sampler = Ctx().CreateBindGroup()
        .BindSampler(0, RHI::ShaderVisibility::Fragment, RHI::SamplerBindingType::Filtering, Cairn::SamplerHandle(3))
        .Build();
    ASSERT_FALSE(sampler.has_value());
    EXPECT_EQ(sampler.error(), Core::ErrorCode::ResourceNotFound);

    auto recreate = Ctx().RecreateBindGroup(Cairn::BindGroupHandle(5));
    ASSERT_FALSE(recreate.has_value());
    EXPECT_EQ(recreate.error(), Core::ErrorCode::ResourceNotFound);
}
