#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <glm/glm.hpp>

import Core;
import RHI;
import Cairn;

#include "CairnTestContext.h"

class PipelineTest : public CairnTest
{
protected:
    void SetUp() override
    {
        CairnTest::SetUp();
        m_Vs = Shader(RHI::ShaderStage::Vertex);
        m_Fs = Shader(RHI::ShaderStage::Fragment);
        m_Cs = Shader(RHI::ShaderStage::Compute);
    }

    [[nodiscard]] Cairn::RenderPipelineBuilder Minimal()
    {
        auto builder = Ctx().CreateRenderPipeline();
        builder.VertexShader(m_Vs)
               .FragmentShader(m_Fs)
               .Topology(RHI::PrimitiveTopology::TriangleList)
               .FrontFace(RHI::FrontFace::Ccw);
        return builder;
    }

    Cairn::ShaderHandle m_Vs;
    Cairn::ShaderHandle m_Fs;
    Cairn::ShaderHandle m_Cs;
};

// -----------------------------------------------------------------------------
// Render pipelines
// -----------------------------------------------------------------------------

TEST_F(PipelineTest, MinimalPipelineTargetsSurfaceFormat)
{
    auto pipeline = Minimal().Label("minimal").Build();
    ASSERT_TRUE(pipeline.has_value());

    const RHI::NullRenderPipeline& gpu = GetNullPipeline(*pipeline);
    ASSERT_EQ(gpu.GetColorTargets().size(), 1u);
    EXPECT_EQ(gpu.GetColorTargets()[0], Device().GetSurfaceFormat());
    EXPECT_TRUE(gpu.HasFragmentStage());
    EXPECT_EQ(gpu.GetVertexEntryPoint(), "main");
    EXPECT_TRUE(gpu.GetVertexLayouts().empty());
    EXPECT_FALSE(gpu.GetDepthStencil().has_value());
}

TEST_F(PipelineTest, MandatoryFieldsAreInvalidState)
{
    auto noVertex = Ctx().CreateRenderPipeline()
        .Topology(RHI::PrimitiveTopology::TriangleList)
        .FrontFace(RHI::FrontFace::Ccw)
        .Build();
    ASSERT_FALSE(noVertex.has_value());
    EXPECT_EQ(noVertex.error(), Core::ErrorCode::InvalidState);

    auto noTopology = Ctx().CreateRenderPipeline()
        .VertexShader(m_Vs)
        .FrontFace(RHI::FrontFace::Ccw)
        .Build();
    ASSERT_FALSE(noTopology.has_value());
    EXPECT_EQ(noTopology.error(), Core::ErrorCode::InvalidState);

    auto noWinding = Ctx().CreateRenderPipeline()
        .VertexShader(m_Vs)
        .Topology(RHI::PrimitiveTopology::TriangleList)
        .Build();
    ASSERT_FALSE(noWinding.has_value());
    EXPECT_EQ(noWinding.error(), Core::ErrorCode::InvalidState);

    EXPECT_EQ(Device().GetStats().RenderPipelinesCreated, 0u);
}

TEST_F(PipelineTest, ShaderStageMustMatch)
{
    auto pipeline = Ctx().CreateRenderPipeline()
        .VertexShader(m_Fs)
        .Topology(RHI::PrimitiveTopology::TriangleList)
        .FrontFace(RHI::FrontFace::Ccw)
        .Build();
    ASSERT_FALSE(pipeline.has_value());
    EXPECT_EQ(pipeline.error(), Core::ErrorCode::InvalidArgument);

    auto unknown = Ctx().CreateRenderPipeline()
        .VertexShader(Cairn::ShaderHandle(50))
        .Topology(RHI::PrimitiveTopology::TriangleList)
        .FrontFace(RHI::FrontFace::Ccw)
        .Build();
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), Core::ErrorCode::ResourceNotFound);
}

TEST_F(PipelineTest, VertexSlotsPrecedeInstanceSlots)
{
    auto instances = Ctx().CreateBuffer<glm::vec4>().Instance().Build(2);
    auto positions = Ctx().CreateBuffer<glm::vec3>().Vertex().Build(3);
    // Marked per-vertex, attached as per-instance: the attachment wins.
    auto offsets = Ctx().CreateBuffer<glm::vec2>().Vertex().Build(2);
    ASSERT_TRUE(instances && positions && offsets);

    auto pipeline = Minimal()
        .AddInstanceBuffer(*instances)
        .AddVertexBuffer(*positions)
        .AddInstanceBuffer(*offsets)
        .Build();
    ASSERT_TRUE(pipeline.has_value());

    const auto& layouts = GetNullPipeline(*pipeline).GetVertexLayouts();
    ASSERT_EQ(layouts.size(), 3u);
    EXPECT_EQ(layouts[0].Stride, sizeof(glm::vec3));
    EXPECT_EQ(layouts[0].StepMode, RHI::VertexStepMode::Vertex);
    EXPECT_EQ(layouts[1].Stride, sizeof(glm::vec4));
    EXPECT_EQ(layouts[1].StepMode, RHI::VertexStepMode::Instance);
    EXPECT_EQ(layouts[2].Stride, sizeof(glm::vec2));
    EXPECT_EQ(layouts[2].StepMode, RHI::VertexStepMode::Instance);
}

TEST_F(PipelineTest, BufferWithoutVertexLayoutIsRejected)
{
    auto raw = Ctx().CreateBuffer<glm::vec4>().Storage().Build(4);
    ASSERT_TRUE(raw.has_value());

    auto pipeline = Minimal().AddVertexBuffer(*raw).Build();
    ASSERT_FALSE(pipeline.has_value());
    EXPECT_EQ(pipeline.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(PipelineTest, IndexBufferNeedsIndexUsage)
{
    auto unmarked = Ctx().CreateBuffer<uint16_t>().CopyDst().Build(6);
    ASSERT_TRUE(unmarked.has_value());

    auto pipeline = Minimal().AddIndexBuffer(*unmarked).Build();
    ASSERT_FALSE(pipeline.has_value());
    EXPECT_EQ(pipeline.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(PipelineTest, StripIndexFormatOnlyForStrips)
{
    auto indices = Ctx().CreateBuffer<uint32_t>().Index().Build(4);
    ASSERT_TRUE(indices.has_value());

    auto strip = Minimal().Topology(RHI::PrimitiveTopology::TriangleStrip).AddIndexBuffer(*indices).Build();
    auto list = Minimal().AddIndexBuffer(*indices).Build();
    ASSERT_TRUE(strip && list);

    EXPECT_EQ(GetNullPipeline(*strip).GetStripIndexFormat(), RHI::IndexFormat::Uint32);
    EXPECT_FALSE(GetNullPipeline(*list).GetStripIndexFormat().has_value());
    EXPECT_EQ(GetNullPipeline(*strip).GetTopology(), RHI::PrimitiveTopology::TriangleStrip);
}

TEST_F(PipelineTest, DepthStencilState)
{
    auto depth = Minimal()
        .DepthStencil<Cairn::Depth<float>>(true, RHI::CompareFunction::Less)
        .Culling(RHI::CullMode::Back)
        .Build();
    ASSERT_TRUE(depth.has_value());

    const auto& state = GetNullPipeline(*depth).GetDepthStencil();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->Format, RHI::TextureFormat::Depth32Float);
    EXPECT_TRUE(state->DepthWriteEnabled);
    EXPECT_EQ(state->DepthCompare, RHI::CompareFunction::Less);
    EXPECT_EQ(GetNullPipeline(*depth).GetCullMode(), RHI::CullMode::Back);

    auto color = Minimal()
        .DepthStencilFormat(RHI::TextureFormat::RGBA8Unorm, true, RHI::CompareFunction::Less)
        .Build();
    ASSERT_FALSE(color.has_value());
    EXPECT_EQ(color.error(), Core::ErrorCode::InvalidFormat);
}

TEST_F(PipelineTest, BindGroupLayoutsInSlotOrder)
{
    auto a = Ctx().CreateBuffer<glm::vec4>().Uniform().Build(1);
    auto b = Ctx().CreateBuffer<glm::vec4>().Storage().Build(1);
    ASSERT_TRUE(a && b);

    auto g0 = Ctx().CreateBindGroup().BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, *a).Build();
    auto g1 = Ctx().CreateBindGroup().BindStorageBuffer(0, RHI::ShaderVisibility::Vertex, true, *b).Build();
    ASSERT_TRUE(g0 && g1);

    auto pipeline = Minimal().AddBindGroup(*g0).AddBindGroup(*g1).Build();
    ASSERT_TRUE(pipeline.has_value());

    const auto& ids = GetNullPipeline(*pipeline).GetBindGroupLayoutIds();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], GetBindGroup(*g0).GetLayout().GetId());
    EXPECT_EQ(ids[1], GetBindGroup(*g1).GetLayout().GetId());

    auto missing = Minimal().AddBindGroup(Cairn::BindGroupHandle(9)).Build();
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), Core::ErrorCode::ResourceNotFound);
}

// -----------------------------------------------------------------------------
// Compute pipelines
// -----------------------------------------------------------------------------

TEST_F(PipelineTest, ComputePipelineRecordsWorkGroups)
{
    auto pipeline = Ctx().CreateComputePipeline()
        .Shader(m_Cs, "simulate")
        .WorkGroups(8, 4, 1)
        .Label("sim")
        .Build();
    ASSERT_TRUE(pipeline.has_value());

    const Cairn::ComputePipeline& record = *Store().GetComputePipelines().Get(*pipeline).value();
    EXPECT_EQ(record.GetWorkGroups(), (std::array<uint32_t, 3>{8, 4, 1}));
    EXPECT_EQ(record.GetLabel(), "sim");

    const auto& gpu = static_cast<const RHI::NullComputePipeline&>(record.GetGpu());
    EXPECT_EQ(gpu.GetEntryPoint(), "simulate");
}

TEST_F(PipelineTest, ComputePipelineValidation)
{
    auto noShader = Ctx().CreateComputePipeline().WorkGroups(1, 1, 1).Build();
    ASSERT_FALSE(noShader.has_value());
    EXPECT_EQ(noShader.error(), Core::ErrorCode::InvalidState);

    auto noGroups = Ctx().CreateComputePipeline().Shader(m_Cs).Build();
    ASSERT_FALSE(noGroups.has_value());
    EXPECT_EQ(noGroups.error(), Core::ErrorCode::InvalidState);

    auto emptyAxis = Ctx().CreateComputePipeline().Shader(m_Cs).WorkGroups(4, 0, 1).Build();
    ASSERT_FALSE(emptyAxis.has_value());
    EXPECT_EQ(emptyAxis.error(), Core::ErrorCode::InvalidArgument);

    auto wrongStage = Ctx().CreateComputePipeline().Shader(m_Vs).WorkGroups(1, 1, 1).Build();
    ASSERT_FALSE(wrongStage.has_value());
    EXPECT_EQ(wrongStage.error(), Core::ErrorCode::InvalidArgument);

    EXPECT_EQ(Device().GetStats().ComputePipelinesCreated, 0u);
}
