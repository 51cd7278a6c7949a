#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

import Core;
import RHI;
import Cairn;

#include "CairnTestContext.h"

using Recorded = RHI::RecordedCommand;

class FrameExecutorTest : public CairnTest
{
protected:
    void SetUp() override
    {
        CairnTest::SetUp();
        m_Vs = Shader(RHI::ShaderStage::Vertex);
        m_Fs = Shader(RHI::ShaderStage::Fragment);
        m_Cs = Shader(RHI::ShaderStage::Compute);
    }

    [[nodiscard]] Cairn::RenderPipelineBuilder Pipeline()
    {
        auto builder = Ctx().CreateRenderPipeline();
        builder.VertexShader(m_Vs)
               .FragmentShader(m_Fs)
               .Topology(RHI::PrimitiveTopology::TriangleList)
               .FrontFace(RHI::FrontFace::Ccw);
        return builder;
    }

    [[nodiscard]] Core::Expected<Cairn::FrameStatus> Frame() { return Ctx().Render(); }

    Cairn::ShaderHandle m_Vs;
    Cairn::ShaderHandle m_Fs;
    Cairn::ShaderHandle m_Cs;
};

// -----------------------------------------------------------------------------
// Recording
// -----------------------------------------------------------------------------

TEST_F(FrameExecutorTest, TriangleFrame)
{
    const std::array<glm::vec2, 3> points = {glm::vec2{0.0f, -0.5f}, glm::vec2{0.5f, 0.5f}, glm::vec2{-0.5f, 0.5f}};
    auto vertices = Ctx().CreateBuffer<glm::vec2>().Vertex().BuildInit(points);
    ASSERT_TRUE(vertices.has_value());

    auto pipeline = Pipeline().AddVertexBuffer(*vertices).Build();
    ASSERT_TRUE(pipeline.has_value());

    auto pass = Ctx().CreateRenderPass()
        .AddColorAttachment(Cairn::SurfaceTexture, RHI::ClearColor{0.1, 0.2, 0.3, 1.0})
        .AddPipeline(*pipeline)
        .Label("main")
        .Build();
    ASSERT_TRUE(pass.has_value());

    auto status = Frame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, Cairn::FrameStatus::Presented);

    const auto& commands = Device().GetLastSubmittedCommands();
    ASSERT_EQ(commands.size(), 5u);

    const auto& begin = std::get<RHI::Recorded::BeginRenderPass>(commands[0]);
    EXPECT_EQ(begin.Label, "main");
    ASSERT_EQ(begin.Colors.size(), 1u);
    EXPECT_EQ(begin.Colors[0].View, Device().GetSurfaceViewId());
    EXPECT_EQ(begin.Colors[0].Load, RHI::LoadOp::Clear);
    EXPECT_EQ(begin.Colors[0].Clear, (RHI::ClearColor{0.1, 0.2, 0.3, 1.0}));
    EXPECT_FALSE(begin.DepthStencilView.has_value());

    EXPECT_EQ(std::get<RHI::Recorded::SetRenderPipeline>(commands[1]).Pipeline, GetNullPipeline(*pipeline).GetId());

    const auto& vertexBuffer = std::get<RHI::Recorded::SetVertexBuffer>(commands[2]);
    EXPECT_EQ(vertexBuffer.Slot, 0u);
    EXPECT_EQ(vertexBuffer.Buffer, GetBuffer(*vertices).GetGpu().GetId());

    const auto& draw = std::get<RHI::Recorded::Draw>(commands[3]);
    EXPECT_EQ(draw.VertexCount, 3u);
    EXPECT_EQ(draw.InstanceCount, 1u);

    EXPECT_TRUE(std::holds_alternative<RHI::Recorded::EndRenderPass>(commands[4]));

    EXPECT_EQ(Device().GetStats().Submits, 1u);
    EXPECT_EQ(Device().GetStats().Presents, 1u);
    EXPECT_FALSE(Device().IsFrameOpen());
}

TEST_F(FrameExecutorTest, EmptyPassOrderStillPresents)
{
    auto status = Frame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, Cairn::FrameStatus::Presented);
    EXPECT_TRUE(Device().GetLastSubmittedCommands().empty());
    EXPECT_EQ(Device().GetStats().Presents, 1u);
}

TEST_F(FrameExecutorTest, NonIndexedDrawUsesShortestVertexBuffer)
{
    auto five = Ctx().CreateBuffer<glm::vec3>().Vertex().Build(5);
    auto three = Ctx().CreateBuffer<glm::vec2>().Vertex().Build(3);
    auto instances = Ctx().CreateBuffer<glm::vec4>().Instance().Build(7);
    ASSERT_TRUE(five && three && instances);

    auto pipeline = Pipeline().AddVertexBuffer(*five).AddVertexBuffer(*three).AddInstanceBuffer(*instances).Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const auto draws = Commands<RHI::Recorded::Draw>();
    ASSERT_EQ(draws.size(), 1u);
    EXPECT_EQ(draws[0].VertexCount, 3u);
    EXPECT_EQ(draws[0].InstanceCount, 1u);

    const auto slots = Commands<RHI::Recorded::SetVertexBuffer>();
    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[2].Slot, 2u);
    EXPECT_EQ(slots[2].Buffer, GetBuffer(*instances).GetGpu().GetId());
}

TEST_F(FrameExecutorTest, DrawWithoutVertexBuffersDrawsOne)
{
    auto pipeline = Pipeline().Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const auto draws = Commands<RHI::Recorded::Draw>();
    ASSERT_EQ(draws.size(), 1u);
    EXPECT_EQ(draws[0].VertexCount, 1u);
    EXPECT_EQ(draws[0].InstanceCount, 1u);
}

TEST_F(FrameExecutorTest, IndexedDrawUsesIndexAndInstanceCounts)
{
    const std::array<uint16_t, 6> quad = {0, 1, 2, 2, 3, 0};
    auto indices = Ctx().CreateBuffer<uint16_t>().Index().BuildInit(quad);
    auto corners = Ctx().CreateBuffer<glm::vec2>().Vertex().Build(4);
    auto colors = Ctx().CreateBuffer<glm::vec4>().Vertex().Build(4);
    auto instances = Ctx().CreateBuffer<glm::vec4>().Instance().Build(10);
    ASSERT_TRUE(indices && corners && colors && instances);

    auto pipeline = Pipeline()
        .AddVertexBuffer(*corners)
        .AddVertexBuffer(*colors)
        .AddInstanceBuffer(*instances)
        .AddIndexBuffer(*indices)
        .Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const auto bound = Commands<RHI::Recorded::SetIndexBuffer>();
    ASSERT_EQ(bound.size(), 1u);
    EXPECT_EQ(bound[0].Buffer, GetBuffer(*indices).GetGpu().GetId());
    EXPECT_EQ(bound[0].Format, RHI::IndexFormat::Uint16);

    const auto draws = Commands<RHI::Recorded::DrawIndexed>();
    ASSERT_EQ(draws.size(), 1u);
    EXPECT_EQ(draws[0].IndexCount, 6u);
    EXPECT_EQ(draws[0].InstanceCount, 10u);
    EXPECT_TRUE(Commands<RHI::Recorded::Draw>().empty());
}

TEST_F(FrameExecutorTest, IndexedDrawRejectsInconsistentVertexCounts)
{
    const std::array<uint32_t, 3> tri = {0, 1, 2};
    auto indices = Ctx().CreateBuffer<uint32_t>().Index().BuildInit(tri);
    auto positions = Ctx().CreateBuffer<glm::vec3>().Vertex().Build(3);
    auto normals = Ctx().CreateBuffer<glm::vec3>().Vertex().Build(4);
    ASSERT_TRUE(indices && positions && normals);

    auto pipeline = Pipeline().AddVertexBuffer(*positions).AddVertexBuffer(*normals).AddIndexBuffer(*indices).Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).Build().has_value());

    auto status = Frame();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error(), Core::ErrorCode::InvalidState);

    // Rejected before the surface was touched.
    EXPECT_EQ(Device().GetStats().Acquires, 0u);
    EXPECT_EQ(Device().GetStats().Submits, 0u);
    EXPECT_FALSE(Device().IsFrameOpen());
}

TEST_F(FrameExecutorTest, BindGroupsBoundInSlotOrder)
{
    auto a = Ctx().CreateBuffer<glm::vec4>().Uniform().Build(1);
    auto b = Ctx().CreateBuffer<glm::vec4>().Uniform().Build(1);
    ASSERT_TRUE(a && b);
    auto g0 = Ctx().CreateBindGroup().BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, *a).Build();
    auto g1 = Ctx().CreateBindGroup().BindUniformBuffer(0, RHI::ShaderVisibility::Vertex, *b).Build();
    ASSERT_TRUE(g0 && g1);

    auto pipeline = Pipeline().AddBindGroup(*g0).AddBindGroup(*g1).Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const auto groups = Commands<RHI::Recorded::SetBindGroup>();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].Slot, 0u);
    EXPECT_EQ(groups[0].Group, GetBindGroup(*g0).GetInstance()->GetId());
    EXPECT_EQ(groups[1].Slot, 1u);
    EXPECT_EQ(groups[1].Group, GetBindGroup(*g1).GetInstance()->GetId());
}

TEST_F(FrameExecutorTest, PassesRunInCreationOrder)
{
    auto sim = Ctx().CreateComputePipeline().Shader(m_Cs).WorkGroups(64, 1, 1).Build();
    auto reduce = Ctx().CreateComputePipeline().Shader(m_Cs).WorkGroups(4, 2, 1).Build();
    auto draw = Pipeline().Build();
    ASSERT_TRUE(sim && reduce && draw);

    ASSERT_TRUE(Ctx().CreateComputePass().AddPipeline(*sim).AddPipeline(*reduce).Label("simulate").Build().has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*draw).Label("draw").Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const auto& commands = Device().GetLastSubmittedCommands();
    ASSERT_GE(commands.size(), 7u);
    EXPECT_EQ(std::get<RHI::Recorded::BeginComputePass>(commands[0]).Label, "simulate");
    EXPECT_TRUE(std::holds_alternative<RHI::Recorded::SetComputePipeline>(commands[1]));

    const auto dispatches = Commands<RHI::Recorded::Dispatch>();
    ASSERT_EQ(dispatches.size(), 2u);
    EXPECT_EQ(dispatches[0].X, 64u);
    EXPECT_EQ(dispatches[1].X, 4u);
    EXPECT_EQ(dispatches[1].Y, 2u);

    EXPECT_TRUE(std::holds_alternative<RHI::Recorded::EndComputePass>(commands[5]));
    EXPECT_EQ(std::get<RHI::Recorded::BeginRenderPass>(commands[6]).Label, "draw");
}

TEST_F(FrameExecutorTest, ReorderedPipelinesRecordInNewOrder)
{
    auto first = Pipeline().Build();
    auto second = Pipeline().Topology(RHI::PrimitiveTopology::LineList).Build();
    ASSERT_TRUE(first && second);
    auto pass = Ctx().CreateRenderPass().AddPipeline(*first).AddPipeline(*second).Build();
    ASSERT_TRUE(pass.has_value());

    const std::array<Cairn::RenderPipelineHandle, 2> swapped = {*second, *first};
    ASSERT_TRUE(Ctx().ReorderPipelines(*pass, swapped).has_value());
    ASSERT_TRUE(Frame().has_value());

    const auto bound = Commands<RHI::Recorded::SetRenderPipeline>();
    ASSERT_EQ(bound.size(), 2u);
    EXPECT_EQ(bound[0].Pipeline, GetNullPipeline(*second).GetId());
    EXPECT_EQ(bound[1].Pipeline, GetNullPipeline(*first).GetId());
}

TEST_F(FrameExecutorTest, OffscreenAndDepthAttachments)
{
    auto color = Ctx().CreateTexture<glm::vec4>().SizeSurface().RenderAttachment().Sampled().Build();
    auto depth = Ctx().CreateTexture<Cairn::Depth<float>>().SizeSurface().RenderAttachment().Build();
    ASSERT_TRUE(color && depth);

    auto pipeline = Pipeline()
        .ColorTarget(RHI::TextureFormat::RGBA32Float)
        .DepthStencil<Cairn::Depth<float>>(true, RHI::CompareFunction::Less)
        .Build();
    ASSERT_TRUE(pipeline.has_value());

    ASSERT_TRUE(Ctx().CreateRenderPass()
        .AddColorAttachment(*color, std::nullopt, true)
        .AddDepthStencilAttachment(*depth, RHI::DepthOps{.Clear = 1.0f, .Store = false})
        .AddPipeline(*pipeline)
        .Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const auto begins = Commands<RHI::Recorded::BeginRenderPass>();
    ASSERT_EQ(begins.size(), 1u);
    ASSERT_EQ(begins[0].Colors.size(), 1u);
    EXPECT_EQ(begins[0].Colors[0].View, GetTexture(*color).GetView().GetId());
    EXPECT_EQ(begins[0].Colors[0].Load, RHI::LoadOp::Load);
    ASSERT_TRUE(begins[0].DepthStencilView.has_value());
    EXPECT_EQ(*begins[0].DepthStencilView, GetTexture(*depth).GetView().GetId());
}

TEST_F(FrameExecutorTest, FrameSeesGrownBuffer)
{
    auto vertices = Ctx().CreateBuffer<glm::vec2>().Vertex().Build(3);
    ASSERT_TRUE(vertices.has_value());
    auto pipeline = Pipeline().AddVertexBuffer(*vertices).Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).Build().has_value());

    ASSERT_TRUE(Frame().has_value());
    EXPECT_EQ(Commands<RHI::Recorded::Draw>()[0].VertexCount, 3u);

    const std::vector<glm::vec2> more(12, glm::vec2(0.0f));
    ASSERT_TRUE(Ctx().WriteBuffer<glm::vec2>(*vertices, more).value_or(false));
    ASSERT_TRUE(Frame().has_value());

    EXPECT_EQ(Commands<RHI::Recorded::Draw>()[0].VertexCount, 12u);
    EXPECT_EQ(Commands<RHI::Recorded::SetVertexBuffer>()[0].Buffer, GetBuffer(*vertices).GetGpu().GetId());
}

TEST_F(FrameExecutorTest, PlanIsExposedAfterFrame)
{
    auto pipeline = Pipeline().Build();
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_TRUE(Ctx().CreateRenderPass().AddPipeline(*pipeline).AddPipeline(*pipeline).Build().has_value());

    ASSERT_TRUE(Frame().has_value());

    const Cairn::FramePlan& plan = Ctx().GetLastFramePlan();
    ASSERT_EQ(plan.PassCount, 1u);
    const auto& pass = std::get<Cairn::PlannedRenderPass>(plan.Passes[0]);
    EXPECT_EQ(pass.Draws.size(), 2u);
    ASSERT_EQ(pass.Colors.size(), 1u);
    EXPECT_EQ(pass.Colors[0].View, nullptr);
}

// -----------------------------------------------------------------------------
// Surface errors
// -----------------------------------------------------------------------------

TEST_F(FrameExecutorTest, LostSurfaceIsReconfigured)
{
    Device().QueueAcquireError(RHI::SurfaceError::Lost);

    auto status = Frame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, Cairn::FrameStatus::Reconfigured);
    EXPECT_EQ(Device().GetStats().SurfaceConfigurations, 1u);
    EXPECT_EQ(Device().GetStats().Presents, 0u);
    EXPECT_EQ(Device().GetSurfaceExtent(), (RHI::Extent2D{1280, 720}));
    EXPECT_FALSE(Device().IsFrameOpen());

    auto next = Frame();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, Cairn::FrameStatus::Presented);
}

TEST_F(FrameExecutorTest, OutOfMemorySurfaceIsReconfigured)
{
    Device().QueueAcquireError(RHI::SurfaceError::OutOfMemory);

    auto status = Frame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, Cairn::FrameStatus::Reconfigured);
}

TEST_F(FrameExecutorTest, TimeoutSkipsFrame)
{
    Device().QueueAcquireError(RHI::SurfaceError::Timeout);

    auto status = Frame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, Cairn::FrameStatus::Skipped);
    EXPECT_EQ(Device().GetStats().SurfaceConfigurations, 0u);
    EXPECT_EQ(Device().GetStats().Submits, 0u);
}

TEST_F(FrameExecutorTest, OutdatedSurfaceIsFatal)
{
    Device().QueueAcquireError(RHI::SurfaceError::Outdated);

    auto status = Frame();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error(), Core::ErrorCode::DeviceLost);
    EXPECT_FALSE(Device().IsFrameOpen());
}

TEST_F(FrameExecutorTest, ZeroSizedSurfaceSkipsWithoutAcquire)
{
    ASSERT_TRUE(Ctx().Resize({0, 0}).has_value());

    auto status = Frame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, Cairn::FrameStatus::Skipped);
    EXPECT_EQ(Device().GetStats().Acquires, 0u);

    ASSERT_TRUE(Ctx().Resize({1280, 720}).has_value());
    auto resumed = Frame();
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(*resumed, Cairn::FrameStatus::Presented);
}
