#include <gtest/gtest.h>
#include <array>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

import Core;
import RHI;
import Cairn;

#include "CairnTestContext.h"

class PassTest : public CairnTest
{
protected:
    [[nodiscard]] Cairn::RenderPipelineHandle MakeRenderPipeline()
    {
        auto pipeline = Ctx().CreateRenderPipeline()
            .VertexShader(Shader(RHI::ShaderStage::Vertex))
            .Topology(RHI::PrimitiveTopology::PointList)
            .FrontFace(RHI::FrontFace::Ccw)
            .Build();
        EXPECT_TRUE(pipeline.has_value());
        return pipeline.value_or(Cairn::RenderPipelineHandle{});
    }

    [[nodiscard]] Cairn::ComputePipelineHandle MakeComputePipeline()
    {
        auto pipeline = Ctx().CreateComputePipeline()
            .Shader(Shader(RHI::ShaderStage::Compute))
            .WorkGroups(1, 1, 1)
            .Build();
        EXPECT_TRUE(pipeline.has_value());
        return pipeline.value_or(Cairn::ComputePipelineHandle{});
    }
};

TEST_F(PassTest, DefaultPassLoadsAndStoresSurface)
{
    auto pass = Ctx().CreateRenderPass().AddPipeline(MakeRenderPipeline()).Build();
    ASSERT_TRUE(pass.has_value());

    const Cairn::RenderPass& record = *Store().GetRenderPasses().Get(*pass).value();
    ASSERT_EQ(record.GetColorAttachments().size(), 1u);

    const Cairn::ColorAttachmentRef& color = record.GetColorAttachments()[0];
    EXPECT_EQ(color.Target, Cairn::SurfaceTexture);
    EXPECT_FALSE(color.Clear.has_value());
    EXPECT_TRUE(color.Store);
    EXPECT_FALSE(record.GetDepthStencil().has_value());
}

TEST_F(PassTest, PassOrderFollowsCreationAcrossKinds)
{
    auto first = Ctx().CreateComputePass().AddPipeline(MakeComputePipeline()).Build();
    auto second = Ctx().CreateRenderPass().AddPipeline(MakeRenderPipeline()).Build();
    auto third = Ctx().CreateComputePass().Build();
    ASSERT_TRUE(first && second && third);

    const auto& order = Ctx().GetPassOrder();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(std::get<Cairn::ComputePassHandle>(order[0]), *first);
    EXPECT_EQ(std::get<Cairn::RenderPassHandle>(order[1]), *second);
    EXPECT_EQ(std::get<Cairn::ComputePassHandle>(order[2]), *third);
}

TEST_F(PassTest, ColorAttachmentsMustBeRenderableColor)
{
    auto sampledOnly = Ctx().CreateTexture<glm::vec4>().Size2D(8, 8).Sampled().Build();
    auto depth = Ctx().CreateTexture<Cairn::Depth<float>>().SizeSurface().RenderAttachment().Build();
    ASSERT_TRUE(sampledOnly && depth);

    auto notRenderable = Ctx().CreateRenderPass().AddColorAttachment(*sampledOnly).Build();
    ASSERT_FALSE(notRenderable.has_value());
    EXPECT_EQ(notRenderable.error(), Core::ErrorCode::InvalidArgument);

    auto depthAsColor = Ctx().CreateRenderPass().AddColorAttachment(*depth).Build();
    ASSERT_FALSE(depthAsColor.has_value());
    EXPECT_EQ(depthAsColor.error(), Core::ErrorCode::InvalidArgument);

    auto unknown = Ctx().CreateRenderPass().AddColorAttachment(Cairn::TextureHandle(40)).Build();
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), Core::ErrorCode::ResourceNotFound);

    EXPECT_TRUE(Ctx().GetPassOrder().empty());
}

TEST_F(PassTest, DepthAttachmentValidation)
{
    auto color = Ctx().CreateTexture<glm::vec4>().SizeSurface().RenderAttachment().Build();
    auto depth = Ctx().CreateTexture<Cairn::Depth<float>>().SizeSurface().RenderAttachment().Build();
    ASSERT_TRUE(color && depth);

    auto surfaceDepth = Ctx().CreateRenderPass().AddDepthStencilAttachment(Cairn::SurfaceTexture).Build();
    ASSERT_FALSE(surfaceDepth.has_value());
    EXPECT_EQ(surfaceDepth.error(), Core::ErrorCode::InvalidArgument);

    auto colorDepth = Ctx().CreateRenderPass().AddDepthStencilAttachment(*color).Build();
    ASSERT_FALSE(colorDepth.has_value());
    EXPECT_EQ(colorDepth.error(), Core::ErrorCode::InvalidFormat);

    auto valid = Ctx().CreateRenderPass()
        .AddColorAttachment(*color, RHI::ClearColor{0.0, 0.0, 0.0, 1.0})
        .AddDepthStencilAttachment(*depth, RHI::DepthOps{.Clear = 1.0f, .Store = false})
        .Build();
    ASSERT_TRUE(valid.has_value());

    const Cairn::RenderPass& record = *Store().GetRenderPasses().Get(*valid).value();
    ASSERT_TRUE(record.GetDepthStencil().has_value());
    EXPECT_EQ(record.GetDepthStencil()->Target, *depth);
    ASSERT_TRUE(record.GetDepthStencil()->Depth.has_value());
    EXPECT_EQ(record.GetDepthStencil()->Depth->Clear, 1.0f);
}

TEST_F(PassTest, UnknownPipelineIsResourceNotFound)
{
    auto render = Ctx().CreateRenderPass().AddPipeline(Cairn::RenderPipelineHandle(3)).Build();
    ASSERT_FALSE(render.has_value());
    EXPECT_EQ(render.error(), Core::ErrorCode::ResourceNotFound);

    auto compute = Ctx().CreateComputePass().AddPipeline(Cairn::ComputePipelineHandle(3)).Build();
    ASSERT_FALSE(compute.has_value());
    EXPECT_EQ(compute.error(), Core::ErrorCode::ResourceNotFound);
}

TEST_F(PassTest, ReorderPipelines)
{
    const Cairn::RenderPipelineHandle a = MakeRenderPipeline();
    const Cairn::RenderPipelineHandle b = MakeRenderPipeline();
    auto pass = Ctx().CreateRenderPass().AddPipeline(a).AddPipeline(b).Build();
    ASSERT_TRUE(pass.has_value());

    const std::array<Cairn::RenderPipelineHandle, 3> reordered = {b, a, b};
    ASSERT_TRUE(Ctx().ReorderPipelines(*pass, reordered).has_value());

    const auto& pipelines = Store().GetRenderPasses().Get(*pass).value()->GetPipelines();
    EXPECT_EQ(pipelines, (std::vector<Cairn::RenderPipelineHandle>{b, a, b}));

    const std::array<Cairn::RenderPipelineHandle, 2> bogus = {a, Cairn::RenderPipelineHandle(99)};
    auto rejected = Ctx().ReorderPipelines(*pass, bogus);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_EQ(Store().GetRenderPasses().Get(*pass).value()->GetPipelines().size(), 3u);
}

TEST_F(PassTest, ReorderComputePipelines)
{
    const Cairn::ComputePipelineHandle a = MakeComputePipeline();
    const Cairn::ComputePipelineHandle b = MakeComputePipeline();
    auto pass = Ctx().CreateComputePass().AddPipeline(a).AddPipeline(b).Build();
    ASSERT_TRUE(pass.has_value());

    const std::array<Cairn::ComputePipelineHandle, 1> only = {b};
    ASSERT_TRUE(Ctx().ReorderPipelines(*pass, only).has_value());
    EXPECT_EQ(Store().GetComputePasses().Get(*pass).value()->GetPipelines(),
              (std::vector<Cairn::ComputePipelineHandle>{b}));

    auto missing = Ctx().ReorderPipelines(Cairn::ComputePassHandle(8), only);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), Core::ErrorCode::ResourceNotFound);
}
