module;
#include <optional>
#include <string>
#include <utility>
#include <vector>

export module Cairn:Pass;

import RHI;
import :Types;

export namespace Cairn
{
    struct ColorAttachmentRef
    {
        TextureHandle Target = SurfaceTexture;
        std::optional<RHI::ClearColor> Clear; // nullopt -> load previous contents
        bool Store = true;
    };

    struct DepthStencilAttachmentRef
    {
        TextureHandle Target{};
        std::optional<RHI::DepthOps> Depth;
        std::optional<RHI::StencilOps> Stencil;
    };

    class RenderPass
    {
    public:
        RenderPass(std::vector<ColorAttachmentRef> colors, std::optional<DepthStencilAttachmentRef> depthStencil,
                   std::vector<RenderPipelineHandle> pipelines, std::string label)
            : m_Colors(std::move(colors)), m_DepthStencil(std::move(depthStencil)),
              m_Pipelines(std::move(pipelines)), m_Label(std::move(label))
        {
        }

        [[nodiscard]] const std::vector<ColorAttachmentRef>& GetColorAttachments() const { return m_Colors; }
        [[nodiscard]] const std::optional<DepthStencilAttachmentRef>& GetDepthStencil() const { return m_DepthStencil; }
        [[nodiscard]] const std::vector<RenderPipelineHandle>& GetPipelines() const { return m_Pipelines; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

        void SetPipelines(std::vector<RenderPipelineHandle> pipelines) { m_Pipelines = std::move(pipelines); }

    private:
        std::vector<ColorAttachmentRef> m_Colors;
        std::optional<DepthStencilAttachmentRef> m_DepthStencil;
        std::vector<RenderPipelineHandle> m_Pipelines;
        std::string m_Label;
    };

    class ComputePass
    {
    public:
        ComputePass(std::vector<ComputePipelineHandle> pipelines, std::string label)
            : m_Pipelines(std::move(pipelines)), m_Label(std::move(label))
        {
        }

        [[nodiscard]] const std::vector<ComputePipelineHandle>& GetPipelines() const { return m_Pipelines; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

        void SetPipelines(std::vector<ComputePipelineHandle> pipelines) { m_Pipelines = std::move(pipelines); }

    private:
        std::vector<ComputePipelineHandle> m_Pipelines;
        std::string m_Label;
    };
}
