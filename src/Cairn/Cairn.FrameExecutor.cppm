module;
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

export module Cairn:FrameExecutor;

import Core;
import RHI;
import :Types;
import :ResourceStore;

export namespace Cairn
{
    struct PlannedBindGroup
    {
        uint32_t Slot = 0;
        const RHI::IBindGroup* Group = nullptr;
    };

    struct PlannedDraw
    {
        const RHI::IRenderPipeline* Pipeline = nullptr;
        std::vector<PlannedBindGroup> BindGroups;
        std::vector<const RHI::IBuffer*> VertexBuffers; // vertex slots first, then instance slots
        const RHI::IBuffer* IndexBuffer = nullptr;
        RHI::IndexFormat IndexFormat = RHI::IndexFormat::Uint32;
        uint32_t Count = 0;     // vertices, or indices when IndexBuffer is set
        uint32_t Instances = 1;
    };

    struct PlannedDispatch
    {
        const RHI::IComputePipeline* Pipeline = nullptr;
        std::vector<PlannedBindGroup> BindGroups;
        uint32_t X = 1, Y = 1, Z = 1;
    };

    // View == nullptr stands for the surface target acquired for the frame.
    struct PlannedColorAttachment
    {
        const RHI::ITextureView* View = nullptr;
        RHI::LoadOp Load = RHI::LoadOp::Load;
        RHI::ClearColor Clear{};
        bool Store = true;
    };

    struct PlannedRenderPass
    {
        std::string_view Label;
        std::vector<PlannedColorAttachment> Colors;
        std::optional<RHI::DepthStencilAttachment> DepthStencil;
        std::vector<PlannedDraw> Draws;
    };

    struct PlannedComputePass
    {
        std::string_view Label;
        std::vector<PlannedDispatch> Dispatches;
    };

    using PlannedPass = std::variant<PlannedRenderPass, PlannedComputePass>;

    // Fully resolved frame. Rebuilt in place every frame so steady-state
    // rendering reuses the vectors' storage.
    struct FramePlan
    {
        std::vector<PlannedPass> Passes;
        uint32_t PassCount = 0;
    };

    // -------------------------------------------------------------------------
    // FrameExecutor
    // -------------------------------------------------------------------------
    // Validate -> acquire -> record -> submit -> present. Validation resolves
    // every handle, view and draw count before the surface is touched, so a
    // frame that fails validation records nothing and acquires nothing. The
    // executor never allocates device resources.
    // -------------------------------------------------------------------------
    class FrameExecutor
    {
    public:
        [[nodiscard]] Core::Expected<FrameStatus> Execute(ResourceStore& store);

        [[nodiscard]] const FramePlan& GetPlan() const { return m_Plan; }

    private:
        [[nodiscard]] Core::Result BuildPlan(const ResourceStore& store);
        [[nodiscard]] Core::Result PlanRenderPass(const ResourceStore& store, RenderPassHandle handle,
                                                  PlannedRenderPass& out);
        [[nodiscard]] Core::Result PlanComputePass(const ResourceStore& store, ComputePassHandle handle,
                                                   PlannedComputePass& out);
        [[nodiscard]] Core::Result PlanDraw(const ResourceStore& store, RenderPipelineHandle handle,
                                            PlannedDraw& out);

        void Record(RHI::ICommandRecorder& recorder, const RHI::ITextureView& surfaceView);

        [[nodiscard]] Core::Expected<FrameStatus> HandleSurfaceError(ResourceStore& store, RHI::SurfaceError error);

        FramePlan m_Plan;
        std::vector<RHI::ColorAttachment> m_ColorScratch;
    };
}
