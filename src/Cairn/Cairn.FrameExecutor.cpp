module;
#include <algorithm>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

module Cairn:FrameExecutor.Impl;
import :FrameExecutor;
import Core;
import RHI;

namespace Cairn
{
    namespace
    {
        constexpr uint64_t MaxDrawCount = std::numeric_limits<uint32_t>::max();

        // Element counts of one group of buffers. Consistent is false as soon
        // as two buffers disagree.
        struct CountSummary
        {
            std::optional<uint64_t> Min;
            bool Consistent = true;

            void Add(uint64_t count)
            {
                if (Min && *Min != count) Consistent = false;
                Min = Min ? std::min(*Min, count) : count;
            }
        };
    }

    Core::Expected<FrameStatus> FrameExecutor::Execute(ResourceStore& store)
    {
        const RHI::Extent2D extent = store.GetSurfaceExtent();
        if (extent.Width == 0 || extent.Height == 0)
        {
            Core::Log::Debug("Render(): surface has no area, frame skipped");
            return FrameStatus::Skipped;
        }

        if (auto planned = BuildPlan(store); !planned)
            return std::unexpected(planned.error());

        RHI::IDevice& device = store.GetDevice();
        auto target = device.AcquireSurfaceTarget();
        if (!target)
            return HandleSurfaceError(store, target.error());

        RHI::ICommandRecorder& recorder = device.BeginCommands();
        Record(recorder, *target->View);

        if (auto submitted = device.Submit(recorder); !submitted)
        {
            Core::Log::Error("Render(): submit failed ({})", Core::ErrorCodeToString(submitted.error()));
            return std::unexpected(submitted.error());
        }

        if (auto presented = device.Present(*target); !presented)
        {
            Core::Log::Error("Render(): present failed ({})", Core::ErrorCodeToString(presented.error()));
            return std::unexpected(presented.error());
        }

        return FrameStatus::Presented;
    }

    Core::Result FrameExecutor::BuildPlan(const ResourceStore& store)
    {
        const auto& order = store.GetPassOrder();
        if (m_Plan.Passes.size() < order.size())
            m_Plan.Passes.resize(order.size());
        m_Plan.PassCount = 0;

        for (const PassRef& ref : order)
        {
            PlannedPass& slot = m_Plan.Passes[m_Plan.PassCount];

            Core::Result planned = std::visit([&](auto handle) -> Core::Result
            {
                using H = std::decay_t<decltype(handle)>;

                if constexpr (std::is_same_v<H, RenderPassHandle>)
                {
                    auto* pass = std::get_if<PlannedRenderPass>(&slot);
                    if (!pass) pass = &slot.emplace<PlannedRenderPass>();
                    return PlanRenderPass(store, handle, *pass);
                }
                else
                {
                    auto* pass = std::get_if<PlannedComputePass>(&slot);
                    if (!pass) pass = &slot.emplace<PlannedComputePass>();
                    return PlanComputePass(store, handle, *pass);
                }
            }, ref);

            if (!planned) return planned;
            ++m_Plan.PassCount;
        }

        return Core::Ok();
    }

    Core::Result FrameExecutor::PlanRenderPass(const ResourceStore& store, RenderPassHandle handle,
                                               PlannedRenderPass& out)
    {
        auto found = store.GetRenderPasses().Get(handle);
        if (!found)
        {
            Core::Log::Error("Render(): render pass handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        const RenderPass& pass = **found;
        out.Label = pass.GetLabel();

        out.Colors.clear();
        for (const ColorAttachmentRef& color : pass.GetColorAttachments())
        {
            PlannedColorAttachment planned{
                .View = nullptr,
                .Load = color.Clear ? RHI::LoadOp::Clear : RHI::LoadOp::Load,
                .Clear = color.Clear.value_or(RHI::ClearColor{}),
                .Store = color.Store,
            };

            if (color.Target != SurfaceTexture)
            {
                auto texture = store.GetTextures().Get(color.Target);
                if (!texture)
                {
                    Core::Log::Error("Render(): pass '{}' color attachment {} is not registered",
                                     pass.GetLabel(), color.Target.Index);
                    return std::unexpected(texture.error());
                }
                planned.View = &(*texture)->GetView();
            }

            out.Colors.push_back(planned);
        }

        out.DepthStencil.reset();
        if (const auto& depthStencil = pass.GetDepthStencil())
        {
            auto texture = store.GetTextures().Get(depthStencil->Target);
            if (!texture)
            {
                Core::Log::Error("Render(): pass '{}' depth attachment {} is not registered",
                                 pass.GetLabel(), depthStencil->Target.Index);
                return std::unexpected(texture.error());
            }

            out.DepthStencil = RHI::DepthStencilAttachment{
                .View = &(*texture)->GetView(),
                .Depth = depthStencil->Depth,
                .Stencil = depthStencil->Stencil,
            };
        }

        const auto& pipelines = pass.GetPipelines();
        out.Draws.resize(pipelines.size());
        for (size_t i = 0; i < pipelines.size(); ++i)
        {
            if (auto planned = PlanDraw(store, pipelines[i], out.Draws[i]); !planned)
                return planned;
        }

        return Core::Ok();
    }

    Core::Result FrameExecutor::PlanDraw(const ResourceStore& store, RenderPipelineHandle handle, PlannedDraw& out)
    {
        auto found = store.GetRenderPipelines().Get(handle);
        if (!found)
        {
            Core::Log::Error("Render(): render pipeline handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        const RenderPipeline& pipeline = **found;
        const RenderPipelineBindings& bindings = pipeline.GetBindings();
        out.Pipeline = &pipeline.GetGpu();

        out.BindGroups.clear();
        for (uint32_t slot = 0; slot < bindings.BindGroups.size(); ++slot)
        {
            auto group = store.GetBindGroups().Get(bindings.BindGroups[slot]);
            if (!group)
            {
                Core::Log::Error("Render(): pipeline '{}' bind group {} is not registered",
                                 pipeline.GetLabel(), bindings.BindGroups[slot].Index);
                return std::unexpected(group.error());
            }
            if ((*group)->IsStale())
            {
                Core::Log::Error("Render(): pipeline '{}' bind group '{}' is stale after a failed rebuild",
                                 pipeline.GetLabel(), (*group)->GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidState);
            }
            out.BindGroups.push_back({slot, (*group)->GetInstance()});
        }

        out.VertexBuffers.clear();
        CountSummary vertices;
        CountSummary instances;

        for (BufferHandle vertexHandle : bindings.VertexBuffers)
        {
            auto buffer = store.GetBuffers().Get(vertexHandle);
            if (!buffer)
            {
                Core::Log::Error("Render(): pipeline '{}' vertex buffer {} is not registered",
                                 pipeline.GetLabel(), vertexHandle.Index);
                return std::unexpected(buffer.error());
            }
            out.VertexBuffers.push_back(&(*buffer)->GetGpu());
            vertices.Add((*buffer)->GetElementCount());
        }

        for (BufferHandle instanceHandle : bindings.InstanceBuffers)
        {
            auto buffer = store.GetBuffers().Get(instanceHandle);
            if (!buffer)
            {
                Core::Log::Error("Render(): pipeline '{}' instance buffer {} is not registered",
                                 pipeline.GetLabel(), instanceHandle.Index);
                return std::unexpected(buffer.error());
            }
            out.VertexBuffers.push_back(&(*buffer)->GetGpu());
            instances.Add((*buffer)->GetElementCount());
        }

        uint64_t count = 0;
        uint64_t instanceCount = 1;

        if (bindings.IndexBuffer)
        {
            if (!vertices.Consistent || !instances.Consistent)
            {
                Core::Log::Error("Render(): pipeline '{}' attaches vertex/instance buffers with different element counts",
                                 pipeline.GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidState);
            }

            auto buffer = store.GetBuffers().Get(*bindings.IndexBuffer);
            if (!buffer)
            {
                Core::Log::Error("Render(): pipeline '{}' index buffer {} is not registered",
                                 pipeline.GetLabel(), bindings.IndexBuffer->Index);
                return std::unexpected(buffer.error());
            }

            const auto format = (*buffer)->GetIndexFormat();
            if (!format)
            {
                Core::Log::Error("Render(): pipeline '{}' index buffer '{}' has {}-byte elements",
                                 pipeline.GetLabel(), (*buffer)->GetLabel(), (*buffer)->GetElementSize());
                return std::unexpected(Core::ErrorCode::InvalidFormat);
            }

            out.IndexBuffer = &(*buffer)->GetGpu();
            out.IndexFormat = *format;
            count = (*buffer)->GetElementCount();
            instanceCount = instances.Min.value_or(1);
        }
        else
        {
            out.IndexBuffer = nullptr;
            count = vertices.Min.value_or(1);
        }

        if (count > MaxDrawCount || instanceCount > MaxDrawCount)
        {
            Core::Log::Error("Render(): pipeline '{}' draw count {} x {} exceeds 32 bits",
                             pipeline.GetLabel(), count, instanceCount);
            return std::unexpected(Core::ErrorCode::OutOfRange);
        }

        out.Count = static_cast<uint32_t>(count);
        out.Instances = static_cast<uint32_t>(instanceCount);
        return Core::Ok();
    }

    Core::Result FrameExecutor::PlanComputePass(const ResourceStore& store, ComputePassHandle handle,
                                                PlannedComputePass& out)
    {
        auto found = store.GetComputePasses().Get(handle);
        if (!found)
        {
            Core::Log::Error("Render(): compute pass handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        const ComputePass& pass = **found;
        out.Label = pass.GetLabel();

        const auto& pipelines = pass.GetPipelines();
        out.Dispatches.resize(pipelines.size());
        for (size_t i = 0; i < pipelines.size(); ++i)
        {
            auto pipeline = store.GetComputePipelines().Get(pipelines[i]);
            if (!pipeline)
            {
                Core::Log::Error("Render(): compute pipeline handle {} is not registered", pipelines[i].Index);
                return std::unexpected(pipeline.error());
            }

            PlannedDispatch& dispatch = out.Dispatches[i];
            dispatch.Pipeline = &(*pipeline)->GetGpu();
            dispatch.BindGroups.clear();

            const auto& groups = (*pipeline)->GetBindGroups();
            for (uint32_t slot = 0; slot < groups.size(); ++slot)
            {
                auto group = store.GetBindGroups().Get(groups[slot]);
                if (!group)
                {
                    Core::Log::Error("Render(): compute pipeline '{}' bind group {} is not registered",
                                     (*pipeline)->GetLabel(), groups[slot].Index);
                    return std::unexpected(group.error());
                }
                if ((*group)->IsStale())
                {
                    Core::Log::Error("Render(): compute pipeline '{}' bind group '{}' is stale after a failed rebuild",
                                     (*pipeline)->GetLabel(), (*group)->GetLabel());
                    return std::unexpected(Core::ErrorCode::InvalidState);
                }
                dispatch.BindGroups.push_back({slot, (*group)->GetInstance()});
            }

            const auto& workGroups = (*pipeline)->GetWorkGroups();
            dispatch.X = workGroups[0];
            dispatch.Y = workGroups[1];
            dispatch.Z = workGroups[2];
        }

        return Core::Ok();
    }

    void FrameExecutor::Record(RHI::ICommandRecorder& recorder, const RHI::ITextureView& surfaceView)
    {
        for (uint32_t i = 0; i < m_Plan.PassCount; ++i)
        {
            std::visit([&](const auto& pass)
            {
                using P = std::decay_t<decltype(pass)>;

                if constexpr (std::is_same_v<P, PlannedRenderPass>)
                {
                    m_ColorScratch.clear();
                    for (const PlannedColorAttachment& color : pass.Colors)
                    {
                        m_ColorScratch.push_back({
                            .View = color.View ? color.View : &surfaceView,
                            .Load = color.Load,
                            .Clear = color.Clear,
                            .Store = color.Store,
                        });
                    }

                    recorder.BeginRenderPass({
                        .ColorAttachments = m_ColorScratch,
                        .DepthStencil = pass.DepthStencil,
                        .Label = pass.Label,
                    });

                    for (const PlannedDraw& draw : pass.Draws)
                    {
                        recorder.SetRenderPipeline(*draw.Pipeline);
                        for (const PlannedBindGroup& group : draw.BindGroups)
                            recorder.SetBindGroup(group.Slot, *group.Group);
                        for (uint32_t slot = 0; slot < draw.VertexBuffers.size(); ++slot)
                            recorder.SetVertexBuffer(slot, *draw.VertexBuffers[slot]);

                        if (draw.IndexBuffer)
                        {
                            recorder.SetIndexBuffer(*draw.IndexBuffer, draw.IndexFormat);
                            recorder.DrawIndexed(draw.Count, draw.Instances);
                        }
                        else
                        {
                            recorder.Draw(draw.Count, draw.Instances);
                        }
                    }

                    recorder.EndRenderPass();
                }
                else
                {
                    recorder.BeginComputePass(pass.Label);
                    for (const PlannedDispatch& dispatch : pass.Dispatches)
                    {
                        recorder.SetComputePipeline(*dispatch.Pipeline);
                        for (const PlannedBindGroup& group : dispatch.BindGroups)
                            recorder.SetBindGroup(group.Slot, *group.Group);
                        recorder.Dispatch(dispatch.X, dispatch.Y, dispatch.Z);
                    }
                    recorder.EndComputePass();
                }
            }, m_Plan.Passes[i]);
        }
    }

    Core::Expected<FrameStatus> FrameExecutor::HandleSurfaceError(ResourceStore& store, RHI::SurfaceError error)
    {
        switch (error)
        {
        case RHI::SurfaceError::Lost:
        case RHI::SurfaceError::OutOfMemory:
        {
            const RHI::Extent2D extent = store.GetSurfaceExtent();
            Core::Log::Warn("Render(): surface {}, reconfiguring at {}x{}",
                            RHI::SurfaceErrorToString(error), extent.Width, extent.Height);
            if (auto configured = store.GetDevice().ConfigureSurface(extent); !configured)
            {
                Core::Log::Error("Render(): surface reconfiguration failed ({})",
                                 Core::ErrorCodeToString(configured.error()));
                return std::unexpected(configured.error());
            }
            return FrameStatus::Reconfigured;
        }
        case RHI::SurfaceError::Timeout:
            Core::Log::Warn("Render(): surface acquire timed out, frame skipped");
            return FrameStatus::Skipped;
        case RHI::SurfaceError::Outdated:
            break;
        }

        Core::Log::Error("Render(): surface is outdated and cannot be reconfigured");
        return std::unexpected(Core::ErrorCode::DeviceLost);
    }
}
