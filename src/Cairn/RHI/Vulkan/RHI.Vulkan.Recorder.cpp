module;
#include <cstdint>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Recorder.Impl;
import :Recorder;
import :Buffer;
import :CommandUtils;
import :Convert;
import :Descriptors;
import :Image;
import :Pipeline;
import Core;

namespace RHI
{
    namespace
    {
        VkClearColorValue ToVkClearColor(const ClearColor& color, TextureFormat format)
        {
            VkClearColorValue value{};
            if (format == TextureFormat::R32Uint)
            {
                value.uint32[0] = static_cast<uint32_t>(color.R);
                value.uint32[1] = static_cast<uint32_t>(color.G);
                value.uint32[2] = static_cast<uint32_t>(color.B);
                value.uint32[3] = static_cast<uint32_t>(color.A);
            }
            else if (format == TextureFormat::R32Sint)
            {
                value.int32[0] = static_cast<int32_t>(color.R);
                value.int32[1] = static_cast<int32_t>(color.G);
                value.int32[2] = static_cast<int32_t>(color.B);
                value.int32[3] = static_cast<int32_t>(color.A);
            }
            else
            {
                value.float32[0] = static_cast<float>(color.R);
                value.float32[1] = static_cast<float>(color.G);
                value.float32[2] = static_cast<float>(color.B);
                value.float32[3] = static_cast<float>(color.A);
            }
            return value;
        }
    }

    void VulkanCommandRecorder::Begin(VkCommandBuffer cmd)
    {
        m_Cmd = cmd;
        m_CurrentLayout = VK_NULL_HANDLE;
        m_CurrentBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        m_InRenderPass = false;
        m_SwapchainImageInitialized = false;
    }

    void VulkanCommandRecorder::End()
    {
        m_Cmd = VK_NULL_HANDLE;
        m_CurrentLayout = VK_NULL_HANDLE;
    }

    void VulkanCommandRecorder::BeginRenderPass(const RenderPassDesc& desc)
    {
        CommandUtils::FullMemoryBarrier(m_Cmd);

        Extent3D extent{0, 0, 1};
        std::vector<VkRenderingAttachmentInfo> colorAttachments;
        colorAttachments.reserve(desc.ColorAttachments.size());

        for (const ColorAttachment& color : desc.ColorAttachments)
        {
            const auto* view = static_cast<const VulkanTextureView*>(color.View);
            VkImageLayout layout = VK_IMAGE_LAYOUT_GENERAL;

            if (view->IsSwapchainImage())
            {
                if (!m_SwapchainImageInitialized)
                {
                    CommandUtils::TransitionImageLayout(m_Cmd, view->GetImage(), VK_IMAGE_ASPECT_COLOR_BIT,
                                                        VK_IMAGE_LAYOUT_UNDEFINED,
                                                        VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
                    m_SwapchainImageInitialized = true;
                }
                layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
            }

            VkRenderingAttachmentInfo attachment{};
            attachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
            attachment.imageView = view->GetHandle();
            attachment.imageLayout = layout;
            attachment.loadOp = color.Load == LoadOp::Clear ? VK_ATTACHMENT_LOAD_OP_CLEAR : VK_ATTACHMENT_LOAD_OP_LOAD;
            attachment.storeOp = color.Store ? VK_ATTACHMENT_STORE_OP_STORE : VK_ATTACHMENT_STORE_OP_DONT_CARE;
            attachment.clearValue.color = ToVkClearColor(color.Clear, view->GetFormat());
            colorAttachments.push_back(attachment);

            if (extent.Width == 0) extent = view->GetExtent();
        }

        VkRenderingAttachmentInfo depthAttachment{};
        VkRenderingAttachmentInfo stencilAttachment{};
        bool hasDepth = false;
        bool hasStencil = false;

        if (desc.DepthStencil && desc.DepthStencil->View)
        {
            const auto* view = static_cast<const VulkanTextureView*>(desc.DepthStencil->View);
            const DepthOps depthOps = desc.DepthStencil->Depth.value_or(DepthOps{});

            depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
            depthAttachment.imageView = view->GetHandle();
            depthAttachment.imageLayout = VK_IMAGE_LAYOUT_GENERAL;
            depthAttachment.loadOp = depthOps.Clear ? VK_ATTACHMENT_LOAD_OP_CLEAR : VK_ATTACHMENT_LOAD_OP_LOAD;
            depthAttachment.storeOp = depthOps.Store ? VK_ATTACHMENT_STORE_OP_STORE : VK_ATTACHMENT_STORE_OP_DONT_CARE;
            depthAttachment.clearValue.depthStencil.depth = depthOps.Clear.value_or(1.0f);
            hasDepth = true;

            if (HasStencil(view->GetFormat()))
            {
                const StencilOps stencilOps = desc.DepthStencil->Stencil.value_or(StencilOps{});
                stencilAttachment = depthAttachment;
                stencilAttachment.loadOp = stencilOps.Clear ? VK_ATTACHMENT_LOAD_OP_CLEAR : VK_ATTACHMENT_LOAD_OP_LOAD;
                stencilAttachment.storeOp = stencilOps.Store ? VK_ATTACHMENT_STORE_OP_STORE
                                                             : VK_ATTACHMENT_STORE_OP_DONT_CARE;
                stencilAttachment.clearValue.depthStencil.stencil = stencilOps.Clear.value_or(0u);
                hasStencil = true;
            }

            if (extent.Width == 0) extent = view->GetExtent();
        }

        VkRenderingInfo renderInfo{};
        renderInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
        renderInfo.renderArea = {{0, 0}, {extent.Width, extent.Height}};
        renderInfo.layerCount = 1;
        renderInfo.colorAttachmentCount = static_cast<uint32_t>(colorAttachments.size());
        renderInfo.pColorAttachments = colorAttachments.data();
        renderInfo.pDepthAttachment = hasDepth ? &depthAttachment : nullptr;
        renderInfo.pStencilAttachment = hasStencil ? &stencilAttachment : nullptr;

        vkCmdBeginRendering(m_Cmd, &renderInfo);
        m_InRenderPass = true;

        VkViewport viewport{};
        viewport.x = 0.0f;
        viewport.y = 0.0f;
        viewport.width = static_cast<float>(extent.Width);
        viewport.height = static_cast<float>(extent.Height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;

        VkRect2D scissor{};
        scissor.offset = {0, 0};
        scissor.extent = {extent.Width, extent.Height};

        vkCmdSetViewport(m_Cmd, 0, 1, &viewport);
        vkCmdSetScissor(m_Cmd, 0, 1, &scissor);
    }

    void VulkanCommandRecorder::EndRenderPass()
    {
        if (!m_InRenderPass) return;
        vkCmdEndRendering(m_Cmd);
        m_InRenderPass = false;
    }

    void VulkanCommandRecorder::BeginComputePass(std::string_view label)
    {
        Core::Log::Debug("Compute pass '{}'", label);
        CommandUtils::FullMemoryBarrier(m_Cmd);
    }

    void VulkanCommandRecorder::EndComputePass()
    {
    }

    void VulkanCommandRecorder::SetRenderPipeline(const IRenderPipeline& pipeline)
    {
        const auto& vkPipeline = static_cast<const VulkanRenderPipeline&>(pipeline);
        vkCmdBindPipeline(m_Cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, vkPipeline.GetHandle());
        m_CurrentLayout = vkPipeline.GetLayout();
        m_CurrentBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    }

    void VulkanCommandRecorder::SetComputePipeline(const IComputePipeline& pipeline)
    {
        const auto& vkPipeline = static_cast<const VulkanComputePipeline&>(pipeline);
        vkCmdBindPipeline(m_Cmd, VK_PIPELINE_BIND_POINT_COMPUTE, vkPipeline.GetHandle());
        m_CurrentLayout = vkPipeline.GetLayout();
        m_CurrentBindPoint = VK_PIPELINE_BIND_POINT_COMPUTE;
    }

    void VulkanCommandRecorder::SetBindGroup(uint32_t slot, const IBindGroup& group)
    {
        if (!m_CurrentLayout)
        {
            Core::Log::Error("SetBindGroup({}) without a bound pipeline", slot);
            return;
        }

        VkDescriptorSet set = static_cast<const VulkanBindGroup&>(group).GetHandle();
        vkCmdBindDescriptorSets(m_Cmd, m_CurrentBindPoint, m_CurrentLayout, slot, 1, &set, 0, nullptr);
    }

    void VulkanCommandRecorder::SetVertexBuffer(uint32_t slot, const IBuffer& buffer)
    {
        VkBuffer handle = static_cast<const VulkanBuffer&>(buffer).GetHandle();
        VkDeviceSize offset = 0;
        vkCmdBindVertexBuffers(m_Cmd, slot, 1, &handle, &offset);
    }

    void VulkanCommandRecorder::SetIndexBuffer(const IBuffer& buffer, IndexFormat format)
    {
        vkCmdBindIndexBuffer(m_Cmd, static_cast<const VulkanBuffer&>(buffer).GetHandle(), 0,
                             Vk::ToVkIndexType(format));
    }

    void VulkanCommandRecorder::Draw(uint32_t vertexCount, uint32_t instanceCount)
    {
        vkCmdDraw(m_Cmd, vertexCount, instanceCount, 0, 0);
    }

    void VulkanCommandRecorder::DrawIndexed(uint32_t indexCount, uint32_t instanceCount)
    {
        vkCmdDrawIndexed(m_Cmd, indexCount, instanceCount, 0, 0, 0);
    }

    void VulkanCommandRecorder::Dispatch(uint32_t x, uint32_t y, uint32_t z)
    {
        vkCmdDispatch(m_Cmd, x, y, z);
    }
}
