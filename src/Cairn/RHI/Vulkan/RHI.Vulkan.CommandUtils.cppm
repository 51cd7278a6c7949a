module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:CommandUtils;

import :Device;
import Core;

export namespace RHI::CommandUtils
{
    // Command buffer and fence of one blocking submission, released on scope
    // exit whichever step failed.
    class OneShotSubmission
    {
    public:
        explicit OneShotSubmission(VulkanDevice& device) : m_Device(device) {}
        ~OneShotSubmission()
        {
            if (m_Fence) vkDestroyFence(m_Device.GetLogicalDevice(), m_Fence, nullptr);
            if (m_Cmd) vkFreeCommandBuffers(m_Device.GetLogicalDevice(), m_Device.GetTransferPool(), 1, &m_Cmd);
        }

        OneShotSubmission(const OneShotSubmission&) = delete;
        OneShotSubmission& operator=(const OneShotSubmission&) = delete;

        [[nodiscard]] VkResult Begin()
        {
            VkCommandBufferAllocateInfo allocInfo{};
            allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            allocInfo.commandPool = m_Device.GetTransferPool();
            allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            allocInfo.commandBufferCount = 1;
            if (VkResult r = vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, &m_Cmd); r != VK_SUCCESS)
            {
                m_Cmd = VK_NULL_HANDLE;
                return r;
            }

            VkCommandBufferBeginInfo beginInfo{};
            beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
            beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
            return vkBeginCommandBuffer(m_Cmd, &beginInfo);
        }

        [[nodiscard]] VkCommandBuffer Cmd() const { return m_Cmd; }

        [[nodiscard]] VkResult SubmitAndWait()
        {
            if (VkResult r = vkEndCommandBuffer(m_Cmd); r != VK_SUCCESS) return r;

            VkFenceCreateInfo fenceInfo{};
            fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            if (VkResult r = vkCreateFence(m_Device.GetLogicalDevice(), &fenceInfo, nullptr, &m_Fence); r != VK_SUCCESS)
            {
                m_Fence = VK_NULL_HANDLE;
                return r;
            }

            VkSubmitInfo submitInfo{};
            submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            submitInfo.commandBufferCount = 1;
            submitInfo.pCommandBuffers = &m_Cmd;
            if (VkResult r = m_Device.Submit(submitInfo, m_Fence); r != VK_SUCCESS) return r;

            return vkWaitForFences(m_Device.GetLogicalDevice(), 1, &m_Fence, VK_TRUE, UINT64_MAX);
        }

    private:
        VulkanDevice& m_Device;
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;
        VkFence m_Fence = VK_NULL_HANDLE;
    };

    // Records `function` and blocks until the GPU has run it. Queue order
    // puts it after every frame submitted before it.
    [[nodiscard]] VkResult ExecuteImmediate(VulkanDevice& device, auto&& function)
    {
        OneShotSubmission submission(device);
        VkResult result = submission.Begin();
        if (result == VK_SUCCESS)
        {
            function(submission.Cmd());
            result = submission.SubmitAndWait();
        }
        if (result != VK_SUCCESS)
            Core::Log::Error("ExecuteImmediate failed ({})", static_cast<int>(result));
        return result;
    }

    void TransitionImageLayout(VkCommandBuffer cmd, VkImage image, VkImageAspectFlags aspect,
                               VkImageLayout oldLayout, VkImageLayout newLayout)
    {
        VkImageMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
        barrier.oldLayout = oldLayout;
        barrier.newLayout = newLayout;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.image = image;
        barrier.subresourceRange.aspectMask = aspect;
        barrier.subresourceRange.baseMipLevel = 0;
        barrier.subresourceRange.levelCount = VK_REMAINING_MIP_LEVELS;
        barrier.subresourceRange.baseArrayLayer = 0;
        barrier.subresourceRange.layerCount = 1;

        barrier.srcStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.srcAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT | VK_ACCESS_2_MEMORY_READ_BIT;
        barrier.dstStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.dstAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT | VK_ACCESS_2_MEMORY_READ_BIT;

        if (oldLayout == VK_IMAGE_LAYOUT_UNDEFINED)
        {
            barrier.srcStageMask = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
            barrier.srcAccessMask = 0;
        }

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.imageMemoryBarrierCount = 1;
        depInfo.pImageMemoryBarriers = &barrier;

        vkCmdPipelineBarrier2(cmd, &depInfo);
    }

    // Full read/write hazard barrier. Textures live in GENERAL layout, so
    // separating passes needs no layout transitions.
    void FullMemoryBarrier(VkCommandBuffer cmd)
    {
        VkMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        barrier.srcStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.srcAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT;
        barrier.dstStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.dstAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT | VK_ACCESS_2_MEMORY_READ_BIT;

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.memoryBarrierCount = 1;
        depInfo.pMemoryBarriers = &barrier;

        vkCmdPipelineBarrier2(cmd, &depInfo);
    }
}
