module;
#include <cstdint>
#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Recorder;

import RHI;

export namespace RHI
{
    // Records straight into the frame's primary command buffer. Passes are
    // separated by full memory barriers; textures never leave GENERAL layout.
    // The swapchain image is moved to COLOR_ATTACHMENT_OPTIMAL on first use.
    class VulkanCommandRecorder final : public ICommandRecorder
    {
    public:
        VulkanCommandRecorder() = default;

        void Begin(VkCommandBuffer cmd);
        void End();

        [[nodiscard]] VkCommandBuffer GetCommandBuffer() const { return m_Cmd; }
        [[nodiscard]] bool IsRecording() const { return m_Cmd != VK_NULL_HANDLE; }
        [[nodiscard]] bool IsSwapchainImageInitialized() const { return m_SwapchainImageInitialized; }

        void BeginRenderPass(const RenderPassDesc& desc) override;
        void EndRenderPass() override;
        void BeginComputePass(std::string_view label) override;
        void EndComputePass() override;

        void SetRenderPipeline(const IRenderPipeline& pipeline) override;
        void SetComputePipeline(const IComputePipeline& pipeline) override;
        void SetBindGroup(uint32_t slot, const IBindGroup& group) override;
        void SetVertexBuffer(uint32_t slot, const IBuffer& buffer) override;
        void SetIndexBuffer(const IBuffer& buffer, IndexFormat format) override;

        void Draw(uint32_t vertexCount, uint32_t instanceCount) override;
        void DrawIndexed(uint32_t indexCount, uint32_t instanceCount) override;
        void Dispatch(uint32_t x, uint32_t y, uint32_t z) override;

    private:
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;
        VkPipelineLayout m_CurrentLayout = VK_NULL_HANDLE;
        VkPipelineBindPoint m_CurrentBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        bool m_InRenderPass = false;
        bool m_SwapchainImageInitialized = false;
    };
}
