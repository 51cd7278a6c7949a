module;
#include <cstdint>
#include <memory>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Pipeline;

import Core;
import RHI;
import :Device;

export namespace RHI
{
    class VulkanRenderPipeline final : public IRenderPipeline
    {
    public:
        VulkanRenderPipeline(VulkanDevice& device, uint64_t id, VkPipeline pipeline, VkPipelineLayout layout)
            : m_Device(device), m_Id(id), m_Pipeline(pipeline), m_Layout(layout)
        {
        }

        ~VulkanRenderPipeline() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }

        // Dynamic rendering, dynamic viewport and scissor. Vertex input, raster
        // and depth state are baked from the desc.
        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanRenderPipeline>> Create(
            VulkanDevice& device, uint64_t id, const RenderPipelineDesc& desc);

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
    };

    class VulkanComputePipeline final : public IComputePipeline
    {
    public:
        VulkanComputePipeline(VulkanDevice& device, uint64_t id, VkPipeline pipeline, VkPipelineLayout layout)
            : m_Device(device), m_Id(id), m_Pipeline(pipeline), m_Layout(layout)
        {
        }

        ~VulkanComputePipeline() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanComputePipeline>> Create(
            VulkanDevice& device, uint64_t id, const ComputePipelineDesc& desc);

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
    };
}
