module;
#include <cstdint>
#include <span>
#include <string>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Shader;

import RHI;
import :Device;

export namespace RHI
{
    class VulkanShaderModule final : public IShaderModule
    {
    public:
        VulkanShaderModule(VulkanDevice& device, uint64_t id, std::span<const uint32_t> spirv, ShaderStage stage);
        ~VulkanShaderModule() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] ShaderStage GetStage() const override { return m_Stage; }

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }

        // entryPoint must outlive the pipeline creation call.
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo(const std::string& entryPoint) const;

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        ShaderStage m_Stage;
        VkShaderModule m_Module = VK_NULL_HANDLE;
    };
}
