module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Sampler;

import RHI;
import :Device;

export namespace RHI
{
    class VulkanSampler final : public ISampler
    {
    public:
        VulkanSampler(VulkanDevice& device, uint64_t id, const SamplerDesc& desc);
        ~VulkanSampler() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] VkSampler GetHandle() const { return m_Sampler; }
        [[nodiscard]] bool IsValid() const { return m_Sampler != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        VkSampler m_Sampler = VK_NULL_HANDLE;
    };
}
