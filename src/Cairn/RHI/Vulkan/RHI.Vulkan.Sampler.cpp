module;
#include <algorithm>
#include <cstdint>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Sampler.Impl;
import :Sampler;
import :Convert;
import Core;

namespace RHI
{
    VulkanSampler::VulkanSampler(VulkanDevice& device, uint64_t id, const SamplerDesc& desc)
        : m_Device(device), m_Id(id)
    {
        VkSamplerCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        info.magFilter = Vk::ToVkFilter(desc.MagFilter);
        info.minFilter = Vk::ToVkFilter(desc.MinFilter);
        info.mipmapMode = Vk::ToVkMipmapMode(desc.MipmapFilter);
        info.addressModeU = Vk::ToVkAddressMode(desc.AddressU);
        info.addressModeV = Vk::ToVkAddressMode(desc.AddressV);
        info.addressModeW = Vk::ToVkAddressMode(desc.AddressW);
        info.minLod = desc.LodMinClamp;
        info.maxLod = desc.LodMaxClamp;

        if (desc.AnisotropyClamp > 1 && m_Device.SupportsSamplerAnisotropy())
        {
            info.anisotropyEnable = VK_TRUE;
            info.maxAnisotropy = std::min(static_cast<float>(desc.AnisotropyClamp),
                                          m_Device.GetLimits().maxSamplerAnisotropy);
        }

        if (desc.Compare)
        {
            info.compareEnable = VK_TRUE;
            info.compareOp = Vk::ToVkCompareOp(*desc.Compare);
        }

        info.borderColor = Vk::ToVkBorderColor(desc.Border.value_or(BorderColor::TransparentBlack));

        if (vkCreateSampler(m_Device.GetLogicalDevice(), &info, nullptr, &m_Sampler) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create sampler '{}'!", desc.Label);
            m_Sampler = VK_NULL_HANDLE;
        }
    }

    VulkanSampler::~VulkanSampler()
    {
        if (!m_Sampler) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkSampler sampler = m_Sampler;
        m_Device.DeferDestroy([logicalDevice, sampler]()
        {
            vkDestroySampler(logicalDevice, sampler, nullptr);
        });
    }
}
