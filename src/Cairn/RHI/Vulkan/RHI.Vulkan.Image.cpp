module;
#include <cstdint>
#include <optional>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Image.Impl;
import :Image;
import :Convert;
import Core;

namespace RHI
{
    VulkanTexture::VulkanTexture(VulkanDevice& device, uint64_t id, uint64_t viewId, const TextureDesc& desc)
        : m_Device(device), m_Id(id), m_Desc(desc)
    {
        m_Desc.Label = {};

        VkImageCreateInfo imageInfo{};
        imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        imageInfo.imageType = Vk::ToVkImageType(desc.Dimension);
        imageInfo.extent = {desc.Size.Width, desc.Size.Height, desc.Size.Depth};
        imageInfo.mipLevels = desc.MipLevels;
        imageInfo.arrayLayers = 1;
        imageInfo.format = Vk::ToVkFormat(desc.Format);
        imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        imageInfo.usage = Vk::ToVkImageUsage(desc.Usage, desc.Format);
        imageInfo.samples = Vk::ToVkSampleCount(desc.SampleCount);
        imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;

        VkResult result = vmaCreateImage(m_Device.GetAllocator(), &imageInfo, &allocInfo, &m_Image, &m_Allocation, nullptr);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("VulkanTexture: failed to create image ({})", static_cast<int>(result));
            m_Image = VK_NULL_HANDLE;
            m_Allocation = VK_NULL_HANDLE;
            return;
        }

        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = m_Image;
        viewInfo.viewType = Vk::ToVkImageViewType(desc.Dimension);
        viewInfo.format = imageInfo.format;
        viewInfo.subresourceRange.aspectMask = Vk::AspectOf(desc.Format);
        viewInfo.subresourceRange.baseMipLevel = 0;
        viewInfo.subresourceRange.levelCount = desc.MipLevels;
        viewInfo.subresourceRange.baseArrayLayer = 0;
        viewInfo.subresourceRange.layerCount = 1;

        result = vkCreateImageView(m_Device.GetLogicalDevice(), &viewInfo, nullptr, &m_ImageView);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("VulkanTexture: failed to create image view ({})", static_cast<int>(result));
            m_ImageView = VK_NULL_HANDLE;
            return;
        }

        m_ViewInfo.emplace(viewId, desc.Format, m_Image, m_ImageView, desc.Size, false);
    }

    VulkanTexture::~VulkanTexture()
    {
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VmaAllocator allocator = m_Device.GetAllocator();

        if (m_ImageView)
        {
            VkImageView view = m_ImageView;
            m_Device.DeferDestroy([logicalDevice, view]()
            {
                vkDestroyImageView(logicalDevice, view, nullptr);
            });
        }

        if (m_Image)
        {
            VkImage image = m_Image;
            VmaAllocation allocation = m_Allocation;
            m_Device.DeferDestroy([allocator, image, allocation]()
            {
                vmaDestroyImage(allocator, image, allocation);
            });
        }
    }
}
