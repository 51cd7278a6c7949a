module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <utility>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Swapchain.Impl;
import :Swapchain;
import :Convert;
import Core;

namespace RHI
{
    namespace
    {
        // sRGB BGRA first, then any format TextureFormat can name.
        VkSurfaceFormatKHR PickSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats)
        {
            const auto preferred = std::ranges::find_if(formats, [](const VkSurfaceFormatKHR& f)
            {
                return f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
            });
            if (preferred != formats.end()) return *preferred;

            const auto known = std::ranges::find_if(formats, [](const VkSurfaceFormatKHR& f)
            {
                return Vk::FromVkFormat(f.format) != TextureFormat::Undefined;
            });
            return known != formats.end() ? *known : formats.front();
        }

        // FIFO is the only mode every implementation must offer.
        VkPresentModeKHR PickPresentMode(const std::vector<VkPresentModeKHR>& modes, PresentMode preferred)
        {
            const VkPresentModeKHR wanted = Vk::ToVkPresentMode(preferred);
            return std::ranges::find(modes, wanted) != modes.end() ? wanted : VK_PRESENT_MODE_FIFO_KHR;
        }

        VkExtent2D ResolveExtent(const VkSurfaceCapabilitiesKHR& caps, Extent2D requested)
        {
            if (caps.currentExtent.width != std::numeric_limits<uint32_t>::max())
                return caps.currentExtent;

            return {
                std::clamp(requested.Width, caps.minImageExtent.width, caps.maxImageExtent.width),
                std::clamp(requested.Height, caps.minImageExtent.height, caps.maxImageExtent.height),
            };
        }

        // One more than the minimum so acquire rarely waits on the driver.
        uint32_t PickImageCount(const VkSurfaceCapabilitiesKHR& caps)
        {
            const uint32_t count = caps.minImageCount + 1;
            return caps.maxImageCount > 0 ? std::min(count, caps.maxImageCount) : count;
        }
    }

    VulkanSwapchain::VulkanSwapchain(VulkanDevice& device, PresentMode preferredMode, Extent2D extent,
                                     std::function<uint64_t()> idSource)
        : m_Device(device), m_PreferredMode(preferredMode), m_IdSource(std::move(idSource))
    {
        if (!Build(extent))
            Core::Log::Error("Initial swapchain at {}x{} could not be created", extent.Width, extent.Height);
    }

    VulkanSwapchain::~VulkanSwapchain()
    {
        ReleaseImages();
        if (m_Swapchain) vkDestroySwapchainKHR(m_Device.GetLogicalDevice(), m_Swapchain, nullptr);
    }

    bool VulkanSwapchain::Recreate(Extent2D extent)
    {
        return Build(extent);
    }

    bool VulkanSwapchain::Build(Extent2D requested)
    {
        ReleaseImages();

        const SurfaceSupport support = m_Device.QuerySurfaceSupport();
        if (support.Formats.empty() || support.PresentModes.empty())
        {
            Core::Log::Error("Surface reports no formats or present modes");
            return false;
        }

        const VkSurfaceFormatKHR format = PickSurfaceFormat(support.Formats);
        const VkExtent2D extent = ResolveExtent(support.Capabilities, requested);
        const QueueFamilies& families = m_Device.GetQueueFamilies();
        const std::array<uint32_t, 2> familyIndices = {*families.Graphics, *families.Present};

        VkSwapchainCreateInfoKHR createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        createInfo.surface = m_Device.GetSurface();
        createInfo.minImageCount = PickImageCount(support.Capabilities);
        createInfo.imageFormat = format.format;
        createInfo.imageColorSpace = format.colorSpace;
        createInfo.imageExtent = extent;
        createInfo.imageArrayLayers = 1;
        createInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        createInfo.imageSharingMode = families.IsShared() ? VK_SHARING_MODE_EXCLUSIVE : VK_SHARING_MODE_CONCURRENT;
        if (!families.IsShared())
        {
            createInfo.queueFamilyIndexCount = static_cast<uint32_t>(familyIndices.size());
            createInfo.pQueueFamilyIndices = familyIndices.data();
        }
        createInfo.preTransform = support.Capabilities.currentTransform;
        createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        createInfo.presentMode = PickPresentMode(support.PresentModes, m_PreferredMode);
        createInfo.clipped = VK_TRUE;
        createInfo.oldSwapchain = m_Swapchain;

        // The retired handle is destroyed whether or not its successor exists.
        VkSwapchainKHR created = VK_NULL_HANDLE;
        const VkResult result = vkCreateSwapchainKHR(m_Device.GetLogicalDevice(), &createInfo, nullptr, &created);
        if (m_Swapchain) vkDestroySwapchainKHR(m_Device.GetLogicalDevice(), m_Swapchain, nullptr);
        m_Swapchain = result == VK_SUCCESS ? created : VK_NULL_HANDLE;
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("vkCreateSwapchainKHR failed ({})", static_cast<int>(result));
            return false;
        }

        m_Format = format;
        m_Extent = extent;
        if (!WrapImages()) return false;

        Core::Log::Info("Swapchain ready: {}x{}, {} images", extent.width, extent.height, m_Images.size());
        return true;
    }

    bool VulkanSwapchain::WrapImages()
    {
        uint32_t count = 0;
        VK_CHECK(vkGetSwapchainImagesKHR(m_Device.GetLogicalDevice(), m_Swapchain, &count, nullptr));
        std::vector<VkImage> images(count);
        VK_CHECK(vkGetSwapchainImagesKHR(m_Device.GetLogicalDevice(), m_Swapchain, &count, images.data()));

        const TextureFormat format = Vk::FromVkFormat(m_Format.format);
        const Extent3D extent{m_Extent.width, m_Extent.height, 1};

        m_Images.reserve(images.size());
        for (VkImage image : images)
        {
            VkImageViewCreateInfo viewInfo{};
            viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            viewInfo.image = image;
            viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
            viewInfo.format = m_Format.format;
            viewInfo.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

            PresentImage entry{.Image = image};
            if (vkCreateImageView(m_Device.GetLogicalDevice(), &viewInfo, nullptr, &entry.View) != VK_SUCCESS)
            {
                Core::Log::Error("Swapchain image view creation failed");
                ReleaseImages();
                return false;
            }
            entry.Target = std::make_unique<VulkanTextureView>(m_IdSource(), format, image, entry.View, extent, true);
            m_Images.push_back(std::move(entry));
        }
        return true;
    }

    void VulkanSwapchain::ReleaseImages()
    {
        for (const PresentImage& entry : m_Images)
            vkDestroyImageView(m_Device.GetLogicalDevice(), entry.View, nullptr);
        m_Images.clear();
    }
}
