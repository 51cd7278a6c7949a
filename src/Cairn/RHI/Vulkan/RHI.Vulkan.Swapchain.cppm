module;
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Swapchain;

import RHI;
import :Device;
import :Image;

export namespace RHI
{
    // Presentable images of the window surface. Each image is exposed as a
    // VulkanTextureView so passes can target the surface like any texture.
    class VulkanSwapchain
    {
    public:
        // Every image view gets a fresh id from idSource, also on Recreate.
        VulkanSwapchain(VulkanDevice& device, PresentMode preferredMode, Extent2D extent,
                        std::function<uint64_t()> idSource);
        ~VulkanSwapchain();

        VulkanSwapchain(const VulkanSwapchain&) = delete;
        VulkanSwapchain& operator=(const VulkanSwapchain&) = delete;

        // Caller waits for the device to be idle first.
        [[nodiscard]] bool Recreate(Extent2D extent);

        [[nodiscard]] bool IsValid() const { return m_Swapchain != VK_NULL_HANDLE && !m_Images.empty(); }
        [[nodiscard]] VkSwapchainKHR GetHandle() const { return m_Swapchain; }
        [[nodiscard]] VkFormat GetImageFormat() const { return m_Format.format; }
        [[nodiscard]] Extent2D GetExtent() const { return {m_Extent.width, m_Extent.height}; }

        [[nodiscard]] const VulkanTextureView& GetView(uint32_t imageIndex) const { return *m_Images[imageIndex].Target; }

    private:
        struct PresentImage
        {
            VkImage Image = VK_NULL_HANDLE;
            VkImageView View = VK_NULL_HANDLE;
            std::unique_ptr<VulkanTextureView> Target;
        };

        [[nodiscard]] bool Build(Extent2D requested);
        [[nodiscard]] bool WrapImages();
        void ReleaseImages();

        VulkanDevice& m_Device;
        PresentMode m_PreferredMode;
        std::function<uint64_t()> m_IdSource;

        VkSwapchainKHR m_Swapchain = VK_NULL_HANDLE;
        VkSurfaceFormatKHR m_Format{};
        VkExtent2D m_Extent{};
        std::vector<PresentImage> m_Images;
    };
}
