module;
#include <cstdint>
#include <optional>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Image;

import RHI;
import :Device;

export namespace RHI
{
    // Non-owning description of an image view. Texture views and swapchain
    // views are both handed to the recorder through this type.
    class VulkanTextureView final : public ITextureView
    {
    public:
        VulkanTextureView(uint64_t id, TextureFormat format, VkImage image, VkImageView view,
                          Extent3D extent, bool isSwapchainImage)
            : m_Id(id), m_Format(format), m_Image(image), m_View(view), m_Extent(extent),
              m_IsSwapchainImage(isSwapchainImage)
        {
        }

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] TextureFormat GetFormat() const override { return m_Format; }

        [[nodiscard]] VkImage GetImage() const { return m_Image; }
        [[nodiscard]] VkImageView GetHandle() const { return m_View; }
        [[nodiscard]] Extent3D GetExtent() const { return m_Extent; }
        [[nodiscard]] bool IsSwapchainImage() const { return m_IsSwapchainImage; }

    private:
        uint64_t m_Id;
        TextureFormat m_Format;
        VkImage m_Image;
        VkImageView m_View;
        Extent3D m_Extent;
        bool m_IsSwapchainImage;
    };

    // Device-local image plus one view over all of its mips. Lives in
    // VK_IMAGE_LAYOUT_GENERAL from creation on.
    class VulkanTexture final : public ITexture
    {
    public:
        VulkanTexture(VulkanDevice& device, uint64_t id, uint64_t viewId, const TextureDesc& desc);
        ~VulkanTexture() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] const TextureDesc& GetDesc() const override { return m_Desc; }
        [[nodiscard]] const ITextureView& GetView() const override { return *m_ViewInfo; }

        [[nodiscard]] VkImage GetImage() const { return m_Image; }
        [[nodiscard]] VkImageView GetImageView() const { return m_ImageView; }
        [[nodiscard]] bool IsValid() const { return m_Image != VK_NULL_HANDLE && m_ImageView != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        TextureDesc m_Desc;

        VkImage m_Image = VK_NULL_HANDLE;
        VkImageView m_ImageView = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        // Engaged once the image and its view exist.
        std::optional<VulkanTextureView> m_ViewInfo;
    };
}
