module;
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Device;

import :Context;

export namespace RHI
{
    struct QueueFamilies
    {
        std::optional<uint32_t> Graphics; // graphics + compute + transfer
        std::optional<uint32_t> Present;

        [[nodiscard]] bool IsComplete() const { return Graphics.has_value() && Present.has_value(); }
        [[nodiscard]] bool IsShared() const { return IsComplete() && *Graphics == *Present; }
    };

    struct SurfaceSupport
    {
        VkSurfaceCapabilitiesKHR Capabilities{};
        std::vector<VkSurfaceFormatKHR> Formats;
        std::vector<VkPresentModeKHR> PresentModes;
    };

    // Adapter + logical device, the queues the frame executor submits to,
    // the VMA allocator, and destruction deferred by frame slot.
    class VulkanDevice
    {
    public:
        static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

        VulkanDevice(VulkanContext& context, VkSurfaceKHR surface);
        ~VulkanDevice();

        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] const VkPhysicalDeviceLimits& GetLimits() const { return m_Properties.limits; }
        [[nodiscard]] bool SupportsSamplerAnisotropy() const { return m_SamplerAnisotropy; }
        [[nodiscard]] const QueueFamilies& GetQueueFamilies() const { return m_Queues; }
        [[nodiscard]] VkSurfaceKHR GetSurface() const { return m_Surface; }
        [[nodiscard]] VkCommandPool GetTransferPool() const { return m_TransferPool; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }

        [[nodiscard]] SurfaceSupport QuerySurfaceSupport() const;

        [[nodiscard]] VkResult Submit(const VkSubmitInfo& submitInfo, VkFence fence);
        [[nodiscard]] VkResult Present(const VkPresentInfoKHR& presentInfo);

        // A destroy deferred while slot N records runs the next time slot N
        // begins, once its fence has signalled.
        void DeferDestroy(std::function<void()>&& destroyFn);
        void BeginFrameSlot(uint32_t slot);
        void DrainDeferredDestroys();

    private:
        bool SelectAdapter(VkInstance instance);
        bool CreateLogicalDevice(VkInstance instance);
        bool CreateTransferPool();

        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkPhysicalDeviceProperties m_Properties{};
        VkDevice m_Device = VK_NULL_HANDLE;
        VkSurfaceKHR m_Surface = VK_NULL_HANDLE; // Owned by the backend.
        QueueFamilies m_Queues;

        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        VkQueue m_PresentQueue = VK_NULL_HANDLE;
        VmaAllocator m_Allocator = VK_NULL_HANDLE;
        VkCommandPool m_TransferPool = VK_NULL_HANDLE;
        bool m_SamplerAnisotropy = false;
        bool m_IsValid = false;

        std::array<std::vector<std::function<void()>>, MAX_FRAMES_IN_FLIGHT> m_Deferred;
        uint32_t m_Slot = 0;
    };
}
