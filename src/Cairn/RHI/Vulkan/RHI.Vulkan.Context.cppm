module;
#include <string>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Context;

import Core;

export namespace RHI
{
    struct InstanceConfig
    {
        std::string AppName = "Cairn App";
        bool EnableValidation = true;
        // Platform surface extensions, as reported by the window system.
        std::vector<const char*> SurfaceExtensions;
    };

    // Owns the VkInstance and the validation messenger. Loads volk.
    class VulkanContext
    {
    public:
        explicit VulkanContext(const InstanceConfig& config);
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValid() const { return m_Instance != VK_NULL_HANDLE; }

    private:
        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;

        [[nodiscard]] bool CreateInstance(const InstanceConfig& config);
        void SetupDebugMessenger();
    };
}
