module;
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Context.Impl;
import :Context;
import Core;

namespace RHI
{
    namespace
    {
        const std::vector<const char*> VALIDATION_LAYERS = {
            "VK_LAYER_KHRONOS_validation"
        };

        VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            [[maybe_unused]] VkDebugUtilsMessageTypeFlagsEXT type,
            const VkDebugUtilsMessengerCallbackDataEXT* callbackData,
            [[maybe_unused]] void* userData)
        {
            if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
                Core::Log::Error("[Vulkan Validation]: {}", callbackData->pMessage);
            else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
                Core::Log::Warn("[Vulkan Validation]: {}", callbackData->pMessage);
            return VK_FALSE;
        }

        VkDebugUtilsMessengerCreateInfoEXT MakeMessengerInfo()
        {
            VkDebugUtilsMessengerCreateInfoEXT info{};
            info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                   VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                               VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                               VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
            info.pfnUserCallback = DebugCallback;
            return info;
        }
    }

    VulkanContext::VulkanContext(const InstanceConfig& config)
    {
        if (volkInitialize() != VK_SUCCESS)
        {
            Core::Log::Error("Failed to initialize Volk! Is a Vulkan loader installed?");
            return;
        }

        if (!CreateInstance(config))
            return;

        volkLoadInstance(m_Instance);

        if (config.EnableValidation)
            SetupDebugMessenger();

        Core::Log::Info("Vulkan instance initialized.");
    }

    VulkanContext::~VulkanContext()
    {
        if (m_DebugMessenger != VK_NULL_HANDLE)
            vkDestroyDebugUtilsMessengerEXT(m_Instance, m_DebugMessenger, nullptr);
        if (m_Instance != VK_NULL_HANDLE)
            vkDestroyInstance(m_Instance, nullptr);
    }

    bool VulkanContext::CreateInstance(const InstanceConfig& config)
    {
        VkApplicationInfo appInfo{};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = config.AppName.c_str();
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "Cairn";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_3;

        if (config.SurfaceExtensions.empty())
        {
            Core::Log::Error("No Vulkan surface extensions available for this window system.");
            return false;
        }

        std::vector<const char*> extensions = config.SurfaceExtensions;
        if (config.EnableValidation)
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

        VkInstanceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;
        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();

        // Also covers vkCreateInstance itself.
        VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo = MakeMessengerInfo();
        if (config.EnableValidation)
        {
            createInfo.enabledLayerCount = static_cast<uint32_t>(VALIDATION_LAYERS.size());
            createInfo.ppEnabledLayerNames = VALIDATION_LAYERS.data();
            createInfo.pNext = &debugCreateInfo;
        }

        const VkResult result = vkCreateInstance(&createInfo, nullptr, &m_Instance);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create Vulkan instance! Error code: {}", static_cast<int>(result));
            m_Instance = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    void VulkanContext::SetupDebugMessenger()
    {
        const VkDebugUtilsMessengerCreateInfoEXT createInfo = MakeMessengerInfo();
        if (vkCreateDebugUtilsMessengerEXT(m_Instance, &createInfo, nullptr, &m_DebugMessenger) != VK_SUCCESS)
            Core::Log::Error("Failed to set up debug messenger!");
    }
}
