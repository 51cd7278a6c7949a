module;
#include <algorithm>
#include <array>
#include <cstring>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Device.Impl;
import :Device;
import Core;

namespace RHI
{
    namespace
    {
        constexpr std::array<const char*, 1> REQUIRED_DEVICE_EXTENSIONS = {
            VK_KHR_SWAPCHAIN_EXTENSION_NAME
        };

        template<typename T, typename Fn>
        std::vector<T> Enumerate(Fn&& fn)
        {
            uint32_t count = 0;
            fn(&count, nullptr);
            std::vector<T> items(count);
            if (count > 0) fn(&count, items.data());
            items.resize(count);
            return items;
        }

        QueueFamilies FindQueueFamilies(VkPhysicalDevice adapter, VkSurfaceKHR surface)
        {
            const auto families = Enumerate<VkQueueFamilyProperties>([&](uint32_t* n, VkQueueFamilyProperties* out)
            {
                vkGetPhysicalDeviceQueueFamilyProperties(adapter, n, out);
            });

            constexpr VkQueueFlags needed = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
            QueueFamilies result;
            for (uint32_t i = 0; i < families.size(); ++i)
            {
                const bool universal = (families[i].queueFlags & needed) == needed;
                VkBool32 presents = VK_FALSE;
                vkGetPhysicalDeviceSurfaceSupportKHR(adapter, i, surface, &presents);

                // One family doing both avoids concurrent swapchain sharing.
                if (universal && presents)
                {
                    result.Graphics = i;
                    result.Present = i;
                    return result;
                }
                if (universal && !result.Graphics) result.Graphics = i;
                if (presents && !result.Present) result.Present = i;
            }
            return result;
        }

        bool HasRequiredExtensions(VkPhysicalDevice adapter)
        {
            const auto available = Enumerate<VkExtensionProperties>([&](uint32_t* n, VkExtensionProperties* out)
            {
                vkEnumerateDeviceExtensionProperties(adapter, nullptr, n, out);
            });

            return std::ranges::all_of(REQUIRED_DEVICE_EXTENSIONS, [&](const char* name)
            {
                return std::ranges::any_of(available, [&](const VkExtensionProperties& ext)
                {
                    return std::strcmp(ext.extensionName, name) == 0;
                });
            });
        }

        struct Vulkan13Features
        {
            VkPhysicalDeviceVulkan13Features V13{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES};
            VkPhysicalDeviceFeatures2 Base{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2};

            explicit Vulkan13Features(VkPhysicalDevice adapter)
            {
                Base.pNext = &V13;
                vkGetPhysicalDeviceFeatures2(adapter, &Base);
            }
        };

        // Reason the adapter cannot run the backend, or nullopt when it can.
        std::optional<std::string_view> RejectReason(VkPhysicalDevice adapter, VkSurfaceKHR surface)
        {
            VkPhysicalDeviceProperties props{};
            vkGetPhysicalDeviceProperties(adapter, &props);
            if (props.apiVersion < VK_API_VERSION_1_3) return "Vulkan 1.3 not supported";

            const Vulkan13Features features(adapter);
            if (!features.V13.dynamicRendering || !features.V13.synchronization2)
                return "dynamic rendering or synchronization2 missing";

            if (!FindQueueFamilies(adapter, surface).IsComplete()) return "no graphics+compute or present queue";
            if (!HasRequiredExtensions(adapter)) return "VK_KHR_swapchain missing";

            uint32_t formats = 0;
            uint32_t modes = 0;
            vkGetPhysicalDeviceSurfaceFormatsKHR(adapter, surface, &formats, nullptr);
            vkGetPhysicalDeviceSurfacePresentModesKHR(adapter, surface, &modes, nullptr);
            if (formats == 0 || modes == 0) return "surface has no formats or present modes";

            return std::nullopt;
        }

        uint32_t Score(VkPhysicalDevice adapter, VkSurfaceKHR surface)
        {
            VkPhysicalDeviceProperties props{};
            vkGetPhysicalDeviceProperties(adapter, &props);

            uint32_t score = 1;
            if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) score += 1000;
            else if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) score += 100;
            if (FindQueueFamilies(adapter, surface).IsShared()) score += 10;
            return score;
        }
    }

    VulkanDevice::VulkanDevice(VulkanContext& context, VkSurfaceKHR surface)
        : m_Surface(surface)
    {
        m_IsValid = SelectAdapter(context.GetInstance())
                    && CreateLogicalDevice(context.GetInstance())
                    && CreateTransferPool();
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);

        DrainDeferredDestroys();

        if (m_TransferPool) vkDestroyCommandPool(m_Device, m_TransferPool, nullptr);
        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    bool VulkanDevice::SelectAdapter(VkInstance instance)
    {
        const auto adapters = Enumerate<VkPhysicalDevice>([&](uint32_t* n, VkPhysicalDevice* out)
        {
            vkEnumeratePhysicalDevices(instance, n, out);
        });

        uint32_t bestScore = 0;
        for (VkPhysicalDevice adapter : adapters)
        {
            VkPhysicalDeviceProperties props{};
            vkGetPhysicalDeviceProperties(adapter, &props);

            if (const auto reason = RejectReason(adapter, m_Surface))
            {
                Core::Log::Warn("GPU '{}' rejected: {}", props.deviceName, *reason);
                continue;
            }

            const uint32_t score = Score(adapter, m_Surface);
            if (score > bestScore)
            {
                bestScore = score;
                m_PhysicalDevice = adapter;
                m_Properties = props;
            }
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("No usable GPU among {} Vulkan adapter(s)", adapters.size());
            return false;
        }

        m_Queues = FindQueueFamilies(m_PhysicalDevice, m_Surface);
        Core::Log::Info("Selected GPU: {} (graphics family {}, present family {})", m_Properties.deviceName,
                        *m_Queues.Graphics, *m_Queues.Present);
        return true;
    }

    bool VulkanDevice::CreateLogicalDevice(VkInstance instance)
    {
        const float priority = 1.0f;
        std::vector<VkDeviceQueueCreateInfo> queueInfos;
        for (uint32_t family : {*m_Queues.Graphics, *m_Queues.Present})
        {
            if (!queueInfos.empty() && queueInfos.front().queueFamilyIndex == family) continue;

            VkDeviceQueueCreateInfo info{};
            info.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
            info.queueFamilyIndex = family;
            info.queueCount = 1;
            info.pQueuePriorities = &priority;
            queueInfos.push_back(info);
        }

        const Vulkan13Features supported(m_PhysicalDevice);
        m_SamplerAnisotropy = supported.Base.features.samplerAnisotropy == VK_TRUE;

        VkPhysicalDeviceVulkan13Features enabled13{};
        enabled13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        enabled13.dynamicRendering = VK_TRUE;
        enabled13.synchronization2 = VK_TRUE;

        VkPhysicalDeviceFeatures2 enabled{};
        enabled.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        enabled.pNext = &enabled13;
        enabled.features.samplerAnisotropy = supported.Base.features.samplerAnisotropy;
        enabled.features.depthBiasClamp = supported.Base.features.depthBiasClamp;
        enabled.features.depthClamp = supported.Base.features.depthClamp;

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &enabled;
        createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueInfos.size());
        createInfo.pQueueCreateInfos = queueInfos.data();
        createInfo.enabledExtensionCount = static_cast<uint32_t>(REQUIRED_DEVICE_EXTENSIONS.size());
        createInfo.ppEnabledExtensionNames = REQUIRED_DEVICE_EXTENSIONS.data();

        if (const VkResult result = vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device);
            result != VK_SUCCESS)
        {
            Core::Log::Error("vkCreateDevice failed ({})", static_cast<int>(result));
            m_Device = VK_NULL_HANDLE;
            return false;
        }
        volkLoadDevice(m_Device);

        vkGetDeviceQueue(m_Device, *m_Queues.Graphics, 0, &m_GraphicsQueue);
        vkGetDeviceQueue(m_Device, *m_Queues.Present, 0, &m_PresentQueue);

        VmaVulkanFunctions functions{};
        functions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        functions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo{};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.instance = instance;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.pVulkanFunctions = &functions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("VMA allocator creation failed");
            m_Allocator = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    bool VulkanDevice::CreateTransferPool()
    {
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
        poolInfo.queueFamilyIndex = *m_Queues.Graphics;

        if (vkCreateCommandPool(m_Device, &poolInfo, nullptr, &m_TransferPool) != VK_SUCCESS)
        {
            Core::Log::Error("Transfer command pool creation failed");
            m_TransferPool = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    SurfaceSupport VulkanDevice::QuerySurfaceSupport() const
    {
        SurfaceSupport support;
        vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_PhysicalDevice, m_Surface, &support.Capabilities);
        support.Formats = Enumerate<VkSurfaceFormatKHR>([&](uint32_t* n, VkSurfaceFormatKHR* out)
        {
            vkGetPhysicalDeviceSurfaceFormatsKHR(m_PhysicalDevice, m_Surface, n, out);
        });
        support.PresentModes = Enumerate<VkPresentModeKHR>([&](uint32_t* n, VkPresentModeKHR* out)
        {
            vkGetPhysicalDeviceSurfacePresentModesKHR(m_PhysicalDevice, m_Surface, n, out);
        });
        return support;
    }

    VkResult VulkanDevice::Submit(const VkSubmitInfo& submitInfo, VkFence fence)
    {
        return vkQueueSubmit(m_GraphicsQueue, 1, &submitInfo, fence);
    }

    VkResult VulkanDevice::Present(const VkPresentInfoKHR& presentInfo)
    {
        return vkQueuePresentKHR(m_PresentQueue, &presentInfo);
    }

    void VulkanDevice::DeferDestroy(std::function<void()>&& destroyFn)
    {
        m_Deferred[m_Slot].push_back(std::move(destroyFn));
    }

    void VulkanDevice::BeginFrameSlot(uint32_t slot)
    {
        m_Slot = slot % MAX_FRAMES_IN_FLIGHT;
        auto pending = std::exchange(m_Deferred[m_Slot], {});
        for (auto& fn : pending) fn();
    }

    void VulkanDevice::DrainDeferredDestroys()
    {
        for (auto& slot : m_Deferred)
        {
            auto pending = std::exchange(slot, {});
            for (auto& fn : pending) fn();
        }
    }
}
