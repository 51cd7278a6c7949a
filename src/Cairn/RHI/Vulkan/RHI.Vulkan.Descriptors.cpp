module;
#include <array>
#include <cstdint>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Descriptors.Impl;
import :Descriptors;
import :Convert;
import Core;

namespace RHI
{
    VulkanBindGroupLayout::VulkanBindGroupLayout(VulkanDevice& device, uint64_t id,
                                                 std::span<const BindGroupLayoutEntry> entries)
        : m_Device(device), m_Id(id), m_Entries(entries.begin(), entries.end())
    {
        std::vector<VkDescriptorSetLayoutBinding> bindings;
        bindings.reserve(m_Entries.size());
        for (const BindGroupLayoutEntry& entry : m_Entries)
        {
            VkDescriptorSetLayoutBinding binding{};
            binding.binding = entry.Binding;
            binding.descriptorType = Vk::ToVkDescriptorType(entry.Kind);
            binding.descriptorCount = 1;
            binding.stageFlags = Vk::ToVkShaderStages(entry.Visibility);
            bindings.push_back(binding);
        }

        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
        layoutInfo.pBindings = bindings.data();

        if (vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout!");
            m_Layout = VK_NULL_HANDLE;
        }
    }

    VulkanBindGroupLayout::~VulkanBindGroupLayout()
    {
        if (!m_Layout) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkDescriptorSetLayout layout = m_Layout;
        m_Device.DeferDestroy([logicalDevice, layout]()
        {
            vkDestroyDescriptorSetLayout(logicalDevice, layout, nullptr);
        });
    }

    // --- Allocator ---

    DescriptorAllocator::DescriptorAllocator(VulkanDevice& device)
        : m_Device(device)
    {
    }

    DescriptorAllocator::~DescriptorAllocator()
    {
        // The owner flushes the deletion queues first, so no Free is pending.
        for (VkDescriptorPool pool : m_Pools)
            vkDestroyDescriptorPool(m_Device.GetLogicalDevice(), pool, nullptr);
    }

    VkDescriptorPool DescriptorAllocator::CreatePool()
    {
        const std::array<VkDescriptorPoolSize, 5> sizes{{
            {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, SETS_PER_POOL * 4},
            {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, SETS_PER_POOL * 4},
            {VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE, SETS_PER_POOL * 4},
            {VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, SETS_PER_POOL * 2},
            {VK_DESCRIPTOR_TYPE_SAMPLER, SETS_PER_POOL * 2},
        }};

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        poolInfo.poolSizeCount = static_cast<uint32_t>(sizes.size());
        poolInfo.pPoolSizes = sizes.data();
        poolInfo.maxSets = SETS_PER_POOL;

        VkDescriptorPool pool = VK_NULL_HANDLE;
        if (vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &pool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool!");
            return VK_NULL_HANDLE;
        }

        m_Pools.push_back(pool);
        return pool;
    }

    DescriptorAllocator::Allocation DescriptorAllocator::Allocate(VkDescriptorSetLayout layout)
    {
        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &layout;

        // Newest pool first; older pools regain space as sets are freed.
        for (auto it = m_Pools.rbegin(); it != m_Pools.rend(); ++it)
        {
            allocInfo.descriptorPool = *it;
            VkDescriptorSet set = VK_NULL_HANDLE;
            if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) == VK_SUCCESS)
                return {*it, set};
        }

        VkDescriptorPool pool = CreatePool();
        if (!pool) return {};

        allocInfo.descriptorPool = pool;
        VkDescriptorSet set = VK_NULL_HANDLE;
        if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set!");
            return {};
        }
        return {pool, set};
    }

    void DescriptorAllocator::Free(const Allocation& allocation)
    {
        if (!allocation.Set) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        m_Device.DeferDestroy([logicalDevice, allocation]()
        {
            VK_CHECK(vkFreeDescriptorSets(logicalDevice, allocation.Pool, 1, &allocation.Set));
        });
    }
}
