module;
#include <cstdint>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Descriptors;

import RHI;
import :Device;

export namespace RHI
{
    class VulkanBindGroupLayout final : public IBindGroupLayout
    {
    public:
        VulkanBindGroupLayout(VulkanDevice& device, uint64_t id, std::span<const BindGroupLayoutEntry> entries);
        ~VulkanBindGroupLayout() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] std::span<const BindGroupLayoutEntry> GetEntries() const override { return m_Entries; }

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] bool IsValid() const { return m_Layout != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        std::vector<BindGroupLayoutEntry> m_Entries;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
    };

    // Hands out individually freeable sets. A new pool is appended whenever
    // the current ones are exhausted.
    class DescriptorAllocator
    {
    public:
        explicit DescriptorAllocator(VulkanDevice& device);
        ~DescriptorAllocator();

        DescriptorAllocator(const DescriptorAllocator&) = delete;
        DescriptorAllocator& operator=(const DescriptorAllocator&) = delete;

        struct Allocation
        {
            VkDescriptorPool Pool = VK_NULL_HANDLE;
            VkDescriptorSet Set = VK_NULL_HANDLE;
        };

        [[nodiscard]] Allocation Allocate(VkDescriptorSetLayout layout);

        // Deferred through the device deletion queue.
        void Free(const Allocation& allocation);

    private:
        static constexpr uint32_t SETS_PER_POOL = 256;

        VulkanDevice& m_Device;
        std::vector<VkDescriptorPool> m_Pools;

        [[nodiscard]] VkDescriptorPool CreatePool();
    };

    class VulkanBindGroup final : public IBindGroup
    {
    public:
        VulkanBindGroup(DescriptorAllocator& allocator, uint64_t id, DescriptorAllocator::Allocation allocation)
            : m_Allocator(allocator), m_Id(id), m_Allocation(allocation)
        {
        }

        ~VulkanBindGroup() override { m_Allocator.Free(m_Allocation); }

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] VkDescriptorSet GetHandle() const { return m_Allocation.Set; }

    private:
        DescriptorAllocator& m_Allocator;
        uint64_t m_Id;
        DescriptorAllocator::Allocation m_Allocation;
    };
}
