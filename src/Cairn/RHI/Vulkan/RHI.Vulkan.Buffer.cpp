module;
#include <cstddef>
#include <cstdint>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Buffer.Impl;
import :Buffer;
import :Convert;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(VulkanDevice& device, uint64_t id, uint64_t size, BufferUsage usage, BufferMemory memory)
        : m_Device(device), m_Id(id), m_Usage(usage), m_SizeBytes(size)
    {
        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = size;
        bufferInfo.usage = Vk::ToVkBufferUsage(usage);
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_AUTO;
        switch (memory)
        {
        case BufferMemory::DeviceLocal:
            allocInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
            break;
        case BufferMemory::Upload:
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
            break;
        case BufferMemory::Readback:
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
            break;
        }

        VmaAllocationInfo resultInfo{};
        const VkResult result = vmaCreateBuffer(m_Device.GetAllocator(), &bufferInfo, &allocInfo,
                                                &m_Buffer, &m_Allocation, &resultInfo);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("VulkanBuffer: vmaCreateBuffer failed ({}) for {} bytes", static_cast<int>(result), size);
            m_Buffer = VK_NULL_HANDLE;
            m_Allocation = VK_NULL_HANDLE;
            return;
        }

        m_MappedData = resultInfo.pMappedData;
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (!m_Buffer) return;

        VkBuffer buffer = m_Buffer;
        VmaAllocation allocation = m_Allocation;
        VmaAllocator allocator = m_Device.GetAllocator();

        // Frames in flight may still reference the buffer.
        m_Device.DeferDestroy([allocator, buffer, allocation]()
        {
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }

    void VulkanBuffer::Invalidate(size_t offset, size_t size)
    {
        if (m_Allocation)
            VK_CHECK(vmaInvalidateAllocation(m_Device.GetAllocator(), m_Allocation, offset, size == SIZE_MAX ? VK_WHOLE_SIZE : size));
    }

    void VulkanBuffer::Flush(size_t offset, size_t size)
    {
        if (m_Allocation)
            VK_CHECK(vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, size == SIZE_MAX ? VK_WHOLE_SIZE : size));
    }
}
