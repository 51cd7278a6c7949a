module;
#include <cstddef>
#include <cstdint>
#include <limits>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Buffer;

import RHI;
import :Device;

export namespace RHI
{
    enum class BufferMemory : uint8_t
    {
        DeviceLocal, // GPU only, written through transfer commands.
        Upload,      // Host-visible staging, persistently mapped.
        Readback     // Host-visible, random access, persistently mapped.
    };

    class VulkanBuffer final : public IBuffer
    {
    public:
        VulkanBuffer(VulkanDevice& device, uint64_t id, uint64_t size, BufferUsage usage, BufferMemory memory);
        ~VulkanBuffer() override;

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] uint64_t GetSize() const override { return m_SizeBytes; }
        [[nodiscard]] BufferUsage GetUsage() const override { return m_Usage; }

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }

        // nullptr for DeviceLocal memory.
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }

        // Explicit cache management for host-visible memory. No-ops on
        // coherent memory.
        void Invalidate(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());
        void Flush(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());

    private:
        VulkanDevice& m_Device;
        uint64_t m_Id;
        BufferUsage m_Usage;

        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        void* m_MappedData = nullptr;
        uint64_t m_SizeBytes = 0;
    };
}
