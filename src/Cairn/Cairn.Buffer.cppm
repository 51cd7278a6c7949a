module;
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

export module Cairn:Buffer;

import Core;
import RHI;

export namespace Cairn
{
    // Typed GPU buffer record. The element type is fixed at creation; the
    // device allocation behind it may be replaced when a write outgrows it.
    class Buffer
    {
    public:
        Buffer(Core::TypeTag elementType, uint32_t elementSize, RHI::BufferUsage usage,
               std::optional<RHI::VertexBufferLayout> vertexLayout,
               std::unique_ptr<RHI::IBuffer> gpu, std::string label)
            : m_ElementType(elementType), m_ElementSize(elementSize), m_Usage(usage),
              m_VertexLayout(std::move(vertexLayout)), m_Gpu(std::move(gpu)), m_Label(std::move(label))
        {
        }

        Buffer(const Buffer&) = delete;
        Buffer& operator=(const Buffer&) = delete;

        [[nodiscard]] Core::TypeTag GetElementType() const { return m_ElementType; }
        [[nodiscard]] uint32_t GetElementSize() const { return m_ElementSize; }
        [[nodiscard]] RHI::BufferUsage GetUsage() const { return m_Usage; }
        [[nodiscard]] const std::optional<RHI::VertexBufferLayout>& GetVertexLayout() const { return m_VertexLayout; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

        [[nodiscard]] const RHI::IBuffer& GetGpu() const { return *m_Gpu; }
        [[nodiscard]] uint64_t GetCapacity() const { return m_Gpu->GetSize(); }
        [[nodiscard]] uint64_t GetElementCount() const { return m_Gpu->GetSize() / m_ElementSize; }
        [[nodiscard]] uint32_t GetReallocationCount() const { return m_Reallocations; }

        // Only 2- and 4-byte index buffers have one.
        [[nodiscard]] std::optional<RHI::IndexFormat> GetIndexFormat() const
        {
            if (!RHI::HasFlag(m_Usage, RHI::BufferUsage::Index)) return std::nullopt;
            return RHI::IndexFormatFromElementSize(m_ElementSize);
        }

        void Replace(std::unique_ptr<RHI::IBuffer> gpu)
        {
            m_Gpu = std::move(gpu);
            ++m_Reallocations;
        }

    private:
        Core::TypeTag m_ElementType;
        uint32_t m_ElementSize;
        RHI::BufferUsage m_Usage;
        std::optional<RHI::VertexBufferLayout> m_VertexLayout;
        std::unique_ptr<RHI::IBuffer> m_Gpu;
        std::string m_Label;
        uint32_t m_Reallocations = 0;
    };
}
