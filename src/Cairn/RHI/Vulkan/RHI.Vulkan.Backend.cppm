module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Backend;

import Core;
import RHI;
import :Context;
import :Descriptors;
import :Device;
import :Recorder;
import :Swapchain;

export namespace RHI
{
    struct VulkanBackendConfig
    {
        std::string AppName = "Cairn App";
        bool EnableValidation = true;
        PresentMode PreferredPresentMode = PresentMode::Fifo;
    };

    // IDevice over Vulkan 1.3: dynamic rendering, synchronization2, VMA.
    // Content writes and read-back are synchronous one-shot submissions.
    class VulkanBackend final : public IDevice
    {
    public:
        VulkanBackend(Core::Windowing::Window& window, const VulkanBackendConfig& config);
        ~VulkanBackend() override;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] std::string_view GetName() const override { return "vulkan"; }
        [[nodiscard]] uint32_t GetMapAlignment() const override { return DefaultMapAlignment; }

        [[nodiscard]] Core::Expected<std::unique_ptr<IBuffer>> CreateBuffer(const BufferDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<ITexture>> CreateTexture(const TextureDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<ISampler>> CreateSampler(const SamplerDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<IShaderModule>> CreateShaderModule(
            std::span<const uint32_t> spirv, ShaderStage stage, std::string_view label) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<IBindGroupLayout>> CreateBindGroupLayout(
            std::span<const BindGroupLayoutEntry> entries, std::string_view label) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<IBindGroup>> CreateBindGroup(
            const IBindGroupLayout& layout, std::span<const BindGroupEntry> entries, std::string_view label) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<IRenderPipeline>> CreateRenderPipeline(
            const RenderPipelineDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<IComputePipeline>> CreateComputePipeline(
            const ComputePipelineDesc& desc) override;

        [[nodiscard]] Core::Result WriteBuffer(const IBuffer& buffer, uint64_t offset,
                                               std::span<const std::byte> data) override;
        [[nodiscard]] Core::Result ReadBuffer(const IBuffer& buffer, uint64_t offset,
                                              std::span<std::byte> out) override;
        [[nodiscard]] Core::Result WriteTexture(const ITexture& texture, std::span<const std::byte> data) override;

        [[nodiscard]] TextureFormat GetSurfaceFormat() const override;
        [[nodiscard]] Extent2D GetSurfaceExtent() const override;
        [[nodiscard]] Core::Result ConfigureSurface(Extent2D extent) override;
        [[nodiscard]] std::expected<SurfaceTarget, SurfaceError> AcquireSurfaceTarget() override;

        [[nodiscard]] ICommandRecorder& BeginCommands() override;
        [[nodiscard]] Core::Result Submit(ICommandRecorder& recorder) override;
        [[nodiscard]] Core::Result Present(const SurfaceTarget& target) override;

        void WaitIdle() override;

    private:
        static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = VulkanDevice::MAX_FRAMES_IN_FLIGHT;
        static constexpr uint64_t ACQUIRE_TIMEOUT_NS = 1'000'000'000;

        [[nodiscard]] uint64_t NextId() { return ++m_NextId; }

        [[nodiscard]] bool InitFrameStructures();
        void DestroyFrameStructures();

        // Waits for the current frame slot's fence and retires its deletions.
        void PrepareFrameSlot();

        std::unique_ptr<VulkanContext> m_Context;
        VkSurfaceKHR m_Surface = VK_NULL_HANDLE;
        std::unique_ptr<VulkanDevice> m_Device;
        std::unique_ptr<VulkanSwapchain> m_Swapchain;
        std::unique_ptr<DescriptorAllocator> m_Descriptors;

        VkCommandPool m_FramePool = VK_NULL_HANDLE;
        std::vector<VkCommandBuffer> m_CommandBuffers;
        std::vector<VkSemaphore> m_ImageAvailableSemaphores;
        std::vector<VkSemaphore> m_RenderFinishedSemaphores;
        std::vector<VkFence> m_InFlightFences;

        VulkanCommandRecorder m_Recorder;

        uint64_t m_NextId = 0;
        uint32_t m_CurrentFrame = 0;
        uint32_t m_ImageIndex = 0;
        bool m_SlotReady = false;
        bool m_TargetAcquired = false;
        bool m_SurfaceStale = false;
        bool m_IsValid = false;
    };

    [[nodiscard]] Core::Expected<std::unique_ptr<IDevice>> CreateVulkanDevice(
        Core::Windowing::Window& window, const VulkanBackendConfig& config = {});
}
