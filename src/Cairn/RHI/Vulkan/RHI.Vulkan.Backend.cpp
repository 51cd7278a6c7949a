module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Backend.Impl;
import :Backend;
import :Buffer;
import :CommandUtils;
import :Convert;
import :Image;
import :Pipeline;
import :Sampler;
import :Shader;
import Core;

namespace RHI
{
    VulkanBackend::VulkanBackend(Core::Windowing::Window& window, const VulkanBackendConfig& config)
    {
        m_Context = std::make_unique<VulkanContext>(InstanceConfig{
            .AppName = config.AppName,
            .EnableValidation = config.EnableValidation,
            .SurfaceExtensions = Core::Windowing::Window::RequiredSurfaceExtensions(),
        });
        if (!m_Context->IsValid()) return;

        if (!window.CreateSurface(m_Context->GetInstance(), &m_Surface))
            return;

        m_Device = std::make_unique<VulkanDevice>(*m_Context, m_Surface);
        if (!m_Device->IsValid()) return;

        const Extent2D extent{
            std::max(window.GetFramebufferWidth(), 1u),
            std::max(window.GetFramebufferHeight(), 1u),
        };
        m_Swapchain = std::make_unique<VulkanSwapchain>(*m_Device, config.PreferredPresentMode, extent,
                                                        [this]() { return NextId(); });
        if (!m_Swapchain->IsValid()) return;

        m_Descriptors = std::make_unique<DescriptorAllocator>(*m_Device);
        if (!InitFrameStructures()) return;

        m_IsValid = true;
    }

    VulkanBackend::~VulkanBackend()
    {
        // Order: idle the GPU, drop frame objects and the swapchain, retire
        // deferred deletions, then pools, device, surface and instance.
        if (m_Device && m_Device->GetLogicalDevice())
        {
            vkDeviceWaitIdle(m_Device->GetLogicalDevice());
            DestroyFrameStructures();
            m_Swapchain.reset();
            m_Device->DrainDeferredDestroys();
            m_Descriptors.reset();
        }
        m_Device.reset();

        if (m_Surface && m_Context && m_Context->GetInstance())
            vkDestroySurfaceKHR(m_Context->GetInstance(), m_Surface, nullptr);

        m_Context.reset();
    }

    bool VulkanBackend::InitFrameStructures()
    {
        VkDevice device = m_Device->GetLogicalDevice();

        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = *m_Device->GetQueueFamilies().Graphics;

        if (vkCreateCommandPool(device, &poolInfo, nullptr, &m_FramePool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create frame command pool!");
            return false;
        }

        m_CommandBuffers.resize(MAX_FRAMES_IN_FLIGHT);

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_FramePool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = static_cast<uint32_t>(m_CommandBuffers.size());

        if (vkAllocateCommandBuffers(device, &allocInfo, m_CommandBuffers.data()) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate frame command buffers!");
            return false;
        }

        m_ImageAvailableSemaphores.resize(MAX_FRAMES_IN_FLIGHT, VK_NULL_HANDLE);
        m_RenderFinishedSemaphores.resize(MAX_FRAMES_IN_FLIGHT, VK_NULL_HANDLE);
        m_InFlightFences.resize(MAX_FRAMES_IN_FLIGHT, VK_NULL_HANDLE);

        VkSemaphoreCreateInfo semaphoreInfo{};
        semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i)
        {
            if (vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_ImageAvailableSemaphores[i]) != VK_SUCCESS ||
                vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_RenderFinishedSemaphores[i]) != VK_SUCCESS ||
                vkCreateFence(device, &fenceInfo, nullptr, &m_InFlightFences[i]) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create frame synchronization objects!");
                return false;
            }
        }
        return true;
    }

    void VulkanBackend::DestroyFrameStructures()
    {
        VkDevice device = m_Device->GetLogicalDevice();
        for (VkSemaphore semaphore : m_ImageAvailableSemaphores)
            if (semaphore) vkDestroySemaphore(device, semaphore, nullptr);
        for (VkSemaphore semaphore : m_RenderFinishedSemaphores)
            if (semaphore) vkDestroySemaphore(device, semaphore, nullptr);
        for (VkFence fence : m_InFlightFences)
            if (fence) vkDestroyFence(device, fence, nullptr);

        m_ImageAvailableSemaphores.clear();
        m_RenderFinishedSemaphores.clear();
        m_InFlightFences.clear();
        m_CommandBuffers.clear();

        if (m_FramePool)
        {
            vkDestroyCommandPool(device, m_FramePool, nullptr);
            m_FramePool = VK_NULL_HANDLE;
        }
    }

    void VulkanBackend::PrepareFrameSlot()
    {
        if (m_SlotReady) return;

        VK_CHECK(vkWaitForFences(m_Device->GetLogicalDevice(), 1, &m_InFlightFences[m_CurrentFrame], VK_TRUE,
                                 UINT64_MAX));
        m_Device->BeginFrameSlot(m_CurrentFrame);
        m_SlotReady = true;
    }

    // --- Allocation ---

    Core::Expected<std::unique_ptr<IBuffer>> VulkanBackend::CreateBuffer(const BufferDesc& desc)
    {
        if (desc.Size == 0)
        {
            Core::Log::Error("VulkanBackend::CreateBuffer(): zero-sized buffer '{}'", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto buffer = std::make_unique<VulkanBuffer>(*m_Device, NextId(), desc.Size, desc.Usage,
                                                     BufferMemory::DeviceLocal);
        if (!buffer->IsValid())
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        const VkBuffer handle = buffer->GetHandle();
        const VkResult result = CommandUtils::ExecuteImmediate(*m_Device, [handle](VkCommandBuffer cmd)
        {
            vkCmdFillBuffer(cmd, handle, 0, VK_WHOLE_SIZE, 0);
            CommandUtils::FullMemoryBarrier(cmd);
        });
        if (result != VK_SUCCESS)
            return std::unexpected(Vk::ToErrorCode(result));

        return std::unique_ptr<IBuffer>(std::move(buffer));
    }

    Core::Expected<std::unique_ptr<ITexture>> VulkanBackend::CreateTexture(const TextureDesc& desc)
    {
        if (desc.Size.TexelCount() == 0 || desc.Format == TextureFormat::Undefined)
        {
            Core::Log::Error("VulkanBackend::CreateTexture(): invalid size or format for '{}'", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        const uint64_t id = NextId();
        const uint64_t viewId = NextId();
        auto texture = std::make_unique<VulkanTexture>(*m_Device, id, viewId, desc);
        if (!texture->IsValid())
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        // Zero-initialise and park the image in GENERAL for its whole life.
        const VkImage image = texture->GetImage();
        const VkImageAspectFlags aspect = Vk::AspectOf(desc.Format);
        const bool depth = IsDepthFormat(desc.Format);
        const VkResult result = CommandUtils::ExecuteImmediate(*m_Device, [=](VkCommandBuffer cmd)
        {
            CommandUtils::TransitionImageLayout(cmd, image, aspect, VK_IMAGE_LAYOUT_UNDEFINED,
                                                VK_IMAGE_LAYOUT_GENERAL);

            VkImageSubresourceRange range{};
            range.aspectMask = aspect;
            range.levelCount = VK_REMAINING_MIP_LEVELS;
            range.layerCount = 1;

            if (depth)
            {
                VkClearDepthStencilValue clear{0.0f, 0};
                vkCmdClearDepthStencilImage(cmd, image, VK_IMAGE_LAYOUT_GENERAL, &clear, 1, &range);
            }
            else
            {
                VkClearColorValue clear{};
                vkCmdClearColorImage(cmd, image, VK_IMAGE_LAYOUT_GENERAL, &clear, 1, &range);
            }
            CommandUtils::FullMemoryBarrier(cmd);
        });
        if (result != VK_SUCCESS)
            return std::unexpected(Vk::ToErrorCode(result));

        return std::unique_ptr<ITexture>(std::move(texture));
    }

    Core::Expected<std::unique_ptr<ISampler>> VulkanBackend::CreateSampler(const SamplerDesc& desc)
    {
        auto sampler = std::make_unique<VulkanSampler>(*m_Device, NextId(), desc);
        if (!sampler->IsValid())
            return std::unexpected(Core::ErrorCode::Unknown);
        return std::unique_ptr<ISampler>(std::move(sampler));
    }

    Core::Expected<std::unique_ptr<IShaderModule>> VulkanBackend::CreateShaderModule(
        std::span<const uint32_t> spirv, ShaderStage stage, std::string_view label)
    {
        if (spirv.empty())
        {
            Core::Log::Error("VulkanBackend::CreateShaderModule(): empty module '{}'", label);
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        auto shaderModule = std::make_unique<VulkanShaderModule>(*m_Device, NextId(), spirv, stage);
        if (!shaderModule->IsValid())
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        return std::unique_ptr<IShaderModule>(std::move(shaderModule));
    }

    Core::Expected<std::unique_ptr<IBindGroupLayout>> VulkanBackend::CreateBindGroupLayout(
        std::span<const BindGroupLayoutEntry> entries, std::string_view label)
    {
        auto layout = std::make_unique<VulkanBindGroupLayout>(*m_Device, NextId(), entries);
        if (!layout->IsValid())
        {
            Core::Log::Error("VulkanBackend::CreateBindGroupLayout(): '{}' failed", label);
            return std::unexpected(Core::ErrorCode::Unknown);
        }
        return std::unique_ptr<IBindGroupLayout>(std::move(layout));
    }

    Core::Expected<std::unique_ptr<IBindGroup>> VulkanBackend::CreateBindGroup(
        const IBindGroupLayout& layout, std::span<const BindGroupEntry> entries, std::string_view label)
    {
        const auto layoutEntries = layout.GetEntries();
        if (layoutEntries.size() != entries.size())
        {
            Core::Log::Error("VulkanBackend::CreateBindGroup(): '{}' has {} entries, layout expects {}",
                             label, entries.size(), layoutEntries.size());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto allocation = m_Descriptors->Allocate(static_cast<const VulkanBindGroupLayout&>(layout).GetHandle());
        if (!allocation.Set)
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        // Sized up front; the writes point into these arrays.
        std::vector<VkDescriptorBufferInfo> bufferInfos;
        std::vector<VkDescriptorImageInfo> imageInfos;
        std::vector<VkWriteDescriptorSet> writes;
        bufferInfos.reserve(entries.size());
        imageInfos.reserve(entries.size());
        writes.reserve(entries.size());

        for (const BindGroupEntry& entry : entries)
        {
            auto it = std::ranges::find(layoutEntries, entry.Binding, &BindGroupLayoutEntry::Binding);
            if (it == layoutEntries.end())
            {
                Core::Log::Error("VulkanBackend::CreateBindGroup(): '{}' binding {} not in layout",
                                 label, entry.Binding);
                m_Descriptors->Free(allocation);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            VkWriteDescriptorSet write{};
            write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            write.dstSet = allocation.Set;
            write.dstBinding = entry.Binding;
            write.descriptorCount = 1;
            write.descriptorType = Vk::ToVkDescriptorType(it->Kind);

            bool bound = false;
            switch (it->Kind)
            {
            case BindingKind::UniformBuffer:
            case BindingKind::StorageBuffer:
                if (entry.Buffer)
                {
                    bufferInfos.push_back({static_cast<const VulkanBuffer*>(entry.Buffer)->GetHandle(), 0,
                                           VK_WHOLE_SIZE});
                    write.pBufferInfo = &bufferInfos.back();
                    bound = true;
                }
                break;
            case BindingKind::SampledTexture:
            case BindingKind::StorageTexture:
                if (entry.Texture)
                {
                    imageInfos.push_back({VK_NULL_HANDLE,
                                          static_cast<const VulkanTexture*>(entry.Texture)->GetImageView(),
                                          VK_IMAGE_LAYOUT_GENERAL});
                    write.pImageInfo = &imageInfos.back();
                    bound = true;
                }
                break;
            case BindingKind::Sampler:
                if (entry.Sampler)
                {
                    imageInfos.push_back({static_cast<const VulkanSampler*>(entry.Sampler)->GetHandle(),
                                          VK_NULL_HANDLE, VK_IMAGE_LAYOUT_UNDEFINED});
                    write.pImageInfo = &imageInfos.back();
                    bound = true;
                }
                break;
            }

            if (!bound)
            {
                Core::Log::Error("VulkanBackend::CreateBindGroup(): '{}' binding {} has no resource of the layout's kind",
                                 label, entry.Binding);
                m_Descriptors->Free(allocation);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            writes.push_back(write);
        }

        vkUpdateDescriptorSets(m_Device->GetLogicalDevice(), static_cast<uint32_t>(writes.size()), writes.data(),
                               0, nullptr);

        return std::unique_ptr<IBindGroup>(std::make_unique<VulkanBindGroup>(*m_Descriptors, NextId(), allocation));
    }

    Core::Expected<std::unique_ptr<IRenderPipeline>> VulkanBackend::CreateRenderPipeline(
        const RenderPipelineDesc& desc)
    {
        auto pipeline = VulkanRenderPipeline::Create(*m_Device, NextId(), desc);
        if (!pipeline) return std::unexpected(pipeline.error());
        return std::unique_ptr<IRenderPipeline>(std::move(*pipeline));
    }

    Core::Expected<std::unique_ptr<IComputePipeline>> VulkanBackend::CreateComputePipeline(
        const ComputePipelineDesc& desc)
    {
        auto pipeline = VulkanComputePipeline::Create(*m_Device, NextId(), desc);
        if (!pipeline) return std::unexpected(pipeline.error());
        return std::unique_ptr<IComputePipeline>(std::move(*pipeline));
    }

    // --- Queue ---

    Core::Result VulkanBackend::WriteBuffer(const IBuffer& buffer, uint64_t offset, std::span<const std::byte> data)
    {
        if (offset + data.size() > buffer.GetSize())
        {
            Core::Log::Error("VulkanBackend::WriteBuffer(): out of bounds. size={} offset={} cap={}",
                             data.size(), offset, buffer.GetSize());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }
        if (data.empty()) return Core::Ok();

        VulkanBuffer staging(*m_Device, NextId(), data.size(), BufferUsage::CopySrc, BufferMemory::Upload);
        if (!staging.IsValid() || !staging.GetMappedData())
            return Core::Err(Core::ErrorCode::OutOfMemory);

        std::memcpy(staging.GetMappedData(), data.data(), data.size());
        staging.Flush();

        const VkBuffer src = staging.GetHandle();
        const VkBuffer dst = static_cast<const VulkanBuffer&>(buffer).GetHandle();
        const VkBufferCopy region{0, offset, data.size()};
        const VkResult result = CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            CommandUtils::FullMemoryBarrier(cmd);
            vkCmdCopyBuffer(cmd, src, dst, 1, &region);
            CommandUtils::FullMemoryBarrier(cmd);
        });
        if (result != VK_SUCCESS)
            return Core::Err(Vk::ToErrorCode(result));

        return Core::Ok();
    }

    Core::Result VulkanBackend::ReadBuffer(const IBuffer& buffer, uint64_t offset, std::span<std::byte> out)
    {
        if (offset + out.size() > buffer.GetSize())
        {
            Core::Log::Error("VulkanBackend::ReadBuffer(): out of bounds. size={} offset={} cap={}",
                             out.size(), offset, buffer.GetSize());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }
        if (out.empty()) return Core::Ok();

        VulkanBuffer readback(*m_Device, NextId(), out.size(), BufferUsage::CopyDst | BufferUsage::MapRead,
                              BufferMemory::Readback);
        if (!readback.IsValid() || !readback.GetMappedData())
            return Core::Err(Core::ErrorCode::OutOfMemory);

        const VkBuffer src = static_cast<const VulkanBuffer&>(buffer).GetHandle();
        const VkBuffer dst = readback.GetHandle();
        const VkBufferCopy region{offset, 0, out.size()};
        const VkResult result = CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            CommandUtils::FullMemoryBarrier(cmd);
            vkCmdCopyBuffer(cmd, src, dst, 1, &region);
            CommandUtils::FullMemoryBarrier(cmd);
        });
        if (result != VK_SUCCESS)
            return Core::Err(Vk::ToErrorCode(result));

        readback.Invalidate();
        std::memcpy(out.data(), readback.GetMappedData(), out.size());
        return Core::Ok();
    }

    Core::Result VulkanBackend::WriteTexture(const ITexture& texture, std::span<const std::byte> data)
    {
        const TextureDesc& desc = texture.GetDesc();
        const uint64_t expected = desc.Size.TexelCount() * TexelSize(desc.Format);
        if (data.size() != expected)
        {
            Core::Log::Error("VulkanBackend::WriteTexture(): expected {} bytes, got {}", expected, data.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        VulkanBuffer staging(*m_Device, NextId(), data.size(), BufferUsage::CopySrc, BufferMemory::Upload);
        if (!staging.IsValid() || !staging.GetMappedData())
            return Core::Err(Core::ErrorCode::OutOfMemory);

        std::memcpy(staging.GetMappedData(), data.data(), data.size());
        staging.Flush();

        const auto& vkTexture = static_cast<const VulkanTexture&>(texture);
        const VkImage image = vkTexture.GetImage();
        const VkImageAspectFlags aspect = Vk::AspectOf(desc.Format);

        VkBufferImageCopy region{};
        region.bufferOffset = 0;
        region.bufferRowLength = 0;
        region.bufferImageHeight = 0;
        // Depth-stencil uploads only fill the depth aspect.
        region.imageSubresource.aspectMask = IsDepthFormat(desc.Format) ? VK_IMAGE_ASPECT_DEPTH_BIT : aspect;
        region.imageSubresource.mipLevel = 0;
        region.imageSubresource.baseArrayLayer = 0;
        region.imageSubresource.layerCount = 1;
        region.imageOffset = {0, 0, 0};
        region.imageExtent = {desc.Size.Width, desc.Size.Height, desc.Size.Depth};

        const VkBuffer src = staging.GetHandle();
        const VkResult result = CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            CommandUtils::TransitionImageLayout(cmd, image, aspect, VK_IMAGE_LAYOUT_GENERAL,
                                                VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
            vkCmdCopyBufferToImage(cmd, src, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
            CommandUtils::TransitionImageLayout(cmd, image, aspect, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                                VK_IMAGE_LAYOUT_GENERAL);
        });
        if (result != VK_SUCCESS)
            return Core::Err(Vk::ToErrorCode(result));

        return Core::Ok();
    }

    // --- Surface ---

    TextureFormat VulkanBackend::GetSurfaceFormat() const
    {
        return Vk::FromVkFormat(m_Swapchain->GetImageFormat());
    }

    Extent2D VulkanBackend::GetSurfaceExtent() const
    {
        return m_Swapchain->GetExtent();
    }

    Core::Result VulkanBackend::ConfigureSurface(Extent2D extent)
    {
        if (extent.Width == 0 || extent.Height == 0)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        vkDeviceWaitIdle(m_Device->GetLogicalDevice());
        m_TargetAcquired = false;

        if (!m_Swapchain->Recreate(extent))
        {
            Core::Log::Error("VulkanBackend::ConfigureSurface(): swapchain recreation failed at {}x{}",
                             extent.Width, extent.Height);
            return Core::Err(Core::ErrorCode::SurfaceLost);
        }

        m_SurfaceStale = false;
        return Core::Ok();
    }

    std::expected<SurfaceTarget, SurfaceError> VulkanBackend::AcquireSurfaceTarget()
    {
        if (m_SurfaceStale || !m_Swapchain->IsValid())
            return std::unexpected(SurfaceError::Lost);

        PrepareFrameSlot();

        uint32_t imageIndex = 0;
        const VkResult result = vkAcquireNextImageKHR(m_Device->GetLogicalDevice(), m_Swapchain->GetHandle(),
                                                      ACQUIRE_TIMEOUT_NS, m_ImageAvailableSemaphores[m_CurrentFrame],
                                                      VK_NULL_HANDLE, &imageIndex);
        switch (result)
        {
        case VK_SUCCESS:
            break;
        case VK_SUBOPTIMAL_KHR:
            // Usable this frame; the next acquire reports the surface as lost.
            m_SurfaceStale = true;
            break;
        case VK_ERROR_OUT_OF_DATE_KHR:
            return std::unexpected(SurfaceError::Lost);
        case VK_ERROR_SURFACE_LOST_KHR:
            return std::unexpected(SurfaceError::Outdated);
        case VK_ERROR_OUT_OF_HOST_MEMORY:
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:
            return std::unexpected(SurfaceError::OutOfMemory);
        case VK_TIMEOUT:
        case VK_NOT_READY:
            return std::unexpected(SurfaceError::Timeout);
        default:
            Core::Log::Error("vkAcquireNextImageKHR failed ({})", static_cast<int>(result));
            return std::unexpected(SurfaceError::Outdated);
        }

        m_ImageIndex = imageIndex;
        m_TargetAcquired = true;
        return SurfaceTarget{.View = &m_Swapchain->GetView(imageIndex), .ImageIndex = imageIndex};
    }

    // --- Frame ---

    ICommandRecorder& VulkanBackend::BeginCommands()
    {
        PrepareFrameSlot();

        VkCommandBuffer cmd = m_CommandBuffers[m_CurrentFrame];
        VK_CHECK(vkResetCommandBuffer(cmd, 0));

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        VK_CHECK(vkBeginCommandBuffer(cmd, &beginInfo));

        m_Recorder.Begin(cmd);
        return m_Recorder;
    }

    Core::Result VulkanBackend::Submit(ICommandRecorder& recorder)
    {
        if (&recorder != &m_Recorder || !m_Recorder.IsRecording())
        {
            Core::Log::Error("VulkanBackend::Submit(): recorder is not open on this device");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        VkCommandBuffer cmd = m_Recorder.GetCommandBuffer();

        if (m_TargetAcquired)
        {
            const VkImageLayout oldLayout = m_Recorder.IsSwapchainImageInitialized()
                                                ? VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL
                                                : VK_IMAGE_LAYOUT_UNDEFINED;
            CommandUtils::TransitionImageLayout(cmd, m_Swapchain->GetView(m_ImageIndex).GetImage(),
                                                VK_IMAGE_ASPECT_COLOR_BIT, oldLayout,
                                                VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
        }

        m_Recorder.End();
        VK_CHECK(vkEndCommandBuffer(cmd));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;

        VkSemaphore waitSemaphores[] = {m_ImageAvailableSemaphores[m_CurrentFrame]};
        VkPipelineStageFlags waitStages[] = {VK_PIPELINE_STAGE_ALL_COMMANDS_BIT};
        VkSemaphore signalSemaphores[] = {m_RenderFinishedSemaphores[m_CurrentFrame]};
        if (m_TargetAcquired)
        {
            submitInfo.waitSemaphoreCount = 1;
            submitInfo.pWaitSemaphores = waitSemaphores;
            submitInfo.pWaitDstStageMask = waitStages;
            submitInfo.signalSemaphoreCount = 1;
            submitInfo.pSignalSemaphores = signalSemaphores;
        }

        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        VK_CHECK(vkResetFences(m_Device->GetLogicalDevice(), 1, &m_InFlightFences[m_CurrentFrame]));
        const VkResult result = m_Device->Submit(submitInfo, m_InFlightFences[m_CurrentFrame]);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("VulkanBackend::Submit(): vkQueueSubmit failed ({})", static_cast<int>(result));
            return Core::Err(Vk::ToErrorCode(result));
        }

        // Frames without a surface target retire their slot here.
        if (!m_TargetAcquired)
        {
            m_CurrentFrame = (m_CurrentFrame + 1) % MAX_FRAMES_IN_FLIGHT;
            m_SlotReady = false;
        }
        return Core::Ok();
    }

    Core::Result VulkanBackend::Present(const SurfaceTarget& target)
    {
        if (!m_TargetAcquired || target.ImageIndex != m_ImageIndex)
        {
            Core::Log::Error("VulkanBackend::Present(): target was not acquired from the current surface");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        VkSemaphore waitSemaphores[] = {m_RenderFinishedSemaphores[m_CurrentFrame]};
        VkSwapchainKHR swapchains[] = {m_Swapchain->GetHandle()};

        VkPresentInfoKHR presentInfo{};
        presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
        presentInfo.waitSemaphoreCount = 1;
        presentInfo.pWaitSemaphores = waitSemaphores;
        presentInfo.swapchainCount = 1;
        presentInfo.pSwapchains = swapchains;
        presentInfo.pImageIndices = &m_ImageIndex;

        const VkResult result = m_Device->Present(presentInfo);

        m_TargetAcquired = false;
        m_CurrentFrame = (m_CurrentFrame + 1) % MAX_FRAMES_IN_FLIGHT;
        m_SlotReady = false;

        if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
        {
            m_SurfaceStale = true;
            return Core::Ok();
        }
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("VulkanBackend::Present(): vkQueuePresentKHR failed ({})", static_cast<int>(result));
            return Core::Err(Core::ErrorCode::DeviceLost);
        }
        return Core::Ok();
    }

    void VulkanBackend::WaitIdle()
    {
        vkDeviceWaitIdle(m_Device->GetLogicalDevice());
    }

    Core::Expected<std::unique_ptr<IDevice>> CreateVulkanDevice(Core::Windowing::Window& window,
                                                                const VulkanBackendConfig& config)
    {
        auto backend = std::make_unique<VulkanBackend>(window, config);
        if (!backend->IsValid())
        {
            Core::Log::Error("CreateVulkanDevice(): no usable Vulkan 1.3 device for '{}'", config.AppName);
            return std::unexpected(Core::ErrorCode::DeviceLost);
        }

        Core::Log::Info("Vulkan backend ready ({}x{})", backend->GetSurfaceExtent().Width,
                        backend->GetSurfaceExtent().Height);
        return std::unique_ptr<IDevice>(std::move(backend));
    }
}
