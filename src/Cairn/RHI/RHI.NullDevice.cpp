module;
#include <algorithm>
#include <cstring>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

module RHI:NullDevice.Impl;
import :NullDevice;
import Core;

namespace RHI
{
    NullTexture::NullTexture(uint64_t id, uint64_t viewId, const TextureDesc& desc)
        : m_Id(id), m_Desc(desc), m_View(viewId, desc.Format),
          m_Bytes(desc.Size.TexelCount() * TexelSize(desc.Format), std::byte{0})
    {
        m_Desc.Label = {};
    }

    NullRenderPipeline::NullRenderPipeline(uint64_t id, const RenderPipelineDesc& desc)
        : m_Id(id),
          m_VertexLayouts(desc.VertexBuffers.begin(), desc.VertexBuffers.end()),
          m_ColorTargets(desc.ColorTargets.begin(), desc.ColorTargets.end()),
          m_Topology(desc.Topology),
          m_StripIndexFormat(desc.StripIndexFormat),
          m_Cull(desc.Cull),
          m_Polygon(desc.Polygon),
          m_DepthStencil(desc.DepthStencil),
          m_VertexEntry(desc.Vertex.EntryPoint),
          m_HasFragment(desc.Fragment.has_value())
    {
        for (const IBindGroupLayout* layout : desc.BindGroupLayouts)
            m_BindGroupLayoutIds.push_back(layout->GetId());
    }

    NullComputePipeline::NullComputePipeline(uint64_t id, const ComputePipelineDesc& desc)
        : m_Id(id), m_EntryPoint(desc.Compute.EntryPoint)
    {
        for (const IBindGroupLayout* layout : desc.BindGroupLayouts)
            m_BindGroupLayoutIds.push_back(layout->GetId());
    }

    // --- Recorder ---

    void NullCommandRecorder::BeginRenderPass(const RenderPassDesc& desc)
    {
        Recorded::BeginRenderPass cmd;
        cmd.Label = std::string(desc.Label);
        for (const ColorAttachment& color : desc.ColorAttachments)
        {
            cmd.Colors.push_back({
                .View = color.View ? color.View->GetId() : 0,
                .Load = color.Load,
                .Clear = color.Clear,
                .Store = color.Store,
            });
        }
        if (desc.DepthStencil && desc.DepthStencil->View)
            cmd.DepthStencilView = desc.DepthStencil->View->GetId();

        m_Commands.emplace_back(std::move(cmd));
    }

    void NullCommandRecorder::EndRenderPass()
    {
        m_Commands.emplace_back(Recorded::EndRenderPass{});
    }

    void NullCommandRecorder::BeginComputePass(std::string_view label)
    {
        m_Commands.emplace_back(Recorded::BeginComputePass{std::string(label)});
    }

    void NullCommandRecorder::EndComputePass()
    {
        m_Commands.emplace_back(Recorded::EndComputePass{});
    }

    void NullCommandRecorder::SetRenderPipeline(const IRenderPipeline& pipeline)
    {
        m_Commands.emplace_back(Recorded::SetRenderPipeline{pipeline.GetId()});
    }

    void NullCommandRecorder::SetComputePipeline(const IComputePipeline& pipeline)
    {
        m_Commands.emplace_back(Recorded::SetComputePipeline{pipeline.GetId()});
    }

    void NullCommandRecorder::SetBindGroup(uint32_t slot, const IBindGroup& group)
    {
        m_Commands.emplace_back(Recorded::SetBindGroup{slot, group.GetId()});
    }

    void NullCommandRecorder::SetVertexBuffer(uint32_t slot, const IBuffer& buffer)
    {
        m_Commands.emplace_back(Recorded::SetVertexBuffer{slot, buffer.GetId()});
    }

    void NullCommandRecorder::SetIndexBuffer(const IBuffer& buffer, IndexFormat format)
    {
        m_Commands.emplace_back(Recorded::SetIndexBuffer{buffer.GetId(), format});
    }

    void NullCommandRecorder::Draw(uint32_t vertexCount, uint32_t instanceCount)
    {
        m_Commands.emplace_back(Recorded::Draw{vertexCount, instanceCount});
    }

    void NullCommandRecorder::DrawIndexed(uint32_t indexCount, uint32_t instanceCount)
    {
        m_Commands.emplace_back(Recorded::DrawIndexed{indexCount, instanceCount});
    }

    void NullCommandRecorder::Dispatch(uint32_t x, uint32_t y, uint32_t z)
    {
        m_Commands.emplace_back(Recorded::Dispatch{x, y, z});
    }

    // --- Device ---

    NullDevice::NullDevice(const NullDeviceConfig& config)
        : m_Config(config), m_SurfaceExtent(config.SurfaceExtent)
    {
        m_SurfaceView = std::make_unique<NullTextureView>(NextId(), m_Config.SurfaceFormat);
        Core::Log::Info("NullDevice: surface {}x{}", m_SurfaceExtent.Width, m_SurfaceExtent.Height);
    }

    bool NullDevice::ConsumeAllocationFailure(std::string_view kind, std::string_view label)
    {
        if (!m_AllocationsBeforeFailure) return false;
        if (*m_AllocationsBeforeFailure > 0)
        {
            --*m_AllocationsBeforeFailure;
            return false;
        }

        m_AllocationsBeforeFailure.reset();
        Core::Log::Error("NullDevice: injected allocation failure for {} '{}'", kind, label);
        return true;
    }

    Core::Expected<std::unique_ptr<IBuffer>> NullDevice::CreateBuffer(const BufferDesc& desc)
    {
        if (desc.Size == 0)
        {
            Core::Log::Error("NullDevice::CreateBuffer(): zero-sized buffer '{}'", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        if (ConsumeAllocationFailure("buffer", desc.Label))
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        ++m_Stats.BuffersCreated;
        return std::make_unique<NullBuffer>(NextId(), desc);
    }

    Core::Expected<std::unique_ptr<ITexture>> NullDevice::CreateTexture(const TextureDesc& desc)
    {
        if (desc.Size.TexelCount() == 0 || desc.Format == TextureFormat::Undefined)
        {
            Core::Log::Error("NullDevice::CreateTexture(): invalid size or format for '{}'", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        if (ConsumeAllocationFailure("texture", desc.Label))
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        ++m_Stats.TexturesCreated;
        const uint64_t id = NextId();
        const uint64_t viewId = NextId();
        return std::make_unique<NullTexture>(id, viewId, desc);
    }

    Core::Expected<std::unique_ptr<ISampler>> NullDevice::CreateSampler(const SamplerDesc& desc)
    {
        ++m_Stats.SamplersCreated;
        return std::make_unique<NullSampler>(NextId(), desc);
    }

    Core::Expected<std::unique_ptr<IShaderModule>> NullDevice::CreateShaderModule(
        std::span<const uint32_t> spirv, ShaderStage stage, std::string_view label)
    {
        if (spirv.empty())
        {
            Core::Log::Error("NullDevice::CreateShaderModule(): empty module '{}'", label);
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        ++m_Stats.ShaderModulesCreated;
        return std::make_unique<NullShaderModule>(NextId(), stage, spirv.size());
    }

    Core::Expected<std::unique_ptr<IBindGroupLayout>> NullDevice::CreateBindGroupLayout(
        std::span<const BindGroupLayoutEntry> entries, [[maybe_unused]] std::string_view label)
    {
        ++m_Stats.BindGroupLayoutsCreated;
        return std::make_unique<NullBindGroupLayout>(NextId(), entries);
    }

    Core::Expected<std::unique_ptr<IBindGroup>> NullDevice::CreateBindGroup(
        const IBindGroupLayout& layout, std::span<const BindGroupEntry> entries, std::string_view label)
    {
        const auto layoutEntries = layout.GetEntries();
        if (layoutEntries.size() != entries.size())
        {
            Core::Log::Error("NullDevice::CreateBindGroup(): '{}' has {} entries, layout expects {}",
                             label, entries.size(), layoutEntries.size());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        std::vector<NullBinding> bindings;
        bindings.reserve(entries.size());
        for (const BindGroupEntry& entry : entries)
        {
            auto it = std::ranges::find(layoutEntries, entry.Binding, &BindGroupLayoutEntry::Binding);
            if (it == layoutEntries.end())
            {
                Core::Log::Error("NullDevice::CreateBindGroup(): '{}' binding {} not in layout", label, entry.Binding);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            const IDeviceObject* resource = nullptr;
            switch (it->Kind)
            {
            case BindingKind::UniformBuffer:
            case BindingKind::StorageBuffer:  resource = entry.Buffer; break;
            case BindingKind::SampledTexture:
            case BindingKind::StorageTexture: resource = entry.Texture; break;
            case BindingKind::Sampler:        resource = entry.Sampler; break;
            }

            if (!resource)
            {
                Core::Log::Error("NullDevice::CreateBindGroup(): '{}' binding {} has no resource of the layout's kind",
                                 label, entry.Binding);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            bindings.push_back({entry.Binding, resource->GetId()});
        }

        if (ConsumeAllocationFailure("bind group", label))
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        ++m_Stats.BindGroupsCreated;
        return std::make_unique<NullBindGroup>(NextId(), layout.GetId(), std::move(bindings));
    }

    Core::Expected<std::unique_ptr<IRenderPipeline>> NullDevice::CreateRenderPipeline(const RenderPipelineDesc& desc)
    {
        if (!desc.Vertex.Module)
        {
            Core::Log::Error("NullDevice::CreateRenderPipeline(): '{}' has no vertex module", desc.Label);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        ++m_Stats.RenderPipelinesCreated;
        return std::make_unique<NullRenderPipeline>(NextId(), desc);
    }

    Core::Expected<std::unique_ptr<IComputePipeline>> NullDevice::CreateComputePipeline(const ComputePipelineDesc& desc)
    {
        if (!desc.Compute.Module)
        {
            Core::Log::Error("NullDevice::CreateComputePipeline(): '{}' has no compute module", desc.Label);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        ++m_Stats.ComputePipelinesCreated;
        return std::make_unique<NullComputePipeline>(NextId(), desc);
    }

    Core::Result NullDevice::WriteBuffer(const IBuffer& buffer, uint64_t offset, std::span<const std::byte> data)
    {
        const auto bytes = static_cast<const NullBuffer&>(buffer).GetBytes();
        if (offset + data.size() > bytes.size())
        {
            Core::Log::Error("NullDevice::WriteBuffer(): out of bounds. size={} offset={} cap={}",
                             data.size(), offset, bytes.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        std::memcpy(bytes.data() + offset, data.data(), data.size());
        ++m_Stats.BufferWrites;
        return Core::Ok();
    }

    Core::Result NullDevice::ReadBuffer(const IBuffer& buffer, uint64_t offset, std::span<std::byte> out)
    {
        const auto bytes = static_cast<const NullBuffer&>(buffer).GetBytes();
        if (offset + out.size() > bytes.size())
        {
            Core::Log::Error("NullDevice::ReadBuffer(): out of bounds. size={} offset={} cap={}",
                             out.size(), offset, bytes.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        std::memcpy(out.data(), bytes.data() + offset, out.size());
        return Core::Ok();
    }

    Core::Result NullDevice::WriteTexture(const ITexture& texture, std::span<const std::byte> data)
    {
        const auto bytes = static_cast<const NullTexture&>(texture).GetBytes();
        if (data.size() != bytes.size())
        {
            Core::Log::Error("NullDevice::WriteTexture(): expected {} bytes, got {}", bytes.size(), data.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        std::memcpy(bytes.data(), data.data(), data.size());
        ++m_Stats.TextureWrites;
        return Core::Ok();
    }

    Core::Result NullDevice::ConfigureSurface(Extent2D extent)
    {
        if (extent.Width == 0 || extent.Height == 0)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        m_SurfaceExtent = extent;
        // A reconfigured surface hands out new images.
        m_SurfaceView = std::make_unique<NullTextureView>(NextId(), m_Config.SurfaceFormat);
        m_TargetAcquired = false;
        ++m_Stats.SurfaceConfigurations;
        return Core::Ok();
    }

    std::expected<SurfaceTarget, SurfaceError> NullDevice::AcquireSurfaceTarget()
    {
        ++m_Stats.Acquires;

        if (m_PendingAcquireError)
        {
            const SurfaceError error = *m_PendingAcquireError;
            m_PendingAcquireError.reset();
            return std::unexpected(error);
        }

        if (m_TargetAcquired)
        {
            Core::Log::Error("NullDevice::AcquireSurfaceTarget(): previous target was never presented");
            return std::unexpected(SurfaceError::Timeout);
        }

        m_TargetAcquired = true;
        return SurfaceTarget{.View = m_SurfaceView.get(), .ImageIndex = 0};
    }

    ICommandRecorder& NullDevice::BeginCommands()
    {
        m_Recorder.Reset();
        return m_Recorder;
    }

    Core::Result NullDevice::Submit(ICommandRecorder& recorder)
    {
        if (&recorder != &m_Recorder || !m_Recorder.IsOpen())
        {
            Core::Log::Error("NullDevice::Submit(): recorder is not open on this device");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        m_Recorder.Close();
        m_LastSubmitted = std::move(m_Recorder.GetCommands());
        m_Recorder.GetCommands().clear();
        ++m_Stats.Submits;
        return Core::Ok();
    }

    Core::Result NullDevice::Present(const SurfaceTarget& target)
    {
        if (!m_TargetAcquired || target.View != m_SurfaceView.get())
        {
            Core::Log::Error("NullDevice::Present(): target was not acquired from the current surface");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        m_TargetAcquired = false;
        ++m_Stats.Presents;
        return Core::Ok();
    }
}
