module;
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

module Cairn:Builders.Impl;
import :Builders;
import Core;
import RHI;

namespace Cairn
{
    namespace
    {
        bool IsValidSampleCount(uint32_t samples)
        {
            return samples == 1 || samples == 2 || samples == 4 || samples == 8;
        }

        bool NeedsMapAlignment(RHI::BufferUsage usage)
        {
            return RHI::HasFlag(usage, RHI::BufferUsage::Uniform) || RHI::HasFlag(usage, RHI::BufferUsage::Storage);
        }

        // Resolves a shader handle and checks it was compiled for the stage it
        // is about to be used as.
        Core::Expected<const RHI::IShaderModule*> ResolveShader(const ResourceStore& store, const ShaderRef& ref,
                                                                RHI::ShaderStage stage, std::string_view pipeline)
        {
            auto shader = store.GetShaders().Get(ref.Shader);
            if (!shader)
            {
                Core::Log::Error("Pipeline '{}': shader handle {} is not registered", pipeline, ref.Shader.Index);
                return std::unexpected(shader.error());
            }

            if ((*shader)->GetStage() != stage)
            {
                Core::Log::Error("Pipeline '{}': shader '{}' was compiled for another stage",
                                 pipeline, (*shader)->GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            return &(*shader)->GetGpu();
        }

        Core::Expected<std::vector<const RHI::IBindGroupLayout*>> ResolveBindGroupLayouts(
            const ResourceStore& store, std::span<const BindGroupHandle> groups, std::string_view pipeline)
        {
            std::vector<const RHI::IBindGroupLayout*> layouts;
            layouts.reserve(groups.size());
            for (BindGroupHandle handle : groups)
            {
                auto group = store.GetBindGroups().Get(handle);
                if (!group)
                {
                    Core::Log::Error("Pipeline '{}': bind group handle {} is not registered", pipeline, handle.Index);
                    return std::unexpected(group.error());
                }
                layouts.push_back(&(*group)->GetLayout());
            }
            return layouts;
        }
    }

    // --- Buffer / Texture ----------------------------------------------------

    namespace Detail
    {
        Core::Expected<BufferHandle> BuildBuffer(ResourceStore& store, const BufferSpec& spec,
                                                 uint64_t count, std::span<const std::byte> init)
        {
            RHI::IDevice& device = store.GetDevice();

            if (count == 0)
            {
                Core::Log::Error("Buffer '{}': cannot build with zero elements", spec.Label);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            if (NeedsMapAlignment(spec.Usage) && spec.ElementSize % device.GetMapAlignment() != 0)
            {
                Core::Log::Error("Buffer '{}': {}-byte elements are not a multiple of the {}-byte map alignment",
                                 spec.Label, spec.ElementSize, device.GetMapAlignment());
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            const uint64_t size = init.empty() ? count * spec.ElementSize : init.size();
            auto gpu = device.CreateBuffer({.Size = size, .Usage = spec.Usage, .Label = spec.Label});
            if (!gpu)
            {
                Core::Log::Error("Buffer '{}': allocation of {} bytes failed", spec.Label, size);
                return std::unexpected(gpu.error());
            }

            if (!init.empty())
            {
                if (auto written = device.WriteBuffer(**gpu, 0, init); !written)
                    return std::unexpected(written.error());
            }

            const BufferHandle handle = store.GetBuffers().Create(
                spec.ElementType, spec.ElementSize, spec.Usage, spec.VertexLayout, std::move(*gpu), spec.Label);

            Core::Log::Debug("Buffer '{}' built: {} x {} bytes", spec.Label, count, spec.ElementSize);
            return handle;
        }

        Core::Expected<TextureHandle> BuildTexture(ResourceStore& store, const TextureSpec& spec)
        {
            if (!spec.Policy)
            {
                Core::Log::Error("Texture '{}': no size policy set", spec.Label);
                return std::unexpected(Core::ErrorCode::InvalidState);
            }

            if (spec.Policy->Kind == SizePolicyKind::SurfaceScaled &&
                !(std::isfinite(spec.Policy->Scale) && spec.Policy->Scale > 0.0f))
            {
                Core::Log::Error("Texture '{}': surface scale {} must be positive", spec.Label, spec.Policy->Scale);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            if (spec.MipLevels == 0 || !IsValidSampleCount(spec.SampleCount))
            {
                Core::Log::Error("Texture '{}': invalid mip count {} or sample count {}",
                                 spec.Label, spec.MipLevels, spec.SampleCount);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            // Attachments are rendered through a single-level view.
            if (spec.MipLevels > 1 && RHI::HasFlag(spec.Usage, RHI::TextureUsage::RenderAttachment))
            {
                Core::Log::Error("Texture '{}': a render attachment cannot have {} mip levels",
                                 spec.Label, spec.MipLevels);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            const RHI::Extent3D extent = spec.Policy->Evaluate(store.GetSurfaceExtent());
            if (extent.TexelCount() == 0)
            {
                Core::Log::Error("Texture '{}': extent {}x{}x{} has no texels",
                                 spec.Label, extent.Width, extent.Height, extent.Depth);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            const RHI::TextureDesc desc{
                .Dimension = spec.Dimension,
                .Size = extent,
                .Format = spec.Format,
                .Usage = spec.Usage,
                .MipLevels = spec.MipLevels,
                .SampleCount = spec.SampleCount,
                .Label = spec.Label,
            };

            auto gpu = store.GetDevice().CreateTexture(desc);
            if (!gpu)
            {
                Core::Log::Error("Texture '{}': allocation failed", spec.Label);
                return std::unexpected(gpu.error());
            }

            const TextureHandle handle = store.GetTextures().Create(
                spec.ElementType, desc, *spec.Policy, std::move(*gpu), spec.Label);

            Core::Log::Debug("Texture '{}' built: {}x{}x{}", spec.Label, extent.Width, extent.Height, extent.Depth);
            return handle;
        }
    }

    // --- Sampler -------------------------------------------------------------

    SamplerBuilder& SamplerBuilder::AddressMode(RHI::AddressMode all)
    {
        return AddressModes(all, all, all);
    }

    SamplerBuilder& SamplerBuilder::AddressModes(RHI::AddressMode u, RHI::AddressMode v, RHI::AddressMode w)
    {
        m_Desc.AddressU = u;
        m_Desc.AddressV = v;
        m_Desc.AddressW = w;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::MagFilter(RHI::FilterMode filter)
    {
        m_Desc.MagFilter = filter;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::MinFilter(RHI::FilterMode filter)
    {
        m_Desc.MinFilter = filter;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::MipmapFilter(RHI::FilterMode filter)
    {
        m_Desc.MipmapFilter = filter;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::LodClamp(float min, float max)
    {
        m_Desc.LodMinClamp = min;
        m_Desc.LodMaxClamp = max;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::Compare(RHI::CompareFunction compare)
    {
        m_Desc.Compare = compare;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::Anisotropy(uint16_t clamp)
    {
        m_Desc.AnisotropyClamp = clamp;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::Border(RHI::BorderColor color)
    {
        m_Desc.Border = color;
        return *this;
    }

    SamplerBuilder& SamplerBuilder::Label(std::string_view label)
    {
        m_Desc.Label = label;
        return *this;
    }

    Core::Expected<SamplerHandle> SamplerBuilder::Build()
    {
        if (m_Desc.LodMinClamp < 0.0f || m_Desc.LodMinClamp > m_Desc.LodMaxClamp)
        {
            Core::Log::Error("Sampler '{}': lod clamp [{}, {}] is not a valid range",
                             m_Desc.Label, m_Desc.LodMinClamp, m_Desc.LodMaxClamp);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        if (m_Desc.AnisotropyClamp == 0)
        {
            Core::Log::Error("Sampler '{}': anisotropy clamp must be at least 1", m_Desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto gpu = m_Store.GetDevice().CreateSampler(m_Desc);
        if (!gpu)
        {
            Core::Log::Error("Sampler '{}': creation failed", m_Desc.Label);
            return std::unexpected(gpu.error());
        }

        const SamplerHandle handle = m_Store.GetSamplers().Create(std::move(*gpu), m_Desc);
        Core::Log::Debug("Sampler '{}' built", m_Desc.Label);
        return handle;
    }

    // --- Bind group ----------------------------------------------------------

    BindGroupBuilder& BindGroupBuilder::BindUniformBuffer(uint32_t binding, RHI::ShaderVisibility visibility,
                                                          BufferHandle buffer)
    {
        m_Bindings.push_back({
            .Layout = {.Binding = binding, .Visibility = visibility, .Kind = RHI::BindingKind::UniformBuffer},
            .Target = buffer,
        });
        return *this;
    }

    BindGroupBuilder& BindGroupBuilder::BindStorageBuffer(uint32_t binding, RHI::ShaderVisibility visibility,
                                                          bool readOnly, BufferHandle buffer)
    {
        m_Bindings.push_back({
            .Layout = {.Binding = binding, .Visibility = visibility, .Kind = RHI::BindingKind::StorageBuffer,
                       .ReadOnly = readOnly},
            .Target = buffer,
        });
        return *this;
    }

    BindGroupBuilder& BindGroupBuilder::BindTexture(uint32_t binding, RHI::ShaderVisibility visibility,
                                                    RHI::TextureSampleType sampleType,
                                                    RHI::TextureViewDimension viewDimension,
                                                    bool multisampled, TextureHandle texture)
    {
        m_Bindings.push_back({
            .Layout = {.Binding = binding, .Visibility = visibility, .Kind = RHI::BindingKind::SampledTexture,
                       .SampleType = sampleType, .ViewDimension = viewDimension, .Multisampled = multisampled},
            .Target = texture,
        });
        return *this;
    }

    BindGroupBuilder& BindGroupBuilder::BindStorageTexture(uint32_t binding, RHI::ShaderVisibility visibility,
                                                           RHI::StorageTextureAccess access,
                                                           RHI::TextureViewDimension viewDimension,
                                                           TextureHandle texture)
    {
        m_Bindings.push_back({
            .Layout = {.Binding = binding, .Visibility = visibility, .Kind = RHI::BindingKind::StorageTexture,
                       .ViewDimension = viewDimension, .Access = access},
            .Target = texture,
        });
        return *this;
    }

    BindGroupBuilder& BindGroupBuilder::BindSampler(uint32_t binding, RHI::ShaderVisibility visibility,
                                                    RHI::SamplerBindingType samplerType, SamplerHandle sampler)
    {
        m_Bindings.push_back({
            .Layout = {.Binding = binding, .Visibility = visibility, .Kind = RHI::BindingKind::Sampler,
                       .SamplerType = samplerType},
            .Target = sampler,
        });
        return *this;
    }

    BindGroupBuilder& BindGroupBuilder::Label(std::string_view label)
    {
        m_Label = label;
        return *this;
    }

    Core::Result BindGroupBuilder::Validate(std::vector<BindGroupBinding>& bindings) const
    {
        const uint32_t alignment = m_Store.GetDevice().GetMapAlignment();

        for (size_t i = 0; i < bindings.size(); ++i)
        {
            RHI::BindGroupLayoutEntry& layout = bindings[i].Layout;

            const bool duplicate = std::any_of(bindings.begin(), bindings.begin() + static_cast<std::ptrdiff_t>(i),
                [&](const BindGroupBinding& other) { return other.Layout.Binding == layout.Binding; });
            if (duplicate)
            {
                Core::Log::Error("BindGroup '{}': binding {} is declared twice", m_Label, layout.Binding);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            Core::Result checked = std::visit([&](auto handle) -> Core::Result
            {
                using H = std::decay_t<decltype(handle)>;

                if constexpr (std::is_same_v<H, BufferHandle>)
                {
                    auto buffer = m_Store.GetBuffers().Get(handle);
                    if (!buffer)
                    {
                        Core::Log::Error("BindGroup '{}': binding {} buffer handle {} is not registered",
                                         m_Label, layout.Binding, handle.Index);
                        return std::unexpected(buffer.error());
                    }

                    const bool uniform = layout.Kind == RHI::BindingKind::UniformBuffer;
                    const RHI::BufferUsage required = uniform ? RHI::BufferUsage::Uniform : RHI::BufferUsage::Storage;
                    if (!RHI::HasFlag((*buffer)->GetUsage(), required))
                    {
                        Core::Log::Error("BindGroup '{}': buffer '{}' at binding {} lacks {} usage",
                                         m_Label, (*buffer)->GetLabel(), layout.Binding, uniform ? "uniform" : "storage");
                        return std::unexpected(Core::ErrorCode::InvalidArgument);
                    }

                    if ((*buffer)->GetElementSize() % alignment != 0)
                    {
                        Core::Log::Error("BindGroup '{}': buffer '{}' elements ({} bytes) break the {}-byte map alignment",
                                         m_Label, (*buffer)->GetLabel(), (*buffer)->GetElementSize(), alignment);
                        return std::unexpected(Core::ErrorCode::InvalidArgument);
                    }

                    if (uniform)
                        layout.MinBindingSize = (*buffer)->GetElementSize();
                    return Core::Ok();
                }
                else if constexpr (std::is_same_v<H, TextureHandle>)
                {
                    if (handle == SurfaceTexture)
                    {
                        Core::Log::Error("BindGroup '{}': the surface texture cannot be bound (binding {})",
                                         m_Label, layout.Binding);
                        return std::unexpected(Core::ErrorCode::InvalidArgument);
                    }

                    auto texture = m_Store.GetTextures().Get(handle);
                    if (!texture)
                    {
                        Core::Log::Error("BindGroup '{}': binding {} texture handle {} is not registered",
                                         m_Label, layout.Binding, handle.Index);
                        return std::unexpected(texture.error());
                    }

                    const bool storage = layout.Kind == RHI::BindingKind::StorageTexture;
                    const RHI::TextureUsage required = storage ? RHI::TextureUsage::Storage : RHI::TextureUsage::Sampled;
                    if (!RHI::HasFlag((*texture)->GetUsage(), required))
                    {
                        Core::Log::Error("BindGroup '{}': texture '{}' at binding {} lacks {} usage",
                                         m_Label, (*texture)->GetLabel(), layout.Binding, storage ? "storage" : "sampled");
                        return std::unexpected(Core::ErrorCode::InvalidArgument);
                    }

                    if (storage)
                        layout.Format = (*texture)->GetFormat();
                    return Core::Ok();
                }
                else
                {
                    if (!m_Store.GetSamplers().Contains(handle))
                    {
                        Core::Log::Error("BindGroup '{}': binding {} sampler handle {} is not registered",
                                         m_Label, layout.Binding, handle.Index);
                        return std::unexpected(Core::ErrorCode::ResourceNotFound);
                    }
                    return Core::Ok();
                }
            }, bindings[i].Target);

            if (!checked) return checked;
        }

        return Core::Ok();
    }

    Core::Expected<BindGroupHandle> BindGroupBuilder::Build()
    {
        std::vector<BindGroupBinding> bindings = m_Bindings;
        if (auto valid = Validate(bindings); !valid)
            return std::unexpected(valid.error());

        std::vector<RHI::BindGroupLayoutEntry> entries;
        entries.reserve(bindings.size());
        for (const BindGroupBinding& binding : bindings)
            entries.push_back(binding.Layout);

        RHI::IDevice& device = m_Store.GetDevice();
        auto layout = device.CreateBindGroupLayout(entries, m_Label);
        if (!layout)
        {
            Core::Log::Error("BindGroup '{}': layout creation failed", m_Label);
            return std::unexpected(layout.error());
        }

        auto group = std::make_unique<BindGroup>(std::move(bindings), std::move(*layout), m_Label);
        if (auto instantiated = group->Instantiate(device, m_Store); !instantiated)
        {
            Core::Log::Error("BindGroup '{}': first resolution failed", m_Label);
            return std::unexpected(instantiated.error());
        }

        const BindGroupHandle handle = m_Store.GetBindGroups().Add(std::move(group));
        Core::Log::Debug("BindGroup '{}' built with {} binding(s)", m_Label, entries.size());
        return handle;
    }

    // --- Render pipeline -----------------------------------------------------

    RenderPipelineBuilder& RenderPipelineBuilder::VertexShader(ShaderHandle shader, std::string_view entryPoint)
    {
        m_Vertex = ShaderRef{shader, std::string(entryPoint)};
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::FragmentShader(ShaderHandle shader, std::string_view entryPoint)
    {
        m_Fragment = ShaderRef{shader, std::string(entryPoint)};
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::Topology(RHI::PrimitiveTopology topology)
    {
        m_Topology = topology;
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::FrontFace(RHI::FrontFace winding)
    {
        m_FrontFace = winding;
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::Culling(RHI::CullMode cull)
    {
        m_Cull = cull;
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::Polygon(RHI::PolygonMode mode)
    {
        m_Polygon = mode;
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::UnclippedDepth(bool unclipped)
    {
        m_UnclippedDepth = unclipped;
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::DepthStencilFormat(RHI::TextureFormat format, bool depthWrite,
                                                                     RHI::CompareFunction compare,
                                                                     RHI::StencilState stencil,
                                                                     RHI::DepthBiasState bias)
    {
        m_DepthStencil = RHI::DepthStencilState{
            .Format = format,
            .DepthWriteEnabled = depthWrite,
            .DepthCompare = compare,
            .Stencil = stencil,
            .Bias = bias,
        };
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::ColorTarget(RHI::TextureFormat format)
    {
        m_ColorTargets.push_back(format);
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::AddVertexBuffer(BufferHandle buffer)
    {
        m_Bindings.VertexBuffers.push_back(buffer);
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::AddInstanceBuffer(BufferHandle buffer)
    {
        m_Bindings.InstanceBuffers.push_back(buffer);
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::AddIndexBuffer(BufferHandle buffer)
    {
        m_Bindings.IndexBuffer = buffer;
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::AddBindGroup(BindGroupHandle group)
    {
        m_Bindings.BindGroups.push_back(group);
        return *this;
    }

    RenderPipelineBuilder& RenderPipelineBuilder::Label(std::string_view label)
    {
        m_Label = label;
        return *this;
    }

    Core::Expected<RenderPipelineHandle> RenderPipelineBuilder::Build()
    {
        if (!m_Vertex || !m_Topology || !m_FrontFace)
        {
            Core::Log::Error("RenderPipeline '{}': missing {}", m_Label,
                             !m_Vertex ? "vertex shader" : !m_Topology ? "primitive topology" : "front face");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        auto vertexModule = ResolveShader(m_Store, *m_Vertex, RHI::ShaderStage::Vertex, m_Label);
        if (!vertexModule) return std::unexpected(vertexModule.error());

        std::optional<RHI::ShaderEntryPoint> fragment;
        if (m_Fragment)
        {
            auto fragmentModule = ResolveShader(m_Store, *m_Fragment, RHI::ShaderStage::Fragment, m_Label);
            if (!fragmentModule) return std::unexpected(fragmentModule.error());
            fragment = RHI::ShaderEntryPoint{*fragmentModule, m_Fragment->EntryPoint};
        }

        // Vertex slots first, instance slots after, in attachment order.
        std::vector<RHI::VertexBufferLayout> vertexLayouts;
        const auto collectLayouts = [&](std::span<const BufferHandle> handles, RHI::VertexStepMode stepMode) -> Core::Result
        {
            for (BufferHandle handle : handles)
            {
                auto buffer = m_Store.GetBuffers().Get(handle);
                if (!buffer)
                {
                    Core::Log::Error("RenderPipeline '{}': buffer handle {} is not registered", m_Label, handle.Index);
                    return std::unexpected(buffer.error());
                }

                const auto& layout = (*buffer)->GetVertexLayout();
                if (!layout)
                {
                    Core::Log::Error("RenderPipeline '{}': buffer '{}' was never marked as a vertex or instance source",
                                     m_Label, (*buffer)->GetLabel());
                    return std::unexpected(Core::ErrorCode::InvalidArgument);
                }

                RHI::VertexBufferLayout slot = *layout;
                slot.StepMode = stepMode;
                vertexLayouts.push_back(std::move(slot));
            }
            return Core::Ok();
        };

        if (auto collected = collectLayouts(m_Bindings.VertexBuffers, RHI::VertexStepMode::Vertex); !collected)
            return std::unexpected(collected.error());
        if (auto collected = collectLayouts(m_Bindings.InstanceBuffers, RHI::VertexStepMode::Instance); !collected)
            return std::unexpected(collected.error());

        std::optional<RHI::IndexFormat> indexFormat;
        if (m_Bindings.IndexBuffer)
        {
            auto buffer = m_Store.GetBuffers().Get(*m_Bindings.IndexBuffer);
            if (!buffer)
            {
                Core::Log::Error("RenderPipeline '{}': index buffer handle {} is not registered",
                                 m_Label, m_Bindings.IndexBuffer->Index);
                return std::unexpected(buffer.error());
            }

            indexFormat = RHI::IndexFormatFromElementSize((*buffer)->GetElementSize());
            if (!indexFormat)
            {
                Core::Log::Error("RenderPipeline '{}': index buffer '{}' has {}-byte elements, need 2 or 4",
                                 m_Label, (*buffer)->GetLabel(), (*buffer)->GetElementSize());
                return std::unexpected(Core::ErrorCode::InvalidFormat);
            }

            if (!RHI::HasFlag((*buffer)->GetUsage(), RHI::BufferUsage::Index))
            {
                Core::Log::Error("RenderPipeline '{}': buffer '{}' lacks index usage", m_Label, (*buffer)->GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }
        }

        auto layouts = ResolveBindGroupLayouts(m_Store, m_Bindings.BindGroups, m_Label);
        if (!layouts) return std::unexpected(layouts.error());

        if (m_DepthStencil && !RHI::IsDepthFormat(m_DepthStencil->Format))
        {
            Core::Log::Error("RenderPipeline '{}': depth-stencil state needs a depth format", m_Label);
            return std::unexpected(Core::ErrorCode::InvalidFormat);
        }

        std::vector<RHI::TextureFormat> colorTargets = m_ColorTargets;
        if (colorTargets.empty())
            colorTargets.push_back(m_Store.GetSurfaceFormat());

        const RHI::RenderPipelineDesc desc{
            .Vertex = {*vertexModule, m_Vertex->EntryPoint},
            .Fragment = fragment,
            .VertexBuffers = vertexLayouts,
            .BindGroupLayouts = *layouts,
            .Topology = *m_Topology,
            .StripIndexFormat = RHI::IsStripTopology(*m_Topology) ? indexFormat : std::optional<RHI::IndexFormat>{},
            .Winding = *m_FrontFace,
            .Cull = m_Cull,
            .Polygon = m_Polygon,
            .UnclippedDepth = m_UnclippedDepth,
            .DepthStencil = m_DepthStencil,
            .ColorTargets = colorTargets,
            .Label = m_Label,
        };

        auto gpu = m_Store.GetDevice().CreateRenderPipeline(desc);
        if (!gpu)
        {
            Core::Log::Error("RenderPipeline '{}': creation failed", m_Label);
            return std::unexpected(gpu.error());
        }

        const RenderPipelineHandle handle =
            m_Store.GetRenderPipelines().Create(std::move(*gpu), m_Bindings, *m_Topology, m_Label);
        Core::Log::Debug("RenderPipeline '{}' built: {} vertex slot(s), {} bind group(s)",
                         m_Label, vertexLayouts.size(), m_Bindings.BindGroups.size());
        return handle;
    }

    // --- Compute pipeline ----------------------------------------------------

    ComputePipelineBuilder& ComputePipelineBuilder::Shader(ShaderHandle shader, std::string_view entryPoint)
    {
        m_Shader = ShaderRef{shader, std::string(entryPoint)};
        return *this;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::WorkGroups(uint32_t x, uint32_t y, uint32_t z)
    {
        m_WorkGroups = std::array<uint32_t, 3>{x, y, z};
        return *this;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::AddBindGroup(BindGroupHandle group)
    {
        m_BindGroups.push_back(group);
        return *this;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::Label(std::string_view label)
    {
        m_Label = label;
        return *this;
    }

    Core::Expected<ComputePipelineHandle> ComputePipelineBuilder::Build()
    {
        if (!m_Shader || !m_WorkGroups)
        {
            Core::Log::Error("ComputePipeline '{}': missing {}", m_Label, !m_Shader ? "shader" : "workgroup count");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        if (std::ranges::any_of(*m_WorkGroups, [](uint32_t n) { return n == 0; }))
        {
            Core::Log::Error("ComputePipeline '{}': workgroup count {}x{}x{} has an empty axis", m_Label,
                             (*m_WorkGroups)[0], (*m_WorkGroups)[1], (*m_WorkGroups)[2]);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto computeModule = ResolveShader(m_Store, *m_Shader, RHI::ShaderStage::Compute, m_Label);
        if (!computeModule) return std::unexpected(computeModule.error());

        auto layouts = ResolveBindGroupLayouts(m_Store, m_BindGroups, m_Label);
        if (!layouts) return std::unexpected(layouts.error());

        const RHI::ComputePipelineDesc desc{
            .Compute = {*computeModule, m_Shader->EntryPoint},
            .BindGroupLayouts = *layouts,
            .Label = m_Label,
        };

        auto gpu = m_Store.GetDevice().CreateComputePipeline(desc);
        if (!gpu)
        {
            Core::Log::Error("ComputePipeline '{}': creation failed", m_Label);
            return std::unexpected(gpu.error());
        }

        const ComputePipelineHandle handle =
            m_Store.GetComputePipelines().Create(std::move(*gpu), m_BindGroups, *m_WorkGroups, m_Label);
        Core::Log::Debug("ComputePipeline '{}' built", m_Label);
        return handle;
    }

    // --- Render pass ---------------------------------------------------------

    RenderPassBuilder& RenderPassBuilder::AddColorAttachment(TextureHandle texture,
                                                             std::optional<RHI::ClearColor> clear, bool store)
    {
        m_Colors.push_back({texture, clear, store});
        return *this;
    }

    RenderPassBuilder& RenderPassBuilder::AddDepthStencilAttachment(TextureHandle texture,
                                                                    std::optional<RHI::DepthOps> depth,
                                                                    std::optional<RHI::StencilOps> stencil)
    {
        m_DepthStencil = DepthStencilAttachmentRef{texture, depth, stencil};
        return *this;
    }

    RenderPassBuilder& RenderPassBuilder::AddPipeline(RenderPipelineHandle pipeline)
    {
        m_Pipelines.push_back(pipeline);
        return *this;
    }

    RenderPassBuilder& RenderPassBuilder::Label(std::string_view label)
    {
        m_Label = label;
        return *this;
    }

    Core::Expected<RenderPassHandle> RenderPassBuilder::Build()
    {
        std::vector<ColorAttachmentRef> colors = m_Colors;
        if (colors.empty())
            colors.push_back({.Target = SurfaceTexture, .Clear = std::nullopt, .Store = true});

        for (const ColorAttachmentRef& color : colors)
        {
            if (color.Target == SurfaceTexture) continue;

            auto texture = m_Store.GetTextures().Get(color.Target);
            if (!texture)
            {
                Core::Log::Error("RenderPass '{}': color attachment handle {} is not registered",
                                 m_Label, color.Target.Index);
                return std::unexpected(texture.error());
            }

            if (!RHI::HasFlag((*texture)->GetUsage(), RHI::TextureUsage::RenderAttachment) ||
                RHI::IsDepthFormat((*texture)->GetFormat()))
            {
                Core::Log::Error("RenderPass '{}': texture '{}' is not a color render attachment",
                                 m_Label, (*texture)->GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }
        }

        if (m_DepthStencil)
        {
            if (m_DepthStencil->Target == SurfaceTexture)
            {
                Core::Log::Error("RenderPass '{}': the surface texture cannot be a depth attachment", m_Label);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }

            auto texture = m_Store.GetTextures().Get(m_DepthStencil->Target);
            if (!texture)
            {
                Core::Log::Error("RenderPass '{}': depth attachment handle {} is not registered",
                                 m_Label, m_DepthStencil->Target.Index);
                return std::unexpected(texture.error());
            }

            if (!RHI::IsDepthFormat((*texture)->GetFormat()))
            {
                Core::Log::Error("RenderPass '{}': depth attachment '{}' has no depth format",
                                 m_Label, (*texture)->GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidFormat);
            }

            if (!RHI::HasFlag((*texture)->GetUsage(), RHI::TextureUsage::RenderAttachment))
            {
                Core::Log::Error("RenderPass '{}': depth attachment '{}' lacks render attachment usage",
                                 m_Label, (*texture)->GetLabel());
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }
        }

        for (RenderPipelineHandle pipeline : m_Pipelines)
        {
            if (!m_Store.GetRenderPipelines().Contains(pipeline))
            {
                Core::Log::Error("RenderPass '{}': pipeline handle {} is not registered", m_Label, pipeline.Index);
                return std::unexpected(Core::ErrorCode::ResourceNotFound);
            }
        }

        const RenderPassHandle handle =
            m_Store.GetRenderPasses().Create(std::move(colors), m_DepthStencil, m_Pipelines, m_Label);
        m_Store.AppendPass(handle);

        Core::Log::Debug("RenderPass '{}' built with {} pipeline(s)", m_Label, m_Pipelines.size());
        return handle;
    }

    // --- Compute pass --------------------------------------------------------

    ComputePassBuilder& ComputePassBuilder::AddPipeline(ComputePipelineHandle pipeline)
    {
        m_Pipelines.push_back(pipeline);
        return *this;
    }

    ComputePassBuilder& ComputePassBuilder::Label(std::string_view label)
    {
        m_Label = label;
        return *this;
    }

    Core::Expected<ComputePassHandle> ComputePassBuilder::Build()
    {
        for (ComputePipelineHandle pipeline : m_Pipelines)
        {
            if (!m_Store.GetComputePipelines().Contains(pipeline))
            {
                Core::Log::Error("ComputePass '{}': pipeline handle {} is not registered", m_Label, pipeline.Index);
                return std::unexpected(Core::ErrorCode::ResourceNotFound);
            }
        }

        const ComputePassHandle handle = m_Store.GetComputePasses().Create(m_Pipelines, m_Label);
        m_Store.AppendPass(handle);

        Core::Log::Debug("ComputePass '{}' built with {} pipeline(s)", m_Label, m_Pipelines.size());
        return handle;
    }
}
