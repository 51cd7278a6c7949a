module;
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

export module Cairn:ResourceStore;

import Core;
import RHI;
import :Types;
import :Buffer;
import :Texture;
import :Sampler;
import :Shader;
import :BindGroup;
import :Pipeline;
import :Pass;

export namespace Cairn
{
    // -------------------------------------------------------------------------
    // ResourceStore - every registry of one context
    // -------------------------------------------------------------------------
    // Owns the typed records and implements the mutation protocol: content
    // writes, destructive reallocation and the bind group invalidation cascade
    // that must follow it. Builders borrow the store for the duration of one
    // Build() call; the frame executor reads it.
    // -------------------------------------------------------------------------
    class ResourceStore final : public IBindingResolver
    {
    public:
        explicit ResourceStore(RHI::IDevice& device);
        ~ResourceStore() override = default;

        ResourceStore(const ResourceStore&) = delete;
        ResourceStore& operator=(const ResourceStore&) = delete;

        [[nodiscard]] RHI::IDevice& GetDevice() const { return m_Device; }

        [[nodiscard]] Core::Registry<Buffer, BufferTag>& GetBuffers() { return m_Buffers; }
        [[nodiscard]] const Core::Registry<Buffer, BufferTag>& GetBuffers() const { return m_Buffers; }
        [[nodiscard]] Core::Registry<Texture, TextureTag>& GetTextures() { return m_Textures; }
        [[nodiscard]] const Core::Registry<Texture, TextureTag>& GetTextures() const { return m_Textures; }
        [[nodiscard]] Core::Registry<Sampler, SamplerTag>& GetSamplers() { return m_Samplers; }
        [[nodiscard]] const Core::Registry<Sampler, SamplerTag>& GetSamplers() const { return m_Samplers; }
        [[nodiscard]] Core::Registry<Shader, ShaderTag>& GetShaders() { return m_Shaders; }
        [[nodiscard]] const Core::Registry<Shader, ShaderTag>& GetShaders() const { return m_Shaders; }
        [[nodiscard]] Core::Registry<BindGroup, BindGroupTag>& GetBindGroups() { return m_BindGroups; }
        [[nodiscard]] const Core::Registry<BindGroup, BindGroupTag>& GetBindGroups() const { return m_BindGroups; }
        [[nodiscard]] Core::Registry<RenderPipeline, RenderPipelineTag>& GetRenderPipelines() { return m_RenderPipelines; }
        [[nodiscard]] const Core::Registry<RenderPipeline, RenderPipelineTag>& GetRenderPipelines() const { return m_RenderPipelines; }
        [[nodiscard]] Core::Registry<ComputePipeline, ComputePipelineTag>& GetComputePipelines() { return m_ComputePipelines; }
        [[nodiscard]] const Core::Registry<ComputePipeline, ComputePipelineTag>& GetComputePipelines() const { return m_ComputePipelines; }
        [[nodiscard]] Core::Registry<RenderPass, RenderPassTag>& GetRenderPasses() { return m_RenderPasses; }
        [[nodiscard]] const Core::Registry<RenderPass, RenderPassTag>& GetRenderPasses() const { return m_RenderPasses; }
        [[nodiscard]] Core::Registry<ComputePass, ComputePassTag>& GetComputePasses() { return m_ComputePasses; }
        [[nodiscard]] const Core::Registry<ComputePass, ComputePassTag>& GetComputePasses() const { return m_ComputePasses; }

        // --- Surface ---
        [[nodiscard]] RHI::Extent2D GetSurfaceExtent() const { return m_SurfaceExtent; }
        void SetSurfaceExtent(RHI::Extent2D extent) { m_SurfaceExtent = extent; }
        [[nodiscard]] RHI::TextureFormat GetSurfaceFormat() const { return m_Device.GetSurfaceFormat(); }

        // --- Pass order (creation order across render and compute passes) ---
        [[nodiscard]] const std::vector<PassRef>& GetPassOrder() const { return m_PassOrder; }
        void AppendPass(PassRef pass) { m_PassOrder.push_back(pass); }

        // --- IBindingResolver ---
        [[nodiscard]] Core::Expected<const RHI::IBuffer*> ResolveBuffer(BufferHandle handle) const override;
        [[nodiscard]] Core::Expected<const RHI::ITexture*> ResolveTexture(TextureHandle handle) const override;
        [[nodiscard]] Core::Expected<const RHI::ISampler*> ResolveSampler(SamplerHandle handle) const override;

        // --- Mutation protocol ---
        // true = the allocation was replaced and dependents were rebuilt.
        [[nodiscard]] Core::Expected<bool> WriteBuffer(BufferHandle handle, Core::TypeTag type,
                                                       std::span<const std::byte> data);
        // Whole capacity. Blocks until queued writes have landed.
        [[nodiscard]] Core::Expected<std::vector<std::byte>> ReadBuffer(BufferHandle handle, Core::TypeTag type) const;
        [[nodiscard]] Core::Result WriteTexture(TextureHandle handle, Core::TypeTag type,
                                                std::span<const std::byte> data);
        // Pins the texture to a fixed extent and always reallocates.
        [[nodiscard]] Core::Expected<bool> ResizeTexture(TextureHandle handle, RHI::Extent3D extent);
        // Re-evaluates every surface-relative texture; returns how many were
        // reallocated. Dependents are rebuilt once for the whole batch.
        [[nodiscard]] Core::Expected<uint32_t> ResizeSurfaceTextures(RHI::Extent2D surface);

        [[nodiscard]] Core::Result RecreateBindGroup(BindGroupHandle handle);

        // Rebuilds every bind group that depends on any of the given
        // resources, each at most once. Returns the number rebuilt.
        [[nodiscard]] Core::Expected<uint32_t> RebuildDependents(std::span<const BufferHandle> buffers,
                                                                 std::span<const TextureHandle> textures);

    private:
        [[nodiscard]] Core::Result ReallocateTexture(Texture& texture, RHI::Extent3D extent);

        RHI::IDevice& m_Device;
        RHI::Extent2D m_SurfaceExtent{};

        Core::Registry<Buffer, BufferTag> m_Buffers;
        Core::Registry<Texture, TextureTag> m_Textures;
        Core::Registry<Sampler, SamplerTag> m_Samplers;
        Core::Registry<Shader, ShaderTag> m_Shaders;
        Core::Registry<BindGroup, BindGroupTag> m_BindGroups;
        Core::Registry<RenderPipeline, RenderPipelineTag> m_RenderPipelines;
        Core::Registry<ComputePipeline, ComputePipelineTag> m_ComputePipelines;
        Core::Registry<RenderPass, RenderPassTag> m_RenderPasses;
        Core::Registry<ComputePass, ComputePassTag> m_ComputePasses;

        std::vector<PassRef> m_PassOrder;
    };
}
