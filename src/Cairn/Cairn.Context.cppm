module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

export module Cairn:Context;

import Core;
import RHI;
import :Types;
import :Texture;
import :ResourceStore;
import :Builders;
import :FrameExecutor;

export namespace Cairn
{
    struct ContextConfig
    {
        std::string AppName = "Cairn App";
        RHI::ShaderCompiler Compiler = RHI::CompileGlsl;
    };

    // -------------------------------------------------------------------------
    // Context - sole owner of every GPU resource of one application
    // -------------------------------------------------------------------------
    // Hands out builders, applies content writes and resizes, and renders the
    // frame. All access is single-threaded. Resources live until the context
    // is destroyed; the device is destroyed last.
    // -------------------------------------------------------------------------
    class Context
    {
    public:
        explicit Context(std::unique_ptr<RHI::IDevice> device, const ContextConfig& config = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

        // --- Builders ---
        template<typename T>
        [[nodiscard]] BufferBuilder<T> CreateBuffer() { return BufferBuilder<T>(m_Store); }

        template<TexelType T>
        [[nodiscard]] TextureBuilder<T> CreateTexture() { return TextureBuilder<T>(m_Store); }

        [[nodiscard]] SamplerBuilder CreateSampler() { return SamplerBuilder(m_Store); }
        [[nodiscard]] BindGroupBuilder CreateBindGroup() { return BindGroupBuilder(m_Store); }
        [[nodiscard]] RenderPipelineBuilder CreateRenderPipeline() { return RenderPipelineBuilder(m_Store); }
        [[nodiscard]] ComputePipelineBuilder CreateComputePipeline() { return ComputePipelineBuilder(m_Store); }
        [[nodiscard]] RenderPassBuilder CreateRenderPass() { return RenderPassBuilder(m_Store); }
        [[nodiscard]] ComputePassBuilder CreateComputePass() { return ComputePassBuilder(m_Store); }

        // --- Shaders ---
        [[nodiscard]] Core::Expected<ShaderHandle> RegisterShader(std::string_view source, RHI::ShaderStage stage,
                                                                  std::string_view label = {});
        [[nodiscard]] Core::Expected<ShaderHandle> RegisterShaderFile(const std::filesystem::path& path,
                                                                      RHI::ShaderStage stage);

        // --- Content ---
        // true = the buffer outgrew its allocation and was reallocated.
        template<typename T>
        [[nodiscard]] Core::Expected<bool> WriteBuffer(BufferHandle handle, std::span<const T> data)
        {
            return m_Store.WriteBuffer(handle, Core::TypeTag::Of<T>(), std::as_bytes(data));
        }

        // Whole capacity, as elements.
        template<typename T>
        [[nodiscard]] Core::Expected<std::vector<T>> ReadBuffer(BufferHandle handle) const
        {
            static_assert(std::is_trivially_copyable_v<T>, "buffer elements are copied as raw bytes");

            auto bytes = m_Store.ReadBuffer(handle, Core::TypeTag::Of<T>());
            if (!bytes) return std::unexpected(bytes.error());

            std::vector<T> elements(bytes->size() / sizeof(T));
            std::memcpy(elements.data(), bytes->data(), elements.size() * sizeof(T));
            return elements;
        }

        // Mip 0, exactly width * height * depth texels.
        template<TexelType T>
        [[nodiscard]] Core::Result WriteTexture(TextureHandle handle, std::span<const T> texels)
        {
            return m_Store.WriteTexture(handle, Core::TypeTag::Of<T>(), std::as_bytes(texels));
        }

        // Pins the texture to the new extent (same dimensionality); contents
        // are discarded.
        [[nodiscard]] Core::Expected<bool> ResizeTexture(TextureHandle handle, RHI::Extent3D extent);

        // Forces a rebuild of one bind group against current allocations.
        [[nodiscard]] Core::Result RecreateBindGroup(BindGroupHandle handle);

        // --- Surface & frame ---
        // Push notification from the window. Reconfigures the surface,
        // reallocates surface-relative textures and rebuilds their dependents
        // before returning. Repeating the same size is a no-op.
        [[nodiscard]] Core::Result Resize(RHI::Extent2D size);

        // Reconfigures the surface at the current size.
        [[nodiscard]] Core::Result Recreate();

        [[nodiscard]] Core::Expected<FrameStatus> Render();

        // --- Pass order ---
        [[nodiscard]] Core::Result ReorderPipelines(RenderPassHandle pass, std::span<const RenderPipelineHandle> pipelines);
        [[nodiscard]] Core::Result ReorderPipelines(ComputePassHandle pass, std::span<const ComputePipelineHandle> pipelines);
        [[nodiscard]] const std::vector<PassRef>& GetPassOrder() const { return m_Store.GetPassOrder(); }

        // --- Introspection ---
        [[nodiscard]] ResourceStore& GetResources() { return m_Store; }
        [[nodiscard]] const ResourceStore& GetResources() const { return m_Store; }
        [[nodiscard]] RHI::IDevice& GetDevice() { return *m_Device; }
        [[nodiscard]] const FramePlan& GetLastFramePlan() const { return m_Executor.GetPlan(); }
        [[nodiscard]] const ContextConfig& GetConfig() const { return m_Config; }

    private:
        // Declared first: destroyed after every resource that came from it.
        std::unique_ptr<RHI::IDevice> m_Device;
        ContextConfig m_Config;
        ResourceStore m_Store;
        FrameExecutor m_Executor;
    };
}
