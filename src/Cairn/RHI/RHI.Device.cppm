module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

export module RHI:Device;

import Core;
import :Types;

// -----------------------------------------------------------------------------
// Device seam
// -----------------------------------------------------------------------------
// Everything above RHI talks to the GPU through these interfaces only. The
// Vulkan backend and the recording NullDevice implement them. Every object a
// device creates carries a process-unique, monotonically increasing id so two
// allocations of the same resource can be told apart.
// -----------------------------------------------------------------------------

export namespace RHI
{
    class IDeviceObject
    {
    public:
        virtual ~IDeviceObject() = default;

        IDeviceObject(const IDeviceObject&) = delete;
        IDeviceObject& operator=(const IDeviceObject&) = delete;
        IDeviceObject(IDeviceObject&&) = delete;
        IDeviceObject& operator=(IDeviceObject&&) = delete;

        [[nodiscard]] virtual uint64_t GetId() const = 0;

    protected:
        IDeviceObject() = default;
    };

    class IBuffer : public IDeviceObject
    {
    public:
        [[nodiscard]] virtual uint64_t GetSize() const = 0;
        [[nodiscard]] virtual BufferUsage GetUsage() const = 0;
    };

    class ITextureView : public IDeviceObject
    {
    public:
        [[nodiscard]] virtual TextureFormat GetFormat() const = 0;
    };

    class ITexture : public IDeviceObject
    {
    public:
        [[nodiscard]] virtual const TextureDesc& GetDesc() const = 0;
        [[nodiscard]] virtual const ITextureView& GetView() const = 0;
    };

    class ISampler : public IDeviceObject
    {
    };

    class IShaderModule : public IDeviceObject
    {
    public:
        [[nodiscard]] virtual ShaderStage GetStage() const = 0;
    };

    class IBindGroupLayout : public IDeviceObject
    {
    public:
        [[nodiscard]] virtual std::span<const BindGroupLayoutEntry> GetEntries() const = 0;
    };

    class IBindGroup : public IDeviceObject
    {
    };

    class IRenderPipeline : public IDeviceObject
    {
    };

    class IComputePipeline : public IDeviceObject
    {
    };

    // Exactly one of the resource pointers is set, matching the layout entry
    // with the same binding.
    struct BindGroupEntry
    {
        uint32_t Binding = 0;
        const IBuffer* Buffer = nullptr;
        const ITexture* Texture = nullptr;
        const ISampler* Sampler = nullptr;
    };

    struct ShaderEntryPoint
    {
        const IShaderModule* Module = nullptr;
        std::string_view EntryPoint = "main";
    };

    struct RenderPipelineDesc
    {
        ShaderEntryPoint Vertex{};
        std::optional<ShaderEntryPoint> Fragment;

        std::span<const VertexBufferLayout> VertexBuffers;
        std::span<const IBindGroupLayout* const> BindGroupLayouts;

        PrimitiveTopology Topology = PrimitiveTopology::TriangleList;
        std::optional<IndexFormat> StripIndexFormat;
        FrontFace Winding = FrontFace::Ccw;
        CullMode Cull = CullMode::None;
        PolygonMode Polygon = PolygonMode::Fill;
        bool UnclippedDepth = false;

        std::optional<DepthStencilState> DepthStencil;
        std::span<const TextureFormat> ColorTargets;
        std::string_view Label;
    };

    struct ComputePipelineDesc
    {
        ShaderEntryPoint Compute{};
        std::span<const IBindGroupLayout* const> BindGroupLayouts;
        std::string_view Label;
    };

    struct ColorAttachment
    {
        const ITextureView* View = nullptr;
        LoadOp Load = LoadOp::Load;
        ClearColor Clear{};
        bool Store = true;
    };

    struct DepthStencilAttachment
    {
        const ITextureView* View = nullptr;
        std::optional<DepthOps> Depth;
        std::optional<StencilOps> Stencil;
    };

    struct RenderPassDesc
    {
        std::span<const ColorAttachment> ColorAttachments;
        std::optional<DepthStencilAttachment> DepthStencil;
        std::string_view Label;
    };

    // Handed out by AcquireSurfaceTarget, valid until the matching Present.
    struct SurfaceTarget
    {
        const ITextureView* View = nullptr;
        uint32_t ImageIndex = 0;
    };

    // One recording scope per frame. Bind calls refer to the most recently
    // bound pipeline.
    class ICommandRecorder
    {
    public:
        virtual ~ICommandRecorder() = default;

        ICommandRecorder(const ICommandRecorder&) = delete;
        ICommandRecorder& operator=(const ICommandRecorder&) = delete;

        virtual void BeginRenderPass(const RenderPassDesc& desc) = 0;
        virtual void EndRenderPass() = 0;
        virtual void BeginComputePass(std::string_view label) = 0;
        virtual void EndComputePass() = 0;

        virtual void SetRenderPipeline(const IRenderPipeline& pipeline) = 0;
        virtual void SetComputePipeline(const IComputePipeline& pipeline) = 0;
        virtual void SetBindGroup(uint32_t slot, const IBindGroup& group) = 0;
        virtual void SetVertexBuffer(uint32_t slot, const IBuffer& buffer) = 0;
        virtual void SetIndexBuffer(const IBuffer& buffer, IndexFormat format) = 0;

        virtual void Draw(uint32_t vertexCount, uint32_t instanceCount) = 0;
        virtual void DrawIndexed(uint32_t indexCount, uint32_t instanceCount) = 0;
        virtual void Dispatch(uint32_t x, uint32_t y, uint32_t z) = 0;

    protected:
        ICommandRecorder() = default;
    };

    class IDevice
    {
    public:
        virtual ~IDevice() = default;

        IDevice(const IDevice&) = delete;
        IDevice& operator=(const IDevice&) = delete;
        IDevice(IDevice&&) = delete;
        IDevice& operator=(IDevice&&) = delete;

        [[nodiscard]] virtual std::string_view GetName() const = 0;
        [[nodiscard]] virtual uint32_t GetMapAlignment() const = 0;

        // --- Allocation (builders and reallocation paths only) ---
        // Buffers start zero-filled.
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<IBuffer>> CreateBuffer(const BufferDesc& desc) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<ITexture>> CreateTexture(const TextureDesc& desc) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<ISampler>> CreateSampler(const SamplerDesc& desc) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<IShaderModule>> CreateShaderModule(
            std::span<const uint32_t> spirv, ShaderStage stage, std::string_view label) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<IBindGroupLayout>> CreateBindGroupLayout(
            std::span<const BindGroupLayoutEntry> entries, std::string_view label) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<IBindGroup>> CreateBindGroup(
            const IBindGroupLayout& layout, std::span<const BindGroupEntry> entries, std::string_view label) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<IRenderPipeline>> CreateRenderPipeline(
            const RenderPipelineDesc& desc) = 0;
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<IComputePipeline>> CreateComputePipeline(
            const ComputePipelineDesc& desc) = 0;

        // --- Queue ---
        // Writes are queued and become visible to the next submitted frame.
        [[nodiscard]] virtual Core::Result WriteBuffer(const IBuffer& buffer, uint64_t offset,
                                                       std::span<const std::byte> data) = 0;
        // Blocks until every queued write has landed.
        [[nodiscard]] virtual Core::Result ReadBuffer(const IBuffer& buffer, uint64_t offset,
                                                      std::span<std::byte> out) = 0;
        // Full mip 0 upload, tightly packed.
        [[nodiscard]] virtual Core::Result WriteTexture(const ITexture& texture, std::span<const std::byte> data) = 0;

        // --- Surface ---
        [[nodiscard]] virtual TextureFormat GetSurfaceFormat() const = 0;
        [[nodiscard]] virtual Extent2D GetSurfaceExtent() const = 0;
        [[nodiscard]] virtual Core::Result ConfigureSurface(Extent2D extent) = 0;
        [[nodiscard]] virtual std::expected<SurfaceTarget, SurfaceError> AcquireSurfaceTarget() = 0;

        // --- Frame ---
        [[nodiscard]] virtual ICommandRecorder& BeginCommands() = 0;
        [[nodiscard]] virtual Core::Result Submit(ICommandRecorder& recorder) = 0;
        [[nodiscard]] virtual Core::Result Present(const SurfaceTarget& target) = 0;

        virtual void WaitIdle() = 0;

    protected:
        IDevice() = default;
    };
}
