module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

export module RHI:NullDevice;

import Core;
import :Types;
import :Device;

export namespace RHI
{
    struct NullDeviceConfig
    {
        Extent2D SurfaceExtent{1280, 720};
        TextureFormat SurfaceFormat = TextureFormat::BGRA8UnormSrgb;
    };

    // Commands as seen by the NullDevice, resources referred to by device id.
    namespace Recorded
    {
        struct ColorTarget
        {
            uint64_t View = 0;
            LoadOp Load = LoadOp::Load;
            ClearColor Clear{};
            bool Store = true;
        };

        struct BeginRenderPass
        {
            std::vector<ColorTarget> Colors;
            std::optional<uint64_t> DepthStencilView;
            std::string Label;
        };

        struct EndRenderPass {};

        struct BeginComputePass
        {
            std::string Label;
        };

        struct EndComputePass {};
        struct SetRenderPipeline { uint64_t Pipeline = 0; };
        struct SetComputePipeline { uint64_t Pipeline = 0; };
        struct SetBindGroup { uint32_t Slot = 0; uint64_t Group = 0; };
        struct SetVertexBuffer { uint32_t Slot = 0; uint64_t Buffer = 0; };
        struct SetIndexBuffer { uint64_t Buffer = 0; IndexFormat Format = IndexFormat::Uint16; };
        struct Draw { uint32_t VertexCount = 0; uint32_t InstanceCount = 0; };
        struct DrawIndexed { uint32_t IndexCount = 0; uint32_t InstanceCount = 0; };
        struct Dispatch { uint32_t X = 0; uint32_t Y = 0; uint32_t Z = 0; };
    }

    using RecordedCommand = std::variant<
        Recorded::BeginRenderPass,
        Recorded::EndRenderPass,
        Recorded::BeginComputePass,
        Recorded::EndComputePass,
        Recorded::SetRenderPipeline,
        Recorded::SetComputePipeline,
        Recorded::SetBindGroup,
        Recorded::SetVertexBuffer,
        Recorded::SetIndexBuffer,
        Recorded::Draw,
        Recorded::DrawIndexed,
        Recorded::Dispatch
    >;

    struct NullDeviceStats
    {
        uint32_t BuffersCreated = 0;
        uint32_t TexturesCreated = 0;
        uint32_t SamplersCreated = 0;
        uint32_t ShaderModulesCreated = 0;
        uint32_t BindGroupLayoutsCreated = 0;
        uint32_t BindGroupsCreated = 0;
        uint32_t RenderPipelinesCreated = 0;
        uint32_t ComputePipelinesCreated = 0;
        uint32_t BufferWrites = 0;
        uint32_t TextureWrites = 0;
        uint32_t SurfaceConfigurations = 0;
        uint32_t Acquires = 0;
        uint32_t Submits = 0;
        uint32_t Presents = 0;
    };

    class NullBuffer final : public IBuffer
    {
    public:
        NullBuffer(uint64_t id, const BufferDesc& desc)
            : m_Id(id), m_Usage(desc.Usage), m_Bytes(desc.Size, std::byte{0})
        {
        }

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] uint64_t GetSize() const override { return m_Bytes.size(); }
        [[nodiscard]] BufferUsage GetUsage() const override { return m_Usage; }

        [[nodiscard]] std::span<std::byte> GetBytes() const { return m_Bytes; }

    private:
        uint64_t m_Id;
        BufferUsage m_Usage;
        // Device memory: mutated through const handles by queue operations.
        mutable std::vector<std::byte> m_Bytes;
    };

    class NullTextureView final : public ITextureView
    {
    public:
        NullTextureView(uint64_t id, TextureFormat format) : m_Id(id), m_Format(format) {}

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] TextureFormat GetFormat() const override { return m_Format; }

    private:
        uint64_t m_Id;
        TextureFormat m_Format;
    };

    class NullTexture final : public ITexture
    {
    public:
        NullTexture(uint64_t id, uint64_t viewId, const TextureDesc& desc);

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] const TextureDesc& GetDesc() const override { return m_Desc; }
        [[nodiscard]] const ITextureView& GetView() const override { return m_View; }

        [[nodiscard]] std::span<std::byte> GetBytes() const { return m_Bytes; }

    private:
        uint64_t m_Id;
        TextureDesc m_Desc;
        NullTextureView m_View;
        mutable std::vector<std::byte> m_Bytes;
    };

    class NullSampler final : public ISampler
    {
    public:
        NullSampler(uint64_t id, SamplerDesc desc) : m_Id(id), m_Desc(std::move(desc)) {}

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] const SamplerDesc& GetDesc() const { return m_Desc; }

    private:
        uint64_t m_Id;
        SamplerDesc m_Desc;
    };

    class NullShaderModule final : public IShaderModule
    {
    public:
        NullShaderModule(uint64_t id, ShaderStage stage, size_t wordCount)
            : m_Id(id), m_Stage(stage), m_WordCount(wordCount)
        {
        }

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] ShaderStage GetStage() const override { return m_Stage; }
        [[nodiscard]] size_t GetWordCount() const { return m_WordCount; }

    private:
        uint64_t m_Id;
        ShaderStage m_Stage;
        size_t m_WordCount;
    };

    class NullBindGroupLayout final : public IBindGroupLayout
    {
    public:
        NullBindGroupLayout(uint64_t id, std::span<const BindGroupLayoutEntry> entries)
            : m_Id(id), m_Entries(entries.begin(), entries.end())
        {
        }

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] std::span<const BindGroupLayoutEntry> GetEntries() const override { return m_Entries; }

    private:
        uint64_t m_Id;
        std::vector<BindGroupLayoutEntry> m_Entries;
    };

    // (binding, id of the bound buffer/texture/sampler)
    struct NullBinding
    {
        uint32_t Binding = 0;
        uint64_t ResourceId = 0;

        bool operator==(const NullBinding&) const = default;
    };

    class NullBindGroup final : public IBindGroup
    {
    public:
        NullBindGroup(uint64_t id, uint64_t layoutId, std::vector<NullBinding> bindings)
            : m_Id(id), m_LayoutId(layoutId), m_Bindings(std::move(bindings))
        {
        }

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] uint64_t GetLayoutId() const { return m_LayoutId; }
        [[nodiscard]] const std::vector<NullBinding>& GetBindings() const { return m_Bindings; }

    private:
        uint64_t m_Id;
        uint64_t m_LayoutId;
        std::vector<NullBinding> m_Bindings;
    };

    class NullRenderPipeline final : public IRenderPipeline
    {
    public:
        NullRenderPipeline(uint64_t id, const RenderPipelineDesc& desc);

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] const std::vector<VertexBufferLayout>& GetVertexLayouts() const { return m_VertexLayouts; }
        [[nodiscard]] const std::vector<uint64_t>& GetBindGroupLayoutIds() const { return m_BindGroupLayoutIds; }
        [[nodiscard]] const std::vector<TextureFormat>& GetColorTargets() const { return m_ColorTargets; }
        [[nodiscard]] PrimitiveTopology GetTopology() const { return m_Topology; }
        [[nodiscard]] std::optional<IndexFormat> GetStripIndexFormat() const { return m_StripIndexFormat; }
        [[nodiscard]] CullMode GetCullMode() const { return m_Cull; }
        [[nodiscard]] PolygonMode GetPolygonMode() const { return m_Polygon; }
        [[nodiscard]] const std::optional<DepthStencilState>& GetDepthStencil() const { return m_DepthStencil; }
        [[nodiscard]] const std::string& GetVertexEntryPoint() const { return m_VertexEntry; }
        [[nodiscard]] bool HasFragmentStage() const { return m_HasFragment; }

    private:
        uint64_t m_Id;
        std::vector<VertexBufferLayout> m_VertexLayouts;
        std::vector<uint64_t> m_BindGroupLayoutIds;
        std::vector<TextureFormat> m_ColorTargets;
        PrimitiveTopology m_Topology;
        std::optional<IndexFormat> m_StripIndexFormat;
        CullMode m_Cull;
        PolygonMode m_Polygon;
        std::optional<DepthStencilState> m_DepthStencil;
        std::string m_VertexEntry;
        bool m_HasFragment;
    };

    class NullComputePipeline final : public IComputePipeline
    {
    public:
        NullComputePipeline(uint64_t id, const ComputePipelineDesc& desc);

        [[nodiscard]] uint64_t GetId() const override { return m_Id; }
        [[nodiscard]] const std::vector<uint64_t>& GetBindGroupLayoutIds() const { return m_BindGroupLayoutIds; }
        [[nodiscard]] const std::string& GetEntryPoint() const { return m_EntryPoint; }

    private:
        uint64_t m_Id;
        std::vector<uint64_t> m_BindGroupLayoutIds;
        std::string m_EntryPoint;
    };

    class NullCommandRecorder final : public ICommandRecorder
    {
    public:
        NullCommandRecorder() = default;

        void BeginRenderPass(const RenderPassDesc& desc) override;
        void EndRenderPass() override;
        void BeginComputePass(std::string_view label) override;
        void EndComputePass() override;

        void SetRenderPipeline(const IRenderPipeline& pipeline) override;
        void SetComputePipeline(const IComputePipeline& pipeline) override;
        void SetBindGroup(uint32_t slot, const IBindGroup& group) override;
        void SetVertexBuffer(uint32_t slot, const IBuffer& buffer) override;
        void SetIndexBuffer(const IBuffer& buffer, IndexFormat format) override;

        void Draw(uint32_t vertexCount, uint32_t instanceCount) override;
        void DrawIndexed(uint32_t indexCount, uint32_t instanceCount) override;
        void Dispatch(uint32_t x, uint32_t y, uint32_t z) override;

        void Reset() { m_Commands.clear(); m_IsOpen = true; }
        void Close() { m_IsOpen = false; }
        [[nodiscard]] bool IsOpen() const { return m_IsOpen; }
        [[nodiscard]] std::vector<RecordedCommand>& GetCommands() { return m_Commands; }

    private:
        std::vector<RecordedCommand> m_Commands;
        bool m_IsOpen = false;
    };

    // Host-memory device. Buffers and textures hold real bytes, commands are
    // recorded for inspection, the surface is simulated.
    class NullDevice final : public IDevice
    {
    public:
        explicit NullDevice(const NullDeviceConfig& config = {});
        ~NullDevice() override = default;

        [[nodiscard]] std::string_view GetName() const override { return "null"; }
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

        [[nodiscard]] TextureFormat GetSurfaceFormat() const override { return m_Config.SurfaceFormat; }
        [[nodiscard]] Extent2D GetSurfaceExtent() const override { return m_SurfaceExtent; }
        [[nodiscard]] Core::Result ConfigureSurface(Extent2D extent) override;
        [[nodiscard]] std::expected<SurfaceTarget, SurfaceError> AcquireSurfaceTarget() override;

        [[nodiscard]] ICommandRecorder& BeginCommands() override;
        [[nodiscard]] Core::Result Submit(ICommandRecorder& recorder) override;
        [[nodiscard]] Core::Result Present(const SurfaceTarget& target) override;

        void WaitIdle() override {}

        // --- Inspection ---
        // The next AcquireSurfaceTarget fails once with this error.
        void QueueAcquireError(SurfaceError error) { m_PendingAcquireError = error; }
        // After `skip` more successful buffer, texture or bind group
        // allocations, the next one fails once with OutOfDeviceMemory.
        void QueueAllocationFailure(uint32_t skip = 0) { m_AllocationsBeforeFailure = skip; }

        [[nodiscard]] const NullDeviceStats& GetStats() const { return m_Stats; }
        [[nodiscard]] const std::vector<RecordedCommand>& GetLastSubmittedCommands() const { return m_LastSubmitted; }
        [[nodiscard]] uint64_t GetSurfaceViewId() const { return m_SurfaceView ? m_SurfaceView->GetId() : 0; }
        [[nodiscard]] bool IsFrameOpen() const { return m_Recorder.IsOpen() || m_TargetAcquired; }

    private:
        [[nodiscard]] uint64_t NextId() { return ++m_NextId; }
        [[nodiscard]] bool ConsumeAllocationFailure(std::string_view kind, std::string_view label);

        NullDeviceConfig m_Config;
        Extent2D m_SurfaceExtent;
        uint64_t m_NextId = 0;

        std::unique_ptr<NullTextureView> m_SurfaceView;
        std::optional<SurfaceError> m_PendingAcquireError;
        std::optional<uint32_t> m_AllocationsBeforeFailure;
        bool m_TargetAcquired = false;

        NullCommandRecorder m_Recorder;
        std::vector<RecordedCommand> m_LastSubmitted;
        NullDeviceStats m_Stats;
    };
}
