module;
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

export module Cairn:Builders;

import Core;
import RHI;
import :Types;
import :Vertex;
import :Texture;
import :BindGroup;
import :Pipeline;
import :Pass;
import :ResourceStore;

// -----------------------------------------------------------------------------
// Builders
// -----------------------------------------------------------------------------
// Each builder borrows the context's ResourceStore, accumulates configuration
// through chained setters and validates everything in one Build() call. A
// failed Build() logs the offending field, allocates nothing and returns the
// error code; a successful one returns a handle that stays valid for the
// lifetime of the context.
//
//   auto vertices = ctx.CreateBuffer<glm::vec2>()
//       .Vertex()
//       .Label("Triangle")
//       .BuildInit(points);
// -----------------------------------------------------------------------------

export namespace Cairn
{
    namespace Detail
    {
        struct BufferSpec
        {
            Core::TypeTag ElementType;
            uint32_t ElementSize = 0;
            RHI::BufferUsage Usage = RHI::BufferUsage::None;
            std::optional<RHI::VertexBufferLayout> VertexLayout;
            std::string Label;
        };

        struct TextureSpec
        {
            Core::TypeTag ElementType;
            RHI::TextureFormat Format = RHI::TextureFormat::Undefined;
            std::optional<SizePolicy> Policy;
            RHI::TextureDimension Dimension = RHI::TextureDimension::D2;
            RHI::TextureUsage Usage = RHI::TextureUsage::None;
            uint32_t MipLevels = 1;
            uint32_t SampleCount = 1;
            std::string Label;
        };

        // Either count zeroed elements or exactly the bytes of init.
        [[nodiscard]] Core::Expected<BufferHandle> BuildBuffer(ResourceStore& store, const BufferSpec& spec,
                                                               uint64_t count, std::span<const std::byte> init);

        [[nodiscard]] Core::Expected<TextureHandle> BuildTexture(ResourceStore& store, const TextureSpec& spec);
    }

    // --- Buffer --------------------------------------------------------------

    template<typename T>
    class BufferBuilder
    {
        static_assert(std::is_trivially_copyable_v<T>, "buffer elements are copied as raw bytes");

    public:
        explicit BufferBuilder(ResourceStore& store) : m_Store(store) {}

        BufferBuilder& MapRead()  { m_Usage |= RHI::BufferUsage::MapRead;  return *this; }
        BufferBuilder& MapWrite() { m_Usage |= RHI::BufferUsage::MapWrite; return *this; }
        BufferBuilder& CopySrc()  { m_Usage |= RHI::BufferUsage::CopySrc;  return *this; }
        BufferBuilder& CopyDst()  { m_Usage |= RHI::BufferUsage::CopyDst;  return *this; }
        BufferBuilder& Storage()  { m_Usage |= RHI::BufferUsage::Storage;  return *this; }
        BufferBuilder& Uniform()  { m_Usage |= RHI::BufferUsage::Uniform;  return *this; }
        BufferBuilder& Indirect() { m_Usage |= RHI::BufferUsage::Indirect; return *this; }

        BufferBuilder& Index() requires std::same_as<T, uint16_t> || std::same_as<T, uint32_t>
        {
            m_Usage |= RHI::BufferUsage::Index;
            return *this;
        }

        // Per-vertex source; captures VertexLayout<T>.
        BufferBuilder& Vertex() requires VertexType<T>
        {
            m_Usage |= RHI::BufferUsage::Vertex;
            m_Layout = MakeVertexBufferLayout<T>(RHI::VertexStepMode::Vertex);
            return *this;
        }

        // Per-instance source; captures VertexLayout<T>.
        BufferBuilder& Instance() requires VertexType<T>
        {
            m_Usage |= RHI::BufferUsage::Vertex;
            m_Layout = MakeVertexBufferLayout<T>(RHI::VertexStepMode::Instance);
            return *this;
        }

        BufferBuilder& Label(std::string_view label)
        {
            m_Label = label;
            return *this;
        }

        [[nodiscard]] Core::Expected<BufferHandle> Build(uint64_t count)
        {
            return Detail::BuildBuffer(m_Store, MakeSpec(), count, {});
        }

        [[nodiscard]] Core::Expected<BufferHandle> BuildInit(std::span<const T> data)
        {
            return Detail::BuildBuffer(m_Store, MakeSpec(), data.size(), std::as_bytes(data));
        }

    private:
        [[nodiscard]] Detail::BufferSpec MakeSpec() const
        {
            return Detail::BufferSpec{
                .ElementType = Core::TypeTag::Of<T>(),
                .ElementSize = static_cast<uint32_t>(sizeof(T)),
                .Usage = m_Usage,
                .VertexLayout = m_Layout,
                .Label = m_Label,
            };
        }

        ResourceStore& m_Store;
        RHI::BufferUsage m_Usage = RHI::BufferUsage::None;
        std::optional<RHI::VertexBufferLayout> m_Layout;
        std::string m_Label;
    };

    // --- Texture -------------------------------------------------------------

    template<TexelType T>
    class TextureBuilder
    {
    public:
        explicit TextureBuilder(ResourceStore& store) : m_Store(store) {}

        TextureBuilder& Size1D(uint32_t width)
        {
            return SetPolicy(SizePolicy::Fixed({width, 1, 1}), RHI::TextureDimension::D1);
        }

        TextureBuilder& Size2D(uint32_t width, uint32_t height)
        {
            return SetPolicy(SizePolicy::Fixed({width, height, 1}), RHI::TextureDimension::D2);
        }

        TextureBuilder& Size3D(uint32_t width, uint32_t height, uint32_t depth)
        {
            return SetPolicy(SizePolicy::Fixed({width, height, depth}), RHI::TextureDimension::D3);
        }

        // Follows the surface through every resize.
        TextureBuilder& SizeSurface()
        {
            return SetPolicy(SizePolicy::Surface(), RHI::TextureDimension::D2);
        }

        TextureBuilder& SizeSurfaceScaled(float factor)
        {
            return SetPolicy(SizePolicy::SurfaceScaled(factor), RHI::TextureDimension::D2);
        }

        TextureBuilder& CopySrc()          { m_Usage |= RHI::TextureUsage::CopySrc;          return *this; }
        TextureBuilder& CopyDst()          { m_Usage |= RHI::TextureUsage::CopyDst;          return *this; }
        TextureBuilder& Sampled()          { m_Usage |= RHI::TextureUsage::Sampled;          return *this; }
        TextureBuilder& Storage()          { m_Usage |= RHI::TextureUsage::Storage;          return *this; }
        TextureBuilder& RenderAttachment() { m_Usage |= RHI::TextureUsage::RenderAttachment; return *this; }

        TextureBuilder& MipLevels(uint32_t levels)
        {
            m_MipLevels = levels;
            return *this;
        }

        TextureBuilder& SampleCount(uint32_t samples)
        {
            m_SampleCount = samples;
            return *this;
        }

        TextureBuilder& Label(std::string_view label)
        {
            m_Label = label;
            return *this;
        }

        [[nodiscard]] Core::Expected<TextureHandle> Build()
        {
            return Detail::BuildTexture(m_Store, Detail::TextureSpec{
                .ElementType = Core::TypeTag::Of<T>(),
                .Format = TexelFormatOf<T>,
                .Policy = m_Policy,
                .Dimension = m_Dimension,
                .Usage = m_Usage,
                .MipLevels = m_MipLevels,
                .SampleCount = m_SampleCount,
                .Label = m_Label,
            });
        }

    private:
        TextureBuilder& SetPolicy(SizePolicy policy, RHI::TextureDimension dimension)
        {
            m_Policy = policy;
            m_Dimension = dimension;
            return *this;
        }

        ResourceStore& m_Store;
        std::optional<SizePolicy> m_Policy;
        RHI::TextureDimension m_Dimension = RHI::TextureDimension::D2;
        RHI::TextureUsage m_Usage = RHI::TextureUsage::None;
        uint32_t m_MipLevels = 1;
        uint32_t m_SampleCount = 1;
        std::string m_Label;
    };

    // --- Sampler -------------------------------------------------------------

    class SamplerBuilder
    {
    public:
        explicit SamplerBuilder(ResourceStore& store) : m_Store(store) {}

        SamplerBuilder& AddressMode(RHI::AddressMode all);
        SamplerBuilder& AddressModes(RHI::AddressMode u, RHI::AddressMode v, RHI::AddressMode w);
        SamplerBuilder& MagFilter(RHI::FilterMode filter);
        SamplerBuilder& MinFilter(RHI::FilterMode filter);
        SamplerBuilder& MipmapFilter(RHI::FilterMode filter);
        SamplerBuilder& LodClamp(float min, float max);
        SamplerBuilder& Compare(RHI::CompareFunction compare);
        SamplerBuilder& Anisotropy(uint16_t clamp);
        SamplerBuilder& Border(RHI::BorderColor color);
        SamplerBuilder& Label(std::string_view label);

        [[nodiscard]] Core::Expected<SamplerHandle> Build();

    private:
        ResourceStore& m_Store;
        RHI::SamplerDesc m_Desc{};
    };

    // --- Bind group ----------------------------------------------------------

    class BindGroupBuilder
    {
    public:
        explicit BindGroupBuilder(ResourceStore& store) : m_Store(store) {}

        BindGroupBuilder& BindUniformBuffer(uint32_t binding, RHI::ShaderVisibility visibility, BufferHandle buffer);
        BindGroupBuilder& BindStorageBuffer(uint32_t binding, RHI::ShaderVisibility visibility, bool readOnly,
                                            BufferHandle buffer);
        BindGroupBuilder& BindTexture(uint32_t binding, RHI::ShaderVisibility visibility,
                                      RHI::TextureSampleType sampleType, RHI::TextureViewDimension viewDimension,
                                      bool multisampled, TextureHandle texture);
        // The storage format is taken from the texture.
        BindGroupBuilder& BindStorageTexture(uint32_t binding, RHI::ShaderVisibility visibility,
                                             RHI::StorageTextureAccess access,
                                             RHI::TextureViewDimension viewDimension, TextureHandle texture);
        BindGroupBuilder& BindSampler(uint32_t binding, RHI::ShaderVisibility visibility,
                                      RHI::SamplerBindingType samplerType, SamplerHandle sampler);
        BindGroupBuilder& Label(std::string_view label);

        [[nodiscard]] Core::Expected<BindGroupHandle> Build();

    private:
        [[nodiscard]] Core::Result Validate(std::vector<BindGroupBinding>& bindings) const;

        ResourceStore& m_Store;
        std::vector<BindGroupBinding> m_Bindings;
        std::string m_Label;
    };

    // --- Pipelines -----------------------------------------------------------

    struct ShaderRef
    {
        ShaderHandle Shader{};
        std::string EntryPoint = "main";
    };

    class RenderPipelineBuilder
    {
    public:
        explicit RenderPipelineBuilder(ResourceStore& store) : m_Store(store) {}

        RenderPipelineBuilder& VertexShader(ShaderHandle shader, std::string_view entryPoint = "main");
        RenderPipelineBuilder& FragmentShader(ShaderHandle shader, std::string_view entryPoint = "main");

        RenderPipelineBuilder& Topology(RHI::PrimitiveTopology topology);
        RenderPipelineBuilder& FrontFace(RHI::FrontFace winding);
        RenderPipelineBuilder& Culling(RHI::CullMode cull);
        RenderPipelineBuilder& Polygon(RHI::PolygonMode mode);
        RenderPipelineBuilder& UnclippedDepth(bool unclipped);

        template<DepthTexelType T>
        RenderPipelineBuilder& DepthStencil(bool depthWrite, RHI::CompareFunction compare,
                                            RHI::StencilState stencil = {}, RHI::DepthBiasState bias = {})
        {
            return DepthStencilFormat(TexelFormatOf<T>, depthWrite, compare, stencil, bias);
        }

        RenderPipelineBuilder& DepthStencilFormat(RHI::TextureFormat format, bool depthWrite,
                                                  RHI::CompareFunction compare,
                                                  RHI::StencilState stencil = {}, RHI::DepthBiasState bias = {});

        // Without any, the pipeline renders to the surface format.
        RenderPipelineBuilder& ColorTarget(RHI::TextureFormat format);

        RenderPipelineBuilder& AddVertexBuffer(BufferHandle buffer);
        RenderPipelineBuilder& AddInstanceBuffer(BufferHandle buffer);
        RenderPipelineBuilder& AddIndexBuffer(BufferHandle buffer);
        RenderPipelineBuilder& AddBindGroup(BindGroupHandle group);
        RenderPipelineBuilder& Label(std::string_view label);

        [[nodiscard]] Core::Expected<RenderPipelineHandle> Build();

    private:
        ResourceStore& m_Store;
        std::optional<ShaderRef> m_Vertex;
        std::optional<ShaderRef> m_Fragment;
        std::optional<RHI::PrimitiveTopology> m_Topology;
        std::optional<RHI::FrontFace> m_FrontFace;
        RHI::CullMode m_Cull = RHI::CullMode::None;
        RHI::PolygonMode m_Polygon = RHI::PolygonMode::Fill;
        bool m_UnclippedDepth = false;
        std::optional<RHI::DepthStencilState> m_DepthStencil;
        std::vector<RHI::TextureFormat> m_ColorTargets;
        RenderPipelineBindings m_Bindings;
        std::string m_Label;
    };

    class ComputePipelineBuilder
    {
    public:
        explicit ComputePipelineBuilder(ResourceStore& store) : m_Store(store) {}

        ComputePipelineBuilder& Shader(ShaderHandle shader, std::string_view entryPoint = "main");
        ComputePipelineBuilder& WorkGroups(uint32_t x, uint32_t y, uint32_t z);
        ComputePipelineBuilder& AddBindGroup(BindGroupHandle group);
        ComputePipelineBuilder& Label(std::string_view label);

        [[nodiscard]] Core::Expected<ComputePipelineHandle> Build();

    private:
        ResourceStore& m_Store;
        std::optional<ShaderRef> m_Shader;
        std::optional<std::array<uint32_t, 3>> m_WorkGroups;
        std::vector<BindGroupHandle> m_BindGroups;
        std::string m_Label;
    };

    // --- Passes --------------------------------------------------------------

    class RenderPassBuilder
    {
    public:
        explicit RenderPassBuilder(ResourceStore& store) : m_Store(store) {}

        // Clears to the colour when one is given, otherwise keeps the contents.
        RenderPassBuilder& AddColorAttachment(TextureHandle texture,
                                              std::optional<RHI::ClearColor> clear = std::nullopt,
                                              bool store = true);
        RenderPassBuilder& AddDepthStencilAttachment(TextureHandle texture,
                                                     std::optional<RHI::DepthOps> depth = RHI::DepthOps{},
                                                     std::optional<RHI::StencilOps> stencil = std::nullopt);
        RenderPassBuilder& AddPipeline(RenderPipelineHandle pipeline);
        RenderPassBuilder& Label(std::string_view label);

        [[nodiscard]] Core::Expected<RenderPassHandle> Build();

    private:
        ResourceStore& m_Store;
        std::vector<ColorAttachmentRef> m_Colors;
        std::optional<DepthStencilAttachmentRef> m_DepthStencil;
        std::vector<RenderPipelineHandle> m_Pipelines;
        std::string m_Label;
    };

    class ComputePassBuilder
    {
    public:
        explicit ComputePassBuilder(ResourceStore& store) : m_Store(store) {}

        ComputePassBuilder& AddPipeline(ComputePipelineHandle pipeline);
        ComputePassBuilder& Label(std::string_view label);

        [[nodiscard]] Core::Expected<ComputePassHandle> Build();

    private:
        ResourceStore& m_Store;
        std::vector<ComputePipelineHandle> m_Pipelines;
        std::string m_Label;
    };
}
