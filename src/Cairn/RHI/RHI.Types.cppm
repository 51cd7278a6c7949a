module;
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

export module RHI:Types;

export namespace RHI
{
    // Minimum alignment of any buffer element visible to shaders.
    constexpr uint32_t DefaultMapAlignment = 8;

    template<typename E>
    concept FlagEnum = std::is_enum_v<E> && requires { E::None; };

    template<FlagEnum E>
    constexpr E operator|(E a, E b)
    {
        using U = std::underlying_type_t<E>;
        return static_cast<E>(static_cast<U>(a) | static_cast<U>(b));
    }

    template<FlagEnum E>
    constexpr E operator&(E a, E b)
    {
        using U = std::underlying_type_t<E>;
        return static_cast<E>(static_cast<U>(a) & static_cast<U>(b));
    }

    template<FlagEnum E>
    constexpr E& operator|=(E& a, E b)
    {
        a = a | b;
        return a;
    }

    template<FlagEnum E>
    [[nodiscard]] constexpr bool HasFlag(E value, E flag)
    {
        return (value & flag) == flag && flag != E::None;
    }

    // --- Buffers -------------------------------------------------------------

    enum class BufferUsage : uint32_t
    {
        None     = 0,
        MapRead  = 1u << 0,
        MapWrite = 1u << 1,
        CopySrc  = 1u << 2,
        CopyDst  = 1u << 3,
        Index    = 1u << 4,
        Vertex   = 1u << 5,
        Uniform  = 1u << 6,
        Storage  = 1u << 7,
        Indirect = 1u << 8,
    };

    struct BufferDesc
    {
        uint64_t Size = 0;
        BufferUsage Usage = BufferUsage::None;
        std::string_view Label;
    };

    enum class IndexFormat : uint8_t
    {
        Uint16,
        Uint32
    };

    // 2 -> Uint16, 4 -> Uint32, anything else has no index format.
    [[nodiscard]] constexpr std::optional<IndexFormat> IndexFormatFromElementSize(uint32_t bytes)
    {
        if (bytes == 2) return IndexFormat::Uint16;
        if (bytes == 4) return IndexFormat::Uint32;
        return std::nullopt;
    }

    // --- Vertex input --------------------------------------------------------

    enum class VertexFormat : uint8_t
    {
        Uint8x2, Uint8x4, Sint8x2, Sint8x4,
        Unorm8x2, Unorm8x4, Snorm8x2, Snorm8x4,
        Uint16x2, Uint16x4, Sint16x2, Sint16x4,
        Unorm16x2, Unorm16x4, Snorm16x2, Snorm16x4,
        Float32, Float32x2, Float32x3, Float32x4,
        Uint32, Uint32x2, Uint32x3, Uint32x4,
        Sint32, Sint32x2, Sint32x3, Sint32x4,
        Float64, Float64x2, Float64x3, Float64x4,
    };

    [[nodiscard]] constexpr uint32_t VertexFormatSize(VertexFormat format)
    {
        switch (format)
        {
        case VertexFormat::Uint8x2: case VertexFormat::Sint8x2:
        case VertexFormat::Unorm8x2: case VertexFormat::Snorm8x2:
            return 2;
        case VertexFormat::Uint8x4: case VertexFormat::Sint8x4:
        case VertexFormat::Unorm8x4: case VertexFormat::Snorm8x4:
        case VertexFormat::Uint16x2: case VertexFormat::Sint16x2:
        case VertexFormat::Unorm16x2: case VertexFormat::Snorm16x2:
        case VertexFormat::Float32: case VertexFormat::Uint32: case VertexFormat::Sint32:
            return 4;
        case VertexFormat::Uint16x4: case VertexFormat::Sint16x4:
        case VertexFormat::Unorm16x4: case VertexFormat::Snorm16x4:
        case VertexFormat::Float32x2: case VertexFormat::Uint32x2: case VertexFormat::Sint32x2:
        case VertexFormat::Float64:
            return 8;
        case VertexFormat::Float32x3: case VertexFormat::Uint32x3: case VertexFormat::Sint32x3:
            return 12;
        case VertexFormat::Float32x4: case VertexFormat::Uint32x4: case VertexFormat::Sint32x4:
        case VertexFormat::Float64x2:
            return 16;
        case VertexFormat::Float64x3:
            return 24;
        case VertexFormat::Float64x4:
            return 32;
        }
        return 0;
    }

    enum class VertexStepMode : uint8_t
    {
        Vertex,
        Instance
    };

    struct VertexAttribute
    {
        VertexFormat Format = VertexFormat::Float32;
        uint32_t Offset = 0;
        uint32_t ShaderLocation = 0;

        bool operator==(const VertexAttribute&) const = default;
    };

    struct VertexBufferLayout
    {
        uint32_t Stride = 0;
        VertexStepMode StepMode = VertexStepMode::Vertex;
        std::vector<VertexAttribute> Attributes;

        bool operator==(const VertexBufferLayout&) const = default;
    };

    // --- Textures ------------------------------------------------------------

    enum class TextureFormat : uint32_t
    {
        Undefined,
        R8Unorm,
        RG8Unorm,
        RGBA8Unorm,
        RGBA8UnormSrgb,
        BGRA8Unorm,
        BGRA8UnormSrgb,
        R32Float,
        RG32Float,
        RGBA32Float,
        R32Uint,
        R32Sint,
        Depth32Float,
        Depth24PlusStencil8,
    };

    [[nodiscard]] constexpr uint32_t TexelSize(TextureFormat format)
    {
        switch (format)
        {
        case TextureFormat::R8Unorm:             return 1;
        case TextureFormat::RG8Unorm:            return 2;
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::RGBA8UnormSrgb:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::BGRA8UnormSrgb:
        case TextureFormat::R32Float:
        case TextureFormat::R32Uint:
        case TextureFormat::R32Sint:
        case TextureFormat::Depth32Float:
        case TextureFormat::Depth24PlusStencil8: return 4;
        case TextureFormat::RG32Float:           return 8;
        case TextureFormat::RGBA32Float:         return 16;
        case TextureFormat::Undefined:           return 0;
        }
        return 0;
    }

    [[nodiscard]] constexpr bool IsDepthFormat(TextureFormat format)
    {
        return format == TextureFormat::Depth32Float || format == TextureFormat::Depth24PlusStencil8;
    }

    [[nodiscard]] constexpr bool HasStencil(TextureFormat format)
    {
        return format == TextureFormat::Depth24PlusStencil8;
    }

    enum class TextureUsage : uint32_t
    {
        None             = 0,
        CopySrc          = 1u << 0,
        CopyDst          = 1u << 1,
        Sampled          = 1u << 2,
        Storage          = 1u << 3,
        RenderAttachment = 1u << 4,
    };

    enum class TextureDimension : uint8_t
    {
        D1,
        D2,
        D3
    };

    enum class TextureViewDimension : uint8_t
    {
        D1,
        D2,
        D2Array,
        Cube,
        CubeArray,
        D3
    };

    struct Extent2D
    {
        uint32_t Width = 0;
        uint32_t Height = 0;

        bool operator==(const Extent2D&) const = default;
    };

    struct Extent3D
    {
        uint32_t Width = 1;
        uint32_t Height = 1;
        uint32_t Depth = 1;

        [[nodiscard]] constexpr uint64_t TexelCount() const
        {
            return static_cast<uint64_t>(Width) * Height * Depth;
        }

        bool operator==(const Extent3D&) const = default;
    };

    struct TextureDesc
    {
        TextureDimension Dimension = TextureDimension::D2;
        Extent3D Size{};
        TextureFormat Format = TextureFormat::RGBA8Unorm;
        TextureUsage Usage = TextureUsage::None;
        uint32_t MipLevels = 1;
        uint32_t SampleCount = 1;
        std::string_view Label;
    };

    // --- Samplers ------------------------------------------------------------

    enum class AddressMode : uint8_t
    {
        ClampToEdge,
        Repeat,
        MirrorRepeat,
        ClampToBorder
    };

    enum class FilterMode : uint8_t
    {
        Nearest,
        Linear
    };

    enum class CompareFunction : uint8_t
    {
        Never,
        Less,
        Equal,
        LessEqual,
        Greater,
        NotEqual,
        GreaterEqual,
        Always
    };

    enum class BorderColor : uint8_t
    {
        TransparentBlack,
        OpaqueBlack,
        OpaqueWhite
    };

    struct SamplerDesc
    {
        AddressMode AddressU = AddressMode::ClampToEdge;
        AddressMode AddressV = AddressMode::ClampToEdge;
        AddressMode AddressW = AddressMode::ClampToEdge;
        FilterMode MagFilter = FilterMode::Nearest;
        FilterMode MinFilter = FilterMode::Nearest;
        FilterMode MipmapFilter = FilterMode::Nearest;
        float LodMinClamp = 0.0f;
        float LodMaxClamp = 32.0f;
        std::optional<CompareFunction> Compare;
        uint16_t AnisotropyClamp = 1;
        std::optional<BorderColor> Border;
        std::string Label;
    };

    // --- Shaders & binding layouts -------------------------------------------

    enum class ShaderStage : uint8_t
    {
        Vertex,
        Fragment,
        Compute
    };

    enum class ShaderVisibility : uint32_t
    {
        None     = 0,
        Vertex   = 1u << 0,
        Fragment = 1u << 1,
        Compute  = 1u << 2,
    };

    enum class BindingKind : uint8_t
    {
        UniformBuffer,
        StorageBuffer,
        SampledTexture,
        StorageTexture,
        Sampler
    };

    enum class TextureSampleType : uint8_t
    {
        Float,
        UnfilterableFloat,
        Depth,
        Sint,
        Uint
    };

    enum class StorageTextureAccess : uint8_t
    {
        ReadOnly,
        WriteOnly,
        ReadWrite
    };

    enum class SamplerBindingType : uint8_t
    {
        Filtering,
        NonFiltering,
        Comparison
    };

    // Fields beyond Kind are only meaningful for the matching kind.
    struct BindGroupLayoutEntry
    {
        uint32_t Binding = 0;
        ShaderVisibility Visibility = ShaderVisibility::None;
        BindingKind Kind = BindingKind::UniformBuffer;

        uint64_t MinBindingSize = 0;
        bool ReadOnly = false;

        TextureSampleType SampleType = TextureSampleType::Float;
        TextureViewDimension ViewDimension = TextureViewDimension::D2;
        bool Multisampled = false;

        StorageTextureAccess Access = StorageTextureAccess::WriteOnly;
        TextureFormat Format = TextureFormat::Undefined;

        SamplerBindingType SamplerType = SamplerBindingType::Filtering;

        bool operator==(const BindGroupLayoutEntry&) const = default;
    };

    // --- Fixed function ------------------------------------------------------

    enum class PrimitiveTopology : uint8_t
    {
        PointList,
        LineList,
        LineStrip,
        TriangleList,
        TriangleStrip
    };

    [[nodiscard]] constexpr bool IsStripTopology(PrimitiveTopology topology)
    {
        return topology == PrimitiveTopology::LineStrip || topology == PrimitiveTopology::TriangleStrip;
    }

    enum class FrontFace : uint8_t
    {
        Ccw,
        Cw
    };

    enum class CullMode : uint8_t
    {
        None,
        Front,
        Back
    };

    enum class PolygonMode : uint8_t
    {
        Fill,
        Line,
        Point
    };

    enum class StencilOperation : uint8_t
    {
        Keep,
        Zero,
        Replace,
        Invert,
        IncrementClamp,
        DecrementClamp,
        IncrementWrap,
        DecrementWrap
    };

    struct StencilFaceState
    {
        CompareFunction Compare = CompareFunction::Always;
        StencilOperation FailOp = StencilOperation::Keep;
        StencilOperation DepthFailOp = StencilOperation::Keep;
        StencilOperation PassOp = StencilOperation::Keep;

        bool operator==(const StencilFaceState&) const = default;
    };

    struct StencilState
    {
        StencilFaceState Front{};
        StencilFaceState Back{};
        uint32_t ReadMask = 0xFFFFFFFFu;
        uint32_t WriteMask = 0xFFFFFFFFu;

        [[nodiscard]] bool IsEnabled() const
        {
            return Front != StencilFaceState{} || Back != StencilFaceState{};
        }
    };

    struct DepthBiasState
    {
        int32_t Constant = 0;
        float SlopeScale = 0.0f;
        float Clamp = 0.0f;

        [[nodiscard]] bool IsEnabled() const
        {
            return Constant != 0 || SlopeScale != 0.0f;
        }
    };

    struct DepthStencilState
    {
        TextureFormat Format = TextureFormat::Depth32Float;
        bool DepthWriteEnabled = false;
        CompareFunction DepthCompare = CompareFunction::Always;
        StencilState Stencil{};
        DepthBiasState Bias{};
    };

    // --- Passes --------------------------------------------------------------

    struct ClearColor
    {
        double R = 0.0;
        double G = 0.0;
        double B = 0.0;
        double A = 1.0;

        bool operator==(const ClearColor&) const = default;
    };

    enum class LoadOp : uint8_t
    {
        Clear,
        Load
    };

    struct DepthOps
    {
        std::optional<float> Clear; // nullopt -> load
        bool Store = true;
    };

    struct StencilOps
    {
        std::optional<uint32_t> Clear; // nullopt -> load
        bool Store = true;
    };

    // --- Presentation --------------------------------------------------------

    enum class PresentMode : uint8_t
    {
        Fifo,
        Mailbox,
        Immediate
    };

    // Lost / OutOfMemory: reconfiguring the surface recovers.
    // Timeout: skip the frame.
    // Outdated: the surface itself is gone; reconfiguration cannot recover.
    enum class SurfaceError : uint8_t
    {
        Lost,
        OutOfMemory,
        Timeout,
        Outdated
    };

    constexpr std::string_view SurfaceErrorToString(SurfaceError error)
    {
        switch (error)
        {
        case SurfaceError::Lost:        return "Lost";
        case SurfaceError::OutOfMemory: return "OutOfMemory";
        case SurfaceError::Timeout:     return "Timeout";
        case SurfaceError::Outdated:    return "Outdated";
        }
        return "Unknown";
    }
}
