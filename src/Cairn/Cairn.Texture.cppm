module;
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

export module Cairn:Texture;

import Core;
import RHI;

export namespace Cairn
{
    // --- Texel element types -------------------------------------------------

    template<typename T>
    struct Depth
    {
        T Value{};
    };

    // 24-bit depth + 8-bit stencil packed in one word.
    struct DepthStencil
    {
        uint32_t Packed = 0;
    };

    struct Srgba8
    {
        uint8_t R = 0, G = 0, B = 0, A = 0;
    };

    struct Bgra8Srgb
    {
        uint8_t B = 0, G = 0, R = 0, A = 0;
    };

    template<typename T>
    consteval RHI::TextureFormat DeduceTexelFormat()
    {
        using F = RHI::TextureFormat;

        if constexpr (std::same_as<T, uint8_t>)          return F::R8Unorm;
        else if constexpr (std::same_as<T, glm::u8vec2>) return F::RG8Unorm;
        else if constexpr (std::same_as<T, glm::u8vec4>) return F::RGBA8Unorm;
        else if constexpr (std::same_as<T, Srgba8>)      return F::RGBA8UnormSrgb;
        else if constexpr (std::same_as<T, Bgra8Srgb>)   return F::BGRA8UnormSrgb;
        else if constexpr (std::same_as<T, float>)       return F::R32Float;
        else if constexpr (std::same_as<T, glm::vec2>)   return F::RG32Float;
        else if constexpr (std::same_as<T, glm::vec4>)   return F::RGBA32Float;
        else if constexpr (std::same_as<T, uint32_t>)    return F::R32Uint;
        else if constexpr (std::same_as<T, int32_t>)     return F::R32Sint;
        else if constexpr (std::same_as<T, Depth<float>>) return F::Depth32Float;
        else if constexpr (std::same_as<T, DepthStencil>) return F::Depth24PlusStencil8;
        else return F::Undefined;
    }

    template<typename T>
    concept TexelType = DeduceTexelFormat<T>() != RHI::TextureFormat::Undefined
                        && sizeof(T) == RHI::TexelSize(DeduceTexelFormat<T>());

    template<TexelType T>
    inline constexpr RHI::TextureFormat TexelFormatOf = DeduceTexelFormat<T>();

    template<typename T>
    concept DepthTexelType = TexelType<T> && RHI::IsDepthFormat(TexelFormatOf<T>);

    // --- Size policy ---------------------------------------------------------

    enum class SizePolicyKind : uint8_t
    {
        Fixed,
        Surface,
        SurfaceScaled
    };

    struct SizePolicy
    {
        SizePolicyKind Kind = SizePolicyKind::Fixed;
        RHI::Extent3D Extent{};
        float Scale = 1.0f;

        [[nodiscard]] static SizePolicy Fixed(RHI::Extent3D extent) { return {SizePolicyKind::Fixed, extent, 1.0f}; }
        [[nodiscard]] static SizePolicy Surface() { return {SizePolicyKind::Surface, {}, 1.0f}; }
        [[nodiscard]] static SizePolicy SurfaceScaled(float scale) { return {SizePolicyKind::SurfaceScaled, {}, scale}; }

        [[nodiscard]] bool FollowsSurface() const { return Kind != SizePolicyKind::Fixed; }

        // Every dimension is at least one texel, even for an empty surface.
        [[nodiscard]] RHI::Extent3D Evaluate(RHI::Extent2D surface) const
        {
            switch (Kind)
            {
            case SizePolicyKind::Fixed:
                return Extent;
            case SizePolicyKind::Surface:
                return {std::max(surface.Width, 1u), std::max(surface.Height, 1u), 1};
            case SizePolicyKind::SurfaceScaled:
                return {ScaleDimension(surface.Width), ScaleDimension(surface.Height), 1};
            }
            return Extent;
        }

    private:
        [[nodiscard]] uint32_t ScaleDimension(uint32_t dim) const
        {
            const double scaled = std::floor(static_cast<double>(dim) * Scale);
            return scaled < 1.0 ? 1u : static_cast<uint32_t>(scaled);
        }
    };

    // --- Record --------------------------------------------------------------

    class Texture
    {
    public:
        Texture(Core::TypeTag elementType, const RHI::TextureDesc& desc, SizePolicy policy,
                std::unique_ptr<RHI::ITexture> gpu, std::string label)
            : m_ElementType(elementType), m_Desc(desc), m_Policy(policy),
              m_Gpu(std::move(gpu)), m_Label(std::move(label))
        {
            m_Desc.Label = {};
        }

        Texture(const Texture&) = delete;
        Texture& operator=(const Texture&) = delete;

        [[nodiscard]] Core::TypeTag GetElementType() const { return m_ElementType; }
        [[nodiscard]] RHI::TextureFormat GetFormat() const { return m_Desc.Format; }
        [[nodiscard]] RHI::TextureDimension GetDimension() const { return m_Desc.Dimension; }
        [[nodiscard]] RHI::TextureUsage GetUsage() const { return m_Desc.Usage; }
        [[nodiscard]] RHI::Extent3D GetExtent() const { return m_Desc.Size; }
        [[nodiscard]] const SizePolicy& GetPolicy() const { return m_Policy; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }
        [[nodiscard]] uint32_t GetReallocationCount() const { return m_Reallocations; }

        // Description for a fresh allocation at the given size.
        [[nodiscard]] RHI::TextureDesc MakeDesc(RHI::Extent3D extent) const
        {
            RHI::TextureDesc desc = m_Desc;
            desc.Size = extent;
            desc.Label = m_Label;
            return desc;
        }

        [[nodiscard]] const RHI::ITexture& GetGpu() const { return *m_Gpu; }
        [[nodiscard]] const RHI::ITextureView& GetView() const { return m_Gpu->GetView(); }
        [[nodiscard]] uint64_t GetByteSize() const { return m_Desc.Size.TexelCount() * RHI::TexelSize(m_Desc.Format); }

        void SetPolicy(SizePolicy policy) { m_Policy = policy; }

        void Replace(std::unique_ptr<RHI::ITexture> gpu, RHI::Extent3D extent)
        {
            m_Gpu = std::move(gpu);
            m_Desc.Size = extent;
            ++m_Reallocations;
        }

    private:
        Core::TypeTag m_ElementType;
        RHI::TextureDesc m_Desc;
        SizePolicy m_Policy;
        std::unique_ptr<RHI::ITexture> m_Gpu;
        std::string m_Label;
        uint32_t m_Reallocations = 0;
    };
}
