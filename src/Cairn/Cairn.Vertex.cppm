module;
#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

export module Cairn:Vertex;

import RHI;

export namespace Cairn
{
    // Marks an integer vector field that the vertex stage reads as a
    // normalized float ([0,1] for unsigned, [-1,1] for signed).
    template<typename V>
    struct Normalized
    {
        V Value{};
    };

    template<typename T>
    consteval std::optional<RHI::VertexFormat> DeduceVertexFormat()
    {
        using F = RHI::VertexFormat;

        if constexpr (std::same_as<T, float>)      return F::Float32;
        else if constexpr (std::same_as<T, glm::vec2>)  return F::Float32x2;
        else if constexpr (std::same_as<T, glm::vec3>)  return F::Float32x3;
        else if constexpr (std::same_as<T, glm::vec4>)  return F::Float32x4;
        else if constexpr (std::same_as<T, double>)     return F::Float64;
        else if constexpr (std::same_as<T, glm::dvec2>) return F::Float64x2;
        else if constexpr (std::same_as<T, glm::dvec3>) return F::Float64x3;
        else if constexpr (std::same_as<T, glm::dvec4>) return F::Float64x4;
        else if constexpr (std::same_as<T, uint32_t>)   return F::Uint32;
        else if constexpr (std::same_as<T, glm::uvec2>) return F::Uint32x2;
        else if constexpr (std::same_as<T, glm::uvec3>) return F::Uint32x3;
        else if constexpr (std::same_as<T, glm::uvec4>) return F::Uint32x4;
        else if constexpr (std::same_as<T, int32_t>)    return F::Sint32;
        else if constexpr (std::same_as<T, glm::ivec2>) return F::Sint32x2;
        else if constexpr (std::same_as<T, glm::ivec3>) return F::Sint32x3;
        else if constexpr (std::same_as<T, glm::ivec4>) return F::Sint32x4;
        else if constexpr (std::same_as<T, glm::u8vec2>)  return F::Uint8x2;
        else if constexpr (std::same_as<T, glm::u8vec4>)  return F::Uint8x4;
        else if constexpr (std::same_as<T, glm::i8vec2>)  return F::Sint8x2;
        else if constexpr (std::same_as<T, glm::i8vec4>)  return F::Sint8x4;
        else if constexpr (std::same_as<T, glm::u16vec2>) return F::Uint16x2;
        else if constexpr (std::same_as<T, glm::u16vec4>) return F::Uint16x4;
        else if constexpr (std::same_as<T, glm::i16vec2>) return F::Sint16x2;
        else if constexpr (std::same_as<T, glm::i16vec4>) return F::Sint16x4;
        else if constexpr (std::same_as<T, Normalized<glm::u8vec2>>)  return F::Unorm8x2;
        else if constexpr (std::same_as<T, Normalized<glm::u8vec4>>)  return F::Unorm8x4;
        else if constexpr (std::same_as<T, Normalized<glm::i8vec2>>)  return F::Snorm8x2;
        else if constexpr (std::same_as<T, Normalized<glm::i8vec4>>)  return F::Snorm8x4;
        else if constexpr (std::same_as<T, Normalized<glm::u16vec2>>) return F::Unorm16x2;
        else if constexpr (std::same_as<T, Normalized<glm::u16vec4>>) return F::Unorm16x4;
        else if constexpr (std::same_as<T, Normalized<glm::i16vec2>>) return F::Snorm16x2;
        else if constexpr (std::same_as<T, Normalized<glm::i16vec4>>) return F::Snorm16x4;
        else return std::nullopt;
    }

    template<typename T>
    concept VertexField = DeduceVertexFormat<T>().has_value();

    template<VertexField T>
    inline constexpr RHI::VertexFormat VertexFormatOf = *DeduceVertexFormat<T>();

    // Attributes for a tightly packed struct whose fields appear in the given
    // order, one shader location each starting at firstLocation.
    //
    //   struct Vertex { glm::vec3 Position; glm::vec2 Uv; };
    //   template<> struct Cairn::VertexLayout<Vertex>
    //   {
    //       static constexpr auto Attributes = SequentialAttributes<glm::vec3, glm::vec2>();
    //   };
    template<VertexField... Fields>
    constexpr std::array<RHI::VertexAttribute, sizeof...(Fields)> SequentialAttributes(uint32_t firstLocation = 0)
    {
        std::array<RHI::VertexAttribute, sizeof...(Fields)> attributes{};
        uint32_t offset = 0;
        size_t i = 0;
        ((attributes[i] = RHI::VertexAttribute{
              .Format = VertexFormatOf<Fields>,
              .Offset = offset,
              .ShaderLocation = firstLocation + static_cast<uint32_t>(i)},
          offset += RHI::VertexFormatSize(VertexFormatOf<Fields>),
          ++i), ...);
        return attributes;
    }

    // Specialise for each vertex struct. Single-field element types get a
    // layout for free.
    template<typename T>
    struct VertexLayout
    {
    };

    template<VertexField T>
    struct VertexLayout<T>
    {
        static constexpr auto Attributes = SequentialAttributes<T>();
    };

    template<typename T>
    concept VertexType = std::is_trivially_copyable_v<T> && requires {
        { VertexLayout<T>::Attributes.size() } -> std::convertible_to<size_t>;
    };

    template<VertexType T>
    consteval uint32_t AttributeExtent()
    {
        uint32_t end = 0;
        for (const RHI::VertexAttribute& attribute : VertexLayout<T>::Attributes)
            end = std::max(end, attribute.Offset + RHI::VertexFormatSize(attribute.Format));
        return end;
    }

    template<VertexType T>
    [[nodiscard]] RHI::VertexBufferLayout MakeVertexBufferLayout(RHI::VertexStepMode stepMode)
    {
        static_assert(AttributeExtent<T>() <= sizeof(T), "vertex attributes overrun the element type");

        const auto& attributes = VertexLayout<T>::Attributes;
        return RHI::VertexBufferLayout{
            .Stride = static_cast<uint32_t>(sizeof(T)),
            .StepMode = stepMode,
            .Attributes = {attributes.begin(), attributes.end()},
        };
    }
}
