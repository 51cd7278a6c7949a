module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI.Vulkan:Convert;

import Core;
import RHI;

// Backend-agnostic enums to their Vulkan equivalents.
export namespace RHI::Vk
{
    [[nodiscard]] constexpr VkFormat ToVkFormat(TextureFormat format)
    {
        switch (format)
        {
        case TextureFormat::R8Unorm:             return VK_FORMAT_R8_UNORM;
        case TextureFormat::RG8Unorm:            return VK_FORMAT_R8G8_UNORM;
        case TextureFormat::RGBA8Unorm:          return VK_FORMAT_R8G8B8A8_UNORM;
        case TextureFormat::RGBA8UnormSrgb:      return VK_FORMAT_R8G8B8A8_SRGB;
        case TextureFormat::BGRA8Unorm:          return VK_FORMAT_B8G8R8A8_UNORM;
        case TextureFormat::BGRA8UnormSrgb:      return VK_FORMAT_B8G8R8A8_SRGB;
        case TextureFormat::R32Float:            return VK_FORMAT_R32_SFLOAT;
        case TextureFormat::RG32Float:           return VK_FORMAT_R32G32_SFLOAT;
        case TextureFormat::RGBA32Float:         return VK_FORMAT_R32G32B32A32_SFLOAT;
        case TextureFormat::R32Uint:             return VK_FORMAT_R32_UINT;
        case TextureFormat::R32Sint:             return VK_FORMAT_R32_SINT;
        case TextureFormat::Depth32Float:        return VK_FORMAT_D32_SFLOAT;
        case TextureFormat::Depth24PlusStencil8: return VK_FORMAT_D24_UNORM_S8_UINT;
        case TextureFormat::Undefined:           return VK_FORMAT_UNDEFINED;
        }
        return VK_FORMAT_UNDEFINED;
    }

    [[nodiscard]] constexpr TextureFormat FromVkFormat(VkFormat format)
    {
        switch (format)
        {
        case VK_FORMAT_R8G8B8A8_UNORM: return TextureFormat::RGBA8Unorm;
        case VK_FORMAT_R8G8B8A8_SRGB:  return TextureFormat::RGBA8UnormSrgb;
        case VK_FORMAT_B8G8R8A8_UNORM: return TextureFormat::BGRA8Unorm;
        case VK_FORMAT_B8G8R8A8_SRGB:  return TextureFormat::BGRA8UnormSrgb;
        default:                       return TextureFormat::Undefined;
        }
    }

    [[nodiscard]] constexpr VkImageAspectFlags AspectOf(TextureFormat format)
    {
        if (HasStencil(format)) return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;
        if (IsDepthFormat(format)) return VK_IMAGE_ASPECT_DEPTH_BIT;
        return VK_IMAGE_ASPECT_COLOR_BIT;
    }

    [[nodiscard]] constexpr VkFormat ToVkFormat(VertexFormat format)
    {
        switch (format)
        {
        case VertexFormat::Uint8x2:   return VK_FORMAT_R8G8_UINT;
        case VertexFormat::Uint8x4:   return VK_FORMAT_R8G8B8A8_UINT;
        case VertexFormat::Sint8x2:   return VK_FORMAT_R8G8_SINT;
        case VertexFormat::Sint8x4:   return VK_FORMAT_R8G8B8A8_SINT;
        case VertexFormat::Unorm8x2:  return VK_FORMAT_R8G8_UNORM;
        case VertexFormat::Unorm8x4:  return VK_FORMAT_R8G8B8A8_UNORM;
        case VertexFormat::Snorm8x2:  return VK_FORMAT_R8G8_SNORM;
        case VertexFormat::Snorm8x4:  return VK_FORMAT_R8G8B8A8_SNORM;
        case VertexFormat::Uint16x2:  return VK_FORMAT_R16G16_UINT;
        case VertexFormat::Uint16x4:  return VK_FORMAT_R16G16B16A16_UINT;
        case VertexFormat::Sint16x2:  return VK_FORMAT_R16G16_SINT;
        case VertexFormat::Sint16x4:  return VK_FORMAT_R16G16B16A16_SINT;
        case VertexFormat::Unorm16x2: return VK_FORMAT_R16G16_UNORM;
        case VertexFormat::Unorm16x4: return VK_FORMAT_R16G16B16A16_UNORM;
        case VertexFormat::Snorm16x2: return VK_FORMAT_R16G16_SNORM;
        case VertexFormat::Snorm16x4: return VK_FORMAT_R16G16B16A16_SNORM;
        case VertexFormat::Float32:   return VK_FORMAT_R32_SFLOAT;
        case VertexFormat::Float32x2: return VK_FORMAT_R32G32_SFLOAT;
        case VertexFormat::Float32x3: return VK_FORMAT_R32G32B32_SFLOAT;
        case VertexFormat::Float32x4: return VK_FORMAT_R32G32B32A32_SFLOAT;
        case VertexFormat::Uint32:    return VK_FORMAT_R32_UINT;
        case VertexFormat::Uint32x2:  return VK_FORMAT_R32G32_UINT;
        case VertexFormat::Uint32x3:  return VK_FORMAT_R32G32B32_UINT;
        case VertexFormat::Uint32x4:  return VK_FORMAT_R32G32B32A32_UINT;
        case VertexFormat::Sint32:    return VK_FORMAT_R32_SINT;
        case VertexFormat::Sint32x2:  return VK_FORMAT_R32G32_SINT;
        case VertexFormat::Sint32x3:  return VK_FORMAT_R32G32B32_SINT;
        case VertexFormat::Sint32x4:  return VK_FORMAT_R32G32B32A32_SINT;
        case VertexFormat::Float64:   return VK_FORMAT_R64_SFLOAT;
        case VertexFormat::Float64x2: return VK_FORMAT_R64G64_SFLOAT;
        case VertexFormat::Float64x3: return VK_FORMAT_R64G64B64_SFLOAT;
        case VertexFormat::Float64x4: return VK_FORMAT_R64G64B64A64_SFLOAT;
        }
        return VK_FORMAT_UNDEFINED;
    }

    [[nodiscard]] constexpr VkBufferUsageFlags ToVkBufferUsage(BufferUsage usage)
    {
        // Uploads, zero fill and read-back all go through transfer commands.
        VkBufferUsageFlags flags = VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        if (HasFlag(usage, BufferUsage::Index))    flags |= VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
        if (HasFlag(usage, BufferUsage::Vertex))   flags |= VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
        if (HasFlag(usage, BufferUsage::Uniform))  flags |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
        if (HasFlag(usage, BufferUsage::Storage))  flags |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
        if (HasFlag(usage, BufferUsage::Indirect)) flags |= VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT;
        return flags;
    }

    [[nodiscard]] constexpr VkImageUsageFlags ToVkImageUsage(TextureUsage usage, TextureFormat format)
    {
        VkImageUsageFlags flags = VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        if (HasFlag(usage, TextureUsage::CopySrc)) flags |= VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
        if (HasFlag(usage, TextureUsage::Sampled)) flags |= VK_IMAGE_USAGE_SAMPLED_BIT;
        if (HasFlag(usage, TextureUsage::Storage)) flags |= VK_IMAGE_USAGE_STORAGE_BIT;
        if (HasFlag(usage, TextureUsage::RenderAttachment))
        {
            flags |= IsDepthFormat(format) ? VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT
                                           : VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        }
        return flags;
    }

    [[nodiscard]] constexpr VkImageType ToVkImageType(TextureDimension dimension)
    {
        switch (dimension)
        {
        case TextureDimension::D1: return VK_IMAGE_TYPE_1D;
        case TextureDimension::D2: return VK_IMAGE_TYPE_2D;
        case TextureDimension::D3: return VK_IMAGE_TYPE_3D;
        }
        return VK_IMAGE_TYPE_2D;
    }

    [[nodiscard]] constexpr VkImageViewType ToVkImageViewType(TextureDimension dimension)
    {
        switch (dimension)
        {
        case TextureDimension::D1: return VK_IMAGE_VIEW_TYPE_1D;
        case TextureDimension::D2: return VK_IMAGE_VIEW_TYPE_2D;
        case TextureDimension::D3: return VK_IMAGE_VIEW_TYPE_3D;
        }
        return VK_IMAGE_VIEW_TYPE_2D;
    }

    [[nodiscard]] constexpr VkSampleCountFlagBits ToVkSampleCount(uint32_t count)
    {
        switch (count)
        {
        case 2:  return VK_SAMPLE_COUNT_2_BIT;
        case 4:  return VK_SAMPLE_COUNT_4_BIT;
        case 8:  return VK_SAMPLE_COUNT_8_BIT;
        default: return VK_SAMPLE_COUNT_1_BIT;
        }
    }

    [[nodiscard]] constexpr VkSamplerAddressMode ToVkAddressMode(AddressMode mode)
    {
        switch (mode)
        {
        case AddressMode::ClampToEdge:   return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        case AddressMode::Repeat:        return VK_SAMPLER_ADDRESS_MODE_REPEAT;
        case AddressMode::MirrorRepeat:  return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
        case AddressMode::ClampToBorder: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_BORDER;
        }
        return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    }

    [[nodiscard]] constexpr VkFilter ToVkFilter(FilterMode mode)
    {
        return mode == FilterMode::Linear ? VK_FILTER_LINEAR : VK_FILTER_NEAREST;
    }

    [[nodiscard]] constexpr VkSamplerMipmapMode ToVkMipmapMode(FilterMode mode)
    {
        return mode == FilterMode::Linear ? VK_SAMPLER_MIPMAP_MODE_LINEAR : VK_SAMPLER_MIPMAP_MODE_NEAREST;
    }

    [[nodiscard]] constexpr VkCompareOp ToVkCompareOp(CompareFunction compare)
    {
        switch (compare)
        {
        case CompareFunction::Never:        return VK_COMPARE_OP_NEVER;
        case CompareFunction::Less:         return VK_COMPARE_OP_LESS;
        case CompareFunction::Equal:        return VK_COMPARE_OP_EQUAL;
        case CompareFunction::LessEqual:    return VK_COMPARE_OP_LESS_OR_EQUAL;
        case CompareFunction::Greater:      return VK_COMPARE_OP_GREATER;
        case CompareFunction::NotEqual:     return VK_COMPARE_OP_NOT_EQUAL;
        case CompareFunction::GreaterEqual: return VK_COMPARE_OP_GREATER_OR_EQUAL;
        case CompareFunction::Always:       return VK_COMPARE_OP_ALWAYS;
        }
        return VK_COMPARE_OP_ALWAYS;
    }

    [[nodiscard]] constexpr VkBorderColor ToVkBorderColor(BorderColor color)
    {
        switch (color)
        {
        case BorderColor::TransparentBlack: return VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK;
        case BorderColor::OpaqueBlack:      return VK_BORDER_COLOR_FLOAT_OPAQUE_BLACK;
        case BorderColor::OpaqueWhite:      return VK_BORDER_COLOR_FLOAT_OPAQUE_WHITE;
        }
        return VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK;
    }

    [[nodiscard]] constexpr VkShaderStageFlagBits ToVkShaderStage(ShaderStage stage)
    {
        switch (stage)
        {
        case ShaderStage::Vertex:   return VK_SHADER_STAGE_VERTEX_BIT;
        case ShaderStage::Fragment: return VK_SHADER_STAGE_FRAGMENT_BIT;
        case ShaderStage::Compute:  return VK_SHADER_STAGE_COMPUTE_BIT;
        }
        return VK_SHADER_STAGE_VERTEX_BIT;
    }

    [[nodiscard]] constexpr VkShaderStageFlags ToVkShaderStages(ShaderVisibility visibility)
    {
        VkShaderStageFlags flags = 0;
        if (HasFlag(visibility, ShaderVisibility::Vertex))   flags |= VK_SHADER_STAGE_VERTEX_BIT;
        if (HasFlag(visibility, ShaderVisibility::Fragment)) flags |= VK_SHADER_STAGE_FRAGMENT_BIT;
        if (HasFlag(visibility, ShaderVisibility::Compute))  flags |= VK_SHADER_STAGE_COMPUTE_BIT;
        return flags;
    }

    [[nodiscard]] constexpr VkDescriptorType ToVkDescriptorType(BindingKind kind)
    {
        switch (kind)
        {
        case BindingKind::UniformBuffer:  return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        case BindingKind::StorageBuffer:  return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        case BindingKind::SampledTexture: return VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
        case BindingKind::StorageTexture: return VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
        case BindingKind::Sampler:        return VK_DESCRIPTOR_TYPE_SAMPLER;
        }
        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    }

    [[nodiscard]] constexpr VkPrimitiveTopology ToVkTopology(PrimitiveTopology topology)
    {
        switch (topology)
        {
        case PrimitiveTopology::PointList:     return VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
        case PrimitiveTopology::LineList:      return VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
        case PrimitiveTopology::LineStrip:     return VK_PRIMITIVE_TOPOLOGY_LINE_STRIP;
        case PrimitiveTopology::TriangleList:  return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        case PrimitiveTopology::TriangleStrip: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP;
        }
        return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    }

    [[nodiscard]] constexpr VkCullModeFlags ToVkCullMode(CullMode cull)
    {
        switch (cull)
        {
        case CullMode::None:  return VK_CULL_MODE_NONE;
        case CullMode::Front: return VK_CULL_MODE_FRONT_BIT;
        case CullMode::Back:  return VK_CULL_MODE_BACK_BIT;
        }
        return VK_CULL_MODE_NONE;
    }

    [[nodiscard]] constexpr VkPolygonMode ToVkPolygonMode(PolygonMode mode)
    {
        switch (mode)
        {
        case PolygonMode::Fill:  return VK_POLYGON_MODE_FILL;
        case PolygonMode::Line:  return VK_POLYGON_MODE_LINE;
        case PolygonMode::Point: return VK_POLYGON_MODE_POINT;
        }
        return VK_POLYGON_MODE_FILL;
    }

    [[nodiscard]] constexpr VkStencilOp ToVkStencilOp(StencilOperation op)
    {
        switch (op)
        {
        case StencilOperation::Keep:           return VK_STENCIL_OP_KEEP;
        case StencilOperation::Zero:           return VK_STENCIL_OP_ZERO;
        case StencilOperation::Replace:        return VK_STENCIL_OP_REPLACE;
        case StencilOperation::Invert:         return VK_STENCIL_OP_INVERT;
        case StencilOperation::IncrementClamp: return VK_STENCIL_OP_INCREMENT_AND_CLAMP;
        case StencilOperation::DecrementClamp: return VK_STENCIL_OP_DECREMENT_AND_CLAMP;
        case StencilOperation::IncrementWrap:  return VK_STENCIL_OP_INCREMENT_AND_WRAP;
        case StencilOperation::DecrementWrap:  return VK_STENCIL_OP_DECREMENT_AND_WRAP;
        }
        return VK_STENCIL_OP_KEEP;
    }

    [[nodiscard]] constexpr VkIndexType ToVkIndexType(IndexFormat format)
    {
        return format == IndexFormat::Uint16 ? VK_INDEX_TYPE_UINT16 : VK_INDEX_TYPE_UINT32;
    }

    [[nodiscard]] constexpr VkPresentModeKHR ToVkPresentMode(PresentMode mode)
    {
        switch (mode)
        {
        case PresentMode::Fifo:      return VK_PRESENT_MODE_FIFO_KHR;
        case PresentMode::Mailbox:   return VK_PRESENT_MODE_MAILBOX_KHR;
        case PresentMode::Immediate: return VK_PRESENT_MODE_IMMEDIATE_KHR;
        }
        return VK_PRESENT_MODE_FIFO_KHR;
    }

    [[nodiscard]] constexpr Core::ErrorCode ToErrorCode(VkResult result)
    {
        switch (result)
        {
        case VK_ERROR_OUT_OF_HOST_MEMORY:   return Core::ErrorCode::OutOfMemory;
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return Core::ErrorCode::OutOfDeviceMemory;
        case VK_ERROR_DEVICE_LOST:          return Core::ErrorCode::DeviceLost;
        case VK_ERROR_SURFACE_LOST_KHR:     return Core::ErrorCode::SurfaceLost;
        default:                            return Core::ErrorCode::Unknown;
        }
    }
}
