module;
#include <cstdint>
#include <string_view>
#include <variant>

export module Cairn:Types;

import Core;

export namespace Cairn
{
    struct BufferTag {};
    struct TextureTag {};
    struct SamplerTag {};
    struct ShaderTag {};
    struct BindGroupTag {};
    struct RenderPipelineTag {};
    struct ComputePipelineTag {};
    struct RenderPassTag {};
    struct ComputePassTag {};

    using BufferHandle          = Core::Handle<BufferTag>;
    using TextureHandle         = Core::Handle<TextureTag>;
    using SamplerHandle         = Core::Handle<SamplerTag>;
    using ShaderHandle          = Core::Handle<ShaderTag>;
    using BindGroupHandle       = Core::Handle<BindGroupTag>;
    using RenderPipelineHandle  = Core::Handle<RenderPipelineTag>;
    using ComputePipelineHandle = Core::Handle<ComputePipelineTag>;
    using RenderPassHandle      = Core::Handle<RenderPassTag>;
    using ComputePassHandle     = Core::Handle<ComputePassTag>;

    // Stands for the presentable surface image of the frame being rendered.
    // Valid only as a render-pass color attachment; never issued by a registry.
    inline constexpr TextureHandle SurfaceTexture{TextureHandle::INVALID_INDEX - 1};

    enum class FrameStatus : uint8_t
    {
        Presented,
        Reconfigured, // surface was reconfigured, nothing presented
        Skipped       // acquire timed out or the surface has no area
    };

    constexpr std::string_view FrameStatusToString(FrameStatus status)
    {
        switch (status)
        {
        case FrameStatus::Presented:    return "Presented";
        case FrameStatus::Reconfigured: return "Reconfigured";
        case FrameStatus::Skipped:      return "Skipped";
        }
        return "Unknown";
    }

    // Entry in the global pass order.
    using PassRef = std::variant<RenderPassHandle, ComputePassHandle>;
}
