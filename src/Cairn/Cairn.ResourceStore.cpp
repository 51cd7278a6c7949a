module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <utility>
#include <vector>

module Cairn:ResourceStore.Impl;
import :ResourceStore;
import Core;
import RHI;

namespace Cairn
{
    namespace
    {
        bool FitsDimension(RHI::TextureDimension dimension, RHI::Extent3D extent)
        {
            if (extent.Width == 0 || extent.Height == 0 || extent.Depth == 0) return false;

            switch (dimension)
            {
            case RHI::TextureDimension::D1: return extent.Height == 1 && extent.Depth == 1;
            case RHI::TextureDimension::D2: return extent.Depth == 1;
            case RHI::TextureDimension::D3: return true;
            }
            return false;
        }
    }

    ResourceStore::ResourceStore(RHI::IDevice& device)
        : m_Device(device), m_SurfaceExtent(device.GetSurfaceExtent())
    {
    }

    Core::Expected<const RHI::IBuffer*> ResourceStore::ResolveBuffer(BufferHandle handle) const
    {
        auto buffer = m_Buffers.Get(handle);
        if (!buffer) return std::unexpected(buffer.error());
        return &(*buffer)->GetGpu();
    }

    Core::Expected<const RHI::ITexture*> ResourceStore::ResolveTexture(TextureHandle handle) const
    {
        if (handle == SurfaceTexture) return std::unexpected(Core::ErrorCode::InvalidArgument);

        auto texture = m_Textures.Get(handle);
        if (!texture) return std::unexpected(texture.error());
        return &(*texture)->GetGpu();
    }

    Core::Expected<const RHI::ISampler*> ResourceStore::ResolveSampler(SamplerHandle handle) const
    {
        auto sampler = m_Samplers.Get(handle);
        if (!sampler) return std::unexpected(sampler.error());
        return &(*sampler)->GetGpu();
    }

    Core::Expected<bool> ResourceStore::WriteBuffer(BufferHandle handle, Core::TypeTag type,
                                                    std::span<const std::byte> data)
    {
        auto found = m_Buffers.Get(handle);
        if (!found)
        {
            Core::Log::Error("WriteBuffer(): buffer handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        Buffer& buffer = **found;
        if (buffer.GetElementType() != type)
        {
            Core::Log::Error("WriteBuffer(): '{}' holds {}, write supplies {}",
                             buffer.GetLabel(), buffer.GetElementType().Name(), type.Name());
            return std::unexpected(Core::ErrorCode::TypeMismatch);
        }

        if (data.size() <= buffer.GetCapacity())
        {
            if (data.empty()) return false;
            if (auto written = m_Device.WriteBuffer(buffer.GetGpu(), 0, data); !written)
                return std::unexpected(written.error());
            return false;
        }

        // Growth: new allocation sized exactly to the payload.
        auto gpu = m_Device.CreateBuffer({.Size = data.size(), .Usage = buffer.GetUsage(), .Label = buffer.GetLabel()});
        if (!gpu)
        {
            Core::Log::Error("WriteBuffer(): could not grow '{}' to {} bytes", buffer.GetLabel(), data.size());
            return std::unexpected(gpu.error());
        }
        if (auto written = m_Device.WriteBuffer(**gpu, 0, data); !written)
            return std::unexpected(written.error());

        const uint64_t oldCapacity = buffer.GetCapacity();
        buffer.Replace(std::move(*gpu));
        Core::Log::Info("Buffer '{}' reallocated: {} -> {} bytes", buffer.GetLabel(), oldCapacity, data.size());

        const BufferHandle changed[] = {handle};
        auto rebuilt = RebuildDependents(changed, {});
        if (!rebuilt) return std::unexpected(rebuilt.error());

        return true;
    }

    Core::Expected<std::vector<std::byte>> ResourceStore::ReadBuffer(BufferHandle handle, Core::TypeTag type) const
    {
        auto found = m_Buffers.Get(handle);
        if (!found)
        {
            Core::Log::Error("ReadBuffer(): buffer handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        const Buffer& buffer = **found;
        if (buffer.GetElementType() != type)
        {
            Core::Log::Error("ReadBuffer(): '{}' holds {}, read requests {}",
                             buffer.GetLabel(), buffer.GetElementType().Name(), type.Name());
            return std::unexpected(Core::ErrorCode::TypeMismatch);
        }

        std::vector<std::byte> bytes(buffer.GetCapacity());
        if (auto read = m_Device.ReadBuffer(buffer.GetGpu(), 0, bytes); !read)
            return std::unexpected(read.error());

        return bytes;
    }

    Core::Result ResourceStore::WriteTexture(TextureHandle handle, Core::TypeTag type, std::span<const std::byte> data)
    {
        auto found = m_Textures.Get(handle);
        if (!found)
        {
            Core::Log::Error("WriteTexture(): texture handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        const Texture& texture = **found;
        if (texture.GetElementType() != type)
        {
            Core::Log::Error("WriteTexture(): '{}' holds {}, write supplies {}",
                             texture.GetLabel(), texture.GetElementType().Name(), type.Name());
            return std::unexpected(Core::ErrorCode::TypeMismatch);
        }

        if (data.size() != texture.GetByteSize())
        {
            Core::Log::Error("WriteTexture(): '{}' needs {} bytes, got {}",
                             texture.GetLabel(), texture.GetByteSize(), data.size());
            return std::unexpected(Core::ErrorCode::OutOfRange);
        }

        return m_Device.WriteTexture(texture.GetGpu(), data);
    }

    Core::Expected<bool> ResourceStore::ResizeTexture(TextureHandle handle, RHI::Extent3D extent)
    {
        auto found = m_Textures.Get(handle);
        if (!found)
        {
            Core::Log::Error("ResizeTexture(): texture handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        Texture& texture = **found;
        if (!FitsDimension(texture.GetDimension(), extent))
        {
            Core::Log::Error("ResizeTexture(): {}x{}x{} does not fit the dimensionality of '{}'",
                             extent.Width, extent.Height, extent.Depth, texture.GetLabel());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        if (auto reallocated = ReallocateTexture(texture, extent); !reallocated)
            return std::unexpected(reallocated.error());
        texture.SetPolicy(SizePolicy::Fixed(extent));

        const TextureHandle changed[] = {handle};
        auto rebuilt = RebuildDependents({}, changed);
        if (!rebuilt) return std::unexpected(rebuilt.error());

        return true;
    }

    Core::Expected<uint32_t> ResourceStore::ResizeSurfaceTextures(RHI::Extent2D surface)
    {
        std::vector<TextureHandle> changed;
        Core::Result status = Core::Ok();

        // A failed texture keeps its old allocation; the others still move on.
        m_Textures.ForEach([&](TextureHandle handle, Texture& texture)
        {
            if (!texture.GetPolicy().FollowsSurface()) return;

            const RHI::Extent3D extent = texture.GetPolicy().Evaluate(surface);
            if (extent == texture.GetExtent()) return;

            if (auto reallocated = ReallocateTexture(texture, extent))
                changed.push_back(handle);
            else if (status)
                status = reallocated;
        });

        // Runs even after a failure: textures already replaced must not leave
        // their groups on the released allocation. Stale groups are retried.
        auto rebuilt = RebuildDependents({}, changed);

        if (!status)
        {
            Core::Log::Error("Surface {}x{}: {} texture(s) reallocated before a failure ({})",
                             surface.Width, surface.Height, changed.size(), Core::ErrorCodeToString(status.error()));
            return std::unexpected(status.error());
        }
        if (!rebuilt) return std::unexpected(rebuilt.error());

        if (!changed.empty())
            Core::Log::Info("Surface {}x{}: {} texture(s) reallocated, {} bind group(s) rebuilt",
                            surface.Width, surface.Height, changed.size(), *rebuilt);
        return static_cast<uint32_t>(changed.size());
    }

    Core::Result ResourceStore::RecreateBindGroup(BindGroupHandle handle)
    {
        auto found = m_BindGroups.Get(handle);
        if (!found)
        {
            Core::Log::Error("RecreateBindGroup(): bind group handle {} is not registered", handle.Index);
            return std::unexpected(found.error());
        }

        return (*found)->Recreate(m_Device, *this);
    }

    Core::Expected<uint32_t> ResourceStore::RebuildDependents(std::span<const BufferHandle> buffers,
                                                              std::span<const TextureHandle> textures)
    {
        uint32_t rebuilt = 0;
        uint32_t failed = 0;
        Core::Result status = Core::Ok();

        // Every affected group is visited; the first error is reported.
        m_BindGroups.ForEach([&](BindGroupHandle, BindGroup& group)
        {
            const bool affected =
                group.IsStale() ||
                std::ranges::any_of(buffers, [&](BufferHandle b) { return group.DependsOn(b); }) ||
                std::ranges::any_of(textures, [&](TextureHandle t) { return group.DependsOn(t); });
            if (!affected) return;

            if (auto recreated = group.Recreate(m_Device, *this))
                ++rebuilt;
            else
            {
                ++failed;
                if (status) status = recreated;
            }
        });

        if (!status)
        {
            Core::Log::Error("Invalidation cascade: {} bind group(s) rebuilt, {} left stale ({})",
                             rebuilt, failed, Core::ErrorCodeToString(status.error()));
            return std::unexpected(status.error());
        }

        if (rebuilt > 0)
            Core::Log::Debug("Invalidation cascade: {} bind group(s) rebuilt", rebuilt);
        return rebuilt;
    }

    Core::Result ResourceStore::ReallocateTexture(Texture& texture, RHI::Extent3D extent)
    {
        auto gpu = m_Device.CreateTexture(texture.MakeDesc(extent));
        if (!gpu)
        {
            Core::Log::Error("Texture '{}': reallocation to {}x{}x{} failed",
                             texture.GetLabel(), extent.Width, extent.Height, extent.Depth);
            return std::unexpected(gpu.error());
        }

        const RHI::Extent3D old = texture.GetExtent();
        texture.Replace(std::move(*gpu), extent);
        Core::Log::Info("Texture '{}' reallocated: {}x{}x{} -> {}x{}x{}", texture.GetLabel(),
                        old.Width, old.Height, old.Depth, extent.Width, extent.Height, extent.Depth);
        return Core::Ok();
    }
}
