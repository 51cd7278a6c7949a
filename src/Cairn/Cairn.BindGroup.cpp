module;
#include <algorithm>
#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

module Cairn:BindGroup.Impl;
import :BindGroup;
import Core;
import RHI;

namespace Cairn
{
    namespace
    {
        template<typename H>
        bool Targets(const std::vector<BindGroupBinding>& bindings, H handle)
        {
            return std::ranges::any_of(bindings, [handle](const BindGroupBinding& binding)
            {
                const H* target = std::get_if<H>(&binding.Target);
                return target && *target == handle;
            });
        }
    }

    BindGroup::BindGroup(std::vector<BindGroupBinding> bindings, std::unique_ptr<RHI::IBindGroupLayout> layout,
                         std::string label)
        : m_Bindings(std::move(bindings)), m_Layout(std::move(layout)), m_Label(std::move(label))
    {
    }

    Core::Result BindGroup::Instantiate(RHI::IDevice& device, const IBindingResolver& resolver)
    {
        std::vector<RHI::BindGroupEntry> entries;
        std::vector<ResolvedBinding> resolved;
        entries.reserve(m_Bindings.size());
        resolved.reserve(m_Bindings.size());

        for (const BindGroupBinding& binding : m_Bindings)
        {
            RHI::BindGroupEntry entry{.Binding = binding.Layout.Binding};
            Core::Expected<uint64_t> id = std::visit([&](auto handle) -> Core::Expected<uint64_t>
            {
                using H = std::decay_t<decltype(handle)>;

                if constexpr (std::is_same_v<H, BufferHandle>)
                {
                    auto buffer = resolver.ResolveBuffer(handle);
                    if (!buffer) return std::unexpected(buffer.error());
                    entry.Buffer = *buffer;
                    return (*buffer)->GetId();
                }
                else if constexpr (std::is_same_v<H, TextureHandle>)
                {
                    auto texture = resolver.ResolveTexture(handle);
                    if (!texture) return std::unexpected(texture.error());
                    entry.Texture = *texture;
                    return (*texture)->GetId();
                }
                else
                {
                    auto sampler = resolver.ResolveSampler(handle);
                    if (!sampler) return std::unexpected(sampler.error());
                    entry.Sampler = *sampler;
                    return (*sampler)->GetId();
                }
            }, binding.Target);

            if (!id)
            {
                Core::Log::Error("BindGroup '{}': binding {} does not resolve ({})",
                                 m_Label, binding.Layout.Binding, Core::ErrorCodeToString(id.error()));
                return std::unexpected(id.error());
            }

            entries.push_back(entry);
            resolved.push_back({binding.Layout.Binding, *id});
        }

        auto instance = device.CreateBindGroup(*m_Layout, entries, m_Label);
        if (!instance)
            return std::unexpected(instance.error());

        m_Instance = std::move(*instance);
        m_Resolved = std::move(resolved);
        return Core::Ok();
    }

    Core::Result BindGroup::Recreate(RHI::IDevice& device, const IBindingResolver& resolver)
    {
        auto result = Instantiate(device, resolver);
        if (!result)
        {
            m_Instance.reset();
            m_Resolved.clear();
            Core::Log::Error("BindGroup '{}' is stale: rebuild failed ({})", m_Label,
                             Core::ErrorCodeToString(result.error()));
            return result;
        }

        ++m_RebuildCount;
        Core::Log::Debug("BindGroup '{}' rebuilt ({} total)", m_Label, m_RebuildCount);
        return result;
    }

    bool BindGroup::DependsOn(BufferHandle handle) const { return Targets(m_Bindings, handle); }
    bool BindGroup::DependsOn(TextureHandle handle) const { return Targets(m_Bindings, handle); }
    bool BindGroup::DependsOn(SamplerHandle handle) const { return Targets(m_Bindings, handle); }
}
