module;
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

export module Cairn:BindGroup;

import Core;
import RHI;
import :Types;

export namespace Cairn
{
    using BindingTarget = std::variant<BufferHandle, TextureHandle, SamplerHandle>;

    struct BindGroupBinding
    {
        RHI::BindGroupLayoutEntry Layout{};
        BindingTarget Target{};
    };

    // What a binding currently points at, by device object id.
    struct ResolvedBinding
    {
        uint32_t Binding = 0;
        uint64_t ResourceId = 0;

        bool operator==(const ResolvedBinding&) const = default;
    };

    // Looks up the current device object behind a handle.
    class IBindingResolver
    {
    public:
        virtual ~IBindingResolver() = default;

        [[nodiscard]] virtual Core::Expected<const RHI::IBuffer*> ResolveBuffer(BufferHandle handle) const = 0;
        [[nodiscard]] virtual Core::Expected<const RHI::ITexture*> ResolveTexture(TextureHandle handle) const = 0;
        [[nodiscard]] virtual Core::Expected<const RHI::ISampler*> ResolveSampler(SamplerHandle handle) const = 0;
    };

    // A fixed binding layout plus a device instance pointing at whatever the
    // targets resolve to. The layout never changes; the instance is rebuilt
    // whenever a dependency is reallocated.
    class BindGroup
    {
    public:
        BindGroup(std::vector<BindGroupBinding> bindings, std::unique_ptr<RHI::IBindGroupLayout> layout,
                  std::string label);

        BindGroup(const BindGroup&) = delete;
        BindGroup& operator=(const BindGroup&) = delete;

        // First resolution. Leaves the previous instance in place on failure.
        [[nodiscard]] Core::Result Instantiate(RHI::IDevice& device, const IBindingResolver& resolver);

        // Re-resolves every target against its current allocation. On failure
        // the old instance is dropped: it may point at released allocations.
        // The group stays stale until a later Recreate succeeds.
        [[nodiscard]] Core::Result Recreate(RHI::IDevice& device, const IBindingResolver& resolver);

        [[nodiscard]] bool DependsOn(BufferHandle handle) const;
        [[nodiscard]] bool DependsOn(TextureHandle handle) const;
        [[nodiscard]] bool DependsOn(SamplerHandle handle) const;

        [[nodiscard]] const RHI::IBindGroupLayout& GetLayout() const { return *m_Layout; }
        [[nodiscard]] const RHI::IBindGroup* GetInstance() const { return m_Instance.get(); }
        [[nodiscard]] bool IsStale() const { return m_Instance == nullptr; }
        [[nodiscard]] const std::vector<BindGroupBinding>& GetBindings() const { return m_Bindings; }
        [[nodiscard]] const std::vector<ResolvedBinding>& GetResolved() const { return m_Resolved; }
        [[nodiscard]] uint32_t GetRebuildCount() const { return m_RebuildCount; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

    private:
        std::vector<BindGroupBinding> m_Bindings;
        std::unique_ptr<RHI::IBindGroupLayout> m_Layout;
        std::unique_ptr<RHI::IBindGroup> m_Instance;
        std::vector<ResolvedBinding> m_Resolved;
        std::string m_Label;
        uint32_t m_RebuildCount = 0;
    };
}
