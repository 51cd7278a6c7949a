module;

#include <cstdint>
#include <cstddef>
#include <vector>
#include <expected>
#include <memory>
#include <utility>

export module Core:Registry;
import :Error;
import :Handle;

export namespace Core
{
    // Append-only store. Entries live until the registry is destroyed, so every
    // handle it returns stays resolvable. Access is single-threaded: the owner
    // serialises all mutation.
    template <typename T, typename Tag>
    class Registry
    {
    public:
        using HandleType = Handle<Tag>;

        Registry() = default;

        Registry(const Registry&) = delete;
        Registry& operator=(const Registry&) = delete;
        Registry(Registry&&) noexcept = default;
        Registry& operator=(Registry&&) noexcept = default;

        // Takes ownership; the heap address of the resource never changes even
        // when the slot vector grows.
        HandleType Add(std::unique_ptr<T> resource)
        {
            const auto index = static_cast<uint32_t>(m_Slots.size());
            m_Slots.push_back(std::move(resource));
            return HandleType{index};
        }

        template<typename... Args>
        HandleType Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        // ResourceNotFound means the handle was not issued by this registry.
        [[nodiscard]] Core::Expected<T*> Get(HandleType handle) const
        {
            if (handle.Index >= m_Slots.size() || !m_Slots[handle.Index])
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            return m_Slots[handle.Index].get();
        }

        [[nodiscard]] T* GetUnchecked(HandleType handle) const
        {
            if (handle.Index < m_Slots.size())
                return m_Slots[handle.Index].get();
            return nullptr;
        }

        [[nodiscard]] bool Contains(HandleType handle) const
        {
            return handle.Index < m_Slots.size() && m_Slots[handle.Index] != nullptr;
        }

        [[nodiscard]] size_t Size() const { return m_Slots.size(); }

        template<typename Fn>
        void ForEach(Fn&& fn)
        {
            for (uint32_t i = 0; i < m_Slots.size(); ++i)
                fn(HandleType{i}, *m_Slots[i]);
        }

        template<typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (uint32_t i = 0; i < m_Slots.size(); ++i)
                fn(HandleType{i}, static_cast<const T&>(*m_Slots[i]));
        }

    private:
        std::vector<std::unique_ptr<T>> m_Slots;
    };
}
