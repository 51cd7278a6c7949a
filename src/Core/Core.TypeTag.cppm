module;

#include <typeindex>
#include <typeinfo>
#include <string_view>

export module Core:TypeTag;

export namespace Core
{
    // Runtime identity of a static element type. Stored next to type-erased
    // byte storage and compared on every typed access.
    class TypeTag
    {
    public:
        template<typename T>
        [[nodiscard]] static TypeTag Of() noexcept
        {
            return TypeTag(typeid(T));
        }

        [[nodiscard]] std::string_view Name() const noexcept { return m_Index.name(); }

        bool operator==(const TypeTag&) const = default;

    private:
        explicit TypeTag(const std::type_info& info) noexcept : m_Index(info) {}

        std::type_index m_Index;
    };
}
