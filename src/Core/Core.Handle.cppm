module;
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Handle - Type-safe index into an append-only Registry
    // -------------------------------------------------------------------------
    // Registries never remove entries, so a handle needs no generation: once
    // issued it stays valid for the lifetime of the registry that issued it.
    // The Tag parameter keeps handles of different resource kinds apart at
    // compile time.
    //
    //   struct BufferTag {};
    //   using BufferHandle = Core::Handle<BufferTag>;
    //
    //   struct TextureTag {};
    //   using TextureHandle = Core::Handle<TextureTag>;
    //
    //   BufferHandle b = buffers.Add(...);
    //   // TextureHandle t = b; // Compile error - different types!
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct Handle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;

        constexpr Handle() = default;

        constexpr explicit Handle(uint32_t index) : Index(index)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const Handle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::Handle<Tag>>
    {
        std::size_t operator()(const Core::Handle<Tag>& h) const noexcept
        {
            // Murmur3 finaliser
            uint64_t val = h.Index;
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };
}
