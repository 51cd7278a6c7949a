#include <gtest/gtest.h>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

import Core;

struct MeshTag {};
struct ImageTag {};

using MeshHandle = Core::Handle<MeshTag>;
using ImageHandle = Core::Handle<ImageTag>;

// -----------------------------------------------------------------------------
// Basic Functionality
// -----------------------------------------------------------------------------

TEST(Handle, DefaultConstructor_Invalid)
{
    MeshHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, MeshHandle::INVALID_INDEX);
}

TEST(Handle, IndexConstructor_Valid)
{
    MeshHandle h(42);
    EXPECT_TRUE(h.IsValid());
    EXPECT_TRUE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, 42u);
}

TEST(Handle, ZeroIndexIsValid)
{
    MeshHandle h(0);
    EXPECT_TRUE(h.IsValid());
}

TEST(Handle, MaxValidIndex)
{
    MeshHandle h(MeshHandle::INVALID_INDEX - 1);
    EXPECT_TRUE(h.IsValid());
}

// -----------------------------------------------------------------------------
// Comparison Operators
// -----------------------------------------------------------------------------

TEST(Handle, Equality)
{
    EXPECT_EQ(MeshHandle(10), MeshHandle(10));
    EXPECT_NE(MeshHandle(10), MeshHandle(11));
    EXPECT_NE(MeshHandle(10), MeshHandle{});
}

TEST(Handle, Ordering_SpaceshipOperator)
{
    EXPECT_LT(MeshHandle(1), MeshHandle(2));
    EXPECT_GT(MeshHandle(7), MeshHandle(3));
    EXPECT_LE(MeshHandle(4), MeshHandle(4));
}

// -----------------------------------------------------------------------------
// Type Safety (Compile-Time)
// -----------------------------------------------------------------------------

static_assert(!std::is_same_v<MeshHandle, ImageHandle>);
static_assert(!std::is_convertible_v<MeshHandle, ImageHandle>);
static_assert(!std::is_convertible_v<uint32_t, MeshHandle>, "index construction must be explicit");
static_assert(std::is_trivially_copyable_v<MeshHandle>);
static_assert(sizeof(MeshHandle) == sizeof(uint32_t));

// -----------------------------------------------------------------------------
// Hash Support
// -----------------------------------------------------------------------------

TEST(Handle, Hashable_UnorderedSet)
{
    std::unordered_set<MeshHandle> set;
    set.insert(MeshHandle(1));
    set.insert(MeshHandle(2));
    set.insert(MeshHandle(1));

    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(MeshHandle(2)));
    EXPECT_FALSE(set.contains(MeshHandle(3)));
}

TEST(Handle, Hashable_UnorderedMap)
{
    std::unordered_map<ImageHandle, std::string> names;
    names[ImageHandle(0)] = "Albedo";
    names[ImageHandle(5)] = "Normal";
    names[ImageHandle(0)] = "BaseColor";

    EXPECT_EQ(names.size(), 2u);
    EXPECT_EQ(names[ImageHandle(0)], "BaseColor");
}

TEST(Handle, Hash_DifferentIndicesProduceDifferentHashes)
{
    std::hash<MeshHandle> hasher;
    EXPECT_NE(hasher(MeshHandle(1)), hasher(MeshHandle(2)));
}

// -----------------------------------------------------------------------------
// Constexpr
// -----------------------------------------------------------------------------

TEST(Handle, ConstexprConstruction)
{
    constexpr MeshHandle invalid;
    constexpr MeshHandle valid(100);
    static_assert(!invalid.IsValid());
    static_assert(valid.IsValid());
    static_assert(valid.Index == 100);
    EXPECT_TRUE(valid.IsValid());
}
