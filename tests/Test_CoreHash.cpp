#include <gtest/gtest.h>
#include <cstddef>
#include <span>
#include <string_view>
#include <string>
#include <unordered_map>
#include <unordered_set>

import Core;

using namespace Core::Hash;

// -----------------------------------------------------------------------------
// HashString Function Tests
// -----------------------------------------------------------------------------

TEST(CoreHash, HashString_EmptyString)
{
    // FNV-1a base value XOR'd with nothing = base value
    EXPECT_EQ(HashString(""), 2166136261u);
}

TEST(CoreHash, HashString_KnownVector)
{
    EXPECT_EQ(HashString("a"), 3826002220u);
}

TEST(CoreHash, HashString_IsConstexpr)
{
    constexpr uint32_t hash = HashString("ARRAY");
    static_assert(hash != 0);
    EXPECT_EQ(hash, HashString(std::string("ARRAY")));
}

TEST(CoreHash, StringID_LiteralMatchesRuntime)
{
    constexpr StringID fromLiteral = "SOLIDIFY"_id;
    const StringID fromString{std::string_view("SOLIDIFY")};
    EXPECT_EQ(fromLiteral, fromString);
    EXPECT_NE(fromLiteral, "SUBSURF"_id);
}

TEST(CoreHash, StringID_UsableAsMapKey)
{
    std::unordered_map<StringID, int> table;
    table["ARRAY"_id] = 1;
    table["MIRROR"_id] = 2;

    EXPECT_EQ(table.at(StringID("ARRAY")), 1);
    EXPECT_EQ(table.at(StringID("MIRROR")), 2);
    EXPECT_FALSE(table.contains("SCREW"_id));
}

// -----------------------------------------------------------------------------
// FNV-1a 128
// -----------------------------------------------------------------------------

TEST(CoreHash, Fnv128_EmptyIsOffsetBasis)
{
    EXPECT_EQ(HashBytes128("").ToHex(), "6c62272e07bb014262b821756295c58d");
}

TEST(CoreHash, Fnv128_KnownVectors)
{
    EXPECT_EQ(HashBytes128("a").ToHex(), "d228cb696f1a8caf78912b704e4a8964");
    EXPECT_EQ(HashBytes128("foobar").ToHex(), "343e1662793c64bf6f0d3597ba446f18");
}

TEST(CoreHash, Fnv128_StreamingEqualsOneShot)
{
    Fnv1a128 hasher;
    hasher.Update("foo");
    hasher.Update("bar");
    EXPECT_EQ(hasher.Finish(), HashBytes128("foobar"));
}

TEST(CoreHash, Fnv128_ByteSpanEqualsText)
{
    const std::byte bytes[] = {std::byte{'a'}};
    Fnv1a128 hasher;
    hasher.Update(std::span<const std::byte>(bytes));
    EXPECT_EQ(hasher.Finish(), HashBytes128("a"));
}

TEST(CoreHash, Fnv128_ResetRestoresBasis)
{
    Fnv1a128 hasher;
    hasher.Update("something");
    hasher.Reset();
    EXPECT_EQ(hasher.Finish(), HashBytes128(""));
}

TEST(CoreHash, Fnv128_OrderSensitive)
{
    EXPECT_NE(HashBytes128("ab"), HashBytes128("ba"));
}

TEST(CoreHash, Digest128_HexIsFixedWidth)
{
    const Digest128 d{0, 1};
    EXPECT_EQ(d.ToHex(), "00000000000000000000000000000001");
}

TEST(CoreHash, Digest128_Hashable)
{
    std::unordered_set<Digest128> seen;
    seen.insert(HashBytes128("x"));
    seen.insert(HashBytes128("y"));
    seen.insert(HashBytes128("x"));
    EXPECT_EQ(seen.size(), 2u);
}
