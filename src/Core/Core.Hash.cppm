module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

export module Core:Hash;

export namespace Core::Hash
{
    // FNV-1a Hash
    constexpr uint32_t HashString(std::string_view str)
    {
        uint32_t hash = 2166136261u;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 16777619u;
        }
        return hash;
    }

    // Interned-name key for lookup tables. Equality and ordering use the hash only;
    // tables that cannot tolerate collisions keep the source string beside it.
    struct StringID
    {
        uint32_t Value = 0;

        constexpr StringID() = default;

        constexpr StringID(uint32_t v) : Value(v)
        {
        }

        constexpr StringID(const char* str) : Value(HashString(str))
        {
        }

        constexpr StringID(std::string_view str) : Value(HashString(str))
        {
        }

        auto operator<=>(const StringID&) const = default;
        bool operator==(const StringID& other) const { return Value == other.Value; }
    };

    constexpr StringID operator""_id(const char* str, size_t len)
    {
        return {std::string_view(str, len)};
    }

    // -------------------------------------------------------------------------
    // 128-bit content digest
    // -------------------------------------------------------------------------
    // Stable across processes and platforms: the value depends only on the
    // byte stream fed to the hasher, never on pointer values or std::hash.
    struct Digest128
    {
        uint64_t Hi = 0;
        uint64_t Lo = 0;

        bool operator==(const Digest128&) const = default;

        // 32 lowercase hex characters, most significant word first.
        [[nodiscard]] std::string ToHex() const;
    };

    // Streaming FNV-1a with the 128-bit parameters (prime 2^88 + 0x13B).
    // The 128-bit product is assembled from 64-bit halves so no compiler
    // extension is needed.
    class Fnv1a128
    {
    public:
        static constexpr uint64_t kOffsetHi = 0x6c62272e07bb0142ull;
        static constexpr uint64_t kOffsetLo = 0x62b821756295c58dull;

        constexpr void UpdateByte(uint8_t byte)
        {
            m_Lo ^= byte;

            const uint64_t p0 = (m_Lo & 0xffffffffull) * 0x13Bull;
            const uint64_t p1 = (m_Lo >> 32) * 0x13Bull;
            const uint64_t mid = (p0 >> 32) + (p1 & 0xffffffffull);
            const uint64_t carry = (p1 >> 32) + (mid >> 32);

            const uint64_t lo = (p0 & 0xffffffffull) | (mid << 32);
            const uint64_t hi = m_Hi * 0x13Bull + carry + (m_Lo << 24);

            m_Lo = lo;
            m_Hi = hi;
        }

        constexpr void Update(std::span<const std::byte> bytes)
        {
            for (std::byte b : bytes)
                UpdateByte(static_cast<uint8_t>(b));
        }

        constexpr void Update(std::string_view text)
        {
            for (char c : text)
                UpdateByte(static_cast<uint8_t>(c));
        }

        [[nodiscard]] constexpr Digest128 Finish() const { return {m_Hi, m_Lo}; }

        constexpr void Reset()
        {
            m_Hi = kOffsetHi;
            m_Lo = kOffsetLo;
        }

    private:
        uint64_t m_Hi = kOffsetHi;
        uint64_t m_Lo = kOffsetLo;
    };

    [[nodiscard]] constexpr Digest128 HashBytes128(std::string_view text)
    {
        Fnv1a128 hasher;
        hasher.Update(text);
        return hasher.Finish();
    }
}

template <>
struct std::hash<Core::Hash::StringID>
{
    std::size_t operator()(const Core::Hash::StringID& id) const noexcept
    {
        return std::hash<uint32_t>{}(id.Value);
    }
};

template <>
struct std::hash<Core::Hash::Digest128>
{
    std::size_t operator()(const Core::Hash::Digest128& d) const noexcept
    {
        return static_cast<std::size_t>(d.Lo ^ (d.Hi * 0x9e3779b97f4a7c15ull));
    }
};
