module;
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:MeshStore;

import Core;
import :Mesh;

export namespace Graphics
{
    // Generational handle into the MeshStore. A handle whose slot has been
    // reused by a later mesh no longer resolves.
    struct MeshHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        auto operator<=>(const MeshHandle&) const = default;
    };

    struct MeshResource
    {
        std::string Name;
        MeshData Data;
        std::vector<std::string> Materials;
    };

    // Named, reference-counted mesh resources.
    //
    // Names are unique among live resources. The user count is maintained by
    // whoever attaches a resource to an object (AddUser/RemoveUser); Remove()
    // refuses to drop a resource that still has users.
    //
    // Single-threaded: all calls happen on the main thread.
    class MeshStore
    {
    public:
        MeshStore() = default;

        MeshStore(const MeshStore&) = delete;
        MeshStore& operator=(const MeshStore&) = delete;

        // `name` is made unique with a ".001"-style suffix when taken.
        MeshHandle Create(std::string_view name, MeshData data);

        [[nodiscard]] Core::Expected<MeshResource*> Get(MeshHandle handle);
        [[nodiscard]] Core::Expected<const MeshResource*> Get(MeshHandle handle) const;

        [[nodiscard]] bool IsAlive(MeshHandle handle) const;

        Core::Result AddUser(MeshHandle handle);

        // Returns the remaining user count.
        Core::Expected<uint32_t> RemoveUser(MeshHandle handle);

        // 0 for dead handles.
        [[nodiscard]] uint32_t GetUsers(MeshHandle handle) const;

        // Fails with ResourceBusy while the resource has users.
        Core::Result Remove(MeshHandle handle);

        // Returns the applied (unique) name.
        Core::Expected<std::string> Rename(MeshHandle handle, std::string_view name);

        // Invalid handle when no live resource carries `name`.
        [[nodiscard]] MeshHandle FindByName(std::string_view name) const;

        [[nodiscard]] size_t AliveCount() const;

        void Clear();

    private:
        struct Slot
        {
            std::unique_ptr<MeshResource> Data;
            uint32_t Generation = 0;
            uint32_t Users = 0;
            bool IsActive = false;
        };

        [[nodiscard]] Slot* Resolve(MeshHandle handle);
        [[nodiscard]] const Slot* Resolve(MeshHandle handle) const;
        [[nodiscard]] std::string UniqueName(std::string_view wanted, MeshHandle self) const;

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
    };
}

template <>
struct std::hash<Graphics::MeshHandle>
{
    std::size_t operator()(const Graphics::MeshHandle& h) const noexcept
    {
        uint64_t val = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;

        val ^= val >> 33;
        val *= 0xff51afd7ed558ccdull;
        val ^= val >> 33;

        return static_cast<std::size_t>(val);
    }
};
