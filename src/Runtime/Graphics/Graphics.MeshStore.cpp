module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

module Graphics;

import Core;

namespace Graphics
{
    MeshStore::Slot* MeshStore::Resolve(MeshHandle handle)
    {
        if (!handle.IsValid() || handle.Index >= m_Slots.size())
            return nullptr;

        Slot& slot = m_Slots[handle.Index];
        if (!slot.IsActive || slot.Generation != handle.Generation)
            return nullptr;
        return &slot;
    }

    const MeshStore::Slot* MeshStore::Resolve(MeshHandle handle) const
    {
        if (!handle.IsValid() || handle.Index >= m_Slots.size())
            return nullptr;

        const Slot& slot = m_Slots[handle.Index];
        if (!slot.IsActive || slot.Generation != handle.Generation)
            return nullptr;
        return &slot;
    }

    std::string MeshStore::UniqueName(std::string_view wanted, MeshHandle self) const
    {
        return Core::Names::MakeUnique(wanted, [&](std::string_view candidate)
        {
            for (uint32_t i = 0; i < m_Slots.size(); ++i)
            {
                const Slot& slot = m_Slots[i];
                if (!slot.IsActive)
                    continue;
                if (self.Index == i && self.Generation == slot.Generation)
                    continue;
                if (slot.Data->Name == candidate)
                    return true;
            }
            return false;
        });
    }

    MeshHandle MeshStore::Create(std::string_view name, MeshData data)
    {
        std::string unique = UniqueName(name, {});

        uint32_t index;
        if (!m_FreeIndices.empty())
        {
            index = m_FreeIndices.front();
            m_FreeIndices.pop_front();
        }
        else
        {
            index = static_cast<uint32_t>(m_Slots.size());
            m_Slots.emplace_back();
        }

        Slot& slot = m_Slots[index];
        slot.Data = std::make_unique<MeshResource>();
        slot.Data->Name = std::move(unique);
        slot.Data->Data = std::move(data);
        slot.Users = 0;
        ++slot.Generation;
        slot.IsActive = true;

        return {index, slot.Generation};
    }

    Core::Expected<MeshResource*> MeshStore::Get(MeshHandle handle)
    {
        Slot* slot = Resolve(handle);
        if (!slot)
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        return slot->Data.get();
    }

    Core::Expected<const MeshResource*> MeshStore::Get(MeshHandle handle) const
    {
        const Slot* slot = Resolve(handle);
        if (!slot)
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        return slot->Data.get();
    }

    bool MeshStore::IsAlive(MeshHandle handle) const
    {
        return Resolve(handle) != nullptr;
    }

    Core::Result MeshStore::AddUser(MeshHandle handle)
    {
        Slot* slot = Resolve(handle);
        if (!slot)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        ++slot->Users;
        return Core::Ok();
    }

    Core::Expected<uint32_t> MeshStore::RemoveUser(MeshHandle handle)
    {
        Slot* slot = Resolve(handle);
        if (!slot)
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        if (slot->Users == 0)
            return std::unexpected(Core::ErrorCode::InvalidState);
        return --slot->Users;
    }

    uint32_t MeshStore::GetUsers(MeshHandle handle) const
    {
        const Slot* slot = Resolve(handle);
        return slot ? slot->Users : 0u;
    }

    Core::Result MeshStore::Remove(MeshHandle handle)
    {
        Slot* slot = Resolve(handle);
        if (!slot)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (slot->Users > 0)
            return Core::Err(Core::ErrorCode::ResourceBusy);

        slot->IsActive = false;
        slot->Data.reset();
        m_FreeIndices.push_back(handle.Index);
        return Core::Ok();
    }

    Core::Expected<std::string> MeshStore::Rename(MeshHandle handle, std::string_view name)
    {
        Slot* slot = Resolve(handle);
        if (!slot)
            return std::unexpected(Core::ErrorCode::ResourceNotFound);

        slot->Data->Name = UniqueName(name, handle);
        return slot->Data->Name;
    }

    MeshHandle MeshStore::FindByName(std::string_view name) const
    {
        for (uint32_t i = 0; i < m_Slots.size(); ++i)
        {
            const Slot& slot = m_Slots[i];
            if (slot.IsActive && slot.Data->Name == name)
                return {i, slot.Generation};
        }
        return {};
    }

    size_t MeshStore::AliveCount() const
    {
        size_t count = 0;
        for (const Slot& slot : m_Slots)
        {
            if (slot.IsActive)
                ++count;
        }
        return count;
    }

    void MeshStore::Clear()
    {
        m_Slots.clear();
        m_FreeIndices.clear();
    }
}
