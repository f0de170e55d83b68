module;

#include <expected>
#include <string>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>

module Sync;

import Core;
import ECS;
import Graphics;

namespace Sync
{
    std::expected<Graphics::MeshHandle, SyncError>
    SwapTargetMesh(ECS::Scene& scene, Graphics::MeshStore& store, entt::entity target,
                   Graphics::MeshData mesh)
    {
        auto& registry = scene.GetRegistry();
        if (!registry.valid(target))
            return std::unexpected(SyncError::ResourceFailure);

        Graphics::MeshHandle previous{};
        std::string name(scene.GetName(target));
        std::vector<std::string> materials;

        if (const auto* ref = registry.try_get<ECS::MeshRef::Component>(target))
        {
            if (auto res = store.Get(ref->Handle))
            {
                previous = ref->Handle;
                name = (*res)->Name;
                materials = (*res)->Materials;
            }
        }

        const Graphics::MeshHandle created = store.Create(name, std::move(mesh));
        if (auto res = store.Get(created))
            (*res)->Materials = std::move(materials);

        registry.emplace_or_replace<ECS::MeshRef::Component>(target, created);
        if (auto res = store.AddUser(created); !res)
        {
            Core::Log::Error("ArtifactSwapper: cannot attach mesh to '{}': {}",
                             scene.GetName(target), Core::ErrorCodeToString(res.error()));
            return std::unexpected(SyncError::ResourceFailure);
        }

        if (!previous.IsValid())
            return created;

        const auto remaining = store.RemoveUser(previous);
        if (!remaining)
        {
            Core::Log::Warn("ArtifactSwapper: releasing '{}' failed: {}",
                            name, Core::ErrorCodeToString(remaining.error()));
            return created;
        }

        if (*remaining == 0)
        {
            if (auto removed = store.Remove(previous); !removed)
            {
                Core::Log::Warn("ArtifactSwapper: removing '{}' failed: {}",
                                name, Core::ErrorCodeToString(removed.error()));
                return created;
            }
            if (auto renamed = store.Rename(created, name); !renamed)
                return std::unexpected(SyncError::ResourceFailure);
        }
        return created;
    }
}
