module;
#include <string>
#include <utility>
#include <entt/entity/registry.hpp>

module Runtime.SceneManager;

import Core;
import Graphics;
import ECS;

namespace Runtime
{
    SceneManager::SceneManager()
    {
        m_Scene.GetRegistry().on_destroy<ECS::MeshRef::Component>()
            .connect<&SceneManager::OnMeshRefDestroyed>(*this);
        Core::Log::Info("SceneManager: Initialized.");
    }

    SceneManager::~SceneManager()
    {
        m_Scene.GetRegistry().on_destroy<ECS::MeshRef::Component>()
            .disconnect<&SceneManager::OnMeshRefDestroyed>(*this);
        Core::Log::Info("SceneManager: Shutdown.");
    }

    void SceneManager::OnMeshRefDestroyed(entt::registry& registry, entt::entity entity)
    {
        const auto& ref = registry.get<ECS::MeshRef::Component>(entity);
        const auto remaining = m_Store.RemoveUser(ref.Handle);
        if (!remaining)
            return;

        if (*remaining == 0)
        {
            if (auto removed = m_Store.Remove(ref.Handle); !removed)
                Core::Log::Warn("SceneManager: cannot release mesh: {}", Core::ErrorCodeToString(removed.error()));
        }
    }

    entt::entity SceneManager::SpawnMesh(const std::string& name, Graphics::MeshData mesh)
    {
        const entt::entity e = m_Scene.CreateEntity(name);
        const Graphics::MeshHandle handle = m_Store.Create(name, std::move(mesh));
        m_Scene.GetRegistry().emplace<ECS::MeshRef::Component>(e, handle);
        if (auto res = m_Store.AddUser(handle); !res)
            Core::Log::Error("SceneManager: cannot attach mesh to '{}': {}", name, Core::ErrorCodeToString(res.error()));
        return e;
    }

    void SceneManager::Clear()
    {
        m_Scene.Clear();
    }
}
