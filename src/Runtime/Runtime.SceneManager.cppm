module;
#include <string>
#include <entt/fwd.hpp>

export module Runtime.SceneManager;

import Core;
import Graphics;
import ECS;

export namespace Runtime
{
    // Owns the ECS scene and the mesh store, and the EnTT hook that releases
    // a mesh resource when the last object using it is destroyed.
    class SceneManager
    {
    public:
        SceneManager();
        ~SceneManager();

        // Non-copyable, non-movable (owns EnTT registry + hook state).
        SceneManager(const SceneManager&) = delete;
        SceneManager& operator=(const SceneManager&) = delete;
        SceneManager(SceneManager&&) = delete;
        SceneManager& operator=(SceneManager&&) = delete;

        // --- Scene access ---
        [[nodiscard]] ECS::Scene& GetScene() { return m_Scene; }
        [[nodiscard]] const ECS::Scene& GetScene() const { return m_Scene; }
        [[nodiscard]] entt::registry& GetRegistry() { return m_Scene.GetRegistry(); }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Scene.GetRegistry(); }

        [[nodiscard]] Graphics::MeshStore& GetMeshStore() { return m_Store; }
        [[nodiscard]] const Graphics::MeshStore& GetMeshStore() const { return m_Store; }

        // --- Entity lifetime ---

        // Creates a mesh object holding `mesh`, registered as the resource's first user.
        entt::entity SpawnMesh(const std::string& name, Graphics::MeshData mesh);

        // Destroy every object. Mesh resources go with their last user.
        void Clear();

    private:
        void OnMeshRefDestroyed(entt::registry& registry, entt::entity entity);

        ECS::Scene m_Scene;
        Graphics::MeshStore m_Store;
    };
}
