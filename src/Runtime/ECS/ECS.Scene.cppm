module;
#include <cstddef>
#include <string>
#include <string_view>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

import :Components;

export namespace ECS
{
    // The host document: every object is an entity with a NameTag and a
    // Transform. Data blocks (curve data) are nameless entities referenced
    // by objects.
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // Creates an object. If `name` is taken the result gets a ".001"-style
        // suffix; read the final name back through GetName().
        entt::entity CreateEntity(const std::string& name);

        // Creates a nameless data-block entity.
        entt::entity CreateData();

        void DestroyEntity(entt::entity entity);

        // Renames an object, keeping names unique. Returns the applied name.
        std::string Rename(entt::entity entity, const std::string& name);

        // Returns entt::null when no live object carries `name`.
        [[nodiscard]] entt::entity FindByName(std::string_view name) const;

        // Empty for invalid entities and data blocks.
        [[nodiscard]] std::string_view GetName(entt::entity entity) const;

        [[nodiscard]] bool IsValid(entt::entity entity) const { return m_Registry.valid(entity); }

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        // Number of named objects (data blocks excluded).
        [[nodiscard]] size_t ObjectCount() const;

        void Clear();

    private:
        entt::registry m_Registry;
    };
}
