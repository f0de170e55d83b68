module;
#include <cstddef>
#include <string>
#include <string_view>
#include <entt/entity/registry.hpp>

module ECS;

import Core;

namespace ECS
{
    namespace
    {
        [[nodiscard]] std::string UniqueObjectName(const entt::registry& registry,
                                                   std::string_view wanted,
                                                   entt::entity self)
        {
            return Core::Names::MakeUnique(wanted, [&](std::string_view candidate)
            {
                for (auto [entity, tag] : registry.view<Components::NameTag::Component>().each())
                {
                    if (entity != self && tag.Name == candidate)
                        return true;
                }
                return false;
            });
        }
    }

    entt::entity Scene::CreateEntity(const std::string& name)
    {
        std::string unique = UniqueObjectName(m_Registry, name, entt::null);
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, std::move(unique));
        m_Registry.emplace<Components::Transform::Component>(e);
        return e;
    }

    entt::entity Scene::CreateData()
    {
        return m_Registry.create();
    }

    void Scene::DestroyEntity(entt::entity entity)
    {
        if (m_Registry.valid(entity))
            m_Registry.destroy(entity);
    }

    std::string Scene::Rename(entt::entity entity, const std::string& name)
    {
        auto* tag = m_Registry.try_get<Components::NameTag::Component>(entity);
        if (!tag)
            return {};

        tag->Name = UniqueObjectName(m_Registry, name, entity);
        return tag->Name;
    }

    entt::entity Scene::FindByName(std::string_view name) const
    {
        if (name.empty())
            return entt::null;

        for (auto [entity, tag] : m_Registry.view<Components::NameTag::Component>().each())
        {
            if (tag.Name == name)
                return entity;
        }
        return entt::null;
    }

    std::string_view Scene::GetName(entt::entity entity) const
    {
        if (!m_Registry.valid(entity))
            return {};
        if (const auto* tag = m_Registry.try_get<Components::NameTag::Component>(entity))
            return tag->Name;
        return {};
    }

    size_t Scene::ObjectCount() const
    {
        return m_Registry.view<Components::NameTag::Component>().size();
    }

    void Scene::Clear()
    {
        m_Registry.clear();
    }
}
