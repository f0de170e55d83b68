module;

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <entt/entity/registry.hpp>

module Sync;

import ECS;

namespace Sync::LinkRegistry
{
    namespace
    {
        using ECS::Components::MeshLink::Component;

        [[nodiscard]] bool Matches(ECS::Scene& scene, Component& link, entt::entity source,
                                   std::string_view sourceName)
        {
            if (scene.IsValid(link.Source.Entity))
            {
                if (link.Source.Entity != source)
                    return false;
                if (link.Source.Name != sourceName)
                    link.Source.Name = std::string(sourceName);
                return true;
            }

            // Dangling entity: fall back to the last known name.
            if (sourceName.empty() || link.Source.Name != sourceName)
                return false;
            link.Source.Entity = source;
            return true;
        }
    }

    std::vector<entt::entity> TargetsFor(ECS::Scene& scene, entt::entity source, bool includeDisabled)
    {
        std::vector<entt::entity> targets;
        if (!scene.IsValid(source))
            return targets;

        const std::string_view sourceName = scene.GetName(source);
        auto view = scene.GetRegistry().view<Component>();
        for (auto [entity, link] : view.each())
        {
            if (entity == source)
                continue;
            if (!includeDisabled && !link.AutoUpdate)
                continue;
            if (Matches(scene, link, source, sourceName))
                targets.push_back(entity);
        }

        std::sort(targets.begin(), targets.end(), [](entt::entity a, entt::entity b)
        {
            return entt::to_integral(a) < entt::to_integral(b);
        });
        return targets;
    }

    entt::entity ResolveSource(ECS::Scene& scene, entt::entity target)
    {
        auto* link = scene.GetRegistry().try_get<Component>(target);
        if (!link || !link->Source.IsSet())
            return entt::null;

        if (scene.IsValid(link->Source.Entity))
        {
            link->Source.Name = std::string(scene.GetName(link->Source.Entity));
            return link->Source.Entity;
        }

        const entt::entity byName = scene.FindByName(link->Source.Name);
        if (byName != entt::null)
            link->Source.Entity = byName;
        return byName;
    }
}
