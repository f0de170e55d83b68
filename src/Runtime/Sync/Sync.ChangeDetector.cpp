module;

#include <optional>
#include <string>
#include <string_view>
#include <entt/entity/registry.hpp>

module Sync;

import Core;
import ECS;

namespace Sync
{
    bool ChangeDetector::Changed(const ECS::Scene& scene, entt::entity source)
    {
        const std::string_view name = scene.GetName(source);
        if (name.empty())
            return false;

        const auto fingerprint = Fingerprint(scene, source, m_Schemas);
        if (!fingerprint)
            return true;

        const auto it = m_Fingerprints.find(name);
        if (it != m_Fingerprints.end() && it->second == *fingerprint)
            return false;

        m_Fingerprints.insert_or_assign(std::string(name), *fingerprint);
        return true;
    }

    bool ChangeDetector::ExitedDirectEdit(const ECS::Scene& scene, entt::entity source)
    {
        using ECS::Components::SourceObject::InteractionMode;

        const std::string_view name = scene.GetName(source);
        if (name.empty())
            return false;

        const auto* object = scene.GetRegistry().try_get<ECS::Components::SourceObject::Component>(source);
        if (!object)
            return false;

        const InteractionMode current = object->Mode;
        auto it = m_Modes.find(name);
        if (it == m_Modes.end())
        {
            m_Modes.emplace(std::string(name), current);
            return false;
        }

        const InteractionMode previous = it->second;
        it->second = current;
        return previous == InteractionMode::Edit && current != InteractionMode::Edit;
    }

    std::optional<Core::Hash::Digest128> ChangeDetector::Cached(std::string_view sourceName) const
    {
        const auto it = m_Fingerprints.find(sourceName);
        if (it == m_Fingerprints.end())
            return std::nullopt;
        return it->second;
    }

    void ChangeDetector::Forget(std::string_view sourceName)
    {
        if (const auto it = m_Fingerprints.find(sourceName); it != m_Fingerprints.end())
            m_Fingerprints.erase(it);
        if (const auto it = m_Modes.find(sourceName); it != m_Modes.end())
            m_Modes.erase(it);
    }

    void ChangeDetector::Clear()
    {
        m_Fingerprints.clear();
        m_Modes.clear();
    }
}
