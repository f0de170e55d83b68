module;

#include <cstddef>
#include <vector>
#include <entt/entity/registry.hpp>

module Sync;

import Core;
import ECS;

namespace Sync
{
    bool EventRouter::Evaluate(entt::entity source, bool checkGeometry)
    {
        const bool exitedEdit = m_Detector.ExitedDirectEdit(m_Scene, source);
        const bool changed = checkGeometry && m_Detector.Changed(m_Scene, source);
        if (!exitedEdit && !changed)
            return false;

        return m_Scheduler.Schedule(m_Scene, source).has_value();
    }

    size_t EventRouter::OnSceneChanged(const SceneUpdateBatch& batch)
    {
        if (!batch.HasObjectUpdates() && !batch.HasCurveDataUpdates())
            return 0;

        using ECS::Components::SourceObject::Component;
        auto& registry = m_Scene.GetRegistry();
        size_t armed = 0;

        for (const SceneUpdate& update : batch.Updates)
        {
            switch (update.Kind)
            {
            case UpdateKind::Object:
                if (!registry.valid(update.Id) || !registry.all_of<Component>(update.Id))
                    break;
                if (Evaluate(update.Id, update.GeometryUpdated))
                    ++armed;
                break;

            case UpdateKind::CurveData:
            {
                // Collect first: scheduling may touch link components.
                std::vector<entt::entity> users;
                for (auto [entity, object] : registry.view<Component>().each())
                {
                    if (object.Data == update.Id)
                        users.push_back(entity);
                }
                for (entt::entity source : users)
                {
                    if (Evaluate(source, true))
                        ++armed;
                }
                break;
            }

            case UpdateKind::Other:
                break;
            }
        }
        return armed;
    }

    void EventRouter::OnDocumentLoaded()
    {
        m_Detector.Clear();
        m_Scheduler.CancelAll();
        Core::Log::Info("EventRouter: document loaded, runtime state cleared");
    }
}
