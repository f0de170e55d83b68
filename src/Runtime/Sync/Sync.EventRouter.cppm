module;

#include <cstddef>
#include <entt/entity/entity.hpp>

export module Sync:EventRouter;

import ECS;
import :Events;
import :ChangeDetector;
import :DebounceScheduler;

export namespace Sync
{
    // Turns host notifications into scheduled regenerations.
    class EventRouter
    {
    public:
        EventRouter(ECS::Scene& scene, ChangeDetector& detector, DebounceScheduler& scheduler)
            : m_Scene(scene), m_Detector(detector), m_Scheduler(scheduler)
        {
        }

        // Object entries: the mode transition is always recorded; the
        // fingerprint is only consulted when the entry reports a geometry
        // change. Curve-data entries re-check every object using that data.
        // Returns the number of regenerations armed.
        size_t OnSceneChanged(const SceneUpdateBatch& batch);

        // Forgets every fingerprint and mode, cancels every pending task.
        void OnDocumentLoaded();

    private:
        bool Evaluate(entt::entity source, bool checkGeometry);

        ECS::Scene& m_Scene;
        ChangeDetector& m_Detector;
        DebounceScheduler& m_Scheduler;
    };
}
