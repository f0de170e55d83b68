module;

#include <cstddef>
#include <expected>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <entt/entity/entity.hpp>
#include <entt/fwd.hpp>

export module Sync:MeshSyncSystem;

import Core;
import ECS;
import Graphics;
import :Config;
import :Errors;
import :Events;
import :Evaluation;
import :Report;
import :ModifierSchema;
import :ChangeDetector;
import :DebounceScheduler;
import :ArtifactBuilder;
import :EventRouter;

export namespace Sync
{
    // Keeps mesh objects in step with the curve objects they were generated
    // from. Owns the fingerprint and mode caches, the debounce scheduler and
    // the event router; the scene, mesh store, timer service and evaluation
    // service are borrowed and must outlive the system.
    //
    // Runtime state starts empty, is cleared on document load and on
    // Deactivate(). Everything runs on the main thread.
    class MeshSyncSystem
    {
    public:
        MeshSyncSystem(ECS::Scene& scene,
                       Graphics::MeshStore& store,
                       Core::Timers::ITimerService& timers,
                       IEvaluationService& evaluator,
                       SyncConfig config = {});
        ~MeshSyncSystem();

        MeshSyncSystem(const MeshSyncSystem&) = delete;
        MeshSyncSystem& operator=(const MeshSyncSystem&) = delete;
        MeshSyncSystem(MeshSyncSystem&&) = delete;
        MeshSyncSystem& operator=(MeshSyncSystem&&) = delete;

        // --- Lifecycle ---

        // Subscribes to `events`. Activating twice on the same bus is a no-op;
        // activating on another bus moves the subscription.
        void Activate(SceneEvents& events);
        // Unsubscribes and clears all runtime state. No-op when inactive.
        void Deactivate();
        [[nodiscard]] bool IsActive() const { return m_Events != nullptr; }

        // --- Queries ---

        [[nodiscard]] std::vector<entt::entity> LinkedMeshesForSource(entt::entity source,
                                                                      bool includeDisabled = false);

        // --- Commands ---

        // Regenerates every target of the named source now, ignoring debounce.
        // Targets whose last build matches the current source are left alone.
        UpdateReport UpdateNowByName(std::string_view sourceName, bool includeDisabled = false);

        // Runs UpdateNowByName for the target's source, disabled links included.
        // nullopt when the target has no resolvable source.
        std::optional<UpdateReport> UpdateNowForTarget(entt::entity target);

        // Drops cached fingerprint, mode and pending task for the name.
        void ForgetFingerprint(std::string_view sourceName);

        // Builds a mesh from `source` and links a new "<source>_N2M" object to it.
        [[nodiscard]] std::expected<entt::entity, SyncError> CreateLinkedTarget(entt::entity source);

        // Clears the target's link. The source's cache entries are forgotten
        // once no target links to it any more. False if the target had no link.
        bool Unlink(entt::entity target);

        // --- Event handlers (connected by Activate) ---

        void OnSceneChanged(const SceneUpdateBatch& batch);
        void OnDocumentLoaded();

        // --- Access ---

        [[nodiscard]] SyncConfig& GetConfig() { return m_Config; }
        [[nodiscard]] const SyncConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] const ModifierSchemaTable& GetSchemas() const { return m_Schemas; }
        [[nodiscard]] const ChangeDetector& GetChangeDetector() const { return m_Detector; }
        [[nodiscard]] const DebounceScheduler& GetScheduler() const { return m_Scheduler; }
        [[nodiscard]] size_t BuiltRecordCount() const { return m_LastBuilt.size(); }

    private:
        struct BuiltRecord
        {
            Core::Hash::Digest128 Digest;
            bool ApplyModifiers = true;
            bool PreserveAllDataLayers = true;
        };

        // force = true skips the up-to-date check (scheduled runs).
        UpdateReport Regenerate(std::string_view sourceName, bool includeDisabled, bool force);
        void ClearRuntimeState();
        // Drops the last-built record of a target whose link goes away.
        void OnMeshLinkDestroyed(entt::registry& registry, entt::entity entity);

        ECS::Scene& m_Scene;
        Graphics::MeshStore& m_Store;
        SyncConfig m_Config;

        ModifierSchemaTable m_Schemas;
        ChangeDetector m_Detector;
        DebounceScheduler m_Scheduler;
        ArtifactBuilder m_Builder;
        EventRouter m_Router;

        std::unordered_map<entt::entity, BuiltRecord> m_LastBuilt;
        SceneEvents* m_Events = nullptr;
    };
}
