module;

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>
#include <entt/signal/sigh.hpp>

module Sync;

import Core;
import ECS;
import Graphics;

namespace Sync
{
    MeshSyncSystem::MeshSyncSystem(ECS::Scene& scene,
                                   Graphics::MeshStore& store,
                                   Core::Timers::ITimerService& timers,
                                   IEvaluationService& evaluator,
                                   SyncConfig config)
        : m_Scene(scene),
          m_Store(store),
          m_Config(std::move(config)),
          m_Schemas(ModifierSchemaTable::BuiltIn()),
          m_Detector(m_Schemas),
          m_Scheduler(timers, [this](const std::string& name) { Regenerate(name, false, true); }),
          m_Builder(evaluator),
          m_Router(scene, m_Detector, m_Scheduler)
    {
        m_Scene.GetRegistry().on_destroy<ECS::Components::MeshLink::Component>()
            .connect<&MeshSyncSystem::OnMeshLinkDestroyed>(*this);
    }

    MeshSyncSystem::~MeshSyncSystem()
    {
        Deactivate();
        m_Scene.GetRegistry().on_destroy<ECS::Components::MeshLink::Component>()
            .disconnect<&MeshSyncSystem::OnMeshLinkDestroyed>(*this);
    }

    void MeshSyncSystem::OnMeshLinkDestroyed(entt::registry&, entt::entity entity)
    {
        m_LastBuilt.erase(entity);
    }

    void MeshSyncSystem::Activate(SceneEvents& events)
    {
        if (m_Events == &events)
            return;
        if (m_Events)
            Deactivate();

        entt::sink{events.SceneChanged}.connect<&MeshSyncSystem::OnSceneChanged>(*this);
        entt::sink{events.DocumentLoaded}.connect<&MeshSyncSystem::OnDocumentLoaded>(*this);
        m_Events = &events;
        ClearRuntimeState();
        Core::Log::Info("MeshSyncSystem: activated");
    }

    void MeshSyncSystem::Deactivate()
    {
        if (!m_Events)
            return;

        entt::sink{m_Events->SceneChanged}.disconnect<&MeshSyncSystem::OnSceneChanged>(*this);
        entt::sink{m_Events->DocumentLoaded}.disconnect<&MeshSyncSystem::OnDocumentLoaded>(*this);
        m_Events = nullptr;
        ClearRuntimeState();
        Core::Log::Info("MeshSyncSystem: deactivated");
    }

    void MeshSyncSystem::ClearRuntimeState()
    {
        m_Scheduler.CancelAll();
        m_Detector.Clear();
        m_LastBuilt.clear();
    }

    std::vector<entt::entity> MeshSyncSystem::LinkedMeshesForSource(entt::entity source, bool includeDisabled)
    {
        return LinkRegistry::TargetsFor(m_Scene, source, includeDisabled);
    }

    UpdateReport MeshSyncSystem::UpdateNowByName(std::string_view sourceName, bool includeDisabled)
    {
        return Regenerate(sourceName, includeDisabled, false);
    }

    std::optional<UpdateReport> MeshSyncSystem::UpdateNowForTarget(entt::entity target)
    {
        const entt::entity source = LinkRegistry::ResolveSource(m_Scene, target);
        if (source == entt::null)
            return std::nullopt;

        const std::string name(m_Scene.GetName(source));
        return Regenerate(name, true, false);
    }

    void MeshSyncSystem::ForgetFingerprint(std::string_view sourceName)
    {
        m_Detector.Forget(sourceName);
        m_Scheduler.Cancel(sourceName);
    }

    UpdateReport MeshSyncSystem::Regenerate(std::string_view sourceName, bool includeDisabled, bool force)
    {
        UpdateReport report;
        report.SourceName = std::string(sourceName);

        auto& registry = m_Scene.GetRegistry();
        const entt::entity source = m_Scene.FindByName(sourceName);
        if (source == entt::null || !registry.all_of<ECS::Components::SourceObject::Component>(source))
        {
            ForgetFingerprint(sourceName);
            report.SourceMissing = true;
            Core::Log::Debug("MeshSyncSystem: source '{}' is gone", sourceName);
            return report;
        }

        const auto targets = LinkRegistry::TargetsFor(m_Scene, source, includeDisabled);
        if (targets.empty())
            return report;

        const auto digest = Fingerprint(m_Scene, source, m_Schemas);

        for (entt::entity target : targets)
        {
            TargetResult& result = report.Targets.emplace_back();
            result.Target = target;
            result.TargetName = std::string(m_Scene.GetName(target));

            const auto& link = registry.get<ECS::Components::MeshLink::Component>(target);
            const EvaluationOptions options{link.ApplyModifiers, link.PreserveAllDataLayers};

            if (!force && digest)
            {
                const auto* ref = registry.try_get<ECS::MeshRef::Component>(target);
                const auto it = m_LastBuilt.find(target);
                if (ref && m_Store.IsAlive(ref->Handle) && it != m_LastBuilt.end() &&
                    it->second.Digest == *digest &&
                    it->second.ApplyModifiers == options.ApplyModifiers &&
                    it->second.PreserveAllDataLayers == options.PreserveAllDataLayers)
                {
                    result.Outcome = TargetOutcome::UpToDate;
                    continue;
                }
            }

            auto mesh = m_Builder.Build(m_Scene, source, options);
            if (!mesh)
            {
                result.Outcome = TargetOutcome::Failed;
                result.Error = mesh.error();
                Core::Log::Error("MeshSyncSystem: update failed for '{}': {}",
                                 result.TargetName, SyncErrorToString(mesh.error()));
                continue;
            }

            auto swapped = SwapTargetMesh(m_Scene, m_Store, target, std::move(*mesh));
            if (!swapped)
            {
                result.Outcome = TargetOutcome::Failed;
                result.Error = swapped.error();
                Core::Log::Error("MeshSyncSystem: update failed for '{}': {}",
                                 result.TargetName, SyncErrorToString(swapped.error()));
                continue;
            }

            if (digest)
                m_LastBuilt.insert_or_assign(target, BuiltRecord{*digest, options.ApplyModifiers,
                                                                 options.PreserveAllDataLayers});
            else
                m_LastBuilt.erase(target);

            result.Outcome = TargetOutcome::Regenerated;
            if (m_Config.LogUpdates)
                Core::Log::Info("MeshSyncSystem: regenerated '{}' from '{}'", result.TargetName, sourceName);
        }
        return report;
    }

    std::expected<entt::entity, SyncError> MeshSyncSystem::CreateLinkedTarget(entt::entity source)
    {
        if (!IsCurveSource(m_Scene, source))
        {
            Core::Log::Error("MeshSyncSystem: '{}' is not a curve or surface object", m_Scene.GetName(source));
            return std::unexpected(SyncError::UnsupportedSource);
        }

        const EvaluationOptions options{m_Config.DefaultApplyModifiers, m_Config.DefaultPreserveAllDataLayers};
        auto mesh = m_Builder.Build(m_Scene, source, options);
        if (!mesh)
        {
            Core::Log::Error("MeshSyncSystem: cannot link '{}': {}",
                             m_Scene.GetName(source), SyncErrorToString(mesh.error()));
            return std::unexpected(mesh.error());
        }

        const std::string sourceName(m_Scene.GetName(source));
        const entt::entity target = m_Scene.CreateEntity(sourceName + m_Config.TargetSuffix);

        auto swapped = SwapTargetMesh(m_Scene, m_Store, target, std::move(*mesh));
        if (!swapped)
        {
            m_Scene.DestroyEntity(target);
            return std::unexpected(swapped.error());
        }

        auto& registry = m_Scene.GetRegistry();
        auto& link = registry.emplace<ECS::Components::MeshLink::Component>(target);
        link.SetSource(source, sourceName);
        link.AutoUpdate = true;
        link.SetDebounce(m_Config.DefaultDebounce);
        link.ApplyModifiers = options.ApplyModifiers;
        link.PreserveAllDataLayers = options.PreserveAllDataLayers;

        if (m_Config.AutoParent)
        {
            const auto& xf = registry.get<ECS::Components::Transform::Component>(source);
            registry.emplace_or_replace<ECS::Components::Parent::Component>(
                target, source, glm::inverse(ECS::Components::Transform::GetMatrix(xf)));
        }

        if (const auto digest = Fingerprint(m_Scene, source, m_Schemas))
            m_LastBuilt.insert_or_assign(target, BuiltRecord{*digest, options.ApplyModifiers,
                                                             options.PreserveAllDataLayers});

        Core::Log::Info("MeshSyncSystem: linked mesh created: {}", m_Scene.GetName(target));
        return target;
    }

    bool MeshSyncSystem::Unlink(entt::entity target)
    {
        auto* link = m_Scene.GetRegistry().try_get<ECS::Components::MeshLink::Component>(target);
        if (!link || !link->Source.IsSet())
            return false;

        const entt::entity source = LinkRegistry::ResolveSource(m_Scene, target);
        const std::string sourceName = source != entt::null ? std::string(m_Scene.GetName(source))
                                                            : link->Source.Name;
        link->ClearSource();
        m_LastBuilt.erase(target);

        const bool orphaned = source == entt::null ||
                              LinkRegistry::TargetsFor(m_Scene, source, true).empty();
        if (orphaned && !sourceName.empty())
            ForgetFingerprint(sourceName);

        Core::Log::Info("MeshSyncSystem: unlinked '{}' from '{}'", m_Scene.GetName(target), sourceName);
        return true;
    }

    void MeshSyncSystem::OnSceneChanged(const SceneUpdateBatch& batch)
    {
        m_Router.OnSceneChanged(batch);
    }

    void MeshSyncSystem::OnDocumentLoaded()
    {
        m_Router.OnDocumentLoaded();
        m_LastBuilt.clear();
    }
}
