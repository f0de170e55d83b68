module;
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

module Runtime.Engine;

import Core;
import ECS;
import Sync;
import Runtime.SceneManager;

namespace Runtime
{
    Engine::Engine(const EngineConfig& config, std::unique_ptr<Sync::IEvaluationService> evaluator)
        : m_Config(config), m_Evaluator(std::move(evaluator))
    {
        Core::Log::Info("Initializing {}...", m_Config.AppName);

        m_MeshSync = std::make_unique<Sync::MeshSyncSystem>(m_SceneManager.GetScene(),
                                                            m_SceneManager.GetMeshStore(),
                                                            m_Timers,
                                                            *m_Evaluator,
                                                            m_Config.Sync);
        m_MeshSync->Activate(m_Events);
    }

    Engine::~Engine()
    {
        // Sync system first: it unsubscribes from m_Events and cancels its timers.
        m_MeshSync.reset();
        m_Timers.Clear();
        Core::Log::Info("{} shut down.", m_Config.AppName);
    }

    void Engine::Run(size_t maxFrames)
    {
        OnStart();

        size_t frame = 0;
        while (m_Running && frame < maxFrames)
        {
            OnUpdate(m_Config.FixedStep);
            Tick(m_Config.FixedStep);
            ++frame;
        }
        Core::Log::Info("{}: loop ended after {} frames", m_Config.AppName, frame);
    }

    void Engine::Tick(double deltaSeconds)
    {
        m_Timers.Advance(deltaSeconds);
    }

    void Engine::NotifySceneChanged(const Sync::SceneUpdateBatch& batch)
    {
        m_Events.SceneChanged.publish(batch);
    }

    void Engine::LoadDocument(const std::function<void(ECS::Scene&)>& populate)
    {
        m_SceneManager.Clear();
        if (populate)
            populate(m_SceneManager.GetScene());
        m_Events.DocumentLoaded.publish();
    }
}
