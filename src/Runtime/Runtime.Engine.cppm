module;
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

export module Runtime.Engine;

import Core;
import ECS;
import Sync;
import Runtime.SceneManager;

export namespace Runtime
{
    struct EngineConfig
    {
        std::string AppName = "CurveSync App";
        double FixedStep = 1.0 / 60.0; // seconds advanced per frame
        Sync::SyncConfig Sync;
    };

    // Headless host: owns the scene, the timer queue, the scene event bus and
    // the mesh sync system, and drives them from a fixed-step loop.
    class Engine
    {
    public:
        Engine(const EngineConfig& config, std::unique_ptr<Sync::IEvaluationService> evaluator);
        virtual ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // Runs OnStart() once, then up to `maxFrames` frames or until Stop().
        void Run(size_t maxFrames);
        void Stop() { m_Running = false; }

        // Advances the timer queue; due regenerations run inside this call.
        void Tick(double deltaSeconds);

        // To be implemented by the Client (Sandbox)
        virtual void OnStart() = 0;
        virtual void OnUpdate(double deltaSeconds) = 0;

        // --- Host notifications ---
        void NotifySceneChanged(const Sync::SceneUpdateBatch& batch);

        // Replaces the scene content with what `populate` creates and
        // announces the reload to listeners.
        void LoadDocument(const std::function<void(ECS::Scene&)>& populate);

        [[nodiscard]] SceneManager& GetSceneManager() { return m_SceneManager; }
        [[nodiscard]] ECS::Scene& GetScene() { return m_SceneManager.GetScene(); }
        [[nodiscard]] Sync::MeshSyncSystem& GetMeshSync() { return *m_MeshSync; }
        [[nodiscard]] Core::Timers::ManualTimerQueue& GetTimers() { return m_Timers; }
        [[nodiscard]] Sync::SceneEvents& GetEvents() { return m_Events; }
        [[nodiscard]] const EngineConfig& GetConfig() const { return m_Config; }

    protected:
        EngineConfig m_Config;
        SceneManager m_SceneManager;
        Core::Timers::ManualTimerQueue m_Timers;
        Sync::SceneEvents m_Events;
        std::unique_ptr<Sync::IEvaluationService> m_Evaluator;
        std::unique_ptr<Sync::MeshSyncSystem> m_MeshSync;

        bool m_Running = true;
    };
}
