#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

import Core;
import ECS;
import Graphics;
import Sync;
import Runtime.SceneManager;
import Runtime.Engine;

using namespace Core;
using namespace Runtime;

namespace
{
    using namespace ECS::Components;

    // Stand-in for a real tessellator: samples each spline's control polygon
    // ResolutionU times per segment and returns it as a line mesh.
    class ControlCageEvaluator final : public Sync::IEvaluationService
    {
    public:
        std::expected<Graphics::MeshData, Sync::SyncError>
        Evaluate(const ECS::Scene& scene, entt::entity source, const Sync::EvaluationOptions& options) override
        {
            const auto& registry = scene.GetRegistry();
            const auto* object = registry.try_get<SourceObject::Component>(source);
            if (!object || !registry.all_of<Curve::Component>(object->Data))
                return std::unexpected(Sync::SyncError::UnsupportedSource);

            const auto& curve = registry.get<Curve::Component>(object->Data);
            Graphics::MeshData mesh;
            mesh.Topology = Graphics::PrimitiveTopology::Lines;

            for (const Curve::Spline& spline : curve.Splines)
            {
                std::vector<glm::vec3> cage;
                if (spline.Type == Curve::SplineType::Bezier)
                {
                    for (const auto& p : spline.BezierPoints)
                        cage.emplace_back(p.Co);
                }
                else
                {
                    for (const auto& p : spline.Points)
                        cage.emplace_back(p.Co.w != 0.0 ? glm::dvec3(p.Co) / p.Co.w : glm::dvec3(p.Co));
                }
                if (spline.CyclicU && cage.size() > 2)
                    cage.push_back(cage.front());

                const int steps = std::max(1, spline.ResolutionU);
                for (size_t i = 0; i + 1 < cage.size(); ++i)
                {
                    for (int s = 0; s < steps; ++s)
                    {
                        const float t = static_cast<float>(s) / static_cast<float>(steps);
                        const auto base = static_cast<uint32_t>(mesh.Positions.size());
                        mesh.Positions.push_back(glm::mix(cage[i], cage[i + 1], t));
                        mesh.Indices.push_back(base);
                        mesh.Indices.push_back(base + 1);
                    }
                }
                if (!cage.empty())
                    mesh.Positions.push_back(cage.back());
            }

            if (options.PreserveAllDataLayers && !mesh.Positions.empty())
            {
                Graphics::AttributeLayer& uv = mesh.Layers.emplace_back();
                uv.Name = "UVMap";
                for (size_t i = 0; i < mesh.Positions.size(); ++i)
                    uv.Values.emplace_back(static_cast<float>(i) / static_cast<float>(mesh.Positions.size()), 0.0f, 0.0f, 0.0f);
            }
            return mesh;
        }
    };

    entt::entity SpawnCurve(ECS::Scene& scene)
    {
        auto& registry = scene.GetRegistry();

        const entt::entity data = scene.CreateData();
        auto& curve = registry.emplace<Curve::Component>(data);
        Curve::Spline& spline = curve.Splines.emplace_back();
        spline.Type = Curve::SplineType::Nurbs;
        spline.ResolutionU = 4;
        for (int i = 0; i < 4; ++i)
            spline.Points.push_back({glm::dvec4(1.0 + i, i % 2 == 0 ? 0.0 : 1.0, 0.0, 1.0), 0.0, 1.0});

        const entt::entity object = scene.CreateEntity("NurbsPath");
        registry.emplace<SourceObject::Component>(object, SourceObject::ObjectType::Curve, data);
        registry.get<Transform::Component>(object).Position = glm::vec3(0.0f, 0.0f, 2.0f);
        return object;
    }
}

// --- The Application Class ---
class SandboxApp : public Engine
{
public:
    SandboxApp() : Engine({"Sandbox"}, std::make_unique<ControlCageEvaluator>())
    {
    }

    entt::entity m_Source = entt::null;
    entt::entity m_Target = entt::null;
    size_t m_Frame = 0;

    void OnStart() override
    {
        Log::Info("Sandbox Started!");

        m_Source = SpawnCurve(GetScene());
        auto target = GetMeshSync().CreateLinkedTarget(m_Source);
        if (!target)
        {
            Log::Error("Sandbox: linking failed: {}", Sync::SyncErrorToString(target.error()));
            Stop();
            return;
        }
        m_Target = *target;
        PrintTarget("linked");
    }

    void OnUpdate(double) override
    {
        ++m_Frame;

        // Drag the last control point for ten frames, one notification per frame.
        if (m_Frame <= 10)
        {
            auto& registry = GetScene().GetRegistry();
            const entt::entity data = registry.get<SourceObject::Component>(m_Source).Data;
            registry.get<Curve::Component>(data).Splines.front().Points.back().Co.y += 0.1;

            Sync::SceneUpdateBatch batch;
            batch.Updates.push_back({data, Sync::UpdateKind::CurveData, true});
            NotifySceneChanged(batch);
        }

        if (m_Frame == 40)
        {
            PrintTarget("after edits");
            Stop();
        }
    }

    void PrintTarget(const char* when)
    {
        const auto& registry = GetScene().GetRegistry();
        const auto& ref = registry.get<ECS::MeshRef::Component>(m_Target);
        auto mesh = GetSceneManager().GetMeshStore().Get(ref.Handle);
        if (!mesh)
        {
            Log::Error("Sandbox: mesh lookup failed: {}", ErrorCodeToString(mesh.error()));
            return;
        }

        const glm::vec3 last = (*mesh)->Data.Positions.back();
        Log::Info("Sandbox [{}]: '{}' -> mesh '{}', {} vertices, end point ({:.2f}, {:.2f}, {:.2f})",
                  when, GetScene().GetName(m_Target), (*mesh)->Name, (*mesh)->Data.VertexCount(),
                  last.x, last.y, last.z);
    }
};

int main()
{
    SandboxApp app;
    app.Run(600);
    return 0;
}
