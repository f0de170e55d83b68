#pragma once

// =============================================================================
// Shared curve/link builders and a fake evaluation service for the sync
// test suites.
//
// Usage: #include "TestCurveBuilders.h" AFTER `import ECS; import Graphics;
// import Sync;` in each test file. All functions are inline to avoid ODR
// issues across translation units.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

// Poly spline through `points` (w = 1).
inline ECS::Components::Curve::Spline MakePolySpline(const std::vector<glm::dvec3>& points, bool cyclic = false)
{
    ECS::Components::Curve::Spline spline;
    spline.Type = ECS::Components::Curve::SplineType::Poly;
    spline.CyclicU = cyclic;
    for (const glm::dvec3& p : points)
        spline.Points.push_back({glm::dvec4(p, 1.0), 0.0, 1.0});
    return spline;
}

// Curve object `name` whose data block holds `splines`. Returns the object.
inline entt::entity MakeCurveObject(ECS::Scene& scene, const std::string& name,
                                    std::vector<ECS::Components::Curve::Spline> splines)
{
    auto& registry = scene.GetRegistry();
    const entt::entity data = scene.CreateData();
    auto& curve = registry.emplace<ECS::Components::Curve::Component>(data);
    curve.Splines = std::move(splines);

    const entt::entity object = scene.CreateEntity(name);
    registry.emplace<ECS::Components::SourceObject::Component>(
        object, ECS::Components::SourceObject::ObjectType::Curve, data);
    return object;
}

// The two-point open poly line (0,0,0) -> (1,0,0).
inline entt::entity MakeSimpleCurve(ECS::Scene& scene, const std::string& name = "Curve")
{
    return MakeCurveObject(scene, name, {MakePolySpline({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}})});
}

inline ECS::Components::Curve::Component& CurveOf(ECS::Scene& scene, entt::entity object)
{
    auto& registry = scene.GetRegistry();
    return registry.get<ECS::Components::Curve::Component>(
        registry.get<ECS::Components::SourceObject::Component>(object).Data);
}

inline entt::entity DataOf(ECS::Scene& scene, entt::entity object)
{
    return scene.GetRegistry().get<ECS::Components::SourceObject::Component>(object).Data;
}

// Mesh object linked to `source` holding a placeholder mesh resource with one user.
inline entt::entity MakeLinkedTarget(ECS::Scene& scene, Graphics::MeshStore& store, entt::entity source,
                                     const std::string& name, double debounce = 0.25, bool autoUpdate = true)
{
    auto& registry = scene.GetRegistry();
    const entt::entity target = scene.CreateEntity(name);

    Graphics::MeshData placeholder;
    placeholder.Positions.push_back(glm::vec3(0.0f));
    const Graphics::MeshHandle handle = store.Create(name + "_mesh", std::move(placeholder));
    registry.emplace<ECS::MeshRef::Component>(target, handle);
    (void)store.AddUser(handle);

    auto& link = registry.emplace<ECS::Components::MeshLink::Component>(target);
    link.SetSource(source, std::string(scene.GetName(source)));
    link.SetDebounce(debounce);
    link.AutoUpdate = autoUpdate;
    return target;
}

inline const Graphics::MeshResource* MeshOf(const ECS::Scene& scene, const Graphics::MeshStore& store,
                                            entt::entity target)
{
    const auto* ref = scene.GetRegistry().try_get<ECS::MeshRef::Component>(target);
    if (!ref)
        return nullptr;
    auto res = store.Get(ref->Handle);
    return res ? *res : nullptr;
}

// Returns the control points (projected by weight) as a point mesh and counts
// calls. FailWhen lets a test reject specific requests.
class FakeEvaluationService final : public Sync::IEvaluationService
{
public:
    std::expected<Graphics::MeshData, Sync::SyncError>
    Evaluate(const ECS::Scene& scene, entt::entity source, const Sync::EvaluationOptions& options) override
    {
        ++Calls;
        LastOptions = options;
        if (FailWhen && FailWhen(options))
            return std::unexpected(Sync::SyncError::EvaluationFailed);

        const auto& registry = scene.GetRegistry();
        const auto& curve = registry.get<ECS::Components::Curve::Component>(
            registry.get<ECS::Components::SourceObject::Component>(source).Data);

        Graphics::MeshData mesh;
        mesh.Topology = Graphics::PrimitiveTopology::Points;
        if (ReturnEmpty)
            return mesh;

        for (const auto& spline : curve.Splines)
        {
            for (const auto& p : spline.BezierPoints)
                mesh.Positions.push_back(glm::vec3(p.Co));
            for (const auto& p : spline.Points)
            {
                const glm::dvec3 xyz = p.Co.w != 0.0 ? glm::dvec3(p.Co) / p.Co.w : glm::dvec3(p.Co);
                mesh.Positions.push_back(glm::vec3(xyz));
            }
        }
        for (uint32_t i = 0; i < mesh.Positions.size(); ++i)
            mesh.Indices.push_back(i);
        return mesh;
    }

    size_t Calls = 0;
    bool ReturnEmpty = false;
    Sync::EvaluationOptions LastOptions{};
    std::function<bool(const Sync::EvaluationOptions&)> FailWhen;
};
