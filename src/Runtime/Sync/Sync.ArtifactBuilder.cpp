module;

#include <expected>
#include <optional>
#include <utility>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Sync;

import Core;
import ECS;
import Graphics;

namespace Sync
{
    std::optional<glm::vec3> NormalizePlacement(const ECS::Components::Curve::Component& curve,
                                                Graphics::MeshData& mesh)
    {
        using namespace ECS::Components::Curve;

        const Spline* open = nullptr;
        for (const Spline& spline : curve.Splines)
        {
            if (spline.CyclicU)
                continue;
            if (open)
                return std::nullopt;
            open = &spline;
        }
        if (!open || open->PointCount() == 0)
            return std::nullopt;

        glm::dvec3 first;
        if (open->Type == SplineType::Bezier)
        {
            first = open->BezierPoints.front().Co;
        }
        else
        {
            const glm::dvec4& co = open->Points.front().Co;
            first = co.w != 0.0 ? glm::dvec3(co) / co.w : glm::dvec3(co);
        }

        const glm::vec3 offset = -glm::vec3(first);
        mesh.Translate(offset);
        return offset;
    }

    std::expected<Graphics::MeshData, SyncError>
    ArtifactBuilder::Build(const ECS::Scene& scene, entt::entity source, const EvaluationOptions& options)
    {
        if (!IsCurveSource(scene, source))
            return std::unexpected(SyncError::UnsupportedSource);

        auto mesh = m_Evaluator.Evaluate(scene, source, options);
        if (!mesh)
            return std::unexpected(mesh.error());
        if (mesh->Empty())
            return std::unexpected(SyncError::EmptyResult);

        const auto& registry = scene.GetRegistry();
        const auto& curve = registry.get<ECS::Components::Curve::Component>(
            registry.get<ECS::Components::SourceObject::Component>(source).Data);

        if (const auto offset = NormalizePlacement(curve, *mesh))
        {
            Core::Log::Debug("ArtifactBuilder: '{}' shifted by ({}, {}, {})",
                             scene.GetName(source), offset->x, offset->y, offset->z);
        }
        return std::move(*mesh);
    }
}
