module;

#include <expected>
#include <optional>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Sync:ArtifactBuilder;

import ECS;
import Graphics;
import :Errors;
import :Evaluation;

export namespace Sync
{
    // Translates `mesh` so the first control point of the curve's only open
    // (non-cyclic U) spline sits at the origin. Weighted points are projected
    // from homogeneous coordinates. Returns the applied offset, or nullopt when
    // the curve has zero or several open splines and nothing was moved.
    std::optional<glm::vec3> NormalizePlacement(const ECS::Components::Curve::Component& curve,
                                                Graphics::MeshData& mesh);

    class ArtifactBuilder
    {
    public:
        explicit ArtifactBuilder(IEvaluationService& evaluator) : m_Evaluator(evaluator) {}

        // Evaluates `source` and normalizes placement. Fails with
        // UnsupportedSource for non-curve objects and EmptyResult for meshes
        // without vertices; evaluation errors are passed through.
        [[nodiscard]] std::expected<Graphics::MeshData, SyncError>
        Build(const ECS::Scene& scene, entt::entity source, const EvaluationOptions& options);

    private:
        IEvaluationService& m_Evaluator;
    };
}
