module;
#include <expected>
#include <entt/entity/entity.hpp>

export module Sync:Evaluation;

import ECS;
import Graphics;
import :Errors;

export namespace Sync
{
    struct EvaluationOptions
    {
        // Evaluate with the source's modifier stack applied.
        bool ApplyModifiers = true;
        // Keep auxiliary per-vertex layers in the result.
        bool PreserveAllDataLayers = true;
    };

    // Tessellates a curve/surface object into a mesh. Owned by the host; the
    // call is synchronous and may be expensive.
    class IEvaluationService
    {
    public:
        virtual ~IEvaluationService() = default;
        IEvaluationService(const IEvaluationService&) = delete;
        IEvaluationService& operator=(const IEvaluationService&) = delete;
        IEvaluationService(IEvaluationService&&) = delete;
        IEvaluationService& operator=(IEvaluationService&&) = delete;

        [[nodiscard]] virtual std::expected<Graphics::MeshData, SyncError>
        Evaluate(const ECS::Scene& scene, entt::entity source, const EvaluationOptions& options) = 0;

    protected:
        IEvaluationService() = default;
    };
}
