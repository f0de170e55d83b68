module;
#include <algorithm>
#include <cstdint>
#include <vector>
#include <entt/entity/entity.hpp>
#include <entt/signal/sigh.hpp>

export module Sync:Events;

export namespace Sync
{
    enum class UpdateKind : uint8_t
    {
        Object,     // an object's own state (mode, modifiers, transform)
        CurveData,  // a curve data block shared by one or more objects
        Other
    };

    struct SceneUpdate
    {
        entt::entity Id = entt::null;
        UpdateKind Kind = UpdateKind::Other;
        bool GeometryUpdated = false;
    };

    // One host notification. Entries arrive in the order the host reports them.
    struct SceneUpdateBatch
    {
        std::vector<SceneUpdate> Updates;

        [[nodiscard]] bool HasKind(UpdateKind kind) const
        {
            return std::any_of(Updates.begin(), Updates.end(),
                               [kind](const SceneUpdate& u) { return u.Kind == kind; });
        }

        [[nodiscard]] bool HasObjectUpdates() const { return HasKind(UpdateKind::Object); }
        [[nodiscard]] bool HasCurveDataUpdates() const { return HasKind(UpdateKind::CurveData); }
    };

    // The host's event feed. Publishers call publish(); listeners connect
    // through an entt::sink.
    struct SceneEvents
    {
        entt::sigh<void(const SceneUpdateBatch&)> SceneChanged;
        entt::sigh<void()> DocumentLoaded;
    };
}
