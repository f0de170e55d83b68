module;

#include <expected>
#include <entt/entity/entity.hpp>

export module Sync:ArtifactSwapper;

import ECS;
import Graphics;
import :Errors;

export namespace Sync
{
    // Gives `target` a new mesh resource holding `mesh`.
    //
    //  1. The new resource copies the previous resource's material list.
    //  2. The target's MeshRef moves to the new resource (user added).
    //  3. The previous resource loses the target as a user. If that was its
    //     last user it is removed and the new resource takes over its name;
    //     otherwise it stays alive for its other users.
    //
    // A target without a previous resource gets one named after the target.
    std::expected<Graphics::MeshHandle, SyncError>
    SwapTargetMesh(ECS::Scene& scene, Graphics::MeshStore& store, entt::entity target,
                   Graphics::MeshData mesh);
}
