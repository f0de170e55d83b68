module;

#include <vector>
#include <entt/entity/entity.hpp>

export module Sync:LinkRegistry;

import ECS;

// Resolves mesh objects (targets) to the curve object (source) their
// MeshLink points at. The link's entity reference is weak: every lookup
// re-validates it and, when it no longer resolves, falls back to the stored
// source name. Lookups write back what they resolved (the current source
// name on an identity match, the entity on a name match) so later lookups
// follow renames and reloads.
export namespace Sync::LinkRegistry
{
    // Targets linked to `source`, ascending by entity id. With
    // includeDisabled = false, links with AutoUpdate off are skipped.
    [[nodiscard]] std::vector<entt::entity>
    TargetsFor(ECS::Scene& scene, entt::entity source, bool includeDisabled);

    // entt::null when the target has no link or the source cannot be found.
    [[nodiscard]] entt::entity ResolveSource(ECS::Scene& scene, entt::entity target);
}
