module;

#include <optional>
#include <entt/entity/entity.hpp>

export module Sync:Fingerprint;

import Core;
import ECS;
import :ModifierSchema;

// -------------------------------------------------------------------------
// Sync::Fingerprint - content digest of a curve/surface source
// -------------------------------------------------------------------------
// Covers every input to tessellation: curve-wide settings, splines with their
// control points, and the modifier stack. Excludes the object name, selection,
// visibility and transform.
//
// Encoding (fed to Core::Hash::Fnv1a128):
//   - scalar settings and flags as decimal text; float settings as the
//     16-digit hex of their IEEE-754 bits
//   - control-point components as 8-byte little-endian doubles
//   - every logical field is closed by the separator 0x00 0x1F
//   - strings are preceded by their decimal length
//   - object references are hashed by the referenced object's name
//
// The digest depends on nothing but that byte stream, so it is stable across
// runs, processes and platforms.
// -------------------------------------------------------------------------

export namespace Sync
{
    // std::nullopt when `source` is not a curve/surface object or its curve
    // data is missing. Callers treat that as "changed".
    [[nodiscard]] std::optional<Core::Hash::Digest128>
    Fingerprint(const ECS::Scene& scene, entt::entity source, const ModifierSchemaTable& schemas);

    // True for live objects carrying SourceObject whose data entity holds curve data.
    [[nodiscard]] bool IsCurveSource(const ECS::Scene& scene, entt::entity entity);
}
