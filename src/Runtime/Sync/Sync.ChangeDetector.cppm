module;

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <entt/entity/entity.hpp>

export module Sync:ChangeDetector;

import Core;
import ECS;
import :ModifierSchema;

export namespace Sync
{
    // Per-source memory of the last observed fingerprint and interaction mode,
    // keyed by source name.
    class ChangeDetector
    {
    public:
        explicit ChangeDetector(const ModifierSchemaTable& schemas) : m_Schemas(schemas) {}

        // True when the source's fingerprint differs from the cached one (or
        // nothing is cached, or it cannot be fingerprinted). Updates the cache.
        // Unnamed sources never count as changed.
        bool Changed(const ECS::Scene& scene, entt::entity source);

        // Records the source's interaction mode; true exactly when it just left Edit.
        bool ExitedDirectEdit(const ECS::Scene& scene, entt::entity source);

        [[nodiscard]] std::optional<Core::Hash::Digest128> Cached(std::string_view sourceName) const;

        // Drops both the fingerprint and the mode entry.
        void Forget(std::string_view sourceName);
        void Clear();

        [[nodiscard]] size_t CacheSize() const { return m_Fingerprints.size(); }
        [[nodiscard]] size_t ModeCacheSize() const { return m_Modes.size(); }

    private:
        const ModifierSchemaTable& m_Schemas;
        std::map<std::string, Core::Hash::Digest128, std::less<>> m_Fingerprints;
        std::map<std::string, ECS::Components::SourceObject::InteractionMode, std::less<>> m_Modes;
    };
}
