module;
#include <string>
#include <utility>
#include <entt/entity/entity.hpp>

export module ECS:Components.MeshLink;

export namespace ECS::Components::MeshLink
{
    inline constexpr double kDefaultDebounceSeconds = 0.25;

    // Weak reference to a source object.
    // Entity may dangle (destroyed, or recreated by a document reload); Name is
    // the stable name the source had when last resolved. Lookups re-validate
    // the entity every time and fall back to Name; nothing holds on to a
    // resolved entity between lookups.
    struct SourceRef
    {
        entt::entity Entity = entt::null;
        std::string Name;

        [[nodiscard]] bool IsSet() const { return Entity != entt::null || !Name.empty(); }
    };

    // Persistent link record on a generated mesh object.
    struct Component
    {
        SourceRef Source;
        bool AutoUpdate = true;
        double Debounce = kDefaultDebounceSeconds; // seconds, never negative
        bool ApplyModifiers = true;
        bool PreserveAllDataLayers = true;
        std::string Note;

        void SetDebounce(double seconds) { Debounce = seconds > 0.0 ? seconds : 0.0; }

        void SetSource(entt::entity source, std::string name)
        {
            Source.Entity = source;
            Source.Name = std::move(name);
        }

        void ClearSource() { Source = {}; }
    };
}
