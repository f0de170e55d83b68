module;
#include <string>

export module ECS:Components.NameTag;

export namespace ECS::Components::NameTag
{
    // Stable, user-facing object name. Unique among live objects (enforced by
    // ECS::Scene), but a name may be reused once its owner is destroyed.
    struct Component
    {
        std::string Name;
    };
}
