module;
#include <cstdint>
#include <string_view>
#include <entt/entity/entity.hpp>

export module ECS:Components.SourceObject;

export namespace ECS::Components::SourceObject
{
    enum class ObjectType : uint8_t
    {
        Curve,
        Surface
    };

    enum class InteractionMode : uint8_t
    {
        Object,
        Edit
    };

    [[nodiscard]] constexpr std::string_view InteractionModeName(InteractionMode mode)
    {
        return mode == InteractionMode::Edit ? "EDIT" : "OBJECT";
    }

    // Marks an object whose shape comes from a curve data block.
    // Data points at an entity holding Curve::Component; it may be shared.
    struct Component
    {
        ObjectType Type = ObjectType::Curve;
        entt::entity Data = entt::null;
        InteractionMode Mode = InteractionMode::Object;
    };
}
