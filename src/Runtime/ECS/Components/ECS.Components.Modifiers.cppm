module;
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <entt/entity/entity.hpp>

export module ECS:Components.Modifiers;

export namespace ECS::Components::Modifiers
{
    // Ordered collection of object references (e.g. boolean operands).
    struct EntityList
    {
        std::vector<entt::entity> Items;

        bool operator==(const EntityList&) const = default;
    };

    // double: float params, int64_t: int params, bool: toggles,
    // std::string: enum identifiers, entt::entity: object reference.
    using ParamValue = std::variant<double, int64_t, bool, std::string, entt::entity, EntityList>;

    struct Modifier
    {
        std::string Name;   // user label, not shape-relevant
        std::string Type;   // kind tag, e.g. "ARRAY"
        bool ShowViewport = true;
        bool ShowRender = true;
        std::map<std::string, ParamValue, std::less<>> Params;

        Modifier& Set(std::string param, ParamValue value)
        {
            Params.insert_or_assign(std::move(param), std::move(value));
            return *this;
        }

        [[nodiscard]] const ParamValue* Find(std::string_view param) const
        {
            const auto it = Params.find(param);
            return it != Params.end() ? &it->second : nullptr;
        }
    };

    struct Component
    {
        std::vector<Modifier> Stack;

        Modifier& Add(std::string type, std::string name = {})
        {
            Modifier& mod = Stack.emplace_back();
            mod.Name = name.empty() ? type : std::move(name);
            mod.Type = std::move(type);
            return mod;
        }
    };
}
