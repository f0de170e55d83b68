module;

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Sync;

import Core;

namespace Sync
{
    namespace
    {
        constexpr std::array<std::string_view, 2> kUiOnlyParams{"show_expanded", "ui_expanded"};
    }

    bool ModifierSchema::Declares(std::string_view name) const
    {
        const auto it = std::ranges::lower_bound(Params, name, std::ranges::less{},
                                                 [](const ParamDescriptor& p) { return std::string_view(p.Name); });
        return it != Params.end() && it->Name == name;
    }

    bool ModifierSchemaTable::IsUiOnly(std::string_view name)
    {
        return std::ranges::find(kUiOnlyParams, name) != kUiOnlyParams.end();
    }

    bool ModifierSchemaTable::Register(std::string type, std::vector<ParamDescriptor> params)
    {
        const Core::Hash::StringID id{type};
        if (m_Schemas.contains(id))
        {
            Core::Log::Warn("ModifierSchemaTable: '{}' already registered", type);
            return false;
        }

        std::sort(params.begin(), params.end(),
                  [](const ParamDescriptor& a, const ParamDescriptor& b) { return a.Name < b.Name; });

        ModifierSchema schema;
        schema.Id = id;
        schema.Type = std::move(type);
        schema.Params = std::move(params);
        m_Schemas.emplace(id, std::move(schema));
        return true;
    }

    const ModifierSchema* ModifierSchemaTable::Find(std::string_view type) const
    {
        const auto it = m_Schemas.find(Core::Hash::StringID{type});
        if (it == m_Schemas.end() || it->second.Type != type)
            return nullptr;
        return &it->second;
    }

    ModifierSchemaTable ModifierSchemaTable::BuiltIn()
    {
        using enum ParamKind;

        ModifierSchemaTable table;
        table.Register("ARRAY", {
            {"fit_type", Enum},
            {"count", Int},
            {"fit_length", Float},
            {"curve", Reference},
            {"use_relative_offset", Bool},
            {"relative_offset_displace", Float},
            {"use_constant_offset", Bool},
            {"constant_offset_displace", Float},
            {"use_merge_vertices", Bool},
            {"merge_threshold", Float},
            {"start_cap", Reference},
            {"end_cap", Reference},
        });
        table.Register("SOLIDIFY", {
            {"thickness", Float},
            {"offset", Float},
            {"use_even_offset", Bool},
            {"use_rim", Bool},
            {"use_flip_normals", Bool},
        });
        table.Register("SUBSURF", {
            {"levels", Int},
            {"render_levels", Int},
            {"subdivision_type", Enum},
            {"quality", Int},
        });
        table.Register("MIRROR", {
            {"use_axis_x", Bool},
            {"use_axis_y", Bool},
            {"use_axis_z", Bool},
            {"use_clip", Bool},
            {"use_mirror_merge", Bool},
            {"merge_threshold", Float},
            {"mirror_object", Reference},
        });
        table.Register("BOOLEAN", {
            {"operation", Enum},
            {"operand_type", Enum},
            {"object", Reference},
            {"operands", ReferenceList},
            {"solver", Enum},
        });
        table.Register("SCREW", {
            {"angle", Float},
            {"screw_offset", Float},
            {"iterations", Int},
            {"steps", Int},
            {"render_steps", Int},
            {"axis", Enum},
            {"object", Reference},
        });
        return table;
    }
}
