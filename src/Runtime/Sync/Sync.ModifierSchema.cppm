module;

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Sync:ModifierSchema;

import Core;

// -------------------------------------------------------------------------
// Sync::ModifierSchemaTable - shape-relevant parameters per modifier kind
// -------------------------------------------------------------------------
// The fingerprint enumerates the declared parameters of a known kind first,
// in a fixed order and whether or not they are stored, so an unset parameter
// encodes differently from an explicit value. Stored parameters the schema
// does not declare follow, sorted by name. Only the UI-only names listed in
// IsUiOnly() are left out.
//
//   - Built once at startup (BuiltIn() or explicit Register calls).
//   - Parameters are kept sorted by name; registration order is irrelevant.
//   - The declared kind normalizes numeric values (Float/Int).
//   - Not thread-safe; read-only after startup.
// -------------------------------------------------------------------------

export namespace Sync
{
    enum class ParamKind : uint8_t
    {
        Float,
        Int,
        Bool,
        Enum,
        Reference,
        ReferenceList
    };

    struct ParamDescriptor
    {
        std::string Name;
        ParamKind Kind = ParamKind::Float;
    };

    struct ModifierSchema
    {
        Core::Hash::StringID Id{};
        std::string Type;
        std::vector<ParamDescriptor> Params; // sorted by Name

        [[nodiscard]] bool Declares(std::string_view name) const;
    };

    class ModifierSchemaTable
    {
    public:
        // Returns false if `type` is already registered (or collides with a
        // registered kind's hash).
        bool Register(std::string type, std::vector<ParamDescriptor> params);

        // nullptr for unknown kinds.
        [[nodiscard]] const ModifierSchema* Find(std::string_view type) const;

        [[nodiscard]] size_t Count() const { return m_Schemas.size(); }

        // Panel state stored beside real parameters; never affects the shape.
        [[nodiscard]] static bool IsUiOnly(std::string_view name);

        // Table covering the modifier kinds commonly stacked on curves.
        [[nodiscard]] static ModifierSchemaTable BuiltIn();

    private:
        std::unordered_map<Core::Hash::StringID, ModifierSchema> m_Schemas;
    };
}
