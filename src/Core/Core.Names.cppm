module;
#include <functional>
#include <string>
#include <string_view>

export module Core:Names;

export namespace Core::Names
{
    using IsTakenFn = std::function<bool(std::string_view)>;

    // Returns `base` if free, otherwise the first free "base.001", "base.002", ...
    // An empty base is treated as "Object".
    [[nodiscard]] std::string MakeUnique(std::string_view base, const IsTakenFn& isTaken);
}
