module;

#include <format>
#include <string>
#include <string_view>

module Core;

namespace Core::Names
{
    std::string MakeUnique(std::string_view base, const IsTakenFn& isTaken)
    {
        const std::string_view stem = base.empty() ? std::string_view{"Object"} : base;
        if (!isTaken(stem))
            return std::string(stem);

        for (unsigned suffix = 1;; ++suffix)
        {
            std::string candidate = std::format("{}.{:03}", stem, suffix);
            if (!isTaken(candidate))
                return candidate;
        }
    }
}
