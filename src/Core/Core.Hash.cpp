module;

#include <format>
#include <string>

module Core;

namespace Core::Hash
{
    std::string Digest128::ToHex() const
    {
        return std::format("{:016x}{:016x}", Hi, Lo);
    }
}
