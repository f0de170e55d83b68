module;

#include <cstdint>
#include <string_view>

export module Sync:Errors;

export namespace Sync
{
    enum class SyncError : std::uint32_t
    {
        SourceMissing,
        UnsupportedSource,
        EvaluationFailed,
        EmptyResult,
        ResourceFailure
    };

    [[nodiscard]] constexpr std::string_view SyncErrorToString(SyncError e) noexcept
    {
        switch (e)
        {
            case SyncError::SourceMissing:     return "SourceMissing";
            case SyncError::UnsupportedSource: return "UnsupportedSource";
            case SyncError::EvaluationFailed:  return "EvaluationFailed";
            case SyncError::EmptyResult:       return "EmptyResult";
            case SyncError::ResourceFailure:   return "ResourceFailure";
            default:                           return "Unknown";
        }
    }
}
