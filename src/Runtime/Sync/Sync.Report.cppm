module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <entt/entity/entity.hpp>

export module Sync:Report;

import :Errors;

export namespace Sync
{
    enum class TargetOutcome : uint8_t
    {
        Regenerated,
        UpToDate,   // last build already matches the source; nothing done
        Failed
    };

    [[nodiscard]] constexpr std::string_view TargetOutcomeToString(TargetOutcome o) noexcept
    {
        switch (o)
        {
            case TargetOutcome::Regenerated: return "Regenerated";
            case TargetOutcome::UpToDate:    return "UpToDate";
            case TargetOutcome::Failed:      return "Failed";
            default:                         return "Unknown";
        }
    }

    struct TargetResult
    {
        entt::entity Target = entt::null;
        std::string TargetName;
        TargetOutcome Outcome = TargetOutcome::Regenerated;
        std::optional<SyncError> Error; // set iff Outcome == Failed
    };

    struct UpdateReport
    {
        std::string SourceName;
        bool SourceMissing = false;
        std::vector<TargetResult> Targets;

        [[nodiscard]] size_t Count(TargetOutcome outcome) const
        {
            return static_cast<size_t>(std::count_if(Targets.begin(), Targets.end(),
                [outcome](const TargetResult& r) { return r.Outcome == outcome; }));
        }

        [[nodiscard]] size_t RegeneratedCount() const { return Count(TargetOutcome::Regenerated); }
        [[nodiscard]] size_t UpToDateCount() const { return Count(TargetOutcome::UpToDate); }
        [[nodiscard]] size_t FailedCount() const { return Count(TargetOutcome::Failed); }
        [[nodiscard]] bool HasFailures() const { return FailedCount() > 0; }
    };
}
