module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <entt/entity/entity.hpp>

export module Sync:DebounceScheduler;

import Core;
import ECS;

// -------------------------------------------------------------------------
// Sync::DebounceScheduler - one pending regeneration per source
// -------------------------------------------------------------------------
// Schedule() arms a one-shot timer for the source with the smallest debounce
// among its enabled targets. Scheduling again while a timer is pending
// cancels it and re-arms with the full delay, so a burst of edits produces a
// single regeneration once the source has been quiet for that long.
//
// When the timer fires the pending entry is released first, then the run
// callback receives the source name. The callback looks the source up again,
// so it sees the state at execution time.
//
// The destructor cancels every timer the scheduler still has pending.
// -------------------------------------------------------------------------

export namespace Sync
{
    class DebounceScheduler
    {
    public:
        using RunFn = std::function<void(const std::string& sourceName)>;

        DebounceScheduler(Core::Timers::ITimerService& timers, RunFn run);
        ~DebounceScheduler();

        DebounceScheduler(const DebounceScheduler&) = delete;
        DebounceScheduler& operator=(const DebounceScheduler&) = delete;
        DebounceScheduler(DebounceScheduler&&) = delete;
        DebounceScheduler& operator=(DebounceScheduler&&) = delete;

        // Returns the armed delay in seconds, or nullopt when the source has
        // no name or no enabled targets.
        std::optional<double> Schedule(ECS::Scene& scene, entt::entity source);

        // Returns false when nothing was pending for the name.
        bool Cancel(std::string_view sourceName);
        void CancelAll();

        [[nodiscard]] bool IsPending(std::string_view sourceName) const;
        [[nodiscard]] std::optional<double> PendingDelay(std::string_view sourceName) const;
        [[nodiscard]] size_t PendingCount() const { return m_Pending.size(); }

    private:
        struct Pending
        {
            Core::Timers::TimerId Timer;
            uint64_t Ticket = 0;
            double Delay = 0.0;
        };

        void Fire(const std::string& sourceName, uint64_t ticket);

        Core::Timers::ITimerService& m_Timers;
        RunFn m_Run;
        std::map<std::string, Pending, std::less<>> m_Pending;
        uint64_t m_NextTicket = 1;
    };
}
