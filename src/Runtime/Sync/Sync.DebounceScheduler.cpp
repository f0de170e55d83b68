module;

#include <algorithm>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>

module Sync;

import Core;
import ECS;

namespace Sync
{
    DebounceScheduler::DebounceScheduler(Core::Timers::ITimerService& timers, RunFn run)
        : m_Timers(timers), m_Run(std::move(run))
    {
    }

    DebounceScheduler::~DebounceScheduler()
    {
        CancelAll();
    }

    std::optional<double> DebounceScheduler::Schedule(ECS::Scene& scene, entt::entity source)
    {
        const std::string name(scene.GetName(source));
        if (name.empty())
            return std::nullopt;

        const auto targets = LinkRegistry::TargetsFor(scene, source, false);
        if (targets.empty())
            return std::nullopt;

        const auto& registry = scene.GetRegistry();
        double delay = std::numeric_limits<double>::max();
        for (entt::entity target : targets)
        {
            const auto& link = registry.get<ECS::Components::MeshLink::Component>(target);
            // Negative or NaN debounce counts as immediate.
            delay = std::min(delay, link.Debounce > 0.0 ? link.Debounce : 0.0);
        }

        Cancel(name);

        const uint64_t ticket = m_NextTicket++;
        const Core::Timers::TimerId timer = m_Timers.Register([this, name, ticket]()
        {
            Fire(name, ticket);
        }, delay);

        m_Pending.insert_or_assign(name, Pending{timer, ticket, delay});
        Core::Log::Debug("DebounceScheduler: '{}' in {:.3f}s", name, delay);
        return delay;
    }

    void DebounceScheduler::Fire(const std::string& sourceName, uint64_t ticket)
    {
        const auto it = m_Pending.find(sourceName);
        if (it == m_Pending.end() || it->second.Ticket != ticket)
            return;
        m_Pending.erase(it);

        if (m_Run)
            m_Run(sourceName);
    }

    bool DebounceScheduler::Cancel(std::string_view sourceName)
    {
        const auto it = m_Pending.find(sourceName);
        if (it == m_Pending.end())
            return false;

        if (m_Timers.IsRegistered(it->second.Timer))
            m_Timers.Unregister(it->second.Timer);
        m_Pending.erase(it);
        return true;
    }

    void DebounceScheduler::CancelAll()
    {
        for (const auto& [name, pending] : m_Pending)
        {
            if (m_Timers.IsRegistered(pending.Timer))
                m_Timers.Unregister(pending.Timer);
        }
        m_Pending.clear();
    }

    bool DebounceScheduler::IsPending(std::string_view sourceName) const
    {
        return m_Pending.find(sourceName) != m_Pending.end();
    }

    std::optional<double> DebounceScheduler::PendingDelay(std::string_view sourceName) const
    {
        const auto it = m_Pending.find(sourceName);
        if (it == m_Pending.end())
            return std::nullopt;
        return it->second.Delay;
    }
}
