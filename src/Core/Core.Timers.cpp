module;

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

module Core;

namespace Core::Timers
{
    namespace
    {
        // Both operands are non-negative; clamps at the far end of the clock.
        std::chrono::nanoseconds SaturatingAdd(std::chrono::nanoseconds a, std::chrono::nanoseconds b)
        {
            if (b > std::chrono::nanoseconds::max() - a)
                return std::chrono::nanoseconds::max();
            return a + b;
        }
    }

    std::chrono::nanoseconds SecondsToDuration(double seconds)
    {
        // Also rejects NaN.
        if (!(seconds > 0.0))
            return std::chrono::nanoseconds{0};

        const std::chrono::duration<double> value(seconds);
        if (value >= std::chrono::duration<double>(std::chrono::nanoseconds::max()))
            return std::chrono::nanoseconds::max();
        return std::chrono::round<std::chrono::nanoseconds>(value);
    }

    TimerId ManualTimerQueue::Register(TimerCallback callback, double delaySeconds)
    {
        const TimerId id{m_NextId++};
        m_Entries.push_back({id, SaturatingAdd(m_Now, SecondsToDuration(delaySeconds)), std::move(callback)});
        return id;
    }

    bool ManualTimerQueue::Unregister(TimerId id)
    {
        const auto it = std::ranges::find_if(m_Entries, [id](const Entry& e) { return e.Id == id; });
        if (it == m_Entries.end())
            return false;
        m_Entries.erase(it);
        return true;
    }

    bool ManualTimerQueue::IsRegistered(TimerId id) const
    {
        return std::ranges::any_of(m_Entries, [id](const Entry& e) { return e.Id == id; });
    }

    size_t ManualTimerQueue::Advance(std::chrono::nanoseconds dt)
    {
        const auto target = SaturatingAdd(m_Now, std::max(dt, std::chrono::nanoseconds{0}));
        size_t fired = 0;

        while (true)
        {
            // Earliest due entry inside the window. Linear scan: the queue holds
            // one entry per pending source, which stays small.
            auto next = m_Entries.end();
            for (auto it = m_Entries.begin(); it != m_Entries.end(); ++it)
            {
                if (it->Due > target)
                    continue;
                if (next == m_Entries.end() || it->Due < next->Due ||
                    (it->Due == next->Due && it->Id.Value < next->Id.Value))
                {
                    next = it;
                }
            }

            if (next == m_Entries.end())
                break;

            // Unlink before invoking: the callback may register or unregister timers.
            m_Now = next->Due;
            TimerCallback callback = std::move(next->Callback);
            m_Entries.erase(next);

            if (callback)
                callback();
            ++fired;
        }

        m_Now = target;
        return fired;
    }

    std::optional<std::chrono::nanoseconds> ManualTimerQueue::TimeUntilNext() const
    {
        if (m_Entries.empty())
            return std::nullopt;

        const auto earliest = std::ranges::min_element(m_Entries, {}, &Entry::Due);
        return std::max(earliest->Due - m_Now, std::chrono::nanoseconds{0});
    }

    void ManualTimerQueue::Clear()
    {
        m_Entries.clear();
    }
}
