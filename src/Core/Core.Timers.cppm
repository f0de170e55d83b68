module;
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

export module Core:Timers;

// -------------------------------------------------------------------------
// Core::Timers - one-shot deferred callbacks on the owning thread
// -------------------------------------------------------------------------
// ITimerService is the seam to the host's timer facility. Callbacks run on
// the thread that drives the service (the main thread), never concurrently,
// so callers need no locking around state touched by a callback.
//
// ManualTimerQueue is the in-tree implementation: the host loop calls
// Advance() once per tick with the elapsed time. Time is virtual and kept
// in integer nanoseconds, so tests get exact, repeatable ordering.
// -------------------------------------------------------------------------

export namespace Core::Timers
{
    struct TimerId
    {
        uint64_t Value = 0;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Value != 0; }
        constexpr bool operator==(const TimerId&) const = default;
    };

    using TimerCallback = std::function<void()>;

    class ITimerService
    {
    public:
        virtual ~ITimerService() = default;
        ITimerService(const ITimerService&) = delete;
        ITimerService& operator=(const ITimerService&) = delete;
        ITimerService(ITimerService&&) = delete;
        ITimerService& operator=(ITimerService&&) = delete;

        // Fire `callback` once, `delaySeconds` from now. Negative delays are clamped to 0.
        [[nodiscard]] virtual TimerId Register(TimerCallback callback, double delaySeconds) = 0;

        // Returns false if the timer already fired, was cancelled, or never existed.
        virtual bool Unregister(TimerId id) = 0;

        [[nodiscard]] virtual bool IsRegistered(TimerId id) const = 0;

    protected:
        ITimerService() = default;
    };

    [[nodiscard]] std::chrono::nanoseconds SecondsToDuration(double seconds);

    class ManualTimerQueue final : public ITimerService
    {
    public:
        ManualTimerQueue() = default;

        [[nodiscard]] TimerId Register(TimerCallback callback, double delaySeconds) override;
        bool Unregister(TimerId id) override;
        [[nodiscard]] bool IsRegistered(TimerId id) const override;

        // Move the clock forward and fire every timer that became due, earliest
        // first (registration order breaks ties). Timers registered by a callback
        // fire within the same call if they fall inside the window.
        // Returns the number of callbacks invoked.
        size_t Advance(std::chrono::nanoseconds dt);
        size_t Advance(double seconds) { return Advance(SecondsToDuration(seconds)); }

        [[nodiscard]] std::chrono::nanoseconds Now() const { return m_Now; }
        [[nodiscard]] size_t PendingCount() const { return m_Entries.size(); }

        // Remaining time until the earliest pending timer; nullopt when idle.
        [[nodiscard]] std::optional<std::chrono::nanoseconds> TimeUntilNext() const;

        // Drop all pending timers without firing them.
        void Clear();

    private:
        struct Entry
        {
            TimerId Id;
            std::chrono::nanoseconds Due{0};
            TimerCallback Callback;
        };

        std::vector<Entry> m_Entries;
        std::chrono::nanoseconds m_Now{0};
        uint64_t m_NextId = 1;
    };
}
