#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

import Core;

using namespace std::chrono_literals;
using Core::Timers::ManualTimerQueue;
using Core::Timers::TimerId;

TEST(TimerQueue, NotCopyable)
{
    static_assert(!std::is_copy_constructible_v<ManualTimerQueue>);
    static_assert(!std::is_copy_assignable_v<ManualTimerQueue>);
    SUCCEED();
}

TEST(TimerQueue, SecondsToDurationRounds)
{
    EXPECT_EQ(Core::Timers::SecondsToDuration(0.25), 250ms);
    EXPECT_EQ(Core::Timers::SecondsToDuration(0.05), 50ms);
    EXPECT_EQ(Core::Timers::SecondsToDuration(-1.0), 0ns);
}

TEST(TimerQueue, SecondsToDurationSaturates)
{
    EXPECT_EQ(Core::Timers::SecondsToDuration(1e10), std::chrono::nanoseconds::max());
    EXPECT_EQ(Core::Timers::SecondsToDuration(1e300), std::chrono::nanoseconds::max());
    EXPECT_EQ(Core::Timers::SecondsToDuration(std::numeric_limits<double>::infinity()),
              std::chrono::nanoseconds::max());
    EXPECT_EQ(Core::Timers::SecondsToDuration(std::numeric_limits<double>::quiet_NaN()), 0ns);
}

TEST(TimerQueue, HugeDelayNeverFiresEarly)
{
    ManualTimerQueue queue;
    int fired = 0;
    queue.Advance(1.0);
    const TimerId id = queue.Register([&] { ++fired; }, 1e10);

    EXPECT_EQ(queue.Advance(0.001), 0u);
    EXPECT_EQ(queue.Advance(3600.0), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_TRUE(queue.IsRegistered(id));

    const auto remaining = queue.TimeUntilNext();
    ASSERT_TRUE(remaining.has_value());
    EXPECT_GT(*remaining, 0ns);
}

TEST(TimerQueue, FiresOnlyWhenDue)
{
    ManualTimerQueue queue;
    int fired = 0;
    const TimerId id = queue.Register([&] { ++fired; }, 0.25);

    EXPECT_TRUE(id.IsValid());
    EXPECT_TRUE(queue.IsRegistered(id));

    EXPECT_EQ(queue.Advance(0.2), 0u);
    EXPECT_EQ(fired, 0);

    EXPECT_EQ(queue.Advance(0.05), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(queue.IsRegistered(id));
    EXPECT_EQ(queue.PendingCount(), 0u);
}

TEST(TimerQueue, UnregisterCancels)
{
    ManualTimerQueue queue;
    int fired = 0;
    const TimerId id = queue.Register([&] { ++fired; }, 0.1);

    EXPECT_TRUE(queue.Unregister(id));
    EXPECT_FALSE(queue.Unregister(id));

    queue.Advance(1.0);
    EXPECT_EQ(fired, 0);
}

TEST(TimerQueue, EarliestFirstThenRegistrationOrder)
{
    ManualTimerQueue queue;
    std::vector<std::string> order;
    (void)queue.Register([&] { order.push_back("late"); }, 0.3);
    (void)queue.Register([&] { order.push_back("a"); }, 0.1);
    (void)queue.Register([&] { order.push_back("b"); }, 0.1);

    EXPECT_EQ(queue.Advance(1.0), 3u);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], "a");
    EXPECT_EQ(order[1], "b");
    EXPECT_EQ(order[2], "late");
}

TEST(TimerQueue, CallbackSeesItsDueTime)
{
    ManualTimerQueue queue;
    std::chrono::nanoseconds seen{0};
    (void)queue.Register([&] { seen = queue.Now(); }, 0.1);

    queue.Advance(1.0);
    EXPECT_EQ(seen, 100ms);
    EXPECT_EQ(queue.Now(), 1s);
}

TEST(TimerQueue, CallbackMayRegisterInsideWindow)
{
    ManualTimerQueue queue;
    int chained = 0;
    (void)queue.Register([&]
    {
        (void)queue.Register([&] { ++chained; }, 0.1);
    }, 0.1);

    EXPECT_EQ(queue.Advance(0.5), 2u);
    EXPECT_EQ(chained, 1);
}

TEST(TimerQueue, TimeUntilNext)
{
    ManualTimerQueue queue;
    EXPECT_FALSE(queue.TimeUntilNext().has_value());

    (void)queue.Register([] {}, 0.25);
    queue.Advance(0.1);
    ASSERT_TRUE(queue.TimeUntilNext().has_value());
    EXPECT_EQ(*queue.TimeUntilNext(), 150ms);

    queue.Clear();
    EXPECT_EQ(queue.PendingCount(), 0u);
}
