#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

import Core;
import ECS;
import Graphics;
import Sync;

#include "TestCurveBuilders.h"

class DebounceSchedulerTest : public ::testing::Test
{
protected:
    ECS::Scene m_Scene;
    Graphics::MeshStore m_Store;
    Core::Timers::ManualTimerQueue m_Timers;
    std::vector<std::string> m_Runs;
    Sync::DebounceScheduler m_Scheduler{m_Timers, [this](const std::string& name) { m_Runs.push_back(name); }};
};

TEST(DebounceScheduler, NotCopyableOrMovable)
{
    static_assert(!std::is_copy_constructible_v<Sync::DebounceScheduler>);
    static_assert(!std::is_move_constructible_v<Sync::DebounceScheduler>);
    SUCCEED();
}

TEST_F(DebounceSchedulerTest, NoTargetsNoTask)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    EXPECT_FALSE(m_Scheduler.Schedule(m_Scene, src).has_value());
    EXPECT_EQ(m_Scheduler.PendingCount(), 0u);
    EXPECT_EQ(m_Timers.PendingCount(), 0u);
}

TEST_F(DebounceSchedulerTest, DisabledTargetsDoNotSchedule)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T", 0.25, false);
    EXPECT_FALSE(m_Scheduler.Schedule(m_Scene, src).has_value());
}

TEST_F(DebounceSchedulerTest, FiresOnceAfterDelay)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T", 0.25);

    const auto delay = m_Scheduler.Schedule(m_Scene, src);
    ASSERT_TRUE(delay.has_value());
    EXPECT_DOUBLE_EQ(*delay, 0.25);
    EXPECT_TRUE(m_Scheduler.IsPending("Curve"));

    m_Timers.Advance(0.2);
    EXPECT_TRUE(m_Runs.empty());

    m_Timers.Advance(0.05);
    ASSERT_EQ(m_Runs.size(), 1u);
    EXPECT_EQ(m_Runs[0], "Curve");
    EXPECT_FALSE(m_Scheduler.IsPending("Curve"));
}

TEST_F(DebounceSchedulerTest, BurstCoalescesIntoOneRun)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T", 0.25);

    // Five triggers 0.05 s apart: t = 0, 0.05, 0.10, 0.15, 0.20.
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(m_Scheduler.Schedule(m_Scene, src).has_value());
        EXPECT_EQ(m_Scheduler.PendingCount(), 1u);
        EXPECT_EQ(m_Timers.PendingCount(), 1u);
        if (i < 4)
            m_Timers.Advance(0.05);
    }
    EXPECT_TRUE(m_Runs.empty());

    // Quiet period restarts at the last trigger (t = 0.20): due at 0.45.
    m_Timers.Advance(0.2);
    EXPECT_TRUE(m_Runs.empty());
    m_Timers.Advance(0.05);
    EXPECT_EQ(m_Runs.size(), 1u);

    m_Timers.Advance(5.0);
    EXPECT_EQ(m_Runs.size(), 1u);
}

TEST_F(DebounceSchedulerTest, MinimumDebounceAmongTargets)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "Slow", 0.5);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "Fast", 0.1);

    const auto delay = m_Scheduler.Schedule(m_Scene, src);
    ASSERT_TRUE(delay.has_value());
    EXPECT_DOUBLE_EQ(*delay, 0.1);
    EXPECT_EQ(m_Scheduler.PendingDelay("Curve"), 0.1);

    m_Timers.Advance(0.1);
    EXPECT_EQ(m_Runs.size(), 1u);
}

TEST_F(DebounceSchedulerTest, DisabledTargetDebounceIgnored)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "Enabled", 0.5);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "Disabled", 0.05, false);

    EXPECT_EQ(m_Scheduler.Schedule(m_Scene, src), 0.5);
}

TEST_F(DebounceSchedulerTest, ZeroDebounceRunsOnNextAdvance)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T", 0.0);

    EXPECT_EQ(m_Scheduler.Schedule(m_Scene, src), 0.0);
    EXPECT_TRUE(m_Runs.empty());
    m_Timers.Advance(0.0);
    EXPECT_EQ(m_Runs.size(), 1u);
}

TEST_F(DebounceSchedulerTest, LongDebounceStaysPending)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T", 1e10);

    EXPECT_EQ(m_Scheduler.Schedule(m_Scene, src), 1e10);
    m_Timers.Advance(0.001);
    m_Timers.Advance(60.0);
    EXPECT_TRUE(m_Runs.empty());
    EXPECT_TRUE(m_Scheduler.IsPending("Curve"));
}

TEST_F(DebounceSchedulerTest, NanDebounceRunsImmediately)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    const entt::entity target = MakeLinkedTarget(m_Scene, m_Store, src, "T");
    m_Scene.GetRegistry().get<ECS::Components::MeshLink::Component>(target).Debounce =
        std::numeric_limits<double>::quiet_NaN();

    EXPECT_EQ(m_Scheduler.Schedule(m_Scene, src), 0.0);
    m_Timers.Advance(0.0);
    EXPECT_EQ(m_Runs.size(), 1u);
}

TEST_F(DebounceSchedulerTest, SourcesAreIndependent)
{
    const entt::entity a = MakeSimpleCurve(m_Scene, "A");
    const entt::entity b = MakeSimpleCurve(m_Scene, "B");
    (void)MakeLinkedTarget(m_Scene, m_Store, a, "TA", 0.1);
    (void)MakeLinkedTarget(m_Scene, m_Store, b, "TB", 0.3);

    (void)m_Scheduler.Schedule(m_Scene, a);
    (void)m_Scheduler.Schedule(m_Scene, b);
    EXPECT_EQ(m_Scheduler.PendingCount(), 2u);

    m_Timers.Advance(0.1);
    ASSERT_EQ(m_Runs.size(), 1u);
    EXPECT_EQ(m_Runs[0], "A");

    m_Timers.Advance(0.2);
    ASSERT_EQ(m_Runs.size(), 2u);
    EXPECT_EQ(m_Runs[1], "B");
}

TEST_F(DebounceSchedulerTest, CancelUnregistersTimer)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T");
    (void)m_Scheduler.Schedule(m_Scene, src);

    EXPECT_TRUE(m_Scheduler.Cancel("Curve"));
    EXPECT_FALSE(m_Scheduler.Cancel("Curve"));
    EXPECT_EQ(m_Timers.PendingCount(), 0u);

    m_Timers.Advance(1.0);
    EXPECT_TRUE(m_Runs.empty());
}

TEST_F(DebounceSchedulerTest, CancelAll)
{
    const entt::entity a = MakeSimpleCurve(m_Scene, "A");
    const entt::entity b = MakeSimpleCurve(m_Scene, "B");
    (void)MakeLinkedTarget(m_Scene, m_Store, a, "TA");
    (void)MakeLinkedTarget(m_Scene, m_Store, b, "TB");
    (void)m_Scheduler.Schedule(m_Scene, a);
    (void)m_Scheduler.Schedule(m_Scene, b);

    m_Scheduler.CancelAll();
    EXPECT_EQ(m_Scheduler.PendingCount(), 0u);
    EXPECT_EQ(m_Timers.PendingCount(), 0u);
}

TEST_F(DebounceSchedulerTest, RunMayRescheduleSameSource)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T", 0.1);

    int runs = 0;
    Sync::DebounceScheduler scheduler(m_Timers, [&](const std::string&)
    {
        if (++runs == 1)
            (void)scheduler.Schedule(m_Scene, src);
    });

    (void)scheduler.Schedule(m_Scene, src);
    m_Timers.Advance(0.1);
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(scheduler.IsPending("Curve"));

    m_Timers.Advance(0.1);
    EXPECT_EQ(runs, 2);
    EXPECT_FALSE(scheduler.IsPending("Curve"));
}

TEST_F(DebounceSchedulerTest, DestructionCancelsTimers)
{
    const entt::entity src = MakeSimpleCurve(m_Scene);
    (void)MakeLinkedTarget(m_Scene, m_Store, src, "T");

    {
        Sync::DebounceScheduler scoped(m_Timers, [](const std::string&) {});
        (void)scoped.Schedule(m_Scene, src);
        EXPECT_EQ(m_Timers.PendingCount(), 1u);
    }
    EXPECT_EQ(m_Timers.PendingCount(), 0u);
}
