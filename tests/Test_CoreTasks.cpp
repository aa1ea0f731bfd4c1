#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

import Core;

using namespace Core::Tasks;
using namespace std::chrono_literals;

namespace
{
    // Every clock read advances time by `Step`.
    struct SteppingClock
    {
        std::chrono::nanoseconds Now{0};
        std::chrono::nanoseconds Step{1ms};

        CooperativeScheduler::Clock Get()
        {
            return [this]()
            {
                Now += Step;
                return Now;
            };
        }
    };
}

TEST(CoreTasks, RunsEveryItemInOrder)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(1s);
    CooperativeScheduler scheduler(budget);

    std::vector<uint64_t> seen;
    std::optional<JobStatus> finished;

    ChunkedJobDesc desc;
    desc.Name = "Order";
    desc.TotalItems = 10;
    desc.PerItem = [&](uint64_t i) { seen.push_back(i); };
    desc.OnFinished = [&](JobStatus s) { finished = s; };
    const JobHandle handle = scheduler.RunChunked(std::move(desc));

    EXPECT_TRUE(scheduler.IsAlive(handle));
    scheduler.Tick();

    ASSERT_EQ(seen.size(), 10u);
    for (uint64_t i = 0; i < 10; ++i) EXPECT_EQ(seen[i], i);
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(*finished, JobStatus::Completed);
    EXPECT_FALSE(scheduler.IsAlive(handle));
    EXPECT_FALSE(scheduler.HasPendingWork());
}

TEST(CoreTasks, YieldsWhenBudgetIsSpent)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(3ms);

    SteppingClock clock;
    CooperativeScheduler scheduler(CooperativeScheduler::Config{1}, budget, clock.Get());

    uint64_t done = 0;
    std::vector<JobProgress> yields;

    ChunkedJobDesc desc;
    desc.Name = "Sliced";
    desc.TotalItems = 10;
    desc.PerItem = [&](uint64_t) { ++done; };
    desc.OnYield = [&](const JobProgress& p) { yields.push_back(p); };
    const JobHandle handle = scheduler.RunChunked(std::move(desc));

    // Deadline = t(1ms) + 3ms; clock reads after items land on 2, 3, 4ms.
    scheduler.Tick();
    EXPECT_EQ(done, 3u);
    ASSERT_EQ(yields.size(), 1u);
    EXPECT_EQ(yields[0].ItemsDone, 3u);
    EXPECT_EQ(yields[0].TotalItems, 10u);

    auto progress = scheduler.GetProgress(handle);
    ASSERT_TRUE(progress.has_value());
    EXPECT_DOUBLE_EQ(progress->Fraction(), 0.3);

    while (scheduler.HasPendingWork()) scheduler.Tick();
    EXPECT_EQ(done, 10u);
    EXPECT_EQ(scheduler.GetYieldCount(), 3u);
    EXPECT_FALSE(scheduler.GetProgress(handle).has_value());
}

TEST(CoreTasks, ClockIsReadEveryNItems)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(0ns);

    uint32_t clockReads = 0;
    CooperativeScheduler scheduler(CooperativeScheduler::Config{4}, budget, [&]()
    {
        ++clockReads;
        return std::chrono::nanoseconds{0};
    });

    uint64_t done = 0;
    ChunkedJobDesc desc;
    desc.Name = "Batched";
    desc.TotalItems = 10;
    desc.PerItem = [&](uint64_t) { ++done; };
    (void)scheduler.RunChunked(std::move(desc));

    // Zero budget still makes progress: one batch of ItemsPerClockCheck.
    scheduler.Tick();
    EXPECT_EQ(done, 4u);
    EXPECT_EQ(clockReads, 2u); // deadline + one check
}

TEST(CoreTasks, AtLeastOneItemPerTick)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(0ns);
    CooperativeScheduler scheduler(CooperativeScheduler::Config{1}, budget, []() { return std::chrono::nanoseconds{0}; });

    uint64_t done = 0;
    ChunkedJobDesc desc;
    desc.Name = "Starved";
    desc.TotalItems = 5;
    desc.PerItem = [&](uint64_t) { ++done; };
    (void)scheduler.RunChunked(std::move(desc));

    for (uint64_t tick = 1; tick <= 5; ++tick)
    {
        scheduler.Tick();
        EXPECT_EQ(done, tick);
    }
    EXPECT_FALSE(scheduler.HasPendingWork());
}

TEST(CoreTasks, CancellationIsObservedAfterYield)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(0ns);
    CooperativeScheduler scheduler(CooperativeScheduler::Config{1}, budget, []() { return std::chrono::nanoseconds{0}; });

    bool cancel = false;
    uint64_t done = 0;
    std::optional<JobStatus> finished;

    ChunkedJobDesc desc;
    desc.Name = "Cancelled";
    desc.TotalItems = 100;
    desc.PerItem = [&](uint64_t) { ++done; };
    desc.IsCancelled = [&]() { return cancel; };
    desc.OnFinished = [&](JobStatus s) { finished = s; };
    const JobHandle handle = scheduler.RunChunked(std::move(desc));

    scheduler.Tick();
    scheduler.Tick();
    cancel = true;
    scheduler.Tick();

    EXPECT_EQ(done, 2u);
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(*finished, JobStatus::Cancelled);
    EXPECT_FALSE(scheduler.IsAlive(handle));
}

TEST(CoreTasks, RunToCompletionIgnoresBudget)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(0ns);
    CooperativeScheduler scheduler(CooperativeScheduler::Config{1}, budget, []() { return std::chrono::nanoseconds{0}; });

    uint64_t done = 0;
    ChunkedJobDesc desc;
    desc.Name = "Forced";
    desc.TotalItems = 1000;
    desc.PerItem = [&](uint64_t) { ++done; };
    const JobHandle handle = scheduler.RunChunked(std::move(desc));

    scheduler.RunToCompletion(handle);
    EXPECT_EQ(done, 1000u);
    EXPECT_FALSE(scheduler.IsAlive(handle));
    EXPECT_EQ(scheduler.GetYieldCount(), 0u);
}

TEST(CoreTasks, DiscardSkipsCallbacks)
{
    Core::FrameBudget budget;
    CooperativeScheduler scheduler(budget);

    bool finished = false;
    ChunkedJobDesc desc;
    desc.Name = "Dropped";
    desc.TotalItems = 3;
    desc.PerItem = [](uint64_t) {};
    desc.OnFinished = [&](JobStatus) { finished = true; };
    const JobHandle handle = scheduler.RunChunked(std::move(desc));

    scheduler.Discard(handle);
    scheduler.Tick();

    EXPECT_FALSE(finished);
    EXPECT_FALSE(scheduler.IsAlive(handle));
    EXPECT_EQ(scheduler.GetActiveJobCount(), 0u);
}

TEST(CoreTasks, StaleHandleDoesNotResolveToReusedSlot)
{
    Core::FrameBudget budget;
    CooperativeScheduler scheduler(budget);

    ChunkedJobDesc first;
    first.Name = "First";
    first.TotalItems = 0;
    const JobHandle a = scheduler.RunChunked(std::move(first));
    scheduler.Tick();

    ChunkedJobDesc second;
    second.Name = "Second";
    second.TotalItems = 1;
    second.PerItem = [](uint64_t) {};
    const JobHandle b = scheduler.RunChunked(std::move(second));

    EXPECT_EQ(a.Index, b.Index);
    EXPECT_NE(a.Generation, b.Generation);
    EXPECT_FALSE(scheduler.IsAlive(a));
    EXPECT_TRUE(scheduler.IsAlive(b));

    // Discarding through the stale handle must not touch the new job.
    scheduler.Discard(a);
    EXPECT_TRUE(scheduler.IsAlive(b));
}

TEST(CoreTasks, OnFinishedMaySubmitFollowUp)
{
    Core::FrameBudget budget;
    budget.SetFixedLongTaskTime(1s);
    CooperativeScheduler scheduler(budget);

    std::vector<int> order;

    ChunkedJobDesc first;
    first.Name = "First";
    first.TotalItems = 1;
    first.PerItem = [&](uint64_t) { order.push_back(1); };
    first.OnFinished = [&](JobStatus)
    {
        ChunkedJobDesc next;
        next.Name = "Next";
        next.TotalItems = 1;
        next.PerItem = [&](uint64_t) { order.push_back(2); };
        (void)scheduler.RunChunked(std::move(next));
    };
    (void)scheduler.RunChunked(std::move(first));

    scheduler.Tick();
    EXPECT_EQ(order, std::vector<int>({1}));
    EXPECT_TRUE(scheduler.HasPendingWork());

    scheduler.Tick();
    EXPECT_EQ(order, std::vector<int>({1, 2}));
    EXPECT_FALSE(scheduler.HasPendingWork());
}
