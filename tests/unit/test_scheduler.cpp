#include <gtest/gtest.h>
#include <leaseguard/leaseguard.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace leaseguard;
using namespace std::chrono_literals;

// ===========================================================================
// ManualScheduler
// ===========================================================================

TEST(ManualSchedulerTest, FiresOnceIntervalHasPassed) {
    ManualScheduler sched;
    int runs = 0;
    sched.schedule_every(100ms, [&] { runs++; });

    sched.advance(99ms);
    EXPECT_EQ(runs, 0);
    sched.advance(1ms);
    EXPECT_EQ(runs, 1);
    sched.advance(350ms);
    EXPECT_EQ(runs, 4);
    EXPECT_EQ(sched.fired_count(), 4u);
}

TEST(ManualSchedulerTest, TaskSeesFireTime) {
    auto start = Timestamp{} + 10s;
    ManualScheduler sched(start);
    std::vector<Timestamp> seen;
    sched.schedule_every(50ms, [&] { seen.push_back(sched.now()); });

    sched.advance(120ms);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], start + 50ms);
    EXPECT_EQ(seen[1], start + 100ms);
    EXPECT_EQ(sched.now(), start + 120ms);
}

TEST(ManualSchedulerTest, InterleavesTimersInTimeOrder) {
    ManualScheduler sched;
    std::vector<char> order;
    sched.schedule_every(30ms, [&] { order.push_back('a'); });
    sched.schedule_every(20ms, [&] { order.push_back('b'); });

    sched.advance(60ms);
    // b@20 a@30 b@40 then the tie at 60 goes to the earlier timer
    EXPECT_EQ(order, (std::vector<char>{'b', 'a', 'b', 'a', 'b'}));
}

TEST(ManualSchedulerTest, CancelStopsFiring) {
    ManualScheduler sched;
    int runs = 0;
    auto id = sched.schedule_every(10ms, [&] { runs++; });
    sched.advance(25ms);
    sched.cancel(id);
    sched.advance(100ms);
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(sched.active_timers(), 0u);
    EXPECT_NO_THROW(sched.cancel(id));
}

TEST(ManualSchedulerTest, TaskMayCancelItself) {
    ManualScheduler sched;
    int runs = 0;
    TimerId id = 0;
    id = sched.schedule_every(10ms, [&] {
        if (++runs == 3) sched.cancel(id);
    });
    sched.advance(1s);
    EXPECT_EQ(runs, 3);
}

TEST(ManualSchedulerTest, RejectsBadArguments) {
    ManualScheduler sched;
    EXPECT_THROW(sched.schedule_every(0ms, [] {}), ValidationException);
    EXPECT_THROW(sched.schedule_every(10ms, TimerTask{}), ValidationException);
    EXPECT_THROW(sched.advance(-1ms), ValidationException);
}

// ===========================================================================
// ThreadScheduler
// ===========================================================================

TEST(ThreadSchedulerTest, FiresPeriodically) {
    ThreadScheduler sched;
    std::atomic<int> runs{0};
    auto id = sched.schedule_every(5ms, [&] { runs++; });

    auto deadline = Clock::now() + 2s;
    while (runs.load() < 3 && Clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    sched.cancel(id);
    EXPECT_GE(runs.load(), 3);
    EXPECT_EQ(sched.active_timers(), 0u);
}

TEST(ThreadSchedulerTest, NoRunsAfterCancelReturns) {
    ThreadScheduler sched;
    std::atomic<int> runs{0};
    auto id = sched.schedule_every(1ms, [&] { runs++; });
    std::this_thread::sleep_for(20ms);
    sched.cancel(id);

    int after_cancel = runs.load();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(runs.load(), after_cancel);
}

TEST(ThreadSchedulerTest, CancelFromOwnTask) {
    ThreadScheduler sched;
    std::atomic<int> runs{0};
    std::atomic<TimerId> id{0};
    std::atomic<bool> scheduled{false};
    id = sched.schedule_every(1ms, [&] {
        if (!scheduled.load()) return;
        runs++;
        sched.cancel(id.load());
    });
    scheduled = true;

    auto deadline = Clock::now() + 2s;
    while (sched.active_timers() > 0 && Clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(sched.active_timers(), 0u);
    EXPECT_EQ(runs.load(), 1);
}

TEST(ThreadSchedulerTest, DestructorStopsWorkers) {
    std::atomic<int> runs{0};
    {
        ThreadScheduler sched;
        sched.schedule_every(1ms, [&] { runs++; });
        sched.schedule_every(1ms, [&] { runs++; });
        std::this_thread::sleep_for(5ms);
    }
    int after = runs.load();
    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(runs.load(), after);
}
