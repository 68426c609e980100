#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <vector>

#include "TimerQueue.h"
#include "WorkQueue.h"
#include "TestSupport.h"

TEST(TimerQueue, FiresInDeadlineOrder) {
    TimerQueue timers;
    std::mutex m;
    std::vector<int> order;
    auto record = [&](int v) { std::lock_guard<std::mutex> l(m); order.push_back(v); };

    timers.scheduleAfter(60, [&]() { record(3); });
    timers.scheduleAfter(10, [&]() { record(1); });
    timers.scheduleAfter(30, [&]() { record(2); });

    ASSERT_TRUE(waitUntil([&]() { std::lock_guard<std::mutex> l(m); return order.size() == 3; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    timers.shutdown();
}

TEST(TimerQueue, CancelledTimerNeverRuns) {
    TimerQueue timers;
    std::atomic<int> fired(0);

    TimerQueue::TimerId id = timers.scheduleAfter(40, [&]() { ++fired; });
    ASSERT_NE(id, TimerQueue::INVALID_TIMER);
    EXPECT_TRUE(timers.cancel(id));
    EXPECT_FALSE(timers.cancel(id));

    sleepMs(80);
    EXPECT_EQ(fired.load(), 0);
    EXPECT_EQ(timers.pending(), 0u);
    timers.shutdown();
}

TEST(TimerQueue, CallbackMayScheduleItsSuccessor) {
    TimerQueue timers;
    std::atomic<int> ticks(0);
    std::function<void()> tick;
    tick = [&]() {
        if (++ticks < 3) timers.scheduleAfter(5, tick);
    };
    timers.scheduleAfter(5, tick);

    EXPECT_TRUE(waitUntil([&]() { return ticks.load() == 3; }));
    timers.shutdown();
}

TEST(TimerQueue, ShutdownDropsPendingAndRefusesNewTimers) {
    TimerQueue timers;
    std::atomic<int> fired(0);
    timers.scheduleAfter(500, [&]() { ++fired; });
    timers.shutdown();
    timers.shutdown();

    EXPECT_EQ(timers.scheduleAfter(1, [&]() { ++fired; }), TimerQueue::INVALID_TIMER);
    EXPECT_EQ(fired.load(), 0);
}

TEST(WorkQueue, RunsJobsInOrderAndDrains) {
    WorkQueue queue("test");
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        queue.post([&order, i]() { sleepMs(1); order.push_back(i); });
    }
    queue.drain();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));

    queue.shutdown();
    EXPECT_FALSE(queue.post([]() {}));
}
