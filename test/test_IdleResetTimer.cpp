#include <gtest/gtest.h>

#include <atomic>

#include "IdleResetTimer.h"
#include "TestSupport.h"

namespace {

constexpr uint32_t TIMEOUT_MS = 40;

class IdleResetTimerTest : public ::testing::Test {
protected:
    IdleResetTimerTest()
        : idle(timers, TIMEOUT_MS,
               [this]() { return away.load(); },
               [this]() { away = false; ++resets; }) {}
    ~IdleResetTimerTest() override { timers.shutdown(); }

    std::atomic<bool> away{false};
    std::atomic<int>  resets{0};
    TimerQueue        timers;
    IdleResetTimer    idle;
};

} // namespace

TEST_F(IdleResetTimerTest, FiresOnceAfterTimeout) {
    away = true;
    idle.rescheduleIfNeeded();
    EXPECT_TRUE(idle.isScheduled());

    ASSERT_TRUE(waitUntil([&]() { return resets.load() == 1; }));
    sleepMs(TIMEOUT_MS * 2);
    EXPECT_EQ(resets.load(), 1);
    EXPECT_FALSE(idle.isScheduled());
}

TEST_F(IdleResetTimerTest, NothingScheduledAtDefault) {
    idle.rescheduleIfNeeded();
    EXPECT_FALSE(idle.isScheduled());
    sleepMs(TIMEOUT_MS * 2);
    EXPECT_EQ(resets.load(), 0);
}

TEST_F(IdleResetTimerTest, ActivityPushesTheResetBack) {
    away = true;
    for (int i = 0; i < 5; ++i) {
        idle.rescheduleIfNeeded();
        sleepMs(TIMEOUT_MS / 2);
    }
    EXPECT_EQ(resets.load(), 0);
    ASSERT_TRUE(waitUntil([&]() { return resets.load() == 1; }));
}

TEST_F(IdleResetTimerTest, CancelPreventsReset) {
    away = true;
    idle.rescheduleIfNeeded();
    idle.cancel();
    sleepMs(TIMEOUT_MS * 2);
    EXPECT_EQ(resets.load(), 0);
}

TEST_F(IdleResetTimerTest, ScopeCancelsOnEntryAndReschedulesOnExit) {
    away = true;
    idle.rescheduleIfNeeded();
    {
        IdleScope scope(idle);
        EXPECT_FALSE(idle.isScheduled());
    }
    EXPECT_TRUE(idle.isScheduled());
}

TEST_F(IdleResetTimerTest, NoResetIfBackAtDefaultWhenItFires) {
    away = true;
    idle.rescheduleIfNeeded();
    away = false;
    sleepMs(TIMEOUT_MS * 2);
    EXPECT_EQ(resets.load(), 0);
}

TEST_F(IdleResetTimerTest, TimeoutChangeAppliesFromNextSchedule) {
    idle.setTimeout(500);
    EXPECT_EQ(idle.timeout(), 500u);
    away = true;
    idle.rescheduleIfNeeded();
    sleepMs(TIMEOUT_MS * 2);
    EXPECT_EQ(resets.load(), 0);
}
